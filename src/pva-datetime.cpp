#include "pva-datetime.hpp"

#include "pva-logging.hpp"
#include "pva-models.hpp"

#include <QDateTime>
#include <QRegularExpression>

#include <cmath>

namespace pva {
namespace {

std::optional<ParsedDateTime> build_parsed(int year, int month, int day, int hour, int minute, int second)
{
	if (!is_plausible_year(year))
		return std::nullopt;

	const QDate date(year, month, day);
	const QTime time(hour, minute, second);
	if (!date.isValid() || !time.isValid())
		return std::nullopt;

	ParsedDateTime parsed;
	parsed.date = date;
	parsed.time = time;
	return parsed;
}

qint64 epoch_to_msecs(double epoch)
{
	return static_cast<qint64>(std::llround(epoch * 1000.0));
}

} // namespace

std::optional<ParsedDateTime> parse_metadata_date(const QString &raw)
{
	static const QRegularExpression date_re(QStringLiteral(
		"^(UTC\\s+)?(\\d{4})[:\\-/](\\d{2})[:\\-/](\\d{2})"
		"(?:[T\\s]+(\\d{2}):(\\d{2})(?::(\\d{2}))?(?:[.,]\\d+)?)?"
		"\\s*(Z|UTC|[+-]\\d{2}:?\\d{2})?$"));

	const QRegularExpressionMatch match = date_re.match(raw.trimmed());
	if (!match.hasMatch())
		return std::nullopt;

	std::optional<ParsedDateTime> parsed =
		build_parsed(match.captured(2).toInt(), match.captured(3).toInt(), match.captured(4).toInt(),
			     match.captured(5).toInt(), match.captured(6).toInt(), match.captured(7).toInt());
	if (!parsed.has_value())
		return std::nullopt;

	const QString zone = match.captured(8);
	if (!match.captured(1).isEmpty() || zone == "Z" || zone == "UTC") {
		parsed->utc = true;
	} else if (!zone.isEmpty()) {
		int offset = 0;
		if (!parse_utc_offset(zone, &offset))
			return std::nullopt;
		parsed->offset_minutes = offset;
	}
	return parsed;
}

std::optional<ParsedDateTime> parse_wall_clock(const QString &wall_clock)
{
	static const QRegularExpression wall_re(
		QStringLiteral("^(\\d{4})[/:\\-](\\d{2})[/:\\-](\\d{2})[T\\s](\\d{2}):(\\d{2})(?::(\\d{2}))?$"));

	const QRegularExpressionMatch match = wall_re.match(wall_clock.trimmed());
	if (!match.hasMatch())
		return std::nullopt;

	return build_parsed(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt(),
			    match.captured(4).toInt(), match.captured(5).toInt(), match.captured(6).toInt());
}

QString format_wall_clock(const QDate &date, const QTime &time)
{
	return QDateTime(date, time, QTimeZone::utc()).toString(WALL_CLOCK_FORMAT);
}

double epoch_from_wall_clock(const QDate &date, const QTime &time, int offset_minutes)
{
	const QDateTime instant(date, time, QTimeZone(offset_minutes * 60));
	return static_cast<double>(instant.toMSecsSinceEpoch()) / 1000.0;
}

double epoch_in_zone(const QDate &date, const QTime &time, const QTimeZone &zone)
{
	const QDateTime instant(date, time, zone);
	if (!instant.isValid())
		return epoch_from_wall_clock(date, time, 0);
	return static_cast<double>(instant.toMSecsSinceEpoch()) / 1000.0;
}

QString wall_clock_from_epoch(double epoch, int offset_minutes)
{
	return QDateTime::fromMSecsSinceEpoch(epoch_to_msecs(epoch), QTimeZone(offset_minutes * 60))
		.toString(WALL_CLOCK_FORMAT);
}

QString wall_clock_from_epoch(double epoch, const QTimeZone &zone)
{
	return QDateTime::fromMSecsSinceEpoch(epoch_to_msecs(epoch), zone).toString(WALL_CLOCK_FORMAT);
}

bool normalize_manual_time(const QString &input, QString *normalized, QString *error)
{
	const std::optional<ParsedDateTime> parsed = parse_wall_clock(input);
	if (!parsed.has_value()) {
		if (error)
			*error = QString("Invalid date/time '%1', expected YYYY/MM/DD HH:MM:SS").arg(input.trimmed());
		return false;
	}

	if (normalized)
		*normalized = format_wall_clock(parsed->date, parsed->time);
	return true;
}

QTimeZone naive_zone_from_setting(const QString &zone_id)
{
	if (zone_id.trimmed().isEmpty())
		return QTimeZone::systemTimeZone();

	const QTimeZone zone(zone_id.trimmed().toUtf8());
	if (!zone.isValid()) {
		qCWarning(lcTimestamp, "unknown naive_time_zone '%s', using system zone", qUtf8Printable(zone_id));
		return QTimeZone::systemTimeZone();
	}
	return zone;
}

} // namespace pva
