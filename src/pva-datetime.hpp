#pragma once

#include <QDate>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include <optional>

namespace pva {

constexpr const char *WALL_CLOCK_FORMAT = "yyyy/MM/dd HH:mm:ss";

struct ParsedDateTime {
	QDate date;
	QTime time;
	std::optional<int> offset_minutes;
	// Value carried a "Z" or "UTC" marker: an exact instant with no local offset.
	bool utc = false;
};

std::optional<ParsedDateTime> parse_metadata_date(const QString &raw);
std::optional<ParsedDateTime> parse_wall_clock(const QString &wall_clock);

QString format_wall_clock(const QDate &date, const QTime &time);

double epoch_from_wall_clock(const QDate &date, const QTime &time, int offset_minutes);
double epoch_in_zone(const QDate &date, const QTime &time, const QTimeZone &zone);
QString wall_clock_from_epoch(double epoch, int offset_minutes);
QString wall_clock_from_epoch(double epoch, const QTimeZone &zone);

// Accepts the manual entry formats and rewrites them as WALL_CLOCK_FORMAT.
bool normalize_manual_time(const QString &input, QString *normalized, QString *error);

QTimeZone naive_zone_from_setting(const QString &zone_id);

constexpr bool is_plausible_year(int year)
{
	return year >= 1970 && year <= 2100;
}

} // namespace pva
