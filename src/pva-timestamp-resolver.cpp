#include "pva-timestamp-resolver.hpp"

#include "pva-datetime.hpp"
#include "pva-logging.hpp"

#include <QDateTime>
#include <QFileInfo>
#include <QRegularExpression>

#include <algorithm>

namespace pva {
namespace {

TimestampRecord naive_record(const ParsedDateTime &parsed, TimestampSource source, const QTimeZone &naive_zone)
{
	TimestampRecord record;
	record.wall_clock = format_wall_clock(parsed.date, parsed.time);
	record.utc_epoch = epoch_in_zone(parsed.date, parsed.time, naive_zone);
	record.source = source;
	return record;
}

TimestampRecord absolute_record(double epoch, TimestampSource source, const QTimeZone &naive_zone)
{
	TimestampRecord record;
	record.utc_epoch = epoch;
	record.wall_clock = wall_clock_from_epoch(epoch, naive_zone);
	record.absolute = true;
	record.source = source;
	return record;
}

} // namespace

TimestampResolver::TimestampResolver() : TimestampResolver(QTimeZone::systemTimeZone()) {}

TimestampResolver::TimestampResolver(const QTimeZone &naive_zone) : m_naive_zone(naive_zone)
{
	m_probes.push_back(std::make_unique<ExifImageProbe>());
	m_probes.push_back(std::make_unique<QuickTimeProbe>());
}

void TimestampResolver::set_probes(std::vector<std::unique_ptr<MetadataProbe>> probes)
{
	m_probes = std::move(probes);
}

void TimestampResolver::add_probe(std::unique_ptr<MetadataProbe> probe)
{
	if (probe)
		m_probes.push_back(std::move(probe));
}

void TimestampResolver::set_fallback_probe(std::unique_ptr<MetadataProbe> probe)
{
	m_fallback_probe = std::move(probe);
}

const MetadataProbe *TimestampResolver::fallback_probe() const
{
	return m_fallback_probe.get();
}

void TimestampResolver::set_naive_zone(const QTimeZone &naive_zone)
{
	m_naive_zone = naive_zone;
}

const QTimeZone &TimestampResolver::naive_zone() const
{
	return m_naive_zone;
}

ResolvedTimestamp TimestampResolver::resolve(const MediaItem &item) const
{
	ResolvedTimestamp resolved;

	std::optional<TimestampRecord> record = resolve_from_metadata(item, &resolved.gps, &resolved.detail);
	if (!record.has_value()) {
		record = record_from_filename(item.base_name);
		if (record.has_value())
			resolved.detail = "filename";
	}
	if (!record.has_value()) {
		record = record_from_filesystem(item.path);
		if (record.has_value())
			resolved.detail = "filesystem";
	}

	if (record.has_value()) {
		resolved.record = record.value();
		qCDebug(lcTimestamp, "timestamp resolved: key=%s source=%s detail=%s wall=%s", qUtf8Printable(item.key()),
			timestamp_source_to_key(resolved.record.source), qUtf8Printable(resolved.detail),
			qUtf8Printable(resolved.record.wall_clock));
	} else {
		resolved.record = unresolved_record();
		resolved.detail = "unresolved";
		qCInfo(lcTimestamp, "no timestamp source for '%s', sorting it last", qUtf8Printable(item.path));
	}
	return resolved;
}

bool TimestampResolver::needs_resolution(const std::optional<TimestampRecord> &cached)
{
	return !cached.has_value() || !cached->is_resolved() || !cached->is_complete();
}

std::optional<TimestampRecord> TimestampResolver::resolve_from_metadata(const MediaItem &item,
									 std::optional<GpsFix> *gps,
									 QString *detail) const
{
	QVector<DateCandidate> candidates;
	const auto run_probe = [&](const MetadataProbe *probe) {
		if (!probe || !probe->accepts(item))
			return false;

		const ProbeResult result = probe->probe(item.path);
		if (gps && !gps->has_value() && result.gps.has_value())
			*gps = result.gps;
		if (result.dates.isEmpty())
			return false;
		candidates = result.dates;
		return true;
	};

	bool found = false;
	for (const std::unique_ptr<MetadataProbe> &probe : m_probes) {
		if (run_probe(probe.get())) {
			found = true;
			break;
		}
	}
	if (!found)
		run_probe(m_fallback_probe.get());

	if (item.is_video()) {
		std::stable_sort(candidates.begin(), candidates.end(), [](const DateCandidate &a, const DateCandidate &b) {
			return video_field_rank(a.field) < video_field_rank(b.field);
		});
	}

	for (const DateCandidate &candidate : candidates) {
		std::optional<TimestampRecord> record = record_from_candidate(candidate, item.kind);
		if (!record.has_value()) {
			qCDebug(lcTimestamp, "unparseable %s '%s' on '%s'", date_field_name(candidate.field),
				qUtf8Printable(candidate.raw_value), qUtf8Printable(item.path));
			continue;
		}
		if (detail)
			*detail = date_field_name(candidate.field);
		return record;
	}
	return std::nullopt;
}

std::optional<TimestampRecord> TimestampResolver::record_from_candidate(const DateCandidate &candidate,
									MediaKind kind) const
{
	const std::optional<ParsedDateTime> parsed = parse_metadata_date(candidate.raw_value);
	if (!parsed.has_value())
		return std::nullopt;

	// Cameras record local time without an offset.
	if (kind == MediaKind::Image)
		return naive_record(parsed.value(), TimestampSource::DeviceMetadata, m_naive_zone);

	const TimestampSource source = candidate.field == DateField::VendorCreationDate
					       ? TimestampSource::DeviceMetadata
					       : TimestampSource::GenericVideoMetadata;

	if (parsed->offset_minutes.has_value()) {
		TimestampRecord record;
		record.wall_clock = format_wall_clock(parsed->date, parsed->time);
		record.utc_epoch = epoch_from_wall_clock(parsed->date, parsed->time, parsed->offset_minutes.value());
		record.has_timezone = true;
		record.tz_offset_minutes = parsed->offset_minutes;
		record.source = source;
		return record;
	}

	if (parsed->utc || candidate.utc_by_convention)
		return absolute_record(epoch_from_wall_clock(parsed->date, parsed->time, 0), source, m_naive_zone);

	return naive_record(parsed.value(), source, m_naive_zone);
}

std::optional<TimestampRecord> TimestampResolver::record_from_filename(const QString &file_name) const
{
	static const QRegularExpression filename_re(QStringLiteral(
		"(?<!\\d)(20\\d{2})[-_.]?(\\d{2})[-_.]?(\\d{2})(?:[-_ T.]?(\\d{2})[-_.:]?(\\d{2})[-_.:]?(\\d{2}))?(?!\\d)"));

	QRegularExpressionMatchIterator it = filename_re.globalMatch(file_name);
	while (it.hasNext()) {
		const QRegularExpressionMatch match = it.next();
		const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
		if (!date.isValid())
			continue;

		QTime time(0, 0, 0);
		if (!match.captured(4).isEmpty()) {
			const QTime parsed_time(match.captured(4).toInt(), match.captured(5).toInt(),
						match.captured(6).toInt());
			if (parsed_time.isValid())
				time = parsed_time;
		}

		ParsedDateTime parsed;
		parsed.date = date;
		parsed.time = time;
		return naive_record(parsed, TimestampSource::FilenamePattern, m_naive_zone);
	}
	return std::nullopt;
}

std::optional<TimestampRecord> TimestampResolver::record_from_filesystem(const QString &media_path) const
{
	const QFileInfo info(media_path);
	if (!info.exists())
		return std::nullopt;

	std::optional<QDateTime> earliest;
	for (const QDateTime &candidate : {info.birthTime(), info.lastModified(), info.metadataChangeTime()}) {
		if (!candidate.isValid() || candidate.toMSecsSinceEpoch() <= 0)
			continue;
		if (!earliest.has_value() || candidate < earliest.value())
			earliest = candidate;
	}
	if (!earliest.has_value())
		return std::nullopt;

	const double epoch = static_cast<double>(earliest->toMSecsSinceEpoch()) / 1000.0;
	return absolute_record(epoch, TimestampSource::Filesystem, m_naive_zone);
}

TimestampRecord TimestampResolver::unresolved_record()
{
	TimestampRecord record;
	record.utc_epoch = SENTINEL_EPOCH;
	record.source = TimestampSource::Unknown;
	return record;
}

} // namespace pva
