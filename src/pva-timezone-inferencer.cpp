#include "pva-timezone-inferencer.hpp"

#include "pva-datetime.hpp"
#include "pva-logging.hpp"

#include <algorithm>
#include <optional>

namespace pva {

InferenceStats TimezoneInferencer::infer(const QVector<TimestampRecord *> &records) const
{
	QVector<TimestampRecord *> ordered;
	ordered.reserve(records.size());
	for (TimestampRecord *record : records) {
		if (record && record->is_resolved())
			ordered.push_back(record);
	}

	std::stable_sort(ordered.begin(), ordered.end(), [](const TimestampRecord *a, const TimestampRecord *b) {
		return a->utc_epoch < b->utc_epoch;
	});

	InferenceStats stats;
	std::optional<int> running_offset;
	for (TimestampRecord *record : ordered) {
		if (record->has_timezone && record->tz_offset_minutes.has_value()) {
			running_offset = record->tz_offset_minutes;
			continue;
		}

		if (running_offset.has_value()) {
			if (!record->tz_offset_minutes.has_value()) {
				if (apply_inferred_offset(record, running_offset.value()))
					stats.inferred += 1;
			} else if (record->offset_inferred && record->tz_offset_minutes != running_offset) {
				if (apply_inferred_offset(record, running_offset.value()))
					stats.reassigned += 1;
			}
		}

		if (record->tz_offset_minutes.has_value())
			running_offset = record->tz_offset_minutes;
	}

	if (stats.inferred > 0 || stats.reassigned > 0)
		qCInfo(lcTimezone, "offsets inferred: new=%d reassigned=%d of %lld records", stats.inferred,
		       stats.reassigned, static_cast<long long>(ordered.size()));
	return stats;
}

bool TimezoneInferencer::apply_inferred_offset(TimestampRecord *record, int offset_minutes)
{
	if (!record || record->has_timezone)
		return false;

	if (record->absolute) {
		record->wall_clock = wall_clock_from_epoch(record->utc_epoch, offset_minutes);
	} else {
		const std::optional<ParsedDateTime> wall = parse_wall_clock(record->wall_clock);
		if (!wall.has_value()) {
			qCDebug(lcTimezone, "cannot place wall clock '%s' in offset %s", qUtf8Printable(record->wall_clock),
				qUtf8Printable(format_utc_offset(offset_minutes)));
			return false;
		}
		record->utc_epoch = epoch_from_wall_clock(wall->date, wall->time, offset_minutes);
	}

	record->tz_offset_minutes = offset_minutes;
	record->offset_inferred = true;
	return true;
}

} // namespace pva
