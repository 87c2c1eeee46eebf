#include "pva-media-orderer.hpp"

#include "pva-datetime.hpp"

#include <algorithm>

namespace pva {

void MediaOrderer::order(QVector<CatalogEntry> &entries) const
{
	std::stable_sort(entries.begin(), entries.end(), &MediaOrderer::precedes);
}

double MediaOrderer::effective_epoch(const CatalogEntry &entry)
{
	if (entry.manual_epoch.has_value())
		return entry.manual_epoch.value();
	if (entry.timestamp.is_resolved())
		return entry.timestamp.utc_epoch;
	return SENTINEL_EPOCH;
}

bool MediaOrderer::precedes(const CatalogEntry &lhs, const CatalogEntry &rhs)
{
	const double lhs_epoch = effective_epoch(lhs);
	const double rhs_epoch = effective_epoch(rhs);
	if (lhs_epoch != rhs_epoch)
		return lhs_epoch < rhs_epoch;
	return compare_version_suffix(lhs.item.version_suffix, rhs.item.version_suffix) < 0;
}

std::optional<double> MediaOrderer::manual_epoch(const QString &manual_wall_clock, const TimestampRecord &record,
						 const QTimeZone &naive_zone)
{
	if (manual_wall_clock.isEmpty())
		return std::nullopt;

	const std::optional<ParsedDateTime> wall = parse_wall_clock(manual_wall_clock);
	if (!wall.has_value())
		return std::nullopt;

	if (record.tz_offset_minutes.has_value())
		return epoch_from_wall_clock(wall->date, wall->time, record.tz_offset_minutes.value());
	return epoch_in_zone(wall->date, wall->time, naive_zone);
}

} // namespace pva
