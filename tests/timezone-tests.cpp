#include "pva-datetime.hpp"
#include "pva-media-orderer.hpp"
#include "pva-timezone-inferencer.hpp"

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Timezone test failed: " << message << std::endl;
	std::exit(1);
}

pva::TimestampRecord explicit_record(const QString &wall_clock, int offset_minutes)
{
	const auto wall = pva::parse_wall_clock(wall_clock);
	pva::TimestampRecord record;
	record.wall_clock = wall_clock;
	record.utc_epoch = pva::epoch_from_wall_clock(wall->date, wall->time, offset_minutes);
	record.has_timezone = true;
	record.tz_offset_minutes = offset_minutes;
	record.source = pva::TimestampSource::DeviceMetadata;
	return record;
}

pva::TimestampRecord naive_record(const QString &wall_clock)
{
	const auto wall = pva::parse_wall_clock(wall_clock);
	pva::TimestampRecord record;
	record.wall_clock = wall_clock;
	record.utc_epoch = pva::epoch_from_wall_clock(wall->date, wall->time, 0);
	record.source = pva::TimestampSource::FilenamePattern;
	return record;
}

pva::CatalogEntry entry(const QString &path, double epoch)
{
	pva::CatalogEntry e;
	e.item = pva::media_item_from_path(path);
	e.timestamp.utc_epoch = epoch;
	e.timestamp.source = pva::TimestampSource::DeviceMetadata;
	return e;
}

void test_offset_propagates_to_later_naive_record()
{
	pva::TimestampRecord a = explicit_record("2024/05/01 08:00:00", 420);
	pva::TimestampRecord b = naive_record("2024/05/01 10:00:00");
	require(a.utc_epoch < b.utc_epoch, "explicit record precedes naive record");

	const pva::InferenceStats stats = pva::TimezoneInferencer().infer({&b, &a});
	require(stats.inferred == 1, "one offset inferred");
	require(b.tz_offset_minutes == 420, "naive record acquires +07:00");
	require(b.offset_inferred, "offset flagged as inferred");
	require(!b.has_timezone, "inferred offset is not an explicit timezone");
	require(b.wall_clock == "2024/05/01 10:00:00", "wall clock unchanged");
	require(b.utc_epoch == 1714532400.0, "epoch recomputed from wall clock and inferred offset");
}

void test_absolute_record_keeps_epoch()
{
	pva::TimestampRecord a = explicit_record("2024/05/01 08:00:00", 420);
	pva::TimestampRecord c;
	c.utc_epoch = 1714557600.0;
	c.wall_clock = "2024/05/01 10:00:00";
	c.absolute = true;
	c.source = pva::TimestampSource::Filesystem;

	pva::TimezoneInferencer().infer({&a, &c});
	require(c.tz_offset_minutes == 420, "absolute record acquires offset");
	require(c.utc_epoch == 1714557600.0, "absolute epoch kept");
	require(c.wall_clock == "2024/05/01 17:00:00", "wall clock re-rendered in inferred offset");
}

void test_running_offset_changes_and_reassigns()
{
	pva::TimestampRecord a = explicit_record("2024/05/01 08:00:00", 420);
	pva::TimestampRecord b = naive_record("2024/05/02 08:00:00");
	pva::TimestampRecord d = explicit_record("2024/05/03 08:00:00", 120);
	pva::TimestampRecord e = naive_record("2024/05/04 08:00:00");
	e.tz_offset_minutes = 420;
	e.offset_inferred = true;

	const pva::InferenceStats stats = pva::TimezoneInferencer().infer({&a, &b, &d, &e});
	require(b.tz_offset_minutes == 420, "first run uses first explicit offset");
	require(e.tz_offset_minutes == 120, "stale inferred offset replaced");
	require(stats.inferred == 1 && stats.reassigned == 1, "stats count new and reassigned");
	require(d.tz_offset_minutes == 120 && !d.offset_inferred, "explicit offset untouched");
}

void test_records_before_first_offset_stay_naive()
{
	pva::TimestampRecord early = naive_record("2024/04/30 08:00:00");
	pva::TimestampRecord a = explicit_record("2024/05/01 08:00:00", 420);
	pva::TimestampRecord unresolved;

	pva::TimezoneInferencer().infer({&early, &a, &unresolved});
	require(!early.tz_offset_minutes.has_value(), "nothing to inherit before the first offset");
	require(!unresolved.tz_offset_minutes.has_value(), "unresolved record skipped");
}

void test_order_by_epoch_then_suffix()
{
	QVector<pva::CatalogEntry> entries;
	entries.push_back(entry("/p/c.jpg", 300.0));
	entries.push_back(entry("/p/beach##2.jpg", 100.0));
	entries.push_back(entry("/p/beach.jpg", 100.0));
	entries.push_back(entry("/p/beach##1.jpg", 100.0));
	pva::CatalogEntry unknown = entry("/p/unknown.jpg", 0.0);
	unknown.timestamp = pva::TimestampRecord();
	entries.push_back(unknown);

	pva::MediaOrderer().order(entries);
	require(entries.at(0).key() == "beach.jpg", "unsuffixed first among equal epochs");
	require(entries.at(1).key() == "beach.jpg##1", "suffix 1 next");
	require(entries.at(2).key() == "beach.jpg##2", "suffix 2 next");
	require(entries.at(3).key() == "c.jpg", "later epoch after");
	require(entries.at(4).key() == "unknown.jpg", "unresolved last");
}

void test_manual_epoch_overrides_order()
{
	QVector<pva::CatalogEntry> entries;
	entries.push_back(entry("/p/a.jpg", 1000.0));
	pva::CatalogEntry b = entry("/p/b.jpg", 2000.0);
	b.timestamp.tz_offset_minutes = 60;
	b.manual_epoch = pva::MediaOrderer::manual_epoch("1970/01/01 01:00:00", b.timestamp, QTimeZone::utc());
	require(b.manual_epoch.has_value() && b.manual_epoch.value() == 0.0, "manual time placed in record offset");
	entries.push_back(b);

	pva::MediaOrderer().order(entries);
	require(entries.first().key() == "b.jpg", "manual epoch reorders");
	require(!pva::MediaOrderer::manual_epoch("", b.timestamp, QTimeZone::utc()).has_value(), "empty manual time");
}

} // namespace

int main()
{
	test_offset_propagates_to_later_naive_record();
	test_absolute_record_keeps_epoch();
	test_running_offset_changes_and_reassigns();
	test_records_before_first_offset_stay_naive();
	test_order_by_epoch_then_suffix();
	test_manual_epoch_overrides_order();
	return 0;
}
