#include "pva-annotation-timeline.hpp"

#include <cstdlib>
#include <iostream>
#include <random>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Timeline test failed: " << message << std::endl;
	std::exit(1);
}

pva::AnnotationSegment segment(double start_time, const QString &text, bool skip = false)
{
	pva::AnnotationSegment seg;
	seg.start_time = start_time;
	seg.text = text;
	seg.skip = skip;
	return seg;
}

void test_empty_timeline_has_baseline()
{
	const pva::AnnotationTimeline timeline;
	require(timeline.size() == 1, "empty timeline holds one segment");
	require(timeline.at(0).start_time == 0.0, "baseline starts at zero");
	require(timeline.at(0).text.isEmpty(), "baseline text empty");
	require(timeline.is_normalized(), "empty timeline normalized");
}

void test_load_repairs_unsorted_duplicates()
{
	QVector<pva::AnnotationSegment> loaded;
	loaded.push_back(segment(20.0, "later"));
	loaded.push_back(segment(5.0, ""));
	loaded.push_back(segment(5.0, "kept"));
	loaded.push_back(segment(12.5, "middle"));

	const pva::AnnotationTimeline timeline(loaded);
	require(timeline.is_normalized(), "loaded timeline normalized");
	require(timeline.size() == 4, "baseline added and duplicate dropped");
	require(timeline.at(1).start_time == 5.0, "sorted first user segment");
	require(timeline.at(1).text == "kept", "duplicate with text wins");
	require(timeline.at(3).text == "later", "last segment is latest");
}

void test_dedup_prefers_skip_when_texts_empty()
{
	QVector<pva::AnnotationSegment> input;
	input.push_back(segment(3.0, ""));
	input.push_back(segment(3.0, "", true));
	const QVector<pva::AnnotationSegment> once = pva::AnnotationTimeline::deduplicate(input);
	require(once.size() == 1, "dedup collapses equal start times");
	require(once.first().skip, "skip flag survives dedup");

	const QVector<pva::AnnotationSegment> twice = pva::AnnotationTimeline::deduplicate(once);
	require(twice.size() == once.size(), "dedup idempotent size");
	require(twice.first().skip == once.first().skip && twice.first().text == once.first().text,
		"dedup idempotent content");
}

void test_active_segment_last_not_after()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(10.0, "ten");
	timeline.insert(20.0, "twenty");

	require(timeline.active_segment(0.0).start_time == 0.0, "position zero selects baseline");
	require(timeline.active_segment(9.999).start_time == 0.0, "before first segment selects baseline");
	require(timeline.active_segment(10.0).text == "ten", "exact start selects segment");
	require(timeline.active_segment(19.0).text == "ten", "between selects previous");
	require(timeline.active_segment(500.0).text == "twenty", "after last selects last");
	require(timeline.active_index(-3.0) == 0, "negative position selects baseline");
}

void test_insert_at_existing_time_merges()
{
	pva::AnnotationTimeline timeline;
	const quint64 first = timeline.insert(4.0, "original");
	const quint64 second = timeline.insert(4.0, "");
	require(timeline.size() == 2, "insert at same time does not duplicate");
	require(second == first, "empty insert merged into existing segment");
	require(timeline.at(1).text == "original", "existing text retained");
}

void test_set_start_time_keeps_order()
{
	pva::AnnotationTimeline timeline;
	const quint64 a = timeline.insert(5.0, "a");
	const quint64 b = timeline.insert(10.0, "b");

	const quint64 moved = timeline.set_start_time(a, 15.0);
	require(moved == a, "moved segment keeps identity");
	require(timeline.is_normalized(), "order restored after move");
	require(timeline.at(2).text == "a", "moved segment now last");

	const quint64 onto = timeline.set_start_time(a, 10.0);
	require(timeline.size() == 2, "moving onto existing segment merges");
	require(onto == b, "segment already at that time survives a tie");
	require(timeline.is_normalized(), "normalized after merge");
}

void test_remove_baseline_clears_text()
{
	pva::AnnotationTimeline timeline;
	const quint64 baseline = timeline.at(0).id;
	timeline.set_text(baseline, "intro");
	timeline.insert(8.0, "scene");

	require(timeline.remove_active(2.0), "remove active baseline");
	require(timeline.size() == 2, "baseline removal keeps length");
	require(timeline.at(0).text.isEmpty(), "baseline text cleared");

	require(timeline.remove_active(9.0), "remove active user segment");
	require(timeline.size() == 1, "user segment removed");
}

void test_auto_advance_skips_segment()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(10.0, "boring", true);
	timeline.insert(20.0, "resume");

	const pva::PlaybackDecision at_ten = timeline.decide_playback(10.0, pva::PlaybackMode::AutoAdvance, 60.0);
	require(at_ten.seek_to.has_value(), "skip segment seeks in auto mode");
	require(at_ten.seek_to.value() == 20.0, "seek to next non-skip segment");
	require(at_ten.display_text == "resume", "next segment text displayed");

	const pva::PlaybackDecision again = timeline.decide_playback(10.0, pva::PlaybackMode::AutoAdvance, 60.0);
	require(again.seek_to == at_ten.seek_to && again.segment_index == at_ten.segment_index,
		"repeated position yields identical decision");
}

void test_manual_pause_shows_sentinel()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(10.0, "stored text", true);
	timeline.insert(20.0, "resume");

	const pva::PlaybackDecision decision = timeline.decide_playback(12.0, pva::PlaybackMode::Manual, 60.0);
	require(!decision.seek_to.has_value(), "manual mode never seeks");
	require(decision.display_text == pva::SKIPPED_SEGMENT_TEXT, "manual mode shows sentinel");
}

void test_trailing_skip_stops_at_end()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(30.0, "credits", true);
	timeline.insert(40.0, "", true);

	const pva::PlaybackDecision decision = timeline.decide_playback(31.0, pva::PlaybackMode::AutoAdvance, 50.0);
	require(decision.stop_at_end, "trailing skips stop playback");
	require(decision.seek_to.has_value() && decision.seek_to.value() == 50.0, "seek to end of media");
}

void test_persisted_form_drops_ids()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(3.0, "x");
	const QVector<pva::AnnotationSegment> persisted = timeline.to_persisted();
	require(persisted.size() == 2, "persisted includes baseline");
	require(persisted.at(0).id == 0 && persisted.at(1).id == 0, "ids are session-local");
}

void test_random_edits_stay_normalized()
{
	// Half-second grid up to 10s so inserts and moves collide often, baseline included.
	std::mt19937 rng(20240101u);
	std::uniform_int_distribution<int> op_dist(0, 4);
	std::uniform_int_distribution<int> slot_dist(0, 20);

	pva::AnnotationTimeline timeline;
	for (int step = 0; step < 2000; ++step) {
		const double time = slot_dist(rng) * 0.5;
		const int pick = std::uniform_int_distribution<int>(0, timeline.size() - 1)(rng);
		const quint64 id = timeline.at(pick).id;

		switch (op_dist(rng)) {
		case 0:
			require(timeline.insert(time, step % 3 == 0 ? QString() : QString::number(step), step % 5 == 0) != 0,
				"insert returns the holder of its start time");
			break;
		case 1:
			require(timeline.set_start_time(id, time) != 0, "move returns the surviving segment");
			break;
		case 2:
			require(timeline.remove(id), "remove finds the segment");
			break;
		case 3:
			require(timeline.remove_active(time), "remove active always has a target");
			break;
		default:
			require(timeline.set_skip(id, !timeline.at(pick).skip) == id, "skip toggled in place");
			break;
		}

		require(timeline.is_normalized(), "sorted, unique and baseline-first after every edit");
		require(timeline.active_segment(time).start_time <= time, "active segment never starts after position");
	}
}

} // namespace

int main()
{
	test_empty_timeline_has_baseline();
	test_load_repairs_unsorted_duplicates();
	test_dedup_prefers_skip_when_texts_empty();
	test_active_segment_last_not_after();
	test_insert_at_existing_time_merges();
	test_set_start_time_keeps_order();
	test_remove_baseline_clears_text();
	test_auto_advance_skips_segment();
	test_manual_pause_shows_sentinel();
	test_trailing_skip_stops_at_end();
	test_persisted_form_drops_ids();
	test_random_edits_stay_normalized();
	return 0;
}
