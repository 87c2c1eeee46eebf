#include "pva-annotation-edit-session.hpp"

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Edit session test failed: " << message << std::endl;
	std::exit(1);
}

class RecordingTransport : public pva::PlaybackTransport {
public:
	void pause() override { pauses += 1; }
	void seek(double position_seconds) override { last_seek = position_seconds; }
	void stop() override { stops += 1; }

	int pauses = 0;
	int stops = 0;
	double last_seek = -1.0;
};

void test_add_commits_on_finish()
{
	pva::AnnotationTimeline timeline;
	RecordingTransport transport;
	pva::AnnotationEditSession session(&timeline, &transport);
	int changes = 0;
	session.set_changed_callback([&changes]() { changes += 1; });

	session.begin_add(7.5);
	require(session.state() == pva::EditState::PendingNew, "add opens pending state");
	require(transport.pauses == 1, "add pauses playback");

	session.update_text("dog runs");
	require(timeline.size() == 1, "pending text not written before commit");

	require(session.finish() == pva::FlushOutcome::Committed, "finish commits text");
	require(session.state() == pva::EditState::Idle, "session idle after finish");
	require(timeline.size() == 2, "segment inserted");
	require(timeline.at(1).start_time == 7.5 && timeline.at(1).text == "dog runs", "segment content");
	require(changes == 1, "one change notification");
}

void test_empty_add_is_discarded()
{
	pva::AnnotationTimeline timeline;
	pva::AnnotationEditSession session(&timeline);

	session.begin_add(3.0);
	require(session.flush() == pva::FlushOutcome::Discarded, "empty pending add discarded");
	require(timeline.size() == 1, "nothing inserted");
	require(session.flush() == pva::FlushOutcome::NothingPending, "second flush is a no-op");
}

void test_focus_loss_keeps_session_open()
{
	pva::AnnotationTimeline timeline;
	pva::AnnotationEditSession session(&timeline);

	session.begin_add(2.0);
	session.update_text("wave");
	session.focus_lost();
	require(session.state() == pva::EditState::PendingNew, "focus loss does not close add");
	require(session.pending_text() == "wave", "pending text retained");
}

void test_edit_writes_live_and_follows_scrub()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(10.0, "old");
	timeline.insert(30.0, "other");
	pva::AnnotationEditSession session(&timeline);
	int changes = 0;
	session.set_changed_callback([&changes]() { changes += 1; });

	const QString text = session.begin_edit(12.0);
	require(text == "old", "edit returns active text");
	require(session.state() == pva::EditState::Editing, "edit state");

	session.update_text("new");
	require(timeline.active_segment(12.0).text == "new", "text written live");
	session.update_text("new");
	require(changes == 1, "unchanged text does not notify");

	session.update_position(14.0);
	require(timeline.at(1).start_time == 14.0, "start time follows position");
	require(timeline.is_normalized(), "timeline normalized after scrub");
	session.update_position(14.0);
	require(changes == 2, "repeated position is idempotent");

	session.update_position(40.0);
	require(timeline.at(2).start_time == 40.0 && timeline.at(2).text == "new", "scrub past neighbour reorders");
	require(session.bound_segment() && session.bound_segment()->text == "new", "binding follows segment");

	require(session.finish() == pva::FlushOutcome::Committed, "edit finish reports committed");
	require(session.bound_segment() == nullptr, "binding released");
}

void test_scrub_onto_existing_rebinds_survivor()
{
	pva::AnnotationTimeline timeline;
	timeline.insert(5.0, "");
	timeline.insert(9.0, "keep me");
	pva::AnnotationEditSession session(&timeline);

	session.begin_edit(5.0);
	session.update_position(9.0);
	require(timeline.size() == 2, "merged into existing segment");
	const pva::AnnotationSegment *bound = session.bound_segment();
	require(bound != nullptr, "session bound to survivor");
	require(bound->text == "keep me", "survivor is the segment with text");
}

void test_begin_add_flushes_open_add()
{
	pva::AnnotationTimeline timeline;
	pva::AnnotationEditSession session(&timeline);

	session.begin_add(1.0);
	session.update_text("first");
	session.begin_add(6.0);
	require(timeline.size() == 2, "previous add flushed before new add");
	require(session.pending_start_time() == 6.0, "new add captured position");
}

} // namespace

int main()
{
	test_add_commits_on_finish();
	test_empty_add_is_discarded();
	test_focus_loss_keeps_session_open();
	test_edit_writes_live_and_follows_scrub();
	test_scrub_onto_existing_rebinds_survivor();
	test_begin_add_flushes_open_add();
	return 0;
}
