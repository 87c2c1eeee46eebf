#pragma once

#include "pva-annotation-timeline.hpp"
#include "pva-playback-transport.hpp"

#include <QString>

#include <functional>

namespace pva {

enum class EditState {
	Idle,
	PendingNew,
	Editing,
};

enum class FlushOutcome {
	NothingPending,
	Committed,
	Discarded,
};

// The single writer of one video's timeline while an add or edit is open.
class AnnotationEditSession {
public:
	using ChangedCallback = std::function<void()>;

	explicit AnnotationEditSession(AnnotationTimeline *timeline, PlaybackTransport *transport = nullptr);

	void set_changed_callback(ChangedCallback cb);

	EditState state() const;
	bool is_active() const { return m_state != EditState::Idle; }
	double pending_start_time() const;
	QString pending_text() const;
	quint64 bound_segment_id() const;
	const AnnotationSegment *bound_segment() const;

	// Pauses playback and captures the current position as the new start time.
	void begin_add(double position);
	// Binds to the active segment at position and returns its text.
	QString begin_edit(double position);

	void update_text(const QString &text);
	void update_position(double position);
	// Leaving the text field to scrub must keep the session open.
	void focus_lost();

	FlushOutcome finish();
	FlushOutcome flush();

private:
	FlushOutcome close(const char *reason);
	void notify_changed() const;

	AnnotationTimeline *m_timeline = nullptr;
	PlaybackTransport *m_transport = nullptr;
	ChangedCallback m_changed_cb;

	EditState m_state = EditState::Idle;
	double m_pending_start_time = 0.0;
	QString m_pending_text;
	quint64 m_bound_id = 0;
};

const char *edit_state_name(EditState state);

} // namespace pva
