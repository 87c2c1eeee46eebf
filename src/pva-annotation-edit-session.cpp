#include "pva-annotation-edit-session.hpp"

#include "pva-logging.hpp"

#include <algorithm>

namespace pva {

const char *edit_state_name(EditState state)
{
	switch (state) {
	case EditState::Idle:
		return "idle";
	case EditState::PendingNew:
		return "pending_new";
	case EditState::Editing:
		return "editing";
	default:
		return "unknown";
	}
}

AnnotationEditSession::AnnotationEditSession(AnnotationTimeline *timeline, PlaybackTransport *transport)
	: m_timeline(timeline),
	  m_transport(transport)
{
}

void AnnotationEditSession::set_changed_callback(ChangedCallback cb)
{
	m_changed_cb = std::move(cb);
}

EditState AnnotationEditSession::state() const
{
	return m_state;
}

double AnnotationEditSession::pending_start_time() const
{
	return m_pending_start_time;
}

QString AnnotationEditSession::pending_text() const
{
	return m_pending_text;
}

quint64 AnnotationEditSession::bound_segment_id() const
{
	return m_state == EditState::Editing ? m_bound_id : 0;
}

const AnnotationSegment *AnnotationEditSession::bound_segment() const
{
	if (m_state != EditState::Editing || !m_timeline)
		return nullptr;
	return m_timeline->find(m_bound_id);
}

void AnnotationEditSession::begin_add(double position)
{
	flush();
	if (!m_timeline)
		return;

	m_state = EditState::PendingNew;
	m_pending_start_time = std::max(0.0, position);
	m_pending_text.clear();
	if (m_transport)
		m_transport->pause();

	qCDebug(lcAnnotations, "add annotation opened at %.3f", m_pending_start_time);
}

QString AnnotationEditSession::begin_edit(double position)
{
	flush();
	if (!m_timeline)
		return {};

	const AnnotationSegment &active = m_timeline->active_segment(position);
	m_state = EditState::Editing;
	m_bound_id = active.id;

	qCDebug(lcAnnotations, "edit annotation opened: start=%.3f", active.start_time);
	return active.text;
}

void AnnotationEditSession::update_text(const QString &text)
{
	if (m_state == EditState::PendingNew) {
		m_pending_text = text;
		return;
	}
	if (m_state != EditState::Editing)
		return;

	const AnnotationSegment *bound = bound_segment();
	if (!bound || bound->text == text)
		return;

	m_timeline->set_text(m_bound_id, text);
	notify_changed();
}

void AnnotationEditSession::update_position(double position)
{
	if (m_state != EditState::Editing)
		return;

	const AnnotationSegment *bound = bound_segment();
	const double start_time = std::max(0.0, position);
	if (!bound || bound->start_time == start_time)
		return;

	const quint64 survivor = m_timeline->set_start_time(m_bound_id, start_time);
	if (survivor != m_bound_id)
		qCDebug(lcAnnotations, "edited annotation merged into existing segment at %.3f", start_time);
	m_bound_id = survivor;
	notify_changed();
}

void AnnotationEditSession::focus_lost()
{
	if (m_state != EditState::Idle)
		qCDebug(lcAnnotations, "input focus left while %s, session stays open", edit_state_name(m_state));
}

FlushOutcome AnnotationEditSession::finish()
{
	return close("finish");
}

FlushOutcome AnnotationEditSession::flush()
{
	return close("flush");
}

FlushOutcome AnnotationEditSession::close(const char *reason)
{
	FlushOutcome outcome = FlushOutcome::NothingPending;

	if (m_state == EditState::PendingNew) {
		if (m_pending_text.isEmpty()) {
			outcome = FlushOutcome::Discarded;
		} else {
			m_timeline->insert(m_pending_start_time, m_pending_text);
			outcome = FlushOutcome::Committed;
			notify_changed();
		}
	} else if (m_state == EditState::Editing) {
		// Text and time were written live; closing only releases the binding.
		outcome = FlushOutcome::Committed;
	}

	if (m_state != EditState::Idle)
		qCDebug(lcAnnotations, "annotation session closed (%s): state=%s outcome=%s", reason,
			edit_state_name(m_state), outcome == FlushOutcome::Committed ? "committed" : "discarded");

	m_state = EditState::Idle;
	m_pending_start_time = 0.0;
	m_pending_text.clear();
	m_bound_id = 0;
	return outcome;
}

void AnnotationEditSession::notify_changed() const
{
	if (m_changed_cb)
		m_changed_cb();
}

} // namespace pva
