#include "pva-annotation-timeline.hpp"

#include "pva-logging.hpp"

#include <algorithm>

namespace pva {
namespace {

// True when candidate should replace kept for the same start time.
bool preferred_over(const AnnotationSegment &candidate, const AnnotationSegment &kept)
{
	const bool candidate_has_text = !candidate.text.isEmpty();
	const bool kept_has_text = !kept.text.isEmpty();
	if (candidate_has_text != kept_has_text)
		return candidate_has_text;
	return candidate.skip && !kept.skip;
}

} // namespace

AnnotationTimeline::AnnotationTimeline()
{
	normalize();
}

AnnotationTimeline::AnnotationTimeline(const QVector<AnnotationSegment> &segments)
{
	m_segments.reserve(segments.size() + 1);
	for (AnnotationSegment segment : segments) {
		segment.start_time = std::max(0.0, segment.start_time);
		segment.id = m_next_id++;
		m_segments.push_back(segment);
	}
	const int loaded = static_cast<int>(m_segments.size());
	normalize();
	if (m_segments.size() != loaded)
		qCDebug(lcAnnotations, "timeline repaired on load: %d -> %lld segments", loaded,
			static_cast<long long>(m_segments.size()));
}

const QVector<AnnotationSegment> &AnnotationTimeline::segments() const
{
	return m_segments;
}

int AnnotationTimeline::size() const
{
	return static_cast<int>(m_segments.size());
}

const AnnotationSegment &AnnotationTimeline::at(int index) const
{
	return m_segments.at(index);
}

int AnnotationTimeline::index_of(quint64 id) const
{
	for (int i = 0; i < m_segments.size(); ++i) {
		if (m_segments.at(i).id == id)
			return i;
	}
	return -1;
}

const AnnotationSegment *AnnotationTimeline::find(quint64 id) const
{
	const int index = index_of(id);
	return index < 0 ? nullptr : &m_segments.at(index);
}

int AnnotationTimeline::active_index(double position) const
{
	const auto after = std::upper_bound(m_segments.cbegin(), m_segments.cend(), std::max(0.0, position),
					    [](double value, const AnnotationSegment &segment) {
						    return value < segment.start_time;
					    });
	const int index = static_cast<int>(after - m_segments.cbegin()) - 1;
	return std::max(0, index);
}

const AnnotationSegment &AnnotationTimeline::active_segment(double position) const
{
	return m_segments.at(active_index(position));
}

quint64 AnnotationTimeline::insert(double start_time, const QString &text, bool skip)
{
	AnnotationSegment segment;
	segment.start_time = std::max(0.0, start_time);
	segment.text = text;
	segment.skip = skip;
	segment.id = m_next_id++;
	m_segments.push_back(segment);
	normalize();
	return id_at(segment.start_time);
}

quint64 AnnotationTimeline::set_text(quint64 id, const QString &text)
{
	const int index = index_of(id);
	if (index < 0)
		return 0;
	m_segments[index].text = text;
	return id;
}

quint64 AnnotationTimeline::set_start_time(quint64 id, double start_time)
{
	const int index = index_of(id);
	if (index < 0)
		return 0;

	const double clamped = std::max(0.0, start_time);
	if (m_segments.at(index).start_time == clamped)
		return id;

	m_segments[index].start_time = clamped;
	normalize();
	return id_at(clamped);
}

quint64 AnnotationTimeline::set_skip(quint64 id, bool skip)
{
	const int index = index_of(id);
	if (index < 0)
		return 0;

	m_segments[index].skip = skip;
	return id;
}

bool AnnotationTimeline::remove(quint64 id)
{
	const int index = index_of(id);
	if (index < 0)
		return false;

	if (is_baseline(m_segments.at(index))) {
		m_segments[index].text.clear();
		return true;
	}

	m_segments.removeAt(index);
	return true;
}

bool AnnotationTimeline::remove_active(double position)
{
	return remove(active_segment(position).id);
}

PlaybackDecision AnnotationTimeline::decide_playback(double position, PlaybackMode mode, double media_duration) const
{
	PlaybackDecision decision;
	decision.segment_index = active_index(position);

	const AnnotationSegment &active = m_segments.at(decision.segment_index);
	if (!active.skip) {
		decision.display_text = active.text;
		return decision;
	}

	if (mode == PlaybackMode::Manual) {
		decision.display_text = SKIPPED_SEGMENT_TEXT;
		return decision;
	}

	int target = decision.segment_index + 1;
	while (target < m_segments.size() && m_segments.at(target).skip)
		++target;

	if (target < m_segments.size()) {
		decision.segment_index = target;
		decision.display_text = m_segments.at(target).text;
		decision.seek_to = m_segments.at(target).start_time;
		return decision;
	}

	decision.stop_at_end = true;
	if (media_duration > 0.0)
		decision.seek_to = media_duration;
	return decision;
}

QVector<AnnotationSegment> AnnotationTimeline::to_persisted() const
{
	QVector<AnnotationSegment> persisted = m_segments;
	for (AnnotationSegment &segment : persisted)
		segment.id = 0;
	return persisted;
}

bool AnnotationTimeline::is_normalized() const
{
	if (m_segments.isEmpty() || !is_baseline(m_segments.first()))
		return false;
	for (int i = 1; i < m_segments.size(); ++i) {
		if (!(m_segments.at(i - 1).start_time < m_segments.at(i).start_time))
			return false;
	}
	return true;
}

QVector<AnnotationSegment> AnnotationTimeline::deduplicate(const QVector<AnnotationSegment> &segments)
{
	QVector<AnnotationSegment> sorted = segments;
	std::stable_sort(sorted.begin(), sorted.end(), [](const AnnotationSegment &a, const AnnotationSegment &b) {
		return a.start_time < b.start_time;
	});

	QVector<AnnotationSegment> unique;
	unique.reserve(sorted.size());
	for (const AnnotationSegment &segment : sorted) {
		if (!unique.isEmpty() && unique.last().start_time == segment.start_time) {
			if (preferred_over(segment, unique.last()))
				unique.last() = segment;
			continue;
		}
		unique.push_back(segment);
	}
	return unique;
}

void AnnotationTimeline::normalize()
{
	m_segments = deduplicate(m_segments);
	if (m_segments.isEmpty() || !is_baseline(m_segments.first())) {
		AnnotationSegment baseline;
		baseline.id = m_next_id++;
		m_segments.prepend(baseline);
	}
}

quint64 AnnotationTimeline::id_at(double start_time) const
{
	for (const AnnotationSegment &segment : m_segments) {
		if (segment.start_time == start_time)
			return segment.id;
	}
	return 0;
}

} // namespace pva
