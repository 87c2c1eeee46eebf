#pragma once

#include "pva-models.hpp"

#include <QString>
#include <QVector>

#include <optional>

namespace pva {

constexpr const char *SKIPPED_SEGMENT_TEXT = "segment skipped";

enum class PlaybackMode {
	AutoAdvance,
	Manual,
};

struct PlaybackDecision {
	int segment_index = 0;
	QString display_text;
	std::optional<double> seek_to;
	bool stop_at_end = false;
};

// Time-ordered annotations of one video. Every mutation leaves the sequence
// sorted by start time, free of duplicate start times, and holding exactly one
// baseline segment at 0.0.
class AnnotationTimeline {
public:
	AnnotationTimeline();
	explicit AnnotationTimeline(const QVector<AnnotationSegment> &segments);

	const QVector<AnnotationSegment> &segments() const;
	int size() const;
	const AnnotationSegment &at(int index) const;
	int index_of(quint64 id) const;
	const AnnotationSegment *find(quint64 id) const;

	// Last segment with start_time <= position. Always defined thanks to the baseline.
	int active_index(double position) const;
	const AnnotationSegment &active_segment(double position) const;

	// Mutators return the id of the segment that holds the affected start time
	// afterwards; it differs from the input id when deduplication merged it away.
	quint64 insert(double start_time, const QString &text, bool skip = false);
	quint64 set_text(quint64 id, const QString &text);
	quint64 set_start_time(quint64 id, double start_time);
	quint64 set_skip(quint64 id, bool skip);

	// Removing the baseline clears its text instead.
	bool remove(quint64 id);
	bool remove_active(double position);

	PlaybackDecision decide_playback(double position, PlaybackMode mode, double media_duration) const;

	QVector<AnnotationSegment> to_persisted() const;
	bool is_normalized() const;

	static bool is_baseline(const AnnotationSegment &segment) { return segment.start_time == 0.0; }
	static QVector<AnnotationSegment> deduplicate(const QVector<AnnotationSegment> &segments);

private:
	void normalize();
	quint64 id_at(double start_time) const;

	QVector<AnnotationSegment> m_segments;
	quint64 m_next_id = 1;
};

} // namespace pva
