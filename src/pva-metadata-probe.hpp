#pragma once

#include "pva-media-item.hpp"
#include "pva-quicktime-reader.hpp"

#include <QString>
#include <QVector>

#include <optional>

namespace pva {

enum class DateField {
	ImageOriginal,
	VendorCreationDate,
	CreationTime,
	EncodedDate,
	TaggedDate,
	RecordedDate,
};

struct DateCandidate {
	DateField field = DateField::CreationTime;
	QString raw_value;
	// Container fields that are UTC by definition even when the text has no marker.
	bool utc_by_convention = false;
};

struct GpsFix {
	double latitude = 0.0;
	double longitude = 0.0;
};

struct ProbeResult {
	QVector<DateCandidate> dates;
	std::optional<GpsFix> gps;

	bool is_empty() const { return dates.isEmpty() && !gps.has_value(); }
};

const char *date_field_name(DateField field);

// Lower rank wins. Vendor field with explicit offset first, then generic fields.
int video_field_rank(DateField field);

// Failures never propagate: a probe that cannot read a file returns an empty result.
class MetadataProbe {
public:
	virtual ~MetadataProbe() = default;

	virtual QString probe_name() const = 0;
	virtual bool accepts(const MediaItem &item) const = 0;
	virtual ProbeResult probe(const QString &media_path) const = 0;
};

class ExifImageProbe : public MetadataProbe {
public:
	QString probe_name() const override;
	bool accepts(const MediaItem &item) const override;
	ProbeResult probe(const QString &media_path) const override;
};

class QuickTimeProbe : public MetadataProbe {
public:
	QString probe_name() const override;
	bool accepts(const MediaItem &item) const override;
	ProbeResult probe(const QString &media_path) const override;

	static ProbeResult candidates_from_dates(const QuickTimeDates &dates);

private:
	QuickTimeReader m_reader;
};

class ExifToolProbe : public MetadataProbe {
public:
	explicit ExifToolProbe(int timeout_ms = 5000);

	int timeout_ms() const { return m_timeout_ms; }
	QString probe_name() const override;
	bool accepts(const MediaItem &item) const override;
	ProbeResult probe(const QString &media_path) const override;

	static ProbeResult candidates_from_json(const QByteArray &exiftool_json);

private:
	int m_timeout_ms = 5000;
};

} // namespace pva
