#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

#include <optional>

namespace pva {

// 9999-12-31T23:59:59Z. Unresolved items sort after every real capture.
constexpr double SENTINEL_EPOCH = 253402300799.0;

constexpr const char *SETTINGS_KEY = "_settings";

enum class TimestampSource {
	Unknown,
	DeviceMetadata,
	GenericVideoMetadata,
	FilenamePattern,
	Filesystem,
	Manual,
};

struct TimestampRecord {
	double utc_epoch = SENTINEL_EPOCH;
	QString wall_clock;
	bool has_timezone = false;
	std::optional<int> tz_offset_minutes;
	bool offset_inferred = false;
	// utc_epoch is an exact instant (container UTC field or filesystem time)
	// and wall_clock is only a rendering of it.
	bool absolute = false;
	TimestampSource source = TimestampSource::Unknown;

	bool is_resolved() const { return source != TimestampSource::Unknown; }
	bool is_complete() const { return tz_offset_minutes.has_value(); }
};

struct AnnotationSegment {
	double start_time = 0.0;
	QString text;
	bool skip = false;
	// Session-local identity, never persisted.
	quint64 id = 0;
};

struct GeoLocation {
	QString manual_text;
	QString automated_text;
	std::optional<double> latitude;
	std::optional<double> longitude;

	bool is_empty() const
	{
		return manual_text.isEmpty() && automated_text.isEmpty() && !latitude.has_value() &&
		       !longitude.has_value();
	}
};

struct ItemRecord {
	std::optional<QVector<AnnotationSegment>> annotations;
	std::optional<QString> text;
	std::optional<TimestampRecord> timestamp;
	QString manual_time;
	GeoLocation location;
	std::optional<int> rotation;
	std::optional<double> volume;
	bool skip = false;
	QJsonValue crop;
	QJsonObject extra;
};

struct CollectionSettings {
	bool use_exiftool = true;
	int exiftool_timeout_ms = 5000;
	QString naive_time_zone;
	int max_backups = 10;
	QMap<QString, bool> folders;
	QJsonObject extra;
};

const char *timestamp_source_to_key(TimestampSource source);
TimestampSource timestamp_source_from_key(const QString &source_key);

QString format_utc_offset(int offset_minutes);
bool parse_utc_offset(const QString &text, int *offset_minutes);

QJsonObject annotation_segment_to_json(const AnnotationSegment &segment);
AnnotationSegment annotation_segment_from_json(const QJsonObject &json_obj);

void timestamp_record_to_json(const TimestampRecord &record, QJsonObject *json_obj);
std::optional<TimestampRecord> timestamp_record_from_json(const QJsonObject &json_obj);

QJsonObject item_record_to_json(const ItemRecord &record);
ItemRecord item_record_from_json(const QJsonObject &json_obj);

QJsonObject collection_settings_to_json(const CollectionSettings &settings);
CollectionSettings collection_settings_from_json(const QJsonObject &json_obj);

} // namespace pva
