#include "pva-models.hpp"

#include <QRegularExpression>

#include <algorithm>
#include <cstdlib>
#include <cstddef>
#include <iterator>

namespace pva {
namespace {

const char *const ITEM_KNOWN_KEYS[] = {
	"annotations",
	"text",
	"creation_time_utc",
	"local_time_zone",
	"local_time_zone_inferred",
	"creation_local_naive",
	"creation_date_time",
	"creation_time_manual",
	"creation_time_source",
	"creation_time_absolute",
	"location",
	"rotation",
	"volume",
	"skip",
	"crop",
};

const char *const SETTINGS_KNOWN_KEYS[] = {
	"use_exiftool", "exiftool_timeout_ms", "naive_time_zone", "max_backups", "folders",
};

template<std::size_t N> bool is_known_key(const char *const (&keys)[N], const QString &key)
{
	return std::any_of(std::begin(keys), std::end(keys), [&key](const char *known) { return key == known; });
}

} // namespace

const char *timestamp_source_to_key(TimestampSource source)
{
	switch (source) {
	case TimestampSource::DeviceMetadata:
		return "device_metadata";
	case TimestampSource::GenericVideoMetadata:
		return "generic_video_metadata";
	case TimestampSource::FilenamePattern:
		return "filename_pattern";
	case TimestampSource::Filesystem:
		return "filesystem";
	case TimestampSource::Manual:
		return "manual";
	case TimestampSource::Unknown:
	default:
		return "unknown";
	}
}

TimestampSource timestamp_source_from_key(const QString &source_key)
{
	if (source_key == "device_metadata")
		return TimestampSource::DeviceMetadata;
	if (source_key == "generic_video_metadata")
		return TimestampSource::GenericVideoMetadata;
	if (source_key == "filename_pattern")
		return TimestampSource::FilenamePattern;
	if (source_key == "filesystem")
		return TimestampSource::Filesystem;
	if (source_key == "manual")
		return TimestampSource::Manual;
	return TimestampSource::Unknown;
}

QString format_utc_offset(int offset_minutes)
{
	const QChar sign = offset_minutes < 0 ? QChar('-') : QChar('+');
	const int magnitude = std::abs(offset_minutes);
	return QString("%1%2:%3").arg(sign).arg(magnitude / 60, 2, 10, QChar('0')).arg(magnitude % 60, 2, 10, QChar('0'));
}

bool parse_utc_offset(const QString &text, int *offset_minutes)
{
	static const QRegularExpression offset_re(QStringLiteral("^([+-])(\\d{2}):?(\\d{2})$"));

	const QRegularExpressionMatch match = offset_re.match(text.trimmed());
	if (!match.hasMatch())
		return false;

	const int hours = match.captured(2).toInt();
	const int minutes = match.captured(3).toInt();
	if (hours > 14 || minutes > 59)
		return false;

	const int total = hours * 60 + minutes;
	if (offset_minutes)
		*offset_minutes = match.captured(1) == "-" ? -total : total;
	return true;
}

QJsonObject annotation_segment_to_json(const AnnotationSegment &segment)
{
	QJsonObject json_obj;
	json_obj.insert("time", segment.start_time);
	json_obj.insert("text", segment.text);
	if (segment.skip)
		json_obj.insert("skip", true);
	return json_obj;
}

AnnotationSegment annotation_segment_from_json(const QJsonObject &json_obj)
{
	AnnotationSegment segment;
	segment.start_time = std::max(0.0, json_obj.value("time").toDouble(0.0));
	segment.text = json_obj.value("text").toString();
	segment.skip = json_obj.value("skip").toBool(false);
	return segment;
}

void timestamp_record_to_json(const TimestampRecord &record, QJsonObject *json_obj)
{
	json_obj->remove("local_time_zone");
	json_obj->remove("local_time_zone_inferred");
	json_obj->remove("creation_local_naive");
	json_obj->remove("creation_time_absolute");

	json_obj->insert("creation_time_utc", record.utc_epoch);
	json_obj->insert("creation_date_time", record.wall_clock);
	json_obj->insert("creation_time_source", timestamp_source_to_key(record.source));
	if (record.tz_offset_minutes.has_value()) {
		const QString offset = format_utc_offset(record.tz_offset_minutes.value());
		json_obj->insert(record.offset_inferred ? "local_time_zone_inferred" : "local_time_zone", offset);
	}
	if (record.absolute)
		json_obj->insert("creation_time_absolute", true);
	else if (!record.has_timezone)
		json_obj->insert("creation_local_naive", record.wall_clock);
}

std::optional<TimestampRecord> timestamp_record_from_json(const QJsonObject &json_obj)
{
	if (!json_obj.value("creation_time_utc").isDouble())
		return std::nullopt;

	TimestampRecord record;
	record.utc_epoch = json_obj.value("creation_time_utc").toDouble();
	record.wall_clock = json_obj.value("creation_local_naive").toString();
	if (record.wall_clock.isEmpty())
		record.wall_clock = json_obj.value("creation_date_time").toString();
	record.source = timestamp_source_from_key(json_obj.value("creation_time_source").toString());
	record.absolute = json_obj.value("creation_time_absolute").toBool(false);

	int offset = 0;
	if (parse_utc_offset(json_obj.value("local_time_zone").toString(), &offset)) {
		record.tz_offset_minutes = offset;
		record.has_timezone = true;
	} else if (parse_utc_offset(json_obj.value("local_time_zone_inferred").toString(), &offset)) {
		record.tz_offset_minutes = offset;
		record.offset_inferred = true;
	}
	return record;
}

QJsonObject item_record_to_json(const ItemRecord &record)
{
	QJsonObject json_obj = record.extra;

	if (record.annotations.has_value()) {
		QJsonArray annotations;
		for (const AnnotationSegment &segment : record.annotations.value())
			annotations.push_back(annotation_segment_to_json(segment));
		json_obj.insert("annotations", annotations);
	}
	if (record.text.has_value())
		json_obj.insert("text", record.text.value());
	if (record.timestamp.has_value())
		timestamp_record_to_json(record.timestamp.value(), &json_obj);
	if (!record.manual_time.isEmpty())
		json_obj.insert("creation_time_manual", record.manual_time);

	if (!record.location.is_empty()) {
		QJsonObject location;
		if (!record.location.manual_text.isEmpty())
			location.insert("manual_text", record.location.manual_text);
		if (!record.location.automated_text.isEmpty())
			location.insert("automated_text", record.location.automated_text);
		if (record.location.latitude.has_value() && record.location.longitude.has_value())
			location.insert("latitude_longitude",
					QJsonArray{record.location.latitude.value(), record.location.longitude.value()});
		json_obj.insert("location", location);
	}

	if (record.rotation.has_value())
		json_obj.insert("rotation", record.rotation.value());
	if (record.volume.has_value())
		json_obj.insert("volume", record.volume.value());
	if (record.skip)
		json_obj.insert("skip", true);
	if (!record.crop.isUndefined() && !record.crop.isNull())
		json_obj.insert("crop", record.crop);

	return json_obj;
}

ItemRecord item_record_from_json(const QJsonObject &json_obj)
{
	ItemRecord record;

	if (json_obj.value("annotations").isArray()) {
		QVector<AnnotationSegment> segments;
		const QJsonArray annotations = json_obj.value("annotations").toArray();
		segments.reserve(annotations.size());
		for (QJsonValue value : annotations) {
			if (!value.isObject())
				continue;
			segments.push_back(annotation_segment_from_json(value.toObject()));
		}
		record.annotations = segments;
	}
	if (json_obj.value("text").isString())
		record.text = json_obj.value("text").toString();

	record.timestamp = timestamp_record_from_json(json_obj);
	record.manual_time = json_obj.value("creation_time_manual").toString();

	const QJsonObject location = json_obj.value("location").toObject();
	record.location.manual_text = location.value("manual_text").toString();
	record.location.automated_text = location.value("automated_text").toString();
	const QJsonArray lat_lon = location.value("latitude_longitude").toArray();
	if (lat_lon.size() == 2 && lat_lon.at(0).isDouble() && lat_lon.at(1).isDouble()) {
		record.location.latitude = lat_lon.at(0).toDouble();
		record.location.longitude = lat_lon.at(1).toDouble();
	}

	if (json_obj.value("rotation").isDouble())
		record.rotation = json_obj.value("rotation").toInt();
	if (json_obj.value("volume").isDouble())
		record.volume = json_obj.value("volume").toDouble();
	record.skip = json_obj.value("skip").toBool(false);
	if (json_obj.contains("crop"))
		record.crop = json_obj.value("crop");

	for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
		if (!is_known_key(ITEM_KNOWN_KEYS, it.key()))
			record.extra.insert(it.key(), it.value());
	}

	return record;
}

QJsonObject collection_settings_to_json(const CollectionSettings &settings)
{
	QJsonObject json_obj = settings.extra;
	json_obj.insert("use_exiftool", settings.use_exiftool);
	json_obj.insert("exiftool_timeout_ms", settings.exiftool_timeout_ms);
	json_obj.insert("naive_time_zone", settings.naive_time_zone);
	json_obj.insert("max_backups", settings.max_backups);

	QJsonObject folders;
	for (auto it = settings.folders.constBegin(); it != settings.folders.constEnd(); ++it)
		folders.insert(it.key(), it.value());
	json_obj.insert("folders", folders);
	return json_obj;
}

CollectionSettings collection_settings_from_json(const QJsonObject &json_obj)
{
	CollectionSettings settings;
	settings.use_exiftool = json_obj.value("use_exiftool").toBool(true);
	settings.exiftool_timeout_ms = std::clamp(json_obj.value("exiftool_timeout_ms").toInt(5000), 250, 60000);
	settings.naive_time_zone = json_obj.value("naive_time_zone").toString();
	settings.max_backups = std::max(0, json_obj.value("max_backups").toInt(10));

	const QJsonObject folders = json_obj.value("folders").toObject();
	for (auto it = folders.begin(); it != folders.end(); ++it) {
		if (it.value().isBool())
			settings.folders.insert(it.key(), it.value().toBool());
	}

	for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
		if (!is_known_key(SETTINGS_KNOWN_KEYS, it.key()))
			settings.extra.insert(it.key(), it.value());
	}
	return settings;
}

} // namespace pva
