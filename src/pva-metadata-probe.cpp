#include "pva-metadata-probe.hpp"

#include "pva-logging.hpp"

#include <QFileInfo>
#include <QTimeZone>

namespace pva {

const char *date_field_name(DateField field)
{
	switch (field) {
	case DateField::ImageOriginal:
		return "image_original";
	case DateField::VendorCreationDate:
		return "vendor_creation_date";
	case DateField::CreationTime:
		return "creation_time";
	case DateField::EncodedDate:
		return "encoded_date";
	case DateField::TaggedDate:
		return "tagged_date";
	case DateField::RecordedDate:
		return "recorded_date";
	default:
		return "unknown";
	}
}

int video_field_rank(DateField field)
{
	switch (field) {
	case DateField::VendorCreationDate:
		return 0;
	case DateField::CreationTime:
		return 1;
	case DateField::EncodedDate:
		return 2;
	case DateField::TaggedDate:
		return 3;
	case DateField::RecordedDate:
		return 4;
	case DateField::ImageOriginal:
	default:
		return 5;
	}
}

QString QuickTimeProbe::probe_name() const
{
	return "quicktime";
}

bool QuickTimeProbe::accepts(const MediaItem &item) const
{
	if (!item.is_video())
		return false;
	const QString suffix = QFileInfo(item.path).suffix().toLower();
	return suffix == "mp4" || suffix == "mov" || suffix == "m4v" || suffix == "3gp";
}

ProbeResult QuickTimeProbe::probe(const QString &media_path) const
{
	const QuickTimeReadResult read = m_reader.read(media_path);
	if (!read.ok) {
		qCDebug(lcTimestamp, "[%s] no atoms read from '%s': %s", qUtf8Printable(probe_name()),
			qUtf8Printable(media_path), qUtf8Printable(read.error));
		return {};
	}
	return candidates_from_dates(read.dates);
}

ProbeResult QuickTimeProbe::candidates_from_dates(const QuickTimeDates &dates)
{
	ProbeResult result;
	const auto push_instant = [&result](DateField field, const std::optional<QDateTime> &value) {
		if (!value.has_value())
			return;
		result.dates.push_back({field, value->toTimeZone(QTimeZone::utc()).toString(Qt::ISODate), true});
	};

	if (!dates.vendor_creation_date.isEmpty())
		result.dates.push_back({DateField::VendorCreationDate, dates.vendor_creation_date, false});
	push_instant(DateField::CreationTime, dates.movie_creation);
	push_instant(DateField::EncodedDate, dates.media_creation);
	push_instant(DateField::TaggedDate, dates.track_creation);
	if (!dates.recorded_date.isEmpty())
		result.dates.push_back({DateField::RecordedDate, dates.recorded_date, false});
	return result;
}

} // namespace pva
