#include "pva-metadata-probe.hpp"

#include "pva-logging.hpp"

#include <QFile>

#include <exiv2/exiv2.hpp>

#include <exception>
#include <string>

namespace pva {
namespace {

const char *const ORIGINAL_CAPTURE_KEY = "Exif.Photo.DateTimeOriginal";

std::optional<double> read_gps_coordinate(const Exiv2::ExifData &exif, const char *value_key, const char *ref_key,
					  const char *negative_ref)
{
	const auto value = exif.findKey(Exiv2::ExifKey(value_key));
	if (value == exif.end() || value->count() < 3)
		return std::nullopt;

	double degrees = 0.0;
	double scale = 1.0;
	for (long i = 0; i < 3; ++i) {
		const Exiv2::Rational part = value->toRational(i);
		if (part.second == 0)
			return std::nullopt;
		degrees += (static_cast<double>(part.first) / static_cast<double>(part.second)) / scale;
		scale *= 60.0;
	}

	const auto ref = exif.findKey(Exiv2::ExifKey(ref_key));
	if (ref != exif.end() && ref->toString() == negative_ref)
		degrees = -degrees;
	return degrees;
}

std::optional<GpsFix> read_gps(const Exiv2::ExifData &exif)
{
	const std::optional<double> latitude =
		read_gps_coordinate(exif, "Exif.GPSInfo.GPSLatitude", "Exif.GPSInfo.GPSLatitudeRef", "S");
	const std::optional<double> longitude =
		read_gps_coordinate(exif, "Exif.GPSInfo.GPSLongitude", "Exif.GPSInfo.GPSLongitudeRef", "W");
	if (!latitude.has_value() || !longitude.has_value())
		return std::nullopt;
	return GpsFix{latitude.value(), longitude.value()};
}

} // namespace

QString ExifImageProbe::probe_name() const
{
	return "exif";
}

bool ExifImageProbe::accepts(const MediaItem &item) const
{
	return item.kind == MediaKind::Image;
}

ProbeResult ExifImageProbe::probe(const QString &media_path) const
{
	ProbeResult result;
	try {
		auto image = Exiv2::ImageFactory::open(std::string(QFile::encodeName(media_path).constData()));
		if (!image.get())
			return result;

		image->readMetadata();
		const Exiv2::ExifData &exif = image->exifData();
		if (exif.empty())
			return result;

		const auto original = exif.findKey(Exiv2::ExifKey(ORIGINAL_CAPTURE_KEY));
		if (original != exif.end())
			result.dates.push_back(
				{DateField::ImageOriginal, QString::fromStdString(original->toString()), false});
		result.gps = read_gps(exif);
	} catch (const std::exception &e) {
		qCDebug(lcTimestamp, "[%s] metadata unavailable for '%s': %s", qUtf8Printable(probe_name()),
			qUtf8Printable(media_path), e.what());
		return {};
	}
	return result;
}

} // namespace pva
