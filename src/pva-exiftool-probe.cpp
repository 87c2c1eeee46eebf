#include "pva-metadata-probe.hpp"

#include "pva-logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStandardPaths>

#include <algorithm>

namespace pva {
namespace {

struct ExifToolTag {
	const char *tag;
	DateField field;
	bool utc_by_convention;
};

const ExifToolTag EXIFTOOL_TAGS[] = {
	{"QuickTime:CreationDate", DateField::VendorCreationDate, false},
	{"Keys:CreationDate", DateField::VendorCreationDate, false},
	{"QuickTime:CreateDate", DateField::CreationTime, true},
	{"QuickTime:MediaCreateDate", DateField::EncodedDate, true},
	{"QuickTime:TrackCreateDate", DateField::TaggedDate, true},
	{"QuickTime:DateTimeOriginal", DateField::RecordedDate, false},
	{"UserData:DateTimeOriginal", DateField::RecordedDate, false},
};

} // namespace

ExifToolProbe::ExifToolProbe(int timeout_ms) : m_timeout_ms(std::max(250, timeout_ms)) {}

QString ExifToolProbe::probe_name() const
{
	return "exiftool";
}

bool ExifToolProbe::accepts(const MediaItem &item) const
{
	return item.is_video();
}

ProbeResult ExifToolProbe::probe(const QString &media_path) const
{
	const QString exiftool = QStandardPaths::findExecutable("exiftool");
	if (exiftool.isEmpty())
		return {};

	QStringList arguments{"-j", "-G"};
	for (const ExifToolTag &tag : EXIFTOOL_TAGS)
		arguments << QString("-%1").arg(tag.tag);
	arguments << media_path;

	QProcess process;
	process.start(exiftool, arguments);
	if (!process.waitForStarted(1000)) {
		qCDebug(lcTimestamp, "[%s] failed to start process", qUtf8Printable(probe_name()));
		return {};
	}
	if (!process.waitForFinished(m_timeout_ms)) {
		process.kill();
		process.waitForFinished(1000);
		qCWarning(lcTimestamp, "[%s] timed out after %d ms on '%s'", qUtf8Printable(probe_name()), m_timeout_ms,
			  qUtf8Printable(media_path));
		return {};
	}

	if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
		const QString stderr_text = QString::fromUtf8(process.readAllStandardError()).trimmed();
		qCDebug(lcTimestamp, "[%s] failed on '%s': %s", qUtf8Printable(probe_name()), qUtf8Printable(media_path),
			qUtf8Printable(stderr_text));
		return {};
	}

	return candidates_from_json(process.readAllStandardOutput());
}

ProbeResult ExifToolProbe::candidates_from_json(const QByteArray &exiftool_json)
{
	ProbeResult result;

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(exiftool_json, &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isArray() || doc.array().isEmpty())
		return result;

	const QJsonObject tags = doc.array().first().toObject();
	for (const ExifToolTag &tag : EXIFTOOL_TAGS) {
		const QString value = tags.value(tag.tag).toString().trimmed();
		if (value.isEmpty())
			continue;
		result.dates.push_back({tag.field, value, tag.utc_by_convention});
	}
	return result;
}

} // namespace pva
