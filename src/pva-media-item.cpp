#include "pva-media-item.hpp"

#include <QFileInfo>
#include <QRegularExpression>

namespace pva {
namespace {

const char *const IMAGE_EXTENSIONS[] = {"jpg", "jpeg", "png", "bmp", "gif", "heic", "tif", "tiff", "webp"};
const char *const VIDEO_EXTENSIONS[] = {"mp4", "mov", "m4v", "3gp", "avi", "mkv"};

} // namespace

QString MediaItem::key() const
{
	return item_key(base_name, version_suffix);
}

MediaKind media_kind_for_path(const QString &path)
{
	const QString suffix = QFileInfo(path).suffix().toLower();
	if (suffix.isEmpty())
		return MediaKind::Unsupported;

	for (const char *ext : IMAGE_EXTENSIONS) {
		if (suffix == QLatin1String(ext))
			return MediaKind::Image;
	}
	for (const char *ext : VIDEO_EXTENSIONS) {
		if (suffix == QLatin1String(ext))
			return MediaKind::Video;
	}
	return MediaKind::Unsupported;
}

QString item_key(const QString &base_name, const QString &version_suffix)
{
	if (version_suffix.isEmpty())
		return base_name;
	return base_name + VERSION_SEPARATOR + version_suffix;
}

void split_item_key(const QString &key, QString *base_name, QString *version_suffix)
{
	const qsizetype separator = key.lastIndexOf(VERSION_SEPARATOR);
	if (separator < 0) {
		if (base_name)
			*base_name = key;
		if (version_suffix)
			version_suffix->clear();
		return;
	}

	if (base_name)
		*base_name = key.left(separator);
	if (version_suffix)
		*version_suffix = key.mid(separator + 2);
}

MediaItem media_item_from_path(const QString &path)
{
	static const QRegularExpression versioned_stem(QStringLiteral("^(.+)##([^#]+)$"));

	const QFileInfo info(path);
	MediaItem item;
	item.path = path;
	item.kind = media_kind_for_path(path);

	const QString stem = info.completeBaseName();
	const QString ext = info.suffix();
	const QRegularExpressionMatch match = versioned_stem.match(stem);
	if (match.hasMatch()) {
		item.base_name = ext.isEmpty() ? match.captured(1) : match.captured(1) + "." + ext;
		item.version_suffix = match.captured(2);
	} else {
		item.base_name = info.fileName();
	}
	return item;
}

QString versioned_file_name(const QString &base_name, const QString &version_suffix)
{
	if (version_suffix.isEmpty())
		return base_name;

	const qsizetype dot = base_name.lastIndexOf('.');
	if (dot <= 0)
		return base_name + VERSION_SEPARATOR + version_suffix;
	return base_name.left(dot) + VERSION_SEPARATOR + version_suffix + base_name.mid(dot);
}

int compare_version_suffix(const QString &lhs, const QString &rhs)
{
	if (lhs == rhs)
		return 0;
	if (lhs.isEmpty())
		return -1;
	if (rhs.isEmpty())
		return 1;

	bool lhs_numeric = false;
	bool rhs_numeric = false;
	const qlonglong lhs_value = lhs.toLongLong(&lhs_numeric);
	const qlonglong rhs_value = rhs.toLongLong(&rhs_numeric);
	if (lhs_numeric && rhs_numeric) {
		if (lhs_value != rhs_value)
			return lhs_value < rhs_value ? -1 : 1;
		return QString::compare(lhs, rhs);
	}
	if (lhs_numeric != rhs_numeric)
		return lhs_numeric ? -1 : 1;
	return QString::compare(lhs, rhs);
}

} // namespace pva
