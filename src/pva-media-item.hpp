#pragma once

#include <QString>

namespace pva {

enum class MediaKind {
	Unsupported,
	Image,
	Video,
};

constexpr const char *VERSION_SEPARATOR = "##";

struct MediaItem {
	QString path;
	QString base_name;
	QString version_suffix;
	MediaKind kind = MediaKind::Unsupported;

	QString key() const;
	bool is_video() const { return kind == MediaKind::Video; }
};

MediaKind media_kind_for_path(const QString &path);

inline bool is_supported_media_path(const QString &path)
{
	return media_kind_for_path(path) != MediaKind::Unsupported;
}

QString item_key(const QString &base_name, const QString &version_suffix);
void split_item_key(const QString &key, QString *base_name, QString *version_suffix);

// "beach##2.jpg" on disk is the logical item "beach.jpg##2".
MediaItem media_item_from_path(const QString &path);
QString versioned_file_name(const QString &base_name, const QString &version_suffix);

// Negative, zero or positive like strcmp. Unsuffixed sorts first.
int compare_version_suffix(const QString &lhs, const QString &rhs);

} // namespace pva
