#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace pva {

struct QuickTimeDates {
	// com.apple.quicktime.creationdate, carries the device's UTC offset.
	QString vendor_creation_date;
	std::optional<QDateTime> movie_creation;
	std::optional<QDateTime> media_creation;
	std::optional<QDateTime> track_creation;
	// moov/udta/(c)day
	QString recorded_date;

	bool is_empty() const
	{
		return vendor_creation_date.isEmpty() && !movie_creation.has_value() && !media_creation.has_value() &&
		       !track_creation.has_value() && recorded_date.isEmpty();
	}
};

struct QuickTimeReadResult {
	bool ok = false;
	QString error;
	QuickTimeDates dates;
};

class QuickTimeReader {
public:
	QuickTimeReadResult read(const QString &media_path) const;

	static std::optional<QDateTime> datetime_from_mac_seconds(quint64 seconds_since_1904);
};

} // namespace pva
