#pragma once

#include "pva-media-item.hpp"
#include "pva-models.hpp"

#include <QTimeZone>
#include <QVector>

#include <optional>

namespace pva {

struct CatalogEntry {
	MediaItem item;
	TimestampRecord timestamp;
	std::optional<double> manual_epoch;

	QString key() const { return item.key(); }
};

class MediaOrderer {
public:
	// Stable: entries with equal epoch and suffix keep their input order.
	void order(QVector<CatalogEntry> &entries) const;

	static double effective_epoch(const CatalogEntry &entry);
	static bool precedes(const CatalogEntry &lhs, const CatalogEntry &rhs);

	// Manual wall clock placed in the record's offset, else in the naive zone.
	static std::optional<double> manual_epoch(const QString &manual_wall_clock, const TimestampRecord &record,
						  const QTimeZone &naive_zone);
};

} // namespace pva
