#pragma once

#include "pva-media-item.hpp"
#include "pva-metadata-probe.hpp"
#include "pva-models.hpp"

#include <QTimeZone>

#include <memory>
#include <optional>
#include <vector>

namespace pva {

struct ResolvedTimestamp {
	TimestampRecord record;
	std::optional<GpsFix> gps;
	QString detail;
};

class TimestampResolver {
public:
	TimestampResolver();
	explicit TimestampResolver(const QTimeZone &naive_zone);

	// Replaces the default probe set.
	void set_probes(std::vector<std::unique_ptr<MetadataProbe>> probes);
	void add_probe(std::unique_ptr<MetadataProbe> probe);
	// Consulted after every other probe came back empty. Null clears it.
	void set_fallback_probe(std::unique_ptr<MetadataProbe> probe);
	const MetadataProbe *fallback_probe() const;
	void set_naive_zone(const QTimeZone &naive_zone);
	const QTimeZone &naive_zone() const;

	ResolvedTimestamp resolve(const MediaItem &item) const;

	static bool needs_resolution(const std::optional<TimestampRecord> &cached);

	std::optional<TimestampRecord> record_from_candidate(const DateCandidate &candidate, MediaKind kind) const;
	std::optional<TimestampRecord> record_from_filename(const QString &file_name) const;
	std::optional<TimestampRecord> record_from_filesystem(const QString &media_path) const;
	static TimestampRecord unresolved_record();

private:
	std::optional<TimestampRecord> resolve_from_metadata(const MediaItem &item, std::optional<GpsFix> *gps,
							     QString *detail) const;

	std::vector<std::unique_ptr<MetadataProbe>> m_probes;
	std::unique_ptr<MetadataProbe> m_fallback_probe;
	QTimeZone m_naive_zone;
};

} // namespace pva
