#pragma once

#include "pva-annotation-edit-session.hpp"
#include "pva-annotation-timeline.hpp"
#include "pva-collection-store.hpp"
#include "pva-duplicate-filename-resolver.hpp"
#include "pva-media-orderer.hpp"
#include "pva-rename-queue.hpp"
#include "pva-timestamp-resolver.hpp"

#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <map>
#include <memory>
#include <optional>

namespace pva {

class PlaybackTransport;

struct CatalogLoadStats {
	int items = 0;
	int resolved = 0;
	int cached = 0;
	int unresolved = 0;
	int inferred = 0;
	int duplicate_groups = 0;
};

// Owns the store, the ordered entries and one timeline plus edit session per
// video. Every navigation or mode change flushes the open session first.
class Catalog {
public:
	explicit Catalog(PlaybackTransport *transport = nullptr);
	~Catalog();

	Catalog(const Catalog &) = delete;
	Catalog &operator=(const Catalog &) = delete;

	TimestampResolver &resolver();
	CollectionStore &store();
	const CollectionStore &store() const;
	const RenameQueue &rename_queue() const;

	void set_store_path(const QString &store_path);
	void set_exiftool_override(std::optional<bool> use_exiftool);

	static QStringList enumerate_media(const QString &root_dir, const QMap<QString, bool> &folder_flags);

	bool open(const QString &root_dir, QString *error = nullptr);
	void load_paths(const QStringList &media_paths);
	const CatalogLoadStats &load_stats() const;

	const QVector<CatalogEntry> &entries() const;
	int size() const;
	int current_index() const;
	const CatalogEntry *current() const;
	const CatalogEntry *find(const QString &key) const;

	bool go_to(int index);
	bool go_to_key(const QString &key);
	void next();
	void previous();

	void set_playback_mode(PlaybackMode mode);
	PlaybackMode playback_mode() const;

	bool set_manual_time(const QString &key, const QString &input, QString *error = nullptr);
	bool set_image_text(const QString &key, const QString &text, QString *error = nullptr);

	// Current video only. Null for images. Edits go through the session or
	// the annotation actions below so they are persisted.
	const AnnotationTimeline *timeline();
	AnnotationEditSession *session();

	bool remove_active_annotation(double position);
	bool toggle_skip_active(double position);
	PlaybackDecision playback_decision(double position, double media_duration);
	QString display_text(double position);
	// Same decision, with skip seeks and stops forwarded to the transport.
	PlaybackDecision on_playback_position(double position, double media_duration);

	const QVector<DuplicateGroup> &pending_duplicate_groups() const;
	ResolutionSummary resolve_duplicates(const DuplicateFilenameResolver::ConfirmCallback &confirm,
					     FileRenamer *renamer = nullptr);

	bool save(QString *error = nullptr);

private:
	struct VideoState {
		std::unique_ptr<AnnotationTimeline> timeline;
		std::unique_ptr<AnnotationEditSession> session;
	};

	void configure_resolver();
	void refresh_shared_keys();
	CatalogEntry build_entry(const MediaItem &item);
	void apply_inference();
	void refresh_manual_epochs();
	void collect_duplicate_groups();
	void reorder(const QString &keep_path);
	VideoState *video_state(const QString &key);
	AnnotationTimeline *current_timeline();
	void persist_timeline(const QString &key);
	void flush_session(const char *reason);
	int index_of_key(const QString &key) const;

	PlaybackTransport *m_transport = nullptr;
	TimestampResolver m_resolver;
	CollectionStore m_store;
	RenameQueue m_rename_queue;
	MediaOrderer m_orderer;

	QString m_root_dir;
	QString m_store_path;
	std::optional<bool> m_exiftool_override;

	QVector<CatalogEntry> m_entries;
	int m_current = -1;
	PlaybackMode m_mode = PlaybackMode::AutoAdvance;
	std::map<QString, VideoState> m_videos;
	QVector<DuplicateGroup> m_pending_groups;
	// Keys held by more than one physical file in this load. Their store
	// record cannot speak for any single file.
	QSet<QString> m_shared_keys;
	CatalogLoadStats m_stats;
};

} // namespace pva
