#include "pva-catalog.hpp"

#include "pva-datetime.hpp"
#include "pva-logging.hpp"
#include "pva-playback-transport.hpp"
#include "pva-timezone-inferencer.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>

#include <algorithm>

namespace pva {
namespace {

QMap<QString, bool> relative_folder_flags(const QString &root_dir, const QMap<QString, bool> &folder_flags)
{
	const QDir root(root_dir);
	QMap<QString, bool> relative;
	for (auto it = folder_flags.constBegin(); it != folder_flags.constEnd(); ++it) {
		QString folder = QDir::cleanPath(it.key());
		if (QDir::isAbsolutePath(folder))
			folder = root.relativeFilePath(folder);
		if (folder.isEmpty())
			folder = ".";
		relative.insert(folder, it.value());
	}
	return relative;
}

// Nearest configured ancestor decides; folders without a flag are included.
bool folder_included(QString relative_dir, const QMap<QString, bool> &flags)
{
	for (;;) {
		if (flags.contains(relative_dir))
			return flags.value(relative_dir);
		if (relative_dir == "." || relative_dir.isEmpty())
			return true;

		const qsizetype slash = relative_dir.lastIndexOf('/');
		relative_dir = slash < 0 ? QString(".") : relative_dir.left(slash);
	}
}

QString absolute_path(const QString &path)
{
	return QFileInfo(path).absoluteFilePath();
}

} // namespace

Catalog::Catalog(PlaybackTransport *transport) : m_transport(transport) {}

Catalog::~Catalog() = default;

TimestampResolver &Catalog::resolver()
{
	return m_resolver;
}

CollectionStore &Catalog::store()
{
	return m_store;
}

const CollectionStore &Catalog::store() const
{
	return m_store;
}

const RenameQueue &Catalog::rename_queue() const
{
	return m_rename_queue;
}

void Catalog::set_store_path(const QString &store_path)
{
	m_store_path = store_path;
}

void Catalog::set_exiftool_override(std::optional<bool> use_exiftool)
{
	m_exiftool_override = use_exiftool;
}

QStringList Catalog::enumerate_media(const QString &root_dir, const QMap<QString, bool> &folder_flags)
{
	const QDir root(root_dir);
	const QMap<QString, bool> flags = relative_folder_flags(root_dir, folder_flags);

	QStringList paths;
	QDirIterator it(root_dir, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
	while (it.hasNext()) {
		const QString path = it.next();
		if (!is_supported_media_path(path))
			continue;

		const QString relative_dir = root.relativeFilePath(QFileInfo(path).absolutePath());
		if (!folder_included(relative_dir.isEmpty() ? QString(".") : relative_dir, flags))
			continue;
		paths.push_back(absolute_path(path));
	}
	paths.sort();
	return paths;
}

bool Catalog::open(const QString &root_dir, QString *error)
{
	const QFileInfo root_info(root_dir);
	if (!root_info.isDir()) {
		if (error)
			*error = QString("Not a directory: %1").arg(root_dir);
		return false;
	}
	m_root_dir = root_info.absoluteFilePath();

	const QString store_path =
		m_store_path.isEmpty() ? QDir(m_root_dir).filePath(DEFAULT_STORE_FILE_NAME) : m_store_path;
	m_store.set_store_path(store_path);
	if (!m_store.load(error))
		return false;

	m_rename_queue.set_queue_path(RenameQueue::queue_path_for_store(store_path));
	QString queue_error;
	if (!m_rename_queue.load(&queue_error))
		qCWarning(lcCatalog, "rename queue ignored: %s", qUtf8Printable(queue_error));

	load_paths(enumerate_media(m_root_dir, m_store.settings().folders));
	return true;
}

void Catalog::load_paths(const QStringList &media_paths)
{
	flush_session("reload");
	m_videos.clear();
	m_entries.clear();
	m_stats = CatalogLoadStats();
	configure_resolver();

	QVector<MediaItem> items;
	for (const QString &path : media_paths) {
		const MediaItem item = media_item_from_path(absolute_path(path));
		if (item.kind != MediaKind::Unsupported)
			items.push_back(item);
	}

	m_entries.reserve(items.size());
	for (const MediaItem &item : items) {
		CatalogEntry entry;
		entry.item = item;
		m_entries.push_back(entry);
	}
	refresh_shared_keys();
	for (CatalogEntry &entry : m_entries)
		entry = build_entry(entry.item);
	m_stats.items = static_cast<int>(m_entries.size());

	apply_inference();
	refresh_manual_epochs();
	collect_duplicate_groups();
	reorder(QString());

	qCInfo(lcCatalog, "catalog loaded: items=%d resolved=%d cached=%d unresolved=%d inferred=%d duplicates=%d",
	       m_stats.items, m_stats.resolved, m_stats.cached, m_stats.unresolved, m_stats.inferred,
	       m_stats.duplicate_groups);
}

const CatalogLoadStats &Catalog::load_stats() const
{
	return m_stats;
}

const QVector<CatalogEntry> &Catalog::entries() const
{
	return m_entries;
}

int Catalog::size() const
{
	return static_cast<int>(m_entries.size());
}

int Catalog::current_index() const
{
	return m_current;
}

const CatalogEntry *Catalog::current() const
{
	if (m_current < 0 || m_current >= m_entries.size())
		return nullptr;
	return &m_entries.at(m_current);
}

const CatalogEntry *Catalog::find(const QString &key) const
{
	const int index = index_of_key(key);
	return index < 0 ? nullptr : &m_entries.at(index);
}

bool Catalog::go_to(int index)
{
	if (index < 0 || index >= m_entries.size())
		return false;

	flush_session("navigation");
	m_current = index;
	qCDebug(lcCatalog, "current item: index=%d key=%s", index, qUtf8Printable(m_entries.at(index).key()));
	return true;
}

bool Catalog::go_to_key(const QString &key)
{
	return go_to(index_of_key(key));
}

void Catalog::next()
{
	if (m_entries.isEmpty())
		return;
	go_to((m_current + 1) % size());
}

void Catalog::previous()
{
	if (m_entries.isEmpty())
		return;
	go_to((m_current - 1 + size()) % size());
}

void Catalog::set_playback_mode(PlaybackMode mode)
{
	flush_session("mode_toggle");
	m_mode = mode;
}

PlaybackMode Catalog::playback_mode() const
{
	return m_mode;
}

bool Catalog::set_manual_time(const QString &key, const QString &input, QString *error)
{
	if (index_of_key(key) < 0) {
		if (error)
			*error = QString("Unknown item '%1'").arg(key);
		return false;
	}

	QString normalized;
	if (!input.trimmed().isEmpty() && !normalize_manual_time(input, &normalized, error)) {
		qCWarning(lcCatalog, "manual time rejected: key=%s input=%s", qUtf8Printable(key), qUtf8Printable(input));
		return false;
	}

	flush_session("manual_time");
	m_store.ensure(key).manual_time = normalized;

	const QTimeZone naive_zone = m_resolver.naive_zone();
	for (CatalogEntry &entry : m_entries) {
		if (entry.key() == key)
			entry.manual_epoch = MediaOrderer::manual_epoch(normalized, entry.timestamp, naive_zone);
	}

	const CatalogEntry *entry = current();
	reorder(entry ? entry->item.path : QString());
	qCInfo(lcCatalog, "manual time set: key=%s wall=%s", qUtf8Printable(key),
	       normalized.isEmpty() ? "<cleared>" : qUtf8Printable(normalized));
	return true;
}

bool Catalog::set_image_text(const QString &key, const QString &text, QString *error)
{
	const CatalogEntry *entry = find(key);
	if (!entry || entry->item.kind != MediaKind::Image) {
		if (error)
			*error = QString("'%1' is not an image in this catalog").arg(key);
		return false;
	}

	ItemRecord &record = m_store.ensure(key);
	if (text.isEmpty())
		record.text.reset();
	else
		record.text = text;
	return true;
}

const AnnotationTimeline *Catalog::timeline()
{
	return current_timeline();
}

AnnotationTimeline *Catalog::current_timeline()
{
	const CatalogEntry *entry = current();
	if (!entry)
		return nullptr;
	VideoState *state = video_state(entry->key());
	return state ? state->timeline.get() : nullptr;
}

AnnotationEditSession *Catalog::session()
{
	const CatalogEntry *entry = current();
	if (!entry)
		return nullptr;
	VideoState *state = video_state(entry->key());
	return state ? state->session.get() : nullptr;
}

bool Catalog::remove_active_annotation(double position)
{
	flush_session("remove");
	AnnotationTimeline *tl = current_timeline();
	if (!tl || !tl->remove_active(position))
		return false;

	persist_timeline(current()->key());
	return true;
}

bool Catalog::toggle_skip_active(double position)
{
	flush_session("toggle_skip");
	AnnotationTimeline *tl = current_timeline();
	if (!tl)
		return false;

	const AnnotationSegment &active = tl->active_segment(position);
	tl->set_skip(active.id, !active.skip);
	persist_timeline(current()->key());
	return true;
}

PlaybackDecision Catalog::playback_decision(double position, double media_duration)
{
	PlaybackDecision decision;
	const CatalogEntry *entry = current();
	if (!entry)
		return decision;

	if (!entry->item.is_video()) {
		decision.display_text = m_store.record(entry->key()).text.value_or(QString());
		return decision;
	}

	VideoState *state = video_state(entry->key());
	const AnnotationTimeline *tl = state->timeline.get();
	const AnnotationEditSession *edit = state->session.get();

	// The open session owns the displayed text and playback is not steered.
	if (edit->state() == EditState::PendingNew) {
		decision.segment_index = tl->active_index(edit->pending_start_time());
		decision.display_text = edit->pending_text();
		return decision;
	}
	if (edit->state() == EditState::Editing) {
		const AnnotationSegment *bound = edit->bound_segment();
		decision.segment_index = bound ? tl->index_of(bound->id) : tl->active_index(position);
		decision.display_text = bound ? bound->text : tl->active_segment(position).text;
		return decision;
	}

	return tl->decide_playback(position, m_mode, media_duration);
}

QString Catalog::display_text(double position)
{
	return playback_decision(position, 0.0).display_text;
}

PlaybackDecision Catalog::on_playback_position(double position, double media_duration)
{
	const PlaybackDecision decision = playback_decision(position, media_duration);
	if (!m_transport)
		return decision;

	if (decision.stop_at_end) {
		if (decision.seek_to.has_value())
			m_transport->seek(decision.seek_to.value());
		m_transport->stop();
	} else if (decision.seek_to.has_value()) {
		m_transport->seek(decision.seek_to.value());
	}
	return decision;
}

const QVector<DuplicateGroup> &Catalog::pending_duplicate_groups() const
{
	return m_pending_groups;
}

ResolutionSummary Catalog::resolve_duplicates(const DuplicateFilenameResolver::ConfirmCallback &confirm,
					      FileRenamer *renamer)
{
	flush_session("resolve_duplicates");

	QSet<QString> taken_keys;
	for (const CatalogEntry &entry : m_entries)
		taken_keys.insert(entry.key());

	DuplicateFilenameResolver resolver(&m_store, renamer);
	const ResolutionSummary summary = resolver.resolve_all(m_pending_groups, confirm, &taken_keys, &m_rename_queue);

	QString keep_path = current() ? current()->item.path : QString();
	for (const RenamedMember &member : summary.renamed) {
		for (CatalogEntry &entry : m_entries) {
			if (absolute_path(entry.item.path) != member.old_path)
				continue;
			entry.item = media_item_from_path(member.new_path);
			// The relocated record was shared by the group; each file keeps its own capture time.
			m_store.ensure(entry.key()).timestamp = entry.timestamp;
			if (keep_path == member.old_path)
				keep_path = member.new_path;
		}
		m_videos.erase(member.old_key);
	}
	refresh_shared_keys();

	if (!m_rename_queue.queue_path().isEmpty()) {
		QString error;
		if (!m_rename_queue.save(&error))
			qCWarning(lcCatalog, "rename queue not saved: %s", qUtf8Printable(error));
	}

	collect_duplicate_groups();
	reorder(keep_path);
	qCInfo(lcCatalog, "duplicates: resolved=%d failed=%d deferred=%d", summary.resolved, summary.failed,
	       summary.deferred);
	return summary;
}

bool Catalog::save(QString *error)
{
	flush_session("save");
	if (!m_store.save(error))
		return false;

	if (!m_rename_queue.queue_path().isEmpty()) {
		QString queue_error;
		if (!m_rename_queue.save(&queue_error))
			qCWarning(lcCatalog, "rename queue not saved: %s", qUtf8Printable(queue_error));
	}
	return true;
}

void Catalog::configure_resolver()
{
	const CollectionSettings &settings = m_store.settings();
	m_resolver.set_naive_zone(naive_zone_from_setting(settings.naive_time_zone));

	const bool use_exiftool = m_exiftool_override.value_or(settings.use_exiftool);
	if (use_exiftool)
		m_resolver.set_fallback_probe(std::make_unique<ExifToolProbe>(settings.exiftool_timeout_ms));
	else
		m_resolver.set_fallback_probe(nullptr);
}

void Catalog::refresh_shared_keys()
{
	QMap<QString, QSet<QString>> paths_by_key;
	for (const CatalogEntry &entry : m_entries)
		paths_by_key[entry.key()].insert(absolute_path(entry.item.path));

	m_shared_keys.clear();
	for (auto it = paths_by_key.constBegin(); it != paths_by_key.constEnd(); ++it) {
		if (it.value().size() > 1)
			m_shared_keys.insert(it.key());
	}
}

CatalogEntry Catalog::build_entry(const MediaItem &item)
{
	CatalogEntry entry;
	entry.item = item;

	if (m_shared_keys.contains(item.key())) {
		const ResolvedTimestamp resolved = m_resolver.resolve(item);
		entry.timestamp = resolved.record;
		if (entry.timestamp.is_resolved())
			m_stats.resolved += 1;
		else
			m_stats.unresolved += 1;
		qCDebug(lcCatalog, "shared key resolved per file: key=%s path=%s", qUtf8Printable(item.key()),
			qUtf8Printable(item.path));
		return entry;
	}

	ItemRecord &record = m_store.ensure(item.key());
	if (!TimestampResolver::needs_resolution(record.timestamp)) {
		entry.timestamp = record.timestamp.value();
		m_stats.cached += 1;
		return entry;
	}

	const ResolvedTimestamp resolved = m_resolver.resolve(item);
	const bool replace = !record.timestamp.has_value() || !record.timestamp->is_resolved() ||
			     resolved.record.has_timezone;
	if (replace)
		record.timestamp = resolved.record;

	if (resolved.gps.has_value() && !record.location.latitude.has_value()) {
		record.location.latitude = resolved.gps->latitude;
		record.location.longitude = resolved.gps->longitude;
	}

	entry.timestamp = record.timestamp.value();
	if (entry.timestamp.is_resolved())
		m_stats.resolved += 1;
	else
		m_stats.unresolved += 1;
	return entry;
}

void Catalog::apply_inference()
{
	QVector<TimestampRecord *> records;
	records.reserve(m_entries.size());
	for (CatalogEntry &entry : m_entries)
		records.push_back(&entry.timestamp);

	const InferenceStats stats = TimezoneInferencer().infer(records);
	m_stats.inferred = stats.inferred + stats.reassigned;

	for (const CatalogEntry &entry : m_entries) {
		if (!m_shared_keys.contains(entry.key()))
			m_store.ensure(entry.key()).timestamp = entry.timestamp;
	}
}

void Catalog::refresh_manual_epochs()
{
	const QTimeZone naive_zone = m_resolver.naive_zone();
	for (CatalogEntry &entry : m_entries) {
		const QString manual = m_store.record(entry.key()).manual_time;
		entry.manual_epoch = MediaOrderer::manual_epoch(manual, entry.timestamp, naive_zone);
	}
}

void Catalog::collect_duplicate_groups()
{
	m_pending_groups.clear();

	QSet<QString> queued;
	const QVector<PendingRenameGroup> pending = m_rename_queue.groups();
	for (const PendingRenameGroup &queued_group : pending) {
		DuplicateGroup group;
		group.file_name = queued_group.file_name;
		QString suffix;
		split_item_key(group.file_name, &group.base_name, &suffix);

		QVector<double> epochs;
		for (const QString &path : queued_group.paths) {
			if (!QFileInfo::exists(path))
				continue;
			group.paths.push_back(path);
			for (const CatalogEntry &entry : m_entries) {
				if (absolute_path(entry.item.path) == path)
					epochs.push_back(MediaOrderer::effective_epoch(entry));
			}
		}

		if (group.paths.size() < 2) {
			m_rename_queue.remove(group.file_name);
			continue;
		}
		group.same_timestamp = !epochs.isEmpty() && std::all_of(epochs.begin(), epochs.end(), [&](double epoch) {
			return epoch == epochs.first();
		});
		m_pending_groups.push_back(group);
		queued.insert(group.file_name);
	}

	for (const DuplicateGroup &group : DuplicateFilenameResolver::detect(m_entries)) {
		if (!queued.contains(group.file_name))
			m_pending_groups.push_back(group);
	}
	m_stats.duplicate_groups = static_cast<int>(m_pending_groups.size());
}

void Catalog::reorder(const QString &keep_path)
{
	m_orderer.order(m_entries);

	m_current = m_entries.isEmpty() ? -1 : 0;
	if (keep_path.isEmpty())
		return;
	for (int i = 0; i < m_entries.size(); ++i) {
		if (m_entries.at(i).item.path == keep_path) {
			m_current = i;
			return;
		}
	}
}

Catalog::VideoState *Catalog::video_state(const QString &key)
{
	const CatalogEntry *entry = find(key);
	if (!entry || !entry->item.is_video())
		return nullptr;

	auto it = m_videos.find(key);
	if (it != m_videos.end())
		return &it->second;

	const ItemRecord &record = m_store.ensure(key);
	VideoState state;
	state.timeline = std::make_unique<AnnotationTimeline>(record.annotations.value_or(QVector<AnnotationSegment>()));
	state.session = std::make_unique<AnnotationEditSession>(state.timeline.get(), m_transport);
	state.session->set_changed_callback([this, key]() { persist_timeline(key); });
	return &m_videos.emplace(key, std::move(state)).first->second;
}

void Catalog::persist_timeline(const QString &key)
{
	auto it = m_videos.find(key);
	if (it == m_videos.end())
		return;
	m_store.ensure(key).annotations = it->second.timeline->to_persisted();
}

void Catalog::flush_session(const char *reason)
{
	for (auto &video : m_videos) {
		AnnotationEditSession *edit = video.second.session.get();
		if (!edit->is_active())
			continue;

		const FlushOutcome outcome = edit->flush();
		qCDebug(lcCatalog, "session flushed: key=%s reason=%s outcome=%d", qUtf8Printable(video.first), reason,
			static_cast<int>(outcome));
	}
}

int Catalog::index_of_key(const QString &key) const
{
	for (int i = 0; i < m_entries.size(); ++i) {
		if (m_entries.at(i).key() == key)
			return i;
	}
	return -1;
}

} // namespace pva
