#include "pva-collection-store.hpp"

#include "pva-annotation-timeline.hpp"
#include "pva-logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include <algorithm>

namespace pva {
namespace {

bool read_json_file(const QString &path, QJsonObject *out_obj, QString *error)
{
	QFile file(path);
	if (!file.exists()) {
		*out_obj = QJsonObject();
		return true;
	}
	if (!file.open(QIODevice::ReadOnly)) {
		if (error)
			*error = QString("Failed to open store: %1").arg(path);
		return false;
	}

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
		if (error)
			*error = QString("Malformed store %1: %2").arg(path, parse_error.errorString());
		return false;
	}

	*out_obj = doc.object();
	return true;
}

bool write_json_file(const QString &path, const QJsonObject &json_obj, QString *error)
{
	QFileInfo info(path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath(".")) {
		if (error)
			*error = QString("Failed to create directory: %1").arg(dir.path());
		return false;
	}

	QSaveFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		if (error)
			*error = QString("Failed to open store for write: %1").arg(path);
		return false;
	}

	const QJsonDocument doc(json_obj);
	if (file.write(doc.toJson(QJsonDocument::Indented)) == -1) {
		if (error)
			*error = QString("Failed to write store: %1").arg(path);
		return false;
	}

	if (!file.commit()) {
		if (error)
			*error = QString("Failed to commit store: %1").arg(path);
		return false;
	}
	return true;
}

} // namespace

void CollectionStore::set_store_path(const QString &store_path)
{
	m_store_path = store_path;
}

QString CollectionStore::store_path() const
{
	return m_store_path;
}

bool CollectionStore::load(QString *error)
{
	QJsonObject json_obj;
	if (!read_json_file(m_store_path, &json_obj, error)) {
		qCWarning(lcStore, "store load failed: %s", error ? qUtf8Printable(*error) : "");
		return false;
	}

	from_json(json_obj);
	qCInfo(lcStore, "store loaded: path=%s records=%lld", qUtf8Printable(m_store_path),
	       static_cast<long long>(m_records.size()));
	return true;
}

bool CollectionStore::save(QString *error)
{
	if (m_store_path.isEmpty()) {
		if (error)
			*error = "Store path is not set";
		return false;
	}

	if (!write_json_file(m_store_path, to_json(), error)) {
		qCWarning(lcStore, "store save failed: %s", error ? qUtf8Printable(*error) : "");
		return false;
	}

	QString backup_error;
	if (!write_backup(&backup_error))
		qCWarning(lcStore, "backup not written: %s", qUtf8Printable(backup_error));
	prune_backups();
	return true;
}

bool CollectionStore::contains(const QString &key) const
{
	return m_records.contains(key);
}

ItemRecord CollectionStore::record(const QString &key) const
{
	return m_records.value(key);
}

ItemRecord *CollectionStore::find(const QString &key)
{
	auto it = m_records.find(key);
	return it == m_records.end() ? nullptr : &it.value();
}

ItemRecord &CollectionStore::ensure(const QString &key)
{
	return m_records[key];
}

void CollectionStore::set_record(const QString &key, const ItemRecord &record)
{
	m_records.insert(key, record);
}

std::optional<ItemRecord> CollectionStore::take(const QString &key)
{
	auto it = m_records.find(key);
	if (it == m_records.end())
		return std::nullopt;

	ItemRecord record = it.value();
	m_records.erase(it);
	return record;
}

bool CollectionStore::relocate(const QString &from_key, const QString &to_key, QString *error)
{
	if (from_key == to_key)
		return true;
	if (m_records.contains(to_key)) {
		if (error)
			*error = QString("Record already exists under '%1'").arg(to_key);
		return false;
	}

	std::optional<ItemRecord> record = take(from_key);
	if (record.has_value())
		m_records.insert(to_key, record.value());
	return true;
}

QStringList CollectionStore::keys() const
{
	return m_records.keys();
}

CollectionSettings &CollectionStore::settings()
{
	return m_settings;
}

const CollectionSettings &CollectionStore::settings() const
{
	return m_settings;
}

QJsonObject CollectionStore::to_json() const
{
	QJsonObject root;
	for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it)
		root.insert(it.key(), item_record_to_json(it.value()));
	root.insert(SETTINGS_KEY, collection_settings_to_json(m_settings));
	return root;
}

void CollectionStore::from_json(const QJsonObject &json_obj)
{
	m_records.clear();
	m_settings = collection_settings_from_json(json_obj.value(SETTINGS_KEY).toObject());

	int repaired = 0;
	for (auto it = json_obj.begin(); it != json_obj.end(); ++it) {
		if (it.key() == SETTINGS_KEY || !it.value().isObject())
			continue;

		ItemRecord record = item_record_from_json(it.value().toObject());
		if (record.annotations.has_value()) {
			const AnnotationTimeline timeline(record.annotations.value());
			const QVector<AnnotationSegment> normalized = timeline.to_persisted();
			if (normalized.size() != record.annotations->size())
				repaired += 1;
			record.annotations = normalized;
		}
		m_records.insert(it.key(), record);
	}

	if (repaired > 0)
		qCInfo(lcStore, "repaired annotation lists on load: %d", repaired);
}

QString CollectionStore::backup_path_for(const QDateTime &timestamp) const
{
	const QFileInfo info(m_store_path);
	return info.dir().filePath(
		QString("%1.%2.bak.json").arg(info.completeBaseName(), timestamp.toString("yyyyMMdd-HHmmss-zzz")));
}

QStringList CollectionStore::backup_paths() const
{
	const QFileInfo info(m_store_path);
	const QDir dir = info.dir();
	QStringList paths;
	const QStringList names = dir.entryList({info.completeBaseName() + ".*.bak.json"}, QDir::Files, QDir::Name);
	for (const QString &name : names)
		paths.push_back(dir.filePath(name));
	return paths;
}

bool CollectionStore::write_backup(QString *error) const
{
	const QString backup_path = backup_path_for(QDateTime::currentDateTime());
	QFile::remove(backup_path);
	if (!QFile::copy(m_store_path, backup_path)) {
		if (error)
			*error = QString("Failed to copy store to %1").arg(backup_path);
		return false;
	}
	return true;
}

void CollectionStore::prune_backups() const
{
	if (m_settings.max_backups <= 0)
		return;

	const QStringList backups = backup_paths();
	const qsizetype excess = backups.size() - m_settings.max_backups;
	for (qsizetype i = 0; i < excess; ++i) {
		if (!QFile::remove(backups.at(i)))
			qCWarning(lcStore, "failed to prune backup '%s'", qUtf8Printable(backups.at(i)));
	}
}

} // namespace pva
