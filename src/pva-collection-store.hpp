#pragma once

#include "pva-models.hpp"

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

namespace pva {

constexpr const char *DEFAULT_STORE_FILE_NAME = "annotations.json";

// One JSON document per collection: item key -> record, plus "_settings".
class CollectionStore {
public:
	CollectionStore() = default;

	void set_store_path(const QString &store_path);
	QString store_path() const;

	bool load(QString *error = nullptr);
	bool save(QString *error = nullptr);

	bool contains(const QString &key) const;
	ItemRecord record(const QString &key) const;
	ItemRecord *find(const QString &key);
	ItemRecord &ensure(const QString &key);
	void set_record(const QString &key, const ItemRecord &record);
	std::optional<ItemRecord> take(const QString &key);
	bool relocate(const QString &from_key, const QString &to_key, QString *error = nullptr);
	QStringList keys() const;

	CollectionSettings &settings();
	const CollectionSettings &settings() const;

	QJsonObject to_json() const;
	void from_json(const QJsonObject &json_obj);

	QString backup_path_for(const QDateTime &timestamp) const;
	QStringList backup_paths() const;

private:
	bool write_backup(QString *error) const;
	void prune_backups() const;

	QString m_store_path;
	QMap<QString, ItemRecord> m_records;
	CollectionSettings m_settings;
};

} // namespace pva
