#pragma once

#include "pva-media-orderer.hpp"

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

namespace pva {

class CollectionStore;
class RenameQueue;

// Items whose physical files map to one key from different full paths.
struct DuplicateGroup {
	QString file_name;
	QString base_name;
	QStringList paths;
	// Informational only: all members resolved to the same epoch.
	bool same_timestamp = false;
};

struct RenamedMember {
	QString old_path;
	QString new_path;
	QString old_key;
	QString new_key;
};

struct GroupResolution {
	bool ok = false;
	QString error;
	bool retryable = false;
	QVector<RenamedMember> members;
};

struct ResolutionSummary {
	int resolved = 0;
	int failed = 0;
	int deferred = 0;
	QVector<RenamedMember> renamed;
};

class FileRenamer {
public:
	virtual ~FileRenamer() = default;
	virtual bool rename(const QString &from_path, const QString &to_path, QString *error) = 0;
};

class FilesystemRenamer final : public FileRenamer {
public:
	bool rename(const QString &from_path, const QString &to_path, QString *error) override;
};

class DuplicateFilenameResolver {
public:
	using ConfirmCallback = std::function<bool(const DuplicateGroup &)>;

	explicit DuplicateFilenameResolver(CollectionStore *store, FileRenamer *renamer = nullptr);

	static QVector<DuplicateGroup> detect(const QVector<CatalogEntry> &entries);
	static QString lowest_unused_suffix(const QString &base_name, const QSet<QString> &taken_keys);

	// Renames every member to a fresh suffix and moves the stored record
	// under the new keys. Either all of it happens or none of it.
	GroupResolution resolve_group(const DuplicateGroup &group, QSet<QString> *taken_keys);

	// Stops at the first declined group; it and the rest go to the queue.
	ResolutionSummary resolve_all(const QVector<DuplicateGroup> &groups, const ConfirmCallback &confirm,
				      QSet<QString> *taken_keys, RenameQueue *queue);

private:
	CollectionStore *m_store = nullptr;
	FileRenamer *m_renamer = nullptr;
	FilesystemRenamer m_filesystem_renamer;
};

} // namespace pva
