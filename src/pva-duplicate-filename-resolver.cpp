#include "pva-duplicate-filename-resolver.hpp"

#include "pva-collection-store.hpp"
#include "pva-logging.hpp"
#include "pva-rename-queue.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMap>

#include <algorithm>

namespace pva {
namespace {

struct PlannedRename {
	QString from_path;
	QString to_path;
	QString new_key;
};

void roll_back(FileRenamer *renamer, const QVector<PlannedRename> &done)
{
	for (auto it = done.crbegin(); it != done.crend(); ++it) {
		QString error;
		if (!renamer->rename(it->to_path, it->from_path, &error))
			qCWarning(lcDuplicates, "rollback failed: %s -> %s: %s", qUtf8Printable(it->to_path),
				  qUtf8Printable(it->from_path), qUtf8Printable(error));
	}
}

GroupResolution group_failure(const QString &error, bool retryable)
{
	GroupResolution result;
	result.error = error;
	result.retryable = retryable;
	return result;
}

PendingRenameGroup pending_from_group(const DuplicateGroup &group)
{
	return {group.file_name, group.paths};
}

} // namespace

bool FilesystemRenamer::rename(const QString &from_path, const QString &to_path, QString *error)
{
	QFile file(from_path);
	if (file.rename(to_path))
		return true;
	if (error)
		*error = file.errorString();
	return false;
}

DuplicateFilenameResolver::DuplicateFilenameResolver(CollectionStore *store, FileRenamer *renamer)
	: m_store(store),
	  m_renamer(renamer ? renamer : &m_filesystem_renamer)
{
}

QVector<DuplicateGroup> DuplicateFilenameResolver::detect(const QVector<CatalogEntry> &entries)
{
	QMap<QString, QVector<const CatalogEntry *>> by_key;
	QStringList key_order;
	for (const CatalogEntry &entry : entries) {
		const QString key = entry.key();
		if (!by_key.contains(key))
			key_order.push_back(key);
		by_key[key].push_back(&entry);
	}

	QVector<DuplicateGroup> groups;
	for (const QString &key : key_order) {
		const QVector<const CatalogEntry *> &members = by_key.value(key);
		QStringList paths;
		for (const CatalogEntry *entry : members) {
			const QString path = QFileInfo(entry->item.path).absoluteFilePath();
			if (!paths.contains(path))
				paths.push_back(path);
		}
		if (paths.size() < 2)
			continue;

		paths.sort();
		DuplicateGroup group;
		group.file_name = key;
		group.base_name = members.first()->item.base_name;
		group.paths = paths;
		group.same_timestamp = std::all_of(members.begin(), members.end(), [&](const CatalogEntry *entry) {
			return MediaOrderer::effective_epoch(*entry) == MediaOrderer::effective_epoch(*members.first());
		});
		groups.push_back(group);
	}
	return groups;
}

QString DuplicateFilenameResolver::lowest_unused_suffix(const QString &base_name, const QSet<QString> &taken_keys)
{
	for (int counter = 1;; ++counter) {
		const QString suffix = QString::number(counter);
		if (!taken_keys.contains(item_key(base_name, suffix)))
			return suffix;
	}
}

GroupResolution DuplicateFilenameResolver::resolve_group(const DuplicateGroup &group, QSet<QString> *taken_keys)
{
	if (group.paths.size() < 2)
		return group_failure(QString("Group '%1' has fewer than two files").arg(group.file_name), false);

	QSet<QString> taken = taken_keys ? *taken_keys : QSet<QString>();
	if (m_store) {
		for (const QString &key : m_store->keys())
			taken.insert(key);
	}

	QVector<PlannedRename> plan;
	for (const QString &path : group.paths) {
		const QFileInfo info(path);
		if (!info.exists())
			return group_failure(QString("File no longer exists: %1").arg(path), false);

		QString suffix;
		QString to_path;
		for (;;) {
			suffix = lowest_unused_suffix(group.base_name, taken);
			to_path = info.dir().filePath(versioned_file_name(group.base_name, suffix));
			taken.insert(item_key(group.base_name, suffix));
			if (!QFileInfo::exists(to_path))
				break;
		}
		plan.push_back({info.absoluteFilePath(), to_path, item_key(group.base_name, suffix)});
	}

	QVector<PlannedRename> done;
	for (const PlannedRename &step : plan) {
		QString error;
		if (!m_renamer->rename(step.from_path, step.to_path, &error)) {
			roll_back(m_renamer, done);
			qCWarning(lcDuplicates, "group rename failed: name=%s path=%s error=%s",
				  qUtf8Printable(group.file_name), qUtf8Printable(step.from_path), qUtf8Printable(error));
			return group_failure(QString("Failed to rename %1: %2").arg(step.from_path, error), true);
		}
		done.push_back(step);
	}

	if (m_store) {
		const std::optional<ItemRecord> record = m_store->take(group.file_name);
		if (record.has_value()) {
			for (const PlannedRename &step : plan)
				m_store->set_record(step.new_key, record.value());
		}
	}

	GroupResolution result;
	result.ok = true;
	for (const PlannedRename &step : plan) {
		result.members.push_back({step.from_path, step.to_path, group.file_name, step.new_key});
		if (taken_keys)
			taken_keys->insert(step.new_key);
	}
	if (taken_keys)
		taken_keys->remove(group.file_name);

	qCInfo(lcDuplicates, "group resolved: name=%s members=%lld same_timestamp=%s", qUtf8Printable(group.file_name),
	       static_cast<long long>(plan.size()), group.same_timestamp ? "true" : "false");
	return result;
}

ResolutionSummary DuplicateFilenameResolver::resolve_all(const QVector<DuplicateGroup> &groups,
							 const ConfirmCallback &confirm, QSet<QString> *taken_keys,
							 RenameQueue *queue)
{
	ResolutionSummary summary;
	for (int i = 0; i < groups.size(); ++i) {
		const DuplicateGroup &group = groups.at(i);
		if (confirm && !confirm(group)) {
			for (int j = i; j < groups.size(); ++j) {
				if (queue)
					queue->upsert(pending_from_group(groups.at(j)));
				summary.deferred += 1;
			}
			qCInfo(lcDuplicates, "rename declined: name=%s deferred=%d", qUtf8Printable(group.file_name),
			       summary.deferred);
			break;
		}

		const GroupResolution result = resolve_group(group, taken_keys);
		if (result.ok) {
			summary.resolved += 1;
			summary.renamed += result.members;
			if (queue)
				queue->remove(group.file_name);
			continue;
		}

		summary.failed += 1;
		if (queue) {
			if (result.retryable)
				queue->upsert(pending_from_group(group));
			else
				queue->remove(group.file_name);
		}
	}
	return summary;
}

} // namespace pva
