#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

namespace pva {

struct PendingRenameGroup {
	QString file_name;
	QStringList paths;
};

// Duplicate-name groups the user has not accepted yet, offered again next run.
class RenameQueue {
public:
	static QString queue_path_for_store(const QString &store_path);

	void set_queue_path(const QString &queue_path);
	QString queue_path() const;
	bool load(QString *error = nullptr);
	bool save(QString *error = nullptr) const;

	void upsert(const PendingRenameGroup &group);
	void remove(const QString &file_name);
	void clear();
	bool is_empty() const;

	const QVector<PendingRenameGroup> &groups() const;

private:
	QString m_queue_path;
	QVector<PendingRenameGroup> m_groups;
};

} // namespace pva
