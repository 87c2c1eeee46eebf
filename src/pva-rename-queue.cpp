#include "pva-rename-queue.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace pva {

QString RenameQueue::queue_path_for_store(const QString &store_path)
{
	const QFileInfo info(store_path);
	return info.dir().filePath(info.completeBaseName() + ".rename-queue.json");
}

void RenameQueue::set_queue_path(const QString &queue_path)
{
	m_queue_path = queue_path;
}

QString RenameQueue::queue_path() const
{
	return m_queue_path;
}

bool RenameQueue::load(QString *error)
{
	m_groups.clear();
	if (m_queue_path.isEmpty())
		return true;

	QFile file(m_queue_path);
	if (!file.exists())
		return true;
	if (!file.open(QIODevice::ReadOnly)) {
		if (error)
			*error = QString("Failed to open rename queue: %1").arg(m_queue_path);
		return false;
	}

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
		if (error)
			*error = QString("Malformed rename queue: %1").arg(m_queue_path);
		return false;
	}

	const QJsonArray groups = doc.object().value("groups").toArray();
	for (QJsonValue value : groups) {
		if (!value.isObject())
			continue;

		const QJsonObject obj = value.toObject();
		PendingRenameGroup group;
		group.file_name = obj.value("fileName").toString();
		for (QJsonValue path : obj.value("paths").toArray()) {
			if (path.isString() && !path.toString().isEmpty())
				group.paths.push_back(path.toString());
		}
		if (!group.file_name.isEmpty() && group.paths.size() > 1)
			m_groups.push_back(group);
	}

	return true;
}

bool RenameQueue::save(QString *error) const
{
	if (m_queue_path.isEmpty()) {
		if (error)
			*error = "Rename queue path is not set";
		return false;
	}

	if (m_groups.isEmpty()) {
		if (QFile::exists(m_queue_path) && !QFile::remove(m_queue_path)) {
			if (error)
				*error = QString("Failed to remove rename queue: %1").arg(m_queue_path);
			return false;
		}
		return true;
	}

	QFileInfo info(m_queue_path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath(".")) {
		if (error)
			*error = QString("Failed to create directory: %1").arg(dir.path());
		return false;
	}

	QJsonArray groups;
	for (const PendingRenameGroup &group : m_groups) {
		QJsonObject obj;
		obj.insert("fileName", group.file_name);
		obj.insert("paths", QJsonArray::fromStringList(group.paths));
		groups.push_back(obj);
	}

	QJsonObject root;
	root.insert("groups", groups);

	QSaveFile file(m_queue_path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
	    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented)) == -1 || !file.commit()) {
		if (error)
			*error = QString("Failed to write rename queue: %1").arg(m_queue_path);
		return false;
	}
	return true;
}

void RenameQueue::upsert(const PendingRenameGroup &group)
{
	for (PendingRenameGroup &existing : m_groups) {
		if (existing.file_name == group.file_name) {
			existing.paths = group.paths;
			return;
		}
	}
	m_groups.push_back(group);
}

void RenameQueue::remove(const QString &file_name)
{
	for (int i = 0; i < m_groups.size(); ++i) {
		if (m_groups.at(i).file_name == file_name) {
			m_groups.removeAt(i);
			return;
		}
	}
}

void RenameQueue::clear()
{
	m_groups.clear();
}

bool RenameQueue::is_empty() const
{
	return m_groups.isEmpty();
}

const QVector<PendingRenameGroup> &RenameQueue::groups() const
{
	return m_groups;
}

} // namespace pva
