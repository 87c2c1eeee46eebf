#include "pva-collection-store.hpp"
#include "pva-duplicate-filename-resolver.hpp"
#include "pva-rename-queue.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Duplicate test failed: " << message << std::endl;
	std::exit(1);
}

QString create_media_file(const QString &dir_path, const QString &file_name)
{
	require(QDir().mkpath(dir_path), "create media folder");
	const QString path = QDir(dir_path).filePath(file_name);
	QFile file(path);
	require(file.open(QIODevice::WriteOnly | QIODevice::Truncate), "create media file");
	require(file.write("media") == 5, "write media file");
	return QFileInfo(path).absoluteFilePath();
}

pva::CatalogEntry entry_for(const QString &path, double epoch)
{
	pva::CatalogEntry entry;
	entry.item = pva::media_item_from_path(path);
	entry.timestamp.utc_epoch = epoch;
	entry.timestamp.source = pva::TimestampSource::DeviceMetadata;
	return entry;
}

// Fails the Nth rename; every other call goes to the filesystem.
class FlakyRenamer : public pva::FileRenamer {
public:
	explicit FlakyRenamer(int fail_on_call) : m_fail_on_call(fail_on_call) {}

	bool rename(const QString &from_path, const QString &to_path, QString *error) override
	{
		calls += 1;
		if (calls == m_fail_on_call) {
			if (error)
				*error = "simulated failure";
			return false;
		}
		return m_filesystem.rename(from_path, to_path, error);
	}

	int calls = 0;

private:
	int m_fail_on_call = 0;
	pva::FilesystemRenamer m_filesystem;
};

void test_detect_groups_by_name()
{
	QVector<pva::CatalogEntry> entries;
	entries.push_back(entry_for("/x/a/beach.jpg", 100.0));
	entries.push_back(entry_for("/x/b/beach.jpg", 100.0));
	entries.push_back(entry_for("/x/a/dog.jpg", 100.0));
	entries.push_back(entry_for("/x/a/cat.jpg", 5.0));
	entries.push_back(entry_for("/x/b/cat.jpg", 6.0));
	entries.push_back(entry_for("/x/a/beach##1.jpg", 100.0));

	const QVector<pva::DuplicateGroup> groups = pva::DuplicateFilenameResolver::detect(entries);
	require(groups.size() == 2, "two colliding names");
	require(groups.at(0).file_name == "beach.jpg" && groups.at(0).paths.size() == 2, "beach group");
	require(groups.at(0).same_timestamp, "beach likely a true duplicate");
	require(groups.at(1).file_name == "cat.jpg" && !groups.at(1).same_timestamp, "cat group differs");
}

void test_lowest_unused_suffix()
{
	QSet<QString> taken{"beach.jpg", "beach.jpg##1", "beach.jpg##3"};
	require(pva::DuplicateFilenameResolver::lowest_unused_suffix("beach.jpg", taken) == "2", "fills gap");
	require(pva::DuplicateFilenameResolver::lowest_unused_suffix("dog.jpg", taken) == "1", "starts at one");
}

void test_resolve_group_renames_and_relocates()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	const QString first = create_media_file(temp_dir.path() + "/a", "beach.jpg");
	const QString second = create_media_file(temp_dir.path() + "/b", "beach.jpg");

	pva::CollectionStore store;
	store.ensure("beach.jpg").text = "family at the beach";

	QVector<pva::CatalogEntry> entries{entry_for(first, 100.0), entry_for(second, 100.0)};
	const QVector<pva::DuplicateGroup> groups = pva::DuplicateFilenameResolver::detect(entries);
	require(groups.size() == 1 && groups.first().same_timestamp, "identical epoch group");

	QSet<QString> taken{"beach.jpg"};
	pva::DuplicateFilenameResolver resolver(&store);
	const pva::GroupResolution result = resolver.resolve_group(groups.first(), &taken);
	require(result.ok, "group resolved");
	require(result.members.size() == 2, "both members renamed");

	require(QFileInfo::exists(temp_dir.path() + "/a/beach##1.jpg"), "first file suffixed ##1");
	require(QFileInfo::exists(temp_dir.path() + "/b/beach##2.jpg"), "second file suffixed ##2");
	require(!QFileInfo::exists(first) && !QFileInfo::exists(second), "unsuffixed files gone");

	require(!store.contains("beach.jpg"), "no record under unsuffixed key");
	require(store.record("beach.jpg##1").text == QString("family at the beach"), "record relocated to ##1");
	require(store.record("beach.jpg##2").text == QString("family at the beach"), "record relocated to ##2");
	require(taken.contains("beach.jpg##1") && taken.contains("beach.jpg##2") && !taken.contains("beach.jpg"),
		"taken keys updated");

	const pva::MediaItem renamed = pva::media_item_from_path(result.members.first().new_path);
	require(renamed.key() == result.members.first().new_key, "new path maps to new key");
}

void test_failed_rename_rolls_back()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	const QString first = create_media_file(temp_dir.path() + "/a", "beach.jpg");
	const QString second = create_media_file(temp_dir.path() + "/b", "beach.jpg");

	pva::CollectionStore store;
	store.ensure("beach.jpg").text = "keep";

	pva::DuplicateGroup group;
	group.file_name = "beach.jpg";
	group.base_name = "beach.jpg";
	group.paths = {first, second};

	FlakyRenamer renamer(2);
	pva::DuplicateFilenameResolver resolver(&store, &renamer);
	QSet<QString> taken{"beach.jpg"};
	const pva::GroupResolution result = resolver.resolve_group(group, &taken);
	require(!result.ok, "group fails");
	require(result.retryable, "rename failure is retryable");
	require(QFileInfo::exists(first) && QFileInfo::exists(second), "renamed file rolled back");
	require(!QFileInfo::exists(temp_dir.path() + "/a/beach##1.jpg"), "no suffixed leftovers");
	require(store.contains("beach.jpg") && !store.contains("beach.jpg##1"), "store untouched");
	require(taken.contains("beach.jpg") && !taken.contains("beach.jpg##1"), "taken keys untouched");
}

void test_declined_groups_are_queued()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	pva::DuplicateGroup beach;
	beach.file_name = "beach.jpg";
	beach.base_name = "beach.jpg";
	beach.paths = {create_media_file(temp_dir.path() + "/a", "beach.jpg"),
		       create_media_file(temp_dir.path() + "/b", "beach.jpg")};
	pva::DuplicateGroup dog;
	dog.file_name = "dog.jpg";
	dog.base_name = "dog.jpg";
	dog.paths = {create_media_file(temp_dir.path() + "/a", "dog.jpg"),
		     create_media_file(temp_dir.path() + "/b", "dog.jpg")};

	pva::CollectionStore store;
	pva::RenameQueue queue;
	pva::DuplicateFilenameResolver resolver(&store);
	QSet<QString> taken{"beach.jpg", "dog.jpg"};

	int asked = 0;
	const pva::ResolutionSummary summary = resolver.resolve_all(
		{beach, dog},
		[&asked](const pva::DuplicateGroup &) {
			asked += 1;
			return false;
		},
		&taken, &queue);
	require(asked == 1, "stops asking after a decline");
	require(summary.resolved == 0 && summary.deferred == 2, "both groups deferred");
	require(queue.groups().size() == 2, "declined and remaining groups queued");
	require(QFileInfo::exists(beach.paths.first()), "declined group untouched");

	const pva::ResolutionSummary accepted = resolver.resolve_all({beach, dog}, nullptr, &taken, &queue);
	require(accepted.resolved == 2 && accepted.renamed.size() == 4, "accepted groups resolved");
	require(queue.is_empty(), "resolved groups leave the queue");
}

} // namespace

int main()
{
	test_detect_groups_by_name();
	test_lowest_unused_suffix();
	test_resolve_group_renames_and_relocates();
	test_failed_rename_rolls_back();
	test_declined_groups_are_queued();
	return 0;
}
