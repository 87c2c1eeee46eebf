#include "pva-catalog.hpp"
#include "pva-datetime.hpp"
#include "pva-logging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

namespace {

QString offset_column(const pva::TimestampRecord &record)
{
	if (!record.tz_offset_minutes.has_value())
		return "-";
	const QString offset = pva::format_utc_offset(record.tz_offset_minutes.value());
	return record.offset_inferred ? "~" + offset : offset;
}

void print_catalog(pva::Catalog &catalog, QTextStream &out)
{
	for (const pva::CatalogEntry &entry : catalog.entries()) {
		const pva::ItemRecord record = catalog.store().record(entry.key());
		const bool manual = !record.manual_time.isEmpty();
		const QString wall = manual ? record.manual_time : entry.timestamp.wall_clock;
		const char *source = manual ? pva::timestamp_source_to_key(pva::TimestampSource::Manual)
					    : pva::timestamp_source_to_key(entry.timestamp.source);

		out << entry.key() << '\t' << (wall.isEmpty() ? QString("-") : wall) << '\t'
		    << offset_column(entry.timestamp) << '\t' << source;
		if (record.annotations.has_value())
			out << '\t' << record.annotations->size() << " annotation(s)";
		out << '\n';
	}
}

bool apply_manual_times(pva::Catalog &catalog, const QStringList &assignments, QTextStream &err)
{
	bool ok = true;
	for (const QString &assignment : assignments) {
		const qsizetype eq = assignment.indexOf('=');
		if (eq <= 0) {
			err << "invalid --set-time '" << assignment << "', expected KEY=DATETIME\n";
			ok = false;
			continue;
		}

		QString error;
		if (!catalog.set_manual_time(assignment.left(eq), assignment.mid(eq + 1), &error)) {
			err << error << '\n';
			ok = false;
		}
	}
	return ok;
}

} // namespace

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("pva-catalog");
	QCoreApplication::setApplicationVersion("1.0.0");

	QCommandLineParser parser;
	parser.setApplicationDescription("Resolve capture times, order and annotate a photo/video collection");
	parser.addHelpOption();
	parser.addVersionOption();
	parser.addPositionalArgument("folder", "Collection root folder");

	const QCommandLineOption store_option("store", "Store file (default <folder>/annotations.json).", "file");
	const QCommandLineOption no_exiftool_option("no-exiftool", "Do not fall back to ExifTool for videos.");
	const QCommandLineOption set_time_option("set-time", "Manual capture time override, may repeat.",
						 "key=datetime");
	const QCommandLineOption resolve_option("resolve-duplicates", "Accept every pending duplicate-name rename.");
	const QCommandLineOption list_option("list", "Print the ordered catalog.");
	parser.addOption(store_option);
	parser.addOption(no_exiftool_option);
	parser.addOption(set_time_option);
	parser.addOption(resolve_option);
	parser.addOption(list_option);
	parser.process(app);

	QTextStream out(stdout);
	QTextStream err(stderr);

	const QStringList positional = parser.positionalArguments();
	if (positional.size() != 1) {
		err << "expected exactly one collection folder\n";
		parser.showHelp(2);
	}

	pva::Catalog catalog;
	if (parser.isSet(store_option))
		catalog.set_store_path(parser.value(store_option));
	if (parser.isSet(no_exiftool_option))
		catalog.set_exiftool_override(false);

	QString error;
	if (!catalog.open(positional.first(), &error)) {
		err << error << '\n';
		return 1;
	}

	bool ok = apply_manual_times(catalog, parser.values(set_time_option), err);

	const QVector<pva::DuplicateGroup> &groups = catalog.pending_duplicate_groups();
	if (!groups.isEmpty()) {
		if (parser.isSet(resolve_option)) {
			const pva::ResolutionSummary summary = catalog.resolve_duplicates(nullptr);
			out << "duplicates: resolved " << summary.resolved << ", failed " << summary.failed << '\n';
			ok = ok && summary.failed == 0;
		} else {
			for (const pva::DuplicateGroup &group : groups)
				out << "duplicate name: " << group.file_name << " (" << group.paths.size() << " files"
				    << (group.same_timestamp ? ", same capture time" : "") << ")\n";
		}
	}

	if (parser.isSet(list_option))
		print_catalog(catalog, out);

	if (!catalog.save(&error)) {
		err << error << '\n';
		return 1;
	}
	qCInfo(pva::lcCatalog, "catalog saved: %s", qUtf8Printable(catalog.store().store_path()));
	return ok ? 0 : 1;
}
