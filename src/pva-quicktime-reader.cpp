#include "pva-quicktime-reader.hpp"

#include "pva-datetime.hpp"

#include <QByteArray>
#include <QFile>
#include <QTimeZone>
#include <QVector>

#include <limits>

namespace pva {
namespace {

constexpr quint64 MAC_TO_UNIX_EPOCH_SECONDS = 2082844800ULL;
constexpr quint64 MAX_MOOV_BYTES = 64ULL * 1024ULL * 1024ULL;
const QByteArray VENDOR_CREATION_KEY("com.apple.quicktime.creationdate");
const QByteArray RECORDED_DATE_TYPE("\xA9"
				    "day");

struct Atom {
	quint64 offset = 0;
	quint64 size = 0;
	quint64 header_size = 0;
	QByteArray type;
};

quint32 read_be32(const char *data)
{
	return (static_cast<quint32>(static_cast<unsigned char>(data[0])) << 24) |
	       (static_cast<quint32>(static_cast<unsigned char>(data[1])) << 16) |
	       (static_cast<quint32>(static_cast<unsigned char>(data[2])) << 8) |
	       (static_cast<quint32>(static_cast<unsigned char>(data[3])));
}

quint64 read_be64(const char *data)
{
	return (static_cast<quint64>(read_be32(data)) << 32) | read_be32(data + 4);
}

quint16 read_be16(const char *data)
{
	return static_cast<quint16>((static_cast<unsigned char>(data[0]) << 8) | static_cast<unsigned char>(data[1]));
}

bool parse_atoms_from_buffer(const QByteArray &buffer, int start, int end, QVector<Atom> &atoms, QString *error)
{
	atoms.clear();
	int pos = start;
	while (pos + 8 <= end) {
		const char *ptr = buffer.constData() + pos;
		const quint32 size32 = read_be32(ptr);
		const QByteArray type(ptr + 4, 4);

		quint64 size = size32;
		quint64 header = 8;
		if (size32 == 1) {
			if (pos + 16 > end) {
				if (error)
					*error = "Truncated extended atom header";
				return false;
			}
			size = read_be64(ptr + 8);
			header = 16;
		} else if (size32 == 0) {
			size = static_cast<quint64>(end - pos);
		}

		if (size < header || size > static_cast<quint64>(end - pos)) {
			if (error)
				*error = "Invalid atom size while parsing buffer";
			return false;
		}

		atoms.push_back(Atom{static_cast<quint64>(pos), size, header, type});
		pos += static_cast<int>(size);
	}

	// Some writers pad container atoms with a 4 byte terminator.
	if (end - pos > 4) {
		if (error)
			*error = "Unaligned atom payload";
		return false;
	}

	return true;
}

bool parse_top_level_atoms(QFile &file, QVector<Atom> &atoms, QString *error)
{
	atoms.clear();
	const quint64 file_size = static_cast<quint64>(file.size());
	quint64 offset = 0;

	while (offset + 8 <= file_size) {
		if (!file.seek(static_cast<qint64>(offset))) {
			if (error)
				*error = "Failed to seek while parsing atoms";
			return false;
		}

		QByteArray header = file.read(16);
		if (header.size() < 8) {
			if (error)
				*error = "Truncated atom header";
			return false;
		}

		const quint32 size32 = read_be32(header.constData());
		const QByteArray type = header.mid(4, 4);

		quint64 size = size32;
		quint64 header_size = 8;
		if (size32 == 1) {
			if (header.size() < 16) {
				if (error)
					*error = "Truncated extended atom header";
				return false;
			}
			size = read_be64(header.constData() + 8);
			header_size = 16;
		} else if (size32 == 0) {
			size = file_size - offset;
		}

		if (size < header_size || offset + size > file_size) {
			if (error)
				*error = "Invalid top-level atom size";
			return false;
		}

		atoms.push_back(Atom{offset, size, header_size, type});
		offset += size;
	}

	return true;
}

bool children_of(const QByteArray &buffer, const Atom &parent, int skip, QVector<Atom> &children)
{
	const quint64 start = parent.offset + parent.header_size + static_cast<quint64>(skip);
	const quint64 end = parent.offset + parent.size;
	if (start > end || end > static_cast<quint64>(buffer.size()))
		return false;
	return parse_atoms_from_buffer(buffer, static_cast<int>(start), static_cast<int>(end), children, nullptr);
}

const Atom *find_child(const QVector<Atom> &atoms, const char *type)
{
	for (const Atom &atom : atoms) {
		if (atom.type == type)
			return &atom;
	}
	return nullptr;
}

QByteArray payload_of(const QByteArray &buffer, const Atom &atom)
{
	return buffer.mid(static_cast<int>(atom.offset + atom.header_size),
			  static_cast<int>(atom.size - atom.header_size));
}

// mvhd, tkhd and mdhd share the same leading layout: version, flags, creation time.
std::optional<QDateTime> creation_from_header_atom(const QByteArray &payload)
{
	if (payload.size() < 4)
		return std::nullopt;

	const unsigned char version = static_cast<unsigned char>(payload.at(0));
	if (version == 1) {
		if (payload.size() < 12)
			return std::nullopt;
		return QuickTimeReader::datetime_from_mac_seconds(read_be64(payload.constData() + 4));
	}
	if (payload.size() < 8)
		return std::nullopt;
	return QuickTimeReader::datetime_from_mac_seconds(read_be32(payload.constData() + 4));
}

QString string_from_data_atom(const QByteArray &payload)
{
	// payload: size, "data", type indicator, locale, value
	if (payload.size() < 16 || payload.mid(4, 4) != "data")
		return {};
	const quint32 size = read_be32(payload.constData());
	if (size < 16 || size > static_cast<quint32>(payload.size()))
		return {};
	return QString::fromUtf8(payload.mid(16, static_cast<int>(size) - 16)).trimmed();
}

QString read_vendor_creation_date(const QByteArray &moov, const Atom &meta)
{
	// QuickTime meta is a plain container, ISO meta carries version and flags first.
	QVector<Atom> children;
	if (!children_of(moov, meta, 0, children) || !find_child(children, "hdlr")) {
		if (!children_of(moov, meta, 4, children))
			return {};
	}

	const Atom *keys = find_child(children, "keys");
	const Atom *ilst = find_child(children, "ilst");
	if (!keys || !ilst)
		return {};

	const QByteArray keys_payload = payload_of(moov, *keys);
	if (keys_payload.size() < 8)
		return {};

	quint32 vendor_index = 0;
	const quint32 entry_count = read_be32(keys_payload.constData() + 4);
	int pos = 8;
	for (quint32 index = 1; index <= entry_count && pos + 8 <= keys_payload.size(); ++index) {
		const quint32 key_size = read_be32(keys_payload.constData() + pos);
		if (key_size < 8 || pos + static_cast<qint64>(key_size) > keys_payload.size())
			return {};
		if (keys_payload.mid(pos + 8, static_cast<int>(key_size) - 8) == VENDOR_CREATION_KEY) {
			vendor_index = index;
			break;
		}
		pos += static_cast<int>(key_size);
	}
	if (vendor_index == 0)
		return {};

	QVector<Atom> items;
	if (!children_of(moov, *ilst, 0, items))
		return {};
	for (const Atom &item : items) {
		if (item.type.size() != 4 || read_be32(item.type.constData()) != vendor_index)
			continue;
		return string_from_data_atom(payload_of(moov, item));
	}
	return {};
}

QString read_recorded_date(const QByteArray &moov, const Atom &udta)
{
	QVector<Atom> children;
	if (!children_of(moov, udta, 0, children))
		return {};

	const Atom *day = find_child(children, RECORDED_DATE_TYPE.constData());
	if (!day)
		return {};

	const QByteArray payload = payload_of(moov, *day);
	const QString from_data = string_from_data_atom(payload);
	if (!from_data.isEmpty())
		return from_data;

	// Classic user data text: length, language code, text.
	if (payload.size() < 4)
		return {};
	const quint16 length = read_be16(payload.constData());
	if (4 + length > payload.size())
		return {};
	return QString::fromUtf8(payload.mid(4, length)).trimmed();
}

void read_first_track(const QByteArray &moov, const QVector<Atom> &moov_children, QuickTimeDates *dates)
{
	const Atom *trak = find_child(moov_children, "trak");
	if (!trak)
		return;

	QVector<Atom> trak_children;
	if (!children_of(moov, *trak, 0, trak_children))
		return;

	if (const Atom *tkhd = find_child(trak_children, "tkhd"))
		dates->track_creation = creation_from_header_atom(payload_of(moov, *tkhd));

	const Atom *mdia = find_child(trak_children, "mdia");
	if (!mdia)
		return;
	QVector<Atom> mdia_children;
	if (!children_of(moov, *mdia, 0, mdia_children))
		return;
	if (const Atom *mdhd = find_child(mdia_children, "mdhd"))
		dates->media_creation = creation_from_header_atom(payload_of(moov, *mdhd));
}

} // namespace

QuickTimeReadResult QuickTimeReader::read(const QString &media_path) const
{
	QuickTimeReadResult result;

	QFile file(media_path);
	if (!file.open(QIODevice::ReadOnly)) {
		result.error = QString("Failed to open media file: %1").arg(media_path);
		return result;
	}

	QVector<Atom> top_level;
	if (!parse_top_level_atoms(file, top_level, &result.error)) {
		result.error = QString("Failed to parse MP4/MOV atoms: %1").arg(result.error);
		return result;
	}

	const Atom *moov_atom = find_child(top_level, "moov");
	if (!moov_atom) {
		result.error = "No moov atom";
		return result;
	}
	if (moov_atom->size > MAX_MOOV_BYTES || moov_atom->size > static_cast<quint64>(std::numeric_limits<int>::max())) {
		result.error = "moov atom too large";
		return result;
	}

	if (!file.seek(static_cast<qint64>(moov_atom->offset))) {
		result.error = "Failed to seek moov atom";
		return result;
	}
	const QByteArray moov = file.read(static_cast<qint64>(moov_atom->size));
	if (moov.size() != static_cast<qint64>(moov_atom->size)) {
		result.error = "Failed to read moov atom";
		return result;
	}

	const Atom root{0, moov_atom->size, moov_atom->header_size, "moov"};
	QVector<Atom> moov_children;
	if (!children_of(moov, root, 0, moov_children)) {
		result.error = "Failed to parse moov children";
		return result;
	}

	if (const Atom *mvhd = find_child(moov_children, "mvhd"))
		result.dates.movie_creation = creation_from_header_atom(payload_of(moov, *mvhd));
	if (const Atom *meta = find_child(moov_children, "meta"))
		result.dates.vendor_creation_date = read_vendor_creation_date(moov, *meta);
	if (const Atom *udta = find_child(moov_children, "udta"))
		result.dates.recorded_date = read_recorded_date(moov, *udta);
	read_first_track(moov, moov_children, &result.dates);

	result.ok = true;
	return result;
}

std::optional<QDateTime> QuickTimeReader::datetime_from_mac_seconds(quint64 seconds_since_1904)
{
	if (seconds_since_1904 <= MAC_TO_UNIX_EPOCH_SECONDS)
		return std::nullopt;

	const qint64 unix_seconds = static_cast<qint64>(seconds_since_1904 - MAC_TO_UNIX_EPOCH_SECONDS);
	const QDateTime value = QDateTime::fromSecsSinceEpoch(unix_seconds, QTimeZone::utc());
	if (!value.isValid() || !is_plausible_year(value.date().year()))
		return std::nullopt;
	return value;
}

} // namespace pva
