#include "FileProcessor.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <algorithm>
#include <utility>
#include <zlib.h>
Q_LOGGING_CATEGORY(bfFiles, "bookfetch.files")

namespace {

constexpr quint32 kLocalHeaderSig = 0x04034b50;
constexpr quint32 kCentralHeaderSig = 0x02014b50;
constexpr quint32 kEndOfCentralDirSig = 0x06054b50;
constexpr int kLocalHeaderSize = 30;
constexpr int kCentralHeaderSize = 46;
constexpr int kEndOfCentralDirSize = 22;
constexpr int kMaxCommentSize = 0xFFFF;

constexpr quint16 kMethodStored = 0;
constexpr quint16 kMethodDeflated = 8;

// Search listings are plain text; anything larger is not one
constexpr quint32 kMaxListingSize = 64u * 1024u * 1024u;
constexpr int kInflateChunk = 16 * 1024;

// ZIP fields are little-endian; callers check bounds.
quint16 le16(const QByteArray &b, qint64 at) {
    const auto *p = reinterpret_cast<const unsigned char *>(b.constData() + at);
    return static_cast<quint16>(p[0] | (p[1] << 8));
}

quint32 le32(const QByteArray &b, qint64 at) {
    const auto *p = reinterpret_cast<const unsigned char *>(b.constData() + at);
    return static_cast<quint32>(p[0]) | (static_cast<quint32>(p[1]) << 8) |
           (static_cast<quint32>(p[2]) << 16) |
           (static_cast<quint32>(p[3]) << 24);
}

bool inflateRaw(const char *data, qint64 len, quint32 expected, QByteArray &out,
                QString &err) {
    // The announced size comes from the peer; it only bounds the output
    if (expected > kMaxListingSize) {
        err = QStringLiteral("Entry claims %1 bytes, limit is %2")
                  .arg(expected)
                  .arg(kMaxListingSize);
        return false;
    }
    z_stream zs{};
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
    zs.avail_in = static_cast<uInt>(len);
    // Negative window bits: raw deflate data without a zlib header
    int rc = inflateInit2(&zs, -MAX_WBITS);
    if (rc != Z_OK) {
        err = QStringLiteral("inflateInit2 failed: %1").arg(rc);
        return false;
    }
    out.clear();
    char chunk[kInflateChunk];
    do {
        zs.next_out = reinterpret_cast<Bytef *>(chunk);
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
            break;
        const qsizetype produced =
            static_cast<qsizetype>(sizeof(chunk) - zs.avail_out);
        if (out.size() + produced > static_cast<qsizetype>(expected)) {
            inflateEnd(&zs);
            err = QStringLiteral("Entry inflates past its declared %1 bytes")
                      .arg(expected);
            return false;
        }
        out.append(chunk, produced);
        // No input left and no progress: the stream is cut short
        if (rc == Z_OK && zs.avail_in == 0 && produced == 0) {
            rc = Z_BUF_ERROR;
            break;
        }
    } while (rc != Z_STREAM_END);
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        err = QStringLiteral("Corrupt deflate stream (zlib %1)").arg(rc);
        return false;
    }
    if (out.size() != static_cast<qsizetype>(expected)) {
        err = QStringLiteral("Entry inflated to %1 bytes, expected %2")
                  .arg(out.size())
                  .arg(expected);
        return false;
    }
    return true;
}

} // namespace

QStringList FileProcessor::defaultFileTypes() {
    return {QStringLiteral("epub"), QStringLiteral("mobi"),
            QStringLiteral("pdf"),  QStringLiteral("azw3"),
            QStringLiteral("azw"),  QStringLiteral("cbz"),
            QStringLiteral("cbr")};
}

FileProcessor::FileProcessor(QStringList fileTypes)
    : fileTypes_(fileTypes.isEmpty() ? defaultFileTypes()
                                     : std::move(fileTypes)) {
    for (QString &t : fileTypes_)
        t = t.trimmed().toLower();
}

bool FileProcessor::extractSingleEntry(const QByteArray &zip, QByteArray &out,
                                       QString &err) {
    const qint64 size = zip.size();
    if (size < kEndOfCentralDirSize) {
        err = QStringLiteral("Not a zip file");
        return false;
    }
    // The end record sits at the tail, before an optional comment
    qint64 eocd = -1;
    const qint64 lowest =
        std::max<qint64>(0, size - kEndOfCentralDirSize - kMaxCommentSize);
    for (qint64 at = size - kEndOfCentralDirSize; at >= lowest; --at) {
        if (le32(zip, at) == kEndOfCentralDirSig) {
            eocd = at;
            break;
        }
    }
    if (eocd < 0) {
        err = QStringLiteral("Not a zip file");
        return false;
    }

    const quint16 entries = le16(zip, eocd + 10);
    const quint32 cdOffset = le32(zip, eocd + 16);
    if (entries != 1) {
        err = QStringLiteral("Expected one entry in the archive, found %1")
                  .arg(entries);
        return false;
    }
    if (static_cast<qint64>(cdOffset) + kCentralHeaderSize > size ||
        le32(zip, cdOffset) != kCentralHeaderSig) {
        err = QStringLiteral("Bad central directory");
        return false;
    }

    const quint16 flags = le16(zip, cdOffset + 8);
    const quint16 method = le16(zip, cdOffset + 10);
    const quint32 crc = le32(zip, cdOffset + 16);
    const quint32 compSize = le32(zip, cdOffset + 20);
    const quint32 uncompSize = le32(zip, cdOffset + 24);
    const quint32 localOffset = le32(zip, cdOffset + 42);
    if (flags & 0x1) {
        err = QStringLiteral("Encrypted entries are not supported");
        return false;
    }
    if (compSize == 0xFFFFFFFFu || uncompSize == 0xFFFFFFFFu ||
        localOffset == 0xFFFFFFFFu) {
        err = QStringLiteral("ZIP64 archives are not supported");
        return false;
    }
    if (static_cast<qint64>(localOffset) + kLocalHeaderSize > size ||
        le32(zip, localOffset) != kLocalHeaderSig) {
        err = QStringLiteral("Bad local header");
        return false;
    }
    const qint64 dataAt = static_cast<qint64>(localOffset) + kLocalHeaderSize +
                          le16(zip, localOffset + 26) +
                          le16(zip, localOffset + 28);
    if (dataAt + compSize > size) {
        err = QStringLiteral("Truncated archive");
        return false;
    }
    const char *data = zip.constData() + dataAt;

    if (method == kMethodStored) {
        if (compSize != uncompSize) {
            err = QStringLiteral("Stored entry size mismatch");
            return false;
        }
        out = QByteArray(data, static_cast<int>(compSize));
    } else if (method == kMethodDeflated) {
        if (!inflateRaw(data, compSize, uncompSize, out, err))
            return false;
    } else {
        err = QStringLiteral("Unsupported compression method %1").arg(method);
        return false;
    }

    const uLong actual =
        crc32(crc32(0L, Z_NULL, 0),
              reinterpret_cast<const Bytef *>(out.constData()),
              static_cast<uInt>(out.size()));
    if (actual != crc) {
        err = QStringLiteral("CRC mismatch");
        return false;
    }
    return true;
}

SearchResults FileProcessor::processSearchResults(
    const QString &archivePath) const {
    QFile in(archivePath);
    if (!in.open(QIODevice::ReadOnly)) {
        qCWarning(bfFiles) << "Cannot open" << archivePath << ":"
                           << in.errorString();
        return {};
    }
    const QByteArray zip = in.readAll();
    in.close();

    qCInfo(bfFiles) << "Unzipping file";
    QByteArray text;
    QString err;
    if (!extractSingleEntry(zip, text, err)) {
        qCWarning(bfFiles) << "Invalid zip file" << archivePath << ":" << err;
        return {};
    }

    const QFileInfo fi(archivePath);
    const QString listing =
        fi.suffix().isEmpty()
            ? archivePath + QStringLiteral(".txt")
            : fi.dir().filePath(fi.completeBaseName());
    QFile outFile(listing);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
        outFile.write(text) != text.size()) {
        qCWarning(bfFiles) << "Cannot write" << listing << ":"
                           << outFile.errorString();
        return {};
    }
    outFile.close();

    qCInfo(bfFiles) << "Parsing file";
    const SearchResults available = parseResultsFile(listing);
    qCInfo(bfFiles) << "Got" << available.size() << "unique options";
    return available;
}

SearchResults FileProcessor::parseResultsFile(const QString &path) const {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(bfFiles) << "Cannot open" << path << ":" << f.errorString();
        return {};
    }
    return parseResults(f.readAll());
}

bool FileProcessor::matchesFileType(const QString &lowerLine) const {
    for (const QString &ext : fileTypes_) {
        if (lowerLine.contains(QLatin1Char('.') + ext))
            return true;
    }
    return false;
}

SearchResults FileProcessor::parseResults(const QByteArray &text) const {
    SearchResults available;
    // Invalid UTF-8 becomes U+FFFD
    const QString all = QString::fromUtf8(text);
    const QStringList lines = all.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        if (!line.startsWith(QLatin1Char('!')))
            continue;
        if (!matchesFileType(line.toLower()))
            continue;
        QString user, filename;
        if (!parseResultLine(line, user, filename)) {
            qCDebug(bfFiles) << "Failed to parse line:" << line.trimmed();
            continue;
        }
        available[filename].insert(user);
    }
    return available;
}

bool FileProcessor::parseResultLine(const QString &line, QString &user,
                                    QString &filename) {
    const int space = static_cast<int>(line.indexOf(QLatin1Char(' ')));
    if (space < 0)
        return false;
    int end = static_cast<int>(line.indexOf(QLatin1String("::"), space));
    if (end < 0) {
        end = static_cast<int>(line.indexOf(QLatin1Char('\r'), space));
        if (end < 0)
            end = static_cast<int>(line.size());
    }
    user = line.left(space).remove(QLatin1Char('!')).trimmed();
    filename = line.mid(space, end - space).trimmed();
    return !user.isEmpty() && !filename.isEmpty();
}
