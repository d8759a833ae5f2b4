// Turns a downloaded search-results archive into "filename -> users offering
// it". The bots send a ZIP holding a single text listing.
#pragma once
#include <QByteArray>
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

using SearchResults = QMap<QString, QSet<QString>>;

class FileProcessor {
public:
    static QStringList defaultFileTypes();

    // fileTypes are extensions without the dot; empty means the defaults.
    explicit FileProcessor(QStringList fileTypes = {});

    // Extracts the listing next to the archive (archive path without its last
    // suffix) and parses it. Any failure is logged and yields no results.
    SearchResults processSearchResults(const QString &archivePath) const;

    SearchResults parseResultsFile(const QString &path) const;
    SearchResults parseResults(const QByteArray &text) const;

    // "!user file name.epub ::INFO:: 1.2MB" -> ("user", "file name.epub").
    // Returns false when the line has no filename.
    static bool parseResultLine(const QString &line, QString &user,
                                QString &filename);

    // Contents of the only entry of a ZIP archive (stored or deflated).
    static bool extractSingleEntry(const QByteArray &zip, QByteArray &out,
                                   QString &err);

    const QStringList &fileTypes() const { return fileTypes_; }

private:
    bool matchesFileType(const QString &lowerLine) const;

    QStringList fileTypes_;
};
