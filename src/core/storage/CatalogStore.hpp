#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <optional>

#include "../common/Expected.hpp"
#include "../media/CodecClassifier.hpp"

namespace Swarmcast {

enum class CatalogError {
    FileNotFound,
    ReadFailed,
    ParseError,
    InvalidFormat
};

struct CatalogFile {
    int index = 0;
    QString name;
    qint64 length = 0;
    std::optional<ProbedCodecs> codecs;
};

struct CatalogEntry {
    QString infoHash;
    QString displayName;
    QString posterUrl;
    QList<CatalogFile> files;

    /// Stored codec info for one file, if the catalog has it
    std::optional<ProbedCodecs> codecsFor(int fileIndex) const;
};

/**
 * @brief Read-only view of the torrent catalog
 */
class CatalogStore {
public:
    virtual ~CatalogStore() = default;
    virtual std::optional<CatalogEntry> lookup(const QString& infoHash) const = 0;
};

/**
 * @brief Catalog loaded from a JSON document
 *
 * Expected layout: {"torrents": [{"infoHash", "name", "poster",
 * "files": [{"index", "name", "length", "videoCodec", "audioCodec", "container"}]}]}
 */
class JsonCatalogStore : public CatalogStore {
public:
    JsonCatalogStore() = default;

    /// @return Number of entries loaded
    Expected<int, CatalogError> loadFile(const QString& path);
    Expected<int, CatalogError> loadJson(const QByteArray& json);

    std::optional<CatalogEntry> lookup(const QString& infoHash) const override;
    int size() const;

private:
    mutable QReadWriteLock lock_;
    QHash<QString, CatalogEntry> entries_;
};

QString catalogErrorString(CatalogError error);

} // namespace Swarmcast
