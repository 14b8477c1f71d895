#include "CatalogStore.hpp"
#include "../common/Logger.hpp"
#include "../security/InfoHashValidator.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

namespace Swarmcast {

std::optional<ProbedCodecs> CatalogEntry::codecsFor(int fileIndex) const {
    for (const CatalogFile& file : files) {
        if (file.index == fileIndex) {
            return file.codecs;
        }
    }
    return std::nullopt;
}

Expected<int, CatalogError> JsonCatalogStore::loadFile(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        SWARMCAST_WARN("Catalog file {} does not exist", path.toStdString());
        return makeUnexpected(CatalogError::FileNotFound);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        SWARMCAST_ERROR("Cannot read catalog {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(CatalogError::ReadFailed);
    }
    return loadJson(file.readAll());
}

Expected<int, CatalogError> JsonCatalogStore::loadJson(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        SWARMCAST_ERROR("Catalog JSON parse error at {}: {}", parseError.offset,
                        parseError.errorString().toStdString());
        return makeUnexpected(CatalogError::ParseError);
    }
    if (!document.isObject() || !document.object().value("torrents").isArray()) {
        return makeUnexpected(CatalogError::InvalidFormat);
    }

    QHash<QString, CatalogEntry> entries;
    const QJsonArray torrents = document.object().value("torrents").toArray();
    for (const QJsonValue& value : torrents) {
        const QJsonObject object = value.toObject();
        const QString infoHash = InfoHashValidator::normalize(object.value("infoHash").toString());
        if (infoHash.isEmpty()) {
            SWARMCAST_WARN("Skipping catalog entry with invalid info hash");
            continue;
        }

        CatalogEntry entry;
        entry.infoHash = infoHash;
        entry.displayName = object.value("name").toString();
        entry.posterUrl = object.value("poster").toString();

        const QJsonArray files = object.value("files").toArray();
        for (const QJsonValue& fileValue : files) {
            const QJsonObject fileObject = fileValue.toObject();
            CatalogFile file;
            file.index = fileObject.value("index").toInt(-1);
            file.name = fileObject.value("name").toString();
            file.length = static_cast<qint64>(fileObject.value("length").toDouble());
            const QString video = fileObject.value("videoCodec").toString();
            const QString audio = fileObject.value("audioCodec").toString();
            if (!video.isEmpty() || !audio.isEmpty()) {
                file.codecs = ProbedCodecs{video, audio, fileObject.value("container").toString()};
            }
            if (file.index >= 0) {
                entry.files.append(file);
            }
        }
        entries.insert(infoHash, entry);
    }

    QWriteLocker locker(&lock_);
    entries_ = entries;
    SWARMCAST_INFO("Catalog loaded with {} entries", entries_.size());
    return static_cast<int>(entries_.size());
}

std::optional<CatalogEntry> JsonCatalogStore::lookup(const QString& infoHash) const {
    QReadLocker locker(&lock_);
    auto it = entries_.constFind(infoHash.toLower());
    if (it == entries_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int JsonCatalogStore::size() const {
    QReadLocker locker(&lock_);
    return entries_.size();
}

QString catalogErrorString(CatalogError error) {
    switch (error) {
        case CatalogError::FileNotFound:  return QStringLiteral("Catalog file not found");
        case CatalogError::ReadFailed:    return QStringLiteral("Catalog file could not be read");
        case CatalogError::ParseError:    return QStringLiteral("Catalog is not valid JSON");
        case CatalogError::InvalidFormat: return QStringLiteral("Catalog has no torrents array");
    }
    return QStringLiteral("Unknown catalog error");
}

} // namespace Swarmcast
