#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../common/Expected.hpp"
#include "../common/StreamError.hpp"

namespace Swarmcast {

/**
 * @brief Parsed BEP 9 magnet link
 *
 * Only v1 (btih) links are accepted. The info hash is always stored in
 * canonical 40-character lowercase hex form.
 */
struct MagnetUri {
    QString infoHash;
    QString displayName;
    QStringList trackers;
    QStringList webSeeds;
    QStringList keywords;
    qint64 exactLength = -1;

    /**
     * @brief Parses a magnet URI
     * @return The parsed link, or InvalidIdentifier
     */
    static Expected<MagnetUri, StreamError> parse(const QString& uri);

    /**
     * @brief Accepts either a magnet URI or a bare hex/base32 info hash
     */
    static Expected<MagnetUri, StreamError> fromIdentifier(const QString& identifier);

    /// Canonical magnet text with duplicate trackers removed
    QString toString() const;

    /// Copy with @p preferred trackers first and original trackers after, de-duplicated
    MagnetUri withTrackers(const QStringList& preferred) const;

    /// Display name, falling back to a name derived from the hash
    QString displayNameOr(const QString& torrentName = QString()) const;

    static constexpr int MAX_URI_LENGTH = 8192;
};

} // namespace Swarmcast
