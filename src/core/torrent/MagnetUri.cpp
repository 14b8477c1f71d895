#include "MagnetUri.hpp"
#include "../common/Logger.hpp"
#include "../security/InfoHashValidator.hpp"

#include <QtCore/QRegularExpression>
#include <QtCore/QSet>
#include <QtCore/QUrl>

namespace Swarmcast {

namespace {

QString decodeComponent(QString value) {
    value.replace(QLatin1Char('+'), QLatin1Char(' '));
    return QUrl::fromPercentEncoding(value.toUtf8());
}

QString encodeComponent(const QString& value) {
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

// "tr.1" and "tr" are the same key
QString baseKey(const QString& key) {
    const int dot = key.indexOf(QLatin1Char('.'));
    return dot > 0 ? key.left(dot) : key;
}

void appendUnique(QStringList& out, QSet<QString>& seen, const QString& tracker) {
    const QString folded = tracker.trimmed().toLower();
    if (folded.isEmpty() || seen.contains(folded)) {
        return;
    }
    seen.insert(folded);
    out.append(tracker.trimmed());
}

} // namespace

Expected<MagnetUri, StreamError> MagnetUri::parse(const QString& uri) {
    const QString trimmed = uri.trimmed();
    if (trimmed.isEmpty() || trimmed.length() > MAX_URI_LENGTH) {
        return makeUnexpected(StreamError::InvalidIdentifier);
    }

    const QString withoutFragment = trimmed.section(QLatin1Char('#'), 0, 0);
    if (!withoutFragment.startsWith(QLatin1String("magnet:"), Qt::CaseInsensitive)) {
        return makeUnexpected(StreamError::InvalidIdentifier);
    }

    const int queryStart = withoutFragment.indexOf(QLatin1Char('?'));
    if (queryStart < 0) {
        return makeUnexpected(StreamError::InvalidIdentifier);
    }

    MagnetUri magnet;
    QString exactTopic;

    const QStringList pairs = withoutFragment.mid(queryStart + 1).split(QLatin1Char('&'), Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        const int eq = pair.indexOf(QLatin1Char('='));
        const QString key = baseKey(eq < 0 ? pair : pair.left(eq)).toLower();
        const QString value = eq < 0 ? QString() : decodeComponent(pair.mid(eq + 1));

        if (key == QLatin1String("xt")) {
            // First btih topic wins; other topic kinds are ignored
            if (exactTopic.isEmpty() && value.startsWith(QLatin1String("urn:btih:"), Qt::CaseInsensitive)) {
                exactTopic = value.mid(9);
            }
        } else if (key == QLatin1String("dn")) {
            if (magnet.displayName.isEmpty()) {
                magnet.displayName = value;
            }
        } else if (key == QLatin1String("tr")) {
            if (!value.isEmpty()) {
                magnet.trackers.append(value);
            }
        } else if (key == QLatin1String("ws")) {
            if (!value.isEmpty()) {
                magnet.webSeeds.append(value);
            }
        } else if (key == QLatin1String("xl")) {
            bool ok = false;
            const qint64 length = value.toLongLong(&ok);
            if (ok && length >= 0) {
                magnet.exactLength = length;
            }
        } else if (key == QLatin1String("kt")) {
            magnet.keywords = value.split(QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts);
        }
    }

    if (exactTopic.isEmpty()) {
        SWARMCAST_DEBUG("Magnet URI rejected: missing urn:btih topic");
        return makeUnexpected(StreamError::InvalidIdentifier);
    }

    magnet.infoHash = InfoHashValidator::normalize(exactTopic);
    if (magnet.infoHash.isEmpty()) {
        SWARMCAST_DEBUG("Magnet URI rejected: bad info hash '{}'", exactTopic.toStdString());
        return makeUnexpected(StreamError::InvalidIdentifier);
    }

    return magnet;
}

Expected<MagnetUri, StreamError> MagnetUri::fromIdentifier(const QString& identifier) {
    const QString trimmed = identifier.trimmed();
    if (trimmed.startsWith(QLatin1String("magnet:"), Qt::CaseInsensitive)) {
        return parse(trimmed);
    }

    MagnetUri magnet;
    magnet.infoHash = InfoHashValidator::normalize(trimmed);
    if (magnet.infoHash.isEmpty()) {
        return makeUnexpected(StreamError::InvalidIdentifier);
    }
    return magnet;
}

QString MagnetUri::toString() const {
    QStringList parts;
    parts << QStringLiteral("xt=urn:btih:%1").arg(infoHash);

    if (!displayName.isEmpty()) {
        parts << QStringLiteral("dn=%1").arg(encodeComponent(displayName).replace(QLatin1String("%20"), QLatin1String("+")));
    }
    if (exactLength >= 0) {
        parts << QStringLiteral("xl=%1").arg(exactLength);
    }

    QStringList uniqueTrackers;
    QSet<QString> seen;
    for (const QString& tracker : trackers) {
        appendUnique(uniqueTrackers, seen, tracker);
    }
    for (const QString& tracker : uniqueTrackers) {
        parts << QStringLiteral("tr=%1").arg(encodeComponent(tracker));
    }
    for (const QString& seed : webSeeds) {
        parts << QStringLiteral("ws=%1").arg(encodeComponent(seed));
    }
    if (!keywords.isEmpty()) {
        parts << QStringLiteral("kt=%1").arg(encodeComponent(keywords.join(QLatin1Char(' '))));
    }

    return QStringLiteral("magnet:?") + parts.join(QLatin1Char('&'));
}

MagnetUri MagnetUri::withTrackers(const QStringList& preferred) const {
    MagnetUri enhanced = *this;
    enhanced.trackers.clear();

    QSet<QString> seen;
    for (const QString& tracker : preferred) {
        appendUnique(enhanced.trackers, seen, tracker);
    }
    for (const QString& tracker : trackers) {
        appendUnique(enhanced.trackers, seen, tracker);
    }
    return enhanced;
}

QString MagnetUri::displayNameOr(const QString& torrentName) const {
    if (!torrentName.isEmpty()) {
        return torrentName;
    }
    if (!displayName.isEmpty()) {
        return displayName;
    }
    return QStringLiteral("Torrent %1").arg(infoHash.left(8));
}

} // namespace Swarmcast
