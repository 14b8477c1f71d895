#include "InfoHashValidator.hpp"
#include <QtCore/QCryptographicHash>
#include <QtCore/QRandomGenerator>

namespace Swarmcast {

const QRegularExpression InfoHashValidator::HASH_PATTERN(R"(^[a-fA-F0-9]{40}$)");
const QRegularExpression InfoHashValidator::BASE32_PATTERN(R"(^[A-Za-z2-7]{32}$)");

bool InfoHashValidator::isValid(const QString& infoHash) {
    if (infoHash.length() != HASH_LENGTH) {
        return false;
    }
    return HASH_PATTERN.match(infoHash).hasMatch();
}

bool InfoHashValidator::isValidBase32(const QString& infoHash) {
    if (infoHash.length() != BASE32_LENGTH) {
        return false;
    }
    return BASE32_PATTERN.match(infoHash).hasMatch();
}

QString InfoHashValidator::normalize(const QString& infoHash) {
    const QString trimmed = infoHash.trimmed();
    if (isValid(trimmed)) {
        return trimmed.toLower();
    }
    if (isValidBase32(trimmed)) {
        return fromBase32(trimmed);
    }
    return QString();
}

QString InfoHashValidator::fromBase32(const QString& base32) {
    static const QString alphabet = QStringLiteral("ABCDEFGHIJKLMNOPQRSTUVWXYZ234567");

    QByteArray bytes;
    quint32 buffer = 0;
    int bits = 0;

    for (const QChar ch : base32.toUpper()) {
        if (ch == QLatin1Char('=')) {
            break;
        }
        const int index = alphabet.indexOf(ch);
        if (index < 0) {
            return QString();
        }
        buffer = (buffer << 5) | static_cast<quint32>(index);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            bytes.append(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    return QString::fromLatin1(bytes.toHex());
}

QString InfoHashValidator::generateTestHash(int seed) {
    if (seed == 0) {
        seed = QRandomGenerator::global()->bounded(1000000);
    }

    const QString input = QString("swarmcast_test_hash_%1").arg(seed);
    const QByteArray hash = QCryptographicHash::hash(input.toUtf8(), QCryptographicHash::Sha1);
    return QString::fromLatin1(hash.toHex());
}

} // namespace Swarmcast
