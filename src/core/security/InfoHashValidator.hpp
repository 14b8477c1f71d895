#pragma once

#include <QtCore/QString>
#include <QtCore/QRegularExpression>

namespace Swarmcast {

/**
 * @brief Validation and normalization of BitTorrent v1 info hashes
 *
 * Canonical form is 40 lowercase hexadecimal characters. Magnet links may
 * also carry the 32-character base32 encoding, which is converted here.
 */
class InfoHashValidator {
public:
    /**
     * @brief Checks for exactly 40 hexadecimal characters
     */
    static bool isValid(const QString& infoHash);

    /**
     * @brief Checks for exactly 32 base32 characters (RFC 4648 alphabet)
     */
    static bool isValidBase32(const QString& infoHash);

    /**
     * @brief Validates and normalizes a hex or base32 hash to lowercase hex
     * @return Normalized hash if valid, empty string if invalid
     */
    static QString normalize(const QString& infoHash);

    /**
     * @brief Converts a 32-character base32 hash to 40 hex characters
     * @return Hex string, empty if the input has invalid characters
     */
    static QString fromBase32(const QString& base32);

    /**
     * @brief Deterministic hash for tests
     */
    static QString generateTestHash(int seed = 0);

private:
    static const QRegularExpression HASH_PATTERN;
    static const QRegularExpression BASE32_PATTERN;

    static constexpr int HASH_LENGTH = 40;
    static constexpr int BASE32_LENGTH = 32;
};

} // namespace Swarmcast
