#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QPair>
#include <QtCore/QString>
#include <QtCore/QUrlQuery>

namespace Swarmcast {

struct HttpRequest {
    QByteArray method;
    QString path;
    QUrlQuery query;
    QByteArray version;
    QHash<QByteArray, QByteArray> headers;   // names lowercased
    QString peerAddress;

    QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    QString queryValue(const QString& key) const {
        return query.queryItemValue(key, QUrl::FullyDecoded);
    }

    enum class ParseResult {
        Complete,
        Incomplete,
        Invalid,
        TooLarge
    };

    /**
     * @brief Parses a request head from the start of @p buffer
     *
     * Bodies are not supported; anything after the blank line is ignored.
     */
    static ParseResult parse(const QByteArray& buffer, HttpRequest& request);

    static constexpr int MAX_HEAD_BYTES = 16 * 1024;
};

/**
 * @brief Response status line and headers, serialized once before the body
 */
class HttpResponseHead {
public:
    explicit HttpResponseHead(int status = 200);

    HttpResponseHead& setHeader(const QByteArray& name, const QByteArray& value);
    HttpResponseHead& setHeader(const QByteArray& name, const QString& value);
    HttpResponseHead& setContentLength(qint64 length);

    int status() const { return status_; }
    bool hasHeader(const QByteArray& name) const;
    QByteArray header(const QByteArray& name) const;

    QByteArray serialize() const;

    static QByteArray reasonPhrase(int status);

private:
    int status_;
    QList<QPair<QByteArray, QByteArray>> headers_;
};

/// Frames one chunk for Transfer-Encoding: chunked
QByteArray encodeChunk(const QByteArray& data);

/// Terminating zero-length chunk
QByteArray lastChunk();

} // namespace Swarmcast
