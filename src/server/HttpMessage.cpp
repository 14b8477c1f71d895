#include "HttpMessage.hpp"

#include <QtCore/QUrl>

namespace Swarmcast {

HttpRequest::ParseResult HttpRequest::parse(const QByteArray& buffer, HttpRequest& request) {
    const int headEnd = buffer.indexOf("\r\n\r\n");
    if (headEnd < 0) {
        return buffer.size() > MAX_HEAD_BYTES ? ParseResult::TooLarge : ParseResult::Incomplete;
    }
    if (headEnd > MAX_HEAD_BYTES) {
        return ParseResult::TooLarge;
    }

    const QList<QByteArray> lines = buffer.left(headEnd).split('\n');
    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() != 3 || requestLine.at(0).isEmpty()
        || !requestLine.at(2).startsWith("HTTP/1.")) {
        return ParseResult::Invalid;
    }

    request.method = requestLine.at(0).toUpper();
    request.version = requestLine.at(2);

    const QUrl url(QString::fromLatin1(requestLine.at(1)), QUrl::TolerantMode);
    if (!url.isValid() || !requestLine.at(1).startsWith('/')) {
        return ParseResult::Invalid;
    }
    request.path = url.path();
    request.query = QUrlQuery(url);

    request.headers.clear();
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            return ParseResult::Invalid;
        }
        const QByteArray name = line.left(colon).trimmed().toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        if (request.headers.contains(name)) {
            request.headers[name] += ", " + value;
        } else {
            request.headers.insert(name, value);
        }
    }
    return ParseResult::Complete;
}

HttpResponseHead::HttpResponseHead(int status)
    : status_(status) {
}

HttpResponseHead& HttpResponseHead::setHeader(const QByteArray& name, const QByteArray& value) {
    for (auto& header : headers_) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            header.second = value;
            return *this;
        }
    }
    headers_.append(qMakePair(name, value));
    return *this;
}

HttpResponseHead& HttpResponseHead::setHeader(const QByteArray& name, const QString& value) {
    return setHeader(name, value.toUtf8());
}

HttpResponseHead& HttpResponseHead::setContentLength(qint64 length) {
    return setHeader("Content-Length", QByteArray::number(length));
}

bool HttpResponseHead::hasHeader(const QByteArray& name) const {
    for (const auto& header : headers_) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

QByteArray HttpResponseHead::header(const QByteArray& name) const {
    for (const auto& header : headers_) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
            return header.second;
        }
    }
    return QByteArray();
}

QByteArray HttpResponseHead::serialize() const {
    QByteArray head;
    head.reserve(512);
    head += "HTTP/1.1 " + QByteArray::number(status_) + ' ' + reasonPhrase(status_) + "\r\n";
    for (const auto& header : headers_) {
        head += header.first + ": " + header.second + "\r\n";
    }
    head += "\r\n";
    return head;
}

QByteArray HttpResponseHead::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 499: return "Client Closed Request";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "Unknown";
    }
}

QByteArray encodeChunk(const QByteArray& data) {
    QByteArray chunk;
    chunk.reserve(data.size() + 16);
    chunk += QByteArray::number(static_cast<qint64>(data.size()), 16) + "\r\n";
    chunk += data;
    chunk += "\r\n";
    return chunk;
}

QByteArray lastChunk() {
    return QByteArrayLiteral("0\r\n\r\n");
}

} // namespace Swarmcast
