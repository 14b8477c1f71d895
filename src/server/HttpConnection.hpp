#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QTimer>
#include <QtCore/QWaitCondition>
#include <QtNetwork/QTcpSocket>
#include <functional>

#include "HttpMessage.hpp"

namespace Swarmcast {

/**
 * @brief One client connection, one request
 *
 * Lives on the server thread with its socket. After requestReceived() the
 * handler runs on a worker and talks to the connection through the
 * thread-safe write()/finish() pair; writes are queued to the socket's thread
 * and write() blocks while more than the write budget is unsent.
 *
 * The object deletes itself once the socket has closed and the handler has
 * called finish(), so a handler may use it until then.
 */
class HttpConnection : public QObject {
    Q_OBJECT

public:
    HttpConnection(QTcpSocket* socket, qint64 writeBudgetBytes, int headerTimeoutMs, QObject* parent = nullptr);
    ~HttpConnection() override;

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    /**
     * @brief Queues bytes for the client, waiting for room in the write budget
     * @return false once the client is gone
     */
    bool write(const QByteArray& data);

    /// Flushes and closes; the handler must not touch the connection afterwards
    void finish();

    /// Closes without flushing
    void abort();

    bool isOpen() const;

    /**
     * @brief Called on the socket's thread when the client disconnects
     *
     * Runs immediately if the client is already gone.
     */
    void setDisconnectHandler(std::function<void()> handler);

    QString peerAddress() const { return peerAddress_; }

signals:
    void requestReceived(Swarmcast::HttpConnection* connection, const Swarmcast::HttpRequest& request);
    void badRequest(Swarmcast::HttpConnection* connection, int status);

private slots:
    void onReadyRead();
    void onBytesWritten(qint64 bytes);
    void onDisconnected();
    void onHeaderTimeout();

private:
    void writeQueued(const QByteArray& data);
    void finishQueued();
    void markClosed();
    void maybeDelete();

    QTcpSocket* socket_;
    QTimer* headerTimer_;
    QByteArray buffer_;
    QString peerAddress_;
    bool requestSeen_ = false;
    bool handlerDone_ = false;
    bool socketClosed_ = false;

    const qint64 writeBudgetBytes_;
    mutable QMutex mutex_;
    QWaitCondition drained_;
    qint64 unsentBytes_ = 0;
    bool closed_ = false;
    std::function<void()> disconnectHandler_;
};

} // namespace Swarmcast
