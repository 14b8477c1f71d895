#include "HttpConnection.hpp"
#include "../core/common/Logger.hpp"

#include <QtCore/QThread>
#include <QtNetwork/QHostAddress>

#include <algorithm>

namespace Swarmcast {

HttpConnection::HttpConnection(QTcpSocket* socket, qint64 writeBudgetBytes, int headerTimeoutMs, QObject* parent)
    : QObject(parent)
    , socket_(socket)
    , headerTimer_(new QTimer(this))
    , writeBudgetBytes_(writeBudgetBytes) {
    socket_->setParent(this);
    peerAddress_ = socket_->peerAddress().toString();

    headerTimer_->setSingleShot(true);
    headerTimer_->setInterval(headerTimeoutMs);
    connect(headerTimer_, &QTimer::timeout, this, &HttpConnection::onHeaderTimeout);
    headerTimer_->start();

    connect(socket_, &QTcpSocket::readyRead, this, &HttpConnection::onReadyRead);
    connect(socket_, &QTcpSocket::bytesWritten, this, &HttpConnection::onBytesWritten);
    connect(socket_, &QTcpSocket::disconnected, this, &HttpConnection::onDisconnected);
    connect(socket_, &QTcpSocket::errorOccurred, this, [this](QAbstractSocket::SocketError error) {
        if (error != QAbstractSocket::RemoteHostClosedError) {
            SWARMCAST_DEBUG("Socket error from {}: {}", peerAddress_.toStdString(),
                            socket_->errorString().toStdString());
        }
    });
}

HttpConnection::~HttpConnection() {
    markClosed();
}

void HttpConnection::onReadyRead() {
    if (requestSeen_) {
        socket_->readAll();
        return;
    }

    buffer_ += socket_->readAll();
    HttpRequest request;
    switch (HttpRequest::parse(buffer_, request)) {
        case HttpRequest::ParseResult::Incomplete:
            return;
        case HttpRequest::ParseResult::Invalid:
            requestSeen_ = true;
            headerTimer_->stop();
            emit badRequest(this, 400);
            return;
        case HttpRequest::ParseResult::TooLarge:
            requestSeen_ = true;
            headerTimer_->stop();
            emit badRequest(this, 431);
            return;
        case HttpRequest::ParseResult::Complete:
            break;
    }

    requestSeen_ = true;
    headerTimer_->stop();
    buffer_.clear();
    request.peerAddress = peerAddress_;
    emit requestReceived(this, request);
}

bool HttpConnection::write(const QByteArray& data) {
    if (data.isEmpty()) {
        return isOpen();
    }
    {
        QMutexLocker locker(&mutex_);
        const bool onSocketThread = QThread::currentThread() == thread();
        while (!closed_ && !onSocketThread && unsentBytes_ > 0
               && unsentBytes_ + data.size() > writeBudgetBytes_) {
            drained_.wait(&mutex_);
        }
        if (closed_) {
            return false;
        }
        unsentBytes_ += data.size();
    }
    QMetaObject::invokeMethod(this, [this, data]() { writeQueued(data); }, Qt::QueuedConnection);
    return true;
}

void HttpConnection::writeQueued(const QByteArray& data) {
    if (socket_->state() != QAbstractSocket::ConnectedState) {
        return;
    }
    if (socket_->write(data) < 0) {
        SWARMCAST_DEBUG("Write to {} failed: {}", peerAddress_.toStdString(),
                        socket_->errorString().toStdString());
        socket_->abort();
    }
}

void HttpConnection::onBytesWritten(qint64 bytes) {
    QMutexLocker locker(&mutex_);
    unsentBytes_ = std::max<qint64>(0, unsentBytes_ - bytes);
    drained_.wakeAll();
}

void HttpConnection::finish() {
    QMetaObject::invokeMethod(this, [this]() { finishQueued(); }, Qt::QueuedConnection);
}

void HttpConnection::abort() {
    auto abortSocket = [this]() {
        if (socket_->state() != QAbstractSocket::UnconnectedState) {
            socket_->abort();
        }
    };
    if (QThread::currentThread() == thread()) {
        abortSocket();
    } else {
        QMetaObject::invokeMethod(this, abortSocket, Qt::QueuedConnection);
    }
}

void HttpConnection::finishQueued() {
    handlerDone_ = true;
    if (socket_->state() == QAbstractSocket::UnconnectedState) {
        socketClosed_ = true;
        maybeDelete();
        return;
    }
    socket_->disconnectFromHost();
}

bool HttpConnection::isOpen() const {
    QMutexLocker locker(&mutex_);
    return !closed_;
}

void HttpConnection::setDisconnectHandler(std::function<void()> handler) {
    {
        QMutexLocker locker(&mutex_);
        if (!closed_) {
            disconnectHandler_ = std::move(handler);
            return;
        }
    }
    if (handler) {
        handler();
    }
}

void HttpConnection::markClosed() {
    std::function<void()> handler;
    {
        QMutexLocker locker(&mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        handler = std::move(disconnectHandler_);
        disconnectHandler_ = nullptr;
        drained_.wakeAll();
    }
    if (handler) {
        handler();
    }
}

void HttpConnection::onDisconnected() {
    markClosed();
    socketClosed_ = true;
    maybeDelete();
}

void HttpConnection::onHeaderTimeout() {
    if (!requestSeen_) {
        SWARMCAST_DEBUG("No request head from {} in time, closing", peerAddress_.toStdString());
        socket_->abort();
    }
}

void HttpConnection::maybeDelete() {
    if (socketClosed_ && (handlerDone_ || !requestSeen_)) {
        deleteLater();
    }
}

} // namespace Swarmcast
