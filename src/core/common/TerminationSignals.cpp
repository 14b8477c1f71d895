#include "TerminationSignals.hpp"
#include "Logger.hpp"

#include <QtCore/QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

namespace Swarmcast {

namespace {

// [0] is written from the handler, [1] is watched by the event loop
int signalFds[2] = {-1, -1};

void forwardSignal(int signalNumber) {
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signalNumber);
    const ssize_t written = ::write(signalFds[0], &byte, sizeof(byte));
    Q_UNUSED(written);
    errno = savedErrno;
}

} // namespace

TerminationSignals::TerminationSignals(QObject* parent)
    : QObject(parent) {
}

TerminationSignals::~TerminationSignals() {
    for (int signalNumber : installed_) {
        std::signal(signalNumber, SIG_DFL);
    }
    if (notifier_) {
        notifier_->setEnabled(false);
        ::close(signalFds[0]);
        ::close(signalFds[1]);
        signalFds[0] = signalFds[1] = -1;
    }
}

bool TerminationSignals::install(const QList<int>& signalNumbers) {
    if (!notifier_) {
        if (signalFds[0] != -1) {
            SWARMCAST_ERROR("Signal forwarding is already owned by another instance");
            return false;
        }
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signalFds) != 0) {
            SWARMCAST_ERROR("socketpair failed: {}", std::strerror(errno));
            return false;
        }
        notifier_ = new QSocketNotifier(signalFds[1], QSocketNotifier::Read, this);
        connect(notifier_, &QSocketNotifier::activated, this, &TerminationSignals::onReadable);
    }

    bool ok = true;
    for (int signalNumber : signalNumbers) {
        struct sigaction action = {};
        action.sa_handler = forwardSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (::sigaction(signalNumber, &action, nullptr) != 0) {
            SWARMCAST_ERROR("Cannot handle signal {}: {}", signalNumber, std::strerror(errno));
            ok = false;
            continue;
        }
        installed_.append(signalNumber);
    }
    return ok;
}

void TerminationSignals::onReadable() {
    unsigned char byte = 0;
    if (::read(signalFds[1], &byte, sizeof(byte)) != sizeof(byte)) {
        return;
    }
    SWARMCAST_INFO("Signal {} received", static_cast<int>(byte));
    emit received(static_cast<int>(byte));
}

} // namespace Swarmcast
