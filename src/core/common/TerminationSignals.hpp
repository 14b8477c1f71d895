#pragma once

#include <QtCore/QList>
#include <QtCore/QObject>

class QSocketNotifier;

namespace Swarmcast {

/**
 * @brief Turns POSIX signals into a Qt signal on the owner's thread
 *
 * The handler only writes the signal number to a socket pair; the event loop
 * reads it back and emits received(). One instance per process.
 */
class TerminationSignals : public QObject {
    Q_OBJECT

public:
    explicit TerminationSignals(QObject* parent = nullptr);
    ~TerminationSignals() override;

    TerminationSignals(const TerminationSignals&) = delete;
    TerminationSignals& operator=(const TerminationSignals&) = delete;

    /// Routes @p signalNumbers through received(); false if any could not be installed
    bool install(const QList<int>& signalNumbers);

signals:
    void received(int signalNumber);

private slots:
    void onReadable();

private:
    QSocketNotifier* notifier_ = nullptr;
    QList<int> installed_;
};

} // namespace Swarmcast
