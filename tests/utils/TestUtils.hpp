#pragma once

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QFuture>
#include <QtTest/QSignalSpy>
#include <QtConcurrent/QtConcurrent>
#include <functional>

#include "../../src/core/common/Config.hpp"
#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/common/StreamError.hpp"
#include "../../src/core/media/TranscodeSession.hpp"

namespace Swarmcast {
namespace Test {

/**
 * @brief Shared helpers for the swarmcast test suites
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    explicit TestUtils(QObject* parent = nullptr);
    ~TestUtils() override;

    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "swarmcast_test");
    static void cleanupTempDirectory(const QString& path);

    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");

    // Identifiers
    static QString testInfoHash(int seed);
    static QString createTestMagnetLink(const QString& infoHash, const QString& name = "Test Torrent");

    // Settings with short timers so suites finish quickly
    static Config::StreamingSettings fastStreamingSettings();
    static Config::TranscodeSettings fastTranscodeSettings();

    /// Transcoder stand-in running @p script under /bin/sh
    static TranscodeCommandFactory shellCommandFactory(const QString& script);
    static bool isShellAvailable();

    // Async testing utilities; these keep the event loop running
    template<typename T>
    static bool waitForFuture(const QFuture<T>& future, int timeoutMs = 5000);

    static bool waitForSignal(QObject* sender, const char* signal, int timeoutMs = 5000);
    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 10);

    static QByteArray generateRandomData(int size);

    // Thread safety testing
    static void testThreadSafety(std::function<void()> operation, int threadCount = 10, int iterationsPerThread = 100);

    // Test assertions with better error messages
    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void logMessage(const QString& message);

private:
    static QTemporaryDir* tempDir_;
};

template<typename T>
bool TestUtils::waitForFuture(const QFuture<T>& future, int timeoutMs) {
    const bool finished = waitForCondition([future]() { return future.isFinished(); }, timeoutMs);
    if (!finished) {
        logMessage(QString("waitForFuture timeout after %1ms").arg(timeoutMs));
    }
    return finished;
}

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += QString(": %1").arg(errorCode(result.error()));
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error %1 but got value").arg(errorCode(expectedError));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(errorCode(expectedError), errorCode(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))

} // namespace Test
} // namespace Swarmcast
