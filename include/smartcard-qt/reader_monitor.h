// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "context.h"
#include "types.h"
#include <QAtomicInt>
#include <QByteArray>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QThread>
#include <memory>
#include <optional>

namespace Smartcard {

class ServiceBackend;

/**
 * @brief Watches readers and cards on a background thread
 *
 * Owns its own session and runs a getStatusChange() loop on a dedicated
 * thread: the PnP pseudo-reader reports reader insertions, readers that
 * turn UNKNOWN or IGNORE are dropped, and PRESENT transitions on each
 * reader are reported as card insertions and removals.
 *
 * Signals are emitted from the monitor thread; connect with the default
 * (auto) connection type to receive them in the receiver's thread.
 *
 * Usage:
 * @code
 * auto* monitor = new ReaderMonitor(this);
 * connect(monitor, &ReaderMonitor::cardInserted, this, [](const QString& reader, const QByteArray& atr) {
 *     qDebug() << "Card in" << reader << atr.toHex();
 * });
 * monitor->start();
 * @endcode
 */
class ReaderMonitor : public QObject
{
    Q_OBJECT

public:
    explicit ReaderMonitor(QObject* parent = nullptr);

    /**
     * @brief Constructor with dependency injection (for testing)
     * @param backend Service to monitor, nullptr for the platform default
     */
    explicit ReaderMonitor(std::shared_ptr<ServiceBackend> backend, QObject* parent = nullptr);

    ~ReaderMonitor() override;

    /**
     * @brief Scope of the monitoring session, applied on the next start()
     */
    void setScope(Scope scope) { m_scope = scope; }
    Scope scope() const { return m_scope; }

    /**
     * @brief Maximum time a single wait blocks before the loop re-checks
     *        the reader list and the stop flag (default 500 ms)
     *
     * May be changed while running; the next wait picks it up.
     */
    void setPollTimeout(int ms) { m_pollTimeoutMs.storeRelease(ms); }
    int pollTimeout() const { return m_pollTimeoutMs.loadAcquire(); }

    /**
     * @brief Establish the session and start the monitor thread
     * @return false if the session could not be established
     */
    bool start();

    /**
     * @brief Stop the monitor thread and release the session
     *
     * Cancels the blocking wait so the thread exits promptly.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Readers currently tracked by the monitor
     */
    QStringList readers() const;

signals:
    void readerAdded(const QString& reader);
    void readerRemoved(const QString& reader);
    void cardInserted(const QString& reader, const QByteArray& atr);
    void cardRemoved(const QString& reader);
    void error(const QString& message);

private:
    void monitorLoop();
    void setTrackedReaders(const QList<ReaderState>& states);

    std::shared_ptr<ServiceBackend> m_backend;
    std::optional<Context> m_context;
    QThread* m_monitorThread;
    QAtomicInt m_stopMonitor;
    Scope m_scope;
    QAtomicInt m_pollTimeoutMs;

    mutable QMutex m_readersMutex;
    QStringList m_readers;
};

} // namespace Smartcard
