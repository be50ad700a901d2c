// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/reader_monitor.h"
#include "smartcard-qt/backends/service_backend.h"
#include <QDebug>
#include <QMutexLocker>
#include <chrono>

namespace Smartcard {

namespace {

bool isDead(const ReaderState& state)
{
    const ReaderStates event = state.eventState();
    return event.testFlag(ReaderStateFlag::Unknown) || event.testFlag(ReaderStateFlag::Ignore);
}

} // anonymous namespace

ReaderMonitor::ReaderMonitor(QObject* parent)
    : ReaderMonitor(nullptr, parent)
{
}

ReaderMonitor::ReaderMonitor(std::shared_ptr<ServiceBackend> backend, QObject* parent)
    : QObject(parent)
    , m_backend(backend ? std::move(backend) : createDefaultBackend())
    , m_monitorThread(nullptr)
    , m_stopMonitor(0)
    , m_scope(Scope::User)
    , m_pollTimeoutMs(500)
{
}

ReaderMonitor::~ReaderMonitor()
{
    stop();
}

bool ReaderMonitor::start()
{
    if (m_monitorThread && m_monitorThread->isRunning()) {
        qDebug() << "ReaderMonitor: Monitor already running";
        return true;
    }

    // The previous loop ended on an error
    stop();

    auto established = Context::establish(m_scope, m_backend);
    if (!established) {
        const QString msg = QString("Failed to establish context: %1").arg(established.errorMessage());
        qWarning() << "ReaderMonitor:" << msg;
        emit error(msg);
        return false;
    }
    m_context = established.takeValue();

    m_stopMonitor = 0;
    m_monitorThread = QThread::create([this]() {
        monitorLoop();
    });
    m_monitorThread->start();

    qDebug() << "ReaderMonitor: Monitor thread started";
    return true;
}

void ReaderMonitor::stop()
{
    if (!m_monitorThread) {
        return;
    }

    qDebug() << "ReaderMonitor: Stopping monitor";

    m_stopMonitor = 1;

    // A cancel is not remembered when nothing is blocked yet, so repeat it
    // until the thread has seen the stop flag
    while (!m_monitorThread->wait(50)) {
        auto cancelled = m_context->cancel();
        if (!cancelled) {
            qWarning() << "ReaderMonitor: Cancel failed:" << errorName(cancelled.error());
        }
    }

    delete m_monitorThread;
    m_monitorThread = nullptr;

    auto released = m_context->release();
    if (!released) {
        qWarning() << "ReaderMonitor: Failed to release context:" << errorName(released.error());
    }
    m_context.reset();

    setTrackedReaders({});
    qDebug() << "ReaderMonitor: Monitor thread stopped";
}

bool ReaderMonitor::isRunning() const
{
    return m_monitorThread && m_monitorThread->isRunning();
}

QStringList ReaderMonitor::readers() const
{
    QMutexLocker locker(&m_readersMutex);
    return m_readers;
}

void ReaderMonitor::setTrackedReaders(const QList<ReaderState>& states)
{
    QStringList names;
    for (qsizetype i = 1; i < states.size(); ++i) {
        names.append(QString::fromUtf8(states[i].name()));
    }

    QMutexLocker locker(&m_readersMutex);
    m_readers = names;
}

void ReaderMonitor::monitorLoop()
{
    qDebug() << "ReaderMonitor: Monitor loop started";

    // Entry 0 listens for reader insertions and removals
    QList<ReaderState> states{ReaderState(pnpNotification(), ReaderStateFlag::Unaware)};

    while (m_stopMonitor.loadAcquire() == 0) {
        // Remove dead readers
        for (qsizetype i = states.size() - 1; i >= 1; --i) {
            if (isDead(states[i])) {
                const QString name = QString::fromUtf8(states[i].name());
                qDebug() << "ReaderMonitor: Removing reader" << name;
                states.removeAt(i);
                emit readerRemoved(name);
            }
        }

        // Add new readers
        auto names = m_context->listReadersOwned();
        if (!names) {
            const QString msg = QString("Failed to list readers: %1").arg(names.errorMessage());
            qWarning() << "ReaderMonitor:" << msg;
            emit error(msg);
            break;
        }
        for (const QByteArray& name : names.value()) {
            bool known = false;
            for (qsizetype i = 1; i < states.size(); ++i) {
                if (states[i].name() == name) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                qDebug() << "ReaderMonitor: Adding reader" << name;
                states.append(ReaderState(name, ReaderStateFlag::Unaware));
                emit readerAdded(QString::fromUtf8(name));
            }
        }
        setTrackedReaders(states);

        // Update the view of the state to wait on
        for (ReaderState& state : states) {
            state.syncCurrentState();
        }

        auto changed = m_context->getStatusChange(
            std::chrono::milliseconds(m_pollTimeoutMs.loadAcquire()), states);
        if (changed.error() == Error::Timeout) {
            continue;
        }
        if (changed.error() == Error::Cancelled) {
            // Either stop() or a cancel from another holder of the session
            continue;
        }
        if (!changed) {
            const QString msg = QString("GetStatusChange failed: %1").arg(changed.errorMessage());
            qWarning() << "ReaderMonitor:" << msg;
            emit error(msg);
            break;
        }

        // Report card transitions; the current state still holds the
        // state seen before this wait
        for (qsizetype i = 1; i < states.size(); ++i) {
            const ReaderState& state = states[i];
            const QString name = QString::fromUtf8(state.name());
            const bool wasPresent = state.currentState().testFlag(ReaderStateFlag::Present);
            const bool isPresent = state.eventState().testFlag(ReaderStateFlag::Present);
            const uint32_t previousCount = (state.rawCurrentState() & EVENT_COUNT_MASK) >> 16;
            // Removed and reinserted between two waits
            const bool swapped = wasPresent && isPresent && previousCount != state.eventCount();

            if (wasPresent && (!isPresent || swapped)) {
                qDebug() << "ReaderMonitor: Card removed from" << name;
                emit cardRemoved(name);
            }
            if (isPresent && (!wasPresent || swapped)) {
                qDebug() << "ReaderMonitor: Card inserted in" << name << "ATR:" << state.atr().toByteArray().toHex();
                emit cardInserted(name, state.atr().toByteArray());
            }
        }
    }

    qDebug() << "ReaderMonitor: Monitor loop stopped";
}

} // namespace Smartcard
