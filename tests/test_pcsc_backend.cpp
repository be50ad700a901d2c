// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include <QFuture>
#include <QtConcurrent/QtConcurrent>
#include "smartcard-qt/context.h"
#include "smartcard-qt/backends/pcsc_service_backend.h"
#include <chrono>
#include <memory>

using namespace Smartcard;
using namespace std::chrono_literals;

/**
 * @brief Tests against the real PC/SC service
 *
 * Machines without a running service (CI containers) skip; nothing here
 * needs a reader or a card to be plugged in.
 */
class TestPcscBackend : public QObject {
    Q_OBJECT

private:
    std::optional<Context> m_context;

private slots:
    void init() {
        auto established = Context::establish(Scope::System, std::make_shared<PcscServiceBackend>());
        if (!established) {
            QSKIP(qPrintable(QString("PC/SC service not available: %1").arg(errorName(established.error()))));
        }
        m_context.emplace(established.takeValue());
    }

    void cleanup() {
        m_context.reset();
    }

    void testBackendName() {
        QCOMPARE(m_context->backendName(), QString("PC/SC"));
    }

    void testContextIsValid() {
        QVERIFY(m_context->isValid().isOk());
    }

    void testListReadersIsConsistent() {
        auto length = m_context->listReadersLen();
        QVERIFY(length.isOk());

        auto owned = m_context->listReadersOwned();
        QVERIFY(owned.isOk());
        for (const QByteArray& name : owned.value()) {
            QVERIFY(!name.isEmpty());
            QVERIFY(!name.contains('\0'));
        }
    }

    void testUnknownReader() {
        auto card = m_context->connect("No Such Reader 4711", ShareMode::Shared, PROTOCOLS_ANY);
        QVERIFY(!card.isOk());
        QVERIFY(card.error() == Error::UnknownReader || card.error() == Error::ReaderUnavailable);
    }

    void testPnpTimeout() {
        QList<ReaderState> readers{ReaderState(pnpNotification(), ReaderStateFlag::Unaware)};
        auto first = m_context->getStatusChange(0ms, readers);
        if (first.error() == Error::UnsupportedFeature) {
            QSKIP("PnP notification not supported by this service");
        }
        readers[0].syncCurrentState();

        auto second = m_context->getStatusChange(100ms, readers);
        QVERIFY(second.error() == Error::Timeout || second.isOk());
    }

    void testCancelFromAnotherThread() {
        QList<ReaderState> readers{ReaderState(pnpNotification(), ReaderStateFlag::Unaware)};
        auto first = m_context->getStatusChange(0ms, readers);
        if (first.error() == Error::UnsupportedFeature) {
            QSKIP("PnP notification not supported by this service");
        }
        readers[0].syncCurrentState();

        Context ctx = *m_context;
        QFuture<Error> waiting = QtConcurrent::run([ctx, &readers]() {
            return ctx.getStatusChange(10000ms, readers).error();
        });

        // A cancel is not remembered, so repeat it until the wait returns
        while (!waiting.isFinished()) {
            QVERIFY(m_context->cancel().isOk());
            QTest::qWait(20);
        }

        const Error result = waiting.result();
        QVERIFY(result == Error::Cancelled || result == Error::Success);
    }
};

QTEST_MAIN(TestPcscBackend)
#include "test_pcsc_backend.moc"
