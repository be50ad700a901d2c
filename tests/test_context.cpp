// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include <QtConcurrent/QtConcurrent>
#include <QFuture>
#include "smartcard-qt/context.h"
#include "smartcard-qt/card.h"
#include "mocks/mock_service.h"
#include <memory>

using namespace Smartcard;
using namespace Smartcard::Test;

/**
 * @brief Tests for Context lifecycle and reader enumeration
 *
 * Covers:
 * - Establishment with an injected service
 * - Sole-owner release, CantDispose and transport failures
 * - Reader listing with caller buffers, size probes and owned copies
 * - Connection errors
 */
class TestContext : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<MockService> m_mock;

    Context establish() {
        auto result = Context::establish(Scope::User, m_mock);
        if (!result) {
            qFatal("Mock context could not be established");
        }
        return result.takeValue();
    }

private slots:
    void init() {
        m_mock = std::make_shared<MockService>();
    }

    void cleanup() {
        m_mock.reset();
    }

    // ========================================================================
    // Establish / Release
    // ========================================================================

    void testEstablishWithInjectedService() {
        auto result = Context::establish(Scope::User, m_mock);
        QVERIFY(result.isOk());
        QVERIFY(result.value().isEstablished());
        QCOMPARE(result.value().backendName(), QString("Mock Service"));
        QCOMPARE(m_mock->openContextCount(), 1);
    }

    void testEstablishWithoutService() {
        m_mock->setServiceAvailable(false);
        auto result = Context::establish(Scope::System, m_mock);
        QVERIFY(!result.isOk());
        QCOMPARE(result.error(), Error::NoService);
        QCOMPARE(m_mock->openContextCount(), 0);
    }

    void testReleaseSoleOwner() {
        Context ctx = establish();
        QVERIFY(ctx.isValid().isOk());

        auto released = ctx.release();
        QVERIFY(released.isOk());
        QVERIFY(!ctx.isEstablished());
        QCOMPARE(m_mock->openContextCount(), 0);

        // Released context refuses further use
        QCOMPARE(ctx.isValid().error(), Error::InvalidHandle);
        QCOMPARE(ctx.release().error(), Error::InvalidHandle);
        QCOMPARE(ctx.listReadersLen().error(), Error::InvalidHandle);
    }

    void testReleaseWithLiveCopyFails() {
        Context ctx = establish();
        Context copy = ctx;

        auto released = ctx.release();
        QVERIFY(!released.isOk());
        QCOMPARE(released.error(), Error::CantDispose);

        // Both handles still usable
        QVERIFY(ctx.isEstablished());
        QVERIFY(ctx.isValid().isOk());
        QVERIFY(copy.isValid().isOk());
        QCOMPARE(m_mock->callCount(MockService::Operation::ReleaseContext), 0);

        // Once the copy is gone the release goes through
        copy = establish();
        QVERIFY(ctx.release().isOk());
        QCOMPARE(m_mock->callCount(MockService::Operation::ReleaseContext), 1);
    }

    void testReleaseWithOpenCardFails() {
        m_mock->addReader("Reader A");
        m_mock->insertCard("Reader A", QByteArray::fromHex("3B00"));
        Context ctx = establish();

        auto card = ctx.connect("Reader A", ShareMode::Shared, PROTOCOLS_ANY);
        QVERIFY(card.isOk());
        QCOMPARE(ctx.release().error(), Error::CantDispose);

        QVERIFY(card.value().disconnect(Disposition::LeaveCard).isOk());
        QVERIFY(ctx.release().isOk());
    }

    void testReleaseFailureKeepsHandle() {
        Context ctx = establish();
        m_mock->failNext(MockService::Operation::ReleaseContext, Error::InternalError);

        auto released = ctx.release();
        QCOMPARE(released.error(), Error::InternalError);
        QVERIFY(ctx.isEstablished());
        QVERIFY(ctx.isValid().isOk());

        // Retry succeeds
        QVERIFY(ctx.release().isOk());
        QVERIFY(!ctx.isEstablished());
    }

    void testDestructionReleases() {
        {
            Context ctx = establish();
            Context copy = ctx;
            QCOMPARE(m_mock->openContextCount(), 1);
        }
        QCOMPARE(m_mock->openContextCount(), 0);
        QCOMPARE(m_mock->callCount(MockService::Operation::ReleaseContext), 1);
    }

    void testInvalidatedContext() {
        Context ctx = establish();
        m_mock->invalidateContexts();
        QCOMPARE(ctx.isValid().error(), Error::InvalidHandle);
    }

    void testExpiredCanceler() {
        Canceler canceler = [this]() {
            Context ctx = establish();
            return ctx.canceler();
        }();
        QCOMPARE(canceler.cancel().error(), Error::InvalidHandle);
    }

    void testCancelerDoesNotKeepSessionAlive() {
        Context ctx = establish();
        Canceler canceler = ctx.canceler();
        QVERIFY(canceler.cancel().isOk());
        QVERIFY(ctx.release().isOk());
        QCOMPARE(canceler.cancel().error(), Error::InvalidHandle);
    }

    // ========================================================================
    // Reader Listing
    // ========================================================================

    void testNoReadersIsEmptySequence() {
        Context ctx = establish();

        QByteArray buffer(2048, '\0');
        auto names = ctx.listReaders(buffer);
        QVERIFY(names.isOk());
        QVERIFY(names.value().isEmpty());

        auto length = ctx.listReadersLen();
        QVERIFY(length.isOk());
        QCOMPARE(length.value(), qsizetype(0));

        auto owned = ctx.listReadersOwned();
        QVERIFY(owned.isOk());
        QVERIFY(owned.value().isEmpty());
    }

    void testListReaders() {
        m_mock->addReader("Reader A");
        m_mock->addReader("Reader B");
        Context ctx = establish();

        QByteArray buffer(2048, '\0');
        auto names = ctx.listReaders(buffer);
        QVERIFY(names.isOk());
        QCOMPARE(names.value().toList(), (QList<QByteArray>{"Reader A", "Reader B"}));

        // The view borrows the caller's buffer
        QVERIFY((*names.value().begin()).data() == buffer.constData());
    }

    void testListReadersLenIsExact() {
        m_mock->addReader("Reader A");
        m_mock->addReader("Reader B");
        Context ctx = establish();

        auto length = ctx.listReadersLen();
        QVERIFY(length.isOk());
        QCOMPARE(length.value(), qsizetype(19));

        QByteArray buffer(length.value(), '\0');
        QVERIFY(ctx.listReaders(buffer).isOk());
    }

    void testTooSmallBufferYieldsNoNames() {
        m_mock->addReader("Reader A");
        m_mock->addReader("Reader B");
        Context ctx = establish();

        QByteArray buffer(12, '\0');
        auto names = ctx.listReaders(buffer);
        QVERIFY(!names.isOk());
        QCOMPARE(names.error(), Error::InsufficientBuffer);
        QCOMPARE(names.requiredSize(), qsizetype(19));

        QByteArray empty;
        QCOMPARE(ctx.listReaders(empty).error(), Error::InsufficientBuffer);
    }

    void testListReadersOwned() {
        m_mock->addReader("Reader A");
        Context ctx = establish();

        auto owned = ctx.listReadersOwned();
        QVERIFY(owned.isOk());
        QCOMPARE(owned.value(), QList<QByteArray>{"Reader A"});
    }

    void testListReadersError() {
        m_mock->addReader("Reader A");
        Context ctx = establish();
        m_mock->failNext(MockService::Operation::ListReaders, Error::NoService);

        QByteArray buffer(2048, '\0');
        QCOMPARE(ctx.listReaders(buffer).error(), Error::NoService);
    }

    void testCopiesUsedFromSeveralThreads() {
        m_mock->addReader("Reader A");
        Context ctx = establish();

        QList<QFuture<bool>> futures;
        for (int i = 0; i < 8; ++i) {
            Context copy = ctx;
            futures.append(QtConcurrent::run([copy]() {
                for (int j = 0; j < 20; ++j) {
                    auto names = copy.listReadersOwned();
                    if (!names || names.value().size() != 1) {
                        return false;
                    }
                }
                return true;
            }));
        }
        for (auto& future : futures) {
            QVERIFY(future.result());
        }
    }

    // ========================================================================
    // Connect
    // ========================================================================

    void testConnectUnknownReader() {
        Context ctx = establish();
        auto card = ctx.connect("Nope", ShareMode::Shared, PROTOCOLS_ANY);
        QCOMPARE(card.error(), Error::UnknownReader);
    }

    void testConnectWithoutCard() {
        m_mock->addReader("Reader A");
        Context ctx = establish();
        auto card = ctx.connect("Reader A", ShareMode::Shared, PROTOCOLS_ANY);
        QCOMPARE(card.error(), Error::NoSmartcard);
    }

    void testConnectRejectsNameWithNul() {
        Context ctx = establish();
        auto card = ctx.connect(QByteArray("A\0B", 3), ShareMode::Shared, PROTOCOLS_ANY);
        QCOMPARE(card.error(), Error::InvalidParameter);
        QCOMPARE(m_mock->callCount(MockService::Operation::Connect), 0);
    }

    void testConnectNegotiatesProtocol() {
        m_mock->addReader("Reader A");
        m_mock->insertCard("Reader A", QByteArray::fromHex("3B00"), Protocol::T0);
        Context ctx = establish();

        auto card = ctx.connect("Reader A", ShareMode::Shared, PROTOCOLS_ANY);
        QVERIFY(card.isOk());
        QCOMPARE(card.value().activeProtocol(), std::optional<Protocol>(Protocol::T0));

        auto mismatch = ctx.connect("Reader A", ShareMode::Shared, Protocol::T1);
        QCOMPARE(mismatch.error(), Error::ProtoMismatch);
    }

    void testConnectDirectHasNoProtocol() {
        m_mock->addReader("Reader A");
        Context ctx = establish();

        auto card = ctx.connect("Reader A", ShareMode::Direct, Protocols());
        QVERIFY(card.isOk());
        QVERIFY(!card.value().activeProtocol().has_value());
    }

    void testExclusiveConnectBlocksOthers() {
        m_mock->addReader("Reader A");
        m_mock->insertCard("Reader A", QByteArray::fromHex("3B00"));
        Context ctx = establish();

        auto first = ctx.connect("Reader A", ShareMode::Exclusive, PROTOCOLS_ANY);
        QVERIFY(first.isOk());
        auto second = ctx.connect("Reader A", ShareMode::Shared, PROTOCOLS_ANY);
        QCOMPARE(second.error(), Error::SharingViolation);
    }
};

QTEST_MAIN(TestContext)
#include "test_context.moc"
