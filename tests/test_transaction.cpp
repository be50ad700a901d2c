// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include "smartcard-qt/context.h"
#include "smartcard-qt/card.h"
#include "smartcard-qt/transaction.h"
#include "mocks/mock_service.h"
#include <memory>

using namespace Smartcard;
using namespace Smartcard::Test;

/**
 * @brief Tests for Transaction exclusivity and lifecycle
 */
class TestTransaction : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<MockService> m_mock;
    std::optional<Context> m_context;

    Card connect() {
        auto result = m_context->connect("Reader A", ShareMode::Shared, PROTOCOLS_ANY);
        if (!result) {
            qFatal("Mock card could not be connected");
        }
        return result.takeValue();
    }

private slots:
    void init() {
        m_mock = std::make_shared<MockService>();
        m_mock->addReader("Reader A");
        m_mock->insertCard("Reader A", QByteArray::fromHex("3B00"));
        m_context.emplace(Context::establish(Scope::User, m_mock).takeValue());
    }

    void cleanup() {
        m_context.reset();
        m_mock.reset();
    }

    void testBeginAndEnd() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());
        QVERIFY(tx.value().isActive());
        QVERIFY(card.inTransaction());

        QVERIFY(tx.value().end(Disposition::LeaveCard).isOk());
        QVERIFY(!tx.value().isActive());
        QVERIFY(!card.inTransaction());
        QCOMPARE(m_mock->callCount(MockService::Operation::EndTransaction), 1);
        QCOMPARE(m_mock->lastDisposition(), std::optional<Disposition>(Disposition::LeaveCard));

        // Ended transactions refuse further use
        QCOMPARE(tx.value().end(Disposition::LeaveCard).error(), Error::InvalidHandle);
        QByteArray response(MAX_BUFFER_SIZE, '\0');
        QCOMPARE(tx.value().transmit(QByteArray::fromHex("00A40400"), response).error(),
                 Error::InvalidHandle);
    }

    void testSecondTransactionIsRefused() {
        Card card = connect();
        auto first = card.transaction();
        QVERIFY(first.isOk());

        auto second = card.transaction();
        QCOMPARE(second.error(), Error::SharingViolation);
        QCOMPARE(m_mock->callCount(MockService::Operation::BeginTransaction), 1);
    }

    void testCardIsBlockedDuringTransaction() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());

        QByteArray response(MAX_BUFFER_SIZE, '\0');
        QCOMPARE(card.transmit(QByteArray::fromHex("00A40400"), response).error(),
                 Error::SharingViolation);
        QCOMPARE(card.statusOwned().error(), Error::SharingViolation);
        QCOMPARE(card.getAttributeOwned(Attribute::AtrString).error(), Error::SharingViolation);
        QCOMPARE(card.disconnect(Disposition::LeaveCard).error(), Error::SharingViolation);
        QCOMPARE(card.reconnect(ShareMode::Shared, PROTOCOLS_ANY, Disposition::LeaveCard).error(),
                 Error::SharingViolation);
        QCOMPARE(m_mock->callCount(MockService::Operation::Transmit), 0);

        QVERIFY(tx.value().end(Disposition::LeaveCard).isOk());
        QVERIFY(card.transmit(QByteArray::fromHex("00A40400"), response).isOk());
    }

    void testOperationsThroughTransaction() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());

        m_mock->queueResponse(QByteArray::fromHex("019000"));
        QByteArray response(MAX_BUFFER_SIZE, '\0');
        auto rapdu = tx.value().transmit(QByteArray::fromHex("80CA9F7F00"), response);
        QVERIFY(rapdu.isOk());
        QCOMPARE(rapdu.value().toByteArray(), QByteArray::fromHex("019000"));

        auto status = tx.value().statusOwned();
        QVERIFY(status.isOk());
        QCOMPARE(status.value().atr, QByteArray::fromHex("3B00"));

        QCOMPARE(tx.value().activeProtocol(), std::optional<Protocol>(Protocol::T1));
        QVERIFY(tx.value().getAttributeOwned(Attribute::AtrString).isOk());
    }

    void testEndFailureKeepsTransactionOpen() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());
        m_mock->failNext(MockService::Operation::EndTransaction, Error::CommError);

        QCOMPARE(tx.value().end(Disposition::ResetCard).error(), Error::CommError);
        QVERIFY(tx.value().isActive());
        QVERIFY(card.inTransaction());

        // Retry with another disposition
        QVERIFY(tx.value().end(Disposition::LeaveCard).isOk());
        QVERIFY(!card.inTransaction());
    }

    void testDestructionEndsWithLeaveCard() {
        Card card = connect();
        {
            auto tx = card.transaction();
            QVERIFY(tx.isOk());
        }
        QVERIFY(!card.inTransaction());
        QCOMPARE(m_mock->callCount(MockService::Operation::EndTransaction), 1);
        QCOMPARE(m_mock->lastDisposition(), std::optional<Disposition>(Disposition::LeaveCard));
        QVERIFY(card.transaction().isOk());
    }

    void testDestructionFailureReleasesCard() {
        Card card = connect();
        {
            auto tx = card.transaction();
            QVERIFY(tx.isOk());
            m_mock->failNext(MockService::Operation::EndTransaction, Error::CommError);
        }
        // The failure is logged and the Card is usable again
        QVERIFY(!card.inTransaction());
        QByteArray response(MAX_BUFFER_SIZE, '\0');
        QVERIFY(card.transmit(QByteArray::fromHex("00A40400"), response).isOk());
    }

    void testFailedBeginLeavesCardUsable() {
        Card card = connect();
        m_mock->resetCard("Reader A");

        auto tx = card.transaction();
        QCOMPARE(tx.error(), Error::ResetCard);
        QVERIFY(!card.inTransaction());
        QVERIFY(card.isConnected());

        QVERIFY(card.reconnect(ShareMode::Shared, PROTOCOLS_ANY, Disposition::LeaveCard).isOk());
        auto retry = card.transaction();
        QVERIFY(retry.isOk());
    }

    void testMovedTransactionStaysOpen() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());

        Transaction moved(tx.takeValue());
        QVERIFY(moved.isActive());
        QVERIFY(card.inTransaction());
        QCOMPARE(m_mock->callCount(MockService::Operation::EndTransaction), 0);

        QVERIFY(moved.end(Disposition::LeaveCard).isOk());
    }

    void testMovingCardDuringTransaction() {
        Card card = connect();
        auto tx = card.transaction();
        QVERIFY(tx.isOk());

        Card moved(std::move(card));
        QVERIFY(moved.inTransaction());

        QByteArray response(MAX_BUFFER_SIZE, '\0');
        QVERIFY(tx.value().transmit(QByteArray::fromHex("00A40400"), response).isOk());
        QVERIFY(tx.value().end(Disposition::LeaveCard).isOk());
        QVERIFY(!moved.inTransaction());
    }

    void testDestroyingCardKeepsTransactionUsable() {
        std::optional<Card> card(connect());
        auto tx = card->transaction();
        QVERIFY(tx.isOk());

        card.reset();
        QCOMPARE(m_mock->openCardCount(), 1);
        QCOMPARE(m_mock->callCount(MockService::Operation::Disconnect), 0);

        QByteArray response(MAX_BUFFER_SIZE, '\0');
        QVERIFY(tx.value().transmit(QByteArray::fromHex("00A40400"), response).isOk());
        QVERIFY(tx.value().end(Disposition::LeaveCard).isOk());

        // Ending the transaction released the last hold on the connection
        QCOMPARE(m_mock->callCount(MockService::Operation::Disconnect), 1);
        QCOMPARE(m_mock->lastDisposition(), std::optional<Disposition>(Disposition::ResetCard));
        QCOMPARE(m_mock->openCardCount(), 0);
    }

    void testDestroyingCardThenTransaction() {
        std::optional<Card> card(connect());
        auto tx = card->transaction();
        QVERIFY(tx.isOk());
        std::optional<Transaction> open(tx.takeValue());

        card.reset();
        QCOMPARE(m_mock->openCardCount(), 1);

        open.reset();
        QCOMPARE(m_mock->callCount(MockService::Operation::EndTransaction), 1);
        QCOMPARE(m_mock->callCount(MockService::Operation::Disconnect), 1);
        QCOMPARE(m_mock->lastDisposition(), std::optional<Disposition>(Disposition::ResetCard));
        QCOMPARE(m_mock->openCardCount(), 0);
    }
};

QTEST_MAIN(TestTransaction)
#include "test_transaction.moc"
