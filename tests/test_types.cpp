// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include <QRegularExpression>
#include "smartcard-qt/types.h"
#include "smartcard-qt/reader_state.h"
#include "smartcard-qt/context.h"
#include "mocks/mock_service.h"
#include <chrono>
#include <memory>

using namespace Smartcard;
using namespace Smartcard::Test;
using namespace std::chrono_literals;

/**
 * @brief Tests for the core vocabulary and ReaderState
 */
class TestTypes : public QObject {
    Q_OBJECT

private slots:
    // ========================================================================
    // Constants
    // ========================================================================

    void testConstants() {
        QCOMPARE(MAX_ATR_SIZE, 33);
        QCOMPARE(MAX_BUFFER_SIZE, 264);
        QCOMPARE(MAX_BUFFER_SIZE_EXTENDED, 65548);
        QCOMPARE(INFINITE_TIMEOUT, 0xFFFFFFFFu);
        QVERIFY(PROTOCOLS_ANY.testFlag(Protocol::T0));
        QVERIFY(PROTOCOLS_ANY.testFlag(Protocol::T1));
        QVERIFY(!PROTOCOLS_ANY.testFlag(Protocol::Raw));
    }

    void testPnpNotificationName() {
        const QByteArray name = pnpNotification();
        QCOMPARE(name, QByteArray("\\\\?PnP?\\Notification"));
        QCOMPARE(name.size(), 20);
        QVERIFY(!name.contains('\0'));
    }

    void testCtlCode() {
#ifdef Q_OS_WIN
        QCOMPARE(ctlCode(3500), 0x00310000u | (3500u << 2));
#else
        QCOMPARE(ctlCode(1), 0x42000001u);
        QCOMPARE(ctlCode(3400), 0x42000000u + 3400u);
#endif
    }

    void testAttributeIds() {
        QCOMPARE(static_cast<uint32_t>(Attribute::VendorName), 0x00010100u);
        QCOMPARE(static_cast<uint32_t>(Attribute::VendorIfdVersion), 0x00010102u);
        QCOMPARE(static_cast<uint32_t>(Attribute::AtrString), 0x00090303u);
        QCOMPARE(static_cast<uint32_t>(Attribute::CurrentProtocolType), 0x00080201u);
        QCOMPARE(static_cast<uint32_t>(Attribute::MaxInput), 0x0007A007u);
        QCOMPARE(static_cast<uint32_t>(Attribute::DeviceFriendlyName), 0x00000003u);
    }

    // ========================================================================
    // Conversions
    // ========================================================================

    void testProtocolFromRaw() {
        QVERIFY(!protocolFromRaw(0).has_value());
        QCOMPARE(protocolFromRaw(1).value(), Protocol::T0);
        QCOMPARE(protocolFromRaw(2).value(), Protocol::T1);
        QCOMPARE(protocolFromRaw(4).value(), Protocol::Raw);
    }

    void testStatusFromOrdinal() {
        QCOMPARE(statusFromOrdinal(0), CardStatusFlags(CardStatusFlag::Unknown));
        QCOMPARE(statusFromOrdinal(1), CardStatusFlags(CardStatusFlag::Absent));
        QCOMPARE(statusFromOrdinal(2), CardStatusFlags(CardStatusFlag::Present));
        QCOMPARE(statusFromOrdinal(3), CardStatusFlags(CardStatusFlag::Swallowed));
        QCOMPARE(statusFromOrdinal(4), CardStatusFlags(CardStatusFlag::Powered));
        QCOMPARE(statusFromOrdinal(5), CardStatusFlags(CardStatusFlag::Negotiable));
        QCOMPARE(statusFromOrdinal(6), CardStatusFlags(CardStatusFlag::Specific));
        QCOMPARE(statusFromOrdinal(7), CardStatusFlags());
    }

    void testStatusFromBitsDropsUnknownBits() {
        const CardStatusFlags status = statusFromBits(0x0034 | 0x8000);
        QVERIFY(status.testFlag(CardStatusFlag::Present));
        QVERIFY(status.testFlag(CardStatusFlag::Powered));
        QVERIFY(status.testFlag(CardStatusFlag::Negotiable));
        QCOMPARE(status.toInt(), 0x0034u);
    }

    void testReaderStatesFromRawDropsCounter() {
        const ReaderStates states = readerStatesFromRaw(0x00030022);
        QVERIFY(states.testFlag(ReaderStateFlag::Present));
        QVERIFY(states.testFlag(ReaderStateFlag::Changed));
        QCOMPARE(states.toInt(), 0x0022u);
    }

    void testNames() {
        QCOMPARE(protocolName(Protocol::T1), QString("T=1"));
        QCOMPARE(protocolName(std::nullopt), QString("undefined"));
        QCOMPARE(readerStateNames(ReaderStateFlag::Unaware), QStringList{"UNAWARE"});
        QCOMPARE(readerStateNames(ReaderStates(ReaderStateFlag::Present) | ReaderStateFlag::InUse),
                 (QStringList{"PRESENT", "INUSE"}));
        QCOMPARE(cardStatusNames(CardStatusFlag::Absent), QStringList{"ABSENT"});
    }

    // ========================================================================
    // ReaderState
    // ========================================================================

    void testNewReaderState() {
        ReaderState state("Reader A", ReaderStateFlag::Unaware);
        QCOMPARE(state.name(), QByteArray("Reader A"));
        QCOMPARE(state.currentState(), ReaderStates());
        QCOMPARE(state.eventState(), ReaderStates());
        QCOMPARE(state.eventCount(), 0u);
        QVERIFY(state.atr().isEmpty());
    }

    void testNameIsTruncatedAtNul() {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("contains NUL"));
        ReaderState state(QByteArray("Reader\0B", 8), ReaderStateFlag::Unaware);
        QCOMPARE(state.name(), QByteArray("Reader"));
    }

    void testSetCurrentState() {
        ReaderState state("Reader A", ReaderStateFlag::Unaware);
        state.setCurrentState(ReaderStates(ReaderStateFlag::Present) | ReaderStateFlag::Exclusive);
        QVERIFY(state.currentState().testFlag(ReaderStateFlag::Present));
        QVERIFY(state.currentState().testFlag(ReaderStateFlag::Exclusive));
        QCOMPARE(state.rawCurrentState(), 0x00A0u);
    }

    void testSyncCopiesEventCounter() {
        auto mock = std::make_shared<MockService>();
        mock->addReader("Reader A");
        mock->addReader("Reader B");
        mock->insertCard("Reader A", QByteArray::fromHex("3B00"));
        Context context = Context::establish(Scope::User, mock).takeValue();

        QList<ReaderState> readers{
            ReaderState(pnpNotification(), ReaderStateFlag::Unaware),
            ReaderState("Reader A", ReaderStateFlag::Unaware)
        };
        QVERIFY(context.getStatusChange(0ms, readers).isOk());

        for (auto& reader : readers) {
            QVERIFY((reader.rawEventState() & EVENT_COUNT_MASK) != 0);
            reader.syncCurrentState();
            QCOMPARE(reader.rawCurrentState(), reader.rawEventState());
        }
        QCOMPARE(readers[1].rawCurrentState() >> 16, 1u);
    }
};

QTEST_MAIN(TestTypes)
#include "test_types.moc"
