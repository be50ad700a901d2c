// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include <QTest>
#include "smartcard-qt/reader_names.h"

using namespace Smartcard;

/**
 * @brief Tests for the multi-string reader name view
 */
class TestReaderNames : public QObject {
    Q_OBJECT

private slots:
    void testDecodesNamesInOrder() {
        const QByteArray buffer("Reader A\0Reader B\0\0", 19);
        ReaderNames names(buffer);

        QList<QByteArray> decoded;
        for (QByteArrayView name : names) {
            decoded.append(name.toByteArray());
        }
        QCOMPARE(decoded, (QList<QByteArray>{"Reader A", "Reader B"}));
        QCOMPARE(names.count(), qsizetype(2));
    }

    void testEncodeDecodeIdentity() {
        const QList<QByteArray> original{"ACS ACR122U 00 00", "Gemalto PC Twin Reader", "x"};
        const QByteArray buffer = ReaderNames::encode(original);
        QCOMPARE(ReaderNames(buffer).toList(), original);
        QCOMPARE(ReaderNames::encode(ReaderNames(buffer).toList()), buffer);
    }

    void testEmptyBuffer() {
        QVERIFY(ReaderNames().isEmpty());
        QVERIFY(ReaderNames(QByteArrayView()).isEmpty());
        QCOMPARE(ReaderNames(QByteArrayView()).count(), qsizetype(0));
    }

    void testOnlyTerminator() {
        const QByteArray buffer(1, '\0');
        QVERIFY(ReaderNames(buffer).isEmpty());
    }

    void testStopsAtFirstEmptyName() {
        const QByteArray buffer("A\0\0B\0\0", 6);
        QCOMPARE(ReaderNames(buffer).toList(), QList<QByteArray>{"A"});
    }

    void testUnterminatedTailIsNotYielded() {
        const QByteArray buffer("A\0BC", 4);
        QCOMPARE(ReaderNames(buffer).toList(), QList<QByteArray>{"A"});
    }

    void testMissingFinalTerminatorStillYieldsLastName() {
        const QByteArray buffer("A\0B\0", 4);
        QCOMPARE(ReaderNames(buffer).toList(), (QList<QByteArray>{"A", "B"}));
    }

    void testCopiedIteratorRestartsFromItsPosition() {
        const QByteArray buffer("A\0B\0C\0\0", 7);
        ReaderNames names(buffer);

        auto it = names.begin();
        ++it;
        auto copy = it;
        QCOMPARE(*it, QByteArrayView("B"));
        ++it;
        QCOMPARE(*it, QByteArrayView("C"));
        QCOMPARE(*copy, QByteArrayView("B"));
        QVERIFY(copy != it);

        // A copy of the view iterates from the start again
        ReaderNames again = names;
        QCOMPARE(*again.begin(), QByteArrayView("A"));
    }

    void testNamesBorrowTheBuffer() {
        const QByteArray buffer("Reader\0\0", 8);
        ReaderNames names(buffer);
        QVERIFY((*names.begin()).data() == buffer.constData());
    }
};

QTEST_MAIN(TestReaderNames)
#include "test_reader_names.moc"
