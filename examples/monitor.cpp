/**
 * Example monitoring reader and card changes
 *
 * Runs until interrupted. Plug readers in and out and insert or remove
 * cards to see the signals.
 */

#include <QCoreApplication>
#include <QDebug>
#include "smartcard-qt/reader_monitor.h"

using namespace Smartcard;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    ReaderMonitor monitor;

    QObject::connect(&monitor, &ReaderMonitor::readerAdded,
        [](const QString& reader) {
        qDebug() << "Adding" << reader;
    });

    QObject::connect(&monitor, &ReaderMonitor::readerRemoved,
        [](const QString& reader) {
        qDebug() << "Removing" << reader;
    });

    QObject::connect(&monitor, &ReaderMonitor::cardInserted,
        [](const QString& reader, const QByteArray& atr) {
        qDebug() << "Card inserted in" << reader << "ATR:" << atr.toHex();
    });

    QObject::connect(&monitor, &ReaderMonitor::cardRemoved,
        [](const QString& reader) {
        qDebug() << "Card removed from" << reader;
    });

    QObject::connect(&monitor, &ReaderMonitor::error, &app,
        [&app](const QString& msg) {
        qWarning() << "Error:" << msg;
        app.exit(1);
    });

    if (!monitor.start()) {
        return 1;
    }
    qDebug() << "Monitoring readers...";

    return app.exec();
}
