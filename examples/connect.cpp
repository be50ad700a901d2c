/**
 * Example talking to the card in the first reader
 *
 * Opens an exclusive transaction, reads the status and a few reader
 * attributes, and sends a harmless SELECT.
 */

#include <QCoreApplication>
#include <QDebug>
#include "smartcard-qt/context.h"
#include "smartcard-qt/card.h"
#include "smartcard-qt/transaction.h"

using namespace Smartcard;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    auto established = Context::establish(Scope::User);
    if (!established) {
        qWarning() << "Failed to establish context:" << established.errorMessage();
        return 1;
    }
    Context ctx = established.takeValue();

    auto readers = ctx.listReadersOwned();
    if (!readers) {
        qWarning() << "Failed to list readers:" << readers.errorMessage();
        return 1;
    }
    qDebug() << "Readers:" << readers.value();
    if (readers.value().isEmpty()) {
        return 0;
    }

    {
        auto connected = ctx.connect(readers.value().first(), ShareMode::Exclusive, PROTOCOLS_ANY);
        if (!connected) {
            qWarning() << "Failed to connect to card:" << connected.errorMessage();
            return 1;
        }
        Card card = connected.takeValue();

        {
            auto started = card.transaction();
            if (!started) {
                qWarning() << "Failed to begin transaction:" << started.errorMessage();
                return 1;
            }
            Transaction tx = started.takeValue();

            auto status = tx.statusOwned();
            if (status) {
                qDebug() << "Status:" << cardStatusNames(status.value().status);
                qDebug() << "Protocol:" << protocolName(status.value().protocol);
            }

            const QByteArray apdu = QByteArray::fromHex("00A4040008315449432E494341");
            QByteArray response(MAX_BUFFER_SIZE, '\0');
            auto rapdu = tx.transmit(apdu, response);
            if (!rapdu) {
                qWarning() << "Failed to transmit APDU:" << rapdu.errorMessage();
                return 1;
            }
            qDebug() << "RAPDU:" << rapdu.value().toByteArray().toHex();

            QByteArray atrBuffer(MAX_ATR_SIZE, '\0');
            auto atr = tx.getAttribute(Attribute::AtrString, atrBuffer);
            if (atr) {
                qDebug() << "ATR:" << atr.value().toByteArray().toHex();
            }

            QByteArray versionBuffer(4, '\0');
            auto version = tx.getAttribute(Attribute::VendorIfdVersion, versionBuffer);
            if (version) {
                qDebug() << "Vendor IFD version:" << version.value().toByteArray().toHex();
            }

            // Sized with a length query first
            auto vendorName = tx.getAttributeOwned(Attribute::VendorName);
            if (vendorName) {
                qDebug() << "Vendor name:" << QString::fromUtf8(vendorName.value());
            }

            // Ending explicitly reports errors; destruction would use LeaveCard
            auto ended = tx.end(Disposition::LeaveCard);
            if (!ended) {
                qWarning() << "Failed to end transaction:" << ended.errorMessage();
                return 1;
            }
        }

        // Destruction would use ResetCard and swallow errors
        auto disconnected = card.disconnect(Disposition::ResetCard);
        if (!disconnected) {
            qWarning() << "Failed to disconnect:" << disconnected.errorMessage();
            return 1;
        }
    }

    auto released = ctx.release();
    if (!released) {
        qWarning() << "Failed to release context:" << released.errorMessage();
        return 1;
    }
    return 0;
}
