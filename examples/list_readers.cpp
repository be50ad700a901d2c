/**
 * Example listing the connected card readers
 *
 * Shows both ways of listing: into a caller-provided buffer, which
 * allocates nothing, and into owned copies.
 */

#include <QCoreApplication>
#include <QDebug>
#include "smartcard-qt/context.h"

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

    // Fixed buffer, big enough for any realistic setup
    QByteArray buffer(2048, '\0');
    auto names = ctx.listReaders(buffer);
    if (!names) {
        qWarning() << "Failed to list readers:" << names.errorMessage();
        return 1;
    }

    qDebug() << "Readers:";
    for (QByteArrayView name : names.value()) {
        qDebug() << "  " << name.toByteArray();
    }

    // Exactly sized, owned copies
    auto owned = ctx.listReadersOwned();
    if (!owned) {
        qWarning() << "Failed to list readers:" << owned.errorMessage();
        return 1;
    }
    qDebug() << "Reader count:" << owned.value().size();

    return 0;
}
