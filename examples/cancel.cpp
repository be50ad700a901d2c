/**
 * Example cancelling a blocking wait from another thread
 *
 * Press Enter within 5 seconds to cancel the wait.
 */

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <QThread>
#include "smartcard-qt/context.h"

using namespace Smartcard;
using namespace std::chrono_literals;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    auto established = Context::establish(Scope::User);
    if (!established) {
        qWarning() << "Failed to establish context:" << established.errorMessage();
        return 1;
    }
    Context ctx = established.takeValue();

    // Weak handle, safe to hand to another thread
    Canceler canceler = ctx.canceler();

    QThread* keyWatcher = QThread::create([canceler]() {
        QTextStream in(stdin);
        in.readLine();
        auto cancelled = canceler.cancel();
        if (!cancelled) {
            qWarning() << "Failed to cancel:" << cancelled.errorMessage();
        }
    });
    keyWatcher->start();

    qDebug() << "Entering blocking call; press Enter to cancel";
    QList<ReaderState> readers{ReaderState(pnpNotification(), ReaderStateFlag::Unaware)};
    auto result = ctx.getStatusChange(5000ms, readers);

    int exitCode = 0;
    switch (result.error()) {
    case Error::Success:
        qDebug() << "Blocking call exited normally";
        break;
    case Error::Cancelled:
        qDebug() << "Blocking call cancelled";
        break;
    case Error::Timeout:
        qDebug() << "Blocking call timed out";
        break;
    default:
        qWarning() << "Failed to get status changes:" << result.errorMessage();
        exitCode = 1;
        break;
    }

    // The watcher is stuck on stdin until a key is pressed
    if (!keyWatcher->wait(0)) {
        keyWatcher->terminate();
        keyWatcher->wait();
    }
    delete keyWatcher;
    return exitCode;
}
