/************************************************************************\

    Syncman - Directory synchronization engine
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QCoreApplication>
#include <QTextStream>
#include <QThread>
#include <QTimer>

#include "CommandLineOptions.h"
#include "ConsoleProgress.h"
#include "SyncOptions.h"
#include "SyncWorker.h"

namespace {
constexpr int interruptPollMs = 100;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("Syncman"));

    SyncOptions options;
    QString error;
    if (!CommandLineOptions::parse(app.arguments().mid(1), &options, &error)) {
        QTextStream err(stderr);
        err << error << "\n\n" << CommandLineOptions::usageText();
        return 1;
    }

    ConsoleProgress console(options.showProgress, options.logFileNames);
    ConsoleProgress::installInterruptHandler();

    QThread thread;
    SyncWorker worker(options);
    worker.moveToThread(&thread);

    QObject::connect(&thread, &QThread::started, &worker, &SyncWorker::start);
    QObject::connect(&worker, &SyncWorker::progress, &console, &ConsoleProgress::showProgress);
    QObject::connect(&worker, &SyncWorker::logLine, &console, &ConsoleProgress::showLog);
    QObject::connect(&worker, &SyncWorker::finished, &app, [](const QVariantMap &result) {
        const bool ok = result.value(QStringLiteral("ok")).toBool()
            || result.value(QStringLiteral("cancelled")).toBool();
        QCoreApplication::exit(ok ? 0 : 1);
    });

    QTimer interruptTimer;
    interruptTimer.setInterval(interruptPollMs);
    QObject::connect(&interruptTimer, &QTimer::timeout, &app, [&worker, &interruptTimer]() {
        if (ConsoleProgress::interruptRequested()) {
            interruptTimer.stop();
            worker.cancel();
        }
    });
    interruptTimer.start();

    thread.start();
    const int status = app.exec();
    thread.quit();
    thread.wait();
    return status;
}
