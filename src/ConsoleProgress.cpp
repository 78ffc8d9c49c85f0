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

#include "ConsoleProgress.h"

#include <csignal>
#include <cstdio>

#ifdef Q_OS_UNIX
#include <signal.h>
#endif

namespace {

volatile std::sig_atomic_t interrupted = 0;

void handleInterrupt(int)
{
    interrupted = 1;
}

} // namespace

ConsoleProgress::ConsoleProgress(bool showProgress, bool showLog, QObject *parent)
    : QObject(parent)
    , m_showProgress(showProgress)
    , m_showLog(showLog)
    , m_out(stdout)
{
}

/**
 * @brief Turns Ctrl+C into a cancellation request polled by the caller.
 */
void ConsoleProgress::installInterruptHandler()
{
#ifdef Q_OS_UNIX
    struct sigaction action = {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
#else
    std::signal(SIGINT, handleInterrupt);
#endif
}

bool ConsoleProgress::interruptRequested()
{
    return interrupted != 0;
}

void ConsoleProgress::showProgress(const ProgressSnapshot &snapshot)
{
    if (!m_showProgress) {
        return;
    }
    switch (snapshot.state) {
    case ProgressState::Scanning:
        m_out << QStringLiteral("\rScanning: %1 files found...").arg(snapshot.filesTotal);
        m_progressLineOpen = true;
        break;
    case ProgressState::Copying:
        m_out << QStringLiteral("\r%1% - %2 of %3 files")
                     .arg(snapshot.percentage(), 0, 'f', 0)
                     .arg(snapshot.filesDone)
                     .arg(snapshot.filesTotal);
        m_progressLineOpen = true;
        break;
    case ProgressState::Completed:
        m_out << QStringLiteral("\nCompleted!\n");
        m_progressLineOpen = false;
        break;
    case ProgressState::Cancelled:
        m_out << QStringLiteral("\nCancelled.\n");
        m_progressLineOpen = false;
        break;
    case ProgressState::Failed:
        m_out << QStringLiteral("\nFailed.\n");
        m_progressLineOpen = false;
        break;
    case ProgressState::Idle:
    case ProgressState::Paused:
        break;
    }
    m_out.flush();
}

void ConsoleProgress::showLog(const QString &line)
{
    if (!m_showLog) {
        return;
    }
    if (m_progressLineOpen) {
        m_out << '\n';
        m_progressLineOpen = false;
    }
    m_out << line << '\n';
    m_out.flush();
}
