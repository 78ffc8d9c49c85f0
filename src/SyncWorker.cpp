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

#include "SyncWorker.h"

#include "SyncEngine.h"

/**
 * @brief Creates a worker for one synchronization run.
 * @param options Run configuration, copied.
 * @param parent Parent QObject for ownership.
 */
SyncWorker::SyncWorker(const SyncOptions &options, QObject *parent)
    : QObject(parent)
    , m_options(options)
    , m_hub(this)
{
    qRegisterMetaType<ProgressSnapshot>();
    connect(&m_hub, &ProgressHub::progressUpdated, this, &SyncWorker::progress, Qt::DirectConnection);
    connect(&m_hub, &ProgressHub::logAppended, this, &SyncWorker::logLine, Qt::DirectConnection);
    connect(&m_hub, &ProgressHub::pausedChanged, this, &SyncWorker::pausedChanged, Qt::DirectConnection);
}

/**
 * @brief Requests cooperative cancellation of the run.
 */
void SyncWorker::cancel()
{
    m_hub.cancel();
}

void SyncWorker::togglePause()
{
    m_hub.togglePause();
}

void SyncWorker::setPaused(bool paused)
{
    m_hub.setPaused(paused);
}

/**
 * @brief Executes the run and emits finished with the result map.
 *
 * The map holds ok, state, cancelled, the statistics counters and, when the
 * run failed, error.
 */
void SyncWorker::start()
{
    SyncEngine engine(m_options, m_hub);
    const SyncRunResult run = engine.run();

    QVariantMap result;
    result.insert(QStringLiteral("ok"), run.state == ProgressState::Completed);
    result.insert(QStringLiteral("state"), progressStateName(run.state));
    result.insert(QStringLiteral("cancelled"), run.state == ProgressState::Cancelled);
    result.insert(QStringLiteral("dirsCreated"), run.totals.dirsCreated);
    result.insert(QStringLiteral("dirsSkipped"), run.totals.dirsSkipped);
    result.insert(QStringLiteral("dirsRemoved"), run.totals.dirsRemoved);
    result.insert(QStringLiteral("filesCopied"), run.totals.filesCopied);
    result.insert(QStringLiteral("filesSkipped"), run.totals.filesSkipped);
    result.insert(QStringLiteral("filesFailed"), run.totals.filesFailed);
    result.insert(QStringLiteral("filesRemoved"), run.totals.filesRemoved);
    result.insert(QStringLiteral("bytesCopied"), run.totals.bytesCopied);
    if (run.error.isSet()) {
        result.insert(QStringLiteral("error"), run.error.message);
    }
    emit finished(result);
}
