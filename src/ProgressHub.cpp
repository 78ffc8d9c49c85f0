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

#include "ProgressHub.h"

namespace {
struct ProgressHubConstants {
    static constexpr int cleared = 0;
    static constexpr int set = 1;
};
} // namespace

ProgressHub::ProgressHub(QObject *parent)
    : QObject(parent)
{
}

/**
 * @brief Stores the latest snapshot, replacing the previous one.
 * @param snapshot Snapshot reported by the engine.
 *
 * Once a terminal state is stored, later snapshots are ignored until reset().
 */
void ProgressHub::onProgress(const ProgressSnapshot &snapshot)
{
    ProgressSnapshot stored = snapshot;
    {
        QMutexLocker locker(&m_snapshotMutex);
        if (isTerminalState(m_snapshot.state)) {
            return;
        }
        if (stored.state == ProgressState::Copying && isPaused()) {
            stored.state = ProgressState::Paused;
        }
        m_snapshot = stored;
    }
    emit progressUpdated(stored);
}

void ProgressHub::onLog(const QString &line)
{
    {
        QMutexLocker locker(&m_logMutex);
        m_logs.append(line);
    }
    emit logAppended(line);
}

bool ProgressHub::isCancelled() const
{
    return m_cancelled.loadAcquire() != ProgressHubConstants::cleared;
}

bool ProgressHub::isPaused() const
{
    return m_paused.loadAcquire() != ProgressHubConstants::cleared;
}

/**
 * @brief Parks the calling worker until the run is resumed or cancelled.
 */
void ProgressHub::waitWhilePaused()
{
    QMutexLocker locker(&m_pauseMutex);
    while (isPaused() && !isCancelled()) {
        m_pauseCondition.wait(&m_pauseMutex);
    }
}

void ProgressHub::cancel()
{
    QMutexLocker locker(&m_pauseMutex);
    m_cancelled.storeRelease(ProgressHubConstants::set);
    m_pauseCondition.wakeAll();
}

void ProgressHub::togglePause()
{
    bool paused = false;
    {
        QMutexLocker locker(&m_pauseMutex);
        paused = !isPaused();
        m_paused.storeRelease(paused ? ProgressHubConstants::set : ProgressHubConstants::cleared);
        m_pauseCondition.wakeAll();
    }
    applyPausedState(paused);
}

void ProgressHub::setPaused(bool paused)
{
    {
        QMutexLocker locker(&m_pauseMutex);
        if (isPaused() == paused) {
            return;
        }
        m_paused.storeRelease(paused ? ProgressHubConstants::set : ProgressHubConstants::cleared);
        m_pauseCondition.wakeAll();
    }
    applyPausedState(paused);
}

/**
 * @brief Clears control flags, the snapshot and buffered logs for a new run.
 */
void ProgressHub::reset()
{
    {
        QMutexLocker locker(&m_pauseMutex);
        m_cancelled.storeRelease(ProgressHubConstants::cleared);
        m_paused.storeRelease(ProgressHubConstants::cleared);
        m_pauseCondition.wakeAll();
    }
    {
        QMutexLocker locker(&m_snapshotMutex);
        m_snapshot = ProgressSnapshot();
    }
    QMutexLocker locker(&m_logMutex);
    m_logs.clear();
}

ProgressSnapshot ProgressHub::snapshot() const
{
    QMutexLocker locker(&m_snapshotMutex);
    return m_snapshot;
}

QStringList ProgressHub::takeLogs()
{
    QMutexLocker locker(&m_logMutex);
    QStringList logs;
    logs.swap(m_logs);
    return logs;
}

QStringList ProgressHub::peekLogs() const
{
    QMutexLocker locker(&m_logMutex);
    return m_logs;
}

void ProgressHub::applyPausedState(bool paused)
{
    ProgressSnapshot updated;
    bool changed = false;
    {
        QMutexLocker locker(&m_snapshotMutex);
        if (paused && m_snapshot.state == ProgressState::Copying) {
            m_snapshot.state = ProgressState::Paused;
            changed = true;
        } else if (!paused && m_snapshot.state == ProgressState::Paused) {
            m_snapshot.state = ProgressState::Copying;
            changed = true;
        }
        updated = m_snapshot;
    }
    emit pausedChanged(paused);
    if (changed) {
        emit progressUpdated(updated);
    }
}
