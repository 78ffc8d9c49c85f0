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

#include "RunProgressTracker.h"

#include "SyncStatistics.h"

namespace {
constexpr double millisecondsPerSecond = 1000.0;
} // namespace

RunProgressTracker::RunProgressTracker(ProgressObserver &inner,
                                       const SyncStatistics &statistics,
                                       quint64 filesTotal,
                                       quint64 bytesTotal)
    : m_inner(inner)
    , m_statistics(statistics)
    , m_filesTotal(filesTotal)
    , m_bytesTotal(bytesTotal)
{
    m_timer.start();
}

void RunProgressTracker::onProgress(const ProgressSnapshot &snapshot)
{
    ProgressSnapshot merged = snapshot;
    merged.filesDone = m_statistics.filesCopied();
    merged.bytesDone = m_statistics.bytesCopied() + snapshot.currentFileBytesDone;
    merged.filesTotal = m_filesTotal;
    merged.bytesTotal = m_bytesTotal;

    const qint64 elapsedMs = m_timer.elapsed();
    if (elapsedMs > 0) {
        const double seconds = static_cast<double>(elapsedMs) / millisecondsPerSecond;
        merged.bytesPerSecond = static_cast<quint64>(static_cast<double>(merged.bytesDone) / seconds);
    }
    m_inner.onProgress(merged);
}

void RunProgressTracker::onLog(const QString &line)
{
    m_inner.onLog(line);
}

bool RunProgressTracker::isCancelled() const
{
    return m_inner.isCancelled();
}

bool RunProgressTracker::isPaused() const
{
    return m_inner.isPaused();
}

void RunProgressTracker::waitWhilePaused()
{
    m_inner.waitWhilePaused();
}
