#pragma once

#include <QAtomicInt>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

#include "ProgressObserver.h"

// Observer keeping every report, pausable and cancellable from any thread.
class RecordingObserver : public ProgressObserver
{
public:
    void onProgress(const ProgressSnapshot &snapshot) override
    {
        QMutexLocker locker(&m_mutex);
        m_snapshots.append(snapshot);
        if (m_cancelAfterSnapshots > 0 && m_snapshots.size() >= m_cancelAfterSnapshots) {
            cancel();
        }
    }

    void onLog(const QString &line) override
    {
        QMutexLocker locker(&m_mutex);
        m_logs.append(line);
        if (!m_pauseOnLog.isEmpty() && line.contains(m_pauseOnLog)) {
            m_pauseOnLog.clear();
            setPaused(true);
        }
    }

    bool isCancelled() const override { return m_cancelled.loadAcquire() != 0; }
    bool isPaused() const override { return m_paused.loadAcquire() != 0; }

    void cancel() { m_cancelled.storeRelease(1); }
    void setPaused(bool paused) { m_paused.storeRelease(paused ? 1 : 0); }
    void cancelAfterSnapshots(int count) { m_cancelAfterSnapshots = count; }
    void pauseOnLogContaining(const QString &text) { m_pauseOnLog = text; }

    QStringList logs() const
    {
        QMutexLocker locker(&m_mutex);
        return m_logs;
    }

    QList<ProgressSnapshot> snapshots() const
    {
        QMutexLocker locker(&m_mutex);
        return m_snapshots;
    }

    int countLogsContaining(const QString &text) const
    {
        int count = 0;
        for (const QString &line : logs()) {
            if (line.contains(text)) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable QMutex m_mutex;
    QStringList m_logs;
    QList<ProgressSnapshot> m_snapshots;
    QAtomicInt m_cancelled = 0;
    QAtomicInt m_paused = 0;
    int m_cancelAfterSnapshots = 0;
    QString m_pauseOnLog;
};
