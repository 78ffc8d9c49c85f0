#pragma once

#include <QAtomicInt>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QWaitCondition>

#include "ProgressObserver.h"

/**
 * @brief Shared observer polled by front-ends: latest snapshot, buffered logs,
 * cancel and pause control.
 *
 * Snapshots are overwritten, never queued. Signals are emitted from the
 * reporting worker thread.
 */
class ProgressHub : public QObject, public ProgressObserver
{
    Q_OBJECT

public:
    explicit ProgressHub(QObject *parent = nullptr);

    void onProgress(const ProgressSnapshot &snapshot) override;
    void onLog(const QString &line) override;
    bool isCancelled() const override;
    bool isPaused() const override;
    void waitWhilePaused() override;

    void cancel();
    void togglePause();
    void setPaused(bool paused);
    void reset();

    ProgressSnapshot snapshot() const;
    QStringList takeLogs();
    QStringList peekLogs() const;

signals:
    void progressUpdated(const ProgressSnapshot &snapshot);
    void logAppended(const QString &line);
    void pausedChanged(bool paused);

private:
    void applyPausedState(bool paused);

    QAtomicInt m_cancelled = 0;
    QAtomicInt m_paused = 0;
    mutable QMutex m_snapshotMutex;
    ProgressSnapshot m_snapshot;
    mutable QMutex m_logMutex;
    QStringList m_logs;
    QMutex m_pauseMutex;
    QWaitCondition m_pauseCondition;
};
