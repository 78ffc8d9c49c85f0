#pragma once

#include <QElapsedTimer>

#include "ProgressObserver.h"

class SyncStatistics;

/**
 * @brief Observer wrapper that turns per-file byte reports into run totals.
 *
 * Files and bytes done come from the run statistics, totals from the scan,
 * and throughput from the time elapsed since construction. Every other call
 * is forwarded unchanged.
 */
class RunProgressTracker : public ProgressObserver
{
public:
    RunProgressTracker(ProgressObserver &inner,
                       const SyncStatistics &statistics,
                       quint64 filesTotal,
                       quint64 bytesTotal);

    void onProgress(const ProgressSnapshot &snapshot) override;
    void onLog(const QString &line) override;
    bool isCancelled() const override;
    bool isPaused() const override;
    void waitWhilePaused() override;

private:
    ProgressObserver &m_inner;
    const SyncStatistics &m_statistics;
    quint64 m_filesTotal = 0;
    quint64 m_bytesTotal = 0;
    QElapsedTimer m_timer;
};
