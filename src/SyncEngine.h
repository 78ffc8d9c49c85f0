#pragma once

#include <QDateTime>
#include <QString>

#include "ProgressTypes.h"
#include "SyncError.h"
#include "SyncOptions.h"
#include "SyncStatistics.h"

class ProgressObserver;
class RunLog;
class Synchronizer;

struct SyncRunResult {
    ProgressState state = ProgressState::Idle;
    SyncStatistics::Totals totals;
    SyncError error;

    bool succeeded() const { return state == ProgressState::Completed || state == ProgressState::Cancelled; }
};

/**
 * @brief Runs one synchronization: preconditions, scan, root dispatch, summary.
 *
 * The engine keeps its own copy of the options. A new SyncStatistics and
 * worker pool are created for every call to run(). The pool holds
 * options.threads workers; a thread waiting on a batch may also run queued
 * tasks of that batch itself, so up to threads + 1 entries can be processed
 * at once.
 */
class SyncEngine
{
public:
    SyncEngine(const SyncOptions &options, ProgressObserver &observer);

    SyncRunResult run();

    const SyncOptions &options() const { return m_options; }

private:
    bool checkPreconditions(RunLog &log, SyncError *error) const;
    bool prepareDestination(RunLog &log, SyncError *error) const;
    bool dispatchRoots(Synchronizer &synchronizer, SyncError *error) const;
    QString bannerText(const QDateTime &startedAt) const;
    QString summaryText(const QDateTime &finishedAt,
                        const SyncStatistics::Totals &totals,
                        qint64 elapsedSeconds) const;
    void publishState(ProgressState state, const SyncStatistics::Totals &totals,
                      quint64 filesTotal, quint64 bytesTotal);

    const SyncOptions m_options;
    ProgressObserver &m_observer;
};
