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

#include "SyncEngine.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QThreadPool>

#include <memory>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PatternMatcher.h"
#include "PlatformUtils.h"
#include "ProgressObserver.h"
#include "RunLog.h"
#include "RunProgressTracker.h"
#include "SourceScanner.h"
#include "Synchronizer.h"

namespace {
constexpr qint64 millisecondsPerSecond = 1000;
const QString clockFormat = QStringLiteral("HH:mm:ss");
} // namespace

SyncEngine::SyncEngine(const SyncOptions &options, ProgressObserver &observer)
    : m_options(options)
    , m_observer(observer)
{
}

/**
 * @brief Executes the run and reports its terminal state.
 * @return Final statistics, terminal state and, when failed, the error.
 */
SyncRunResult SyncEngine::run()
{
    SyncRunResult result;
    SyncStatistics statistics;
    RunLog log(m_observer);

    if (!checkPreconditions(log, &result.error)) {
        result.state = ProgressState::Failed;
        publishState(result.state, result.totals, 0, 0);
        return result;
    }
    if (!m_options.logFile.isEmpty()) {
        QString logError;
        if (!log.openFile(m_options.logFile, &logError)) {
            log.log(QStringLiteral("ERROR: %1").arg(logError));
            result.error = SyncError::precondition(logError);
            result.state = ProgressState::Failed;
            publishState(result.state, result.totals, 0, 0);
            return result;
        }
    }

    QElapsedTimer elapsed;
    elapsed.start();
    log.log(bannerText(QDateTime::currentDateTime()));

    const PatternMatcher matcher(m_options.effectivePatterns());
    SourceScanner::ScanResult scan;
    if (m_options.showProgress) {
        publishState(ProgressState::Scanning, result.totals, 0, 0);
        scan = SourceScanner::scanSources(m_options.sources, matcher, m_options.recursionEnabled(), m_observer, &log);
        publishState(ProgressState::Scanning, result.totals, scan.fileCount, scan.totalBytes);
    }

    bool ok = !m_observer.isCancelled() && prepareDestination(log, &result.error);
    if (ok) {
        publishState(ProgressState::Copying, result.totals, scan.fileCount, scan.totalBytes);

        RunProgressTracker tracker(m_observer, statistics, scan.fileCount, scan.totalBytes);
        std::unique_ptr<QThreadPool> pool;
        if (m_options.threads > 1) {
            pool = std::make_unique<QThreadPool>();
            pool->setMaxThreadCount(m_options.threads);
        }
        Synchronizer synchronizer(m_options, matcher, statistics, tracker, log, pool.get());
        ok = dispatchRoots(synchronizer, &result.error);
        if (pool) {
            pool->waitForDone();
        }
    }

    result.totals = statistics.totals();
    if (m_observer.isCancelled()) {
        result.state = ProgressState::Cancelled;
        result.error = SyncError();
    } else if (!ok) {
        result.state = ProgressState::Failed;
        log.log(QStringLiteral("ERROR: %1").arg(result.error.message));
    } else {
        result.state = ProgressState::Completed;
        log.log(summaryText(QDateTime::currentDateTime(), result.totals, elapsed.elapsed() / millisecondsPerSecond));
    }
    qCDebug(lcEngine) << "run finished" << progressStateName(result.state);
    publishState(result.state, result.totals, scan.fileCount, scan.totalBytes);
    return result;
}

/**
 * @brief Validates sources, destination nesting and attribute letters.
 */
bool SyncEngine::checkPreconditions(RunLog &log, SyncError *error) const
{
    const auto fail = [&log, error](const QString &message) {
        log.log(QStringLiteral("ERROR: %1").arg(message));
        setSyncError(error, SyncError::precondition(message));
        return false;
    };

    if (m_options.sources.isEmpty()) {
        return fail(QStringLiteral("No source path given"));
    }
    if (m_options.destination.isEmpty()) {
        return fail(QStringLiteral("No destination path given"));
    }

    for (const QString &source : m_options.sources) {
        if (!QFileInfo::exists(source)) {
            return fail(QStringLiteral("Source path does not exist: %1").arg(source));
        }
        if (PlatformUtils::isPathInside(source, m_options.destination)) {
            return fail(QStringLiteral("Cannot copy source into its own subdirectory: %1 -> %2")
                            .arg(source, m_options.destination));
        }
    }

    quint32 mask = 0;
    QString maskError;
    if (!PlatformUtils::parseAttributeMask(m_options.attributesAdd, &mask, &maskError)
        || !PlatformUtils::parseAttributeMask(m_options.attributesRemove, &mask, &maskError)) {
        return fail(maskError);
    }
    return true;
}

bool SyncEngine::prepareDestination(RunLog &log, SyncError *error) const
{
    if (QFileInfo::exists(m_options.destination)) {
        return true;
    }
    if (m_options.listOnly) {
        log.log(QStringLiteral("Would create destination directory: %1").arg(m_options.destination));
        return true;
    }
    log.log(QStringLiteral("Creating destination directory: %1").arg(m_options.destination));
    QString createError;
    if (!FileOperationUtils::createFolder(m_options.destination, &createError)) {
        setSyncError(error, SyncError::directoryCreate(m_options.destination, createError));
        return false;
    }
    return true;
}

/**
 * @brief Hands every source root to the synchronizer, in order.
 *
 * Folder roots sync into the destination (or destination/<root name> when
 * the root is preserved), file roots are transferred into it. In
 * children-only mode each subfolder of a folder root is synced separately.
 */
bool SyncEngine::dispatchRoots(Synchronizer &synchronizer, SyncError *error) const
{
    for (const QString &source : m_options.sources) {
        if (m_observer.isCancelled()) {
            return true;
        }
        const QFileInfo info(source);
        const QString sourcePath = info.absoluteFilePath();
        bool ok = true;
        if (m_options.childrenOnly) {
            if (info.isDir()) {
                ok = synchronizer.synchronizeChildren(sourcePath, m_options.destination, error);
            }
        } else if (info.isDir()) {
            const QString target = m_options.preserveRoot
                ? QDir(m_options.destination).filePath(info.fileName())
                : m_options.destination;
            ok = synchronizer.synchronize(sourcePath, target, error);
        } else {
            ok = synchronizer.synchronizeFile(sourcePath, m_options.destination, error);
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

QString SyncEngine::bannerText(const QDateTime &startedAt) const
{
    return QStringLiteral("Syncman - Started: %1\n"
                          "Sources: %2\n"
                          "Destination: %3\n"
                          "Patterns: %4\n"
                          "Options: %5\n")
        .arg(startedAt.toString(clockFormat),
             m_options.sources.join(QStringLiteral(", ")),
             m_options.destination,
             m_options.effectivePatterns().join(QLatin1Char(' ')),
             m_options.toFlagString());
}

QString SyncEngine::summaryText(const QDateTime &finishedAt,
                                const SyncStatistics::Totals &totals,
                                qint64 elapsedSeconds) const
{
    QString text = QStringLiteral("Syncman - Finished: %1\n"
                                  "Sources: %2\n"
                                  "Destination: %3\n\n")
                       .arg(finishedAt.toString(clockFormat),
                            m_options.sources.join(QStringLiteral(", ")),
                            m_options.destination);
    text += QStringLiteral("Statistics:\n");
    text += QStringLiteral("    Directories: %1\n").arg(totals.dirsCreated);
    text += QStringLiteral("    Files: %1\n").arg(totals.filesCopied);
    text += QStringLiteral("    Bytes: %1\n").arg(totals.bytesCopied);
    text += QStringLiteral("    Directories skipped: %1\n").arg(totals.dirsSkipped);
    text += QStringLiteral("    Files skipped: %1\n").arg(totals.filesSkipped);
    text += QStringLiteral("    Files failed: %1\n").arg(totals.filesFailed);
    text += QStringLiteral("    Directories removed: %1\n").arg(totals.dirsRemoved);
    text += QStringLiteral("    Files removed: %1\n\n").arg(totals.filesRemoved);
    text += QStringLiteral("Elapsed time: %1 seconds\n").arg(elapsedSeconds);
    return text;
}

void SyncEngine::publishState(ProgressState state, const SyncStatistics::Totals &totals,
                              quint64 filesTotal, quint64 bytesTotal)
{
    ProgressSnapshot snapshot;
    snapshot.state = state;
    snapshot.filesDone = totals.filesCopied;
    snapshot.bytesDone = totals.bytesCopied;
    snapshot.filesTotal = filesTotal;
    snapshot.bytesTotal = bytesTotal;
    m_observer.onProgress(snapshot);
}
