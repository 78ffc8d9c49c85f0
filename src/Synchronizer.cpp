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

#include "Synchronizer.h"

#include <QDir>
#include <QFuture>
#include <QMutex>
#include <QMutexLocker>
#include <QThreadPool>
#include <QVector>
#include <QtConcurrent/QtConcurrentRun>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PatternMatcher.h"
#include "ProgressObserver.h"
#include "RunLog.h"
#include "SecureEraser.h"
#include "SyncOptions.h"
#include "SyncStatistics.h"

Synchronizer::Synchronizer(const SyncOptions &options,
                           const PatternMatcher &matcher,
                           SyncStatistics &statistics,
                           ProgressObserver &observer,
                           RunLog &log,
                           QThreadPool *pool)
    : m_options(options)
    , m_matcher(matcher)
    , m_statistics(statistics)
    , m_observer(observer)
    , m_log(log)
    , m_pool(pool)
    , m_transfer(options, statistics, observer, log)
{
}

/**
 * @brief Synchronizes one source folder into a target folder, recursively.
 * @param sourceFolder Existing source folder.
 * @param targetFolder Target folder, created when missing.
 * @param error Optional output error, set when the subtree failed.
 * @return False on the first unrecovered error; cancellation returns true.
 */
bool Synchronizer::synchronize(const QString &sourceFolder, const QString &targetFolder, SyncError *error)
{
    if (m_observer.isCancelled()) {
        return true;
    }
    m_observer.waitWhilePaused();
    if (m_observer.isCancelled()) {
        return true;
    }

    if (!ensureTargetFolder(targetFolder, error)) {
        return false;
    }

    QFileInfoList entries;
    if (!readFolder(sourceFolder, &entries, error)) {
        return false;
    }

    // Purge compares against the names present when the folder was read.
    QSet<QString> sourceNames;
    sourceNames.reserve(entries.size());
    for (const QFileInfo &entry : entries) {
        sourceNames.insert(entry.fileName());
    }

    const EntryTask task = [this, targetFolder](const QFileInfo &entry, SyncError *taskError) {
        return processEntry(entry, targetFolder, taskError);
    };
    if (!runBatch(entries, task, error)) {
        return false;
    }

    if (m_observer.isCancelled()) {
        return true;
    }
    if (m_options.purgeEnabled() && !m_options.listOnly) {
        return purgeTarget(targetFolder, sourceNames, error);
    }
    return true;
}

/**
 * @brief Synchronizes every immediate subfolder of a source root separately.
 *
 * Each child lands in targetFolder/<child name>. Files directly inside the
 * root are ignored.
 */
bool Synchronizer::synchronizeChildren(const QString &sourceRoot, const QString &targetFolder, SyncError *error)
{
    QFileInfoList entries;
    if (!readFolder(sourceRoot, &entries, error)) {
        return false;
    }

    const EntryTask task = [this, targetFolder](const QFileInfo &entry, SyncError *taskError) {
        if (m_observer.isCancelled() || !entry.isDir()) {
            return true;
        }
        const QString name = entry.fileName();
        m_log.log(QStringLiteral("\nProcessing child directory: %1").arg(name));
        return synchronize(entry.absoluteFilePath(), QDir(targetFolder).filePath(name), taskError);
    };
    return runBatch(entries, task, error);
}

/**
 * @brief Transfers a single source file into a target folder.
 */
bool Synchronizer::synchronizeFile(const QString &sourceFile, const QString &targetFolder, SyncError *error)
{
    if (m_observer.isCancelled()) {
        return true;
    }
    if (!ensureTargetFolder(targetFolder, error)) {
        return false;
    }
    const QFileInfo info(sourceFile);
    if (!m_matcher.matches(info.fileName())) {
        return true;
    }
    return m_transfer.transfer(info.absoluteFilePath(), QDir(targetFolder).filePath(info.fileName()), error);
}

bool Synchronizer::ensureTargetFolder(const QString &targetFolder, SyncError *error)
{
    if (QFileInfo::exists(targetFolder)) {
        return true;
    }
    if (m_options.listOnly) {
        m_log.log(QStringLiteral("Would create directory: %1").arg(targetFolder));
        m_statistics.addDirCreated();
        return true;
    }

    m_log.log(QStringLiteral("Creating directory: %1").arg(targetFolder));
    QString createError;
    if (!FileOperationUtils::createFolder(targetFolder, &createError)) {
        m_log.log(QStringLiteral("Failed to create directory: %1, Error: %2").arg(targetFolder, createError));
        setSyncError(error, SyncError::directoryCreate(targetFolder, createError));
        return false;
    }
    m_statistics.addDirCreated();
    return true;
}

bool Synchronizer::readFolder(const QString &folderPath, QFileInfoList *entries, SyncError *error)
{
    QString readError;
    if (FileOperationUtils::listEntries(folderPath, entries, &readError)) {
        return true;
    }
    m_log.log(QStringLiteral("Failed to read directory: %1, Error: %2").arg(folderPath, readError));
    setSyncError(error, SyncError::directoryRead(folderPath, readError));
    return false;
}

bool Synchronizer::processEntry(const QFileInfo &entry, const QString &targetFolder, SyncError *error)
{
    if (m_observer.isCancelled()) {
        return true;
    }

    const QString name = entry.fileName();
    if (entry.isFile()) {
        if (!m_matcher.matches(name)) {
            return true;
        }
        return m_transfer.transfer(entry.absoluteFilePath(), QDir(targetFolder).filePath(name), error);
    }
    if (entry.isDir() && m_options.recursionEnabled()) {
        return processSubfolder(entry, targetFolder, error);
    }
    return true;
}

bool Synchronizer::processSubfolder(const QFileInfo &entry, const QString &targetFolder, SyncError *error)
{
    const QString sourcePath = entry.absoluteFilePath();
    if (!m_options.includeEmptyEnabled() && FileOperationUtils::isFolderEmpty(sourcePath)) {
        if (m_options.logFileNames) {
            m_log.log(QStringLiteral("Skipping empty directory: %1").arg(sourcePath));
        }
        m_statistics.addDirSkipped();
        return true;
    }

    if (!synchronize(sourcePath, QDir(targetFolder).filePath(entry.fileName()), error)) {
        return false;
    }

    if (!m_options.moveDirs || m_options.listOnly) {
        return true;
    }
    m_observer.waitWhilePaused();
    if (!m_observer.isCancelled() && FileOperationUtils::isFolderEmpty(sourcePath)) {
        if (!QDir().rmdir(sourcePath)) {
            qCWarning(lcEngine) << "cannot remove moved folder" << sourcePath;
        }
    }
    return true;
}

/**
 * @brief Removes target entries whose names were not in the source folder.
 */
bool Synchronizer::purgeTarget(const QString &targetFolder, const QSet<QString> &sourceNames, SyncError *error)
{
    QFileInfoList targetEntries;
    QString readError;
    if (!FileOperationUtils::listEntries(targetFolder, &targetEntries, &readError)) {
        qCWarning(lcEngine) << "cannot read target folder for purge" << targetFolder << readError;
        return true;
    }

    QFileInfoList extraneous;
    for (const QFileInfo &entry : targetEntries) {
        if (!sourceNames.contains(entry.fileName())) {
            extraneous.append(entry);
        }
    }

    const EntryTask task = [this](const QFileInfo &entry, SyncError *taskError) {
        return removeEntry(entry, taskError);
    };
    return runBatch(extraneous, task, error);
}

bool Synchronizer::removeEntry(const QFileInfo &entry, SyncError *error)
{
    if (m_observer.isCancelled()) {
        return true;
    }
    m_observer.waitWhilePaused();
    if (m_observer.isCancelled()) {
        return true;
    }

    const QString path = entry.absoluteFilePath();
    const QFileInfo current(path);
    if (!current.exists() && !current.isSymLink()) {
        return true;
    }

    const bool isFolder = current.isDir() && !current.isSymLink();
    const QString kind = isFolder ? QStringLiteral("directory") : QStringLiteral("file");
    if (m_options.shredFiles) {
        m_log.log(QStringLiteral("Securely removing %1: %2").arg(kind, path));
    } else {
        m_log.log(QStringLiteral("Removing %1: %2").arg(kind, path));
    }

    QString removeError;
    bool removed = false;
    if (m_options.shredFiles) {
        removed = isFolder ? SecureEraser::eraseFolder(path, &m_log, &removeError)
                           : SecureEraser::eraseFile(path, &m_log, &removeError);
    } else {
        removed = FileOperationUtils::removePath(path, &removeError);
    }
    if (!removed) {
        m_log.log(QStringLiteral("Failed to remove %1: %2, Error: %3").arg(kind, path, removeError));
        setSyncError(error, SyncError::removal(path, removeError));
        return false;
    }

    if (isFolder) {
        m_statistics.addDirRemoved();
    } else {
        m_statistics.addFileRemoved();
    }
    return true;
}

/**
 * @brief Runs a task over sibling entries and stops at the first error.
 *
 * Without a pool the entries are processed in order. With a pool every entry
 * is submitted, tasks that start after a sibling failed return immediately,
 * and the first recorded error is returned once all submitted tasks ended.
 */
bool Synchronizer::runBatch(const QFileInfoList &entries, const EntryTask &task, SyncError *error)
{
    if (!m_pool || entries.size() < 2) {
        for (const QFileInfo &entry : entries) {
            if (!task(entry, error)) {
                return false;
            }
        }
        return true;
    }

    QAtomicInt aborted = 0;
    QMutex errorMutex;
    SyncError firstError;
    bool failed = false;

    QVector<QFuture<void>> futures;
    futures.reserve(entries.size());
    for (const QFileInfo &entry : entries) {
        futures.append(QtConcurrent::run(m_pool, [&, entry]() {
            if (aborted.loadAcquire() != 0) {
                return;
            }
            SyncError taskError;
            if (task(entry, &taskError)) {
                return;
            }
            aborted.storeRelease(1);
            QMutexLocker locker(&errorMutex);
            if (!failed) {
                failed = true;
                firstError = taskError;
            }
        }));
    }

    // Waiting runs not-yet-started tasks on this thread, so nested batches
    // cannot exhaust the pool.
    for (QFuture<void> &future : futures) {
        future.waitForFinished();
    }

    if (!failed) {
        return true;
    }
    setSyncError(error, firstError);
    return false;
}
