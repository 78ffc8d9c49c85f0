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

#include "FileTransfer.h"

#include <QByteArray>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QThread>

#include "FileOperationUtils.h"
#include "Logging.h"
#include "PlatformUtils.h"
#include "ProgressObserver.h"
#include "RunLog.h"
#include "SecureEraser.h"
#include "SyncOptions.h"
#include "SyncStatistics.h"

namespace {
struct FileTransferConstants {
    static constexpr int firstAttempt = 1;
    static constexpr unsigned long retrySliceMs = 100;
    static constexpr qint64 millisecondsPerSecond = 1000;
};
} // namespace

FileMeta FileMeta::fromInfo(const QFileInfo &info)
{
    FileMeta meta;
    meta.exists = info.exists();
    if (meta.exists) {
        meta.modifiedMs = info.lastModified().toMSecsSinceEpoch();
        meta.size = info.size();
    }
    return meta;
}

FileTransfer::FileTransfer(const SyncOptions &options,
                           SyncStatistics &statistics,
                           ProgressObserver &observer,
                           RunLog &log)
    : m_options(options)
    , m_statistics(statistics)
    , m_observer(observer)
    , m_log(log)
{
    // Letters are validated before a run starts; unknown ones leave the mask empty.
    if (!PlatformUtils::parseAttributeMask(m_options.attributesAdd, &m_attributesAdd, nullptr)) {
        m_attributesAdd = 0;
    }
    if (!PlatformUtils::parseAttributeMask(m_options.attributesRemove, &m_attributesRemove, nullptr)) {
        m_attributesRemove = 0;
    }
}

/**
 * @brief Decides whether a source file must be copied over its target.
 * @param source Source file metadata.
 * @param target Target file metadata, exists == false when absent.
 * @param forceOverwrite Copy regardless of timestamps and sizes.
 * @return True when the source is newer, or equally old with another size.
 */
bool FileTransfer::shouldCopy(const FileMeta &source, const FileMeta &target, bool forceOverwrite)
{
    if (forceOverwrite || !target.exists) {
        return true;
    }
    if (source.modifiedMs > target.modifiedMs) {
        return true;
    }
    return source.modifiedMs == target.modifiedMs && source.size != target.size;
}

/**
 * @brief Transfers one file, retrying failed attempts.
 * @param sourcePath Source file path.
 * @param targetPath Target file path.
 * @param error Optional output error, set when the file finally failed.
 * @return False only when the file could not be transferred; cancellation returns true.
 */
bool FileTransfer::transfer(const QString &sourcePath, const QString &targetPath, SyncError *error)
{
    if (m_observer.isCancelled()) {
        return true;
    }
    m_observer.waitWhilePaused();
    if (m_observer.isCancelled()) {
        return true;
    }

    const QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.exists()) {
        const QString message = QStringLiteral("Source file not found");
        m_log.log(QStringLiteral("Failed to copy: %1 -> %2, Error: %3").arg(sourcePath, targetPath, message));
        m_statistics.addFileFailed();
        setSyncError(error, SyncError::transientIo(sourcePath, targetPath, message, 0));
        return false;
    }
    const QFileInfo targetInfo(targetPath);
    if (!shouldCopy(FileMeta::fromInfo(sourceInfo), FileMeta::fromInfo(targetInfo), m_options.forceOverwrite)) {
        m_statistics.addFileSkipped();
        return true;
    }

    const quint64 sourceSize = static_cast<quint64>(sourceInfo.size());
    if (m_options.listOnly) {
        m_log.log(QStringLiteral("Would copy file: %1 -> %2").arg(sourcePath, targetPath));
        m_statistics.addFileCopied(sourceSize);
        return true;
    }
    if (m_options.logFileNames) {
        m_log.log(QStringLiteral("Copying file: %1 -> %2").arg(sourcePath, targetPath));
    }

    const int maxAttempts = qMax(FileTransferConstants::firstAttempt, m_options.retries);
    for (int attempt = FileTransferConstants::firstAttempt;; ++attempt) {
        if (m_observer.isCancelled()) {
            return true;
        }
        QString copyError;
        const CopyOutcome outcome = copyContent(sourcePath, targetPath, sourceInfo.size(), &copyError);
        if (outcome == CopyOutcome::Cancelled) {
            return true;
        }
        if (outcome == CopyOutcome::Copied) {
            return finishTransfer(sourceInfo, targetPath, error);
        }

        qCDebug(lcTransfer) << "attempt" << attempt << "failed" << sourcePath << copyError;
        if (attempt >= maxAttempts) {
            m_log.log(QStringLiteral("Failed to copy after %1 attempts: %2 -> %3, Error: %4")
                          .arg(attempt)
                          .arg(sourcePath, targetPath, copyError));
            m_statistics.addFileFailed();
            setSyncError(error, SyncError::transientIo(sourcePath, targetPath, copyError, attempt));
            return false;
        }
        m_log.log(QStringLiteral("Retry %1 of %2: %3 -> %4, Error: %5")
                      .arg(attempt)
                      .arg(maxAttempts)
                      .arg(sourcePath, targetPath, copyError));
        if (!waitBeforeRetry()) {
            return true;
        }
    }
}

/**
 * @brief Copies the source over the target.
 *
 * A target left incomplete by a failure or a cancellation is removed, so its
 * fresh modification time cannot mark it up to date on the next run.
 */
FileTransfer::CopyOutcome FileTransfer::copyContent(const QString &sourcePath,
                                                    const QString &targetPath,
                                                    qint64 sourceSize,
                                                    QString *error) const
{
    if (m_options.emptyFiles) {
        return createPlaceholder(targetPath, error);
    }

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        *error = source.errorString();
        return CopyOutcome::Failed;
    }
    QFile target(targetPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *error = target.errorString();
        return CopyOutcome::Failed;
    }

    const CopyOutcome outcome = streamContent(source, target, sourceSize, error);
    if (outcome != CopyOutcome::Copied) {
        target.close();
        if (!target.remove()) {
            qCWarning(lcTransfer) << "cannot remove incomplete target" << targetPath << target.errorString();
        }
    }
    return outcome;
}

/**
 * @brief Streams the source into the target in fixed-size chunks.
 *
 * Reports per-file progress after each chunk and honors pause and
 * cancellation between chunks.
 */
FileTransfer::CopyOutcome FileTransfer::streamContent(QFile &source,
                                                      QFile &target,
                                                      qint64 sourceSize,
                                                      QString *error) const
{
    ProgressSnapshot snapshot;
    snapshot.state = ProgressState::Copying;
    snapshot.currentFile = source.fileName();
    snapshot.currentFileBytesTotal = static_cast<quint64>(sourceSize);

    QByteArray buffer(static_cast<int>(bufferSize), '\0');
    quint64 copied = 0;
    while (true) {
        if (m_observer.isCancelled()) {
            return CopyOutcome::Cancelled;
        }
        m_observer.waitWhilePaused();
        if (m_observer.isCancelled()) {
            return CopyOutcome::Cancelled;
        }

        const qint64 bytesRead = source.read(buffer.data(), bufferSize);
        if (bytesRead < 0) {
            *error = source.errorString();
            return CopyOutcome::Failed;
        }
        if (bytesRead == 0) {
            break;
        }
        if (target.write(buffer.constData(), bytesRead) != bytesRead) {
            *error = target.errorString();
            return CopyOutcome::Failed;
        }
        if (m_options.restartable && !target.flush()) {
            *error = target.errorString();
            return CopyOutcome::Failed;
        }

        copied += static_cast<quint64>(bytesRead);
        snapshot.currentFileBytesDone = copied;
        m_observer.onProgress(snapshot);
    }

    if (!target.flush()) {
        *error = target.errorString();
        return CopyOutcome::Failed;
    }
    target.close();
    return CopyOutcome::Copied;
}

FileTransfer::CopyOutcome FileTransfer::createPlaceholder(const QString &targetPath, QString *error) const
{
    QFile target(targetPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *error = target.errorString();
        return CopyOutcome::Failed;
    }
    target.close();
    return CopyOutcome::Copied;
}

/**
 * @brief Applies times and attributes, counts the copy and handles move semantics.
 */
bool FileTransfer::finishTransfer(const QFileInfo &sourceInfo, const QString &targetPath, SyncError *error)
{
    QString timeError;
    if (!FileOperationUtils::applyFileTimes(sourceInfo, targetPath, &timeError)) {
        qCWarning(lcTransfer) << "cannot replicate modification time" << targetPath << timeError;
    }
    QString attributeError;
    if (!PlatformUtils::applyAttributeMasks(targetPath, m_attributesAdd, m_attributesRemove, &attributeError)) {
        qCWarning(lcTransfer) << "cannot apply attributes" << targetPath << attributeError;
    }
    m_statistics.addFileCopied(static_cast<quint64>(sourceInfo.size()));

    if (!m_options.moveFilesEnabled()) {
        return true;
    }
    const QString sourcePath = sourceInfo.absoluteFilePath();
    QString removeError;
    const bool removed = m_options.shredFiles
        ? SecureEraser::eraseFile(sourcePath, &m_log, &removeError)
        : FileOperationUtils::removePath(sourcePath, &removeError);
    if (!removed) {
        m_log.log(QStringLiteral("Failed to remove moved file: %1, Error: %2").arg(sourcePath, removeError));
        setSyncError(error, SyncError::removal(sourcePath, removeError));
        return false;
    }
    return true;
}

/**
 * @brief Sleeps for the configured retry delay.
 * @return False if the run was cancelled while waiting.
 */
bool FileTransfer::waitBeforeRetry() const
{
    QElapsedTimer timer;
    timer.start();
    const qint64 waitMs = static_cast<qint64>(m_options.retryWaitSeconds) * FileTransferConstants::millisecondsPerSecond;
    while (timer.elapsed() < waitMs) {
        if (m_observer.isCancelled()) {
            return false;
        }
        const qint64 remaining = waitMs - timer.elapsed();
        QThread::msleep(static_cast<unsigned long>(qMax<qint64>(0, qMin<qint64>(remaining, FileTransferConstants::retrySliceMs))));
    }
    return !m_observer.isCancelled();
}
