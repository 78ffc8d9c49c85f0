#pragma once

#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QtGlobal>

#include "SyncError.h"

class ProgressObserver;
class RunLog;
class SyncStatistics;
struct SyncOptions;

struct FileMeta {
    bool exists = false;
    qint64 modifiedMs = 0;
    qint64 size = 0;

    static FileMeta fromInfo(const QFileInfo &info);
};

/**
 * @brief Copies, skips or retries a single file according to the run options.
 *
 * One instance is shared by all workers of a run; transfer() is reentrant.
 */
class FileTransfer
{
public:
    static constexpr qint64 bufferSize = 64 * 1024;

    FileTransfer(const SyncOptions &options,
                 SyncStatistics &statistics,
                 ProgressObserver &observer,
                 RunLog &log);

    static bool shouldCopy(const FileMeta &source, const FileMeta &target, bool forceOverwrite);

    bool transfer(const QString &sourcePath, const QString &targetPath, SyncError *error);

private:
    enum class CopyOutcome {
        Copied,
        Cancelled,
        Failed
    };

    CopyOutcome copyContent(const QString &sourcePath,
                            const QString &targetPath,
                            qint64 sourceSize,
                            QString *error) const;
    CopyOutcome streamContent(QFile &source, QFile &target, qint64 sourceSize, QString *error) const;
    CopyOutcome createPlaceholder(const QString &targetPath, QString *error) const;
    bool finishTransfer(const QFileInfo &sourceInfo, const QString &targetPath, SyncError *error);
    bool waitBeforeRetry() const;

    const SyncOptions &m_options;
    SyncStatistics &m_statistics;
    ProgressObserver &m_observer;
    RunLog &m_log;
    quint32 m_attributesAdd = 0;
    quint32 m_attributesRemove = 0;
};
