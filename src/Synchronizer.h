#pragma once

#include <QFileInfo>
#include <QSet>
#include <QString>

#include <functional>

#include "FileTransfer.h"
#include "SyncError.h"

class PatternMatcher;
class ProgressObserver;
class QThreadPool;
class RunLog;
class SyncStatistics;
struct SyncOptions;

/**
 * @brief Recursively reconciles a source folder with a target folder.
 *
 * With a thread pool, sibling entries of one folder run concurrently and the
 * first unrecovered error stops the siblings that have not started yet.
 */
class Synchronizer
{
public:
    Synchronizer(const SyncOptions &options,
                 const PatternMatcher &matcher,
                 SyncStatistics &statistics,
                 ProgressObserver &observer,
                 RunLog &log,
                 QThreadPool *pool = nullptr);

    bool synchronize(const QString &sourceFolder, const QString &targetFolder, SyncError *error);
    bool synchronizeChildren(const QString &sourceRoot, const QString &targetFolder, SyncError *error);
    bool synchronizeFile(const QString &sourceFile, const QString &targetFolder, SyncError *error);

private:
    using EntryTask = std::function<bool(const QFileInfo &, SyncError *)>;

    bool ensureTargetFolder(const QString &targetFolder, SyncError *error);
    bool readFolder(const QString &folderPath, QFileInfoList *entries, SyncError *error);
    bool processEntry(const QFileInfo &entry, const QString &targetFolder, SyncError *error);
    bool processSubfolder(const QFileInfo &entry, const QString &targetFolder, SyncError *error);
    bool purgeTarget(const QString &targetFolder, const QSet<QString> &sourceNames, SyncError *error);
    bool removeEntry(const QFileInfo &entry, SyncError *error);
    bool runBatch(const QFileInfoList &entries, const EntryTask &task, SyncError *error);

    const SyncOptions &m_options;
    const PatternMatcher &m_matcher;
    SyncStatistics &m_statistics;
    ProgressObserver &m_observer;
    RunLog &m_log;
    QThreadPool *m_pool = nullptr;
    FileTransfer m_transfer;
};
