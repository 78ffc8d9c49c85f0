#pragma once

#include <QString>
#include <QStringList>

struct SyncOptions {
    static constexpr int defaultThreadCount = 1;
    static constexpr int shorthandThreadCount = 8;
    static constexpr int defaultRetries = 1000000;
    static constexpr int defaultRetryWaitSeconds = 30;

    QStringList sources;
    QString destination;
    QStringList patterns;

    bool recursive = false;
    bool includeEmptyDirs = false;
    bool restartable = false;
    bool backupMode = false;
    bool purge = false;
    bool mirror = false;
    bool moveFiles = false;
    bool moveDirs = false;
    QString attributesAdd;
    QString attributesRemove;
    int threads = defaultThreadCount;
    int retries = defaultRetries;
    int retryWaitSeconds = defaultRetryWaitSeconds;
    QString logFile;
    bool listOnly = false;
    bool showProgress = true;
    bool logFileNames = true;
    bool emptyFiles = false;
    bool childrenOnly = false;
    bool shredFiles = false;
    bool forceOverwrite = false;
    bool preserveRoot = false;

    bool recursionEnabled() const { return recursive || mirror; }
    bool includeEmptyEnabled() const { return includeEmptyDirs || mirror; }
    bool purgeEnabled() const { return purge || mirror; }
    bool moveFilesEnabled() const { return moveFiles || moveDirs; }

    void enableMirror();
    void enableMoveDirs();
    QStringList effectivePatterns() const;
    QString toFlagString() const;
};
