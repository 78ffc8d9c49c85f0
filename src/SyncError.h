#pragma once

#include <QString>

struct SyncError {
    enum class Kind {
        None,
        Precondition,
        TransientIo,
        DirectoryRead,
        DirectoryCreate,
        Removal
    };

    Kind kind = Kind::None;
    QString message;
    QString sourcePath;
    QString targetPath;
    int attempt = 0;

    bool isSet() const { return kind != Kind::None; }

    static SyncError precondition(const QString &message)
    {
        SyncError error;
        error.kind = Kind::Precondition;
        error.message = message;
        return error;
    }

    static SyncError directoryRead(const QString &path, const QString &message)
    {
        SyncError error;
        error.kind = Kind::DirectoryRead;
        error.sourcePath = path;
        error.message = message;
        return error;
    }

    static SyncError directoryCreate(const QString &path, const QString &message)
    {
        SyncError error;
        error.kind = Kind::DirectoryCreate;
        error.targetPath = path;
        error.message = message;
        return error;
    }

    static SyncError removal(const QString &path, const QString &message)
    {
        SyncError error;
        error.kind = Kind::Removal;
        error.targetPath = path;
        error.message = message;
        return error;
    }

    static SyncError transientIo(const QString &sourcePath,
                                 const QString &targetPath,
                                 const QString &message,
                                 int attempt)
    {
        SyncError error;
        error.kind = Kind::TransientIo;
        error.sourcePath = sourcePath;
        error.targetPath = targetPath;
        error.message = message;
        error.attempt = attempt;
        return error;
    }
};

/**
 * @brief Stores an error into an optional out-parameter.
 * @param target Destination pointer, may be null.
 * @param error Error to store.
 */
inline void setSyncError(SyncError *target, const SyncError &error)
{
    if (target) {
        *target = error;
    }
}
