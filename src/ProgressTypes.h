#pragma once

#include <QMetaType>
#include <QString>
#include <QtGlobal>

enum class ProgressState {
    Idle,
    Scanning,
    Copying,
    Paused,
    Cancelled,
    Completed,
    Failed
};

inline bool isTerminalState(ProgressState state)
{
    return state == ProgressState::Cancelled
        || state == ProgressState::Completed
        || state == ProgressState::Failed;
}

QString progressStateName(ProgressState state);

struct ProgressSnapshot {
    ProgressState state = ProgressState::Idle;
    QString currentFile;
    quint64 filesDone = 0;
    quint64 filesTotal = 0;
    quint64 bytesDone = 0;
    quint64 bytesTotal = 0;
    quint64 currentFileBytesDone = 0;
    quint64 currentFileBytesTotal = 0;
    quint64 bytesPerSecond = 0;

    double percentage() const;
    double filePercentage() const;
};

Q_DECLARE_METATYPE(ProgressSnapshot)
