#pragma once

#include <QFile>
#include <QMutex>
#include <QString>

class ProgressObserver;

/**
 * @brief Run log: each line goes to the observer and to the optional log file.
 *
 * Lines are dropped once the observer reports cancellation.
 */
class RunLog
{
public:
    explicit RunLog(ProgressObserver &observer);
    ~RunLog();

    RunLog(const RunLog &) = delete;
    RunLog &operator=(const RunLog &) = delete;

    bool openFile(const QString &path, QString *error);
    bool hasFile() const;

    void log(const QString &line);
    void logFileOnly(const QString &line);

private:
    void appendToFile(const QString &line);

    ProgressObserver &m_observer;
    QMutex m_fileMutex;
    QFile m_file;
};
