#pragma once

#include <QObject>
#include <QString>
#include <QTextStream>

#include "ProgressTypes.h"

/**
 * @brief Prints run progress and log lines to the console.
 */
class ConsoleProgress : public QObject
{
    Q_OBJECT

public:
    ConsoleProgress(bool showProgress, bool showLog, QObject *parent = nullptr);

    static void installInterruptHandler();
    static bool interruptRequested();

public slots:
    void showProgress(const ProgressSnapshot &snapshot);
    void showLog(const QString &line);

private:
    bool m_showProgress = true;
    bool m_showLog = true;
    bool m_progressLineOpen = false;
    QTextStream m_out;
};
