#pragma once

#include <QObject>
#include <QString>
#include <QVariantMap>

#include "ProgressHub.h"
#include "SyncOptions.h"

/**
 * @brief Runs a synchronization on the thread the worker lives in.
 *
 * cancel(), togglePause() and setPaused() are safe to call directly from any
 * thread while start() is running.
 */
class SyncWorker : public QObject
{
    Q_OBJECT

public:
    explicit SyncWorker(const SyncOptions &options, QObject *parent = nullptr);

    ProgressHub *hub() { return &m_hub; }

public slots:
    void start();
    void cancel();
    void togglePause();
    void setPaused(bool paused);

signals:
    void progress(const ProgressSnapshot &snapshot);
    void logLine(const QString &line);
    void pausedChanged(bool paused);
    void finished(QVariantMap result);

private:
    SyncOptions m_options;
    ProgressHub m_hub;
};
