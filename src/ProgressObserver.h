#pragma once

#include <QString>

#include "ProgressTypes.h"

/**
 * @brief Capability interface through which the engine reports and is controlled.
 *
 * Implementations are called concurrently from every worker of a run.
 */
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;

    virtual void onProgress(const ProgressSnapshot &snapshot) = 0;
    virtual void onLog(const QString &line) = 0;
    virtual bool isCancelled() const = 0;
    virtual bool isPaused() const = 0;

    /**
     * @brief Blocks the calling worker while the run is paused.
     *
     * Returns as soon as the run is resumed or cancelled. The default
     * implementation polls; observers that own the pause flag override it.
     */
    virtual void waitWhilePaused();
};

class SilentProgressObserver : public ProgressObserver
{
public:
    void onProgress(const ProgressSnapshot &) override {}
    void onLog(const QString &) override {}
    bool isCancelled() const override { return false; }
    bool isPaused() const override { return false; }
};
