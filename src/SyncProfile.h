#pragma once

#include <QString>

struct SyncOptions;

/**
 * @brief INI profile holding the paths and options of a synchronization.
 *
 * Keys live in a [paths] and an [options] group. Keys missing from the file
 * leave the corresponding option untouched.
 */
class SyncProfile
{
public:
    explicit SyncProfile(const QString &filePath);

    QString filePath() const { return m_filePath; }

    bool load(SyncOptions *options, QString *error) const;
    bool save(const SyncOptions &options, QString *error) const;

private:
    static QString normalizePath(const QString &path);

    QString m_filePath;
};
