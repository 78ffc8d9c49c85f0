/************************************************************************\

    Syncman - Directory synchronization engine
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "SyncProfile.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>

#include "SyncOptions.h"

namespace {
constexpr char pathsGroup[] = "paths";
constexpr char optionsGroup[] = "options";
constexpr char sourcesKey[] = "sources";
constexpr char destinationKey[] = "destination";
constexpr char patternsKey[] = "patterns";
constexpr char recursiveKey[] = "recursive";
constexpr char includeEmptyKey[] = "includeEmpty";
constexpr char restartableKey[] = "restartable";
constexpr char backupKey[] = "backup";
constexpr char purgeKey[] = "purge";
constexpr char mirrorKey[] = "mirror";
constexpr char moveFilesKey[] = "moveFiles";
constexpr char moveDirsKey[] = "moveDirs";
constexpr char attributesAddKey[] = "attributesAdd";
constexpr char attributesRemoveKey[] = "attributesRemove";
constexpr char threadsKey[] = "threads";
constexpr char retriesKey[] = "retries";
constexpr char retryWaitKey[] = "retryWait";
constexpr char logFileKey[] = "logFile";
constexpr char listOnlyKey[] = "listOnly";
constexpr char showProgressKey[] = "showProgress";
constexpr char logFileNamesKey[] = "logFileNames";
constexpr char emptyFilesKey[] = "emptyFiles";
constexpr char childrenOnlyKey[] = "childrenOnly";
constexpr char shredKey[] = "shred";
constexpr char forceKey[] = "force";
constexpr char preserveRootKey[] = "preserveRoot";

void readBool(const QSettings &settings, const char *key, bool *value)
{
    *value = settings.value(QLatin1String(key), *value).toBool();
}

void readInt(const QSettings &settings, const char *key, int minimum, int *value)
{
    bool ok = false;
    const int read = settings.value(QLatin1String(key), *value).toInt(&ok);
    if (ok && read >= minimum) {
        *value = read;
    }
}

void readString(const QSettings &settings, const char *key, QString *value)
{
    *value = settings.value(QLatin1String(key), *value).toString();
}
} // namespace

SyncProfile::SyncProfile(const QString &filePath)
    : m_filePath(filePath)
{
}

/**
 * @brief Applies the profile values on top of existing options.
 * @param options Options to update.
 * @param error Optional output error message.
 * @return True when the profile was read.
 */
bool SyncProfile::load(SyncOptions *options, QString *error) const
{
    if (!QFileInfo(m_filePath).isFile()) {
        if (error) {
            *error = QCoreApplication::translate("SyncProfile", "Profile not found: %1").arg(m_filePath);
        }
        return false;
    }
    QSettings settings(m_filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (error) {
            *error = QCoreApplication::translate("SyncProfile", "Cannot read profile: %1").arg(m_filePath);
        }
        return false;
    }

    settings.beginGroup(QLatin1String(pathsGroup));
    if (settings.contains(QLatin1String(sourcesKey))) {
        QStringList sources;
        const QStringList stored = settings.value(QLatin1String(sourcesKey)).toStringList();
        for (const QString &source : stored) {
            const QString normalized = normalizePath(source);
            if (!normalized.isEmpty()) {
                sources.append(normalized);
            }
        }
        options->sources = sources;
    }
    if (settings.contains(QLatin1String(destinationKey))) {
        options->destination = normalizePath(settings.value(QLatin1String(destinationKey)).toString());
    }
    if (settings.contains(QLatin1String(patternsKey))) {
        options->patterns = settings.value(QLatin1String(patternsKey)).toStringList();
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(optionsGroup));
    readBool(settings, recursiveKey, &options->recursive);
    readBool(settings, includeEmptyKey, &options->includeEmptyDirs);
    readBool(settings, restartableKey, &options->restartable);
    readBool(settings, backupKey, &options->backupMode);
    readBool(settings, purgeKey, &options->purge);
    readBool(settings, mirrorKey, &options->mirror);
    readBool(settings, moveFilesKey, &options->moveFiles);
    readBool(settings, moveDirsKey, &options->moveDirs);
    readString(settings, attributesAddKey, &options->attributesAdd);
    readString(settings, attributesRemoveKey, &options->attributesRemove);
    readInt(settings, threadsKey, 1, &options->threads);
    readInt(settings, retriesKey, 0, &options->retries);
    readInt(settings, retryWaitKey, 0, &options->retryWaitSeconds);
    readString(settings, logFileKey, &options->logFile);
    readBool(settings, listOnlyKey, &options->listOnly);
    readBool(settings, showProgressKey, &options->showProgress);
    readBool(settings, logFileNamesKey, &options->logFileNames);
    readBool(settings, emptyFilesKey, &options->emptyFiles);
    readBool(settings, childrenOnlyKey, &options->childrenOnly);
    readBool(settings, shredKey, &options->shredFiles);
    readBool(settings, forceKey, &options->forceOverwrite);
    readBool(settings, preserveRootKey, &options->preserveRoot);
    settings.endGroup();

    if (options->mirror) {
        options->enableMirror();
    }
    if (options->moveDirs) {
        options->enableMoveDirs();
    }
    return true;
}

/**
 * @brief Writes every option to the profile file, replacing its content.
 */
bool SyncProfile::save(const SyncOptions &options, QString *error) const
{
    QSettings settings(m_filePath, QSettings::IniFormat);
    settings.clear();

    settings.beginGroup(QLatin1String(pathsGroup));
    settings.setValue(QLatin1String(sourcesKey), options.sources);
    settings.setValue(QLatin1String(destinationKey), options.destination);
    settings.setValue(QLatin1String(patternsKey), options.patterns);
    settings.endGroup();

    settings.beginGroup(QLatin1String(optionsGroup));
    settings.setValue(QLatin1String(recursiveKey), options.recursive);
    settings.setValue(QLatin1String(includeEmptyKey), options.includeEmptyDirs);
    settings.setValue(QLatin1String(restartableKey), options.restartable);
    settings.setValue(QLatin1String(backupKey), options.backupMode);
    settings.setValue(QLatin1String(purgeKey), options.purge);
    settings.setValue(QLatin1String(mirrorKey), options.mirror);
    settings.setValue(QLatin1String(moveFilesKey), options.moveFiles);
    settings.setValue(QLatin1String(moveDirsKey), options.moveDirs);
    settings.setValue(QLatin1String(attributesAddKey), options.attributesAdd);
    settings.setValue(QLatin1String(attributesRemoveKey), options.attributesRemove);
    settings.setValue(QLatin1String(threadsKey), options.threads);
    settings.setValue(QLatin1String(retriesKey), options.retries);
    settings.setValue(QLatin1String(retryWaitKey), options.retryWaitSeconds);
    settings.setValue(QLatin1String(logFileKey), options.logFile);
    settings.setValue(QLatin1String(listOnlyKey), options.listOnly);
    settings.setValue(QLatin1String(showProgressKey), options.showProgress);
    settings.setValue(QLatin1String(logFileNamesKey), options.logFileNames);
    settings.setValue(QLatin1String(emptyFilesKey), options.emptyFiles);
    settings.setValue(QLatin1String(childrenOnlyKey), options.childrenOnly);
    settings.setValue(QLatin1String(shredKey), options.shredFiles);
    settings.setValue(QLatin1String(forceKey), options.forceOverwrite);
    settings.setValue(QLatin1String(preserveRootKey), options.preserveRoot);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        if (error) {
            *error = QCoreApplication::translate("SyncProfile", "Cannot write profile: %1").arg(m_filePath);
        }
        return false;
    }
    return true;
}

QString SyncProfile::normalizePath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QDir::fromNativeSeparators(trimmed));
}
