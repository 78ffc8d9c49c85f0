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

#include "FileOperationUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>

namespace {
const QDir::Filters allEntriesFilter = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;
} // namespace

namespace FileOperationUtils {

/**
 * @brief Copies the source modification time onto the target file.
 * @param sourceInfo Source file information.
 * @param targetPath Target file path.
 * @param error Optional output error message.
 * @return True if the time was applied, false otherwise.
 */
bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath, QString *error)
{
    QFile targetFile(targetPath);
    if (!targetFile.open(QIODevice::ReadWrite)) {
        if (error) {
            *error = targetFile.errorString();
        }
        return false;
    }
    const bool ok = targetFile.setFileTime(sourceInfo.lastModified(), QFileDevice::FileModificationTime);
    if (!ok && error) {
        *error = targetFile.errorString();
    }
    targetFile.close();
    return ok;
}

/**
 * @brief Lists every entry of a folder by name, hidden and system entries included.
 * @param folderPath Folder to enumerate.
 * @param entries Output entry list.
 * @param error Optional output error message.
 * @return True if the folder could be read, false otherwise.
 */
bool listEntries(const QString &folderPath, QFileInfoList *entries, QString *error)
{
    const QFileInfo folderInfo(folderPath);
    if (!folderInfo.exists() || !folderInfo.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Folder not found");
        }
        return false;
    }
    if (!folderInfo.isReadable() || !folderInfo.isExecutable()) {
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Permission denied");
        }
        return false;
    }
    const QDir dir(folderPath);
    if (entries) {
        *entries = dir.entryInfoList(allEntriesFilter, QDir::Name);
    }
    return true;
}

bool isFolderEmpty(const QString &folderPath)
{
    return QDir(folderPath).isEmpty(allEntriesFilter);
}

bool createFolder(const QString &folderPath, QString *error)
{
    if (QDir().mkpath(folderPath)) {
        return true;
    }
    if (error) {
        *error = QCoreApplication::translate("FileOperationUtils", "Cannot create folder");
    }
    return false;
}

/**
 * @brief Deletes a file, or a folder with its content, without overwriting.
 * @param path File or folder path to remove.
 * @param error Optional output error message.
 * @return True if removal succeeds, false otherwise.
 */
bool removePath(const QString &path, QString *error)
{
    const QFileInfo info(path);
    if (info.isDir() && !info.isSymLink()) {
        if (QDir(path).removeRecursively()) {
            return true;
        }
        if (error) {
            *error = QCoreApplication::translate("FileOperationUtils", "Failed to delete folder");
        }
        return false;
    }
    QFile file(path);
    if (file.remove()) {
        return true;
    }
    if (error) {
        *error = file.errorString();
    }
    return false;
}

} // namespace FileOperationUtils
