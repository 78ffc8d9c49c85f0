#pragma once

#include <QFileInfo>
#include <QString>

namespace FileOperationUtils {

bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath, QString *error);
bool listEntries(const QString &folderPath, QFileInfoList *entries, QString *error);
bool isFolderEmpty(const QString &folderPath);
bool createFolder(const QString &folderPath, QString *error);
bool removePath(const QString &path, QString *error);

} // namespace FileOperationUtils
