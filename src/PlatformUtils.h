#pragma once

#include <QString>
#include <QtGlobal>

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isPathInside(const QString &rootPath, const QString &path);
bool parseAttributeMask(const QString &letters, quint32 *mask, QString *error);
bool applyAttributeMasks(const QString &path, quint32 addMask, quint32 removeMask, QString *error);

} // namespace PlatformUtils
