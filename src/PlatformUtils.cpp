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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#ifdef Q_OS_WIN
#include <windows.h>

#include <string>
#endif

namespace PlatformUtils {

namespace {

struct AttributeBit {
    char letter;
    quint32 value;
};

// Values follow the Windows FILE_ATTRIBUTE_* constants.
constexpr AttributeBit attributeBits[] = {
    {'R', 0x00000001},
    {'H', 0x00000002},
    {'S', 0x00000004},
    {'A', 0x00000020},
    {'N', 0x00000080},
    {'T', 0x00000100},
    {'C', 0x00000800},
    {'O', 0x00001000},
    {'E', 0x00004000},
};

} // namespace

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Canonical path when the path exists, cleaned absolute path otherwise.
 */
QString normalizePath(const QString &path)
{
    const QFileInfo info(QDir::fromNativeSeparators(path));
    QString normalized = info.canonicalFilePath();
    if (normalized.isEmpty()) {
        normalized = QDir::cleanPath(info.absoluteFilePath());
    }
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Checks whether a path equals a root or lies below it.
 * @param rootPath Root folder path.
 * @param path Candidate path.
 * @return True when path is the root itself or one of its descendants.
 */
bool isPathInside(const QString &rootPath, const QString &path)
{
    const QString root = normalizePath(rootPath);
    const QString candidate = normalizePath(path);
    if (root.isEmpty() || candidate.isEmpty()) {
        return false;
    }
    if (candidate == root) {
        return true;
    }
    const QString prefix = root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/');
    return candidate.startsWith(prefix);
}

/**
 * @brief Converts attribute letters (RASHCNETO) to a bit mask.
 * @param letters Attribute letters, case-insensitive.
 * @param mask Output mask.
 * @param error Optional output error message.
 * @return True if every letter is known, false otherwise.
 */
bool parseAttributeMask(const QString &letters, quint32 *mask, QString *error)
{
    quint32 result = 0;
    for (const QChar ch : letters.toUpper()) {
        bool known = false;
        for (const AttributeBit &bit : attributeBits) {
            if (ch == QLatin1Char(bit.letter)) {
                result |= bit.value;
                known = true;
                break;
            }
        }
        if (!known) {
            if (error) {
                *error = QCoreApplication::translate("PlatformUtils", "Unknown attribute letter: %1").arg(ch);
            }
            return false;
        }
    }
    if (mask) {
        *mask = result;
    }
    return true;
}

/**
 * @brief Adds and removes attribute bits on a file.
 *
 * Only Windows carries these attributes; elsewhere this is a no-op.
 */
bool applyAttributeMasks(const QString &path, quint32 addMask, quint32 removeMask, QString *error)
{
    if (addMask == 0 && removeMask == 0) {
        return true;
    }
#ifdef Q_OS_WIN
    const std::wstring nativePath = QDir::toNativeSeparators(path).toStdWString();
    const DWORD current = GetFileAttributesW(nativePath.c_str());
    if (current == INVALID_FILE_ATTRIBUTES) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Cannot read attributes");
        }
        return false;
    }
    const DWORD updated = (current | addMask) & ~static_cast<DWORD>(removeMask);
    if (!SetFileAttributesW(nativePath.c_str(), updated)) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Cannot set attributes");
        }
        return false;
    }
    return true;
#else
    Q_UNUSED(path);
    Q_UNUSED(error);
    return true;
#endif
}

} // namespace PlatformUtils
