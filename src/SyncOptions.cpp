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

#include "SyncOptions.h"

#include "PatternMatcher.h"

/**
 * @brief Turns on mirroring, which implies purge, recursion and empty folders.
 */
void SyncOptions::enableMirror()
{
    mirror = true;
    purge = true;
    recursive = true;
    includeEmptyDirs = true;
}

void SyncOptions::enableMoveDirs()
{
    moveFiles = true;
    moveDirs = true;
}

QStringList SyncOptions::effectivePatterns() const
{
    return patterns.isEmpty() ? QStringList{PatternMatcher::defaultPattern()} : patterns;
}

/**
 * @brief Renders the non-default options as command-line style flags.
 * @return Space separated flag list, empty when everything is default.
 */
QString SyncOptions::toFlagString() const
{
    QStringList flags;

    if (recursive) {
        flags.append(includeEmptyDirs ? QStringLiteral("/E") : QStringLiteral("/S"));
    }
    if (restartable) {
        flags.append(QStringLiteral("/Z"));
    }
    if (backupMode) {
        flags.append(QStringLiteral("/B"));
    }
    if (mirror) {
        flags.append(QStringLiteral("/MIR"));
    } else if (purge) {
        flags.append(QStringLiteral("/PURGE"));
    }
    if (moveDirs) {
        flags.append(QStringLiteral("/MOVE"));
    } else if (moveFiles) {
        flags.append(QStringLiteral("/MOV"));
    }
    if (!attributesAdd.isEmpty()) {
        flags.append(QStringLiteral("/A+:%1").arg(attributesAdd));
    }
    if (!attributesRemove.isEmpty()) {
        flags.append(QStringLiteral("/A-:%1").arg(attributesRemove));
    }
    if (threads != defaultThreadCount) {
        flags.append(QStringLiteral("/MT:%1").arg(threads));
    }
    if (retries != defaultRetries) {
        flags.append(QStringLiteral("/R:%1").arg(retries));
    }
    if (retryWaitSeconds != defaultRetryWaitSeconds) {
        flags.append(QStringLiteral("/W:%1").arg(retryWaitSeconds));
    }
    if (listOnly) {
        flags.append(QStringLiteral("/L"));
    }
    if (!showProgress) {
        flags.append(QStringLiteral("/NP"));
    }
    if (!logFileNames) {
        flags.append(QStringLiteral("/NFL"));
    }
    if (emptyFiles) {
        flags.append(QStringLiteral("/EMPTY"));
    }
    if (childrenOnly) {
        flags.append(QStringLiteral("/CHILDONLY"));
    }
    if (shredFiles) {
        flags.append(QStringLiteral("/SHRED"));
    }
    if (forceOverwrite) {
        flags.append(QStringLiteral("/FORCE"));
    }
    if (preserveRoot) {
        flags.append(QStringLiteral("/ROOT"));
    }
    return flags.join(QLatin1Char(' '));
}
