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

#include "SourceScanner.h"

#include <QFileInfo>

#include "FileOperationUtils.h"
#include "PatternMatcher.h"
#include "ProgressObserver.h"
#include "RunLog.h"

namespace {

struct ScanContext {
    const PatternMatcher &matcher;
    bool recursive = false;
    const ProgressObserver &observer;
    RunLog *log = nullptr;
};

void accumulateFile(const QFileInfo &info, const ScanContext &context, SourceScanner::ScanResult &result)
{
    if (!context.matcher.matches(info.fileName())) {
        return;
    }
    result.fileCount += 1;
    result.totalBytes += static_cast<quint64>(info.size());
}

void accumulateFolder(const QString &path, const ScanContext &context, SourceScanner::ScanResult &result)
{
    if (context.observer.isCancelled()) {
        return;
    }
    QFileInfoList entries;
    QString error;
    if (!FileOperationUtils::listEntries(path, &entries, &error)) {
        if (context.log) {
            context.log->log(QStringLiteral("Warning: Could not scan directory %1: %2").arg(path, error));
        }
        return;
    }
    for (const QFileInfo &entry : entries) {
        if (entry.isDir()) {
            if (context.recursive) {
                accumulateFolder(entry.absoluteFilePath(), context, result);
            }
        } else if (entry.isFile()) {
            accumulateFile(entry, context, result);
        }
    }
}

} // namespace

namespace SourceScanner {

/**
 * @brief Counts the pattern-matching files and their bytes below the source roots.
 * @param sources Source roots, folders or files.
 * @param matcher Filename patterns.
 * @param recursive Descend into subfolders.
 * @param observer Observer polled for cancellation.
 * @param log Optional run log receiving warnings for unreadable folders.
 * @return Totals; unreadable folders count as empty.
 */
ScanResult scanSources(const QStringList &sources,
                       const PatternMatcher &matcher,
                       bool recursive,
                       const ProgressObserver &observer,
                       RunLog *log)
{
    ScanResult result;
    const ScanContext context{matcher, recursive, observer, log};
    for (const QString &source : sources) {
        const QFileInfo info(source);
        if (info.isDir()) {
            accumulateFolder(info.absoluteFilePath(), context, result);
        } else if (info.isFile()) {
            accumulateFile(info, context, result);
        }
    }
    return result;
}

} // namespace SourceScanner
