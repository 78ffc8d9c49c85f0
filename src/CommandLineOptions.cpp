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

#include "CommandLineOptions.h"

#include <QCoreApplication>
#include <QFileInfo>

#include "SyncOptions.h"
#include "SyncProfile.h"

namespace {

const QLatin1String profilePrefix("/PROFILE:");
const QLatin1String logPrefix("/LOG:");
const QLatin1String attributesAddPrefix("/A+:");
const QLatin1String attributesRemovePrefix("/A-:");
const QLatin1String threadsFlag("/MT");
const QLatin1String threadsPrefix("/MT:");
const QLatin1String retriesPrefix("/R:");
const QLatin1String waitPrefix("/W:");

bool isFlag(const QString &argument)
{
    return argument.startsWith(QLatin1Char('/'));
}

// Absolute Unix paths also start with a slash.
bool looksLikePath(const QString &argument)
{
    return argument.indexOf(QLatin1Char('/'), 1) > 0 || QFileInfo::exists(argument);
}

int parseCount(const QString &text, int minimum, int fallback)
{
    bool ok = false;
    const int value = text.toInt(&ok);
    return ok && value >= minimum ? value : fallback;
}

bool applySwitch(const QString &upper, SyncOptions *options)
{
    if (upper == QLatin1String("/S")) {
        options->recursive = true;
    } else if (upper == QLatin1String("/E")) {
        options->recursive = true;
        options->includeEmptyDirs = true;
    } else if (upper == QLatin1String("/Z")) {
        options->restartable = true;
    } else if (upper == QLatin1String("/B")) {
        options->backupMode = true;
    } else if (upper == QLatin1String("/PURGE")) {
        options->purge = true;
    } else if (upper == QLatin1String("/MIR")) {
        options->enableMirror();
    } else if (upper == QLatin1String("/MOV")) {
        options->moveFiles = true;
    } else if (upper == QLatin1String("/MOVE")) {
        options->enableMoveDirs();
    } else if (upper == QLatin1String("/L")) {
        options->listOnly = true;
    } else if (upper == QLatin1String("/NP")) {
        options->showProgress = false;
    } else if (upper == QLatin1String("/NFL")) {
        options->logFileNames = false;
    } else if (upper == QLatin1String("/EMPTY")) {
        options->emptyFiles = true;
    } else if (upper == QLatin1String("/CHILDONLY")) {
        options->childrenOnly = true;
    } else if (upper == QLatin1String("/SHRED")) {
        options->shredFiles = true;
    } else if (upper == QLatin1String("/FORCE")) {
        options->forceOverwrite = true;
    } else if (upper == QLatin1String("/ROOT")) {
        options->preserveRoot = true;
    } else {
        return false;
    }
    return true;
}

bool applyValueFlag(const QString &argument, const QString &upper, SyncOptions *options)
{
    if (upper.startsWith(attributesAddPrefix)) {
        options->attributesAdd = upper.mid(attributesAddPrefix.size());
    } else if (upper.startsWith(attributesRemovePrefix)) {
        options->attributesRemove = upper.mid(attributesRemovePrefix.size());
    } else if (upper == threadsFlag) {
        options->threads = SyncOptions::shorthandThreadCount;
    } else if (upper.startsWith(threadsPrefix)) {
        options->threads = parseCount(upper.mid(threadsPrefix.size()), 1, SyncOptions::shorthandThreadCount);
    } else if (upper.startsWith(retriesPrefix)) {
        options->retries = parseCount(upper.mid(retriesPrefix.size()), 0, SyncOptions::defaultRetries);
    } else if (upper.startsWith(waitPrefix)) {
        options->retryWaitSeconds = parseCount(upper.mid(waitPrefix.size()), 0, SyncOptions::defaultRetryWaitSeconds);
    } else if (upper.startsWith(logPrefix)) {
        // The file name keeps its original case.
        options->logFile = argument.mid(logPrefix.size());
    } else if (upper.startsWith(profilePrefix)) {
        // Already applied before the other flags.
    } else {
        return false;
    }
    return true;
}

bool loadProfile(const QStringList &arguments, SyncOptions *options, QString *error)
{
    for (const QString &argument : arguments) {
        if (!argument.toUpper().startsWith(profilePrefix)) {
            continue;
        }
        const SyncProfile profile(argument.mid(profilePrefix.size()));
        if (!profile.load(options, error)) {
            return false;
        }
    }
    return true;
}

} // namespace

namespace CommandLineOptions {

bool parse(const QStringList &arguments, SyncOptions *options, QString *error)
{
    if (!loadProfile(arguments, options, error)) {
        return false;
    }

    QStringList positionals;
    for (const QString &argument : arguments) {
        if (!isFlag(argument)) {
            positionals.append(argument);
            continue;
        }
        const QString upper = argument.toUpper();
        if (applySwitch(upper, options) || applyValueFlag(argument, upper, options)) {
            continue;
        }
        if (!looksLikePath(argument)) {
            if (error) {
                *error = QCoreApplication::translate("CommandLineOptions", "Unknown option: %1").arg(argument);
            }
            return false;
        }
        positionals.append(argument);
    }

    if (positionals.size() >= 2) {
        options->sources = QStringList{positionals.at(0)};
        options->destination = positionals.at(1);
        if (positionals.size() > 2) {
            options->patterns = positionals.mid(2);
        }
    } else if (!positionals.isEmpty() || options->sources.isEmpty() || options->destination.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("CommandLineOptions", "Missing source or destination");
        }
        return false;
    }
    return true;
}

QString usageText()
{
    return QStringLiteral(
        "Usage: syncman <source> <destination> [<pattern>...] [options]\n"
        "\n"
        "Options:\n"
        "  /S           Copy subdirectories, excluding empty ones\n"
        "  /E           Copy subdirectories, including empty ones\n"
        "  /Z           Restartable mode, flush after every chunk\n"
        "  /B           Backup mode\n"
        "  /PURGE       Delete destination entries missing from the source\n"
        "  /MIR         Mirror the tree (/E plus /PURGE)\n"
        "  /MOV         Move files, deleting them from the source after copy\n"
        "  /MOVE        Move files and directories\n"
        "  /A+:[RASHCNETO]  Add attributes to copied files\n"
        "  /A-:[RASHCNETO]  Remove attributes from copied files\n"
        "  /MT[:n]      Use n threads (default 8)\n"
        "  /R:n         Number of attempts per file (default 1000000)\n"
        "  /W:n         Wait time between attempts in seconds (default 30)\n"
        "  /LOG:file    Write the run log to a file\n"
        "  /L           List only, do not copy, delete or create anything\n"
        "  /NP          No progress display\n"
        "  /NFL         Do not log file names\n"
        "  /EMPTY       Create empty placeholder files instead of copying content\n"
        "  /CHILDONLY   Synchronize each child directory of the source separately\n"
        "  /SHRED       Securely overwrite files before deleting them\n"
        "  /FORCE       Copy files even when the destination looks up to date\n"
        "  /ROOT        Synchronize the source directory itself into the destination\n"
        "  /PROFILE:file  Load paths and options from an INI profile first\n");
}

} // namespace CommandLineOptions
