#pragma once

#include <QString>
#include <QStringList>

struct SyncOptions;

namespace CommandLineOptions {

/**
 * @brief Parses `<source> <destination> [<pattern>...] [/flags]`.
 * @param arguments Command-line arguments without the program name.
 * @param options Output options; a /PROFILE:file is loaded into it first.
 * @param error Optional output error message.
 * @return False on an unknown flag, an unreadable profile or missing paths.
 */
bool parse(const QStringList &arguments, SyncOptions *options, QString *error);
QString usageText();

} // namespace CommandLineOptions
