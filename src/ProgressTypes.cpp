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

#include "ProgressTypes.h"

namespace {
constexpr double fullPercentage = 100.0;

double ratioPercentage(quint64 done, quint64 total)
{
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(done) / static_cast<double>(total) * fullPercentage;
}
} // namespace

QString progressStateName(ProgressState state)
{
    switch (state) {
    case ProgressState::Idle:
        return QStringLiteral("Idle");
    case ProgressState::Scanning:
        return QStringLiteral("Scanning");
    case ProgressState::Copying:
        return QStringLiteral("Copying");
    case ProgressState::Paused:
        return QStringLiteral("Paused");
    case ProgressState::Cancelled:
        return QStringLiteral("Cancelled");
    case ProgressState::Completed:
        return QStringLiteral("Completed");
    case ProgressState::Failed:
        return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

double ProgressSnapshot::percentage() const
{
    return ratioPercentage(bytesDone, bytesTotal);
}

double ProgressSnapshot::filePercentage() const
{
    return ratioPercentage(currentFileBytesDone, currentFileBytesTotal);
}
