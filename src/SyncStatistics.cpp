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

#include "SyncStatistics.h"

void SyncStatistics::addDirCreated()
{
    m_dirsCreated.fetchAndAddRelaxed(1);
}

void SyncStatistics::addDirSkipped()
{
    m_dirsSkipped.fetchAndAddRelaxed(1);
}

void SyncStatistics::addDirRemoved()
{
    m_dirsRemoved.fetchAndAddRelaxed(1);
}

void SyncStatistics::addFileCopied(quint64 bytes)
{
    m_filesCopied.fetchAndAddRelaxed(1);
    m_bytesCopied.fetchAndAddRelaxed(bytes);
}

void SyncStatistics::addFileSkipped()
{
    m_filesSkipped.fetchAndAddRelaxed(1);
}

void SyncStatistics::addFileFailed()
{
    m_filesFailed.fetchAndAddRelaxed(1);
}

void SyncStatistics::addFileRemoved()
{
    m_filesRemoved.fetchAndAddRelaxed(1);
}

quint64 SyncStatistics::filesCopied() const
{
    return m_filesCopied.loadRelaxed();
}

quint64 SyncStatistics::bytesCopied() const
{
    return m_bytesCopied.loadRelaxed();
}

/**
 * @brief Reads every counter into a plain value copy.
 * @return Counter values; each one is read independently.
 */
SyncStatistics::Totals SyncStatistics::totals() const
{
    Totals totals;
    totals.dirsCreated = m_dirsCreated.loadRelaxed();
    totals.dirsSkipped = m_dirsSkipped.loadRelaxed();
    totals.dirsRemoved = m_dirsRemoved.loadRelaxed();
    totals.filesCopied = m_filesCopied.loadRelaxed();
    totals.filesSkipped = m_filesSkipped.loadRelaxed();
    totals.filesFailed = m_filesFailed.loadRelaxed();
    totals.filesRemoved = m_filesRemoved.loadRelaxed();
    totals.bytesCopied = m_bytesCopied.loadRelaxed();
    return totals;
}
