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

#include "RunLog.h"

#include <QCoreApplication>

#include "Logging.h"
#include "ProgressObserver.h"

RunLog::RunLog(ProgressObserver &observer)
    : m_observer(observer)
{
}

RunLog::~RunLog()
{
    QMutexLocker locker(&m_fileMutex);
    if (m_file.isOpen()) {
        m_file.close();
    }
}

/**
 * @brief Creates or truncates the log file.
 * @param path Log file path.
 * @param error Optional output error message.
 * @return True when the file is ready for writing.
 */
bool RunLog::openFile(const QString &path, QString *error)
{
    QMutexLocker locker(&m_fileMutex);
    if (m_file.isOpen()) {
        m_file.close();
    }
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (error) {
            *error = QCoreApplication::translate("RunLog", "Cannot create log file %1: %2")
                         .arg(path, m_file.errorString());
        }
        return false;
    }
    return true;
}

bool RunLog::hasFile() const
{
    return m_file.isOpen();
}

void RunLog::log(const QString &line)
{
    if (m_observer.isCancelled()) {
        return;
    }
    m_observer.onLog(line);
    appendToFile(line);
}

void RunLog::logFileOnly(const QString &line)
{
    if (m_observer.isCancelled()) {
        return;
    }
    appendToFile(line);
}

void RunLog::appendToFile(const QString &line)
{
    QMutexLocker locker(&m_fileMutex);
    if (!m_file.isOpen()) {
        return;
    }
    const QByteArray bytes = line.toUtf8() + '\n';
    if (m_file.write(bytes) != bytes.size() || !m_file.flush()) {
        qCWarning(lcEngine) << "log file write failed" << m_file.fileName() << m_file.errorString();
    }
}
