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

#include "SecureEraser.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRandomGenerator>
#include <QVector>

#include <cstring>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

#include "FileOperationUtils.h"
#include "Logging.h"
#include "RunLog.h"

namespace {

constexpr qint64 bufferSize = 64 * 1024;
constexpr int wordSize = static_cast<int>(sizeof(quint32));

bool syncToStorage(QFile &file)
{
    if (!file.flush()) {
        return false;
    }
#ifdef Q_OS_UNIX
    return ::fsync(file.handle()) == 0;
#else
    return true;
#endif
}

bool openForOverwrite(QFile &file)
{
    if (file.open(QIODevice::ReadWrite)) {
        return true;
    }
    const QFileDevice::Permissions permissions = file.permissions();
    if (permissions.testFlag(QFileDevice::WriteOwner) || !file.setPermissions(permissions | QFileDevice::WriteOwner)) {
        return false;
    }
    return file.open(QIODevice::ReadWrite);
}

/**
 * @brief Overwrites the whole file once, filling each chunk with fill().
 */
template <typename Fill>
bool overwritePass(QFile &file, qint64 fileSize, QByteArray &buffer, Fill fill)
{
    if (!file.seek(0)) {
        return false;
    }
    qint64 remaining = fileSize;
    while (remaining > 0) {
        const qint64 chunk = qMin(remaining, bufferSize);
        fill(buffer);
        if (file.write(buffer.constData(), chunk) != chunk) {
            return false;
        }
        remaining -= chunk;
    }
    return syncToStorage(file);
}

QString eraseFailure(const QFile &file)
{
    return QCoreApplication::translate("SecureEraser", "Secure erase failed for %1: %2")
        .arg(file.fileName(), file.errorString());
}

} // namespace

namespace SecureEraser {

/**
 * @brief Overwrites a file with seven passes and unlinks it.
 * @param path File to erase.
 * @param log Optional run log receiving the completion line.
 * @param error Optional output error message.
 * @param onPass Optional hook invoked after every completed pass.
 * @return True if the file was overwritten and removed.
 */
bool eraseFile(const QString &path, RunLog *log, QString *error, const PassCallback &onPass)
{
    const QFileInfo info(path);
    if (info.isSymLink()) {
        return FileOperationUtils::removePath(path, error);
    }
    if (!info.isFile()) {
        if (error) {
            *error = QCoreApplication::translate("SecureEraser", "File not found: %1").arg(path);
        }
        return false;
    }

    QFile file(path);
    if (!openForOverwrite(file)) {
        if (error) {
            *error = eraseFailure(file);
        }
        return false;
    }

    const qint64 fileSize = file.size();
    QByteArray buffer(static_cast<int>(bufferSize), '\0');
    int passIndex = 0;
    for (const unsigned char value : fixedPassValues) {
        const auto fillFixed = [value](QByteArray &chunk) {
            chunk.fill(static_cast<char>(value));
        };
        if (!overwritePass(file, fileSize, buffer, fillFixed)) {
            if (error) {
                *error = eraseFailure(file);
            }
            return false;
        }
        if (onPass) {
            onPass(passIndex, path);
        }
        ++passIndex;
    }

    QVector<quint32> words(static_cast<int>(bufferSize / wordSize));
    const auto fillRandom = [&words](QByteArray &chunk) {
        QRandomGenerator::system()->fillRange(words.data(), words.size());
        std::memcpy(chunk.data(), words.constData(), static_cast<size_t>(chunk.size()));
    };
    if (!overwritePass(file, fileSize, buffer, fillRandom)) {
        if (error) {
            *error = eraseFailure(file);
        }
        return false;
    }
    if (onPass) {
        onPass(passIndex, path);
    }
    file.close();

    if (!file.remove()) {
        if (error) {
            *error = eraseFailure(file);
        }
        return false;
    }
    qCDebug(lcErase) << "erased" << path << fileSize << "bytes";
    if (log) {
        log->logFileOnly(QStringLiteral("Securely deleted file: %1").arg(path));
    }
    return true;
}

/**
 * @brief Securely erases every file below a folder, then removes the folders.
 * @param path Folder to erase.
 * @param log Optional run log receiving completion lines.
 * @param error Optional output error message.
 * @param onPass Optional hook forwarded to every file erase.
 * @return True if the whole folder was removed.
 */
bool eraseFolder(const QString &path, RunLog *log, QString *error, const PassCallback &onPass)
{
    QFileInfoList entries;
    if (!FileOperationUtils::listEntries(path, &entries, error)) {
        return false;
    }
    for (const QFileInfo &entry : entries) {
        const QString entryPath = entry.absoluteFilePath();
        const bool ok = (entry.isDir() && !entry.isSymLink())
            ? eraseFolder(entryPath, log, error, onPass)
            : eraseFile(entryPath, log, error, onPass);
        if (!ok) {
            return false;
        }
    }
    if (!QDir().rmdir(path)) {
        if (error) {
            *error = QCoreApplication::translate("SecureEraser", "Cannot remove folder %1").arg(path);
        }
        return false;
    }
    if (log) {
        log->logFileOnly(QStringLiteral("Removed directory after secure file deletion: %1").arg(path));
    }
    return true;
}

} // namespace SecureEraser
