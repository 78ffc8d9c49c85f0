#pragma once

#include <QAtomicInteger>
#include <QtGlobal>

class SyncStatistics
{
public:
    struct Totals {
        quint64 dirsCreated = 0;
        quint64 dirsSkipped = 0;
        quint64 dirsRemoved = 0;
        quint64 filesCopied = 0;
        quint64 filesSkipped = 0;
        quint64 filesFailed = 0;
        quint64 filesRemoved = 0;
        quint64 bytesCopied = 0;
    };

    SyncStatistics() = default;
    SyncStatistics(const SyncStatistics &) = delete;
    SyncStatistics &operator=(const SyncStatistics &) = delete;

    void addDirCreated();
    void addDirSkipped();
    void addDirRemoved();
    void addFileCopied(quint64 bytes);
    void addFileSkipped();
    void addFileFailed();
    void addFileRemoved();

    quint64 filesCopied() const;
    quint64 bytesCopied() const;
    Totals totals() const;

private:
    QAtomicInteger<quint64> m_dirsCreated = 0;
    QAtomicInteger<quint64> m_dirsSkipped = 0;
    QAtomicInteger<quint64> m_dirsRemoved = 0;
    QAtomicInteger<quint64> m_filesCopied = 0;
    QAtomicInteger<quint64> m_filesSkipped = 0;
    QAtomicInteger<quint64> m_filesFailed = 0;
    QAtomicInteger<quint64> m_filesRemoved = 0;
    QAtomicInteger<quint64> m_bytesCopied = 0;
};
