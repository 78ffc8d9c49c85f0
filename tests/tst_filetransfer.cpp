#include <QtTest>

#include <QDateTime>
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <QThread>

#include "FileTransfer.h"
#include "RecordingObserver.h"
#include "RunLog.h"
#include "SyncOptions.h"
#include "SyncStatistics.h"
#include "TestFiles.h"

class FileTransferTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void shouldCopy_data();
    void shouldCopy();
    void copiesNewFileAndReplicatesTime();
    void skipsUpToDateFile();
    void forceOverwriteCopiesUpToDateFile();
    void listOnlyCountsWithoutTouchingDisk();
    void emptyFilesModeCreatesPlaceholder();
    void moveRemovesSource();
    void reportsProgressPerChunk();
    void retriesUntilExhausted();
    void waitsBetweenAttempts();
    void cancelledBeforeStartDoesNothing();
    void cancelDuringRetryWaitStopsQuietly();
    void cancelledCopyIsRecopiedOnNextRun();
    void missingSourceIsCountedFailed();

private:
    bool transfer(const QString &source, const QString &target, SyncError *error = nullptr);

    QTemporaryDir *m_dir = nullptr;
    SyncOptions m_options;
    SyncStatistics *m_statistics = nullptr;
    RecordingObserver *m_observer = nullptr;
};

void FileTransferTest::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    m_options = SyncOptions();
    m_options.retries = 1;
    m_options.retryWaitSeconds = 0;
    m_statistics = new SyncStatistics();
    m_observer = new RecordingObserver();
}

void FileTransferTest::cleanup()
{
    delete m_observer;
    m_observer = nullptr;
    delete m_statistics;
    m_statistics = nullptr;
    delete m_dir;
    m_dir = nullptr;
}

bool FileTransferTest::transfer(const QString &source, const QString &target, SyncError *error)
{
    RunLog log(*m_observer);
    FileTransfer fileTransfer(m_options, *m_statistics, *m_observer, log);
    return fileTransfer.transfer(source, target, error);
}

void FileTransferTest::shouldCopy_data()
{
    QTest::addColumn<bool>("targetExists");
    QTest::addColumn<qint64>("sourceTime");
    QTest::addColumn<qint64>("targetTime");
    QTest::addColumn<qint64>("sourceSize");
    QTest::addColumn<qint64>("targetSize");
    QTest::addColumn<bool>("force");
    QTest::addColumn<bool>("expected");

    QTest::newRow("target missing") << false << qint64(1000) << qint64(0) << qint64(5) << qint64(0) << false << true;
    QTest::newRow("source newer") << true << qint64(2000) << qint64(1000) << qint64(5) << qint64(5) << false << true;
    QTest::newRow("source older") << true << qint64(1000) << qint64(2000) << qint64(5) << qint64(9) << false << false;
    QTest::newRow("same time, same size") << true << qint64(1000) << qint64(1000) << qint64(5) << qint64(5) << false << false;
    QTest::newRow("same time, other size") << true << qint64(1000) << qint64(1000) << qint64(5) << qint64(6) << false << true;
    QTest::newRow("forced") << true << qint64(1000) << qint64(2000) << qint64(5) << qint64(5) << true << true;
}

void FileTransferTest::shouldCopy()
{
    QFETCH(bool, targetExists);
    QFETCH(qint64, sourceTime);
    QFETCH(qint64, targetTime);
    QFETCH(qint64, sourceSize);
    QFETCH(qint64, targetSize);
    QFETCH(bool, force);
    QFETCH(bool, expected);

    FileMeta source;
    source.exists = true;
    source.modifiedMs = sourceTime;
    source.size = sourceSize;
    FileMeta target;
    target.exists = targetExists;
    target.modifiedMs = targetTime;
    target.size = targetSize;

    QCOMPARE(FileTransfer::shouldCopy(source, target, force), expected);
}

void FileTransferTest::copiesNewFileAndReplicatesTime()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "hello world"));
    const QDateTime past = QDateTime::currentDateTime().addDays(-3);
    QVERIFY(TestFiles::setModified(source, past));

    QVERIFY(transfer(source, target));

    QCOMPARE(TestFiles::readFile(target), QByteArray("hello world"));
    QCOMPARE(QFileInfo(target).lastModified().toMSecsSinceEpoch(),
             QFileInfo(source).lastModified().toMSecsSinceEpoch());
    const SyncStatistics::Totals totals = m_statistics->totals();
    QCOMPARE(totals.filesCopied, quint64(1));
    QCOMPARE(totals.bytesCopied, quint64(11));
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Copying file: ")), 1);
}

void FileTransferTest::skipsUpToDateFile()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "content"));
    QVERIFY(transfer(source, target));
    QVERIFY(transfer(source, target));

    const SyncStatistics::Totals totals = m_statistics->totals();
    QCOMPARE(totals.filesCopied, quint64(1));
    QCOMPARE(totals.filesSkipped, quint64(1));
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Copying file: ")), 1);
}

void FileTransferTest::forceOverwriteCopiesUpToDateFile()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "content"));
    m_options.forceOverwrite = true;
    QVERIFY(transfer(source, target));
    QVERIFY(transfer(source, target));
    QCOMPARE(m_statistics->totals().filesCopied, quint64(2));
}

void FileTransferTest::listOnlyCountsWithoutTouchingDisk()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "12345"));
    m_options.listOnly = true;
    m_options.moveFiles = true;

    QVERIFY(transfer(source, target));

    QVERIFY(!QFileInfo::exists(target));
    QVERIFY(QFileInfo::exists(source));
    const SyncStatistics::Totals totals = m_statistics->totals();
    QCOMPARE(totals.filesCopied, quint64(1));
    QCOMPARE(totals.bytesCopied, quint64(5));
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Would copy file: ")), 1);
}

void FileTransferTest::emptyFilesModeCreatesPlaceholder()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "not copied"));
    m_options.emptyFiles = true;

    QVERIFY(transfer(source, target));
    QVERIFY(QFileInfo::exists(target));
    QCOMPARE(QFileInfo(target).size(), qint64(0));
}

void FileTransferTest::moveRemovesSource()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "moving"));
    m_options.moveFiles = true;

    QVERIFY(transfer(source, target));
    QVERIFY(!QFileInfo::exists(source));
    QCOMPARE(TestFiles::readFile(target), QByteArray("moving"));
    QCOMPARE(m_statistics->totals().filesCopied, quint64(1));
}

void FileTransferTest::reportsProgressPerChunk()
{
    const QString source = m_dir->filePath(QStringLiteral("src/big.bin"));
    const QString target = m_dir->filePath(QStringLiteral("big.bin"));
    const QByteArray content(3 * FileTransfer::bufferSize + 10, 'x');
    QVERIFY(TestFiles::writeFile(source, content));

    QVERIFY(transfer(source, target));

    const QList<ProgressSnapshot> snapshots = m_observer->snapshots();
    QCOMPARE(snapshots.size(), 4);
    QCOMPARE(snapshots.first().currentFileBytesDone, quint64(FileTransfer::bufferSize));
    QCOMPARE(snapshots.last().currentFileBytesDone, quint64(content.size()));
    QCOMPARE(snapshots.last().currentFileBytesTotal, quint64(content.size()));
    QCOMPARE(snapshots.last().state, ProgressState::Copying);
}

void FileTransferTest::retriesUntilExhausted()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("missing/folder/a.txt"));
    QVERIFY(TestFiles::writeFile(source, "data"));
    m_options.retries = 3;

    SyncError error;
    QVERIFY(!transfer(source, target, &error));

    QCOMPARE(error.kind, SyncError::Kind::TransientIo);
    QCOMPARE(error.attempt, 3);
    QCOMPARE(error.sourcePath, source);
    QCOMPARE(error.targetPath, target);
    QCOMPARE(m_statistics->totals().filesFailed, quint64(1));
    QCOMPARE(m_statistics->totals().filesCopied, quint64(0));
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Retry ")), 2);
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Failed to copy after 3 attempts")), 1);
}

void FileTransferTest::waitsBetweenAttempts()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("missing/a.txt"));
    QVERIFY(TestFiles::writeFile(source, "data"));
    m_options.retries = 2;
    m_options.retryWaitSeconds = 1;

    QElapsedTimer timer;
    timer.start();
    QVERIFY(!transfer(source, target));
    QVERIFY(timer.elapsed() >= 1000);
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Retry 1 of 2")), 1);
}

void FileTransferTest::cancelledBeforeStartDoesNothing()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("a.txt"));
    QVERIFY(TestFiles::writeFile(source, "data"));
    m_observer->cancel();

    SyncError error;
    QVERIFY(transfer(source, target, &error));
    QVERIFY(!error.isSet());
    QVERIFY(!QFileInfo::exists(target));
    QVERIFY(m_observer->logs().isEmpty());
    const SyncStatistics::Totals totals = m_statistics->totals();
    QCOMPARE(totals.filesCopied + totals.filesSkipped + totals.filesFailed, quint64(0));
}

void FileTransferTest::cancelDuringRetryWaitStopsQuietly()
{
    const QString source = m_dir->filePath(QStringLiteral("src/a.txt"));
    const QString target = m_dir->filePath(QStringLiteral("missing/a.txt"));
    QVERIFY(TestFiles::writeFile(source, "data"));
    m_options.retries = 5;
    m_options.retryWaitSeconds = 30;

    RecordingObserver *observer = m_observer;
    QThread *canceller = QThread::create([observer]() {
        QThread::msleep(300);
        observer->cancel();
    });
    canceller->start();

    QElapsedTimer timer;
    timer.start();
    SyncError error;
    QVERIFY(transfer(source, target, &error));
    QVERIFY(timer.elapsed() < 5000);
    QVERIFY(!error.isSet());
    QCOMPARE(m_statistics->totals().filesFailed, quint64(0));
    QCOMPARE(m_observer->countLogsContaining(QStringLiteral("Retry ")), 1);

    QVERIFY(canceller->wait(5000));
    delete canceller;
}

void FileTransferTest::cancelledCopyIsRecopiedOnNextRun()
{
    const QString source = m_dir->filePath(QStringLiteral("src/big.bin"));
    const QString target = m_dir->filePath(QStringLiteral("big.bin"));
    QByteArray content(3 * FileTransfer::bufferSize + 10, 'a');
    content.replace(0, 5, "first");
    content.replace(content.size() - 4, 4, "last");
    QVERIFY(TestFiles::writeFile(source, content));
    QVERIFY(TestFiles::setModified(source, QDateTime::currentDateTime().addDays(-1)));
    QVERIFY(TestFiles::writeFile(target, "older good copy"));
    QVERIFY(TestFiles::setModified(target, QDateTime::currentDateTime().addDays(-2)));

    m_observer->cancelAfterSnapshots(1);
    SyncError error;
    QVERIFY(transfer(source, target, &error));
    QVERIFY(!error.isSet());
    QVERIFY(!QFileInfo::exists(target));
    QCOMPARE(m_statistics->totals().filesCopied, quint64(0));

    delete m_observer;
    m_observer = new RecordingObserver();
    QVERIFY(transfer(source, target));

    QCOMPARE(TestFiles::readFile(target), content);
    QCOMPARE(m_statistics->totals().filesCopied, quint64(1));
    QCOMPARE(m_statistics->totals().filesSkipped, quint64(0));
}

void FileTransferTest::missingSourceIsCountedFailed()
{
    SyncError error;
    QVERIFY(!transfer(m_dir->filePath(QStringLiteral("nope.txt")), m_dir->filePath(QStringLiteral("out.txt")), &error));
    QCOMPARE(error.kind, SyncError::Kind::TransientIo);
    QCOMPARE(m_statistics->totals().filesFailed, quint64(1));
}

QTEST_GUILESS_MAIN(FileTransferTest)

#include "tst_filetransfer.moc"
