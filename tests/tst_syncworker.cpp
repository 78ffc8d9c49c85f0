#include <QtTest>

#include <QTemporaryDir>
#include <QThread>

#include "SyncWorker.h"
#include "TestFiles.h"

class SyncWorkerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void reportsResultMap();
    void reportsFailure();
    void runsOnWorkerThread();
    void pausedRunResumesAndCompletes();
};

void SyncWorkerTest::initTestCase()
{
    qRegisterMetaType<ProgressSnapshot>();
}

void SyncWorkerTest::reportsResultMap()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(TestFiles::writeFile(dir.filePath(QStringLiteral("src/a.txt")), "abc"));

    SyncOptions options;
    options.sources = {dir.filePath(QStringLiteral("src"))};
    options.destination = dir.filePath(QStringLiteral("dst"));
    SyncWorker worker(options);
    QSignalSpy finishedSpy(&worker, &SyncWorker::finished);
    QSignalSpy logSpy(&worker, &SyncWorker::logLine);
    QSignalSpy progressSpy(&worker, &SyncWorker::progress);

    worker.start();

    QCOMPARE(finishedSpy.count(), 1);
    const QVariantMap result = finishedSpy.at(0).at(0).toMap();
    QVERIFY(result.value(QStringLiteral("ok")).toBool());
    QVERIFY(!result.value(QStringLiteral("cancelled")).toBool());
    QCOMPARE(result.value(QStringLiteral("state")).toString(), QStringLiteral("Completed"));
    QCOMPARE(result.value(QStringLiteral("filesCopied")).toULongLong(), 1ULL);
    QCOMPARE(result.value(QStringLiteral("bytesCopied")).toULongLong(), 3ULL);
    QVERIFY(!result.contains(QStringLiteral("error")));
    QVERIFY(logSpy.count() > 0);
    QVERIFY(progressSpy.count() > 0);
    QCOMPARE(worker.hub()->snapshot().state, ProgressState::Completed);
}

void SyncWorkerTest::reportsFailure()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    SyncOptions options;
    options.sources = {dir.filePath(QStringLiteral("missing"))};
    options.destination = dir.filePath(QStringLiteral("dst"));
    SyncWorker worker(options);
    QSignalSpy finishedSpy(&worker, &SyncWorker::finished);

    worker.start();

    const QVariantMap result = finishedSpy.at(0).at(0).toMap();
    QVERIFY(!result.value(QStringLiteral("ok")).toBool());
    QCOMPARE(result.value(QStringLiteral("state")).toString(), QStringLiteral("Failed"));
    QVERIFY(result.value(QStringLiteral("error")).toString().contains(QStringLiteral("missing")));
}

void SyncWorkerTest::runsOnWorkerThread()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(TestFiles::writeFile(dir.filePath(QStringLiteral("src/sub/a.txt")), "a"));

    SyncOptions options;
    options.sources = {dir.filePath(QStringLiteral("src"))};
    options.destination = dir.filePath(QStringLiteral("dst"));
    options.recursive = true;

    QThread thread;
    auto *worker = new SyncWorker(options);
    worker->moveToThread(&thread);
    connect(&thread, &QThread::started, worker, &SyncWorker::start);
    connect(&thread, &QThread::finished, worker, &QObject::deleteLater);

    QVariantMap result;
    connect(worker, &SyncWorker::finished, this, [&result, &thread](const QVariantMap &map) {
        result = map;
        thread.quit();
    });
    thread.start();

    QTRY_VERIFY_WITH_TIMEOUT(!result.isEmpty(), 10000);
    QVERIFY(thread.wait(5000));
    QVERIFY(result.value(QStringLiteral("ok")).toBool());
    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("dst/sub/a.txt"))));
}

void SyncWorkerTest::pausedRunResumesAndCompletes()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(TestFiles::writeFile(dir.filePath(QStringLiteral("src/a.txt")), "a"));

    SyncOptions options;
    options.sources = {dir.filePath(QStringLiteral("src"))};
    options.destination = dir.filePath(QStringLiteral("dst"));

    SyncWorker worker(options);
    QSignalSpy pausedSpy(&worker, &SyncWorker::pausedChanged);
    worker.setPaused(true);
    QCOMPARE(pausedSpy.count(), 1);

    QThread *runner = QThread::create([&worker]() {
        worker.start();
    });
    QVariantMap result;
    connect(&worker, &SyncWorker::finished, this, [&result](const QVariantMap &map) {
        result = map;
    }, Qt::DirectConnection);
    runner->start();

    QTest::qWait(300);
    QVERIFY(result.isEmpty());
    QVERIFY(!QFileInfo::exists(dir.filePath(QStringLiteral("dst/a.txt"))));

    worker.togglePause();
    QVERIFY(runner->wait(10000));
    QVERIFY(result.value(QStringLiteral("ok")).toBool());
    QVERIFY(QFileInfo::exists(dir.filePath(QStringLiteral("dst/a.txt"))));
    delete runner;
}

QTEST_GUILESS_MAIN(SyncWorkerTest)

#include "tst_syncworker.moc"
