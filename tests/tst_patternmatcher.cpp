#include <QtTest>

#include "PatternMatcher.h"

class PatternMatcherTest : public QObject
{
    Q_OBJECT

private slots:
    void matchesPattern_data();
    void matchesPattern();
    void defaultPatternMatchesEverything();
    void anyPatternIncludesFile();
    void keepsConfiguredPatterns();
};

void PatternMatcherTest::matchesPattern_data()
{
    QTest::addColumn<QString>("pattern");
    QTest::addColumn<QString>("fileName");
    QTest::addColumn<bool>("expected");

    QTest::newRow("suffix glob") << "*.txt" << "a.txt" << true;
    QTest::newRow("suffix glob rejects longer extension") << "*.txt" << "a.txtx" << false;
    QTest::newRow("prefix glob") << "report*" << "report_final" << true;
    QTest::newRow("prefix glob rejects other prefix") << "report*" << "final_report" << false;
    QTest::newRow("substring glob") << "*mid*" << "xxmidyy" << true;
    QTest::newRow("substring glob rejects missing part") << "*mid*" << "xxmiyy" << false;
    QTest::newRow("literal") << "readme" << "readme" << true;
    QTest::newRow("literal rejects extension") << "readme" << "readme.md" << false;
    QTest::newRow("literal is case sensitive") << "readme" << "README" << false;
    QTest::newRow("star matches all") << "*" << "anything" << true;
    QTest::newRow("star dot star matches dotless name") << "*.*" << "Makefile" << true;
    QTest::newRow("question mark") << "file?.log" << "file1.log" << true;
    QTest::newRow("question mark needs one character") << "file?.log" << "file.log" << false;
    QTest::newRow("character class") << "data[0-9].csv" << "data7.csv" << true;
    QTest::newRow("negated character class") << "data[!0-9].csv" << "data7.csv" << false;
    QTest::newRow("negated class accepts other") << "data[!0-9].csv" << "dataX.csv" << true;
}

void PatternMatcherTest::matchesPattern()
{
    QFETCH(QString, pattern);
    QFETCH(QString, fileName);
    QFETCH(bool, expected);

    QCOMPARE(PatternMatcher::matchesPattern(fileName, pattern), expected);
}

void PatternMatcherTest::defaultPatternMatchesEverything()
{
    const PatternMatcher matcher;
    QCOMPARE(matcher.patterns(), QStringList{QStringLiteral("*.*")});
    QVERIFY(matcher.matches(QStringLiteral("a.txt")));
    QVERIFY(matcher.matches(QStringLiteral("noextension")));
    QVERIFY(matcher.matches(QStringLiteral(".hidden")));
}

void PatternMatcherTest::anyPatternIncludesFile()
{
    const PatternMatcher matcher({QStringLiteral("*.jpg"), QStringLiteral("*.png")});
    QVERIFY(matcher.matches(QStringLiteral("photo.jpg")));
    QVERIFY(matcher.matches(QStringLiteral("icon.png")));
    QVERIFY(!matcher.matches(QStringLiteral("notes.txt")));
}

void PatternMatcherTest::keepsConfiguredPatterns()
{
    const QStringList patterns{QStringLiteral("*.h"), QStringLiteral("*.cpp")};
    const PatternMatcher matcher(patterns);
    QCOMPARE(matcher.patterns(), patterns);
}

QTEST_GUILESS_MAIN(PatternMatcherTest)

#include "tst_patternmatcher.moc"
