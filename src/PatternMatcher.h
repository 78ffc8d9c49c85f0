#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>

class PatternMatcher
{
public:
    explicit PatternMatcher(const QStringList &patterns = {});

    QStringList patterns() const;
    bool matches(const QString &fileName) const;

    static bool matchesPattern(const QString &fileName, const QString &pattern);
    static QString defaultPattern();

private:
    struct CompiledPattern {
        QString pattern;
        QRegularExpression glob;
    };

    static CompiledPattern compile(const QString &pattern);
    static bool matchesCompiled(const QString &fileName, const CompiledPattern &compiled);
    static bool matchesWildcardEdges(const QString &fileName, const QString &pattern);

    QVector<CompiledPattern> m_patterns;
};
