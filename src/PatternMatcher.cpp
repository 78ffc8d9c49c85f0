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

#include "PatternMatcher.h"

namespace {
constexpr char matchAllPattern[] = "*";
constexpr char matchAllWithDotPattern[] = "*.*";
const QChar wildcard = QLatin1Char('*');
} // namespace

/**
 * @brief Compiles the given patterns once so they can be shared by workers.
 * @param patterns Filename patterns; an empty list means the default pattern.
 */
PatternMatcher::PatternMatcher(const QStringList &patterns)
{
    const QStringList effective = patterns.isEmpty() ? QStringList{defaultPattern()} : patterns;
    m_patterns.reserve(effective.size());
    for (const QString &pattern : effective) {
        m_patterns.push_back(compile(pattern));
    }
}

QStringList PatternMatcher::patterns() const
{
    QStringList list;
    list.reserve(m_patterns.size());
    for (const CompiledPattern &compiled : m_patterns) {
        list.append(compiled.pattern);
    }
    return list;
}

/**
 * @brief Checks a file name against every configured pattern.
 * @param fileName Bare file name without directory components.
 * @return True if at least one pattern matches.
 */
bool PatternMatcher::matches(const QString &fileName) const
{
    for (const CompiledPattern &compiled : m_patterns) {
        if (matchesCompiled(fileName, compiled)) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::matchesPattern(const QString &fileName, const QString &pattern)
{
    return matchesCompiled(fileName, compile(pattern));
}

QString PatternMatcher::defaultPattern()
{
    return QLatin1String(matchAllWithDotPattern);
}

PatternMatcher::CompiledPattern PatternMatcher::compile(const QString &pattern)
{
    CompiledPattern compiled;
    compiled.pattern = pattern;
    compiled.glob = QRegularExpression(QRegularExpression::wildcardToRegularExpression(pattern));
    if (compiled.glob.isValid()) {
        compiled.glob.optimize();
    }
    return compiled;
}

bool PatternMatcher::matchesCompiled(const QString &fileName, const CompiledPattern &compiled)
{
    if (compiled.glob.isValid() && compiled.glob.match(fileName).hasMatch()) {
        return true;
    }
    return matchesWildcardEdges(fileName, compiled.pattern);
}

/**
 * @brief Legacy matching for patterns the glob engine rejects.
 *
 * Handles "*" and "*.*" as match-all, then "*substring*", "*suffix" and
 * "prefix*", and finally exact equality.
 */
bool PatternMatcher::matchesWildcardEdges(const QString &fileName, const QString &pattern)
{
    if (pattern == QLatin1String(matchAllPattern) || pattern == QLatin1String(matchAllWithDotPattern)) {
        return true;
    }
    if (pattern.startsWith(wildcard)) {
        const QString rest = pattern.mid(1);
        if (rest.endsWith(wildcard)) {
            return fileName.contains(rest.chopped(1));
        }
        return fileName.endsWith(rest);
    }
    if (pattern.endsWith(wildcard)) {
        return fileName.startsWith(pattern.chopped(1));
    }
    return fileName == pattern;
}
