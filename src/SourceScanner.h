#pragma once

#include <QStringList>
#include <QtGlobal>

class PatternMatcher;
class ProgressObserver;
class RunLog;

namespace SourceScanner {

struct ScanResult {
    quint64 fileCount = 0;
    quint64 totalBytes = 0;
};

ScanResult scanSources(const QStringList &sources,
                       const PatternMatcher &matcher,
                       bool recursive,
                       const ProgressObserver &observer,
                       RunLog *log);

} // namespace SourceScanner
