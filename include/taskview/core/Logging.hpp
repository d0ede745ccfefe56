#pragma once

#include <QDateTime>
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

namespace taskview {
namespace core {

// One log line; the message is sanitized and flattened so nothing read from a
// task file can reach the log sink as raw control bytes.
QString formatLogLine(QtMsgType type, const char *category, const QString &message, const QDateTime &time);

// Routes Qt logging into the file while the terminal owns stdout/stderr.
bool installLogFile(const QString &filePath);
void uninstallLogFile();

} // namespace core
} // namespace taskview
