#include "taskview/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <memory>

#include "taskview/core/Sanitizer.hpp"

Q_LOGGING_CATEGORY(lcStore, "taskview.store")
Q_LOGGING_CATEGORY(lcApp, "taskview.app")
Q_LOGGING_CATEGORY(lcUi, "taskview.ui")

namespace taskview {
namespace core {

namespace {
constexpr int MaxLogMessageLength = 2000;

std::unique_ptr<QFile> &logFile()
{
    static std::unique_ptr<QFile> file;
    return file;
}

QtMessageHandler &previousHandler()
{
    static QtMessageHandler handler = nullptr;
    return handler;
}

const char *levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "debug";
    case QtInfoMsg:
        return "info";
    case QtWarningMsg:
        return "warning";
    case QtCriticalMsg:
        return "critical";
    case QtFatalMsg:
        return "fatal";
    }
    return "unknown";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    auto &file = logFile();
    if (!file || !file->isOpen()) {
        return;
    }
    const QString line = formatLogLine(type, context.category, message, QDateTime::currentDateTimeUtc());
    file->write(line.toUtf8());
    file->write("\n");
    file->flush();
}
} // namespace

QString formatLogLine(QtMsgType type, const char *category, const QString &message, const QDateTime &time)
{
    QString flattened = message;
    flattened.replace(QLatin1Char('\n'), QLatin1Char(' '));
    flattened.replace(QLatin1Char('\r'), QLatin1Char(' '));
    flattened.replace(QLatin1Char('\t'), QLatin1Char(' '));
    // The sanitizer caps lines at 100 code points; chunk so long messages survive.
    QString safe;
    const QString bounded = truncateText(flattened, MaxLogMessageLength);
    for (int i = 0; i < bounded.size(); i += MaxLineLength - Ellipsis.size()) {
        safe += sanitize(bounded.mid(i, MaxLineLength - Ellipsis.size()));
    }
    return QStringLiteral("%1 %2 %3: %4")
        .arg(time.toString(Qt::ISODateWithMs),
             QLatin1String(levelName(type)),
             QLatin1String(category ? category : "default"),
             safe);
}

bool installLogFile(const QString &filePath)
{
    if (filePath.isEmpty()) {
        return false;
    }
    const QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }
    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    logFile() = std::move(file);
    QtMessageHandler previous = qInstallMessageHandler(fileMessageHandler);
    if (previous != fileMessageHandler) {
        previousHandler() = previous;
    }
    return true;
}

void uninstallLogFile()
{
    qInstallMessageHandler(previousHandler());
    previousHandler() = nullptr;
    logFile().reset();
}

} // namespace core
} // namespace taskview
