#include "taskview/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace taskview {
namespace core {

namespace {
const QString StorageRootKey = QStringLiteral("storage/rootPath");
const QString MaxErrorsKey = QStringLiteral("app/maxErrors");
const QString LogFileKey = QStringLiteral("log/filePath");
const QString StorageRootVariable = QStringLiteral("TASKVIEW_STORAGE_ROOT");
} // namespace

QString defaultStorageRoot()
{
    return QDir::homePath() + QStringLiteral("/.critical-claude");
}

QString defaultLogFilePath()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/taskview");
    }
    return QDir(folder).filePath(QStringLiteral("taskview.log"));
}

AppSettings loadAppSettings(const QSettings &settings, const QProcessEnvironment &environment)
{
    AppSettings result;
    result.storageRoot = settings.value(StorageRootKey, defaultStorageRoot()).toString();
    const QString fromEnvironment = environment.value(StorageRootVariable);
    if (!fromEnvironment.isEmpty()) {
        result.storageRoot = fromEnvironment;
    }
    if (result.storageRoot.isEmpty()) {
        result.storageRoot = defaultStorageRoot();
    }

    result.logFilePath = settings.value(LogFileKey, defaultLogFilePath()).toString();

    bool ok = false;
    const int maxErrors = settings.value(MaxErrorsKey, DefaultMaxErrors).toInt(&ok);
    result.maxErrors = ok && maxErrors > 0 ? maxErrors : DefaultMaxErrors;
    return result;
}

} // namespace core
} // namespace taskview
