#pragma once

#include <QProcessEnvironment>
#include <QString>

#include "taskview/core/ErrorBudget.hpp"

class QSettings;

namespace taskview {
namespace core {

struct AppSettings
{
    QString storageRoot;
    QString logFilePath;
    int maxErrors = DefaultMaxErrors;
};

QString defaultStorageRoot();
QString defaultLogFilePath();

// QSettings values, with TASKVIEW_STORAGE_ROOT taking precedence for the root.
AppSettings loadAppSettings(const QSettings &settings,
                            const QProcessEnvironment &environment = QProcessEnvironment::systemEnvironment());

} // namespace core
} // namespace taskview
