#pragma once

#include <QStringList>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace ui {

constexpr int DetailsLineLength = 200;

extern const QLatin1String NoSelectionText;

// Display lines for the details panel. Every source line is sanitized again
// with a 200 character cap before it is split for display.
QStringList taskDetailsLines(const data::TaskRecord &task);

QString statusDisplay(const QString &status);
QString priorityDisplay(const QString &priority);

} // namespace ui
} // namespace taskview
