#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace ui {

// Row to select after the displayed list was rebuilt: the row holding taskId if
// it is still shown, otherwise fallbackRow clamped to the new list. Empty list
// means no selection.
std::optional<int> restoreRow(const std::vector<const data::TaskRecord *> &rows,
                              const QString &taskId,
                              int fallbackRow);

} // namespace ui
} // namespace taskview
