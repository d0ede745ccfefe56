#include "taskview/ui/models/CursorPreserver.hpp"

#include <algorithm>

namespace taskview {
namespace ui {

std::optional<int> restoreRow(const std::vector<const data::TaskRecord *> &rows,
                              const QString &taskId,
                              int fallbackRow)
{
    if (rows.empty()) {
        return std::nullopt;
    }
    for (std::size_t row = 0; row < rows.size(); ++row) {
        if (rows[row] && rows[row]->id == taskId) {
            return static_cast<int>(row);
        }
    }
    const int lastRow = static_cast<int>(rows.size()) - 1;
    return std::min(std::max(fallbackRow, 0), lastRow);
}

} // namespace ui
} // namespace taskview
