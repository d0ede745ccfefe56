#pragma once

#include <QDateTime>
#include <vector>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace data {

constexpr std::size_t MaxLoadedTasks = 1000;

// Milliseconds since the epoch used to order tasks by creation time. An empty value
// counts as the epoch, an unparsable one as `now`.
qint64 creationSortKey(const QString &createdAt, const QDateTime &now);

// Stable: priority rank descending, then creation time descending.
void sortTasks(std::vector<TaskRecord> &tasks, const QDateTime &now);

} // namespace data
} // namespace taskview
