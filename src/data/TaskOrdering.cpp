#include "taskview/data/TaskOrdering.hpp"

#include <algorithm>

namespace taskview {
namespace data {

qint64 creationSortKey(const QString &createdAt, const QDateTime &now)
{
    if (createdAt.isEmpty()) {
        return 0;
    }
    QDateTime parsed = QDateTime::fromString(createdAt, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(createdAt, Qt::ISODate);
    }
    if (!parsed.isValid()) {
        return now.toMSecsSinceEpoch();
    }
    return parsed.toMSecsSinceEpoch();
}

void sortTasks(std::vector<TaskRecord> &tasks, const QDateTime &now)
{
    struct Keyed
    {
        int rank;
        qint64 created;
        std::size_t position;
    };
    std::vector<Keyed> keys;
    keys.reserve(tasks.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        keys.push_back({ priorityRank(tasks[i].priority), creationSortKey(tasks[i].createdAt, now), i });
    }
    std::stable_sort(keys.begin(), keys.end(), [](const Keyed &lhs, const Keyed &rhs) {
        if (lhs.rank == rhs.rank) {
            return lhs.created > rhs.created;
        }
        return lhs.rank > rhs.rank;
    });

    std::vector<TaskRecord> sorted;
    sorted.reserve(tasks.size());
    for (const Keyed &key : keys) {
        sorted.push_back(std::move(tasks[key.position]));
    }
    tasks = std::move(sorted);
}

} // namespace data
} // namespace taskview
