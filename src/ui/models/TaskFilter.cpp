#include "taskview/ui/models/TaskFilter.hpp"

#include "taskview/core/Sanitizer.hpp"

namespace taskview {
namespace ui {

TaskFilter::TaskFilter()
    : m_statusFilter(AllStatusesFilter)
{
}

bool TaskFilter::setStatusFilter(const QString &status)
{
    const QString normalized = status.isEmpty() ? QString(AllStatusesFilter) : core::sanitize(status);
    if (m_statusFilter == normalized) {
        return false;
    }
    m_statusFilter = normalized;
    return true;
}

bool TaskFilter::setSearchText(const QString &text)
{
    const QString normalized = core::sanitize(text).toLower();
    if (m_searchText == normalized) {
        return false;
    }
    m_searchText = normalized;
    return true;
}

QString TaskFilter::statusFilter() const
{
    return m_statusFilter;
}

QString TaskFilter::searchText() const
{
    return m_searchText;
}

bool TaskFilter::accepts(const data::TaskRecord &task) const
{
    if (m_statusFilter != AllStatusesFilter && task.status != m_statusFilter) {
        return false;
    }

    if (!m_searchText.isEmpty()) {
        if (!task.title.toLower().contains(m_searchText)
            && !task.description.toLower().contains(m_searchText)
            && !task.labels.join(QLatin1Char(' ')).toLower().contains(m_searchText)
            && !task.assignee.toLower().contains(m_searchText)) {
            return false;
        }
    }

    return true;
}

std::vector<const data::TaskRecord *> TaskFilter::apply(const std::vector<data::TaskRecord> &tasks) const
{
    std::vector<const data::TaskRecord *> result;
    for (const auto &task : tasks) {
        if (result.size() == MaxDisplayedTasks) {
            break;
        }
        if (accepts(task)) {
            result.push_back(&task);
        }
    }
    return result;
}

const QStringList &statusFilterCycle()
{
    static const QStringList cycle{ AllStatusesFilter,
                                    data::TaskStatus::Todo,
                                    data::TaskStatus::InProgress,
                                    data::TaskStatus::Done,
                                    data::TaskStatus::Blocked,
                                    data::TaskStatus::Archived };
    return cycle;
}

QString nextStatusFilter(const QString &current)
{
    const auto &cycle = statusFilterCycle();
    const int index = cycle.indexOf(current);
    if (index < 0) {
        return cycle.front();
    }
    return cycle.at((index + 1) % cycle.size());
}

} // namespace ui
} // namespace taskview
