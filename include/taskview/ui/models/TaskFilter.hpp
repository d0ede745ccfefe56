#pragma once

#include <QString>
#include <QStringList>
#include <vector>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace ui {

constexpr QLatin1String AllStatusesFilter("all");
constexpr std::size_t MaxDisplayedTasks = 100;

// Status filter plus case-insensitive search. apply() keeps the input order and
// returns pointers into the caller's list.
class TaskFilter
{
public:
    TaskFilter();

    bool setStatusFilter(const QString &status);
    bool setSearchText(const QString &text);
    QString statusFilter() const;
    QString searchText() const;

    bool accepts(const data::TaskRecord &task) const;
    std::vector<const data::TaskRecord *> apply(const std::vector<data::TaskRecord> &tasks) const;

private:
    QString m_statusFilter;
    QString m_searchText;
};

const QStringList &statusFilterCycle();
QString nextStatusFilter(const QString &current);

} // namespace ui
} // namespace taskview
