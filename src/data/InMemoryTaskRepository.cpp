#include "taskview/data/InMemoryTaskRepository.hpp"

#include <QDateTime>
#include <algorithm>

#include "taskview/data/TaskOrdering.hpp"

namespace taskview {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

const std::vector<TaskRecord> &InMemoryTaskRepository::loadAll()
{
    m_tasks = m_stored;
    sortTasks(m_tasks, QDateTime::currentDateTime());
    if (m_tasks.size() > MaxLoadedTasks) {
        m_tasks.erase(m_tasks.begin() + static_cast<long>(MaxLoadedTasks), m_tasks.end());
    }
    return m_tasks;
}

const std::vector<TaskRecord> &InMemoryTaskRepository::tasks() const
{
    return m_tasks;
}

int InMemoryTaskRepository::skippedCount() const
{
    return m_skippedCount;
}

TaskRecord *InMemoryTaskRepository::findById(const QString &id)
{
    auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const TaskRecord &task) {
        return task.id == id;
    });
    return it == m_tasks.end() ? nullptr : &*it;
}

bool InMemoryTaskRepository::saveTask(TaskRecord &task)
{
    if (m_failSaves) {
        return false;
    }
    ++m_saveCount;
    task.updatedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    auto it = std::find_if(m_stored.begin(), m_stored.end(), [&task](const TaskRecord &stored) {
        return stored.id == task.id;
    });
    if (it == m_stored.end()) {
        m_stored.push_back(task);
    } else {
        *it = task;
    }
    return true;
}

void InMemoryTaskRepository::addTask(TaskRecord task)
{
    m_stored.push_back(std::move(task));
}

void InMemoryTaskRepository::setFailSaves(bool fail)
{
    m_failSaves = fail;
}

void InMemoryTaskRepository::setSkippedCount(int count)
{
    m_skippedCount = count;
}

int InMemoryTaskRepository::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace taskview
