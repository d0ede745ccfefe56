#pragma once

#include <QString>
#include <vector>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    // Rebuilds the in-memory list from the backing store and returns it.
    virtual const std::vector<TaskRecord> &loadAll() = 0;
    virtual const std::vector<TaskRecord> &tasks() const = 0;
    // Files the last loadAll() could not read.
    virtual int skippedCount() const = 0;
    virtual TaskRecord *findById(const QString &id) = 0;
    // Persists the whole record and stamps task.updatedAt. Returns false on any
    // failure; the caller's record stays mutated either way.
    virtual bool saveTask(TaskRecord &task) = 0;
};

} // namespace data
} // namespace taskview
