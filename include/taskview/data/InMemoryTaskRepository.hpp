#pragma once

#include "taskview/data/TaskRepository.hpp"

namespace taskview {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    const std::vector<TaskRecord> &loadAll() override;
    const std::vector<TaskRecord> &tasks() const override;
    int skippedCount() const override;
    TaskRecord *findById(const QString &id) override;
    bool saveTask(TaskRecord &task) override;

    // Stored records, as if written to disk; visible after the next loadAll().
    void addTask(TaskRecord task);
    void setFailSaves(bool fail);
    void setSkippedCount(int count);
    int saveCount() const;

private:
    std::vector<TaskRecord> m_stored;
    std::vector<TaskRecord> m_tasks;
    bool m_failSaves = false;
    int m_skippedCount = 0;
    int m_saveCount = 0;
};

} // namespace data
} // namespace taskview
