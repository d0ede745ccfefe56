#pragma once

#include "taskview/data/TaskRepository.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace taskview {
namespace data {

constexpr qint64 MaxTaskFileSize = 1024 * 1024;
constexpr int MaxPersistedTitleLength = 500;
constexpr int MaxPersistedDescriptionLength = 5000;
constexpr int MaxPersistedLabels = 10;
constexpr int MaxPersistedAssigneeLength = 100;

extern const QLatin1String CorruptedFilePrefix;

// One JSON file per task under <root>/tasks.
class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(QString rootPath);
    ~FileTaskRepository() override = default;

    const std::vector<TaskRecord> &loadAll() override;
    const std::vector<TaskRecord> &tasks() const override;
    int skippedCount() const override;
    TaskRecord *findById(const QString &id) override;
    bool saveTask(TaskRecord &task) override;

    QString rootPath() const;
    QString tasksDirectory() const;
    QString filePathFor(const QString &id) const;

private:
    std::optional<TaskRecord> readTaskFile(const QString &filePath) const;

    QString m_rootPath;
    std::vector<TaskRecord> m_tasks;
    int m_skippedCount = 0;
};

bool isSafeTaskId(const QString &id);

// Applies the persistence caps to an already sanitized record.
TaskRecord persistedForm(const TaskRecord &task);

// Indented JSON restricted to ASCII: every other character becomes \uXXXX.
QByteArray encodeAsciiJson(const QJsonObject &object);

} // namespace data
} // namespace taskview
