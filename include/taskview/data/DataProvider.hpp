#pragma once

#include <memory>
#include <QString>

namespace taskview {
namespace data {

class TaskRepository;

class DataProvider
{
public:
    explicit DataProvider(const QString &storageRoot);
    ~DataProvider();

    TaskRepository &taskRepository();
    QString storageRoot() const;

private:
    QString m_storageRoot;
    std::unique_ptr<TaskRepository> m_taskRepository;
};

} // namespace data
} // namespace taskview
