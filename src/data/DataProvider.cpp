#include "taskview/data/DataProvider.hpp"

#include "taskview/core/Logging.hpp"
#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/FileTaskRepository.hpp"

namespace taskview {
namespace data {

DataProvider::DataProvider(const QString &storageRoot)
    : m_storageRoot(storageRoot)
    , m_taskRepository(std::make_unique<FileTaskRepository>(storageRoot))
{
    qCInfo(lcStore).noquote() << "Task storage at" << core::sanitize(m_storageRoot);
}

DataProvider::~DataProvider() = default;

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

QString DataProvider::storageRoot() const
{
    return m_storageRoot;
}

} // namespace data
} // namespace taskview
