#include "taskview/core/AppContext.hpp"

#include "taskview/data/DataProvider.hpp"

#include "taskview/core/ErrorBudget.hpp"

namespace taskview {
namespace core {

AppContext::AppContext(AppSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.storageRoot))
    , m_errorBudget(std::make_unique<ErrorBudget>(m_settings.maxErrors))
{
}

AppContext::~AppContext() = default;

data::TaskRepository &AppContext::taskRepository()
{
    return m_dataProvider->taskRepository();
}

ErrorBudget &AppContext::errorBudget()
{
    return *m_errorBudget;
}

const AppSettings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace taskview
