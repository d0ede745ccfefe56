#pragma once

#include <memory>

#include "taskview/core/AppSettings.hpp"

namespace taskview {
namespace data {
class DataProvider;
class TaskRepository;
}

namespace core {

class ErrorBudget;

class AppContext
{
public:
    explicit AppContext(AppSettings settings);
    ~AppContext();

    data::TaskRepository &taskRepository();
    ErrorBudget &errorBudget();
    const AppSettings &settings() const;

private:
    AppSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<ErrorBudget> m_errorBudget;
};

} // namespace core
} // namespace taskview
