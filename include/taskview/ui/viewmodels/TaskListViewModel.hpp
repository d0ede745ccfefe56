#pragma once

#include <QObject>
#include <memory>
#include <optional>
#include <vector>

#include "taskview/core/ErrorBudget.hpp"
#include "taskview/data/Task.hpp"
#include "taskview/ui/models/TaskFilter.hpp"

namespace taskview {
namespace data {
class TaskRepository;
}

namespace ui {

class TaskTableModel;

constexpr int EditTitleLength = 100;
constexpr int EditDescriptionLength = 200;
constexpr int EditAssigneeLength = 50;
constexpr int NotificationLength = 100;

enum class Severity
{
    Information,
    Warning,
    Error,
};

// Raw values from the edit form. Nothing here is trusted except taskId, which
// names the record the form was opened for.
struct TaskEdit
{
    QString taskId;
    QString title;
    QString description;
    QString priority;
    QString status;
    QString assignee;
};

class TaskListViewModel : public QObject
{
    Q_OBJECT
public:
    explicit TaskListViewModel(data::TaskRepository &repository, QObject *parent = nullptr);
    ~TaskListViewModel() override;

    TaskTableModel *model() const;
    const std::vector<const data::TaskRecord *> &rows() const;
    int totalCount() const;
    QString subtitle() const;

    QString statusFilter() const;
    QString searchQuery() const;

    std::optional<int> selectedRow() const;
    const data::TaskRecord *selectedTask() const;

    static TaskEdit editDraft(const data::TaskRecord &task);
    // An edit needs a title that is non-empty after trimming and sanitizing.
    static bool acceptsEdit(const TaskEdit &edit);

public slots:
    void reload();
    void refreshTasks();
    void setStatusFilter(const QString &status);
    void cycleStatusFilter();
    void setSearchQuery(const QString &text);
    void selectRow(int row);
    void moveSelection(int delta);
    bool toggleSelectedStatus();
    bool applyEdit(const taskview::ui::TaskEdit &edit);

signals:
    void tasksChanged();
    void selectionChanged();
    void notificationRaised(const QString &message, taskview::ui::Severity severity);
    void errorRaised(taskview::core::ErrorKind kind, const QString &message);

private:
    int loadTasks();
    void applyFilter();
    void restoreSelection(const QString &taskId, int fallbackRow);
    bool saveAndReload(data::TaskRecord &task, int fallbackRow);
    void notify(const QString &message, Severity severity);

    data::TaskRepository &m_repository;
    TaskFilter m_filter;
    std::vector<const data::TaskRecord *> m_rows;
    std::unique_ptr<TaskTableModel> m_model;
    std::optional<int> m_selectedRow;
};

} // namespace ui
} // namespace taskview
