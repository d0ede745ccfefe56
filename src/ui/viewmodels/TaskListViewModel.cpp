#include "taskview/ui/viewmodels/TaskListViewModel.hpp"

#include "taskview/core/Logging.hpp"
#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/TaskRepository.hpp"
#include "taskview/ui/models/CursorPreserver.hpp"
#include "taskview/ui/models/TaskTableModel.hpp"

namespace taskview {
namespace ui {

TaskListViewModel::TaskListViewModel(data::TaskRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_model(std::make_unique<TaskTableModel>(this))
{
}

TaskListViewModel::~TaskListViewModel() = default;

TaskTableModel *TaskListViewModel::model() const
{
    return m_model.get();
}

const std::vector<const data::TaskRecord *> &TaskListViewModel::rows() const
{
    return m_rows;
}

int TaskListViewModel::totalCount() const
{
    return static_cast<int>(m_repository.tasks().size());
}

QString TaskListViewModel::subtitle() const
{
    return tr("%1 tasks").arg(totalCount());
}

QString TaskListViewModel::statusFilter() const
{
    return m_filter.statusFilter();
}

QString TaskListViewModel::searchQuery() const
{
    return m_filter.searchText();
}

std::optional<int> TaskListViewModel::selectedRow() const
{
    return m_selectedRow;
}

const data::TaskRecord *TaskListViewModel::selectedTask() const
{
    if (!m_selectedRow) {
        return nullptr;
    }
    return m_model->taskAt(*m_selectedRow);
}

TaskEdit TaskListViewModel::editDraft(const data::TaskRecord &task)
{
    TaskEdit edit;
    edit.taskId = task.id;
    edit.title = core::truncateText(task.title, EditTitleLength);
    edit.description = core::truncateText(task.description, EditDescriptionLength);
    edit.priority = task.priority;
    edit.status = task.status;
    edit.assignee = core::truncateText(task.assignee, EditAssigneeLength);
    return edit;
}

bool TaskListViewModel::acceptsEdit(const TaskEdit &edit)
{
    return !core::sanitize(edit.title.trimmed()).isEmpty();
}

void TaskListViewModel::reload()
{
    const int skipped = loadTasks();
    if (skipped > 0) {
        notify(tr("Skipped %1 unreadable task files").arg(skipped), Severity::Warning);
    }
}

void TaskListViewModel::refreshTasks()
{
    const int skipped = loadTasks();
    if (skipped > 0) {
        notify(tr("Tasks refreshed, skipped %1 unreadable task files").arg(skipped), Severity::Warning);
    } else {
        notify(tr("Tasks refreshed"), Severity::Information);
    }
}

void TaskListViewModel::setStatusFilter(const QString &status)
{
    if (m_filter.setStatusFilter(status)) {
        applyFilter();
    }
}

void TaskListViewModel::cycleStatusFilter()
{
    setStatusFilter(nextStatusFilter(m_filter.statusFilter()));
    notify(tr("Filter: %1").arg(data::displayName(m_filter.statusFilter())), Severity::Information);
}

void TaskListViewModel::setSearchQuery(const QString &text)
{
    if (m_filter.setSearchText(text)) {
        applyFilter();
    }
}

void TaskListViewModel::selectRow(int row)
{
    std::optional<int> target;
    if (!m_rows.empty()) {
        target = qBound(0, row, static_cast<int>(m_rows.size()) - 1);
    }
    if (target == m_selectedRow) {
        return;
    }
    m_selectedRow = target;
    emit selectionChanged();
}

void TaskListViewModel::moveSelection(int delta)
{
    selectRow(m_selectedRow.value_or(0) + delta);
}

bool TaskListViewModel::toggleSelectedStatus()
{
    const data::TaskRecord *selected = selectedTask();
    if (!selected) {
        notify(tr("No task selected"), Severity::Warning);
        return false;
    }

    data::TaskRecord updated = *selected;
    const QString oldStatus = updated.status;
    updated.status = data::nextStatus(oldStatus);
    if (!saveAndReload(updated, *m_selectedRow)) {
        notify(tr("Failed to update task status"), Severity::Error);
        return false;
    }
    notify(tr("Status: %1 %2 %3").arg(oldStatus, QString(QChar(0x2192)), updated.status), Severity::Information);
    return true;
}

bool TaskListViewModel::applyEdit(const TaskEdit &edit)
{
    const data::TaskRecord *target = m_repository.findById(edit.taskId);
    if (!target) {
        notify(tr("Task not found"), Severity::Warning);
        return false;
    }

    if (!acceptsEdit(edit)) {
        notify(tr("Title cannot be empty"), Severity::Warning);
        return false;
    }

    data::TaskRecord updated = *target;
    updated.title = core::sanitize(edit.title.trimmed());
    updated.description = core::sanitize(edit.description);
    updated.priority = data::TaskPriority::all().contains(edit.priority) ? edit.priority
                                                                         : QString(data::TaskPriority::Medium);
    updated.status = data::TaskStatus::all().contains(edit.status) ? edit.status : QString(data::TaskStatus::Todo);
    updated.assignee = core::sanitize(edit.assignee);

    if (!saveAndReload(updated, m_selectedRow.value_or(0))) {
        notify(tr("Failed to save task"), Severity::Error);
        return false;
    }
    notify(tr("Task saved successfully"), Severity::Information);
    return true;
}

int TaskListViewModel::loadTasks()
{
    m_repository.loadAll();
    applyFilter();
    return m_repository.skippedCount();
}

void TaskListViewModel::applyFilter()
{
    m_rows = m_filter.apply(m_repository.tasks());
    m_model->setTasks(m_rows);
    m_selectedRow = m_rows.empty() ? std::nullopt : std::optional<int>(0);
    emit tasksChanged();
    emit selectionChanged();
}

void TaskListViewModel::restoreSelection(const QString &taskId, int fallbackRow)
{
    const std::optional<int> row = restoreRow(m_rows, taskId, fallbackRow);
    if (row == m_selectedRow) {
        return;
    }
    m_selectedRow = row;
    emit selectionChanged();
}

bool TaskListViewModel::saveAndReload(data::TaskRecord &task, int fallbackRow)
{
    // `task` is a working copy; the repository's list only changes through reload().
    const QString taskId = task.id;
    if (!m_repository.saveTask(task)) {
        emit errorRaised(core::ErrorKind::SaveIo, tr("Could not save task %1").arg(core::sanitize(taskId, NotificationLength)));
        return false;
    }
    loadTasks();
    restoreSelection(taskId, fallbackRow);
    return true;
}

void TaskListViewModel::notify(const QString &message, Severity severity)
{
    const QString safe = core::sanitize(message, NotificationLength);
    if (severity == Severity::Error) {
        qCWarning(lcUi).noquote() << safe;
    } else {
        qCDebug(lcUi).noquote() << safe;
    }
    emit notificationRaised(safe, severity);
}

} // namespace ui
} // namespace taskview
