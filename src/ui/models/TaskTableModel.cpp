#include "taskview/ui/models/TaskTableModel.hpp"

#include "taskview/core/Sanitizer.hpp"

namespace taskview {
namespace ui {

TaskTableModel::TaskTableModel(QObject *parent)
    : QAbstractTableModel(parent)
{
}

int TaskTableModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_tasks.size());
}

int TaskTableModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}

QVariant TaskTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || !taskAt(index.row())) {
        return {};
    }

    switch (role) {
    case Qt::DisplayRole:
        return cellText(index.row(), index.column());
    case Qt::ToolTipRole:
        return taskAt(index.row())->description;
    default:
        return {};
    }
}

QVariant TaskTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
        return {};
    }
    switch (section) {
    case StatusColumn:
        return QStringLiteral("S");
    case PriorityColumn:
        return QStringLiteral("P");
    case TitleColumn:
        return QStringLiteral("Title");
    case AssigneeColumn:
        return QStringLiteral("Assignee");
    case LabelsColumn:
        return QStringLiteral("Labels");
    default:
        return {};
    }
}

void TaskTableModel::setTasks(std::vector<const data::TaskRecord *> tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

const data::TaskRecord *TaskTableModel::taskAt(int row) const
{
    if (row < 0 || row >= static_cast<int>(m_tasks.size())) {
        return nullptr;
    }
    return m_tasks[static_cast<std::size_t>(row)];
}

QString TaskTableModel::cellText(int row, int column) const
{
    const data::TaskRecord *task = taskAt(row);
    if (!task) {
        return {};
    }

    switch (column) {
    case StatusColumn:
        return data::statusIcon(task->status);
    case PriorityColumn:
        return data::priorityBadge(task->priority);
    case TitleColumn: {
        // Single line in the table; the details panel shows the rest.
        QString title = task->title;
        title.replace(QLatin1Char('\n'), QLatin1Char(' '));
        if (core::codePointCount(title) > TableTitleLength) {
            return core::truncateText(title, TableTitleLength) + core::Ellipsis;
        }
        return title;
    }
    case AssigneeColumn:
        return core::truncateText(task->assignee, TableAssigneeLength);
    case LabelsColumn:
        return task->labels.mid(0, TableInlineLabels).join(QStringLiteral(", "));
    default:
        return {};
    }
}

} // namespace ui
} // namespace taskview
