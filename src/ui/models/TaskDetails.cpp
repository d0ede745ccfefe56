#include "taskview/ui/models/TaskDetails.hpp"

#include "taskview/core/Sanitizer.hpp"

namespace taskview {
namespace ui {

const QLatin1String NoSelectionText("Select a task to view details");

QString statusDisplay(const QString &status)
{
    return data::statusIcon(status) + QLatin1Char(' ') + data::displayName(core::sanitize(status));
}

QString priorityDisplay(const QString &priority)
{
    return data::priorityBadge(priority) + QLatin1Char(' ') + data::displayName(core::sanitize(priority));
}

QStringList taskDetailsLines(const data::TaskRecord &task)
{
    QStringList labels;
    for (const QString &label : task.labels) {
        labels << QLatin1Char('#') + label;
    }

    const QStringList source{
        QStringLiteral("TITLE: %1").arg(task.title),
        QStringLiteral("STATUS: %1").arg(statusDisplay(task.status)),
        QStringLiteral("PRIORITY: %1").arg(priorityDisplay(task.priority)),
        QString(),
        QStringLiteral("DESCRIPTION:"),
        task.description.isEmpty() ? QStringLiteral("No description provided") : task.description,
        QString(),
        QStringLiteral("ID: %1").arg(task.id),
        QStringLiteral("Assignee: %1").arg(task.assignee.isEmpty() ? QStringLiteral("Unassigned") : task.assignee),
        QStringLiteral("Labels: %1").arg(labels.isEmpty() ? QStringLiteral("None") : labels.join(QStringLiteral(", "))),
        QStringLiteral("Estimated Hours: %1")
            .arg(task.estimatedHours > 0 ? QString::number(task.estimatedHours) : QStringLiteral("Not set")),
        QStringLiteral("Created: %1").arg(task.createdAt),
        QStringLiteral("Updated: %1").arg(task.updatedAt),
    };

    QStringList lines;
    for (const QString &line : source) {
        lines << core::sanitize(line, DetailsLineLength).split(QLatin1Char('\n'));
    }
    return lines;
}

} // namespace ui
} // namespace taskview
