#include "taskview/data/Task.hpp"

#include <QJsonArray>

#include "taskview/core/Sanitizer.hpp"

namespace taskview {
namespace data {

namespace TaskStatus {
const QStringList &all()
{
    static const QStringList statuses{ Todo, InProgress, Done, Blocked, Archived };
    return statuses;
}
} // namespace TaskStatus

namespace TaskPriority {
const QStringList &all()
{
    static const QStringList priorities{ Critical, High, Medium, Low };
    return priorities;
}
} // namespace TaskPriority

namespace {
QString stringField(const QJsonObject &object, const QString &key, const QString &fallback = QString())
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return fallback;
    }
    return core::sanitize(value);
}

QStringList labelsField(const QJsonObject &object)
{
    QStringList labels;
    const QJsonValue value = object.value(QStringLiteral("labels"));
    if (!value.isArray()) {
        return labels;
    }
    const QJsonArray array = value.toArray();
    labels.reserve(array.size());
    for (const QJsonValue &entry : array) {
        labels << core::sanitize(entry);
    }
    return labels;
}
} // namespace

TaskRecord TaskRecord::fromJson(const QJsonObject &object)
{
    TaskRecord task;
    task.id = stringField(object, QStringLiteral("id"));
    task.title = stringField(object, QStringLiteral("title"));
    task.description = stringField(object, QStringLiteral("description"));
    task.status = stringField(object, QStringLiteral("status"), TaskStatus::Todo);
    task.priority = stringField(object, QStringLiteral("priority"), TaskPriority::Medium);
    task.labels = labelsField(object);
    task.assignee = stringField(object, QStringLiteral("assignee"));
    task.estimatedHours = core::sanitizeNumber(object.value(QStringLiteral("estimatedHours")));
    task.createdAt = stringField(object, QStringLiteral("createdAt"));
    task.updatedAt = stringField(object, QStringLiteral("updatedAt"));
    return task;
}

QJsonObject TaskRecord::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), id);
    object.insert(QStringLiteral("title"), title);
    object.insert(QStringLiteral("description"), description);
    object.insert(QStringLiteral("status"), status);
    object.insert(QStringLiteral("priority"), priority);
    object.insert(QStringLiteral("labels"), QJsonArray::fromStringList(labels));
    object.insert(QStringLiteral("assignee"), assignee);
    object.insert(QStringLiteral("estimatedHours"), estimatedHours);
    object.insert(QStringLiteral("createdAt"), createdAt);
    object.insert(QStringLiteral("updatedAt"), updatedAt);
    return object;
}

bool TaskRecord::operator==(const TaskRecord &other) const
{
    return id == other.id && title == other.title && description == other.description
        && status == other.status && priority == other.priority && labels == other.labels
        && assignee == other.assignee && estimatedHours == other.estimatedHours
        && createdAt == other.createdAt && updatedAt == other.updatedAt;
}

QString statusIcon(const QString &status)
{
    if (status == TaskStatus::Todo) {
        return QString(QChar(0x25CB));
    }
    if (status == TaskStatus::InProgress) {
        return QString(QChar(0x25CF));
    }
    if (status == TaskStatus::Done) {
        return QString(QChar(0x2713));
    }
    if (status == TaskStatus::Blocked) {
        return QString(QChar(0x2298));
    }
    if (status == TaskStatus::Archived) {
        return QString(QChar(0x25A1));
    }
    return QStringLiteral("?");
}

QString priorityBadge(const QString &priority)
{
    if (priority == TaskPriority::Critical) {
        return QStringLiteral("[CRIT]");
    }
    if (priority == TaskPriority::High) {
        return QStringLiteral("[HIGH]");
    }
    if (priority == TaskPriority::Medium) {
        return QStringLiteral("[MED]");
    }
    if (priority == TaskPriority::Low) {
        return QStringLiteral("[LOW]");
    }
    return QStringLiteral("[UNK]");
}

int priorityRank(const QString &priority)
{
    if (priority == TaskPriority::Critical) {
        return 4;
    }
    if (priority == TaskPriority::High) {
        return 3;
    }
    if (priority == TaskPriority::Medium) {
        return 2;
    }
    if (priority == TaskPriority::Low) {
        return 1;
    }
    return 0;
}

QString nextStatus(const QString &status)
{
    if (status == TaskStatus::Todo || status == TaskStatus::Blocked) {
        return TaskStatus::InProgress;
    }
    if (status == TaskStatus::InProgress) {
        return TaskStatus::Done;
    }
    return TaskStatus::Todo;
}

QString displayName(const QString &value)
{
    QString result = value.toLower();
    result.replace(QLatin1Char('_'), QLatin1Char(' '));
    bool wordStart = true;
    for (QChar &ch : result) {
        if (ch.isLetter()) {
            if (wordStart) {
                ch = ch.toUpper();
            }
            wordStart = false;
        } else {
            wordStart = true;
        }
    }
    return result;
}

} // namespace data
} // namespace taskview
