#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace taskview {
namespace data {

namespace TaskStatus {
constexpr QLatin1String Todo("todo");
constexpr QLatin1String InProgress("in_progress");
constexpr QLatin1String Done("done");
constexpr QLatin1String Blocked("blocked");
constexpr QLatin1String Archived("archived");

const QStringList &all();
} // namespace TaskStatus

namespace TaskPriority {
constexpr QLatin1String Critical("critical");
constexpr QLatin1String High("high");
constexpr QLatin1String Medium("medium");
constexpr QLatin1String Low("low");

const QStringList &all();
} // namespace TaskPriority

// A task as read from storage. Status and priority stay plain strings so that
// values outside the known sets survive a load/save cycle untouched.
struct TaskRecord
{
    QString id;
    QString title;
    QString description;
    QString status = QString(TaskStatus::Todo);
    QString priority = QString(TaskPriority::Medium);
    QStringList labels;
    QString assignee;
    int estimatedHours = 0;
    QString createdAt;
    QString updatedAt;

    // Never fails: missing or malformed fields fall back to their defaults.
    static TaskRecord fromJson(const QJsonObject &object);
    QJsonObject toJson() const;

    bool operator==(const TaskRecord &other) const;
    bool operator!=(const TaskRecord &other) const { return !(*this == other); }
};

QString statusIcon(const QString &status);
QString priorityBadge(const QString &priority);
int priorityRank(const QString &priority);
QString nextStatus(const QString &status);
QString displayName(const QString &value);

} // namespace data
} // namespace taskview
