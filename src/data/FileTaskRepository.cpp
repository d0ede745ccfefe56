#include "taskview/data/FileTaskRepository.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>

#include "taskview/core/Logging.hpp"
#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/TaskOrdering.hpp"

namespace taskview {
namespace data {

const QLatin1String CorruptedFilePrefix("corrupted-");

namespace {
const QString TasksFolder = QStringLiteral("tasks");

// Qt indents with four spaces per level; storage files use two.
QString halveIndentation(const QString &json)
{
    QStringList lines = json.split(QLatin1Char('\n'));
    for (QString &line : lines) {
        int spaces = 0;
        while (spaces < line.size() && line.at(spaces) == QLatin1Char(' ')) {
            ++spaces;
        }
        line.remove(0, spaces / 2);
    }
    return lines.join(QLatin1Char('\n'));
}
} // namespace

FileTaskRepository::FileTaskRepository(QString rootPath)
    : m_rootPath(std::move(rootPath))
{
}

const std::vector<TaskRecord> &FileTaskRepository::loadAll()
{
    m_tasks.clear();
    m_skippedCount = 0;

    const QDir dir(tasksDirectory());
    if (!dir.exists()) {
        return m_tasks;
    }

    const QFileInfoList entries = dir.entryInfoList({ QStringLiteral("*.json") }, QDir::Files, QDir::Name);
    for (const QFileInfo &entry : entries) {
        if (entry.fileName().startsWith(CorruptedFilePrefix)) {
            continue;
        }
        if (entry.size() > MaxTaskFileSize) {
            qCWarning(lcStore).noquote() << "Skipping large file" << core::sanitize(entry.fileName());
            ++m_skippedCount;
            continue;
        }
        auto task = readTaskFile(entry.absoluteFilePath());
        if (task) {
            m_tasks.push_back(std::move(*task));
        } else {
            ++m_skippedCount;
        }
    }

    sortTasks(m_tasks, QDateTime::currentDateTime());
    if (m_tasks.size() > MaxLoadedTasks) {
        m_tasks.erase(m_tasks.begin() + static_cast<long>(MaxLoadedTasks), m_tasks.end());
    }
    qCDebug(lcStore) << "Loaded" << m_tasks.size() << "tasks";
    return m_tasks;
}

const std::vector<TaskRecord> &FileTaskRepository::tasks() const
{
    return m_tasks;
}

int FileTaskRepository::skippedCount() const
{
    return m_skippedCount;
}

TaskRecord *FileTaskRepository::findById(const QString &id)
{
    auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const TaskRecord &task) {
        return task.id == id;
    });
    if (it == m_tasks.end()) {
        return nullptr;
    }
    return &*it;
}

bool FileTaskRepository::saveTask(TaskRecord &task)
{
    if (!isSafeTaskId(task.id)) {
        qCWarning(lcStore).noquote() << "Refusing to save task with unusable id" << core::sanitize(task.id);
        return false;
    }

    QDir root(m_rootPath);
    if (!root.mkpath(TasksFolder)) {
        qCWarning(lcStore).noquote() << "Could not create" << core::sanitize(tasksDirectory());
        return false;
    }

    const QString updatedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    TaskRecord persisted = persistedForm(task);
    persisted.updatedAt = updatedAt;

    QSaveFile file(filePathFor(task.id));
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStore).noquote() << "Error saving task" << core::sanitize(task.id) << file.errorString();
        return false;
    }
    const QByteArray payload = encodeAsciiJson(persisted.toJson());
    if (file.write(payload) != payload.size() || !file.commit()) {
        qCWarning(lcStore).noquote() << "Error saving task" << core::sanitize(task.id) << file.errorString();
        return false;
    }

    TaskRecord *stored = findById(task.id);
    task = persisted;
    if (stored && stored != &task) {
        *stored = persisted;
    }
    return true;
}

QString FileTaskRepository::rootPath() const
{
    return m_rootPath;
}

QString FileTaskRepository::tasksDirectory() const
{
    return QDir(m_rootPath).filePath(TasksFolder);
}

QString FileTaskRepository::filePathFor(const QString &id) const
{
    return QDir(tasksDirectory()).filePath(id + QStringLiteral(".json"));
}

std::optional<TaskRecord> FileTaskRepository::readTaskFile(const QString &filePath) const
{
    const QString name = core::sanitize(QFileInfo(filePath).fileName());
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore).noquote() << "Failed to load" << name << file.errorString();
        return std::nullopt;
    }
    // The size was checked before opening; the bounded read covers files that grow in between.
    const QByteArray content = file.read(MaxTaskFileSize + 1);
    if (content.size() > MaxTaskFileSize) {
        qCWarning(lcStore).noquote() << "Skipping large file" << name;
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(content, &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcStore).noquote() << "Failed to load" << name << error.errorString();
        return std::nullopt;
    }
    if (!document.isObject()) {
        qCWarning(lcStore).noquote() << "Failed to load" << name << "document is not an object";
        return std::nullopt;
    }
    return TaskRecord::fromJson(document.object());
}

bool isSafeTaskId(const QString &id)
{
    if (id.isEmpty() || id == QLatin1String(".") || id == QLatin1String("..")) {
        return false;
    }
    if (id.contains(QLatin1Char('/')) || id.contains(QLatin1Char('\\')) || id.contains(QChar(0))) {
        return false;
    }
    // The stored record carries the sanitized id; it has to name the same file.
    return core::sanitize(id) == id;
}

TaskRecord persistedForm(const TaskRecord &task)
{
    // Re-construct so the record is sanitized again on its way to disk.
    TaskRecord persisted = TaskRecord::fromJson(task.toJson());
    persisted.title = core::truncateText(persisted.title, MaxPersistedTitleLength);
    persisted.description = core::truncateText(persisted.description, MaxPersistedDescriptionLength);
    persisted.labels = persisted.labels.mid(0, MaxPersistedLabels);
    persisted.assignee = core::truncateText(persisted.assignee, MaxPersistedAssigneeLength);
    return persisted;
}

QByteArray encodeAsciiJson(const QJsonObject &object)
{
    const QString json = halveIndentation(QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Indented)));
    QByteArray result;
    result.reserve(json.size());
    for (const QChar ch : json) {
        const ushort unit = ch.unicode();
        if (unit < 0x7f) {
            result.append(static_cast<char>(unit));
        } else {
            result.append(QStringLiteral("\\u%1").arg(unit, 4, 16, QLatin1Char('0')).toLatin1());
        }
    }
    return result;
}

} // namespace data
} // namespace taskview
