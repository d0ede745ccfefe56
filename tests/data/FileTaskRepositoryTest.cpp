#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <memory>

#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/FileTaskRepository.hpp"

using namespace taskview::data;

namespace {
void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(content), qint64(content.size()));
}

QByteArray taskJson(const QString &id, const QString &priority, const QString &createdAt)
{
    const QJsonObject object{
        { QStringLiteral("id"), id },
        { QStringLiteral("title"), QStringLiteral("Task %1").arg(id) },
        { QStringLiteral("priority"), priority },
        { QStringLiteral("createdAt"), createdAt },
    };
    return QJsonDocument(object).toJson();
}
} // namespace

class FileTaskRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void missingDirectoryLoadsNothing();
    void loadsEscapeLadenTitleAsDanger();
    void skipsLargeFiles();
    void skipsCorruptedAndInvalidFiles();
    void sortsByPriorityThenNewest();
    void saveRoundTrip();
    void savesAsciiOnlyJson();
    void saveAppliesPersistenceCaps();
    void savedRecordMatchesPersistedForm();
    void togglePersistsAcrossReload();
    void rejectsUnsafeIds();

private:
    QString tasksPath(const QString &fileName) const;

    std::unique_ptr<QTemporaryDir> m_dir;
};

void FileTaskRepositoryTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    QVERIFY(QDir(m_dir->path()).mkpath(QStringLiteral("tasks")));
}

void FileTaskRepositoryTest::cleanup()
{
    m_dir.reset();
}

QString FileTaskRepositoryTest::tasksPath(const QString &fileName) const
{
    return QDir(m_dir->path()).filePath(QStringLiteral("tasks/") + fileName);
}

void FileTaskRepositoryTest::missingDirectoryLoadsNothing()
{
    FileTaskRepository repo(QDir(m_dir->path()).filePath(QStringLiteral("nowhere")));
    QVERIFY(repo.loadAll().empty());
}

void FileTaskRepositoryTest::loadsEscapeLadenTitleAsDanger()
{
    writeFile(tasksPath(QStringLiteral("evil.json")),
              QByteArrayLiteral("{\"id\": \"evil\", \"title\": \"\\u001b[31mDANGER\\u001b[0m\", \"status\": \"todo\"}"));

    FileTaskRepository repo(m_dir->path());
    const auto &tasks = repo.loadAll();
    QCOMPARE(tasks.size(), std::size_t(1));
    QCOMPARE(tasks.front().title, QStringLiteral("DANGER"));
    QVERIFY(repo.findById(QStringLiteral("evil")));
}

void FileTaskRepositoryTest::skipsLargeFiles()
{
    const QJsonObject big{
        { QStringLiteral("id"), QStringLiteral("big") },
        { QStringLiteral("description"), QString(2 * 1024 * 1024, QLatin1Char('x')) },
    };
    writeFile(tasksPath(QStringLiteral("big.json")), QJsonDocument(big).toJson());
    writeFile(tasksPath(QStringLiteral("small.json")), taskJson(QStringLiteral("small"), QStringLiteral("low"), QString()));

    FileTaskRepository repo(m_dir->path());
    const auto &tasks = repo.loadAll();
    QCOMPARE(tasks.size(), std::size_t(1));
    QCOMPARE(tasks.front().id, QStringLiteral("small"));
    QCOMPARE(repo.skippedCount(), 1);
}

void FileTaskRepositoryTest::skipsCorruptedAndInvalidFiles()
{
    writeFile(tasksPath(QStringLiteral("corrupted-old.json")), taskJson(QStringLiteral("old"), QStringLiteral("high"), QString()));
    writeFile(tasksPath(QStringLiteral("broken.json")), QByteArrayLiteral("{\"id\": \"broken\""));
    writeFile(tasksPath(QStringLiteral("array.json")), QByteArrayLiteral("[1, 2, 3]"));
    writeFile(tasksPath(QStringLiteral("notes.txt")), taskJson(QStringLiteral("txt"), QStringLiteral("high"), QString()));
    writeFile(tasksPath(QStringLiteral("good.json")), taskJson(QStringLiteral("good"), QStringLiteral("high"), QString()));

    FileTaskRepository repo(m_dir->path());
    const auto &tasks = repo.loadAll();
    QCOMPARE(tasks.size(), std::size_t(1));
    QCOMPARE(tasks.front().id, QStringLiteral("good"));
    QCOMPARE(repo.skippedCount(), 2);
}

void FileTaskRepositoryTest::sortsByPriorityThenNewest()
{
    writeFile(tasksPath(QStringLiteral("a.json")), taskJson(QStringLiteral("low-old"), QStringLiteral("low"), QStringLiteral("2024-01-01T00:00:00Z")));
    writeFile(tasksPath(QStringLiteral("b.json")), taskJson(QStringLiteral("crit"), QStringLiteral("critical"), QStringLiteral("2023-01-01T00:00:00Z")));
    writeFile(tasksPath(QStringLiteral("c.json")), taskJson(QStringLiteral("low-new"), QStringLiteral("low"), QStringLiteral("2024-06-01T12:30:00.250Z")));
    writeFile(tasksPath(QStringLiteral("d.json")), taskJson(QStringLiteral("odd"), QStringLiteral("urgent"), QStringLiteral("2025-01-01T00:00:00Z")));
    writeFile(tasksPath(QStringLiteral("e.json")), taskJson(QStringLiteral("low-undated"), QStringLiteral("low"), QString()));

    FileTaskRepository repo(m_dir->path());
    const auto &tasks = repo.loadAll();
    QStringList ids;
    for (const auto &task : tasks) {
        ids << task.id;
    }
    QCOMPARE(ids,
             QStringList({ QStringLiteral("crit"),
                           QStringLiteral("low-new"),
                           QStringLiteral("low-old"),
                           QStringLiteral("low-undated"),
                           QStringLiteral("odd") }));
}

void FileTaskRepositoryTest::saveRoundTrip()
{
    FileTaskRepository repo(m_dir->path());
    TaskRecord task;
    task.id = QStringLiteral("roundtrip");
    task.title = QStringLiteral("Ship release");
    task.description = QStringLiteral("Tag\nUpload");
    task.status = QString(TaskStatus::InProgress);
    task.priority = QString(TaskPriority::High);
    task.labels = QStringList{ QStringLiteral("release") };
    task.assignee = QStringLiteral("kim");
    task.estimatedHours = 3;
    task.createdAt = QStringLiteral("2024-05-05T05:05:05Z");

    QVERIFY(repo.saveTask(task));
    QVERIFY(!task.updatedAt.isEmpty());
    QVERIFY(QFile::exists(repo.filePathFor(task.id)));

    FileTaskRepository reloaded(m_dir->path());
    const auto &tasks = reloaded.loadAll();
    QCOMPARE(tasks.size(), std::size_t(1));
    QVERIFY(tasks.front() == task);
}

void FileTaskRepositoryTest::savesAsciiOnlyJson()
{
    FileTaskRepository repo(m_dir->path());
    TaskRecord task;
    task.id = QStringLiteral("unicode");
    task.title = QString::fromUtf8("Caf\xC3\xA9 \xE4\xB8\x96\xE7\x95\x8C");

    QVERIFY(repo.saveTask(task));

    QFile file(repo.filePathFor(task.id));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray content = file.readAll();
    for (const char byte : content) {
        QVERIFY(static_cast<unsigned char>(byte) < 0x80);
    }
    QVERIFY(content.contains("\\u00e9"));
    QVERIFY(content.contains("\n  \"id\""));

    FileTaskRepository reloaded(m_dir->path());
    QCOMPARE(reloaded.loadAll().front().title, task.title);
}

void FileTaskRepositoryTest::saveAppliesPersistenceCaps()
{
    FileTaskRepository repo(m_dir->path());
    TaskRecord task;
    task.id = QStringLiteral("labels");
    for (int i = 0; i < 15; ++i) {
        task.labels << QStringLiteral("l%1").arg(i);
    }
    task.description = QStringLiteral("\x1b[31mred");

    QVERIFY(repo.saveTask(task));

    FileTaskRepository reloaded(m_dir->path());
    const TaskRecord &stored = reloaded.loadAll().front();
    QCOMPARE(stored.labels.size(), MaxPersistedLabels);
    QCOMPARE(stored.description, QStringLiteral("red"));
}

void FileTaskRepositoryTest::savedRecordMatchesPersistedForm()
{
    writeFile(tasksPath(QStringLiteral("long.json")), taskJson(QStringLiteral("long"), QStringLiteral("low"), QString()));

    FileTaskRepository repo(m_dir->path());
    repo.loadAll();
    QCOMPARE(repo.skippedCount(), 0);

    TaskRecord updated = *repo.findById(QStringLiteral("long"));
    QStringList lines;
    for (int i = 0; i < 9; ++i) {
        lines << QString(99, QLatin1Char('a'));
    }
    updated.title = lines.join(QLatin1Char('\n'));
    updated.description = QStringLiteral("\x1b[31mred");
    QCOMPARE(taskview::core::codePointCount(updated.title), 899);

    QVERIFY(repo.saveTask(updated));
    QCOMPARE(taskview::core::codePointCount(updated.title), MaxPersistedTitleLength);
    QCOMPARE(updated.description, QStringLiteral("red"));

    const TaskRecord *stored = repo.findById(QStringLiteral("long"));
    QVERIFY(stored);
    QCOMPARE(taskview::core::codePointCount(stored->title), MaxPersistedTitleLength);
    QVERIFY(!stored->description.contains(QChar(0x1b)));
    QCOMPARE(stored->updatedAt, updated.updatedAt);

    FileTaskRepository reloaded(m_dir->path());
    reloaded.loadAll();
    QVERIFY(*reloaded.findById(QStringLiteral("long")) == *stored);
}

void FileTaskRepositoryTest::togglePersistsAcrossReload()
{
    writeFile(tasksPath(QStringLiteral("t.json")),
              QByteArrayLiteral("{\"id\": \"t\", \"title\": \"Finish\", \"status\": \"done\"}"));

    FileTaskRepository repo(m_dir->path());
    repo.loadAll();
    TaskRecord updated = *repo.findById(QStringLiteral("t"));
    updated.status = nextStatus(updated.status);
    QVERIFY(repo.saveTask(updated));
    QCOMPARE(repo.findById(QStringLiteral("t"))->status, QStringLiteral("todo"));

    FileTaskRepository reloaded(m_dir->path());
    reloaded.loadAll();
    QCOMPARE(reloaded.findById(QStringLiteral("t"))->status, QStringLiteral("todo"));
}

void FileTaskRepositoryTest::rejectsUnsafeIds()
{
    FileTaskRepository repo(m_dir->path());
    TaskRecord task;
    task.title = QStringLiteral("Escape");

    const QStringList unsafe{ QString(), QStringLiteral("."), QStringLiteral(".."), QStringLiteral("../outside"),
                              QStringLiteral("a\\b"), QStringLiteral("id\x1b[2J") };
    for (const QString &id : unsafe) {
        task.id = id;
        QVERIFY(!repo.saveTask(task));
        QVERIFY(!isSafeTaskId(id));
    }
    QVERIFY(!QFile::exists(QDir(m_dir->path()).filePath(QStringLiteral("outside.json"))));
    QVERIFY(isSafeTaskId(QStringLiteral("task-1")));
}

QTEST_GUILESS_MAIN(FileTaskRepositoryTest)
#include "FileTaskRepositoryTest.moc"
