#include <QtTest/QtTest>

#include "taskview/data/InMemoryTaskRepository.hpp"
#include "taskview/ui/models/TaskTableModel.hpp"
#include "taskview/ui/viewmodels/TaskListViewModel.hpp"

using namespace taskview;

namespace {
data::TaskRecord makeTask(const QString &id,
                          const QString &status,
                          const QString &priority = QStringLiteral("medium"),
                          const QString &createdAt = QString())
{
    data::TaskRecord task;
    task.id = id;
    task.title = QStringLiteral("Task %1").arg(id);
    task.status = status;
    task.priority = priority;
    task.createdAt = createdAt;
    return task;
}

struct Notifications
{
    QStringList messages;
    QList<ui::Severity> severities;
    QList<core::ErrorKind> errors;

    void watch(ui::TaskListViewModel &viewModel)
    {
        QObject::connect(&viewModel, &ui::TaskListViewModel::notificationRaised, [this](const QString &message, ui::Severity severity) {
            messages << message;
            severities << severity;
        });
        QObject::connect(&viewModel, &ui::TaskListViewModel::errorRaised, [this](core::ErrorKind kind, const QString &) {
            errors << kind;
        });
    }
};
} // namespace

class TaskListViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void reloadSelectsFirstRow();
    void emptyRepositoryHasNoSelection();
    void selectionIsClamped();
    void toggleAdvancesStatus();
    void toggleWrapsDoneToTodo();
    void toggleFailureIsReported();
    void toggleHiddenByFilterFallsBack();
    void editSanitizesAndValidates();
    void editRejectsEmptyTitle();
    void editKeepsCursorOnMovedTask();
    void editTargetsTaskTheFormWasOpenedFor();
    void editOfVanishedTaskIsRejected();
    void cycleAndSearch();
    void refreshNotifies();
    void skippedFilesAreReported();
};

void TaskListViewModelTest::reloadSelectsFirstRow()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    repo.addTask(makeTask(QStringLiteral("b"), QStringLiteral("done")));
    ui::TaskListViewModel viewModel(repo);

    int changes = 0;
    connect(&viewModel, &ui::TaskListViewModel::tasksChanged, this, [&changes]() { ++changes; });
    viewModel.reload();

    QCOMPARE(changes, 1);
    QCOMPARE(viewModel.rows().size(), std::size_t(2));
    QCOMPARE(viewModel.model()->rowCount(), 2);
    QCOMPARE(viewModel.selectedRow().value_or(-1), 0);
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("a"));
    QCOMPARE(viewModel.subtitle(), QStringLiteral("2 tasks"));
}

void TaskListViewModelTest::emptyRepositoryHasNoSelection()
{
    data::InMemoryTaskRepository repo;
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    QVERIFY(!viewModel.selectedRow().has_value());
    QVERIFY(!viewModel.selectedTask());
    QVERIFY(!viewModel.toggleSelectedStatus());
    QVERIFY(!viewModel.applyEdit(ui::TaskEdit{ {}, QStringLiteral("x"), {}, {}, {}, {} }));
    QCOMPARE(notifications.messages,
             QStringList({ QStringLiteral("No task selected"), QStringLiteral("Task not found") }));
    QCOMPARE(repo.saveCount(), 0);
}

void TaskListViewModelTest::selectionIsClamped()
{
    data::InMemoryTaskRepository repo;
    for (const QString &id : { QStringLiteral("1"), QStringLiteral("2"), QStringLiteral("3") }) {
        repo.addTask(makeTask(id, QStringLiteral("todo")));
    }
    ui::TaskListViewModel viewModel(repo);
    viewModel.reload();

    viewModel.moveSelection(10);
    QCOMPARE(viewModel.selectedRow().value_or(-1), 2);
    viewModel.moveSelection(-1);
    QCOMPARE(viewModel.selectedRow().value_or(-1), 1);
    viewModel.selectRow(-5);
    QCOMPARE(viewModel.selectedRow().value_or(-1), 0);
}

void TaskListViewModelTest::toggleAdvancesStatus()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    repo.addTask(makeTask(QStringLiteral("b"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();
    viewModel.selectRow(1);

    QVERIFY(viewModel.toggleSelectedStatus());
    QCOMPARE(repo.saveCount(), 1);
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("b"));
    QCOMPARE(viewModel.selectedTask()->status, QStringLiteral("in_progress"));
    QVERIFY(!viewModel.selectedTask()->updatedAt.isEmpty());
    QCOMPARE(notifications.messages.last(),
             QStringLiteral("Status: todo ") + QChar(0x2192) + QStringLiteral(" in_progress"));
    QVERIFY(notifications.severities.last() == ui::Severity::Information);
}

void TaskListViewModelTest::toggleWrapsDoneToTodo()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("done")));
    ui::TaskListViewModel viewModel(repo);
    viewModel.reload();

    QVERIFY(viewModel.toggleSelectedStatus());
    repo.loadAll();
    QCOMPARE(repo.findById(QStringLiteral("a"))->status, QStringLiteral("todo"));
}

void TaskListViewModelTest::toggleFailureIsReported()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();
    repo.setFailSaves(true);

    QVERIFY(!viewModel.toggleSelectedStatus());
    QCOMPARE(notifications.messages.last(), QStringLiteral("Failed to update task status"));
    QVERIFY(notifications.severities.last() == ui::Severity::Error);
    QCOMPARE(notifications.errors.size(), 1);
    QVERIFY(notifications.errors.first() == core::ErrorKind::SaveIo);
    QCOMPARE(viewModel.selectedTask()->status, QStringLiteral("todo"));
}

void TaskListViewModelTest::toggleHiddenByFilterFallsBack()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    repo.addTask(makeTask(QStringLiteral("b"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    viewModel.reload();
    viewModel.setStatusFilter(QStringLiteral("todo"));

    QVERIFY(viewModel.toggleSelectedStatus());
    QCOMPARE(viewModel.rows().size(), std::size_t(1));
    QCOMPARE(viewModel.selectedRow().value_or(-1), 0);
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("b"));
}

void TaskListViewModelTest::editSanitizesAndValidates()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    const ui::TaskEdit draft = ui::TaskListViewModel::editDraft(*viewModel.selectedTask());
    QCOMPARE(draft.title, QStringLiteral("Task a"));
    QCOMPARE(draft.priority, QStringLiteral("medium"));

    ui::TaskEdit edit;
    edit.taskId = QStringLiteral("a");
    edit.title = QStringLiteral("  \x1b[31mNew title  ");
    edit.description = QStringLiteral("Body\x07");
    edit.priority = QStringLiteral("urgent");
    edit.status = QStringLiteral("sleeping");
    edit.assignee = QStringLiteral("\\033[1mpat");

    QVERIFY(viewModel.applyEdit(edit));
    const data::TaskRecord *task = viewModel.selectedTask();
    QCOMPARE(task->title, QStringLiteral("New title"));
    QCOMPARE(task->description, QStringLiteral("Body"));
    QCOMPARE(task->priority, QStringLiteral("medium"));
    QCOMPARE(task->status, QStringLiteral("todo"));
    QCOMPARE(task->assignee, QStringLiteral("pat"));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Task saved successfully"));

    edit.priority = QStringLiteral("critical");
    edit.status = QStringLiteral("blocked");
    QVERIFY(viewModel.applyEdit(edit));
    QCOMPARE(viewModel.selectedTask()->priority, QStringLiteral("critical"));
    QCOMPARE(viewModel.selectedTask()->status, QStringLiteral("blocked"));
}

void TaskListViewModelTest::editRejectsEmptyTitle()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    ui::TaskEdit edit = ui::TaskListViewModel::editDraft(*viewModel.selectedTask());
    edit.title = QStringLiteral("   \x1b[0m ");
    QVERIFY(!ui::TaskListViewModel::acceptsEdit(edit));
    QVERIFY(!viewModel.applyEdit(edit));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Title cannot be empty"));
    QVERIFY(notifications.severities.last() == ui::Severity::Warning);
    QCOMPARE(repo.saveCount(), 0);
}

void TaskListViewModelTest::editKeepsCursorOnMovedTask()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("x"), QStringLiteral("todo"), QStringLiteral("critical"),
                          QStringLiteral("2024-01-01T00:00:00Z")));
    repo.addTask(makeTask(QStringLiteral("y"), QStringLiteral("todo"), QStringLiteral("low"),
                          QStringLiteral("2024-06-01T00:00:00Z")));
    ui::TaskListViewModel viewModel(repo);
    viewModel.reload();
    viewModel.selectRow(1);
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("y"));

    ui::TaskEdit edit = ui::TaskListViewModel::editDraft(*viewModel.selectedTask());
    edit.priority = QStringLiteral("critical");
    QVERIFY(viewModel.applyEdit(edit));

    QCOMPARE(viewModel.selectedRow().value_or(-1), 0);
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("y"));
}

void TaskListViewModelTest::editTargetsTaskTheFormWasOpenedFor()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    repo.addTask(makeTask(QStringLiteral("b"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    viewModel.reload();
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("a"));

    ui::TaskEdit edit = ui::TaskListViewModel::editDraft(*viewModel.selectedTask());
    QCOMPARE(edit.taskId, QStringLiteral("a"));
    edit.title = QStringLiteral("Renamed");

    // The cursor moves while the form is open.
    viewModel.selectRow(1);
    QVERIFY(viewModel.applyEdit(edit));

    QCOMPARE(repo.saveCount(), 1);
    QCOMPARE(repo.findById(QStringLiteral("a"))->title, QStringLiteral("Renamed"));
    QCOMPARE(repo.findById(QStringLiteral("b"))->title, QStringLiteral("Task b"));
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("a"));
}

void TaskListViewModelTest::editOfVanishedTaskIsRejected()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    ui::TaskEdit edit = ui::TaskListViewModel::editDraft(*viewModel.selectedTask());
    edit.taskId = QStringLiteral("gone");
    QVERIFY(!viewModel.applyEdit(edit));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Task not found"));
    QVERIFY(notifications.severities.last() == ui::Severity::Warning);
    QCOMPARE(repo.saveCount(), 0);
}

void TaskListViewModelTest::cycleAndSearch()
{
    data::InMemoryTaskRepository repo;
    data::TaskRecord bug = makeTask(QStringLiteral("bug"), QStringLiteral("todo"));
    bug.title = QStringLiteral("Crash on start");
    repo.addTask(bug);
    repo.addTask(makeTask(QStringLiteral("done"), QStringLiteral("done")));
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    viewModel.cycleStatusFilter();
    QCOMPARE(viewModel.statusFilter(), QStringLiteral("todo"));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Filter: Todo"));
    QCOMPARE(viewModel.rows().size(), std::size_t(1));

    viewModel.cycleStatusFilter();
    QCOMPARE(notifications.messages.last(), QStringLiteral("Filter: In Progress"));
    QVERIFY(viewModel.rows().empty());
    QVERIFY(!viewModel.selectedRow().has_value());

    viewModel.setStatusFilter(QStringLiteral("all"));
    viewModel.setSearchQuery(QStringLiteral("CRASH"));
    QCOMPARE(viewModel.searchQuery(), QStringLiteral("crash"));
    QCOMPARE(viewModel.rows().size(), std::size_t(1));
    QCOMPARE(viewModel.selectedTask()->id, QStringLiteral("bug"));
    QCOMPARE(viewModel.totalCount(), 2);
}

void TaskListViewModelTest::refreshNotifies()
{
    data::InMemoryTaskRepository repo;
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);
    viewModel.reload();

    repo.addTask(makeTask(QStringLiteral("late"), QStringLiteral("todo")));
    viewModel.refreshTasks();
    QCOMPARE(viewModel.rows().size(), std::size_t(1));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Tasks refreshed"));
}

void TaskListViewModelTest::skippedFilesAreReported()
{
    data::InMemoryTaskRepository repo;
    repo.addTask(makeTask(QStringLiteral("a"), QStringLiteral("todo")));
    repo.setSkippedCount(2);
    ui::TaskListViewModel viewModel(repo);
    Notifications notifications;
    notifications.watch(viewModel);

    viewModel.reload();
    QCOMPARE(viewModel.rows().size(), std::size_t(1));
    QCOMPARE(notifications.messages.last(), QStringLiteral("Skipped 2 unreadable task files"));
    QVERIFY(notifications.severities.last() == ui::Severity::Warning);

    viewModel.refreshTasks();
    QCOMPARE(notifications.messages.last(), QStringLiteral("Tasks refreshed, skipped 2 unreadable task files"));
    QVERIFY(notifications.severities.last() == ui::Severity::Warning);
    QVERIFY(notifications.errors.isEmpty());

    repo.setSkippedCount(0);
    viewModel.refreshTasks();
    QCOMPARE(notifications.messages.last(), QStringLiteral("Tasks refreshed"));
    QVERIFY(notifications.severities.last() == ui::Severity::Information);
}

QTEST_GUILESS_MAIN(TaskListViewModelTest)
#include "TaskListViewModelTest.moc"
