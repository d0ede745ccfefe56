#pragma once

#include <QObject>
#include <QString>
#include <functional>
#include <memory>

#include "taskview/core/ErrorBudget.hpp"
#include "taskview/ui/viewmodels/TaskListViewModel.hpp"

class QSocketNotifier;
class QTimer;

namespace taskview {
namespace ui {

class TaskEditForm;
class TerminalSession;

// Draws the task table, details panel and status lines, and dispatches keys.
// Every key is handled inside one error boundary that turns failures into a
// notification and an error budget entry.
class TerminalWindow : public QObject
{
    Q_OBJECT

public:
    TerminalWindow(TaskListViewModel &viewModel,
                   core::ErrorBudget &errorBudget,
                   TerminalSession &session,
                   QObject *parent = nullptr);
    ~TerminalWindow() override;

    void start();

signals:
    void quitRequested(int exitCode);

public slots:
    void reportError(taskview::core::ErrorKind kind, const QString &message);

private slots:
    void readInput();

private:
    void runGuarded(const std::function<void()> &action);
    void dispatch(bool functionKey, unsigned int key);
    void handleKey(bool functionKey, unsigned int key);
    void handleSearchKey(bool functionKey, unsigned int key);
    void handleFormKey(bool functionKey, unsigned int key);
    void openEditForm();
    void showNotification(const QString &message, taskview::ui::Severity severity);
    void requestQuit(int exitCode);

    void render();
    void renderHeader(int columns);
    void renderTable(int top, int left, int height, int width);
    void renderDetails(int top, int left, int height, int width);
    void renderStatusLines(int rows, int columns);

    TaskListViewModel &m_viewModel;
    core::ErrorBudget &m_errorBudget;
    TerminalSession &m_session;
    QSocketNotifier *m_inputNotifier = nullptr;
    QTimer *m_pollTimer = nullptr;
    std::unique_ptr<TaskEditForm> m_editForm;
    bool m_searchMode = false;
    QString m_searchBuffer;
    QString m_notification;
    Severity m_notificationSeverity = Severity::Information;
    int m_scrollOffset = 0;
    bool m_quitting = false;
};

} // namespace ui
} // namespace taskview
