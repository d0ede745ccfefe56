#include "taskview/ui/terminal/TerminalWindow.hpp"

#include <QSocketNotifier>
#include <QTimer>
#include <algorithm>
#include <exception>
#include <unistd.h>

#include "taskview/core/Logging.hpp"
#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/Task.hpp"
#include "taskview/ui/models/TaskDetails.hpp"
#include "taskview/ui/models/TaskTableModel.hpp"
#include "taskview/ui/terminal/TaskEditForm.hpp"
#include "taskview/ui/terminal/TerminalSession.hpp"
#include "taskview/ui/terminal/TextPainter.hpp"

#include <ncurses.h>

namespace taskview {
namespace ui {

namespace {
constexpr int PollIntervalMs = 200;
constexpr int SearchLength = 100;
constexpr int TablePercent = 60;
constexpr int PageStep = 10;
constexpr unsigned int EscapeKey = 27;
constexpr unsigned int DeleteKey = 127;
constexpr unsigned int BackspaceKey = 8;

int severityColor(Severity severity)
{
    switch (severity) {
    case Severity::Information:
        return SuccessColor;
    case Severity::Warning:
        return WarningColor;
    case Severity::Error:
        return ErrorColor;
    }
    return TextColor;
}

bool isSectionLabel(const QString &line)
{
    static const QStringList labels{ QStringLiteral("TITLE:"),
                                     QStringLiteral("STATUS:"),
                                     QStringLiteral("PRIORITY:"),
                                     QStringLiteral("DESCRIPTION:") };
    for (const QString &label : labels) {
        if (line.startsWith(label)) {
            return true;
        }
    }
    return false;
}
} // namespace

TerminalWindow::TerminalWindow(TaskListViewModel &viewModel,
                               core::ErrorBudget &errorBudget,
                               TerminalSession &session,
                               QObject *parent)
    : QObject(parent)
    , m_viewModel(viewModel)
    , m_errorBudget(errorBudget)
    , m_session(session)
{
    connect(&m_viewModel, &TaskListViewModel::notificationRaised, this, &TerminalWindow::showNotification);
    connect(&m_viewModel, &TaskListViewModel::errorRaised, this, &TerminalWindow::reportError);
}

TerminalWindow::~TerminalWindow() = default;

void TerminalWindow::start()
{
    m_inputNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    // activated() is overloaded since Qt 5.15.
    connect(m_inputNotifier, SIGNAL(activated(int)), this, SLOT(readInput()));

    // Resize events only surface through the next read.
    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(PollIntervalMs);
    connect(m_pollTimer, &QTimer::timeout, this, &TerminalWindow::readInput);
    m_pollTimer->start();

    runGuarded([this]() { m_viewModel.reload(); });
    if (!m_quitting) {
        render();
    }
}

void TerminalWindow::reportError(core::ErrorKind kind, const QString &message)
{
    showNotification(tr("Error: %1").arg(message), Severity::Error);
    if (!m_errorBudget.record(kind, message)) {
        requestQuit(1);
    }
}

void TerminalWindow::readInput()
{
    if (m_quitting || !m_session.isActive()) {
        return;
    }
    bool changed = false;
    wint_t key = 0;
    int kind = ERR;
    while (!m_quitting && (kind = get_wch(&key)) != ERR) {
        changed = true;
        if (kind == KEY_CODE_YES && key == KEY_RESIZE) {
            continue;
        }
        dispatch(kind == KEY_CODE_YES, static_cast<unsigned int>(key));
    }
    if (changed && !m_quitting) {
        render();
    }
}

void TerminalWindow::runGuarded(const std::function<void()> &action)
{
    try {
        action();
    } catch (const std::exception &error) {
        reportError(core::ErrorKind::Internal, QString::fromLocal8Bit(error.what()));
    }
}

void TerminalWindow::dispatch(bool functionKey, unsigned int key)
{
    runGuarded([this, functionKey, key]() {
        if (m_editForm) {
            handleFormKey(functionKey, key);
        } else if (m_searchMode) {
            handleSearchKey(functionKey, key);
        } else {
            handleKey(functionKey, key);
        }
    });
}

void TerminalWindow::handleKey(bool functionKey, unsigned int key)
{
    if (functionKey) {
        switch (key) {
        case KEY_UP:
            m_viewModel.moveSelection(-1);
            break;
        case KEY_DOWN:
            m_viewModel.moveSelection(1);
            break;
        case KEY_PPAGE:
            m_viewModel.moveSelection(-PageStep);
            break;
        case KEY_NPAGE:
            m_viewModel.moveSelection(PageStep);
            break;
        case KEY_HOME:
            m_viewModel.selectRow(0);
            break;
        case KEY_END:
            m_viewModel.selectRow(static_cast<int>(m_viewModel.rows().size()) - 1);
            break;
        case KEY_ENTER:
            openEditForm();
            break;
        default:
            break;
        }
        return;
    }

    switch (key) {
    case 'q':
        showNotification(tr("Exiting safely..."), Severity::Information);
        requestQuit(0);
        break;
    case 'r':
        m_viewModel.refreshTasks();
        break;
    case 'f':
        m_viewModel.cycleStatusFilter();
        break;
    case '/':
        m_searchMode = true;
        break;
    case '\n':
    case '\r':
        openEditForm();
        break;
    case ' ':
        m_viewModel.toggleSelectedStatus();
        break;
    case 'j':
        m_viewModel.moveSelection(1);
        break;
    case 'k':
        m_viewModel.moveSelection(-1);
        break;
    default:
        break;
    }
}

void TerminalWindow::handleSearchKey(bool functionKey, unsigned int key)
{
    if (functionKey) {
        switch (key) {
        case KEY_ENTER:
            m_searchMode = false;
            break;
        case KEY_UP:
            m_viewModel.moveSelection(-1);
            break;
        case KEY_DOWN:
            m_viewModel.moveSelection(1);
            break;
        case KEY_BACKSPACE:
            m_searchBuffer.chop(1);
            m_viewModel.setSearchQuery(m_searchBuffer);
            break;
        default:
            break;
        }
        return;
    }

    switch (key) {
    case EscapeKey:
    case '\n':
    case '\r':
        m_searchMode = false;
        break;
    case DeleteKey:
    case BackspaceKey:
        m_searchBuffer.chop(1);
        m_viewModel.setSearchQuery(m_searchBuffer);
        break;
    default:
        if (core::codePointCount(m_searchBuffer) < SearchLength) {
            m_searchBuffer += printableInput(key);
            m_viewModel.setSearchQuery(m_searchBuffer);
        }
        break;
    }
}

void TerminalWindow::handleFormKey(bool functionKey, unsigned int key)
{
    switch (m_editForm->handleKey(functionKey, key)) {
    case TaskEditForm::Result::Pending:
        break;
    case TaskEditForm::Result::Cancelled:
        m_editForm.reset();
        break;
    case TaskEditForm::Result::Submitted: {
        const TaskEdit edit = m_editForm->edit();
        if (!TaskListViewModel::acceptsEdit(edit)) {
            showNotification(tr("Title cannot be empty"), Severity::Warning);
            break;
        }
        m_editForm.reset();
        m_viewModel.applyEdit(edit);
        break;
    }
    }
}

void TerminalWindow::openEditForm()
{
    const data::TaskRecord *task = m_viewModel.selectedTask();
    if (!task) {
        showNotification(tr("No task selected"), Severity::Warning);
        return;
    }
    m_editForm = std::make_unique<TaskEditForm>(task->id, TaskListViewModel::editDraft(*task));
}

void TerminalWindow::showNotification(const QString &message, Severity severity)
{
    m_notification = core::sanitize(message, NotificationLength);
    m_notificationSeverity = severity;
}

void TerminalWindow::requestQuit(int exitCode)
{
    if (m_quitting) {
        return;
    }
    m_quitting = true;
    if (m_inputNotifier) {
        m_inputNotifier->setEnabled(false);
    }
    if (m_pollTimer) {
        m_pollTimer->stop();
    }
    qCInfo(lcUi) << "Quit requested with exit code" << exitCode;
    emit quitRequested(exitCode);
}

void TerminalWindow::render()
{
    if (!m_session.isActive()) {
        return;
    }
    int rows = 0;
    int columns = 0;
    getmaxyx(stdscr, rows, columns);
    erase();

    if (rows < 10 || columns < 40) {
        putText(0, 0, columns, tr("Terminal too small"), ErrorColor, true);
        refresh();
        return;
    }

    renderHeader(columns);
    const int bodyTop = 2;
    const int bodyHeight = rows - 4;
    const int tableWidth = columns * TablePercent / 100;
    renderTable(bodyTop, 0, bodyHeight, tableWidth);
    renderDetails(bodyTop, tableWidth, bodyHeight, columns - tableWidth);
    renderStatusLines(rows, columns);

    if (m_editForm) {
        m_editForm->render(rows, columns);
    }
    refresh();
}

void TerminalWindow::renderHeader(int columns)
{
    putText(0, 0, columns, tr("Task View - Terminal-Safe Task Management - %1").arg(m_viewModel.subtitle()), AccentColor, true);

    QString search = m_searchMode ? m_searchBuffer + QLatin1Char('_') : m_viewModel.searchQuery();
    if (!m_searchMode && search.isEmpty()) {
        search = tr("(press / to search)");
    }
    const QString filter = tr("Filter: %1").arg(data::displayName(m_viewModel.statusFilter()));
    const int filterWidth = filter.size() + 2;
    putText(1, 0, columns - filterWidth, tr("Search: %1").arg(search), m_searchMode ? SelectionColor : TextColor);
    putText(1, columns - filterWidth, filterWidth, filter, AccentColor);
}

void TerminalWindow::renderTable(int top, int left, int height, int width)
{
    drawBox(top, left, height, width, tr("Tasks"));
    const int innerLeft = left + 1;
    const int innerWidth = width - 2;
    const int visibleRows = height - 3;
    if (innerWidth <= 0 || visibleRows <= 0) {
        return;
    }

    const int statusWidth = 2;
    const int priorityWidth = 7;
    const int assigneeWidth = TableAssigneeLength + 1;
    const int labelsWidth = std::max(10, innerWidth / 5);
    const int titleWidth = std::max(8, innerWidth - statusWidth - priorityWidth - assigneeWidth - labelsWidth);
    const int widths[] = { statusWidth, priorityWidth, titleWidth, assigneeWidth, labelsWidth };

    const TaskTableModel *model = m_viewModel.model();
    int x = innerLeft;
    for (int column = 0; column < TaskTableModel::ColumnCount; ++column) {
        putText(top + 1, x, std::min(widths[column], innerLeft + innerWidth - x),
                model->headerData(column, Qt::Horizontal).toString(), AccentColor, true);
        x += widths[column];
    }

    const int rowCount = model->rowCount();
    if (rowCount == 0) {
        putText(top + 2, innerLeft, innerWidth, tr("No tasks"), DimColor);
        return;
    }

    const int selected = m_viewModel.selectedRow().value_or(0);
    if (selected < m_scrollOffset) {
        m_scrollOffset = selected;
    } else if (selected >= m_scrollOffset + visibleRows) {
        m_scrollOffset = selected - visibleRows + 1;
    }
    m_scrollOffset = qBound(0, m_scrollOffset, std::max(0, rowCount - visibleRows));

    for (int line = 0; line < visibleRows && m_scrollOffset + line < rowCount; ++line) {
        const int row = m_scrollOffset + line;
        const bool isSelected = m_viewModel.selectedRow() == row;
        const int color = isSelected ? SelectionColor : TextColor;
        const int y = top + 2 + line;
        if (isSelected) {
            putText(y, innerLeft, innerWidth, QString(innerWidth, QLatin1Char(' ')), color);
        }
        x = innerLeft;
        for (int column = 0; column < TaskTableModel::ColumnCount; ++column) {
            const int cellWidth = std::min(widths[column] - 1, innerLeft + innerWidth - x);
            putText(y, x, cellWidth, model->cellText(row, column), color, isSelected);
            x += widths[column];
        }
    }
}

void TerminalWindow::renderDetails(int top, int left, int height, int width)
{
    drawBox(top, left, height, width, tr("Details"));
    const data::TaskRecord *task = m_viewModel.selectedTask();
    const QStringList lines = task ? taskDetailsLines(*task) : QStringList{ NoSelectionText };
    const int innerWidth = width - 4;
    for (int i = 0; i < lines.size() && i < height - 2; ++i) {
        const QString &line = lines.at(i);
        const bool label = isSectionLabel(line);
        putText(top + 1 + i, left + 2, innerWidth, line, label ? AccentColor : TextColor, label);
    }
}

void TerminalWindow::renderStatusLines(int rows, int columns)
{
    putText(rows - 2, 0, columns, m_notification, severityColor(m_notificationSeverity));
    putText(rows - 1,
            0,
            columns,
            tr("q Quit  r Refresh  f Filter  / Search  Enter Edit  Space Toggle status  j/k Move"),
            DimColor);
}

} // namespace ui
} // namespace taskview
