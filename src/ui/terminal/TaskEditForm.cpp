#include "taskview/ui/terminal/TaskEditForm.hpp"

#include <algorithm>

#include "taskview/core/Sanitizer.hpp"
#include "taskview/data/Task.hpp"
#include "taskview/ui/terminal/TextPainter.hpp"

#include <ncurses.h>

namespace taskview {
namespace ui {

namespace {
constexpr unsigned int EscapeKey = 27;
constexpr unsigned int DeleteKey = 127;
constexpr unsigned int BackspaceKey = 8;
constexpr int LabelWidth = 14;
constexpr int FormWidth = 72;
constexpr int TitleIdLength = 20;

enum FieldIndex
{
    TitleField,
    DescriptionField,
    PriorityField,
    StatusField,
    AssigneeField,
};

int choiceIndex(const QStringList &choices, const QString &value, const QString &fallback)
{
    int index = choices.indexOf(value);
    if (index < 0) {
        index = choices.indexOf(fallback);
    }
    return std::max(index, 0);
}
} // namespace

TaskEditForm::TaskEditForm(const QString &taskId, const TaskEdit &draft)
    : m_taskId(taskId)
{
    Field title;
    title.label = QStringLiteral("Title:");
    title.text = draft.title;
    title.maxLength = EditTitleLength;

    Field description;
    description.label = QStringLiteral("Description:");
    description.text = draft.description;
    description.maxLength = EditDescriptionLength;

    Field priority;
    priority.label = QStringLiteral("Priority:");
    priority.choices = data::TaskPriority::all();
    priority.choice = choiceIndex(priority.choices, draft.priority, data::TaskPriority::Medium);

    Field status;
    status.label = QStringLiteral("Status:");
    status.choices = data::TaskStatus::all();
    status.choice = choiceIndex(status.choices, draft.status, data::TaskStatus::Todo);

    Field assignee;
    assignee.label = QStringLiteral("Assignee:");
    assignee.text = draft.assignee;
    assignee.maxLength = EditAssigneeLength;

    m_fields = { title, description, priority, status, assignee };
}

TaskEditForm::Result TaskEditForm::handleKey(bool functionKey, unsigned int key)
{
    if (functionKey) {
        switch (key) {
        case KEY_DOWN:
            focusNext(1);
            break;
        case KEY_UP:
        case KEY_BTAB:
            focusNext(-1);
            break;
        case KEY_LEFT:
        case KEY_RIGHT: {
            Field &field = m_fields[static_cast<std::size_t>(m_focus)];
            if (field.isSelect()) {
                const int step = key == KEY_RIGHT ? 1 : -1;
                const int count = field.choices.size();
                field.choice = (field.choice + step + count) % count;
            }
            break;
        }
        case KEY_BACKSPACE:
        case KEY_DC:
            removeLastCharacter();
            break;
        case KEY_ENTER:
            return Result::Submitted;
        default:
            break;
        }
        return Result::Pending;
    }

    switch (key) {
    case EscapeKey:
        return Result::Cancelled;
    case '\n':
    case '\r':
        return Result::Submitted;
    case '\t':
        focusNext(1);
        break;
    case DeleteKey:
    case BackspaceKey:
        removeLastCharacter();
        break;
    default:
        insertCharacter(key);
        break;
    }
    return Result::Pending;
}

void TaskEditForm::render(int rows, int columns) const
{
    const int width = std::min(FormWidth, columns - 4);
    const int height = static_cast<int>(m_fields.size()) * 2 + 5;
    if (width < LabelWidth + 10 || height > rows) {
        putText(0, 0, columns, QStringLiteral("Terminal too small to edit"), ErrorColor, true);
        return;
    }
    const int top = (rows - height) / 2;
    const int left = (columns - width) / 2;

    const QString blank(width, QLatin1Char(' '));
    for (int row = 0; row < height; ++row) {
        putText(top + row, left, width, blank);
    }
    drawBox(top, left, height, width, QStringLiteral("Editing Task: %1").arg(core::truncateText(m_taskId, TitleIdLength)), AccentColor);

    const int valueWidth = width - LabelWidth - 4;
    for (std::size_t i = 0; i < m_fields.size(); ++i) {
        const Field &field = m_fields[i];
        const bool focused = static_cast<int>(i) == m_focus;
        const int y = top + 2 + static_cast<int>(i) * 2;
        putText(y, left + 2, LabelWidth, field.label, focused ? AccentColor : TextColor, focused);

        QString value;
        if (field.isSelect()) {
            value = QStringLiteral("< %1 >").arg(data::displayName(field.choices.at(field.choice)));
        } else {
            // Show the tail so the insertion point stays visible.
            value = field.text.right(std::max(valueWidth - 1, 1));
            if (focused) {
                value += QLatin1Char('_');
            }
        }
        putText(y, left + 2 + LabelWidth, valueWidth, value, focused ? SelectionColor : TextColor);
    }

    putText(top + height - 2,
            left + 2,
            width - 4,
            QStringLiteral("Enter save  Esc cancel  Tab/Up/Down field  Left/Right choose"),
            DimColor);
}

TaskEdit TaskEditForm::edit() const
{
    TaskEdit edit;
    edit.taskId = m_taskId;
    edit.title = m_fields[TitleField].text;
    edit.description = m_fields[DescriptionField].text;
    edit.priority = m_fields[PriorityField].choices.at(m_fields[PriorityField].choice);
    edit.status = m_fields[StatusField].choices.at(m_fields[StatusField].choice);
    edit.assignee = m_fields[AssigneeField].text;
    return edit;
}

int TaskEditForm::focusedField() const
{
    return m_focus;
}

void TaskEditForm::focusNext(int step)
{
    const int count = static_cast<int>(m_fields.size());
    m_focus = (m_focus + step + count) % count;
}

void TaskEditForm::insertCharacter(unsigned int codePoint)
{
    Field &field = m_fields[static_cast<std::size_t>(m_focus)];
    if (field.isSelect() || core::codePointCount(field.text) >= field.maxLength) {
        return;
    }
    field.text += printableInput(codePoint);
}

void TaskEditForm::removeLastCharacter()
{
    Field &field = m_fields[static_cast<std::size_t>(m_focus)];
    if (field.isSelect() || field.text.isEmpty()) {
        return;
    }
    const int size = field.text.size();
    if (size >= 2 && field.text.at(size - 1).isLowSurrogate() && field.text.at(size - 2).isHighSurrogate()) {
        field.text.chop(2);
    } else {
        field.text.chop(1);
    }
}

} // namespace ui
} // namespace taskview
