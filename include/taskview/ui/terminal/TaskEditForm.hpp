#pragma once

#include <QString>
#include <QStringList>
#include <vector>

#include "taskview/ui/viewmodels/TaskListViewModel.hpp"

namespace taskview {
namespace ui {

class TaskEditForm
{
public:
    enum class Result
    {
        Pending,
        Submitted,
        Cancelled,
    };

    TaskEditForm(const QString &taskId, const TaskEdit &draft);

    Result handleKey(bool functionKey, unsigned int key);
    void render(int rows, int columns) const;
    TaskEdit edit() const;
    int focusedField() const;

private:
    struct Field
    {
        QString label;
        QString text;
        int maxLength = 0;
        QStringList choices;
        int choice = 0;

        bool isSelect() const { return !choices.isEmpty(); }
    };

    void focusNext(int step);
    void insertCharacter(unsigned int codePoint);
    void removeLastCharacter();

    QString m_taskId;
    std::vector<Field> m_fields;
    int m_focus = 0;
};

} // namespace ui
} // namespace taskview
