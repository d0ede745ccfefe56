#pragma once

#include <QAbstractTableModel>
#include <vector>

#include "taskview/data/Task.hpp"

namespace taskview {
namespace ui {

constexpr int TableTitleLength = 30;
constexpr int TableAssigneeLength = 15;
constexpr int TableInlineLabels = 2;

class TaskTableModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Column
    {
        StatusColumn,
        PriorityColumn,
        TitleColumn,
        AssigneeColumn,
        LabelsColumn,
        ColumnCount
    };

    explicit TaskTableModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    // The records are borrowed from the repository's list.
    void setTasks(std::vector<const data::TaskRecord *> tasks);
    const data::TaskRecord *taskAt(int row) const;
    QString cellText(int row, int column) const;

private:
    std::vector<const data::TaskRecord *> m_tasks;
};

} // namespace ui
} // namespace taskview
