module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QString>
#include <QVariant>
#include <QVector>
#include <QtGlobal>

module reel.core.tasklistmodel;

import reel.core.downloadtask;

TaskListModel::TaskListModel(QObject* parent) : QAbstractListModel(parent) {}

int TaskListModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) return 0;
    return m_tasks.size();
}

QVariant TaskListModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() >= m_tasks.size()) return {};
    const TaskItem& item = m_tasks[index.row()];

    switch (role) {
    case TaskIdRole: return item.taskId;
    case TitleRole: return item.title;
    case ResolutionRole: return item.resolution;
    case PhaseRole: return item.phase;
    case ProgressRole: return item.percent / 100.0;
    case StatusRole: return stateString(item.state);
    case FinishedRole: return item.state == TaskState::Finished || item.state == TaskState::Failed;
    case SucceededRole: return item.state == TaskState::Finished;
    case OutputPathRole: return item.outputPath;
    case ErrorRole:
        if (item.state != TaskState::Failed) return QString();
        return QStringLiteral("%1: %2").arg(errorKindName(item.errorKind), item.errorMessage);
    }
    return {};
}

QHash<int, QByteArray> TaskListModel::roleNames() const
{
    return {
        {TaskIdRole, "taskId"},
        {TitleRole, "title"},
        {ResolutionRole, "resolution"},
        {PhaseRole, "phase"},
        {ProgressRole, "progress"},
        {StatusRole, "status"},
        {FinishedRole, "finished"},
        {SucceededRole, "succeeded"},
        {OutputPathRole, "outputPath"},
        {ErrorRole, "error"}
    };
}

QString TaskListModel::stateString(TaskState state)
{
    switch (state) {
    case TaskState::Queued: return QStringLiteral("Queued");
    case TaskState::Running: return QStringLiteral("Running");
    case TaskState::Finished: return QStringLiteral("Finished");
    case TaskState::Failed: return QStringLiteral("Failed");
    }
    return QString();
}

void TaskListModel::addTask(int taskId, const QString& title, const QString& resolution)
{
    beginInsertRows(QModelIndex(), m_tasks.size(), m_tasks.size());
    TaskItem item;
    item.taskId = taskId;
    item.title = title;
    item.resolution = resolution;
    item.phase = stateString(TaskState::Queued);
    m_tasks.append(item);
    endInsertRows();
    emit activeCountChanged();
}

TaskItem TaskListModel::item(int taskId) const
{
    const int row = rowOf(taskId);
    if (row < 0) return TaskItem();
    return m_tasks[row];
}

int TaskListModel::rowOf(int taskId) const
{
    for (int i = 0; i < m_tasks.size(); ++i) {
        if (m_tasks[i].taskId == taskId) return i;
    }
    return -1;
}

QString TaskListModel::outputPathAt(int index) const
{
    if (index < 0 || index >= m_tasks.size()) return QString();
    return m_tasks[index].outputPath;
}

bool TaskListModel::removeAt(int index)
{
    if (index < 0 || index >= m_tasks.size()) return false;
    const TaskState state = m_tasks[index].state;
    if (state == TaskState::Queued || state == TaskState::Running) return false;
    beginRemoveRows(QModelIndex(), index, index);
    m_tasks.removeAt(index);
    endRemoveRows();
    return true;
}

void TaskListModel::clearFinished()
{
    for (int i = m_tasks.size() - 1; i >= 0; --i) {
        removeAt(i);
    }
}

int TaskListModel::activeCount() const
{
    int count = 0;
    for (const TaskItem& item : m_tasks) {
        if (item.state == TaskState::Queued || item.state == TaskState::Running) ++count;
    }
    return count;
}

void TaskListModel::touch(int row, const QVector<int>& roles)
{
    const QModelIndex idx = index(row);
    emit dataChanged(idx, idx, roles);
}

void TaskListModel::onTaskStarted(int taskId)
{
    const int row = rowOf(taskId);
    if (row < 0) return;
    m_tasks[row].state = TaskState::Running;
    touch(row, {StatusRole});
}

void TaskListModel::onTaskProgress(int taskId, const QString& phase, double percent)
{
    const int row = rowOf(taskId);
    if (row < 0) return;
    TaskItem& item = m_tasks[row];
    item.state = TaskState::Running;
    item.phase = phase;
    item.percent = qMax(item.percent, qBound(0.0, percent, 100.0));
    touch(row, {PhaseRole, ProgressRole, StatusRole});
}

void TaskListModel::onTaskFinished(int taskId, const QString& outputPath)
{
    const int row = rowOf(taskId);
    if (row < 0) return;
    TaskItem& item = m_tasks[row];
    item.state = TaskState::Finished;
    item.percent = 100.0;
    item.phase = stateString(TaskState::Finished);
    item.outputPath = outputPath;
    touch(row, {PhaseRole, ProgressRole, StatusRole, FinishedRole, SucceededRole, OutputPathRole});
    emit activeCountChanged();
}

void TaskListModel::onTaskFailed(int taskId, ErrorKind kind, const QString& message)
{
    const int row = rowOf(taskId);
    if (row < 0) return;
    TaskItem& item = m_tasks[row];
    item.state = TaskState::Failed;
    item.phase = stateString(TaskState::Failed);
    item.errorKind = kind;
    item.errorMessage = message;
    touch(row, {PhaseRole, StatusRole, FinishedRole, ErrorRole});
    emit activeCountChanged();
}
