/*!
 * @file        tasklistmodel.cppm
 * @brief       QAbstractListModel of submitted download tasks.
 * @details     Exposes every task handed to the dispatcher as a row, so the
 *              QML task list can show several concurrent downloads at once.
 *
 *              Rows are keyed by the task id returned by the dispatcher and are
 *              updated from its started/progress/finished/failed signals. Each
 *              row carries its own phase, progress and terminal state; finished
 *              and failed rows stay in the list until removed.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVariant>
#include <QVector>

#ifndef Q_MOC_RUN
export module reel.core.tasklistmodel;
import reel.core.downloadtask;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Life cycle of a row.
 */
REEL_MODULE_EXPORT enum class TaskState {
    Queued,     //!< Waiting for a free worker.
    Running,    //!< Downloading or merging.
    Finished,   //!< Output file in place.
    Failed      //!< Terminal error.
};

/**
 * @brief Presentation data of a single task row.
 */
REEL_MODULE_EXPORT struct TaskItem {
    int taskId = -1;                        //!< Dispatcher task id.
    QString title;                          //!< Video title.
    QString resolution;                     //!< Resolution label chosen by the user.
    QString phase;                          //!< Current phase label.
    double percent = 0.0;                   //!< Overall progress, 0-100.
    TaskState state = TaskState::Queued;    //!< Row state.
    QString outputPath;                     //!< Final file path on success.
    ErrorKind errorKind = ErrorKind::None;  //!< Failure category.
    QString errorMessage;                   //!< Failure description.
};

/**
 * @brief Qt list model exposing download tasks to QML.
 */
REEL_MODULE_EXPORT class TaskListModel : public QAbstractListModel {
    Q_OBJECT

    //!< @brief Number of queued or running rows.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY activeCountChanged)

public:
    /**
     * @brief Custom model roles exposed to QML.
     */
    enum Roles {
        TaskIdRole = Qt::UserRole + 1,  //!< Dispatcher task id
        TitleRole,                      //!< Video title
        ResolutionRole,                 //!< Resolution label
        PhaseRole,                      //!< Phase label
        ProgressRole,                   //!< Progress ratio (0.0 - 1.0)
        StatusRole,                     //!< Human-readable status string
        FinishedRole,                   //!< True once the task is finished or failed
        SucceededRole,                  //!< True if the output file is in place
        OutputPathRole,                 //!< Final file path
        ErrorRole                       //!< "<kind>: <message>" for failed rows
    };

    explicit TaskListModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Appends a queued row.
     * @param taskId Id returned by the dispatcher.
     * @param title Video title.
     * @param resolution Resolution label.
     */
    void addTask(int taskId, const QString& title, const QString& resolution);

    //!< @brief Return a copy of the row with the given task id, or a default item.
    TaskItem item(int taskId) const;

    //!< @brief Return the row index of a task id, or -1.
    int rowOf(int taskId) const;

    //!< @brief Return the output path of a row, or an empty string.
    Q_INVOKABLE QString outputPathAt(int index) const;

    //!< @brief Removes a finished or failed row. Active rows are kept.
    Q_INVOKABLE bool removeAt(int index);

    //!< @brief Removes every finished and failed row.
    Q_INVOKABLE void clearFinished();

    int activeCount() const;

    //!< @brief Human-readable name of a state.
    static QString stateString(TaskState state);

public slots:
    void onTaskStarted(int taskId);
    void onTaskProgress(int taskId, const QString& phase, double percent);
    void onTaskFinished(int taskId, const QString& outputPath);
    void onTaskFailed(int taskId, ErrorKind kind, const QString& message);

signals:
    //!< @brief Emitted when the number of active rows changes.
    void activeCountChanged();

private:
    //!< @brief Notifies views that a row changed.
    void touch(int row, const QVector<int>& roles);

    //!< @brief Internal storage for task rows.
    QVector<TaskItem> m_tasks;
};

#include "tasklistmodel.moc"
