/*!
 * @file        taskdispatcher.cppm
 * @brief       Runs download tasks on a bounded worker pool.
 * @details     TaskDispatcher accepts DownloadTask requests from the GUI thread
 *              and runs each one as a DownloadJob on its own QThreadPool, so
 *              several downloads proceed concurrently while the interface stays
 *              responsive.
 *
 *              Each submission receives a task id. Progress, completion and
 *              failure are reported through signals delivered on the thread the
 *              dispatcher lives in, tagged with that id. A task never reports
 *              progress after its terminal signal.
 *
 *              Destroying the dispatcher cancels every pending task, kills the
 *              running tool processes and waits for the workers to return.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QFutureWatcher>
#include <QHash>
#include <QObject>
#include <QString>
#include <QThreadPool>

#ifndef Q_MOC_RUN
export module reel.core.taskdispatcher;
import reel.core.downloadtask;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Worker pool front-end for download tasks.
 */
REEL_MODULE_EXPORT class TaskDispatcher : public QObject {
    Q_OBJECT

    //!< @brief Number of submitted tasks without a terminal signal yet.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY activeCountChanged)

    //!< @brief Maximum number of tasks running at once.
    Q_PROPERTY(int maxWorkers READ maxWorkers WRITE setMaxWorkers NOTIFY maxWorkersChanged)

public:
    static constexpr int kProgressScale = 10000;    //!< Promise progress range (percent * 100).

    /**
     * @brief Construct a dispatcher.
     * @param maxWorkers Initial pool size.
     * @param parent Optional parent QObject.
     */
    explicit TaskDispatcher(int maxWorkers = 2, QObject* parent = nullptr);

    //!< @brief Cancels pending work and waits for the workers.
    ~TaskDispatcher() override;

    //!< @brief Set the tools used by tasks submitted from now on.
    void setToolPaths(const ToolPaths& tools) { m_tools = tools; }
    ToolPaths toolPaths() const { return m_tools; }

    //!< @brief Set the parent folder of per-task temporary directories (empty = system default).
    void setTemporaryRoot(const QString& path) { m_temporaryRoot = path; }
    QString temporaryRoot() const { return m_temporaryRoot; }

    /**
     * @brief Queue a task for execution.
     *
     * Returns immediately. The task starts when a worker is free.
     *
     * @param task Task to run.
     * @return Task id, or -1 if the task is invalid.
     */
    int submit(const DownloadTask& task);

    int activeCount() const { return m_watchers.size(); }

    int maxWorkers() const;

    /**
     * @brief Set the pool size.
     * @param count Requested size, at least 1.
     */
    void setMaxWorkers(int count);

    //!< @brief Requests cancellation of every unfinished task.
    void cancelAll();

    /**
     * @brief Blocks until the pool is idle.
     *
     * Terminal signals are queued and delivered by the event loop afterwards.
     *
     * @param msecs Timeout, -1 for none.
     * @return True if every worker returned.
     */
    bool waitForDone(int msecs = -1);

signals:
    //!< @brief A worker picked the task up.
    void taskStarted(int taskId);

    //!< @brief Phase label and overall percentage (0-100) of a running task.
    void taskProgress(int taskId, const QString& phase, double percent);

    //!< @brief The task's output file is in place.
    void taskFinished(int taskId, const QString& outputPath);

    //!< @brief The task ended with an error.
    void taskFailed(int taskId, ErrorKind kind, const QString& message);

    //!< @brief Emitted when the number of unfinished tasks changes.
    void activeCountChanged();

    //!< @brief Emitted when the pool size changes.
    void maxWorkersChanged();

private:
    //!< @brief Reports the terminal signal of a watched task and releases its watcher.
    void finishTask(int taskId, QFutureWatcher<TaskOutcome>* watcher);

    QThreadPool m_pool;                                     //!< Dedicated worker pool.
    ToolPaths m_tools;                                      //!< Tools handed to jobs.
    QString m_temporaryRoot;                                //!< Temporary root handed to jobs.
    int m_nextTaskId = 1;                                   //!< Next id to hand out.
    QHash<int, QFutureWatcher<TaskOutcome>*> m_watchers;    //!< Unfinished tasks by id.
};

#include "taskdispatcher.moc"
