module;
#include <utility>
#include <QDebug>
#include <QFuture>
#include <QFutureWatcher>
#include <QPromise>
#include <QString>
#include <QThreadPool>
#include <QtConcurrent>
#include <QtGlobal>

module reel.core.taskdispatcher;

import reel.core.downloadjob;
import reel.core.downloadtask;
import reel.services.tool_runner;

TaskDispatcher::TaskDispatcher(int maxWorkers, QObject* parent)
    : QObject(parent)
{
    m_pool.setMaxThreadCount(qMax(1, maxWorkers));
}

TaskDispatcher::~TaskDispatcher()
{
    cancelAll();
    m_pool.waitForDone();
}

int TaskDispatcher::maxWorkers() const
{
    return m_pool.maxThreadCount();
}

void TaskDispatcher::setMaxWorkers(int count)
{
    const int next = qMax(1, count);
    if (m_pool.maxThreadCount() == next) return;
    m_pool.setMaxThreadCount(next);
    emit maxWorkersChanged();
}

int TaskDispatcher::submit(const DownloadTask& task)
{
    if (!task.isValid()) {
        qWarning() << "Rejected invalid download task for" << task.url;
        return -1;
    }

    const int taskId = m_nextTaskId++;
    const ToolPaths tools = m_tools;
    const QString temporaryRoot = m_temporaryRoot;

    auto* watcher = new QFutureWatcher<TaskOutcome>(this);
    m_watchers.insert(taskId, watcher);

    connect(watcher, &QFutureWatcherBase::started, this, [this, taskId]() {
        emit taskStarted(taskId);
    });
    connect(watcher, &QFutureWatcherBase::progressValueChanged, this, [this, taskId, watcher](int value) {
        if (!m_watchers.contains(taskId)) return;
        emit taskProgress(taskId, watcher->progressText(), static_cast<double>(value) * 100.0 / kProgressScale);
    });
    connect(watcher, &QFutureWatcherBase::finished, this, [this, taskId, watcher]() {
        finishTask(taskId, watcher);
    });

    QFuture<TaskOutcome> future = QtConcurrent::run(&m_pool,
        [task, tools, temporaryRoot](QPromise<TaskOutcome>& promise) {
            promise.setProgressRange(0, kProgressScale);
            int lastValue = 0;
            QString lastPhase;

            DownloadJob job(task, tools);
            if (!temporaryRoot.isEmpty()) job.setTemporaryRoot(temporaryRoot);

            const TaskOutcome outcome = job.run(
                [&promise, &lastValue, &lastPhase](const QString& phase, double percent) {
                    int value = qBound(0, qRound(percent * 100.0), kProgressScale);
                    if (value <= lastValue) {
                        // Values that do not increase are dropped by QPromise
                        if (phase == lastPhase || lastValue >= kProgressScale) return;
                        value = lastValue + 1;
                    }
                    lastValue = value;
                    lastPhase = phase;
                    promise.setProgressValueAndText(value, phase);
                },
                [&promise]() { return promise.isCanceled(); });
            promise.addResult(outcome);
        });
    watcher->setFuture(future);

    qInfo().noquote() << "Queued task" << taskId << ":" << task.title;
    emit activeCountChanged();
    return taskId;
}

void TaskDispatcher::finishTask(int taskId, QFutureWatcher<TaskOutcome>* watcher)
{
    if (m_watchers.take(taskId) == nullptr) return;
    watcher->deleteLater();
    emit activeCountChanged();

    const QFuture<TaskOutcome> future = watcher->future();
    if (future.isCanceled() || future.resultCount() == 0) {
        qInfo() << "Task" << taskId << "canceled";
        emit taskFailed(taskId, ErrorKind::Download, QStringLiteral("Canceled"));
        return;
    }

    const TaskOutcome outcome = future.result();
    if (outcome.success) {
        qInfo().noquote() << "Task" << taskId << "finished:" << outcome.outputPath;
        emit taskFinished(taskId, outcome.outputPath);
    } else {
        qWarning().noquote() << "Task" << taskId << errorKindName(outcome.errorKind) << ":" << outcome.errorMessage;
        emit taskFailed(taskId, outcome.errorKind, outcome.errorMessage);
    }
}

void TaskDispatcher::cancelAll()
{
    for (QFutureWatcher<TaskOutcome>* watcher : std::as_const(m_watchers)) {
        watcher->future().cancel();
    }
}

bool TaskDispatcher::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}
