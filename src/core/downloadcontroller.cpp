module;
#include <QDebug>
#include <QDesktopServices>
#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QFutureWatcher>
#include <QProcess>
#include <QPromise>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QtConcurrent>
#include <QtGlobal>

module reel.core.downloadcontroller;

import reel.core.downloadtask;
import reel.core.metadatafetcher;
import reel.core.streamcatalog;
import reel.core.streamdescriptor;
import reel.core.taskdispatcher;
import reel.core.tasklistmodel;
import reel.services.app_settings;
import reel.services.tool_runner;
import reel.utils.media_utils;

namespace utils = reel::utils;

static QString idleStatus()
{
    return QStringLiteral("Paste link to Youtube video.");
}

DownloadController::DownloadController(QObject* parent)
    : QObject(parent),
    m_dispatcher(m_settings.workerCount())
{
    m_status = idleStatus();
    m_statusTimer.setSingleShot(true);
    connect(&m_statusTimer, &QTimer::timeout, this, [this]() {
        m_status = m_loading ? QStringLiteral("Loading video information...") : idleStatus();
        emit statusChanged();
    });

    connect(&m_settings, &AppSettings::workerCountChanged, this, [this]() {
        m_dispatcher.setMaxWorkers(m_settings.workerCount());
    });
    connect(&m_settings, &AppSettings::toolPathsChanged, this, &DownloadController::refreshTools);
    connect(&m_settings, &AppSettings::lastFolderChanged, this, &DownloadController::initialFolderChanged);

    connect(&m_dispatcher, &TaskDispatcher::taskStarted, &m_tasks, &TaskListModel::onTaskStarted);
    connect(&m_dispatcher, &TaskDispatcher::taskProgress, &m_tasks, &TaskListModel::onTaskProgress);
    connect(&m_dispatcher, &TaskDispatcher::taskFinished, &m_tasks, &TaskListModel::onTaskFinished);
    connect(&m_dispatcher, &TaskDispatcher::taskFailed, &m_tasks, &TaskListModel::onTaskFailed);

    connect(&m_dispatcher, &TaskDispatcher::taskProgress, this, &DownloadController::onTaskProgress);
    connect(&m_dispatcher, &TaskDispatcher::taskFinished, this, &DownloadController::onTaskFinished);
    connect(&m_dispatcher, &TaskDispatcher::taskFailed, this, &DownloadController::onTaskFailed);

    refreshTools();
}

DownloadController::~DownloadController()
{
    cancelFetch();
    m_dispatcher.cancelAll();
    m_fetchFuture.waitForFinished();
}

void DownloadController::refreshTools()
{
    setToolPaths(m_settings.resolveToolPaths());
}

void DownloadController::setToolPaths(const ToolPaths& tools)
{
    m_tools = tools;
    m_dispatcher.setToolPaths(tools);
}

QUrl DownloadController::initialFolder() const
{
    QString folder = m_settings.lastFolder();
    if (folder.isEmpty()) folder = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (folder.isEmpty()) folder = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
    return QUrl::fromLocalFile(folder);
}

QUrl DownloadController::thumbnailUrl() const
{
    if (m_info.thumbnailUrl.isEmpty()) return QUrl();
    return QUrl(m_info.thumbnailUrl);
}

bool DownloadController::canDownload() const
{
    return m_hasInfo && m_selectedIndex >= 0 && m_selectedIndex < m_choices.size();
}

void DownloadController::setUrl(const QString& text)
{
    const QString next = text.trimmed();
    if (m_url == next) return;
    m_url = next;
    emit urlChanged();

    ++m_fetchGeneration;
    cancelFetch();
    clearVideo();
    setLoading(false);

    if (m_url.isEmpty()) {
        showStatus(idleStatus());
        return;
    }
    if (!utils::isYouTubeVideoUrl(m_url)) {
        showError(ErrorKind::Fetch, QStringLiteral("URL error, please try again."), kStatusTimeoutMs);
        return;
    }
    startFetch();
}

void DownloadController::setSelectedIndex(int index)
{
    const int next = (index >= 0 && index < m_choices.size()) ? index : -1;
    if (m_selectedIndex == next) return;
    m_selectedIndex = next;
    emit selectedIndexChanged();
    emit canDownloadChanged();
}

void DownloadController::startFetch()
{
    const int generation = m_fetchGeneration;
    const QString url = m_url;
    const ToolPaths tools = m_tools;

    setLoading(true);
    showStatus(QStringLiteral("Loading video information..."));
    qDebug() << "Fetching video information for" << url;

    auto* watcher = new QFutureWatcher<FetchResult>(this);
    connect(watcher, &QFutureWatcher<FetchResult>::finished, this, [this, watcher, generation]() {
        watcher->deleteLater();
        if (watcher->future().resultCount() == 0) {
            FetchResult failed;
            failed.error = QStringLiteral("Could not load video information.");
            applyFetchResult(generation, failed);
            return;
        }
        applyFetchResult(generation, watcher->result());
    });
    m_fetchFuture = QtConcurrent::run([url, tools](QPromise<FetchResult>& promise) {
        promise.addResult(MetadataFetcher(tools).fetch(url, [&promise]() { return promise.isCanceled(); }));
    });
    watcher->setFuture(m_fetchFuture);
}

void DownloadController::cancelFetch()
{
    if (!m_fetchFuture.isFinished()) m_fetchFuture.cancel();
}

void DownloadController::applyFetchResult(int generation, const FetchResult& result)
{
    if (generation != m_fetchGeneration) {
        qDebug() << "Dropping stale video information for" << result.url;
        return;
    }
    setLoading(false);

    if (!result.ok) {
        showError(ErrorKind::Fetch, result.error);
        emit fetchFinished(false);
        return;
    }

    m_info = result.info;
    m_choices = availableResolutions(m_info);
    m_resolutions = choiceLabels(m_choices);
    m_hasInfo = true;
    m_selectedIndex = m_choices.isEmpty() ? -1 : 0;
    emit videoChanged();
    emit selectedIndexChanged();
    emit canDownloadChanged();

    if (m_choices.isEmpty()) {
        showError(ErrorKind::Fetch, QStringLiteral("No downloadable streams found."));
        emit fetchFinished(false);
        return;
    }
    showStatus(QStringLiteral("Choose a resolution and press Download."));
    emit fetchFinished(true);
}

void DownloadController::clearVideo()
{
    const bool hadVideo = m_hasInfo || !m_info.title.isEmpty();
    m_info = VideoInfo();
    m_choices.clear();
    m_resolutions.clear();
    m_hasInfo = false;
    if (m_selectedIndex != -1) {
        m_selectedIndex = -1;
        emit selectedIndexChanged();
    }
    if (hadVideo) emit videoChanged();
    emit canDownloadChanged();
}

bool DownloadController::download(const QString& folder)
{
    QString directory = folder.trimmed();
    if (directory.startsWith(QStringLiteral("file:"))) directory = QUrl(directory).toLocalFile();
    directory = utils::normalizeFilePath(directory);
    if (directory.isEmpty()) {
        showStatus(QStringLiteral("No download path provided."), kStatusTimeoutMs);
        return false;
    }
    if (!utils::isYouTubeVideoUrl(m_url)) {
        showError(ErrorKind::Fetch, QStringLiteral("URL error, please try again."), kStatusTimeoutMs);
        return false;
    }
    if (!canDownload()) {
        showStatus(m_loading ? QStringLiteral("Loading video information...")
                             : QStringLiteral("Select a resolution first."),
                   kStatusTimeoutMs);
        return false;
    }

    const StreamChoice& choice = m_choices.at(m_selectedIndex);
    DownloadTask task;
    task.url = m_url;
    task.title = m_info.title;
    task.video = choice.video;
    task.destinationDir = directory;
    if (task.video.isAdaptive() && !bestAudioFor(m_info, task.video, &task.audio)) {
        showError(ErrorKind::Download, QStringLiteral("No audio stream available."));
        return false;
    }

    m_settings.setLastFolder(directory);

    const int taskId = m_dispatcher.submit(task);
    if (taskId < 0) {
        showError(ErrorKind::Download, QStringLiteral("Invalid download task."));
        return false;
    }
    m_tasks.addTask(taskId, task.title, choice.label);
    m_currentTaskId = taskId;
    setProgress(0.0, QStringLiteral("Waiting for a free worker ..."));
    showStatus(QStringLiteral("Downloading %1").arg(task.title));
    return true;
}

void DownloadController::onTaskProgress(int taskId, const QString& phase, double percent)
{
    if (taskId != m_currentTaskId) return;
    setProgress(percent, QStringLiteral("%1 ... %2").arg(phase, utils::formatPercent(percent)));
}

void DownloadController::onTaskFinished(int taskId, const QString& outputPath)
{
    Q_UNUSED(outputPath)
    if (taskId != m_currentTaskId) return;
    setProgress(100.0, QStringLiteral("Download complete!"));
    showStatus(QStringLiteral("Finished download."));
}

void DownloadController::onTaskFailed(int taskId, ErrorKind kind, const QString& message)
{
    if (taskId != m_currentTaskId) return;
    setProgress(m_progress, QStringLiteral("Download failed"));
    showError(kind, message);
}

void DownloadController::revealOutput(int index)
{
    const QString path = utils::normalizeFilePath(m_tasks.outputPathAt(index));
    if (path.isEmpty()) return;
    QFileInfo info(path);
    const QString absPath = info.absoluteFilePath();
#if defined(Q_OS_MAC)
    if (info.exists()) {
        QProcess::startDetached("open", QStringList() << "-R" << absPath);
        return;
    }
#elif defined(Q_OS_WIN)
    if (info.exists()) {
        const QString nativePath = QDir::toNativeSeparators(absPath);
        QProcess::startDetached("explorer", QStringList() << "/select," + nativePath);
        return;
    }
#endif
    if (!info.absolutePath().isEmpty()) {
        QDesktopServices::openUrl(QUrl::fromLocalFile(info.absolutePath()));
    }
}

void DownloadController::showStatus(const QString& text, int timeoutMs)
{
    m_statusTimer.stop();
    if (m_status != text) {
        m_status = text;
        emit statusChanged();
    }
    if (timeoutMs > 0) m_statusTimer.start(timeoutMs);
}

void DownloadController::showError(ErrorKind kind, const QString& message, int timeoutMs)
{
    m_lastError = QStringLiteral("%1: %2").arg(errorKindName(kind), message);
    emit lastErrorChanged();
    qWarning().noquote() << m_lastError;
    showStatus(message, timeoutMs);
}

void DownloadController::setLoading(bool loading)
{
    if (m_loading == loading) return;
    m_loading = loading;
    emit loadingChanged();
}

void DownloadController::setProgress(double percent, const QString& text)
{
    m_progress = qBound(0.0, percent, 100.0);
    m_progressText = text;
    emit progressChanged();
}
