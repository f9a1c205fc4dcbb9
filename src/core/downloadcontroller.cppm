/*!
 * @file        downloadcontroller.cppm
 * @brief       QML facade of the downloader.
 * @details     DownloadController is the single object exposed to the QML
 *              window. It owns the preferences, the task dispatcher and the
 *              task list model, and turns user input into work:
 *
 *              - URL changes validate the link and fetch the video information
 *                on a worker thread; results for a superseded URL are dropped
 *              - The fetched streams are offered as a resolution list
 *              - A download request builds a DownloadTask for the selected
 *                resolution and hands it to the dispatcher
 *
 *              Progress of the most recent task drives the progress bar; every
 *              task also has its own row in the task model. Errors never leave
 *              the GUI: they are shown in the status line.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QFuture>
#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <QVector>

#ifndef Q_MOC_RUN
export module reel.core.downloadcontroller;
import reel.core.downloadtask;
import reel.core.metadatafetcher;
import reel.core.streamcatalog;
import reel.core.streamdescriptor;
import reel.core.taskdispatcher;
import reel.core.tasklistmodel;
import reel.services.app_settings;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Controller between the QML window and the download core.
 */
REEL_MODULE_EXPORT class DownloadController : public QObject {
    Q_OBJECT

    //!< @brief Current video URL (trimmed).
    Q_PROPERTY(QString url READ url WRITE setUrl NOTIFY urlChanged)

    //!< @brief Title of the fetched video.
    Q_PROPERTY(QString title READ title NOTIFY videoChanged)

    //!< @brief Thumbnail URL of the fetched video.
    Q_PROPERTY(QUrl thumbnailUrl READ thumbnailUrl NOTIFY videoChanged)

    //!< @brief Labels of the available resolutions.
    Q_PROPERTY(QStringList resolutions READ resolutions NOTIFY videoChanged)

    //!< @brief Selected resolution index (-1 when none).
    Q_PROPERTY(int selectedIndex READ selectedIndex WRITE setSelectedIndex NOTIFY selectedIndexChanged)

    //!< @brief True while video information is being fetched.
    Q_PROPERTY(bool loading READ loading NOTIFY loadingChanged)

    //!< @brief True when a download can be requested.
    Q_PROPERTY(bool canDownload READ canDownload NOTIFY canDownloadChanged)

    //!< @brief Progress of the most recent task (0-100).
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)

    //!< @brief Progress bar text of the most recent task.
    Q_PROPERTY(QString progressText READ progressText NOTIFY progressChanged)

    //!< @brief Status line text.
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)

    //!< @brief Last error shown, prefixed by its kind.
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

    //!< @brief Folder the folder dialog opens in (last folder, else Downloads).
    Q_PROPERTY(QUrl initialFolder READ initialFolder NOTIFY initialFolderChanged)

    //!< @brief Task list model.
    Q_PROPERTY(QObject* tasks READ tasks CONSTANT)

    //!< @brief User preferences.
    Q_PROPERTY(QObject* settings READ settings CONSTANT)

public:
    static constexpr int kStatusTimeoutMs = 5000;   //!< Lifetime of transient status messages.

    /**
     * @brief Construct the controller and resolve the external tools.
     * @param parent Optional parent QObject.
     */
    explicit DownloadController(QObject* parent = nullptr);

    //!< @brief Cancels the running lookup and the queued downloads, then waits for the lookup.
    ~DownloadController() override;

    QString url() const { return m_url; }

    /**
     * @brief Set the URL and start fetching its information.
     *
     * An invalid URL shows "URL error, please try again." and starts nothing.
     */
    void setUrl(const QString& text);

    QString title() const { return m_info.title; }
    QUrl thumbnailUrl() const;
    QStringList resolutions() const { return m_resolutions; }

    int selectedIndex() const { return m_selectedIndex; }
    void setSelectedIndex(int index);

    bool loading() const { return m_loading; }
    bool canDownload() const;

    double progress() const { return m_progress; }
    QString progressText() const { return m_progressText; }
    QString status() const { return m_status; }
    QString lastError() const { return m_lastError; }
    QUrl initialFolder() const;

    QObject* tasks() { return &m_tasks; }
    QObject* settings() { return &m_settings; }

    //!< @brief Typed access to the task model.
    TaskListModel* taskModel() { return &m_tasks; }

    //!< @brief Typed access to the dispatcher.
    TaskDispatcher* dispatcher() { return &m_dispatcher; }

    //!< @brief Typed access to the preferences.
    AppSettings* appSettings() { return &m_settings; }

    //!< @brief Replace the resolved tool paths.
    void setToolPaths(const ToolPaths& tools);
    ToolPaths toolPaths() const { return m_tools; }

    /**
     * @brief Queue a download of the selected resolution.
     *
     * @param folder Destination folder as a local path or file URL.
     * @return True if a task was submitted.
     */
    Q_INVOKABLE bool download(const QString& folder);

    /**
     * @brief Opens the file manager on a finished task's file.
     * @param index Row in the task model.
     */
    Q_INVOKABLE void revealOutput(int index);

    //!< @brief Resolve the tools again (after changing their paths).
    Q_INVOKABLE void refreshTools();

signals:
    void urlChanged();
    void videoChanged();
    void selectedIndexChanged();
    void loadingChanged();
    void canDownloadChanged();
    void progressChanged();
    void statusChanged();
    void lastErrorChanged();
    void initialFolderChanged();

    //!< @brief Emitted when a fetch ends, successfully or not.
    void fetchFinished(bool ok);

private slots:
    void onTaskProgress(int taskId, const QString& phase, double percent);
    void onTaskFinished(int taskId, const QString& outputPath);
    void onTaskFailed(int taskId, ErrorKind kind, const QString& message);

private:
    //!< @brief Starts an asynchronous fetch of the current URL.
    void startFetch();

    //!< @brief Stops the running lookup, if any. Its result is dropped.
    void cancelFetch();

    //!< @brief Applies a fetch result, unless it belongs to an older URL.
    void applyFetchResult(int generation, const FetchResult& result);

    //!< @brief Forgets the fetched video.
    void clearVideo();

    /**
     * @brief Shows a status message.
     * @param text Message.
     * @param timeoutMs Restore the idle message after this delay (0 = keep).
     */
    void showStatus(const QString& text, int timeoutMs = 0);

    //!< @brief Records and shows an error.
    void showError(ErrorKind kind, const QString& message, int timeoutMs = 0);

    void setLoading(bool loading);
    void setProgress(double percent, const QString& text);

    AppSettings m_settings;                 //!< Preferences.
    TaskDispatcher m_dispatcher;            //!< Worker pool.
    TaskListModel m_tasks;                  //!< Task rows.
    ToolPaths m_tools;                      //!< Resolved tools.

    QString m_url;                          //!< Current URL.
    VideoInfo m_info;                       //!< Fetched video.
    bool m_hasInfo = false;                 //!< True once m_info matches m_url.
    QVector<StreamChoice> m_choices;        //!< Resolution choices.
    QStringList m_resolutions;              //!< Labels of m_choices.
    int m_selectedIndex = -1;               //!< Selected choice.
    bool m_loading = false;                 //!< Fetch in progress.
    int m_fetchGeneration = 0;              //!< Incremented on every URL change.
    QFuture<FetchResult> m_fetchFuture;     //!< Running lookup.

    int m_currentTaskId = -1;               //!< Task driving the progress bar.
    double m_progress = 0.0;                //!< Progress bar value.
    QString m_progressText;                 //!< Progress bar text.
    QString m_status;                       //!< Status line.
    QString m_lastError;                    //!< Last error shown.
    QTimer m_statusTimer;                   //!< Restores the idle status.
};

#include "downloadcontroller.moc"
