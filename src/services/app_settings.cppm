/*!
 * @file        app_settings.cppm
 * @brief       Persistent user preferences.
 * @details     Stores the optional tool locations, the worker pool size and the
 *              last chosen output folder through QSettings, and exposes them to
 *              QML as properties. Every change is written back immediately.
 *
 *              Only preferences are persisted; download state never is.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module reel.services.app_settings;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief QSettings-backed preferences object.
 */
REEL_MODULE_EXPORT class AppSettings : public QObject {
    Q_OBJECT

    //!< @brief Explicit yt-dlp path (empty = search PATH).
    Q_PROPERTY(QString ytDlpPath READ ytDlpPath WRITE setYtDlpPath NOTIFY toolPathsChanged)

    //!< @brief Explicit ffmpeg path (empty = search PATH).
    Q_PROPERTY(QString ffmpegPath READ ffmpegPath WRITE setFfmpegPath NOTIFY toolPathsChanged)

    //!< @brief Explicit ffprobe path (empty = search PATH).
    Q_PROPERTY(QString ffprobePath READ ffprobePath WRITE setFfprobePath NOTIFY toolPathsChanged)

    //!< @brief Browser whose cookies yt-dlp may use (empty = none).
    Q_PROPERTY(QString cookiesFromBrowser READ cookiesFromBrowser WRITE setCookiesFromBrowser NOTIFY toolPathsChanged)

    //!< @brief Number of parallel download workers.
    Q_PROPERTY(int workerCount READ workerCount WRITE setWorkerCount NOTIFY workerCountChanged)

    //!< @brief Last output folder chosen by the user.
    Q_PROPERTY(QString lastFolder READ lastFolder WRITE setLastFolder NOTIFY lastFolderChanged)

public:
    static constexpr int kDefaultWorkerCount = 2;   //!< Default pool size.
    static constexpr int kMaxWorkerCount = 8;       //!< Upper bound of the pool size.

    /**
     * @brief Construct and load the settings.
     * @param parent Optional parent QObject.
     */
    explicit AppSettings(QObject* parent = nullptr);

    QString ytDlpPath() const { return m_ytDlpPath; }
    void setYtDlpPath(const QString& path);

    QString ffmpegPath() const { return m_ffmpegPath; }
    void setFfmpegPath(const QString& path);

    QString ffprobePath() const { return m_ffprobePath; }
    void setFfprobePath(const QString& path);

    QString cookiesFromBrowser() const { return m_cookiesFromBrowser; }
    void setCookiesFromBrowser(const QString& browser);

    int workerCount() const { return m_workerCount; }

    /**
     * @brief Set the worker pool size.
     * @param count Requested size, clamped to 1..kMaxWorkerCount.
     */
    void setWorkerCount(int count);

    QString lastFolder() const { return m_lastFolder; }
    void setLastFolder(const QString& folder);

    /**
     * @brief Resolve the external tools.
     *
     * Configured paths win; otherwise the tools are searched on PATH and
     * next to the application.
     */
    ToolPaths resolveToolPaths() const;

signals:
    //!< @brief Emitted when a tool setting changes.
    void toolPathsChanged();

    //!< @brief Emitted when the worker count changes.
    void workerCountChanged();

    //!< @brief Emitted when the last folder changes.
    void lastFolderChanged();

private:
    //!< @brief Load settings from persistent store.
    void loadSettings();

    //!< @brief Save settings to persistent store.
    void saveSettings();

    QString m_ytDlpPath;                            //!< yt-dlp override.
    QString m_ffmpegPath;                           //!< ffmpeg override.
    QString m_ffprobePath;                          //!< ffprobe override.
    QString m_cookiesFromBrowser;                   //!< Cookie source browser.
    int m_workerCount = kDefaultWorkerCount;        //!< Pool size.
    QString m_lastFolder;                           //!< Last output folder.
};

#include "app_settings.moc"
