module;
#include <QSettings>
#include <QString>
#include <QtGlobal>

module reel.services.app_settings;

import reel.services.tool_runner;

static QString toolsGroup()
{
    return QStringLiteral("tools");
}

static QString downloadsGroup()
{
    return QStringLiteral("downloads");
}

AppSettings::AppSettings(QObject* parent)
    : QObject(parent)
{
    loadSettings();
}

void AppSettings::setYtDlpPath(const QString& path)
{
    const QString next = path.trimmed();
    if (m_ytDlpPath == next) return;
    m_ytDlpPath = next;
    saveSettings();
    emit toolPathsChanged();
}

void AppSettings::setFfmpegPath(const QString& path)
{
    const QString next = path.trimmed();
    if (m_ffmpegPath == next) return;
    m_ffmpegPath = next;
    saveSettings();
    emit toolPathsChanged();
}

void AppSettings::setFfprobePath(const QString& path)
{
    const QString next = path.trimmed();
    if (m_ffprobePath == next) return;
    m_ffprobePath = next;
    saveSettings();
    emit toolPathsChanged();
}

void AppSettings::setCookiesFromBrowser(const QString& browser)
{
    const QString next = browser.trimmed().toLower();
    if (m_cookiesFromBrowser == next) return;
    m_cookiesFromBrowser = next;
    saveSettings();
    emit toolPathsChanged();
}

void AppSettings::setWorkerCount(int count)
{
    const int next = qBound(1, count, kMaxWorkerCount);
    if (m_workerCount == next) return;
    m_workerCount = next;
    saveSettings();
    emit workerCountChanged();
}

void AppSettings::setLastFolder(const QString& folder)
{
    if (m_lastFolder == folder) return;
    m_lastFolder = folder;
    saveSettings();
    emit lastFolderChanged();
}

ToolPaths AppSettings::resolveToolPaths() const
{
    ToolPaths tools;
    tools.ytDlp = locateTool(QStringLiteral("yt-dlp"), m_ytDlpPath);
    tools.ffmpeg = locateTool(QStringLiteral("ffmpeg"), m_ffmpegPath);
    tools.ffprobe = locateTool(QStringLiteral("ffprobe"), m_ffprobePath);
    tools.cookiesFromBrowser = m_cookiesFromBrowser;
    return tools;
}

void AppSettings::loadSettings()
{
    QSettings settings;
    settings.beginGroup(toolsGroup());
    m_ytDlpPath = settings.value(QStringLiteral("ytDlpPath"), m_ytDlpPath).toString().trimmed();
    m_ffmpegPath = settings.value(QStringLiteral("ffmpegPath"), m_ffmpegPath).toString().trimmed();
    m_ffprobePath = settings.value(QStringLiteral("ffprobePath"), m_ffprobePath).toString().trimmed();
    m_cookiesFromBrowser = settings.value(QStringLiteral("cookiesFromBrowser"), m_cookiesFromBrowser).toString().trimmed().toLower();
    settings.endGroup();

    settings.beginGroup(downloadsGroup());
    m_workerCount = qBound(1, settings.value(QStringLiteral("workerCount"), m_workerCount).toInt(), kMaxWorkerCount);
    m_lastFolder = settings.value(QStringLiteral("lastFolder"), m_lastFolder).toString();
    settings.endGroup();
}

void AppSettings::saveSettings()
{
    QSettings settings;
    settings.beginGroup(toolsGroup());
    settings.setValue(QStringLiteral("ytDlpPath"), m_ytDlpPath);
    settings.setValue(QStringLiteral("ffmpegPath"), m_ffmpegPath);
    settings.setValue(QStringLiteral("ffprobePath"), m_ffprobePath);
    settings.setValue(QStringLiteral("cookiesFromBrowser"), m_cookiesFromBrowser);
    settings.endGroup();

    settings.beginGroup(downloadsGroup());
    settings.setValue(QStringLiteral("workerCount"), m_workerCount);
    settings.setValue(QStringLiteral("lastFolder"), m_lastFolder);
    settings.endGroup();
}
