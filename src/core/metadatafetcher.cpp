module;
#include <QDebug>
#include <QString>
#include <QStringList>

module reel.core.metadatafetcher;

import reel.core.streamdescriptor;
import reel.services.tool_runner;
import reel.utils.media_utils;

namespace utils = reel::utils;

MetadataFetcher::MetadataFetcher(const ToolPaths& tools, int timeoutMs)
    : m_tools(tools),
    m_timeoutMs(timeoutMs)
{
}

QStringList MetadataFetcher::arguments(const QString& url) const
{
    QStringList args{
        QStringLiteral("-J"),
        QStringLiteral("--no-playlist"),
        QStringLiteral("--no-warnings")
    };
    if (!m_tools.cookiesFromBrowser.isEmpty()) {
        args << QStringLiteral("--cookies-from-browser") << m_tools.cookiesFromBrowser;
    }
    args << QStringLiteral("--") << url.trimmed();
    return args;
}

FetchResult MetadataFetcher::fetch(const QString& url, const CancelCheck& isCanceled) const
{
    FetchResult result;
    result.url = url.trimmed();

    if (!utils::isYouTubeVideoUrl(result.url)) {
        qWarning() << "Invalid URL:" << url;
        result.error = QStringLiteral("URL error, please try again.");
        return result;
    }
    if (m_tools.ytDlp.isEmpty()) {
        result.error = QStringLiteral("yt-dlp is not found. Please install yt-dlp.");
        return result;
    }

    qDebug() << "Fetching video information for" << result.url;
    const ToolResult run = runTool(m_tools.ytDlp, arguments(result.url), {}, isCanceled, m_timeoutMs);
    if (!run.started) {
        result.error = QStringLiteral("yt-dlp could not be started: %1").arg(run.failureReason());
        return result;
    }
    if (run.canceled) {
        result.error = QStringLiteral("Canceled");
        return result;
    }
    if (run.timedOut) {
        result.error = QStringLiteral("Network error while loading video information.");
        return result;
    }
    if (!run.succeeded()) {
        result.error = utils::describeExtractorError(run.errorOutput);
        return result;
    }

    QString parseError;
    if (!parseVideoInfo(run.standardOutput, &result.info, &parseError)) {
        result.error = parseError;
        return result;
    }
    qDebug() << "Found" << result.info.streams.size() << "streams for" << result.info.title;
    result.ok = true;
    return result;
}
