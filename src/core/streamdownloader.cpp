module;
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>

module reel.core.streamdownloader;

import reel.core.streamdescriptor;
import reel.services.tool_runner;
import reel.utils.media_utils;

namespace utils = reel::utils;

StreamDownloader::StreamDownloader(const ToolPaths& tools)
    : m_tools(tools)
{
}

QStringList StreamDownloader::arguments(const QString& url, const StreamDescriptor& stream, const QString& targetPath) const
{
    QStringList args{
        QStringLiteral("--no-playlist"),
        QStringLiteral("--no-warnings"),
        QStringLiteral("--newline"),
        QStringLiteral("--no-mtime"),
        QStringLiteral("-f"), stream.formatId,
        QStringLiteral("-o"), targetPath
    };
    if (!m_tools.cookiesFromBrowser.isEmpty()) {
        args << QStringLiteral("--cookies-from-browser") << m_tools.cookiesFromBrowser;
    }
    args << QStringLiteral("--") << url.trimmed();
    return args;
}

bool StreamDownloader::download(const QString& url,
                                const StreamDescriptor& stream,
                                const QString& targetPath,
                                const ProgressCallback& onProgress,
                                const CancelCheck& isCanceled,
                                QString* error) const
{
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    if (m_tools.ytDlp.isEmpty()) {
        return fail(QStringLiteral("yt-dlp is not found. Please install yt-dlp."));
    }
    if (stream.formatId.isEmpty()) {
        return fail(QStringLiteral("No stream selected."));
    }

    qDebug() << "Downloading" << describeStream(stream) << "to" << targetPath;
    if (onProgress) onProgress(0.0);
    const ToolResult run = runTool(
        m_tools.ytDlp,
        arguments(url, stream, targetPath),
        [&onProgress](const QString& line) {
            double percent = 0.0;
            if (onProgress && utils::parseDownloadPercent(line, &percent)) onProgress(percent);
        },
        isCanceled);

    if (!run.succeeded()) {
        // yt-dlp leaves its partial file behind
        QFile::remove(targetPath);
        QFile::remove(targetPath + QStringLiteral(".part"));
        if (!run.started) return fail(QStringLiteral("yt-dlp could not be started: %1").arg(run.failureReason()));
        return fail(run.failureReason());
    }

    QFileInfo info(targetPath);
    if (!info.exists() || !info.isFile() || info.size() <= 0) {
        qWarning() << "Download finished without output file" << targetPath;
        return fail(QStringLiteral("Downloaded file is missing or empty."));
    }
    if (onProgress) onProgress(100.0);
    return true;
}
