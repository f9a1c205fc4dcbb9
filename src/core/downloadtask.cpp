module;
#include <QDir>
#include <QString>

module reel.core.downloadtask;

import reel.core.streamdescriptor;
import reel.utils.media_utils;

namespace utils = reel::utils;

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return QString();
    case ErrorKind::Fetch: return QStringLiteral("Fetch error");
    case ErrorKind::Download: return QStringLiteral("Download error");
    case ErrorKind::Merge: return QStringLiteral("Merge error");
    }
    return QString();
}

bool DownloadTask::isValid() const
{
    if (url.trimmed().isEmpty() || destinationDir.trimmed().isEmpty()) return false;
    if (video.formatId.isEmpty() || !video.hasVideo()) return false;
    if (video.isProgressive()) return true;
    return video.isVideoOnly() && audio.isAudioOnly() && !audio.formatId.isEmpty();
}

QString DownloadTask::outputExtension() const
{
    if (needsMerge()) return utils::mergedContainer(video.container, audio.container);
    return video.container.isEmpty() ? QStringLiteral("mp4") : video.container;
}

QString DownloadTask::preferredOutputPath() const
{
    const QString dir = utils::normalizeFilePath(destinationDir);
    return QDir(dir).filePath(utils::sanitizeFileName(title) + QLatin1Char('.') + outputExtension());
}
