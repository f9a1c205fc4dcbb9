module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QtGlobal>

module reel.core.downloadjob;

import reel.core.downloadtask;
import reel.core.merger;
import reel.core.streamdescriptor;
import reel.core.streamdownloader;
import reel.services.tool_runner;
import reel.utils.media_utils;

namespace utils = reel::utils;

static constexpr int kMaxRenameAttempts = 20;

QString DownloadJob::temporaryDirPrefix()
{
    return QStringLiteral("reel-");
}

DownloadJob::DownloadJob(const DownloadTask& task, const ToolPaths& tools)
    : m_task(task),
    m_tools(tools)
{
    m_temporaryRoot = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    if (m_temporaryRoot.isEmpty()) m_temporaryRoot = QDir::tempPath();
}

TaskOutcome DownloadJob::run(const PhaseProgressCallback& onProgress, const CancelCheck& isCanceled)
{
    if (!m_task.isValid()) {
        if (m_task.video.isAdaptive() && !m_task.audio.isAudioOnly()) {
            return TaskOutcome::failed(ErrorKind::Download, QStringLiteral("No audio stream available."));
        }
        return TaskOutcome::failed(ErrorKind::Download, QStringLiteral("Invalid download task."));
    }

    const QString destinationDir = utils::normalizeFilePath(m_task.destinationDir);
    if (!QDir().mkpath(destinationDir)) {
        qWarning() << "Cannot create destination folder" << destinationDir;
        return TaskOutcome::failed(ErrorKind::Download,
                                   QStringLiteral("Cannot create folder %1").arg(destinationDir));
    }

    QDir().mkpath(m_temporaryRoot);
    QTemporaryDir workDir(QDir(m_temporaryRoot).filePath(temporaryDirPrefix() + QStringLiteral("XXXXXX")));
    if (!workDir.isValid()) {
        qWarning() << "Cannot create temporary folder:" << workDir.errorString();
        return TaskOutcome::failed(ErrorKind::Download,
                                   QStringLiteral("Cannot create temporary folder: %1").arg(workDir.errorString()));
    }

    double reported = 0.0;
    auto stepProgress = [&onProgress, &reported](const QString& phase, double bandStart, double bandWidth) {
        return [&onProgress, &reported, phase, bandStart, bandWidth](double percent) {
            const double overall = qMax(reported, bandStart + bandWidth * qBound(0.0, percent, 100.0) / 100.0);
            reported = overall;
            if (onProgress) onProgress(phase, overall);
        };
    };
    auto canceledOutcome = [&isCanceled](ErrorKind kind, const QString& error) {
        if (isCanceled && isCanceled()) return TaskOutcome::failed(kind, QStringLiteral("Canceled"));
        return TaskOutcome::failed(kind, error);
    };

    const StreamDownloader downloader(m_tools);
    QString error;

    if (!m_task.needsMerge()) {
        const QString streamPath = workDir.filePath(QStringLiteral("stream.") + m_task.outputExtension());
        if (!downloader.download(m_task.url, m_task.video, streamPath,
                                 stepProgress(QStringLiteral("Downloading"), 0.0, 100.0),
                                 isCanceled, &error)) {
            return canceledOutcome(ErrorKind::Download, error);
        }
        const QString finalPath = moveIntoPlace(streamPath, &error);
        if (finalPath.isEmpty()) return TaskOutcome::failed(ErrorKind::Download, error);
        return TaskOutcome::succeeded(finalPath);
    }

    MergeJob mergeJob;
    mergeJob.videoPath = workDir.filePath(QStringLiteral("video.") + m_task.video.container);
    mergeJob.audioPath = workDir.filePath(QStringLiteral("audio.") + m_task.audio.container);
    mergeJob.outputPath = workDir.filePath(QStringLiteral("merged.") + m_task.outputExtension());

    if (!downloader.download(m_task.url, m_task.video, mergeJob.videoPath,
                             stepProgress(QStringLiteral("Downloading video"), 0.0, 70.0),
                             isCanceled, &error)) {
        return canceledOutcome(ErrorKind::Download, error);
    }
    if (!downloader.download(m_task.url, m_task.audio, mergeJob.audioPath,
                             stepProgress(QStringLiteral("Downloading audio"), 70.0, 15.0),
                             isCanceled, &error)) {
        return canceledOutcome(ErrorKind::Download, error);
    }

    const Merger merger(m_tools);
    if (!merger.merge(mergeJob, stepProgress(QStringLiteral("Merging"), 85.0, 15.0), isCanceled, &error)) {
        return canceledOutcome(ErrorKind::Merge, error);
    }

    const QString finalPath = moveIntoPlace(mergeJob.outputPath, &error);
    if (finalPath.isEmpty()) return TaskOutcome::failed(ErrorKind::Download, error);
    return TaskOutcome::succeeded(finalPath);
}

QString DownloadJob::moveIntoPlace(const QString& sourcePath, QString* error) const
{
    for (int attempt = 0; attempt < kMaxRenameAttempts; ++attempt) {
        const QString target = utils::uniqueFilePath(m_task.preferredOutputPath());
        // QFile::rename never overwrites, so a concurrent job claiming the same name loses here
        if (QFile::rename(sourcePath, target)) {
            qDebug() << "Saved" << target;
            return target;
        }
        if (!QFile::exists(target)) {
            qWarning() << "Cannot move" << sourcePath << "to" << target;
            if (error) *error = QStringLiteral("Cannot write output file %1").arg(target);
            return QString();
        }
    }
    if (error) *error = QStringLiteral("Cannot find a free file name for %1").arg(m_task.preferredOutputPath());
    return QString();
}

int DownloadJob::removeStaleTemporaryDirs(const QString& root, qint64 maxAgeSecs)
{
    QDir dir(root);
    if (!dir.exists()) return 0;
    const QDateTime cutoff = QDateTime::currentDateTime().addSecs(-maxAgeSecs);
    const QFileInfoList entries = dir.entryInfoList(
        QStringList{temporaryDirPrefix() + QStringLiteral("*")},
        QDir::Dirs | QDir::NoDotAndDotDot);
    int removed = 0;
    for (const QFileInfo& entry : entries) {
        if (entry.lastModified() > cutoff) continue;
        if (QDir(entry.absoluteFilePath()).removeRecursively()) {
            ++removed;
        } else {
            qWarning() << "Cannot remove stale temporary folder" << entry.absoluteFilePath();
        }
    }
    if (removed > 0) qDebug() << "Removed" << removed << "stale temporary folders from" << root;
    return removed;
}
