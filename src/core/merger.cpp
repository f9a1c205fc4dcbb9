module;
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module reel.core.merger;

import reel.core.downloadtask;
import reel.core.streamdownloader;
import reel.services.tool_runner;
import reel.utils.media_utils;

namespace utils = reel::utils;

static constexpr int kProbeTimeoutMs = 120000;

Merger::Merger(const ToolPaths& tools)
    : m_tools(tools)
{
}

qint64 Merger::probeFrameCount(const QString& videoPath) const
{
    if (m_tools.ffprobe.isEmpty()) return 0;
    const QStringList args{
        QStringLiteral("-v"), QStringLiteral("error"),
        QStringLiteral("-select_streams"), QStringLiteral("v:0"),
        QStringLiteral("-count_packets"),
        QStringLiteral("-show_entries"), QStringLiteral("stream=nb_read_packets"),
        QStringLiteral("-of"), QStringLiteral("json"),
        videoPath
    };
    const ToolResult run = runTool(m_tools.ffprobe, args, {}, {}, kProbeTimeoutMs);
    if (!run.succeeded()) return 0;
    return utils::parsePacketCount(run.standardOutput);
}

QStringList Merger::arguments(const MergeJob& job) const
{
    return QStringList{
        QStringLiteral("-y"),
        QStringLiteral("-nostdin"),
        QStringLiteral("-loglevel"), QStringLiteral("error"),
        QStringLiteral("-nostats"),
        QStringLiteral("-i"), job.videoPath,
        QStringLiteral("-i"), job.audioPath,
        QStringLiteral("-map"), QStringLiteral("0:v:0"),
        QStringLiteral("-map"), QStringLiteral("1:a:0"),
        QStringLiteral("-codec:v"), QStringLiteral("copy"),
        QStringLiteral("-codec:a"), QStringLiteral("copy"),
        QStringLiteral("-progress"), QStringLiteral("pipe:1"),
        job.outputPath
    };
}

bool Merger::merge(const MergeJob& job,
                   const ProgressCallback& onProgress,
                   const CancelCheck& isCanceled,
                   QString* error) const
{
    auto fail = [error, &job](const QString& message) {
        QFile::remove(job.outputPath);
        if (error) *error = message;
        qWarning().noquote() << "Merge failed:" << message;
        return false;
    };

    if (m_tools.ffmpeg.isEmpty()) {
        return fail(QStringLiteral("FFMPEG is not found! Please install ffmpeg."));
    }
    if (!QFileInfo::exists(job.videoPath) || !QFileInfo::exists(job.audioPath)) {
        return fail(QStringLiteral("Video or audio file for merging is missing."));
    }

    const qint64 totalFrames = probeFrameCount(job.videoPath);
    if (totalFrames <= 0) {
        qDebug() << "No frame count for" << job.videoPath << "- merge progress unavailable";
    }
    if (onProgress) onProgress(0.0);

    const ToolResult run = runTool(
        m_tools.ffmpeg,
        arguments(job),
        [&onProgress, totalFrames](const QString& line) {
            qint64 frame = 0;
            if (!onProgress || totalFrames <= 0 || !utils::parseProgressFrame(line, &frame)) return;
            onProgress(qMin(100.0, static_cast<double>(frame) * 100.0 / static_cast<double>(totalFrames)));
        },
        isCanceled);

    if (!run.started) {
        return fail(QStringLiteral("ffmpeg could not be started: %1").arg(run.failureReason()));
    }
    if (!run.succeeded()) {
        return fail(run.failureReason());
    }
    if (!QFileInfo::exists(job.outputPath)) {
        return fail(QStringLiteral("ffmpeg did not produce an output file."));
    }
    if (onProgress) onProgress(100.0);
    return true;
}
