/*!
 * @file        merger.cppm
 * @brief       Muxes an adaptive video-only file with its audio-only file.
 * @details     Invokes ffmpeg with stream copy (no re-encoding) to combine the
 *              two downloads of an adaptive task into one container. Progress is
 *              derived from ffmpeg's `-progress pipe:1` frame counter against the
 *              packet count reported by ffprobe; without ffprobe the merge still
 *              runs, only without a percentage.
 *
 *              A missing ffmpeg or a non-zero exit is a MergeError. Any partial
 *              output is removed on failure. The merged content is not validated.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <functional>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.merger;
import reel.core.downloadtask;
import reel.core.streamdownloader;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Synchronous ffmpeg wrapper.
 */
REEL_MODULE_EXPORT class Merger {
public:
    explicit Merger(const ToolPaths& tools);

    /**
     * @brief Combines the video and audio file of a merge job.
     *
     * @param job Input and output paths.
     * @param onProgress Optional progress callback (percent of frames written).
     * @param isCanceled Optional cancellation predicate.
     * @param error Receives a MergeError description on failure.
     * @return true if ffmpeg exited with 0 and the output exists.
     */
    bool merge(const MergeJob& job,
               const ProgressCallback& onProgress,
               const CancelCheck& isCanceled,
               QString* error) const;

    /**
     * @brief Counts the packets of the first video stream with ffprobe.
     *
     * Counting packets instead of decoded frames is much faster and matches
     * the frame counter of a stream-copy merge.
     *
     * @return Packet count, or 0 if ffprobe is missing or fails.
     */
    qint64 probeFrameCount(const QString& videoPath) const;

    //!< @brief Arguments passed to ffmpeg for a merge job.
    QStringList arguments(const MergeJob& job) const;

private:
    ToolPaths m_tools;  //!< Tool locations.
};
