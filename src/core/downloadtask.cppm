/*!
 * @file        downloadtask.cppm
 * @brief       Units of work handed to the task dispatcher.
 * @details     DownloadTask describes one user request (URL, chosen streams,
 *              destination folder). MergeJob describes the transient ffmpeg run
 *              that combines an adaptive video-only file with its audio-only
 *              counterpart. TaskOutcome carries the terminal result back to
 *              the GUI thread.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module reel.core.downloadtask;
import reel.core.streamdescriptor;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Category of a failure, used for the status line and the task list.
 */
REEL_MODULE_EXPORT enum class ErrorKind {
    None,       //!< No error.
    Fetch,      //!< Bad URL, network failure or extraction failure.
    Download,   //!< Network interruption or disk write failure.
    Merge       //!< Missing ffmpeg or non-zero exit.
};

//!< @brief Human-readable name of an error kind ("Download error", ...).
REEL_MODULE_EXPORT QString errorKindName(ErrorKind kind);

/**
 * @brief A single download request.
 *
 * Owned by the dispatcher from submission until its outcome is reported.
 */
REEL_MODULE_EXPORT struct DownloadTask {
    QString url;                //!< Video page URL.
    QString title;              //!< Title used for the output file name.
    StreamDescriptor video;     //!< Progressive stream, or adaptive video-only stream.
    StreamDescriptor audio;     //!< Audio-only stream, used for adaptive tasks only.
    QString destinationDir;     //!< Folder receiving the final file.

    //!< @brief True if the video stream must be merged with the audio stream.
    bool needsMerge() const { return video.isAdaptive(); }

    /**
     * @brief Checks the task is complete enough to run.
     *
     * An adaptive video stream must be paired with an audio-only stream.
     */
    bool isValid() const;

    //!< @brief Extension of the final file (container of the stream or of the merge).
    QString outputExtension() const;

    //!< @brief Preferred final file path inside destinationDir (may already exist).
    QString preferredOutputPath() const;
};

/**
 * @brief Inputs and output of one ffmpeg merge.
 */
REEL_MODULE_EXPORT struct MergeJob {
    QString videoPath;      //!< Downloaded video-only file.
    QString audioPath;      //!< Downloaded audio-only file.
    QString outputPath;     //!< File written by ffmpeg.
};

/**
 * @brief Terminal result of a task.
 */
REEL_MODULE_EXPORT struct TaskOutcome {
    bool success = false;                   //!< True if the output file is in place.
    QString outputPath;                     //!< Final file path on success.
    ErrorKind errorKind = ErrorKind::None;  //!< Failure category.
    QString errorMessage;                   //!< Failure description.

    static TaskOutcome succeeded(const QString& path)
    {
        TaskOutcome outcome;
        outcome.success = true;
        outcome.outputPath = path;
        return outcome;
    }

    static TaskOutcome failed(ErrorKind kind, const QString& message)
    {
        TaskOutcome outcome;
        outcome.errorKind = kind;
        outcome.errorMessage = message;
        return outcome;
    }
};
