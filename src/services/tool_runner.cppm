/*!
 * @file        tool_runner.cppm
 * @brief       Discovery and execution of external command-line tools.
 * @details     Reel delegates stream extraction to yt-dlp and muxing to
 *              ffmpeg/ffprobe. This module resolves those executables and runs
 *              them synchronously from worker threads, streaming their standard
 *              output line by line while collecting standard error for
 *              diagnostics.
 *
 *              Lookup order for an executable:
 *              - An explicitly configured path (or bare program name)
 *              - The system PATH
 *              - The application directory and the current working directory
 *
 *              runTool() must never be called from the GUI thread: it blocks
 *              until the child process exits, is canceled, or times out.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <functional>
#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Resolved locations of the external tools.
 *
 * An empty member means the tool could not be found.
 */
REEL_MODULE_EXPORT struct ToolPaths {

    //!< @brief yt-dlp executable (metadata and stream download).
    QString ytDlp;

    //!< @brief ffmpeg executable (muxing).
    QString ffmpeg;

    //!< @brief ffprobe executable (packet counting for merge progress).
    QString ffprobe;

    //!< @brief Optional browser name passed to yt-dlp as --cookies-from-browser.
    QString cookiesFromBrowser;
};

/**
 * @brief Outcome of a single external process run.
 */
REEL_MODULE_EXPORT struct ToolResult {
    bool started = false;                                 //!< Process could be started.
    bool canceled = false;                                //!< Killed because cancellation was requested.
    bool timedOut = false;                                //!< Killed because the timeout expired.
    int exitCode = -1;                                    //!< Exit code (valid for normal exits).
    QProcess::ExitStatus exitStatus = QProcess::NormalExit; //!< Normal or crash exit.
    QByteArray standardOutput;                            //!< Collected stdout when no line handler is set.
    QString errorOutput;                                  //!< Collected stderr.
    QString errorString;                                  //!< QProcess error text, if any.

    //!< @brief True if the process ran to completion with exit code 0.
    bool succeeded() const
    {
        return started && !canceled && !timedOut
               && exitStatus == QProcess::NormalExit && exitCode == 0;
    }

    /**
     * @brief Short description of why the run failed.
     *
     * Prefers the last non-empty stderr line over the generic QProcess text.
     */
    QString failureReason() const;
};

//!< @brief Receives each complete stdout line (without the trailing newline).
REEL_MODULE_EXPORT using LineHandler = std::function<void(const QString& line)>;

//!< @brief Polled while the process runs; returning true kills the process.
REEL_MODULE_EXPORT using CancelCheck = std::function<bool()>;

/**
 * @brief Locates an executable.
 *
 * @param name Program name without extension (e.g. "ffmpeg").
 * @param configuredPath Optional user-configured path or program name.
 * @return Absolute path to the executable, or an empty string if not found.
 */
REEL_MODULE_EXPORT QString locateTool(const QString& name, const QString& configuredPath = QString());

/**
 * @brief Runs an external program to completion.
 *
 * When @p onLine is set, stdout is delivered line by line and not collected;
 * otherwise it is collected into ToolResult::standardOutput.
 *
 * @param program Executable path.
 * @param arguments Program arguments (no shell involved).
 * @param onLine Optional stdout line handler.
 * @param isCanceled Optional cancellation predicate, polled every 200 ms.
 * @param timeoutMs Optional overall timeout (<= 0 means none).
 * @return Collected result.
 */
REEL_MODULE_EXPORT ToolResult runTool(const QString& program,
                                      const QStringList& arguments,
                                      const LineHandler& onLine = {},
                                      const CancelCheck& isCanceled = {},
                                      int timeoutMs = -1);
