/*!
 * @file        downloadjob.cppm
 * @brief       Sequential execution of one download task on a worker thread.
 * @details     DownloadJob performs the whole life of a DownloadTask:
 *
 *              - Progressive: download the stream, move it into place
 *              - Adaptive: download video, download audio, merge, move into place
 *
 *              Every job works inside its own temporary directory
 *              (`reel-XXXXXX` under the temporary root), so concurrent jobs
 *              never share files. The directory is removed when the job ends,
 *              whatever the outcome, and nothing is written to the destination
 *              folder before the final file is complete. The final name is
 *              claimed with a non-overwriting rename.
 *
 *              Progress is reported as a phase label and an overall percentage
 *              that never decreases: adaptive jobs map video to 0-70 %, audio to
 *              70-85 % and the merge to 85-100 %.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <functional>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.downloadjob;
import reel.core.downloadtask;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

//!< @brief Receives the current phase label and the overall percentage.
REEL_MODULE_EXPORT using PhaseProgressCallback = std::function<void(const QString& phase, double overallPercent)>;

/**
 * @brief Runs one DownloadTask to completion.
 */
REEL_MODULE_EXPORT class DownloadJob {
public:
    /**
     * @brief Construct a job.
     * @param task Task to run.
     * @param tools Resolved tool paths.
     */
    DownloadJob(const DownloadTask& task, const ToolPaths& tools);

    /**
     * @brief Set the folder receiving the per-job temporary directories.
     *
     * Defaults to the system temporary location.
     */
    void setTemporaryRoot(const QString& path) { m_temporaryRoot = path; }

    //!< @brief Return the temporary root folder.
    QString temporaryRoot() const { return m_temporaryRoot; }

    /**
     * @brief Runs the task. Blocks until it finishes.
     *
     * @param onProgress Optional phase/percentage callback, called on the running thread.
     * @param isCanceled Optional cancellation predicate.
     * @return Terminal outcome.
     */
    TaskOutcome run(const PhaseProgressCallback& onProgress = {},
                    const CancelCheck& isCanceled = {});

    /**
     * @brief Removes job directories left behind by a killed process.
     *
     * @param root Temporary root folder.
     * @param maxAgeSecs Only directories older than this are removed.
     * @return Number of directories removed.
     */
    static int removeStaleTemporaryDirs(const QString& root, qint64 maxAgeSecs = 24 * 3600);

    //!< @brief Prefix of per-job temporary directory names.
    static QString temporaryDirPrefix();

private:
    /**
     * @brief Moves the finished file into the destination folder.
     * @return Final path, or an empty string on failure.
     */
    QString moveIntoPlace(const QString& sourcePath, QString* error) const;

    DownloadTask m_task;        //!< Task being run.
    ToolPaths m_tools;          //!< Tool locations.
    QString m_temporaryRoot;    //!< Parent of the job's temporary directory.
};
