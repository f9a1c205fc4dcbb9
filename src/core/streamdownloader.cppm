/*!
 * @file        streamdownloader.cppm
 * @brief       Downloads a single stream of a video through yt-dlp.
 * @details     Runs `yt-dlp -f <format id> -o <target>` for one stream and
 *              reports the percentage printed by yt-dlp. The HTTP transfer is
 *              entirely owned by yt-dlp; this class only sequences the process,
 *              checks the resulting file and translates failures into
 *              DownloadError messages.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <functional>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.streamdownloader;
import reel.core.streamdescriptor;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

//!< @brief Receives the progress of the current step in percent (0..100).
REEL_MODULE_EXPORT using ProgressCallback = std::function<void(double percent)>;

/**
 * @brief Synchronous single-stream downloader.
 */
REEL_MODULE_EXPORT class StreamDownloader {
public:
    explicit StreamDownloader(const ToolPaths& tools);

    /**
     * @brief Downloads one stream to a file.
     *
     * @param url Video page URL.
     * @param stream Stream to download.
     * @param targetPath File to create.
     * @param onProgress Optional progress callback.
     * @param isCanceled Optional cancellation predicate.
     * @param error Receives a DownloadError description on failure.
     * @return true if the file was written.
     */
    bool download(const QString& url,
                  const StreamDescriptor& stream,
                  const QString& targetPath,
                  const ProgressCallback& onProgress,
                  const CancelCheck& isCanceled,
                  QString* error) const;

    //!< @brief Arguments passed to yt-dlp for one stream.
    QStringList arguments(const QString& url, const StreamDescriptor& stream, const QString& targetPath) const;

private:
    ToolPaths m_tools;  //!< Tool locations.
};
