/*!
 * @file        metadatafetcher.cppm
 * @brief       Video metadata lookup through yt-dlp.
 * @details     Given a URL, asks yt-dlp for the title, thumbnail and the list
 *              of available formats, and converts the answer into a VideoInfo.
 *
 *              The lookup blocks on an external process and must run on a
 *              worker thread; DownloadController drives it through
 *              QtConcurrent::run() and a QFutureWatcher.
 *
 *              Failures (invalid URL, missing tool, private/removed video,
 *              network errors, unparsable output) are reported as a FetchResult
 *              with ok == false and a user-facing message. No retry.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.metadatafetcher;
import reel.core.streamdescriptor;
import reel.services.tool_runner;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Result of a metadata lookup.
 */
REEL_MODULE_EXPORT struct FetchResult {
    bool ok = false;        //!< True if info is valid.
    QString url;            //!< URL that was looked up.
    VideoInfo info;         //!< Parsed metadata.
    QString error;          //!< FetchError description when ok is false.
};

/**
 * @brief Synchronous yt-dlp metadata client.
 */
REEL_MODULE_EXPORT class MetadataFetcher {
public:
    /**
     * @brief Construct a fetcher.
     * @param tools Resolved tool paths (only ytDlp and cookiesFromBrowser are used).
     * @param timeoutMs Maximum time allowed for one lookup.
     */
    explicit MetadataFetcher(const ToolPaths& tools, int timeoutMs = 60000);

    /**
     * @brief Looks up a video.
     *
     * Validates the URL before starting yt-dlp; an invalid URL never reaches
     * the external tool.
     *
     * @param url YouTube video URL.
     * @param isCanceled Optional cancellation predicate; a canceled lookup kills yt-dlp.
     * @return Parsed metadata or a FetchError description.
     */
    FetchResult fetch(const QString& url, const CancelCheck& isCanceled = {}) const;

    //!< @brief Arguments passed to yt-dlp for a lookup.
    QStringList arguments(const QString& url) const;

private:
    ToolPaths m_tools;      //!< Tool locations.
    int m_timeoutMs = 0;    //!< Lookup timeout.
};
