/*!
 * @file        media_utils.cppm
 * @brief       Common helpers for URLs, stream labels, tool output and file naming.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the fetch, download and merge components. These utilities
 *              validate YouTube URLs, build and check resolution labels, parse the
 *              progress lines printed by yt-dlp and ffmpeg, and derive safe,
 *              non-colliding output file names.
 *
 *              All helpers are side-effect free except uniqueFilePath(), which
 *              only inspects the filesystem.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.utils.media_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs (as handed over by QML dialogs) to local paths.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a string is a syntactically valid http(s) URL with a host.
 */
bool isValidUrl(const QString& text);

/**
 * @brief Checks whether a host belongs to YouTube.
 *
 * Accepts youtube.com and its subdomains, youtu.be and youtube-nocookie.com.
 */
bool isYouTubeHost(const QString& host);

/**
 * @brief Extracts the 11-character video id from a YouTube URL.
 *
 * Understands watch?v=, youtu.be/, /embed/, /shorts/, /live/ and /v/ forms.
 *
 * @param url Source URL.
 * @return Video id, or an empty string if none could be found.
 */
QString videoIdFromUrl(const QUrl& url);

/**
 * @brief Returns true if the text is a URL that points at a single YouTube video.
 */
bool isYouTubeVideoUrl(const QString& text);

/**
 * @brief Builds the resolution label for a video height, e.g. "1080p".
 */
QString resolutionLabel(int height);

//!< @brief Label used for audio-only streams.
inline constexpr const char* kAudioResolution = "audio";

/**
 * @brief Checks whether a resolution label is well formed.
 *
 * A well-formed label is either "<height>p" with a two to four digit
 * height, or "audio".
 */
bool isWellFormedResolution(const QString& label);

/**
 * @brief Parses the percentage from a yt-dlp "[download]  42.3% of ..." line.
 *
 * @param line One line of yt-dlp output (with --newline).
 * @param percent Receives the value in the range 0..100.
 * @return true if the line carried a percentage.
 */
bool parseDownloadPercent(const QString& line, double* percent);

/**
 * @brief Parses the frame counter from an ffmpeg "-progress" line ("frame=123").
 */
bool parseProgressFrame(const QString& line, qint64* frame);

/**
 * @brief Reads the packet count from ffprobe's JSON output.
 *
 * Expects the shape produced by
 * `-count_packets -show_entries stream=nb_read_packets -of json`.
 *
 * @return Number of packets, or 0 if the document does not carry one.
 */
qint64 parsePacketCount(const QByteArray& json);

/**
 * @brief Maps yt-dlp's error output to a short user-facing message.
 */
QString describeExtractorError(const QString& errorOutput);

/**
 * @brief Picks the container used when muxing a video and an audio stream.
 *
 * @return "mp4", "webm" or "mkv".
 */
QString mergedContainer(const QString& videoContainer, const QString& audioContainer);

//!< @brief Per-name limit of common file systems (ext4, APFS, NTFS), in UTF-8 bytes.
inline constexpr int kMaxFileNameBytes = 255;

//!< @brief Bytes kept free for the extension and a " (n)" suffix.
inline constexpr int kReservedFileNameBytes = 24;

/**
 * @brief Turns a video title into a file name that is valid on all platforms.
 *
 * Strips path separators, reserved characters and control characters,
 * collapses whitespace and falls back to "video" for empty results.
 * The result fits in kMaxFileNameBytes - kReservedFileNameBytes UTF-8 bytes
 * and never ends in half of a surrogate pair.
 */
QString sanitizeFileName(const QString& title);

/**
 * @brief Cuts text to at most maxBytes UTF-8 bytes on a code point boundary.
 */
QString truncateUtf8(const QString& text, int maxBytes);

/**
 * @brief Generates a unique file path if the given path already exists.
 *
 * Appends a numeric suffix to avoid overwriting existing files.
 *
 * @param path Desired file path.
 * @return A unique, non-existing file path.
 */
QString uniqueFilePath(const QString& path);

/**
 * @brief Formats a progress value the way the progress bar shows it ("42.00 %").
 */
QString formatPercent(double percent);

} // namespace reel::utils
