/*!
 * @file        streamdescriptor.cppm
 * @brief       Stream and video metadata value types.
 * @details     Declares the immutable values produced by the metadata fetcher:
 *              one StreamDescriptor per media format offered by YouTube, and
 *              the VideoInfo that groups them with the title and thumbnail.
 *
 *              parseVideoInfo() converts yt-dlp's single-video JSON document
 *              (`yt-dlp -J`) into these types. Formats that carry neither video
 *              nor audio (storyboards) and video formats without a known height
 *              are dropped, so every returned descriptor has a well-formed
 *              resolution label.
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.streamdescriptor;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief How a stream is delivered.
 */
REEL_MODULE_EXPORT enum class StreamKind {
    Progressive,    //!< Video and audio in one stream.
    Adaptive        //!< Video-only or audio-only stream, combined after download.
};

/**
 * @brief Description of one downloadable media format.
 */
REEL_MODULE_EXPORT struct StreamDescriptor {

    //!< @brief Extractor format id (YouTube itag).
    QString formatId;

    //!< @brief "<height>p" for streams with video, "audio" for audio-only streams.
    QString resolution;

    //!< @brief Delivery kind.
    StreamKind kind = StreamKind::Progressive;

    //!< @brief File extension of the container (mp4, webm, m4a, ...).
    QString container;

    //!< @brief Video codec, "none" for audio-only streams.
    QString videoCodec;

    //!< @brief Audio codec, "none" for video-only streams.
    QString audioCodec;

    int height = 0;             //!< Frame height in pixels (0 for audio).
    double fps = 0.0;           //!< Frame rate (0 if unknown).
    double audioBitrate = 0.0;  //!< Audio bitrate in kbit/s (0 if unknown).
    qint64 fileSize = 0;        //!< Size in bytes, exact or approximate (0 if unknown).

    //!< @brief True if the stream carries a video track.
    bool hasVideo() const { return !videoCodec.isEmpty() && videoCodec != QLatin1String("none"); }

    //!< @brief True if the stream carries an audio track.
    bool hasAudio() const { return !audioCodec.isEmpty() && audioCodec != QLatin1String("none"); }

    //!< @brief True for adaptive streams that only carry audio.
    bool isAudioOnly() const { return hasAudio() && !hasVideo(); }

    //!< @brief True for adaptive streams that only carry video.
    bool isVideoOnly() const { return hasVideo() && !hasAudio(); }

    bool isAdaptive() const { return kind == StreamKind::Adaptive; }
    bool isProgressive() const { return kind == StreamKind::Progressive; }
};

/**
 * @brief Metadata of one video as reported by the extractor.
 */
REEL_MODULE_EXPORT struct VideoInfo {
    QString id;                         //!< Video id.
    QString title;                      //!< Display title.
    QString uploader;                   //!< Channel name.
    int durationSeconds = 0;            //!< Duration (0 if unknown or live).
    QString thumbnailUrl;               //!< Thumbnail image URL.
    QString webpageUrl;                 //!< Canonical watch URL.
    QVector<StreamDescriptor> streams;  //!< Formats in extractor order.
};

/**
 * @brief Parses a `yt-dlp -J` document into a VideoInfo.
 *
 * @param json Raw JSON output.
 * @param info Receives the parsed metadata.
 * @param error Receives a description on failure.
 * @return true if the document described a single video with at least one stream.
 */
REEL_MODULE_EXPORT bool parseVideoInfo(const QByteArray& json, VideoInfo* info, QString* error);

/**
 * @brief Short codec/container summary used in logs and the task list.
 */
REEL_MODULE_EXPORT QString describeStream(const StreamDescriptor& stream);
