/*!
 * @file        streamcatalog.cppm
 * @brief       Resolution choices and audio pairing for a fetched video.
 * @details     Reduces the full list of formats reported by the extractor to
 *              the short list of resolutions offered in the UI, and picks the
 *              audio stream that accompanies an adaptive video stream.
 *
 *              Rules:
 *              - One choice per distinct (height, kind), highest first
 *              - Adaptive before progressive at the same height
 *              - mp4 preferred when several containers share a height and kind
 *              - Audio: highest bitrate stream whose container suits the video
 *                container, otherwise the highest bitrate audio stream
 *
 * @author      Reel contributors
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Reel contributors. All rights reserved.
 */

module;
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module reel.core.streamcatalog;
import reel.core.streamdescriptor;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief One entry of the resolution list.
 */
REEL_MODULE_EXPORT struct StreamChoice {
    QString label;              //!< Text shown in the combo box.
    StreamDescriptor video;     //!< Progressive stream or video-only adaptive stream.
};

/**
 * @brief Builds the resolution choices for a video.
 *
 * @param info Fetched video metadata.
 * @return Choices ordered from highest to lowest resolution.
 */
REEL_MODULE_EXPORT QVector<StreamChoice> availableResolutions(const VideoInfo& info);

/**
 * @brief Returns the labels of the given choices.
 */
REEL_MODULE_EXPORT QStringList choiceLabels(const QVector<StreamChoice>& choices);

/**
 * @brief Picks the audio stream to merge with an adaptive video stream.
 *
 * @param info Fetched video metadata.
 * @param video Selected video-only stream.
 * @param audio Receives the selected audio stream.
 * @return false if the video offers no audio-only stream.
 */
REEL_MODULE_EXPORT bool bestAudioFor(const VideoInfo& info, const StreamDescriptor& video, StreamDescriptor* audio);
