module;
#include <algorithm>
#include <QHash>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

module reel.core.streamcatalog;

import reel.core.streamdescriptor;

static int containerRank(const QString& container)
{
    if (container == QStringLiteral("mp4")) return 0;
    if (container == QStringLiteral("webm")) return 1;
    return 2;
}

// Lower is better.
static bool preferredVideo(const StreamDescriptor& candidate, const StreamDescriptor& current)
{
    const int rc = containerRank(candidate.container);
    const int rk = containerRank(current.container);
    if (rc != rk) return rc < rk;
    if (!qFuzzyCompare(candidate.fps + 1.0, current.fps + 1.0)) return candidate.fps > current.fps;
    return candidate.fileSize > current.fileSize;
}

static QString choiceLabel(const StreamDescriptor& stream)
{
    if (stream.isProgressive()) {
        return QStringLiteral("%1 (%2, progressive)").arg(stream.resolution, stream.container);
    }
    return QStringLiteral("%1 (%2)").arg(stream.resolution, stream.container);
}

QVector<StreamChoice> availableResolutions(const VideoInfo& info)
{
    // keyed by (height, adaptive)
    QHash<QPair<int, bool>, StreamDescriptor> best;
    for (const StreamDescriptor& stream : info.streams) {
        if (!stream.hasVideo() || stream.height <= 0) continue;
        const QPair<int, bool> key(stream.height, stream.isAdaptive());
        auto it = best.find(key);
        if (it == best.end()) {
            best.insert(key, stream);
        } else if (preferredVideo(stream, it.value())) {
            it.value() = stream;
        }
    }

    QVector<StreamDescriptor> picked;
    picked.reserve(best.size());
    for (auto it = best.cbegin(); it != best.cend(); ++it) picked.append(it.value());
    std::sort(picked.begin(), picked.end(), [](const StreamDescriptor& a, const StreamDescriptor& b) {
        if (a.height != b.height) return a.height > b.height;
        return a.isAdaptive() && !b.isAdaptive();
    });

    QVector<StreamChoice> choices;
    choices.reserve(picked.size());
    for (const StreamDescriptor& stream : picked) {
        choices.append(StreamChoice{choiceLabel(stream), stream});
    }
    return choices;
}

QStringList choiceLabels(const QVector<StreamChoice>& choices)
{
    QStringList labels;
    labels.reserve(choices.size());
    for (const StreamChoice& choice : choices) labels << choice.label;
    return labels;
}

static bool audioSuits(const QString& videoContainer, const QString& audioContainer)
{
    if (videoContainer == QStringLiteral("mp4")) {
        return audioContainer == QStringLiteral("m4a") || audioContainer == QStringLiteral("mp4");
    }
    if (videoContainer == QStringLiteral("webm")) {
        return audioContainer == QStringLiteral("webm");
    }
    return false;
}

bool bestAudioFor(const VideoInfo& info, const StreamDescriptor& video, StreamDescriptor* audio)
{
    const StreamDescriptor* matching = nullptr;
    const StreamDescriptor* any = nullptr;
    for (const StreamDescriptor& stream : info.streams) {
        if (!stream.isAudioOnly()) continue;
        if (!any || stream.audioBitrate > any->audioBitrate) any = &stream;
        if (audioSuits(video.container, stream.container)
            && (!matching || stream.audioBitrate > matching->audioBitrate)) {
            matching = &stream;
        }
    }
    const StreamDescriptor* chosen = matching ? matching : any;
    if (!chosen) return false;
    if (audio) *audio = *chosen;
    return true;
}
