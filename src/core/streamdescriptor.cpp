module;
#include <QByteArray>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QRegularExpression>
#include <QString>
#include <QVector>
#include <QtGlobal>

module reel.core.streamdescriptor;

import reel.utils.media_utils;

namespace utils = reel::utils;

static QString stringValue(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    return v.isString() ? v.toString() : QString();
}

static double numberValue(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    return v.isDouble() ? v.toDouble() : 0.0;
}

static int heightFromResolution(const QString& resolution)
{
    static const QRegularExpression re(QStringLiteral("^(\\d+)x(\\d+)$"));
    const auto match = re.match(resolution.trimmed());
    if (!match.hasMatch()) return 0;
    return match.captured(2).toInt();
}

static bool parseStream(const QJsonObject& obj, StreamDescriptor* out)
{
    StreamDescriptor s;
    s.formatId = stringValue(obj, QStringLiteral("format_id"));
    s.container = stringValue(obj, QStringLiteral("ext")).toLower();
    s.videoCodec = stringValue(obj, QStringLiteral("vcodec"));
    s.audioCodec = stringValue(obj, QStringLiteral("acodec"));
    if (s.videoCodec.isEmpty()) s.videoCodec = QStringLiteral("none");
    if (s.audioCodec.isEmpty()) s.audioCodec = QStringLiteral("none");
    if (s.formatId.isEmpty() || s.container.isEmpty()) return false;
    if (!s.hasVideo() && !s.hasAudio()) return false;

    s.kind = (s.hasVideo() && s.hasAudio()) ? StreamKind::Progressive : StreamKind::Adaptive;
    s.fps = numberValue(obj, QStringLiteral("fps"));
    s.audioBitrate = numberValue(obj, QStringLiteral("abr"));

    qint64 size = static_cast<qint64>(numberValue(obj, QStringLiteral("filesize")));
    if (size <= 0) size = static_cast<qint64>(numberValue(obj, QStringLiteral("filesize_approx")));
    s.fileSize = qMax<qint64>(0, size);

    if (s.hasVideo()) {
        s.height = static_cast<int>(numberValue(obj, QStringLiteral("height")));
        if (s.height <= 0) s.height = heightFromResolution(stringValue(obj, QStringLiteral("resolution")));
        s.resolution = utils::resolutionLabel(s.height);
    } else {
        s.resolution = QString::fromLatin1(utils::kAudioResolution);
    }
    if (!utils::isWellFormedResolution(s.resolution)) return false;

    *out = s;
    return true;
}

bool parseVideoInfo(const QByteArray& json, VideoInfo* info, QString* error)
{
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        qWarning().noquote() << "Video info parse error:" << message;
        return false;
    };

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(QStringLiteral("Could not parse video information."));
    }
    const QJsonObject root = doc.object();
    const QString type = stringValue(root, QStringLiteral("_type"));
    if (type == QStringLiteral("playlist")) {
        return fail(QStringLiteral("Playlists are not supported."));
    }

    VideoInfo out;
    out.id = stringValue(root, QStringLiteral("id"));
    out.title = stringValue(root, QStringLiteral("title")).trimmed();
    if (out.title.isEmpty()) out.title = out.id.isEmpty() ? QStringLiteral("video") : out.id;
    out.uploader = stringValue(root, QStringLiteral("uploader"));
    out.durationSeconds = static_cast<int>(numberValue(root, QStringLiteral("duration")));
    out.webpageUrl = stringValue(root, QStringLiteral("webpage_url"));
    out.thumbnailUrl = stringValue(root, QStringLiteral("thumbnail"));
    if (out.thumbnailUrl.isEmpty()) {
        // the last entry of "thumbnails" is the preferred one
        const QJsonArray thumbs = root.value(QStringLiteral("thumbnails")).toArray();
        for (qsizetype i = thumbs.size() - 1; i >= 0; --i) {
            const QString url = stringValue(thumbs.at(i).toObject(), QStringLiteral("url"));
            if (!url.isEmpty()) {
                out.thumbnailUrl = url;
                break;
            }
        }
    }

    const QJsonArray formats = root.value(QStringLiteral("formats")).toArray();
    for (const QJsonValue& v : formats) {
        if (!v.isObject()) continue;
        StreamDescriptor stream;
        if (parseStream(v.toObject(), &stream)) out.streams.append(stream);
    }
    if (out.streams.isEmpty()) {
        return fail(QStringLiteral("No downloadable streams found."));
    }

    if (info) *info = out;
    return true;
}

QString describeStream(const StreamDescriptor& stream)
{
    QString kind = stream.isProgressive()
        ? QStringLiteral("progressive")
        : (stream.isAudioOnly() ? QStringLiteral("audio only") : QStringLiteral("video only"));
    QString text = QStringLiteral("%1 %2 [%3] %4").arg(stream.resolution, stream.container, stream.formatId, kind);
    if (stream.isAudioOnly() && stream.audioBitrate > 0) {
        text += QStringLiteral(" %1kbps").arg(qRound(stream.audioBitrate));
    }
    return text;
}
