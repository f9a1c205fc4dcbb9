module;
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QStringList>
#include <QUrlQuery>
#include <QtGlobal>

module reel.utils.media_utils;

namespace reel::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

bool isValidUrl(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || trimmed.contains(' ')) return false;
    const QUrl url(trimmed, QUrl::StrictMode);
    if (!url.isValid()) return false;
    const QString scheme = url.scheme().toLower();
    if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")) return false;
    const QString host = url.host();
    return !host.isEmpty() && host.contains('.');
}

bool isYouTubeHost(const QString& host)
{
    const QString h = host.trimmed().toLower();
    if (h.isEmpty()) return false;
    if (h == QStringLiteral("youtu.be")) return true;
    if (h == QStringLiteral("youtube.com") || h.endsWith(QStringLiteral(".youtube.com"))) return true;
    if (h == QStringLiteral("youtube-nocookie.com") || h.endsWith(QStringLiteral(".youtube-nocookie.com"))) return true;
    return false;
}

QString videoIdFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    static const QRegularExpression idRe(QStringLiteral("^[A-Za-z0-9_-]{11}$"));

    const QString host = url.host().toLower();
    const QStringList parts = url.path().split('/', Qt::SkipEmptyParts);

    if (host == QStringLiteral("youtu.be")) {
        if (!parts.isEmpty() && idRe.match(parts.first()).hasMatch()) return parts.first();
        return QString();
    }

    QUrlQuery query(url);
    const QString v = query.queryItemValue(QStringLiteral("v"));
    if (idRe.match(v).hasMatch()) return v;

    if (parts.size() >= 2) {
        const QString kind = parts.at(0).toLower();
        if (kind == QStringLiteral("embed") || kind == QStringLiteral("shorts")
            || kind == QStringLiteral("live") || kind == QStringLiteral("v")) {
            if (idRe.match(parts.at(1)).hasMatch()) return parts.at(1);
        }
    }
    return QString();
}

bool isYouTubeVideoUrl(const QString& text)
{
    if (!isValidUrl(text)) return false;
    const QUrl url(text.trimmed());
    if (!isYouTubeHost(url.host())) return false;
    return !videoIdFromUrl(url).isEmpty();
}

QString resolutionLabel(int height)
{
    if (height <= 0) return QString();
    return QStringLiteral("%1p").arg(height);
}

bool isWellFormedResolution(const QString& label)
{
    if (label == QLatin1String(kAudioResolution)) return true;
    static const QRegularExpression re(QStringLiteral("^[1-9][0-9]{1,3}p$"));
    return re.match(label).hasMatch();
}

bool parseDownloadPercent(const QString& line, double* percent)
{
    static const QRegularExpression re(QStringLiteral("^\\[download\\]\\s+([0-9]+(?:\\.[0-9]+)?)%"));
    const auto match = re.match(line.trimmed());
    if (!match.hasMatch()) return false;
    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    if (!ok) return false;
    if (percent) *percent = qBound(0.0, value, 100.0);
    return true;
}

bool parseProgressFrame(const QString& line, qint64* frame)
{
    const QString trimmed = line.trimmed();
    if (!trimmed.startsWith(QStringLiteral("frame="))) return false;
    bool ok = false;
    const qint64 value = trimmed.mid(6).trimmed().toLongLong(&ok);
    if (!ok || value < 0) return false;
    if (frame) *frame = value;
    return true;
}

qint64 parsePacketCount(const QByteArray& json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return 0;
    const QJsonArray streams = doc.object().value(QStringLiteral("streams")).toArray();
    if (streams.isEmpty() || !streams.first().isObject()) return 0;
    const QJsonValue packets = streams.first().toObject().value(QStringLiteral("nb_read_packets"));
    // ffprobe prints the counter as a string
    if (packets.isString()) return qMax<qint64>(0, packets.toString().toLongLong());
    if (packets.isDouble()) return qMax<qint64>(0, static_cast<qint64>(packets.toDouble()));
    return 0;
}

QString describeExtractorError(const QString& errorOutput)
{
    const QString text = errorOutput;
    if (text.contains(QStringLiteral("Private video"), Qt::CaseInsensitive)) {
        return QStringLiteral("Video is private.");
    }
    if (text.contains(QStringLiteral("members-only"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("Join this channel"), Qt::CaseInsensitive)) {
        return QStringLiteral("Video is members only.");
    }
    if (text.contains(QStringLiteral("confirm your age"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("age-restricted"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("inappropriate for some users"), Qt::CaseInsensitive)) {
        return QStringLiteral("Video is age restricted.");
    }
    if (text.contains(QStringLiteral("Video unavailable"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("video is unavailable"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("has been removed"), Qt::CaseInsensitive)) {
        return QStringLiteral("Video is unavailable.");
    }
    if (text.contains(QStringLiteral("getaddrinfo"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("Failed to resolve"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("timed out"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("Connection refused"), Qt::CaseInsensitive)
        || text.contains(QStringLiteral("HTTP Error"), Qt::CaseInsensitive)) {
        return QStringLiteral("Network error while loading video information.");
    }

    const QStringList lines = text.split('\n', Qt::SkipEmptyParts);
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (line.startsWith(QStringLiteral("ERROR:"))) {
            return line.mid(6).trimmed();
        }
    }
    return QStringLiteral("Could not load video information.");
}

QString mergedContainer(const QString& videoContainer, const QString& audioContainer)
{
    const QString v = videoContainer.toLower();
    const QString a = audioContainer.toLower();
    if (v == QStringLiteral("mp4") && (a == QStringLiteral("m4a") || a == QStringLiteral("mp4"))) {
        return QStringLiteral("mp4");
    }
    if (v == QStringLiteral("webm") && a == QStringLiteral("webm")) {
        return QStringLiteral("webm");
    }
    return QStringLiteral("mkv");
}

QString sanitizeFileName(const QString& title)
{
    QString out;
    out.reserve(title.size());
    static const QString reserved = QStringLiteral("<>:\"/\\|?*");
    for (const QChar c : title) {
        if (c.category() == QChar::Other_Control || reserved.contains(c)) {
            out.append(' ');
            continue;
        }
        out.append(c);
    }
    out = out.simplified();
    while (out.endsWith('.') || out.endsWith(' ')) out.chop(1);
    while (out.startsWith('.')) out.remove(0, 1);
    out = truncateUtf8(out, kMaxFileNameBytes - kReservedFileNameBytes).trimmed();
    while (out.endsWith('.')) out.chop(1);
    if (out.isEmpty()) return QStringLiteral("video");
    return out;
}

QString truncateUtf8(const QString& text, int maxBytes)
{
    if (text.toUtf8().size() <= maxBytes) return text;
    qsizetype end = 0;
    int bytes = 0;
    while (end < text.size()) {
        const bool pair = text.at(end).isHighSurrogate()
                          && end + 1 < text.size() && text.at(end + 1).isLowSurrogate();
        const qsizetype units = pair ? 2 : 1;
        const int size = static_cast<int>(text.mid(end, units).toUtf8().size());
        if (bytes + size > maxBytes) break;
        bytes += size;
        end += units;
    }
    return text.left(end);
}

QString uniqueFilePath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return normalized;
    QFileInfo info(normalized);
    const QString dirPath = info.absolutePath();
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();
    if (!QFile::exists(normalized)) return normalized;

    QDir dir(dirPath);
    for (int i = 1; i < 10000; ++i) {
        const QString name = suffix.isEmpty()
            ? QString("%1 (%2)").arg(base).arg(i)
            : QString("%1 (%2).%3").arg(base).arg(i).arg(suffix);
        const QString candidate = dir.filePath(name);
        if (!QFile::exists(candidate)) return candidate;
    }
    return normalized;
}

QString formatPercent(double percent)
{
    return QStringLiteral("%1 %").arg(qBound(0.0, percent, 100.0), 0, 'f', 2);
}

} // namespace reel::utils
