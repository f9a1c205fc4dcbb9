#include <algorithm>

#include <gtest/gtest.h>

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringList>
#include <QVector>

#include "fake_tools.h"

import reel.core.streamcatalog;
import reel.core.streamdescriptor;
import reel.utils.media_utils;

namespace {

QByteArray fixture()
{
    QFile file(testDataPath(QStringLiteral("video_info.json")));
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

class StreamCatalogTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        QString error;
        ASSERT_TRUE(parseVideoInfo(fixture(), &info, &error)) << error.toStdString();
    }

    VideoInfo info;
};

} // namespace

TEST_F(StreamCatalogTest, ParsesVideoMetadata)
{
    EXPECT_EQ(info.id, QStringLiteral("dQw4w9WgXcQ"));
    EXPECT_EQ(info.title, QStringLiteral("Never: Gonna/Give \"You\" Up"));
    EXPECT_EQ(info.durationSeconds, 213);
    EXPECT_EQ(info.thumbnailUrl, QStringLiteral("https://i.ytimg.com/vi/dQw4w9WgXcQ/maxresdefault.jpg"));
    // storyboard and the video format without a height are skipped
    EXPECT_EQ(info.streams.size(), 8);
}

TEST_F(StreamCatalogTest, ClassifiesStreams)
{
    for (const StreamDescriptor& stream : info.streams) {
        EXPECT_TRUE(reel::utils::isWellFormedResolution(stream.resolution)) << stream.resolution.toStdString();
        if (stream.formatId == QStringLiteral("18")) {
            EXPECT_TRUE(stream.isProgressive());
            EXPECT_EQ(stream.resolution, QStringLiteral("360p"));
        } else if (stream.formatId == QStringLiteral("140")) {
            EXPECT_TRUE(stream.isAdaptive());
            EXPECT_TRUE(stream.isAudioOnly());
            EXPECT_EQ(stream.resolution, QStringLiteral("audio"));
        } else if (stream.formatId == QStringLiteral("248")) {
            EXPECT_TRUE(stream.isVideoOnly());
            EXPECT_EQ(stream.height, 1080);
        } else if (stream.formatId == QStringLiteral("22")) {
            EXPECT_EQ(stream.fileSize, 20000000);
        }
    }
}

TEST_F(StreamCatalogTest, ListsOneChoicePerResolutionAndKind)
{
    const QVector<StreamChoice> choices = availableResolutions(info);
    const QStringList expected{
        QStringLiteral("1080p (mp4)"),
        QStringLiteral("720p (mp4)"),
        QStringLiteral("720p (mp4, progressive)"),
        QStringLiteral("360p (mp4, progressive)")
    };
    EXPECT_EQ(choiceLabels(choices), expected);
    ASSERT_EQ(choices.size(), 4);
    EXPECT_EQ(choices.at(0).video.formatId, QStringLiteral("137"));
    EXPECT_EQ(choices.at(1).video.formatId, QStringLiteral("136"));
    EXPECT_EQ(choices.at(2).video.formatId, QStringLiteral("22"));
}

TEST_F(StreamCatalogTest, PairsAudioWithMatchingContainer)
{
    StreamDescriptor video;
    for (const StreamDescriptor& stream : info.streams) {
        if (stream.formatId == QStringLiteral("137")) video = stream;
    }
    StreamDescriptor audio;
    ASSERT_TRUE(bestAudioFor(info, video, &audio));
    EXPECT_EQ(audio.formatId, QStringLiteral("140"));

    for (const StreamDescriptor& stream : info.streams) {
        if (stream.formatId == QStringLiteral("248")) video = stream;
    }
    ASSERT_TRUE(bestAudioFor(info, video, &audio));
    EXPECT_EQ(audio.formatId, QStringLiteral("251"));
}

TEST_F(StreamCatalogTest, NoAudioStreamAvailable)
{
    VideoInfo silent = info;
    silent.streams.erase(std::remove_if(silent.streams.begin(), silent.streams.end(),
                                        [](const StreamDescriptor& s) { return s.isAudioOnly(); }),
                         silent.streams.end());
    StreamDescriptor audio;
    EXPECT_FALSE(bestAudioFor(silent, silent.streams.first(), &audio));
}

TEST(VideoInfoParseTest, RejectsPlaylistsAndGarbage)
{
    VideoInfo info;
    QString error;
    EXPECT_FALSE(parseVideoInfo(QByteArray(R"({"_type":"playlist","entries":[]})"), &info, &error));
    EXPECT_EQ(error, QStringLiteral("Playlists are not supported."));

    EXPECT_FALSE(parseVideoInfo(QByteArray("<html>"), &info, &error));
    EXPECT_EQ(error, QStringLiteral("Could not parse video information."));

    EXPECT_FALSE(parseVideoInfo(QByteArray(R"({"id":"x","title":"t","formats":[]})"), &info, &error));
    EXPECT_EQ(error, QStringLiteral("No downloadable streams found."));
}
