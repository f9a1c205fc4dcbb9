#include <gtest/gtest.h>

#include <QElapsedTimer>
#include <QFile>
#include <QString>
#include <QStringList>

#include "fake_tools.h"

import reel.core.metadatafetcher;
import reel.core.streamcatalog;
import reel.services.tool_runner;

namespace {

ToolPaths fakePaths(const FakeTools& fake)
{
    ToolPaths tools;
    tools.ytDlp = fake.ytDlp();
    tools.ffmpeg = fake.ffmpeg();
    tools.ffprobe = fake.ffprobe();
    return tools;
}

QStringList lastArguments(const FakeTools& fake)
{
    QFile file(fake.ytDlpArgsFile());
    if (!file.open(QIODevice::ReadOnly)) return {};
    return QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts);
}

} // namespace

TEST(MetadataFetcherTest, FetchesStreamsForValidUrl)
{
    FakeTools fake;
    ASSERT_TRUE(fake.isValid());
    const MetadataFetcher fetcher(fakePaths(fake));

    const FetchResult result = fetcher.fetch(QStringLiteral("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
    ASSERT_TRUE(result.ok) << result.error.toStdString();
    EXPECT_FALSE(result.info.streams.isEmpty());
    EXPECT_FALSE(availableResolutions(result.info).isEmpty());

    const QStringList args = lastArguments(fake);
    ASSERT_FALSE(args.isEmpty());
    EXPECT_TRUE(args.contains(QStringLiteral("-J")));
    EXPECT_TRUE(args.contains(QStringLiteral("--no-playlist")));
    EXPECT_EQ(args.last(), QStringLiteral("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
}

TEST(MetadataFetcherTest, InvalidUrlNeverStartsTheExtractor)
{
    FakeTools fake;
    ASSERT_TRUE(fake.isValid());
    const MetadataFetcher fetcher(fakePaths(fake));

    const FetchResult result = fetcher.fetch(QStringLiteral("https://example.com/watch?v=dQw4w9WgXcQ"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, QStringLiteral("URL error, please try again."));
    EXPECT_FALSE(QFile::exists(fake.ytDlpArgsFile()));
}

TEST(MetadataFetcherTest, MapsExtractorFailure)
{
    FakeTools fake;
    ToolPaths tools = fakePaths(fake);
    tools.ytDlp = fake.failingYtDlp(QStringLiteral("ERROR: [youtube] dQw4w9WgXcQ: Private video. Sign in if you've been granted access to this video"));
    ASSERT_FALSE(tools.ytDlp.isEmpty());

    const FetchResult result = MetadataFetcher(tools).fetch(QStringLiteral("https://youtu.be/dQw4w9WgXcQ"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, QStringLiteral("Video is private."));
}

TEST(MetadataFetcherTest, MissingExtractor)
{
    const FetchResult result = MetadataFetcher(ToolPaths()).fetch(QStringLiteral("https://youtu.be/dQw4w9WgXcQ"));
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.isEmpty());
}

TEST(MetadataFetcherTest, PassesBrowserCookies)
{
    ToolPaths tools;
    tools.ytDlp = QStringLiteral("yt-dlp");
    tools.cookiesFromBrowser = QStringLiteral("firefox");
    const QStringList args = MetadataFetcher(tools).arguments(QStringLiteral(" https://youtu.be/dQw4w9WgXcQ "));
    const qsizetype at = args.indexOf(QStringLiteral("--cookies-from-browser"));
    ASSERT_GE(at, 0);
    EXPECT_EQ(args.at(at + 1), QStringLiteral("firefox"));
    EXPECT_EQ(args.at(args.size() - 2), QStringLiteral("--"));
    EXPECT_EQ(args.last(), QStringLiteral("https://youtu.be/dQw4w9WgXcQ"));
}

TEST(MetadataFetcherTest, CanceledLookupKillsExtractor)
{
    FakeTools fake;
    ASSERT_TRUE(fake.writeScript(QStringLiteral("yt-dlp-stalled"), QStringLiteral("#!/bin/sh\nexec sleep 30\n")));
    ToolPaths tools;
    tools.ytDlp = fake.path(QStringLiteral("yt-dlp-stalled"));

    QElapsedTimer timer;
    timer.start();
    const FetchResult result = MetadataFetcher(tools).fetch(
        QStringLiteral("https://youtu.be/dQw4w9WgXcQ"),
        [&timer]() { return timer.elapsed() > 300; });
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, QStringLiteral("Canceled"));
    EXPECT_LT(timer.elapsed(), 10000);
}
