#include <gtest/gtest.h>

#include <memory>

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSettings>
#include <QSignalSpy>
#include <QString>
#include <QTemporaryDir>
#include <QThreadPool>
#include <QUrl>

#include "fake_tools.h"

import reel.core.downloadcontroller;
import reel.core.taskdispatcher;
import reel.core.tasklistmodel;
import reel.services.app_settings;
import reel.services.tool_runner;

namespace {

class DownloadControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(fake.isValid());
        ASSERT_TRUE(destination.isValid());
        ASSERT_TRUE(temporaryRoot.isValid());

        ToolPaths tools;
        tools.ytDlp = fake.ytDlp();
        tools.ffmpeg = fake.ffmpeg();
        tools.ffprobe = fake.ffprobe();
        controller.setToolPaths(tools);
        controller.dispatcher()->setTemporaryRoot(temporaryRoot.path());
    }

    void TearDown() override
    {
        // let pending fetches end before the fake tools go away
        QThreadPool::globalInstance()->waitForDone();
        QSettings().clear();
    }

    bool waitForFetch()
    {
        return waitUntil([this]() { return !controller.loading(); });
    }

    FakeTools fake;
    QTemporaryDir destination;
    QTemporaryDir temporaryRoot;
    DownloadController controller;
};

const QString kVideoUrl = QStringLiteral("https://www.youtube.com/watch?v=dQw4w9WgXcQ");

} // namespace

TEST_F(DownloadControllerTest, StartsWithPasteHint)
{
    EXPECT_EQ(controller.status(), QStringLiteral("Paste link to Youtube video."));
    EXPECT_FALSE(controller.canDownload());
}

TEST_F(DownloadControllerTest, InvalidUrlIsFetchErrorWithoutTask)
{
    controller.setUrl(QStringLiteral("https://example.com/some/page"));
    EXPECT_EQ(controller.status(), QStringLiteral("URL error, please try again."));
    EXPECT_EQ(controller.lastError(), QStringLiteral("Fetch error: URL error, please try again."));
    EXPECT_FALSE(controller.loading());

    EXPECT_FALSE(controller.download(destination.path()));
    EXPECT_EQ(controller.taskModel()->rowCount(), 0);
    EXPECT_EQ(controller.dispatcher()->activeCount(), 0);
}

TEST_F(DownloadControllerTest, FetchFillsResolutions)
{
    controller.setUrl(kVideoUrl);
    EXPECT_TRUE(controller.loading());
    EXPECT_EQ(controller.status(), QStringLiteral("Loading video information..."));

    ASSERT_TRUE(waitForFetch());
    EXPECT_EQ(controller.title(), QStringLiteral("Never: Gonna/Give \"You\" Up"));
    EXPECT_EQ(controller.thumbnailUrl(), QUrl(QStringLiteral("https://i.ytimg.com/vi/dQw4w9WgXcQ/maxresdefault.jpg")));
    ASSERT_EQ(controller.resolutions().size(), 4);
    EXPECT_EQ(controller.resolutions().first(), QStringLiteral("1080p (mp4)"));
    EXPECT_EQ(controller.selectedIndex(), 0);
    EXPECT_TRUE(controller.canDownload());
}

TEST_F(DownloadControllerTest, DropsStaleFetchResult)
{
    controller.setUrl(kVideoUrl);
    controller.setUrl(QString());
    QThreadPool::globalInstance()->waitForDone();
    waitUntil([]() { return false; }, 200);

    EXPECT_TRUE(controller.resolutions().isEmpty());
    EXPECT_TRUE(controller.title().isEmpty());
    EXPECT_FALSE(controller.loading());
    EXPECT_EQ(controller.status(), QStringLiteral("Paste link to Youtube video."));
}

TEST_F(DownloadControllerTest, MissingFolderIsRejected)
{
    controller.setUrl(kVideoUrl);
    ASSERT_TRUE(waitForFetch());
    EXPECT_FALSE(controller.download(QString()));
    EXPECT_EQ(controller.status(), QStringLiteral("No download path provided."));
    EXPECT_EQ(controller.taskModel()->rowCount(), 0);
}

TEST_F(DownloadControllerTest, DownloadsSelectedResolution)
{
    controller.setUrl(kVideoUrl);
    ASSERT_TRUE(waitForFetch());
    controller.setSelectedIndex(0);

    ASSERT_TRUE(controller.download(QUrl::fromLocalFile(destination.path()).toString()));
    ASSERT_EQ(controller.taskModel()->rowCount(), 1);
    EXPECT_EQ(controller.appSettings()->lastFolder(), destination.path());

    ASSERT_TRUE(waitUntil([this]() { return controller.dispatcher()->activeCount() == 0; }));
    EXPECT_EQ(controller.progressText(), QStringLiteral("Download complete!"));
    EXPECT_EQ(controller.status(), QStringLiteral("Finished download."));
    EXPECT_DOUBLE_EQ(controller.progress(), 100.0);

    const QString output = controller.taskModel()->outputPathAt(0);
    EXPECT_EQ(output, QDir(destination.path()).filePath(QStringLiteral("Never Gonna Give You Up.mp4")));
    EXPECT_TRUE(QFile::exists(output));
}

TEST_F(DownloadControllerTest, ReportsMergeFailureInStatus)
{
    ToolPaths tools = controller.toolPaths();
    tools.ffmpeg.clear();
    controller.setToolPaths(tools);

    controller.setUrl(kVideoUrl);
    ASSERT_TRUE(waitForFetch());
    ASSERT_TRUE(controller.download(destination.path()));
    ASSERT_TRUE(waitUntil([this]() { return controller.dispatcher()->activeCount() == 0; }));

    EXPECT_EQ(controller.status(), QStringLiteral("FFMPEG is not found! Please install ffmpeg."));
    EXPECT_EQ(controller.lastError(), QStringLiteral("Merge error: FFMPEG is not found! Please install ffmpeg."));
    EXPECT_TRUE(QDir(destination.path()).entryList(QDir::Files).isEmpty());
}

TEST_F(DownloadControllerTest, InitialFolderIsLocalFileUrl)
{
    EXPECT_TRUE(controller.initialFolder().isLocalFile());

    const QString folder = QDir(destination.path()).filePath(QStringLiteral("with space %20"));
    ASSERT_TRUE(QDir().mkpath(folder));
    QSignalSpy changed(&controller, &DownloadController::initialFolderChanged);
    controller.appSettings()->setLastFolder(folder);
    EXPECT_EQ(changed.count(), 1);
    EXPECT_EQ(controller.initialFolder(), QUrl::fromLocalFile(folder));
    EXPECT_EQ(controller.initialFolder().toLocalFile(), folder);
}

TEST(DownloadControllerShutdownTest, DestroyingDuringLookupStopsExtractor)
{
    FakeTools fake;
    ASSERT_TRUE(fake.isValid());
    ASSERT_TRUE(fake.writeScript(QStringLiteral("yt-dlp-stalled"), QStringLiteral("#!/bin/sh\nexec sleep 30\n")));

    auto controller = std::make_unique<DownloadController>();
    ToolPaths tools;
    tools.ytDlp = fake.path(QStringLiteral("yt-dlp-stalled"));
    controller->setToolPaths(tools);
    controller->setUrl(kVideoUrl);
    ASSERT_TRUE(controller->loading());
    // give the worker time to start the stalled lookup
    waitUntil([]() { return false; }, 500);

    QElapsedTimer timer;
    timer.start();
    controller.reset();
    EXPECT_TRUE(QThreadPool::globalInstance()->waitForDone(10000));
    EXPECT_LT(timer.elapsed(), 10000);
    QSettings().clear();
}

TEST(DownloadControllerShutdownTest, NewUrlStopsPreviousLookup)
{
    FakeTools fake;
    ASSERT_TRUE(fake.isValid());
    ASSERT_TRUE(fake.writeScript(QStringLiteral("yt-dlp-stalled"), QStringLiteral("#!/bin/sh\nexec sleep 30\n")));

    DownloadController controller;
    ToolPaths tools;
    tools.ytDlp = fake.path(QStringLiteral("yt-dlp-stalled"));
    controller.setToolPaths(tools);
    controller.setUrl(kVideoUrl);
    waitUntil([]() { return false; }, 500);

    QElapsedTimer timer;
    timer.start();
    controller.setUrl(QString());
    EXPECT_TRUE(QThreadPool::globalInstance()->waitForDone(10000));
    EXPECT_LT(timer.elapsed(), 10000);
    EXPECT_FALSE(controller.loading());
    EXPECT_EQ(controller.status(), QStringLiteral("Paste link to Youtube video."));
    QSettings().clear();
}
