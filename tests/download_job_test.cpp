#include <gtest/gtest.h>

#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QVector>

#include "fake_tools.h"

import reel.core.downloadjob;
import reel.core.downloadtask;
import reel.core.streamdescriptor;
import reel.services.tool_runner;

namespace {

StreamDescriptor streamById(const VideoInfo& info, const QString& formatId)
{
    for (const StreamDescriptor& stream : info.streams) {
        if (stream.formatId == formatId) return stream;
    }
    return StreamDescriptor();
}

class DownloadJobTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(fake.isValid());
        ASSERT_TRUE(destination.isValid());
        ASSERT_TRUE(temporaryRoot.isValid());

        QFile file(testDataPath(QStringLiteral("video_info.json")));
        ASSERT_TRUE(file.open(QIODevice::ReadOnly));
        QString error;
        ASSERT_TRUE(parseVideoInfo(file.readAll(), &info, &error)) << error.toStdString();

        tools.ytDlp = fake.ytDlp();
        tools.ffmpeg = fake.ffmpeg();
        tools.ffprobe = fake.ffprobe();
    }

    DownloadTask adaptiveTask() const
    {
        DownloadTask task;
        task.url = info.webpageUrl;
        task.title = info.title;
        task.video = streamById(info, QStringLiteral("137"));
        task.audio = streamById(info, QStringLiteral("140"));
        task.destinationDir = destination.path();
        return task;
    }

    DownloadTask progressiveTask() const
    {
        DownloadTask task;
        task.url = info.webpageUrl;
        task.title = info.title;
        task.video = streamById(info, QStringLiteral("18"));
        task.destinationDir = destination.path();
        return task;
    }

    TaskOutcome run(const DownloadTask& task, QVector<double>* progress = nullptr, QStringList* phases = nullptr)
    {
        DownloadJob job(task, tools);
        job.setTemporaryRoot(temporaryRoot.path());
        return job.run([progress, phases](const QString& phase, double percent) {
            if (progress) progress->append(percent);
            if (phases && (phases->isEmpty() || phases->last() != phase)) phases->append(phase);
        });
    }

    QStringList destinationFiles() const
    {
        return QDir(destination.path()).entryList(QDir::Files, QDir::Name);
    }

    QStringList leftoverTemporaryEntries() const
    {
        return QDir(temporaryRoot.path()).entryList(QDir::AllEntries | QDir::NoDotAndDotDot);
    }

    FakeTools fake;
    QTemporaryDir destination;
    QTemporaryDir temporaryRoot;
    VideoInfo info;
    ToolPaths tools;
};

} // namespace

TEST_F(DownloadJobTest, AdaptiveDownloadsTwoStreamsAndMerges)
{
    QVector<double> progress;
    QStringList phases;
    const TaskOutcome outcome = run(adaptiveTask(), &progress, &phases);
    ASSERT_TRUE(outcome.success) << outcome.errorMessage.toStdString();

    // exactly the video and audio files existed when ffmpeg ran
    EXPECT_EQ(fake.mergeLog(), QStringList{QStringLiteral("2")});

    EXPECT_EQ(destinationFiles(), QStringList{QStringLiteral("Never Gonna Give You Up.mp4")});
    EXPECT_EQ(outcome.outputPath, QDir(destination.path()).filePath(QStringLiteral("Never Gonna Give You Up.mp4")));
    EXPECT_TRUE(leftoverTemporaryEntries().isEmpty());

    QFile out(outcome.outputPath);
    ASSERT_TRUE(out.open(QIODevice::ReadOnly));
    EXPECT_EQ(out.readAll(), QByteArray("stream 137\nstream 140\n"));

    const QStringList expectedPhases{
        QStringLiteral("Downloading video"),
        QStringLiteral("Downloading audio"),
        QStringLiteral("Merging")
    };
    EXPECT_EQ(phases, expectedPhases);
    ASSERT_FALSE(progress.isEmpty());
    for (int i = 1; i < progress.size(); ++i) EXPECT_GE(progress.at(i), progress.at(i - 1));
    EXPECT_DOUBLE_EQ(progress.last(), 100.0);
}

TEST_F(DownloadJobTest, ProgressiveSkipsMerger)
{
    QStringList phases;
    const TaskOutcome outcome = run(progressiveTask(), nullptr, &phases);
    ASSERT_TRUE(outcome.success) << outcome.errorMessage.toStdString();

    EXPECT_TRUE(fake.mergeLog().isEmpty());
    EXPECT_EQ(phases, QStringList{QStringLiteral("Downloading")});
    EXPECT_EQ(destinationFiles(), QStringList{QStringLiteral("Never Gonna Give You Up.mp4")});
    EXPECT_TRUE(leftoverTemporaryEntries().isEmpty());
}

TEST_F(DownloadJobTest, NeverOverwritesExistingFile)
{
    const QString existing = QDir(destination.path()).filePath(QStringLiteral("Never Gonna Give You Up.mp4"));
    QFile file(existing);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("keep me");
    file.close();

    const TaskOutcome outcome = run(progressiveTask());
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(QFileInfo(outcome.outputPath).fileName(), QStringLiteral("Never Gonna Give You Up (1).mp4"));

    QFile kept(existing);
    ASSERT_TRUE(kept.open(QIODevice::ReadOnly));
    EXPECT_EQ(kept.readAll(), QByteArray("keep me"));
}

TEST_F(DownloadJobTest, LongNonLatinTitleCompletes)
{
    DownloadTask task = adaptiveTask();
    task.title.clear();
    for (int i = 0; i < 9; ++i) task.title += QStringLiteral("日本語の長いタイトル");
    for (int i = 0; i < 10; ++i) task.title += QStringLiteral("😀");

    const TaskOutcome outcome = run(task);
    ASSERT_TRUE(outcome.success) << outcome.errorMessage.toStdString();
    EXPECT_TRUE(QFileInfo::exists(outcome.outputPath));
    EXPECT_LE(QFileInfo(outcome.outputPath).fileName().toUtf8().size(), 255);
    EXPECT_TRUE(QFileInfo(outcome.outputPath).fileName().startsWith(QStringLiteral("日本語の長いタイトル")));
    EXPECT_EQ(destinationFiles().size(), 1);
    EXPECT_TRUE(leftoverTemporaryEntries().isEmpty());
}

TEST_F(DownloadJobTest, MissingMergeToolLeavesNoFiles)
{
    tools.ffmpeg.clear();
    const TaskOutcome outcome = run(adaptiveTask());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Merge);
    EXPECT_EQ(outcome.errorMessage, QStringLiteral("FFMPEG is not found! Please install ffmpeg."));
    EXPECT_TRUE(destinationFiles().isEmpty());
    EXPECT_TRUE(leftoverTemporaryEntries().isEmpty());
}

TEST_F(DownloadJobTest, FailingDownloadIsDownloadError)
{
    tools.ytDlp = fake.failingYtDlp(QStringLiteral("ERROR: unable to download video data: HTTP Error 403: Forbidden"));
    const TaskOutcome outcome = run(progressiveTask());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Download);
    EXPECT_EQ(outcome.errorMessage, QStringLiteral("ERROR: unable to download video data: HTTP Error 403: Forbidden"));
    EXPECT_TRUE(destinationFiles().isEmpty());
    EXPECT_TRUE(leftoverTemporaryEntries().isEmpty());
}

TEST_F(DownloadJobTest, AdaptiveWithoutAudioIsRejected)
{
    DownloadTask task = adaptiveTask();
    task.audio = StreamDescriptor();
    EXPECT_FALSE(task.isValid());
    const TaskOutcome outcome = run(task);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorMessage, QStringLiteral("No audio stream available."));
}

TEST_F(DownloadJobTest, CanceledBeforeStart)
{
    DownloadJob job(progressiveTask(), tools);
    job.setTemporaryRoot(temporaryRoot.path());
    const TaskOutcome outcome = job.run({}, []() { return true; });
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorMessage, QStringLiteral("Canceled"));
    EXPECT_TRUE(destinationFiles().isEmpty());
}

TEST(DownloadJobCleanupTest, RemovesOnlyStaleJobDirectories)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    QDir dir(root.path());
    ASSERT_TRUE(dir.mkdir(QStringLiteral("reel-stale1")));
    ASSERT_TRUE(dir.mkdir(QStringLiteral("reel-fresh1")));
    ASSERT_TRUE(dir.mkdir(QStringLiteral("other-dir")));

    // a negative age makes every matching directory count as stale
    EXPECT_EQ(DownloadJob::removeStaleTemporaryDirs(root.path(), 3600), 0);
    EXPECT_EQ(DownloadJob::removeStaleTemporaryDirs(root.path(), -60), 2);
    EXPECT_EQ(dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot), QStringList{QStringLiteral("other-dir")});
}
