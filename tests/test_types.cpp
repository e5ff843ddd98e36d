#include <gtest/gtest.h>
#include <string>
#include "types.hpp"
#include "errors.hpp"

using namespace vid2mp3;

TEST(TypesTest, EncoderDefaults) {
    EncoderSettings settings;
    EXPECT_EQ(settings.sample_rate, 44100);
    EXPECT_EQ(settings.bitrate_kbps, 128);
    EXPECT_EQ(settings.max_channels, 2);

    ConvertConfig config;
    EXPECT_EQ(config.input_extension, ".mp4");
    EXPECT_TRUE(config.output_dir.empty());
}

TEST(TypesTest, FileResultFactories) {
    auto ok = FileResult::succeeded(0, "/in/a.mp4", "/out/a.mp3");
    EXPECT_EQ(ok.status, FileStatus::Succeeded);
    EXPECT_EQ(ok.output_path, "/out/a.mp3");
    EXPECT_TRUE(ok.reason.empty());

    auto bad = FileResult::failed(3, "/in/b.mp4", "no audio track");
    EXPECT_EQ(bad.status, FileStatus::Failed);
    EXPECT_EQ(bad.index, 3u);
    EXPECT_TRUE(bad.output_path.empty());
    EXPECT_EQ(bad.reason, "no audio track");

    auto gone = FileResult::skipped(1, "/in/c.mp4", "File not found");
    EXPECT_EQ(gone.status, FileStatus::Skipped);
}

TEST(TypesTest, SummaryCounts) {
    BatchSummary summary;
    summary.total = 4;
    summary.add(FileResult::succeeded(0, "a", "a.mp3"));
    summary.add(FileResult::failed(1, "b", "x"));
    summary.add(FileResult::succeeded(2, "c", "c.mp3"));

    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(summary.processed(), 3u);
}

TEST(TypesTest, PercentOf) {
    EXPECT_EQ(percent_of(0, 0), 0);
    EXPECT_EQ(percent_of(0, 3), 0);
    EXPECT_EQ(percent_of(1, 3), 33);
    EXPECT_EQ(percent_of(2, 3), 66);
    EXPECT_EQ(percent_of(3, 3), 100);
    EXPECT_EQ(percent_of(5, 3), 100);
}

TEST(TypesTest, EnumNames) {
    EXPECT_STREQ(to_string(FileStatus::Skipped), "skipped");
    EXPECT_STREQ(to_string(JobOutcome::Cancelled), "cancelled");
    EXPECT_STREQ(to_string(ErrorKind::NoOutputDirectory), "NoOutputDirectory");
}

TEST(TypesTest, BatchErrorCarriesKind) {
    try {
        throw BatchError(ErrorKind::EmptyInputList, "Please select files to convert.");
    } catch (const std::runtime_error& e) {
        auto* batch = dynamic_cast<const BatchError*>(&e);
        ASSERT_NE(batch, nullptr);
        EXPECT_EQ(batch->kind(), ErrorKind::EmptyInputList);
        EXPECT_STREQ(e.what(), "Please select files to convert.");
    }
}
