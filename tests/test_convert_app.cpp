#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include "convert_app.hpp"
#include "fake_backend.hpp"

namespace fs = std::filesystem;
using namespace vid2mp3;
using vid2mp3::testing_support::FakeBackend;
using vid2mp3::testing_support::FakeBehavior;

class ConvertAppTest : public ::testing::Test {
protected:
    fs::path temp_dir_;
    fs::path output_dir_;
    FakeBackend backend_;
    std::vector<std::string> args_;
    std::vector<char*> argv_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = fs::temp_directory_path() / (std::string("vid2mp3_app_") + info->name());
        fs::remove_all(temp_dir_);
        output_dir_ = temp_dir_ / "out";
        fs::create_directories(output_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    std::string create_file(const std::string& name) {
        fs::path p = temp_dir_ / name;
        std::ofstream f(p);
        f << "video";
        return p.string();
    }

    int run_app(std::vector<std::string> args, std::unique_ptr<ConvertApp>* keep = nullptr) {
        args_ = std::move(args);
        args_.insert(args_.begin(), "vid2mp3");
        argv_.clear();
        for (auto& a : args_) argv_.push_back(a.data());
        argv_.push_back(nullptr);

        auto app = std::make_unique<ConvertApp>(static_cast<int>(args_.size()), argv_.data(), backend_);
        int code = app->run();
        if (keep) *keep = std::move(app);
        return code;
    }
};

TEST_F(ConvertAppTest, ParsesOptions) {
    std::unique_ptr<ConvertApp> app;
    int code = run_app({"-o", output_dir_.string(), "--ext", "mkv", "--bitrate", "192",
                        "--sample-rate", "48000", create_file("a.mkv")}, &app);

    EXPECT_EQ(code, ConvertApp::EXIT_OK);
    EXPECT_EQ(app->config().output_dir, output_dir_.string());
    EXPECT_EQ(app->config().input_extension, ".mkv");
    EXPECT_EQ(app->config().encoder.bitrate_kbps, 192);
    EXPECT_EQ(app->config().encoder.sample_rate, 48000);
    EXPECT_EQ(app->inputFiles().size(), 1u);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
}

TEST_F(ConvertAppTest, HelpExitsCleanly) {
    EXPECT_EQ(run_app({"--help"}), ConvertApp::EXIT_OK);
    EXPECT_TRUE(backend_.loaded().empty());
}

TEST_F(ConvertAppTest, UsageErrors) {
    EXPECT_EQ(run_app({create_file("a.mp4")}), ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o"}), ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string(), "--bitrate", "999", "a.mp4"}),
              ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string(), "--bitrate", "12x", "a.mp4"}),
              ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string(), "--sample-rate", "100", "a.mp4"}),
              ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string(), "--verbose", "a.mp4"}),
              ConvertApp::EXIT_USAGE);
    EXPECT_TRUE(backend_.loaded().empty());
}

TEST_F(ConvertAppTest, PreconditionFailures) {
    std::string a = create_file("a.mp4");
    EXPECT_EQ(run_app({"-o", (temp_dir_ / "missing").string(), a}), ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string()}), ConvertApp::EXIT_USAGE);
    EXPECT_EQ(run_app({"-o", output_dir_.string(), create_file("notes.txt")}),
              ConvertApp::EXIT_USAGE);
    EXPECT_TRUE(backend_.loaded().empty());
}

TEST_F(ConvertAppTest, ConvertsAllFiles) {
    int code = run_app({"-o", output_dir_.string(), create_file("a.mp4"), create_file("b.MP4")});

    EXPECT_EQ(code, ConvertApp::EXIT_OK);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
    EXPECT_TRUE(fs::exists(output_dir_ / "b.mp3"));
    EXPECT_EQ(backend_.openHandles(), 0);
}

TEST_F(ConvertAppTest, FailedFileSetsExitCode) {
    backend_.setBehavior("silent.mp4", FakeBehavior::NoAudio);
    int code = run_app({"-o", output_dir_.string(), create_file("a.mp4"), create_file("silent.mp4")});

    EXPECT_EQ(code, ConvertApp::EXIT_FILES_FAILED);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
    EXPECT_FALSE(fs::exists(output_dir_ / "silent.mp3"));
}

TEST_F(ConvertAppTest, RejectedInputSetsExitCode) {
    std::string missing = (temp_dir_ / "missing.mp4").string();
    int code = run_app({"-o", output_dir_.string(), create_file("a.mp4"), missing});

    EXPECT_EQ(code, ConvertApp::EXIT_FILES_FAILED);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
}

TEST_F(ConvertAppTest, WrongExtensionSetsExitCode) {
    int code = run_app({"-o", output_dir_.string(), create_file("a.mp4"), create_file("b.avi")});

    EXPECT_EQ(code, ConvertApp::EXIT_FILES_FAILED);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
}

TEST_F(ConvertAppTest, InterruptCancelsBatch) {
    backend_.setWriteHook([](const std::string& name) {
        if (name == "a.mp4") {
            std::raise(SIGINT);
            // Give the foreground loop time to see the interrupt
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
        }
    });

    int code = run_app({"-o", output_dir_.string(), create_file("a.mp4"),
                        create_file("b.mp4"), create_file("c.mp4")});

    EXPECT_EQ(code, ConvertApp::EXIT_FILES_FAILED);
    EXPECT_TRUE(fs::exists(output_dir_ / "a.mp3"));
    EXPECT_FALSE(fs::exists(output_dir_ / "c.mp3"));
    EXPECT_EQ(std::signal(SIGINT, SIG_DFL), SIG_DFL);
}
