/**
 * @file test_ffmpeg_engine.cpp
 * @brief ffmpeg binding tests: telemetry parsing and process handling
 *
 * @details Process tests run a small shell script in place of ffmpeg; it
 *          ignores its arguments and prints canned telemetry.
 */

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "media_convert/ffmpeg_engine.hpp"

using namespace media_convert;
namespace fs = std::filesystem;

namespace {

class RecordingListener : public EngineListener {
public:
  void on_progress_sample(int64_t elapsed_ms) override {
    std::lock_guard<std::mutex> lock(mutex_);
    samples.push_back(elapsed_ms);
  }
  void on_log_line(const std::string &line) override {
    std::lock_guard<std::mutex> lock(mutex_);
    lines.push_back(line);
  }
  void on_exit(int status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    exit_status = status;
    cv_.notify_all();
  }

  bool wait_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return exit_status >= 0; });
  }

  std::vector<int64_t> samples;
  std::vector<std::string> lines;
  int exit_status = -1;

private:
  std::mutex mutex_;
  std::condition_variable cv_;
};

/// Executable shell script in the temp directory, removed on destruction
class ScriptFile {
public:
  explicit ScriptFile(const std::string &body) {
    path_ = fs::temp_directory_path() /
            ("media_convert_fake_ffmpeg_" + std::to_string(getpid()) + "_" +
             std::to_string(counter_++) + ".sh");
    std::ofstream out(path_);
    out << "#!/bin/sh\n" << body;
    out.close();
    fs::permissions(path_, fs::perms::owner_all);
  }
  ~ScriptFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  std::string path() const { return path_.string(); }

private:
  static inline int counter_ = 0;
  fs::path path_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Telemetry parsing
// ---------------------------------------------------------------------------

TEST(FfmpegProgressTest, ParsesMicrosecondKeys) {
  EXPECT_EQ(parse_progress_line("out_time_us=2500000"), 2500);
  /// out_time_ms is microseconds as well
  EXPECT_EQ(parse_progress_line("out_time_ms=2500000"), 2500);
}

TEST(FfmpegProgressTest, ParsesClockKey) {
  EXPECT_EQ(parse_progress_line("out_time=00:01:02.500000"), 62500);
  EXPECT_EQ(parse_progress_line("out_time=01:00:00.000000\r"), 3600000);
}

TEST(FfmpegProgressTest, IgnoresOtherLines) {
  EXPECT_FALSE(parse_progress_line("out_time_us=N/A"));
  EXPECT_FALSE(parse_progress_line("out_time=N/A"));
  EXPECT_FALSE(parse_progress_line("out_time=-00:00:00.023220"));
  EXPECT_FALSE(parse_progress_line("out_time_us=-23220"));
  EXPECT_FALSE(parse_progress_line("frame=120"));
  EXPECT_FALSE(parse_progress_line("progress=end"));
  EXPECT_FALSE(parse_progress_line("garbage"));
}

TEST(FfmpegProgressTest, ArgvPutsTelemetryOptionsFirst) {
  EncodePlan plan;
  plan.args = {"-y", "-i", "in.mp4", "out.mp3"};
  std::vector<std::string> argv = build_ffmpeg_argv("ffmpeg", plan);

  ASSERT_GE(argv.size(), plan.args.size() + 1);
  EXPECT_EQ(argv.front(), "ffmpeg");
  EXPECT_EQ(argv.back(), "out.mp3");

  auto progress = std::find(argv.begin(), argv.end(), "-progress");
  ASSERT_NE(progress, argv.end());
  EXPECT_EQ(*std::next(progress), "pipe:1");
  EXPECT_LT(progress, std::find(argv.begin(), argv.end(), "-i"));
}

// ---------------------------------------------------------------------------
// Process handling
// ---------------------------------------------------------------------------

TEST(FfmpegEngineTest, MissingBinaryFailsToSpawn) {
  FfmpegEngine engine("/nonexistent/ffmpeg-binary");
  EXPECT_FALSE(engine.available());

  RecordingListener listener;
  EXPECT_EQ(engine.execute(EncodePlan{}, listener), kInvalidProcess);
  EXPECT_EQ(engine.active_count(), 0u);
}

TEST(FfmpegEngineTest, DeliversTelemetryLogAndExit) {
  ScriptFile script("echo 'out_time_us=1000000'\n"
                    "echo 'progress=continue'\n"
                    "printf 'out_time_us=2000000\\r'\n"
                    "echo 'something broke' >&2\n"
                    "exit 3\n");
  FfmpegEngine engine(script.path());
  ASSERT_TRUE(engine.available());

  RecordingListener listener;
  ProcessHandle handle = engine.execute(EncodePlan{}, listener);
  ASSERT_NE(handle, kInvalidProcess);

  ASSERT_TRUE(listener.wait_exit(std::chrono::seconds(10)));
  engine.release(handle);

  EXPECT_EQ(listener.exit_status, 3);
  EXPECT_EQ(listener.samples, (std::vector<int64_t>{1000, 2000}));
  ASSERT_EQ(listener.lines.size(), 1u);
  EXPECT_EQ(listener.lines[0], "something broke");
  EXPECT_EQ(engine.active_count(), 0u);
}

TEST(FfmpegEngineTest, TerminateStopsProcess) {
  ScriptFile script("exec sleep 30\n");
  FfmpegEngine engine(script.path());

  RecordingListener listener;
  ProcessHandle handle = engine.execute(EncodePlan{}, listener);
  ASSERT_NE(handle, kInvalidProcess);

  engine.terminate(handle);
  ASSERT_TRUE(listener.wait_exit(std::chrono::seconds(10)));
  engine.release(handle);

  /// Killed by SIGTERM
  EXPECT_EQ(listener.exit_status, 128 + 15);
}

TEST(FfmpegEngineTest, ReleaseOfLiveProcessDoesNotBlock) {
  ScriptFile script("trap '' TERM\nexec sleep 30\n");
  FfmpegEngine engine(script.path());

  RecordingListener listener;
  ProcessHandle handle = engine.execute(EncodePlan{}, listener);
  ASSERT_NE(handle, kInvalidProcess);

  auto start = std::chrono::steady_clock::now();
  engine.release(handle);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(engine.active_count(), 0u);

  /// Released handles are forgotten
  engine.terminate(handle);
  engine.release(handle);
}
