/**
 * @file main.cpp
 * @brief Entry point for the media_convert command-line tool
 *
 * @details Main entry point that handles:
 *
 *          - Positional argument parsing
 *
 *          - One conversion (or clip) job through TranscodeController
 *
 *          - SIGINT/SIGTERM -> cancel of the running job
 *
 * @note Exit codes: 0 success, 1 usage error, 2 failed job, 130 cancelled.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "media_convert/config.hpp"
#include "media_convert/ffmpeg_engine.hpp"
#include "media_convert/logging.hpp"
#include "media_convert/transcode_controller.hpp"

using namespace media_convert;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;
constexpr int kExitCancelled = 130;

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM)
    g_interrupted.store(true);
}

void print_usage() {
  LOG_WARN("Usage: ./media_convert <input> <output> <format> [quality] "
           "[clip_start clip_end]");
  LOG_WARN("  format:  mp4 | mov | mp3 | wav | aac | flac");
  LOG_WARN("  quality: low | medium | high (default medium)");
}

/// Strict seconds parse for clip bounds
bool parse_seconds(const char *text, double &value) {
  char *end = nullptr;
  value = std::strtod(text, &end);
  return end != text && *end == '\0';
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc != 4 && argc != 5 && argc != 7) {
    print_usage();
    return kExitUsage;
  }

  ConversionRequest request;
  request.input_path = argv[1];
  request.output_path = argv[2];
  request.format = argv[3];
  if (argc >= 5)
    request.quality = argv[4];

  if (argc == 7) {
    ClipWindow clip{};
    if (!parse_seconds(argv[5], clip.start) ||
        !parse_seconds(argv[6], clip.end)) {
      LOG_ERROR("Clip bounds must be numbers of seconds: '{}' '{}'", argv[5],
                argv[6]);
      return kExitUsage;
    }
    request.clip = clip;
  }

  FfmpegEngine engine(Config::ffmpeg_binary());
  if (!engine.available()) {
    LOG_WARN("'{}' not found on PATH (set FFMPEG_BINARY)",
             Config::ffmpeg_binary());
  }

  TranscodeController controller(engine);
  CancelHandle cancel_handle;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  /// Turns the signal flag into a cancel from a normal thread
  std::atomic<bool> job_done{false};
  std::thread watcher([&] {
    while (!job_done.load()) {
      if (g_interrupted.load()) {
        LOG_WARN("Interrupted, cancelling...");
        controller.cancel(cancel_handle);
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  int last_percent = -1;
  auto on_progress = [&last_percent](double value) {
    int percent = static_cast<int>(value * 100.0);
    if (percent != last_percent) {
      last_percent = percent;
      LOG_INFO("Progress: {:3d}%", percent);
    }
  };

  Outcome outcome = controller.convert(request, on_progress, &cancel_handle);

  job_done.store(true);
  watcher.join();

  TimingCollector::print_summary();

  if (outcome.succeeded)
    return kExitSuccess;
  if (outcome.error == ErrorCode::Cancelled)
    return kExitCancelled;

  LOG_ERROR("Conversion failed: {}", to_string(outcome.error));
  return kExitFailed;
}
