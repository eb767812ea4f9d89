/**
 * @file ffmpeg_engine.cpp
 * @brief ffmpeg subprocess engine implementation
 *
 * @details
 *          - posix_spawnp with stdout/stderr pipes (stdin is /dev/null)
 *
 *          - poll(2) reader thread per process, line-oriented dispatch
 *
 *          - waitid(WNOWAIT) before waitpid so signals never hit a reused pid
 *
 *          - Children run in their own process group
 */

#include "media_convert/ffmpeg_engine.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" {
#include <libavutil/log.h>
}

#include <fmt/core.h>

#include "media_convert/logging.hpp"
#include "media_convert/media_probe.hpp"
#include "media_convert/system.hpp"

extern char **environ;

namespace media_convert {

// **---- Process ----**

/**
 * @struct FfmpegEngine::Process
 * @brief One spawned ffmpeg and its reader thread.
 */
struct FfmpegEngine::Process {
  pid_t pid = -1;
  int out_fd = -1; //< Read end of the telemetry pipe
  int err_fd = -1; //< Read end of the log pipe
  std::thread reader;

  /// Guards listener and exited
  std::mutex state_mutex;
  EngineListener *listener = nullptr;
  bool exited = false; //< Child exited; its pid must not be signalled

  std::atomic<bool> finished{false}; //< Reader loop returned

  ~Process() {
    if (reader.joinable())
      reader.join();
    if (out_fd != -1)
      close(out_fd);
    if (err_fd != -1)
      close(err_fd);
  }

  bool signal(int signo) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (exited || pid <= 0)
      return false;
    return kill(pid, signo) == 0;
  }

  void detach_listener() {
    std::lock_guard<std::mutex> lock(state_mutex);
    listener = nullptr;
  }

  template <typename Fn> void notify(Fn &&fn) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (listener)
      fn(*listener);
  }
};

// **---- Internal Helpers ----**

namespace {

/// Strict integer parse of the whole string
bool parse_int64(const std::string &text, int64_t &value) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  value = static_cast<int64_t>(v);
  return true;
}

/// HH:MM:SS.ffffff -> ms
std::optional<int64_t> parse_clock(const std::string &text) {
  int h = 0, m = 0;
  double s = 0;
  char trailing = 0;
  if (std::sscanf(text.c_str(), "%d:%d:%lf%c", &h, &m, &s, &trailing) != 3)
    return std::nullopt;
  if (h < 0 || m < 0 || m >= 60 || s < 0)
    return std::nullopt;
  double ms = (h * 3600.0 + m * 60.0 + s) * 1000.0;
  return static_cast<int64_t>(ms + 0.5);
}

/**
 * @brief Split complete lines out of a buffer.
 * @note '\r' counts as a line end too. Empty lines are skipped. With
 *       flush set, a trailing partial line is emitted as well.
 */
void drain_lines(std::string &buffer, bool flush,
                 const std::function<void(const std::string &)> &on_line) {
  size_t start = 0;
  while (true) {
    size_t end = buffer.find_first_of("\r\n", start);
    if (end == std::string::npos)
      break;
    if (end > start)
      on_line(buffer.substr(start, end - start));
    start = end + 1;
  }
  buffer.erase(0, start);

  if (flush && !buffer.empty()) {
    on_line(buffer);
    buffer.clear();
  }
}

int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // anonymous namespace

// **---- Telemetry Parsing ----**

std::optional<int64_t> parse_progress_line(const std::string &line) {
  std::string text = trim(line);
  size_t eq = text.find('=');
  if (eq == std::string::npos)
    return std::nullopt;

  std::string key = text.substr(0, eq);
  std::string value = text.substr(eq + 1);

  if (key == "out_time_us" || key == "out_time_ms") {
    /// Both keys carry microseconds
    int64_t us = 0;
    if (!parse_int64(value, us) || us < 0)
      return std::nullopt;
    return us / 1000;
  }

  if (key == "out_time") {
    if (value.empty() || value[0] == '-')
      return std::nullopt;
    return parse_clock(value);
  }

  return std::nullopt;
}

std::vector<std::string> build_ffmpeg_argv(const std::string &binary,
                                           const EncodePlan &plan) {
  std::vector<std::string> argv = {binary,     "-nostdin", "-loglevel",
                                   "error",    "-progress", "pipe:1",
                                   "-nostats"};
  argv.insert(argv.end(), plan.args.begin(), plan.args.end());
  return argv;
}

// **---- FfmpegEngine ----**

FfmpegEngine::FfmpegEngine(std::string binary) : binary_(std::move(binary)) {
  /// Keep libavformat quiet during probes; failures are logged by us
  av_log_set_level(AV_LOG_ERROR);
}

FfmpegEngine::~FfmpegEngine() {
  std::map<ProcessHandle, std::unique_ptr<Process>> live;
  std::vector<std::unique_ptr<Process>> parked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    live.swap(processes_);
    parked.swap(parked_);
  }

  if (!live.empty()) {
    LOG_WARN("Stopping {} unreleased ffmpeg process(es)", live.size());
  }
  for (auto &entry : live) {
    entry.second->detach_listener();
    entry.second->signal(SIGKILL);
  }

  /// Process destructors join the reader threads
  live.clear();
  parked.clear();
}

bool FfmpegEngine::available() const { return !find_executable(binary_).empty(); }

size_t FfmpegEngine::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return processes_.size();
}

bool FfmpegEngine::probe(const std::string &input_path, MediaMetadata &meta) {
  TIMER_START(probe_input);

  MediaProbe media;
  if (!media.open(input_path))
    return false;

  double duration = media.get_duration();
  meta.duration = (duration > 0) ? fmt::format("{:.6f}", duration) : "";
  meta.format_name = media.get_format_name();
  meta.video_streams = media.count_streams(AVMEDIA_TYPE_VIDEO);
  meta.audio_streams = media.count_streams(AVMEDIA_TYPE_AUDIO);

  TIMER_END(probe_input);

  LOG_INFO("Probed {}: {} ({} video, {} audio), duration {}", input_path,
           meta.format_name, meta.video_streams, meta.audio_streams,
           format_time(duration));
  return true;
}

ProcessHandle FfmpegEngine::execute(const EncodePlan &plan,
                                    EngineListener &listener) {
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("Failed to create telemetry pipe: {}", std::strerror(errno));
    return kInvalidProcess;
  }
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("Failed to create log pipe: {}", std::strerror(errno));
    close(out_pipe[0]);
    close(out_pipe[1]);
    return kInvalidProcess;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  /// dup2 clears O_CLOEXEC on the child's copies
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  std::vector<std::string> args = build_ffmpeg_argv(binary_, plan);
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  /// Own process group: terminal Ctrl-C reaches us, not ffmpeg
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, binary_.c_str(), &actions, &attr, argv.data(),
                        environ);
  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);

  /// Parent keeps only the read ends
  close(out_pipe[1]);
  close(err_pipe[1]);

  if (rc != 0) {
    LOG_ERROR("Failed to spawn {}: {}", binary_, std::strerror(rc));
    close(out_pipe[0]);
    close(err_pipe[0]);
    return kInvalidProcess;
  }

  auto proc = std::make_unique<Process>();
  proc->pid = pid;
  proc->out_fd = out_pipe[0];
  proc->err_fd = err_pipe[0];
  proc->listener = &listener;
  proc->reader = std::thread(&FfmpegEngine::reader_loop, std::ref(*proc));

  std::lock_guard<std::mutex> lock(mutex_);
  reap_parked_locked();
  ProcessHandle handle = next_handle_++;
  processes_.emplace(handle, std::move(proc));

  LOG_INFO("Started {} (pid {}, handle {})", binary_, pid, handle);
  return handle;
}

void FfmpegEngine::terminate(ProcessHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = processes_.find(handle);
  if (it == processes_.end())
    return;
  if (it->second->signal(SIGTERM)) {
    LOG_INFO("Sent SIGTERM to pid {}", it->second->pid);
  }
}

void FfmpegEngine::release(ProcessHandle handle) {
  std::unique_ptr<Process> proc;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(handle);
    if (it == processes_.end())
      return;
    proc = std::move(it->second);
    processes_.erase(it);
  }

  proc->detach_listener();

  if (proc->finished.load()) {
    proc.reset();
    return;
  }

  /// Still running: force it down and reap it later
  if (proc->signal(SIGKILL)) {
    LOG_WARN("Sent SIGKILL to unresponsive pid {}", proc->pid);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  parked_.push_back(std::move(proc));
  reap_parked_locked();
}

void FfmpegEngine::reap_parked_locked() {
  for (auto it = parked_.begin(); it != parked_.end();) {
    if ((*it)->finished.load()) {
      it = parked_.erase(it);
    } else {
      ++it;
    }
  }
}

// **---- Reader Thread ----**

void FfmpegEngine::reader_loop(Process &proc) {
  std::string out_buffer;
  std::string err_buffer;
  char chunk[4096];

  auto on_telemetry = [&proc](const std::string &line) {
    if (auto elapsed_ms = parse_progress_line(line)) {
      proc.notify([&](EngineListener &l) { l.on_progress_sample(*elapsed_ms); });
    }
  };
  auto on_log = [&proc](const std::string &line) {
    proc.notify([&](EngineListener &l) { l.on_log_line(line); });
  };

  pollfd fds[2] = {{proc.out_fd, POLLIN, 0}, {proc.err_fd, POLLIN, 0}};
  int open_fds = 2;

  while (open_fds > 0) {
    int ready = poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("poll failed for pid {}: {}", proc.pid, std::strerror(errno));
      break;
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;

      std::string &buffer = (i == 0) ? out_buffer : err_buffer;
      ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
      if (n > 0) {
        buffer.append(chunk, static_cast<size_t>(n));
        drain_lines(buffer, false, i == 0 ? on_telemetry : on_log);
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        drain_lines(buffer, true, i == 0 ? on_telemetry : on_log);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }

  /// Wait without reaping, mark exited, then reap
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  while (waitid(P_PID, static_cast<id_t>(proc.pid), &info, WEXITED | WNOWAIT) ==
             -1 &&
         errno == EINTR) {
  }
  {
    std::lock_guard<std::mutex> lock(proc.state_mutex);
    proc.exited = true;
  }

  int status = 0;
  int exit_code = -1;
  pid_t waited;
  do {
    waited = waitpid(proc.pid, &status, 0);
  } while (waited == -1 && errno == EINTR);

  if (waited == proc.pid) {
    exit_code = decode_wait_status(status);
  } else {
    LOG_ERROR("waitpid failed for pid {}: {}", proc.pid, std::strerror(errno));
  }

  proc.notify([exit_code](EngineListener &l) { l.on_exit(exit_code); });
  proc.finished.store(true);
}

} // namespace media_convert
