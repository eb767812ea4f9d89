/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector per-phase totals and summary table
 */

#include "media_convert/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_convert {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  TimingEntry &entry = entries[name];
  entry.total_us += us;
  entry.max_us = std::max<long long>(entry.max_us, us);
  ++entry.count;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================= TIMING SUMMARY =======================\n");
  fmt::print("{:<20} {:>6} {:>16} {:>16}\n", "Phase", "Runs", "Total [sec]",
             "Max [sec]");
  fmt::print("{:-<20} {:-<6} {:-<16} {:-<16}\n", "", "", "", "");

  for (const auto &[name, e] : entries) {
    fmt::print("{:<20} {:>6} {:>15.3f}s {:>15.3f}s\n", name, e.count,
               e.total_us / 1000000.0, e.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "==============================================================\n");
  std::fflush(stdout);
}

TimingEntry TimingCollector::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = entries.find(name);
  return it == entries.end() ? TimingEntry{} : it->second;
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

} // namespace media_convert
