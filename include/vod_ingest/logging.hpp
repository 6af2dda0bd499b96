/**
 * @file logging.hpp
 * @brief Logging macros and per-run stage timing
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - StageTimings: per-pipeline collector of stage durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so they interleave cleanly between worker threads.
 */

#ifndef VOD_INGEST_LOGGING_HPP
#define VOD_INGEST_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vod_ingest {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_ingest::log_mutex);                   \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_ingest::log_mutex);                   \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_ingest::log_mutex);                   \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_ingest::log_mutex);                   \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_ingest::log_mutex);                   \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- STAGE TIMING -----**

/**
 * @struct StageTiming
 * @brief A single stage measurement.
 */
struct StageTiming {
  std::string name;  //< Stage name ("assemble", "transcode 720p", ...)
  long microseconds; //< Duration in microseconds
};

/**
 * @class StageTimings
 * @brief Collects stage durations for one pipeline run.
 * @note One instance per video, so concurrent pipelines never mix entries.
 *       Thread-safe anyway; renditions may report from helper threads.
 */
class StageTimings {
public:
  explicit StageTimings(std::string label) : label_(std::move(label)) {}

  void record(const std::string &name, long us);

  /// Log all entries as a table under the run label
  void log_summary() const;

  std::vector<StageTiming> entries() const;

private:
  std::string label_;
  mutable std::mutex mutex_;
  std::vector<StageTiming> entries_;
};

/**
 * @class ScopedStage
 * @brief Records the lifetime of a scope into a StageTimings.
 */
class ScopedStage {
public:
  ScopedStage(StageTimings &timings, std::string name)
      : timings_(timings), name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopedStage() {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - start_)
                  .count();
    timings_.record(name_, static_cast<long>(us));
  }

  ScopedStage(const ScopedStage &) = delete;
  ScopedStage &operator=(const ScopedStage &) = delete;

private:
  StageTimings &timings_;
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_LOGGING_HPP
