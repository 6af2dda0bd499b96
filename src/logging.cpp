/**
 * @file logging.cpp
 * @brief Logging and stage timing implementation
 */

#include "vod_ingest/logging.hpp"

namespace vod_ingest {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- StageTimings -----**

void StageTimings::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({name, us});
}

std::vector<StageTiming> StageTimings::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

void StageTimings::log_summary() const {
  std::vector<StageTiming> snapshot = entries();
  if (snapshot.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(fg(fmt::color::cyan), "========== TIMINGS {} ==========\n",
             label_);
  for (const auto &e : snapshot) {
    fmt::print("{:<30} {:>12} [{:.2f}s]\n", e.name, e.microseconds,
               e.microseconds / 1000000.0);
  }
  std::fflush(stdout);
}

} // namespace vod_ingest
