/**
 * @file system.cpp
 * @brief CPU discovery and thread affinity
 */

#include "vod_ingest/system.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

#include <pthread.h>
#include <sched.h>

#include <fmt/core.h>

namespace vod_ingest {

namespace {

constexpr int MAX_CPUS = 64;

/// Parse a non-negative integer; -1 if text is not one
long to_long(const std::string &text) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(),
                   [](char c) { return c >= '0' && c <= '9'; }))
    return -1;
  try {
    return std::stol(text);
  } catch (const std::exception &) {
    return -1;
  }
}

std::string read_first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

std::vector<int> read_cpuset() {
  auto cpus = parse_cpu_list(read_first_line("/sys/fs/cgroup/cpuset.cpus.effective"));
  if (cpus.empty())
    cpus = parse_cpu_list(read_first_line("/sys/fs/cgroup/cpuset/cpuset.cpus"));
  return cpus;
}

/// ceil(quota / period), or -1 when unlimited or unreadable
int quota_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

} // anonymous namespace

// **---- CPU Detection ----**

std::vector<int> parse_cpu_list(const std::string &text) {
  std::vector<int> cpus;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string::npos)
      comma = text.size();
    std::string part = text.substr(pos, comma - pos);
    pos = comma + 1;

    size_t dash = part.find('-');
    if (dash == std::string::npos) {
      long cpu = to_long(part);
      if (cpu >= 0)
        cpus.push_back(static_cast<int>(cpu));
      continue;
    }
    long first = to_long(part.substr(0, dash));
    long last = to_long(part.substr(dash + 1));
    if (first < 0 || last < first)
      continue;
    for (long cpu = first; cpu <= last; ++cpu)
      cpus.push_back(static_cast<int>(cpu));
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = -1;

  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    std::string quota, period;
    if (f >> quota >> period)
      limit = quota_cpus(to_long(quota), to_long(period));
  }

  if (limit <= 0) {
    limit = quota_cpus(
        to_long(read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_quota_us")),
        to_long(read_first_line("/sys/fs/cgroup/cpu/cpu.cfs_period_us")));
  }

  if (limit <= 0)
    limit = static_cast<int>(read_cpuset().size());

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  return std::clamp(limit, 1, MAX_CPUS);
}

std::vector<int> get_available_cpus() {
  auto cpus = read_cpuset();
  if (cpus.empty()) {
    int limit = detect_cpu_limit();
    for (int i = 0; i < limit; ++i)
      cpus.push_back(i);
  }
  return cpus;
}

int calculate_transcode_workers(int configured, int cpus) {
  cpus = std::max(1, cpus);
  if (configured <= 0)
    return std::max(1, cpus / 4);
  return std::min(configured, cpus);
}

std::vector<std::vector<int>> partition_cpus(const std::vector<int> &cpus,
                                             int workers) {
  std::vector<std::vector<int>> sets(static_cast<size_t>(std::max(0, workers)));
  if (workers <= 0 || static_cast<int>(cpus.size()) < workers)
    return sets;

  size_t per_worker = cpus.size() / static_cast<size_t>(workers);
  for (int w = 0; w < workers; ++w) {
    auto first = cpus.begin() + static_cast<long>(w * per_worker);
    sets[w].assign(first, first + static_cast<long>(per_worker));
  }
  return sets;
}

// **---- Thread Pinning ----**

bool pin_thread_to_cpus(const std::vector<int> &cpu_ids) {
  if (cpu_ids.empty())
    return false;

  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  for (int cpu : cpu_ids)
    CPU_SET(cpu, &cpuset);

  return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) ==
         0;
}

std::string format_cpu_list(const std::vector<int> &cpu_ids) {
  std::string out;
  for (size_t i = 0; i < cpu_ids.size(); ++i) {
    if (i > 0)
      out += ',';
    out += std::to_string(cpu_ids[i]);
  }
  return out;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  long total = static_cast<long>(seconds);
  return fmt::format("{:02d}:{:02d}:{:02d}", total / 3600, (total % 3600) / 60,
                     total % 60);
}

} // namespace vod_ingest
