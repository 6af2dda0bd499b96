/**
 * @file system.hpp
 * @brief CPU discovery, worker sizing and thread affinity
 *
 * @note CPU discovery honors cgroup limits so container quotas are respected.
 *       Thread pinning is Linux-specific (pthread_setaffinity_np).
 */

#ifndef VOD_INGEST_SYSTEM_HPP
#define VOD_INGEST_SYSTEM_HPP

#include <string>
#include <vector>

namespace vod_ingest {

// **---- CPU Detection ----**

/**
 * @brief Number of CPUs this process may use.
 * @details Checks cgroup v2 `cpu.max`, then cgroup v1 CFS quota, then the
 *          effective cpuset, then hardware_concurrency(). Clamped to [1, 64].
 */
int detect_cpu_limit();

/// CPU ids from the effective cpuset, or 0..detect_cpu_limit()-1
std::vector<int> get_available_cpus();

/// Parse a cpuset list such as "0-3,8,10-11"; malformed parts are skipped
std::vector<int> parse_cpu_list(const std::string &text);

/**
 * @brief Number of transcode workers.
 * @param configured TRANSCODE_WORKERS value (0 = auto)
 * @param cpus Available CPU count
 * @return auto: max(1, cpus / 4); configured: clamped to [1, cpus]
 */
int calculate_transcode_workers(int configured, int cpus);

/**
 * @brief Split CPUs into one contiguous set per worker.
 * @note Sets are empty when there are fewer CPUs than workers.
 */
std::vector<std::vector<int>> partition_cpus(const std::vector<int> &cpus,
                                             int workers);

// **---- Thread Pinning ----**

/// Pin the calling thread to a set of CPUs; false on failure or empty set
bool pin_thread_to_cpus(const std::vector<int> &cpu_ids);

/// "0,1,2" for taskset -c
std::string format_cpu_list(const std::vector<int> &cpu_ids);

// **---- Utilities ----**

/// HH:MM:SS
std::string format_time(double seconds);

} // namespace vod_ingest

#endif // VOD_INGEST_SYSTEM_HPP
