/**
 * @file process_runner.hpp
 * @brief External tool execution (ffmpeg, ffprobe)
 *
 * @details Tools are launched with an argument vector, never through a
 *          shell, so filenames need no quoting. Each run has a timeout;
 *          an expired process is killed and reported as timed out.
 *
 *          When a CPU set is given, the command is prefixed with
 *          `taskset -c <cpus>` so the encoder stays on the worker's cores.
 */

#ifndef VOD_INGEST_PROCESS_RUNNER_HPP
#define VOD_INGEST_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace vod_ingest {

/**
 * @struct ProcessResult
 * @brief Outcome of one external process run.
 */
struct ProcessResult {
  bool launched = false;  //< false if the binary could not be started
  bool timed_out = false; //< Killed after the timeout expired
  int exit_code = -1;     //< Exit status when the process exited normally
  std::string output;     //< Captured stdout (if requested)

  bool ok() const { return launched && !timed_out && exit_code == 0; }
};

/**
 * @class ProcessRunner
 * @brief Runs an argument vector to completion.
 */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * @param argv Program and arguments; argv[0] is looked up on PATH
   * @param timeout_sec Kill after this many seconds (<= 0 = no limit)
   * @param capture_stdout Collect stdout into ProcessResult::output
   * @param cpu_set Pin the process with taskset (empty = unpinned)
   */
  virtual ProcessResult run(const std::vector<std::string> &argv,
                            double timeout_sec, bool capture_stdout,
                            const std::vector<int> &cpu_set = {}) = 0;
};

/**
 * @class SubprocessRunner
 * @brief fork/execvp implementation.
 * @note stderr is discarded; stdout goes to /dev/null unless captured.
 */
class SubprocessRunner : public ProcessRunner {
public:
  ProcessResult run(const std::vector<std::string> &argv, double timeout_sec,
                    bool capture_stdout,
                    const std::vector<int> &cpu_set = {}) override;
};

/// argv with the taskset prefix applied (unchanged for an empty cpu_set)
std::vector<std::string> with_cpu_affinity(const std::vector<std::string> &argv,
                                           const std::vector<int> &cpu_set);

/// Space-joined command line for logging
std::string describe_command(const std::vector<std::string> &argv);

} // namespace vod_ingest

#endif // VOD_INGEST_PROCESS_RUNNER_HPP
