/**
 * @file worker_pool.hpp
 * @brief Bounded pool of transcode workers
 *
 * @details A fixed number of worker threads pop PipelineJobs from a
 *          JobQueue and hand them to a handler. The pool bounds how many
 *          encoders run at once.
 *
 * @attention CPU ALLOCATION (when pinning is enabled):
 *
 *   Available CPUs are split into equal contiguous sets, one per worker.
 *   The worker thread is pinned to its set and the set is passed to the
 *   handler so the encoder can be pinned with taskset. Example with 8 CPUs
 *   and 2 workers: worker 0 -> [0-3], worker 1 -> [4-7].
 */

#ifndef VOD_INGEST_WORKER_POOL_HPP
#define VOD_INGEST_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "job_queue.hpp"

namespace vod_ingest {

/**
 * @struct WorkerContext
 * @brief Identity and CPU set of the worker running a job.
 */
struct WorkerContext {
  int worker_id = 0;
  std::vector<int> cpu_set; //< Empty when unpinned
};

class TranscodeWorkerPool {
public:
  using Handler = std::function<void(PipelineJob &, const WorkerContext &)>;

  /**
   * @param num_workers Number of threads (clamped to at least 1)
   * @param cpu_sets Per-worker CPU sets; empty = no pinning
   */
  TranscodeWorkerPool(int num_workers,
                      std::vector<std::vector<int>> cpu_sets = {});
  ~TranscodeWorkerPool();

  TranscodeWorkerPool(const TranscodeWorkerPool &) = delete;
  TranscodeWorkerPool &operator=(const TranscodeWorkerPool &) = delete;

  /// Spawn the workers; a second call is ignored
  void start(Handler handler);

  /// false before start() and after shutdown(); the job is not queued
  bool submit(PipelineJob job);

  /// Started and not yet shut down
  bool running() const { return started_.load() && !stopped_.load(); }

  /// Finish the queue, let workers drain it and join them
  void shutdown();

  /**
   * @brief Block until no job is queued or running.
   * @return false on timeout
   */
  bool wait_idle(std::chrono::milliseconds timeout);

  int num_workers() const { return num_workers_; }

  /// Jobs queued or running
  size_t pending() const;

private:
  void worker_loop(int worker_id);

  int num_workers_;
  std::vector<std::vector<int>> cpu_sets_;
  Handler handler_;
  JobQueue queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  mutable std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  size_t pending_{0};
};

} // namespace vod_ingest

#endif // VOD_INGEST_WORKER_POOL_HPP
