/**
 * @file job_queue.hpp
 * @brief Thread-safe pipeline job queue (producer-consumer)
 *
 * @details Completion requests push jobs; transcode workers pop them in a
 *          loop until the queue is finished and drained.
 */

#ifndef VOD_INGEST_JOB_QUEUE_HPP
#define VOD_INGEST_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <utility>

#include "types.hpp"

namespace vod_ingest {

/**
 * @struct PipelineJob
 * @brief One assemble -> probe -> transcode run.
 */
struct PipelineJob {
  std::string video_id;  //< For logging
  UploadSession session; //< Released from the session manager
};

/**
 * @class JobQueue
 * @brief Blocking FIFO of pipeline jobs.
 *
 * @attention USAGE:
 *
 *   - Producers call push()
 *
 *   - Workers call pop() in a loop; false means shut down
 *
 *   - finish() wakes all workers; queued jobs are still handed out
 */
class JobQueue {
public:
  /// false if the queue was already finished (job dropped)
  bool push(PipelineJob job);

  /**
   * @brief Pop a job (blocking).
   * @return false once the queue is finished and empty
   */
  bool pop(PipelineJob &job);

  void finish();

  bool finished() const { return done_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<PipelineJob> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace vod_ingest

#endif // VOD_INGEST_JOB_QUEUE_HPP
