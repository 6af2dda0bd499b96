/**
 * @file job_queue.cpp
 * @brief Pipeline job queue implementation
 */

#include "vod_ingest/job_queue.hpp"

namespace vod_ingest {

bool JobQueue::push(PipelineJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(PipelineJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty())
    return false;

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace vod_ingest
