/**
 * @file worker_pool.cpp
 * @brief Transcode worker threads
 */

#include "vod_ingest/worker_pool.hpp"

#include <algorithm>
#include <utility>

#include "vod_ingest/logging.hpp"
#include "vod_ingest/system.hpp"

namespace vod_ingest {

TranscodeWorkerPool::TranscodeWorkerPool(
    int num_workers, std::vector<std::vector<int>> cpu_sets)
    : num_workers_(std::max(1, num_workers)), cpu_sets_(std::move(cpu_sets)) {
  cpu_sets_.resize(static_cast<size_t>(num_workers_));
}

TranscodeWorkerPool::~TranscodeWorkerPool() { shutdown(); }

void TranscodeWorkerPool::start(Handler handler) {
  if (started_.load() || stopped_.load())
    return;
  handler_ = std::move(handler);

  threads_.reserve(static_cast<size_t>(num_workers_));
  for (int i = 0; i < num_workers_; ++i)
    threads_.emplace_back(&TranscodeWorkerPool::worker_loop, this, i);
  started_ = true;

  LOG_INFO("Started {} transcode worker(s)", num_workers_);
}

bool TranscodeWorkerPool::submit(PipelineJob job) {
  /// Nothing would ever pop the job
  if (!started_.load())
    return false;

  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    ++pending_;
  }
  if (queue_.push(std::move(job)))
    return true;

  std::lock_guard<std::mutex> lock(idle_mutex_);
  --pending_;
  idle_cv_.notify_all();
  return false;
}

void TranscodeWorkerPool::shutdown() {
  stopped_ = true;
  queue_.finish();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
}

bool TranscodeWorkerPool::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

size_t TranscodeWorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  return pending_;
}

void TranscodeWorkerPool::worker_loop(int worker_id) {
  WorkerContext ctx;
  ctx.worker_id = worker_id;
  ctx.cpu_set = cpu_sets_[static_cast<size_t>(worker_id)];

  if (!ctx.cpu_set.empty()) {
    if (pin_thread_to_cpus(ctx.cpu_set)) {
      LOG_INFO("[Worker {}] Pinned to CPUs [{}]", worker_id,
               format_cpu_list(ctx.cpu_set));
    } else {
      LOG_WARN("[Worker {}] Failed to pin to CPUs [{}]", worker_id,
               format_cpu_list(ctx.cpu_set));
    }
  }

  PipelineJob job;
  while (queue_.pop(job)) {
    handler_(job, ctx);

    std::lock_guard<std::mutex> lock(idle_mutex_);
    --pending_;
    if (pending_ == 0)
      idle_cv_.notify_all();
  }
}

} // namespace vod_ingest
