/**
 * @file video_lifecycle.cpp
 * @brief Pipeline orchestration and status transitions
 */

#include "vod_ingest/video_lifecycle.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "vod_ingest/id_generator.hpp"
#include "vod_ingest/logging.hpp"
#include "vod_ingest/system.hpp"

namespace vod_ingest {

namespace fs = std::filesystem;

int resolve_worker_count(const LifecycleOptions &options) {
  if (options.workers > 0)
    return options.workers;
  return calculate_transcode_workers(Config::transcode_workers(),
                                     detect_cpu_limit());
}

namespace {

std::vector<std::vector<int>> worker_cpu_sets(const LifecycleOptions &options) {
  if (!options.pin_workers)
    return {};
  return partition_cpus(get_available_cpus(), resolve_worker_count(options));
}

} // anonymous namespace

VideoLifecycle::VideoLifecycle(MetadataStore &metadata,
                               ChunkSessionManager &sessions,
                               ChunkAssembler &assembler, MediaProbe &probe,
                               Transcoder &transcoder,
                               LifecycleOptions options)
    : metadata_(metadata), sessions_(sessions), assembler_(assembler),
      probe_(probe), transcoder_(transcoder),
      pool_(resolve_worker_count(options), worker_cpu_sets(options)) {}

VideoLifecycle::~VideoLifecycle() { shutdown(); }

void VideoLifecycle::start() {
  pool_.start([this](PipelineJob &job, const WorkerContext &ctx) {
    run_pipeline(job, ctx);
  });
}

void VideoLifecycle::shutdown() { pool_.shutdown(); }

bool VideoLifecycle::wait_idle(std::chrono::milliseconds timeout) {
  return pool_.wait_idle(timeout);
}

bool VideoLifecycle::record(const std::string &video_id, VideoRecord &out) {
  return metadata_.get(video_id, out);
}

std::vector<VideoRecord> VideoLifecycle::list_videos(const VideoQuery &query) {
  return metadata_.list(query);
}

// **---- Completion ----**

ErrorCode VideoLifecycle::complete_upload(const std::string &session_id,
                                          CompleteResult &result,
                                          int &missing) {
  UploadSession session;
  if (!sessions_.snapshot(session_id, session))
    return ErrorCode::SessionNotFound;

  if (!pool_.running()) {
    LOG_WARN("[Video {}] Completion refused: workers not running",
             session.video_id);
    return ErrorCode::ServerError;
  }

  VideoRecord rec;
  if (!metadata_.get(session.video_id, rec)) {
    LOG_ERROR("[Video {}] No record for session {}", session.video_id,
              session_id);
    return ErrorCode::StorageError;
  }

  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    if (in_flight_.count(session.video_id))
      return ErrorCode::SessionNotFound;

    ErrorCode rc = sessions_.missing_chunks(session_id, missing);
    if (rc != ErrorCode::Ok)
      return rc;
    if (missing > 0) {
      LOG_WARN("[Video {}] Completion refused: {} chunk(s) missing",
               session.video_id, missing);
      return ErrorCode::MissingChunks;
    }

    /// The session stays open until the new status is stored
    const VideoRecord before = rec;
    rec.status = VideoStatus::Processing;
    rec.processing_error.clear();
    if (!metadata_.update(rec)) {
      LOG_ERROR("[Video {}] Failed to mark processing", rec.video_id);
      return ErrorCode::StorageError;
    }

    /// Removes the session, so a repeated completion cannot queue twice
    rc = sessions_.release_completed(session_id, session, missing);
    if (rc != ErrorCode::Ok) {
      if (!metadata_.update(before))
        LOG_ERROR("[Video {}] Failed to restore status", rec.video_id);
      return rc;
    }
    in_flight_.insert(session.video_id);
  }

  PipelineJob job;
  job.video_id = session.video_id;
  job.session = session;
  if (!pool_.submit(std::move(job))) {
    mark_failed(session.video_id, "service shutting down");
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(session.video_id);
    return ErrorCode::ServerError;
  }

  result.video_id = session.video_id;
  result.status = VideoStatus::Processing;
  LOG_INFO("[Video {}] Upload complete; queued for processing",
           session.video_id);
  return ErrorCode::Ok;
}

// **---- Pipeline ----**

void VideoLifecycle::run_pipeline(PipelineJob &job, const WorkerContext &ctx) {
  const std::string &id = job.video_id;
  StageTimings timings(fmt::format("Video {}", id));
  LOG_PHASE("[Worker {}] Processing video {}", ctx.worker_id, id);

  try {
    std::string error;
    ErrorCode rc = execute(job, ctx, timings, error);
    if (rc != ErrorCode::Ok)
      mark_failed(id, error);
  } catch (const std::exception &e) {
    mark_failed(id, fmt::format("unexpected error: {}", e.what()));
  } catch (...) {
    mark_failed(id, "unexpected non-standard exception");
  }

  std::error_code ec;
  fs::remove_all(assembler_.local_dir(id), ec);
  if (ec)
    LOG_WARN("[Video {}] Failed to remove work dir: {}", id, ec.message());

  timings.log_summary();

  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_.erase(id);
}

ErrorCode VideoLifecycle::execute(const PipelineJob &job,
                                  const WorkerContext &ctx,
                                  StageTimings &timings, std::string &error) {
  const std::string &id = job.video_id;
  VideoRecord rec;
  if (!metadata_.get(id, rec)) {
    error = "video record disappeared";
    return ErrorCode::StorageError;
  }

  // **---- Assemble ----**

  AssembledVideo assembled;
  {
    ScopedStage stage(timings, "assemble");
    ErrorCode rc = assembler_.assemble(job.session, assembled);
    if (rc != ErrorCode::Ok) {
      error = fmt::format("assembly failed: {}", to_string(rc));
      return rc;
    }
  }

  rec.size_bytes = static_cast<int64_t>(assembled.size_bytes);
  rec.storage_type = assembled.storage_type;
  rec.chunk_count = assembled.chunk_count;
  if (assembled.storage_type == StorageType::Chunked)
    rec.storage_path = fmt::format("{}/{}/chunks", rec.org_id, id);
  if (!metadata_.update(rec)) {
    error = "failed to record storage layout";
    return ErrorCode::StorageError;
  }

  // **---- Probe ----**

  ProbeResult info;
  {
    ScopedStage stage(timings, "probe");
    info = probe_.probe(assembled.local_path, rec.size_bytes);
  }
  rec.duration = info.duration;
  rec.fps = info.fps;
  rec.resolution = info.resolution;
  rec.codec = info.codec;
  rec.bitrate = info.bitrate;
  LOG_INFO("[Video {}] {} {} @ {:.2f} fps, {:.1f}s{}", id, info.codec,
           info.resolution, info.fps, info.duration,
           info.fallback ? " (fallback)" : "");

  // **---- Transcode ----**

  MasterManifest manifest;
  ErrorCode rc =
      transcoder_.transcode(assembled.local_path, id, rec.org_id, info.duration,
                            ctx.cpu_set, manifest, &timings);
  if (rc != ErrorCode::Ok) {
    error = fmt::format("transcoding failed: {}", to_string(rc));
    if (!metadata_.update(rec))
      LOG_WARN("[Video {}] Failed to record probe metadata", id);
    return rc;
  }

  rec.status = VideoStatus::Processed;
  rec.hls_manifest_path = hls_key(rec.org_id, id, "master.m3u8");
  rec.processing_error.clear();
  rec.processed_at = now_epoch_seconds();
  if (!metadata_.update(rec)) {
    error = "failed to record processed status";
    return ErrorCode::StorageError;
  }

  LOG_SUCCESS("[Video {}] Processed: {} rendition(s)", id,
              manifest.entries.size());
  return ErrorCode::Ok;
}

void VideoLifecycle::mark_failed(const std::string &video_id,
                                 const std::string &error) {
  LOG_ERROR("[Video {}] Processing failed: {}", video_id, error);
  VideoRecord rec;
  if (!metadata_.get(video_id, rec)) {
    LOG_ERROR("[Video {}] Cannot mark failed: record missing", video_id);
    return;
  }
  rec.status = VideoStatus::Failed;
  rec.processing_error = error;
  if (!metadata_.update(rec))
    LOG_ERROR("[Video {}] Failed to persist failed status", video_id);
}

} // namespace vod_ingest
