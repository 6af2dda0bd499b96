/**
 * @file video_lifecycle.hpp
 * @brief Upload completion and the post-upload pipeline
 *
 * @details complete_upload() hands a finished session to a bounded worker
 *          pool, which runs assemble -> probe -> transcode sequentially for
 *          that video and records the outcome:
 *
 *          uploaded --complete--> processing --ok--> processed
 *                                            \--error--> failed
 *
 *          Any error inside the pipeline, thrown or returned, ends in
 *          status failed with processing_error set. The local working copy
 *          is removed after every run.
 */

#ifndef VOD_INGEST_VIDEO_LIFECYCLE_HPP
#define VOD_INGEST_VIDEO_LIFECYCLE_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "chunk_assembler.hpp"
#include "media_probe.hpp"
#include "metadata_store.hpp"
#include "session_manager.hpp"
#include "transcoder.hpp"
#include "worker_pool.hpp"

namespace vod_ingest {

struct LifecycleOptions {
  int workers = 0; //< 0 = TRANSCODE_WORKERS / CPU based
  bool pin_workers = Config::pin_workers();
};

/**
 * @struct CompleteResult
 * @brief Answer to a completion request.
 */
struct CompleteResult {
  std::string video_id;
  VideoStatus status = VideoStatus::Processing;
};

class VideoLifecycle {
public:
  VideoLifecycle(MetadataStore &metadata, ChunkSessionManager &sessions,
                 ChunkAssembler &assembler, MediaProbe &probe,
                 Transcoder &transcoder,
                 LifecycleOptions options = LifecycleOptions());
  ~VideoLifecycle();

  VideoLifecycle(const VideoLifecycle &) = delete;
  VideoLifecycle &operator=(const VideoLifecycle &) = delete;

  /// Spawn the worker pool
  void start();

  /// Run queued jobs to completion, then join the workers
  void shutdown();

  /**
   * @brief Finish an upload and queue its pipeline.
   * @param missing Set to the number of absent chunks on MissingChunks
   * @return SessionNotFound, MissingChunks, or StorageError when the
   *         processing status cannot be stored, all with the status
   *         unchanged and the session kept; ServerError if the workers are
   *         not running
   */
  ErrorCode complete_upload(const std::string &session_id,
                            CompleteResult &result, int &missing);

  /// false on timeout
  bool wait_idle(std::chrono::milliseconds timeout);

  /// false if the video is unknown
  bool record(const std::string &video_id, VideoRecord &out);

  std::vector<VideoRecord> list_videos(const VideoQuery &query);

  int num_workers() const { return pool_.num_workers(); }

private:
  /// Worker entry point; never throws
  void run_pipeline(PipelineJob &job, const WorkerContext &ctx);

  /// assemble -> probe -> transcode; error describes a non-Ok result
  ErrorCode execute(const PipelineJob &job, const WorkerContext &ctx,
                    StageTimings &timings, std::string &error);

  void mark_failed(const std::string &video_id, const std::string &error);

  MetadataStore &metadata_;
  ChunkSessionManager &sessions_;
  ChunkAssembler &assembler_;
  MediaProbe &probe_;
  Transcoder &transcoder_;
  TranscodeWorkerPool pool_;

  std::mutex in_flight_mutex_;
  std::set<std::string> in_flight_; //< Videos with a queued or running job
};

/// Worker count: options.workers if set, else TRANSCODE_WORKERS / CPU based
int resolve_worker_count(const LifecycleOptions &options);

} // namespace vod_ingest

#endif // VOD_INGEST_VIDEO_LIFECYCLE_HPP
