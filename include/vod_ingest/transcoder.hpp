/**
 * @file transcoder.hpp
 * @brief HLS adaptive-bitrate transcoding
 *
 * @details For each rendition of the ladder, one encoder process writes a
 *          media playlist and its segments into a per-video scratch
 *          directory. Successful renditions are uploaded under
 *          `{org}/{video}/hls/` together with a master manifest listing them.
 *
 * @attention FAILURE MODEL:
 *
 * - A rendition fails on launch failure, non-zero exit, timeout, or when
 *   its playlist was not produced; it is skipped
 *
 * - Zero successful renditions fail the transcode and upload nothing
 *
 * - The scratch directory is removed on every exit path
 */

#ifndef VOD_INGEST_TRANSCODER_HPP
#define VOD_INGEST_TRANSCODER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace vod_ingest {

/**
 * @struct RenditionDescriptor
 * @brief One ladder step. Bitrates in kbit/s.
 */
struct RenditionDescriptor {
  std::string name; //< "1080p"; also the playlist/segment file prefix
  int width;
  int height;
  int video_kbps;
  int audio_kbps;
  int maxrate_kbps;
  int bufsize_kbps;

  /// Advertised BANDWIDTH in bits/s
  int64_t bandwidth() const {
    return static_cast<int64_t>(video_kbps + audio_kbps) * 1000;
  }
  std::string resolution() const;
  std::string playlist_name() const { return name + ".m3u8"; }
};

/// 1080p, 720p, 480p
const std::vector<RenditionDescriptor> &default_ladder();

struct MasterManifestEntry {
  std::string playlist; //< Relative URI, e.g. "720p.m3u8"
  int64_t bandwidth;
  std::string resolution;
};

/**
 * @struct MasterManifest
 * @brief Top-level playlist; entries are in attempt order.
 */
struct MasterManifest {
  std::vector<MasterManifestEntry> entries;

  /// `#EXTM3U`, `#EXT-X-VERSION:3`, then one STREAM-INF + URI per entry
  std::string serialize() const;
};

struct TranscodeOptions {
  std::string ffmpeg_bin = Config::ffmpeg_bin();
  std::string work_dir = Config::work_dir();
  int segment_sec = Config::hls_segment_sec();
  double timeout_factor = Config::transcode_timeout_factor();
  double min_timeout_sec = Config::transcode_min_timeout_sec();
  std::vector<RenditionDescriptor> ladder = default_ladder();
};

/// Encoder argument vector for one rendition
std::vector<std::string> build_rendition_command(const std::string &ffmpeg_bin,
                                                 const std::string &input_path,
                                                 const std::string &output_dir,
                                                 const RenditionDescriptor &r,
                                                 int segment_sec);

/// max(min_timeout_sec, duration * timeout_factor)
double rendition_timeout(const TranscodeOptions &options, double duration);

class Transcoder {
public:
  Transcoder(BlobStore &blobs, ProcessRunner &runner,
             TranscodeOptions options = TranscodeOptions());

  /**
   * @brief Produce and upload the HLS ladder for one video.
   *
   * @param duration Probed duration in seconds (0 when unknown)
   * @param cpu_set Encoder CPU pinning (empty = unpinned)
   * @param manifest Output: entries of the uploaded master manifest
   * @param timings Optional per-rendition stage timings
   * @return TranscodeFailed when every rendition failed, StorageError when
   *         the scratch directory or an upload failed
   */
  ErrorCode transcode(const std::string &local_path,
                      const std::string &video_id, const std::string &org_id,
                      double duration, const std::vector<int> &cpu_set,
                      MasterManifest &manifest,
                      StageTimings *timings = nullptr);

  /// Scratch directory for a video's HLS output
  std::string output_dir(const std::string &video_id) const;

private:
  /// Upload the playlist and segments of one rendition
  ErrorCode upload_rendition(const std::string &dir,
                             const RenditionDescriptor &r,
                             const std::string &video_id,
                             const std::string &org_id);

  BlobStore &blobs_;
  ProcessRunner &runner_;
  TranscodeOptions options_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_TRANSCODER_HPP
