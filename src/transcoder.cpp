/**
 * @file transcoder.cpp
 * @brief HLS ladder encoding, manifest generation and upload
 */

#include "vod_ingest/transcoder.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace vod_ingest {

namespace fs = std::filesystem;

// **---- Ladder ----**

std::string RenditionDescriptor::resolution() const {
  return fmt::format("{}x{}", width, height);
}

const std::vector<RenditionDescriptor> &default_ladder() {
  static const std::vector<RenditionDescriptor> ladder = {
      {"1080p", 1920, 1080, 5000, 128, 5350, 7500},
      {"720p", 1280, 720, 2500, 128, 2675, 3750},
      {"480p", 854, 480, 1000, 96, 1070, 1500},
  };
  return ladder;
}

std::string MasterManifest::serialize() const {
  std::string out = "#EXTM3U\n#EXT-X-VERSION:3\n";
  for (const auto &e : entries) {
    out += fmt::format("#EXT-X-STREAM-INF:BANDWIDTH={},RESOLUTION={}\n{}\n",
                       e.bandwidth, e.resolution, e.playlist);
  }
  return out;
}

// **---- Command Construction ----**

std::vector<std::string> build_rendition_command(const std::string &ffmpeg_bin,
                                                 const std::string &input_path,
                                                 const std::string &output_dir,
                                                 const RenditionDescriptor &r,
                                                 int segment_sec) {
  std::string filter = fmt::format(
      "scale={w}:{h}:force_original_aspect_ratio=decrease,"
      "pad={w}:{h}:(ow-iw)/2:(oh-ih)/2",
      fmt::arg("w", r.width), fmt::arg("h", r.height));

  fs::path dir(output_dir);
  return {ffmpeg_bin,
          "-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-i",
          input_path,
          "-vf",
          filter,
          "-c:v",
          "h264",
          "-preset",
          "fast",
          "-b:v",
          fmt::format("{}k", r.video_kbps),
          "-maxrate",
          fmt::format("{}k", r.maxrate_kbps),
          "-bufsize",
          fmt::format("{}k", r.bufsize_kbps),
          "-c:a",
          "aac",
          "-b:a",
          fmt::format("{}k", r.audio_kbps),
          "-f",
          "hls",
          "-hls_time",
          std::to_string(segment_sec),
          "-hls_list_size",
          "0",
          "-hls_segment_filename",
          (dir / (r.name + "_%03d.ts")).string(),
          (dir / r.playlist_name()).string()};
}

double rendition_timeout(const TranscodeOptions &options, double duration) {
  return std::max(options.min_timeout_sec, duration * options.timeout_factor);
}

// **---- Transcoder ----**

namespace {

/**
 * @class ScopedDirectory
 * @brief Removes a directory tree when the scope ends.
 */
class ScopedDirectory {
public:
  explicit ScopedDirectory(std::string path) : path_(std::move(path)) {}
  ~ScopedDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
      LOG_WARN("Failed to remove {}: {}", path_, ec.message());
  }

  ScopedDirectory(const ScopedDirectory &) = delete;
  ScopedDirectory &operator=(const ScopedDirectory &) = delete;

private:
  std::string path_;
};

/// `name_NNN.ts` produced for a rendition
bool is_segment_of(const std::string &filename, const std::string &name) {
  const std::string prefix = name + "_";
  return filename.size() > prefix.size() + 3 &&
         filename.compare(0, prefix.size(), prefix) == 0 &&
         filename.compare(filename.size() - 3, 3, ".ts") == 0;
}

} // anonymous namespace

Transcoder::Transcoder(BlobStore &blobs, ProcessRunner &runner,
                       TranscodeOptions options)
    : blobs_(blobs), runner_(runner), options_(std::move(options)) {}

std::string Transcoder::output_dir(const std::string &video_id) const {
  return (fs::path(options_.work_dir) / "hls" / video_id).string();
}

ErrorCode Transcoder::upload_rendition(const std::string &dir,
                                       const RenditionDescriptor &r,
                                       const std::string &video_id,
                                       const std::string &org_id) {
  std::vector<std::string> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string fname = it->path().filename().string();
    if (fname == r.playlist_name() || is_segment_of(fname, r.name))
      files.push_back(fname);
  }
  if (ec) {
    LOG_ERROR("[Video {}] Cannot list {}: {}", video_id, dir, ec.message());
    return ErrorCode::StorageError;
  }
  std::sort(files.begin(), files.end());

  for (const auto &fname : files) {
    std::string key = hls_key(org_id, video_id, fname);
    if (blobs_.put_file(key, (fs::path(dir) / fname).string()) !=
        BlobStatus::Ok) {
      LOG_ERROR("[Video {}] Failed to upload {}", video_id, key);
      return ErrorCode::StorageError;
    }
  }
  LOG_INFO("[Video {}] Uploaded rendition {} ({} files)", video_id, r.name,
           files.size());
  return ErrorCode::Ok;
}

ErrorCode Transcoder::transcode(const std::string &local_path,
                                const std::string &video_id,
                                const std::string &org_id, double duration,
                                const std::vector<int> &cpu_set,
                                MasterManifest &manifest,
                                StageTimings *timings) {
  const std::string dir = output_dir(video_id);

  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("[Video {}] Cannot create {}: {}", video_id, dir, ec.message());
    return ErrorCode::StorageError;
  }
  ScopedDirectory cleanup(dir);

  const double timeout = rendition_timeout(options_, duration);

  // **---- Encode each rendition ----**

  std::vector<const RenditionDescriptor *> succeeded;
  for (const auto &r : options_.ladder) {
    auto argv = build_rendition_command(options_.ffmpeg_bin, local_path, dir,
                                        r, options_.segment_sec);
    LOG_INFO("[Video {}] Encoding {} (timeout {:.0f}s)", video_id, r.name,
             timeout);

    ProcessResult pr;
    {
      auto start = std::chrono::steady_clock::now();
      pr = runner_.run(argv, timeout, false, cpu_set);
      if (timings) {
        timings->record(
            "transcode " + r.name,
            static_cast<long>(
                std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count()));
      }
    }

    if (!pr.ok()) {
      LOG_WARN("[Video {}] Rendition {} failed ({})", video_id, r.name,
               !pr.launched    ? "launch failure"
               : pr.timed_out ? "timeout"
                              : fmt::format("exit {}", pr.exit_code));
      continue;
    }
    if (!fs::exists(fs::path(dir) / r.playlist_name(), ec)) {
      LOG_WARN("[Video {}] Rendition {} produced no playlist", video_id,
               r.name);
      continue;
    }
    succeeded.push_back(&r);
  }

  if (succeeded.empty()) {
    LOG_ERROR("[Video {}] All {} renditions failed", video_id,
              options_.ladder.size());
    return ErrorCode::TranscodeFailed;
  }

  // **---- Upload renditions, then the master ----**

  MasterManifest master;
  for (const auto *r : succeeded) {
    ErrorCode rc = upload_rendition(dir, *r, video_id, org_id);
    if (rc != ErrorCode::Ok)
      return rc;
    master.entries.push_back({r->playlist_name(), r->bandwidth(),
                              r->resolution()});
  }

  std::string master_key = hls_key(org_id, video_id, "master.m3u8");
  if (blobs_.put(master_key, master.serialize()) != BlobStatus::Ok) {
    LOG_ERROR("[Video {}] Failed to upload {}", video_id, master_key);
    return ErrorCode::StorageError;
  }

  LOG_SUCCESS("[Video {}] HLS ready: {}/{} renditions", video_id,
              master.entries.size(), options_.ladder.size());
  manifest = std::move(master);
  return ErrorCode::Ok;
}

} // namespace vod_ingest
