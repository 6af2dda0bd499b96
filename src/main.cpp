/**
 * @file main.cpp
 * @brief Entry point for the vod_ingest command-line tool
 *
 * @details Drives the full ingest path against the filesystem blob store:
 *
 *          - Single file mode: upload one video in chunks and process it
 *
 *          - Batch directory mode: upload every video in the directory;
 *            the worker pool processes them concurrently
 *
 *          Each file is split into UPLOAD_CHUNK_MB chunks, uploaded through
 *          ChunkSessionManager, completed, and processed into HLS. A summary
 *          of the resulting records is printed as JSON at the end.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "vod_ingest/backend_registry.hpp"
#include "vod_ingest/chunk_assembler.hpp"
#include "vod_ingest/config.hpp"
#include "vod_ingest/logging.hpp"
#include "vod_ingest/media_probe.hpp"
#include "vod_ingest/process_runner.hpp"
#include "vod_ingest/session_manager.hpp"
#include "vod_ingest/streaming_proxy.hpp"
#include "vod_ingest/system.hpp"
#include "vod_ingest/transcoder.hpp"
#include "vod_ingest/video_lifecycle.hpp"

using namespace vod_ingest;
namespace fs = std::filesystem;

namespace {

bool is_video_file(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
         ext == ".avi" || ext == ".webm";
}

/**
 * @brief Upload one file through a chunked session and complete it.
 * @return false if any step was refused
 */
bool ingest_file(const std::string &path, const std::string &org_id,
                 ChunkSessionManager &sessions, VideoLifecycle &lifecycle) {
  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec || size == 0) {
    LOG_ERROR("Cannot read {}: {}", path, ec ? ec.message() : "empty file");
    return false;
  }

  uint64_t chunk_bytes = std::max<uint64_t>(1, Config::upload_chunk_bytes());
  int total_chunks = static_cast<int>((size + chunk_bytes - 1) / chunk_bytes);

  InitRequest request;
  request.filename = fs::path(path).filename().string();
  request.size_bytes = static_cast<int64_t>(size);
  request.total_chunks = total_chunks;
  request.org_id = org_id;

  SessionTicket ticket;
  ErrorCode rc = sessions.init_session(request, ticket);
  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Upload init refused for {}: {}", path, to_string(rc));
    return false;
  }

  /// Chunks go out in random order, as parallel uploaders would send them
  std::vector<int> order(static_cast<size_t>(total_chunks));
  std::iota(order.begin(), order.end(), 0);
  std::shuffle(order.begin(), order.end(), std::mt19937{std::random_device{}()});

  std::ifstream in(path, std::ios::binary);
  std::string buffer;
  for (int i : order) {
    uint64_t offset = static_cast<uint64_t>(i) * chunk_bytes;
    buffer.resize(
        static_cast<size_t>(std::min<uint64_t>(chunk_bytes, size - offset)));
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    if (!in) {
      LOG_ERROR("Short read on {} at chunk {}", path, i);
      return false;
    }
    rc = sessions.put_chunk(ticket.session_id, i, buffer);
    if (rc != ErrorCode::Ok) {
      LOG_ERROR("Chunk {} of {} refused: {}", i, path, to_string(rc));
      return false;
    }
  }

  CompleteResult result;
  int missing = 0;
  rc = lifecycle.complete_upload(ticket.session_id, result, missing);
  if (rc != ErrorCode::Ok) {
    LOG_ERROR("Completion refused for {}: {} (missing {})", path,
              to_string(rc), missing);
    return false;
  }
  LOG_INFO("{} -> video {} ({} chunk(s))", request.filename, result.video_id,
           total_chunks);
  return true;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    LOG_WARN("Usage: ./vod_ingest <input file or directory> [org_id]");
    return 1;
  }

  std::string input_arg = argv[1];
  std::string org_id = argc > 2 ? argv[2] : "default";

  std::vector<std::string> files;
  if (fs::is_directory(input_arg)) {
    for (const auto &entry : fs::directory_iterator(input_arg)) {
      if (entry.is_regular_file() && is_video_file(entry.path()))
        files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    LOG_INFO("vod_ingest - Batch Mode: {} video file(s) in {}", files.size(),
             input_arg);
  } else {
    files.push_back(input_arg);
    LOG_INFO("vod_ingest - Single File Mode: {}", input_arg);
  }

  if (files.empty()) {
    LOG_WARN("No video files found");
    return 0;
  }

  // **---- Backends ----**

  BackendRegistry registry(Config::blob_root());
  const BackendConnection &conn = registry.connect();
  if (!conn.connected()) {
    LOG_ERROR("Storage unavailable: {}", conn.reason);
    return 1;
  }

  LOG_INFO("Blob root: {}", Config::blob_root());
  LOG_INFO("Work dir: {}", Config::work_dir());
  LOG_INFO("CPU limit: {}", detect_cpu_limit());

  // **---- Components ----**

  SubprocessRunner runner;
  auto probe_tool = make_probe_tool(Config::probe_backend(), runner);
  MediaProbe probe(*probe_tool);
  ChunkSessionManager sessions(*conn.blobs, *conn.metadata);
  ChunkAssembler assembler(*conn.blobs, sessions);
  Transcoder transcoder(*conn.blobs, runner);
  VideoLifecycle lifecycle(*conn.metadata, sessions, assembler, probe,
                           transcoder);
  StreamingProxy proxy(*conn.blobs, *conn.metadata);

  lifecycle.start();

  auto start = std::chrono::steady_clock::now();
  int refused = 0;
  for (const auto &file : files) {
    if (!ingest_file(file, org_id, sessions, lifecycle))
      ++refused;
    sessions.abandon_expired();
  }

  /// Drop sessions of refused uploads
  int abandoned = sessions.abandon_expired(0);
  if (abandoned > 0)
    LOG_WARN("Abandoned {} incomplete upload session(s)", abandoned);

  lifecycle.shutdown();
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  // **---- Summary ----**

  VideoQuery query;
  query.org_id = org_id;
  query.limit = files.size();
  int failed = 0;
  for (const auto &rec : lifecycle.list_videos(query)) {
    if (rec.status == VideoStatus::Processed) {
      FileResponse master;
      if (proxy.serve_hls_file(rec.video_id, org_id, "master.m3u8", master) ==
          ErrorCode::Ok) {
        LOG_SUCCESS("{}: processed, master manifest {} bytes", rec.filename,
                    master.body.size());
      }
    } else {
      ++failed;
      LOG_ERROR("{}: {} ({})", rec.filename, to_string(rec.status),
                rec.processing_error);
    }
    fmt::print("{}\n", to_json(rec).dump(2));
  }

  LOG_PHASE("Finished {} file(s) in {} ({} refused, {} not processed)",
            files.size(), format_time(elapsed), refused, failed);
  return (failed == 0 && refused == 0) ? 0 : 1;
}
