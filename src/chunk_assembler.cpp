/**
 * @file chunk_assembler.cpp
 * @brief Ordered chunk reassembly and storage strategy
 */

#include "vod_ingest/chunk_assembler.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "vod_ingest/logging.hpp"

namespace vod_ingest {

namespace fs = std::filesystem;

ChunkAssembler::ChunkAssembler(BlobStore &blobs, ChunkSessionManager &sessions,
                               AssemblerOptions options)
    : blobs_(blobs), sessions_(sessions), options_(std::move(options)) {}

std::string ChunkAssembler::local_dir(const std::string &video_id) const {
  return (fs::path(options_.work_dir) / video_id).string();
}

ErrorCode ChunkAssembler::assemble(const std::string &session_id,
                                   AssembledVideo &out, int &missing) {
  UploadSession session;
  ErrorCode rc = sessions_.release_completed(session_id, session, missing);
  if (rc != ErrorCode::Ok)
    return rc;
  return assemble(session, out);
}

ErrorCode ChunkAssembler::assemble(const UploadSession &session,
                                   AssembledVideo &out) {
  if (!session.is_complete()) {
    LOG_WARN("[Video {}] Cannot assemble: {} chunk(s) missing",
             session.video_id, session.missing_count());
    return ErrorCode::MissingChunks;
  }

  // **----- CONCATENATE IN INDEX ORDER -----**

  std::error_code ec;
  fs::create_directories(local_dir(session.video_id), ec);
  if (ec) {
    LOG_ERROR("[Video {}] Failed to create work dir: {}", session.video_id,
              ec.message());
    return ErrorCode::StorageError;
  }

  std::string local_path =
      (fs::path(local_dir(session.video_id)) / "original").string();
  uint64_t total = 0;
  {
    std::ofstream ofs(local_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      LOG_ERROR("[Video {}] Failed to open {}", session.video_id, local_path);
      return ErrorCode::StorageError;
    }

    /// Order is correctness-critical: never iterate arrival order
    std::string chunk;
    for (int i = 0; i < session.total_chunks; ++i) {
      BlobStatus st =
          blobs_.get(chunk_key(session.org_id, session.video_id, i), chunk);
      if (st != BlobStatus::Ok) {
        LOG_ERROR("[Video {}] Failed to read chunk {} ({})", session.video_id,
                  i, st == BlobStatus::NotFound ? "missing" : "backend error");
        return ErrorCode::StorageError;
      }
      ofs.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      total += chunk.size();
    }
    ofs.flush();
    if (!ofs) {
      LOG_ERROR("[Video {}] Failed to write {}", session.video_id, local_path);
      return ErrorCode::StorageError;
    }
  }

  if (static_cast<int64_t>(total) != session.total_size_bytes) {
    LOG_WARN("[Video {}] Assembled {} bytes, upload declared {}",
             session.video_id, total, session.total_size_bytes);
  }

  out.video_id = session.video_id;
  out.org_id = session.org_id;
  out.local_path = local_path;
  out.size_bytes = total;
  out.chunk_count = session.total_chunks;

  // **----- STORAGE STRATEGY -----**

  if (total > options_.single_blob_threshold) {
    out.storage_type = StorageType::Chunked;
    LOG_INFO("[Video {}] {} MB above threshold; keeping {} chunks as canonical",
             session.video_id, total / 1024 / 1024, session.total_chunks);
    return ErrorCode::Ok;
  }

  out.storage_type = StorageType::Single;
  std::string key = original_key(session.org_id, session.video_id);
  if (blobs_.put_file(key, local_path) != BlobStatus::Ok) {
    LOG_ERROR("[Video {}] Failed to upload consolidated blob {}",
              session.video_id, key);
    return ErrorCode::StorageError;
  }
  LOG_INFO("[Video {}] Consolidated {} bytes into {}", session.video_id, total,
           key);

  delete_chunks(session);
  return ErrorCode::Ok;
}

void ChunkAssembler::delete_chunks(const UploadSession &session) {
  int failures = 0;
  for (int i = 0; i < session.total_chunks; ++i) {
    BlobStatus st =
        blobs_.remove(chunk_key(session.org_id, session.video_id, i));
    if (st == BlobStatus::Error)
      ++failures;
  }
  if (failures > 0) {
    LOG_WARN("[Video {}] {} chunk blob(s) could not be deleted",
             session.video_id, failures);
  }
}

} // namespace vod_ingest
