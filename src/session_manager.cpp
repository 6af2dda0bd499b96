/**
 * @file session_manager.cpp
 * @brief Chunked upload session management
 */

#include "vod_ingest/session_manager.hpp"

#include <vector>

#include "vod_ingest/id_generator.hpp"
#include "vod_ingest/logging.hpp"

namespace vod_ingest {

ChunkSessionManager::ChunkSessionManager(BlobStore &blobs,
                                         MetadataStore &metadata)
    : blobs_(blobs), metadata_(metadata) {}

std::shared_ptr<ChunkSessionManager::SessionState>
ChunkSessionManager::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

// **---- Session Creation ----**

ErrorCode ChunkSessionManager::init_session(const InitRequest &request,
                                            SessionTicket &ticket) {
  if (request.size_bytes <= 0 || request.total_chunks <= 0) {
    LOG_WARN("Rejected upload init for '{}': size={} chunks={}",
             request.filename, request.size_bytes, request.total_chunks);
    return ErrorCode::InvalidRequest;
  }
  if (request.filename.empty() || request.org_id.empty()) {
    LOG_WARN("Rejected upload init: filename and org are required");
    return ErrorCode::InvalidRequest;
  }
  /// Every chunk must carry at least one byte
  if (static_cast<int64_t>(request.total_chunks) > request.size_bytes) {
    LOG_WARN("Rejected upload init for '{}': {} chunks for {} bytes",
             request.filename, request.total_chunks, request.size_bytes);
    return ErrorCode::InvalidRequest;
  }

  auto state = std::make_shared<SessionState>();
  UploadSession &s = state->session;
  s.session_id = generate_uuid();
  s.video_id = generate_uuid();
  s.org_id = request.org_id;
  s.filename = request.filename;
  s.total_size_bytes = request.size_bytes;
  s.total_chunks = request.total_chunks;
  s.created_at = now_epoch_seconds();

  VideoRecord record;
  record.video_id = s.video_id;
  record.org_id = s.org_id;
  record.filename = s.filename;
  record.storage_path = original_key(s.org_id, s.video_id);
  record.storage_type = StorageType::Single;
  record.size_bytes = s.total_size_bytes;
  record.status = VideoStatus::Uploaded;
  record.uploaded_at = s.created_at;

  if (!metadata_.insert(record)) {
    LOG_ERROR("Failed to create video record {}", s.video_id);
    return ErrorCode::StorageError;
  }

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.emplace(s.session_id, state);
  }

  ticket.session_id = s.session_id;
  ticket.video_id = s.video_id;
  LOG_INFO("[Video {}] Upload session {} opened: '{}' ({} bytes, {} chunks)",
           s.video_id, s.session_id, s.filename, s.total_size_bytes,
           s.total_chunks);
  return ErrorCode::Ok;
}

// **---- Chunk Intake ----**

ErrorCode ChunkSessionManager::put_chunk(const std::string &session_id,
                                         int index, const std::string &bytes) {
  auto state = find(session_id);
  if (!state)
    return ErrorCode::SessionNotFound;

  /// Immutable after init; safe to read without the session lock
  const UploadSession &s = state->session;
  if (index < 0 || index >= s.total_chunks) {
    LOG_WARN("[Video {}] Chunk index {} outside [0, {})", s.video_id, index,
             s.total_chunks);
    return ErrorCode::OutOfRange;
  }

  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->released)
      return ErrorCode::SessionNotFound;
    ++state->writers;
  }

  BlobStatus st = blobs_.put(chunk_key(s.org_id, s.video_id, index), bytes);

  std::lock_guard<std::mutex> lock(state->mutex);
  --state->writers;
  state->writers_done.notify_all();
  if (st != BlobStatus::Ok) {
    LOG_ERROR("[Video {}] Failed to store chunk {}", s.video_id, index);
    return ErrorCode::StorageError;
  }

  bool fresh = state->session.received_indices.insert(index).second;
  if (!fresh) {
    LOG_INFO("[Video {}] Chunk {} re-uploaded (overwritten)", s.video_id,
             index);
  }
  return ErrorCode::Ok;
}

bool ChunkSessionManager::is_complete(const std::string &session_id) const {
  auto state = find(session_id);
  if (!state)
    return false;
  std::lock_guard<std::mutex> lock(state->mutex);
  return state->session.is_complete();
}

ErrorCode ChunkSessionManager::missing_chunks(const std::string &session_id,
                                              int &missing) const {
  auto state = find(session_id);
  if (!state)
    return ErrorCode::SessionNotFound;
  std::lock_guard<std::mutex> lock(state->mutex);
  missing = state->session.missing_count();
  return ErrorCode::Ok;
}

bool ChunkSessionManager::snapshot(const std::string &session_id,
                                   UploadSession &out) const {
  auto state = find(session_id);
  if (!state)
    return false;
  std::lock_guard<std::mutex> lock(state->mutex);
  out = state->session;
  return true;
}

// **---- Handover ----**

ErrorCode ChunkSessionManager::release_completed(const std::string &session_id,
                                                 UploadSession &session,
                                                 int &missing) {
  auto state = find(session_id);
  if (!state)
    return ErrorCode::SessionNotFound;

  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->writers_done.wait(lock, [&] { return state->writers == 0; });
    if (state->released)
      return ErrorCode::SessionNotFound;
    missing = state->session.missing_count();
    if (missing > 0)
      return ErrorCode::MissingChunks;
    state->released = true;
    session = state->session;
  }

  std::lock_guard<std::mutex> map_lock(sessions_mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end() && it->second == state)
    sessions_.erase(it);
  return ErrorCode::Ok;
}

int ChunkSessionManager::abandon_expired(int64_t max_age_sec) {
  int64_t cutoff = now_epoch_seconds() - max_age_sec;
  std::vector<std::shared_ptr<SessionState>> candidates;

  {
    std::lock_guard<std::mutex> map_lock(sessions_mutex_);
    for (const auto &kv : sessions_) {
      if (kv.second->session.created_at <= cutoff)
        candidates.push_back(kv.second);
    }
  }

  std::vector<UploadSession> expired;
  for (const auto &state : candidates) {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->writers_done.wait(lock, [&] { return state->writers == 0; });
    /// Lost the race to release_completed
    if (state->released)
      continue;
    state->released = true;
    expired.push_back(state->session);
  }

  {
    std::lock_guard<std::mutex> map_lock(sessions_mutex_);
    for (const auto &s : expired)
      sessions_.erase(s.session_id);
  }

  for (const auto &s : expired) {
    for (int index : s.received_indices) {
      if (blobs_.remove(chunk_key(s.org_id, s.video_id, index)) ==
          BlobStatus::Error) {
        LOG_WARN("[Video {}] Could not delete stale chunk {}", s.video_id,
                 index);
      }
    }
    LOG_INFO("[Video {}] Abandoned upload session {} ({}/{} chunks)",
             s.video_id, s.session_id, s.received_indices.size(),
             s.total_chunks);
  }
  return static_cast<int>(expired.size());
}

size_t ChunkSessionManager::active_sessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

} // namespace vod_ingest
