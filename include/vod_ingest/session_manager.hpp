/**
 * @file session_manager.hpp
 * @brief Ownership of in-progress chunked upload sessions
 *
 * @details ChunkSessionManager creates sessions (and their VideoRecord),
 *          stores chunks in the blob backend, tracks which indices have
 *          arrived and hands complete sessions over to assembly.
 *
 * @attention THREAD MODEL:
 *
 * - A manager-wide mutex guards the session map only
 *
 * - Each session has its own mutex guarding received_indices
 *
 * - Chunk bytes are written to the blob store outside both locks, so
 *   uploads for different chunks and sessions proceed in parallel
 */

#ifndef VOD_INGEST_SESSION_MANAGER_HPP
#define VOD_INGEST_SESSION_MANAGER_HPP

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "blob_store.hpp"
#include "config.hpp"
#include "metadata_store.hpp"
#include "types.hpp"

namespace vod_ingest {

/**
 * @struct InitRequest
 * @brief Parameters of a new upload session.
 */
struct InitRequest {
  std::string filename;
  int64_t size_bytes = 0;
  int total_chunks = 0;
  std::string org_id;
};

/**
 * @struct SessionTicket
 * @brief Identifiers handed back to the uploader.
 */
struct SessionTicket {
  std::string session_id;
  std::string video_id;
};

class ChunkSessionManager {
public:
  ChunkSessionManager(BlobStore &blobs, MetadataStore &metadata);

  /**
   * @brief Open a session and create its VideoRecord (status uploaded).
   * @return InvalidRequest for bad parameters (nothing is created),
   *         StorageError if the record cannot be inserted
   */
  ErrorCode init_session(const InitRequest &request, SessionTicket &ticket);

  /**
   * @brief Store one chunk; re-uploads overwrite and count once.
   * @note The index is marked only after the blob write succeeded. A write
   *       already in progress when the session is released completes
   *       before the release returns.
   * @return SessionNotFound (also once released), OutOfRange, or
   *         StorageError on write failure
   */
  ErrorCode put_chunk(const std::string &session_id, int index,
                      const std::string &bytes);

  /// false for unknown sessions
  bool is_complete(const std::string &session_id) const;

  /**
   * @brief Number of chunks not yet received.
   * @return SessionNotFound for unknown sessions
   */
  ErrorCode missing_chunks(const std::string &session_id, int &missing) const;

  /// Copy of the session state; false for unknown sessions
  bool snapshot(const std::string &session_id, UploadSession &out) const;

  /**
   * @brief Hand a complete session over to assembly and forget it.
   * @details Waits for chunk writes in progress, so the returned session
   *          matches the stored chunk blobs. Later put_chunk calls get
   *          SessionNotFound.
   * @param missing Set to the missing count on MissingChunks
   * @return SessionNotFound, or MissingChunks (session kept)
   */
  ErrorCode release_completed(const std::string &session_id,
                              UploadSession &session, int &missing);

  /**
   * @brief Drop sessions older than max_age_sec and their chunk blobs.
   * @return Number of sessions dropped
   */
  int abandon_expired(int64_t max_age_sec = Config::session_max_age_sec());

  size_t active_sessions() const;

private:
  struct SessionState {
    UploadSession session;
    mutable std::mutex mutex;
    std::condition_variable writers_done;
    int writers = 0;       //< Chunk writes in progress
    bool released = false; //< Handed to assembly or abandoned
  };

  std::shared_ptr<SessionState> find(const std::string &session_id) const;

  BlobStore &blobs_;
  MetadataStore &metadata_;

  mutable std::mutex sessions_mutex_;
  std::map<std::string, std::shared_ptr<SessionState>> sessions_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_SESSION_MANAGER_HPP
