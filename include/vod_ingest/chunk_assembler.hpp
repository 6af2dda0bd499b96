/**
 * @file chunk_assembler.hpp
 * @brief Ordered reassembly of uploaded chunks
 *
 * @details The assembler reads chunks 0..N-1 strictly in index order into a
 *          local file, then decides the canonical storage representation:
 *
 *          - size <= threshold: one consolidated blob at the storage path,
 *            chunk blobs deleted best-effort
 *
 *          - size > threshold: the chunk set itself stays canonical and no
 *            consolidated copy is uploaded
 *
 *          The local copy is always kept for probing and transcoding.
 */

#ifndef VOD_INGEST_CHUNK_ASSEMBLER_HPP
#define VOD_INGEST_CHUNK_ASSEMBLER_HPP

#include <cstdint>
#include <string>

#include "blob_store.hpp"
#include "config.hpp"
#include "session_manager.hpp"
#include "types.hpp"

namespace vod_ingest {

struct AssemblerOptions {
  std::string work_dir = Config::work_dir();
  uint64_t single_blob_threshold = Config::single_blob_threshold();
};

/**
 * @struct AssembledVideo
 * @brief Result of assembly, applied to the VideoRecord by the lifecycle.
 */
struct AssembledVideo {
  std::string video_id;
  std::string org_id;
  std::string local_path; //< `{work_dir}/{video_id}/original`
  uint64_t size_bytes = 0;
  StorageType storage_type = StorageType::Single;
  int chunk_count = 0;
};

class ChunkAssembler {
public:
  ChunkAssembler(BlobStore &blobs, ChunkSessionManager &sessions,
                 AssemblerOptions options = AssemblerOptions());

  /**
   * @brief Release a complete session from the manager and assemble it.
   * @param missing Set to the number of absent chunks on MissingChunks
   * @return SessionNotFound, MissingChunks, StorageError
   */
  ErrorCode assemble(const std::string &session_id, AssembledVideo &out,
                     int &missing);

  /**
   * @brief Assemble a session already released from the manager.
   * @return MissingChunks if the session is incomplete, StorageError on
   *         read/write/upload failure
   */
  ErrorCode assemble(const UploadSession &session, AssembledVideo &out);

  /// Directory holding the local copy for a video
  std::string local_dir(const std::string &video_id) const;

private:
  /// Delete chunk blobs after consolidation; failures are only logged
  void delete_chunks(const UploadSession &session);

  BlobStore &blobs_;
  ChunkSessionManager &sessions_;
  AssemblerOptions options_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_CHUNK_ASSEMBLER_HPP
