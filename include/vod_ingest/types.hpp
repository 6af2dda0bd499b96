/**
 * @file types.hpp
 * @brief Core data types and constants for vod_ingest
 *
 * @details Contains the data model shared by every component:
 *          - ErrorCode status values returned by all operations
 *
 *          - UploadSession for in-progress chunked uploads
 *
 *          - VideoRecord persisted per video
 *
 *          - ProbeResult for media inspection output
 */

#ifndef VOD_INGEST_TYPES_HPP
#define VOD_INGEST_TYPES_HPP

#include <cstdint>
#include <set>
#include <string>

namespace vod_ingest {

// **----- CONSTANTS -----**

/**
 * @brief Size above which the chunk set stays the canonical representation.
 * @note 50 MiB. Smaller uploads are consolidated into a single blob.
 */
constexpr uint64_t DEFAULT_SINGLE_BLOB_THRESHOLD = 50ULL * 1024 * 1024;

/// HLS segment length handed to the encoder
constexpr int DEFAULT_HLS_SEGMENT_SEC = 10;

/// Bytes relayed per pull by the streaming proxy
constexpr size_t DEFAULT_STREAM_CHUNK_BYTES = 64 * 1024;

// **----- STATUS CODES -----**

/**
 * @brief Result of every fallible operation (0 = success).
 */
enum class ErrorCode : int {
  Ok = 0,
  InvalidRequest,
  SessionNotFound,
  OutOfRange,
  MissingChunks,
  ProbeFailed,
  TranscodeFailed,
  NotFound,
  RangeNotSatisfiable,
  ServerError, //< Retryable backend failure
  StorageError,
};

/// Stable name of an error code ("MissingChunks", ...)
const char *to_string(ErrorCode code);

/// HTTP status a routing layer should answer with for this code
int http_status(ErrorCode code);

// **----- DATA MODEL -----**

enum class VideoStatus { Uploaded, Processing, Processed, Failed };

enum class StorageType { Single, Chunked };

/// Persisted status string ("uploaded", "processing", ...)
const char *to_string(VideoStatus status);
const char *to_string(StorageType type);

/// Parse a persisted status string; returns false on unknown input
bool parse_video_status(const std::string &text, VideoStatus &out);

/// processed and failed are terminal
inline bool is_terminal(VideoStatus status) {
  return status == VideoStatus::Processed || status == VideoStatus::Failed;
}

/**
 * @struct UploadSession
 * @brief State of one resumable upload.
 * @note received_indices is always a subset of [0, total_chunks).
 */
struct UploadSession {
  std::string session_id;
  std::string video_id;
  std::string org_id;
  std::string filename;
  int64_t total_size_bytes = 0;
  int total_chunks = 0;
  std::set<int> received_indices;
  int64_t created_at = 0; //< Epoch seconds

  bool is_complete() const {
    return static_cast<int>(received_indices.size()) == total_chunks;
  }
  int missing_count() const {
    return total_chunks - static_cast<int>(received_indices.size());
  }
};

/**
 * @struct VideoRecord
 * @brief Metadata row for one video.
 */
struct VideoRecord {
  std::string video_id;
  std::string org_id;
  std::string filename;
  std::string storage_path;
  StorageType storage_type = StorageType::Single;
  int chunk_count = 0; //< Chunk blobs forming the video when chunked
  int64_t size_bytes = 0;
  VideoStatus status = VideoStatus::Uploaded;

  double duration = 0.0;
  double fps = 0.0;
  std::string resolution;
  std::string codec;
  int64_t bitrate = 0;

  std::string hls_manifest_path;
  std::string processing_error;
  int64_t uploaded_at = 0;
  int64_t processed_at = 0;
};

/**
 * @struct ProbeResult
 * @brief Media properties reported by an inspection tool.
 */
struct ProbeResult {
  double duration = 0.0; //< Seconds
  double fps = 0.0;
  std::string resolution; //< "WxH"
  std::string codec;
  int64_t bitrate = 0; //< bits/s
  int64_t size = 0;    //< bytes
  bool fallback = false;
};

// **----- STORAGE KEYS -----**

/// `{org}/{video}/original`
std::string original_key(const std::string &org_id,
                         const std::string &video_id);

/// `{org}/{video}/chunks/chunk_{index:05}`
std::string chunk_key(const std::string &org_id, const std::string &video_id,
                      int index);

/// `{org}/{video}/hls/{filename}`
std::string hls_key(const std::string &org_id, const std::string &video_id,
                    const std::string &filename);

/// `{org}/{video}/thumbnails/{whole seconds}.jpg`
std::string thumbnail_key(const std::string &org_id,
                          const std::string &video_id, int64_t second);

} // namespace vod_ingest

#endif // VOD_INGEST_TYPES_HPP
