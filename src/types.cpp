/**
 * @file types.cpp
 * @brief String conversions and storage key layout
 */

#include "vod_ingest/types.hpp"

#include <fmt/core.h>

namespace vod_ingest {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidRequest:
    return "InvalidRequest";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::OutOfRange:
    return "OutOfRange";
  case ErrorCode::MissingChunks:
    return "MissingChunks";
  case ErrorCode::ProbeFailed:
    return "ProbeFailed";
  case ErrorCode::TranscodeFailed:
    return "TranscodeFailed";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::RangeNotSatisfiable:
    return "RangeNotSatisfiable";
  case ErrorCode::ServerError:
    return "ServerError";
  case ErrorCode::StorageError:
    return "StorageError";
  }
  return "Unknown";
}

int http_status(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return 200;
  case ErrorCode::InvalidRequest:
  case ErrorCode::OutOfRange:
  case ErrorCode::MissingChunks:
    return 400;
  case ErrorCode::SessionNotFound:
  case ErrorCode::NotFound:
    return 404;
  case ErrorCode::RangeNotSatisfiable:
    return 416;
  case ErrorCode::ServerError:
  case ErrorCode::StorageError:
    return 503;
  case ErrorCode::ProbeFailed:
  case ErrorCode::TranscodeFailed:
    return 500;
  }
  return 500;
}

const char *to_string(VideoStatus status) {
  switch (status) {
  case VideoStatus::Uploaded:
    return "uploaded";
  case VideoStatus::Processing:
    return "processing";
  case VideoStatus::Processed:
    return "processed";
  case VideoStatus::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(StorageType type) {
  return type == StorageType::Chunked ? "chunked" : "single";
}

bool parse_video_status(const std::string &text, VideoStatus &out) {
  for (VideoStatus s : {VideoStatus::Uploaded, VideoStatus::Processing,
                        VideoStatus::Processed, VideoStatus::Failed}) {
    if (text == to_string(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

std::string original_key(const std::string &org_id,
                         const std::string &video_id) {
  return fmt::format("{}/{}/original", org_id, video_id);
}

std::string chunk_key(const std::string &org_id, const std::string &video_id,
                      int index) {
  return fmt::format("{}/{}/chunks/chunk_{:05d}", org_id, video_id, index);
}

std::string hls_key(const std::string &org_id, const std::string &video_id,
                    const std::string &filename) {
  return fmt::format("{}/{}/hls/{}", org_id, video_id, filename);
}

std::string thumbnail_key(const std::string &org_id,
                          const std::string &video_id, int64_t second) {
  return fmt::format("{}/{}/thumbnails/{}.jpg", org_id, video_id, second);
}

} // namespace vod_ingest
