/**
 * @file streaming_proxy.cpp
 * @brief Range relay, HLS and thumbnail serving
 */

#include "vod_ingest/streaming_proxy.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "vod_ingest/logging.hpp"

namespace vod_ingest {

namespace {

void add_cors_headers(HeaderMap &headers) {
  headers["Access-Control-Allow-Origin"] = "*";
  headers["Access-Control-Allow-Methods"] = "GET, OPTIONS";
  headers["Access-Control-Allow-Headers"] = "Range";
}

bool has_suffix(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Single path component without traversal
bool is_safe_filename(const std::string &name) {
  return !name.empty() && name.find('/') == std::string::npos &&
         name.find('\\') == std::string::npos &&
         name.find("..") == std::string::npos;
}

} // anonymous namespace

// **---- StreamResponse ----**

std::string StreamResponse::header(const std::string &name) const {
  auto it = headers.find(name);
  return it == headers.end() ? std::string() : it->second;
}

bool StreamResponse::next_chunk(std::string &out) {
  out.clear();
  if (!body_ || failed_)
    return false;
  if (!body_->read(out, chunk_size_)) {
    failed_ = true;
    body_.reset();
    return false;
  }
  if (out.empty()) {
    body_.reset();
    return false;
  }
  return true;
}

std::string FileResponse::content_type() const {
  auto it = headers.find("Content-Type");
  return it == headers.end() ? std::string() : it->second;
}

// **---- ChunkedBlobReader ----**

ChunkedBlobReader::ChunkedBlobReader(BlobStore &blobs,
                                     std::vector<std::string> keys,
                                     std::vector<uint64_t> sizes,
                                     uint64_t offset, uint64_t length)
    : blobs_(blobs), keys_(std::move(keys)), sizes_(std::move(sizes)),
      position_(offset), remaining_(length) {}

bool ChunkedBlobReader::open_current() {
  /// Skip chunks that end before the current position
  while (chunk_index_ < sizes_.size() &&
         chunk_start_ + sizes_[chunk_index_] <= position_) {
    chunk_start_ += sizes_[chunk_index_];
    ++chunk_index_;
  }
  if (chunk_index_ >= sizes_.size())
    return false;

  uint64_t first = position_ - chunk_start_;
  uint64_t last = std::min(sizes_[chunk_index_] - 1, first + remaining_ - 1);
  ByteRange range;
  BlobStatus st =
      blobs_.open_range(keys_[chunk_index_], fmt::format("bytes={}-{}", first, last),
                        current_, range);
  if (st != BlobStatus::Ok) {
    LOG_ERROR("Failed to open chunk {} for streaming", keys_[chunk_index_]);
    current_.reset();
    return false;
  }
  return true;
}

bool ChunkedBlobReader::read(std::string &out, size_t max_bytes) {
  out.clear();
  while (remaining_ > 0) {
    if (!current_ && !open_current())
      return false;

    std::string piece;
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, max_bytes));
    if (!current_->read(piece, want))
      return false;
    if (piece.empty()) {
      /// Current chunk exhausted; move to the next one
      current_.reset();
      continue;
    }
    position_ += piece.size();
    remaining_ -= piece.size();
    out = std::move(piece);
    return true;
  }
  return true;
}

// **---- Content types ----**

void hls_content_headers(const std::string &filename,
                         std::string &content_type,
                         std::string &cache_control) {
  if (has_suffix(filename, ".m3u8")) {
    content_type = "application/x-mpegURL";
    cache_control = "no-cache";
  } else if (has_suffix(filename, ".ts")) {
    content_type = "video/MP2T";
    cache_control = "max-age=3600";
  } else {
    content_type = "application/octet-stream";
    cache_control.clear();
  }
}

// **---- StreamingProxy ----**

StreamingProxy::StreamingProxy(BlobStore &blobs, MetadataStore &metadata,
                               size_t chunk_size)
    : blobs_(blobs), metadata_(metadata),
      chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_STREAM_CHUNK_BYTES) {}

ErrorCode StreamingProxy::open_chunked(const VideoRecord &record,
                                       const std::string &range_header,
                                       std::unique_ptr<BlobReader> &reader,
                                       ByteRange &range) {
  std::vector<std::string> keys;
  std::vector<uint64_t> sizes;
  uint64_t total = 0;
  for (int i = 0; i < record.chunk_count; ++i) {
    std::string key = chunk_key(record.org_id, record.video_id, i);
    uint64_t sz = 0;
    BlobStatus st = blobs_.size(key, sz);
    if (st == BlobStatus::NotFound) {
      LOG_ERROR("[Video {}] Chunk {} missing from storage", record.video_id, i);
      return ErrorCode::NotFound;
    }
    if (st != BlobStatus::Ok)
      return ErrorCode::ServerError;
    keys.push_back(std::move(key));
    sizes.push_back(sz);
    total += sz;
  }

  if (resolve_range(range_header, total, range) ==
      RangeOutcome::Unsatisfiable) {
    range.total = total;
    return ErrorCode::RangeNotSatisfiable;
  }
  reader = std::make_unique<ChunkedBlobReader>(
      blobs_, std::move(keys), std::move(sizes), range.offset, range.length);
  return ErrorCode::Ok;
}

ErrorCode StreamingProxy::stream_range(const std::string &video_id,
                                       const std::string &org_id,
                                       const std::string &range_header,
                                       StreamResponse &response) {
  response = StreamResponse();
  response.chunk_size_ = chunk_size_;
  add_cors_headers(response.headers);

  VideoRecord record;
  bool known = metadata_.get(video_id, record);
  if (known && record.org_id != org_id)
    return ErrorCode::NotFound;

  std::unique_ptr<BlobReader> reader;
  ByteRange range;
  ErrorCode rc = ErrorCode::Ok;

  if (known && record.storage_type == StorageType::Chunked) {
    rc = open_chunked(record, range_header, reader, range);
  } else {
    BlobStatus st = blobs_.open_range(original_key(org_id, video_id),
                                      range_header, reader, range);
    switch (st) {
    case BlobStatus::Ok:
      break;
    case BlobStatus::NotFound:
      rc = ErrorCode::NotFound;
      break;
    case BlobStatus::RangeNotSatisfiable:
      rc = ErrorCode::RangeNotSatisfiable;
      break;
    case BlobStatus::Error:
      rc = ErrorCode::ServerError;
      break;
    }
  }

  if (rc == ErrorCode::RangeNotSatisfiable) {
    response.status = 416;
    response.range = range;
    response.headers["Content-Range"] = fmt::format("bytes */{}", range.total);
    return rc;
  }
  if (rc != ErrorCode::Ok) {
    if (rc == ErrorCode::ServerError)
      LOG_ERROR("[Video {}] Blob backend error while streaming", video_id);
    return rc;
  }

  response.range = range;
  response.body_ = std::move(reader);
  response.headers["Accept-Ranges"] = "bytes";
  response.headers["Content-Type"] = "video/mp4";
  response.headers["Content-Length"] = std::to_string(range.length);
  response.headers["Cache-Control"] = "no-cache";
  if (range.partial) {
    response.status = 206;
    response.headers["Content-Range"] = content_range_value(range);
  } else {
    response.status = 200;
  }
  return ErrorCode::Ok;
}

ErrorCode StreamingProxy::serve_hls_file(const std::string &video_id,
                                         const std::string &org_id,
                                         const std::string &filename,
                                         FileResponse &response) {
  if (!is_safe_filename(filename)) {
    LOG_WARN("[Video {}] Rejected HLS filename '{}'", video_id, filename);
    return ErrorCode::NotFound;
  }

  VideoRecord record;
  if (metadata_.get(video_id, record) && record.org_id != org_id)
    return ErrorCode::NotFound;

  std::string body;
  BlobStatus st = blobs_.get(hls_key(org_id, video_id, filename), body);
  if (st == BlobStatus::NotFound)
    return ErrorCode::NotFound;
  if (st != BlobStatus::Ok) {
    LOG_ERROR("[Video {}] Blob backend error fetching {}", video_id, filename);
    return ErrorCode::ServerError;
  }

  std::string content_type, cache_control;
  hls_content_headers(filename, content_type, cache_control);

  response = FileResponse();
  response.body = std::move(body);
  response.headers["Content-Type"] = content_type;
  if (!cache_control.empty())
    response.headers["Cache-Control"] = cache_control;
  response.headers["Content-Length"] = std::to_string(response.body.size());
  add_cors_headers(response.headers);
  return ErrorCode::Ok;
}

ErrorCode StreamingProxy::serve_thumbnail(const std::string &video_id,
                                          const std::string &org_id,
                                          double timestamp_sec,
                                          FileResponse &response) {
  if (!std::isfinite(timestamp_sec) || timestamp_sec < 0)
    return ErrorCode::NotFound;

  VideoRecord record;
  if (metadata_.get(video_id, record) && record.org_id != org_id)
    return ErrorCode::NotFound;

  int64_t second = static_cast<int64_t>(timestamp_sec);
  std::string body;
  BlobStatus st = blobs_.get(thumbnail_key(org_id, video_id, second), body);
  if (st == BlobStatus::NotFound)
    return ErrorCode::NotFound;
  if (st != BlobStatus::Ok) {
    LOG_ERROR("[Video {}] Blob backend error fetching thumbnail at {}s",
              video_id, second);
    return ErrorCode::ServerError;
  }

  response = FileResponse();
  response.body = std::move(body);
  response.headers["Content-Type"] = "image/jpeg";
  response.headers["Cache-Control"] = "max-age=86400";
  response.headers["Content-Length"] = std::to_string(response.body.size());
  add_cors_headers(response.headers);
  return ErrorCode::Ok;
}

} // namespace vod_ingest
