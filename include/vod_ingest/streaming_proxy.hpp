/**
 * @file streaming_proxy.hpp
 * @brief Range-aware video relay and HLS file serving
 *
 * @details Originals are relayed from the blob store in bounded chunks
 *          pulled one at a time, so at most one chunk is buffered per
 *          response. Single-blob videos forward the client's Range header
 *          to the blob backend unmodified; chunked videos are stitched from
 *          their chunk blobs in index order behind the same range semantics.
 *
 *          Status mapping: 200 full body, 206 partial with Content-Range,
 *          416 for unsatisfiable ranges (Content-Range carries the total).
 */

#ifndef VOD_INGEST_STREAMING_PROXY_HPP
#define VOD_INGEST_STREAMING_PROXY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "blob_store.hpp"
#include "config.hpp"
#include "metadata_store.hpp"
#include "types.hpp"

namespace vod_ingest {

using HeaderMap = std::map<std::string, std::string>;

/**
 * @class StreamResponse
 * @brief Status, headers and a pull-based body.
 */
class StreamResponse {
public:
  int status = 200;
  HeaderMap headers;
  ByteRange range;

  /// Header value or empty string
  std::string header(const std::string &name) const;

  /**
   * @brief Pull the next body chunk (at most the proxy's chunk size).
   * @return false at end of body or on backend error (see failed())
   */
  bool next_chunk(std::string &out);

  bool failed() const { return failed_; }

private:
  friend class StreamingProxy;

  std::unique_ptr<BlobReader> body_;
  size_t chunk_size_ = DEFAULT_STREAM_CHUNK_BYTES;
  bool failed_ = false;
};

/**
 * @struct FileResponse
 * @brief A stored playlist, segment or thumbnail with its headers.
 */
struct FileResponse {
  HeaderMap headers;
  std::string body;

  std::string content_type() const;
};

/**
 * @class ChunkedBlobReader
 * @brief Reads a byte window spanning consecutive chunk blobs.
 * @note Each chunk is opened with a range read only when the window
 *       reaches it.
 */
class ChunkedBlobReader : public BlobReader {
public:
  /**
   * @param keys Chunk blob keys in index order
   * @param sizes Byte size of each chunk
   */
  ChunkedBlobReader(BlobStore &blobs, std::vector<std::string> keys,
                    std::vector<uint64_t> sizes, uint64_t offset,
                    uint64_t length);

  bool read(std::string &out, size_t max_bytes) override;

private:
  /// Open the chunk containing position_; false on backend error
  bool open_current();

  BlobStore &blobs_;
  std::vector<std::string> keys_;
  std::vector<uint64_t> sizes_;
  uint64_t position_;  //< Absolute offset of the next byte
  uint64_t remaining_; //< Bytes left in the window
  size_t chunk_index_ = 0;
  uint64_t chunk_start_ = 0; //< Absolute offset of chunk_index_
  std::unique_ptr<BlobReader> current_;
};

/**
 * @brief Content type and cache policy by extension.
 * @note `.m3u8` application/x-mpegURL + no-cache; `.ts` video/MP2T +
 *       max-age=3600; anything else application/octet-stream.
 */
void hls_content_headers(const std::string &filename,
                         std::string &content_type,
                         std::string &cache_control);

class StreamingProxy {
public:
  StreamingProxy(BlobStore &blobs, MetadataStore &metadata,
                 size_t chunk_size = Config::stream_chunk_bytes());

  /**
   * @brief Relay (part of) the original video.
   * @return NotFound for unknown blobs or another org's video,
   *         RangeNotSatisfiable (response carries the 416 headers),
   *         ServerError on backend failure
   */
  ErrorCode stream_range(const std::string &video_id, const std::string &org_id,
                         const std::string &range_header,
                         StreamResponse &response);

  /**
   * @brief Fetch one HLS playlist or segment.
   * @return NotFound for missing blobs and for filenames containing `/`
   *         or `..`; ServerError on other backend failures
   */
  ErrorCode serve_hls_file(const std::string &video_id,
                           const std::string &org_id,
                           const std::string &filename,
                           FileResponse &response);

  /**
   * @brief Fetch the stored JPEG thumbnail taken at a timestamp.
   * @param timestamp_sec Truncated to whole seconds
   * @return NotFound for missing blobs and negative or non-finite
   *         timestamps; ServerError on other backend failures
   */
  ErrorCode serve_thumbnail(const std::string &video_id,
                            const std::string &org_id, double timestamp_sec,
                            FileResponse &response);

private:
  /// Set up a reader over the chunk blobs of a chunked video
  ErrorCode open_chunked(const VideoRecord &record,
                         const std::string &range_header,
                         std::unique_ptr<BlobReader> &reader, ByteRange &range);

  BlobStore &blobs_;
  MetadataStore &metadata_;
  size_t chunk_size_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_STREAMING_PROXY_HPP
