/**
 * @file byte_range.hpp
 * @brief HTTP `Range: bytes=` header resolution
 *
 * @details Supports the three single-range forms:
 *
 *          - `bytes=first-last`
 *
 *          - `bytes=first-` (to end of resource)
 *
 *          - `bytes=-suffix` (last N bytes)
 *
 *          Multi-range requests are answered with the full resource, which
 *          RFC 9110 permits.
 */

#ifndef VOD_INGEST_BYTE_RANGE_HPP
#define VOD_INGEST_BYTE_RANGE_HPP

#include <cstdint>
#include <string>

namespace vod_ingest {

/**
 * @struct ByteRange
 * @brief A resolved, inclusive byte window of a resource.
 */
struct ByteRange {
  uint64_t offset = 0;
  uint64_t length = 0;
  uint64_t total = 0;
  bool partial = false; //< true when a range was honored (206)

  uint64_t last() const { return offset + length - 1; }
};

enum class RangeOutcome {
  Full,          //< No usable Range header; serve everything
  Partial,       //< Serve the resolved window
  Unsatisfiable, //< 416
};

/**
 * @brief Resolve a Range header against a resource size.
 * @param header Raw header value, may be empty
 * @param total Resource size in bytes
 * @param out Resolved window (covers the whole resource for Full)
 */
RangeOutcome resolve_range(const std::string &header, uint64_t total,
                           ByteRange &out);

/// `bytes first-last/total`
std::string content_range_value(const ByteRange &range);

} // namespace vod_ingest

#endif // VOD_INGEST_BYTE_RANGE_HPP
