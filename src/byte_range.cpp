/**
 * @file byte_range.cpp
 * @brief Range header resolution
 */

#include "vod_ingest/byte_range.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace vod_ingest {

namespace {

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

/// Strict unsigned decimal; rejects signs, blanks and overflow
bool parse_u64(const std::string &s, uint64_t &out) {
  if (s.empty() || s.size() > 19)
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  out = v;
  return true;
}

void set_full(uint64_t total, ByteRange &out) {
  out.offset = 0;
  out.length = total;
  out.total = total;
  out.partial = false;
}

} // anonymous namespace

RangeOutcome resolve_range(const std::string &header, uint64_t total,
                           ByteRange &out) {
  set_full(total, out);

  std::string value = trim(header);
  if (value.empty())
    return RangeOutcome::Full;

  /// Unknown units are ignored per RFC 9110
  const std::string unit = "bytes=";
  if (value.size() < unit.size() ||
      !std::equal(unit.begin(), unit.end(), value.begin(),
                  [](char a, char b) {
                    return a == std::tolower(static_cast<unsigned char>(b));
                  })) {
    return RangeOutcome::Full;
  }

  std::string range_set = trim(value.substr(unit.size()));
  if (range_set.find(',') != std::string::npos)
    return RangeOutcome::Full;

  size_t dash = range_set.find('-');
  if (dash == std::string::npos)
    return RangeOutcome::Full;

  std::string first_str = trim(range_set.substr(0, dash));
  std::string last_str = trim(range_set.substr(dash + 1));

  uint64_t first = 0;
  uint64_t last = 0;

  if (first_str.empty()) {
    /// Suffix form: last N bytes
    uint64_t suffix = 0;
    if (!parse_u64(last_str, suffix))
      return RangeOutcome::Full;
    if (suffix == 0 || total == 0)
      return RangeOutcome::Unsatisfiable;
    suffix = std::min(suffix, total);
    first = total - suffix;
    last = total - 1;
  } else {
    if (!parse_u64(first_str, first))
      return RangeOutcome::Full;
    if (last_str.empty()) {
      last = total == 0 ? 0 : total - 1;
    } else {
      if (!parse_u64(last_str, last))
        return RangeOutcome::Full;
      if (last < first)
        return RangeOutcome::Full;
      last = std::min(last, total == 0 ? 0 : total - 1);
    }
    if (first >= total)
      return RangeOutcome::Unsatisfiable;
  }

  out.offset = first;
  out.length = last - first + 1;
  out.total = total;
  out.partial = true;
  return RangeOutcome::Partial;
}

std::string content_range_value(const ByteRange &range) {
  return fmt::format("bytes {}-{}/{}", range.offset, range.last(),
                     range.total);
}

} // namespace vod_ingest
