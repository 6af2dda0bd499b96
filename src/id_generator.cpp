/**
 * @file id_generator.cpp
 * @brief UUID generation
 */

#include "vod_ingest/id_generator.hpp"

#include <chrono>
#include <random>

#include <fmt/core.h>

namespace vod_ingest {

std::string generate_uuid() {
  /// One engine per thread, seeded from the OS
  thread_local std::mt19937_64 engine{std::random_device{}()};
  uint64_t hi = engine();
  uint64_t lo = engine();

  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; //< version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; //< variant 1

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     static_cast<uint32_t>(hi >> 32),
                     static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                     static_cast<uint32_t>(hi & 0xFFFF),
                     static_cast<uint32_t>(lo >> 48),
                     lo & 0xFFFFFFFFFFFFULL);
}

int64_t now_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace vod_ingest
