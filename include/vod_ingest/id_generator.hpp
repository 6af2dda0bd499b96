/**
 * @file id_generator.hpp
 * @brief Random identifiers for sessions and videos
 */

#ifndef VOD_INGEST_ID_GENERATOR_HPP
#define VOD_INGEST_ID_GENERATOR_HPP

#include <cstdint>
#include <string>

namespace vod_ingest {

/// RFC 4122 version-4 UUID string (lowercase, hyphenated)
std::string generate_uuid();

/// Current wall-clock time in epoch seconds
int64_t now_epoch_seconds();

} // namespace vod_ingest

#endif // VOD_INGEST_ID_GENERATOR_HPP
