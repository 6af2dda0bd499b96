/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Component option structs (AssemblerOptions, TranscodeOptions, ...)
 *          take their defaults from here; tests set the structs directly.
 */

#ifndef VOD_INGEST_CONFIG_HPP
#define VOD_INGEST_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace vod_ingest {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stod(val);
  } catch (const std::exception &) {
    return default_val;
  }
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    return default_val;
  }
}

/**
 * @brief Get a size given in MiB from environment variable, in bytes.
 * @note Values below min_mb fall back to default_mb.
 */
inline uint64_t get_env_mib(const char *name, int default_mb, int min_mb) {
  int mb = get_env_int(name, default_mb);
  if (mb < min_mb)
    mb = default_mb;
  return static_cast<uint64_t>(mb) * 1024 * 1024;
}

/// Get a string value from environment variable.
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- STORAGE ----**

/// Root directory of the filesystem blob store
inline const std::string &blob_root() {
  static std::string val = get_env_string("VOD_BLOB_ROOT", "./blobs");
  return val;
}

/// Scratch directory for assembled originals and HLS output
inline const std::string &work_dir() {
  static std::string val = get_env_string("VOD_WORK_DIR", "/tmp/vod_ingest");
  return val;
}

/**
 * @brief Assembled size above which chunks stay canonical (bytes)
 * @note Set in MiB via SINGLE_BLOB_THRESHOLD_MB. Equal sizes are stored
 *       as a single blob.
 */
inline uint64_t single_blob_threshold() {
  static uint64_t val = get_env_mib("SINGLE_BLOB_THRESHOLD_MB", 50, 0);
  return val;
}

/// Sessions older than this are dropped by the janitor (seconds)
inline int session_max_age_sec() {
  static int val = get_env_int("SESSION_MAX_AGE_SEC", 86400);
  return val;
}

// **---- EXTERNAL TOOLS ----**

inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

inline const std::string &ffprobe_bin() {
  static std::string val = get_env_string("FFPROBE_BIN", "ffprobe");
  return val;
}

/**
 * @brief Media inspection backend
 * @note "ffprobe" (external process, default) or "libav" (in-process).
 */
inline const std::string &probe_backend() {
  static std::string val = get_env_string("PROBE_BACKEND", "ffprobe");
  return val;
}

inline int probe_timeout_sec() {
  static int val = get_env_int("PROBE_TIMEOUT_SEC", 60);
  return val;
}

// **---- TRANSCODING ----**

/// HLS segment duration passed to the encoder
inline int hls_segment_sec() {
  static int val = get_env_int("HLS_SEGMENT_SEC", 10);
  return val;
}

/**
 * @brief Per-rendition timeout as a multiple of the source duration
 * @note Effective timeout = max(TRANSCODE_MIN_TIMEOUT_SEC,
 *       duration * TRANSCODE_TIMEOUT_FACTOR).
 */
inline double transcode_timeout_factor() {
  static double val = get_env_double("TRANSCODE_TIMEOUT_FACTOR", 4.0);
  return val;
}

inline int transcode_min_timeout_sec() {
  static int val = get_env_int("TRANSCODE_MIN_TIMEOUT_SEC", 300);
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of concurrent video pipelines
 * @note 0 = auto-detect from the cgroup-aware CPU limit.
 * @attention Each pipeline runs one encoder at a time; the encoder itself
 *            is multi-threaded, so the auto value is deliberately small
 *            (CPUs / 4, at least 1).
 */
inline int transcode_workers() {
  static int val = get_env_int("TRANSCODE_WORKERS", 0);
  return val;
}

/**
 * @brief Pin workers and their encoder processes to disjoint CPU sets
 * @note Encoders are wrapped in `taskset -c <cpus>` when enabled.
 */
inline bool pin_workers() {
  static bool val = (get_env_int("PIN_WORKERS", 0) != 0);
  return val;
}

// **---- STREAMING ----**

inline size_t stream_chunk_bytes() {
  static size_t val = [] {
    int bytes = get_env_int("STREAM_CHUNK_BYTES", 64 * 1024);
    return static_cast<size_t>(bytes > 0 ? bytes : 64 * 1024);
  }();
  return val;
}

// **---- CLI ----**

/// Chunk size used by the command-line uploader
inline uint64_t upload_chunk_bytes() {
  static uint64_t val = get_env_mib("UPLOAD_CHUNK_MB", 50, 1);
  return val;
}

} // namespace Config
} // namespace vod_ingest

#endif // VOD_INGEST_CONFIG_HPP
