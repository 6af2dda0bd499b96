/**
 * @file media_probe.hpp
 * @brief Media property extraction with fallback
 *
 * @details MediaProbe asks a ProbeTool for duration, frame rate, resolution,
 *          codec, bitrate and size. Two tools exist:
 *
 *          - FfprobeTool: runs `ffprobe -print_format json` and parses it
 *
 *          - LibavProbeTool: opens the file in-process with libavformat
 *
 *          A failed inspection never fails the pipeline; MediaProbe
 *          substitutes fallback metadata instead.
 */

#ifndef VOD_INGEST_MEDIA_PROBE_HPP
#define VOD_INGEST_MEDIA_PROBE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "process_runner.hpp"
#include "types.hpp"

namespace vod_ingest {

/// Frame rate assumed when inspection fails
constexpr double FALLBACK_FPS = 30.0;

/**
 * @class ProbeTool
 * @brief One way of inspecting a local media file.
 */
class ProbeTool {
public:
  virtual ~ProbeTool() = default;

  /// ProbeFailed when the file cannot be inspected
  virtual ErrorCode inspect(const std::string &local_path,
                            ProbeResult &out) = 0;

  virtual const char *name() const = 0;
};

class FfprobeTool : public ProbeTool {
public:
  FfprobeTool(ProcessRunner &runner, std::string binary, double timeout_sec)
      : runner_(runner), binary_(std::move(binary)), timeout_sec_(timeout_sec) {
  }

  ErrorCode inspect(const std::string &local_path, ProbeResult &out) override;
  const char *name() const override { return "ffprobe"; }

private:
  ProcessRunner &runner_;
  std::string binary_;
  double timeout_sec_;
};

class LibavProbeTool : public ProbeTool {
public:
  ErrorCode inspect(const std::string &local_path, ProbeResult &out) override;
  const char *name() const override { return "libav"; }
};

/**
 * @brief Build the tool named by PROBE_BACKEND ("ffprobe" or "libav").
 * @note Unknown names log a warning and use ffprobe.
 */
std::unique_ptr<ProbeTool> make_probe_tool(const std::string &backend,
                                           ProcessRunner &runner);

class MediaProbe {
public:
  explicit MediaProbe(ProbeTool &tool) : tool_(tool) {}

  /**
   * @brief Inspect a file; never fails.
   * @param known_size Upload size reported in the fallback
   * @return Tool output, or fallback metadata with fallback = true
   */
  ProbeResult probe(const std::string &local_path, int64_t known_size);

private:
  ProbeTool &tool_;
};

// **---- Parsing helpers ----**

/// "30000/1001" -> 29.97; 0 on malformed input or zero denominator
double parse_frame_rate(const std::string &text);

/**
 * @brief Parse ffprobe `-show_format -show_streams` JSON.
 * @return ProbeFailed on invalid JSON or when no format section exists
 */
ErrorCode parse_ffprobe_json(const std::string &json_text, ProbeResult &out);

/// Metadata used when inspection fails
ProbeResult fallback_probe_result(int64_t known_size);

} // namespace vod_ingest

#endif // VOD_INGEST_MEDIA_PROBE_HPP
