/**
 * @file media_probe.cpp
 * @brief ffprobe and libavformat inspection
 */

#include "vod_ingest/media_probe.hpp"

#include <cmath>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vod_ingest/config.hpp"
#include "vod_ingest/logging.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/rational.h>
}

namespace vod_ingest {

using json = nlohmann::json;

// **---- Parsing helpers ----**

double parse_frame_rate(const std::string &text) {
  size_t slash = text.find('/');
  if (slash == std::string::npos)
    return 0.0;
  try {
    size_t used = 0;
    double num = std::stod(text.substr(0, slash), &used);
    if (used != slash)
      return 0.0;
    std::string den_text = text.substr(slash + 1);
    double den = std::stod(den_text, &used);
    if (used != den_text.size() || den == 0.0 || !std::isfinite(num / den))
      return 0.0;
    return num / den;
  } catch (const std::exception &) {
    return 0.0;
  }
}

namespace {

/// ffprobe reports numbers as strings ("12.5"); accept both forms
double number_field(const json &obj, const char *key, double default_val) {
  auto it = obj.find(key);
  if (it == obj.end())
    return default_val;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    try {
      return std::stod(it->get<std::string>());
    } catch (const std::exception &) {
      return default_val;
    }
  }
  return default_val;
}

} // anonymous namespace

ErrorCode parse_ffprobe_json(const std::string &json_text, ProbeResult &out) {
  json doc = json::parse(json_text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    return ErrorCode::ProbeFailed;

  auto format = doc.find("format");
  if (format == doc.end() || !format->is_object())
    return ErrorCode::ProbeFailed;

  ProbeResult r;
  r.duration = number_field(*format, "duration", 0.0);
  r.bitrate = static_cast<int64_t>(number_field(*format, "bit_rate", 0.0));
  r.size = static_cast<int64_t>(number_field(*format, "size", 0.0));
  r.resolution = "unknown";
  r.codec = "unknown";

  auto streams = doc.find("streams");
  if (streams != doc.end() && streams->is_array()) {
    try {
      for (const auto &stream : *streams) {
        if (!stream.is_object() || stream.value("codec_type", "") != "video")
          continue;
        r.codec = stream.value("codec_name", "unknown");
        r.fps = parse_frame_rate(stream.value("r_frame_rate", ""));
        int w = static_cast<int>(number_field(stream, "width", 0));
        int h = static_cast<int>(number_field(stream, "height", 0));
        if (w > 0 && h > 0)
          r.resolution = fmt::format("{}x{}", w, h);
        break;
      }
    } catch (const json::exception &e) {
      LOG_WARN("Malformed ffprobe stream entry: {}", e.what());
      return ErrorCode::ProbeFailed;
    }
  }

  out = r;
  return ErrorCode::Ok;
}

ProbeResult fallback_probe_result(int64_t known_size) {
  ProbeResult r;
  r.duration = 0.0;
  r.fps = FALLBACK_FPS;
  r.resolution = "unknown";
  r.codec = "unknown";
  r.bitrate = 0;
  r.size = known_size;
  r.fallback = true;
  return r;
}

// **---- FfprobeTool ----**

ErrorCode FfprobeTool::inspect(const std::string &local_path,
                               ProbeResult &out) {
  std::vector<std::string> argv = {binary_,         "-v",           "quiet",
                                   "-print_format", "json",         "-show_format",
                                   "-show_streams", local_path};

  ProcessResult pr = runner_.run(argv, timeout_sec_, true);
  if (!pr.ok()) {
    LOG_WARN("ffprobe failed on {} (exit {}{})", local_path, pr.exit_code,
             pr.timed_out ? ", timed out" : "");
    return ErrorCode::ProbeFailed;
  }

  if (parse_ffprobe_json(pr.output, out) != ErrorCode::Ok) {
    LOG_WARN("ffprobe returned unparsable output for {}", local_path);
    return ErrorCode::ProbeFailed;
  }
  return ErrorCode::Ok;
}

// **---- LibavProbeTool ----**

ErrorCode LibavProbeTool::inspect(const std::string &local_path,
                                  ProbeResult &out) {
  AVFormatContext *fmt_ctx = nullptr;
  if (avformat_open_input(&fmt_ctx, local_path.c_str(), nullptr, nullptr) <
      0) {
    LOG_WARN("avformat_open_input failed on {}", local_path);
    return ErrorCode::ProbeFailed;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_WARN("avformat_find_stream_info failed on {}", local_path);
    avformat_close_input(&fmt_ctx);
    return ErrorCode::ProbeFailed;
  }

  ProbeResult r;
  r.duration = fmt_ctx->duration > 0
                   ? static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE
                   : 0.0;
  r.bitrate = fmt_ctx->bit_rate;
  r.size = fmt_ctx->pb ? avio_size(fmt_ctx->pb) : 0;
  if (r.size < 0)
    r.size = 0;
  r.resolution = "unknown";
  r.codec = "unknown";

  int idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (idx >= 0) {
    AVStream *stream = fmt_ctx->streams[idx];
    AVCodecParameters *par = stream->codecpar;
    const char *codec_name = avcodec_get_name(par->codec_id);
    if (codec_name)
      r.codec = codec_name;
    if (par->width > 0 && par->height > 0)
      r.resolution = fmt::format("{}x{}", par->width, par->height);
    AVRational rate = stream->r_frame_rate;
    r.fps = rate.den > 0 ? av_q2d(rate) : 0.0;
  }

  avformat_close_input(&fmt_ctx);
  out = r;
  return ErrorCode::Ok;
}

std::unique_ptr<ProbeTool> make_probe_tool(const std::string &backend,
                                           ProcessRunner &runner) {
  if (backend == "libav")
    return std::make_unique<LibavProbeTool>();
  if (backend != "ffprobe")
    LOG_WARN("Unknown PROBE_BACKEND '{}', using ffprobe", backend);
  return std::make_unique<FfprobeTool>(runner, Config::ffprobe_bin(),
                                       Config::probe_timeout_sec());
}

// **---- MediaProbe ----**

ProbeResult MediaProbe::probe(const std::string &local_path,
                              int64_t known_size) {
  ProbeResult r;
  if (tool_.inspect(local_path, r) != ErrorCode::Ok) {
    LOG_WARN("Probe ({}) failed for {}; using fallback metadata",
             tool_.name(), local_path);
    return fallback_probe_result(known_size);
  }
  if (r.size <= 0)
    r.size = known_size;
  return r;
}

} // namespace vod_ingest
