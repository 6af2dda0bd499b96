#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vod_ingest/media_probe.hpp"

using namespace vod_ingest;
using namespace vod_ingest::test_support;

namespace {

const char *kProbeJson = R"({
  "streams": [
    {"index": 0, "codec_type": "audio", "codec_name": "aac"},
    {"index": 1, "codec_type": "video", "codec_name": "h264",
     "width": 1920, "height": 1080, "r_frame_rate": "30000/1001"}
  ],
  "format": {"duration": "12.500000", "bit_rate": "4000000", "size": "6250000"}
})";

} // namespace

TEST(ParseFrameRate, Fractions) {
  EXPECT_DOUBLE_EQ(parse_frame_rate("30/1"), 30.0);
  EXPECT_NEAR(parse_frame_rate("30000/1001"), 29.97, 0.01);
}

TEST(ParseFrameRate, MalformedYieldsZero) {
  EXPECT_EQ(parse_frame_rate("30/0"), 0.0);
  EXPECT_EQ(parse_frame_rate("0/0"), 0.0);
  EXPECT_EQ(parse_frame_rate("abc"), 0.0);
  EXPECT_EQ(parse_frame_rate("30"), 0.0);
  EXPECT_EQ(parse_frame_rate("x/y"), 0.0);
  EXPECT_EQ(parse_frame_rate(""), 0.0);
}

TEST(ParseFfprobeJson, ExtractsFirstVideoStream) {
  ProbeResult r;
  ASSERT_EQ(parse_ffprobe_json(kProbeJson, r), ErrorCode::Ok);
  EXPECT_DOUBLE_EQ(r.duration, 12.5);
  EXPECT_EQ(r.bitrate, 4000000);
  EXPECT_EQ(r.size, 6250000);
  EXPECT_EQ(r.resolution, "1920x1080");
  EXPECT_EQ(r.codec, "h264");
  EXPECT_NEAR(r.fps, 29.97, 0.01);
  EXPECT_FALSE(r.fallback);
}

TEST(ParseFfprobeJson, RejectsGarbage) {
  ProbeResult r;
  EXPECT_EQ(parse_ffprobe_json("not json", r), ErrorCode::ProbeFailed);
  EXPECT_EQ(parse_ffprobe_json("{\"streams\": []}", r),
            ErrorCode::ProbeFailed);
}

TEST(FfprobeTool, RunsFfprobeWithJsonOutput) {
  FakeProcessRunner runner;
  runner.probe_output = kProbeJson;
  FfprobeTool tool(runner, "ffprobe", 60);

  ProbeResult r;
  ASSERT_EQ(tool.inspect("/tmp/in.mp4", r), ErrorCode::Ok);
  ASSERT_EQ(runner.commands.size(), 1u);
  const auto &argv = runner.commands[0];
  EXPECT_EQ(argv.front(), "ffprobe");
  EXPECT_EQ(argv.back(), "/tmp/in.mp4");
  EXPECT_NE(std::find(argv.begin(), argv.end(), "-show_streams"), argv.end());
  EXPECT_EQ(runner.timeouts[0], 60.0);
  EXPECT_EQ(r.codec, "h264");
}

TEST(MediaProbe, ToolFailureYieldsFallback) {
  FakeProcessRunner runner;
  runner.probe_exit_code = 1;
  FfprobeTool tool(runner, "ffprobe", 60);
  MediaProbe probe(tool);

  ProbeResult r = probe.probe("/tmp/broken.mp4", 3 * 1024 * 1024);
  EXPECT_TRUE(r.fallback);
  EXPECT_EQ(r.duration, 0.0);
  EXPECT_EQ(r.fps, 30.0);
  EXPECT_EQ(r.resolution, "unknown");
  EXPECT_EQ(r.codec, "unknown");
  EXPECT_EQ(r.bitrate, 0);
  EXPECT_EQ(r.size, 3 * 1024 * 1024);
}

TEST(MediaProbe, MissingSizeIsFilledFromUpload) {
  FakeProbeTool tool;
  tool.result.duration = 5;
  tool.result.size = 0;
  MediaProbe probe(tool);
  ProbeResult r = probe.probe("/tmp/x.mp4", 1234);
  EXPECT_FALSE(r.fallback);
  EXPECT_EQ(r.size, 1234);
}

TEST(MediaProbe, LibavToolFallsBackOnNonMedia) {
  TempDir dir;
  write_file(dir.sub("junk.mp4"), "definitely not a video");
  LibavProbeTool tool;
  MediaProbe probe(tool);
  ProbeResult r = probe.probe(dir.sub("junk.mp4"), 22);
  EXPECT_TRUE(r.fallback);
  EXPECT_EQ(r.size, 22);
}

TEST(MakeProbeTool, SelectsBackendByName) {
  FakeProcessRunner runner;
  EXPECT_STREQ(make_probe_tool("libav", runner)->name(), "libav");
  EXPECT_STREQ(make_probe_tool("ffprobe", runner)->name(), "ffprobe");
  EXPECT_STREQ(make_probe_tool("bogus", runner)->name(), "ffprobe");
}
