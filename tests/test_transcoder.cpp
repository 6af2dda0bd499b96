#include <gtest/gtest.h>

#include <algorithm>

#include "test_support.hpp"
#include "vod_ingest/transcoder.hpp"

using namespace vod_ingest;
using namespace vod_ingest::test_support;

namespace {

class TranscoderTest : public ::testing::Test {
protected:
  Transcoder make_transcoder() {
    TranscodeOptions opts;
    opts.ffmpeg_bin = "ffmpeg";
    opts.work_dir = work.path();
    opts.segment_sec = 10;
    opts.timeout_factor = 4.0;
    opts.min_timeout_sec = 300;
    return Transcoder(blobs, runner, opts);
  }

  TempDir work;
  InMemoryBlobStore blobs;
  FakeProcessRunner runner;
};

} // namespace

TEST(Ladder, DefaultRenditions) {
  const auto &ladder = default_ladder();
  ASSERT_EQ(ladder.size(), 3u);
  EXPECT_EQ(ladder[0].name, "1080p");
  EXPECT_EQ(ladder[0].bandwidth(), 5128000);
  EXPECT_EQ(ladder[1].resolution(), "1280x720");
  EXPECT_EQ(ladder[2].width, 854);
  EXPECT_EQ(ladder[2].bandwidth(), 1096000);
  EXPECT_EQ(ladder[2].bufsize_kbps, 1500);
}

TEST(Ladder, MasterManifestFormat) {
  MasterManifest m;
  m.entries.push_back({"720p.m3u8", 2628000, "1280x720"});
  m.entries.push_back({"480p.m3u8", 1096000, "854x480"});
  EXPECT_EQ(m.serialize(),
            "#EXTM3U\n#EXT-X-VERSION:3\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=2628000,RESOLUTION=1280x720\n"
            "720p.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=1096000,RESOLUTION=854x480\n"
            "480p.m3u8\n");
}

TEST(Ladder, RenditionCommand) {
  auto argv = build_rendition_command("ffmpeg", "/in/original", "/out",
                                      default_ladder()[1], 10);
  auto has_pair = [&](const std::string &flag, const std::string &value) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    return it != argv.end() && (it + 1) != argv.end() && *(it + 1) == value;
  };
  EXPECT_EQ(argv.front(), "ffmpeg");
  EXPECT_TRUE(has_pair("-i", "/in/original"));
  EXPECT_TRUE(has_pair("-vf", "scale=1280:720:force_original_aspect_ratio="
                              "decrease,pad=1280:720:(ow-iw)/2:(oh-ih)/2"));
  EXPECT_TRUE(has_pair("-c:v", "h264"));
  EXPECT_TRUE(has_pair("-preset", "fast"));
  EXPECT_TRUE(has_pair("-b:v", "2500k"));
  EXPECT_TRUE(has_pair("-maxrate", "2675k"));
  EXPECT_TRUE(has_pair("-bufsize", "3750k"));
  EXPECT_TRUE(has_pair("-b:a", "128k"));
  EXPECT_TRUE(has_pair("-f", "hls"));
  EXPECT_TRUE(has_pair("-hls_time", "10"));
  EXPECT_TRUE(has_pair("-hls_list_size", "0"));
  EXPECT_TRUE(has_pair("-hls_segment_filename", "/out/720p_%03d.ts"));
  EXPECT_EQ(argv.back(), "/out/720p.m3u8");
}

TEST(Ladder, TimeoutScalesWithDuration) {
  TranscodeOptions opts;
  opts.timeout_factor = 4.0;
  opts.min_timeout_sec = 300;
  EXPECT_DOUBLE_EQ(rendition_timeout(opts, 10), 300.0);
  EXPECT_DOUBLE_EQ(rendition_timeout(opts, 600), 2400.0);
}

TEST_F(TranscoderTest, AllRenditionsSucceed) {
  auto transcoder = make_transcoder();
  MasterManifest m;
  ASSERT_EQ(transcoder.transcode("/in", "v1", "orgX", 100, {2, 3}, m),
            ErrorCode::Ok);
  ASSERT_EQ(m.entries.size(), 3u);
  EXPECT_EQ(m.entries[0].playlist, "1080p.m3u8");

  EXPECT_EQ(blobs.value("orgX/v1/hls/master.m3u8"), m.serialize());
  for (const char *name : {"1080p", "720p", "480p"}) {
    EXPECT_TRUE(blobs.contains(fmt::format("orgX/v1/hls/{}.m3u8", name)));
    EXPECT_TRUE(blobs.contains(fmt::format("orgX/v1/hls/{}_000.ts", name)));
    EXPECT_TRUE(blobs.contains(fmt::format("orgX/v1/hls/{}_001.ts", name)));
  }
  ASSERT_EQ(runner.cpu_sets.size(), 3u);
  EXPECT_EQ(runner.cpu_sets[0], (std::vector<int>{2, 3}));
  EXPECT_DOUBLE_EQ(runner.timeouts[0], 400.0);
  EXPECT_FALSE(fs::exists(transcoder.output_dir("v1")));
}

TEST_F(TranscoderTest, FailedRenditionIsSkipped) {
  runner.outcomes["720p"] = FakeOutcome::ExitFailure;
  auto transcoder = make_transcoder();
  MasterManifest m;
  ASSERT_EQ(transcoder.transcode("/in", "v1", "orgX", 0, {}, m),
            ErrorCode::Ok);

  ASSERT_EQ(m.entries.size(), 2u);
  EXPECT_EQ(m.entries[0].playlist, "1080p.m3u8");
  EXPECT_EQ(m.entries[1].playlist, "480p.m3u8");
  EXPECT_TRUE(blobs.keys_with_prefix("orgX/v1/hls/720p").empty());
  EXPECT_EQ(blobs.value("orgX/v1/hls/master.m3u8").find("720p"),
            std::string::npos);
}

TEST_F(TranscoderTest, TimeoutAndMissingPlaylistCountAsFailures) {
  runner.outcomes["1080p"] = FakeOutcome::Timeout;
  runner.outcomes["720p"] = FakeOutcome::NoPlaylist;
  auto transcoder = make_transcoder();
  MasterManifest m;
  ASSERT_EQ(transcoder.transcode("/in", "v1", "orgX", 0, {}, m),
            ErrorCode::Ok);
  ASSERT_EQ(m.entries.size(), 1u);
  EXPECT_EQ(m.entries[0].resolution, "854x480");
}

TEST_F(TranscoderTest, AllFailedUploadsNothing) {
  runner.outcomes["1080p"] = FakeOutcome::ExitFailure;
  runner.outcomes["720p"] = FakeOutcome::LaunchFailure;
  runner.outcomes["480p"] = FakeOutcome::Timeout;
  auto transcoder = make_transcoder();
  MasterManifest m;
  EXPECT_EQ(transcoder.transcode("/in", "v1", "orgX", 0, {}, m),
            ErrorCode::TranscodeFailed);
  EXPECT_TRUE(m.entries.empty());
  EXPECT_EQ(blobs.put_calls, 0);
  EXPECT_FALSE(fs::exists(transcoder.output_dir("v1")));
}

TEST_F(TranscoderTest, UploadFailureIsStorageErrorAndCleansUp) {
  blobs.fail_put_prefixes.push_back("orgX/v1/hls/master.m3u8");
  auto transcoder = make_transcoder();
  MasterManifest m;
  EXPECT_EQ(transcoder.transcode("/in", "v1", "orgX", 0, {}, m),
            ErrorCode::StorageError);
  EXPECT_FALSE(fs::exists(transcoder.output_dir("v1")));
}

TEST_F(TranscoderTest, RecordsPerRenditionTimings) {
  auto transcoder = make_transcoder();
  StageTimings timings("test");
  MasterManifest m;
  ASSERT_EQ(transcoder.transcode("/in", "v1", "orgX", 0, {}, m, &timings),
            ErrorCode::Ok);
  auto entries = timings.entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[1].name, "transcode 720p");
}
