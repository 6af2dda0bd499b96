#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vod_ingest/streaming_proxy.hpp"

using namespace vod_ingest;
using namespace vod_ingest::test_support;

namespace {

class StreamingProxyTest : public ::testing::Test {
protected:
  void add_record(const std::string &id, StorageType type, int chunks) {
    VideoRecord r;
    r.video_id = id;
    r.org_id = "orgX";
    r.storage_type = type;
    r.chunk_count = chunks;
    ASSERT_TRUE(metadata.insert(r));
  }

  /// Pull the whole body, checking that no chunk exceeds the limit
  std::string drain(StreamResponse &resp, size_t limit) {
    std::string all, piece;
    while (resp.next_chunk(piece)) {
      EXPECT_LE(piece.size(), limit);
      all += piece;
    }
    return all;
  }

  InMemoryBlobStore blobs;
  InMemoryMetadataStore metadata;
};

} // namespace

TEST_F(StreamingProxyTest, PartialRangeOfSingleBlob) {
  const std::string payload = make_payload(1000);
  blobs.put(original_key("orgX", "v1"), payload);
  add_record("v1", StorageType::Single, 0);

  StreamingProxy proxy(blobs, metadata, 32);
  StreamResponse resp;
  ASSERT_EQ(proxy.stream_range("v1", "orgX", "bytes=100-199", resp),
            ErrorCode::Ok);
  EXPECT_EQ(resp.status, 206);
  EXPECT_EQ(resp.header("Accept-Ranges"), "bytes");
  EXPECT_EQ(resp.header("Content-Range"), "bytes 100-199/1000");
  EXPECT_EQ(resp.header("Content-Length"), "100");
  EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(drain(resp, 32), payload.substr(100, 100));
  EXPECT_FALSE(resp.failed());

  ASSERT_FALSE(blobs.range_headers.empty());
  EXPECT_EQ(blobs.range_headers.back(), "bytes=100-199");
}

TEST_F(StreamingProxyTest, NoRangeServesFullBody) {
  const std::string payload = make_payload(500);
  blobs.put(original_key("orgX", "v1"), payload);

  StreamingProxy proxy(blobs, metadata, 64);
  StreamResponse resp;
  ASSERT_EQ(proxy.stream_range("v1", "orgX", "", resp), ErrorCode::Ok);
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.header("Content-Range"), "");
  EXPECT_EQ(resp.header("Content-Length"), "500");
  EXPECT_EQ(drain(resp, 64), payload);
}

TEST_F(StreamingProxyTest, UnsatisfiableRangeIs416) {
  blobs.put(original_key("orgX", "v1"), std::string(10, 'x'));
  StreamingProxy proxy(blobs, metadata, 64);
  StreamResponse resp;
  EXPECT_EQ(proxy.stream_range("v1", "orgX", "bytes=20-30", resp),
            ErrorCode::RangeNotSatisfiable);
  EXPECT_EQ(resp.status, 416);
  EXPECT_EQ(resp.header("Content-Range"), "bytes */10");
  std::string piece;
  EXPECT_FALSE(resp.next_chunk(piece));
}

TEST_F(StreamingProxyTest, MissingAndForeignVideosAreNotFound) {
  StreamingProxy proxy(blobs, metadata, 64);
  StreamResponse resp;
  EXPECT_EQ(proxy.stream_range("ghost", "orgX", "", resp),
            ErrorCode::NotFound);

  blobs.put(original_key("orgX", "v1"), "data");
  add_record("v1", StorageType::Single, 0);
  EXPECT_EQ(proxy.stream_range("v1", "orgY", "", resp), ErrorCode::NotFound);
}

TEST_F(StreamingProxyTest, BackendErrorIsServerError) {
  blobs.put(original_key("orgX", "v1"), "data");
  blobs.fail_get_prefixes.push_back("orgX/v1/");
  StreamingProxy proxy(blobs, metadata, 64);
  StreamResponse resp;
  EXPECT_EQ(proxy.stream_range("v1", "orgX", "", resp),
            ErrorCode::ServerError);
}

TEST_F(StreamingProxyTest, ChunkedVideoRangeSpansChunkBoundaries) {
  const std::string payload = make_payload(300);
  for (int i = 0; i < 3; ++i)
    blobs.put(chunk_key("orgX", "big", i), payload.substr(i * 100, 100));
  add_record("big", StorageType::Chunked, 3);

  StreamingProxy proxy(blobs, metadata, 16);
  StreamResponse resp;
  ASSERT_EQ(proxy.stream_range("big", "orgX", "bytes=90-210", resp),
            ErrorCode::Ok);
  EXPECT_EQ(resp.status, 206);
  EXPECT_EQ(resp.header("Content-Range"), "bytes 90-210/300");
  EXPECT_EQ(drain(resp, 16), payload.substr(90, 121));

  StreamResponse full;
  ASSERT_EQ(proxy.stream_range("big", "orgX", "", full), ErrorCode::Ok);
  EXPECT_EQ(full.status, 200);
  EXPECT_EQ(drain(full, 16), payload);

  StreamResponse tail;
  ASSERT_EQ(proxy.stream_range("big", "orgX", "bytes=-5", tail),
            ErrorCode::Ok);
  EXPECT_EQ(drain(tail, 16), payload.substr(295));
}

TEST_F(StreamingProxyTest, ChunkedVideoUnsatisfiableRange) {
  blobs.put(chunk_key("orgX", "big", 0), "abc");
  add_record("big", StorageType::Chunked, 1);
  StreamingProxy proxy(blobs, metadata, 16);
  StreamResponse resp;
  EXPECT_EQ(proxy.stream_range("big", "orgX", "bytes=3-", resp),
            ErrorCode::RangeNotSatisfiable);
  EXPECT_EQ(resp.header("Content-Range"), "bytes */3");
}

TEST(HlsContentHeaders, TypeAndCacheTable) {
  std::string type, cache;
  hls_content_headers("master.m3u8", type, cache);
  EXPECT_EQ(type, "application/x-mpegURL");
  EXPECT_EQ(cache, "no-cache");
  hls_content_headers("720p_004.ts", type, cache);
  EXPECT_EQ(type, "video/MP2T");
  EXPECT_EQ(cache, "max-age=3600");
  hls_content_headers("poster.jpg", type, cache);
  EXPECT_EQ(type, "application/octet-stream");
}

TEST_F(StreamingProxyTest, ServesHlsFiles) {
  blobs.put(hls_key("orgX", "v1", "master.m3u8"), "#EXTM3U\n");
  blobs.put(hls_key("orgX", "v1", "720p_000.ts"), "segment");
  StreamingProxy proxy(blobs, metadata, 64);

  FileResponse resp;
  ASSERT_EQ(proxy.serve_hls_file("v1", "orgX", "master.m3u8", resp),
            ErrorCode::Ok);
  EXPECT_EQ(resp.body, "#EXTM3U\n");
  EXPECT_EQ(resp.content_type(), "application/x-mpegURL");
  EXPECT_EQ(resp.headers["Cache-Control"], "no-cache");

  ASSERT_EQ(proxy.serve_hls_file("v1", "orgX", "720p_000.ts", resp),
            ErrorCode::Ok);
  EXPECT_EQ(resp.content_type(), "video/MP2T");
  EXPECT_EQ(resp.headers["Cache-Control"], "max-age=3600");
}

TEST_F(StreamingProxyTest, HlsErrors) {
  StreamingProxy proxy(blobs, metadata, 64);
  FileResponse resp;
  EXPECT_EQ(proxy.serve_hls_file("v1", "orgX", "1080p.m3u8", resp),
            ErrorCode::NotFound);
  EXPECT_EQ(proxy.serve_hls_file("v1", "orgX", "../../secret", resp),
            ErrorCode::NotFound);
  EXPECT_EQ(proxy.serve_hls_file("v1", "orgX", "a/b.ts", resp),
            ErrorCode::NotFound);

  blobs.put(hls_key("orgX", "v1", "480p.m3u8"), "x");
  blobs.fail_get_prefixes.push_back("orgX/v1/hls/");
  EXPECT_EQ(proxy.serve_hls_file("v1", "orgX", "480p.m3u8", resp),
            ErrorCode::ServerError);
}

TEST_F(StreamingProxyTest, ServesThumbnailsByWholeSecond) {
  blobs.put(thumbnail_key("orgX", "v1", 12), "jpegdata");
  StreamingProxy proxy(blobs, metadata, 64);

  FileResponse resp;
  ASSERT_EQ(proxy.serve_thumbnail("v1", "orgX", 12.9, resp), ErrorCode::Ok);
  EXPECT_EQ(resp.body, "jpegdata");
  EXPECT_EQ(resp.content_type(), "image/jpeg");
  EXPECT_EQ(resp.headers["Cache-Control"], "max-age=86400");
  EXPECT_EQ(resp.headers["Access-Control-Allow-Origin"], "*");
  EXPECT_EQ(thumbnail_key("orgX", "v1", 12), "orgX/v1/thumbnails/12.jpg");

  EXPECT_EQ(proxy.serve_thumbnail("v1", "orgX", 3.0, resp),
            ErrorCode::NotFound);
  EXPECT_EQ(proxy.serve_thumbnail("v1", "orgX", -1.0, resp),
            ErrorCode::NotFound);

  blobs.fail_get_prefixes.push_back("orgX/v1/thumbnails/");
  EXPECT_EQ(proxy.serve_thumbnail("v1", "orgX", 12.0, resp),
            ErrorCode::ServerError);
}
