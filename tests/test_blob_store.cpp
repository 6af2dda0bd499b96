#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "test_support.hpp"
#include "vod_ingest/backend_registry.hpp"
#include "vod_ingest/blob_store.hpp"

using namespace vod_ingest;
using namespace vod_ingest::test_support;

namespace {

std::string drain(BlobReader &reader, size_t chunk) {
  std::string all, piece;
  while (reader.read(piece, chunk) && !piece.empty())
    all += piece;
  return all;
}

} // namespace

TEST(FilesystemBlobStore, PutGetOverwriteRemove) {
  TempDir dir;
  FilesystemBlobStore store(dir.path());

  ASSERT_EQ(store.put("org/v/chunks/chunk_00000", "first"), BlobStatus::Ok);
  ASSERT_EQ(store.put("org/v/chunks/chunk_00000", "second"), BlobStatus::Ok);

  std::string out;
  ASSERT_EQ(store.get("org/v/chunks/chunk_00000", out), BlobStatus::Ok);
  EXPECT_EQ(out, "second");

  uint64_t size = 0;
  ASSERT_EQ(store.size("org/v/chunks/chunk_00000", size), BlobStatus::Ok);
  EXPECT_EQ(size, 6u);

  EXPECT_EQ(store.remove("org/v/chunks/chunk_00000"), BlobStatus::Ok);
  EXPECT_EQ(store.remove("org/v/chunks/chunk_00000"), BlobStatus::NotFound);
  EXPECT_EQ(store.get("org/v/chunks/chunk_00000", out), BlobStatus::NotFound);
}

TEST(FilesystemBlobStore, PutFileCopiesLocalFile) {
  TempDir dir;
  FilesystemBlobStore store(dir.sub("blobs"));
  std::string payload = make_payload(4096);
  write_file(dir.sub("local.bin"), payload);

  ASSERT_EQ(store.put_file("o/v/original", dir.sub("local.bin")),
            BlobStatus::Ok);
  std::string out;
  ASSERT_EQ(store.get("o/v/original", out), BlobStatus::Ok);
  EXPECT_EQ(out, payload);

  EXPECT_EQ(store.put_file("o/v/other", dir.sub("missing.bin")),
            BlobStatus::Error);
}

TEST(FilesystemBlobStore, RejectsTraversalKeys) {
  TempDir dir;
  FilesystemBlobStore store(dir.sub("blobs"));
  EXPECT_EQ(store.put("../escape", "x"), BlobStatus::Error);
  EXPECT_EQ(store.put("/abs/path", "x"), BlobStatus::Error);
  std::string out;
  EXPECT_EQ(store.get("a/../../b", out), BlobStatus::NotFound);
  EXPECT_FALSE(fs::exists(dir.sub("escape")));
}

TEST(FilesystemBlobStore, RangeReadIsChunked) {
  TempDir dir;
  FilesystemBlobStore store(dir.path());
  std::string payload = make_payload(1000);
  ASSERT_EQ(store.put("o/v/original", payload), BlobStatus::Ok);

  std::unique_ptr<BlobReader> reader;
  ByteRange range;
  ASSERT_EQ(store.open_range("o/v/original", "bytes=100-199", reader, range),
            BlobStatus::Ok);
  EXPECT_TRUE(range.partial);
  EXPECT_EQ(range.total, 1000u);

  std::string piece;
  ASSERT_TRUE(reader->read(piece, 64));
  EXPECT_EQ(piece.size(), 64u);
  std::string rest = drain(*reader, 64);
  EXPECT_EQ(piece + rest, payload.substr(100, 100));
}

TEST(FilesystemBlobStore, UnsatisfiableRangeReportsTotal) {
  TempDir dir;
  FilesystemBlobStore store(dir.path());
  ASSERT_EQ(store.put("o/v/original", std::string(10, 'a')), BlobStatus::Ok);

  std::unique_ptr<BlobReader> reader;
  ByteRange range;
  EXPECT_EQ(store.open_range("o/v/original", "bytes=50-", reader, range),
            BlobStatus::RangeNotSatisfiable);
  EXPECT_EQ(range.total, 10u);
  EXPECT_EQ(reader, nullptr);

  EXPECT_EQ(store.open_range("o/v/none", "", reader, range),
            BlobStatus::NotFound);
}

TEST(BackendRegistry, ConnectAndShutdown) {
  TempDir dir;
  BackendRegistry registry(dir.sub("root"));
  const BackendConnection &conn = registry.connect();
  ASSERT_TRUE(conn.connected());
  ASSERT_NE(conn.blobs, nullptr);
  ASSERT_NE(conn.metadata, nullptr);
  EXPECT_TRUE(fs::is_directory(dir.sub("root")));

  registry.shutdown();
  EXPECT_FALSE(registry.connection().connected());
  EXPECT_EQ(registry.connection().blobs, nullptr);
}

TEST(BackendRegistry, UnusableRootIsReportedUnavailable) {
  TempDir dir;
  write_file(dir.sub("file"), "not a directory");
  BackendRegistry registry(dir.sub("file"));
  const BackendConnection &conn = registry.connect();
  EXPECT_FALSE(conn.connected());
  EXPECT_EQ(conn.state, BackendState::Unavailable);
  EXPECT_FALSE(conn.reason.empty());
  EXPECT_EQ(conn.blobs, nullptr);
}
