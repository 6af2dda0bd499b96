/**
 * @file blob_store.cpp
 * @brief Filesystem blob store implementation
 */

#include "vod_ingest/blob_store.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <functional>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "vod_ingest/logging.hpp"

namespace vod_ingest {

namespace fs = std::filesystem;

namespace {

/// Monotonic suffix so concurrent writers never share a temp file
std::atomic<unsigned long> temp_counter{0};

bool rename_into_place(const std::string &tmp, const std::string &path) {
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    LOG_ERROR("Failed to move {} into place: {}", path, ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // anonymous namespace

// **---- FilesystemBlobStore ----**

FilesystemBlobStore::FilesystemBlobStore(std::string root)
    : root_(std::move(root)) {}

bool FilesystemBlobStore::resolve(const std::string &key,
                                  std::string &path) const {
  if (key.empty() || key.front() == '/')
    return false;
  fs::path rel(key);
  for (const auto &part : rel) {
    if (part == "..")
      return false;
  }
  path = (fs::path(root_) / rel).string();
  return true;
}

std::string FilesystemBlobStore::temp_path_for(const std::string &path) const {
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return fmt::format("{}.tmp.{:x}.{}", path, tid, ++temp_counter);
}

BlobStatus FilesystemBlobStore::put(const std::string &key,
                                    const std::string &bytes) {
  std::string path;
  if (!resolve(key, path)) {
    LOG_ERROR("Rejected blob key: {}", key);
    return BlobStatus::Error;
  }

  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) {
    LOG_ERROR("Failed to create directory for {}: {}", key, ec.message());
    return BlobStatus::Error;
  }

  std::string tmp = temp_path_for(path);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      LOG_ERROR("Failed to open {} for writing", tmp);
      return BlobStatus::Error;
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs) {
      LOG_ERROR("Short write for blob {}", key);
      ofs.close();
      fs::remove(tmp, ec);
      return BlobStatus::Error;
    }
  }
  return rename_into_place(tmp, path) ? BlobStatus::Ok : BlobStatus::Error;
}

BlobStatus FilesystemBlobStore::put_file(const std::string &key,
                                         const std::string &local_path) {
  std::string path;
  if (!resolve(key, path)) {
    LOG_ERROR("Rejected blob key: {}", key);
    return BlobStatus::Error;
  }

  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) {
    LOG_ERROR("Failed to create directory for {}: {}", key, ec.message());
    return BlobStatus::Error;
  }

  std::string tmp = temp_path_for(path);
  fs::copy_file(local_path, tmp, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_ERROR("Failed to copy {} to blob {}: {}", local_path, key,
              ec.message());
    fs::remove(tmp, ec);
    return BlobStatus::Error;
  }
  return rename_into_place(tmp, path) ? BlobStatus::Ok : BlobStatus::Error;
}

BlobStatus FilesystemBlobStore::get(const std::string &key, std::string &out) {
  std::string path;
  if (!resolve(key, path))
    return BlobStatus::NotFound;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return ec && ec != std::errc::no_such_file_or_directory
               ? BlobStatus::Error
               : BlobStatus::NotFound;

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    LOG_ERROR("Failed to open blob {}", key);
    return BlobStatus::Error;
  }
  out.assign(std::istreambuf_iterator<char>(ifs),
             std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    LOG_ERROR("Read error on blob {}", key);
    return BlobStatus::Error;
  }
  return BlobStatus::Ok;
}

BlobStatus FilesystemBlobStore::remove(const std::string &key) {
  std::string path;
  if (!resolve(key, path))
    return BlobStatus::NotFound;

  std::error_code ec;
  bool removed = fs::remove(path, ec);
  if (ec) {
    LOG_ERROR("Failed to delete blob {}: {}", key, ec.message());
    return BlobStatus::Error;
  }
  return removed ? BlobStatus::Ok : BlobStatus::NotFound;
}

BlobStatus FilesystemBlobStore::size(const std::string &key, uint64_t &out) {
  std::string path;
  if (!resolve(key, path))
    return BlobStatus::NotFound;

  std::error_code ec;
  auto sz = fs::file_size(path, ec);
  if (ec) {
    return ec == std::errc::no_such_file_or_directory ? BlobStatus::NotFound
                                                      : BlobStatus::Error;
  }
  out = static_cast<uint64_t>(sz);
  return BlobStatus::Ok;
}

BlobStatus FilesystemBlobStore::open_range(const std::string &key,
                                           const std::string &range_header,
                                           std::unique_ptr<BlobReader> &reader,
                                           ByteRange &range) {
  uint64_t total = 0;
  BlobStatus st = size(key, total);
  if (st != BlobStatus::Ok)
    return st;

  if (resolve_range(range_header, total, range) ==
      RangeOutcome::Unsatisfiable) {
    range.total = total;
    return BlobStatus::RangeNotSatisfiable;
  }

  std::string path;
  if (!resolve(key, path))
    return BlobStatus::NotFound;
  auto file_reader =
      std::make_unique<FileRangeReader>(path, range.offset, range.length);
  if (!file_reader->is_open()) {
    LOG_ERROR("Failed to open blob {} for range read", key);
    return BlobStatus::Error;
  }
  reader = std::move(file_reader);
  return BlobStatus::Ok;
}

// **---- FileRangeReader ----**

FileRangeReader::FileRangeReader(const std::string &path, uint64_t offset,
                                 uint64_t length)
    : file_(path, std::ios::binary), remaining_(length) {
  if (file_)
    file_.seekg(static_cast<std::streamoff>(offset));
}

bool FileRangeReader::read(std::string &out, size_t max_bytes) {
  out.clear();
  if (remaining_ == 0)
    return true;

  size_t want = static_cast<size_t>(
      std::min<uint64_t>(remaining_, static_cast<uint64_t>(max_bytes)));
  out.resize(want);
  file_.read(&out[0], static_cast<std::streamsize>(want));
  auto got = static_cast<size_t>(file_.gcount());
  out.resize(got);
  if (got == 0) {
    /// File shrank underneath us
    return false;
  }
  remaining_ -= got;
  return true;
}

} // namespace vod_ingest
