/**
 * @file blob_store.hpp
 * @brief Named byte-object storage
 *
 * @details The blob backend is an external collaborator. This header
 *          defines the narrow interface the pipeline depends on, plus a
 *          filesystem implementation used by the command-line tool.
 *
 * @attention Range reads receive the client's Range header unmodified; the
 *            backend resolves it, as an HTTP object store would.
 */

#ifndef VOD_INGEST_BLOB_STORE_HPP
#define VOD_INGEST_BLOB_STORE_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "byte_range.hpp"

namespace vod_ingest {

enum class BlobStatus { Ok, NotFound, RangeNotSatisfiable, Error };

/**
 * @class BlobReader
 * @brief Pull-based reader over one resolved byte window.
 * @note Callers pull bounded chunks, so nothing larger than one chunk is
 *       ever buffered.
 */
class BlobReader {
public:
  virtual ~BlobReader() = default;

  /**
   * @brief Read up to max_bytes of the window into out (replacing it).
   * @return false on backend error; true with empty out at end of window
   */
  virtual bool read(std::string &out, size_t max_bytes) = 0;
};

/**
 * @class BlobStore
 * @brief put/get/delete/range-get of named byte objects.
 * @note Implementations must be safe for concurrent use, and a put must
 *       replace the object atomically (readers see old or new bytes).
 */
class BlobStore {
public:
  virtual ~BlobStore() = default;

  virtual BlobStatus put(const std::string &key, const std::string &bytes) = 0;

  /// Upload a local file without loading it into memory
  virtual BlobStatus put_file(const std::string &key,
                              const std::string &local_path) = 0;

  virtual BlobStatus get(const std::string &key, std::string &out) = 0;

  virtual BlobStatus remove(const std::string &key) = 0;

  virtual BlobStatus size(const std::string &key, uint64_t &out) = 0;

  /**
   * @brief Open a reader for the window selected by a Range header.
   * @param range_header Client header value, forwarded as received
   * @param reader Output reader (set only on Ok)
   * @param range Output window; total is filled for RangeNotSatisfiable too
   */
  virtual BlobStatus open_range(const std::string &key,
                                const std::string &range_header,
                                std::unique_ptr<BlobReader> &reader,
                                ByteRange &range) = 0;
};

/**
 * @class FilesystemBlobStore
 * @brief BlobStore rooted at a local directory; keys map to relative paths.
 *
 * @attention ROBUSTNESS:
 *
 * - Writes go to a unique temp file and are renamed into place
 *
 * - Keys containing ".." or absolute paths are rejected
 */
class FilesystemBlobStore : public BlobStore {
public:
  explicit FilesystemBlobStore(std::string root);

  const std::string &root() const { return root_; }

  BlobStatus put(const std::string &key, const std::string &bytes) override;
  BlobStatus put_file(const std::string &key,
                      const std::string &local_path) override;
  BlobStatus get(const std::string &key, std::string &out) override;
  BlobStatus remove(const std::string &key) override;
  BlobStatus size(const std::string &key, uint64_t &out) override;
  BlobStatus open_range(const std::string &key, const std::string &range_header,
                        std::unique_ptr<BlobReader> &reader,
                        ByteRange &range) override;

private:
  std::string root_;

  /// Resolve key to a path under root_; false for unsafe keys
  bool resolve(const std::string &key, std::string &path) const;

  /// Unique sibling path for an atomic write
  std::string temp_path_for(const std::string &path) const;
};

/**
 * @class FileRangeReader
 * @brief Reads a byte window of a local file.
 */
class FileRangeReader : public BlobReader {
public:
  FileRangeReader(const std::string &path, uint64_t offset, uint64_t length);

  bool is_open() const { return file_.is_open(); }
  bool read(std::string &out, size_t max_bytes) override;

private:
  std::ifstream file_;
  uint64_t remaining_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_BLOB_STORE_HPP
