/**
 * @file metadata_store.hpp
 * @brief Keyed storage of VideoRecord rows
 *
 * @details The metadata table is an external collaborator; this is the
 *          interface the pipeline needs (insert, get, update, filtered
 *          listing) and an in-memory implementation.
 */

#ifndef VOD_INGEST_METADATA_STORE_HPP
#define VOD_INGEST_METADATA_STORE_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace vod_ingest {

/**
 * @struct VideoQuery
 * @brief Equality filters plus paging for list().
 */
struct VideoQuery {
  std::string org_id;                //< Empty = any organization
  bool filter_status = false;
  VideoStatus status = VideoStatus::Uploaded;
  size_t limit = 100;
  size_t offset = 0;
};

class MetadataStore {
public:
  virtual ~MetadataStore() = default;

  /// false if a record with the same id already exists or on backend error
  virtual bool insert(const VideoRecord &record) = 0;

  /// false if the record does not exist
  virtual bool get(const std::string &video_id, VideoRecord &out) = 0;

  /// Replace an existing record; false if it does not exist
  virtual bool update(const VideoRecord &record) = 0;

  /// Records matching the query, ordered by upload time then id
  virtual std::vector<VideoRecord> list(const VideoQuery &query) = 0;
};

/**
 * @class InMemoryMetadataStore
 * @brief Mutex-guarded map of records.
 */
class InMemoryMetadataStore : public MetadataStore {
public:
  bool insert(const VideoRecord &record) override;
  bool get(const std::string &video_id, VideoRecord &out) override;
  bool update(const VideoRecord &record) override;
  std::vector<VideoRecord> list(const VideoQuery &query) override;

private:
  std::mutex mutex_;
  std::map<std::string, VideoRecord> records_;
};

/// Row representation with the persisted column names
nlohmann::json to_json(const VideoRecord &record);

} // namespace vod_ingest

#endif // VOD_INGEST_METADATA_STORE_HPP
