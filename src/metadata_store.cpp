/**
 * @file metadata_store.cpp
 * @brief In-memory metadata store and row serialization
 */

#include "vod_ingest/metadata_store.hpp"

#include <algorithm>

namespace vod_ingest {

bool InMemoryMetadataStore::insert(const VideoRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.emplace(record.video_id, record).second;
}

bool InMemoryMetadataStore::get(const std::string &video_id,
                                VideoRecord &out) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(video_id);
  if (it == records_.end())
    return false;
  out = it->second;
  return true;
}

bool InMemoryMetadataStore::update(const VideoRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(record.video_id);
  if (it == records_.end())
    return false;
  it->second = record;
  return true;
}

std::vector<VideoRecord>
InMemoryMetadataStore::list(const VideoQuery &query) {
  std::vector<VideoRecord> matches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : records_) {
      const VideoRecord &r = kv.second;
      if (!query.org_id.empty() && r.org_id != query.org_id)
        continue;
      if (query.filter_status && r.status != query.status)
        continue;
      matches.push_back(r);
    }
  }

  std::sort(matches.begin(), matches.end(),
            [](const VideoRecord &a, const VideoRecord &b) {
              if (a.uploaded_at != b.uploaded_at)
                return a.uploaded_at < b.uploaded_at;
              return a.video_id < b.video_id;
            });

  if (query.offset >= matches.size())
    return {};
  auto first = matches.begin() + static_cast<std::ptrdiff_t>(query.offset);
  auto last = matches.end();
  if (matches.size() - query.offset > query.limit)
    last = first + static_cast<std::ptrdiff_t>(query.limit);
  return std::vector<VideoRecord>(first, last);
}

nlohmann::json to_json(const VideoRecord &record) {
  nlohmann::json row;
  row["id"] = record.video_id;
  row["org_id"] = record.org_id;
  row["filename"] = record.filename;
  row["storage_path"] = record.storage_path;
  row["file_size_bytes"] = record.size_bytes;
  row["duration_seconds"] = record.duration;
  row["fps"] = record.fps;
  row["resolution"] = record.resolution;
  row["codec"] = record.codec;
  row["bitrate"] = record.bitrate;
  row["status"] = to_string(record.status);
  row["uploaded_at"] = record.uploaded_at;
  row["metadata"] = {{"storage_type", to_string(record.storage_type)},
                     {"chunk_count", record.chunk_count}};
  if (!record.hls_manifest_path.empty())
    row["hls_manifest_url"] = record.hls_manifest_path;
  if (!record.processing_error.empty())
    row["processing_error"] = record.processing_error;
  if (record.processed_at > 0)
    row["processed_at"] = record.processed_at;
  return row;
}

} // namespace vod_ingest
