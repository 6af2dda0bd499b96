/**
 * @file backend_registry.cpp
 * @brief Backend connection and teardown
 */

#include "vod_ingest/backend_registry.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "vod_ingest/logging.hpp"

namespace vod_ingest {

namespace fs = std::filesystem;

const BackendConnection &BackendRegistry::connect() {
  if (connection_.connected())
    return connection_;

  connection_ = BackendConnection{};

  std::error_code ec;
  fs::create_directories(blob_root_, ec);
  if (ec || !fs::is_directory(blob_root_, ec)) {
    connection_.reason = fmt::format("blob root {} is not usable: {}",
                                     blob_root_, ec.message());
    LOG_ERROR("Blob backend unavailable: {}", connection_.reason);
    return connection_;
  }

  connection_.blobs = std::make_shared<FilesystemBlobStore>(blob_root_);
  connection_.metadata = std::make_shared<InMemoryMetadataStore>();
  connection_.state = BackendState::Connected;
  LOG_INFO("Backends connected (blob root: {})", blob_root_);
  return connection_;
}

void BackendRegistry::shutdown() {
  if (!connection_.connected())
    return;
  connection_ = BackendConnection{};
  connection_.reason = "shut down";
  LOG_INFO("Backends released");
}

} // namespace vod_ingest
