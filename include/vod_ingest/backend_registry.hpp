/**
 * @file backend_registry.hpp
 * @brief Process-wide storage backends with explicit init/teardown
 *
 * @details The registry is created once by main() and its stores are
 *          injected into components. connect() reports a tagged state so
 *          callers can tell "no backend" apart from "backend returned
 *          nothing"; there is no silent no-op fallback.
 */

#ifndef VOD_INGEST_BACKEND_REGISTRY_HPP
#define VOD_INGEST_BACKEND_REGISTRY_HPP

#include <memory>
#include <string>
#include <utility>

#include "blob_store.hpp"
#include "metadata_store.hpp"

namespace vod_ingest {

enum class BackendState { Connected, Unavailable };

/**
 * @struct BackendConnection
 * @brief Outcome of BackendRegistry::connect().
 * @note blobs and metadata are set only when state == Connected.
 */
struct BackendConnection {
  BackendState state = BackendState::Unavailable;
  std::string reason; //< Why the backend is unavailable
  std::shared_ptr<BlobStore> blobs;
  std::shared_ptr<MetadataStore> metadata;

  bool connected() const { return state == BackendState::Connected; }
};

class BackendRegistry {
public:
  explicit BackendRegistry(std::string blob_root)
      : blob_root_(std::move(blob_root)) {}
  ~BackendRegistry() { shutdown(); }

  BackendRegistry(const BackendRegistry &) = delete;
  BackendRegistry &operator=(const BackendRegistry &) = delete;

  /**
   * @brief Open the blob root and metadata store.
   * @note Idempotent while connected.
   */
  const BackendConnection &connect();

  /// Drop the stores; components must not be used afterwards
  void shutdown();

  const BackendConnection &connection() const { return connection_; }

private:
  std::string blob_root_;
  BackendConnection connection_;
};

} // namespace vod_ingest

#endif // VOD_INGEST_BACKEND_REGISTRY_HPP
