#pragma once

#include "warden/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden::storage {

using BlobMetadata = std::map<std::string, std::string>;

struct BlobObject {
  std::string key;
  std::uint64_t size = 0;
};

/// Immutable-object storage addressed by slash-separated keys.
class IBlobStore {
public:
  virtual ~IBlobStore() = default;

  [[nodiscard]] virtual common::Status put(const std::string &key, const std::string &content,
                                           const BlobMetadata &metadata) = 0;
  /// Objects whose key starts with `prefix`, sorted by key.
  [[nodiscard]] virtual common::Result<std::vector<BlobObject>> list(const std::string &prefix) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &key) = 0;
};

/// Stores each object as a file under `root`, with metadata in a `.meta` JSON sidecar.
class LocalBlobStore final : public IBlobStore {
public:
  explicit LocalBlobStore(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  [[nodiscard]] common::Status put(const std::string &key, const std::string &content,
                                   const BlobMetadata &metadata) override;
  [[nodiscard]] common::Result<std::vector<BlobObject>> list(const std::string &prefix) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;

  [[nodiscard]] common::Result<std::string> read(const std::string &key) const;
  [[nodiscard]] common::Result<BlobMetadata> read_metadata(const std::string &key) const;

private:
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &key) const;

  std::filesystem::path root_;
};

} // namespace warden::storage
