#include "warden/storage/blob_store.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace warden::storage {

namespace {

constexpr const char *META_SUFFIX = ".meta";

std::filesystem::path meta_path(const std::filesystem::path &path) {
  return std::filesystem::path(path.string() + META_SUFFIX);
}

std::string render_metadata(const BlobMetadata &metadata) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : metadata) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_string(key) << ":" << common::json_string(value);
  }
  out << "}";
  return out.str();
}

void prune_empty_dirs(std::filesystem::path dir, const std::filesystem::path &root) {
  std::error_code ec;
  while (!dir.empty() && dir != root && std::filesystem::is_directory(dir, ec) &&
         std::filesystem::is_empty(dir, ec)) {
    std::filesystem::remove(dir, ec);
    dir = dir.parent_path();
  }
}

} // namespace

LocalBlobStore::LocalBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

common::Result<std::filesystem::path> LocalBlobStore::resolve(const std::string &key) const {
  if (key.empty() || key.front() == '/' || common::ends_with(key, META_SUFFIX)) {
    return common::Result<std::filesystem::path>::failure("invalid blob key: " + key,
                                                          common::ErrorKind::Invalid);
  }
  for (const auto &segment : common::split(key, '/')) {
    if (segment.empty() || segment == "." || segment == "..") {
      return common::Result<std::filesystem::path>::failure("invalid blob key: " + key,
                                                            common::ErrorKind::Invalid);
    }
  }
  return common::Result<std::filesystem::path>::success(root_ / key);
}

common::Status LocalBlobStore::put(const std::string &key, const std::string &content,
                                   const BlobMetadata &metadata) {
  auto path = resolve(key);
  if (!path.ok()) {
    return common::Status::from(path.details());
  }
  auto dir = common::ensure_dir(path.value().parent_path());
  if (!dir.ok()) {
    return common::Status::error(dir.error(), common::ErrorKind::Flush);
  }
  if (auto meta = common::write_file_atomic(meta_path(path.value()), render_metadata(metadata));
      !meta.ok()) {
    return common::Status::error(meta.error(), common::ErrorKind::Flush);
  }
  if (auto written = common::write_file_atomic(path.value(), content); !written.ok()) {
    return common::Status::error(written.error(), common::ErrorKind::Flush);
  }
  return common::Status::success();
}

common::Result<std::vector<BlobObject>> LocalBlobStore::list(const std::string &prefix) {
  std::vector<BlobObject> objects;
  std::error_code ec;
  if (!std::filesystem::exists(root_, ec)) {
    return common::Result<std::vector<BlobObject>>::success(std::move(objects));
  }

  std::filesystem::recursive_directory_iterator it(root_, ec);
  if (ec) {
    return common::Result<std::vector<BlobObject>>::failure("list " + root_.string() + ": " +
                                                            ec.message());
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const std::string key = std::filesystem::relative(entry.path(), root_, ec).generic_string();
    if (ec || common::ends_with(key, META_SUFFIX) || common::ends_with(key, ".tmp")) {
      continue;
    }
    if (!common::starts_with(key, prefix)) {
      continue;
    }
    objects.push_back(BlobObject{.key = key, .size = entry.file_size(ec)});
  }
  std::sort(objects.begin(), objects.end(),
            [](const BlobObject &a, const BlobObject &b) { return a.key < b.key; });
  return common::Result<std::vector<BlobObject>>::success(std::move(objects));
}

common::Status LocalBlobStore::remove(const std::string &key) {
  auto path = resolve(key);
  if (!path.ok()) {
    return common::Status::from(path.details());
  }
  std::error_code ec;
  std::filesystem::remove(path.value(), ec);
  if (ec) {
    return common::Status::error("remove " + key + ": " + ec.message());
  }
  std::filesystem::remove(meta_path(path.value()), ec);
  prune_empty_dirs(path.value().parent_path(), root_);
  return common::Status::success();
}

common::Result<std::string> LocalBlobStore::read(const std::string &key) const {
  auto path = resolve(key);
  if (!path.ok()) {
    return common::Result<std::string>::failure(path.details());
  }
  return common::read_file(path.value());
}

common::Result<BlobMetadata> LocalBlobStore::read_metadata(const std::string &key) const {
  auto path = resolve(key);
  if (!path.ok()) {
    return common::Result<BlobMetadata>::failure(path.details());
  }
  auto raw = common::read_file(meta_path(path.value()));
  if (!raw.ok()) {
    return common::Result<BlobMetadata>::failure(raw.error());
  }
  BlobMetadata metadata;
  for (const auto &[name, value] : common::json_object_members(raw.value())) {
    metadata[name] = common::json_value_as_string(value);
  }
  return common::Result<BlobMetadata>::success(std::move(metadata));
}

} // namespace warden::storage
