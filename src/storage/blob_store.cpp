#include "quiver/storage/blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace quiver::storage {

namespace {

constexpr std::string_view kTmpSuffix = ".tmp";

auto fsync_path(const std::filesystem::path& p) -> bool {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) return false;
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
#else
  (void)p;
  return true;
#endif
}

} // namespace

auto MemoryBlobStore::write(std::string_view key, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  std::lock_guard lock(mutex_);
  blobs_.insert_or_assign(std::string(key), std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
  return {};
}

auto MemoryBlobStore::read(std::string_view key) const
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::lock_guard lock(mutex_);
  auto it = blobs_.find(key);
  if (it == blobs_.end()) {
    return core::make_error(core::error_code::not_found, "blob '" + std::string(key) + "' not found",
                            "storage.memory_blob");
  }
  return it->second;
}

auto MemoryBlobStore::remove(std::string_view key) -> std::expected<void, core::error> {
  std::lock_guard lock(mutex_);
  auto it = blobs_.find(key);
  if (it != blobs_.end()) blobs_.erase(it);
  return {};
}

auto MemoryBlobStore::list(std::string_view prefix) const
    -> std::expected<std::vector<std::string>, core::error> {
  std::lock_guard lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = blobs_.lower_bound(prefix); it != blobs_.end(); ++it) {
    if (!it->first.starts_with(prefix)) break;
    keys.push_back(it->first);
  }
  return keys;
}

auto FileBlobStore::open(const std::filesystem::path& dir)
    -> std::expected<std::shared_ptr<FileBlobStore>, core::error> {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec || !std::filesystem::is_directory(dir, ec)) {
    return core::make_error(core::error_code::io_failed,
                            "cannot open blob directory " + dir.string(), "storage.file_blob");
  }
  return std::make_shared<FileBlobStore>(dir);
}

auto FileBlobStore::path_for(std::string_view key) const
    -> std::expected<std::filesystem::path, core::error> {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string_view::npos ||
      key.ends_with(kTmpSuffix)) {
    return core::make_error(core::error_code::precondition_failed,
                            "invalid blob key '" + std::string(key) + "'", "storage.file_blob");
  }
  return root_ / std::filesystem::path(std::string(key));
}

auto FileBlobStore::write(std::string_view key, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  using core::error_code;
  auto dst = path_for(key);
  if (!dst) return std::unexpected(dst.error());

  std::error_code ec;
  std::filesystem::create_directories(dst->parent_path(), ec);
  if (ec) {
    return core::make_error(error_code::io_failed, "mkdir failed for " + dst->string(),
                            "storage.file_blob");
  }

  auto tmp = *dst;
  tmp += kTmpSuffix;
  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return core::make_error(error_code::io_failed, "tmp open failed for " + tmp.string(),
                              "storage.file_blob");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      std::filesystem::remove(tmp, ec);
      return core::make_error(error_code::io_failed, "tmp write failed for " + tmp.string(),
                              "storage.file_blob");
    }
  }
  // 2) Ensure tmp contents durable
  if (!fsync_path(tmp)) {
    std::filesystem::remove(tmp, ec);
    return core::make_error(error_code::io_failed, "tmp fsync failed for " + tmp.string(),
                            "storage.file_blob");
  }
  // 3) Atomic rename over the destination
  std::filesystem::rename(tmp, *dst, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return core::make_error(error_code::io_failed, "rename failed for " + dst->string(),
                            "storage.file_blob");
  }
  // 4) Persist the directory entry
  if (!fsync_path(dst->parent_path())) {
    return core::make_error(error_code::io_failed, "directory fsync failed for " + dst->string(),
                            "storage.file_blob");
  }
  return {};
}

auto FileBlobStore::read(std::string_view key) const
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto p = path_for(key);
  if (!p) return std::unexpected(p.error());

  std::ifstream in(*p, std::ios::binary);
  if (!in.good()) {
    std::error_code ec;
    if (!std::filesystem::exists(*p, ec)) {
      return core::make_error(core::error_code::not_found, "blob '" + std::string(key) + "' not found",
                              "storage.file_blob");
    }
    return core::make_error(core::error_code::io_failed, "open failed for " + p->string(),
                            "storage.file_blob");
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return core::make_error(core::error_code::io_failed, "read failed for " + p->string(),
                            "storage.file_blob");
  }
  return bytes;
}

auto FileBlobStore::remove(std::string_view key) -> std::expected<void, core::error> {
  auto p = path_for(key);
  if (!p) return std::unexpected(p.error());
  std::error_code ec;
  std::filesystem::remove(*p, ec);
  if (ec) {
    return core::make_error(core::error_code::io_failed, "remove failed for " + p->string(),
                            "storage.file_blob");
  }
  return {};
}

auto FileBlobStore::list(std::string_view prefix) const
    -> std::expected<std::vector<std::string>, core::error> {
  std::vector<std::string> keys;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root_, ec), end;
  if (ec) {
    return core::make_error(core::error_code::io_failed, "cannot list " + root_.string(),
                            "storage.file_blob");
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return core::make_error(core::error_code::io_failed, "listing failed under " + root_.string(),
                              "storage.file_blob");
    }
    if (!it->is_regular_file(ec)) continue;
    auto key = it->path().lexically_relative(root_).generic_string();
    if (key.ends_with(kTmpSuffix)) continue;  // interrupted writes
    if (key.starts_with(prefix)) keys.push_back(std::move(key));
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace quiver::storage
