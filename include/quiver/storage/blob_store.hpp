#pragma once

/** \file blob_store.hpp
 *  \brief Durable key -> bytes storage consumed by the index.
 *
 * Keys are '/'-separated relative names ("header", "vec/000000000000002a").
 * Implementations must make write() atomic: a reader sees either the old or
 * the new bytes, never a torn blob. Transient failures are reported as
 * error_code::unavailable so callers may retry them.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::storage {

class BlobStore {
public:
    virtual ~BlobStore() = default;

    /** \brief Create or replace a blob. */
    virtual auto write(std::string_view key, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> = 0;

    /** \brief Read a blob; not_found when absent. */
    virtual auto read(std::string_view key) const
        -> std::expected<std::vector<std::uint8_t>, core::error> = 0;

    /** \brief Delete a blob; removing an absent key succeeds. */
    virtual auto remove(std::string_view key) -> std::expected<void, core::error> = 0;

    /** \brief Keys starting with prefix, in ascending order. */
    virtual auto list(std::string_view prefix) const
        -> std::expected<std::vector<std::string>, core::error> = 0;
};

/** \brief Ephemeral in-process store (tests, scratch indexes). Thread-safe. */
class MemoryBlobStore final : public BlobStore {
public:
    auto write(std::string_view key, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto read(std::string_view key) const
        -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto remove(std::string_view key) -> std::expected<void, core::error> override;
    auto list(std::string_view prefix) const
        -> std::expected<std::vector<std::string>, core::error> override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::uint8_t>, std::less<>> blobs_;
};

/** \brief Directory-backed store.
 *
 * Each key maps to a file under the root ('/' in keys becomes a subdirectory).
 * write() goes through "<file>.tmp", fsync, atomic rename, then a directory
 * fsync so the rename itself is durable.
 */
class FileBlobStore final : public BlobStore {
public:
    /** \brief Open (creating if needed) a store rooted at dir. */
    static auto open(const std::filesystem::path& dir)
        -> std::expected<std::shared_ptr<FileBlobStore>, core::error>;

    explicit FileBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

    auto write(std::string_view key, std::span<const std::uint8_t> bytes)
        -> std::expected<void, core::error> override;
    auto read(std::string_view key) const
        -> std::expected<std::vector<std::uint8_t>, core::error> override;
    auto remove(std::string_view key) -> std::expected<void, core::error> override;
    auto list(std::string_view prefix) const
        -> std::expected<std::vector<std::string>, core::error> override;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_; }

private:
    auto path_for(std::string_view key) const -> std::expected<std::filesystem::path, core::error>;

    std::filesystem::path root_;
};

} // namespace quiver::storage
