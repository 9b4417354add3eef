#pragma once

/** \file vector_store.hpp
 *  \brief Durable VectorId -> record mapping over a BlobStore with a hot-record cache.
 *
 * Each record is one sealed blob under "vec/<16 hex digits>". An in-memory
 * roaring id index is rebuilt from BlobStore::list() on open. Hot records are
 * cached in a byte-bounded sharded LRU cache and handed out as
 * shared_ptr<const VectorRecord>, so a cached record stays valid for its
 * reader even after eviction or overwrite.
 *
 * Transient blob failures (error_code::unavailable) are retried with
 * exponential backoff; every other error propagates unchanged.
 *
 * Thread-safety: all member functions are safe for concurrent use.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "quiver/attributes.hpp"
#include "quiver/cache/lru_cache.hpp"
#include "quiver/error.hpp"
#include "quiver/index/metric.hpp"
#include "quiver/storage/blob_store.hpp"

namespace quiver::storage {

using index::VectorId;

/** \brief Everything stored for one vector. */
struct VectorRecord {
    std::vector<float> values;          /**< Full-precision vector (normalized for cosine) */
    std::vector<std::uint8_t> code;     /**< Quantized code, empty without a codebook */
    std::uint64_t code_generation{0};   /**< Codebook generation that produced code */
    Attributes attributes;              /**< Metadata for post-filtering */
};

/** \brief Binary form of a record (unsealed). */
auto encode_record(const VectorRecord& record) -> std::vector<std::uint8_t>;
auto decode_record(std::span<const std::uint8_t> bytes) -> std::expected<VectorRecord, core::error>;

/** \brief Vector store configuration. */
struct VectorStoreConfig {
    std::size_t cache_bytes{64u << 20};                      /**< Record cache budget */
    std::size_t cache_shards{16};                            /**< Cache shards */
    std::uint32_t max_retries{3};                            /**< Retries of transient failures */
    std::chrono::milliseconds initial_backoff{5};            /**< First retry delay, doubled per retry */
    bool compress{false};                                    /**< zstd-compress record blobs */
};

class VectorStore {
    class Impl;

public:
    using RecordPtr = std::shared_ptr<const VectorRecord>;

    /** \brief Lazy, restartable iteration in ascending id order.
     *
     * rewind() snapshots the id set; next() reads one record at a time and
     * skips ids removed since the snapshot. The store must outlive the cursor.
     */
    class Cursor {
    public:
        void rewind();

        /** \return The next (id, record), nullopt at the end, or the read error. */
        auto next() -> std::expected<std::optional<std::pair<VectorId, RecordPtr>>, core::error>;

        [[nodiscard]] auto remaining() const noexcept -> std::size_t { return ids_.size() - pos_; }

    private:
        friend class VectorStore;
        explicit Cursor(const Impl* store) : store_(store) { rewind(); }

        const Impl* store_;
        std::vector<VectorId> ids_;
        std::size_t pos_{0};
    };

    ~VectorStore();
    VectorStore(VectorStore&&) noexcept;
    VectorStore& operator=(VectorStore&&) noexcept;
    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /** \brief Attach to a blob store and rebuild the id index from its "vec/" keys. */
    static auto open(std::shared_ptr<BlobStore> blobs, const VectorStoreConfig& config)
        -> std::expected<VectorStore, core::error>;

    /** \brief Create or overwrite the record of id. */
    auto put(VectorId id, VectorRecord record) -> std::expected<void, core::error>;

    /** \brief Fetch a record through the cache; not_found when absent. */
    auto get(VectorId id) const -> std::expected<RecordPtr, core::error>;

    /** \brief Delete a record; not_found when absent. */
    auto remove(VectorId id) -> std::expected<void, core::error>;

    [[nodiscard]] auto contains(VectorId id) const -> bool;
    [[nodiscard]] auto size() const -> std::uint64_t;
    [[nodiscard]] auto ids() const -> std::vector<VectorId>;
    [[nodiscard]] auto cursor() const -> Cursor;
    [[nodiscard]] auto cache_stats() const -> cache::CacheStats;

    /** \brief Blob key of a record, "vec/" followed by 16 lowercase hex digits. */
    static auto key_for(VectorId id) -> std::string;

private:
    VectorStore();

    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::storage
