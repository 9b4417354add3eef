#pragma once

/** \file vector_index.hpp
 *  \brief Administrative interface of a Quiver index.
 *
 * A VectorIndex ties together the Vector Store (durable records), the HNSW
 * graph (in-memory, persisted on save()) and the active quantizer codebook.
 *
 * Persisted blobs (each sealed with a CRC32C trailer):
 * - "header":   format version, dimension, metric, configuration,
 *               codebook generation, next auto id
 * - "graph":    topology and entry point (zstd-compressed when compress_graph)
 * - "codebook": serialized Codebook of the current generation
 * - "vec/<id>": one record per vector, written on every insert
 *
 * Thread-safety: search(), get() and stats() run concurrently with each other
 * and with writers. Writers (insert, remove, train, compact, save) are
 * serialized by an internal mutex.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>

#include "quiver/attributes.hpp"
#include "quiver/cache/lru_cache.hpp"
#include "quiver/engine/config.hpp"
#include "quiver/engine/query_engine.hpp"
#include "quiver/error.hpp"
#include "quiver/index/hnsw_graph.hpp"
#include "quiver/index/quantizer.hpp"
#include "quiver/storage/blob_store.hpp"
#include "quiver/storage/vector_store.hpp"

namespace quiver::engine {

/** \brief Index-level statistics. */
struct IndexStats {
    std::uint64_t vector_count{0};                       /**< Records in the Vector Store */
    index::GraphStats graph;                             /**< Graph shape */
    index::QuantizerKind quantizer{index::QuantizerKind::none};  /**< Active codebook kind */
    std::size_t code_size{0};                            /**< Bytes per code (0 without codebook) */
    std::uint64_t codebook_generation{0};                /**< 0 until the first training */
    cache::CacheStats cache;                             /**< Record cache counters */
    bool needs_rebuild{false};                           /**< Graph is read-only until compact() */
};

class VectorIndex {
public:
    ~VectorIndex();
    VectorIndex(VectorIndex&&) noexcept;
    VectorIndex& operator=(VectorIndex&&) noexcept;
    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /** \brief Create a new, empty index in blobs.
     *
     * Environment overrides (apply_env_overrides) are applied before validation.
     * \return config_invalid, or precondition_failed when blobs already holds an index
     */
    static auto create(IndexConfig config, std::shared_ptr<storage::BlobStore> blobs)
        -> std::expected<VectorIndex, core::error>;

    /** \brief Open an existing index.
     *
     * The graph blob is reconciled with the Vector Store: stored vectors the graph
     * lacks are inserted, graph nodes without a record are purged. Without a graph
     * blob the graph is rebuilt from the store.
     */
    static auto open(std::shared_ptr<storage::BlobStore> blobs)
        -> std::expected<VectorIndex, core::error>;

    /** \brief Store and link one vector.
     *
     * \return dimension_mismatch, duplicate_id (id live and !overwrite),
     *         internal_inconsistency (graph flagged for rebuild) or store errors
     */
    auto insert(index::VectorId id, std::span<const float> vec, Attributes attributes = {},
                bool overwrite = false) -> std::expected<void, core::error>;

    /** \brief Insert under the next unused sequential id. */
    auto insert_auto(std::span<const float> vec, Attributes attributes = {})
        -> std::expected<index::VectorId, core::error>;

    /** \brief Tombstone in the graph and delete the record; not_found if absent.
     *
     * Compacts afterwards when the tombstone ratio reaches auto_compact_ratio.
     * \return internal_inconsistency while the graph is flagged for rebuild
     */
    auto remove(index::VectorId id) -> std::expected<void, core::error>;

    /** \brief Stored record of id (vector as indexed, code, attributes). */
    auto get(index::VectorId id) const
        -> std::expected<std::shared_ptr<const storage::VectorRecord>, core::error>;

    auto search(std::span<const float> query, std::size_t k, const SearchParams& params = {}) const
        -> std::expected<SearchResult, core::error>;

    /** \brief Train a codebook on sample [n x dim], re-encode every vector and hot-swap it.
     *
     * Training runs without blocking readers or writers; only the re-encode and
     * swap hold the writer mutex.
     * \return internal_inconsistency while the graph is flagged for rebuild
     */
    auto train_quantizer(const float* sample, std::size_t n) -> std::expected<void, core::error>;

    /** \brief train_quantizer() on up to max_samples vectors drawn evenly from the store. */
    auto train_quantizer_from_store(std::size_t max_samples) -> std::expected<void, core::error>;

    [[nodiscard]] auto stats() const -> IndexStats;

    /** \brief Purge tombstones and repair the graph; clears the rebuild flag. */
    auto compact() -> std::expected<void, core::error>;

    /** \brief Persist graph and header (records and codebook are written eagerly).
     *
     * Refused with internal_inconsistency while the graph is flagged for rebuild.
     */
    auto save() -> std::expected<void, core::error>;

    [[nodiscard]] auto config() const noexcept -> const IndexConfig&;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto codebook() const -> std::shared_ptr<const index::Codebook>;
    [[nodiscard]] auto graph() const noexcept -> const index::HnswGraph&;

    // Debug-only: put the index in read-only mode as a failed graph check would
    auto debug_mark_inconsistent(const char* what) -> void;

private:
    VectorIndex();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::engine
