#pragma once

/** \file config.hpp
 *  \brief Index and search configuration.
 */

#include <cstdint>
#include <expected>
#include <optional>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/filter_expr.hpp"
#include "quiver/index/hnsw_graph.hpp"
#include "quiver/index/metric.hpp"
#include "quiver/index/quantizer.hpp"
#include "quiver/storage/vector_store.hpp"

namespace quiver::engine {

/** \brief Everything fixed at index creation. */
struct IndexConfig {
    std::uint32_t dimension{0};                       /**< Vector dimensionality D */
    index::Metric metric{index::Metric::l2};          /**< Similarity metric */
    index::HnswParams hnsw;                           /**< Graph construction */
    index::QuantizerConfig quantizer;                 /**< Codebook training */
    storage::VectorStoreConfig store;                 /**< Record store and cache */
    bool compress_graph{true};                        /**< zstd-compress the graph blob when available */
    double auto_compact_ratio{0.0};                   /**< Compact after a delete past this tombstone ratio (0 = off) */
};

/** \brief Check an index configuration; config_invalid with the offending field. */
auto validate(const IndexConfig& config) -> std::expected<void, core::error>;

/** \brief Apply QUIVER_HNSW_M, QUIVER_EF_CONSTRUCTION, QUIVER_CACHE_MB and QUIVER_SEED.
 *
 * Unset or malformed variables leave the field untouched.
 */
void apply_env_overrides(IndexConfig& config);

/** \brief Per-query knobs. */
struct SearchParams {
    std::uint32_t ef{64};                             /**< Layer-0 beam width (clamped to >= k) */
    std::uint32_t rerank_factor{2};                   /**< Candidates = max(ef, k * rerank_factor) */
    bool exact_rerank{true};                          /**< Re-rank candidates by exact distance */
    bool use_quantized{true};                         /**< Traverse with ADC when a codebook is active */
    std::optional<filter_expr> filter;                /**< Post-filter over metadata */
    const core::CancellationToken* cancel{nullptr};   /**< Cooperative cancellation */
};

} // namespace quiver::engine
