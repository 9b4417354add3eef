#pragma once

/** \file query_engine.hpp
 *  \brief k-NN query pipeline: validate, traverse, exact re-rank, post-filter, truncate.
 *
 * The graph produces an oversampled candidate list (approximate distances when
 * a codebook is active); candidates are then re-scored against full-precision
 * vectors from the Vector Store, filtered on metadata and cut to k.
 *
 * Thread-safety: search() is const and safe for concurrent calls.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "quiver/engine/config.hpp"
#include "quiver/error.hpp"
#include "quiver/index/hnsw_graph.hpp"
#include "quiver/storage/vector_store.hpp"

namespace quiver::engine {

/** \brief One result. For inner product, distance holds the similarity (higher is closer). */
struct SearchHit {
    index::VectorId id{0};
    float distance{0.0f};
};

/** \brief At most k hits, best first. */
using SearchResult = std::vector<SearchHit>;

class QueryEngine {
public:
    /** \param graph and store must outlive the engine. */
    QueryEngine(const index::HnswGraph& graph, const storage::VectorStore& store) noexcept
        : graph_(graph), store_(store) {}

    /** \brief Approximate k nearest neighbors of query.
     *
     * \return dimension_mismatch, precondition_failed (k == 0), cancelled, or
     *         errors from the graph and the store
     *
     * Complexity: O(ef * log N) graph work + O(candidates * dim) re-ranking
     */
    auto search(std::span<const float> query, std::size_t k, const SearchParams& params) const
        -> std::expected<SearchResult, core::error>;

private:
    const index::HnswGraph& graph_;
    const storage::VectorStore& store_;
};

/** \brief Exact k-NN by scanning every stored record (ground truth for recall). */
auto exact_search(const storage::VectorStore& store, index::Metric metric,
                  std::span<const float> query, std::size_t k)
    -> std::expected<SearchResult, core::error>;

/** \brief Mean fraction of each truth list's first k ids found in the matching result. */
auto compute_recall(const std::vector<SearchResult>& results,
                    const std::vector<SearchResult>& truth, std::size_t k) -> float;

} // namespace quiver::engine
