#include "quiver/engine/query_engine.hpp"
#include "quiver/filter_eval.hpp"
#include "quiver/kernels/distance.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace quiver::engine {

namespace {

auto by_distance_then_id(const SearchHit& a, const SearchHit& b) noexcept -> bool {
    return a.distance < b.distance || (a.distance == b.distance && a.id < b.id);
}

void finish(SearchResult& hits, std::size_t k, index::Metric metric) {
    std::sort(hits.begin(), hits.end(), by_distance_then_id);
    if (hits.size() > k) hits.resize(k);
    for (auto& h : hits) h.distance = index::reported_distance(metric, h.distance);
}

} // namespace

auto QueryEngine::search(std::span<const float> query, std::size_t k, const SearchParams& params) const
    -> std::expected<SearchResult, core::error> {
    using core::error_code;
    const auto dim = graph_.dimension();
    const auto metric = graph_.metric();

    if (query.size() != dim) {
        return core::make_error(error_code::dimension_mismatch,
                                "expected dimension " + std::to_string(dim) + ", got " +
                                    std::to_string(query.size()),
                                "engine.query");
    }
    if (k == 0) {
        return core::make_error(error_code::precondition_failed, "k must be > 0", "engine.query");
    }

    std::vector<float> q(query.begin(), query.end());
    if (index::needs_normalization(metric)) kernels::normalize(q);

    const std::size_t ef = std::max<std::size_t>(params.ef, k);
    const std::size_t candidates = std::max(ef, k * std::max<std::size_t>(params.rerank_factor, 1));

    auto found = graph_.search(q, candidates, candidates, params.cancel, params.use_quantized);
    if (!found) return std::unexpected(found.error());

    SearchResult hits;
    hits.reserve(found->size());
    for (const auto& c : *found) {
        if (params.cancel && params.cancel->is_cancelled()) {
            return core::make_error(error_code::cancelled, "search cancelled", "engine.query");
        }
        if (!params.exact_rerank && !params.filter) {
            hits.push_back({c.id, c.distance});
            continue;
        }

        auto record = store_.get(c.id);
        if (!record) {
            if (record.error().code == error_code::not_found) continue;  // deleted meanwhile
            return std::unexpected(record.error());
        }
        if (params.filter && !filter_eval::matches(*params.filter, (*record)->attributes)) continue;

        const float d = params.exact_rerank ? index::distance(metric, q, (*record)->values) : c.distance;
        hits.push_back({c.id, d});
    }

    finish(hits, k, metric);
    return hits;
}

auto exact_search(const storage::VectorStore& store, index::Metric metric,
                  std::span<const float> query, std::size_t k)
    -> std::expected<SearchResult, core::error> {
    std::vector<float> q(query.begin(), query.end());
    if (index::needs_normalization(metric)) kernels::normalize(q);

    SearchResult hits;
    auto cursor = store.cursor();
    for (;;) {
        auto next = cursor.next();
        if (!next) return std::unexpected(next.error());
        if (!next->has_value()) break;
        const auto& [id, record] = **next;
        if (record->values.size() != q.size()) {
            return core::make_error(core::error_code::dimension_mismatch,
                                    "stored vector " + std::to_string(id) + " has wrong dimension",
                                    "engine.query");
        }
        hits.push_back({id, index::distance(metric, q, record->values)});
    }
    finish(hits, k, metric);
    return hits;
}

auto compute_recall(const std::vector<SearchResult>& results,
                    const std::vector<SearchResult>& truth, std::size_t k) -> float {
    const std::size_t n = std::min(results.size(), truth.size());
    if (n == 0 || k == 0) return 0.0f;

    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t kk = std::min(k, truth[i].size());
        if (kk == 0) {
            total += 1.0;
            continue;
        }
        std::unordered_set<index::VectorId> want;
        for (std::size_t j = 0; j < kk; ++j) want.insert(truth[i][j].id);
        std::size_t found = 0;
        for (std::size_t j = 0; j < std::min(k, results[i].size()); ++j) {
            if (want.contains(results[i][j].id)) ++found;
        }
        total += static_cast<double>(found) / static_cast<double>(kk);
    }
    return static_cast<float>(total / static_cast<double>(n));
}

} // namespace quiver::engine
