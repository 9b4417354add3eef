/** \file hnsw_graph.cpp
 *  \brief HNSW graph: insertion, tombstoning, beam search and compaction.
 */

#include "quiver/index/hnsw_graph.hpp"
#include "quiver/index/tombstone_set.hpp"
#include "quiver/kernels/distance.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/storage/codec.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <string>

namespace quiver::index {

namespace {

constexpr std::uint32_t kNoEntry = std::numeric_limits<std::uint32_t>::max();
constexpr std::uint32_t kGraphMagic = 0x52475651u;  // "QVGR"
constexpr std::uint32_t kGraphVersion = 1;
constexpr int kRelinkPasses = 4;

/** \brief Node in the graph arena. */
struct Node {
    VectorId id{0};
    std::uint32_t level{0};
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per layer, slots
    std::vector<float> vector;
    std::vector<std::uint8_t> code;
    std::uint64_t code_generation{0};
    std::atomic<bool> tombstoned{false};

    auto view() const noexcept -> NodeView { return {vector, code, code_generation}; }
    auto dead() const noexcept -> bool { return tombstoned.load(std::memory_order_acquire); }
};

struct Scored {
    float dist;
    VectorId id;
    std::uint32_t slot;
};

// Equal distances are ordered by lower id so topology and results are reproducible.
struct Closer {
    bool operator()(const Scored& a, const Scored& b) const noexcept {
        return a.dist < b.dist || (a.dist == b.dist && a.id < b.id);
    }
};

struct Farther {
    bool operator()(const Scored& a, const Scored& b) const noexcept { return Closer{}(b, a); }
};

auto graph_error(core::error_code code, std::string msg) -> std::unexpected<core::error> {
    return core::make_error(code, std::move(msg), "index.hnsw_graph");
}

} // namespace

auto validate(const HnswParams& params) -> std::expected<void, core::error> {
    if (params.M < 2) {
        return graph_error(core::error_code::config_invalid, "M must be >= 2");
    }
    if (params.ef_construction < params.M) {
        return graph_error(core::error_code::config_invalid, "ef_construction must be >= M");
    }
    return {};
}

LevelGenerator::LevelGenerator(std::uint32_t seed, std::uint32_t M)
    : rng_(seed), ml_(1.0 / std::log(static_cast<double>(std::max<std::uint32_t>(M, 2)))) {}

auto LevelGenerator::next() -> std::uint32_t {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    const double u = 1.0 - dist(rng_);  // (0, 1]
    const double f = std::floor(-std::log(u) * ml_);
    return static_cast<std::uint32_t>(std::min<double>(f, kMaxLevel));
}

/** \brief Internal implementation of the graph. */
class HnswGraph::Impl {
public:
    std::size_t dim_{0};
    Metric metric_{Metric::l2};
    HnswParams params_;

    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<VectorId, std::uint32_t> id_to_slot_;  // Live nodes only
    TombstoneSet tombstones_;
    std::uint32_t entry_{kNoEntry};
    std::uint32_t top_level_{0};
    std::atomic<std::size_t> live_{0};

    std::shared_ptr<const Codebook> codebook_;
    std::uint64_t generation_{0};

    mutable std::atomic<bool> needs_rebuild_{false};
    mutable std::shared_mutex graph_mutex_;  // Shared for traversal, unique for linking
    mutable std::mutex label_mutex_;         // For id_to_slot_
    std::mutex writer_mutex_;                // Serializes mutations

    auto cap(std::uint32_t layer) const noexcept -> std::size_t {
        return layer == 0 ? 2u * params_.M : params_.M;
    }

    auto node_distance(std::uint32_t a, std::uint32_t b) const noexcept -> float {
        return distance(metric_, nodes_[a]->vector, nodes_[b]->vector);
    }

    auto lookup(VectorId id) const -> std::optional<std::uint32_t> {
        std::lock_guard lock(label_mutex_);
        auto it = id_to_slot_.find(id);
        if (it == id_to_slot_.end()) return std::nullopt;
        return it->second;
    }

    auto fail_consistency(const char* what) const -> std::unexpected<core::error> {
        needs_rebuild_.store(true, std::memory_order_release);
        if (core::debug_enabled("QUIVER_GRAPH_DEBUG")) {
            std::cerr << "[quiver][graph][consistency] " << what << " entry=" << entry_
                      << " nodes=" << nodes_.size() << " top=" << top_level_ << std::endl;
        }
        return graph_error(core::error_code::internal_inconsistency, what);
    }

    auto check_entry() const -> std::expected<void, core::error> {
        if (entry_ >= nodes_.size() || !nodes_[entry_] || nodes_[entry_]->level < top_level_) {
            return fail_consistency("invalid entry point");
        }
        return {};
    }

    auto search_layer(const NodeScorer& scorer, Scored entry, std::size_t ef, std::uint32_t layer,
                      const core::CancellationToken* cancel, bool collect_tombstoned) const
        -> std::expected<std::vector<Scored>, core::error>;

    auto search_locked(const NodeScorer& scorer, std::size_t k, std::size_t ef,
                       const core::CancellationToken* cancel) const
        -> std::expected<std::vector<Candidate>, core::error>;

    auto select_neighbors(std::vector<Scored> candidates, std::size_t max_conn) const
        -> std::vector<std::uint32_t>;

    void link(std::uint32_t from, std::uint32_t to, std::uint32_t layer);
    void force_link(std::uint32_t from, std::uint32_t to, std::uint32_t layer);

    auto insert(VectorId id, std::span<const float> vec, std::vector<std::uint8_t> code,
                std::uint64_t code_generation, LevelGenerator& levels, bool overwrite)
        -> std::expected<void, core::error>;

    auto reachable_mask() const -> std::vector<char>;
    void mark_reachable_from(std::uint32_t start, std::vector<char>& mask) const;
    auto relink_unreachable() -> std::size_t;
    void compact_locked();
    void rebuild_id_map();
};

auto HnswGraph::Impl::search_layer(const NodeScorer& scorer, Scored entry, std::size_t ef,
                                   std::uint32_t layer, const core::CancellationToken* cancel,
                                   bool collect_tombstoned) const
    -> std::expected<std::vector<Scored>, core::error> {
    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) {
        std::fill(tls.seen.begin(), tls.seen.end(), 0u);
        tls.epoch = 1;
    }

    std::priority_queue<Scored, std::vector<Scored>, Farther> frontier;  // closest on top
    std::priority_queue<Scored, std::vector<Scored>, Closer> results;    // worst on top

    tls.seen[entry.slot] = tls.epoch;
    frontier.push(entry);
    if (collect_tombstoned || !nodes_[entry.slot]->dead()) results.push(entry);

    while (!frontier.empty()) {
        if (cancel && cancel->is_cancelled()) {
            return graph_error(core::error_code::cancelled, "search cancelled");
        }
        const Scored current = frontier.top();
        if (results.size() >= ef && Closer{}(results.top(), current)) break;
        frontier.pop();

        const Node& node = *nodes_[current.slot];
        if (layer >= node.neighbors.size()) continue;

        for (std::uint32_t nb : node.neighbors[layer]) {
            if (nb >= N || !nodes_[nb]) return fail_consistency("dangling neighbor");
            if (tls.seen[nb] == tls.epoch) continue;
            tls.seen[nb] = tls.epoch;

            const Node& next = *nodes_[nb];
            const Scored s{scorer.score(next.view()), next.id, nb};
            if (results.size() < ef || Closer{}(s, results.top())) {
                frontier.push(s);
                if (collect_tombstoned || !next.dead()) {
                    results.push(s);
                    if (results.size() > ef) results.pop();
                }
            }
        }
    }

    std::vector<Scored> out;
    out.reserve(results.size());
    while (!results.empty()) {
        out.push_back(results.top());
        results.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

auto HnswGraph::Impl::search_locked(const NodeScorer& scorer, std::size_t k, std::size_t ef,
                                    const core::CancellationToken* cancel) const
    -> std::expected<std::vector<Candidate>, core::error> {
    if (k == 0 || nodes_.empty() || entry_ == kNoEntry) return std::vector<Candidate>{};
    if (auto ok = check_entry(); !ok) return std::unexpected(ok.error());

    const Node& ep = *nodes_[entry_];
    Scored current{scorer.score(ep.view()), ep.id, entry_};
    for (std::uint32_t lc = top_level_; lc > 0; --lc) {
        auto w = search_layer(scorer, current, 1, lc, cancel, true);
        if (!w) return std::unexpected(w.error());
        if (!w->empty()) current = w->front();
    }

    auto w = search_layer(scorer, current, std::max(ef, k), 0, cancel, false);
    if (!w) return std::unexpected(w.error());

    std::vector<Candidate> out;
    out.reserve(w->size());
    for (const auto& s : *w) out.push_back({s.id, s.dist});
    return out;
}

auto HnswGraph::Impl::select_neighbors(std::vector<Scored> candidates, std::size_t max_conn) const
    -> std::vector<std::uint32_t> {
    std::sort(candidates.begin(), candidates.end(), Closer{});

    // Relative-neighborhood heuristic: keep c only if it is closer to the base
    // node than to every neighbor selected so far.
    std::vector<std::uint32_t> selected;
    std::vector<std::uint32_t> pruned;
    selected.reserve(max_conn);
    for (const auto& c : candidates) {
        if (selected.size() >= max_conn) break;
        bool diverse = true;
        for (std::uint32_t r : selected) {
            if (node_distance(c.slot, r) < c.dist) {
                diverse = false;
                break;
            }
        }
        if (diverse) {
            selected.push_back(c.slot);
        } else {
            pruned.push_back(c.slot);
        }
    }

    if (params_.keep_pruned_connections) {
        for (std::uint32_t p : pruned) {
            if (selected.size() >= max_conn) break;
            selected.push_back(p);
        }
    }
    return selected;
}

void HnswGraph::Impl::link(std::uint32_t from, std::uint32_t to, std::uint32_t layer) {
    auto& list = nodes_[from]->neighbors[layer];
    if (std::find(list.begin(), list.end(), to) != list.end()) return;
    list.push_back(to);

    const std::size_t max_conn = cap(layer);
    if (list.size() <= max_conn) return;

    std::vector<Scored> cands;
    cands.reserve(list.size());
    for (std::uint32_t nb : list) {
        cands.push_back({node_distance(from, nb), nodes_[nb]->id, nb});
    }
    list = select_neighbors(std::move(cands), max_conn);
}

void HnswGraph::Impl::force_link(std::uint32_t from, std::uint32_t to, std::uint32_t layer) {
    auto& list = nodes_[from]->neighbors[layer];
    if (std::find(list.begin(), list.end(), to) != list.end()) return;
    if (list.size() < cap(layer)) {
        list.push_back(to);
        return;
    }
    // Replace the farthest
    std::size_t worst_pos = 0;
    Scored worst{-std::numeric_limits<float>::infinity(), 0, 0};
    for (std::size_t i = 0; i < list.size(); ++i) {
        const Scored s{node_distance(from, list[i]), nodes_[list[i]]->id, list[i]};
        if (Closer{}(worst, s)) {
            worst = s;
            worst_pos = i;
        }
    }
    list[worst_pos] = to;
}

auto HnswGraph::Impl::insert(VectorId id, std::span<const float> vec, std::vector<std::uint8_t> code,
                             std::uint64_t code_generation, LevelGenerator& levels, bool overwrite)
    -> std::expected<void, core::error> {
    using core::error_code;
    std::lock_guard writer(writer_mutex_);

    if (needs_rebuild_.load(std::memory_order_acquire)) {
        return graph_error(error_code::internal_inconsistency, "graph is flagged for rebuild");
    }
    if (vec.size() != dim_) {
        return graph_error(error_code::dimension_mismatch,
                           "expected dimension " + std::to_string(dim_) + ", got " +
                               std::to_string(vec.size()));
    }
    const auto previous = lookup(id);
    if (previous && !overwrite) {
        return graph_error(error_code::duplicate_id, "id " + std::to_string(id) + " already present");
    }

    std::vector<float> working(vec.begin(), vec.end());
    if (needs_normalization(metric_)) kernels::normalize(working);

    const std::uint32_t level = levels.next();
    const ExactScorer scorer(metric_, working);

    // Candidate search runs concurrently with readers.
    const bool had_entry = entry_ != kNoEntry;
    std::vector<std::vector<Scored>> layer_candidates(level + 1);
    if (had_entry) {
        std::shared_lock lock(graph_mutex_);
        if (auto ok = check_entry(); !ok) return std::unexpected(ok.error());

        const Node& ep = *nodes_[entry_];
        Scored current{scorer.score(ep.view()), ep.id, entry_};
        for (std::uint32_t lc = top_level_; lc > level; --lc) {
            auto w = search_layer(scorer, current, 1, lc, nullptr, true);
            if (!w) return std::unexpected(w.error());
            if (!w->empty()) current = w->front();
        }
        for (std::uint32_t lc = std::min(level, top_level_) + 1; lc-- > 0;) {
            auto w = search_layer(scorer, current, params_.ef_construction, lc, nullptr, true);
            if (!w) return std::unexpected(w.error());
            if (!w->empty()) current = w->front();
            layer_candidates[lc] = std::move(*w);
        }
    }

    // Linking and publishing happen in one exclusive section.
    std::unique_lock lock(graph_mutex_);
    if (previous) {
        nodes_[*previous]->tombstoned.store(true, std::memory_order_release);
        if (auto r = tombstones_.mark(*previous); !r) return std::unexpected(r.error());
        live_.fetch_sub(1, std::memory_order_relaxed);
    }

    const auto slot = static_cast<std::uint32_t>(nodes_.size());
    auto node = std::make_unique<Node>();
    node->id = id;
    node->level = level;
    node->neighbors.resize(level + 1);
    node->vector = std::move(working);
    node->code = std::move(code);
    node->code_generation = code_generation;
    nodes_.push_back(std::move(node));

    if (had_entry) {
        for (std::uint32_t lc = 0; lc <= std::min(level, top_level_); ++lc) {
            auto& cands = layer_candidates[lc];
            std::vector<Scored> live;
            live.reserve(cands.size());
            for (const auto& c : cands) {
                if (!nodes_[c.slot]->dead()) live.push_back(c);
            }
            // Link through tombstoned waypoints only when nothing live was found.
            auto selected = select_neighbors(live.empty() ? cands : live, cap(lc));
            nodes_[slot]->neighbors[lc] = selected;
            for (std::uint32_t s : selected) link(s, slot, lc);
        }
    }

    if (!had_entry || level > top_level_) {
        entry_ = slot;
        top_level_ = level;
        if (core::debug_enabled("QUIVER_GRAPH_DEBUG")) {
            std::cerr << "[quiver][graph][insert] new entry point id=" << id << " level=" << level
                      << std::endl;
        }
    }

    {
        std::lock_guard label(label_mutex_);
        id_to_slot_[id] = slot;
    }
    live_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

void HnswGraph::Impl::mark_reachable_from(std::uint32_t start, std::vector<char>& mask) const {
    std::queue<std::uint32_t> q;
    if (!mask[start]) {
        mask[start] = 1;
        q.push(start);
    }
    while (!q.empty()) {
        const auto current = q.front();
        q.pop();
        for (const auto& layer : nodes_[current]->neighbors) {
            for (std::uint32_t nb : layer) {
                if (nb >= nodes_.size() || mask[nb]) continue;
                mask[nb] = 1;
                q.push(nb);
            }
        }
    }
}

auto HnswGraph::Impl::reachable_mask() const -> std::vector<char> {
    std::vector<char> mask(nodes_.size(), 0);
    if (entry_ < nodes_.size()) mark_reachable_from(entry_, mask);
    return mask;
}

auto HnswGraph::Impl::relink_unreachable() -> std::size_t {
    std::size_t relinked = 0;
    for (int pass = 0; pass < kRelinkPasses; ++pass) {
        auto mask = reachable_mask();
        bool stranded_any = false;
        for (std::uint32_t u = 0; u < nodes_.size(); ++u) {
            if (mask[u] || nodes_[u]->dead()) continue;
            stranded_any = true;

            // Nearest reachable live node, preferring one with a free layer-0 slot.
            std::uint32_t best = kNoEntry;
            bool best_room = false;
            Scored best_s{std::numeric_limits<float>::infinity(), 0, 0};
            for (std::uint32_t r = 0; r < nodes_.size(); ++r) {
                if (!mask[r] || nodes_[r]->dead()) continue;
                const bool room = nodes_[r]->neighbors[0].size() < cap(0);
                const Scored s{node_distance(u, r), nodes_[r]->id, r};
                if (best == kNoEntry || (room && !best_room) ||
                    (room == best_room && Closer{}(s, best_s))) {
                    best = r;
                    best_room = room;
                    best_s = s;
                }
            }
            if (best == kNoEntry) break;

            force_link(best, u, 0);
            force_link(u, best, 0);
            mark_reachable_from(u, mask);
            ++relinked;
        }
        if (!stranded_any) break;
    }
    return relinked;
}

void HnswGraph::Impl::rebuild_id_map() {
    std::lock_guard label(label_mutex_);
    id_to_slot_.clear();
    for (std::uint32_t s = 0; s < nodes_.size(); ++s) {
        if (!nodes_[s]->dead()) id_to_slot_[nodes_[s]->id] = s;
    }
    live_.store(id_to_slot_.size(), std::memory_order_relaxed);
}

void HnswGraph::Impl::compact_locked() {
    const std::size_t N = nodes_.size();
    std::vector<char> dead(N, 0);
    std::size_t purged = 0;
    for (std::size_t s = 0; s < N; ++s) {
        if (nodes_[s]->dead()) {
            dead[s] = 1;
            ++purged;
        }
    }

    // Replace edges into purged nodes with the best diverse survivor among their neighbors.
    std::size_t repaired = 0;
    for (std::uint32_t u = 0; u < N; ++u) {
        if (dead[u]) continue;
        Node& node = *nodes_[u];
        for (std::uint32_t lc = 0; lc < node.neighbors.size(); ++lc) {
            auto& list = node.neighbors[lc];
            std::vector<std::uint32_t> kept;
            std::vector<std::uint32_t> dropped;
            for (std::uint32_t nb : list) {
                if (nb < N && !dead[nb]) {
                    kept.push_back(nb);
                } else {
                    dropped.push_back(nb);
                }
            }
            if (dropped.empty()) continue;

            for (std::uint32_t d : dropped) {
                if (kept.size() >= cap(lc)) break;
                if (d >= N || lc >= nodes_[d]->neighbors.size()) continue;
                std::uint32_t best = kNoEntry;
                Scored best_s{std::numeric_limits<float>::infinity(), 0, 0};
                for (std::uint32_t c : nodes_[d]->neighbors[lc]) {
                    if (c >= N || dead[c] || c == u) continue;
                    if (std::find(kept.begin(), kept.end(), c) != kept.end()) continue;
                    const float du = node_distance(u, c);
                    bool diverse = true;
                    for (std::uint32_t r : kept) {
                        if (node_distance(c, r) < du) {
                            diverse = false;
                            break;
                        }
                    }
                    const Scored s{du, nodes_[c]->id, c};
                    if (diverse && Closer{}(s, best_s)) {
                        best = c;
                        best_s = s;
                    }
                }
                if (best != kNoEntry) {
                    kept.push_back(best);
                    ++repaired;
                }
            }
            list = std::move(kept);
        }
    }

    // Renumber slots densely.
    std::vector<std::uint32_t> remap(N, kNoEntry);
    std::vector<std::unique_ptr<Node>> survivors;
    survivors.reserve(N - purged);
    for (std::uint32_t s = 0; s < N; ++s) {
        if (dead[s]) continue;
        remap[s] = static_cast<std::uint32_t>(survivors.size());
        survivors.push_back(std::move(nodes_[s]));
    }
    for (auto& node : survivors) {
        for (auto& list : node->neighbors) {
            for (auto& nb : list) nb = remap[nb];
        }
    }
    const std::uint32_t old_entry = entry_;
    nodes_ = std::move(survivors);

    // Entry point: keep it when alive and still on the top layer, else the highest-level node.
    std::uint32_t max_level = 0;
    for (const auto& node : nodes_) max_level = std::max(max_level, node->level);
    entry_ = kNoEntry;
    if (old_entry < N && remap[old_entry] != kNoEntry &&
        nodes_[remap[old_entry]]->level == max_level) {
        entry_ = remap[old_entry];
    } else {
        for (std::uint32_t s = 0; s < nodes_.size(); ++s) {
            if (entry_ == kNoEntry || nodes_[s]->level > nodes_[entry_]->level ||
                (nodes_[s]->level == nodes_[entry_]->level && nodes_[s]->id < nodes_[entry_]->id)) {
                entry_ = s;
            }
        }
    }
    top_level_ = entry_ == kNoEntry ? 0 : nodes_[entry_]->level;

    tombstones_.clear();
    rebuild_id_map();
    const std::size_t relinked = relink_unreachable();
    needs_rebuild_.store(false, std::memory_order_release);

    if (core::debug_enabled("QUIVER_GRAPH_DEBUG")) {
        std::cerr << "[quiver][graph][compact] purged=" << purged << " repaired=" << repaired
                  << " relinked=" << relinked << " live=" << nodes_.size()
                  << " top=" << top_level_ << std::endl;
    }
}

HnswGraph::HnswGraph() : impl_(std::make_unique<Impl>()) {}
HnswGraph::~HnswGraph() = default;
HnswGraph::HnswGraph(HnswGraph&&) noexcept = default;
HnswGraph& HnswGraph::operator=(HnswGraph&&) noexcept = default;

auto HnswGraph::create(std::size_t dim, Metric metric, const HnswParams& params)
    -> std::expected<HnswGraph, core::error> {
    if (dim == 0) {
        return graph_error(core::error_code::config_invalid, "dimension must be > 0");
    }
    if (auto ok = validate(params); !ok) return std::unexpected(ok.error());

    HnswGraph g;
    g.impl_->dim_ = dim;
    g.impl_->metric_ = metric;
    g.impl_->params_ = params;
    return g;
}

auto HnswGraph::insert(VectorId id, std::span<const float> vec, std::vector<std::uint8_t> code,
                       std::uint64_t code_generation, LevelGenerator& levels, bool overwrite)
    -> std::expected<void, core::error> {
    return impl_->insert(id, vec, std::move(code), code_generation, levels, overwrite);
}

auto HnswGraph::remove(VectorId id) -> std::expected<void, core::error> {
    std::lock_guard writer(impl_->writer_mutex_);
    if (impl_->needs_rebuild_.load(std::memory_order_acquire)) {
        return graph_error(core::error_code::internal_inconsistency, "graph is flagged for rebuild");
    }
    std::uint32_t slot;
    {
        std::lock_guard label(impl_->label_mutex_);
        auto it = impl_->id_to_slot_.find(id);
        if (it == impl_->id_to_slot_.end()) {
            return graph_error(core::error_code::not_found, "id " + std::to_string(id) + " not live");
        }
        slot = it->second;
        impl_->id_to_slot_.erase(it);
    }
    impl_->nodes_[slot]->tombstoned.store(true, std::memory_order_release);
    impl_->live_.fetch_sub(1, std::memory_order_relaxed);
    return impl_->tombstones_.mark(slot);
}

auto HnswGraph::search(std::span<const float> query, std::size_t k, std::size_t ef,
                       const core::CancellationToken* cancel, bool use_quantized) const
    -> std::expected<std::vector<Candidate>, core::error> {
    if (query.size() != impl_->dim_) {
        return graph_error(core::error_code::dimension_mismatch,
                           "expected dimension " + std::to_string(impl_->dim_) + ", got " +
                               std::to_string(query.size()));
    }
    std::vector<float> q(query.begin(), query.end());
    if (needs_normalization(impl_->metric_)) kernels::normalize(q);

    std::shared_lock lock(impl_->graph_mutex_);
    if (use_quantized && impl_->codebook_) {
        auto table = impl_->codebook_->make_table(q, impl_->metric_);
        if (!table) return std::unexpected(table.error());
        const AdcScorer scorer(std::move(*table), impl_->generation_, impl_->metric_, q);
        return impl_->search_locked(scorer, k, ef, cancel);
    }
    const ExactScorer scorer(impl_->metric_, q);
    return impl_->search_locked(scorer, k, ef, cancel);
}

auto HnswGraph::compact() -> std::expected<void, core::error> {
    std::lock_guard writer(impl_->writer_mutex_);
    std::unique_lock lock(impl_->graph_mutex_);
    impl_->compact_locked();
    return {};
}

auto HnswGraph::set_codes(std::shared_ptr<const Codebook> codebook, std::uint64_t generation,
                          std::unordered_map<VectorId, std::vector<std::uint8_t>> codes)
    -> std::expected<void, core::error> {
    if (codebook) {
        if (codebook->dimension() != impl_->dim_) {
            return graph_error(core::error_code::dimension_mismatch, "codebook dimension differs");
        }
        for (const auto& [id, code] : codes) {
            if (code.size() != codebook->code_size()) {
                return graph_error(core::error_code::precondition_failed,
                                   "code of id " + std::to_string(id) + " has wrong size");
            }
        }
    }

    std::lock_guard writer(impl_->writer_mutex_);
    if (impl_->needs_rebuild_.load(std::memory_order_acquire)) {
        return graph_error(core::error_code::internal_inconsistency, "graph is flagged for rebuild");
    }
    std::unique_lock lock(impl_->graph_mutex_);
    impl_->codebook_ = std::move(codebook);
    impl_->generation_ = generation;
    for (auto& [id, code] : codes) {
        auto slot = impl_->lookup(id);
        if (!slot) continue;
        Node& node = *impl_->nodes_[*slot];
        node.code = std::move(code);
        node.code_generation = generation;
    }
    return {};
}

auto HnswGraph::stats() const -> GraphStats {
    std::shared_lock lock(impl_->graph_mutex_);
    GraphStats s;
    std::size_t base_degree = 0;
    for (const auto& node : impl_->nodes_) {
        if (node->dead()) {
            ++s.tombstone_count;
            continue;
        }
        ++s.node_count;
        s.max_level = std::max(s.max_level, node->level);
        if (s.layer_histogram.size() <= node->level) s.layer_histogram.resize(node->level + 1, 0);
        for (std::uint32_t l = 0; l <= node->level; ++l) ++s.layer_histogram[l];
        base_degree += node->neighbors[0].size();
        for (const auto& list : node->neighbors) s.edge_count += list.size();
    }
    if (s.node_count > 0) {
        s.avg_degree = static_cast<float>(base_degree) / static_cast<float>(s.node_count);
    }
    return s;
}

auto HnswGraph::reachable_count() const -> std::size_t {
    std::shared_lock lock(impl_->graph_mutex_);
    const auto mask = impl_->reachable_mask();
    std::size_t count = 0;
    for (std::size_t s = 0; s < mask.size(); ++s) {
        if (mask[s] && !impl_->nodes_[s]->dead()) ++count;
    }
    return count;
}

auto HnswGraph::neighbors(VectorId id, std::uint32_t layer) const
    -> std::expected<std::vector<VectorId>, core::error> {
    std::shared_lock lock(impl_->graph_mutex_);
    auto slot = impl_->lookup(id);
    if (!slot) return graph_error(core::error_code::not_found, "id " + std::to_string(id) + " not live");
    const Node& node = *impl_->nodes_[*slot];
    std::vector<VectorId> out;
    if (layer < node.neighbors.size()) {
        for (std::uint32_t nb : node.neighbors[layer]) out.push_back(impl_->nodes_[nb]->id);
    }
    return out;
}

auto HnswGraph::contains(VectorId id) const -> bool { return impl_->lookup(id).has_value(); }

auto HnswGraph::size() const noexcept -> std::size_t {
    return impl_->live_.load(std::memory_order_relaxed);
}

auto HnswGraph::tombstone_count() const -> std::size_t { return impl_->tombstones_.count(); }
auto HnswGraph::dimension() const noexcept -> std::size_t { return impl_->dim_; }
auto HnswGraph::metric() const noexcept -> Metric { return impl_->metric_; }
auto HnswGraph::params() const noexcept -> const HnswParams& { return impl_->params_; }

auto HnswGraph::needs_rebuild() const noexcept -> bool {
    return impl_->needs_rebuild_.load(std::memory_order_acquire);
}

auto HnswGraph::needs_compaction(double ratio) const -> bool {
    const auto total = impl_->live_.load(std::memory_order_relaxed) + impl_->tombstones_.count();
    return impl_->tombstones_.needs_compaction(total, ratio);
}

auto HnswGraph::debug_mark_inconsistent(const char* what) -> void {
    (void)impl_->fail_consistency(what);
}

auto HnswGraph::ids() const -> std::vector<VectorId> {
    std::vector<VectorId> out;
    {
        std::lock_guard label(impl_->label_mutex_);
        out.reserve(impl_->id_to_slot_.size());
        for (const auto& [id, slot] : impl_->id_to_slot_) out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

auto HnswGraph::serialize() const -> std::vector<std::uint8_t> {
    std::shared_lock lock(impl_->graph_mutex_);
    storage::ByteWriter out;
    out.put_u32(kGraphMagic);
    out.put_u32(kGraphVersion);
    out.put_u32(static_cast<std::uint32_t>(impl_->dim_));
    out.put_u8(static_cast<std::uint8_t>(impl_->metric_));
    out.put_u32(impl_->params_.M);
    out.put_u32(impl_->params_.ef_construction);
    out.put_u32(impl_->params_.seed);
    out.put_u8(impl_->params_.keep_pruned_connections ? 1 : 0);
    out.put_u32(impl_->entry_);
    out.put_u32(impl_->top_level_);
    out.put_u32(static_cast<std::uint32_t>(impl_->nodes_.size()));
    for (const auto& node : impl_->nodes_) {
        out.put_u64(node->id);
        out.put_u32(node->level);
        out.put_u8(node->dead() ? 1 : 0);
        for (const auto& list : node->neighbors) {
            out.put_u32(static_cast<std::uint32_t>(list.size()));
            for (std::uint32_t nb : list) out.put_u32(nb);
        }
    }
    return std::move(out).take();
}

auto HnswGraph::deserialize(std::span<const std::uint8_t> bytes, const NodeLoader& loader)
    -> std::expected<HnswGraph, core::error> {
    using core::error_code;
    storage::ByteReader in(bytes);
    const std::uint32_t magic = in.u32();
    const std::uint32_t version = in.u32();
    if (!in.ok() || magic != kGraphMagic) {
        return graph_error(error_code::data_integrity, "bad graph header");
    }
    if (version != kGraphVersion) {
        return graph_error(error_code::unsupported, "graph version " + std::to_string(version) +
                                                        " not supported");
    }
    const std::uint32_t dim = in.u32();
    auto metric = metric_from_tag(in.u8());
    if (!metric) return std::unexpected(metric.error());
    HnswParams params;
    params.M = in.u32();
    params.ef_construction = in.u32();
    params.seed = in.u32();
    params.keep_pruned_connections = in.u8() != 0;
    const std::uint32_t entry = in.u32();
    const std::uint32_t top_level = in.u32();
    const std::uint32_t count = in.u32();
    if (!in.ok()) return graph_error(error_code::data_integrity, "truncated graph header");

    auto created = create(dim, *metric, params);
    if (!created) return std::unexpected(created.error());
    HnswGraph g = std::move(*created);
    Impl& impl = *g.impl_;

    bool any_dead = false;
    impl.nodes_.reserve(count);
    for (std::uint32_t s = 0; s < count; ++s) {
        auto node = std::make_unique<Node>();
        node->id = in.u64();
        node->level = in.u32();
        const bool tombstoned = in.u8() != 0;
        if (!in.ok() || node->level > LevelGenerator::kMaxLevel) {
            return graph_error(error_code::data_integrity, "corrupt graph node table");
        }
        node->neighbors.resize(node->level + 1);
        for (auto& list : node->neighbors) {
            const std::uint32_t n = in.u32();
            if (!in.ok() || n > in.remaining() / sizeof(std::uint32_t)) {
                return graph_error(error_code::data_integrity, "corrupt neighbor list");
            }
            list.resize(n);
            for (auto& nb : list) {
                nb = in.u32();
                if (nb >= count) return graph_error(error_code::data_integrity, "neighbor slot out of range");
            }
        }

        if (!tombstoned) {
            auto payload = loader(node->id);
            if (!payload) return std::unexpected(payload.error());
            if (payload->has_value()) {
                auto& p = **payload;
                if (p.vector.size() != dim) {
                    return graph_error(error_code::data_integrity,
                                       "stored vector of id " + std::to_string(node->id) +
                                           " has wrong dimension");
                }
                node->vector = std::move(p.vector);
                node->code = std::move(p.code);
                node->code_generation = p.code_generation;
            } else {
                node->tombstoned.store(true);
            }
        } else {
            node->tombstoned.store(true);
        }
        any_dead = any_dead || node->dead();
        impl.nodes_.push_back(std::move(node));
    }
    if (!in.exhausted()) return graph_error(error_code::data_integrity, "trailing bytes after graph");
    if (count > 0 && (entry >= count || impl.nodes_[entry]->level != top_level)) {
        return graph_error(error_code::data_integrity, "invalid persisted entry point");
    }
    if (count == 0 && entry != kNoEntry) {
        return graph_error(error_code::data_integrity, "entry point in empty graph");
    }
    impl.entry_ = entry;
    impl.top_level_ = top_level;

    {
        std::unordered_map<VectorId, std::uint32_t> seen;
        for (std::uint32_t s = 0; s < count; ++s) {
            if (impl.nodes_[s]->dead()) continue;
            if (!seen.emplace(impl.nodes_[s]->id, s).second) {
                return graph_error(error_code::data_integrity, "duplicate live id in graph");
            }
        }
    }

    if (any_dead) {
        impl.compact_locked();
    } else {
        impl.rebuild_id_map();
    }
    return g;
}

} // namespace quiver::index
