#pragma once

/** \file hnsw_graph.hpp
 *  \brief Hierarchical Navigable Small World proximity graph with tombstones.
 *
 * Nodes live in a flat arena addressed by uint32 slot; neighbor lists hold
 * slots. Features:
 * - Incremental insertion with the relative-neighborhood pruning heuristic
 * - O(1) soft delete (tombstone flag); tombstoned nodes stay as waypoints
 * - Compaction that purges tombstones, repairs edges and restores reachability
 * - Pluggable node scoring: exact vectors or ADC over quantized codes
 *
 * Thread-safety: search() and the const accessors are safe for concurrent
 * use. Writers (insert, remove, compact, set_codes) are serialized
 * internally; an insert runs its candidate search under the shared lock and
 * links the node inside one short exclusive section, so readers never see a
 * partially linked node.
 * Memory: O(M * N) edges plus N * dim floats of working vectors.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <unordered_map>
#include <vector>

#include "quiver/core/cancellation.hpp"
#include "quiver/error.hpp"
#include "quiver/index/metric.hpp"
#include "quiver/index/quantizer.hpp"

namespace quiver::index {

/** \brief HNSW construction parameters. */
struct HnswParams {
    std::uint32_t M{16};                    /**< Max connections per node on layers > 0 (2M on layer 0) */
    std::uint32_t ef_construction{200};     /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool keep_pruned_connections{true};     /**< Fill free slots with the nearest pruned candidates */
};

/** \brief Check construction parameters; config_invalid when M < 2 or ef_construction < M. */
auto validate(const HnswParams& params) -> std::expected<void, core::error>;

/** \brief Seeded geometric level draw, floor(-ln(U) * mL) with mL = 1 / ln(M). */
class LevelGenerator {
public:
    static constexpr std::uint32_t kMaxLevel = 16;

    LevelGenerator(std::uint32_t seed, std::uint32_t M);

    auto next() -> std::uint32_t;

private:
    std::mt19937 rng_;
    double ml_;
};

/** \brief Graph statistics. */
struct GraphStats {
    std::size_t node_count{0};                  /**< Live nodes */
    std::size_t tombstone_count{0};             /**< Tombstoned, not yet purged */
    float avg_degree{0.0f};                     /**< Mean layer-0 degree of live nodes */
    std::uint32_t max_level{0};                 /**< Highest layer of any live node */
    std::vector<std::size_t> layer_histogram;   /**< Live nodes present on each layer */
    std::size_t edge_count{0};                  /**< Directed edges out of live nodes, all layers */
};

/** \brief A search candidate with its internal ("lower is better") distance. */
struct Candidate {
    VectorId id{0};
    float distance{0.0f};
};

/** \brief What a scorer may look at for one node. */
struct NodeView {
    std::span<const float> vector;
    std::span<const std::uint8_t> code;
    std::uint64_t code_generation{0};
};

/** \brief Distance from a fixed query to a graph node. */
class NodeScorer {
public:
    virtual ~NodeScorer() = default;
    [[nodiscard]] virtual auto score(const NodeView& node) const noexcept -> float = 0;
};

/** \brief Scores nodes by exact distance to their working vectors. */
class ExactScorer final : public NodeScorer {
public:
    /** \param query Query already normalized when the metric is cosine; must outlive the scorer. */
    ExactScorer(Metric metric, std::span<const float> query) noexcept
        : metric_(metric), query_(query) {}

    [[nodiscard]] auto score(const NodeView& node) const noexcept -> float override {
        return distance(metric_, query_, node.vector);
    }

private:
    Metric metric_;
    std::span<const float> query_;
};

/** \brief Scores nodes through an ADC table; nodes without a current code fall back to exact. */
class AdcScorer final : public NodeScorer {
public:
    AdcScorer(AdcTable table, std::uint64_t generation, Metric metric,
              std::span<const float> query) noexcept
        : table_(std::move(table)), generation_(generation), exact_(metric, query) {}

    [[nodiscard]] auto score(const NodeView& node) const noexcept -> float override {
        if (node.code_generation == generation_ && node.code.size() == table_.subquantizers()) {
            return table_.distance(node.code);
        }
        return exact_.score(node);
    }

private:
    AdcTable table_;
    std::uint64_t generation_;
    ExactScorer exact_;
};

/** \brief Working state of one node handed to deserialize(). */
struct NodePayload {
    std::vector<float> vector;
    std::vector<std::uint8_t> code;
    std::uint64_t code_generation{0};
};

/** \brief Resolves a live node's payload by id; nullopt when the record is gone. */
using NodeLoader =
    std::function<std::expected<std::optional<NodePayload>, core::error>(VectorId)>;

/** \brief Multi-layer proximity graph. */
class HnswGraph {
public:
    ~HnswGraph();
    HnswGraph(HnswGraph&&) noexcept;
    HnswGraph& operator=(HnswGraph&&) noexcept;
    HnswGraph(const HnswGraph&) = delete;
    HnswGraph& operator=(const HnswGraph&) = delete;

    /** \brief Create an empty graph.
     *
     * \return config_invalid for dim == 0 or invalid params
     */
    static auto create(std::size_t dim, Metric metric, const HnswParams& params)
        -> std::expected<HnswGraph, core::error>;

    /** \brief Link a new node into the graph.
     *
     * \param id Caller-supplied identifier
     * \param vec Vector [dim]; normalized internally for cosine
     * \param code Quantized code (may be empty)
     * \param code_generation Codebook generation that produced code
     * \param levels Level source, advanced once per successful call
     * \param overwrite Tombstone an existing live node with the same id first
     * \return dimension_mismatch (graph unchanged), duplicate_id, or
     *         internal_inconsistency when the graph is flagged for rebuild
     *
     * Complexity: O(ef_construction * M * log N) distance evaluations
     */
    auto insert(VectorId id, std::span<const float> vec, std::vector<std::uint8_t> code,
                std::uint64_t code_generation, LevelGenerator& levels, bool overwrite = false)
        -> std::expected<void, core::error>;

    /** \brief Tombstone a live node; edges are untouched. not_found if id is not live. */
    auto remove(VectorId id) -> std::expected<void, core::error>;

    /** \brief k-NN candidate search.
     *
     * Uses the ADC scorer when use_quantized is set and a codebook is installed,
     * otherwise exact distances. Returns up to max(ef, k) live candidates sorted by
     * (distance, id).
     *
     * \return cancelled when the token fires, internal_inconsistency on a broken entry point
     * Thread-safety: safe for concurrent calls; holds the graph lock shared.
     */
    auto search(std::span<const float> query, std::size_t k, std::size_t ef,
                const core::CancellationToken* cancel = nullptr, bool use_quantized = true) const
        -> std::expected<std::vector<Candidate>, core::error>;

    /** \brief Purge tombstones, repair edges, renumber slots and re-link stranded nodes.
     *
     * Also clears the rebuild flag once the entry point is valid again.
     */
    auto compact() -> std::expected<void, core::error>;

    /** \brief Install a codebook and swap every listed node's code atomically.
     *
     * Nodes absent from codes keep their previous code, which no longer matches
     * the generation and is therefore scored exactly.
     */
    auto set_codes(std::shared_ptr<const Codebook> codebook, std::uint64_t generation,
                   std::unordered_map<VectorId, std::vector<std::uint8_t>> codes)
        -> std::expected<void, core::error>;

    [[nodiscard]] auto stats() const -> GraphStats;

    /** \brief Live nodes reachable from the entry point over any layer (BFS diagnostic). */
    [[nodiscard]] auto reachable_count() const -> std::size_t;

    /** \brief Neighbor ids of a node on a layer (diagnostics); not_found for unknown ids. */
    [[nodiscard]] auto neighbors(VectorId id, std::uint32_t layer) const
        -> std::expected<std::vector<VectorId>, core::error>;

    [[nodiscard]] auto contains(VectorId id) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto tombstone_count() const -> std::size_t;
    [[nodiscard]] auto dimension() const noexcept -> std::size_t;
    [[nodiscard]] auto metric() const noexcept -> Metric;
    [[nodiscard]] auto params() const noexcept -> const HnswParams&;
    [[nodiscard]] auto needs_rebuild() const noexcept -> bool;

    /** \brief Whether tombstones / (live + tombstones) reached ratio; ratio <= 0 never triggers. */
    [[nodiscard]] auto needs_compaction(double ratio) const -> bool;

    // Debug-only: flag the graph as inconsistent, as a failed consistency check would
    auto debug_mark_inconsistent(const char* what) -> void;
    [[nodiscard]] auto ids() const -> std::vector<VectorId>;

    /** \brief Topology image: node table (id, level, tombstone flag, neighbor slots) and entry point. */
    [[nodiscard]] auto serialize() const -> std::vector<std::uint8_t>;

    /** \brief Rebuild from serialize() output.
     *
     * Vectors and codes come from the loader. Nodes that were tombstoned, or whose
     * record the loader no longer has, are purged by a compaction before returning.
     */
    static auto deserialize(std::span<const std::uint8_t> bytes, const NodeLoader& loader)
        -> std::expected<HnswGraph, core::error>;

private:
    HnswGraph();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quiver::index
