#include <catch2/catch_all.hpp>
#include <quiver/index/hnsw_graph.hpp>
#include <quiver/index/quantizer.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <set>
#include <unordered_map>
#include <vector>

using namespace quiver;
using namespace quiver::index;
using Catch::Approx;

namespace {

struct Dataset {
    std::size_t n;
    std::size_t dim;
    std::vector<float> data;

    auto row(std::size_t i) const -> std::span<const float> { return {data.data() + i * dim, dim}; }
};

auto make_dataset(std::size_t n, std::size_t dim, std::uint32_t seed) -> Dataset {
    std::mt19937 gen(seed);
    std::normal_distribution<float> g(0.0f, 1.0f);
    Dataset ds{n, dim, std::vector<float>(n * dim)};
    for (auto& x : ds.data) x = g(gen);
    return ds;
}

auto build(const Dataset& ds, Metric metric = Metric::l2, HnswParams params = {}) -> HnswGraph {
    auto g = HnswGraph::create(ds.dim, metric, params);
    REQUIRE(g.has_value());
    LevelGenerator levels(params.seed, params.M);
    for (std::size_t i = 0; i < ds.n; ++i) {
        REQUIRE(g->insert(i, ds.row(i), {}, 0, levels).has_value());
    }
    return std::move(*g);
}

auto brute_force(const Dataset& ds, std::span<const float> q, std::size_t k,
                 const std::set<VectorId>& skip = {}) -> std::vector<VectorId> {
    std::vector<std::pair<float, VectorId>> all;
    for (std::size_t i = 0; i < ds.n; ++i) {
        if (skip.contains(i)) continue;
        all.emplace_back(distance(Metric::l2, q, ds.row(i)), i);
    }
    std::sort(all.begin(), all.end());
    std::vector<VectorId> out;
    for (std::size_t i = 0; i < std::min(k, all.size()); ++i) out.push_back(all[i].second);
    return out;
}

auto recall(const std::vector<Candidate>& got, const std::vector<VectorId>& truth) -> double {
    std::set<VectorId> want(truth.begin(), truth.end());
    std::size_t hit = 0;
    for (std::size_t i = 0; i < std::min(got.size(), truth.size()); ++i) {
        if (want.contains(got[i].id)) ++hit;
    }
    return truth.empty() ? 1.0 : static_cast<double>(hit) / static_cast<double>(truth.size());
}

} // namespace

TEST_CASE("graph parameters are validated", "[graph]") {
    REQUIRE(HnswGraph::create(0, Metric::l2, {}).error().code == core::error_code::config_invalid);
    REQUIRE(HnswGraph::create(4, Metric::l2, HnswParams{.M = 1}).error().code == core::error_code::config_invalid);
    REQUIRE(HnswGraph::create(4, Metric::l2, HnswParams{.M = 16, .ef_construction = 8}).error().code ==
            core::error_code::config_invalid);
}

TEST_CASE("empty graph answers with no candidates", "[graph]") {
    auto g = HnswGraph::create(3, Metric::l2, {});
    REQUIRE(g.has_value());
    const std::vector<float> q{1.0f, 2.0f, 3.0f};
    auto r = g->search(q, 5, 10);
    REQUIRE(r.has_value());
    REQUIRE(r->empty());
    REQUIRE(g->search(std::vector<float>{1.0f}, 5, 10).error().code == core::error_code::dimension_mismatch);
}

TEST_CASE("every inserted vector finds itself", "[graph]") {
    auto ds = make_dataset(500, 16, 1);
    auto g = build(ds);
    REQUIRE(g.size() == 500);

    for (std::size_t i = 0; i < ds.n; ++i) {
        auto r = g.search(ds.row(i), 1, 64);
        REQUIRE(r.has_value());
        REQUIRE_FALSE(r->empty());
        REQUIRE(r->front().id == i);
        REQUIRE(r->front().distance == Approx(0.0f).margin(1e-5));
    }
}

TEST_CASE("graph respects degree bounds and stays connected", "[graph]") {
    auto ds = make_dataset(800, 8, 2);
    const HnswParams params{.M = 8, .ef_construction = 64};
    auto g = build(ds, Metric::l2, params);

    for (std::size_t i = 0; i < ds.n; ++i) {
        auto l0 = g.neighbors(i, 0);
        REQUIRE(l0.has_value());
        REQUIRE(l0->size() <= 2 * params.M);
        REQUIRE_FALSE(l0->empty());
        REQUIRE(std::find(l0->begin(), l0->end(), static_cast<VectorId>(i)) == l0->end());
        for (std::uint32_t layer = 1; layer <= LevelGenerator::kMaxLevel; ++layer) {
            REQUIRE(g.neighbors(i, layer).value().size() <= params.M);
        }
    }
    REQUIRE(g.reachable_count() >= ds.n - ds.n / 100);
    REQUIRE(g.compact().has_value());
    REQUIRE(g.reachable_count() == ds.n);

    auto stats = g.stats();
    REQUIRE(stats.node_count == ds.n);
    REQUIRE(stats.layer_histogram.front() == ds.n);
    REQUIRE(stats.avg_degree > 1.0f);
    REQUIRE(stats.avg_degree <= 2.0f * params.M);
}

TEST_CASE("graph search has high recall", "[graph][recall]") {
    auto ds = make_dataset(2000, 16, 3);
    auto g = build(ds);
    auto queries = make_dataset(50, 16, 4);

    double total = 0.0;
    for (std::size_t i = 0; i < queries.n; ++i) {
        auto r = g.search(queries.row(i), 10, 100);
        REQUIRE(r.has_value());
        REQUIRE(r->size() >= 10);
        REQUIRE(std::is_sorted(r->begin(), r->end(), [](const Candidate& a, const Candidate& b) {
            return a.distance < b.distance;
        }));
        total += recall(*r, brute_force(ds, queries.row(i), 10));
    }
    REQUIRE(total / static_cast<double>(queries.n) >= 0.9);
}

TEST_CASE("larger ef does not lower recall", "[graph][recall]") {
    auto ds = make_dataset(1500, 12, 5);
    auto g = build(ds, Metric::l2, HnswParams{.M = 6, .ef_construction = 40});
    auto queries = make_dataset(40, 12, 6);

    auto mean_recall = [&](std::size_t ef) {
        double total = 0.0;
        for (std::size_t i = 0; i < queries.n; ++i) {
            auto r = g.search(queries.row(i), 10, ef);
            REQUIRE(r.has_value());
            total += recall(*r, brute_force(ds, queries.row(i), 10));
        }
        return total / static_cast<double>(queries.n);
    };
    const double low = mean_recall(10);
    const double high = mean_recall(200);
    REQUIRE(high >= low);
    REQUIRE(high >= 0.9);
}

TEST_CASE("graph construction is deterministic", "[graph]") {
    auto ds = make_dataset(300, 8, 7);
    auto a = build(ds);
    auto b = build(ds);
    REQUIRE(a.serialize() == b.serialize());
    for (VectorId id : {0u, 17u, 299u}) {
        REQUIRE(a.neighbors(id, 0).value() == b.neighbors(id, 0).value());
    }
}

TEST_CASE("tombstoned nodes never surface in results", "[graph][tombstone]") {
    auto ds = make_dataset(600, 8, 8);
    auto g = build(ds);

    std::set<VectorId> removed;
    for (VectorId id = 0; id < 600; id += 3) {
        REQUIRE(g.remove(id).has_value());
        removed.insert(id);
    }
    REQUIRE(g.remove(0).error().code == core::error_code::not_found);
    REQUIRE(g.size() == 400);
    REQUIRE(g.tombstone_count() == 200);
    REQUIRE(g.needs_compaction(1.0 / 3.0));
    REQUIRE_FALSE(g.needs_compaction(0.34));
    REQUIRE_FALSE(g.needs_compaction(0.0));
    REQUIRE_FALSE(g.contains(3));

    for (std::size_t i = 0; i < 60; ++i) {
        auto r = g.search(ds.row(i), 10, 64);
        REQUIRE(r.has_value());
        REQUIRE(r->size() >= 10);
        for (const auto& c : *r) REQUIRE_FALSE(removed.contains(c.id));
    }
}

TEST_CASE("compaction purges tombstones and keeps every survivor reachable", "[graph][compact]") {
    auto ds = make_dataset(1000, 8, 9);
    auto g = build(ds, Metric::l2, HnswParams{.M = 6, .ef_construction = 48});

    std::set<VectorId> removed;
    std::mt19937 gen(10);
    std::vector<VectorId> ids(1000);
    std::iota(ids.begin(), ids.end(), 0);
    std::shuffle(ids.begin(), ids.end(), gen);
    for (std::size_t i = 0; i < 500; ++i) {
        REQUIRE(g.remove(ids[i]).has_value());
        removed.insert(ids[i]);
    }

    REQUIRE(g.compact().has_value());
    REQUIRE(g.tombstone_count() == 0);
    REQUIRE(g.size() == 500);
    REQUIRE(g.stats().tombstone_count == 0);
    REQUIRE(g.reachable_count() == 500);
    REQUIRE_FALSE(g.needs_rebuild());

    double total = 0.0;
    for (std::size_t i = 0; i < 50; ++i) {
        auto q = ds.row(ids[500 + i]);
        auto r = g.search(q, 10, 100);
        REQUIRE(r.has_value());
        REQUIRE(r->front().id == ids[500 + i]);
        total += recall(*r, brute_force(ds, q, 10, removed));
    }
    REQUIRE(total / 50.0 >= 0.85);

    // Removing everything leaves an empty, searchable graph.
    for (std::size_t i = 500; i < 1000; ++i) REQUIRE(g.remove(ids[i]).has_value());
    REQUIRE(g.compact().has_value());
    REQUIRE(g.size() == 0);
    REQUIRE(g.search(ds.row(0), 5, 10).value().empty());
}

TEST_CASE("a graph flagged for rebuild rejects writers until compacted", "[graph][compact]") {
    auto ds = make_dataset(200, 8, 14);
    auto g = build(ds);
    LevelGenerator levels(99, 16);

    g.debug_mark_inconsistent("test");
    REQUIRE(g.needs_rebuild());
    const auto inconsistent = core::error_code::internal_inconsistency;
    REQUIRE(g.insert(500, ds.row(0), {}, 0, levels).error().code == inconsistent);
    REQUIRE(g.remove(5).error().code == inconsistent);
    REQUIRE(g.set_codes(nullptr, 1, {}).error().code == inconsistent);
    REQUIRE(g.size() == 200);
    REQUIRE(g.contains(5));
    REQUIRE(g.search(ds.row(5), 1, 32).value().front().id == 5);

    REQUIRE(g.compact().has_value());
    REQUIRE_FALSE(g.needs_rebuild());
    REQUIRE(g.remove(5).has_value());
    REQUIRE(g.insert(500, ds.row(0), {}, 0, levels).has_value());
}

TEST_CASE("overwrite replaces a node in place of the old one", "[graph]") {
    auto ds = make_dataset(100, 4, 11);
    auto g = build(ds);
    LevelGenerator levels(99, 16);

    const std::vector<float> moved{50.0f, 50.0f, 50.0f, 50.0f};
    REQUIRE(g.insert(5, moved, {}, 0, levels).error().code == core::error_code::duplicate_id);
    REQUIRE(g.insert(5, moved, {}, 0, levels, true).has_value());
    REQUIRE(g.size() == 100);
    REQUIRE(g.tombstone_count() == 1);

    auto r = g.search(moved, 1, 16);
    REQUIRE(r.has_value());
    REQUIRE(r->front().id == 5);
    REQUIRE(g.insert(6, std::vector<float>{1.0f}, {}, 0, levels).error().code ==
            core::error_code::dimension_mismatch);
}

TEST_CASE("search honours cancellation", "[graph][cancel]") {
    auto ds = make_dataset(200, 8, 12);
    auto g = build(ds);
    core::CancellationToken token;
    token.cancel();
    auto r = g.search(ds.row(0), 10, 50, &token);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::cancelled);

    token.reset();
    REQUIRE(g.search(ds.row(0), 10, 50, &token).has_value());
}

TEST_CASE("cosine graph normalizes vectors", "[graph][cosine]") {
    auto g = HnswGraph::create(2, Metric::cosine, {});
    REQUIRE(g.has_value());
    LevelGenerator levels(1, 16);
    REQUIRE(g->insert(1, std::vector<float>{10.0f, 0.0f}, {}, 0, levels).has_value());
    REQUIRE(g->insert(2, std::vector<float>{0.0f, 3.0f}, {}, 0, levels).has_value());

    auto r = g->search(std::vector<float>{2.0f, 0.1f}, 2, 10);
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 2);
    REQUIRE(r->front().id == 1);
    REQUIRE(r->front().distance < 0.01f);
    REQUIRE((*r)[1].distance == Approx(1.0f - 0.1f / std::sqrt(4.01f)).margin(1e-4));
}

TEST_CASE("graph traverses with ADC codes when a codebook is installed", "[graph][adc]") {
    auto ds = make_dataset(1200, 8, 13);
    QuantizerConfig qc;
    qc.kind = QuantizerKind::scalar;
    auto cb = train_codebook(ds.data.data(), ds.n, ds.dim, qc);
    REQUIRE(cb.has_value());

    auto g = HnswGraph::create(ds.dim, Metric::l2, {});
    REQUIRE(g.has_value());
    LevelGenerator levels(42, 16);
    for (std::size_t i = 0; i < ds.n; ++i) {
        std::vector<std::uint8_t> code((*cb)->code_size());
        REQUIRE((*cb)->encode(ds.row(i), code).has_value());
        REQUIRE(g->insert(i, ds.row(i), code, 1, levels).has_value());
    }
    REQUIRE(g->set_codes(*cb, 1, {}).has_value());

    auto queries = make_dataset(30, 8, 14);
    double adc = 0.0;
    for (std::size_t i = 0; i < queries.n; ++i) {
        auto r = g->search(queries.row(i), 10, 100, nullptr, true);
        REQUIRE(r.has_value());
        adc += recall(*r, brute_force(ds, queries.row(i), 10));
    }
    REQUIRE(adc / static_cast<double>(queries.n) >= 0.8);

    // Stale codes (older generation) fall back to exact scoring.
    REQUIRE(g->set_codes(*cb, 2, {}).has_value());
    auto r = g->search(ds.row(7), 1, 32, nullptr, true);
    REQUIRE(r.has_value());
    REQUIRE(r->front().id == 7);
    REQUIRE(r->front().distance == Approx(0.0f).margin(1e-6));

    std::unordered_map<VectorId, std::vector<std::uint8_t>> wrong{{0, {1, 2}}};
    REQUIRE(g->set_codes(*cb, 3, wrong).error().code == core::error_code::precondition_failed);
}

TEST_CASE("graph topology survives serialization", "[graph][persistence]") {
    auto ds = make_dataset(400, 8, 15);
    auto g = build(ds);
    REQUIRE(g.remove(10).has_value());
    const auto bytes = g.serialize();

    NodeLoader loader = [&ds](VectorId id) -> std::expected<std::optional<NodePayload>, core::error> {
        if (id == 20) return std::nullopt;  // record lost since the save
        return NodePayload{std::vector<float>(ds.row(id).begin(), ds.row(id).end()), {}, 0};
    };
    auto back = HnswGraph::deserialize(bytes, loader);
    REQUIRE(back.has_value());
    REQUIRE(back->size() == 398);
    REQUIRE(back->tombstone_count() == 0);
    REQUIRE_FALSE(back->contains(10));
    REQUIRE_FALSE(back->contains(20));
    REQUIRE(back->reachable_count() == 398);

    auto r = back->search(ds.row(33), 1, 32);
    REQUIRE(r.has_value());
    REQUIRE(r->front().id == 33);

    auto truncated = bytes;
    truncated.resize(truncated.size() / 2);
    REQUIRE(HnswGraph::deserialize(truncated, loader).error().code == core::error_code::data_integrity);

    auto bad_magic = bytes;
    bad_magic[0] ^= 0xFF;
    REQUIRE(HnswGraph::deserialize(bad_magic, loader).error().code == core::error_code::data_integrity);
}
