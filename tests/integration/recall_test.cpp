#include <catch2/catch_test_macros.hpp>

#include <quiver/engine/query_engine.hpp>
#include <quiver/engine/vector_index.hpp>
#include <quiver/storage/blob_store.hpp>
#include <quiver/storage/vector_store.hpp>

#include <chrono>
#include <iostream>
#include <random>
#include <vector>

using namespace quiver;
using namespace quiver::engine;

namespace {

constexpr std::size_t kDim = 32;
constexpr std::size_t kBase = 2000;
constexpr std::size_t kQueries = 50;
constexpr std::size_t kK = 10;

auto gaussian(std::size_t n, std::uint32_t seed) -> std::vector<float> {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> out(n * kDim);
    for (auto& v : out) v = dist(rng);
    return out;
}

struct Measured {
    float recall{0.0f};
    float unranked_recall{0.0f};
};

auto measure(IndexConfig cfg) -> Measured {
    cfg.dimension = kDim;
    cfg.hnsw.M = 16;
    cfg.hnsw.ef_construction = 100;
    cfg.store.initial_backoff = std::chrono::milliseconds(1);

    auto blobs = std::make_shared<storage::MemoryBlobStore>();
    auto idx = VectorIndex::create(cfg, blobs).value();
    const auto base = gaussian(kBase, 101);
    for (std::size_t i = 0; i < kBase; ++i) {
        REQUIRE(idx.insert(i, std::span<const float>(base.data() + i * kDim, kDim)).has_value());
    }
    if (cfg.quantizer.kind != index::QuantizerKind::none) {
        REQUIRE(idx.train_quantizer(base.data(), kBase).has_value());
    }

    // Ground truth scans the same records through a second handle.
    auto store = storage::VectorStore::open(blobs, cfg.store).value();
    const auto queries = gaussian(kQueries, 202);

    std::vector<SearchResult> truth, reranked, raw;
    SearchParams params;
    params.ef = 128;
    params.rerank_factor = 4;
    SearchParams no_rerank = params;
    no_rerank.exact_rerank = false;

    for (std::size_t q = 0; q < kQueries; ++q) {
        std::span<const float> query(queries.data() + q * kDim, kDim);
        truth.push_back(exact_search(store, cfg.metric, query, kK).value());
        reranked.push_back(idx.search(query, kK, params).value());
        raw.push_back(idx.search(query, kK, no_rerank).value());
    }
    Measured m{compute_recall(reranked, truth, kK), compute_recall(raw, truth, kK)};
    std::cout << "[recall] kind=" << static_cast<int>(cfg.quantizer.kind)
              << " reranked=" << m.recall << " unranked=" << m.unranked_recall << std::endl;
    return m;
}

} // namespace

TEST_CASE("compute_recall counts overlap with the truth prefix", "[integration][recall]") {
    const SearchResult expected{{1, 0.0f}, {2, 0.0f}, {3, 0.0f}, {4, 0.0f}};
    const SearchResult found{{4, 0.0f}, {9, 0.0f}, {1, 0.0f}};
    const std::vector<SearchResult> truth{expected};
    const std::vector<SearchResult> got{found};
    REQUIRE(compute_recall(got, truth, 4) == 0.5f);
    REQUIRE(compute_recall(got, truth, 2) == 0.5f);
    REQUIRE(compute_recall(std::vector<SearchResult>{}, truth, 4) == 0.0f);
}

TEST_CASE("full precision graph recall", "[integration][recall]") {
    auto m = measure(IndexConfig{});
    REQUIRE(m.recall >= 0.9f);
    REQUIRE(m.unranked_recall >= 0.9f);
}

TEST_CASE("scalar quantized recall with exact re-ranking", "[integration][recall][quantizer]") {
    IndexConfig cfg;
    cfg.quantizer.kind = index::QuantizerKind::scalar;
    auto m = measure(cfg);
    REQUIRE(m.recall >= 0.85f);
}

TEST_CASE("product quantized recall with exact re-ranking", "[integration][recall][quantizer]") {
    IndexConfig cfg;
    cfg.quantizer.kind = index::QuantizerKind::product;
    cfg.quantizer.m = 8;
    cfg.quantizer.nbits = 8;
    auto m = measure(cfg);
    REQUIRE(m.recall >= 0.8f);
    REQUIRE(m.recall >= m.unranked_recall);
}

TEST_CASE("rotated product quantized recall", "[integration][recall][quantizer][opq]") {
    IndexConfig cfg;
    cfg.quantizer.kind = index::QuantizerKind::product;
    cfg.quantizer.m = 8;
    cfg.quantizer.nbits = 8;
    cfg.quantizer.use_rotation = true;
    auto m = measure(cfg);
    REQUIRE(m.recall >= 0.8f);
}

TEST_CASE("inner product recall", "[integration][recall][metric]") {
    IndexConfig cfg;
    cfg.metric = index::Metric::inner_product;
    auto m = measure(cfg);
    REQUIRE(m.recall >= 0.85f);
}
