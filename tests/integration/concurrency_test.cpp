#include <catch2/catch_test_macros.hpp>

#include <quiver/engine/vector_index.hpp>
#include <quiver/storage/blob_store.hpp>

#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

using namespace quiver;
using namespace quiver::engine;

namespace {

constexpr std::size_t kDim = 16;

auto gaussian(std::size_t n, std::uint32_t seed) -> std::vector<float> {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> out(n * kDim);
    for (auto& v : out) v = dist(rng);
    return out;
}

auto row(const std::vector<float>& data, std::size_t i) -> std::span<const float> {
    return {data.data() + i * kDim, kDim};
}

} // namespace

TEST_CASE("searches run alongside inserts, removes and retraining", "[integration][concurrency]") {
    IndexConfig cfg;
    cfg.dimension = kDim;
    cfg.hnsw.M = 8;
    cfg.hnsw.ef_construction = 64;
    cfg.quantizer.kind = index::QuantizerKind::scalar;
    cfg.store.initial_backoff = std::chrono::milliseconds(1);
    auto idx = VectorIndex::create(cfg, std::make_shared<storage::MemoryBlobStore>()).value();

    const auto data = gaussian(2000, 31);
    for (std::size_t i = 0; i < 1000; ++i) REQUIRE(idx.insert(i, row(data, i)).has_value());
    REQUIRE(idx.train_quantizer_from_store(1000).has_value());

    std::atomic<bool> done{false};
    std::atomic<int> search_errors{0};
    std::atomic<int> oversized{0};
    std::atomic<int> searches{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&, t] {
            std::size_t q = static_cast<std::size_t>(t);
            while (!done.load()) {
                auto r = idx.search(row(data, q % 2000), 10);
                if (!r) {
                    search_errors.fetch_add(1);
                } else if (r->size() > 10) {
                    oversized.fetch_add(1);
                }
                searches.fetch_add(1);
                q += 7;
            }
        });
    }

    std::atomic<int> write_errors{0};
    std::thread writer([&] {
        for (std::size_t i = 1000; i < 2000; ++i) {
            if (!idx.insert(i, row(data, i))) write_errors.fetch_add(1);
            if (i % 10 == 0 && !idx.remove(i - 1000)) write_errors.fetch_add(1);
            if (i == 1500 && !idx.train_quantizer_from_store(1200)) write_errors.fetch_add(1);
        }
    });
    writer.join();
    done.store(true);
    for (auto& th : readers) th.join();

    REQUIRE(write_errors.load() == 0);
    REQUIRE(search_errors.load() == 0);
    REQUIRE(oversized.load() == 0);
    REQUIRE(searches.load() > 0);
    REQUIRE(idx.size() == 1900);
    REQUIRE(idx.stats().codebook_generation == 2);

    // Every record written after the last retraining carries the newest generation.
    REQUIRE(idx.get(1999).value()->code_generation == 2);
    auto r = idx.search(row(data, 1234), 1, SearchParams{.ef = 100});
    REQUIRE(r.has_value());
    REQUIRE(r->front().id == 1234);
}

TEST_CASE("concurrent writers are serialized", "[integration][concurrency]") {
    IndexConfig cfg;
    cfg.dimension = kDim;
    cfg.hnsw.M = 8;
    cfg.hnsw.ef_construction = 32;
    auto idx = VectorIndex::create(cfg, std::make_shared<storage::MemoryBlobStore>()).value();
    const auto data = gaussian(800, 32);

    std::atomic<int> errors{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&, t] {
            for (std::size_t i = static_cast<std::size_t>(t); i < 800; i += 4) {
                if (!idx.insert_auto(row(data, i))) errors.fetch_add(1);
            }
        });
    }
    for (auto& th : writers) th.join();

    REQUIRE(errors.load() == 0);
    REQUIRE(idx.size() == 800);
    REQUIRE(idx.graph().size() == 800);
    REQUIRE(idx.graph().reachable_count() >= 790);
}
