#include <catch2/catch_test_macros.hpp>
#include <quiver/engine/config.hpp>

#include <cstdlib>

using namespace quiver;
using engine::IndexConfig;

namespace {

auto base_config() -> IndexConfig {
    IndexConfig cfg;
    cfg.dimension = 16;
    return cfg;
}

auto code_of(const IndexConfig& cfg) -> core::error_code {
    return engine::validate(cfg).error().code;
}

void clear_overrides() {
    for (const char* k : {"QUIVER_HNSW_M", "QUIVER_EF_CONSTRUCTION", "QUIVER_CACHE_MB", "QUIVER_SEED"}) {
        unsetenv(k);
    }
}

} // namespace

TEST_CASE("index config validation", "[config]") {
    REQUIRE(engine::validate(base_config()).has_value());

    auto cfg = base_config();
    cfg.dimension = 0;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);

    cfg = base_config();
    cfg.hnsw.M = 1;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);

    cfg = base_config();
    cfg.hnsw.ef_construction = cfg.hnsw.M - 1;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);

    cfg = base_config();
    cfg.quantizer.kind = index::QuantizerKind::product;
    cfg.quantizer.m = 5;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);
    cfg.quantizer.m = 4;
    REQUIRE(engine::validate(cfg).has_value());
    cfg.quantizer.nbits = 9;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);

    cfg = base_config();
    cfg.store.cache_shards = 0;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);

    cfg = base_config();
    cfg.auto_compact_ratio = 1.5;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);
    cfg.auto_compact_ratio = -0.1;
    REQUIRE(code_of(cfg) == core::error_code::config_invalid);
    cfg.auto_compact_ratio = 0.3;
    REQUIRE(engine::validate(cfg).has_value());
}

TEST_CASE("environment overrides adjust construction knobs", "[config][env]") {
    clear_overrides();
    setenv("QUIVER_HNSW_M", "24", 1);
    setenv("QUIVER_EF_CONSTRUCTION", "300", 1);
    setenv("QUIVER_CACHE_MB", "3", 1);
    setenv("QUIVER_SEED", "7", 1);

    auto cfg = base_config();
    engine::apply_env_overrides(cfg);
    REQUIRE(cfg.hnsw.M == 24);
    REQUIRE(cfg.hnsw.ef_construction == 300);
    REQUIRE(cfg.store.cache_bytes == (std::size_t{3} << 20));
    REQUIRE(cfg.hnsw.seed == 7);
    REQUIRE(cfg.quantizer.seed == 7);
    clear_overrides();
}

TEST_CASE("malformed environment overrides are ignored", "[config][env]") {
    clear_overrides();
    setenv("QUIVER_HNSW_M", "lots", 1);
    setenv("QUIVER_EF_CONSTRUCTION", "", 1);
    setenv("QUIVER_SEED", "99999999999", 1);

    auto cfg = base_config();
    const auto before = cfg;
    engine::apply_env_overrides(cfg);
    REQUIRE(cfg.hnsw.M == before.hnsw.M);
    REQUIRE(cfg.hnsw.ef_construction == before.hnsw.ef_construction);
    REQUIRE(cfg.hnsw.seed == before.hnsw.seed);
    REQUIRE(cfg.store.cache_bytes == before.store.cache_bytes);
    clear_overrides();
}
