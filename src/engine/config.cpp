#include "quiver/engine/config.hpp"
#include "quiver/core/platform_utils.hpp"

#include <iostream>
#include <limits>
#include <string>

namespace quiver::engine {

auto validate(const IndexConfig& config) -> std::expected<void, core::error> {
    using core::error_code;
    if (config.dimension == 0) {
        return core::make_error(error_code::config_invalid, "dimension must be > 0", "engine.config");
    }
    if (auto ok = index::validate(config.hnsw); !ok) return std::unexpected(ok.error());
    if (auto ok = index::validate(config.quantizer, config.dimension); !ok) {
        return std::unexpected(ok.error());
    }
    if (config.store.cache_shards == 0) {
        return core::make_error(error_code::config_invalid, "cache_shards must be > 0", "engine.config");
    }
    if (!(config.auto_compact_ratio >= 0.0 && config.auto_compact_ratio <= 1.0)) {
        return core::make_error(error_code::config_invalid, "auto_compact_ratio must be in [0, 1]",
                                "engine.config");
    }
    return {};
}

void apply_env_overrides(IndexConfig& config) {
    constexpr auto u32_max = std::numeric_limits<std::uint32_t>::max();
    const bool dbg = core::debug_enabled("QUIVER_DEBUG");

    if (auto v = core::env_unsigned("QUIVER_HNSW_M"); v && *v <= u32_max) {
        config.hnsw.M = static_cast<std::uint32_t>(*v);
        if (dbg) std::cerr << "[quiver][config][env] QUIVER_HNSW_M=" << *v << std::endl;
    }
    if (auto v = core::env_unsigned("QUIVER_EF_CONSTRUCTION"); v && *v <= u32_max) {
        config.hnsw.ef_construction = static_cast<std::uint32_t>(*v);
        if (dbg) std::cerr << "[quiver][config][env] QUIVER_EF_CONSTRUCTION=" << *v << std::endl;
    }
    if (auto v = core::env_unsigned("QUIVER_CACHE_MB")) {
        config.store.cache_bytes = static_cast<std::size_t>(*v) << 20;
        if (dbg) std::cerr << "[quiver][config][env] QUIVER_CACHE_MB=" << *v << std::endl;
    }
    if (auto v = core::env_unsigned("QUIVER_SEED"); v && *v <= u32_max) {
        config.hnsw.seed = static_cast<std::uint32_t>(*v);
        config.quantizer.seed = static_cast<std::uint32_t>(*v);
        if (dbg) std::cerr << "[quiver][config][env] QUIVER_SEED=" << *v << std::endl;
    }
}

} // namespace quiver::engine
