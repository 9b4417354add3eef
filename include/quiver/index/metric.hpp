#pragma once

/** \file metric.hpp
 *  \brief Similarity metrics and the "lower is better" internal distance.
 *
 * Every component ranks by an internal distance where smaller means closer:
 * - l2:            squared Euclidean distance
 * - inner_product: negated dot product
 * - cosine:        1 - dot product of unit-normalized vectors
 *
 * Cosine vectors are normalized once at ingestion (and queries once per
 * search), so the hot path only ever evaluates a dot product.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include "quiver/error.hpp"
#include "quiver/kernels/dispatch.hpp"

namespace quiver::index {

using VectorId = std::uint64_t;

enum class Metric : std::uint8_t {
    l2 = 0,
    inner_product = 1,
    cosine = 2,
};

constexpr auto to_string(Metric m) noexcept -> std::string_view {
    switch (m) {
        case Metric::l2: return "l2";
        case Metric::inner_product: return "inner_product";
        case Metric::cosine: return "cosine";
    }
    return "unknown";
}

/** \brief Parse a metric name; config_invalid for anything else. */
auto parse_metric(std::string_view name) -> std::expected<Metric, core::error>;

/** \brief Validates a persisted metric tag. */
auto metric_from_tag(std::uint8_t tag) -> std::expected<Metric, core::error>;

/** \brief Internal distance between two equal-length vectors. */
inline auto distance(Metric metric, std::span<const float> a, std::span<const float> b) noexcept -> float {
    const auto& ops = kernels::select_backend_auto();
    switch (metric) {
        case Metric::l2: return ops.l2_sq(a, b);
        case Metric::inner_product: return -ops.inner_product(a, b);
        case Metric::cosine: return 1.0f - ops.inner_product(a, b);
    }
    return ops.l2_sq(a, b);
}

/** \brief distance() with a length check against the index dimension. */
auto checked_distance(Metric metric, std::span<const float> a, std::span<const float> b,
                      std::size_t dim) -> std::expected<float, core::error>;

/** \brief Converts an internal distance to the value reported to callers.
 *
 * Inner product reports the similarity itself; l2 and cosine report the distance.
 */
constexpr auto reported_distance(Metric metric, float internal) noexcept -> float {
    return metric == Metric::inner_product ? -internal : internal;
}

/** \brief Whether vectors must be unit-normalized before use under this metric. */
constexpr auto needs_normalization(Metric metric) noexcept -> bool {
    return metric == Metric::cosine;
}

} // namespace quiver::index
