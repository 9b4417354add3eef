#include "quiver/index/metric.hpp"

#include <string>

namespace quiver::index {

auto parse_metric(std::string_view name) -> std::expected<Metric, core::error> {
    if (name == "l2" || name == "euclidean") return Metric::l2;
    if (name == "ip" || name == "inner_product" || name == "dot") return Metric::inner_product;
    if (name == "cosine") return Metric::cosine;
    return core::make_error(core::error_code::config_invalid,
                            "unknown metric '" + std::string(name) + "'", "index.metric");
}

auto metric_from_tag(std::uint8_t tag) -> std::expected<Metric, core::error> {
    if (tag > static_cast<std::uint8_t>(Metric::cosine)) {
        return core::make_error(core::error_code::data_integrity,
                                "unknown metric tag " + std::to_string(tag), "index.metric");
    }
    return static_cast<Metric>(tag);
}

auto checked_distance(Metric metric, std::span<const float> a, std::span<const float> b,
                      std::size_t dim) -> std::expected<float, core::error> {
    if (a.size() != dim || b.size() != dim) {
        return core::make_error(core::error_code::dimension_mismatch,
                                "expected " + std::to_string(dim) + " components, got " +
                                    std::to_string(a.size()) + " and " + std::to_string(b.size()),
                                "index.metric");
    }
    return distance(metric, a, b);
}

} // namespace quiver::index
