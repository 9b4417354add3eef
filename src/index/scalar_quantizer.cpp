#include "quiver/index/scalar_quantizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace quiver::index {

namespace {

auto size_error(const char* what, std::size_t want, std::size_t got) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::dimension_mismatch,
                            std::string(what) + ": expected " + std::to_string(want) + ", got " +
                                std::to_string(got),
                            "index.scalar_quantizer");
}

} // namespace

ScalarCodebook::ScalarCodebook(std::vector<float> mins, std::vector<float> steps)
    : mins_(std::move(mins)), steps_(std::move(steps)) {}

auto ScalarCodebook::train(const float* data, std::size_t n, std::size_t dim)
    -> std::shared_ptr<const ScalarCodebook> {
    std::vector<float> lo(dim, std::numeric_limits<float>::max());
    std::vector<float> hi(dim, std::numeric_limits<float>::lowest());
    for (std::size_t i = 0; i < n; ++i) {
        const float* row = data + i * dim;
        for (std::size_t d = 0; d < dim; ++d) {
            lo[d] = std::min(lo[d], row[d]);
            hi[d] = std::max(hi[d], row[d]);
        }
    }
    std::vector<float> steps(dim);
    for (std::size_t d = 0; d < dim; ++d) {
        steps[d] = (hi[d] - lo[d]) / 255.0f;
    }
    return std::make_shared<const ScalarCodebook>(std::move(lo), std::move(steps));
}

auto ScalarCodebook::encode(std::span<const float> vec, std::span<std::uint8_t> code) const
    -> std::expected<void, core::error> {
    if (vec.size() != mins_.size()) return size_error("vector length", mins_.size(), vec.size());
    if (code.size() != mins_.size()) return size_error("code length", mins_.size(), code.size());

    for (std::size_t d = 0; d < mins_.size(); ++d) {
        if (steps_[d] <= 0.0f) {
            code[d] = 0;
            continue;
        }
        const float q = std::nearbyint((vec[d] - mins_[d]) / steps_[d]);
        code[d] = static_cast<std::uint8_t>(std::clamp(q, 0.0f, 255.0f));
    }
    return {};
}

auto ScalarCodebook::decode(std::span<const std::uint8_t> code, std::span<float> out) const
    -> std::expected<void, core::error> {
    if (code.size() != mins_.size()) return size_error("code length", mins_.size(), code.size());
    if (out.size() != mins_.size()) return size_error("output length", mins_.size(), out.size());

    for (std::size_t d = 0; d < mins_.size(); ++d) {
        out[d] = mins_[d] + static_cast<float>(code[d]) * steps_[d];
    }
    return {};
}

auto ScalarCodebook::make_table(std::span<const float> query, Metric metric) const
    -> std::expected<AdcTable, core::error> {
    const std::size_t dim = mins_.size();
    if (query.size() != dim) return size_error("query length", dim, query.size());

    constexpr std::uint32_t ksub = 256;
    std::vector<float> lut(dim * ksub);
    for (std::size_t d = 0; d < dim; ++d) {
        float* row = lut.data() + d * ksub;
        const float q = query[d];
        for (std::uint32_t c = 0; c < ksub; ++c) {
            const float recon = mins_[d] + static_cast<float>(c) * steps_[d];
            if (metric == Metric::l2) {
                const float diff = q - recon;
                row[c] = diff * diff;
            } else {
                row[c] = -q * recon;
            }
        }
    }
    const float bias = metric == Metric::cosine ? 1.0f : 0.0f;
    return AdcTable(static_cast<std::uint32_t>(dim), ksub, bias, std::move(lut));
}

auto ScalarCodebook::serialize() const -> std::vector<std::uint8_t> {
    storage::ByteWriter out;
    detail::write_codebook_header(out, kind(), mins_.size());
    out.put_floats(mins_);
    out.put_floats(steps_);
    return std::move(out).take();
}

auto ScalarCodebook::deserialize(storage::ByteReader& in, std::size_t dim)
    -> std::expected<std::shared_ptr<const ScalarCodebook>, core::error> {
    auto mins = in.floats(dim);
    auto steps = in.floats(dim);
    if (!in.ok()) {
        return core::make_error(core::error_code::data_integrity, "truncated scalar codebook",
                                "index.scalar_quantizer");
    }
    for (float s : steps) {
        if (!(s >= 0.0f) || !std::isfinite(s)) {
            return core::make_error(core::error_code::data_integrity, "invalid scalar step",
                                    "index.scalar_quantizer");
        }
    }
    return std::make_shared<const ScalarCodebook>(std::move(mins), std::move(steps));
}

} // namespace quiver::index
