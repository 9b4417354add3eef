#pragma once

/** \file scalar_quantizer.hpp
 *  \brief 8-bit scalar quantization: one byte per dimension.
 *
 * Each dimension d is mapped affinely onto [0, 255] using the training
 * minimum and step = (max - min) / 255. Reconstruction error per dimension is
 * at most step / 2 for values inside the training range; values outside are
 * clamped. A constant dimension (max == min) always encodes to 0.
 *
 * Memory: 2 * dim floats of parameters; dim bytes per code.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "quiver/index/quantizer.hpp"
#include "quiver/storage/codec.hpp"

namespace quiver::index {

class ScalarCodebook final : public Codebook {
public:
    ScalarCodebook(std::vector<float> mins, std::vector<float> steps);

    /** \brief Learn per-dimension ranges. Preconditions: n > 0, dim > 0. */
    static auto train(const float* data, std::size_t n, std::size_t dim)
        -> std::shared_ptr<const ScalarCodebook>;

    /** \brief Read the body written by serialize() after the common header. */
    static auto deserialize(storage::ByteReader& in, std::size_t dim)
        -> std::expected<std::shared_ptr<const ScalarCodebook>, core::error>;

    auto kind() const noexcept -> QuantizerKind override { return QuantizerKind::scalar; }
    auto dimension() const noexcept -> std::size_t override { return mins_.size(); }
    auto code_size() const noexcept -> std::size_t override { return mins_.size(); }

    auto encode(std::span<const float> vec, std::span<std::uint8_t> code) const
        -> std::expected<void, core::error> override;
    auto decode(std::span<const std::uint8_t> code, std::span<float> out) const
        -> std::expected<void, core::error> override;
    auto make_table(std::span<const float> query, Metric metric) const
        -> std::expected<AdcTable, core::error> override;
    auto serialize() const -> std::vector<std::uint8_t> override;

    [[nodiscard]] auto mins() const noexcept -> std::span<const float> { return mins_; }
    [[nodiscard]] auto steps() const noexcept -> std::span<const float> { return steps_; }

private:
    std::vector<float> mins_;
    std::vector<float> steps_;
};

} // namespace quiver::index
