#pragma once

/** \file product_quantizer.hpp
 *  \brief Product quantization with optional OPQ rotation.
 *
 * Decomposes d-dimensional vectors into m contiguous subspaces of d/m
 * dimensions and quantizes each against its own k-means codebook of
 * ksub = 2^nbits centroids. With a rotation R, vectors are mapped x -> R x
 * before subspace splitting; R is orthonormal so L2 and inner products are
 * preserved and ADC tables are built directly in the rotated space.
 *
 * Memory: m * ksub * dsub floats of centroids (+ d*d for R); m bytes per code.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "quiver/index/quantizer.hpp"
#include "quiver/storage/codec.hpp"

namespace quiver::index {

class ProductCodebook final : public Codebook {
public:
    /** \brief Assemble from trained parts. centroids is [m x ksub x dsub]; rotation is empty or [dim x dim]. */
    ProductCodebook(std::size_t dim, std::uint32_t m, std::uint32_t nbits,
                    std::vector<float> centroids, std::vector<float> rotation);

    /** \brief Train sub-codebooks (and the rotation when cfg.use_rotation).
     *
     * Preconditions: validate(cfg, dim) passed; n >= 2^nbits.
     * Complexity: O(rotation_iters * (n * dim^2 + n * ksub * dim * max_iter))
     */
    static auto train(const float* data, std::size_t n, std::size_t dim, const QuantizerConfig& cfg)
        -> std::expected<std::shared_ptr<const ProductCodebook>, core::error>;

    static auto deserialize(storage::ByteReader& in, std::size_t dim)
        -> std::expected<std::shared_ptr<const ProductCodebook>, core::error>;

    auto kind() const noexcept -> QuantizerKind override { return QuantizerKind::product; }
    auto dimension() const noexcept -> std::size_t override { return dim_; }
    auto code_size() const noexcept -> std::size_t override { return m_; }

    auto encode(std::span<const float> vec, std::span<std::uint8_t> code) const
        -> std::expected<void, core::error> override;
    auto decode(std::span<const std::uint8_t> code, std::span<float> out) const
        -> std::expected<void, core::error> override;
    auto make_table(std::span<const float> query, Metric metric) const
        -> std::expected<AdcTable, core::error> override;
    auto serialize() const -> std::vector<std::uint8_t> override;

    [[nodiscard]] auto subquantizers() const noexcept -> std::uint32_t { return m_; }
    [[nodiscard]] auto ksub() const noexcept -> std::uint32_t { return ksub_; }
    [[nodiscard]] auto has_rotation() const noexcept -> bool { return !rotation_.empty(); }
    [[nodiscard]] auto rotation() const noexcept -> std::span<const float> { return rotation_; }

private:
    auto centroid(std::uint32_t sub, std::uint32_t k) const noexcept -> const float* {
        return centroids_.data() + (static_cast<std::size_t>(sub) * ksub_ + k) * dsub_;
    }
    void rotate(const float* in, float* out) const noexcept;
    void unrotate(const float* in, float* out) const noexcept;
    void encode_rotated(const float* vec, std::uint8_t* code) const noexcept;

    std::size_t dim_{0};
    std::uint32_t m_{0};
    std::uint32_t nbits_{0};
    std::uint32_t ksub_{0};
    std::size_t dsub_{0};
    std::vector<float> centroids_;
    std::vector<float> rotation_;
};

} // namespace quiver::index
