#pragma once

/** \file quantizer.hpp
 *  \brief Trained vector codebooks (scalar / product quantization) and ADC lookup tables.
 *
 * A Codebook is immutable once trained and is shared as
 * std::shared_ptr<const Codebook>; retraining produces a new object that
 * replaces the old one wholesale. Codes are opaque byte strings of
 * code_size() bytes.
 *
 * Asymmetric distance computation (ADC): for a query, make_table() builds an
 * m x ksub table of partial distances so that the approximate distance of a
 * code is bias + sum_j table[j][code[j]]. Values live in the same "lower is
 * better" space as index::distance() for the chosen metric.
 *
 * Thread-safety: all const member functions are safe for concurrent use.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"
#include "quiver/index/metric.hpp"

namespace quiver::storage {
class ByteWriter;
} // namespace quiver::storage

namespace quiver::index {

enum class QuantizerKind : std::uint8_t {
    none = 0,
    scalar = 1,   /**< 8-bit per-dimension affine quantization */
    product = 2,  /**< m sub-quantizers with 2^nbits centroids each */
};

constexpr auto to_string(QuantizerKind k) noexcept -> std::string_view {
    switch (k) {
        case QuantizerKind::none: return "none";
        case QuantizerKind::scalar: return "scalar";
        case QuantizerKind::product: return "product";
    }
    return "unknown";
}

/** \brief Quantizer training configuration. */
struct QuantizerConfig {
    QuantizerKind kind{QuantizerKind::none};  /**< none disables quantization */
    std::uint32_t m{8};                       /**< Sub-quantizers (product only); must divide dim */
    std::uint32_t nbits{8};                   /**< Bits per sub-code (product only), 1..8 */
    std::uint32_t max_iter{25};               /**< K-means iterations per subspace */
    float epsilon{1e-4f};                     /**< K-means convergence threshold */
    std::uint32_t seed{42};                   /**< Training seed */
    bool use_rotation{false};                 /**< Learn an OPQ rotation (product only) */
    std::uint32_t rotation_iters{4};          /**< Alternating PQ / Procrustes rounds */
    std::uint32_t min_samples_per_centroid{2};/**< Training needs n >= this * ksub */
};

/** \brief Centroids per slot: 256 for scalar, 2^nbits for product. */
constexpr auto centroids_per_slot(const QuantizerConfig& cfg) noexcept -> std::uint32_t {
    return cfg.kind == QuantizerKind::product ? (1u << cfg.nbits) : 256u;
}

/** \brief Check the configuration against an index dimension. */
auto validate(const QuantizerConfig& cfg, std::size_t dim) -> std::expected<void, core::error>;

/** \brief Per-query table of partial distances. */
class AdcTable {
public:
    AdcTable() = default;
    AdcTable(std::uint32_t m, std::uint32_t ksub, float bias, std::vector<float> lut) noexcept
        : m_(m), ksub_(ksub), bias_(bias), lut_(std::move(lut)) {}

    /** \brief Approximate distance of a code; m table lookups, no decompression. */
    [[nodiscard]] auto distance(std::span<const std::uint8_t> code) const noexcept -> float {
        float s = bias_;
        const float* row = lut_.data();
        for (std::uint32_t j = 0; j < m_; ++j, row += ksub_) s += row[code[j]];
        return s;
    }

    [[nodiscard]] auto subquantizers() const noexcept -> std::uint32_t { return m_; }
    [[nodiscard]] auto ksub() const noexcept -> std::uint32_t { return ksub_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return lut_.empty(); }

private:
    std::uint32_t m_{0};
    std::uint32_t ksub_{0};
    float bias_{0.0f};
    std::vector<float> lut_;
};

/** \brief Immutable trained quantizer parameters. */
class Codebook {
public:
    virtual ~Codebook() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> QuantizerKind = 0;
    [[nodiscard]] virtual auto dimension() const noexcept -> std::size_t = 0;
    [[nodiscard]] virtual auto code_size() const noexcept -> std::size_t = 0;

    /** \brief Deterministically encode one vector.
     *
     * \param vec Vector [dimension()]
     * \param code Output [code_size()]
     * \return dimension_mismatch on wrong input or output length
     */
    virtual auto encode(std::span<const float> vec, std::span<std::uint8_t> code) const
        -> std::expected<void, core::error> = 0;

    /** \brief Reconstruct an approximation of the encoded vector (diagnostics only). */
    virtual auto decode(std::span<const std::uint8_t> code, std::span<float> out) const
        -> std::expected<void, core::error> = 0;

    /** \brief Build the ADC table of a query for the given metric. */
    virtual auto make_table(std::span<const float> query, Metric metric) const
        -> std::expected<AdcTable, core::error> = 0;

    /** \brief Self-describing binary image; see deserialize_codebook(). */
    [[nodiscard]] virtual auto serialize() const -> std::vector<std::uint8_t> = 0;

    /** \brief Encode n row-major vectors into codes [n x code_size()]. Parallel with OpenMP. */
    auto encode_batch(const float* data, std::size_t n, std::uint8_t* codes) const
        -> std::expected<void, core::error>;

    /** \brief Mean squared reconstruction error over n vectors. */
    [[nodiscard]] auto quantization_error(const float* data, std::size_t n) const -> float;

protected:
    Codebook() = default;
    Codebook(const Codebook&) = default;
    Codebook& operator=(const Codebook&) = default;
};

/** \brief Train a codebook on a sample.
 *
 * Pure function of its inputs; safe to run concurrently with serving.
 *
 * \param data Training vectors [n x dim]
 * \param n Number of vectors
 * \param dim Dimensionality
 * \param cfg Quantizer configuration
 * \return The codebook, config_invalid for bad parameters, or insufficient_samples
 *         when n < min_samples_per_centroid * ksub
 *
 * Complexity: scalar O(n * dim); product O(n * ksub * dim * max_iter), times rotation_iters with OPQ.
 */
auto train_codebook(const float* data, std::size_t n, std::size_t dim, const QuantizerConfig& cfg)
    -> std::expected<std::shared_ptr<const Codebook>, core::error>;

/** \brief Rebuild a codebook from Codebook::serialize() output. */
auto deserialize_codebook(std::span<const std::uint8_t> bytes)
    -> std::expected<std::shared_ptr<const Codebook>, core::error>;

namespace detail {
void write_codebook_header(storage::ByteWriter& out, QuantizerKind kind, std::size_t dim);
} // namespace detail

} // namespace quiver::index
