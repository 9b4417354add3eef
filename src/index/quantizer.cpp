#include "quiver/index/quantizer.hpp"
#include "quiver/index/product_quantizer.hpp"
#include "quiver/index/scalar_quantizer.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/kernels/dispatch.hpp"
#include "quiver/storage/codec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>

namespace quiver::index {

namespace {

constexpr std::uint32_t kCodebookMagic = 0x42435651u;  // "QVCB"
constexpr std::uint32_t kCodebookVersion = 1;

} // namespace

auto validate(const QuantizerConfig& cfg, std::size_t dim) -> std::expected<void, core::error> {
    using core::error_code;
    if (dim == 0) {
        return core::make_error(error_code::config_invalid, "dimension must be > 0", "index.quantizer");
    }
    switch (cfg.kind) {
        case QuantizerKind::none:
            return {};
        case QuantizerKind::scalar:
            break;
        case QuantizerKind::product:
            if (cfg.m == 0 || dim % cfg.m != 0) {
                return core::make_error(error_code::config_invalid,
                                        "m=" + std::to_string(cfg.m) + " must divide dimension " +
                                            std::to_string(dim),
                                        "index.quantizer");
            }
            if (cfg.nbits == 0 || cfg.nbits > 8) {
                return core::make_error(error_code::config_invalid, "nbits must be in [1, 8]",
                                        "index.quantizer");
            }
            if (cfg.use_rotation && cfg.rotation_iters == 0) {
                return core::make_error(error_code::config_invalid,
                                        "rotation_iters must be > 0 with use_rotation",
                                        "index.quantizer");
            }
            break;
        default:
            return core::make_error(error_code::config_invalid, "unknown quantizer kind",
                                    "index.quantizer");
    }
    if (cfg.min_samples_per_centroid == 0) {
        return core::make_error(error_code::config_invalid, "min_samples_per_centroid must be > 0",
                                "index.quantizer");
    }
    return {};
}

auto Codebook::encode_batch(const float* data, std::size_t n, std::uint8_t* codes) const
    -> std::expected<void, core::error> {
    const std::size_t dim = dimension();
    const std::size_t cs = code_size();
    std::atomic<bool> failed{false};

    #pragma omp parallel for schedule(dynamic, 64)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const auto row = static_cast<std::size_t>(i);
        auto r = encode(std::span(data + row * dim, dim), std::span(codes + row * cs, cs));
        if (!r) failed.store(true, std::memory_order_relaxed);
    }

    if (failed.load()) {
        return core::make_error(core::error_code::internal, "batch encode failed", "index.quantizer");
    }
    return {};
}

auto Codebook::quantization_error(const float* data, std::size_t n) const -> float {
    if (n == 0) return 0.0f;
    const std::size_t dim = dimension();
    const auto& ops = kernels::select_backend_auto();
    double total = 0.0;

    #pragma omp parallel for reduction(+:total)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        std::vector<std::uint8_t> code(code_size());
        std::vector<float> recon(dim);
        const float* row = data + static_cast<std::size_t>(i) * dim;
        if (encode(std::span(row, dim), code) && decode(code, recon)) {
            total += ops.l2_sq(std::span(row, dim), recon);
        }
    }
    return static_cast<float>(total / static_cast<double>(n));
}

auto train_codebook(const float* data, std::size_t n, std::size_t dim, const QuantizerConfig& cfg)
    -> std::expected<std::shared_ptr<const Codebook>, core::error> {
    using core::error_code;

    if (auto ok = validate(cfg, dim); !ok) return std::unexpected(ok.error());
    if (cfg.kind == QuantizerKind::none) {
        return core::make_error(error_code::config_invalid, "no quantizer kind configured",
                                "index.quantizer");
    }

    const std::size_t ksub = centroids_per_slot(cfg);
    const std::size_t needed = static_cast<std::size_t>(cfg.min_samples_per_centroid) * ksub;
    if (n < needed) {
        return core::make_error(error_code::insufficient_samples,
                                "training needs at least " + std::to_string(needed) +
                                    " vectors, got " + std::to_string(n),
                                "index.quantizer");
    }

    const bool dbg = core::debug_enabled("QUIVER_QUANT_DEBUG");
    const auto t0 = std::chrono::steady_clock::now();

    std::shared_ptr<const Codebook> out;
    if (cfg.kind == QuantizerKind::scalar) {
        out = ScalarCodebook::train(data, n, dim);
    } else {
        auto pq = ProductCodebook::train(data, n, dim, cfg);
        if (!pq) return std::unexpected(pq.error());
        out = std::move(*pq);
    }

    if (dbg) {
        const auto ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[quiver][quant][train] kind=" << to_string(cfg.kind) << " n=" << n
                  << " dim=" << dim << " code_size=" << out->code_size()
                  << " mse=" << out->quantization_error(data, std::min<std::size_t>(n, 1024))
                  << " ms=" << ms << std::endl;
    }
    return out;
}

auto deserialize_codebook(std::span<const std::uint8_t> bytes)
    -> std::expected<std::shared_ptr<const Codebook>, core::error> {
    using core::error_code;
    storage::ByteReader in(bytes);
    const std::uint32_t magic = in.u32();
    const std::uint32_t version = in.u32();
    const auto kind = static_cast<QuantizerKind>(in.u8());
    const std::uint32_t dim = in.u32();
    if (!in.ok() || magic != kCodebookMagic) {
        return core::make_error(error_code::data_integrity, "bad codebook header", "index.quantizer");
    }
    if (version != kCodebookVersion) {
        return core::make_error(error_code::unsupported,
                                "codebook version " + std::to_string(version) + " not supported",
                                "index.quantizer");
    }
    if (dim == 0) {
        return core::make_error(error_code::data_integrity, "codebook has zero dimension",
                                "index.quantizer");
    }

    std::expected<std::shared_ptr<const Codebook>, core::error> out =
        core::make_error(error_code::data_integrity, "unknown codebook kind", "index.quantizer");
    if (kind == QuantizerKind::scalar) {
        auto sq = ScalarCodebook::deserialize(in, dim);
        if (!sq) return std::unexpected(sq.error());
        out = std::shared_ptr<const Codebook>(std::move(*sq));
    } else if (kind == QuantizerKind::product) {
        auto pq = ProductCodebook::deserialize(in, dim);
        if (!pq) return std::unexpected(pq.error());
        out = std::shared_ptr<const Codebook>(std::move(*pq));
    }
    if (out && !in.exhausted()) {
        return core::make_error(error_code::data_integrity, "trailing bytes after codebook",
                                "index.quantizer");
    }
    return out;
}

namespace detail {

void write_codebook_header(storage::ByteWriter& out, QuantizerKind kind, std::size_t dim) {
    out.put_u32(kCodebookMagic);
    out.put_u32(kCodebookVersion);
    out.put_u8(static_cast<std::uint8_t>(kind));
    out.put_u32(static_cast<std::uint32_t>(dim));
}

} // namespace detail

} // namespace quiver::index
