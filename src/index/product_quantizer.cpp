#include "quiver/index/product_quantizer.hpp"
#include "quiver/index/kmeans.hpp"
#include "quiver/kernels/dispatch.hpp"
#include "quiver/core/platform_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>

namespace quiver::index {

namespace {

auto size_error(const char* what, std::size_t want, std::size_t got) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::dimension_mismatch,
                            std::string(what) + ": expected " + std::to_string(want) + ", got " +
                                std::to_string(got),
                            "index.product_quantizer");
}

/** \brief Learn m sub-codebooks on (already rotated) data; returns [m x ksub x dsub]. */
auto train_subspaces(const float* data, std::size_t n, std::size_t dim, std::uint32_t m,
                     std::uint32_t ksub, const QuantizerConfig& cfg)
    -> std::expected<std::vector<float>, core::error> {
    const std::size_t dsub = dim / m;
    std::vector<float> centroids(static_cast<std::size_t>(m) * ksub * dsub);
    std::vector<float> sub(n * dsub);

    for (std::uint32_t s = 0; s < m; ++s) {
        for (std::size_t i = 0; i < n; ++i) {
            std::memcpy(sub.data() + i * dsub, data + i * dim + s * dsub, dsub * sizeof(float));
        }
        KmeansParams kp{
            .k = ksub,
            .max_iter = cfg.max_iter,
            .epsilon = cfg.epsilon,
            .seed = cfg.seed + s,
        };
        auto km = kmeans_cluster(sub.data(), n, dsub, kp);
        if (!km) return std::unexpected(km.error());
        for (std::uint32_t k = 0; k < ksub; ++k) {
            std::memcpy(centroids.data() + (static_cast<std::size_t>(s) * ksub + k) * dsub,
                        km->centroids[k].data(), dsub * sizeof(float));
        }
    }
    return centroids;
}

/** \brief Orthonormal R maximizing tr(R M), i.e. R = V U^T for M = U S V^T.
 *
 * SVD by one-sided Jacobi: columns of A = M are rotated pairwise until
 * orthogonal, giving A = U S and the accumulated rotations V. Columns with a
 * vanishing singular value get an orthonormal completion by Gram-Schmidt.
 */
auto procrustes_rotation(std::vector<double> a, std::size_t dim) -> std::vector<float> {
    std::vector<double> v(dim * dim, 0.0);
    for (std::size_t i = 0; i < dim; ++i) v[i * dim + i] = 1.0;

    constexpr int kMaxSweeps = 60;
    constexpr double kTol = 1e-12;
    for (int sweep = 0; sweep < kMaxSweeps; ++sweep) {
        double off = 0.0;
        for (std::size_t p = 0; p + 1 < dim; ++p) {
            for (std::size_t q = p + 1; q < dim; ++q) {
                double alpha = 0.0, beta = 0.0, gamma = 0.0;
                for (std::size_t i = 0; i < dim; ++i) {
                    const double ap = a[i * dim + p];
                    const double aq = a[i * dim + q];
                    alpha += ap * ap;
                    beta += aq * aq;
                    gamma += ap * aq;
                }
                if (std::abs(gamma) <= kTol * std::sqrt(alpha * beta) || gamma == 0.0) continue;
                off = std::max(off, std::abs(gamma) / std::sqrt(alpha * beta));

                const double zeta = (beta - alpha) / (2.0 * gamma);
                const double t = (zeta >= 0.0 ? 1.0 : -1.0) /
                                 (std::abs(zeta) + std::sqrt(1.0 + zeta * zeta));
                const double c = 1.0 / std::sqrt(1.0 + t * t);
                const double s = c * t;
                for (std::size_t i = 0; i < dim; ++i) {
                    const double ap = a[i * dim + p];
                    const double aq = a[i * dim + q];
                    a[i * dim + p] = c * ap - s * aq;
                    a[i * dim + q] = s * ap + c * aq;
                    const double vp = v[i * dim + p];
                    const double vq = v[i * dim + q];
                    v[i * dim + p] = c * vp - s * vq;
                    v[i * dim + q] = s * vp + c * vq;
                }
            }
        }
        if (off < 1e-10) break;
    }

    // U columns from A, normalized; remember which are degenerate.
    std::vector<double> u(dim * dim, 0.0);
    std::vector<bool> valid(dim, false);
    double max_sigma = 0.0;
    std::vector<double> sigma(dim, 0.0);
    for (std::size_t j = 0; j < dim; ++j) {
        double s2 = 0.0;
        for (std::size_t i = 0; i < dim; ++i) s2 += a[i * dim + j] * a[i * dim + j];
        sigma[j] = std::sqrt(s2);
        max_sigma = std::max(max_sigma, sigma[j]);
    }
    for (std::size_t j = 0; j < dim; ++j) {
        if (sigma[j] > 1e-9 * std::max(max_sigma, 1.0)) {
            for (std::size_t i = 0; i < dim; ++i) u[i * dim + j] = a[i * dim + j] / sigma[j];
            valid[j] = true;
        }
    }
    // Complete degenerate columns with unit vectors orthogonalized against the rest.
    std::size_t basis = 0;
    for (std::size_t j = 0; j < dim; ++j) {
        if (valid[j]) continue;
        while (basis < dim) {
            std::vector<double> cand(dim, 0.0);
            cand[basis++] = 1.0;
            for (std::size_t k = 0; k < dim; ++k) {
                if (!valid[k]) continue;
                double dot = 0.0;
                for (std::size_t i = 0; i < dim; ++i) dot += cand[i] * u[i * dim + k];
                for (std::size_t i = 0; i < dim; ++i) cand[i] -= dot * u[i * dim + k];
            }
            double nrm = 0.0;
            for (double x : cand) nrm += x * x;
            nrm = std::sqrt(nrm);
            if (nrm > 1e-6) {
                for (std::size_t i = 0; i < dim; ++i) u[i * dim + j] = cand[i] / nrm;
                valid[j] = true;
                break;
            }
        }
    }

    // R = V U^T, then one Gram-Schmidt pass over rows to remove rounding drift.
    std::vector<double> r(dim * dim, 0.0);
    for (std::size_t i = 0; i < dim; ++i) {
        for (std::size_t j = 0; j < dim; ++j) {
            double sum = 0.0;
            for (std::size_t k = 0; k < dim; ++k) sum += v[i * dim + k] * u[j * dim + k];
            r[i * dim + j] = sum;
        }
    }
    for (std::size_t i = 0; i < dim; ++i) {
        for (std::size_t k = 0; k < i; ++k) {
            double dot = 0.0;
            for (std::size_t j = 0; j < dim; ++j) dot += r[i * dim + j] * r[k * dim + j];
            for (std::size_t j = 0; j < dim; ++j) r[i * dim + j] -= dot * r[k * dim + j];
        }
        double nrm = 0.0;
        for (std::size_t j = 0; j < dim; ++j) nrm += r[i * dim + j] * r[i * dim + j];
        nrm = std::sqrt(nrm);
        for (std::size_t j = 0; j < dim; ++j) r[i * dim + j] /= nrm;
    }

    std::vector<float> out(dim * dim);
    for (std::size_t i = 0; i < dim * dim; ++i) out[i] = static_cast<float>(r[i]);
    return out;
}

} // namespace

ProductCodebook::ProductCodebook(std::size_t dim, std::uint32_t m, std::uint32_t nbits,
                                 std::vector<float> centroids, std::vector<float> rotation)
    : dim_(dim), m_(m), nbits_(nbits), ksub_(1u << nbits), dsub_(dim / m),
      centroids_(std::move(centroids)), rotation_(std::move(rotation)) {}

auto ProductCodebook::train(const float* data, std::size_t n, std::size_t dim, const QuantizerConfig& cfg)
    -> std::expected<std::shared_ptr<const ProductCodebook>, core::error> {
    const std::uint32_t ksub = 1u << cfg.nbits;

    if (!cfg.use_rotation) {
        auto cents = train_subspaces(data, n, dim, cfg.m, ksub, cfg);
        if (!cents) return std::unexpected(cents.error());
        return std::make_shared<const ProductCodebook>(dim, cfg.m, cfg.nbits, std::move(*cents),
                                                       std::vector<float>{});
    }

    const bool dbg = core::debug_enabled("QUIVER_QUANT_DEBUG");

    // OPQ: alternate between PQ training in the rotated space and a Procrustes
    // update of the rotation against the reconstructions.
    std::vector<float> rotation(dim * dim, 0.0f);
    for (std::size_t i = 0; i < dim; ++i) rotation[i * dim + i] = 1.0f;
    std::vector<float> rotated(n * dim);
    std::shared_ptr<const ProductCodebook> current;

    for (std::uint32_t it = 0; it < cfg.rotation_iters; ++it) {
        #pragma omp parallel for
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            const float* x = data + static_cast<std::size_t>(i) * dim;
            float* y = rotated.data() + static_cast<std::size_t>(i) * dim;
            for (std::size_t j = 0; j < dim; ++j) {
                const float* row = rotation.data() + j * dim;
                float s = 0.0f;
                for (std::size_t k = 0; k < dim; ++k) s += row[k] * x[k];
                y[j] = s;
            }
        }

        auto cents = train_subspaces(rotated.data(), n, dim, cfg.m, ksub, cfg);
        if (!cents) return std::unexpected(cents.error());
        current = std::make_shared<const ProductCodebook>(dim, cfg.m, cfg.nbits, std::move(*cents),
                                                          rotation);
        if (dbg) {
            std::cerr << "[quiver][quant][opq] iter=" << it
                      << " mse=" << current->quantization_error(data, std::min<std::size_t>(n, 1024))
                      << std::endl;
        }
        if (it + 1 == cfg.rotation_iters) break;

        // M = X^T Y where Y holds reconstructions in the rotated space.
        std::vector<double> mtx(dim * dim, 0.0);
        std::vector<std::uint8_t> code(cfg.m);
        std::vector<float> recon(dim);
        for (std::size_t i = 0; i < n; ++i) {
            const float* yr = rotated.data() + i * dim;
            current->encode_rotated(yr, code.data());
            for (std::uint32_t s = 0; s < cfg.m; ++s) {
                std::memcpy(recon.data() + s * current->dsub_, current->centroid(s, code[s]),
                            current->dsub_ * sizeof(float));
            }
            const float* x = data + i * dim;
            for (std::size_t j = 0; j < dim; ++j) {
                const double xj = x[j];
                double* row = mtx.data() + j * dim;
                for (std::size_t k = 0; k < dim; ++k) row[k] += xj * recon[k];
            }
        }
        rotation = procrustes_rotation(std::move(mtx), dim);
    }
    return current;
}

void ProductCodebook::rotate(const float* in, float* out) const noexcept {
    for (std::size_t j = 0; j < dim_; ++j) {
        const float* row = rotation_.data() + j * dim_;
        float s = 0.0f;
        for (std::size_t k = 0; k < dim_; ++k) s += row[k] * in[k];
        out[j] = s;
    }
}

void ProductCodebook::unrotate(const float* in, float* out) const noexcept {
    // R is orthonormal: R^-1 = R^T.
    for (std::size_t k = 0; k < dim_; ++k) out[k] = 0.0f;
    for (std::size_t j = 0; j < dim_; ++j) {
        const float* row = rotation_.data() + j * dim_;
        const float v = in[j];
        for (std::size_t k = 0; k < dim_; ++k) out[k] += row[k] * v;
    }
}

void ProductCodebook::encode_rotated(const float* vec, std::uint8_t* code) const noexcept {
    const auto& ops = kernels::select_backend_auto();
    for (std::uint32_t s = 0; s < m_; ++s) {
        const std::span<const float> sub(vec + s * dsub_, dsub_);
        float best = std::numeric_limits<float>::max();
        std::uint32_t best_k = 0;
        for (std::uint32_t k = 0; k < ksub_; ++k) {
            const float d = ops.l2_sq(sub, std::span(centroid(s, k), dsub_));
            if (d < best) {
                best = d;
                best_k = k;
            }
        }
        code[s] = static_cast<std::uint8_t>(best_k);
    }
}

auto ProductCodebook::encode(std::span<const float> vec, std::span<std::uint8_t> code) const
    -> std::expected<void, core::error> {
    if (vec.size() != dim_) return size_error("vector length", dim_, vec.size());
    if (code.size() != m_) return size_error("code length", m_, code.size());

    if (rotation_.empty()) {
        encode_rotated(vec.data(), code.data());
    } else {
        std::vector<float> tmp(dim_);
        rotate(vec.data(), tmp.data());
        encode_rotated(tmp.data(), code.data());
    }
    return {};
}

auto ProductCodebook::decode(std::span<const std::uint8_t> code, std::span<float> out) const
    -> std::expected<void, core::error> {
    if (code.size() != m_) return size_error("code length", m_, code.size());
    if (out.size() != dim_) return size_error("output length", dim_, out.size());

    std::vector<float> tmp(rotation_.empty() ? 0 : dim_);
    float* dst = rotation_.empty() ? out.data() : tmp.data();
    for (std::uint32_t s = 0; s < m_; ++s) {
        if (code[s] >= ksub_) {
            return core::make_error(core::error_code::data_integrity, "sub-code out of range",
                                    "index.product_quantizer");
        }
        std::memcpy(dst + s * dsub_, centroid(s, code[s]), dsub_ * sizeof(float));
    }
    if (!rotation_.empty()) unrotate(tmp.data(), out.data());
    return {};
}

auto ProductCodebook::make_table(std::span<const float> query, Metric metric) const
    -> std::expected<AdcTable, core::error> {
    if (query.size() != dim_) return size_error("query length", dim_, query.size());

    std::vector<float> rq;
    const float* q = query.data();
    if (!rotation_.empty()) {
        rq.resize(dim_);
        rotate(query.data(), rq.data());
        q = rq.data();
    }

    const auto& ops = kernels::select_backend_auto();
    std::vector<float> lut(static_cast<std::size_t>(m_) * ksub_);
    for (std::uint32_t s = 0; s < m_; ++s) {
        const std::span<const float> qs(q + s * dsub_, dsub_);
        float* row = lut.data() + static_cast<std::size_t>(s) * ksub_;
        for (std::uint32_t k = 0; k < ksub_; ++k) {
            const std::span<const float> c(centroid(s, k), dsub_);
            row[k] = metric == Metric::l2 ? ops.l2_sq(qs, c) : -ops.inner_product(qs, c);
        }
    }
    const float bias = metric == Metric::cosine ? 1.0f : 0.0f;
    return AdcTable(m_, ksub_, bias, std::move(lut));
}

auto ProductCodebook::serialize() const -> std::vector<std::uint8_t> {
    storage::ByteWriter out;
    detail::write_codebook_header(out, kind(), dim_);
    out.put_u32(m_);
    out.put_u32(nbits_);
    out.put_floats(centroids_);
    out.put_u8(rotation_.empty() ? 0 : 1);
    if (!rotation_.empty()) out.put_floats(rotation_);
    return std::move(out).take();
}

auto ProductCodebook::deserialize(storage::ByteReader& in, std::size_t dim)
    -> std::expected<std::shared_ptr<const ProductCodebook>, core::error> {
    using core::error_code;
    const std::uint32_t m = in.u32();
    const std::uint32_t nbits = in.u32();
    if (!in.ok() || m == 0 || dim % m != 0 || nbits == 0 || nbits > 8) {
        return core::make_error(error_code::data_integrity, "bad product codebook geometry",
                                "index.product_quantizer");
    }
    const std::size_t ksub = std::size_t{1} << nbits;
    auto centroids = in.floats(static_cast<std::size_t>(m) * ksub * (dim / m));
    const bool rotated = in.u8() != 0;
    std::vector<float> rotation;
    if (rotated) rotation = in.floats(dim * dim);
    if (!in.ok()) {
        return core::make_error(error_code::data_integrity, "truncated product codebook",
                                "index.product_quantizer");
    }
    return std::make_shared<const ProductCodebook>(dim, m, nbits, std::move(centroids),
                                                   std::move(rotation));
}

} // namespace quiver::index
