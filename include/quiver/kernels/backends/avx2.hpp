#pragma once

/** \file avx2.hpp
 *  \brief AVX2/FMA distance kernels.
 *
 * Only compiled when the translation unit targets AVX2 and FMA
 * (QUIVER_ENABLE_AVX2=ON adds -mavx2 -mfma). 8-wide loads with a scalar tail.
 * Preconditions: a.size() == b.size(); inputs finite.
 */

#if defined(__AVX2__) && defined(__FMA__)

#include <immintrin.h>

#include <cmath>
#include <span>

#include "quiver/kernels/dispatch.hpp"

namespace quiver::kernels {

namespace detail {

/** \brief Horizontal sum of the 8 lanes of an AVX register. */
[[gnu::always_inline]] inline auto hsum_ps(__m256 v) noexcept -> float {
    const __m128 lo = _mm256_castps256_ps128(v);
    const __m128 hi = _mm256_extractf128_ps(v, 1);
    __m128 s = _mm_add_ps(lo, hi);
    s = _mm_add_ps(s, _mm_movehl_ps(s, s));
    s = _mm_add_ss(s, _mm_movehdup_ps(s));
    return _mm_cvtss_f32(s);
}

} // namespace detail

[[gnu::hot]] inline auto avx2_l2_sq(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 acc = _mm256_setzero_ps();
    std::size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        const __m256 d = _mm256_sub_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i));
        acc = _mm256_fmadd_ps(d, d, acc);
    }
    float s = detail::hsum_ps(acc);
    for (; i < n; ++i) {
        const float d = pa[i] - pb[i];
        s += d * d;
    }
    return s;
}

[[gnu::hot]] inline auto avx2_inner_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 acc = _mm256_setzero_ps();
    std::size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        acc = _mm256_fmadd_ps(_mm256_loadu_ps(pa + i), _mm256_loadu_ps(pb + i), acc);
    }
    float s = detail::hsum_ps(acc);
    for (; i < n; ++i) s += pa[i] * pb[i];
    return s;
}

inline auto avx2_cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 dot = _mm256_setzero_ps();
    __m256 na = _mm256_setzero_ps();
    __m256 nb = _mm256_setzero_ps();
    std::size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        const __m256 va = _mm256_loadu_ps(pa + i);
        const __m256 vb = _mm256_loadu_ps(pb + i);
        dot = _mm256_fmadd_ps(va, vb, dot);
        na = _mm256_fmadd_ps(va, va, na);
        nb = _mm256_fmadd_ps(vb, vb, nb);
    }
    float d = detail::hsum_ps(dot);
    float a2 = detail::hsum_ps(na);
    float b2 = detail::hsum_ps(nb);
    for (; i < n; ++i) {
        d += pa[i] * pb[i];
        a2 += pa[i] * pa[i];
        b2 += pb[i] * pb[i];
    }
    const float denom = std::sqrt(a2) * std::sqrt(b2);
    if (!(denom > 0.0f)) return 0.0f;
    return d / denom;
}

inline auto avx2_cosine_distance(std::span<const float> a, std::span<const float> b) noexcept -> float {
    return 1.0f - avx2_cosine_similarity(a, b);
}

inline const KernelOps& get_avx2_ops() noexcept {
    static const KernelOps ops{
        &avx2_l2_sq,
        &avx2_inner_product,
        &avx2_cosine_similarity,
        &avx2_cosine_distance,
        "avx2"
    };
    return ops;
}

} // namespace quiver::kernels

#endif // __AVX2__ && __FMA__
