#pragma once

/** \file distance.hpp
 *  \brief Scalar reference distance kernels (L2^2, inner product, cosine).
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions.
 * Zero-norm inputs give cosine similarity 0 (distance 1) instead of NaN.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace quiver::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // Four independent accumulators keep the FP adds from serializing.
  float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  std::size_t i = 0;
  for (; i + 4 <= n; i += 4) {
    for (std::size_t lane = 0; lane < 4; ++lane) {
      const float d = pa[i + lane] - pb[i + lane];
      acc[lane] += d * d;
    }
  }
  float s = (acc[0] + acc[1]) + (acc[2] + acc[3]);
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float acc[4] = {0.0f, 0.0f, 0.0f, 0.0f};
  std::size_t i = 0;
  for (; i + 4 <= n; i += 4) {
    for (std::size_t lane = 0; lane < 4; ++lane) {
      acc[lane] += pa[i + lane] * pb[i + lane];
    }
  }
  float s = (acc[0] + acc[1]) + (acc[2] + acc[3]);
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Squared Euclidean norm. O(d). */
inline float squared_norm(std::span<const float> a) noexcept {
  return inner_product(a, a);
}

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||). O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const float dot = inner_product(a, b);
  const float denom = std::sqrt(squared_norm(a)) * std::sqrt(squared_norm(b));
  if (!(denom > 0.0f)) return 0.0f;
  return dot / denom;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b). O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Scale v to unit length in place. Returns false (and leaves v) for a zero vector. */
inline bool normalize(std::span<float> v) noexcept {
  const float n2 = squared_norm(v);
  if (!(n2 > 0.0f)) return false;
  const float inv = 1.0f / std::sqrt(n2);
  for (float& x : v) x *= inv;
  return true;
}

} // namespace quiver::kernels
