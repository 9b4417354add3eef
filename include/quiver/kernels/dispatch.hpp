#pragma once

/** \file dispatch.hpp
 *  \brief Kernel function table and backend selection. Scalar is the default backend.
 *
 * Preconditions for all ops: a.size() == b.size(); inputs finite.
 * Determinism: pure functions, O(d) complexity; no allocations; no exceptions on hot paths.
 */

#include <cstddef>
#include <span>
#include <string_view>

namespace quiver::kernels {

struct KernelOps {
  float (*l2_sq)(std::span<const float>, std::span<const float>) noexcept;
  float (*inner_product)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_similarity)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_distance)(std::span<const float>, std::span<const float>) noexcept;
  std::string_view name;
};

// Returns a stable reference valid for the process lifetime. Unknown or
// unavailable names resolve to "scalar".
const KernelOps& select_backend(std::string_view name = "scalar") noexcept;

/** \brief Picks the best backend compiled in and supported by the CPU.
 *
 * QUIVER_KERNEL_BACKEND (scalar | avx2 | auto) overrides detection.
 * Resolved once; later calls return the cached table.
 */
const KernelOps& select_backend_auto() noexcept;

} // namespace quiver::kernels
