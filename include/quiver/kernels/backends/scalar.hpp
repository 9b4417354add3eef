#pragma once

/** \file scalar.hpp
 *  \brief Scalar backend implementing KernelOps via the distance.hpp reference kernels.
 */

#include "quiver/kernels/dispatch.hpp"
#include "quiver/kernels/distance.hpp"

namespace quiver::kernels {

inline const KernelOps& get_scalar_ops() noexcept {
  static const KernelOps ops{
      &l2_sq, &inner_product, &cosine_similarity, &cosine_distance, "scalar"
  };
  return ops;
}

} // namespace quiver::kernels
