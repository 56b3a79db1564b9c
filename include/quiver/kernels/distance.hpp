#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels (L2^2, inner product, cosine).
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * - For cosine: norms must be strictly positive
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
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

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    float d0 = pa[i] - pb[i];
    float d1 = pa[i+1] - pb[i+1];
    float d2 = pa[i+2] - pb[i+2];
    float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Euclidean norm ||a||. O(d). */
inline float l2_norm(std::span<const float> a) noexcept {
  return std::sqrt(inner_product(a, a));
}

/** \brief Cosine distance 1 - (a·b)/(||a||·||b||). Norms must be > 0. O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - inner_product(a, b) / (l2_norm(a) * l2_norm(b));
}

/** \brief Scale `a` to unit length in place; returns the original norm. */
inline float normalize_inplace(std::span<float> a) noexcept {
  const float norm = l2_norm(a);
  if (norm > 0.0f) {
    for (float& v : a) v /= norm;
  }
  return norm;
}

} // namespace quiver::kernels
