#pragma once

/** \file distance.hpp
 *  \brief Scalar reference distance kernels (L2^2, inner product, L2 norm).
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 */

#include <cmath>
#include <cstddef>
#include <span>

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <immintrin.h>
#endif

namespace tessera::kernels {

namespace detail {

/** \brief Software prefetch hint for scalar loops. */
inline void scalar_prefetch(const float* ptr) noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    _mm_prefetch(reinterpret_cast<const char*>(ptr + 16), _MM_HINT_T0);
#else
    (void)ptr;
#endif
}

} // namespace detail

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = s0 + s1 + s2 + s3;
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

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
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

} // namespace tessera::kernels
