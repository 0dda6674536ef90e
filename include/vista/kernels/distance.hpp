#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels (L2^2, inner product, cosine) and the metric mapping.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Cosine with a zero-norm operand is defined as similarity 0 (distance 1).
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

#include "vista/metric.hpp"

namespace vista::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4 independent accumulators keep the dependency chain short
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i + 1] - pb[i + 1];
    const float d2 = pa[i + 2] - pb[i + 2];
    const float d3 = pa[i + 3] - pb[i + 3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = (s0 + s1) + (s2 + s3);
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
    s0 += pa[i] * pb[i];
    s1 += pa[i + 1] * pb[i + 1];
    s2 += pa[i + 2] * pb[i + 2];
    s3 += pa[i + 3] * pb[i + 3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) s += pa[i] * pb[i];
  return s;
}

/** \brief Cosine similarity: (a.b) / (||a|| * ||b||); 0 when either norm is 0. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot = 0.0f, na = 0.0f, nb = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    const float av = pa[i], bv = pb[i];
    dot += av * bv;
    na += av * av;
    nb += bv * bv;
  }
  const float denom = std::sqrt(na) * std::sqrt(nb);
  if (!(denom > 0.0f)) return 0.0f;
  return dot / denom;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b). O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Metric-dispatched distance; smaller is always closer. */
inline float distance(Metric metric, std::span<const float> a, std::span<const float> b) noexcept {
  switch (metric) {
    case Metric::Euclidean: return std::sqrt(l2_sq(a, b));
    case Metric::Cosine: return cosine_distance(a, b);
    case Metric::DotProduct: return -inner_product(a, b);
  }
  return std::sqrt(l2_sq(a, b));
}

/** \brief True when no component is NaN or infinite. */
inline bool all_finite(std::span<const float> v) noexcept {
  for (float x : v) {
    if (!std::isfinite(x)) return false;
  }
  return true;
}

/** \brief Scale `v` to unit L2 norm in place; zero vectors are left untouched. */
inline void normalize_in_place(std::span<float> v) noexcept {
  float ss = 0.0f;
  for (float x : v) ss += x * x;
  if (!(ss > 0.0f)) return;
  const float inv = 1.0f / std::sqrt(ss);
  for (float& x : v) x *= inv;
}

} // namespace vista::kernels
