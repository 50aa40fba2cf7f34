#pragma once

#include <cmath>
#include <cstddef>

namespace docrag_core {

// Scales values to unit length in place. Zero vectors are left as zeros.
inline void normalize_in_place(float *values, size_t dimension) {
  double norm = 0.0;
  for (size_t i = 0; i < dimension; ++i) {
    norm += static_cast<double>(values[i]) * values[i];
  }
  if (norm <= 0.0 || !std::isfinite(norm)) {
    for (size_t i = 0; i < dimension; ++i) {
      values[i] = 0.0f;
    }
    return;
  }
  const double inv = 1.0 / std::sqrt(norm);
  for (size_t i = 0; i < dimension; ++i) {
    values[i] = static_cast<float>(values[i] * inv);
  }
}

inline float dot_product(const float *a, const float *b, size_t dimension) {
  double sum = 0.0;
  for (size_t i = 0; i < dimension; ++i) {
    sum += static_cast<double>(a[i]) * b[i];
  }
  return static_cast<float>(sum);
}

}  // namespace docrag_core
