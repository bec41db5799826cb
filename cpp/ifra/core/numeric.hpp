#pragma once
/*
===============================================================================
Core: Hardened Math Utilities
File: cpp/ifra/core/numeric.hpp
===============================================================================
*/

#include <cmath>
#include <limits>

namespace ifra {

inline constexpr double kInf = std::numeric_limits<double>::infinity();

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

inline bool is_finite_nonneg(double x) noexcept {
  return is_finite(x) && x >= 0.0;
}

// Round half away from zero to `places` decimals. Non-finite values pass through.
inline double round_to(double x, int places) noexcept {
  if (!is_finite(x)) return x;
  const double scale = std::pow(10.0, places);
  return std::round(x * scale) / scale;
}

} // namespace ifra
