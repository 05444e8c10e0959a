#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <span>

namespace veritas::levels::math {

inline double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

inline double mean_of(std::span<const double> v) {
  if (v.empty()) return 0.0;
  double sum = 0.0;
  for (const double x : v) sum += x;
  return sum / static_cast<double>(v.size());
}

/// Population standard deviation.
inline double stddev_of(std::span<const double> v) {
  if (v.size() < 2) return 0.0;
  const double m = mean_of(v);
  double sq = 0.0;
  for (const double x : v) sq += (x - m) * (x - m);
  return std::sqrt(sq / static_cast<double>(v.size()));
}

/// Pearson correlation; nullopt for fewer than two samples, a flat series or
/// values too large to correlate.
inline std::optional<double> pearson(std::span<const double> a,
                                     std::span<const double> b) {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < 2) return std::nullopt;
  const double ma = mean_of(a.first(n));
  const double mb = mean_of(b.first(n));
  double cov = 0.0;
  double va = 0.0;
  double vb = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = a[i] - ma;
    const double db = b[i] - mb;
    cov += da * db;
    va += da * da;
    vb += db * db;
  }
  constexpr double kFlat = 1e-12;
  if (va < kFlat || vb < kFlat) return std::nullopt;
  const double r = cov / std::sqrt(va * vb);
  if (!std::isfinite(r)) return std::nullopt;  // sums overflowed
  return std::clamp(r, -1.0, 1.0);
}

/// 0 inside [lo, hi]; outside, the relative distance to the nearest bound
/// (divided by that bound), capped at 1.
inline double band_distance(double value, double lo, double hi) {
  if (value < lo) return lo > 0.0 ? clamp01((lo - value) / lo) : 1.0;
  if (value > hi) return hi > 0.0 ? clamp01((value - hi) / hi) : 1.0;
  return 0.0;
}

}  // namespace veritas::levels::math
