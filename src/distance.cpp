// ============================================================================
// distance.cpp — implementation for meshview/distance.hpp
// ============================================================================
#include "meshview/distance.hpp"

#include <algorithm>
#include <cmath>

namespace meshview {

static constexpr double PI = 3.14159265358979323846;

static double rad(double deg) { return deg * PI / 180.0; }

double haversine_km(const Position& a, const Position& b) {
  const double dlat = rad(b.lat - a.lat);
  const double dlon = rad(b.lon - a.lon);
  const double s1 = std::sin(dlat / 2.0);
  const double s2 = std::sin(dlon / 2.0);
  double h = s1 * s1 + std::cos(rad(a.lat)) * std::cos(rad(b.lat)) * s2 * s2;
  h = std::min(1.0, std::max(0.0, h));            // rounding can push h just past 1
  return 2.0 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

std::optional<double> distance_km(const std::optional<Position>& a, const std::optional<Position>& b) {
  if (!a || !b) return std::nullopt;
  return haversine_km(*a, *b);
}

} // namespace meshview
