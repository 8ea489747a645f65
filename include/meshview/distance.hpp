#ifndef MESHVIEW_DISTANCE_HPP
#define MESHVIEW_DISTANCE_HPP
/**
 * @file distance.hpp
 * @brief Great-circle distance between two positions (haversine, spherical Earth).
 *
 * Pure functions. Symmetric; zero for identical positions; std::nullopt when
 * either side is unknown. Altitude is ignored.
 */

#include <optional>

#include "meshview/types.hpp"

namespace meshview {

/// Mean Earth radius used by the spherical approximation.
static constexpr double EARTH_RADIUS_KM = 6371.0;

double haversine_km(const Position& a, const Position& b);

std::optional<double> distance_km(const std::optional<Position>& a, const std::optional<Position>& b);

} // namespace meshview

#endif // MESHVIEW_DISTANCE_HPP
