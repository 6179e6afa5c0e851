#pragma once
#include <cstdint>
#include <vector>
#include "gatesense/models.hpp"

namespace gatesense {

constexpr double kEarthRadiusMeters = 6371008.8;
constexpr double kAnchorScale = 1e4;        // anchor keys are degrees rounded to 1e-4

// Great-circle distance in meters
double haversineMeters(const GeoPoint& a, const GeoPoint& b);

// Finite, inside lat/lon ranges and away from (0,0)
bool isValidCoordinate(double lat, double lon);
inline bool isValidCoordinate(const GeoPoint& p) { return isValidCoordinate(p.lat, p.lon); }

inline GeoPoint toPoint(const ScanLocation& loc) { return GeoPoint{loc.lat, loc.lon}; }

int64_t anchorKey(double degrees);

// Closest active gate within max_distance_m, or nullptr
const Gate* nearestActiveGate(const std::vector<Gate>& gates, const GeoPoint& p,
                              double max_distance_m, double* distance_out = nullptr);

} // namespace gatesense
