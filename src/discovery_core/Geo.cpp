#include "gatesense/discovery/Geo.h"
#include <algorithm>
#include <cmath>

namespace gatesense {

static constexpr double kPi = 3.14159265358979323846;

static double toRadians(double deg) { return deg * kPi / 180.0; }

double haversineMeters(const GeoPoint& a, const GeoPoint& b) {
    const double dlat = toRadians(b.lat - a.lat);
    const double dlon = toRadians(b.lon - a.lon);
    const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(toRadians(a.lat)) * std::cos(toRadians(b.lat)) *
                     std::sin(dlon / 2) * std::sin(dlon / 2);
    return 2.0 * kEarthRadiusMeters * std::asin(std::min(1.0, std::sqrt(h)));
}

bool isValidCoordinate(double lat, double lon) {
    if (!std::isfinite(lat) || !std::isfinite(lon)) return false;
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) return false;
    // null island is what broken receivers report
    if (std::fabs(lat) < 0.0001 && std::fabs(lon) < 0.0001) return false;
    return true;
}

int64_t anchorKey(double degrees) {
    return static_cast<int64_t>(std::llround(degrees * kAnchorScale));
}

const Gate* nearestActiveGate(const std::vector<Gate>& gates, const GeoPoint& p,
                              double max_distance_m, double* distance_out) {
    const Gate* best = nullptr;
    double best_d = max_distance_m;
    for (const auto& g : gates) {
        if (g.status != GateStatus::Active) continue;
        const double d = haversineMeters(g.centroid, p);
        if (d > max_distance_m) continue;
        // ties go to the older gate
        if (!best || d < best_d || (d == best_d && g.id < best->id)) {
            best = &g;
            best_d = d;
        }
    }
    if (best && distance_out) *distance_out = best_d;
    return best;
}

} // namespace gatesense
