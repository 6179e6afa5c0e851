#include "gatesense/discovery/QualityFilter.h"
#include "gatesense/discovery/Geo.h"
#include <cmath>

namespace gatesense {

double qualityWeight(const std::optional<ScanLocation>& location) {
    if (!location) return 0.0;
    if (!isValidCoordinate(location->lat, location->lon)) return 0.0;
    // a receiver that reports no accuracy is not trusted at all
    if (!location->accuracy_m || !std::isfinite(*location->accuracy_m) || *location->accuracy_m <= 0.0) {
        return 0.0;
    }

    const double acc = *location->accuracy_m;
    if (acc <= 10.0) return 1.0;
    if (acc <= 20.0) return 0.9;
    if (acc <= 30.0) return 0.8;
    if (acc <= 50.0) return 0.6;
    return 0.4;
}

bool acceptedForClustering(const CheckinEvent& event, double min_quality_weight) {
    return event.outcome == CheckinOutcome::Success &&
           event.location.has_value() &&
           event.quality_weight > 0.0 &&
           event.quality_weight >= min_quality_weight;
}

} // namespace gatesense
