#pragma once
#include <optional>
#include "gatesense/models.hpp"

namespace gatesense {

// Accuracy bands: <=10m 1.0, <=20m 0.9, <=30m 0.8, <=50m 0.6, otherwise 0.4.
// No location, an unusable coordinate, or a missing / non-positive accuracy
// gives 0.
double qualityWeight(const std::optional<ScanLocation>& location);

// Whether a stored scan may feed clustering and centroid computation
bool acceptedForClustering(const CheckinEvent& event, double min_quality_weight);

} // namespace gatesense
