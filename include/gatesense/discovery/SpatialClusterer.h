#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

// A group of scans that share one physical entry point
struct ScanCluster {
    std::vector<int64_t> member_ids;       // ascending event id
    GeoPoint    centroid;                  // mean location
    double      spatial_variance_m2 = 0.0; // mean squared distance to the centroid
    double      mean_accuracy_m = 0.0;
    std::string first_seen;
    std::string last_seen;
    std::map<std::string, int> categories;
    std::array<int, 24> hourly{};

    int size() const { return static_cast<int>(member_ids.size()); }
};

struct ClusterRun {
    std::vector<ScanCluster> clusters;     // size desc, then smallest member id
    int input_points = 0;
    int noise_points = 0;                  // members of components below min_samples
    int rejected_by_variance = 0;
};

// Single-linkage density grouping over haversine distance: two scans within
// epsilon share a cluster, transitively. Neighbours are searched on a uniform
// lat/lon grid whose cells are at least epsilon wide.
class SpatialClusterer {
public:
    explicit SpatialClusterer(const AdaptiveThresholdConfig& cfg);

    // Scans without a location are ignored. The result only depends on the
    // set of scans, not on their order.
    ClusterRun run(const std::vector<CheckinEvent>& scans) const;

private:
    double epsilon_m_;
    int    min_samples_;
    double max_variance_m2_;

    ScanCluster summarize(const std::vector<const CheckinEvent*>& members) const;
};

} // namespace gatesense
