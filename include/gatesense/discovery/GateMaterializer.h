#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"
#include "gatesense/discovery/SpatialClusterer.h"

namespace gatesense {

class GateDatabase;

// 50 base, +30 volume, +15 valid centroid, +10 sustained activity,
// -20 for clustering-derived gates below min_effective_samples; clamped to 0..100
int computeHealthScore(const Gate& gate, const AdaptiveThresholdConfig& cfg);

// Presentation name by volume rank within one run
std::string tierName(size_t rank);

struct MaterializeAction {
    enum class Kind { Created, Updated, Skipped };
    Kind        kind = Kind::Created;
    int64_t     gate_id = 0;               // 0 in dry-run creations
    std::string name;
    GeoPoint    centroid;
    int         sample_count = 0;
    int         health_score = 0;
    double      match_distance_m = 0.0;    // updates only
};

struct MaterializeReport {
    bool dry_run = false;
    int  created = 0;
    int  updated = 0;
    int  skipped = 0;                      // anchor held by a retired gate with no active successor
    std::vector<MaterializeAction> actions;
};

// Reconciles clusters with the stored gates of a session. A cluster within
// gate_match_tolerance_meters of an active gate refines that gate; any other
// cluster creates a gate. Creation goes through the unique anchor index, so a
// concurrent run that loses the insert updates the winner instead.
class GateMaterializer {
public:
    GateMaterializer(GateDatabase& db, const AdaptiveThresholdConfig& cfg);

    // Clusters are processed in the given order (largest first from SpatialClusterer)
    MaterializeReport materialize(const std::string& session_id,
                                  const std::vector<ScanCluster>& clusters,
                                  bool dry_run = false);

private:
    GateDatabase& db_;
    AdaptiveThresholdConfig cfg_;

    MaterializeAction refine(Gate gate, const ScanCluster& cluster, double distance_m);
    std::string uniqueName(const std::string& base, const std::vector<Gate>& existing) const;
};

} // namespace gatesense
