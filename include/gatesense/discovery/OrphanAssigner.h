#pragma once
#include <cstdint>
#include <string>
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

class GateDatabase;

struct OrphanReport {
    int     scanned = 0;
    int     assigned = 0;
    int64_t next_cursor = 0;   // 0 once the batch reached the newest orphan
};

// Attaches ungated successful scans to the nearest active gate within
// orphan_max_distance_meters. Never creates gates; scans with no gate in
// range stay orphaned for the next pass.
class OrphanAssigner {
public:
    OrphanAssigner(GateDatabase& db, const AdaptiveThresholdConfig& cfg);

    // One bounded batch of ids above `after_id`
    OrphanReport assignBatch(const std::string& session_id, int64_t after_id);

    // One batch resuming from the stored "orphans" checkpoint; the cursor wraps
    // to the start once the newest orphan has been visited
    OrphanReport runCheckpointed(const std::string& session_id);

private:
    GateDatabase& db_;
    AdaptiveThresholdConfig cfg_;
};

} // namespace gatesense
