#include "gatesense/discovery/OrphanAssigner.h"
#include "gatesense/discovery/Geo.h"
#include "../db_core/GateDatabase.h"

#include <iostream>

namespace gatesense {

OrphanAssigner::OrphanAssigner(GateDatabase& db, const AdaptiveThresholdConfig& cfg)
    : db_(db), cfg_(cfg) {}

OrphanReport OrphanAssigner::assignBatch(const std::string& session_id, int64_t after_id) {
    OrphanReport report;
    const auto gates = db_.getGates(session_id, true);
    const auto orphans = db_.getOrphans(session_id, after_id, cfg_.orphan_batch_size);
    report.scanned = static_cast<int>(orphans.size());
    if (orphans.empty() || gates.empty()) {
        report.next_cursor = 0;
        return report;
    }

    for (const auto& e : orphans) {
        if (!e.location) continue;
        double d = 0.0;
        const Gate* g = nearestActiveGate(gates, toPoint(*e.location), cfg_.orphan_max_distance_meters, &d);
        if (!g) continue;
        if (db_.assignGate(e.id, g->id)) ++report.assigned;
    }

    report.next_cursor = static_cast<int>(orphans.size()) < cfg_.orphan_batch_size ? 0 : orphans.back().id;
    if (report.assigned > 0) {
        std::cout << "[Orphans] Session " << session_id << ": assigned " << report.assigned
                  << " of " << report.scanned << " orphan scans" << std::endl;
    }
    return report;
}

OrphanReport OrphanAssigner::runCheckpointed(const std::string& session_id) {
    CycleCheckpoint cp;
    cp.session_id = session_id;
    cp.cycle = "orphans";
    if (auto stored = db_.getCheckpoint(session_id, "orphans")) cp = *stored;

    OrphanReport report = assignBatch(session_id, cp.last_event_id);
    cp.last_event_id = report.next_cursor;
    cp.runs += 1;
    if (!db_.putCheckpoint(cp)) {
        std::cerr << "[Orphans] Failed to store cursor for session " << session_id << std::endl;
    }
    return report;
}

} // namespace gatesense
