#include "gatesense/discovery/GateMaterializer.h"
#include "gatesense/discovery/Geo.h"
#include "../db_core/GateDatabase.h"
#include "../db_core/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

namespace gatesense {

int computeHealthScore(const Gate& gate, const AdaptiveThresholdConfig& cfg) {
    double score = 50.0;
    score += 30.0 * std::min(1.0, gate.sample_count / 100.0);
    if (isValidCoordinate(gate.centroid)) score += 15.0;

    if (!gate.first_seen.empty() && !gate.last_seen.empty()) {
        const double active_hours = TimeUtils::getSecondsBetween(gate.first_seen, gate.last_seen) / 3600.0;
        score += 10.0 * std::clamp(active_hours, 0.0, 1.0);
    }
    if (gate.derivation == DerivationMethod::Clustering && gate.sample_count < cfg.min_effective_samples) {
        score -= 20.0;
    }
    return static_cast<int>(std::lround(std::clamp(score, 0.0, 100.0)));
}

std::string tierName(size_t rank) {
    if (rank == 0) return "Main Gate";
    if (rank == 1) return "Secondary Gate";
    return "Access Point";
}

GateMaterializer::GateMaterializer(GateDatabase& db, const AdaptiveThresholdConfig& cfg)
    : db_(db), cfg_(cfg) {}

std::string GateMaterializer::uniqueName(const std::string& base, const std::vector<Gate>& existing) const {
    std::set<std::string> taken;
    for (const auto& g : existing) taken.insert(g.name);
    if (!taken.count(base)) return base;
    for (int n = 2;; ++n) {
        std::string candidate = base + " " + std::to_string(n);
        if (!taken.count(candidate)) return candidate;
    }
}

MaterializeAction GateMaterializer::refine(Gate gate, const ScanCluster& cluster, double distance_m) {
    // sample-weighted rolling average of the stored and the observed centroid
    const double n_old = std::max(gate.sample_count, 0);
    const double n_new = cluster.size();
    gate.centroid.lat = (gate.centroid.lat * n_old + cluster.centroid.lat * n_new) / (n_old + n_new);
    gate.centroid.lon = (gate.centroid.lon * n_old + cluster.centroid.lon * n_new) / (n_old + n_new);

    gate.spatial_variance_m2 = cluster.spatial_variance_m2;
    gate.sample_count = std::max(gate.sample_count, cluster.size());
    if (gate.first_seen.empty() || cluster.first_seen < gate.first_seen) gate.first_seen = cluster.first_seen;
    if (gate.last_seen.empty() || cluster.last_seen > gate.last_seen) gate.last_seen = cluster.last_seen;
    gate.health_score = computeHealthScore(gate, cfg_);

    if (!db_.updateGate(gate)) {
        throw std::runtime_error("failed to update gate " + std::to_string(gate.id));
    }

    MaterializeAction action;
    action.kind = MaterializeAction::Kind::Updated;
    action.gate_id = gate.id;
    action.name = gate.name;
    action.centroid = gate.centroid;
    action.sample_count = gate.sample_count;
    action.health_score = gate.health_score;
    action.match_distance_m = distance_m;
    return action;
}

MaterializeReport GateMaterializer::materialize(const std::string& session_id,
                                                const std::vector<ScanCluster>& clusters,
                                                bool dry_run) {
    MaterializeReport report;
    report.dry_run = dry_run;

    for (size_t rank = 0; rank < clusters.size(); ++rank) {
        const ScanCluster& cluster = clusters[rank];

        if (dry_run) {
            auto gates = db_.getGates(session_id, true);
            MaterializeAction action;
            double d = 0.0;
            if (const Gate* match = nearestActiveGate(gates, cluster.centroid, cfg_.gate_match_tolerance_meters, &d)) {
                action.kind = MaterializeAction::Kind::Updated;
                action.gate_id = match->id;
                action.name = match->name;
                action.match_distance_m = d;
                ++report.updated;
            } else {
                action.kind = MaterializeAction::Kind::Created;
                action.name = tierName(rank);
                ++report.created;
            }
            action.centroid = cluster.centroid;
            action.sample_count = cluster.size();
            report.actions.push_back(action);
            continue;
        }

        // match-or-create is atomic with respect to other writers on this store
        MaterializeAction action = db_.withTransaction([&]() -> MaterializeAction {
            auto gates = db_.getGates(session_id, true);
            double d = 0.0;
            if (const Gate* match = nearestActiveGate(gates, cluster.centroid, cfg_.gate_match_tolerance_meters, &d)) {
                return refine(*match, cluster, d);
            }

            Gate gate;
            gate.session_id = session_id;
            gate.name = uniqueName(tierName(rank), db_.getGates(session_id));
            gate.centroid = cluster.centroid;
            gate.derivation = DerivationMethod::Clustering;
            gate.status = GateStatus::Active;
            gate.spatial_variance_m2 = cluster.spatial_variance_m2;
            gate.sample_count = cluster.size();
            gate.first_seen = cluster.first_seen;
            gate.last_seen = cluster.last_seen;
            gate.anchor_lat_key = anchorKey(cluster.centroid.lat);
            gate.anchor_lon_key = anchorKey(cluster.centroid.lon);
            gate.health_score = computeHealthScore(gate, cfg_);

            if (auto id = db_.insertGateIfAbsent(gate)) {
                MaterializeAction created;
                created.kind = MaterializeAction::Kind::Created;
                created.gate_id = *id;
                created.name = gate.name;
                created.centroid = gate.centroid;
                created.sample_count = gate.sample_count;
                created.health_score = gate.health_score;
                return created;
            }

            // lost the anchor to another run: fold the cluster into the winner
            auto winner = db_.getGateByAnchor(session_id, gate.anchor_lat_key, gate.anchor_lon_key);
            if (!winner) {
                throw std::runtime_error("gate insert failed for session " + session_id);
            }
            if (winner->status != GateStatus::Active && winner->merged_into) {
                winner = db_.getGate(*winner->merged_into);
            }
            if (!winner || winner->status != GateStatus::Active) {
                MaterializeAction skipped;
                skipped.kind = MaterializeAction::Kind::Skipped;
                skipped.centroid = cluster.centroid;
                skipped.sample_count = cluster.size();
                return skipped;
            }
            return refine(*winner, cluster, haversineMeters(winner->centroid, cluster.centroid));
        });

        switch (action.kind) {
            case MaterializeAction::Kind::Created:
                ++report.created;
                std::cout << "[Materializer] Created gate " << action.gate_id << " \"" << action.name
                          << "\" from " << action.sample_count << " scans" << std::endl;
                break;
            case MaterializeAction::Kind::Updated:
                ++report.updated;
                std::cout << "[Materializer] Refined gate " << action.gate_id << " with a cluster "
                          << action.match_distance_m << " m away" << std::endl;
                break;
            case MaterializeAction::Kind::Skipped:
                ++report.skipped;
                std::cerr << "[Materializer] Cluster at " << action.centroid.lat << "," << action.centroid.lon
                          << " maps onto a retired gate anchor, skipped" << std::endl;
                break;
        }
        report.actions.push_back(action);
    }
    return report;
}

} // namespace gatesense
