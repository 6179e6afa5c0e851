#include "gatesense/enforcement/GateMerger.h"
#include "gatesense/enforcement/BindingLearner.h"
#include "gatesense/discovery/GateMaterializer.h"
#include "gatesense/discovery/Geo.h"
#include "gatesense/errors.hpp"
#include "../db_core/GateDatabase.h"
#include "../db_core/TimeUtils.h"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace gatesense {

static bool isRetired(const Gate& g) {
    return g.status == GateStatus::Inactive || g.merged_into.has_value();
}

GateMerger::GateMerger(GateDatabase& db, const AdaptiveThresholdConfig& cfg)
    : db_(db), cfg_(cfg) {}

MergeResult GateMerger::merge(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit) {
    return db_.withTransaction([&]() { return mergeLocked(source_gate_id, target_gate_id, audit); });
}

MergeResult GateMerger::applySuggestion(int64_t suggestion_id, MergeStatus resolution, const ReviewAudit& audit) {
    if (resolution != MergeStatus::Approved && resolution != MergeStatus::AutoApplied) {
        throw std::invalid_argument("a merge can only be approved or auto-applied");
    }
    return db_.withTransaction([&]() {
        auto s = db_.getMergeSuggestion(suggestion_id);
        if (!s) throw NotFoundError("merge suggestion " + std::to_string(suggestion_id) + " not found");
        if (isTerminal(s->status)) {
            throw StaleStateError("merge suggestion " + std::to_string(suggestion_id) + " is already " + toString(s->status));
        }
        if (!db_.resolveSuggestion(suggestion_id, resolution, audit)) {
            throw StaleStateError("merge suggestion " + std::to_string(suggestion_id) + " changed during review");
        }
        return mergeLocked(s->source_gate_id, s->target_gate_id, audit);
    });
}

void GateMerger::rejectSuggestion(int64_t suggestion_id, const ReviewAudit& audit) {
    db_.withTransaction([&]() {
        auto s = db_.getMergeSuggestion(suggestion_id);
        if (!s) throw NotFoundError("merge suggestion " + std::to_string(suggestion_id) + " not found");
        if (isTerminal(s->status) || !db_.resolveSuggestion(suggestion_id, MergeStatus::Rejected, audit)) {
            throw StaleStateError("merge suggestion " + std::to_string(suggestion_id) + " is already " + toString(s->status));
        }
    });
}

MergeResult GateMerger::mergeLocked(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit) {
    if (source_gate_id == target_gate_id) {
        throw std::invalid_argument("cannot merge gate " + std::to_string(source_gate_id) + " into itself");
    }
    auto source = db_.getGate(source_gate_id);
    auto target = db_.getGate(target_gate_id);
    if (!source) throw NotFoundError("gate " + std::to_string(source_gate_id) + " not found");
    if (!target) throw NotFoundError("gate " + std::to_string(target_gate_id) + " not found");
    if (source->session_id != target->session_id) {
        throw std::invalid_argument("gates " + std::to_string(source_gate_id) + " and " +
                                    std::to_string(target_gate_id) + " belong to different sessions");
    }
    if (isRetired(*source)) throw StaleStateError("gate " + std::to_string(source_gate_id) + " is already retired");
    if (isRetired(*target)) throw StaleStateError("gate " + std::to_string(target_gate_id) + " is already retired");

    MergeResult result;
    result.source_gate_id = source_gate_id;
    result.target_gate_id = target_gate_id;

    // ---- events ----
    const int moved = db_.repointCheckins(source_gate_id, target_gate_id);
    if (moved < 0) throw std::runtime_error("failed to re-point check-ins of gate " + std::to_string(source_gate_id));
    result.events_repointed = moved;

    // ---- bindings ----
    std::set<std::string> categories;
    for (const auto& sb : db_.getBindingsForGate(source_gate_id)) {
        categories.insert(sb.category);
        CategoryBinding merged;
        if (auto tb = db_.getBinding(target_gate_id, sb.category)) {
            merged = *tb;
            merged.sample_count += sb.sample_count;
            merged.violation_count += sb.violation_count;
            merged.demotion_count = std::max(merged.demotion_count, sb.demotion_count);
            if (sb.last_violation_at > merged.last_violation_at) merged.last_violation_at = sb.last_violation_at;
            ++result.bindings_combined;
        } else {
            merged = sb;
            merged.gate_id = target_gate_id;
            ++result.bindings_moved;
        }
        merged.updated_at = TimeUtils::getCurrentTimestamp();
        if (!db_.deleteBinding(source_gate_id, sb.category) || !db_.upsertBinding(merged)) {
            throw std::runtime_error("failed to move binding " + sb.category + " of gate " + std::to_string(source_gate_id));
        }
    }

    // ---- target geometry: sample-weighted centroid, pooled variance ----
    Gate t = *target;
    const Gate& s = *source;
    const double nt = std::max(t.sample_count, 0);
    const double ns = std::max(s.sample_count, 0);
    GeoPoint centroid = t.centroid;
    if (nt + ns > 0) {
        centroid.lat = (t.centroid.lat * nt + s.centroid.lat * ns) / (nt + ns);
        centroid.lon = (t.centroid.lon * nt + s.centroid.lon * ns) / (nt + ns);
        const double dt = haversineMeters(t.centroid, centroid);
        const double ds = haversineMeters(s.centroid, centroid);
        t.spatial_variance_m2 = (nt * (t.spatial_variance_m2 + dt * dt) + ns * (s.spatial_variance_m2 + ds * ds)) / (nt + ns);
    }
    t.centroid = centroid;
    t.sample_count = t.sample_count + s.sample_count;
    if (!s.first_seen.empty() && (t.first_seen.empty() || s.first_seen < t.first_seen)) t.first_seen = s.first_seen;
    if (s.last_seen > t.last_seen) t.last_seen = s.last_seen;
    t.health_score = computeHealthScore(t, cfg_);
    if (!db_.updateGate(t)) throw std::runtime_error("failed to update merge target " + std::to_string(target_gate_id));

    // ---- retire the source ----
    Gate retired = s;
    retired.status = GateStatus::Inactive;
    retired.merged_into = target_gate_id;
    if (!db_.updateGate(retired)) throw std::runtime_error("failed to retire gate " + std::to_string(source_gate_id));

    BindingLearner learner(db_, cfg_);
    for (const auto& category : categories) learner.recomputeCategory(t.session_id, category);

    ReviewAudit cascade;
    cascade.reviewed_by = audit.reviewed_by.empty() ? "system" : audit.reviewed_by;
    cascade.reason = "gate " + std::to_string(source_gate_id) + " merged into " + std::to_string(target_gate_id);
    const int rejected = db_.rejectPendingForGate(t.session_id, source_gate_id, cascade);
    if (rejected < 0) throw std::runtime_error("failed to close suggestions of gate " + std::to_string(source_gate_id));
    result.suggestions_rejected = rejected;

    result.target = t;
    std::cout << "[Merge] Gate " << source_gate_id << " merged into " << target_gate_id << ": "
              << result.events_repointed << " check-ins, "
              << (result.bindings_moved + result.bindings_combined) << " bindings" << std::endl;
    return result;
}

} // namespace gatesense
