#include "gatesense/enforcement/ValidationService.h"
#include "gatesense/enforcement/BindingLearner.h"
#include "gatesense/discovery/Geo.h"
#include "../db_core/GateDatabase.h"
#include "../db_core/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace gatesense {

double acceptedRadiusMeters(const Gate& gate, const AdaptiveThresholdConfig& cfg) {
    return std::max(cfg.min_accept_radius_meters, 2.0 * std::sqrt(std::max(gate.spatial_variance_m2, 0.0)));
}

ValidationResult evaluateCheckin(const SessionSnapshot& snapshot, int64_t gate_id,
                                 const std::string& category,
                                 const std::optional<GeoPoint>& location) {
    ValidationResult r;
    auto git = snapshot.gates.find(gate_id);
    if (git == snapshot.gates.end() || git->second.session_id != snapshot.session_id) {
        r.decision = ValidationDecision::DenyOutOfRange;
        r.reason = "unknown gate";
        return r;
    }
    const Gate& gate = git->second;
    if (gate.status != GateStatus::Active) {
        r.decision = ValidationDecision::DenyOutOfRange;
        r.reason = "gate is " + toString(gate.status);
        return r;
    }

    static const std::vector<CategoryBinding> kNoBindings;
    auto bit = snapshot.bindings.find(gate_id);
    const auto& bindings = bit == snapshot.bindings.end() ? kNoBindings : bit->second;

    const CategoryBinding* own = nullptr;
    bool other_enforced = false;
    for (const auto& b : bindings) {
        if (b.category == category) own = &b;
        else if (b.status == BindingStatus::Enforced) other_enforced = true;
    }
    if (own) {
        r.confidence = own->confidence;
        r.binding_status = own->status;
    }

    if (location && isValidCoordinate(*location)) {
        const double d = haversineMeters(gate.centroid, *location);
        const double limit = snapshot.thresholds.out_of_range_factor * acceptedRadiusMeters(gate, snapshot.thresholds);
        if (d > limit) {
            std::ostringstream ss;
            ss << "scan " << std::lround(d) << " m from gate, limit " << std::lround(limit) << " m";
            r.decision = ValidationDecision::DenyOutOfRange;
            r.reason = ss.str();
            return r;
        }
    }

    if (own && own->status == BindingStatus::Enforced) {
        r.decision = ValidationDecision::Allow;
        r.reason = "category enforced at gate";
        return r;
    }
    if (other_enforced && !(own && isRecognized(*own, snapshot.thresholds))) {
        r.decision = ValidationDecision::FlagMismatch;
        r.reason = "gate is enforced for other categories";
        return r;
    }
    r.decision = ValidationDecision::Allow;
    r.reason = "insufficient evidence";
    return r;
}

ValidationService::ValidationService(GateDatabase& db, ThresholdProvider thresholds)
    : db_(db), thresholds_(std::move(thresholds)) {}

ValidationResult ValidationService::validate(const std::string& session_id, int64_t gate_id,
                                             const std::string& category,
                                             const std::optional<GeoPoint>& location) {
    auto snap = snapshot(session_id);
    if (!snap) {
        if (!db_.sessionExists(session_id)) {
            SessionSnapshot empty;
            empty.session_id = session_id;
            return evaluateCheckin(empty, gate_id, category, location);
        }
        snap = refresh(session_id);
    }
    return evaluateCheckin(*snap, gate_id, category, location);
}

std::shared_ptr<const SessionSnapshot> ValidationService::refresh(const std::string& session_id) {
    auto snap = std::make_shared<SessionSnapshot>();
    snap->session_id = session_id;
    snap->generation = ++next_generation_;
    snap->thresholds = thresholds_ ? thresholds_(session_id) : AdaptiveThresholdConfig{};
    for (auto& g : db_.getGates(session_id)) {
        const int64_t id = g.id;
        snap->gates.emplace(id, std::move(g));
    }
    for (auto& b : db_.getBindingsForSession(session_id)) {
        snap->bindings[b.gate_id].push_back(std::move(b));
    }
    snap->built_at = TimeUtils::getCurrentTimestamp();

    std::lock_guard<std::mutex> lock(snap_mutex_);
    auto& slot = snapshots_[session_id];
    if (slot && slot->generation > snap->generation) return slot;
    slot = snap;
    return slot;
}

std::shared_ptr<const SessionSnapshot> ValidationService::snapshot(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(snap_mutex_);
    auto it = snapshots_.find(session_id);
    return it == snapshots_.end() ? nullptr : it->second;
}

void ValidationService::drop(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(snap_mutex_);
    snapshots_.erase(session_id);
}

} // namespace gatesense
