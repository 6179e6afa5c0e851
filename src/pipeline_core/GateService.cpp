#include "gatesense/pipeline/GateService.h"
#include "gatesense/discovery/Geo.h"
#include "gatesense/discovery/QualityFilter.h"
#include "gatesense/discovery/SpatialClusterer.h"
#include "gatesense/errors.hpp"
#include "../db_core/GateDatabase.h"
#include "../db_core/TimeUtils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace gatesense {

static std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

GateService::GateService(GateDatabase& db, const ServiceConfig& config)
    : db_(db),
      config_(config),
      validation_(db, [this](const std::string& session_id) { return getThresholds(session_id); }),
      scheduler_([this](const std::string& session_id, CycleKind kind) { runBackground(session_id, kind); },
                 config.worker_threads,
                 [this](const std::string& session_id, CycleKind kind, const std::string& what) {
                     logCycle(session_id, "cycle_failure", toString(kind) + " cycle failed: " + what,
                              json{{"cycle", toString(kind)}, {"error", what}}.dump());
                 }) {}

GateService::~GateService() {
    stop();
}

void GateService::start() {
    scheduler_.start();
}

void GateService::stop() {
    scheduler_.stop();
}

// ============================ ingestion / validation ============================ //

IngestResult GateService::ingest(const CheckinInput& input) {
    if (input.session_id.empty() || input.wristband_id.empty() || input.category.empty() || input.timestamp.empty()) {
        throw std::invalid_argument("session_id, wristband_id, category and timestamp are required");
    }

    CheckinEvent event;
    event.session_id = input.session_id;
    event.wristband_id = input.wristband_id;
    event.category = input.category;
    event.outcome = input.outcome;
    try {
        event.timestamp = TimeUtils::normalizeTimestamp(input.timestamp);
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument(e.what());
    }
    if (input.lat && input.lon) {
        ScanLocation loc;
        loc.lat = *input.lat;
        loc.lon = *input.lon;
        loc.accuracy_m = input.accuracy_m;
        event.location = loc;
    }
    event.quality_weight = qualityWeight(event.location);

    if (!db_.ensureSession(event.session_id)) {
        throw std::runtime_error("cannot register session " + event.session_id);
    }
    const AdaptiveThresholdConfig cfg = getThresholds(event.session_id);

    if (input.gate_id) {
        // a retired gate forwards to the gate it was merged into
        auto gate = db_.getGate(*input.gate_id);
        while (gate && gate->merged_into) gate = db_.getGate(*gate->merged_into);
        if (gate && gate->session_id == event.session_id) {
            event.gate_id = gate->id;
        } else {
            std::cerr << "[Service] Unknown gate " << *input.gate_id << " for session " << event.session_id
                      << ", storing scan as orphan" << std::endl;
        }
    } else if (event.outcome == CheckinOutcome::Success && event.location && event.quality_weight > 0.0) {
        const auto gates = db_.getGates(event.session_id, true);
        if (const Gate* g = nearestActiveGate(gates, toPoint(*event.location), cfg.orphan_max_distance_meters)) {
            event.gate_id = g->id;
        }
    }

    auto id = db_.insertCheckin(event);
    if (!id) throw std::runtime_error("failed to store check-in for session " + event.session_id);

    IngestResult result;
    result.event_id = *id;
    result.gate_id = event.gate_id;
    result.quality_weight = event.quality_weight;

    if (event.outcome != CheckinOutcome::Success || !keepGoing(event.session_id) ||
        !db_.isSessionActive(event.session_id)) {
        return result;
    }

    if (acceptedForClustering(event, cfg.min_quality_weight)) {
        const int64_t accepted = db_.countAcceptedScans(event.session_id, cfg.min_quality_weight);
        auto cp = db_.getCheckpoint(event.session_id, toString(CycleKind::Discovery));
        const int64_t last = cp ? cp->last_accepted_count : 0;
        if (discoveryDue(accepted, last, config_.first_discovery_at, config_.discovery_refresh_every)) {
            result.discovery_scheduled = scheduler_.enqueue(event.session_id, CycleKind::Discovery);
        }
    }
    if (event.gate_id) {
        scheduler_.enqueue(event.session_id, CycleKind::Enforcement);
    }
    return result;
}

ValidationResult GateService::validate(const std::string& session_id, int64_t gate_id, const std::string& category,
                                       const std::optional<GeoPoint>& location) {
    return validation_.validate(session_id, gate_id, category, location);
}

// ============================ gates ============================ //

Gate GateService::requireGate(int64_t gate_id) {
    auto gate = db_.getGate(gate_id);
    if (!gate) throw NotFoundError("gate " + std::to_string(gate_id) + " not found");
    return *gate;
}

std::vector<GateView> GateService::listGates(const std::string& session_id) {
    std::vector<GateView> views;
    for (auto& g : db_.getGates(session_id)) {
        GateView v;
        v.bindings = db_.getBindingsForGate(g.id);
        v.gate = std::move(g);
        views.push_back(std::move(v));
    }
    return views;
}

Gate GateService::createManualGate(const std::string& session_id, const std::string& name, const GeoPoint& location) {
    if (session_id.empty() || name.empty()) throw std::invalid_argument("session_id and name are required");
    if (!isValidCoordinate(location)) throw std::invalid_argument("gate location is not a valid coordinate");
    if (!db_.ensureSession(session_id)) throw std::runtime_error("cannot register session " + session_id);

    const AdaptiveThresholdConfig cfg = getThresholds(session_id);
    Gate gate;
    gate.session_id = session_id;
    gate.name = name;
    gate.centroid = location;
    gate.derivation = DerivationMethod::Manual;
    gate.status = GateStatus::Active;
    gate.anchor_lat_key = anchorKey(location.lat);
    gate.anchor_lon_key = anchorKey(location.lon);
    gate.health_score = computeHealthScore(gate, cfg);

    auto id = db_.insertGate(gate);
    if (!id) {
        if (db_.getGateByAnchor(session_id, gate.anchor_lat_key, gate.anchor_lon_key)) {
            throw std::invalid_argument("a gate already exists at this location");
        }
        throw std::runtime_error("failed to create gate " + name);
    }
    gate.id = *id;

    logCycle(session_id, "manual_intervention", "created gate " + name,
             json{{"gate_id", gate.id}, {"lat", location.lat}, {"lon", location.lon}}.dump());
    validation_.refresh(session_id);
    return gate;
}

Gate GateService::renameGate(int64_t gate_id, const std::string& name) {
    if (name.empty()) throw std::invalid_argument("gate name must not be empty");
    Gate gate = requireGate(gate_id);
    const std::string previous = gate.name;
    gate.name = name;
    if (!db_.updateGate(gate)) throw std::runtime_error("failed to rename gate " + std::to_string(gate_id));
    logCycle(gate.session_id, "manual_intervention", "renamed gate " + previous + " to " + name,
             json{{"gate_id", gate_id}}.dump());
    validation_.refresh(gate.session_id);
    return gate;
}

Gate GateService::setGateStatus(int64_t gate_id, GateStatus status) {
    Gate gate = requireGate(gate_id);
    if (gate.merged_into) {
        throw StaleStateError("gate " + std::to_string(gate_id) + " was merged into " + std::to_string(*gate.merged_into));
    }
    const GateStatus previous = gate.status;
    gate.status = status;
    if (!db_.updateGate(gate)) throw std::runtime_error("failed to update gate " + std::to_string(gate_id));
    logCycle(gate.session_id, "manual_intervention",
             "gate " + std::to_string(gate_id) + " " + toString(previous) + " -> " + toString(status),
             json{{"gate_id", gate_id}, {"status", toString(status)}}.dump());
    validation_.refresh(gate.session_id);
    return gate;
}

MergeResult GateService::mergeGates(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit) {
    const Gate source = requireGate(source_gate_id);
    std::lock_guard<std::mutex> session_lock(scheduler_.sessionMutex(source.session_id));

    ReviewAudit stamped = audit;
    stamped.reviewed_at = TimeUtils::getCurrentTimestamp();
    GateMerger merger(db_, getThresholds(source.session_id));
    MergeResult result = merger.merge(source_gate_id, target_gate_id, stamped);

    logCycle(source.session_id, "manual_intervention",
             "merged gate " + std::to_string(source_gate_id) + " into " + std::to_string(target_gate_id),
             json{{"by", stamped.reviewed_by}, {"reason", stamped.reason},
                  {"events", result.events_repointed}}.dump());
    validation_.refresh(source.session_id);
    return result;
}

void GateService::unbindCategory(int64_t gate_id, const std::string& category, const std::string& reason) {
    const Gate gate = requireGate(gate_id);
    BindingLearner learner(db_, getThresholds(gate.session_id));
    if (!learner.setUnbound(gate_id, category, reason)) {
        throw NotFoundError("no binding for " + category + " at gate " + std::to_string(gate_id));
    }
    logCycle(gate.session_id, "manual_intervention", "unbound " + category + " at gate " + std::to_string(gate_id),
             json{{"gate_id", gate_id}, {"category", category}, {"reason", reason}}.dump());
    validation_.refresh(gate.session_id);
}

void GateService::resetBinding(int64_t gate_id, const std::string& category, const std::string& reason) {
    const Gate gate = requireGate(gate_id);
    BindingLearner learner(db_, getThresholds(gate.session_id));
    if (!learner.resetToProbation(gate_id, category, reason)) {
        if (db_.getBinding(gate_id, category)) {
            throw StaleStateError("binding " + category + " at gate " + std::to_string(gate_id) + " is not unbound");
        }
        throw NotFoundError("no binding for " + category + " at gate " + std::to_string(gate_id));
    }
    logCycle(gate.session_id, "manual_intervention", "reset " + category + " at gate " + std::to_string(gate_id),
             json{{"gate_id", gate_id}, {"category", category}, {"reason", reason}}.dump());
    validation_.refresh(gate.session_id);
}

std::vector<BindingTransition> GateService::bindingHistory(int64_t gate_id, const std::string& category) {
    return db_.getTransitions(gate_id, category);
}

// ============================ merge review ============================ //

std::vector<MergeSuggestion> GateService::listMerges(const std::string& session_id, std::optional<MergeStatus> status) {
    return db_.getMergeSuggestions(session_id, status);
}

MergeResult GateService::approveMerge(int64_t suggestion_id, const ReviewAudit& audit) {
    auto suggestion = db_.getMergeSuggestion(suggestion_id);
    if (!suggestion) throw NotFoundError("merge suggestion " + std::to_string(suggestion_id) + " not found");
    std::lock_guard<std::mutex> session_lock(scheduler_.sessionMutex(suggestion->session_id));

    ReviewAudit stamped = audit;
    stamped.reviewed_at = TimeUtils::getCurrentTimestamp();
    GateMerger merger(db_, getThresholds(suggestion->session_id));
    MergeResult result = merger.applySuggestion(suggestion_id, MergeStatus::Approved, stamped);

    logCycle(suggestion->session_id, "merge_review", "approved suggestion " + std::to_string(suggestion_id),
             json{{"by", stamped.reviewed_by}, {"reason", stamped.reason},
                  {"source", result.source_gate_id}, {"target", result.target_gate_id}}.dump());
    validation_.refresh(suggestion->session_id);
    return result;
}

void GateService::rejectMerge(int64_t suggestion_id, const ReviewAudit& audit) {
    auto suggestion = db_.getMergeSuggestion(suggestion_id);
    if (!suggestion) throw NotFoundError("merge suggestion " + std::to_string(suggestion_id) + " not found");

    ReviewAudit stamped = audit;
    stamped.reviewed_at = TimeUtils::getCurrentTimestamp();
    GateMerger merger(db_, getThresholds(suggestion->session_id));
    merger.rejectSuggestion(suggestion_id, stamped);

    logCycle(suggestion->session_id, "merge_review", "rejected suggestion " + std::to_string(suggestion_id),
             json{{"by", stamped.reviewed_by}, {"reason", stamped.reason}}.dump());
}

// ============================ configuration ============================ //

AdaptiveThresholdConfig GateService::getThresholds(const std::string& session_id) {
    auto stored = db_.getThresholdsJson(session_id);
    if (!stored) return config_.default_thresholds;
    try {
        return AdaptiveThresholdConfig::fromJson(json::parse(*stored), config_.default_thresholds);
    } catch (const json::exception& e) {
        std::cerr << "[Service] Stored thresholds of session " << session_id
                  << " are unreadable, using defaults: " << e.what() << std::endl;
        return config_.default_thresholds;
    }
}

void GateService::setThresholds(const std::string& session_id, const AdaptiveThresholdConfig& cfg) {
    const auto errors = cfg.validate();
    if (!errors.empty()) throw ConfigValidationError(joinErrors(errors));
    if (!db_.ensureSession(session_id)) throw std::runtime_error("cannot register session " + session_id);
    if (!db_.putThresholdsJson(session_id, cfg.toJson().dump())) {
        throw std::runtime_error("failed to store thresholds for session " + session_id);
    }
    logCycle(session_id, "config", "thresholds updated", cfg.toJson().dump());
    validation_.refresh(session_id);
}

// ============================ cycles ============================ //

bool GateService::keepGoing(const std::string& session_id) const {
    return !scheduler_.isCancelled(session_id);
}

void GateService::logCycle(const std::string& session_id, const std::string& type, const std::string& message,
                           const std::string& metadata_json) {
    if (!db_.insertSystemLog(session_id, type, message, metadata_json)) {
        std::cerr << "[Service] Could not write system log for session " << session_id << ": " << message << std::endl;
    }
}

DiscoveryResult GateService::discoveryLocked(const std::string& session_id, bool dry_run) {
    DiscoveryResult r;
    r.dry_run = dry_run;
    const AdaptiveThresholdConfig cfg = getThresholds(session_id);
    auto keep = [this, session_id] { return keepGoing(session_id); };

    if (auto latest = db_.latestScanTime(session_id)) {
        const std::string since =
            TimeUtils::addSeconds(*latest, -static_cast<long long>(cfg.discovery_window_hours * 3600.0));
        const auto scans = db_.getClusterInput(session_id, since, cfg.min_quality_weight, cfg.max_cluster_input);
        r.input_scans = static_cast<int>(scans.size());

        const ClusterRun run = SpatialClusterer(cfg).run(scans);
        r.clusters = static_cast<int>(run.clusters.size());
        r.noise_points = run.noise_points;
        r.rejected_by_variance = run.rejected_by_variance;
        std::cout << "[Cluster] Session " << session_id << ": " << r.input_scans << " scans -> " << r.clusters
                  << " clusters (" << r.noise_points << " noise, " << r.rejected_by_variance
                  << " rejected by variance)" << std::endl;

        r.materialize = GateMaterializer(db_, cfg).materialize(session_id, run.clusters, dry_run);
    }
    if (dry_run) return r;

    CycleCheckpoint cp;
    cp.session_id = session_id;
    cp.cycle = toString(CycleKind::Discovery);
    if (auto stored = db_.getCheckpoint(session_id, cp.cycle)) cp = *stored;
    cp.last_accepted_count = db_.countAcceptedScans(session_id, cfg.min_quality_weight);
    cp.runs += 1;
    if (!db_.putCheckpoint(cp)) {
        std::cerr << "[Service] Failed to store discovery checkpoint for session " << session_id << std::endl;
    }

    if (keep()) r.orphans = OrphanAssigner(db_, cfg).runCheckpointed(session_id);
    if (keep()) r.learning = BindingLearner(db_, cfg).learnPending(session_id, keep);

    logCycle(session_id, "discovery",
             "discovery cycle: " + std::to_string(r.materialize.created) + " created, " +
                 std::to_string(r.materialize.updated) + " updated",
             json{{"input_scans", r.input_scans}, {"clusters", r.clusters},
                  {"created", r.materialize.created}, {"updated", r.materialize.updated},
                  {"orphans_assigned", r.orphans.assigned}, {"learned", r.learning.processed}}.dump());
    validation_.refresh(session_id);
    return r;
}

LearnReport GateService::enforcementLocked(const std::string& session_id) {
    const AdaptiveThresholdConfig cfg = getThresholds(session_id);
    LearnReport report = BindingLearner(db_, cfg).learnPending(session_id, [this, session_id] {
        return keepGoing(session_id);
    });
    if (report.processed > 0 || report.failures > 0) {
        logCycle(session_id, "enforcement", "learned " + std::to_string(report.processed) + " check-ins",
                 json{{"learned", report.processed}, {"violations", report.violations},
                      {"promotions", report.promotions}, {"demotions", report.demotions},
                      {"unbound", report.unbound}, {"failures", report.failures}}.dump());
    }
    validation_.refresh(session_id);
    return report;
}

DuplicateReport GateService::duplicatesLocked(const std::string& session_id) {
    const AdaptiveThresholdConfig cfg = getThresholds(session_id);
    DuplicateReport report = DuplicateDetector(db_, cfg).run(session_id, [this, session_id] {
        return keepGoing(session_id);
    });
    if (report.suggested > 0) {
        logCycle(session_id, "duplicates", std::to_string(report.suggested) + " merge suggestions",
                 json{{"pairs", report.pairs_checked}, {"suggested", report.suggested},
                      {"auto_applied", report.auto_applied}}.dump());
    }
    if (report.auto_applied > 0) validation_.refresh(session_id);
    return report;
}

void GateService::runBackground(const std::string& session_id, CycleKind kind) {
    if (!keepGoing(session_id) || !db_.isSessionActive(session_id)) return;

    switch (kind) {
        case CycleKind::Discovery: {
            // timer-driven runs only re-cluster when new accepted scans arrived
            const AdaptiveThresholdConfig cfg = getThresholds(session_id);
            const int64_t accepted = db_.countAcceptedScans(session_id, cfg.min_quality_weight);
            auto cp = db_.getCheckpoint(session_id, toString(CycleKind::Discovery));
            const int64_t last = cp ? cp->last_accepted_count : 0;
            if (accepted >= config_.first_discovery_at && accepted > last) {
                discoveryLocked(session_id, false);
            } else {
                OrphanAssigner(db_, cfg).runCheckpointed(session_id);
                enforcementLocked(session_id);
            }
            break;
        }
        case CycleKind::Enforcement:
            enforcementLocked(session_id);
            break;
        case CycleKind::Duplicates:
            duplicatesLocked(session_id);
            break;
    }
}

DiscoveryResult GateService::runDiscoveryCycle(const std::string& session_id, bool dry_run) {
    if (!db_.sessionExists(session_id)) throw NotFoundError("session " + session_id + " not found");
    std::lock_guard<std::mutex> session_lock(scheduler_.sessionMutex(session_id));
    return discoveryLocked(session_id, dry_run);
}

LearnReport GateService::runEnforcementCycle(const std::string& session_id) {
    if (!db_.sessionExists(session_id)) throw NotFoundError("session " + session_id + " not found");
    std::lock_guard<std::mutex> session_lock(scheduler_.sessionMutex(session_id));
    return enforcementLocked(session_id);
}

DuplicateReport GateService::runDuplicateDetection(const std::string& session_id) {
    if (!db_.sessionExists(session_id)) throw NotFoundError("session " + session_id + " not found");
    std::lock_guard<std::mutex> session_lock(scheduler_.sessionMutex(session_id));
    return duplicatesLocked(session_id);
}

void GateService::scheduleAll() {
    for (const auto& session_id : db_.getActiveSessions()) {
        if (!keepGoing(session_id)) continue;
        scheduler_.enqueue(session_id, CycleKind::Discovery);
        scheduler_.enqueue(session_id, CycleKind::Enforcement);
        scheduler_.enqueue(session_id, CycleKind::Duplicates);
    }
}

void GateService::waitIdle() {
    scheduler_.waitIdle();
}

void GateService::deactivateSession(const std::string& session_id) {
    if (!db_.setSessionActive(session_id, false)) throw NotFoundError("session " + session_id + " not found");
    scheduler_.deactivate(session_id);
    logCycle(session_id, "session", "session deactivated", "{}");
    std::cout << "[Service] Session " << session_id << " deactivated" << std::endl;
}

void GateService::activateSession(const std::string& session_id) {
    if (!db_.ensureSession(session_id) || !db_.setSessionActive(session_id, true)) {
        throw std::runtime_error("cannot activate session " + session_id);
    }
    scheduler_.reactivate(session_id);
    logCycle(session_id, "session", "session activated", "{}");
}

std::vector<std::string> GateService::activeSessions() {
    return db_.getActiveSessions();
}

// ============================ diagnostics ============================ //

QualityReport GateService::qualityReport(const std::string& session_id) {
    QualityReport q;
    q.stats = db_.getQualityStats(session_id);
    if (q.stats.total == 0) {
        q.rating = "no_data";
        q.recommendation = "No check-ins recorded yet";
        return q;
    }
    q.location_pct = 100.0 * q.stats.with_location / q.stats.total;
    q.usable_pct = 100.0 * q.stats.usable / q.stats.total;

    const int with_accuracy = q.stats.excellent + q.stats.good + q.stats.fair + q.stats.poor;
    const double avg = q.stats.avg_accuracy_m;
    if (with_accuracy == 0) q.rating = "poor";
    else if (avg <= 15.0) q.rating = "excellent";
    else if (avg <= 30.0) q.rating = "good";
    else if (avg <= 50.0) q.rating = "fair";
    else q.rating = "poor";

    if (q.location_pct < 30.0) {
        q.recommendation = "GPS data availability is low - ensure location permissions are granted";
    } else if (with_accuracy == 0 || avg > 50.0) {
        q.recommendation = "GPS accuracy is poor - consider creating gates manually";
    } else {
        q.recommendation = "GPS data quality is sufficient for gate discovery";
    }
    return q;
}

std::vector<GateHealthEntry> GateService::gateHealth(const std::string& session_id) {
    std::vector<GateHealthEntry> entries;
    const auto traffic = db_.getGateTraffic(session_id);
    const auto latest = db_.latestScanTime(session_id);

    for (const auto& g : db_.getGates(session_id)) {
        if (g.merged_into) continue;
        GateHealthEntry e;
        e.gate_id = g.id;
        e.name = g.name;
        e.health_score = g.health_score;
        e.status = g.status;
        auto it = traffic.find(g.id);
        if (it != traffic.end()) {
            e.checkins = it->second.total;
            e.last_scan_at = it->second.last_scan_at;
        }

        // idle time is measured against the newest scan of the session, not the wall clock
        const bool idle = latest && (e.last_scan_at.empty() ||
                                     TimeUtils::getMinutesBetween(e.last_scan_at, *latest) > 30);
        if (g.health_score < 50) {
            e.state = "CRITICAL";
            e.recommendation = "Investigate gate immediately";
        } else if (g.health_score < 70) {
            e.state = "WARNING";
            e.recommendation = "Monitor closely";
        } else if (idle) {
            e.state = "INACTIVE";
            e.recommendation = "Check if gate is still in use";
        } else {
            e.state = "HEALTHY";
            e.recommendation = "No action needed";
        }
        entries.push_back(e);
    }
    std::stable_sort(entries.begin(), entries.end(), [](const GateHealthEntry& a, const GateHealthEntry& b) {
        return a.health_score < b.health_score;
    });
    return entries;
}

std::vector<SystemLogEntry> GateService::systemLog(const std::string& session_id, int limit) {
    return db_.getSystemLogs(session_id, limit);
}

} // namespace gatesense
