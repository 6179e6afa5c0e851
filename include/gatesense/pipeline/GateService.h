#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gatesense/models.hpp"
#include "gatesense/config/ServiceConfig.h"
#include "gatesense/config/ThresholdConfig.h"
#include "gatesense/discovery/GateMaterializer.h"
#include "gatesense/discovery/OrphanAssigner.h"
#include "gatesense/enforcement/BindingLearner.h"
#include "gatesense/enforcement/DuplicateDetector.h"
#include "gatesense/enforcement/GateMerger.h"
#include "gatesense/enforcement/ValidationService.h"
#include "gatesense/pipeline/CycleScheduler.h"

namespace gatesense {

class GateDatabase;

// Raw scan as handed over by the ticketing side
struct CheckinInput {
    std::string session_id;
    std::string wristband_id;
    std::string category;
    std::string timestamp;                 // ISO-8601 or "YYYY-MM-DD HH:MM:SS", UTC
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<double> accuracy_m;
    std::optional<int64_t> gate_id;        // known from context (fixed scanner)
    CheckinOutcome outcome = CheckinOutcome::Success;
};

struct IngestResult {
    int64_t event_id = 0;
    std::optional<int64_t> gate_id;
    double quality_weight = 0.0;
    bool discovery_scheduled = false;
};

struct GateView {
    Gate gate;
    std::vector<CategoryBinding> bindings;
};

struct DiscoveryResult {
    bool dry_run = false;
    int  input_scans = 0;
    int  clusters = 0;
    int  noise_points = 0;
    int  rejected_by_variance = 0;
    MaterializeReport materialize;
    OrphanReport orphans;
    LearnReport learning;
};

struct QualityReport {
    GpsQualityStats stats;
    double location_pct = 0.0;             // share of scans carrying a location
    double usable_pct = 0.0;               // share with a non-zero quality weight
    std::string rating;                    // excellent / good / fair / poor / no_data
    std::string recommendation;
};

struct GateHealthEntry {
    int64_t     gate_id = 0;
    std::string name;
    int         health_score = 0;
    GateStatus  status = GateStatus::Active;
    std::string state;                     // CRITICAL / WARNING / INACTIVE / HEALTHY
    std::string recommendation;
    int         checkins = 0;
    std::string last_scan_at;
};

// The operations offered to scanners and operator tooling, on top of one store.
// Background cycles run on the scheduler's workers; operator-triggered cycles
// run on the caller's thread under the same per-session lock.
class GateService {
public:
    GateService(GateDatabase& db, const ServiceConfig& config);
    ~GateService();

    GateService(const GateService&) = delete;
    GateService& operator=(const GateService&) = delete;

    void start();
    void stop();

    // ---------------- ingestion / validation ----------------
    IngestResult ingest(const CheckinInput& input);
    ValidationResult validate(const std::string& session_id, int64_t gate_id, const std::string& category,
                              const std::optional<GeoPoint>& location = std::nullopt);

    // ---------------- gates ----------------
    std::vector<GateView> listGates(const std::string& session_id);
    Gate createManualGate(const std::string& session_id, const std::string& name, const GeoPoint& location);
    Gate renameGate(int64_t gate_id, const std::string& name);
    Gate setGateStatus(int64_t gate_id, GateStatus status);
    MergeResult mergeGates(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit);
    void unbindCategory(int64_t gate_id, const std::string& category, const std::string& reason);
    void resetBinding(int64_t gate_id, const std::string& category, const std::string& reason);
    std::vector<BindingTransition> bindingHistory(int64_t gate_id, const std::string& category);

    // ---------------- merge review ----------------
    std::vector<MergeSuggestion> listMerges(const std::string& session_id,
                                            std::optional<MergeStatus> status = MergeStatus::Pending);
    MergeResult approveMerge(int64_t suggestion_id, const ReviewAudit& audit);
    void rejectMerge(int64_t suggestion_id, const ReviewAudit& audit);

    // ---------------- configuration ----------------
    AdaptiveThresholdConfig getThresholds(const std::string& session_id);
    // Throws ConfigValidationError and leaves the stored config untouched
    void setThresholds(const std::string& session_id, const AdaptiveThresholdConfig& cfg);

    // ---------------- cycles ----------------
    DiscoveryResult runDiscoveryCycle(const std::string& session_id, bool dry_run = false);
    LearnReport runEnforcementCycle(const std::string& session_id);
    DuplicateReport runDuplicateDetection(const std::string& session_id);
    // Timer entry point: queues every cycle for every active session
    void scheduleAll();
    void waitIdle();

    void deactivateSession(const std::string& session_id);
    void activateSession(const std::string& session_id);
    std::vector<std::string> activeSessions();

    // ---------------- diagnostics ----------------
    QualityReport qualityReport(const std::string& session_id);
    std::vector<GateHealthEntry> gateHealth(const std::string& session_id);
    std::vector<SystemLogEntry> systemLog(const std::string& session_id, int limit = 100);

    const ServiceConfig& config() const { return config_; }
    CycleScheduler::Stats schedulerStats() const { return scheduler_.stats(); }

private:
    GateDatabase& db_;
    ServiceConfig config_;
    ValidationService validation_;
    CycleScheduler scheduler_;

    void runBackground(const std::string& session_id, CycleKind kind);
    DiscoveryResult discoveryLocked(const std::string& session_id, bool dry_run);
    LearnReport enforcementLocked(const std::string& session_id);
    DuplicateReport duplicatesLocked(const std::string& session_id);

    bool keepGoing(const std::string& session_id) const;
    void logCycle(const std::string& session_id, const std::string& type, const std::string& message,
                  const std::string& metadata_json);
    Gate requireGate(int64_t gate_id);
};

} // namespace gatesense
