#pragma once
// Core records shared by the store, the discovery/enforcement engines and the service boundaries

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gatesense {

// Outcome reported by the scanning application
enum class CheckinOutcome : int {
    Success = 0,
    Denied  = 1,
    Error   = 2
};

enum class GateStatus : int {
    Active      = 0,
    Inactive    = 1,
    Maintenance = 2
};

// How a gate came to exist
enum class DerivationMethod : int {
    Clustering = 0,
    Manual     = 1
};

// Lifecycle of a (gate, category) binding
enum class BindingStatus : int {
    Probation = 0,   // observational only
    Enforced  = 1,   // used to flag mismatched categories
    Unbound   = 2    // disabled until an operator resets it
};

enum class MergeStatus : int {
    Pending     = 0,
    Approved    = 1,
    Rejected    = 2,
    AutoApplied = 3
};

enum class ValidationDecision : int {
    Allow           = 0,
    FlagMismatch    = 1,
    DenyOutOfRange  = 2
};

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

// Scan location as reported by the device
struct ScanLocation {
    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> accuracy_m;   // reported accuracy radius
};

struct CheckinEvent {
    int64_t     id = 0;
    std::string session_id;
    std::string wristband_id;
    std::string category;
    std::string timestamp;              // "YYYY-MM-DD HH:MM:SS", UTC
    std::optional<ScanLocation> location;
    double      quality_weight = 0.0;
    std::optional<int64_t> gate_id;
    CheckinOutcome outcome = CheckinOutcome::Success;
    bool        learned = false;
};

struct Gate {
    int64_t     id = 0;
    std::string session_id;
    std::string name;
    GeoPoint    centroid;
    DerivationMethod derivation = DerivationMethod::Clustering;
    int         health_score = 0;       // 0..100
    GateStatus  status = GateStatus::Active;
    double      spatial_variance_m2 = 0.0;
    int         sample_count = 0;
    std::string first_seen;
    std::string last_seen;
    int64_t     anchor_lat_key = 0;     // creation centroid rounded to 1e-4 deg
    int64_t     anchor_lon_key = 0;
    std::optional<int64_t> merged_into;
};

struct CategoryBinding {
    int64_t     gate_id = 0;
    std::string category;
    std::string session_id;
    int         sample_count = 0;
    double      confidence = 0.0;
    BindingStatus status = BindingStatus::Probation;
    int         violation_count = 0;
    std::string last_violation_at;      // empty when never violated
    int         demotion_count = 0;
    std::string updated_at;
};

struct BindingTransition {
    int64_t       gate_id = 0;
    std::string   category;
    BindingStatus from = BindingStatus::Probation;
    BindingStatus to = BindingStatus::Probation;
    std::string   reason;
    std::string   timestamp;
};

struct ReviewAudit {
    std::string reviewed_by;
    std::string reason;
    std::string reviewed_at;            // filled by the server
};

struct MergeSuggestion {
    int64_t     id = 0;
    std::string session_id;
    int64_t     source_gate_id = 0;     // gate to be deactivated
    int64_t     target_gate_id = 0;     // gate that survives
    double      distance_m = 0.0;
    double      traffic_similarity = 0.0;
    double      category_similarity = 0.0;
    double      confidence = 0.0;
    MergeStatus status = MergeStatus::Pending;
    ReviewAudit audit;
    std::string created_at;
};

// Check-in pattern of a single gate, used for duplicate detection
struct GateTraffic {
    int64_t gate_id = 0;
    int     total = 0;
    std::array<int, 24> hourly{};
    std::map<std::string, int> categories;
    std::string last_scan_at;
};

struct CycleCheckpoint {
    std::string session_id;
    std::string cycle;
    int64_t     last_event_id = 0;
    int64_t     last_accepted_count = 0;
    int         runs = 0;
    std::string updated_at;
};

// Raw GPS figures over a session's successful scans
struct GpsQualityStats {
    int    total = 0;
    int    with_location = 0;
    int    usable = 0;                  // quality weight above zero
    double avg_accuracy_m = 0.0;        // over scans reporting accuracy
    double min_accuracy_m = 0.0;
    double max_accuracy_m = 0.0;
    int    excellent = 0;               // <= 10 m
    int    good = 0;                    // <= 20 m
    int    fair = 0;                    // <= 50 m
    int    poor = 0;                    // > 50 m
};

struct SystemLogEntry {
    int64_t     id = 0;
    std::string session_id;
    std::string log_type;
    std::string message;
    std::string metadata_json;
    std::string created_at;
};

// ------ enum <-> string (storage columns and wire format) ------
inline std::string toString(CheckinOutcome o) {
    switch (o) {
        case CheckinOutcome::Success: return "success";
        case CheckinOutcome::Denied:  return "denied";
        case CheckinOutcome::Error:   return "error";
    }
    return "error";
}
inline std::string toString(GateStatus s) {
    switch (s) {
        case GateStatus::Active:      return "active";
        case GateStatus::Inactive:    return "inactive";
        case GateStatus::Maintenance: return "maintenance";
    }
    return "inactive";
}
inline std::string toString(DerivationMethod d) {
    return d == DerivationMethod::Manual ? "manual" : "clustering";
}
inline std::string toString(BindingStatus s) {
    switch (s) {
        case BindingStatus::Probation: return "probation";
        case BindingStatus::Enforced:  return "enforced";
        case BindingStatus::Unbound:   return "unbound";
    }
    return "unbound";
}
inline std::string toString(MergeStatus s) {
    switch (s) {
        case MergeStatus::Pending:     return "pending";
        case MergeStatus::Approved:    return "approved";
        case MergeStatus::Rejected:    return "rejected";
        case MergeStatus::AutoApplied: return "auto_applied";
    }
    return "pending";
}
inline std::string toString(ValidationDecision d) {
    switch (d) {
        case ValidationDecision::Allow:          return "allow";
        case ValidationDecision::FlagMismatch:   return "flag_mismatch";
        case ValidationDecision::DenyOutOfRange: return "deny_out_of_range";
    }
    return "deny_out_of_range";
}

// Parsers return false on unknown text and leave `out` untouched
bool parseOutcome(const std::string& text, CheckinOutcome& out);
bool parseGateStatus(const std::string& text, GateStatus& out);
bool parseDerivation(const std::string& text, DerivationMethod& out);
bool parseBindingStatus(const std::string& text, BindingStatus& out);
bool parseMergeStatus(const std::string& text, MergeStatus& out);

inline bool isTerminal(MergeStatus s) { return s != MergeStatus::Pending; }

} // namespace gatesense
