#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

class GateDatabase;

struct ValidationResult {
    ValidationDecision decision = ValidationDecision::Allow;
    double confidence = 0.0;                     // binding confidence of the category, 0 if none
    std::optional<BindingStatus> binding_status;
    std::string reason;
};

// Immutable view of one session used on the check-in path
struct SessionSnapshot {
    std::string session_id;
    AdaptiveThresholdConfig thresholds;
    std::unordered_map<int64_t, Gate> gates;
    std::unordered_map<int64_t, std::vector<CategoryBinding>> bindings;   // by gate
    std::string built_at;
    uint64_t generation = 0;               // order in which builds started
};

// Pure decision over a snapshot:
//   1. unknown / foreign / non-active gate             -> deny_out_of_range
//   2. location beyond out_of_range_factor * radius    -> deny_out_of_range
//      (radius = max(min_accept_radius, 2 * sqrt(variance)))
//   3. category enforced at the gate                   -> allow
//   4. another category enforced, this one unrecognized -> flag_mismatch
//   5. otherwise                                       -> allow
ValidationResult evaluateCheckin(const SessionSnapshot& snapshot, int64_t gate_id,
                                 const std::string& category,
                                 const std::optional<GeoPoint>& location);

double acceptedRadiusMeters(const Gate& gate, const AdaptiveThresholdConfig& cfg);

// Serves validation from per-session snapshots. Background cycles publish a
// fresh snapshot when they finish; validate() only copies a shared_ptr under
// a short lock and never waits on them.
class ValidationService {
public:
    using ThresholdProvider = std::function<AdaptiveThresholdConfig(const std::string&)>;

    ValidationService(GateDatabase& db, ThresholdProvider thresholds);

    // Builds the first snapshot of a session from the store if none exists yet.
    // Sessions unknown to the store are answered from an empty view, uncached.
    ValidationResult validate(const std::string& session_id, int64_t gate_id,
                              const std::string& category,
                              const std::optional<GeoPoint>& location = std::nullopt);

    // Rebuilds and swaps the snapshot of a session. A build that started before
    // the published one is discarded and the published one is returned.
    std::shared_ptr<const SessionSnapshot> refresh(const std::string& session_id);
    std::shared_ptr<const SessionSnapshot> snapshot(const std::string& session_id) const;
    void drop(const std::string& session_id);

private:
    GateDatabase& db_;
    ThresholdProvider thresholds_;

    std::atomic<uint64_t> next_generation_{0};
    mutable std::mutex snap_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const SessionSnapshot>> snapshots_;
};

} // namespace gatesense
