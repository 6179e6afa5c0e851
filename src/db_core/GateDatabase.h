#ifndef GATESENSE_GATE_DATABASE_H
#define GATESENSE_GATE_DATABASE_H

#include <SQLiteCpp/SQLiteCpp.h>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "gatesense/models.hpp"

namespace gatesense {

// SQLite store for check-ins, gates, bindings and merge suggestions.
// Every method serializes on one recursive mutex, so a caller already inside
// withTransaction() can keep issuing statements on the same thread.
class GateDatabase {
public:
    // ":memory:" gives a private in-process database
    explicit GateDatabase(const std::string& db_path);
    ~GateDatabase() = default;

    GateDatabase(const GateDatabase&) = delete;
    GateDatabase& operator=(const GateDatabase&) = delete;

    bool initialize();

    // Runs fn inside one SQLite transaction. Exceptions thrown by fn roll the
    // transaction back and propagate to the caller.
    // IMMEDIATE takes the file's write lock before fn reads anything, so a
    // second connection cannot commit in between.
    template <typename Fn>
    auto withTransaction(Fn&& fn,
                         SQLite::TransactionBehavior behavior = SQLite::TransactionBehavior::IMMEDIATE)
        -> decltype(fn()) {
        std::lock_guard<std::recursive_mutex> lock(db_mutex_);
        SQLite::Transaction tx(*database_, behavior);
        if constexpr (std::is_void<decltype(fn())>::value) {
            fn();
            tx.commit();
        } else {
            auto result = fn();
            tx.commit();
            return result;
        }
    }

    // ---------------- sessions ----------------
    bool ensureSession(const std::string& session_id);
    bool setSessionActive(const std::string& session_id, bool active);
    bool isSessionActive(const std::string& session_id);
    bool sessionExists(const std::string& session_id);
    std::vector<std::string> getActiveSessions();

    // ---------------- check-in events ----------------
    std::optional<int64_t> insertCheckin(const CheckinEvent& event);
    std::optional<CheckinEvent> getCheckin(int64_t event_id);
    // Quality-accepted successful scans at or after `since`, newest first
    std::vector<CheckinEvent> getClusterInput(const std::string& session_id,
                                              const std::string& since,
                                              double min_quality_weight,
                                              int limit);
    int64_t countAcceptedScans(const std::string& session_id, double min_quality_weight);
    std::optional<std::string> latestScanTime(const std::string& session_id);
    // Successful ungated scans with a usable location, ascending id after `after_id`
    std::vector<CheckinEvent> getOrphans(const std::string& session_id, int64_t after_id, int limit);
    // Only fills a null gate reference; false when the event already had one
    bool assignGate(int64_t event_id, int64_t gate_id);
    std::vector<CheckinEvent> getUnlearned(const std::string& session_id, int limit);
    // false when the event was already learned
    bool markLearned(int64_t event_id);
    int repointCheckins(int64_t from_gate_id, int64_t to_gate_id);
    int countCheckinsForGate(int64_t gate_id);
    // Hourly and category histograms of successful scans per gate
    std::map<int64_t, GateTraffic> getGateTraffic(const std::string& session_id);
    GpsQualityStats getQualityStats(const std::string& session_id);

    // ---------------- gates ----------------
    // nullopt when the anchor key is already taken (or on failure)
    std::optional<int64_t> insertGateIfAbsent(const Gate& gate);
    std::optional<int64_t> insertGate(const Gate& gate);
    std::optional<Gate> getGate(int64_t gate_id);
    std::optional<Gate> getGateByAnchor(const std::string& session_id, int64_t lat_key, int64_t lon_key);
    std::vector<Gate> getGates(const std::string& session_id, bool active_only = false);
    bool updateGate(const Gate& gate);

    // ---------------- category bindings ----------------
    std::optional<CategoryBinding> getBinding(int64_t gate_id, const std::string& category);
    bool upsertBinding(const CategoryBinding& binding);
    bool deleteBinding(int64_t gate_id, const std::string& category);
    std::vector<CategoryBinding> getBindingsForGate(int64_t gate_id);
    std::vector<CategoryBinding> getBindingsForSession(const std::string& session_id);
    std::vector<CategoryBinding> getBindingsForCategory(const std::string& session_id, const std::string& category);
    bool insertTransition(const std::string& session_id, const BindingTransition& transition);
    std::vector<BindingTransition> getTransitions(int64_t gate_id, const std::string& category);

    // ---------------- merge suggestions ----------------
    // Inserts, or refreshes the scores of a still-pending row for the same pair.
    // Returns the stored row, whatever its status.
    std::optional<MergeSuggestion> upsertMergeSuggestion(const MergeSuggestion& suggestion);
    std::optional<MergeSuggestion> getMergeSuggestion(int64_t suggestion_id);
    std::vector<MergeSuggestion> getMergeSuggestions(const std::string& session_id,
                                                     std::optional<MergeStatus> status = std::nullopt);
    // Moves a pending suggestion to a terminal status; false if it was not pending
    bool resolveSuggestion(int64_t suggestion_id, MergeStatus status, const ReviewAudit& audit);
    int rejectPendingForGate(const std::string& session_id, int64_t gate_id, const ReviewAudit& audit);

    // ---------------- thresholds / checkpoints / logs ----------------
    std::optional<std::string> getThresholdsJson(const std::string& session_id);
    bool putThresholdsJson(const std::string& session_id, const std::string& config_json);
    std::optional<CycleCheckpoint> getCheckpoint(const std::string& session_id, const std::string& cycle);
    bool putCheckpoint(const CycleCheckpoint& checkpoint);
    bool insertSystemLog(const std::string& session_id, const std::string& log_type,
                         const std::string& message, const std::string& metadata_json = "{}");
    std::vector<SystemLogEntry> getSystemLogs(const std::string& session_id, int limit = 100);

    bool exec(const std::string& sql);

private:
    std::string db_path_;
    std::unique_ptr<SQLite::Database> database_;
    std::recursive_mutex db_mutex_;

    bool createTables();
};

} // namespace gatesense

#endif // GATESENSE_GATE_DATABASE_H
