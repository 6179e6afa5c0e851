#pragma once
#include <cstdint>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

class GateDatabase;

struct MergeResult {
    int64_t source_gate_id = 0;
    int64_t target_gate_id = 0;
    int     events_repointed = 0;
    int     bindings_moved = 0;
    int     bindings_combined = 0;
    int     suggestions_rejected = 0;
    Gate    target;                        // state after the merge
};

// Folds one gate into another. Everything below runs as a single SQLite
// transaction: no reader ever sees events or bindings on a retired gate.
class GateMerger {
public:
    GateMerger(GateDatabase& db, const AdaptiveThresholdConfig& cfg);

    // Operator merge. Throws NotFoundError for unknown gates and
    // StaleStateError when either gate is already retired.
    MergeResult merge(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit);

    // Resolves a pending suggestion as `resolution` (approved / auto_applied)
    // and applies it in the same transaction. Throws StaleStateError when the
    // suggestion is no longer pending or one of its gates was retired.
    MergeResult applySuggestion(int64_t suggestion_id, MergeStatus resolution, const ReviewAudit& audit);

    // Throws NotFoundError / StaleStateError like applySuggestion
    void rejectSuggestion(int64_t suggestion_id, const ReviewAudit& audit);

private:
    GateDatabase& db_;
    AdaptiveThresholdConfig cfg_;

    // Caller holds the transaction
    MergeResult mergeLocked(int64_t source_gate_id, int64_t target_gate_id, const ReviewAudit& audit);
};

} // namespace gatesense
