#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

class GateDatabase;

// confidence = dominance * evidence
//   dominance = samples at this gate / samples of the category across the session
//   evidence  = n / (n + prior)
double bindingConfidence(int gate_samples, int category_samples, double prior_samples);

// A binding that counts as legitimate use of its gate: enforced, or a
// probation binding that reached the soft threshold
bool isRecognized(const CategoryBinding& b, const AdaptiveThresholdConfig& cfg);

// The enforced binding that absorbs violations at a gate (highest confidence,
// then most samples, then category name); nullptr when none is enforced
const CategoryBinding* strongestEnforced(const std::vector<CategoryBinding>& gate_bindings);

struct LearnReport {
    int processed = 0;
    int violations = 0;
    int promotions = 0;
    int demotions = 0;
    int unbound = 0;
    int failures = 0;
    int64_t last_event_id = 0;
};

class BindingLearner {
public:
    BindingLearner(GateDatabase& db, const AdaptiveThresholdConfig& cfg);

    // Learns one gated successful check-in in its own transaction. Returns
    // false when the event is unknown, not learnable or already learned.
    bool learnEvent(int64_t event_id, LearnReport* report = nullptr);

    // Up to learning_batch_size unlearned events in id order; stops early when
    // keep_going returns false
    LearnReport learnPending(const std::string& session_id,
                             const std::function<bool()>& keep_going = {});

    // Recomputes confidence of every binding of a category in the session and
    // applies promotion / sustained-violation transitions. Expects to run
    // inside a transaction opened by the caller.
    void recomputeCategory(const std::string& session_id, const std::string& category,
                           LearnReport* report = nullptr);

    // Operator overrides
    bool setUnbound(int64_t gate_id, const std::string& category, const std::string& reason);
    bool resetToProbation(int64_t gate_id, const std::string& category, const std::string& reason);

private:
    GateDatabase& db_;
    AdaptiveThresholdConfig cfg_;

    void recordTransition(const CategoryBinding& b, BindingStatus from, BindingStatus to,
                          const std::string& reason, const std::string& when);
    void recordViolation(const CategoryBinding& target, const CheckinEvent& event, LearnReport* report);
};

} // namespace gatesense
