#include "gatesense/enforcement/BindingLearner.h"
#include "../db_core/GateDatabase.h"
#include "../db_core/TimeUtils.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gatesense {

double bindingConfidence(int gate_samples, int category_samples, double prior_samples) {
    if (gate_samples <= 0 || category_samples <= 0) return 0.0;
    const double n = gate_samples;
    const double dominance = n / std::max(category_samples, gate_samples);
    const double evidence = n / (n + std::max(prior_samples, 0.0));
    return std::clamp(dominance * evidence, 0.0, 1.0);
}

bool isRecognized(const CategoryBinding& b, const AdaptiveThresholdConfig& cfg) {
    if (b.status == BindingStatus::Enforced) return true;
    return b.status == BindingStatus::Probation && b.confidence >= cfg.soft_threshold;
}

const CategoryBinding* strongestEnforced(const std::vector<CategoryBinding>& gate_bindings) {
    const CategoryBinding* best = nullptr;
    for (const auto& b : gate_bindings) {
        if (b.status != BindingStatus::Enforced) continue;
        if (!best ||
            b.confidence > best->confidence ||
            (b.confidence == best->confidence && b.sample_count > best->sample_count) ||
            (b.confidence == best->confidence && b.sample_count == best->sample_count && b.category < best->category)) {
            best = &b;
        }
    }
    return best;
}

static std::string fmt2(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

BindingLearner::BindingLearner(GateDatabase& db, const AdaptiveThresholdConfig& cfg)
    : db_(db), cfg_(cfg) {}

void BindingLearner::recordTransition(const CategoryBinding& b, BindingStatus from, BindingStatus to,
                                      const std::string& reason, const std::string& when) {
    BindingTransition t;
    t.gate_id = b.gate_id;
    t.category = b.category;
    t.from = from;
    t.to = to;
    t.reason = reason;
    t.timestamp = when;
    if (!db_.insertTransition(b.session_id, t)) {
        throw std::runtime_error("failed to record binding transition for gate " + std::to_string(b.gate_id));
    }
    std::cout << "[Learner] Gate " << b.gate_id << " / " << b.category << ": "
              << toString(from) << " -> " << toString(to) << " (" << reason << ")" << std::endl;
}

void BindingLearner::recordViolation(const CategoryBinding& target, const CheckinEvent& event, LearnReport* report) {
    CategoryBinding b = target;
    const std::string now = TimeUtils::getCurrentTimestamp();
    b.violation_count += 1;
    b.last_violation_at = event.timestamp;
    b.updated_at = now;
    report->violations += 1;

    const double rate = static_cast<double>(b.violation_count) / (b.violation_count + b.sample_count);
    if (b.violation_count >= cfg_.demotion_violation_count && rate >= cfg_.demotion_violation_rate) {
        const std::string reason = std::to_string(b.violation_count) + " violations, rate " + fmt2(rate);
        b.status = BindingStatus::Probation;
        b.demotion_count += 1;
        b.violation_count = 0;
        recordTransition(b, BindingStatus::Enforced, BindingStatus::Probation, reason, now);
        report->demotions += 1;

        if (b.demotion_count >= cfg_.max_demotions) {
            b.status = BindingStatus::Unbound;
            recordTransition(b, BindingStatus::Probation, BindingStatus::Unbound,
                             "sustained violations, " + std::to_string(b.demotion_count) + " demotions", now);
            report->unbound += 1;
        }
    }

    if (!db_.upsertBinding(b)) {
        throw std::runtime_error("failed to record violation on gate " + std::to_string(b.gate_id));
    }
}

bool BindingLearner::learnEvent(int64_t event_id, LearnReport* report) {
    LearnReport local;
    const bool learned = db_.withTransaction([&]() -> bool {
        auto event = db_.getCheckin(event_id);
        if (!event || event->learned || event->outcome != CheckinOutcome::Success || !event->gate_id) {
            return false;
        }
        // the flag is the idempotency key: a re-delivered event stops here
        if (!db_.markLearned(event_id)) return false;

        const int64_t gate_id = *event->gate_id;
        const auto gate_bindings = db_.getBindingsForGate(gate_id);
        const CategoryBinding* own = nullptr;
        for (const auto& b : gate_bindings) {
            if (b.category == event->category) own = &b;
        }

        if (!own || !isRecognized(*own, cfg_)) {
            if (const CategoryBinding* target = strongestEnforced(gate_bindings)) {
                recordViolation(*target, *event, &local);
            }
        }

        CategoryBinding binding;
        if (own) {
            binding = *own;
        } else {
            binding.gate_id = gate_id;
            binding.category = event->category;
            binding.session_id = event->session_id;
            binding.status = BindingStatus::Probation;
        }
        binding.sample_count += 1;
        binding.updated_at = TimeUtils::getCurrentTimestamp();
        if (!db_.upsertBinding(binding)) {
            throw std::runtime_error("failed to store binding for gate " + std::to_string(gate_id));
        }

        recomputeCategory(event->session_id, event->category, &local);
        local.processed += 1;
        local.last_event_id = event_id;
        return true;
    });

    if (learned && report) {
        report->processed  += local.processed;
        report->violations += local.violations;
        report->promotions += local.promotions;
        report->demotions  += local.demotions;
        report->unbound    += local.unbound;
        report->last_event_id = std::max(report->last_event_id, local.last_event_id);
    }
    return learned;
}

void BindingLearner::recomputeCategory(const std::string& session_id, const std::string& category,
                                       LearnReport* report) {
    auto bindings = db_.getBindingsForCategory(session_id, category);
    int total = 0;
    for (const auto& b : bindings) total += b.sample_count;

    const std::string now = TimeUtils::getCurrentTimestamp();
    for (auto& b : bindings) {
        const double confidence = bindingConfidence(b.sample_count, total, cfg_.confidence_prior_samples);
        const BindingStatus before = b.status;
        const bool confidence_changed = confidence != b.confidence;
        b.confidence = confidence;

        if (b.status == BindingStatus::Probation) {
            if (b.demotion_count >= cfg_.max_demotions) {
                b.status = BindingStatus::Unbound;
                recordTransition(b, before, b.status,
                                 "sustained violations, " + std::to_string(b.demotion_count) + " demotions", now);
                if (report) report->unbound += 1;
            } else if (confidence >= cfg_.hard_threshold && b.sample_count >= cfg_.min_effective_samples) {
                b.status = BindingStatus::Enforced;
                recordTransition(b, before, b.status,
                                 "confidence " + fmt2(confidence) + " over " + std::to_string(b.sample_count) + " samples",
                                 now);
                if (report) report->promotions += 1;
            }
        }

        if (confidence_changed || b.status != before) {
            b.updated_at = now;
            if (!db_.upsertBinding(b)) {
                throw std::runtime_error("failed to update binding confidence for gate " + std::to_string(b.gate_id));
            }
        }
    }
}

LearnReport BindingLearner::learnPending(const std::string& session_id, const std::function<bool()>& keep_going) {
    LearnReport report;
    const auto events = db_.getUnlearned(session_id, cfg_.learning_batch_size);
    for (const auto& e : events) {
        if (keep_going && !keep_going()) break;
        try {
            learnEvent(e.id, &report);
        } catch (const std::exception& ex) {
            report.failures += 1;
            std::cerr << "[Learner] Event " << e.id << " not learned: " << ex.what() << std::endl;
        }
    }

    CycleCheckpoint cp;
    cp.session_id = session_id;
    cp.cycle = "learner";
    if (auto stored = db_.getCheckpoint(session_id, "learner")) cp = *stored;
    cp.last_event_id = std::max(cp.last_event_id, report.last_event_id);
    cp.runs += 1;
    if (!db_.putCheckpoint(cp)) {
        std::cerr << "[Learner] Failed to store checkpoint for session " << session_id << std::endl;
    }

    if (report.processed > 0) {
        std::cout << "[Learner] Session " << session_id << ": learned " << report.processed
                  << " check-ins, " << report.violations << " violations, "
                  << report.promotions << " promotions" << std::endl;
    }
    return report;
}

bool BindingLearner::setUnbound(int64_t gate_id, const std::string& category, const std::string& reason) {
    return db_.withTransaction([&]() -> bool {
        auto b = db_.getBinding(gate_id, category);
        if (!b) return false;
        if (b->status == BindingStatus::Unbound) return true;
        const BindingStatus before = b->status;
        const std::string now = TimeUtils::getCurrentTimestamp();
        b->status = BindingStatus::Unbound;
        b->updated_at = now;
        if (!db_.upsertBinding(*b)) throw std::runtime_error("failed to unbind gate " + std::to_string(gate_id));
        recordTransition(*b, before, BindingStatus::Unbound, "operator: " + reason, now);
        return true;
    });
}

bool BindingLearner::resetToProbation(int64_t gate_id, const std::string& category, const std::string& reason) {
    return db_.withTransaction([&]() -> bool {
        auto b = db_.getBinding(gate_id, category);
        if (!b || b->status != BindingStatus::Unbound) return false;
        const std::string now = TimeUtils::getCurrentTimestamp();
        b->status = BindingStatus::Probation;
        b->violation_count = 0;
        b->demotion_count = 0;
        b->updated_at = now;
        if (!db_.upsertBinding(*b)) throw std::runtime_error("failed to reset gate " + std::to_string(gate_id));
        recordTransition(*b, BindingStatus::Unbound, BindingStatus::Probation, "operator: " + reason, now);
        return true;
    });
}

} // namespace gatesense
