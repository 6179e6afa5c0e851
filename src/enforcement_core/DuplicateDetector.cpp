#include "gatesense/enforcement/DuplicateDetector.h"
#include "gatesense/enforcement/GateMerger.h"
#include "gatesense/discovery/Geo.h"
#include "gatesense/errors.hpp"
#include "../db_core/GateDatabase.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace gatesense {

double cosineSimilarity(const std::array<int, 24>& a, const std::array<int, 24>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na  += static_cast<double>(a[i]) * a[i];
        nb  += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    return std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), 0.0, 1.0);
}

double cosineSimilarity(const std::map<std::string, int>& a, const std::map<std::string, int>& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (const auto& [category, count] : a) {
        na += static_cast<double>(count) * count;
        auto it = b.find(category);
        if (it != b.end()) dot += static_cast<double>(count) * it->second;
    }
    for (const auto& kv : b) nb += static_cast<double>(kv.second) * kv.second;
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    return std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), 0.0, 1.0);
}

MergeSuggestion scoreGatePair(const Gate& a, const GateTraffic& ta,
                              const Gate& b, const GateTraffic& tb,
                              double envelope_m) {
    MergeSuggestion s;
    s.session_id = a.session_id;
    // busier gate survives; on a tie the older one
    const bool a_wins = ta.total > tb.total || (ta.total == tb.total && a.id < b.id);
    s.target_gate_id = a_wins ? a.id : b.id;
    s.source_gate_id = a_wins ? b.id : a.id;

    s.distance_m = haversineMeters(a.centroid, b.centroid);
    s.traffic_similarity = cosineSimilarity(ta.hourly, tb.hourly);
    s.category_similarity = cosineSimilarity(ta.categories, tb.categories);

    const double distance_score = envelope_m > 0.0 ? std::clamp(1.0 - s.distance_m / envelope_m, 0.0, 1.0) : 0.0;
    s.confidence = 0.5 * distance_score + 0.3 * s.traffic_similarity + 0.2 * s.category_similarity;
    return s;
}

DuplicateDetector::DuplicateDetector(GateDatabase& db, const AdaptiveThresholdConfig& cfg)
    : db_(db), cfg_(cfg) {}

DuplicateReport DuplicateDetector::run(const std::string& session_id, const std::function<bool()>& keep_going) {
    DuplicateReport report;
    GateMerger merger(db_, cfg_);
    std::set<int64_t> reported;

    // after an auto-merge the surviving gate has a new centroid and traffic,
    // so pairing starts over from the store
    bool rescan = true;
    while (rescan) {
        rescan = false;
        const auto gates = db_.getGates(session_id, true);
        const auto traffic = db_.getGateTraffic(session_id);
        const GateTraffic empty;

        auto trafficOf = [&](int64_t gate_id) -> const GateTraffic& {
            auto it = traffic.find(gate_id);
            return it == traffic.end() ? empty : it->second;
        };

        for (size_t i = 0; i < gates.size() && !rescan; ++i) {
            for (size_t j = i + 1; j < gates.size() && !rescan; ++j) {
                if (keep_going && !keep_going()) return report;
                const Gate& a = gates[i];
                const Gate& b = gates[j];
                if (haversineMeters(a.centroid, b.centroid) > cfg_.duplicate_distance_meters) continue;

                ++report.pairs_checked;
                MergeSuggestion scored = scoreGatePair(a, trafficOf(a.id), b, trafficOf(b.id), cfg_.duplicate_distance_meters);
                if (scored.confidence < cfg_.merge_review_threshold) continue;

                auto stored = db_.upsertMergeSuggestion(scored);
                if (!stored) {
                    std::cerr << "[Duplicates] Could not store suggestion for gates " << a.id << " and " << b.id << std::endl;
                    continue;
                }
                if (isTerminal(stored->status)) continue;   // reviewed earlier, never re-opened
                if (!reported.insert(stored->id).second) continue;
                ++report.suggested;

                if (cfg_.auto_apply_merges && stored->confidence >= cfg_.merge_auto_apply_threshold) {
                    std::ostringstream reason;
                    reason << "confidence " << std::fixed << std::setprecision(3) << stored->confidence;
                    ReviewAudit audit{"system", reason.str(), ""};
                    try {
                        merger.applySuggestion(stored->id, MergeStatus::AutoApplied, audit);
                        ++report.auto_applied;
                        if (auto refreshed = db_.getMergeSuggestion(stored->id)) stored = refreshed;
                        rescan = true;
                    } catch (const StaleStateError& e) {
                        std::cerr << "[Duplicates] Auto-apply skipped: " << e.what() << std::endl;
                    }
                }
                report.suggestions.push_back(*stored);
            }
        }
    }

    if (report.suggested > 0) {
        std::cout << "[Duplicates] Session " << session_id << ": " << report.suggested << " merge suggestions, "
                  << report.auto_applied << " auto-applied" << std::endl;
    }
    return report;
}

} // namespace gatesense
