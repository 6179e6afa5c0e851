#pragma once
#include <array>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "gatesense/models.hpp"
#include "gatesense/config/ThresholdConfig.h"

namespace gatesense {

class GateDatabase;

// Cosine similarity of two histograms; 0 when either is empty
double cosineSimilarity(const std::array<int, 24>& a, const std::array<int, 24>& b);
double cosineSimilarity(const std::map<std::string, int>& a, const std::map<std::string, int>& b);

// 0.5 * (1 - d/envelope) + 0.3 * hourly similarity + 0.2 * category similarity.
// The busier gate becomes the target. Nothing is stored.
MergeSuggestion scoreGatePair(const Gate& a, const GateTraffic& ta,
                              const Gate& b, const GateTraffic& tb,
                              double envelope_m);

struct DuplicateReport {
    int pairs_checked = 0;                  // pairs inside the distance envelope
    int suggested = 0;                      // at or above the review threshold
    int auto_applied = 0;
    std::vector<MergeSuggestion> suggestions;
};

// Compares every pair of active gates of a session and upserts merge
// suggestions. With auto_apply_merges enabled, suggestions at or above the
// auto-apply threshold are merged right away.
class DuplicateDetector {
public:
    DuplicateDetector(GateDatabase& db, const AdaptiveThresholdConfig& cfg);

    DuplicateReport run(const std::string& session_id, const std::function<bool()>& keep_going = {});

private:
    GateDatabase& db_;
    AdaptiveThresholdConfig cfg_;
};

} // namespace gatesense
