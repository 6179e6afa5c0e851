#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace gatesense {

// Per venue-session tunables (stored as JSON in adaptive_thresholds)
struct AdaptiveThresholdConfig {
    // ===================== discovery ===================== //
    int    min_samples_for_gate        = 5;       // smallest cluster that may become a gate
    double max_spatial_variance_m2     = 2500.0;  // clusters more spread out than this are rejected
    double cluster_epsilon_meters      = 25.0;    // neighbourhood radius for chained membership
    double min_quality_weight          = 0.6;     // scans below this weight never feed clustering
    double discovery_window_hours      = 4.0;
    int    max_cluster_input           = 5000;
    double gate_match_tolerance_meters = 20.0;    // cluster within this of a gate refines that gate

    // ===================== binding learner ===================== //
    double soft_threshold              = 0.70;
    double hard_threshold              = 0.80;
    int    min_effective_samples       = 20;
    double confidence_prior_samples    = 2.0;     // evidence = n / (n + prior)
    int    demotion_violation_count    = 10;
    double demotion_violation_rate     = 0.2;
    int    max_demotions               = 3;       // a binding demoted this often goes unbound
    int    learning_batch_size         = 1000;

    // ===================== duplicates ===================== //
    double duplicate_distance_meters   = 25.0;
    double merge_review_threshold      = 0.6;
    double merge_auto_apply_threshold  = 0.95;
    bool   auto_apply_merges           = false;

    // ===================== orphans ===================== //
    double orphan_max_distance_meters  = 50.0;
    int    orphan_batch_size           = 500;

    // ===================== validation ===================== //
    double min_accept_radius_meters    = 30.0;
    double out_of_range_factor         = 3.0;

    // ===================== methods ===================== //

    // Empty when the configuration is usable
    std::vector<std::string> validate() const;
    bool isValid() const { return validate().empty(); }

    nlohmann::json toJson() const;
    // Missing keys keep the values of `base`
    static AdaptiveThresholdConfig fromJson(const nlohmann::json& j,
                                            const AdaptiveThresholdConfig& base);
    static AdaptiveThresholdConfig fromJson(const nlohmann::json& j) {
        return fromJson(j, AdaptiveThresholdConfig{});
    }
};

} // namespace gatesense
