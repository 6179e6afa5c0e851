#include "gatesense/config/ThresholdConfig.h"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace gatesense {

std::vector<std::string> AdaptiveThresholdConfig::validate() const {
    std::vector<std::string> errors;
    auto require = [&](bool ok, const char* message) { if (!ok) errors.emplace_back(message); };

    require(soft_threshold > 0.0 && soft_threshold <= 1.0, "soft_threshold must be in (0,1]");
    require(hard_threshold > 0.0 && hard_threshold <= 1.0, "hard_threshold must be in (0,1]");
    require(soft_threshold < hard_threshold, "soft_threshold must be lower than hard_threshold");

    require(min_samples_for_gate >= 1, "min_samples_for_gate must be positive");
    require(min_effective_samples >= 1, "min_effective_samples must be positive");
    require(max_spatial_variance_m2 > 0.0, "max_spatial_variance_m2 must be positive");
    require(cluster_epsilon_meters > 0.0, "cluster_epsilon_meters must be positive");
    require(min_quality_weight >= 0.0 && min_quality_weight <= 1.0, "min_quality_weight must be in [0,1]");
    require(discovery_window_hours > 0.0 && discovery_window_hours <= 8760.0,
            "discovery_window_hours must be in (0,8760]");
    require(max_cluster_input >= 1, "max_cluster_input must be positive");
    require(gate_match_tolerance_meters > 0.0, "gate_match_tolerance_meters must be positive");

    require(confidence_prior_samples >= 0.0, "confidence_prior_samples must not be negative");
    require(demotion_violation_count >= 1, "demotion_violation_count must be positive");
    require(demotion_violation_rate >= 0.0 && demotion_violation_rate <= 1.0, "demotion_violation_rate must be in [0,1]");
    require(max_demotions >= 1, "max_demotions must be positive");
    require(learning_batch_size >= 1, "learning_batch_size must be positive");

    require(duplicate_distance_meters > 0.0, "duplicate_distance_meters must be positive");
    require(merge_review_threshold > 0.0 && merge_review_threshold <= 1.0, "merge_review_threshold must be in (0,1]");
    require(merge_auto_apply_threshold > 0.0 && merge_auto_apply_threshold <= 1.0, "merge_auto_apply_threshold must be in (0,1]");
    require(merge_review_threshold <= merge_auto_apply_threshold, "merge_review_threshold must not exceed merge_auto_apply_threshold");

    require(orphan_max_distance_meters > 0.0, "orphan_max_distance_meters must be positive");
    require(orphan_batch_size >= 1, "orphan_batch_size must be positive");
    require(min_accept_radius_meters > 0.0, "min_accept_radius_meters must be positive");
    require(out_of_range_factor >= 1.0, "out_of_range_factor must be at least 1");
    return errors;
}

json AdaptiveThresholdConfig::toJson() const {
    return json{
        {"min_samples_for_gate", min_samples_for_gate},
        {"max_spatial_variance_m2", max_spatial_variance_m2},
        {"cluster_epsilon_meters", cluster_epsilon_meters},
        {"min_quality_weight", min_quality_weight},
        {"discovery_window_hours", discovery_window_hours},
        {"max_cluster_input", max_cluster_input},
        {"gate_match_tolerance_meters", gate_match_tolerance_meters},
        {"soft_threshold", soft_threshold},
        {"hard_threshold", hard_threshold},
        {"min_effective_samples", min_effective_samples},
        {"confidence_prior_samples", confidence_prior_samples},
        {"demotion_violation_count", demotion_violation_count},
        {"demotion_violation_rate", demotion_violation_rate},
        {"max_demotions", max_demotions},
        {"learning_batch_size", learning_batch_size},
        {"duplicate_distance_meters", duplicate_distance_meters},
        {"merge_review_threshold", merge_review_threshold},
        {"merge_auto_apply_threshold", merge_auto_apply_threshold},
        {"auto_apply_merges", auto_apply_merges},
        {"orphan_max_distance_meters", orphan_max_distance_meters},
        {"orphan_batch_size", orphan_batch_size},
        {"min_accept_radius_meters", min_accept_radius_meters},
        {"out_of_range_factor", out_of_range_factor}
    };
}

AdaptiveThresholdConfig AdaptiveThresholdConfig::fromJson(const json& r, const AdaptiveThresholdConfig& base) {
    AdaptiveThresholdConfig c = base;
    if (!r.is_object()) return c;

    auto get_i = [&](const char* k, int& v){ if (r.contains(k)) v = r[k].get<int>(); };
    auto get_d = [&](const char* k, double& v){ if (r.contains(k)) v = r[k].get<double>(); };
    auto get_b = [&](const char* k, bool& v){ if (r.contains(k)) v = r[k].get<bool>(); };

    get_i("min_samples_for_gate", c.min_samples_for_gate);
    get_d("max_spatial_variance_m2", c.max_spatial_variance_m2);
    get_d("cluster_epsilon_meters", c.cluster_epsilon_meters);
    get_d("min_quality_weight", c.min_quality_weight);
    get_d("discovery_window_hours", c.discovery_window_hours);
    get_i("max_cluster_input", c.max_cluster_input);
    get_d("gate_match_tolerance_meters", c.gate_match_tolerance_meters);

    get_d("soft_threshold", c.soft_threshold);
    get_d("hard_threshold", c.hard_threshold);
    get_i("min_effective_samples", c.min_effective_samples);
    get_d("confidence_prior_samples", c.confidence_prior_samples);
    get_i("demotion_violation_count", c.demotion_violation_count);
    get_d("demotion_violation_rate", c.demotion_violation_rate);
    get_i("max_demotions", c.max_demotions);
    get_i("learning_batch_size", c.learning_batch_size);

    get_d("duplicate_distance_meters", c.duplicate_distance_meters);
    get_d("merge_review_threshold", c.merge_review_threshold);
    get_d("merge_auto_apply_threshold", c.merge_auto_apply_threshold);
    get_b("auto_apply_merges", c.auto_apply_merges);

    get_d("orphan_max_distance_meters", c.orphan_max_distance_meters);
    get_i("orphan_batch_size", c.orphan_batch_size);
    get_d("min_accept_radius_meters", c.min_accept_radius_meters);
    get_d("out_of_range_factor", c.out_of_range_factor);
    return c;
}

} // namespace gatesense
