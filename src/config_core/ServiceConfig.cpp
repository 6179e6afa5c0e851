#include "gatesense/config/ServiceConfig.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>

using nlohmann::json;

namespace gatesense {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

static void readThresholds(const YAML::Node& t, AdaptiveThresholdConfig& c) {
    try_get(t, "min_samples_for_gate", c.min_samples_for_gate);
    try_get(t, "max_spatial_variance_m2", c.max_spatial_variance_m2);
    try_get(t, "cluster_epsilon_meters", c.cluster_epsilon_meters);
    try_get(t, "min_quality_weight", c.min_quality_weight);
    try_get(t, "discovery_window_hours", c.discovery_window_hours);
    try_get(t, "max_cluster_input", c.max_cluster_input);
    try_get(t, "gate_match_tolerance_meters", c.gate_match_tolerance_meters);

    try_get(t, "soft_threshold", c.soft_threshold);
    try_get(t, "hard_threshold", c.hard_threshold);
    try_get(t, "min_effective_samples", c.min_effective_samples);
    try_get(t, "confidence_prior_samples", c.confidence_prior_samples);
    try_get(t, "demotion_violation_count", c.demotion_violation_count);
    try_get(t, "demotion_violation_rate", c.demotion_violation_rate);
    try_get(t, "max_demotions", c.max_demotions);
    try_get(t, "learning_batch_size", c.learning_batch_size);

    try_get(t, "duplicate_distance_meters", c.duplicate_distance_meters);
    try_get(t, "merge_review_threshold", c.merge_review_threshold);
    try_get(t, "merge_auto_apply_threshold", c.merge_auto_apply_threshold);
    try_get(t, "auto_apply_merges", c.auto_apply_merges);

    try_get(t, "orphan_max_distance_meters", c.orphan_max_distance_meters);
    try_get(t, "orphan_batch_size", c.orphan_batch_size);
    try_get(t, "min_accept_radius_meters", c.min_accept_radius_meters);
    try_get(t, "out_of_range_factor", c.out_of_range_factor);
}

ServiceConfig ServiceConfig::fromYaml(const std::string& yaml_path) {
    ServiceConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "db_path", c.db_path);
        try_get(r, "ws_host", c.ws_host);
        try_get(r, "ws_port", c.ws_port);
        try_get(r, "tick_interval_ms", c.tick_interval_ms);
        try_get(r, "worker_threads", c.worker_threads);
        try_get(r, "first_discovery_at", c.first_discovery_at);
        try_get(r, "discovery_refresh_every", c.discovery_refresh_every);
        if (r["thresholds"]) readThresholds(r["thresholds"], c.default_thresholds);
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Failed to load " << yaml_path << ", keeping defaults: " << e.what() << std::endl;
        return ServiceConfig{};
    }

    auto errors = c.default_thresholds.validate();
    if (!errors.empty()) {
        std::cerr << "[Config] Invalid default thresholds in " << yaml_path << ": " << errors.front()
                  << ", keeping built-in thresholds" << std::endl;
        c.default_thresholds = AdaptiveThresholdConfig{};
    }
    return c;
}

ServiceConfig ServiceConfig::fromJson(const std::string& json_path) {
    ServiceConfig c;
    try {
        std::ifstream ifs(json_path);
        if (!ifs.is_open()) {
            std::cerr << "[Config] Cannot open " << json_path << ", keeping defaults" << std::endl;
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if (r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if (r.contains(k)) v = r[k].get<int>(); };

        get_s("db_path", c.db_path);
        get_s("ws_host", c.ws_host);
        get_i("ws_port", c.ws_port);
        get_i("tick_interval_ms", c.tick_interval_ms);
        get_i("worker_threads", c.worker_threads);
        get_i("first_discovery_at", c.first_discovery_at);
        get_i("discovery_refresh_every", c.discovery_refresh_every);
        if (r.contains("thresholds")) {
            c.default_thresholds = AdaptiveThresholdConfig::fromJson(r["thresholds"]);
        }
    } catch (const json::exception& e) {
        std::cerr << "[Config] Failed to parse " << json_path << ", keeping defaults: " << e.what() << std::endl;
        return ServiceConfig{};
    }

    auto errors = c.default_thresholds.validate();
    if (!errors.empty()) {
        std::cerr << "[Config] Invalid default thresholds in " << json_path << ": " << errors.front()
                  << ", keeping built-in thresholds" << std::endl;
        c.default_thresholds = AdaptiveThresholdConfig{};
    }
    return c;
}

} // namespace gatesense
