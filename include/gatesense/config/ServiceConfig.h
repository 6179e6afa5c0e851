#pragma once
#include <string>
#include "ThresholdConfig.h"

namespace gatesense {

// Process-wide settings, loaded once at startup (gatesense.yml)
struct ServiceConfig {
    std::string db_path        = "out/gatesense.db";
    std::string ws_host        = "127.0.0.1";
    int         ws_port        = 12345;
    int         tick_interval_ms = 60000;   // timer-driven cycles for every active session
    int         worker_threads = 2;

    // discovery milestones, counted in quality-accepted scans
    int first_discovery_at   = 50;
    int discovery_refresh_every = 100;

    // applied to sessions without stored thresholds
    AdaptiveThresholdConfig default_thresholds;

    static ServiceConfig fromYaml(const std::string& yaml_path);
    static ServiceConfig fromJson(const std::string& json_path);
};

} // namespace gatesense
