// Replays a JSONL file of check-ins through the engine and prints the outcome.
//
//   gatesense_cli <scans.jsonl> [--db <path>] [--config <gatesense.yml>] [--dry-run]
//
// Each line is one check-in in the wire format of the "ingest" message.
#include "gatesense/config/ServiceConfig.h"
#include "gatesense/pipeline/GateService.h"
#include "gatesense/serialization.hpp"
#include "../src/db_core/GateDatabase.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <iostream>
#include <set>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;

static void usage() {
    std::cout << "usage: gatesense_cli <scans.jsonl> [--db <path>] [--config <gatesense.yml>] [--dry-run]" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string jsonl_path;
    std::string db_path = ":memory:";
    std::string config_path;
    bool dry_run = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) db_path = argv[++i];
        else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--dry-run") dry_run = true;
        else if (arg == "-h" || arg == "--help") { usage(); return 0; }
        else if (jsonl_path.empty()) jsonl_path = arg;
        else { usage(); return 2; }
    }
    if (jsonl_path.empty()) { usage(); return 2; }

    if (!fs::exists(jsonl_path) || !fs::is_regular_file(jsonl_path)) {
        std::cerr << "[CLI] Error: JSONL file not found: " << jsonl_path << std::endl;
        return 1;
    }
    std::ifstream file(jsonl_path);
    if (!file.is_open()) {
        std::cerr << "[CLI] Error: Failed to open JSONL file: " << jsonl_path << std::endl;
        return 1;
    }

    gatesense::ServiceConfig config;
    if (!config_path.empty()) config = gatesense::ServiceConfig::fromYaml(config_path);
    config.db_path = db_path;

    std::unique_ptr<gatesense::GateDatabase> db;
    try {
        db = std::make_unique<gatesense::GateDatabase>(config.db_path);
    } catch (const std::exception& e) {
        std::cerr << "[CLI] Error: cannot open database " << config.db_path << ": " << e.what() << std::endl;
        return 1;
    }
    if (!db->initialize()) return 1;

    gatesense::GateService service(*db, config);
    service.start();

    std::set<std::string> sessions;
    std::string line;
    int line_no = 0;
    int ingested = 0;
    int rejected = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            const auto input = gatesense::checkinFromJson(json::parse(line));
            service.ingest(input);
            sessions.insert(input.session_id);
            ++ingested;
        } catch (const json::exception& e) {
            std::cerr << "[CLI] Line " << line_no << ": failed to parse: " << e.what() << std::endl;
            ++rejected;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[CLI] Line " << line_no << ": rejected: " << e.what() << std::endl;
            ++rejected;
        } catch (const std::runtime_error& e) {
            std::cerr << "[CLI] Line " << line_no << ": storage failure: " << e.what() << std::endl;
            return 1;
        }
    }
    std::cout << "[CLI] Ingested " << ingested << " check-ins (" << rejected << " rejected) from " << jsonl_path << std::endl;

    service.waitIdle();
    service.stop();
    const auto stats = service.schedulerStats();
    std::cout << "[CLI] Background cycles: " << stats.completed << " completed, " << stats.failed << " failed, "
              << stats.skipped_busy << " skipped" << std::endl;

    json out = json::object();
    try {
        for (const auto& session_id : sessions) {
            json s;
            s["discovery"] = service.runDiscoveryCycle(session_id, dry_run);
            if (!dry_run) {
                s["enforcement"] = service.runEnforcementCycle(session_id);
                s["duplicates"] = service.runDuplicateDetection(session_id);
            }
            s["gates"] = service.listGates(session_id);
            s["gate_health"] = service.gateHealth(session_id);
            s["quality"] = service.qualityReport(session_id);
            out[session_id] = s;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CLI] Error: cycle failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}
