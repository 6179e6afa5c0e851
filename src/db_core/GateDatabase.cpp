#include "GateDatabase.h"
#include "DatabaseSchemas.h"
#include "TimeUtils.h"
#include <algorithm>
#include <iostream>

namespace gatesense {

namespace {

const char* kCheckinColumns =
    "event_id, session_id, wristband_id, category, timestamp, has_location, lat, lon, accuracy_m, "
    "quality_weight, gate_id, outcome, learned";

const char* kGateColumns =
    "gate_id, session_id, name, lat, lon, derivation, health_score, status, spatial_variance_m2, "
    "sample_count, first_seen, last_seen, anchor_lat_key, anchor_lon_key, merged_into";

const char* kBindingColumns =
    "gate_id, category, session_id, sample_count, confidence, status, violation_count, "
    "last_violation_at, demotion_count, updated_at";

const char* kSuggestionColumns =
    "suggestion_id, session_id, source_gate_id, target_gate_id, distance_m, traffic_similarity, "
    "category_similarity, confidence, status, reviewed_by, review_reason, reviewed_at, created_at";

std::string textOrEmpty(const SQLite::Column& c) {
    return c.isNull() ? std::string() : c.getString();
}

CheckinEvent readCheckin(SQLite::Statement& q) {
    CheckinEvent e;
    e.id           = q.getColumn(0).getInt64();
    e.session_id   = q.getColumn(1).getString();
    e.wristband_id = q.getColumn(2).getString();
    e.category     = q.getColumn(3).getString();
    e.timestamp    = q.getColumn(4).getString();
    if (q.getColumn(5).getInt() != 0) {
        ScanLocation loc;
        loc.lat = q.getColumn(6).getDouble();
        loc.lon = q.getColumn(7).getDouble();
        if (!q.getColumn(8).isNull()) loc.accuracy_m = q.getColumn(8).getDouble();
        e.location = loc;
    }
    e.quality_weight = q.getColumn(9).getDouble();
    if (!q.getColumn(10).isNull()) e.gate_id = q.getColumn(10).getInt64();
    parseOutcome(q.getColumn(11).getString(), e.outcome);
    e.learned = q.getColumn(12).getInt() != 0;
    return e;
}

Gate readGate(SQLite::Statement& q) {
    Gate g;
    g.id           = q.getColumn(0).getInt64();
    g.session_id   = q.getColumn(1).getString();
    g.name         = q.getColumn(2).getString();
    g.centroid.lat = q.getColumn(3).getDouble();
    g.centroid.lon = q.getColumn(4).getDouble();
    parseDerivation(q.getColumn(5).getString(), g.derivation);
    g.health_score = q.getColumn(6).getInt();
    parseGateStatus(q.getColumn(7).getString(), g.status);
    g.spatial_variance_m2 = q.getColumn(8).getDouble();
    g.sample_count   = q.getColumn(9).getInt();
    g.first_seen     = textOrEmpty(q.getColumn(10));
    g.last_seen      = textOrEmpty(q.getColumn(11));
    g.anchor_lat_key = q.getColumn(12).getInt64();
    g.anchor_lon_key = q.getColumn(13).getInt64();
    if (!q.getColumn(14).isNull()) g.merged_into = q.getColumn(14).getInt64();
    return g;
}

CategoryBinding readBinding(SQLite::Statement& q) {
    CategoryBinding b;
    b.gate_id      = q.getColumn(0).getInt64();
    b.category     = q.getColumn(1).getString();
    b.session_id   = q.getColumn(2).getString();
    b.sample_count = q.getColumn(3).getInt();
    b.confidence   = q.getColumn(4).getDouble();
    parseBindingStatus(q.getColumn(5).getString(), b.status);
    b.violation_count   = q.getColumn(6).getInt();
    b.last_violation_at = textOrEmpty(q.getColumn(7));
    b.demotion_count    = q.getColumn(8).getInt();
    b.updated_at        = textOrEmpty(q.getColumn(9));
    return b;
}

MergeSuggestion readSuggestion(SQLite::Statement& q) {
    MergeSuggestion s;
    s.id                  = q.getColumn(0).getInt64();
    s.session_id          = q.getColumn(1).getString();
    s.source_gate_id      = q.getColumn(2).getInt64();
    s.target_gate_id      = q.getColumn(3).getInt64();
    s.distance_m          = q.getColumn(4).getDouble();
    s.traffic_similarity  = q.getColumn(5).getDouble();
    s.category_similarity = q.getColumn(6).getDouble();
    s.confidence          = q.getColumn(7).getDouble();
    parseMergeStatus(q.getColumn(8).getString(), s.status);
    s.audit.reviewed_by = textOrEmpty(q.getColumn(9));
    s.audit.reason      = textOrEmpty(q.getColumn(10));
    s.audit.reviewed_at = textOrEmpty(q.getColumn(11));
    s.created_at        = q.getColumn(12).getString();
    return s;
}

void bindOptionalText(SQLite::Statement& q, int index, const std::string& value) {
    if (value.empty()) q.bind(index);
    else q.bind(index, value);
}

} // namespace

GateDatabase::GateDatabase(const std::string& db_path) : db_path_(db_path) {
    try {
        database_ = std::make_unique<SQLite::Database>(db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        database_->setBusyTimeout(5000);
        if (db_path != ":memory:") {
            database_->exec("PRAGMA journal_mode=WAL");
        }
        std::cout << "[DB] Database opened: " << db_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Failed to open database " << db_path << ": " << e.what() << std::endl;
        throw;
    }
}

bool GateDatabase::initialize() {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        return createTables();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Database initialization failed: " << e.what() << std::endl;
        return false;
    }
}

bool GateDatabase::createTables() {
    try {
        database_->exec(DatabaseSchemas::CREATE_SESSIONS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_CHECKIN_EVENTS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_GATES_TABLE);
        database_->exec(DatabaseSchemas::CREATE_CATEGORY_BINDINGS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_BINDING_TRANSITIONS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_MERGE_SUGGESTIONS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_ADAPTIVE_THRESHOLDS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_CYCLE_CHECKPOINTS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_SYSTEM_LOGS_TABLE);
        database_->exec(DatabaseSchemas::CREATE_INDEXES);
        std::cout << "[DB] All tables created successfully." << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Table creation failed: " << e.what() << std::endl;
        return false;
    }
}

// ============================ sessions ============================ //

bool GateDatabase::ensureSession(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "INSERT OR IGNORE INTO sessions (session_id, is_active) VALUES (?, 1)");
        query.bind(1, session_id);
        query.exec();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Ensure session failed: " << e.what() << std::endl;
        return false;
    }
}

bool GateDatabase::setSessionActive(const std::string& session_id, bool active) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "UPDATE sessions SET is_active = ? WHERE session_id = ?");
        query.bind(1, active ? 1 : 0);
        query.bind(2, session_id);
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Set session active failed: " << e.what() << std::endl;
        return false;
    }
}

bool GateDatabase::isSessionActive(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "SELECT is_active FROM sessions WHERE session_id = ?");
        query.bind(1, session_id);
        if (query.executeStep()) {
            return query.getColumn(0).getInt() != 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Session lookup failed: " << e.what() << std::endl;
    }
    return false;
}

bool GateDatabase::sessionExists(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "SELECT 1 FROM sessions WHERE session_id = ?");
        query.bind(1, session_id);
        return query.executeStep();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Session lookup failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<std::string> GateDatabase::getActiveSessions() {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<std::string> sessions;
    try {
        SQLite::Statement query(*database_, "SELECT session_id FROM sessions WHERE is_active = 1 ORDER BY session_id");
        while (query.executeStep()) {
            sessions.push_back(query.getColumn(0).getString());
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get active sessions failed: " << e.what() << std::endl;
    }
    return sessions;
}

// ============================ check-in events ============================ //

std::optional<int64_t> GateDatabase::insertCheckin(const CheckinEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            INSERT INTO checkin_events
                (session_id, wristband_id, category, timestamp, has_location, lat, lon, accuracy_m,
                 quality_weight, gate_id, outcome, learned)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0)
        )");
        query.bind(1, event.session_id);
        query.bind(2, event.wristband_id);
        query.bind(3, event.category);
        query.bind(4, event.timestamp);
        if (event.location) {
            query.bind(5, 1);
            query.bind(6, event.location->lat);
            query.bind(7, event.location->lon);
            if (event.location->accuracy_m) query.bind(8, *event.location->accuracy_m);
            else query.bind(8);
        } else {
            query.bind(5, 0);
            query.bind(6);
            query.bind(7);
            query.bind(8);
        }
        query.bind(9, event.quality_weight);
        if (event.gate_id) query.bind(10, static_cast<int64_t>(*event.gate_id));
        else query.bind(10);
        query.bind(11, toString(event.outcome));

        if (query.exec() != 1) return std::nullopt;
        return database_->getLastInsertRowid();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Insert check-in failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<CheckinEvent> GateDatabase::getCheckin(int64_t event_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            std::string("SELECT ") + kCheckinColumns + " FROM checkin_events WHERE event_id = ?");
        query.bind(1, static_cast<int64_t>(event_id));
        if (query.executeStep()) {
            return readCheckin(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get check-in failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<CheckinEvent> GateDatabase::getClusterInput(const std::string& session_id,
                                                        const std::string& since,
                                                        double min_quality_weight,
                                                        int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CheckinEvent> events;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kCheckinColumns + R"(
            FROM checkin_events
            WHERE session_id = ?
              AND outcome = 'success'
              AND has_location = 1
              AND quality_weight >= ?
              AND timestamp >= ?
            ORDER BY timestamp DESC, event_id DESC
            LIMIT ?
        )");
        query.bind(1, session_id);
        query.bind(2, min_quality_weight);
        query.bind(3, since);
        query.bind(4, limit);
        while (query.executeStep()) {
            events.push_back(readCheckin(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get cluster input failed: " << e.what() << std::endl;
    }
    return events;
}

int64_t GateDatabase::countAcceptedScans(const std::string& session_id, double min_quality_weight) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            SELECT COUNT(*) FROM checkin_events
            WHERE session_id = ? AND outcome = 'success' AND has_location = 1 AND quality_weight >= ?
        )");
        query.bind(1, session_id);
        query.bind(2, min_quality_weight);
        if (query.executeStep()) {
            return query.getColumn(0).getInt64();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Count accepted scans failed: " << e.what() << std::endl;
    }
    return 0;
}

std::optional<std::string> GateDatabase::latestScanTime(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "SELECT MAX(timestamp) FROM checkin_events WHERE session_id = ?");
        query.bind(1, session_id);
        if (query.executeStep() && !query.getColumn(0).isNull()) {
            return query.getColumn(0).getString();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Latest scan time failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<CheckinEvent> GateDatabase::getOrphans(const std::string& session_id, int64_t after_id, int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CheckinEvent> events;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kCheckinColumns + R"(
            FROM checkin_events
            WHERE session_id = ?
              AND outcome = 'success'
              AND gate_id IS NULL
              AND has_location = 1
              AND quality_weight > 0
              AND event_id > ?
            ORDER BY event_id
            LIMIT ?
        )");
        query.bind(1, session_id);
        query.bind(2, static_cast<int64_t>(after_id));
        query.bind(3, limit);
        while (query.executeStep()) {
            events.push_back(readCheckin(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get orphans failed: " << e.what() << std::endl;
    }
    return events;
}

bool GateDatabase::assignGate(int64_t event_id, int64_t gate_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "UPDATE checkin_events SET gate_id = ? WHERE event_id = ? AND gate_id IS NULL");
        query.bind(1, static_cast<int64_t>(gate_id));
        query.bind(2, static_cast<int64_t>(event_id));
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Assign gate failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<CheckinEvent> GateDatabase::getUnlearned(const std::string& session_id, int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CheckinEvent> events;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kCheckinColumns + R"(
            FROM checkin_events
            WHERE session_id = ?
              AND learned = 0
              AND outcome = 'success'
              AND gate_id IS NOT NULL
            ORDER BY event_id
            LIMIT ?
        )");
        query.bind(1, session_id);
        query.bind(2, limit);
        while (query.executeStep()) {
            events.push_back(readCheckin(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get unlearned check-ins failed: " << e.what() << std::endl;
    }
    return events;
}

bool GateDatabase::markLearned(int64_t event_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "UPDATE checkin_events SET learned = 1 WHERE event_id = ? AND learned = 0");
        query.bind(1, static_cast<int64_t>(event_id));
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Mark learned failed: " << e.what() << std::endl;
        return false;
    }
}

int GateDatabase::repointCheckins(int64_t from_gate_id, int64_t to_gate_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "UPDATE checkin_events SET gate_id = ? WHERE gate_id = ?");
        query.bind(1, static_cast<int64_t>(to_gate_id));
        query.bind(2, static_cast<int64_t>(from_gate_id));
        return query.exec();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Re-point check-ins failed: " << e.what() << std::endl;
        return -1;
    }
}

int GateDatabase::countCheckinsForGate(int64_t gate_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "SELECT COUNT(*) FROM checkin_events WHERE gate_id = ?");
        query.bind(1, static_cast<int64_t>(gate_id));
        if (query.executeStep()) {
            return query.getColumn(0).getInt();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Count gate check-ins failed: " << e.what() << std::endl;
    }
    return 0;
}

std::map<int64_t, GateTraffic> GateDatabase::getGateTraffic(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::map<int64_t, GateTraffic> traffic;
    try {
        SQLite::Statement hourly(*database_, R"(
            SELECT gate_id, CAST(strftime('%H', timestamp) AS INTEGER) AS hour, COUNT(*)
            FROM checkin_events
            WHERE session_id = ? AND outcome = 'success' AND gate_id IS NOT NULL
            GROUP BY gate_id, hour
        )");
        hourly.bind(1, session_id);
        while (hourly.executeStep()) {
            int64_t gate_id = hourly.getColumn(0).getInt64();
            int hour = hourly.getColumn(1).getInt();
            int count = hourly.getColumn(2).getInt();
            GateTraffic& t = traffic[gate_id];
            t.gate_id = gate_id;
            t.total += count;
            if (hour >= 0 && hour < 24) t.hourly[hour] += count;
        }

        SQLite::Statement categories(*database_, R"(
            SELECT gate_id, category, COUNT(*)
            FROM checkin_events
            WHERE session_id = ? AND outcome = 'success' AND gate_id IS NOT NULL
            GROUP BY gate_id, category
        )");
        categories.bind(1, session_id);
        while (categories.executeStep()) {
            GateTraffic& t = traffic[categories.getColumn(0).getInt64()];
            t.categories[categories.getColumn(1).getString()] = categories.getColumn(2).getInt();
        }

        SQLite::Statement last(*database_, R"(
            SELECT gate_id, MAX(timestamp)
            FROM checkin_events
            WHERE session_id = ? AND outcome = 'success' AND gate_id IS NOT NULL
            GROUP BY gate_id
        )");
        last.bind(1, session_id);
        while (last.executeStep()) {
            traffic[last.getColumn(0).getInt64()].last_scan_at = last.getColumn(1).getString();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get gate traffic failed: " << e.what() << std::endl;
    }
    return traffic;
}

GpsQualityStats GateDatabase::getQualityStats(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    GpsQualityStats stats;
    try {
        SQLite::Statement query(*database_, R"(
            SELECT COUNT(*),
                   SUM(CASE WHEN has_location = 1 THEN 1 ELSE 0 END),
                   SUM(CASE WHEN quality_weight > 0 THEN 1 ELSE 0 END),
                   AVG(accuracy_m), MIN(accuracy_m), MAX(accuracy_m),
                   SUM(CASE WHEN accuracy_m <= 10 THEN 1 ELSE 0 END),
                   SUM(CASE WHEN accuracy_m > 10 AND accuracy_m <= 20 THEN 1 ELSE 0 END),
                   SUM(CASE WHEN accuracy_m > 20 AND accuracy_m <= 50 THEN 1 ELSE 0 END),
                   SUM(CASE WHEN accuracy_m > 50 THEN 1 ELSE 0 END)
            FROM checkin_events
            WHERE session_id = ? AND outcome = 'success'
        )");
        query.bind(1, session_id);
        if (query.executeStep()) {
            // SUM/AVG over zero rows are NULL; getInt()/getDouble() read NULL as 0
            stats.total          = query.getColumn(0).getInt();
            stats.with_location  = query.getColumn(1).getInt();
            stats.usable         = query.getColumn(2).getInt();
            stats.avg_accuracy_m = query.getColumn(3).getDouble();
            stats.min_accuracy_m = query.getColumn(4).getDouble();
            stats.max_accuracy_m = query.getColumn(5).getDouble();
            stats.excellent      = query.getColumn(6).getInt();
            stats.good           = query.getColumn(7).getInt();
            stats.fair           = query.getColumn(8).getInt();
            stats.poor           = query.getColumn(9).getInt();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get quality stats failed: " << e.what() << std::endl;
    }
    return stats;
}

// ============================ gates ============================ //

namespace {

void bindGate(SQLite::Statement& q, const Gate& g) {
    q.bind(1, g.session_id);
    q.bind(2, g.name);
    q.bind(3, g.centroid.lat);
    q.bind(4, g.centroid.lon);
    q.bind(5, toString(g.derivation));
    q.bind(6, g.health_score);
    q.bind(7, toString(g.status));
    q.bind(8, g.spatial_variance_m2);
    q.bind(9, g.sample_count);
    bindOptionalText(q, 10, g.first_seen);
    bindOptionalText(q, 11, g.last_seen);
    q.bind(12, static_cast<int64_t>(g.anchor_lat_key));
    q.bind(13, static_cast<int64_t>(g.anchor_lon_key));
    if (g.merged_into) q.bind(14, static_cast<int64_t>(*g.merged_into));
    else q.bind(14);
}

const char* kGateInsertTail = R"(
    INTO gates (session_id, name, lat, lon, derivation, health_score, status, spatial_variance_m2,
                sample_count, first_seen, last_seen, anchor_lat_key, anchor_lon_key, merged_into)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

} // namespace

std::optional<int64_t> GateDatabase::insertGateIfAbsent(const Gate& gate) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("INSERT OR IGNORE") + kGateInsertTail);
        bindGate(query, gate);
        if (query.exec() != 1) return std::nullopt;
        return database_->getLastInsertRowid();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Insert gate failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<int64_t> GateDatabase::insertGate(const Gate& gate) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("INSERT") + kGateInsertTail);
        bindGate(query, gate);
        if (query.exec() != 1) return std::nullopt;
        return database_->getLastInsertRowid();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Insert gate failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<Gate> GateDatabase::getGate(int64_t gate_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kGateColumns + " FROM gates WHERE gate_id = ?");
        query.bind(1, static_cast<int64_t>(gate_id));
        if (query.executeStep()) {
            return readGate(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get gate failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<Gate> GateDatabase::getGateByAnchor(const std::string& session_id, int64_t lat_key, int64_t lon_key) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kGateColumns +
            " FROM gates WHERE session_id = ? AND anchor_lat_key = ? AND anchor_lon_key = ?");
        query.bind(1, session_id);
        query.bind(2, static_cast<int64_t>(lat_key));
        query.bind(3, static_cast<int64_t>(lon_key));
        if (query.executeStep()) {
            return readGate(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get gate by anchor failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<Gate> GateDatabase::getGates(const std::string& session_id, bool active_only) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<Gate> gates;
    try {
        std::string sql = std::string("SELECT ") + kGateColumns + " FROM gates WHERE session_id = ?";
        if (active_only) sql += " AND status = 'active'";
        sql += " ORDER BY gate_id";
        SQLite::Statement query(*database_, sql);
        query.bind(1, session_id);
        while (query.executeStep()) {
            gates.push_back(readGate(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get gates failed: " << e.what() << std::endl;
    }
    return gates;
}

bool GateDatabase::updateGate(const Gate& gate) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            UPDATE gates SET name = ?, lat = ?, lon = ?, health_score = ?, status = ?,
                             spatial_variance_m2 = ?, sample_count = ?, first_seen = ?, last_seen = ?,
                             merged_into = ?
            WHERE gate_id = ?
        )");
        query.bind(1, gate.name);
        query.bind(2, gate.centroid.lat);
        query.bind(3, gate.centroid.lon);
        query.bind(4, gate.health_score);
        query.bind(5, toString(gate.status));
        query.bind(6, gate.spatial_variance_m2);
        query.bind(7, gate.sample_count);
        bindOptionalText(query, 8, gate.first_seen);
        bindOptionalText(query, 9, gate.last_seen);
        if (gate.merged_into) query.bind(10, static_cast<int64_t>(*gate.merged_into));
        else query.bind(10);
        query.bind(11, static_cast<int64_t>(gate.id));
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Update gate failed: " << e.what() << std::endl;
        return false;
    }
}

// ============================ category bindings ============================ //

std::optional<CategoryBinding> GateDatabase::getBinding(int64_t gate_id, const std::string& category) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kBindingColumns +
            " FROM category_bindings WHERE gate_id = ? AND category = ?");
        query.bind(1, static_cast<int64_t>(gate_id));
        query.bind(2, category);
        if (query.executeStep()) {
            return readBinding(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get binding failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool GateDatabase::upsertBinding(const CategoryBinding& binding) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            INSERT OR REPLACE INTO category_bindings
                (gate_id, category, session_id, sample_count, confidence, status, violation_count,
                 last_violation_at, demotion_count, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        query.bind(1, static_cast<int64_t>(binding.gate_id));
        query.bind(2, binding.category);
        query.bind(3, binding.session_id);
        query.bind(4, binding.sample_count);
        query.bind(5, binding.confidence);
        query.bind(6, toString(binding.status));
        query.bind(7, binding.violation_count);
        bindOptionalText(query, 8, binding.last_violation_at);
        query.bind(9, binding.demotion_count);
        query.bind(10, binding.updated_at.empty() ? TimeUtils::getCurrentTimestamp() : binding.updated_at);
        return query.exec() >= 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Upsert binding failed: " << e.what() << std::endl;
        return false;
    }
}

bool GateDatabase::deleteBinding(int64_t gate_id, const std::string& category) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "DELETE FROM category_bindings WHERE gate_id = ? AND category = ?");
        query.bind(1, static_cast<int64_t>(gate_id));
        query.bind(2, category);
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Delete binding failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<CategoryBinding> GateDatabase::getBindingsForGate(int64_t gate_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CategoryBinding> bindings;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kBindingColumns +
            " FROM category_bindings WHERE gate_id = ? ORDER BY category");
        query.bind(1, static_cast<int64_t>(gate_id));
        while (query.executeStep()) {
            bindings.push_back(readBinding(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get gate bindings failed: " << e.what() << std::endl;
    }
    return bindings;
}

std::vector<CategoryBinding> GateDatabase::getBindingsForSession(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CategoryBinding> bindings;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kBindingColumns +
            " FROM category_bindings WHERE session_id = ? ORDER BY gate_id, category");
        query.bind(1, session_id);
        while (query.executeStep()) {
            bindings.push_back(readBinding(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get session bindings failed: " << e.what() << std::endl;
    }
    return bindings;
}

std::vector<CategoryBinding> GateDatabase::getBindingsForCategory(const std::string& session_id,
                                                                  const std::string& category) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<CategoryBinding> bindings;
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kBindingColumns +
            " FROM category_bindings WHERE session_id = ? AND category = ? ORDER BY gate_id");
        query.bind(1, session_id);
        query.bind(2, category);
        while (query.executeStep()) {
            bindings.push_back(readBinding(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get category bindings failed: " << e.what() << std::endl;
    }
    return bindings;
}

bool GateDatabase::insertTransition(const std::string& session_id, const BindingTransition& transition) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            INSERT INTO binding_transitions (session_id, gate_id, category, from_status, to_status, reason, timestamp)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        query.bind(1, session_id);
        query.bind(2, static_cast<int64_t>(transition.gate_id));
        query.bind(3, transition.category);
        query.bind(4, toString(transition.from));
        query.bind(5, toString(transition.to));
        query.bind(6, transition.reason);
        query.bind(7, transition.timestamp.empty() ? TimeUtils::getCurrentTimestamp() : transition.timestamp);
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Insert binding transition failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<BindingTransition> GateDatabase::getTransitions(int64_t gate_id, const std::string& category) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<BindingTransition> transitions;
    try {
        SQLite::Statement query(*database_, R"(
            SELECT gate_id, category, from_status, to_status, reason, timestamp
            FROM binding_transitions
            WHERE gate_id = ? AND category = ?
            ORDER BY transition_id
        )");
        query.bind(1, static_cast<int64_t>(gate_id));
        query.bind(2, category);
        while (query.executeStep()) {
            BindingTransition t;
            t.gate_id  = query.getColumn(0).getInt64();
            t.category = query.getColumn(1).getString();
            parseBindingStatus(query.getColumn(2).getString(), t.from);
            parseBindingStatus(query.getColumn(3).getString(), t.to);
            t.reason    = query.getColumn(4).getString();
            t.timestamp = query.getColumn(5).getString();
            transitions.push_back(t);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get binding transitions failed: " << e.what() << std::endl;
    }
    return transitions;
}

// ============================ merge suggestions ============================ //

std::optional<MergeSuggestion> GateDatabase::upsertMergeSuggestion(const MergeSuggestion& s) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        const int64_t lo = std::min(s.source_gate_id, s.target_gate_id);
        const int64_t hi = std::max(s.source_gate_id, s.target_gate_id);

        // terminal rows keep their scores and status
        SQLite::Statement upsert(*database_, R"(
            INSERT INTO merge_suggestions
                (session_id, source_gate_id, target_gate_id, gate_lo, gate_hi, distance_m,
                 traffic_similarity, category_similarity, confidence, status, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 'pending', ?)
            ON CONFLICT(session_id, gate_lo, gate_hi) DO UPDATE SET
                source_gate_id = excluded.source_gate_id,
                target_gate_id = excluded.target_gate_id,
                distance_m = excluded.distance_m,
                traffic_similarity = excluded.traffic_similarity,
                category_similarity = excluded.category_similarity,
                confidence = excluded.confidence
            WHERE merge_suggestions.status = 'pending'
        )");
        upsert.bind(1, s.session_id);
        upsert.bind(2, static_cast<int64_t>(s.source_gate_id));
        upsert.bind(3, static_cast<int64_t>(s.target_gate_id));
        upsert.bind(4, lo);
        upsert.bind(5, hi);
        upsert.bind(6, s.distance_m);
        upsert.bind(7, s.traffic_similarity);
        upsert.bind(8, s.category_similarity);
        upsert.bind(9, s.confidence);
        upsert.bind(10, s.created_at.empty() ? TimeUtils::getCurrentTimestamp() : s.created_at);
        upsert.exec();

        SQLite::Statement query(*database_, std::string("SELECT ") + kSuggestionColumns +
            " FROM merge_suggestions WHERE session_id = ? AND gate_lo = ? AND gate_hi = ?");
        query.bind(1, s.session_id);
        query.bind(2, lo);
        query.bind(3, hi);
        if (query.executeStep()) {
            return readSuggestion(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Upsert merge suggestion failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<MergeSuggestion> GateDatabase::getMergeSuggestion(int64_t suggestion_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, std::string("SELECT ") + kSuggestionColumns +
            " FROM merge_suggestions WHERE suggestion_id = ?");
        query.bind(1, static_cast<int64_t>(suggestion_id));
        if (query.executeStep()) {
            return readSuggestion(query);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get merge suggestion failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<MergeSuggestion> GateDatabase::getMergeSuggestions(const std::string& session_id,
                                                               std::optional<MergeStatus> status) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<MergeSuggestion> suggestions;
    try {
        std::string sql = std::string("SELECT ") + kSuggestionColumns + " FROM merge_suggestions WHERE session_id = ?";
        if (status) sql += " AND status = ?";
        sql += " ORDER BY confidence DESC, suggestion_id";
        SQLite::Statement query(*database_, sql);
        query.bind(1, session_id);
        if (status) query.bind(2, toString(*status));
        while (query.executeStep()) {
            suggestions.push_back(readSuggestion(query));
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get merge suggestions failed: " << e.what() << std::endl;
    }
    return suggestions;
}

bool GateDatabase::resolveSuggestion(int64_t suggestion_id, MergeStatus status, const ReviewAudit& audit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            UPDATE merge_suggestions
            SET status = ?, reviewed_by = ?, review_reason = ?, reviewed_at = ?
            WHERE suggestion_id = ? AND status = 'pending'
        )");
        query.bind(1, toString(status));
        query.bind(2, audit.reviewed_by);
        query.bind(3, audit.reason);
        query.bind(4, audit.reviewed_at.empty() ? TimeUtils::getCurrentTimestamp() : audit.reviewed_at);
        query.bind(5, static_cast<int64_t>(suggestion_id));
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Resolve merge suggestion failed: " << e.what() << std::endl;
        return false;
    }
}

int GateDatabase::rejectPendingForGate(const std::string& session_id, int64_t gate_id, const ReviewAudit& audit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            UPDATE merge_suggestions
            SET status = 'rejected', reviewed_by = ?, review_reason = ?, reviewed_at = ?
            WHERE session_id = ? AND status = 'pending' AND (source_gate_id = ? OR target_gate_id = ?)
        )");
        query.bind(1, audit.reviewed_by);
        query.bind(2, audit.reason);
        query.bind(3, audit.reviewed_at.empty() ? TimeUtils::getCurrentTimestamp() : audit.reviewed_at);
        query.bind(4, session_id);
        query.bind(5, static_cast<int64_t>(gate_id));
        query.bind(6, static_cast<int64_t>(gate_id));
        return query.exec();
    } catch (const std::exception& e) {
        std::cerr << "[DB] Reject pending suggestions failed: " << e.what() << std::endl;
        return -1;
    }
}

// ============================ thresholds / checkpoints / logs ============================ //

std::optional<std::string> GateDatabase::getThresholdsJson(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, "SELECT config_json FROM adaptive_thresholds WHERE session_id = ?");
        query.bind(1, session_id);
        if (query.executeStep()) {
            return query.getColumn(0).getString();
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get thresholds failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool GateDatabase::putThresholdsJson(const std::string& session_id, const std::string& config_json) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "INSERT OR REPLACE INTO adaptive_thresholds (session_id, config_json, updated_at) VALUES (?, ?, ?)");
        query.bind(1, session_id);
        query.bind(2, config_json);
        query.bind(3, TimeUtils::getCurrentTimestamp());
        return query.exec() >= 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Put thresholds failed: " << e.what() << std::endl;
        return false;
    }
}

std::optional<CycleCheckpoint> GateDatabase::getCheckpoint(const std::string& session_id, const std::string& cycle) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            SELECT session_id, cycle, last_event_id, last_accepted_count, runs, updated_at
            FROM cycle_checkpoints WHERE session_id = ? AND cycle = ?
        )");
        query.bind(1, session_id);
        query.bind(2, cycle);
        if (query.executeStep()) {
            CycleCheckpoint c;
            c.session_id          = query.getColumn(0).getString();
            c.cycle               = query.getColumn(1).getString();
            c.last_event_id       = query.getColumn(2).getInt64();
            c.last_accepted_count = query.getColumn(3).getInt64();
            c.runs                = query.getColumn(4).getInt();
            c.updated_at          = textOrEmpty(query.getColumn(5));
            return c;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get checkpoint failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool GateDatabase::putCheckpoint(const CycleCheckpoint& checkpoint) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_, R"(
            INSERT OR REPLACE INTO cycle_checkpoints
                (session_id, cycle, last_event_id, last_accepted_count, runs, updated_at)
            VALUES (?, ?, ?, ?, ?, ?)
        )");
        query.bind(1, checkpoint.session_id);
        query.bind(2, checkpoint.cycle);
        query.bind(3, static_cast<int64_t>(checkpoint.last_event_id));
        query.bind(4, static_cast<int64_t>(checkpoint.last_accepted_count));
        query.bind(5, checkpoint.runs);
        query.bind(6, TimeUtils::getCurrentTimestamp());
        return query.exec() >= 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Put checkpoint failed: " << e.what() << std::endl;
        return false;
    }
}

bool GateDatabase::insertSystemLog(const std::string& session_id, const std::string& log_type,
                                   const std::string& message, const std::string& metadata_json) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        SQLite::Statement query(*database_,
            "INSERT INTO system_logs (session_id, log_type, message, metadata, created_at) VALUES (?, ?, ?, ?, ?)");
        query.bind(1, session_id);
        query.bind(2, log_type);
        query.bind(3, message);
        query.bind(4, metadata_json);
        query.bind(5, TimeUtils::getCurrentTimestamp());
        return query.exec() == 1;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Insert system log failed: " << e.what() << std::endl;
        return false;
    }
}

std::vector<SystemLogEntry> GateDatabase::getSystemLogs(const std::string& session_id, int limit) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    std::vector<SystemLogEntry> logs;
    try {
        SQLite::Statement query(*database_, R"(
            SELECT log_id, session_id, log_type, message, metadata, created_at
            FROM system_logs WHERE session_id = ?
            ORDER BY log_id DESC LIMIT ?
        )");
        query.bind(1, session_id);
        query.bind(2, limit);
        while (query.executeStep()) {
            SystemLogEntry entry;
            entry.id            = query.getColumn(0).getInt64();
            entry.session_id    = textOrEmpty(query.getColumn(1));
            entry.log_type      = query.getColumn(2).getString();
            entry.message       = query.getColumn(3).getString();
            entry.metadata_json = textOrEmpty(query.getColumn(4));
            entry.created_at    = query.getColumn(5).getString();
            logs.push_back(entry);
        }
    } catch (const std::exception& e) {
        std::cerr << "[DB] Get system logs failed: " << e.what() << std::endl;
    }
    return logs;
}

bool GateDatabase::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(db_mutex_);
    try {
        database_->exec(sql);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DB] Execute SQL failed: " << e.what() << std::endl;
        std::cerr << "SQL: " << sql << std::endl;
        return false;
    }
}

} // namespace gatesense
