#ifndef GATESENSE_DATABASE_SCHEMAS_H
#define GATESENSE_DATABASE_SCHEMAS_H

#include <string>

namespace DatabaseSchemas {
    // venue-sessions
    const std::string CREATE_SESSIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            session_id TEXT PRIMARY KEY,
            is_active INTEGER NOT NULL DEFAULT 1,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )";
    // scan events, append-only apart from gate_id and learned
    const std::string CREATE_CHECKIN_EVENTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS checkin_events (
            event_id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            wristband_id TEXT NOT NULL,
            category TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            has_location INTEGER NOT NULL DEFAULT 0,
            lat REAL,
            lon REAL,
            accuracy_m REAL,
            quality_weight REAL NOT NULL DEFAULT 0,
            gate_id INTEGER,
            outcome TEXT NOT NULL CHECK(outcome IN ('success', 'denied', 'error')),
            learned INTEGER NOT NULL DEFAULT 0,
            FOREIGN KEY (session_id) REFERENCES sessions(session_id)
        );
    )";
    // physical entry points
    const std::string CREATE_GATES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS gates (
            gate_id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            name TEXT NOT NULL,
            lat REAL NOT NULL,
            lon REAL NOT NULL,
            derivation TEXT NOT NULL CHECK(derivation IN ('clustering', 'manual')),
            health_score INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL CHECK(status IN ('active', 'inactive', 'maintenance')),
            spatial_variance_m2 REAL NOT NULL DEFAULT 0,
            sample_count INTEGER NOT NULL DEFAULT 0,
            first_seen TEXT,
            last_seen TEXT,
            anchor_lat_key INTEGER NOT NULL,
            anchor_lon_key INTEGER NOT NULL,
            merged_into INTEGER,
            UNIQUE(session_id, anchor_lat_key, anchor_lon_key)
        );
    )";
    // learned (gate, category) associations
    const std::string CREATE_CATEGORY_BINDINGS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS category_bindings (
            gate_id INTEGER NOT NULL,
            category TEXT NOT NULL,
            session_id TEXT NOT NULL,
            sample_count INTEGER NOT NULL DEFAULT 0,
            confidence REAL NOT NULL DEFAULT 0,
            status TEXT NOT NULL CHECK(status IN ('probation', 'enforced', 'unbound')),
            violation_count INTEGER NOT NULL DEFAULT 0,
            last_violation_at TEXT,
            demotion_count INTEGER NOT NULL DEFAULT 0,
            updated_at TEXT,
            PRIMARY KEY (gate_id, category),
            FOREIGN KEY (gate_id) REFERENCES gates(gate_id)
        );
    )";
    const std::string CREATE_BINDING_TRANSITIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS binding_transitions (
            transition_id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            gate_id INTEGER NOT NULL,
            category TEXT NOT NULL,
            from_status TEXT NOT NULL,
            to_status TEXT NOT NULL,
            reason TEXT NOT NULL,
            timestamp TEXT NOT NULL
        );
    )";
    // one row per unordered gate pair
    const std::string CREATE_MERGE_SUGGESTIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS merge_suggestions (
            suggestion_id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            source_gate_id INTEGER NOT NULL,
            target_gate_id INTEGER NOT NULL,
            gate_lo INTEGER NOT NULL,
            gate_hi INTEGER NOT NULL,
            distance_m REAL NOT NULL,
            traffic_similarity REAL NOT NULL,
            category_similarity REAL NOT NULL,
            confidence REAL NOT NULL,
            status TEXT NOT NULL CHECK(status IN ('pending', 'approved', 'rejected', 'auto_applied')),
            reviewed_by TEXT,
            review_reason TEXT,
            reviewed_at TEXT,
            created_at TEXT NOT NULL,
            UNIQUE(session_id, gate_lo, gate_hi)
        );
    )";
    // per-session tunables as a JSON document
    const std::string CREATE_ADAPTIVE_THRESHOLDS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS adaptive_thresholds (
            session_id TEXT PRIMARY KEY,
            config_json TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
    )";
    const std::string CREATE_CYCLE_CHECKPOINTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS cycle_checkpoints (
            session_id TEXT NOT NULL,
            cycle TEXT NOT NULL,
            last_event_id INTEGER NOT NULL DEFAULT 0,
            last_accepted_count INTEGER NOT NULL DEFAULT 0,
            runs INTEGER NOT NULL DEFAULT 0,
            updated_at TEXT,
            PRIMARY KEY (session_id, cycle)
        );
    )";
    const std::string CREATE_SYSTEM_LOGS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS system_logs (
            log_id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT,
            log_type TEXT NOT NULL,
            message TEXT NOT NULL,
            metadata TEXT,
            created_at TEXT NOT NULL
        );
    )";

    const std::string CREATE_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_checkins_session_time ON checkin_events(session_id, timestamp);
        CREATE INDEX IF NOT EXISTS idx_checkins_session_gate ON checkin_events(session_id, gate_id);
        CREATE INDEX IF NOT EXISTS idx_checkins_unlearned ON checkin_events(session_id, learned, event_id);
        CREATE INDEX IF NOT EXISTS idx_gates_session ON gates(session_id, status);
        CREATE INDEX IF NOT EXISTS idx_bindings_session_category ON category_bindings(session_id, category);
        CREATE INDEX IF NOT EXISTS idx_transitions_binding ON binding_transitions(gate_id, category);
        CREATE INDEX IF NOT EXISTS idx_merges_session_status ON merge_suggestions(session_id, status);
        CREATE INDEX IF NOT EXISTS idx_system_logs_session ON system_logs(session_id, created_at);
    )";
} // namespace DatabaseSchemas

#endif // GATESENSE_DATABASE_SCHEMAS_H
