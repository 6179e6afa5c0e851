#include "gatesense/serialization.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace gatesense {

static json optionalString(const std::string& s) {
    return s.empty() ? json(nullptr) : json(s);
}

void to_json(json& j, const GeoPoint& p) {
    j = json{{"lat", p.lat}, {"lon", p.lon}};
}

void to_json(json& j, const Gate& g) {
    j = json{
        {"id", g.id},
        {"session_id", g.session_id},
        {"name", g.name},
        {"centroid", g.centroid},
        {"derivation", toString(g.derivation)},
        {"health_score", g.health_score},
        {"status", toString(g.status)},
        {"spatial_variance_m2", g.spatial_variance_m2},
        {"sample_count", g.sample_count},
        {"first_seen", optionalString(g.first_seen)},
        {"last_seen", optionalString(g.last_seen)},
        {"merged_into", g.merged_into ? json(*g.merged_into) : json(nullptr)}
    };
}

void to_json(json& j, const CategoryBinding& b) {
    j = json{
        {"gate_id", b.gate_id},
        {"category", b.category},
        {"sample_count", b.sample_count},
        {"confidence", b.confidence},
        {"status", toString(b.status)},
        {"violation_count", b.violation_count},
        {"last_violation_at", optionalString(b.last_violation_at)},
        {"demotion_count", b.demotion_count},
        {"updated_at", b.updated_at}
    };
}

void to_json(json& j, const BindingTransition& t) {
    j = json{{"gate_id", t.gate_id}, {"category", t.category}, {"from", toString(t.from)},
             {"to", toString(t.to)}, {"reason", t.reason}, {"timestamp", t.timestamp}};
}

void to_json(json& j, const MergeSuggestion& s) {
    j = json{
        {"id", s.id},
        {"session_id", s.session_id},
        {"source_gate_id", s.source_gate_id},
        {"target_gate_id", s.target_gate_id},
        {"distance_m", s.distance_m},
        {"traffic_similarity", s.traffic_similarity},
        {"category_similarity", s.category_similarity},
        {"confidence", s.confidence},
        {"status", toString(s.status)},
        {"reviewed_by", optionalString(s.audit.reviewed_by)},
        {"reviewed_at", optionalString(s.audit.reviewed_at)},
        {"reason", optionalString(s.audit.reason)},
        {"created_at", s.created_at}
    };
}

void to_json(json& j, const SystemLogEntry& e) {
    json metadata = json::parse(e.metadata_json, nullptr, false);
    if (metadata.is_discarded()) metadata = e.metadata_json;
    j = json{{"id", e.id}, {"type", e.log_type}, {"message", e.message},
             {"metadata", metadata}, {"created_at", e.created_at}};
}

void to_json(json& j, const ValidationResult& r) {
    j = json{
        {"decision", toString(r.decision)},
        {"confidence", r.confidence},
        {"binding_status", r.binding_status ? json(toString(*r.binding_status)) : json(nullptr)},
        {"reason", r.reason}
    };
}

void to_json(json& j, const MaterializeReport& r) {
    json actions = json::array();
    for (const auto& a : r.actions) {
        const char* kind = a.kind == MaterializeAction::Kind::Created ? "created"
                         : a.kind == MaterializeAction::Kind::Updated ? "updated" : "skipped";
        actions.push_back({{"action", kind}, {"gate_id", a.gate_id}, {"name", a.name},
                           {"centroid", a.centroid}, {"sample_count", a.sample_count},
                           {"health_score", a.health_score}, {"match_distance_m", a.match_distance_m}});
    }
    j = json{{"dry_run", r.dry_run}, {"created", r.created}, {"updated", r.updated},
             {"skipped", r.skipped}, {"actions", actions}};
}

void to_json(json& j, const OrphanReport& r) {
    j = json{{"scanned", r.scanned}, {"assigned", r.assigned}, {"next_cursor", r.next_cursor}};
}

void to_json(json& j, const LearnReport& r) {
    j = json{{"processed", r.processed}, {"violations", r.violations}, {"promotions", r.promotions},
             {"demotions", r.demotions}, {"unbound", r.unbound}, {"failures", r.failures},
             {"last_event_id", r.last_event_id}};
}

void to_json(json& j, const DuplicateReport& r) {
    j = json{{"pairs_checked", r.pairs_checked}, {"suggested", r.suggested},
             {"auto_applied", r.auto_applied}, {"suggestions", r.suggestions}};
}

void to_json(json& j, const MergeResult& r) {
    j = json{{"source_gate_id", r.source_gate_id}, {"target_gate_id", r.target_gate_id},
             {"events_repointed", r.events_repointed}, {"bindings_moved", r.bindings_moved},
             {"bindings_combined", r.bindings_combined}, {"suggestions_rejected", r.suggestions_rejected},
             {"target", r.target}};
}

void to_json(json& j, const DiscoveryResult& r) {
    j = json{{"dry_run", r.dry_run}, {"input_scans", r.input_scans}, {"clusters", r.clusters},
             {"noise_points", r.noise_points}, {"rejected_by_variance", r.rejected_by_variance},
             {"materialize", r.materialize}, {"orphans", r.orphans}, {"learning", r.learning}};
}

void to_json(json& j, const IngestResult& r) {
    j = json{{"event_id", r.event_id},
             {"gate_id", r.gate_id ? json(*r.gate_id) : json(nullptr)},
             {"quality_weight", r.quality_weight},
             {"discovery_scheduled", r.discovery_scheduled}};
}

void to_json(json& j, const GateView& v) {
    j = v.gate;
    j["bindings"] = v.bindings;
}

void to_json(json& j, const QualityReport& r) {
    j = json{
        {"total_checkins", r.stats.total},
        {"with_location", r.stats.with_location},
        {"usable", r.stats.usable},
        {"location_pct", r.location_pct},
        {"usable_pct", r.usable_pct},
        {"accuracy", {{"avg_m", r.stats.avg_accuracy_m}, {"min_m", r.stats.min_accuracy_m},
                      {"max_m", r.stats.max_accuracy_m}}},
        {"distribution", {{"excellent", r.stats.excellent}, {"good", r.stats.good},
                          {"fair", r.stats.fair}, {"poor", r.stats.poor}}},
        {"rating", r.rating},
        {"recommendation", r.recommendation}
    };
}

void to_json(json& j, const GateHealthEntry& e) {
    j = json{{"gate_id", e.gate_id}, {"name", e.name}, {"health_score", e.health_score},
             {"status", toString(e.status)}, {"state", e.state}, {"recommendation", e.recommendation},
             {"checkins", e.checkins}, {"last_scan_at", optionalString(e.last_scan_at)}};
}

// ============================ input ============================ //

static std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + key);
    }
    return it->get<std::string>();
}

static std::optional<double> optionalNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) throw std::invalid_argument(std::string("field is not a number: ") + key);
    return it->get<double>();
}

CheckinInput checkinFromJson(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("check-in must be a JSON object");
    CheckinInput in;
    in.session_id = requireString(j, "session_id");
    in.wristband_id = requireString(j, "wristband_id");
    in.category = requireString(j, "category");
    in.timestamp = requireString(j, "timestamp");
    in.lat = optionalNumber(j, "lat");
    in.lon = optionalNumber(j, "lon");
    in.accuracy_m = optionalNumber(j, "accuracy_m");

    auto gate = j.find("gate_id");
    if (gate != j.end() && !gate->is_null()) {
        if (!gate->is_number_integer()) throw std::invalid_argument("field is not an integer: gate_id");
        in.gate_id = gate->get<int64_t>();
    }
    auto outcome = j.find("outcome");
    if (outcome != j.end() && !outcome->is_null()) {
        if (!outcome->is_string() || !parseOutcome(outcome->get<std::string>(), in.outcome)) {
            throw std::invalid_argument("unknown outcome");
        }
    }
    return in;
}

ReviewAudit auditFromJson(const json& j) {
    ReviewAudit audit;
    audit.reviewed_by = j.value("reviewed_by", std::string());
    audit.reason = j.value("reason", std::string());
    if (audit.reviewed_by.empty()) throw std::invalid_argument("missing or invalid field: reviewed_by");
    return audit;
}

GeoPoint pointFromJson(const json& j) {
    auto lat = optionalNumber(j, "lat");
    auto lon = optionalNumber(j, "lon");
    if (!lat || !lon) throw std::invalid_argument("lat and lon are required");
    return GeoPoint{*lat, *lon};
}

} // namespace gatesense
