#pragma once
// JSON wire format shared by the WebSocket hub and the replay CLI
#include <nlohmann/json.hpp>
#include "gatesense/models.hpp"
#include "gatesense/pipeline/GateService.h"

namespace gatesense {

void to_json(nlohmann::json& j, const GeoPoint& p);
void to_json(nlohmann::json& j, const Gate& g);
void to_json(nlohmann::json& j, const CategoryBinding& b);
void to_json(nlohmann::json& j, const BindingTransition& t);
void to_json(nlohmann::json& j, const MergeSuggestion& s);
void to_json(nlohmann::json& j, const SystemLogEntry& e);
void to_json(nlohmann::json& j, const ValidationResult& r);
void to_json(nlohmann::json& j, const MaterializeReport& r);
void to_json(nlohmann::json& j, const OrphanReport& r);
void to_json(nlohmann::json& j, const LearnReport& r);
void to_json(nlohmann::json& j, const DuplicateReport& r);
void to_json(nlohmann::json& j, const MergeResult& r);
void to_json(nlohmann::json& j, const DiscoveryResult& r);
void to_json(nlohmann::json& j, const IngestResult& r);
void to_json(nlohmann::json& j, const GateView& v);
void to_json(nlohmann::json& j, const QualityReport& r);
void to_json(nlohmann::json& j, const GateHealthEntry& e);

// Throws std::invalid_argument naming the offending field
CheckinInput checkinFromJson(const nlohmann::json& j);
ReviewAudit auditFromJson(const nlohmann::json& j);
GeoPoint pointFromJson(const nlohmann::json& j);

} // namespace gatesense
