#include "gatesense/models.hpp"

namespace gatesense {

bool parseOutcome(const std::string& text, CheckinOutcome& out) {
    if (text == "success") { out = CheckinOutcome::Success; return true; }
    if (text == "denied")  { out = CheckinOutcome::Denied;  return true; }
    if (text == "error")   { out = CheckinOutcome::Error;   return true; }
    return false;
}

bool parseGateStatus(const std::string& text, GateStatus& out) {
    if (text == "active")      { out = GateStatus::Active;      return true; }
    if (text == "inactive")    { out = GateStatus::Inactive;    return true; }
    if (text == "maintenance") { out = GateStatus::Maintenance; return true; }
    return false;
}

bool parseDerivation(const std::string& text, DerivationMethod& out) {
    if (text == "clustering") { out = DerivationMethod::Clustering; return true; }
    if (text == "manual")     { out = DerivationMethod::Manual;     return true; }
    return false;
}

bool parseBindingStatus(const std::string& text, BindingStatus& out) {
    if (text == "probation") { out = BindingStatus::Probation; return true; }
    if (text == "enforced")  { out = BindingStatus::Enforced;  return true; }
    if (text == "unbound")   { out = BindingStatus::Unbound;   return true; }
    return false;
}

bool parseMergeStatus(const std::string& text, MergeStatus& out) {
    if (text == "pending")      { out = MergeStatus::Pending;     return true; }
    if (text == "approved")     { out = MergeStatus::Approved;    return true; }
    if (text == "rejected")     { out = MergeStatus::Rejected;    return true; }
    if (text == "auto_applied") { out = MergeStatus::AutoApplied; return true; }
    return false;
}

} // namespace gatesense
