#include "incidentguard/policy.hpp"
#include "incidentguard/exceptions.hpp"

namespace incidentguard {

// ========== AllowListPolicy ==========

AllowListPolicy::AllowListPolicy(CategoryMap<std::set<ActionToken>> allowed,
                                 std::set<ActionToken> approval_required)
    : allowed_(std::move(allowed))
    , approval_required_(std::move(approval_required))
{}

bool AllowListPolicy::may_auto_execute(const Incident& incident,
                                       const ActionToken& action) const {
    if (approval_required_.count(action)) return false;

    auto it = allowed_.find(incident.category);
    if (it == allowed_.end()) return false;
    return it->second.count(action) > 0;
}

// ========== SeverityCappedPolicy ==========

SeverityCappedPolicy::SeverityCappedPolicy(Severity max_severity,
                                           std::unique_ptr<ExecutionPolicy> inner)
    : max_severity_(max_severity)
    , inner_(std::move(inner))
{
    if (!inner_) {
        throw InvalidConfigurationException("SeverityCappedPolicy needs an inner policy");
    }
}

bool SeverityCappedPolicy::may_auto_execute(const Incident& incident,
                                            const ActionToken& action) const {
    if (incident.severity > max_severity_) return false;
    return inner_->may_auto_execute(incident, action);
}

std::string SeverityCappedPolicy::name() const {
    return std::string("SeverityCapped(") + to_string(max_severity_) + ", " + inner_->name() + ")";
}

} // namespace incidentguard
