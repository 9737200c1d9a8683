#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"

#include <memory>
#include <set>
#include <string>

namespace incidentguard {

// Decides whether an eligible decision's action may run without a human.
class ExecutionPolicy {
public:
    virtual ~ExecutionPolicy() = default;

    virtual bool may_auto_execute(const Incident& incident,
                                  const ActionToken& action) const = 0;

    virtual std::string name() const = 0;
};

// Per-category allow-list plus a global approval-required list (default)
class AllowListPolicy : public ExecutionPolicy {
public:
    explicit AllowListPolicy(CategoryMap<std::set<ActionToken>> allowed,
                             std::set<ActionToken> approval_required = {});

    bool may_auto_execute(const Incident& incident,
                          const ActionToken& action) const override;
    std::string name() const override { return "AllowList"; }

private:
    CategoryMap<std::set<ActionToken>> allowed_;
    std::set<ActionToken> approval_required_;
};

// Never auto-executes above `max_severity`, otherwise defers to `inner`
class SeverityCappedPolicy : public ExecutionPolicy {
public:
    SeverityCappedPolicy(Severity max_severity, std::unique_ptr<ExecutionPolicy> inner);

    bool may_auto_execute(const Incident& incident,
                          const ActionToken& action) const override;
    std::string name() const override;

private:
    Severity max_severity_;
    std::unique_ptr<ExecutionPolicy> inner_;
};

} // namespace incidentguard
