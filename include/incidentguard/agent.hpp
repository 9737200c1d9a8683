#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/call_tracker.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace incidentguard {

// Static agent configuration, never mutated at runtime
struct AgentDescriptor {
    AgentRole role{AgentRole::Detection};
    std::string name;
    double weight{0.0};
    Duration timeout = std::chrono::seconds(30);
    std::size_t max_retries{0};

    // Provider calls that may still be running past their deadline before
    // new dispatches fail as Saturated
    std::size_t max_outstanding_calls{4};
};

// Read-only view handed to a provider for one call
struct AnalysisContext {
    Incident incident;
    RoundNumber round{0};
    Timestamp deadline{};
    std::shared_ptr<const std::atomic<bool>> cancel_flag;

    // Providers should poll this and give up early when it turns true
    bool cancelled() const noexcept {
        return cancel_flag && cancel_flag->load();
    }
};

// Raw provider output before validation
struct ProviderResponse {
    std::optional<double> confidence;
    std::optional<ActionToken> action;
    std::string evidence;
};

// External reasoning capability backing one agent role.
// Implementations may block and may throw; the harness bounds both.
class AnalysisProvider {
public:
    virtual ~AnalysisProvider() = default;
    virtual ProviderResponse analyze(const AnalysisContext& context) = 0;
};

class Agent {
public:
    Agent(AgentDescriptor descriptor, std::shared_ptr<AnalysisProvider> provider);

    AgentRole role() const noexcept;
    const std::string& name() const noexcept;
    double weight() const noexcept;
    Duration timeout() const noexcept;
    std::size_t max_retries() const noexcept;

    const AgentDescriptor& descriptor() const noexcept;
    const std::shared_ptr<AnalysisProvider>& provider() const noexcept;

    // Shared by copies of this agent
    const std::shared_ptr<CallTracker>& call_tracker() const noexcept;

private:
    AgentDescriptor descriptor_;
    std::shared_ptr<AnalysisProvider> provider_;
    std::shared_ptr<CallTracker> calls_;
};

} // namespace incidentguard
