#include "incidentguard/agent.hpp"
#include "incidentguard/exceptions.hpp"

namespace incidentguard {

Agent::Agent(AgentDescriptor descriptor, std::shared_ptr<AnalysisProvider> provider)
    : descriptor_(std::move(descriptor))
    , provider_(std::move(provider))
{
    if (!provider_) {
        throw InvalidConfigurationException(
            std::string("Agent ") + to_string(descriptor_.role) + " has no analysis provider");
    }
    if (!(descriptor_.weight > 0.0 && descriptor_.weight <= 1.0)) {
        throw InvalidConfigurationException(
            std::string("Agent ") + to_string(descriptor_.role) +
            " weight must be in (0, 1], got " + std::to_string(descriptor_.weight));
    }
    if (descriptor_.timeout <= Duration::zero()) {
        throw InvalidConfigurationException(
            std::string("Agent ") + to_string(descriptor_.role) + " timeout must be positive");
    }
    if (descriptor_.max_outstanding_calls == 0) {
        throw InvalidConfigurationException(
            std::string("Agent ") + to_string(descriptor_.role) +
            " max_outstanding_calls must be at least 1");
    }
    if (descriptor_.name.empty()) {
        descriptor_.name = to_string(descriptor_.role);
    }
    calls_ = std::make_shared<CallTracker>(descriptor_.max_outstanding_calls);
}

AgentRole Agent::role() const noexcept { return descriptor_.role; }
const std::string& Agent::name() const noexcept { return descriptor_.name; }
double Agent::weight() const noexcept { return descriptor_.weight; }
Duration Agent::timeout() const noexcept { return descriptor_.timeout; }
std::size_t Agent::max_retries() const noexcept { return descriptor_.max_retries; }

const AgentDescriptor& Agent::descriptor() const noexcept {
    return descriptor_;
}

const std::shared_ptr<AnalysisProvider>& Agent::provider() const noexcept {
    return provider_;
}

const std::shared_ptr<CallTracker>& Agent::call_tracker() const noexcept {
    return calls_;
}

} // namespace incidentguard
