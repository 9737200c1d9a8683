#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/agent.hpp"
#include "incidentguard/circuit_breaker.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace incidentguard {

// Invokes one agent under a deadline and turns whatever happens into either
// a Finding or a DispatchFailure. The outcome is reported to the agent's
// breaker when one is attached.
//
// The call is bounded by the earlier of `deadline` and the agent's own
// timeout. Only a miss of the agent's own timeout is a Timeout; a miss of a
// tighter caller deadline is Cancelled and is not charged to the breaker.
// A call is refused as Saturated while the agent already has
// max_outstanding_calls provider calls running.
class AgentHarness {
public:
    explicit AgentHarness(const Agent& agent, CircuitBreaker* breaker = nullptr);

    DispatchResult invoke(const Incident& incident,
                          RoundNumber round,
                          Timestamp deadline,
                          std::shared_ptr<const std::atomic<bool>> cancel_flag = nullptr);

    // Checks a raw response against the Finding schema. Returns the failure
    // message, or nullopt if the response is well-formed.
    static std::optional<std::string> validate(const ProviderResponse& response);

    // Breaker state change caused by the last invoke(), if any
    std::optional<BreakerState> breaker_transition() const noexcept;

private:
    const Agent& agent_;
    CircuitBreaker* breaker_;
    std::optional<BreakerState> breaker_transition_;

    DispatchResult attempt(const Incident& incident,
                           RoundNumber round,
                           Timestamp deadline,
                           const std::shared_ptr<const std::atomic<bool>>& cancel_flag);

    DispatchResult make_failure(DispatchFailureKind kind, std::string message) const;
    void report(const DispatchResult& result);
};

} // namespace incidentguard
