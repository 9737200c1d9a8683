#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace incidentguard {

struct BreakerStats {
    AgentRole role{AgentRole::Detection};
    BreakerState state{BreakerState::Closed};
    std::size_t consecutive_failures{0};
    std::uint64_t total_successes{0};
    std::uint64_t total_failures{0};
    std::uint64_t state_changes{0};
    Timestamp last_transition{};
    std::optional<Timestamp> last_success;
    std::optional<Timestamp> last_failure;

    double failure_rate() const noexcept {
        auto total = total_successes + total_failures;
        return total > 0 ? static_cast<double>(total_failures) / total : 0.0;
    }
};

// Result of asking a breaker for a call slot. `transition` is set only for
// the caller whose request moved the breaker Open -> HalfOpen.
struct DispatchPermit {
    bool allowed{false};
    std::optional<BreakerState> transition;

    explicit operator bool() const noexcept { return allowed; }
};

// Failure isolation for one agent role.
//
//   Closed   --(failure_threshold consecutive failures)--> Open
//   Open     --(cooldown elapsed, checked on dispatch)---> HalfOpen
//   HalfOpen --(success)--> Closed
//   HalfOpen --(failure)--> Open
//
// Every method takes the breaker's own mutex, so two incidents dispatching
// to different roles never contend.
class CircuitBreaker {
public:
    CircuitBreaker(AgentRole role, BreakerConfig config);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Asks for a call slot. Moves Open -> HalfOpen once the cooldown has
    // elapsed and reports that move to exactly one caller.
    DispatchPermit try_dispatch(Timestamp now = Clock::now());

    // try_dispatch(now).allowed
    bool allow_dispatch(Timestamp now = Clock::now());

    // Both return the state change they caused, if any
    std::optional<BreakerState> record_success(Timestamp now = Clock::now());
    std::optional<BreakerState> record_failure(Timestamp now = Clock::now());

    void reset(Timestamp now = Clock::now());

    AgentRole role() const noexcept;
    BreakerState state() const;
    BreakerStats stats() const;

private:
    AgentRole role_;
    BreakerConfig config_;

    mutable std::mutex mutex_;
    BreakerStats stats_;

    void transition(BreakerState to, Timestamp now);
};

// Breakers for every configured role. The set of roles is fixed at
// construction; lookups never lock, each breaker locks itself.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(const std::vector<AgentRole>& roles, BreakerConfig config);

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // Throws InvalidConfigurationException for an unknown role
    CircuitBreaker& breaker(AgentRole role);
    const CircuitBreaker& breaker(AgentRole role) const;

    bool contains(AgentRole role) const;
    std::vector<BreakerStats> snapshot() const;
    void reset_all();

private:
    RoleMap<std::unique_ptr<CircuitBreaker>> breakers_;
};

} // namespace incidentguard
