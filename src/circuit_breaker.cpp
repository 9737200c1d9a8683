#include "incidentguard/circuit_breaker.hpp"
#include "incidentguard/exceptions.hpp"

#include <algorithm>

namespace incidentguard {

// ========== CircuitBreaker ==========

CircuitBreaker::CircuitBreaker(AgentRole role, BreakerConfig config)
    : role_(role)
    , config_(std::move(config))
{
    if (config_.failure_threshold == 0) {
        throw InvalidConfigurationException("Breaker failure_threshold must be at least 1");
    }
    stats_.role = role_;
    stats_.last_transition = Clock::now();
}

DispatchPermit CircuitBreaker::try_dispatch(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    DispatchPermit permit;
    switch (stats_.state) {
        case BreakerState::Closed:
        case BreakerState::HalfOpen:
            permit.allowed = true;
            break;
        case BreakerState::Open:
            if (now - stats_.last_transition >= config_.cooldown) {
                transition(BreakerState::HalfOpen, now);
                permit.allowed = true;
                permit.transition = BreakerState::HalfOpen;
            }
            break;
    }
    return permit;
}

bool CircuitBreaker::allow_dispatch(Timestamp now) {
    return try_dispatch(now).allowed;
}

std::optional<BreakerState> CircuitBreaker::record_success(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_successes++;
    stats_.consecutive_failures = 0;
    stats_.last_success = now;

    if (stats_.state != BreakerState::Closed) {
        transition(BreakerState::Closed, now);
        return BreakerState::Closed;
    }
    return std::nullopt;
}

std::optional<BreakerState> CircuitBreaker::record_failure(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_failures++;
    stats_.consecutive_failures++;
    stats_.last_failure = now;

    if (stats_.state == BreakerState::HalfOpen ||
        (stats_.state == BreakerState::Closed &&
         stats_.consecutive_failures >= config_.failure_threshold)) {
        transition(BreakerState::Open, now);
        return BreakerState::Open;
    }
    return std::nullopt;
}

void CircuitBreaker::reset(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BreakerStats{};
    stats_.role = role_;
    stats_.last_transition = now;
}

AgentRole CircuitBreaker::role() const noexcept { return role_; }

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.state;
}

BreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CircuitBreaker::transition(BreakerState to, Timestamp now) {
    stats_.state = to;
    stats_.last_transition = now;
    stats_.state_changes++;
    if (to == BreakerState::Closed) {
        stats_.consecutive_failures = 0;
    }
}

// ========== CircuitBreakerRegistry ==========

CircuitBreakerRegistry::CircuitBreakerRegistry(const std::vector<AgentRole>& roles,
                                               BreakerConfig config) {
    for (AgentRole role : roles) {
        if (breakers_.count(role)) {
            throw InvalidConfigurationException(
                std::string("Duplicate breaker role: ") + to_string(role));
        }
        breakers_.emplace(role, std::make_unique<CircuitBreaker>(role, config));
    }
}

CircuitBreaker& CircuitBreakerRegistry::breaker(AgentRole role) {
    auto it = breakers_.find(role);
    if (it == breakers_.end()) {
        throw InvalidConfigurationException(
            std::string("No circuit breaker for role ") + to_string(role));
    }
    return *it->second;
}

const CircuitBreaker& CircuitBreakerRegistry::breaker(AgentRole role) const {
    auto it = breakers_.find(role);
    if (it == breakers_.end()) {
        throw InvalidConfigurationException(
            std::string("No circuit breaker for role ") + to_string(role));
    }
    return *it->second;
}

bool CircuitBreakerRegistry::contains(AgentRole role) const {
    return breakers_.count(role) > 0;
}

std::vector<BreakerStats> CircuitBreakerRegistry::snapshot() const {
    std::vector<BreakerStats> result;
    result.reserve(breakers_.size());
    for (auto& [_, b] : breakers_) {
        result.push_back(b->stats());
    }
    std::sort(result.begin(), result.end(),
        [](const BreakerStats& a, const BreakerStats& b) {
            return static_cast<int>(a.role) < static_cast<int>(b.role);
        });
    return result;
}

void CircuitBreakerRegistry::reset_all() {
    auto now = Clock::now();
    for (auto& [_, b] : breakers_) {
        b->reset(now);
    }
}

} // namespace incidentguard
