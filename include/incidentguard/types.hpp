#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace incidentguard {

// Unique identifiers
using IncidentId = std::uint64_t;
using RoundNumber = std::uint32_t;
using Version = std::uint64_t;

// Recommended remediation action, e.g. "scale_out" or "restart_service"
using ActionToken = std::string;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Wall-clock time for records that leave the process
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

enum class IncidentCategory {
    InfrastructureCascade,
    ResourceExhaustion,
    Security,
    LatencyDegradation
};

// Ordered: comparisons on Severity are meaningful
enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

enum class AgentRole {
    Detection,
    Diagnosis,
    Prediction,
    Resolution,
    Communication
};

// Incident lifecycle state
enum class IncidentState {
    Pending,
    Analyzing,
    Deciding,
    Executing,
    Escalating,
    Resolved,
    EscalatedOpen,
    Abandoned
};

enum class BreakerState {
    Closed,
    Open,
    HalfOpen
};

enum class DispatchFailureKind {
    Timeout,
    ProviderError,
    InvalidOutput,
    Cancelled,
    Saturated
};

enum class ConsensusStatus {
    Reached,
    InsufficientQuorum
};

enum class EscalationReason {
    BelowThreshold,
    ActionNotAllowed,
    InsufficientQuorum,
    ActionFailed,
    ActionTimedOut,
    Abandoned,
    LedgerUnavailable,
    InternalError
};

// Hash for enum keys in unordered containers
struct EnumHash {
    template <typename E>
    std::size_t operator()(E e) const noexcept {
        return std::hash<int>()(static_cast<int>(e));
    }
};

template <typename V>
using RoleMap = std::unordered_map<AgentRole, V, EnumHash>;

template <typename V>
using CategoryMap = std::unordered_map<IncidentCategory, V, EnumHash>;

using WeightTable = RoleMap<double>;

// Inbound alert as delivered by an upstream detector
struct AlertPayload {
    IncidentCategory category{IncidentCategory::InfrastructureCascade};
    Severity severity{Severity::Medium};
    std::string description;
    std::string evidence;
};

struct Incident {
    IncidentId id{0};
    IncidentCategory category{IncidentCategory::InfrastructureCascade};
    Severity severity{Severity::Medium};
    std::string description;
    std::string evidence;
    WallTime opened_at{};
    IncidentState state{IncidentState::Pending};
};

// One agent's independent analysis output for a round
struct Finding {
    AgentRole role{AgentRole::Detection};
    IncidentId incident_id{0};
    RoundNumber round{0};
    double confidence{0.0};
    ActionToken action;
    std::string evidence;
    WallTime produced_at{};
};

struct DispatchFailure {
    AgentRole role{AgentRole::Detection};
    DispatchFailureKind kind{DispatchFailureKind::ProviderError};
    std::string message;
};

// Outcome of one harness call: exactly one of finding/failure is set
struct DispatchResult {
    std::optional<Finding> finding;
    std::optional<DispatchFailure> failure;

    bool ok() const noexcept { return finding.has_value(); }
};

// One agent's share of a decision
struct Contribution {
    AgentRole role{AgentRole::Detection};
    double static_weight{0.0};
    double normalized_weight{0.0};
    Finding finding;
};

struct ConsensusDecision {
    IncidentId incident_id{0};
    RoundNumber round{0};
    double weighted_confidence{0.0};
    ActionToken action;
    double threshold{0.0};
    std::vector<Contribution> contributions;
    std::unordered_map<ActionToken, double> action_votes;
    std::vector<AgentRole> excluded_roles;
    // Responders set aside by Byzantine screening (also in excluded_roles)
    std::vector<AgentRole> suspected_roles;
    bool autonomous_eligible{false};
    WallTime decided_at{};
};

struct ConsensusResult {
    ConsensusStatus status{ConsensusStatus::InsufficientQuorum};
    std::optional<ConsensusDecision> decision;
    double responding_weight{0.0};
    std::string reason;

    bool reached() const noexcept { return status == ConsensusStatus::Reached; }
};

// Everything a human needs to act on a non-autonomous outcome
struct EscalationRecord {
    IncidentId incident_id{0};
    EscalationReason reason{EscalationReason::BelowThreshold};
    std::string message;
    std::vector<Finding> findings;
    std::vector<DispatchFailure> failures;
    std::optional<ConsensusDecision> decision;
    WallTime created_at{};
};

inline const char* to_string(IncidentCategory c) {
    switch (c) {
        case IncidentCategory::InfrastructureCascade: return "InfrastructureCascade";
        case IncidentCategory::ResourceExhaustion:    return "ResourceExhaustion";
        case IncidentCategory::Security:              return "Security";
        case IncidentCategory::LatencyDegradation:    return "LatencyDegradation";
    }
    return "Unknown";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Low:      return "Low";
        case Severity::Medium:   return "Medium";
        case Severity::High:     return "High";
        case Severity::Critical: return "Critical";
    }
    return "Unknown";
}

inline const char* to_string(AgentRole r) {
    switch (r) {
        case AgentRole::Detection:     return "Detection";
        case AgentRole::Diagnosis:     return "Diagnosis";
        case AgentRole::Prediction:    return "Prediction";
        case AgentRole::Resolution:    return "Resolution";
        case AgentRole::Communication: return "Communication";
    }
    return "Unknown";
}

inline const char* to_string(IncidentState s) {
    switch (s) {
        case IncidentState::Pending:       return "Pending";
        case IncidentState::Analyzing:     return "Analyzing";
        case IncidentState::Deciding:      return "Deciding";
        case IncidentState::Executing:     return "Executing";
        case IncidentState::Escalating:    return "Escalating";
        case IncidentState::Resolved:      return "Resolved";
        case IncidentState::EscalatedOpen: return "EscalatedOpen";
        case IncidentState::Abandoned:     return "Abandoned";
    }
    return "Unknown";
}

inline const char* to_string(BreakerState s) {
    switch (s) {
        case BreakerState::Closed:   return "Closed";
        case BreakerState::Open:     return "Open";
        case BreakerState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

inline const char* to_string(DispatchFailureKind k) {
    switch (k) {
        case DispatchFailureKind::Timeout:       return "Timeout";
        case DispatchFailureKind::ProviderError: return "ProviderError";
        case DispatchFailureKind::InvalidOutput: return "InvalidOutput";
        case DispatchFailureKind::Cancelled:     return "Cancelled";
        case DispatchFailureKind::Saturated:     return "Saturated";
    }
    return "Unknown";
}

inline const char* to_string(ConsensusStatus s) {
    switch (s) {
        case ConsensusStatus::Reached:            return "Reached";
        case ConsensusStatus::InsufficientQuorum: return "InsufficientQuorum";
    }
    return "Unknown";
}

inline const char* to_string(EscalationReason r) {
    switch (r) {
        case EscalationReason::BelowThreshold:     return "BelowThreshold";
        case EscalationReason::ActionNotAllowed:   return "ActionNotAllowed";
        case EscalationReason::InsufficientQuorum: return "InsufficientQuorum";
        case EscalationReason::ActionFailed:       return "ActionFailed";
        case EscalationReason::ActionTimedOut:     return "ActionTimedOut";
        case EscalationReason::Abandoned:          return "Abandoned";
        case EscalationReason::LedgerUnavailable:  return "LedgerUnavailable";
        case EscalationReason::InternalError:      return "InternalError";
    }
    return "Unknown";
}

inline bool is_terminal(IncidentState s) noexcept {
    return s == IncidentState::Resolved ||
           s == IncidentState::EscalatedOpen ||
           s == IncidentState::Abandoned;
}

} // namespace incidentguard
