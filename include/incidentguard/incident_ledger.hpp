#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace incidentguard {

enum class LedgerEventType {
    Opened,
    StateChanged,
    RoundStarted,
    FindingRecorded,
    DispatchFailed,
    ConsensusReached,
    QuorumFailed,
    ActionExecuted,
    ActionFailed,
    RollbackAttempted,
    Escalated,
    Resolved,
    Abandoned
};

inline const char* to_string(LedgerEventType t) {
    switch (t) {
        case LedgerEventType::Opened:             return "Opened";
        case LedgerEventType::StateChanged:       return "StateChanged";
        case LedgerEventType::RoundStarted:       return "RoundStarted";
        case LedgerEventType::FindingRecorded:    return "FindingRecorded";
        case LedgerEventType::DispatchFailed:     return "DispatchFailed";
        case LedgerEventType::ConsensusReached:   return "ConsensusReached";
        case LedgerEventType::QuorumFailed:       return "QuorumFailed";
        case LedgerEventType::ActionExecuted:     return "ActionExecuted";
        case LedgerEventType::ActionFailed:       return "ActionFailed";
        case LedgerEventType::RollbackAttempted:  return "RollbackAttempted";
        case LedgerEventType::Escalated:          return "Escalated";
        case LedgerEventType::Resolved:           return "Resolved";
        case LedgerEventType::Abandoned:          return "Abandoned";
    }
    return "Unknown";
}

struct LedgerEvent {
    LedgerEventType type{LedgerEventType::StateChanged};
    IncidentId incident_id{0};
    Version version{0};          // assigned on append, 1-based
    WallTime recorded_at{};      // assigned on append
    RoundNumber round{0};
    std::string message;

    // Payload, depending on type
    std::optional<IncidentState> state;
    std::optional<Incident> incident;
    std::optional<Finding> finding;
    std::optional<DispatchFailure> failure;
    std::optional<ConsensusDecision> decision;
    std::optional<EscalationReason> escalation_reason;
    std::optional<bool> rollback_succeeded;
};

// Incident history rebuilt from the ledger
struct IncidentReplay {
    Incident incident;
    IncidentState state{IncidentState::Pending};
    Version version{0};
    RoundNumber rounds{0};
    std::vector<Finding> findings;
    std::vector<DispatchFailure> failures;
    std::vector<ConsensusDecision> decisions;
    std::optional<ActionToken> executed_action;
    std::optional<bool> rollback_succeeded;
    std::optional<EscalationReason> escalation_reason;
};

// Append-only, optimistically locked event log, one stream per incident.
class IncidentLedger {
public:
    explicit IncidentLedger(LedgerConfig config = LedgerConfig{});

    IncidentLedger(const IncidentLedger&) = delete;
    IncidentLedger& operator=(const IncidentLedger&) = delete;

    // Appends to the incident's stream if its version still equals
    // expected_version (0 for a new stream). Returns the new version.
    // Throws ConcurrentModificationException on a version mismatch and
    // LedgerTimeoutException if the lock could not be taken in time.
    Version append(IncidentId incident_id, Version expected_version, LedgerEvent event);

    // Events with version > from_version, in append order
    std::vector<LedgerEvent> events(IncidentId incident_id, Version from_version = 0) const;

    // 0 for an unknown incident
    Version current_version(IncidentId incident_id) const;

    bool contains(IncidentId incident_id) const;
    std::vector<IncidentId> incident_ids() const;

    // Throws IncidentNotFoundException for an unknown incident
    IncidentReplay replay(IncidentId incident_id) const;

    // Pure fold used by replay(); exposed for audits over exported events
    static IncidentReplay fold(const std::vector<LedgerEvent>& events);

private:
    LedgerConfig config_;
    mutable std::timed_mutex mutex_;
    std::unordered_map<IncidentId, std::vector<LedgerEvent>> streams_;
};

} // namespace incidentguard
