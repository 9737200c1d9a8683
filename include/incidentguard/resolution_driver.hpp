#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"
#include "incidentguard/policy.hpp"
#include "incidentguard/call_tracker.hpp"

#include <memory>
#include <optional>
#include <string>

namespace incidentguard {

// Incident lifecycle state machine.
//
//   Pending -> Analyzing -> Deciding -> Executing  -> Resolved
//                  ^           |            |
//                  +-----------+            v
//                  (retry)     +------> Escalating -> EscalatedOpen
//
// Abandoned is reachable from every non-terminal state.
class IncidentLifecycle {
public:
    explicit IncidentLifecycle(IncidentState initial = IncidentState::Pending);

    IncidentState state() const noexcept;

    // Throws InvalidTransitionException for a transition not in the table
    void advance(IncidentState to);

    static bool is_valid_transition(IncidentState from, IncidentState to) noexcept;

private:
    IncidentState state_;
};

struct RemediationResult {
    bool success{false};
    std::string message;
};

struct RollbackResult {
    bool attempted{false};
    bool success{false};
    std::string message;
};

// External action-execution capability. May block and may throw; the
// driver bounds both with the action timeout.
class RemediationExecutor {
public:
    virtual ~RemediationExecutor() = default;
    virtual RemediationResult execute(const Incident& incident, const ActionToken& action) = 0;

    // Undoes whatever part of `action` took effect after execute() failed
    // or overran. The default has nothing to undo.
    virtual RollbackResult rollback(const Incident& incident, const ActionToken& action) {
        (void)incident;
        return RollbackResult{false, false, "no rollback for '" + action + "'"};
    }
};

enum class Verdict {
    Execute,
    Escalate,
    AnotherRound
};

inline const char* to_string(Verdict v) {
    switch (v) {
        case Verdict::Execute:      return "Execute";
        case Verdict::Escalate:     return "Escalate";
        case Verdict::AnotherRound: return "AnotherRound";
    }
    return "Unknown";
}

struct DriverVerdict {
    Verdict verdict{Verdict::Escalate};
    std::optional<EscalationReason> reason;
    std::string message;
};

struct ExecutionOutcome {
    bool success{false};
    bool timed_out{false};
    std::string message;
};

class ResolutionDriver {
public:
    // A null policy means AllowListPolicy built from the config's lists
    ResolutionDriver(ResolutionConfig config,
                     std::shared_ptr<RemediationExecutor> executor,
                     std::unique_ptr<ExecutionPolicy> policy = nullptr);

    ResolutionDriver(const ResolutionDriver&) = delete;
    ResolutionDriver& operator=(const ResolutionDriver&) = delete;

    // What to do with a round's outcome. `round` is the round just decided
    // (1-based); `time_remaining` says whether the incident deadline leaves
    // room for another round.
    DriverVerdict decide(const Incident& incident,
                         const ConsensusResult& result,
                         RoundNumber round,
                         bool time_remaining) const;

    // Runs the winning action once, bounded by the action timeout and by
    // `deadline`. Never retries. Fails without calling the executor while
    // max_outstanding_actions earlier calls are still running.
    ExecutionOutcome execute(const Incident& incident,
                             const ConsensusDecision& decision,
                             Timestamp deadline);

    // Asks the executor to undo a failed action, under the same bounds as
    // execute(). attempted is false when the executor has no rollback.
    RollbackResult rollback(const Incident& incident,
                            const ConsensusDecision& decision,
                            Timestamp deadline);

    const ResolutionConfig& config() const noexcept;
    const ExecutionPolicy& policy() const noexcept;
    const std::shared_ptr<CallTracker>& call_tracker() const noexcept;

private:
    ResolutionConfig config_;
    std::shared_ptr<RemediationExecutor> executor_;
    std::unique_ptr<ExecutionPolicy> policy_;
    std::shared_ptr<CallTracker> calls_;
};

} // namespace incidentguard
