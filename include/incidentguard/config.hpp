#pragma once

#include "incidentguard/types.hpp"
#include <cstddef>
#include <set>

namespace incidentguard {

// Per-agent circuit breaker configuration
struct BreakerConfig {
    // Consecutive dispatch failures before the breaker opens
    std::size_t failure_threshold = 5;

    // Time an open breaker waits before allowing a trial call
    Duration cooldown = std::chrono::seconds(30);
};

// Weighted voting configuration
struct ConsensusConfig {
    // Threshold used when a category has no entry in category_thresholds
    double default_threshold = 0.85;
    CategoryMap<double> category_thresholds;

    // Overrides the descriptor weights for a category (must sum to 1.0)
    CategoryMap<WeightTable> category_weights;

    // Minimum combined static weight of responders to attempt a decision
    double quorum_fraction = 0.5;

    // Minimum number of responding agents
    std::size_t min_responders = 2;

    // Byzantine screening: before voting, set aside responders whose
    // confidence strays from the round median by more than
    // max_confidence_deviation, or who back a minority action with more
    // than minority_confidence_floor confidence while the leading action
    // holds less than min_agreement of the votes. At most
    // byzantine_tolerance(responders) agents are set aside per round.
    bool byzantine_screening = false;
    double max_confidence_deviation = 0.3;
    double min_agreement = 0.67;
    double minority_confidence_floor = 0.8;
};

// Resolution state machine configuration
struct ResolutionConfig {
    // Rounds per incident, capped at 2
    RoundNumber max_rounds = 2;

    // A non-eligible decision within this distance below the threshold
    // earns another round
    double retry_margin = 0.10;

    // Overall incident deadline (Abandoned when it fires)
    Duration incident_timeout = std::chrono::minutes(5);

    // Deadline for one remediation call
    Duration action_timeout = std::chrono::seconds(60);

    // Actions that may run without a human, per category
    CategoryMap<std::set<ActionToken>> auto_executable_actions;

    // Actions that always require human approval regardless of category
    std::set<ActionToken> approval_required_actions;

    // Executor calls that may still be running after their timeout
    std::size_t max_outstanding_actions = 4;

    // Ask the executor to undo a failed or timed-out action before escalating
    bool rollback_on_failure = true;
};

struct LedgerConfig {
    // How long an append may wait for the ledger lock
    Duration append_timeout = std::chrono::seconds(2);

    // Re-read/retry attempts after a ConcurrentModification
    std::size_t max_append_retries = 3;
};

struct RuntimeConfig {
    // Monitor events buffered between the core and a slow subscriber;
    // the oldest is dropped when full
    std::size_t event_queue_capacity = 4096;

    // How long stop() waits for overrunning provider and executor calls
    // and for queued monitor events
    Duration shutdown_grace = std::chrono::seconds(1);
};

struct Config {
    BreakerConfig breaker;
    ConsensusConfig consensus;
    ResolutionConfig resolution;
    LedgerConfig ledger;
    RuntimeConfig runtime;
};

} // namespace incidentguard
