#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"

#include <vector>

namespace incidentguard {

// Turns one round's Findings into a single ConsensusDecision.
//
// Weights of the agents that actually responded are renormalized to sum to
// 1.0, so an excluded agent's trust is redistributed proportionally instead
// of simply disappearing from the total. Every decision records who
// contributed and at what weight.
//
// A decision is autonomous_eligible when
//   weighted_confidence + kThresholdTolerance >= threshold
// i.e. a weighted confidence up to 1e-9 below the threshold counts as
// reaching it. Anything further below does not.
class ConsensusEngine {
public:
    explicit ConsensusEngine(ConsensusConfig config = ConsensusConfig{});

    // `weights` is the static table for the incident's category.
    // `excluded` lists roles that were circuit-broken or failed to respond;
    // it is carried into the decision for audit.
    ConsensusResult decide(IncidentId incident_id,
                           RoundNumber round,
                           IncidentCategory category,
                           const std::vector<Finding>& findings,
                           const WeightTable& weights,
                           const std::vector<AgentRole>& excluded = {}) const;

    double threshold_for(IncidentCategory category) const;

    // Responders Byzantine screening would set aside from `findings`,
    // sorted by role. Applies the screening rules regardless of whether
    // config().byzantine_screening is on.
    std::vector<AgentRole> suspected_byzantine(const std::vector<Finding>& findings) const;

    const ConsensusConfig& config() const noexcept;

    // Renormalizes `weights` over `responders`. Roles without a weight are
    // skipped. Returns an empty table when the responders carry no weight.
    static WeightTable renormalize(const WeightTable& weights,
                                   const std::vector<AgentRole>& responders);

    // Largest number of faulty agents out of n the voting tolerates
    static std::size_t byzantine_tolerance(std::size_t agent_count) noexcept;

    // Throws InvalidConfigurationException unless every weight is in (0, 1]
    // and the table sums to 1.0
    static void validate_weights(const WeightTable& weights);

    static constexpr double kWeightEpsilon = 1e-6;
    static constexpr double kThresholdTolerance = 1e-9;

private:
    ConsensusConfig config_;

    std::vector<AgentRole> screen(const std::vector<const Finding*>& findings) const;

    ConsensusResult insufficient_quorum(double responding_weight, std::string reason) const;
};

} // namespace incidentguard
