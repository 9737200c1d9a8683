#include "incidentguard/consensus_engine.hpp"
#include "incidentguard/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>

namespace incidentguard {

namespace {

// Vote totals closer than this are a tie
constexpr double kVoteEpsilon = 1e-9;

struct ActionTally {
    double vote{0.0};
    double best_confidence{0.0};
    double best_static_weight{0.0};
};

// True if a beats b for the winning action
bool outranks(const ActionToken& a_action, const ActionTally& a,
              const ActionToken& b_action, const ActionTally& b) {
    if (std::fabs(a.vote - b.vote) > kVoteEpsilon) return a.vote > b.vote;
    if (a.best_confidence != b.best_confidence) return a.best_confidence > b.best_confidence;
    if (a.best_static_weight != b.best_static_weight) return a.best_static_weight > b.best_static_weight;
    return a_action < b_action;
}

void validate_unit(double value, const std::string& what) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw InvalidConfigurationException(
            what + " must be in [0, 1], got " + std::to_string(value));
    }
}

} // anonymous namespace

ConsensusEngine::ConsensusEngine(ConsensusConfig config)
    : config_(std::move(config))
{
    validate_unit(config_.default_threshold, "default_threshold");
    for (auto& [category, threshold] : config_.category_thresholds) {
        validate_unit(threshold, std::string("threshold for ") + to_string(category));
    }
    validate_unit(config_.quorum_fraction, "quorum_fraction");
    if (config_.min_responders < 2) {
        throw InvalidConfigurationException("min_responders must be at least 2");
    }
    for (auto& [_, table] : config_.category_weights) {
        validate_weights(table);
    }
    validate_unit(config_.max_confidence_deviation, "max_confidence_deviation");
    validate_unit(config_.min_agreement, "min_agreement");
    validate_unit(config_.minority_confidence_floor, "minority_confidence_floor");
}

ConsensusResult ConsensusEngine::decide(IncidentId incident_id,
                                        RoundNumber round,
                                        IncidentCategory category,
                                        const std::vector<Finding>& findings,
                                        const WeightTable& weights,
                                        const std::vector<AgentRole>& excluded) const {
    std::vector<AgentRole> excluded_roles = excluded;
    auto mark_excluded = [&excluded_roles](AgentRole role) {
        if (std::find(excluded_roles.begin(), excluded_roles.end(), role) == excluded_roles.end()) {
            excluded_roles.push_back(role);
        }
    };

    // One vote per weighted role; the first Finding from a role wins
    std::vector<const Finding*> usable;
    std::unordered_set<int> seen;
    for (const auto& f : findings) {
        if (!weights.count(f.role)) {
            mark_excluded(f.role);
            continue;
        }
        if (seen.insert(static_cast<int>(f.role)).second) {
            usable.push_back(&f);
        }
    }

    std::vector<AgentRole> suspected;
    if (config_.byzantine_screening) {
        suspected = screen(usable);
        for (AgentRole role : suspected) {
            mark_excluded(role);
        }
        usable.erase(std::remove_if(usable.begin(), usable.end(), [&suspected](const Finding* f) {
            return std::find(suspected.begin(), suspected.end(), f->role) != suspected.end();
        }), usable.end());
    }

    double responding_weight = 0.0;
    std::vector<AgentRole> responders;
    for (const Finding* f : usable) {
        responding_weight += weights.at(f->role);
        responders.push_back(f->role);
    }

    if (usable.size() < config_.min_responders) {
        return insufficient_quorum(responding_weight,
            std::to_string(usable.size()) + " agent(s) responded, " +
            std::to_string(config_.min_responders) + " required" +
            (suspected.empty() ? std::string()
                               : " after setting aside " + std::to_string(suspected.size()) +
                                 " suspected agent(s)"));
    }
    if (responding_weight + kWeightEpsilon < config_.quorum_fraction) {
        return insufficient_quorum(responding_weight,
            "responding weight " + std::to_string(responding_weight) +
            " below quorum " + std::to_string(config_.quorum_fraction));
    }

    WeightTable normalized = renormalize(weights, responders);

    ConsensusDecision decision;
    decision.incident_id = incident_id;
    decision.round = round;
    decision.threshold = threshold_for(category);
    decision.decided_at = WallClock::now();

    std::unordered_map<ActionToken, ActionTally> tallies;
    for (const Finding* f : usable) {
        double static_w = weights.at(f->role);
        double norm_w = normalized.at(f->role);

        decision.weighted_confidence += norm_w * f->confidence;

        auto& tally = tallies[f->action];
        tally.vote += norm_w;
        tally.best_confidence = std::max(tally.best_confidence, f->confidence);
        tally.best_static_weight = std::max(tally.best_static_weight, static_w);

        decision.contributions.push_back(Contribution{f->role, static_w, norm_w, *f});
    }

    const ActionToken* winner = nullptr;
    const ActionTally* winner_tally = nullptr;
    for (auto& [action, tally] : tallies) {
        decision.action_votes[action] = tally.vote;
        if (!winner || outranks(action, tally, *winner, *winner_tally)) {
            winner = &action;
            winner_tally = &tally;
        }
    }
    decision.action = *winner;

    for (auto& [role, _] : weights) {
        if (!normalized.count(role)) {
            mark_excluded(role);
        }
    }
    std::sort(excluded_roles.begin(), excluded_roles.end(),
        [](AgentRole a, AgentRole b) { return static_cast<int>(a) < static_cast<int>(b); });
    decision.excluded_roles = std::move(excluded_roles);
    decision.suspected_roles = std::move(suspected);

    decision.autonomous_eligible =
        decision.weighted_confidence + kThresholdTolerance >= decision.threshold;

    ConsensusResult result;
    result.status = ConsensusStatus::Reached;
    result.responding_weight = responding_weight;
    result.reason = "action '" + decision.action + "' at confidence " +
                    std::to_string(decision.weighted_confidence);
    result.decision = std::move(decision);
    return result;
}

double ConsensusEngine::threshold_for(IncidentCategory category) const {
    auto it = config_.category_thresholds.find(category);
    return it != config_.category_thresholds.end() ? it->second : config_.default_threshold;
}

std::vector<AgentRole> ConsensusEngine::suspected_byzantine(const std::vector<Finding>& findings) const {
    std::vector<const Finding*> responders;
    responders.reserve(findings.size());
    for (const auto& f : findings) {
        responders.push_back(&f);
    }
    return screen(responders);
}

std::vector<AgentRole> ConsensusEngine::screen(const std::vector<const Finding*>& findings) const {
    std::vector<AgentRole> suspects;
    const std::size_t cap = byzantine_tolerance(findings.size());
    if (cap == 0) return suspects;

    // Upper median for an even count
    std::vector<double> confidences;
    std::map<ActionToken, std::size_t> backers;
    for (const Finding* f : findings) {
        confidences.push_back(f->confidence);
        backers[f->action]++;
    }
    std::sort(confidences.begin(), confidences.end());
    const double median = confidences[confidences.size() / 2];

    // std::map order makes the smallest token win a count tie
    auto leading = backers.begin();
    for (auto it = backers.begin(); it != backers.end(); ++it) {
        if (it->second > leading->second) leading = it;
    }
    const double agreement = static_cast<double>(leading->second) / findings.size();
    const bool split = backers.size() > 1 && agreement < config_.min_agreement;

    struct Suspect {
        AgentRole role;
        double score;
    };
    std::vector<Suspect> flagged;
    for (const Finding* f : findings) {
        double deviation = std::fabs(f->confidence - median);
        bool outlier = deviation > config_.max_confidence_deviation;
        bool defiant = split && f->action != leading->first &&
                       f->confidence > config_.minority_confidence_floor;
        if (outlier || defiant) {
            flagged.push_back({f->role, deviation + (defiant ? f->confidence : 0.0)});
        }
    }

    std::sort(flagged.begin(), flagged.end(), [](const Suspect& a, const Suspect& b) {
        if (a.score != b.score) return a.score > b.score;
        return static_cast<int>(a.role) < static_cast<int>(b.role);
    });
    if (flagged.size() > cap) flagged.resize(cap);

    for (const Suspect& s : flagged) {
        suspects.push_back(s.role);
    }
    std::sort(suspects.begin(), suspects.end(),
        [](AgentRole a, AgentRole b) { return static_cast<int>(a) < static_cast<int>(b); });
    return suspects;
}

const ConsensusConfig& ConsensusEngine::config() const noexcept {
    return config_;
}

WeightTable ConsensusEngine::renormalize(const WeightTable& weights,
                                         const std::vector<AgentRole>& responders) {
    double total = 0.0;
    for (AgentRole role : responders) {
        auto it = weights.find(role);
        if (it != weights.end()) total += it->second;
    }

    WeightTable normalized;
    if (total <= 0.0) return normalized;

    for (AgentRole role : responders) {
        auto it = weights.find(role);
        if (it != weights.end()) {
            normalized[role] = it->second / total;
        }
    }
    return normalized;
}

std::size_t ConsensusEngine::byzantine_tolerance(std::size_t agent_count) noexcept {
    return agent_count == 0 ? 0 : (agent_count - 1) / 3;
}

void ConsensusEngine::validate_weights(const WeightTable& weights) {
    if (weights.empty()) {
        throw InvalidConfigurationException("Weight table is empty");
    }
    double sum = 0.0;
    for (auto& [role, w] : weights) {
        if (!(w > 0.0 && w <= 1.0)) {
            throw InvalidConfigurationException(
                std::string("Weight for ") + to_string(role) +
                " must be in (0, 1], got " + std::to_string(w));
        }
        sum += w;
    }
    if (std::fabs(sum - 1.0) > kWeightEpsilon) {
        throw InvalidConfigurationException(
            "Weights must sum to 1.0, got " + std::to_string(sum));
    }
}

ConsensusResult ConsensusEngine::insufficient_quorum(double responding_weight,
                                                     std::string reason) const {
    ConsensusResult result;
    result.status = ConsensusStatus::InsufficientQuorum;
    result.responding_weight = responding_weight;
    result.reason = std::move(reason);
    return result;
}

} // namespace incidentguard
