#include "incidentguard/resolution_driver.hpp"
#include "incidentguard/exceptions.hpp"
#include "detached_call.hpp"

#include <algorithm>

namespace incidentguard {

// ========== IncidentLifecycle ==========

IncidentLifecycle::IncidentLifecycle(IncidentState initial)
    : state_(initial) {}

IncidentState IncidentLifecycle::state() const noexcept {
    return state_;
}

void IncidentLifecycle::advance(IncidentState to) {
    if (!is_valid_transition(state_, to)) {
        throw InvalidTransitionException(state_, to);
    }
    state_ = to;
}

bool IncidentLifecycle::is_valid_transition(IncidentState from, IncidentState to) noexcept {
    if (is_terminal(from)) return false;
    if (to == IncidentState::Abandoned) return true;

    switch (from) {
        case IncidentState::Pending:
            return to == IncidentState::Analyzing;
        case IncidentState::Analyzing:
            return to == IncidentState::Deciding;
        case IncidentState::Deciding:
            return to == IncidentState::Executing ||
                   to == IncidentState::Escalating ||
                   to == IncidentState::Analyzing;
        case IncidentState::Executing:
            return to == IncidentState::Resolved ||
                   to == IncidentState::Escalating;
        case IncidentState::Escalating:
            return to == IncidentState::EscalatedOpen;
        default:
            return false;
    }
}

// ========== ResolutionDriver ==========

ResolutionDriver::ResolutionDriver(ResolutionConfig config,
                                   std::shared_ptr<RemediationExecutor> executor,
                                   std::unique_ptr<ExecutionPolicy> policy)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , policy_(std::move(policy))
{
    if (!executor_) {
        throw InvalidConfigurationException("ResolutionDriver needs a remediation executor");
    }
    if (config_.max_rounds < 1 || config_.max_rounds > 2) {
        throw InvalidConfigurationException(
            "max_rounds must be 1 or 2, got " + std::to_string(config_.max_rounds));
    }
    if (!(config_.retry_margin >= 0.0 && config_.retry_margin <= 1.0)) {
        throw InvalidConfigurationException("retry_margin must be in [0, 1]");
    }
    if (config_.incident_timeout <= Duration::zero() ||
        config_.action_timeout <= Duration::zero()) {
        throw InvalidConfigurationException("incident and action timeouts must be positive");
    }
    if (config_.max_outstanding_actions == 0) {
        throw InvalidConfigurationException("max_outstanding_actions must be at least 1");
    }
    if (!policy_) {
        policy_ = std::make_unique<AllowListPolicy>(config_.auto_executable_actions,
                                                    config_.approval_required_actions);
    }
    calls_ = std::make_shared<CallTracker>(config_.max_outstanding_actions);
}

DriverVerdict ResolutionDriver::decide(const Incident& incident,
                                       const ConsensusResult& result,
                                       RoundNumber round,
                                       bool time_remaining) const {
    DriverVerdict v;

    if (!result.reached() || !result.decision.has_value()) {
        v.verdict = Verdict::Escalate;
        v.reason = EscalationReason::InsufficientQuorum;
        v.message = "insufficient quorum: " + result.reason;
        return v;
    }

    const auto& d = *result.decision;

    if (d.autonomous_eligible) {
        if (policy_->may_auto_execute(incident, d.action)) {
            v.verdict = Verdict::Execute;
            v.message = "executing '" + d.action + "' autonomously";
        } else {
            v.verdict = Verdict::Escalate;
            v.reason = EscalationReason::ActionNotAllowed;
            v.message = "action '" + d.action + "' requires human approval under " + policy_->name();
        }
        return v;
    }

    bool near_threshold = d.weighted_confidence >= d.threshold - config_.retry_margin;
    if (near_threshold && round < config_.max_rounds && time_remaining) {
        v.verdict = Verdict::AnotherRound;
        v.message = "confidence " + std::to_string(d.weighted_confidence) +
                    " just below threshold " + std::to_string(d.threshold);
        return v;
    }

    v.verdict = Verdict::Escalate;
    v.reason = EscalationReason::BelowThreshold;
    v.message = "confidence " + std::to_string(d.weighted_confidence) +
                " below threshold " + std::to_string(d.threshold);
    return v;
}

ExecutionOutcome ResolutionDriver::execute(const Incident& incident,
                                           const ConsensusDecision& decision,
                                           Timestamp deadline) {
    Timestamp effective = std::min(deadline, Clock::now() + config_.action_timeout);

    ExecutionOutcome outcome;
    if (!calls_->try_acquire()) {
        outcome.message = "executor saturated: " + std::to_string(calls_->outstanding()) +
                          " earlier action(s) still running";
        return outcome;
    }

    auto executor = executor_;
    auto future = detail::launch_detached([executor, incident, action = decision.action]() {
        return executor->execute(incident, action);
    }, calls_);

    if (future.wait_until(effective) != std::future_status::ready) {
        outcome.timed_out = true;
        outcome.message = "action '" + decision.action + "' did not finish in time";
        return outcome;
    }

    try {
        RemediationResult r = future.get();
        outcome.success = r.success;
        outcome.message = std::move(r.message);
    } catch (const std::exception& e) {
        outcome.message = std::string("action threw: ") + e.what();
    } catch (...) {
        outcome.message = "action threw a non-standard exception";
    }
    return outcome;
}

RollbackResult ResolutionDriver::rollback(const Incident& incident,
                                          const ConsensusDecision& decision,
                                          Timestamp deadline) {
    Timestamp effective = std::min(deadline, Clock::now() + config_.action_timeout);

    RollbackResult result;
    if (!calls_->try_acquire()) {
        result.message = "executor saturated, rollback of '" + decision.action + "' skipped";
        return result;
    }

    auto executor = executor_;
    auto future = detail::launch_detached([executor, incident, action = decision.action]() {
        return executor->rollback(incident, action);
    }, calls_);

    if (future.wait_until(effective) != std::future_status::ready) {
        result.attempted = true;
        result.message = "rollback of '" + decision.action + "' did not finish in time";
        return result;
    }

    try {
        result = future.get();
    } catch (const std::exception& e) {
        result.attempted = true;
        result.success = false;
        result.message = std::string("rollback threw: ") + e.what();
    } catch (...) {
        result.attempted = true;
        result.success = false;
        result.message = "rollback threw a non-standard exception";
    }
    return result;
}

const ResolutionConfig& ResolutionDriver::config() const noexcept {
    return config_;
}

const ExecutionPolicy& ResolutionDriver::policy() const noexcept {
    return *policy_;
}

const std::shared_ptr<CallTracker>& ResolutionDriver::call_tracker() const noexcept {
    return calls_;
}

} // namespace incidentguard
