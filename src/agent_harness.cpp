#include "incidentguard/agent_harness.hpp"
#include "detached_call.hpp"

#include <algorithm>
#include <cmath>

namespace incidentguard {

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(5);

} // anonymous namespace

AgentHarness::AgentHarness(const Agent& agent, CircuitBreaker* breaker)
    : agent_(agent)
    , breaker_(breaker)
{}

DispatchResult AgentHarness::invoke(const Incident& incident,
                                    RoundNumber round,
                                    Timestamp deadline,
                                    std::shared_ptr<const std::atomic<bool>> cancel_flag) {
    Timestamp own_deadline = Clock::now() + agent_.timeout();
    Timestamp effective = std::min(deadline, own_deadline);

    DispatchResult result = attempt(incident, round, effective, cancel_flag);

    // Only provider errors are retried; a timeout has already spent the
    // budget and invalid output would just be produced again.
    for (std::size_t retry = 0;
         retry < agent_.max_retries() &&
         !result.ok() &&
         result.failure->kind == DispatchFailureKind::ProviderError &&
         Clock::now() < effective;
         ++retry) {
        result = attempt(incident, round, effective, cancel_flag);
    }

    // The caller's deadline fired before the agent's own timeout did
    if (!result.ok() &&
        result.failure->kind == DispatchFailureKind::Timeout &&
        deadline < own_deadline) {
        result.failure->kind = DispatchFailureKind::Cancelled;
        result.failure->message = "caller deadline reached before the agent timeout";
    }

    report(result);
    return result;
}

std::optional<std::string> AgentHarness::validate(const ProviderResponse& response) {
    if (!response.confidence.has_value()) {
        return std::string("missing confidence");
    }
    double c = response.confidence.value();
    if (!std::isfinite(c) || c < 0.0 || c > 1.0) {
        return "confidence out of range: " + std::to_string(c);
    }
    if (!response.action.has_value() || response.action->empty()) {
        return std::string("missing recommended action");
    }
    return std::nullopt;
}

DispatchResult AgentHarness::attempt(const Incident& incident,
                                     RoundNumber round,
                                     Timestamp deadline,
                                     const std::shared_ptr<const std::atomic<bool>>& cancel_flag) {
    if (cancel_flag && cancel_flag->load()) {
        return make_failure(DispatchFailureKind::Cancelled, "round cancelled before dispatch");
    }

    AnalysisContext context;
    context.incident = incident;
    context.round = round;
    context.deadline = deadline;
    context.cancel_flag = cancel_flag;

    const auto& tracker = agent_.call_tracker();
    if (!tracker->try_acquire()) {
        return make_failure(DispatchFailureKind::Saturated,
            std::to_string(tracker->outstanding()) + " earlier call(s) still running");
    }

    auto provider = agent_.provider();
    auto future = detail::launch_detached([provider, context]() {
        return provider->analyze(context);
    }, tracker);

    // Wait in short slices so a cancelled round is noticed promptly
    while (future.wait_for(kCancelPollInterval) != std::future_status::ready) {
        if (cancel_flag && cancel_flag->load()) {
            return make_failure(DispatchFailureKind::Cancelled, "cancelled while awaiting provider");
        }
        if (Clock::now() >= deadline) {
            return make_failure(DispatchFailureKind::Timeout, "no response before deadline");
        }
    }

    ProviderResponse response;
    try {
        response = future.get();
    } catch (const std::exception& e) {
        return make_failure(DispatchFailureKind::ProviderError, e.what());
    } catch (...) {
        return make_failure(DispatchFailureKind::ProviderError, "provider threw a non-standard exception");
    }

    if (auto problem = validate(response)) {
        return make_failure(DispatchFailureKind::InvalidOutput, *problem);
    }

    Finding finding;
    finding.role = agent_.role();
    finding.incident_id = incident.id;
    finding.round = round;
    finding.confidence = response.confidence.value();
    finding.action = std::move(response.action.value());
    finding.evidence = std::move(response.evidence);
    finding.produced_at = WallClock::now();

    DispatchResult result;
    result.finding = std::move(finding);
    return result;
}

DispatchResult AgentHarness::make_failure(DispatchFailureKind kind, std::string message) const {
    DispatchResult result;
    result.failure = DispatchFailure{agent_.role(), kind, std::move(message)};
    return result;
}

std::optional<BreakerState> AgentHarness::breaker_transition() const noexcept {
    return breaker_transition_;
}

void AgentHarness::report(const DispatchResult& result) {
    breaker_transition_.reset();
    if (!breaker_) return;

    if (result.ok()) {
        breaker_transition_ = breaker_->record_success();
    } else if (result.failure->kind != DispatchFailureKind::Cancelled) {
        // Cancellation comes from the caller, not the agent
        breaker_transition_ = breaker_->record_failure();
    }
}

} // namespace incidentguard
