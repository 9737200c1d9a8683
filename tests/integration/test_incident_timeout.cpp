#include <gtest/gtest.h>
#include <incidentguard/incidentguard.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace incidentguard;
using namespace std::chrono_literals;

// ===========================================================================
// Test doubles
// ===========================================================================

// Sleeps for `delay` (or until cancelled) before answering
class SlowProvider : public AnalysisProvider {
public:
    explicit SlowProvider(Duration delay, double confidence = 0.9)
        : delay_(delay), confidence_(confidence) {}

    ProviderResponse analyze(const AnalysisContext& context) override {
        auto until = Clock::now() + delay_;
        while (Clock::now() < until && !context.cancelled()) {
            std::this_thread::sleep_for(2ms);
        }
        return ProviderResponse{confidence_, ActionToken("scale_out"), ""};
    }

private:
    Duration delay_;
    double confidence_;
};

class SlowExecutor : public RemediationExecutor {
public:
    explicit SlowExecutor(Duration delay) : delay_(delay) {}

    RemediationResult execute(const Incident&, const ActionToken&) override {
        calls_++;
        std::this_thread::sleep_for(delay_);
        return RemediationResult{true, "finished late"};
    }

    int calls() const { return calls_.load(); }

private:
    Duration delay_;
    std::atomic<int> calls_{0};
};

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    bool has_event_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& e : events_) {
            if (e.type == type) return true;
        }
        return false;
    }
private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

static std::vector<Agent> make_agents(Duration provider_delay, Duration agent_timeout) {
    std::vector<Agent> agents;
    const std::vector<std::pair<AgentRole, double>> weights = {
        {AgentRole::Detection, 0.25},
        {AgentRole::Diagnosis, 0.25},
        {AgentRole::Prediction, 0.25},
        {AgentRole::Resolution, 0.25},
    };
    for (const auto& [role, weight] : weights) {
        AgentDescriptor d;
        d.role = role;
        d.weight = weight;
        d.timeout = agent_timeout;
        agents.emplace_back(d, std::make_shared<SlowProvider>(provider_delay));
    }
    return agents;
}

static AlertPayload make_alert() {
    AlertPayload alert;
    alert.category = IncidentCategory::LatencyDegradation;
    alert.severity = Severity::Medium;
    alert.description = "p99 latency 4x baseline";
    return alert;
}

static Config make_config(Duration incident_timeout, Duration action_timeout) {
    Config config;
    config.consensus.default_threshold = 0.70;
    config.resolution.auto_executable_actions[IncidentCategory::LatencyDegradation] = {"scale_out"};
    config.resolution.incident_timeout = incident_timeout;
    config.resolution.action_timeout = action_timeout;
    return config;
}

// ===========================================================================
// Overall incident deadline
// ===========================================================================

TEST(IncidentTimeoutTest, DeadlineBeforeAnyRoundCompletesAbandons) {
    auto executor = std::make_shared<SlowExecutor>(Duration::zero());
    auto monitor = std::make_shared<TestMonitor>();
    Orchestrator orch(make_agents(2s, 5s), executor, make_config(100ms, 1s));
    orch.set_monitor(monitor);

    IncidentId id = orch.submit_alert(make_alert());
    EXPECT_EQ(orch.wait_for_terminal(id, 3s), IncidentState::Abandoned);

    auto events = orch.ledger().events(id);
    bool saw_abandoned = false;
    for (const auto& e : events) {
        EXPECT_NE(e.type, LedgerEventType::FindingRecorded);
        if (e.type == LedgerEventType::Abandoned) saw_abandoned = true;
    }
    EXPECT_TRUE(saw_abandoned);

    auto replay = orch.ledger().replay(id);
    EXPECT_EQ(replay.state, IncidentState::Abandoned);
    EXPECT_TRUE(replay.findings.empty());
    EXPECT_EQ(executor->calls(), 0);

    auto record = orch.escalation_for(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->reason, EscalationReason::Abandoned);
    EXPECT_TRUE(monitor->has_event_type(EventType::Abandoned));
}

TEST(IncidentTimeoutTest, ActionOutlivingIncidentDeadlineAbandons) {
    auto executor = std::make_shared<SlowExecutor>(1s);
    Orchestrator orch(make_agents(Duration::zero(), 1s), executor, make_config(300ms, 5s));

    IncidentId id = orch.submit_alert(make_alert());
    EXPECT_EQ(orch.wait_for_terminal(id, 3s), IncidentState::Abandoned);
    EXPECT_EQ(executor->calls(), 1);
    EXPECT_FALSE(orch.ledger().replay(id).executed_action.has_value());
}

// ===========================================================================
// Action timeout
// ===========================================================================

TEST(IncidentTimeoutTest, SlowActionEscalatesAsTimedOut) {
    auto executor = std::make_shared<SlowExecutor>(500ms);
    Orchestrator orch(make_agents(Duration::zero(), 1s), executor, make_config(5s, 50ms));

    IncidentId id = orch.submit_alert(make_alert());
    EXPECT_EQ(orch.wait_for_terminal(id, 3s), IncidentState::EscalatedOpen);

    auto record = orch.escalation_for(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->reason, EscalationReason::ActionTimedOut);
    ASSERT_TRUE(record->decision.has_value());
    EXPECT_EQ(record->decision->action, "scale_out");
}

// ===========================================================================
// Shutdown
// ===========================================================================

TEST(IncidentTimeoutTest, StopAbandonsInFlightIncidents) {
    auto executor = std::make_shared<SlowExecutor>(Duration::zero());
    Orchestrator orch(make_agents(10s, 20s), executor, make_config(60s, 1s));

    IncidentId a = orch.submit_alert(make_alert());
    IncidentId b = orch.submit_alert(make_alert());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(orch.active_incident_count(), 2u);

    auto start = Clock::now();
    orch.stop();
    EXPECT_LT(Clock::now() - start, 2s);

    EXPECT_FALSE(orch.is_running());
    EXPECT_EQ(orch.get_incident(a)->state, IncidentState::Abandoned);
    EXPECT_EQ(orch.get_incident(b)->state, IncidentState::Abandoned);
    EXPECT_EQ(orch.active_incident_count(), 0u);
    EXPECT_THROW(orch.submit_alert(make_alert()), IncidentGuardException);
}

TEST(IncidentTimeoutTest, CancelledAgentsAreNotChargedToBreakers) {
    auto executor = std::make_shared<SlowExecutor>(Duration::zero());
    Orchestrator orch(make_agents(10s, 20s), executor, make_config(60s, 1s));

    orch.submit_alert(make_alert());
    std::this_thread::sleep_for(30ms);
    orch.stop();

    for (const auto& stats : orch.circuit_breakers().snapshot()) {
        EXPECT_EQ(stats.total_failures, 0u) << to_string(stats.role);
        EXPECT_EQ(stats.state, BreakerState::Closed);
    }
}

// ===========================================================================
// Breakers and the incident deadline
// ===========================================================================

TEST(IncidentTimeoutTest, IncidentDeadlineIsNotChargedToBreakers) {
    Config config = make_config(50ms, 1s);
    config.breaker.failure_threshold = 3;
    auto registry = std::make_shared<CircuitBreakerRegistry>(
        std::vector<AgentRole>{AgentRole::Detection, AgentRole::Diagnosis,
                               AgentRole::Prediction, AgentRole::Resolution},
        config.breaker);
    auto executor = std::make_shared<SlowExecutor>(Duration::zero());

    {
        // Agents answer well inside their own 1s timeout, but after the
        // 50ms incident deadline
        Orchestrator hurried(make_agents(150ms, 1s), executor, config, registry);
        for (int i = 0; i < 3; ++i) {
            IncidentId id = hurried.submit_alert(make_alert());
            ASSERT_EQ(hurried.wait_for_terminal(id, 3s), IncidentState::Abandoned);

            for (const auto& e : hurried.ledger().events(id)) {
                if (e.type == LedgerEventType::DispatchFailed) {
                    ASSERT_TRUE(e.failure.has_value());
                    EXPECT_EQ(e.failure->kind, DispatchFailureKind::Cancelled);
                }
            }
        }
    }

    for (const auto& stats : registry->snapshot()) {
        EXPECT_EQ(stats.state, BreakerState::Closed) << to_string(stats.role);
        EXPECT_EQ(stats.total_failures, 0u) << to_string(stats.role);
    }

    // The same healthy agents still serve an incident with room to finish
    Orchestrator patient(make_agents(150ms, 1s), executor, make_config(10s, 1s), registry);
    IncidentId id = patient.submit_alert(make_alert());
    EXPECT_EQ(patient.wait_for_terminal(id, 5s), IncidentState::Resolved);
    EXPECT_EQ(patient.ledger().replay(id).findings.size(), 4u);
}
