// 02_degraded_agents.cpp
//
// Demonstrates how IncidentGuard keeps deciding while agents misbehave.
//
// Scenario:
//   - The Diagnosis agent's model endpoint is down and throws on every call.
//     After two failures its circuit breaker opens and later incidents skip
//     it entirely; the remaining weights are renormalized.
//   - The Prediction agent is slow and blows its per-call timeout, so its
//     breaker opens as well.
//   - Detection and Resolution carry the decision on their own.
//   - Once Resolution goes down too, a lone responder is left and the
//     incident is escalated for insufficient quorum.
//   - MetricsMonitor and ConsoleMonitor are combined with CompositeMonitor.

#include <incidentguard/incidentguard.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace incidentguard;
using namespace std::chrono_literals;

class SteadyProvider : public AnalysisProvider {
public:
    SteadyProvider(double confidence, std::string action)
        : confidence_(confidence), action_(std::move(action)) {}

    ProviderResponse analyze(const AnalysisContext&) override {
        return ProviderResponse{confidence_, action_, "steady"};
    }

private:
    double confidence_;
    std::string action_;
};

class BrokenProvider : public AnalysisProvider {
public:
    ProviderResponse analyze(const AnalysisContext&) override {
        throw std::runtime_error("model endpoint returned 503");
    }
};

// Sleeps well past its timeout unless the harness cancels it first
class SlowProvider : public AnalysisProvider {
public:
    ProviderResponse analyze(const AnalysisContext& context) override {
        for (int i = 0; i < 100 && !context.cancelled(); ++i) {
            std::this_thread::sleep_for(10ms);
        }
        return ProviderResponse{0.99, std::string("rollback"), "too late"};
    }
};

// Fails only while `down` is set
class FlakyProvider : public AnalysisProvider {
public:
    explicit FlakyProvider(std::atomic<bool>& down) : down_(down) {}

    ProviderResponse analyze(const AnalysisContext&) override {
        if (down_.load()) throw std::runtime_error("connection reset");
        return ProviderResponse{0.9, std::string("restart_pods"), "recovered"};
    }

private:
    std::atomic<bool>& down_;
};

class PrintingExecutor : public RemediationExecutor {
public:
    RemediationResult execute(const Incident& incident, const ActionToken& action) override {
        std::cout << "  >>> executing '" << action << "' for incident " << incident.id << "\n";
        return RemediationResult{true, "done"};
    }
};

static Agent make_agent(AgentRole role, double weight, std::shared_ptr<AnalysisProvider> provider) {
    AgentDescriptor d;
    d.role = role;
    d.weight = weight;
    d.timeout = 200ms;
    return Agent(d, std::move(provider));
}

static void print_breakers(Orchestrator& orch) {
    for (const auto& s : orch.circuit_breakers().snapshot()) {
        std::cout << "  " << to_string(s.role) << ": " << to_string(s.state)
                  << " (failures " << s.total_failures
                  << ", successes " << s.total_successes << ")\n";
    }
}

int main() {
    std::cout << "=== IncidentGuard: Degraded Agents Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configuration: breakers open after 2 failures, cool down fast.
    // ----------------------------------------------------------------
    Config config;
    config.consensus.default_threshold = 0.70;
    config.breaker.failure_threshold = 2;
    config.breaker.cooldown = 300ms;
    config.resolution.incident_timeout = 5s;
    config.resolution.auto_executable_actions[IncidentCategory::InfrastructureCascade] =
        {"restart_pods", "rollback"};

    std::atomic<bool> resolution_down{false};

    std::vector<Agent> agents;
    agents.push_back(make_agent(AgentRole::Detection, 0.3,
                                std::make_shared<SteadyProvider>(0.85, "restart_pods")));
    agents.push_back(make_agent(AgentRole::Diagnosis, 0.3, std::make_shared<BrokenProvider>()));
    agents.push_back(make_agent(AgentRole::Prediction, 0.1, std::make_shared<SlowProvider>()));
    agents.push_back(make_agent(AgentRole::Resolution, 0.3,
                                std::make_shared<FlakyProvider>(resolution_down)));

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);

    Orchestrator orch(std::move(agents), std::make_shared<PrintingExecutor>(), config);
    orch.set_monitor(composite);

    AlertPayload alert;
    alert.category = IncidentCategory::InfrastructureCascade;
    alert.severity = Severity::High;
    alert.description = "checkout pods crash-looping";

    // ----------------------------------------------------------------
    // 2. Two incidents: Diagnosis and Prediction fail each time.
    //    Detection and Resolution hold 0.6 of the static weight, enough
    //    for quorum, and agree on restart_pods.
    // ----------------------------------------------------------------
    for (int i = 0; i < 2; ++i) {
        IncidentId id = orch.submit_alert(alert);
        IncidentState state = orch.wait_for_terminal(id, 10s);
        std::cout << "Incident " << id << " -> " << to_string(state) << "\n";
    }

    std::cout << "\nBreakers after two incidents:\n";
    print_breakers(orch);

    // ----------------------------------------------------------------
    // 3. A third incident skips both open breakers.
    // ----------------------------------------------------------------
    IncidentId skipped = orch.submit_alert(alert);
    orch.wait_for_terminal(skipped, 10s);
    auto replay = orch.ledger().replay(skipped);
    if (!replay.decisions.empty()) {
        std::cout << "\nIncident " << skipped << " decided without:";
        for (auto role : replay.decisions.front().excluded_roles) {
            std::cout << " " << to_string(role);
        }
        std::cout << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Take Resolution down too: only Detection answers, which is
    //    below the minimum responder count.
    // ----------------------------------------------------------------
    resolution_down = true;
    IncidentId lone = orch.submit_alert(alert);
    orch.wait_for_terminal(lone, 10s);

    std::cout << "\n=== Escalations ===\n";
    for (const auto& record : orch.escalations()) {
        std::cout << "  incident " << record.incident_id << ": " << to_string(record.reason)
                  << " (" << record.findings.size() << " findings, "
                  << record.failures.size() << " failures)\n";
        for (const auto& f : record.failures) {
            std::cout << "    " << to_string(f.role) << " " << to_string(f.kind)
                      << ": " << f.message << "\n";
        }
    }

    // ----------------------------------------------------------------
    // 5. Metrics summary.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n"
              << "  Opened:            " << m.incidents_opened << "\n"
              << "  Resolved:          " << m.incidents_resolved << "\n"
              << "  Escalated:         " << m.incidents_escalated << "\n"
              << "  Dispatch failures: " << m.dispatch_failures << "\n"
              << "  Quorum failures:   " << m.quorum_failures << "\n"
              << "  Circuits opened:   " << m.circuits_opened << "\n";

    orch.stop();
    std::cout << "\n=== Done ===\n";
    return 0;
}
