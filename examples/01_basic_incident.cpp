// 01_basic_incident.cpp
//
// Minimal IncidentGuard example: four analysis agents look at one incident.
//
// Scenario:
//   - Detection, Diagnosis, Prediction and Resolution agents carry static
//     weights 0.2 / 0.4 / 0.3 / 0.1.
//   - A resource-exhaustion alert comes in.  Every agent recommends an
//     action with a confidence score.
//   - The weighted confidence clears the 0.70 threshold and "scale_out" is
//     on the allow-list, so the action runs without a human.
//   - The ledger is replayed at the end to show the audit trail.

#include <incidentguard/incidentguard.hpp>

#include <iostream>
#include <string>

using namespace incidentguard;
using namespace std::chrono_literals;

// Stand-in for a model-backed analyzer: always answers the same thing.
class CannedProvider : public AnalysisProvider {
public:
    CannedProvider(double confidence, std::string action, std::string evidence)
        : confidence_(confidence), action_(std::move(action)), evidence_(std::move(evidence)) {}

    ProviderResponse analyze(const AnalysisContext& context) override {
        std::cout << "  [" << context.incident.description << "] analyzing, round "
                  << context.round << "\n";
        return ProviderResponse{confidence_, action_, evidence_};
    }

private:
    double confidence_;
    std::string action_;
    std::string evidence_;
};

// Stand-in for the cluster API.
class PrintingExecutor : public RemediationExecutor {
public:
    RemediationResult execute(const Incident& incident, const ActionToken& action) override {
        std::cout << "  >>> executing '" << action << "' for incident " << incident.id << "\n";
        return RemediationResult{true, "replicas 4 -> 8"};
    }
};

static Agent make_agent(AgentRole role, double weight, double confidence,
                        const std::string& action, const std::string& evidence) {
    AgentDescriptor d;
    d.role = role;
    d.weight = weight;
    d.timeout = 2s;
    return Agent(d, std::make_shared<CannedProvider>(confidence, action, evidence));
}

int main() {
    std::cout << "=== IncidentGuard: Basic Incident Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configure thresholds and the actions allowed to run unattended.
    // ----------------------------------------------------------------
    Config config;
    config.consensus.default_threshold = 0.70;
    config.resolution.auto_executable_actions[IncidentCategory::ResourceExhaustion] =
        {"scale_out", "clear_cache"};
    config.resolution.approval_required_actions = {"failover_region"};

    // ----------------------------------------------------------------
    // 2. Create the agents.  Weights must sum to 1.0.
    // ----------------------------------------------------------------
    std::vector<Agent> agents;
    agents.push_back(make_agent(AgentRole::Detection, 0.2, 0.90, "scale_out",
                                "request rate 3x baseline"));
    agents.push_back(make_agent(AgentRole::Diagnosis, 0.4, 0.85, "scale_out",
                                "heap at 95% on all api pods"));
    agents.push_back(make_agent(AgentRole::Prediction, 0.3, 0.80, "scale_out",
                                "OOM expected within 4 minutes"));
    agents.push_back(make_agent(AgentRole::Resolution, 0.1, 0.95, "clear_cache",
                                "cache holds 40% of heap"));

    Orchestrator orch(std::move(agents), std::make_shared<PrintingExecutor>(), config);
    orch.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 3. Submit the alert and wait for the outcome.
    // ----------------------------------------------------------------
    AlertPayload alert;
    alert.category = IncidentCategory::ResourceExhaustion;
    alert.severity = Severity::High;
    alert.description = "api tier memory pressure";
    alert.evidence = "container_memory_working_set_bytes > 0.9 * limit";

    IncidentId id = orch.submit_alert(alert);
    IncidentState final_state = orch.wait_for_terminal(id, 30s);
    std::cout << "\nIncident " << id << " finished as " << to_string(final_state) << "\n\n";

    // ----------------------------------------------------------------
    // 4. Replay the ledger.
    // ----------------------------------------------------------------
    std::cout << "=== Ledger ===\n";
    for (const auto& e : orch.ledger().events(id)) {
        std::cout << "  v" << e.version << " " << to_string(e.type);
        if (e.state) std::cout << " -> " << to_string(*e.state);
        if (!e.message.empty()) std::cout << " (" << e.message << ")";
        std::cout << "\n";
    }

    auto replay = orch.ledger().replay(id);
    for (const auto& decision : replay.decisions) {
        std::cout << "\nRound " << decision.round << ": action '" << decision.action
                  << "' at weighted confidence " << decision.weighted_confidence
                  << " (threshold " << decision.threshold << ")\n";
        for (const auto& c : decision.contributions) {
            std::cout << "  " << to_string(c.role) << ": weight " << c.normalized_weight
                      << ", confidence " << c.finding.confidence
                      << ", recommends '" << c.finding.action << "'\n";
        }
    }

    orch.stop();
    std::cout << "\n=== Done ===\n";
    return 0;
}
