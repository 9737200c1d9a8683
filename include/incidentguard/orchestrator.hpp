#pragma once

#include "incidentguard/types.hpp"
#include "incidentguard/config.hpp"
#include "incidentguard/agent.hpp"
#include "incidentguard/circuit_breaker.hpp"
#include "incidentguard/consensus_engine.hpp"
#include "incidentguard/incident_ledger.hpp"
#include "incidentguard/monitor.hpp"
#include "incidentguard/policy.hpp"
#include "incidentguard/resolution_driver.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace incidentguard {

// Alert intake and incident driver. Each incident runs on its own worker
// thread: rounds of parallel agent dispatch, weighted consensus, then
// autonomous remediation or escalation to a human. Every step is recorded
// in the ledger and published to the monitor.
//
// Monitor events go through a bounded queue drained by one publisher
// thread, so a slow monitor never holds up intake or an incident.
class Orchestrator {
public:
    // Null breakers/ledger are created internally; an injected registry must
    // hold a breaker for every agent role. A null policy means the
    // allow-list policy from config.resolution. Incident IDs continue past
    // the highest ID already in an injected ledger, which may be shared
    // with other orchestrators.
    Orchestrator(std::vector<Agent> agents,
                 std::shared_ptr<RemediationExecutor> executor,
                 Config config = Config{},
                 std::shared_ptr<CircuitBreakerRegistry> breakers = nullptr,
                 std::shared_ptr<IncidentLedger> ledger = nullptr,
                 std::unique_ptr<ExecutionPolicy> policy = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ==================== Intake ====================

    // Records the incident and returns its ID; analysis continues on a
    // worker thread. Throws InvalidAlertException for an empty description.
    IncidentId submit_alert(AlertPayload alert);

    // ==================== Queries ====================

    std::optional<Incident> get_incident(IncidentId id) const;

    // Blocks until the incident reaches a terminal state or timeout elapses.
    // Once terminal, also waits (within timeout) for queued monitor events
    // to be delivered. Returns the state at return time. Throws
    // IncidentNotFoundException.
    IncidentState wait_for_terminal(IncidentId id, Duration timeout) const;

    std::vector<EscalationRecord> escalations() const;
    std::optional<EscalationRecord> escalation_for(IncidentId id) const;

    std::size_t active_incident_count() const;

    // Static weight table used for a category
    const WeightTable& weights_for(IncidentCategory category) const;

    const IncidentLedger& ledger() const noexcept;
    CircuitBreakerRegistry& circuit_breakers() noexcept;
    const ConsensusEngine& consensus_engine() const noexcept;

    // ==================== Configuration ====================

    // Replaces the monitor. Events already queued for the previous one are
    // delivered to it first. Null disables publishing.
    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Cancels every in-flight incident (they end Abandoned) and joins the
    // workers, then waits up to config.runtime.shutdown_grace for provider
    // and executor calls still running and for queued monitor events.
    // Further submit_alert calls throw.
    void stop();
    bool is_running() const noexcept;

private:
    struct IncidentContext;
    struct RoundOutcome;

    Config config_;
    std::vector<Agent> agents_;
    CategoryMap<WeightTable> weights_;

    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    std::shared_ptr<IncidentLedger> ledger_;
    ConsensusEngine engine_;
    ResolutionDriver driver_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<AsyncMonitor> publisher_;

    // Incident snapshots and cancellation flags
    mutable std::mutex state_mutex_;
    mutable std::condition_variable terminal_cv_;
    std::unordered_map<IncidentId, Incident> incidents_;
    std::unordered_map<IncidentId, std::shared_ptr<std::atomic<bool>>> cancel_flags_;
    std::unordered_map<IncidentId, EscalationRecord> escalations_;

    // Worker threads; finished ones are joined on the next intake
    std::mutex workers_mutex_;
    std::unordered_map<IncidentId, std::thread> workers_;
    std::vector<IncidentId> finished_workers_;

    std::atomic<bool> running_{true};
    std::atomic<IncidentId> next_incident_id_{1};

    // Internal helpers
    void build_weight_tables();
    void run_incident(IncidentContext& ctx);
    RoundOutcome run_round(IncidentContext& ctx, RoundNumber round);
    void transition(IncidentContext& ctx, IncidentLifecycle& lifecycle, IncidentState to,
                    LedgerEventType type, const std::string& message,
                    std::optional<EscalationReason> reason = std::nullopt);
    void escalate(IncidentContext& ctx, IncidentLifecycle& lifecycle,
                  EscalationReason reason, const std::string& message);
    void abandon(IncidentContext& ctx, IncidentLifecycle& lifecycle, const std::string& message);
    void fail_internal(IncidentContext& ctx, IncidentLifecycle& lifecycle, const std::string& message);
    void fail_unrecorded(IncidentContext& ctx, const std::string& message);
    void append(IncidentContext& ctx, LedgerEvent event);
    std::string roll_back(IncidentContext& ctx, const ConsensusDecision& decision, RoundNumber round);
    void skip_recorded_ids();
    void wait_for_outstanding_calls(Timestamp deadline) const;
    std::shared_ptr<AsyncMonitor> current_publisher() const;
    EscalationRecord make_escalation(const IncidentContext& ctx, EscalationReason reason,
                                     const std::string& message) const;
    bool deadline_passed(const IncidentContext& ctx) const;
    void reap_finished_workers();
    void mark_state(IncidentId id, IncidentState state);
    void emit_event(MonitorEvent event);
};

} // namespace incidentguard
