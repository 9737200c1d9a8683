#pragma once

#include "incidentguard/types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace incidentguard {

enum class EventType {
    IncidentOpened,
    RoundStarted,
    FindingRecorded,
    DispatchFailed,
    ConsensusReached,
    QuorumFailed,
    ActionExecuted,
    ActionRolledBack,
    AgentSuspected,
    Escalated,
    Resolved,
    Abandoned,
    // Circuit breaker transitions
    CircuitOpened,
    CircuitHalfOpened,
    CircuitClosed
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<IncidentId> incident_id;
    std::optional<RoundNumber> round;
    std::optional<AgentRole> role;
    std::optional<IncidentState> state;

    std::optional<Finding> finding;
    std::optional<DispatchFailureKind> failure_kind;
    std::optional<ConsensusDecision> decision;
    std::optional<EscalationRecord> escalation;
    std::optional<BreakerState> breaker_state;

    // Time from intake to this event, for terminal events
    std::optional<double> elapsed_ms;
};

// Abstract monitor interface. The orchestrator delivers events from a
// single publisher thread, so a slow implementation only delays other
// subscribers, never an incident.
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t incidents_opened{0};
        std::uint64_t incidents_resolved{0};
        std::uint64_t incidents_escalated{0};
        std::uint64_t incidents_abandoned{0};
        std::uint64_t rounds_started{0};
        std::uint64_t findings_recorded{0};
        std::uint64_t dispatch_failures{0};
        std::uint64_t quorum_failures{0};
        std::uint64_t circuits_opened{0};
        std::uint64_t rollbacks_attempted{0};
        std::uint64_t agents_suspected{0};
        double average_time_to_terminal_ms{0.0};
        double average_weighted_confidence{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    // Fires when the share of terminal incidents that ended in escalation
    // or abandonment exceeds `threshold` (0..1). Needs `min_samples`
    // terminal incidents before it can fire.
    using AlertCallback = std::function<void(const std::string&)>;
    void set_escalation_rate_alert(double threshold, std::size_t min_samples, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double escalation_rate_threshold_{1.1};  // > 1.0 means disabled
    std::size_t escalation_min_samples_{0};
    AlertCallback escalation_cb_;

    std::uint64_t terminal_sample_count_{0};
    double terminal_time_sum_ms_{0.0};
    std::uint64_t decision_count_{0};
    double confidence_sum_{0.0};

    void check_escalation_rate();
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

// Decouples the core from slow or absent consumers. on_event only enqueues;
// a background thread delivers to the downstream monitor. When the queue is
// full the oldest pending event is dropped, so publishing never blocks.
class AsyncMonitor : public Monitor {
public:
    explicit AsyncMonitor(std::shared_ptr<Monitor> downstream, std::size_t capacity = 1024);
    ~AsyncMonitor() override;

    AsyncMonitor(const AsyncMonitor&) = delete;
    AsyncMonitor& operator=(const AsyncMonitor&) = delete;

    void on_event(const MonitorEvent& event) override;

    // Blocks until everything queued so far was delivered or timeout elapses
    bool flush(Duration timeout);

    // Drops everything not yet handed to the downstream monitor and
    // returns how many events that was
    std::size_t discard_pending();

    // Delivers what is still queued, then joins the dispatcher
    void stop();

    std::uint64_t dropped_count() const noexcept;
    std::size_t pending() const;

private:
    std::shared_ptr<Monitor> downstream_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<MonitorEvent> queue_;
    bool delivering_{false};
    bool stopping_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::thread dispatcher_;

    void dispatch_loop();
};

} // namespace incidentguard
