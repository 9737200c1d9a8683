#include "incidentguard/monitor.hpp"

#include <iostream>
#include <iomanip>

namespace incidentguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::IncidentOpened:    return "IncidentOpened";
        case EventType::RoundStarted:      return "RoundStarted";
        case EventType::FindingRecorded:   return "FindingRecorded";
        case EventType::DispatchFailed:    return "DispatchFailed";
        case EventType::ConsensusReached:  return "ConsensusReached";
        case EventType::QuorumFailed:      return "QuorumFailed";
        case EventType::ActionExecuted:    return "ActionExecuted";
        case EventType::ActionRolledBack:  return "ActionRolledBack";
        case EventType::AgentSuspected:    return "AgentSuspected";
        case EventType::Escalated:         return "Escalated";
        case EventType::Resolved:          return "Resolved";
        case EventType::Abandoned:         return "Abandoned";
        case EventType::CircuitOpened:     return "CircuitOpened";
        case EventType::CircuitHalfOpened: return "CircuitHalfOpened";
        case EventType::CircuitClosed:     return "CircuitClosed";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::IncidentOpened:
        case EventType::ConsensusReached:
        case EventType::QuorumFailed:
        case EventType::ActionExecuted:
        case EventType::ActionRolledBack:
        case EventType::AgentSuspected:
        case EventType::Escalated:
        case EventType::Resolved:
        case EventType::Abandoned:
        case EventType::CircuitOpened:
        case EventType::CircuitClosed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[IncidentGuard] " << to_string(event.type);

    if (event.incident_id.has_value()) {
        std::cout << " incident=" << event.incident_id.value();
    }
    if (event.round.has_value()) {
        std::cout << " round=" << event.round.value();
    }
    if (event.role.has_value()) {
        std::cout << " role=" << to_string(event.role.value());
    }
    if (event.state.has_value()) {
        std::cout << " state=" << to_string(event.state.value());
    }
    if (event.failure_kind.has_value()) {
        std::cout << " failure=" << to_string(event.failure_kind.value());
    }
    if (event.decision.has_value()) {
        std::cout << " action=" << event.decision->action
                  << " confidence=" << std::fixed << std::setprecision(3)
                  << event.decision->weighted_confidence
                  << " eligible=" << (event.decision->autonomous_eligible ? "true" : "false");
    }
    if (event.escalation.has_value()) {
        std::cout << " reason=" << to_string(event.escalation->reason);
    }
    if (event.elapsed_ms.has_value()) {
        std::cout << " elapsed_ms=" << std::fixed << std::setprecision(1)
                  << event.elapsed_ms.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";

    if (verbosity_ == Verbosity::Debug && event.finding.has_value()) {
        std::cout << "    evidence: " << event.finding->evidence << "\n";
    }
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::IncidentOpened:
            metrics_.incidents_opened++;
            break;
        case EventType::RoundStarted:
            metrics_.rounds_started++;
            break;
        case EventType::FindingRecorded:
            metrics_.findings_recorded++;
            break;
        case EventType::DispatchFailed:
            metrics_.dispatch_failures++;
            break;
        case EventType::QuorumFailed:
            metrics_.quorum_failures++;
            break;
        case EventType::CircuitOpened:
            metrics_.circuits_opened++;
            break;
        case EventType::ActionRolledBack:
            metrics_.rollbacks_attempted++;
            break;
        case EventType::AgentSuspected:
            metrics_.agents_suspected++;
            break;
        case EventType::ConsensusReached:
            if (event.decision.has_value()) {
                decision_count_++;
                confidence_sum_ += event.decision->weighted_confidence;
                metrics_.average_weighted_confidence = confidence_sum_ / decision_count_;
            }
            break;
        case EventType::Resolved:
            metrics_.incidents_resolved++;
            break;
        case EventType::Escalated:
            metrics_.incidents_escalated++;
            break;
        case EventType::Abandoned:
            metrics_.incidents_abandoned++;
            break;
        default:
            break;
    }

    bool terminal = event.type == EventType::Resolved ||
                    event.type == EventType::Escalated ||
                    event.type == EventType::Abandoned;
    if (terminal) {
        if (event.elapsed_ms.has_value()) {
            terminal_sample_count_++;
            terminal_time_sum_ms_ += event.elapsed_ms.value();
            metrics_.average_time_to_terminal_ms = terminal_time_sum_ms_ / terminal_sample_count_;
        }
        check_escalation_rate();
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    terminal_sample_count_ = 0;
    terminal_time_sum_ms_ = 0.0;
    decision_count_ = 0;
    confidence_sum_ = 0.0;
}

void MetricsMonitor::set_escalation_rate_alert(double threshold, std::size_t min_samples,
                                               AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    escalation_rate_threshold_ = threshold;
    escalation_min_samples_ = min_samples;
    escalation_cb_ = std::move(cb);
}

void MetricsMonitor::check_escalation_rate() {
    if (!escalation_cb_) return;

    auto human = metrics_.incidents_escalated + metrics_.incidents_abandoned;
    auto total = human + metrics_.incidents_resolved;
    if (total == 0 || total < escalation_min_samples_) return;

    double rate = static_cast<double>(human) / total;
    if (rate > escalation_rate_threshold_) {
        escalation_cb_("Escalation rate " + std::to_string(rate * 100.0) +
                       "% exceeds threshold");
    }
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

// ========== AsyncMonitor ==========

AsyncMonitor::AsyncMonitor(std::shared_ptr<Monitor> downstream, std::size_t capacity)
    : downstream_(std::move(downstream))
    , capacity_(capacity == 0 ? 1 : capacity)
{
    dispatcher_ = std::thread([this] { dispatch_loop(); });
}

AsyncMonitor::~AsyncMonitor() {
    stop();
}

void AsyncMonitor::on_event(const MonitorEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            dropped_.fetch_add(1);
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1);
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

bool AsyncMonitor::flush(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !delivering_;
    });
}

std::size_t AsyncMonitor::discard_pending() {
    std::size_t discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discarded = queue_.size();
        queue_.clear();
        dropped_.fetch_add(discarded);
        if (!delivering_) idle_cv_.notify_all();
    }
    return discarded;
}

void AsyncMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

std::uint64_t AsyncMonitor::dropped_count() const noexcept {
    return dropped_.load();
}

std::size_t AsyncMonitor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void AsyncMonitor::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            break;  // stopping and drained
        }

        MonitorEvent event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        if (downstream_) {
            try {
                downstream_->on_event(event);
            } catch (const std::exception& e) {
                // A failing consumer loses this event, the core carries on
                dropped_.fetch_add(1);
                std::cerr << "[IncidentGuard] monitor delivery failed: " << e.what() << "\n";
            }
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

} // namespace incidentguard
