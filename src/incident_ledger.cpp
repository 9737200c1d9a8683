#include "incidentguard/incident_ledger.hpp"
#include "incidentguard/exceptions.hpp"

#include <algorithm>

namespace incidentguard {

IncidentLedger::IncidentLedger(LedgerConfig config)
    : config_(std::move(config)) {}

Version IncidentLedger::append(IncidentId incident_id, Version expected_version,
                               LedgerEvent event) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(config_.append_timeout)) {
        throw LedgerTimeoutException(incident_id);
    }

    auto& stream = streams_[incident_id];
    Version actual = stream.size();
    if (actual != expected_version) {
        if (stream.empty()) streams_.erase(incident_id);
        throw ConcurrentModificationException(incident_id, expected_version, actual);
    }

    event.incident_id = incident_id;
    event.version = actual + 1;
    event.recorded_at = WallClock::now();
    stream.push_back(std::move(event));
    return actual + 1;
}

std::vector<LedgerEvent> IncidentLedger::events(IncidentId incident_id,
                                                Version from_version) const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    auto it = streams_.find(incident_id);
    if (it == streams_.end() || from_version >= it->second.size()) {
        return {};
    }
    return std::vector<LedgerEvent>(it->second.begin() + static_cast<std::ptrdiff_t>(from_version),
                                    it->second.end());
}

Version IncidentLedger::current_version(IncidentId incident_id) const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    auto it = streams_.find(incident_id);
    return it == streams_.end() ? 0 : it->second.size();
}

bool IncidentLedger::contains(IncidentId incident_id) const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return streams_.count(incident_id) > 0;
}

std::vector<IncidentId> IncidentLedger::incident_ids() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    std::vector<IncidentId> ids;
    ids.reserve(streams_.size());
    for (auto& [id, _] : streams_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

IncidentReplay IncidentLedger::replay(IncidentId incident_id) const {
    std::vector<LedgerEvent> history;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        auto it = streams_.find(incident_id);
        if (it == streams_.end()) {
            throw IncidentNotFoundException(incident_id);
        }
        history = it->second;
    }
    return fold(history);
}

IncidentReplay IncidentLedger::fold(const std::vector<LedgerEvent>& events) {
    IncidentReplay r;

    for (const auto& e : events) {
        r.version = e.version;
        if (e.round > r.rounds) r.rounds = e.round;

        switch (e.type) {
            case LedgerEventType::Opened:
                if (e.incident) r.incident = *e.incident;
                break;
            case LedgerEventType::FindingRecorded:
                if (e.finding) r.findings.push_back(*e.finding);
                break;
            case LedgerEventType::DispatchFailed:
                if (e.failure) r.failures.push_back(*e.failure);
                break;
            case LedgerEventType::ConsensusReached:
                if (e.decision) r.decisions.push_back(*e.decision);
                break;
            case LedgerEventType::ActionExecuted:
                if (e.decision) r.executed_action = e.decision->action;
                break;
            case LedgerEventType::RollbackAttempted:
                if (e.rollback_succeeded) r.rollback_succeeded = e.rollback_succeeded;
                break;
            case LedgerEventType::Escalated:
            case LedgerEventType::Abandoned:
                if (e.escalation_reason) r.escalation_reason = e.escalation_reason;
                break;
            case LedgerEventType::StateChanged:
            case LedgerEventType::RoundStarted:
            case LedgerEventType::QuorumFailed:
            case LedgerEventType::ActionFailed:
            case LedgerEventType::Resolved:
                break;
        }

        if (e.state) r.state = *e.state;
    }

    r.incident.state = r.state;
    return r;
}

} // namespace incidentguard
