#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <incidentguard/incidentguard.hpp>

using namespace incidentguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_incidentguard, m) {
    m.doc() = "IncidentGuard: Byzantine-tolerant incident resolution core";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_policies(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<IncidentCategory>(m, "IncidentCategory")
        .value("InfrastructureCascade", IncidentCategory::InfrastructureCascade)
        .value("ResourceExhaustion",    IncidentCategory::ResourceExhaustion)
        .value("Security",              IncidentCategory::Security)
        .value("LatencyDegradation",    IncidentCategory::LatencyDegradation)
        .export_values();

    py::enum_<Severity>(m, "Severity")
        .value("Low",      Severity::Low)
        .value("Medium",   Severity::Medium)
        .value("High",     Severity::High)
        .value("Critical", Severity::Critical)
        .export_values();

    py::enum_<AgentRole>(m, "AgentRole")
        .value("Detection",     AgentRole::Detection)
        .value("Diagnosis",     AgentRole::Diagnosis)
        .value("Prediction",    AgentRole::Prediction)
        .value("Resolution",    AgentRole::Resolution)
        .value("Communication", AgentRole::Communication)
        .export_values();

    // States, reasons and event types share value names, so they stay scoped
    py::enum_<IncidentState>(m, "IncidentState")
        .value("Pending",       IncidentState::Pending)
        .value("Analyzing",     IncidentState::Analyzing)
        .value("Deciding",      IncidentState::Deciding)
        .value("Executing",     IncidentState::Executing)
        .value("Escalating",    IncidentState::Escalating)
        .value("Resolved",      IncidentState::Resolved)
        .value("EscalatedOpen", IncidentState::EscalatedOpen)
        .value("Abandoned",     IncidentState::Abandoned);

    py::enum_<BreakerState>(m, "BreakerState")
        .value("Closed",   BreakerState::Closed)
        .value("Open",     BreakerState::Open)
        .value("HalfOpen", BreakerState::HalfOpen)
        .export_values();

    py::enum_<DispatchFailureKind>(m, "DispatchFailureKind")
        .value("Timeout",       DispatchFailureKind::Timeout)
        .value("ProviderError", DispatchFailureKind::ProviderError)
        .value("InvalidOutput", DispatchFailureKind::InvalidOutput)
        .value("Cancelled",     DispatchFailureKind::Cancelled)
        .value("Saturated",     DispatchFailureKind::Saturated)
        .export_values();

    py::enum_<ConsensusStatus>(m, "ConsensusStatus")
        .value("Reached",            ConsensusStatus::Reached)
        .value("InsufficientQuorum", ConsensusStatus::InsufficientQuorum);

    py::enum_<EscalationReason>(m, "EscalationReason")
        .value("BelowThreshold",     EscalationReason::BelowThreshold)
        .value("ActionNotAllowed",   EscalationReason::ActionNotAllowed)
        .value("InsufficientQuorum", EscalationReason::InsufficientQuorum)
        .value("ActionFailed",       EscalationReason::ActionFailed)
        .value("ActionTimedOut",     EscalationReason::ActionTimedOut)
        .value("Abandoned",          EscalationReason::Abandoned)
        .value("LedgerUnavailable",  EscalationReason::LedgerUnavailable)
        .value("InternalError",      EscalationReason::InternalError);

    py::enum_<EventType>(m, "EventType")
        .value("IncidentOpened",    EventType::IncidentOpened)
        .value("RoundStarted",      EventType::RoundStarted)
        .value("FindingRecorded",   EventType::FindingRecorded)
        .value("DispatchFailed",    EventType::DispatchFailed)
        .value("ConsensusReached",  EventType::ConsensusReached)
        .value("QuorumFailed",      EventType::QuorumFailed)
        .value("ActionExecuted",    EventType::ActionExecuted)
        .value("Escalated",         EventType::Escalated)
        .value("Resolved",          EventType::Resolved)
        .value("Abandoned",         EventType::Abandoned)
        .value("CircuitOpened",     EventType::CircuitOpened)
        .value("CircuitHalfOpened", EventType::CircuitHalfOpened)
        .value("CircuitClosed",     EventType::CircuitClosed)
        .value("ActionRolledBack",  EventType::ActionRolledBack)
        .value("AgentSuspected",    EventType::AgentSuspected);

    py::enum_<LedgerEventType>(m, "LedgerEventType")
        .value("Opened",           LedgerEventType::Opened)
        .value("StateChanged",     LedgerEventType::StateChanged)
        .value("RoundStarted",     LedgerEventType::RoundStarted)
        .value("FindingRecorded",  LedgerEventType::FindingRecorded)
        .value("DispatchFailed",   LedgerEventType::DispatchFailed)
        .value("ConsensusReached", LedgerEventType::ConsensusReached)
        .value("QuorumFailed",     LedgerEventType::QuorumFailed)
        .value("ActionExecuted",   LedgerEventType::ActionExecuted)
        .value("ActionFailed",     LedgerEventType::ActionFailed)
        .value("RollbackAttempted", LedgerEventType::RollbackAttempted)
        .value("Escalated",        LedgerEventType::Escalated)
        .value("Resolved",         LedgerEventType::Resolved)
        .value("Abandoned",        LedgerEventType::Abandoned);

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<BreakerConfig>(m, "BreakerConfig")
        .def(py::init<>())
        .def_readwrite("failure_threshold", &BreakerConfig::failure_threshold)
        .def_readwrite("cooldown",          &BreakerConfig::cooldown);

    py::class_<ConsensusConfig>(m, "ConsensusConfig")
        .def(py::init<>())
        .def_readwrite("default_threshold",   &ConsensusConfig::default_threshold)
        .def_readwrite("category_thresholds", &ConsensusConfig::category_thresholds)
        .def_readwrite("category_weights",    &ConsensusConfig::category_weights)
        .def_readwrite("quorum_fraction",     &ConsensusConfig::quorum_fraction)
        .def_readwrite("min_responders",      &ConsensusConfig::min_responders)
        .def_readwrite("byzantine_screening",       &ConsensusConfig::byzantine_screening)
        .def_readwrite("max_confidence_deviation",  &ConsensusConfig::max_confidence_deviation)
        .def_readwrite("min_agreement",             &ConsensusConfig::min_agreement)
        .def_readwrite("minority_confidence_floor", &ConsensusConfig::minority_confidence_floor);

    py::class_<ResolutionConfig>(m, "ResolutionConfig")
        .def(py::init<>())
        .def_readwrite("max_rounds",                 &ResolutionConfig::max_rounds)
        .def_readwrite("retry_margin",               &ResolutionConfig::retry_margin)
        .def_readwrite("incident_timeout",           &ResolutionConfig::incident_timeout)
        .def_readwrite("action_timeout",             &ResolutionConfig::action_timeout)
        .def_readwrite("auto_executable_actions",    &ResolutionConfig::auto_executable_actions)
        .def_readwrite("approval_required_actions",  &ResolutionConfig::approval_required_actions)
        .def_readwrite("max_outstanding_actions",    &ResolutionConfig::max_outstanding_actions)
        .def_readwrite("rollback_on_failure",        &ResolutionConfig::rollback_on_failure);

    py::class_<LedgerConfig>(m, "LedgerConfig")
        .def(py::init<>())
        .def_readwrite("append_timeout",     &LedgerConfig::append_timeout)
        .def_readwrite("max_append_retries", &LedgerConfig::max_append_retries);

    py::class_<RuntimeConfig>(m, "RuntimeConfig")
        .def(py::init<>())
        .def_readwrite("event_queue_capacity", &RuntimeConfig::event_queue_capacity)
        .def_readwrite("shutdown_grace",       &RuntimeConfig::shutdown_grace);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("breaker",    &Config::breaker)
        .def_readwrite("consensus",  &Config::consensus)
        .def_readwrite("resolution", &Config::resolution)
        .def_readwrite("ledger",     &Config::ledger)
        .def_readwrite("runtime",    &Config::runtime);

    // ---- Incident data ----------------------------------------------------

    py::class_<AlertPayload>(m, "AlertPayload")
        .def(py::init<>())
        .def_readwrite("category",    &AlertPayload::category)
        .def_readwrite("severity",    &AlertPayload::severity)
        .def_readwrite("description", &AlertPayload::description)
        .def_readwrite("evidence",    &AlertPayload::evidence);

    py::class_<Incident>(m, "Incident")
        .def(py::init<>())
        .def_readwrite("id",          &Incident::id)
        .def_readwrite("category",    &Incident::category)
        .def_readwrite("severity",    &Incident::severity)
        .def_readwrite("description", &Incident::description)
        .def_readwrite("evidence",    &Incident::evidence)
        .def_readwrite("opened_at",   &Incident::opened_at)
        .def_readwrite("state",       &Incident::state)
        .def("__repr__", [](const Incident& i) {
            return "<Incident id=" + std::to_string(i.id)
                 + " category=" + std::string(to_string(i.category))
                 + " state=" + std::string(to_string(i.state)) + ">";
        });

    py::class_<Finding>(m, "Finding")
        .def(py::init<>())
        .def_readwrite("role",        &Finding::role)
        .def_readwrite("incident_id", &Finding::incident_id)
        .def_readwrite("round",       &Finding::round)
        .def_readwrite("confidence",  &Finding::confidence)
        .def_readwrite("action",      &Finding::action)
        .def_readwrite("evidence",    &Finding::evidence)
        .def_readwrite("produced_at", &Finding::produced_at);

    py::class_<DispatchFailure>(m, "DispatchFailure")
        .def(py::init<>())
        .def_readwrite("role",    &DispatchFailure::role)
        .def_readwrite("kind",    &DispatchFailure::kind)
        .def_readwrite("message", &DispatchFailure::message);

    py::class_<Contribution>(m, "Contribution")
        .def(py::init<>())
        .def_readwrite("role",              &Contribution::role)
        .def_readwrite("static_weight",     &Contribution::static_weight)
        .def_readwrite("normalized_weight", &Contribution::normalized_weight)
        .def_readwrite("finding",           &Contribution::finding);

    py::class_<ConsensusDecision>(m, "ConsensusDecision")
        .def(py::init<>())
        .def_readwrite("incident_id",         &ConsensusDecision::incident_id)
        .def_readwrite("round",               &ConsensusDecision::round)
        .def_readwrite("weighted_confidence", &ConsensusDecision::weighted_confidence)
        .def_readwrite("action",              &ConsensusDecision::action)
        .def_readwrite("threshold",           &ConsensusDecision::threshold)
        .def_readwrite("contributions",       &ConsensusDecision::contributions)
        .def_readwrite("action_votes",        &ConsensusDecision::action_votes)
        .def_readwrite("excluded_roles",      &ConsensusDecision::excluded_roles)
        .def_readwrite("suspected_roles",     &ConsensusDecision::suspected_roles)
        .def_readwrite("autonomous_eligible", &ConsensusDecision::autonomous_eligible)
        .def_readwrite("decided_at",          &ConsensusDecision::decided_at);

    py::class_<ConsensusResult>(m, "ConsensusResult")
        .def(py::init<>())
        .def_readwrite("status",            &ConsensusResult::status)
        .def_readwrite("decision",          &ConsensusResult::decision)
        .def_readwrite("responding_weight", &ConsensusResult::responding_weight)
        .def_readwrite("reason",            &ConsensusResult::reason)
        .def("reached", &ConsensusResult::reached);

    py::class_<EscalationRecord>(m, "EscalationRecord")
        .def(py::init<>())
        .def_readwrite("incident_id", &EscalationRecord::incident_id)
        .def_readwrite("reason",      &EscalationRecord::reason)
        .def_readwrite("message",     &EscalationRecord::message)
        .def_readwrite("findings",    &EscalationRecord::findings)
        .def_readwrite("failures",    &EscalationRecord::failures)
        .def_readwrite("decision",    &EscalationRecord::decision)
        .def_readwrite("created_at",  &EscalationRecord::created_at);

    py::class_<BreakerStats>(m, "BreakerStats")
        .def(py::init<>())
        .def_readwrite("role",                 &BreakerStats::role)
        .def_readwrite("state",                &BreakerStats::state)
        .def_readwrite("consecutive_failures", &BreakerStats::consecutive_failures)
        .def_readwrite("total_successes",      &BreakerStats::total_successes)
        .def_readwrite("total_failures",       &BreakerStats::total_failures)
        .def_readwrite("state_changes",        &BreakerStats::state_changes)
        .def("failure_rate", &BreakerStats::failure_rate);

    // ---- Ledger records ---------------------------------------------------

    py::class_<LedgerEvent>(m, "LedgerEvent")
        .def(py::init<>())
        .def_readwrite("type",              &LedgerEvent::type)
        .def_readwrite("incident_id",       &LedgerEvent::incident_id)
        .def_readwrite("version",           &LedgerEvent::version)
        .def_readwrite("recorded_at",       &LedgerEvent::recorded_at)
        .def_readwrite("round",             &LedgerEvent::round)
        .def_readwrite("message",           &LedgerEvent::message)
        .def_readwrite("state",             &LedgerEvent::state)
        .def_readwrite("incident",          &LedgerEvent::incident)
        .def_readwrite("finding",           &LedgerEvent::finding)
        .def_readwrite("failure",           &LedgerEvent::failure)
        .def_readwrite("decision",          &LedgerEvent::decision)
        .def_readwrite("escalation_reason", &LedgerEvent::escalation_reason)
        .def_readwrite("rollback_succeeded", &LedgerEvent::rollback_succeeded);

    py::class_<IncidentReplay>(m, "IncidentReplay")
        .def(py::init<>())
        .def_readwrite("incident",          &IncidentReplay::incident)
        .def_readwrite("state",             &IncidentReplay::state)
        .def_readwrite("version",           &IncidentReplay::version)
        .def_readwrite("rounds",            &IncidentReplay::rounds)
        .def_readwrite("findings",          &IncidentReplay::findings)
        .def_readwrite("failures",          &IncidentReplay::failures)
        .def_readwrite("decisions",         &IncidentReplay::decisions)
        .def_readwrite("executed_action",   &IncidentReplay::executed_action)
        .def_readwrite("escalation_reason", &IncidentReplay::escalation_reason)
        .def_readwrite("rollback_succeeded", &IncidentReplay::rollback_succeeded);

    // ---- Monitoring -------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",          &MonitorEvent::type)
        .def_readwrite("timestamp",     &MonitorEvent::timestamp)
        .def_readwrite("message",       &MonitorEvent::message)
        .def_readwrite("incident_id",   &MonitorEvent::incident_id)
        .def_readwrite("round",         &MonitorEvent::round)
        .def_readwrite("role",          &MonitorEvent::role)
        .def_readwrite("state",         &MonitorEvent::state)
        .def_readwrite("finding",       &MonitorEvent::finding)
        .def_readwrite("failure_kind",  &MonitorEvent::failure_kind)
        .def_readwrite("decision",      &MonitorEvent::decision)
        .def_readwrite("escalation",    &MonitorEvent::escalation)
        .def_readwrite("breaker_state", &MonitorEvent::breaker_state)
        .def_readwrite("elapsed_ms",    &MonitorEvent::elapsed_ms);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("incidents_opened",            &MetricsMonitor::Metrics::incidents_opened)
        .def_readwrite("incidents_resolved",          &MetricsMonitor::Metrics::incidents_resolved)
        .def_readwrite("incidents_escalated",         &MetricsMonitor::Metrics::incidents_escalated)
        .def_readwrite("incidents_abandoned",         &MetricsMonitor::Metrics::incidents_abandoned)
        .def_readwrite("rounds_started",              &MetricsMonitor::Metrics::rounds_started)
        .def_readwrite("findings_recorded",           &MetricsMonitor::Metrics::findings_recorded)
        .def_readwrite("dispatch_failures",           &MetricsMonitor::Metrics::dispatch_failures)
        .def_readwrite("quorum_failures",             &MetricsMonitor::Metrics::quorum_failures)
        .def_readwrite("circuits_opened",             &MetricsMonitor::Metrics::circuits_opened)
        .def_readwrite("rollbacks_attempted",         &MetricsMonitor::Metrics::rollbacks_attempted)
        .def_readwrite("agents_suspected",            &MetricsMonitor::Metrics::agents_suspected)
        .def_readwrite("average_time_to_terminal_ms", &MetricsMonitor::Metrics::average_time_to_terminal_ms)
        .def_readwrite("average_weighted_confidence", &MetricsMonitor::Metrics::average_weighted_confidence);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_IncidentGuardError =
        py::register_exception<IncidentGuardException>(m, "IncidentGuardError", PyExc_RuntimeError);

    // Derived from IncidentGuardError
    static auto py_InvalidConfigurationError =
        py::register_exception<InvalidConfigurationException>(m, "InvalidConfigurationError", py_IncidentGuardError.ptr());
    static auto py_InvalidAlertError =
        py::register_exception<InvalidAlertException>(m, "InvalidAlertError", py_IncidentGuardError.ptr());
    static auto py_IncidentNotFoundError =
        py::register_exception<IncidentNotFoundException>(m, "IncidentNotFoundError", py_IncidentGuardError.ptr());
    static auto py_ConcurrentModificationError =
        py::register_exception<ConcurrentModificationException>(m, "ConcurrentModificationError", py_IncidentGuardError.ptr());
    static auto py_LedgerTimeoutError =
        py::register_exception<LedgerTimeoutException>(m, "LedgerTimeoutError", py_IncidentGuardError.ptr());
    static auto py_InvalidTransitionError =
        py::register_exception<InvalidTransitionException>(m, "InvalidTransitionError", py_IncidentGuardError.ptr());
}
