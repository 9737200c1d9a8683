#include "bind_forward.hpp"
#include <incidentguard/incidentguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace incidentguard;

// ---------------------------------------------------------------------------
// Trampolines: providers and executors are called from worker threads
// ---------------------------------------------------------------------------
class PyAnalysisProvider : public AnalysisProvider {
public:
    using AnalysisProvider::AnalysisProvider;

    ProviderResponse analyze(const AnalysisContext& context) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ProviderResponse, AnalysisProvider, analyze, context);
    }
};

class PyRemediationExecutor : public RemediationExecutor {
public:
    using RemediationExecutor::RemediationExecutor;

    RemediationResult execute(const Incident& incident, const ActionToken& action) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(RemediationResult, RemediationExecutor, execute, incident, action);
    }

    RollbackResult rollback(const Incident& incident, const ActionToken& action) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(RollbackResult, RemediationExecutor, rollback, incident, action);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  Agent, providers, breakers, ledger, consensus, Orchestrator
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Agent and its provider
    // ===================================================================
    py::class_<AgentDescriptor>(m, "AgentDescriptor")
        .def(py::init<>())
        .def_readwrite("role",        &AgentDescriptor::role)
        .def_readwrite("name",        &AgentDescriptor::name)
        .def_readwrite("weight",      &AgentDescriptor::weight)
        .def_readwrite("timeout",     &AgentDescriptor::timeout)
        .def_readwrite("max_retries", &AgentDescriptor::max_retries)
        .def_readwrite("max_outstanding_calls", &AgentDescriptor::max_outstanding_calls);

    py::class_<CallTracker, std::shared_ptr<CallTracker>>(m, "CallTracker")
        .def(py::init<std::size_t>(), py::arg("limit"))
        .def("try_acquire", &CallTracker::try_acquire)
        .def("release",     &CallTracker::release)
        .def("outstanding", &CallTracker::outstanding)
        .def("limit",       &CallTracker::limit)
        .def("wait_idle",   &CallTracker::wait_idle, py::arg("deadline"),
             py::call_guard<py::gil_scoped_release>());

    py::class_<AnalysisContext>(m, "AnalysisContext")
        .def_readonly("incident", &AnalysisContext::incident)
        .def_readonly("round",    &AnalysisContext::round)
        .def_readonly("deadline", &AnalysisContext::deadline)
        .def("cancelled", &AnalysisContext::cancelled);

    py::class_<ProviderResponse>(m, "ProviderResponse")
        .def(py::init<>())
        .def(py::init([](std::optional<double> confidence, std::optional<ActionToken> action,
                         std::string evidence) {
                 return ProviderResponse{confidence, std::move(action), std::move(evidence)};
             }),
             py::arg("confidence"), py::arg("action"), py::arg("evidence") = "")
        .def_readwrite("confidence", &ProviderResponse::confidence)
        .def_readwrite("action",     &ProviderResponse::action)
        .def_readwrite("evidence",   &ProviderResponse::evidence);

    py::class_<AnalysisProvider, PyAnalysisProvider, std::shared_ptr<AnalysisProvider>>(
            m, "AnalysisProvider")
        .def(py::init<>())
        .def("analyze", &AnalysisProvider::analyze);

    py::class_<Agent>(m, "Agent")
        .def(py::init<AgentDescriptor, std::shared_ptr<AnalysisProvider>>(),
             py::arg("descriptor"), py::arg("provider"))
        .def("role",        &Agent::role)
        .def("name",        &Agent::name)
        .def("weight",      &Agent::weight)
        .def("timeout",     &Agent::timeout)
        .def("max_retries", &Agent::max_retries)
        .def("call_tracker", &Agent::call_tracker)
        .def("__repr__", [](const Agent& a) {
            return "<Agent role=" + std::string(to_string(a.role()))
                 + " name='" + a.name()
                 + "' weight=" + std::to_string(a.weight()) + ">";
        });

    // ===================================================================
    // Remediation
    // ===================================================================
    py::class_<RemediationResult>(m, "RemediationResult")
        .def(py::init<>())
        .def(py::init([](bool success, std::string message) {
                 return RemediationResult{success, std::move(message)};
             }),
             py::arg("success"), py::arg("message") = "")
        .def_readwrite("success", &RemediationResult::success)
        .def_readwrite("message", &RemediationResult::message);

    py::class_<RollbackResult>(m, "RollbackResult")
        .def(py::init<>())
        .def(py::init([](bool attempted, bool success, std::string message) {
                 return RollbackResult{attempted, success, std::move(message)};
             }),
             py::arg("attempted"), py::arg("success"), py::arg("message") = "")
        .def_readwrite("attempted", &RollbackResult::attempted)
        .def_readwrite("success",   &RollbackResult::success)
        .def_readwrite("message",   &RollbackResult::message);

    py::class_<RemediationExecutor, PyRemediationExecutor, std::shared_ptr<RemediationExecutor>>(
            m, "RemediationExecutor")
        .def(py::init<>())
        .def("execute",  &RemediationExecutor::execute)
        .def("rollback", &RemediationExecutor::rollback);

    // ===================================================================
    // Circuit breakers
    // ===================================================================
    py::class_<DispatchPermit>(m, "DispatchPermit")
        .def_readonly("allowed",    &DispatchPermit::allowed)
        .def_readonly("transition", &DispatchPermit::transition)
        .def("__bool__", [](const DispatchPermit& p) { return p.allowed; });

    py::class_<CircuitBreaker, std::unique_ptr<CircuitBreaker, py::nodelete>>(m, "CircuitBreaker")
        .def("try_dispatch",   [](CircuitBreaker& self) { return self.try_dispatch(); })
        .def("allow_dispatch", [](CircuitBreaker& self) { return self.allow_dispatch(); })
        .def("record_success", [](CircuitBreaker& self) { return self.record_success(); })
        .def("record_failure", [](CircuitBreaker& self) { return self.record_failure(); })
        .def("reset",          [](CircuitBreaker& self) { self.reset(); })
        .def("role",  &CircuitBreaker::role)
        .def("state", &CircuitBreaker::state)
        .def("stats", &CircuitBreaker::stats);

    py::class_<CircuitBreakerRegistry, std::shared_ptr<CircuitBreakerRegistry>>(
            m, "CircuitBreakerRegistry")
        .def(py::init<const std::vector<AgentRole>&, BreakerConfig>(),
             py::arg("roles"), py::arg("config") = BreakerConfig{})
        .def("breaker",
             py::overload_cast<AgentRole>(&CircuitBreakerRegistry::breaker),
             py::arg("role"), py::return_value_policy::reference_internal)
        .def("contains",  &CircuitBreakerRegistry::contains, py::arg("role"))
        .def("snapshot",  &CircuitBreakerRegistry::snapshot)
        .def("reset_all", &CircuitBreakerRegistry::reset_all);

    // ===================================================================
    // Ledger
    // ===================================================================
    py::class_<IncidentLedger, std::shared_ptr<IncidentLedger>>(m, "IncidentLedger")
        .def(py::init<LedgerConfig>(), py::arg("config") = LedgerConfig{})
        .def("append", &IncidentLedger::append,
             py::arg("incident_id"), py::arg("expected_version"), py::arg("event"),
             py::call_guard<py::gil_scoped_release>())
        .def("events", &IncidentLedger::events,
             py::arg("incident_id"), py::arg("from_version") = 0)
        .def("current_version", &IncidentLedger::current_version, py::arg("incident_id"))
        .def("contains",        &IncidentLedger::contains, py::arg("incident_id"))
        .def("incident_ids",    &IncidentLedger::incident_ids)
        .def("replay",          &IncidentLedger::replay, py::arg("incident_id"))
        .def_static("fold",     &IncidentLedger::fold, py::arg("events"));

    // ===================================================================
    // Consensus
    // ===================================================================
    py::class_<ConsensusEngine>(m, "ConsensusEngine")
        .def(py::init<ConsensusConfig>(), py::arg("config") = ConsensusConfig{})
        .def("decide", &ConsensusEngine::decide,
             py::arg("incident_id"), py::arg("round"), py::arg("category"),
             py::arg("findings"), py::arg("weights"),
             py::arg("excluded") = std::vector<AgentRole>{})
        .def("threshold_for", &ConsensusEngine::threshold_for, py::arg("category"))
        .def("suspected_byzantine", &ConsensusEngine::suspected_byzantine, py::arg("findings"))
        .def_readonly_static("THRESHOLD_TOLERANCE", &ConsensusEngine::kThresholdTolerance)
        .def_static("renormalize",         &ConsensusEngine::renormalize,
                    py::arg("weights"), py::arg("responders"))
        .def_static("byzantine_tolerance", &ConsensusEngine::byzantine_tolerance,
                    py::arg("agent_count"))
        .def_static("validate_weights",    &ConsensusEngine::validate_weights,
                    py::arg("weights"));

    // ===================================================================
    // Orchestrator
    // ===================================================================
    // Destroying the orchestrator joins workers that call back into Python
    py::class_<Orchestrator, ReleaseGilHolder<Orchestrator>>(m, "Orchestrator")
        .def(py::init([](std::vector<Agent> agents,
                         std::shared_ptr<RemediationExecutor> executor,
                         Config config,
                         std::shared_ptr<CircuitBreakerRegistry> breakers,
                         std::shared_ptr<IncidentLedger> ledger,
                         std::shared_ptr<ExecutionPolicy> policy) {
                 // Bridge shared_ptr (pybind11 holder) to unique_ptr (C++ API)
                 struct PolicyBridge : ExecutionPolicy {
                     std::shared_ptr<ExecutionPolicy> inner;
                     explicit PolicyBridge(std::shared_ptr<ExecutionPolicy> p) : inner(std::move(p)) {}
                     bool may_auto_execute(const Incident& incident,
                                           const ActionToken& action) const override {
                         return inner->may_auto_execute(incident, action);
                     }
                     std::string name() const override { return inner->name(); }
                 };
                 std::unique_ptr<ExecutionPolicy> bridged;
                 if (policy) bridged = std::make_unique<PolicyBridge>(std::move(policy));
                 return ReleaseGilHolder<Orchestrator>(new Orchestrator(
                     std::move(agents), std::move(executor), std::move(config),
                     std::move(breakers), std::move(ledger), std::move(bridged)));
             }),
             py::arg("agents"), py::arg("executor"),
             py::arg("config") = Config{},
             py::arg("breakers") = nullptr,
             py::arg("ledger") = nullptr,
             py::arg("policy") = nullptr)

        // ------------- Intake -------------
        .def("submit_alert", &Orchestrator::submit_alert, py::arg("alert"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Queries -------------
        .def("get_incident", &Orchestrator::get_incident, py::arg("id"))
        .def("wait_for_terminal", &Orchestrator::wait_for_terminal,
             py::arg("id"), py::arg("timeout"),
             py::call_guard<py::gil_scoped_release>())
        .def("escalations",           &Orchestrator::escalations)
        .def("escalation_for",        &Orchestrator::escalation_for, py::arg("id"))
        .def("active_incident_count", &Orchestrator::active_incident_count)
        .def("weights_for",           &Orchestrator::weights_for, py::arg("category"))
        .def("ledger",                &Orchestrator::ledger,
             py::return_value_policy::reference_internal)
        .def("circuit_breakers",      &Orchestrator::circuit_breakers,
             py::return_value_policy::reference_internal)
        .def("consensus_engine",      &Orchestrator::consensus_engine,
             py::return_value_policy::reference_internal)

        // ------------- Configuration / Lifecycle -------------
        .def("set_monitor", &Orchestrator::set_monitor, py::arg("monitor"),
             py::call_guard<py::gil_scoped_release>())
        .def("stop",        &Orchestrator::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &Orchestrator::is_running);
}
