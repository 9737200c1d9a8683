#include "bind_forward.hpp"
#include <incidentguard/incidentguard.hpp>
#include <pybind11/stl.h>

using namespace incidentguard;

// Trampoline class to allow Python subclassing of ExecutionPolicy
class PyExecutionPolicy : public ExecutionPolicy {
public:
    using ExecutionPolicy::ExecutionPolicy;

    bool may_auto_execute(const Incident& incident, const ActionToken& action) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(bool, ExecutionPolicy, may_auto_execute, incident, action);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, ExecutionPolicy, name);
    }
};

void bind_policies(py::module_& m) {
    // --- Abstract ExecutionPolicy with trampoline ---
    py::class_<ExecutionPolicy, PyExecutionPolicy, std::shared_ptr<ExecutionPolicy>>(
            m, "ExecutionPolicy")
        .def(py::init<>())
        .def("may_auto_execute", &ExecutionPolicy::may_auto_execute,
             py::arg("incident"), py::arg("action"))
        .def("name", &ExecutionPolicy::name);

    // --- Concrete policies ---

    py::class_<AllowListPolicy, ExecutionPolicy, std::shared_ptr<AllowListPolicy>>(
            m, "AllowListPolicy")
        .def(py::init<CategoryMap<std::set<ActionToken>>, std::set<ActionToken>>(),
             py::arg("allowed"), py::arg("approval_required") = std::set<ActionToken>{})
        .def("may_auto_execute", &AllowListPolicy::may_auto_execute)
        .def("name", &AllowListPolicy::name);

    // The capped inner policy is always an allow-list when built from Python
    py::class_<SeverityCappedPolicy, ExecutionPolicy, std::shared_ptr<SeverityCappedPolicy>>(
            m, "SeverityCappedPolicy")
        .def(py::init([](Severity max_severity,
                         CategoryMap<std::set<ActionToken>> allowed,
                         std::set<ActionToken> approval_required) {
                 return std::make_shared<SeverityCappedPolicy>(
                     max_severity,
                     std::make_unique<AllowListPolicy>(std::move(allowed),
                                                       std::move(approval_required)));
             }),
             py::arg("max_severity"), py::arg("allowed"),
             py::arg("approval_required") = std::set<ActionToken>{})
        .def("may_auto_execute", &SeverityCappedPolicy::may_auto_execute)
        .def("name", &SeverityCappedPolicy::name);
}
