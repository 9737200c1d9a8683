#include "bind_forward.hpp"
#include <incidentguard/incidentguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace incidentguard;

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }
};

void bind_monitors(py::module_& m) {
    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event);

    // --- ConsoleMonitor ---
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    // ConsoleMonitor::Verbosity is bound in bindings.cpp as "Verbosity"

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_escalation_rate_alert",
            [](MetricsMonitor& self, double threshold, std::size_t min_samples, py::function cb) {
                MetricsMonitor::AlertCallback cpp_cb =
                    [cb = py::object(cb)](const std::string& msg) {
                        py::gil_scoped_acquire acquire;
                        cb(msg);
                    };
                self.set_escalation_rate_alert(threshold, min_samples, std::move(cpp_cb));
            },
            py::arg("threshold"), py::arg("min_samples"), py::arg("callback"));

    // MetricsMonitor::Metrics is bound in bindings.cpp as "Metrics"

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    // --- AsyncMonitor ---
    py::class_<AsyncMonitor, Monitor, std::shared_ptr<AsyncMonitor>>(m, "AsyncMonitor")
        .def(py::init([](std::shared_ptr<Monitor> downstream, std::size_t capacity) {
                 // The publisher thread may be inside a Python monitor when it is joined
                 return std::shared_ptr<AsyncMonitor>(
                     new AsyncMonitor(std::move(downstream), capacity),
                     ReleaseGilDeleter<AsyncMonitor>{});
             }),
             py::arg("downstream"), py::arg("capacity") = 1024)
        .def("flush", &AsyncMonitor::flush, py::arg("timeout"),
             py::call_guard<py::gil_scoped_release>())
        .def("stop", &AsyncMonitor::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("discard_pending", &AsyncMonitor::discard_pending)
        .def("dropped_count", &AsyncMonitor::dropped_count)
        .def("pending", &AsyncMonitor::pending);
}
