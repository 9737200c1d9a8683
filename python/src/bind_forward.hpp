#pragma once
#include <pybind11/pybind11.h>

#include <memory>

namespace py = pybind11;

// Deleter that drops the GIL while the object is destroyed. Objects whose
// destructor joins threads that call back into Python would otherwise
// deadlock when the last reference goes away.
template <typename T>
struct ReleaseGilDeleter {
    void operator()(T* ptr) const {
        if (PyGILState_Check()) {
            py::gil_scoped_release release;
            delete ptr;
        } else {
            delete ptr;
        }
    }
};

template <typename T>
using ReleaseGilHolder = std::unique_ptr<T, ReleaseGilDeleter<T>>;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_core(py::module_& m);
void bind_monitors(py::module_& m);
void bind_policies(py::module_& m);
