#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "type_converters.hpp"

namespace py = pybind11;

// Forward declarations of binding functions
void init_bridge_service(py::module_& m);
void init_round_trip_harness(py::module_& m);

PYBIND11_MODULE(_core, m) {
    m.doc() = "AgentBridge Python bindings"; // Module docstring

    // Initialize type conversion system first
    agentbridge::init_type_converters(m);

    // Initialize submodules
    init_bridge_service(m);
    init_round_trip_harness(m);
}
