#include "type_converters.hpp"
#include "agentbridge/core/errors.h"

namespace agentbridge {

// Initialize type conversion system
void init_type_converters(py::module_& m) {
    // Exception hierarchy mirrors core::BridgeError. Translators registered
    // later are tried first, so the base class goes in first.
    auto& bridgeError = py::register_exception<core::BridgeError>(m, "BridgeError", PyExc_RuntimeError);
    py::register_exception<core::AdapterNotFoundError>(m, "AdapterNotFoundError", bridgeError.ptr());
    py::register_exception<core::TransformError>(m, "TransformError", bridgeError.ptr());
    py::register_exception<core::FidelityThresholdError>(m, "FidelityThresholdError", bridgeError.ptr());
    py::register_exception<core::StoreError>(m, "StoreError", bridgeError.ptr());
    py::register_exception<core::TimeoutError>(m, "TimeoutError", bridgeError.ptr());
    py::register_exception<core::CacheError>(m, "CacheError", bridgeError.ptr());
}

} // namespace agentbridge
