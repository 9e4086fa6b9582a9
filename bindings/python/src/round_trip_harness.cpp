#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "type_converters.hpp"
#include "agentbridge/core/bridge_service.h"
#include "agentbridge/core/round_trip_harness.h"

namespace py = pybind11;
using namespace agentbridge;
using namespace agentbridge::core;

namespace {

std::shared_ptr<Adapter> adapterOf(const BridgeService& service, const std::string& protocol) {
    auto adapter = service.registry()->getAdapter(protocol);
    if (!adapter) {
        throw AdapterNotFoundError(protocol);
    }
    return adapter;
}

} // namespace

void init_round_trip_harness(py::module_& m) {
    py::class_<RoundTripHarness>(m, "RoundTripHarness")
        .def(py::init([](double minFidelity, double tolerance) {
            return RoundTripHarness(HarnessConfig{minFidelity, tolerance});
        }), py::arg("default_min_fidelity") = 0.95, py::arg("baseline_tolerance") = 0.01)
        .def("run_test", [](const RoundTripHarness& harness, const BridgeService& service,
                            const std::string& protocol, const py::object& sample,
                            std::optional<double> minFidelity) {
            return json_to_object(harness.runTest(*adapterOf(service, protocol), object_to_json(sample),
                                                  minFidelity).toJson());
        }, py::arg("service"), py::arg("protocol"), py::arg("sample"), py::arg("min_fidelity") = py::none())
        .def("run_cross_framework_test", [](const RoundTripHarness& harness, const BridgeService& service,
                                            const std::string& source, const py::object& data,
                                            const std::string& target, std::optional<double> minFidelity) {
            return json_to_object(harness.runCrossFrameworkTest(*adapterOf(service, source), object_to_json(data),
                                                                *adapterOf(service, target), minFidelity).toJson());
        }, py::arg("service"), py::arg("source"), py::arg("data"), py::arg("target"),
           py::arg("min_fidelity") = py::none())
        .def("junit_report", [](const RoundTripHarness& harness, const BridgeService& service,
                                const std::string& name, const py::list& cases) {
            // Each case: {"name", "protocol", "sample", optional "target", optional "min_fidelity"}
            std::vector<HarnessTestCase> suiteCases;
            for (const auto& item : cases) {
                auto entry = object_to_json(py::reinterpret_borrow<py::object>(item));
                HarnessTestCase testCase;
                testCase.name = entry.value("name", "");
                testCase.adapter = adapterOf(service, entry.at("protocol").get<std::string>());
                testCase.sample = entry.at("sample");
                if (entry.contains("target")) {
                    testCase.targetAdapter = adapterOf(service, entry["target"].get<std::string>());
                }
                if (entry.contains("min_fidelity")) {
                    testCase.minFidelity = entry["min_fidelity"].get<double>();
                }
                suiteCases.push_back(std::move(testCase));
            }
            return RoundTripHarness::toJUnitXml(harness.runSuite(name, suiteCases));
        }, py::arg("service"), py::arg("name"), py::arg("cases"));
}
