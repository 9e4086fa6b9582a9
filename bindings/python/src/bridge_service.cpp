#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "type_converters.hpp"
#include "agentbridge/adapters/capability_adapter.h"
#include "agentbridge/adapters/role_goal_adapter.h"
#include "agentbridge/adapters/tool_call_adapter.h"
#include "agentbridge/core/bridge_service.h"

namespace py = pybind11;
using namespace agentbridge;
using namespace agentbridge::core;

namespace {

BridgeConfig configFrom(const py::object& config) {
    if (config.is_none()) {
        return BridgeConfig{};
    }
    auto loaded = loadBridgeConfig(object_to_json(config));
    if (!loaded) {
        throw py::value_error(loaded.error());
    }
    applyLogConfig(loaded.value());
    return loaded.value();
}

TranslateOptions optionsFrom(const py::dict& options) {
    TranslateOptions result;
    if (options.contains("use_cache")) result.useCache = options["use_cache"].cast<bool>();
    if (options.contains("persist")) result.persist = options["persist"].cast<bool>();
    if (options.contains("validate")) result.validate = options["validate"].cast<bool>();
    if (options.contains("strict")) result.strict = options["strict"].cast<bool>();
    if (options.contains("max_fidelity_loss")) {
        result.maxFidelityLoss = options["max_fidelity_loss"].cast<double>();
    }
    if (options.contains("timeout_ms")) {
        result.timeout = std::chrono::milliseconds(options["timeout_ms"].cast<int64_t>());
    }
    return result;
}

} // namespace

void init_bridge_service(py::module_& m) {
    py::enum_<ExportFormat>(m, "ExportFormat")
        .value("NATIVE", ExportFormat::NATIVE)
        .value("NTRIPLES", ExportFormat::NTRIPLES);

    py::class_<BridgeService, std::shared_ptr<BridgeService>>(m, "BridgeService")
        .def(py::init([](const py::object& config) {
            return std::make_shared<BridgeService>(configFrom(config));
        }), py::arg("config") = py::none())
        .def("register_reference_adapters", [](BridgeService& service) {
            service.registerAdapter(std::make_shared<adapters::ToolCallAdapter>());
            service.registerAdapter(std::make_shared<adapters::RoleGoalAdapter>());
            service.registerAdapter(std::make_shared<adapters::CapabilityAdapter>());
        })
        .def("protocols", [](const BridgeService& service) {
            return service.registry()->listProtocols();
        })
        .def("list_agents", [](const BridgeService& service, size_t limit, size_t offset) {
            return vector_to_list(service.listAgents(limit, offset));
        }, py::arg("limit") = 0, py::arg("offset") = 0)
        .def("get_agent", [](const BridgeService& service, const std::string& agentId) -> py::object {
            auto details = service.getAgent(agentId);
            return details ? json_to_object(details->toJson()) : py::none();
        }, py::arg("agent_id"))
        .def("import_agent", [](BridgeService& service, const std::string& sourceFormat,
                                const py::object& data, std::optional<std::string> agentId) {
            return json_to_object(service.importAgent(sourceFormat, object_to_json(data), agentId).toJson());
        }, py::arg("source_format"), py::arg("data"), py::arg("agent_id") = py::none())
        .def("export_agent", [](BridgeService& service, const std::string& agentId, const std::string& targetFormat,
                                std::optional<uint64_t> version, ExportFormat format) {
            return json_to_object(service.exportAgent(agentId, targetFormat, version, format).toJson());
        }, py::arg("agent_id"), py::arg("target_format"), py::arg("version") = py::none(),
           py::arg("format") = ExportFormat::NATIVE)
        .def("discover_agents", [](const BridgeService& service, std::optional<std::string> capability,
                                   std::optional<std::string> protocol, std::optional<std::string> text) {
            DiscoveryCriteria criteria{capability, protocol, text};
            return vector_to_list(service.discoverAgents(criteria));
        }, py::arg("capability") = py::none(), py::arg("protocol") = py::none(), py::arg("text") = py::none())
        .def("translate", [](BridgeService& service, const std::string& sourceFormat,
                             const std::string& targetFormat, const py::object& data,
                             std::optional<std::string> agentId, const py::dict& options) {
            TranslationRequest request;
            request.agentId = std::move(agentId);
            request.sourceFormat = sourceFormat;
            request.targetFormat = targetFormat;
            request.sourceData = object_to_json(data);
            request.options = optionsFrom(options);
            return json_to_object(service.translate(request).toJson());
        }, py::arg("source_format"), py::arg("target_format"), py::arg("data"),
           py::arg("agent_id") = py::none(), py::arg("options") = py::dict())
        .def("translate_chain", [](BridgeService& service, const py::object& data,
                                   const std::vector<std::string>& formats, const py::dict& options) {
            return json_to_object(service.orchestrator()->translateChain(
                object_to_json(data), formats, optionsFrom(options)).toJson());
        }, py::arg("data"), py::arg("formats"), py::arg("options") = py::dict())
        .def("delete_agent", &BridgeService::deleteAgent, py::arg("agent_id"))
        .def("compact", &BridgeService::compact)
        .def("stats", [](const BridgeService& service) { return json_to_object(service.getStats()); });
}
