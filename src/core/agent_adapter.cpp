#include "agentbridge/core/agent_adapter.h"
#include "agentbridge/core/errors.h"
#include <algorithm>

namespace agentbridge {
namespace core {

bool Adapter::supportsFeature(const std::string& name) const {
    auto capabilities = getCapabilities();
    return std::any_of(capabilities.begin(), capabilities.end(),
                       [&name](const AdapterCapability& cap) { return cap.name == name; });
}

nlohmann::json TransformReport::toJson() const {
    nlohmann::json unmapped = nlohmann::json::array();
    for (const auto& field : unmappedFields) {
        unmapped.push_back({{"path", field.path}, {"reason", field.reason}});
    }
    nlohmann::json lossy = nlohmann::json::array();
    for (const auto& mapping : lossyMappings) {
        lossy.push_back({{"path", mapping.path}, {"reason", mapping.reason}});
    }
    return {
        {"success", success},
        {"fidelityScore", fidelityScore},
        {"mappedFields", mappedFields},
        {"unmappedFields", std::move(unmapped)},
        {"lossyMappings", std::move(lossy)},
        {"warnings", warnings},
        {"errors", errors},
        {"durationUs", duration.count()}
    };
}

TransformReport TransformReport::fromJson(const nlohmann::json& json) {
    TransformReport report;
    try {
        report.success = json.at("success").get<bool>();
        report.fidelityScore = json.at("fidelityScore").get<double>();
        report.mappedFields = json.value("mappedFields", std::vector<std::string>{});
        for (const auto& field : json.value("unmappedFields", nlohmann::json::array())) {
            report.unmappedFields.push_back({field.at("path").get<std::string>(), field.at("reason").get<std::string>()});
        }
        for (const auto& mapping : json.value("lossyMappings", nlohmann::json::array())) {
            report.lossyMappings.push_back({mapping.at("path").get<std::string>(), mapping.at("reason").get<std::string>()});
        }
        report.warnings = json.value("warnings", std::vector<std::string>{});
        report.errors = json.value("errors", std::vector<std::string>{});
        report.duration = std::chrono::microseconds(json.value("durationUs", int64_t{0}));
    } catch (const nlohmann::json::exception& e) {
        throw TransformError(std::string("Malformed transform report: ") + e.what());
    }
    return report;
}

} // namespace core
} // namespace agentbridge
