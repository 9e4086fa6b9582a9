#pragma once

#include "agentbridge/core/canonical_graph.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentbridge {
namespace core {

/**
 * @brief Opaque native agent description tagged with its protocol id
 *
 * The orchestrator only ever carries this pair; the shape of data is the
 * business of the adapter registered for the protocol.
 */
struct NativePayload {
    std::string protocol;
    nlohmann::json data;
};

/**
 * @brief Native field preserved in the extension namespace
 */
struct UnmappedField {
    std::string path;
    std::string reason;
};

/**
 * @brief Native or canonical content that could not be carried across
 */
struct LossyMapping {
    std::string path;
    std::string reason;
};

/**
 * @brief Per-direction outcome of a transform
 */
struct TransformReport {
    bool success{false};
    double fidelityScore{0.0};                  ///< In [0, 1]
    std::vector<std::string> mappedFields;
    std::vector<UnmappedField> unmappedFields;
    std::vector<LossyMapping> lossyMappings;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::chrono::microseconds duration{0};

    nlohmann::json toJson() const;
    static TransformReport fromJson(const nlohmann::json& json);
};

/**
 * @brief Options passed to both transform directions
 */
struct TransformOptions {
    std::optional<std::string> agentId;   ///< Overrides the id derived from the native name
    bool strict{false};                   ///< Treat validation warnings as errors
};

struct CanonicalResult {
    CanonicalGraph graph;
    std::string agentId;
    TransformReport report;
};

struct NativeResult {
    nlohmann::json native;
    TransformReport report;
};

struct ValidationIssue {
    std::string path;
    std::string message;
};

struct ValidationResult {
    bool valid{true};
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
};

/**
 * @brief Feature an adapter declares, indexed by the registry
 */
struct AdapterCapability {
    std::string name;
    std::string description;
    bool bidirectional{true};
};

/**
 * @brief Bidirectional translator between one protocol and the canonical model
 *
 * Implementations must be deterministic for identical input and safe to call
 * from several threads at once. toCanonical() never drops a native field
 * silently: it is either mapped, written to the extension namespace under
 * protocolId(), or reported as a lossy mapping with a reason.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    /**
     * @brief Protocol id, also the adapter's extension namespace key
     */
    virtual std::string protocolId() const = 0;

    virtual std::string description() const { return ""; }

    /**
     * @brief Translate a native description into a canonical graph
     *
     * @throws TransformError if a required identity field is absent
     */
    virtual CanonicalResult toCanonical(
        const nlohmann::json& native,
        const TransformOptions& options) const = 0;

    /**
     * @brief Render a canonical graph in this protocol's native shape
     *
     * Restores extension entries that belong to protocolId().
     * @throws TransformError if the graph lacks its Agent-typed node
     */
    virtual NativeResult fromCanonical(
        const CanonicalGraph& graph,
        const TransformOptions& options) const = 0;

    virtual ValidationResult validate(const nlohmann::json& native) const = 0;

    virtual std::vector<AdapterCapability> getCapabilities() const = 0;

    /**
     * @brief Whether a named feature is declared in getCapabilities()
     */
    virtual bool supportsFeature(const std::string& name) const;
};

} // namespace core
} // namespace agentbridge
