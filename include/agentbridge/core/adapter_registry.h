#pragma once

#include "agentbridge/core/agent_adapter.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentbridge {
namespace core {

/**
 * @brief Options for registering an adapter
 */
struct AdapterRegistration {
    int priority{0};       ///< Higher priority adapters are listed first
    bool enabled{true};
};

/**
 * @brief Running usage figures of one adapter
 *
 * Only the mean and the count are kept so memory stays bounded.
 */
struct AdapterUsage {
    size_t count{0};
    double meanFidelity{0.0};
};

/**
 * @brief Registry of protocol adapters with a capability index
 *
 * The registry is an ordinary object owned by the hosting service; several
 * independent registries may coexist. All operations are thread-safe.
 */
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    /**
     * @brief Register an adapter under its protocol id
     *
     * Indexes the adapter by every capability name it declares.
     * @throws std::runtime_error if the protocol id is already registered
     * @throws std::invalid_argument if adapter is null or has an empty protocol id
     */
    void registerAdapter(std::shared_ptr<Adapter> adapter, const AdapterRegistration& registration = {});

    /**
     * @brief Remove an adapter and purge its capability index entries
     * @return false if the protocol was not registered
     */
    bool unregisterAdapter(const std::string& protocolId);

    /**
     * @brief Look up an enabled adapter
     * @return nullptr if the protocol is unknown or disabled
     */
    std::shared_ptr<Adapter> getAdapter(const std::string& protocolId) const;

    bool hasAdapter(const std::string& protocolId) const;
    bool isEnabled(const std::string& protocolId) const;

    /**
     * @return false if the protocol is not registered
     */
    bool setEnabled(const std::string& protocolId, bool enabled);

    /**
     * @brief Protocol ids declaring a capability, highest priority first
     *
     * Disabled adapters are included; callers check getAdapter() before use.
     */
    std::vector<std::string> findByCapability(const std::string& capability) const;

    /**
     * @brief Both protocols registered and enabled
     */
    bool canTranslate(const std::string& sourceProtocol, const std::string& targetProtocol) const;

    /**
     * @brief Fold one observed fidelity score into the running mean
     */
    void recordUsage(const std::string& protocolId, double fidelityScore);

    std::optional<AdapterUsage> getUsage(const std::string& protocolId) const;

    /**
     * @brief Registered protocol ids, highest priority first
     */
    std::vector<std::string> listProtocols() const;

    size_t size() const;
    size_t enabledCount() const;

private:
    struct AdapterInfo {
        std::shared_ptr<Adapter> adapter;
        int priority;
        bool enabled;
        AdapterUsage usage;
    };

    std::vector<std::string> sortByPriority(const std::set<std::string>& protocols) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, AdapterInfo> registry_;
    std::unordered_map<std::string, std::set<std::string>> capabilityIndex_;
};

} // namespace core
} // namespace agentbridge
