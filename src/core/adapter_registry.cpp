#include "agentbridge/core/adapter_registry.h"
#include "agentbridge/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace agentbridge {
namespace core {

void AdapterRegistry::registerAdapter(std::shared_ptr<Adapter> adapter, const AdapterRegistration& registration) {
    if (!adapter) {
        throw std::invalid_argument("Cannot register a null adapter");
    }
    std::string protocolId = adapter->protocolId();
    if (protocolId.empty()) {
        throw std::invalid_argument("Adapter protocol id must not be empty");
    }
    auto capabilities = adapter->getCapabilities();

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.find(protocolId) != registry_.end()) {
        throw std::runtime_error("Adapter already registered for protocol: " + protocolId);
    }

    for (const auto& capability : capabilities) {
        capabilityIndex_[capability.name].insert(protocolId);
    }
    registry_[protocolId] = AdapterInfo{
        std::move(adapter),
        registration.priority,
        registration.enabled,
        AdapterUsage{}
    };

    XLOG_INFO("[registry] registered " << protocolId << " (priority " << registration.priority
              << ", " << capabilities.size() << " capabilities)");
}

bool AdapterRegistry::unregisterAdapter(const std::string& protocolId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    if (it == registry_.end()) {
        return false;
    }
    registry_.erase(it);

    // Purge from the index, dropping capabilities nobody declares any more.
    for (auto index = capabilityIndex_.begin(); index != capabilityIndex_.end();) {
        index->second.erase(protocolId);
        if (index->second.empty()) {
            index = capabilityIndex_.erase(index);
        } else {
            ++index;
        }
    }

    XLOG_INFO("[registry] unregistered " << protocolId);
    return true;
}

std::shared_ptr<Adapter> AdapterRegistry::getAdapter(const std::string& protocolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    if (it == registry_.end() || !it->second.enabled) {
        return nullptr;
    }
    return it->second.adapter;
}

bool AdapterRegistry::hasAdapter(const std::string& protocolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(protocolId) != registry_.end();
}

bool AdapterRegistry::isEnabled(const std::string& protocolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    return it != registry_.end() && it->second.enabled;
}

bool AdapterRegistry::setEnabled(const std::string& protocolId, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    if (it == registry_.end()) {
        return false;
    }
    it->second.enabled = enabled;
    XLOG_INFO("[registry] " << protocolId << (enabled ? " enabled" : " disabled"));
    return true;
}

std::vector<std::string> AdapterRegistry::findByCapability(const std::string& capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = capabilityIndex_.find(capability);
    if (it == capabilityIndex_.end()) {
        return {};
    }
    return sortByPriority(it->second);
}

bool AdapterRegistry::canTranslate(const std::string& sourceProtocol, const std::string& targetProtocol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto source = registry_.find(sourceProtocol);
    auto target = registry_.find(targetProtocol);
    return source != registry_.end() && source->second.enabled &&
           target != registry_.end() && target->second.enabled;
}

void AdapterRegistry::recordUsage(const std::string& protocolId, double fidelityScore) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    if (it == registry_.end()) {
        return;
    }
    AdapterUsage& usage = it->second.usage;
    usage.count++;
    usage.meanFidelity += (fidelityScore - usage.meanFidelity) / static_cast<double>(usage.count);
}

std::optional<AdapterUsage> AdapterRegistry::getUsage(const std::string& protocolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(protocolId);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    return it->second.usage;
}

std::vector<std::string> AdapterRegistry::listProtocols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> protocols;
    for (const auto& entry : registry_) {
        protocols.insert(entry.first);
    }
    return sortByPriority(protocols);
}

size_t AdapterRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

size_t AdapterRegistry::enabledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(registry_.begin(), registry_.end(),
        [](const auto& entry) { return entry.second.enabled; }));
}

std::vector<std::string> AdapterRegistry::sortByPriority(const std::set<std::string>& protocols) const {
    std::vector<std::string> sorted(protocols.begin(), protocols.end());
    // Stable over the alphabetical set order, so equal priorities list by name.
    std::stable_sort(sorted.begin(), sorted.end(), [this](const std::string& a, const std::string& b) {
        return registry_.at(a).priority > registry_.at(b).priority;
    });
    return sorted;
}

} // namespace core
} // namespace agentbridge
