/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/device_registry.hpp"
#include "lanlight/utils/logger.hpp"

namespace lanlight {
namespace core {

// =============================================================================
// Discovery
// =============================================================================

DeviceRegistry::DevicePtr DeviceRegistry::upsertFromScan(const std::string& fingerprint,
                                                         const std::string& ip,
                                                         const std::string& sku,
                                                         const CapabilityTable& table,
                                                         const DiscoveredCallback& callback,
                                                         TimePoint now) {
    auto it = devices_.find(fingerprint);
    if (it != devices_.end()) {
        DevicePtr device = it->second;
        device->touch(now);
        if (device->ip() != ip) {
            LOG_INFO("Registry", "Device {} moved from {} to {}", fingerprint, device->ip(), ip);
            device->setIp(ip);
        }
        if (callback) {
            callback(*device, false);
        }
        return device;
    }

    const LightCapabilities* capabilities = table.find(sku);
    if (capabilities == nullptr) {
        LOG_WARN("Registry", "Unknown model '{}' for device {}, using power-only control",
                 sku, fingerprint);
        capabilities = &CapabilityTable::onOffOnly();
    }

    auto device = std::make_shared<Device>(fingerprint, ip, sku, *capabilities, now);
    if (callback && !callback(*device, true)) {
        LOG_DEBUG("Registry", "Device {} at {} rejected by discovery callback", fingerprint, ip);
        return nullptr;
    }

    if (queue_.erase(ip) > 0) {
        device->setManual(true);
    }
    devices_.emplace(fingerprint, device);

    LOG_INFO("Registry", "Discovered {} ({}) at {}{}", fingerprint, sku, ip,
             device->isManual() ? " [manual]" : "");
    return device;
}

size_t DeviceRegistry::evict(TimePoint now, std::chrono::milliseconds timeout,
                             const EvictedCallback& callback) {
    std::vector<DevicePtr> evicted;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second->lastSeen() >= timeout) {
            evicted.push_back(it->second);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& device : evicted) {
        LOG_INFO("Registry", "Evicting {} at {} (not seen for {} ms)", device->fingerprint(),
                 device->ip(),
                 std::chrono::duration_cast<std::chrono::milliseconds>(
                     now - device->lastSeen()).count());
        if (callback) {
            callback(*device);
        }
    }
    return evicted.size();
}

// =============================================================================
// Devices
// =============================================================================

DeviceRegistry::DevicePtr DeviceRegistry::findByFingerprint(const std::string& fingerprint) const {
    auto it = devices_.find(fingerprint);
    return it == devices_.end() ? nullptr : it->second;
}

DeviceRegistry::DevicePtr DeviceRegistry::findByIp(const std::string& ip) const {
    for (const auto& entry : devices_) {
        if (entry.second->ip() == ip) {
            return entry.second;
        }
    }
    return nullptr;
}

DeviceRegistry::DevicePtr DeviceRegistry::findBySku(const std::string& sku) const {
    for (const auto& entry : devices_) {
        if (entry.second->sku() == sku) {
            return entry.second;
        }
    }
    return nullptr;
}

DeviceRegistry::DevicePtr DeviceRegistry::remove(const std::string& fingerprint) {
    auto it = devices_.find(fingerprint);
    if (it == devices_.end()) {
        return nullptr;
    }
    DevicePtr device = it->second;
    devices_.erase(it);
    LOG_INFO("Registry", "Removed device {}", fingerprint);
    return device;
}

std::vector<DeviceRegistry::DevicePtr> DeviceRegistry::devices() const {
    std::vector<DevicePtr> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_) {
        result.push_back(entry.second);
    }
    return result;
}

// =============================================================================
// Manual address queue
// =============================================================================

bool DeviceRegistry::queueAddress(const std::string& ip) {
    bool inserted = queue_.insert(ip).second;
    if (inserted) {
        LOG_DEBUG("Registry", "Queued manual address {}", ip);
    }
    return inserted;
}

bool DeviceRegistry::unqueueAddress(const std::string& ip) {
    return queue_.erase(ip) > 0;
}

void DeviceRegistry::clear() {
    devices_.clear();
    queue_.clear();
}

}  // namespace core
}  // namespace lanlight
