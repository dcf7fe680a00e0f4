/**
 * @file device_registry.hpp
 * @brief Known devices and manually queued addresses.
 *
 * The DeviceRegistry maintains:
 * - Discovered devices keyed by fingerprint
 * - Addresses queued by the user that have not answered a scan yet
 *
 * The registry lives on the event loop thread and takes no locks.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/capabilities.hpp"
#include "lanlight/core/device.hpp"
#include "lanlight/core/export.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @class DeviceRegistry
 * @brief Authoritative map of known devices.
 *
 * Usage:
 * @code
 * DeviceRegistry registry;
 * registry.queueAddress("10.0.0.7");
 * registry.upsertFromScan("AA:BB:CC", "10.0.0.7", "H619A",
 *                         CapabilityTable::builtin(), acceptAll, now);
 * auto device = registry.findByFingerprint("AA:BB:CC");
 * @endcode
 */
class LANLIGHT_CORE_API DeviceRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using DevicePtr = std::shared_ptr<Device>;

    /// (device, isNew) -> accept. The return value only matters for new devices.
    using DiscoveredCallback = std::function<bool(Device&, bool)>;

    using EvictedCallback = std::function<void(Device&)>;

    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    // Non-copyable
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // =========================================================================
    // Discovery
    // =========================================================================

    /**
     * @brief Merge one scan response into the registry.
     *
     * A known fingerprint only has its address and lastSeen refreshed.
     * An unknown one is built with capabilities from @p table (power-only
     * if the SKU is missing from it) and added if @p callback accepts it.
     *
     * @return The device, or nullptr if a new device was rejected.
     */
    DevicePtr upsertFromScan(const std::string& fingerprint,
                             const std::string& ip,
                             const std::string& sku,
                             const CapabilityTable& table,
                             const DiscoveredCallback& callback,
                             TimePoint now);

    /**
     * @brief Remove every device not seen for at least @p timeout.
     *
     * @p callback runs once per removed device, after it left the registry.
     * @return The number of devices removed.
     */
    size_t evict(TimePoint now, std::chrono::milliseconds timeout,
                 const EvictedCallback& callback);

    // =========================================================================
    // Devices
    // =========================================================================

    DevicePtr findByFingerprint(const std::string& fingerprint) const;
    DevicePtr findByIp(const std::string& ip) const;
    DevicePtr findBySku(const std::string& sku) const;

    /**
     * @return The removed device, or nullptr if it was not registered.
     */
    DevicePtr remove(const std::string& fingerprint);

    /**
     * @brief Snapshot of all devices ordered by fingerprint.
     */
    std::vector<DevicePtr> devices() const;

    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

    // =========================================================================
    // Manual address queue
    // =========================================================================

    /**
     * @return False if the address was already queued.
     */
    bool queueAddress(const std::string& ip);

    /**
     * @return False if the address was not queued.
     */
    bool unqueueAddress(const std::string& ip);

    bool isQueued(const std::string& ip) const { return queue_.count(ip) != 0; }

    const std::set<std::string>& queuedAddresses() const { return queue_; }

    /**
     * @brief Drop every device and every queued address.
     */
    void clear();

private:
    std::map<std::string, DevicePtr> devices_;
    std::set<std::string> queue_;
};

}  // namespace core
}  // namespace lanlight
