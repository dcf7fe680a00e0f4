/**
 * @file discovery_engine.hpp
 * @brief Periodic scan requests and scan-response handling.
 *
 * The DiscoveryEngine handles:
 * - Broadcasting scan requests on every endpoint while discovery is enabled
 * - Unicasting scan requests to queued and manual addresses
 * - Merging scan responses into the DeviceRegistry
 * - Evicting stale devices after each scan response, when enabled
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/capabilities.hpp"
#include "lanlight/core/device_registry.hpp"
#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/messages.hpp"
#include "lanlight/core/transport_manager.hpp"

#include <chrono>
#include <cstdint>

namespace lanlight {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Configuration for the discovery engine.
 */
struct LANLIGHT_CORE_API DiscoveryConfig {
    bool enabled;                           ///< Broadcast scans periodically
    std::chrono::milliseconds interval;     ///< Delay between scan rounds
    uint16_t scan_port;                     ///< Device port receiving scans
    bool evict_enabled;                     ///< Drop devices not seen for evict_timeout
    std::chrono::milliseconds evict_timeout;

    DiscoveryConfig()
        : enabled(false)
        , interval(10000)
        , scan_port(4001)
        , evict_enabled(false)
        , evict_timeout(30000)
    {}
};

/**
 * @class DiscoveryEngine
 * @brief Finds devices and keeps the registry's view of them fresh.
 *
 * Scan rounds are one-shot timers that reschedule themselves after any
 * round that sent something. All methods run on the scheduler thread.
 *
 * Usage:
 * @code
 * DiscoveryConfig config;
 * config.enabled = true;
 * DiscoveryEngine discovery(loop, transports, registry, CapabilityTable::builtin(), config);
 * discovery.start();
 * @endcode
 */
class LANLIGHT_CORE_API DiscoveryEngine {
public:
    DiscoveryEngine(Scheduler& scheduler, DatagramLink& link, DeviceRegistry& registry,
                    const CapabilityTable& table, const DiscoveryConfig& config);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Begin sending; runs a round now if discovery is enabled or
     *        addresses are queued.
     */
    void start();

    /**
     * @brief Stop sending and cancel the pending round.
     */
    void stop();

    /**
     * @brief Enabling runs a round immediately; disabling cancels the pending one.
     */
    void setEnabled(bool enabled);
    bool isEnabled() const { return config_.enabled; }

    /// Takes effect on the next reschedule.
    void setInterval(std::chrono::milliseconds interval) { config_.interval = interval; }
    std::chrono::milliseconds interval() const { return config_.interval; }

    void setEvictEnabled(bool enabled) { config_.evict_enabled = enabled; }
    bool isEvictEnabled() const { return config_.evict_enabled; }

    void setEvictTimeout(std::chrono::milliseconds timeout) { config_.evict_timeout = timeout; }
    std::chrono::milliseconds evictTimeout() const { return config_.evict_timeout; }

    /**
     * @brief Queue a manual address; runs a round now when discovery is off.
     * @return False if the address was already queued.
     */
    bool queueAddress(const std::string& ip);

    /**
     * @brief Send one scan round and reschedule if anything was sent.
     * @return True if at least one scan request went out.
     */
    bool runRound();

    /**
     * @brief Merge a scan response, then evict stale devices if enabled.
     */
    void handleScanResponse(const protocol::ScanResponse& response);

    void setDiscoveredCallback(DeviceRegistry::DiscoveredCallback callback) {
        discoveredCallback_ = std::move(callback);
    }

    void setEvictedCallback(DeviceRegistry::EvictedCallback callback) {
        evictedCallback_ = std::move(callback);
    }

    bool isRoundScheduled() const { return timer_ != Scheduler::INVALID_TIMER; }

private:
    void cancelRound();

    Scheduler& scheduler_;
    DatagramLink& link_;
    DeviceRegistry& registry_;
    const CapabilityTable& table_;
    DiscoveryConfig config_;

    DeviceRegistry::DiscoveredCallback discoveredCallback_;
    DeviceRegistry::EvictedCallback evictedCallback_;

    Scheduler::TimerId timer_ = Scheduler::INVALID_TIMER;
    bool running_ = false;
};

}  // namespace core
}  // namespace lanlight
