/**
 * @file controller.hpp
 * @brief Public entry point: discovery, polling and commands for LAN lights.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/capabilities.hpp"
#include "lanlight/core/command_executor.hpp"
#include "lanlight/core/device_registry.hpp"
#include "lanlight/core/discovery_engine.hpp"
#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/status_poller.hpp"
#include "lanlight/core/transport_manager.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @struct ControllerConfig
 * @brief Everything LightController needs to know up front.
 */
struct LANLIGHT_CORE_API ControllerConfig {
    std::vector<std::string> listen_addresses{"0.0.0.0"};
    std::vector<std::string> network_masks;             ///< Empty, or one per listen address
    uint16_t listen_port = 4002;
    uint16_t command_port = 4003;
    std::string broadcast_address = "239.255.255.250";
    uint16_t broadcast_port = 4001;

    bool discovery_enabled = false;
    std::chrono::milliseconds discovery_interval{10000};
    bool evict_enabled = false;
    std::chrono::milliseconds evict_interval{30000};
    bool update_enabled = true;
    std::chrono::milliseconds update_interval{5000};

    size_t max_retries = 10;

    TransportConfig transportConfig() const;
    DiscoveryConfig discoveryConfig() const;

    /// @throws ConfigError if an interval is not positive.
    void validate() const;
};

/**
 * @class LightController
 * @brief Owns the registry and the protocol components; all calls on the loop thread.
 *
 * Usage:
 * @code
 * EventLoop loop;
 * ControllerConfig config;
 * config.discovery_enabled = true;
 * LightController controller(loop, config);
 * controller.setDiscoveredHandler([](Device& device, bool isNew) { return true; });
 * controller.start();
 * loop.run();
 * @endcode
 */
class LANLIGHT_CORE_API LightController {
public:
    using DiscoveredHandler = DeviceRegistry::DiscoveredCallback;
    using EvictedHandler = DeviceRegistry::EvictedCallback;

    /**
     * @brief Controller with one UDP endpoint per configured listen address.
     * @throws ConfigError on a listen address / network mask count mismatch,
     *         or a non-positive interval.
     */
    LightController(EventLoop& loop, const ControllerConfig& config);

    /**
     * @brief Controller sending through an arbitrary link.
     *
     * Inbound datagrams must be fed to handleDatagram() by the caller.
     * @throws ConfigError on a non-positive interval.
     */
    LightController(Scheduler& scheduler, const ControllerConfig& config,
                    std::unique_ptr<DatagramLink> link);

    ~LightController();

    LightController(const LightController&) = delete;
    LightController& operator=(const LightController&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Open the endpoints and start discovery and polling.
     * @return False if an endpoint could not be bound.
     */
    bool start();

    /**
     * @brief Stop timers, cancel commands, close endpoints, forget devices.
     * @return Future satisfied once every endpoint reported disconnection.
     */
    std::shared_future<void> shutdown();

    bool isStarted() const { return started_; }

    // =========================================================================
    // Settings
    // =========================================================================

    void setDiscoveryEnabled(bool enabled) { discovery_.setEnabled(enabled); }
    bool isDiscoveryEnabled() const { return discovery_.isEnabled(); }
    void setDiscoveryInterval(std::chrono::milliseconds interval) { discovery_.setInterval(interval); }
    std::chrono::milliseconds discoveryInterval() const { return discovery_.interval(); }

    void setEvictEnabled(bool enabled) { discovery_.setEvictEnabled(enabled); }
    bool isEvictEnabled() const { return discovery_.isEvictEnabled(); }
    void setEvictInterval(std::chrono::milliseconds interval) { discovery_.setEvictTimeout(interval); }
    std::chrono::milliseconds evictInterval() const { return discovery_.evictTimeout(); }

    void setUpdateEnabled(bool enabled) { poller_.setEnabled(enabled); }
    bool isUpdateEnabled() const { return poller_.isEnabled(); }
    void setUpdateInterval(std::chrono::milliseconds interval) { poller_.setInterval(interval); }
    std::chrono::milliseconds updateInterval() const { return poller_.interval(); }

    /**
     * @brief Install the discovery hook (empty clears it).
     * @return The previous hook.
     */
    DiscoveredHandler setDiscoveredHandler(DiscoveredHandler handler);

    /**
     * @brief Install the eviction hook (empty clears it).
     * @return The previous hook.
     */
    EvictedHandler setEvictedHandler(EvictedHandler handler);

    // =========================================================================
    // Devices
    // =========================================================================

    /**
     * @brief Probe an address that multicast discovery may not reach.
     * @return False if the address was already queued.
     */
    bool addManualDevice(const std::string& ip);

    bool removeQueuedAddress(const std::string& ip);
    const std::set<std::string>& queuedAddresses() const { return registry_.queuedAddresses(); }

    /**
     * @brief Forget a device and cancel its commands.
     * @return False if the device was unknown.
     */
    bool removeDevice(const std::string& fingerprint);

    std::vector<DeviceRegistry::DevicePtr> devices() const { return registry_.devices(); }
    DeviceRegistry::DevicePtr findByFingerprint(const std::string& fingerprint) const;
    DeviceRegistry::DevicePtr findByIp(const std::string& ip) const;
    DeviceRegistry::DevicePtr findBySku(const std::string& sku) const;

    // =========================================================================
    // Commands
    // =========================================================================

    // Stateful commands: retried until a status response confirms them.
    // Each returns false (with a warning) for an unknown fingerprint.
    bool turnOnOff(const std::string& fingerprint, bool on);
    bool setBrightness(const std::string& fingerprint, int percent);
    bool setRgbColor(const std::string& fingerprint, const Rgb& color);
    bool setTemperature(const std::string& fingerprint, int kelvin);

    /**
     * @brief RGB when given, otherwise color temperature.
     * @return False when neither is given.
     */
    bool setColor(const std::string& fingerprint, const std::optional<Rgb>& rgb,
                  std::optional<int> kelvin);

    /**
     * @brief Color one segment (1-based). Sent once.
     */
    bool setSegmentColor(const std::string& fingerprint, int segment, const Rgb& color);

    /**
     * @brief Activate a scene by name, ignoring case. Sent once.
     */
    bool setScene(const std::string& fingerprint, const std::string& scene);

    /**
     * @brief Send hex-encoded frames verbatim in a ptReal command. Sent once.
     */
    bool sendRawCommand(const std::string& fingerprint, const std::vector<std::string>& hexFrames);

    // =========================================================================
    // Inbound
    // =========================================================================

    /**
     * @brief Decode and dispatch one datagram received from @p senderIp.
     */
    void handleDatagram(const std::string& payload, const std::string& senderIp);

    CommandExecutor& commands() { return executor_; }
    const ControllerConfig& config() const { return config_; }

private:
    DeviceRegistry::DevicePtr requireDevice(const std::string& fingerprint,
                                            const char* operation) const;
    bool sendOnce(const Device& device, const protocol::Message& message);

    Scheduler& scheduler_;
    ControllerConfig config_;
    std::unique_ptr<DatagramLink> link_;
    TransportManager* transports_;      ///< link_ when it owns real sockets, else nullptr

    DeviceRegistry registry_;
    DiscoveryEngine discovery_;
    StatusPoller poller_;
    CommandExecutor executor_;

    DiscoveredHandler discoveredHandler_;
    EvictedHandler evictedHandler_;
    bool started_ = false;
};

}  // namespace core
}  // namespace lanlight
