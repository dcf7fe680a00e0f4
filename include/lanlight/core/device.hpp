/**
 * @file device.hpp
 * @brief One discovered light and its last known state.
 *
 * A Device is plain data owned by the DeviceRegistry. Commands are issued
 * through LightController by fingerprint, so the device keeps no reference
 * back to the controller.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/capabilities.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/light_types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace lanlight {
namespace core {

/**
 * @class Device
 * @brief A light known to the registry.
 */
class LANLIGHT_CORE_API Device {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// Called after every state refresh from a status response.
    using UpdateHandler = std::function<void(const Device&)>;

    Device(std::string fingerprint, std::string ip, std::string sku,
           LightCapabilities capabilities, TimePoint now);

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const std::string& fingerprint() const { return fingerprint_; }
    const std::string& ip() const { return ip_; }
    const std::string& sku() const { return sku_; }
    const LightCapabilities& capabilities() const { return capabilities_; }
    TimePoint lastSeen() const { return lastSeen_; }
    const DeviceState& state() const { return state_; }
    bool isManual() const { return manual_; }

    bool supports(LightFeature feature) const { return capabilities_.has(feature); }

    void setIp(const std::string& ip) { ip_ = ip; }
    void setManual(bool manual) { manual_ = manual; }
    void touch(TimePoint now) { lastSeen_ = now; }

    /**
     * @brief Replace the reported state wholesale, refresh lastSeen and
     *        notify the update handler.
     */
    void applyStatus(const DeviceState& state, TimePoint now);

    // Optimistic updates made when a command is issued; the next status
    // response overwrites them.
    void assumePower(bool on) { state_.on = on; }
    void assumeBrightness(int brightness) { state_.brightness = brightness; }
    void assumeColor(const Rgb& color) { state_.color = color; }
    void assumeTemperature(int kelvin) { state_.colorTemperature = kelvin; }

    /**
     * @brief Install @p handler (empty clears it).
     * @return The previously installed handler.
     */
    UpdateHandler setUpdateHandler(UpdateHandler handler);

    bool hasUpdateHandler() const { return static_cast<bool>(updateHandler_); }

    std::string toString() const;

private:
    const std::string fingerprint_;
    std::string ip_;
    const std::string sku_;
    const LightCapabilities capabilities_;
    TimePoint lastSeen_;
    DeviceState state_;
    bool manual_ = false;
    UpdateHandler updateHandler_;
};

}  // namespace core
}  // namespace lanlight
