/**
 * @file status_poller.hpp
 * @brief Periodic devStatus requests to every known device.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/device_registry.hpp"
#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/transport_manager.hpp"

#include <chrono>
#include <cstdint>

namespace lanlight {
namespace core {

/**
 * @class StatusPoller
 * @brief Asks every registered device for its state on a fixed period.
 *
 * Independent of discovery: polling continues while scans are disabled.
 */
class LANLIGHT_CORE_API StatusPoller {
public:
    StatusPoller(Scheduler& scheduler, DatagramLink& link, const DeviceRegistry& registry,
                 uint16_t commandPort, bool enabled, std::chrono::milliseconds interval);
    ~StatusPoller();

    StatusPoller(const StatusPoller&) = delete;
    StatusPoller& operator=(const StatusPoller&) = delete;

    /**
     * @brief Begin polling; polls immediately if enabled.
     */
    void start();

    void stop();

    /**
     * @brief Enabling polls immediately; disabling cancels the pending poll.
     */
    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    void setInterval(std::chrono::milliseconds interval) { interval_ = interval; }
    std::chrono::milliseconds interval() const { return interval_; }

    /**
     * @brief Request status from every device, then reschedule if enabled.
     * @return Number of requests sent.
     */
    size_t pollAll();

    bool isPollScheduled() const { return timer_ != Scheduler::INVALID_TIMER; }

private:
    void cancelPoll();

    Scheduler& scheduler_;
    DatagramLink& link_;
    const DeviceRegistry& registry_;
    uint16_t commandPort_;
    bool enabled_;
    std::chrono::milliseconds interval_;
    Scheduler::TimerId timer_ = Scheduler::INVALID_TIMER;
    bool running_ = false;
};

}  // namespace core
}  // namespace lanlight
