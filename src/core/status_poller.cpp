/**
 * @file status_poller.cpp
 * @brief StatusPoller implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/status_poller.hpp"
#include "lanlight/core/messages.hpp"
#include "lanlight/utils/logger.hpp"

namespace lanlight {
namespace core {

StatusPoller::StatusPoller(Scheduler& scheduler, DatagramLink& link,
                           const DeviceRegistry& registry, uint16_t commandPort,
                           bool enabled, std::chrono::milliseconds interval)
    : scheduler_(scheduler)
    , link_(link)
    , registry_(registry)
    , commandPort_(commandPort)
    , enabled_(enabled)
    , interval_(interval) {}

StatusPoller::~StatusPoller() {
    cancelPoll();
}

void StatusPoller::start() {
    running_ = true;
    if (enabled_) {
        pollAll();
    }
}

void StatusPoller::stop() {
    running_ = false;
    cancelPoll();
}

void StatusPoller::setEnabled(bool enabled) {
    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    LOG_INFO("Poller", "Status polling {}", enabled ? "enabled" : "disabled");
    if (enabled) {
        pollAll();
    } else {
        cancelPoll();
    }
}

size_t StatusPoller::pollAll() {
    cancelPoll();
    if (!running_) {
        return 0;
    }

    const std::string request = protocol::Message::statusRequest().toJson();
    size_t sent = 0;
    for (const auto& device : registry_.devices()) {
        if (link_.sendTo(request, device->ip(), commandPort_)) {
            ++sent;
        }
    }
    LOG_TRACE("Poller", "Requested status from {} device(s)", sent);

    if (enabled_) {
        timer_ = scheduler_.callLater(interval_, [this]() {
            timer_ = Scheduler::INVALID_TIMER;
            pollAll();
        });
    }
    return sent;
}

void StatusPoller::cancelPoll() {
    if (timer_ != Scheduler::INVALID_TIMER) {
        scheduler_.cancel(timer_);
        timer_ = Scheduler::INVALID_TIMER;
    }
}

}  // namespace core
}  // namespace lanlight
