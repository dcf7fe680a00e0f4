/**
 * @file device.cpp
 * @brief Device implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/device.hpp"

#include <sstream>

namespace lanlight {
namespace core {

Device::Device(std::string fingerprint, std::string ip, std::string sku,
               LightCapabilities capabilities, TimePoint now)
    : fingerprint_(std::move(fingerprint))
    , ip_(std::move(ip))
    , sku_(std::move(sku))
    , capabilities_(std::move(capabilities))
    , lastSeen_(now)
{}

void Device::applyStatus(const DeviceState& state, TimePoint now) {
    state_ = state;
    lastSeen_ = now;
    if (updateHandler_) {
        // Copy so the handler may replace itself.
        UpdateHandler handler = updateHandler_;
        handler(*this);
    }
}

Device::UpdateHandler Device::setUpdateHandler(UpdateHandler handler) {
    UpdateHandler previous = std::move(updateHandler_);
    updateHandler_ = std::move(handler);
    return previous;
}

std::string Device::toString() const {
    std::ostringstream oss;
    oss << "<Device ip=" << ip_ << ", fingerprint=" << fingerprint_ << ", sku=" << sku_
        << (manual_ ? ", manual" : "") << ", state=" << state_ << ">";
    return oss.str();
}

}  // namespace core
}  // namespace lanlight
