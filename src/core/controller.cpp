/**
 * @file controller.cpp
 * @brief LightController implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/controller.hpp"
#include "lanlight/core/messages.hpp"
#include "lanlight/utils/logger.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

namespace lanlight {
namespace core {

namespace {

RetryPolicy retryPolicyFor(const ControllerConfig& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_retries;
    return policy;
}

}  // namespace

// =============================================================================
// ControllerConfig
// =============================================================================

TransportConfig ControllerConfig::transportConfig() const {
    TransportConfig transport;
    transport.listen_addresses = listen_addresses;
    transport.network_masks = network_masks;
    transport.listen_port = listen_port;
    transport.broadcast_address = broadcast_address;
    transport.broadcast_port = broadcast_port;
    return transport;
}

DiscoveryConfig ControllerConfig::discoveryConfig() const {
    DiscoveryConfig discovery;
    discovery.enabled = discovery_enabled;
    discovery.interval = discovery_interval;
    discovery.scan_port = broadcast_port;
    discovery.evict_enabled = evict_enabled;
    discovery.evict_timeout = evict_interval;
    return discovery;
}

void ControllerConfig::validate() const {
    auto requirePositive = [](std::chrono::milliseconds interval, const char* name) {
        if (interval.count() <= 0) {
            throw ConfigError(std::string(name) + " must be positive, got " +
                              std::to_string(interval.count()) + "ms");
        }
    };
    requirePositive(discovery_interval, "discovery interval");
    requirePositive(evict_interval, "evict interval");
    requirePositive(update_interval, "update interval");
}

// =============================================================================
// Lifecycle
// =============================================================================

LightController::LightController(EventLoop& loop, const ControllerConfig& config)
    : LightController(loop, config,
                      std::make_unique<TransportManager>(loop, config.transportConfig())) {}

LightController::LightController(Scheduler& scheduler, const ControllerConfig& config,
                                 std::unique_ptr<DatagramLink> link)
    : scheduler_(scheduler)
    , config_(config)
    , link_(std::move(link))
    , transports_(dynamic_cast<TransportManager*>(link_.get()))
    , discovery_(scheduler, *link_, registry_, CapabilityTable::builtin(),
                 config.discoveryConfig())
    , poller_(scheduler, *link_, registry_, config.command_port, config.update_enabled,
              config.update_interval)
    , executor_(scheduler, *link_, registry_, config.command_port, retryPolicyFor(config))
{
    config_.validate();

    discovery_.setDiscoveredCallback([this](Device& device, bool isNew) {
        if (!discoveredHandler_) {
            return true;
        }
        DiscoveredHandler handler = discoveredHandler_;
        return handler(device, isNew);
    });

    discovery_.setEvictedCallback([this](Device& device) {
        executor_.cancelDevice(device.fingerprint());
        if (evictedHandler_) {
            EvictedHandler handler = evictedHandler_;
            handler(device);
        }
    });
}

LightController::~LightController() {
    if (started_) {
        shutdown();
    }
}

bool LightController::start() {
    if (started_) {
        LOG_WARN("Controller", "Already started");
        return true;
    }

    if (transports_ != nullptr) {
        bool opened = transports_->open([this](const std::string& payload,
                                               const std::string& senderIp) {
            handleDatagram(payload, senderIp);
        });
        if (!opened) {
            LOG_ERROR("Controller", "Failed to open UDP endpoints");
            return false;
        }
    }

    started_ = true;
    LOG_INFO("Controller", "Started (discovery {}, status polling {})",
             discovery_.isEnabled() ? "on" : "off", poller_.isEnabled() ? "on" : "off");

    discovery_.start();
    poller_.start();
    return true;
}

std::shared_future<void> LightController::shutdown() {
    LOG_INFO("Controller", "Shutting down...");
    started_ = false;

    poller_.stop();
    poller_.setEnabled(false);
    discovery_.stop();
    discovery_.setEnabled(false);
    executor_.cancelAll();

    std::shared_future<void> closed;
    if (transports_ != nullptr) {
        closed = transports_->close();
    } else {
        std::promise<void> done;
        done.set_value();
        closed = done.get_future().share();
    }

    registry_.clear();
    LOG_INFO("Controller", "Shutdown complete");
    return closed;
}

// =============================================================================
// Settings
// =============================================================================

LightController::DiscoveredHandler LightController::setDiscoveredHandler(DiscoveredHandler handler) {
    DiscoveredHandler previous = std::move(discoveredHandler_);
    discoveredHandler_ = std::move(handler);
    return previous;
}

LightController::EvictedHandler LightController::setEvictedHandler(EvictedHandler handler) {
    EvictedHandler previous = std::move(evictedHandler_);
    evictedHandler_ = std::move(handler);
    return previous;
}

// =============================================================================
// Devices
// =============================================================================

bool LightController::addManualDevice(const std::string& ip) {
    return discovery_.queueAddress(ip);
}

bool LightController::removeQueuedAddress(const std::string& ip) {
    return registry_.unqueueAddress(ip);
}

bool LightController::removeDevice(const std::string& fingerprint) {
    executor_.cancelDevice(fingerprint);
    return registry_.remove(fingerprint) != nullptr;
}

DeviceRegistry::DevicePtr LightController::findByFingerprint(const std::string& fingerprint) const {
    return registry_.findByFingerprint(fingerprint);
}

DeviceRegistry::DevicePtr LightController::findByIp(const std::string& ip) const {
    return registry_.findByIp(ip);
}

DeviceRegistry::DevicePtr LightController::findBySku(const std::string& sku) const {
    return registry_.findBySku(sku);
}

// =============================================================================
// Commands
// =============================================================================

bool LightController::turnOnOff(const std::string& fingerprint, bool on) {
    auto device = requireDevice(fingerprint, "power");
    if (!device) {
        return false;
    }
    executor_.execute(fingerprint, CommandKind::POWER, protocol::Message::turn(on),
                      predicates::powerIs(on));
    device->assumePower(on);
    return true;
}

bool LightController::setBrightness(const std::string& fingerprint, int percent) {
    auto device = requireDevice(fingerprint, "brightness");
    if (!device) {
        return false;
    }
    const int value = std::max(protocol::kBrightnessMin,
                               std::min(percent, protocol::kBrightnessMax));
    executor_.execute(fingerprint, CommandKind::BRIGHTNESS, protocol::Message::brightness(value),
                      predicates::brightnessIs(value));
    device->assumeBrightness(value);
    return true;
}

bool LightController::setRgbColor(const std::string& fingerprint, const Rgb& color) {
    auto device = requireDevice(fingerprint, "color");
    if (!device) {
        return false;
    }
    auto clampChannel = [](int c) { return std::max(0, std::min(c, protocol::kColorChannelMax)); };
    const Rgb value(clampChannel(color.r), clampChannel(color.g), clampChannel(color.b));
    executor_.execute(fingerprint, CommandKind::COLOR, protocol::Message::color(value),
                      predicates::colorNear(value));
    device->assumeColor(value);
    return true;
}

bool LightController::setTemperature(const std::string& fingerprint, int kelvin) {
    auto device = requireDevice(fingerprint, "temperature");
    if (!device) {
        return false;
    }
    const int value = std::max(protocol::kTemperatureMinKelvin,
                               std::min(kelvin, protocol::kTemperatureMaxKelvin));
    executor_.execute(fingerprint, CommandKind::COLOR, protocol::Message::colorTemperature(value),
                      predicates::temperatureNear(value));
    device->assumeTemperature(value);
    return true;
}

bool LightController::setColor(const std::string& fingerprint, const std::optional<Rgb>& rgb,
                               std::optional<int> kelvin) {
    if (rgb) {
        return setRgbColor(fingerprint, *rgb);
    }
    if (kelvin) {
        return setTemperature(fingerprint, *kelvin);
    }
    LOG_WARN("Controller", "Color command for {} has neither RGB nor temperature", fingerprint);
    return false;
}

bool LightController::setSegmentColor(const std::string& fingerprint, int segment,
                                       const Rgb& color) {
    auto device = requireDevice(fingerprint, "segment color");
    if (!device) {
        return false;
    }
    if (!device->supports(LightFeature::SEGMENT_CONTROL)) {
        LOG_WARN("Controller", "Segment control is not supported by {}", device->toString());
        return false;
    }
    auto code = device->capabilities().segmentCode(segment);
    if (!code) {
        LOG_WARN("Controller", "Segment index {} is not valid for {}", segment,
                 device->toString());
        return false;
    }
    return sendOnce(*device, protocol::Message::ptReal({protocol::segmentColorFrame(*code, color)}));
}

bool LightController::setScene(const std::string& fingerprint, const std::string& scene) {
    auto device = requireDevice(fingerprint, "scene");
    if (!device) {
        return false;
    }
    if (!device->supports(LightFeature::SCENES)) {
        LOG_WARN("Controller", "Scenes are not supported by {}", device->toString());
        return false;
    }
    auto code = device->capabilities().sceneCode(scene);
    if (!code) {
        LOG_WARN("Controller", "Scene '{}' is not available for {}", scene, device->toString());
        return false;
    }
    return sendOnce(*device, protocol::Message::ptReal({protocol::sceneFrame(*code)}));
}

bool LightController::sendRawCommand(const std::string& fingerprint,
                                     const std::vector<std::string>& hexFrames) {
    auto device = requireDevice(fingerprint, "raw");
    if (!device) {
        return false;
    }
    auto message = protocol::rawHexCommand(hexFrames);
    if (!message) {
        return false;
    }
    return sendOnce(*device, *message);
}

DeviceRegistry::DevicePtr LightController::requireDevice(const std::string& fingerprint,
                                                         const char* operation) const {
    auto device = registry_.findByFingerprint(fingerprint);
    if (!device) {
        LOG_WARN("Controller", "Ignoring {} command for unknown device {}", operation,
                 fingerprint);
    }
    return device;
}

bool LightController::sendOnce(const Device& device, const protocol::Message& message) {
    LOG_DEBUG("Controller", "Sending {} to {}", message.toJson(), device.fingerprint());
    return link_->sendTo(message.toJson(), device.ip(), config_.command_port);
}

// =============================================================================
// Inbound
// =============================================================================

void LightController::handleDatagram(const std::string& payload, const std::string& senderIp) {
    auto response = protocol::decodeMessage(payload);
    if (!response) {
        LOG_DEBUG("Controller", "Undecodable datagram from {}", senderIp);
        return;
    }

    std::visit([this, &senderIp](const auto& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, protocol::ScanResponse>) {
            discovery_.handleScanResponse(message);
        } else {
            auto device = registry_.findByIp(senderIp);
            if (!device) {
                LOG_DEBUG("Controller", "Status from unregistered address {}", senderIp);
                return;
            }
            device->applyStatus(message.state, scheduler_.now());
            executor_.notifyStatus(device->fingerprint(), message.state);
        }
    }, *response);
}

}  // namespace core
}  // namespace lanlight
