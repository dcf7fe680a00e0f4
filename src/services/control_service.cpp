/**
 * @file control_service.cpp
 * @brief ControlServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/services/control_service.hpp"
#include "lanlight/utils/logger.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanlight {
namespace services {

namespace {

// =============================================================================
// LoopReactor - runs one RPC body on the event loop
// =============================================================================

class LoopReactor : public grpc::ServerUnaryReactor {
public:
    using Work = std::function<grpc::Status()>;

    LoopReactor(core::EventLoop& loop, const char* method, Work work)
        : method_(method)
    {
        loop.post([this, work = std::move(work)]() {
            grpc::Status status;
            try {
                status = work();
            } catch (const std::exception& e) {
                LOG_ERROR("ControlService", "{} failed: {}", method_, e.what());
                status = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
            }
            Finish(status);
        });
    }

    void OnDone() override {
        delete this;
    }

private:
    const char* method_;
};

const core::LightFeature kAllFeatures[] = {
    core::LightFeature::POWER,
    core::LightFeature::BRIGHTNESS,
    core::LightFeature::COLOR_RGB,
    core::LightFeature::COLOR_TEMPERATURE,
    core::LightFeature::SEGMENT_CONTROL,
    core::LightFeature::SCENES,
};

core::Rgb toRgb(const control::Rgb& color) {
    return core::Rgb(color.r(), color.g(), color.b());
}

grpc::Status unknownDevice(const std::string& fingerprint) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "Unknown device: " + fingerprint);
}

// Commands that pass validation but are refused by the controller report
// success=false rather than an RPC error.
grpc::Status commandResult(control::CommandResponse* response, bool ok, const char* error) {
    response->set_success(ok);
    if (!ok) {
        response->set_error(error);
    }
    return grpc::Status::OK;
}

}  // namespace

void toDeviceInfo(const core::Device& device, core::Scheduler::TimePoint now,
                  control::DeviceInfo* info) {
    info->set_fingerprint(device.fingerprint());
    info->set_ip(device.ip());
    info->set_sku(device.sku());
    info->set_manual(device.isManual());

    const core::DeviceState& state = device.state();
    info->set_on(state.on);
    info->set_brightness(state.brightness);
    auto* color = info->mutable_color();
    color->set_r(state.color.r);
    color->set_g(state.color.g);
    color->set_b(state.color.b);
    info->set_color_temperature(state.colorTemperature);

    const core::LightCapabilities& capabilities = device.capabilities();
    for (core::LightFeature feature : kAllFeatures) {
        if (capabilities.has(feature)) {
            info->add_features(core::lightFeatureToString(feature));
        }
    }
    info->set_segment_count(static_cast<int32_t>(capabilities.segments.size()));
    for (const auto& scene : capabilities.scenes) {
        info->add_scenes(scene.first);
    }

    info->set_last_seen_ms_ago(
        std::chrono::duration_cast<std::chrono::milliseconds>(now - device.lastSeen()).count());
}

// =============================================================================
// ControlServiceImpl
// =============================================================================

ControlServiceImpl::ControlServiceImpl(core::EventLoop& loop, core::LightController& controller)
    : loop_(loop)
    , controller_(controller)
{
    LOG_INFO("ControlService", "Created control service");
}

ControlServiceImpl::~ControlServiceImpl() = default;

// =============================================================================
// Registry
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::ListDevices(
    grpc::CallbackServerContext* context,
    const control::ListDevicesRequest* request,
    control::ListDevicesResponse* response) {

    return new LoopReactor(loop_, "ListDevices", [this, response]() {
        const auto now = loop_.now();
        for (const auto& device : controller_.devices()) {
            toDeviceInfo(*device, now, response->add_devices());
        }
        for (const auto& ip : controller_.queuedAddresses()) {
            response->add_queued_addresses(ip);
        }
        LOG_DEBUG("ControlService", "ListDevices: {} device(s)", response->devices_size());
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::GetDevice(
    grpc::CallbackServerContext* context,
    const control::GetDeviceRequest* request,
    control::GetDeviceResponse* response) {

    return new LoopReactor(loop_, "GetDevice", [this, request, response]() {
        const std::string& key = request->key();
        auto device = controller_.findByFingerprint(key);
        if (!device) {
            device = controller_.findByIp(key);
        }
        if (!device) {
            device = controller_.findBySku(key);
        }

        response->set_found(device != nullptr);
        if (device) {
            toDeviceInfo(*device, loop_.now(), response->mutable_device());
        }
        return grpc::Status::OK;
    });
}

// =============================================================================
// Commands
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::SetPower(
    grpc::CallbackServerContext* context,
    const control::SetPowerRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetPower", [this, request, response]() {
        LOG_DEBUG("ControlService", "SetPower: device={}, on={}", request->fingerprint(),
                  request->on());
        if (!controller_.findByFingerprint(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        return commandResult(response,
                             controller_.turnOnOff(request->fingerprint(), request->on()),
                             "Command rejected");
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetBrightness(
    grpc::CallbackServerContext* context,
    const control::SetBrightnessRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetBrightness", [this, request, response]() {
        LOG_DEBUG("ControlService", "SetBrightness: device={}, brightness={}",
                  request->fingerprint(), request->brightness());
        if (!controller_.findByFingerprint(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        return commandResult(response,
                             controller_.setBrightness(request->fingerprint(),
                                                       request->brightness()),
                             "Command rejected");
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetColor(
    grpc::CallbackServerContext* context,
    const control::SetColorRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetColor", [this, request, response]() {
        const std::string& fingerprint = request->fingerprint();
        if (!controller_.findByFingerprint(fingerprint)) {
            return unknownDevice(fingerprint);
        }

        switch (request->target_case()) {
            case control::SetColorRequest::kRgb:
                LOG_DEBUG("ControlService", "SetColor: device={}, rgb={}", fingerprint,
                          toRgb(request->rgb()));
                return commandResult(response,
                                     controller_.setColor(fingerprint, toRgb(request->rgb()),
                                                          std::nullopt),
                                     "Command rejected");
            case control::SetColorRequest::kKelvin:
                LOG_DEBUG("ControlService", "SetColor: device={}, kelvin={}", fingerprint,
                          request->kelvin());
                return commandResult(response,
                                     controller_.setColor(fingerprint, std::nullopt,
                                                          request->kelvin()),
                                     "Command rejected");
            default:
                return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                    "Either rgb or kelvin is required");
        }
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetSegmentColor(
    grpc::CallbackServerContext* context,
    const control::SetSegmentColorRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetSegmentColor", [this, request, response]() {
        if (!controller_.findByFingerprint(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        return commandResult(response,
                             controller_.setSegmentColor(request->fingerprint(),
                                                         request->segment(),
                                                         toRgb(request->color())),
                             "Segment control unsupported or segment out of range");
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetScene(
    grpc::CallbackServerContext* context,
    const control::SetSceneRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetScene", [this, request, response]() {
        if (!controller_.findByFingerprint(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        return commandResult(response,
                             controller_.setScene(request->fingerprint(), request->scene()),
                             "Scenes unsupported or unknown scene");
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SendRawCommand(
    grpc::CallbackServerContext* context,
    const control::SendRawCommandRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SendRawCommand", [this, request, response]() {
        if (!controller_.findByFingerprint(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        std::vector<std::string> frames(request->frames().begin(), request->frames().end());
        if (frames.empty()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "No frames given");
        }
        return commandResult(response,
                             controller_.sendRawCommand(request->fingerprint(), frames),
                             "Invalid hex frame or send failure");
    });
}

// =============================================================================
// Registry and discovery control
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::AddManualDevice(
    grpc::CallbackServerContext* context,
    const control::AddManualDeviceRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "AddManualDevice", [this, request, response]() {
        if (request->ip().empty()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "ip is required");
        }
        LOG_INFO("ControlService", "AddManualDevice: ip={}", request->ip());
        return commandResult(response, controller_.addManualDevice(request->ip()),
                             "Address already queued");
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::RemoveDevice(
    grpc::CallbackServerContext* context,
    const control::RemoveDeviceRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "RemoveDevice", [this, request, response]() {
        LOG_INFO("ControlService", "RemoveDevice: device={}", request->fingerprint());
        if (!controller_.removeDevice(request->fingerprint())) {
            return unknownDevice(request->fingerprint());
        }
        response->set_success(true);
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetDiscovery(
    grpc::CallbackServerContext* context,
    const control::SetDiscoveryRequest* request,
    control::CommandResponse* response) {

    return new LoopReactor(loop_, "SetDiscovery", [this, request, response]() {
        LOG_INFO("ControlService", "SetDiscovery: enabled={}, interval={}ms",
                 request->enabled(), request->interval_ms());
        if (request->interval_ms() > 0) {
            controller_.setDiscoveryInterval(std::chrono::milliseconds(request->interval_ms()));
        }
        controller_.setDiscoveryEnabled(request->enabled());
        response->set_success(true);
        return grpc::Status::OK;
    });
}

}  // namespace services
}  // namespace lanlight
