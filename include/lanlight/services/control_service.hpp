/**
 * @file control_service.hpp
 * @brief Async gRPC control API for the lights a daemon manages.
 *
 * ControlServiceImpl is the API local tools use:
 * - ListDevices / GetDevice: inspect the registry
 * - SetPower / SetBrightness / SetColor: retried, confirmed commands
 * - SetSegmentColor / SetScene / SendRawCommand: one-shot commands
 * - AddManualDevice / RemoveDevice / SetDiscovery: registry and discovery control
 *
 * gRPC invokes the handlers on its own threads. Every handler hands its work
 * to the event loop, which owns the controller, and finishes the call from
 * there.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/services/export.hpp"
#include "lanlight/core/controller.hpp"
#include "lanlight/core/event_loop.hpp"

#include <grpcpp/grpcpp.h>

// Include generated gRPC service base
#include "lanlight/proto/control.grpc.pb.h"

namespace lanlight {
namespace services {

/**
 * @brief Fill a DeviceInfo message from a registry entry.
 * @param now Scheduler time used to compute last_seen_ms_ago.
 */
LANLIGHT_SERVICES_API void toDeviceInfo(const core::Device& device,
                                        core::Scheduler::TimePoint now,
                                        control::DeviceInfo* info);

/**
 * @class ControlServiceImpl
 * @brief Implementation of the LightControl gRPC service.
 *
 * Usage:
 * @code
 * core::EventLoop loop;
 * core::LightController controller(loop, config);
 * ControlServiceImpl service(loop, controller);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:50061", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class LANLIGHT_SERVICES_API ControlServiceImpl final
    : public control::LightControl::CallbackService {
public:
    /**
     * @param loop Loop that owns @p controller; must be running while RPCs
     *             are served.
     */
    ControlServiceImpl(core::EventLoop& loop, core::LightController& controller);

    ~ControlServiceImpl() override;

    // =========================================================================
    // Registry
    // =========================================================================

    grpc::ServerUnaryReactor* ListDevices(
        grpc::CallbackServerContext* context,
        const control::ListDevicesRequest* request,
        control::ListDevicesResponse* response) override;

    /**
     * @brief Look a device up by fingerprint, then IP address, then SKU.
     */
    grpc::ServerUnaryReactor* GetDevice(
        grpc::CallbackServerContext* context,
        const control::GetDeviceRequest* request,
        control::GetDeviceResponse* response) override;

    // =========================================================================
    // Commands
    // =========================================================================

    grpc::ServerUnaryReactor* SetPower(
        grpc::CallbackServerContext* context,
        const control::SetPowerRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* SetBrightness(
        grpc::CallbackServerContext* context,
        const control::SetBrightnessRequest* request,
        control::CommandResponse* response) override;

    /**
     * @brief RGB or colour temperature, whichever the request carries.
     */
    grpc::ServerUnaryReactor* SetColor(
        grpc::CallbackServerContext* context,
        const control::SetColorRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* SetSegmentColor(
        grpc::CallbackServerContext* context,
        const control::SetSegmentColorRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* SetScene(
        grpc::CallbackServerContext* context,
        const control::SetSceneRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* SendRawCommand(
        grpc::CallbackServerContext* context,
        const control::SendRawCommandRequest* request,
        control::CommandResponse* response) override;

    // =========================================================================
    // Registry and discovery control
    // =========================================================================

    grpc::ServerUnaryReactor* AddManualDevice(
        grpc::CallbackServerContext* context,
        const control::AddManualDeviceRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* RemoveDevice(
        grpc::CallbackServerContext* context,
        const control::RemoveDeviceRequest* request,
        control::CommandResponse* response) override;

    grpc::ServerUnaryReactor* SetDiscovery(
        grpc::CallbackServerContext* context,
        const control::SetDiscoveryRequest* request,
        control::CommandResponse* response) override;

private:
    core::EventLoop& loop_;
    core::LightController& controller_;
};

}  // namespace services
}  // namespace lanlight
