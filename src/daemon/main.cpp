/**
 * @file main.cpp
 * @brief LanLight daemon entry point
 *
 * This is the thin executable that wires together the library components:
 * - Event loop thread owning the light controller and its UDP endpoints
 * - Light controller for discovery, status polling and commands
 * - Control service exposing the controller over gRPC
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include <lanlight/daemon/config.hpp>
#include <lanlight/utils/logger.hpp>
#include <lanlight/core/controller.hpp>
#include <lanlight/core/event_loop.hpp>
#include <lanlight/services/control_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <thread>

using namespace lanlight;
using namespace lanlight::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int) {
    g_shutdown.store(true);
}

namespace {

// Run @p task on the loop thread and wait for its result.
template<typename T, typename Fn>
T runOnLoop(core::EventLoop& loop, Fn task) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> result = promise->get_future();
    loop.post([promise, task]() {
        try {
            promise->set_value(task());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    return result.get();
}

// Runs the loop on its own thread; stops and joins it on scope exit.
class LoopThread {
public:
    explicit LoopThread(core::EventLoop& loop)
        : loop_(loop)
        , thread_([&loop]() { loop.run(); }) {}

    ~LoopThread() { stop(); }

    void stop() {
        loop_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    core::EventLoop& loop_;
    std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::Logger::parseLevel(config.log_level));

    LOG_INFO("Daemon", "LanLight starting...");
    LOG_INFO("Daemon", "Listen port: {}", config.listen_port);
    LOG_INFO("Daemon", "Command port: {}", config.command_port);
    LOG_INFO("Daemon", "Scan target: {}:{}", config.broadcast_addr, config.broadcast_port);
    LOG_INFO("Daemon", "Control port: {}", config.control_port);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        core::EventLoop loop;
        core::LightController controller(loop, config.controllerConfig());

        LoopThread loopThread(loop);

        // Start the controller on the loop thread that owns it
        bool started = runOnLoop<bool>(loop, [&controller, &config]() {
            if (!controller.start()) {
                return false;
            }
            for (const auto& ip : config.manual_devices) {
                controller.addManualDevice(ip);
            }
            return true;
        });
        if (!started) {
            LOG_ERROR("Daemon", "Failed to open UDP endpoints");
            return 1;
        }
        LOG_INFO("Daemon", "Light controller started");

        // Create control service
        auto control_service = std::make_unique<services::ControlServiceImpl>(loop, controller);

        // Build and start control gRPC server
        std::string control_addr = config.bind_addr + ":" + std::to_string(config.control_port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(control_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(control_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start control server on {}", control_addr);
            runOnLoop<bool>(loop, [&controller]() {
                controller.shutdown();
                return true;
            });
            return 1;
        }
        LOG_INFO("Daemon", "Control server listening on {}", control_addr);
        LOG_INFO("Daemon", "LanLight is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        // Stop the gRPC server first; in-flight calls still need the loop
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        auto closed = runOnLoop<std::shared_future<void>>(loop, [&controller]() {
            return controller.shutdown();
        });
        if (closed.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            LOG_WARN("Daemon", "UDP endpoints did not close in time");
        }

        loopThread.stop();

        LOG_INFO("Daemon", "LanLight stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
