/**
 * @file config.hpp
 * @brief LanLight daemon configuration and CLI parsing
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/controller.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanlight {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // UDP endpoints
    std::vector<std::string> listen_addrs;          ///< Empty means the wildcard address
    std::vector<std::string> network_masks;         ///< Empty, or one per listen address
    uint16_t listen_port = 4002;
    uint16_t command_port = 4003;
    std::string broadcast_addr = "239.255.255.250";
    uint16_t broadcast_port = 4001;

    // Discovery and polling
    bool discovery = false;
    int64_t discovery_interval_ms = 10000;
    bool evict = false;
    int64_t evict_interval_ms = 30000;
    bool update = true;
    int64_t update_interval_ms = 5000;
    std::vector<std::string> manual_devices;        ///< Addresses probed directly

    // Control API
    uint16_t control_port = 50061;
    std::string bind_addr = "127.0.0.1";

    std::string log_level = "INFO";
    bool help = false;

    /**
     * @brief Settings handed to the LightController.
     */
    core::ControllerConfig controllerConfig() const {
        core::ControllerConfig controller;
        if (!listen_addrs.empty()) {
            controller.listen_addresses = listen_addrs;
        }
        controller.network_masks = network_masks;
        controller.listen_port = listen_port;
        controller.command_port = command_port;
        controller.broadcast_address = broadcast_addr;
        controller.broadcast_port = broadcast_port;
        controller.discovery_enabled = discovery;
        controller.discovery_interval = std::chrono::milliseconds(discovery_interval_ms);
        controller.evict_enabled = evict;
        controller.evict_interval = std::chrono::milliseconds(evict_interval_ms);
        controller.update_enabled = update;
        controller.update_interval = std::chrono::milliseconds(update_interval_ms);
        return controller;
    }
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "LanLight - LAN Smart Light Controller Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Network Options:\n"
              << "  --listen <addr>          Local address to listen on, repeatable (default: 0.0.0.0)\n"
              << "  --mask <mask>            Network mask for the matching --listen, repeatable\n"
              << "  --listen-port <port>     UDP port for device responses (default: 4002)\n"
              << "  --command-port <port>    UDP port devices accept commands on (default: 4003)\n"
              << "  --broadcast-addr <addr>  Scan destination address (default: 239.255.255.250)\n"
              << "  --broadcast-port <port>  Scan destination port (default: 4001)\n"
              << "\nDiscovery Options:\n"
              << "  --discovery              Enable periodic multicast discovery\n"
              << "  --discovery-interval <ms> Discovery interval (default: 10000)\n"
              << "  --evict                  Forget devices that stop answering scans\n"
              << "  --evict-interval <ms>    Silence before a device is forgotten (default: 30000)\n"
              << "  --no-update              Disable periodic status polling\n"
              << "  --update-interval <ms>   Status polling interval (default: 5000)\n"
              << "  --device <ip>            Probe a device directly, repeatable\n"
              << "\nControl API Options:\n"
              << "  --control-port <port>    gRPC port for the control API (default: 50061)\n"
              << "  --bind <addr>            Bind address for the gRPC server (default: 127.0.0.1)\n"
              << "  --log-level <level>      Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "\n  --help                   Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --discovery --evict\n"
              << "  " << program_name << " --listen 192.168.1.100 --mask 255.255.255.0"
              << " --listen 10.0.0.100 --mask 255.0.0.0\n"
              << "  " << program_name << " --no-update --device 192.168.1.50\n";
}

/**
 * @brief Parse a millisecond interval; throws unless it is a positive number.
 */
inline int64_t parseIntervalMs(const char* value) {
    const int64_t interval = std::stoll(value);
    if (interval <= 0) {
        throw std::invalid_argument("interval must be positive");
    }
    return interval;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--discovery") == 0) {
            config.discovery = true;
            continue;
        } else if (std::strcmp(arg, "--evict") == 0) {
            config.evict = true;
            continue;
        } else if (std::strcmp(arg, "--no-update") == 0) {
            config.update = false;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--listen") == 0) {
                config.listen_addrs.push_back(value);
            } else if (std::strcmp(arg, "--mask") == 0) {
                config.network_masks.push_back(value);
            } else if (std::strcmp(arg, "--listen-port") == 0) {
                config.listen_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--command-port") == 0) {
                config.command_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--broadcast-addr") == 0) {
                config.broadcast_addr = value;
            } else if (std::strcmp(arg, "--broadcast-port") == 0) {
                config.broadcast_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--discovery-interval") == 0) {
                config.discovery_interval_ms = parseIntervalMs(value);
            } else if (std::strcmp(arg, "--evict-interval") == 0) {
                config.evict_interval_ms = parseIntervalMs(value);
            } else if (std::strcmp(arg, "--update-interval") == 0) {
                config.update_interval_ms = parseIntervalMs(value);
            } else if (std::strcmp(arg, "--device") == 0) {
                config.manual_devices.push_back(value);
            } else if (std::strcmp(arg, "--control-port") == 0) {
                config.control_port = static_cast<uint16_t>(std::stoi(value));
            } else if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                return config;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value '" << value << "' for option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

}  // namespace daemon
}  // namespace lanlight
