/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/discovery_engine.hpp"
#include "lanlight/utils/logger.hpp"

#include <vector>

namespace lanlight {
namespace core {

DiscoveryEngine::DiscoveryEngine(Scheduler& scheduler, DatagramLink& link,
                                 DeviceRegistry& registry, const CapabilityTable& table,
                                 const DiscoveryConfig& config)
    : scheduler_(scheduler)
    , link_(link)
    , registry_(registry)
    , table_(table)
    , config_(config)
{
    LOG_DEBUG("Discovery", "Created engine (enabled={}, interval={} ms, scan port {})",
              config_.enabled, config_.interval.count(), config_.scan_port);
}

DiscoveryEngine::~DiscoveryEngine() {
    cancelRound();
}

void DiscoveryEngine::start() {
    running_ = true;
    if (config_.enabled || !registry_.queuedAddresses().empty()) {
        runRound();
    }
}

void DiscoveryEngine::stop() {
    running_ = false;
    cancelRound();
}

void DiscoveryEngine::setEnabled(bool enabled) {
    if (config_.enabled == enabled) {
        return;
    }
    config_.enabled = enabled;
    LOG_INFO("Discovery", "Discovery {}", enabled ? "enabled" : "disabled");
    if (enabled) {
        runRound();
    } else {
        cancelRound();
    }
}

bool DiscoveryEngine::queueAddress(const std::string& ip) {
    bool added = registry_.queueAddress(ip);
    if (added && !config_.enabled) {
        runRound();
    }
    return added;
}

bool DiscoveryEngine::runRound() {
    cancelRound();
    if (!running_) {
        return false;
    }

    const std::string scan = protocol::Message::scanRequest().toJson();
    bool sent = false;

    if (config_.enabled) {
        sent = true;
        if (!link_.broadcast(scan)) {
            LOG_WARN("Discovery", "Scan broadcast was not sent on any endpoint");
        }
    }

    std::vector<std::string> unicastTargets(registry_.queuedAddresses().begin(),
                                            registry_.queuedAddresses().end());
    for (const auto& device : registry_.devices()) {
        if (device->isManual()) {
            unicastTargets.push_back(device->ip());
        }
    }
    for (const auto& ip : unicastTargets) {
        sent = true;
        link_.sendTo(scan, ip, config_.scan_port);
    }

    if (sent) {
        LOG_TRACE("Discovery", "Scan round sent ({} unicast), next in {} ms",
                  unicastTargets.size(), config_.interval.count());
        timer_ = scheduler_.callLater(config_.interval, [this]() {
            timer_ = Scheduler::INVALID_TIMER;
            runRound();
        });
    }
    return sent;
}

void DiscoveryEngine::handleScanResponse(const protocol::ScanResponse& response) {
    const auto now = scheduler_.now();
    registry_.upsertFromScan(response.fingerprint, response.ip, response.sku, table_,
                             discoveredCallback_, now);

    if (config_.evict_enabled) {
        registry_.evict(now, config_.evict_timeout, evictedCallback_);
    }
}

void DiscoveryEngine::cancelRound() {
    if (timer_ != Scheduler::INVALID_TIMER) {
        scheduler_.cancel(timer_);
        timer_ = Scheduler::INVALID_TIMER;
    }
}

}  // namespace core
}  // namespace lanlight
