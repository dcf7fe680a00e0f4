/**
 * @file command_executor.hpp
 * @brief Retry-until-confirmed execution of stateful light commands.
 *
 * A command is sent, followed 100 ms later by a status request. The pair is
 * then resent after each delay of a fixed backoff schedule until either a
 * status response confirms the requested state or the schedule runs out.
 * At most one sequence runs per (device, command kind); issuing a new one
 * cancels the old one before anything new is sent.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/device_registry.hpp"
#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"
#include "lanlight/core/light_types.hpp"
#include "lanlight/core/messages.hpp"
#include "lanlight/core/transport_manager.hpp"
#include "lanlight/core/wait.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @enum CommandKind
 * @brief Commands that supersede each other per device.
 */
enum class CommandKind {
    POWER,
    BRIGHTNESS,
    COLOR
};

inline const char* commandKindToString(CommandKind kind) {
    switch (kind) {
        case CommandKind::POWER: return "power";
        case CommandKind::BRIGHTNESS: return "brightness";
        case CommandKind::COLOR: return "color";
        default: return "unknown";
    }
}

/**
 * @enum SequenceState
 * @brief Lifecycle of one command sequence.
 */
enum class SequenceState {
    IDLE,           ///< Created, nothing sent
    SENT,           ///< Command sent, waiting to request status
    AWAITING,       ///< Inside the backoff schedule
    VERIFIED,       ///< A status response confirmed the command
    EXHAUSTED,      ///< Backoff schedule used up (or device gone)
    SUPERSEDED      ///< Cancelled by a newer command or shutdown
};

inline const char* sequenceStateToString(SequenceState state) {
    switch (state) {
        case SequenceState::IDLE: return "idle";
        case SequenceState::SENT: return "sent";
        case SequenceState::AWAITING: return "awaiting";
        case SequenceState::VERIFIED: return "verified";
        case SequenceState::EXHAUSTED: return "exhausted";
        case SequenceState::SUPERSEDED: return "superseded";
        default: return "unknown";
    }
}

/// True when a reported state satisfies the command.
using StatePredicate = std::function<bool(const DeviceState&)>;

namespace predicates {

LANLIGHT_CORE_API StatePredicate powerIs(bool on);
LANLIGHT_CORE_API StatePredicate brightnessIs(int brightness);

/// Every channel within @p tolerance of @p color.
LANLIGHT_CORE_API StatePredicate colorNear(const Rgb& color, int tolerance = 5);

/// Temperature within @p tolerance Kelvin.
LANLIGHT_CORE_API StatePredicate temperatureNear(int kelvin, int tolerance = 100);

}  // namespace predicates

/**
 * @struct RetryPolicy
 * @brief Timing of a command sequence.
 */
struct LANLIGHT_CORE_API RetryPolicy {
    std::chrono::milliseconds status_delay;         ///< Command -> first status request
    std::vector<std::chrono::milliseconds> backoff; ///< Waits between resends
    size_t max_retries;                             ///< Backoff entries actually used

    RetryPolicy()
        : status_delay(100)
        , backoff{std::chrono::milliseconds(200), std::chrono::milliseconds(300),
                  std::chrono::milliseconds(500), std::chrono::milliseconds(1000),
                  std::chrono::milliseconds(1500), std::chrono::milliseconds(2000),
                  std::chrono::milliseconds(3000), std::chrono::milliseconds(4000),
                  std::chrono::milliseconds(5000), std::chrono::milliseconds(6000),
                  std::chrono::milliseconds(7000)}
        , max_retries(10)
    {}

    size_t attempts() const { return max_retries < backoff.size() ? max_retries : backoff.size(); }
};

class CommandExecutor;

/**
 * @class CommandSequence
 * @brief One command being driven to confirmation.
 *
 * Owned by the CommandExecutor. Without a predicate every backoff delay is
 * waited out in full; with one, each delay is raced against the device's
 * wake signal.
 */
class LANLIGHT_CORE_API CommandSequence {
public:
    CommandSequence(CommandExecutor& executor, uint64_t id, std::string fingerprint,
                    CommandKind kind, protocol::Message message, StatePredicate verify);
    ~CommandSequence();

    CommandSequence(const CommandSequence&) = delete;
    CommandSequence& operator=(const CommandSequence&) = delete;

    void start();

    /**
     * @brief Stop immediately: no further sends, registration removed.
     */
    void cancel();

    SequenceState state() const { return state_; }
    bool isFinished() const;
    uint64_t id() const { return id_; }
    const std::string& fingerprint() const { return fingerprint_; }
    CommandKind kind() const { return kind_; }

    /// Times the command itself (not status requests) was sent.
    size_t commandsSent() const { return commandsSent_; }

private:
    void onStatusDelayElapsed();
    void waitForNextAttempt();
    void onWaitFinished(Race::Outcome outcome);
    bool resend();
    void finish(SequenceState state);
    void stopWaiting();

    CommandExecutor& executor_;
    const uint64_t id_;
    const std::string fingerprint_;
    const CommandKind kind_;
    const protocol::Message message_;
    const StatePredicate verify_;

    SequenceState state_ = SequenceState::IDLE;
    size_t attempt_ = 0;
    size_t commandsSent_ = 0;

    WakeSignal signal_;
    std::unique_ptr<Race> race_;
    Scheduler::TimerId timer_ = Scheduler::INVALID_TIMER;
};

/**
 * @class CommandExecutor
 * @brief Runs command sequences and routes status responses to them.
 *
 * Usage:
 * @code
 * CommandExecutor executor(loop, transports, registry, 4003);
 * executor.execute("AA:BB:CC", CommandKind::BRIGHTNESS,
 *                  protocol::Message::brightness(42), predicates::brightnessIs(42));
 * // For every status response:
 * executor.notifyStatus("AA:BB:CC", state);
 * @endcode
 */
class LANLIGHT_CORE_API CommandExecutor {
public:
    /// Reports every sequence that reaches a final state.
    using FinishedCallback =
        std::function<void(const std::string& fingerprint, CommandKind kind, SequenceState state)>;

    CommandExecutor(Scheduler& scheduler, DatagramLink& link, const DeviceRegistry& registry,
                    uint16_t commandPort, const RetryPolicy& policy = RetryPolicy());
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /**
     * @brief Start a sequence, superseding any unfinished one for the same key.
     * @param verify Predicate confirming the command, or empty for a bare
     *               retry loop.
     */
    void execute(const std::string& fingerprint, CommandKind kind,
                 protocol::Message message, StatePredicate verify = nullptr);

    /**
     * @brief Feed a decoded status response; wakes the device's sequence
     *        when its predicate holds.
     */
    void notifyStatus(const std::string& fingerprint, const DeviceState& state);

    /**
     * @brief Cancel every sequence for one device.
     */
    void cancelDevice(const std::string& fingerprint);

    void cancelAll();

    /**
     * @return State of the sequence for the key, if one is still tracked.
     */
    std::optional<SequenceState> sequenceState(const std::string& fingerprint,
                                               CommandKind kind) const;

    /// Unfinished sequences.
    size_t activeCount() const;

    bool hasVerification(const std::string& fingerprint) const {
        return verifications_.count(fingerprint) != 0;
    }

    FinishedCallback setFinishedCallback(FinishedCallback callback);

    const RetryPolicy& policy() const { return policy_; }
    void setMaxRetries(size_t maxRetries) { policy_.max_retries = maxRetries; }

private:
    friend class CommandSequence;

    struct Verification {
        uint64_t owner;
        WakeSignal* signal;
        StatePredicate predicate;
    };

    using Key = std::pair<std::string, CommandKind>;

    bool sendToDevice(const std::string& fingerprint, const std::string& payload);
    void registerVerification(const std::string& fingerprint, uint64_t owner,
                              WakeSignal* signal, StatePredicate predicate);
    void unregisterVerification(const std::string& fingerprint, uint64_t owner);
    std::optional<DeviceState> latestStatus(const std::string& fingerprint) const;
    void onSequenceFinished(const CommandSequence& sequence);
    void pruneFinished();

    Scheduler& scheduler_;
    DatagramLink& link_;
    const DeviceRegistry& registry_;
    uint16_t commandPort_;
    RetryPolicy policy_;

    std::map<Key, std::unique_ptr<CommandSequence>> sequences_;
    std::unordered_map<std::string, Verification> verifications_;
    std::unordered_map<std::string, DeviceState> latestStatus_;
    uint64_t nextSequenceId_ = 1;
    FinishedCallback finishedCallback_;
};

}  // namespace core
}  // namespace lanlight
