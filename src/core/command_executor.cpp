/**
 * @file command_executor.cpp
 * @brief CommandSequence and CommandExecutor implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/command_executor.hpp"
#include "lanlight/utils/logger.hpp"

#include <cstdint>
#include <cstdlib>

namespace lanlight {
namespace core {

// =============================================================================
// Predicates
// =============================================================================

namespace predicates {

namespace {

bool withinTolerance(int reported, int requested, int tolerance) {
    const int64_t difference = static_cast<int64_t>(reported) - static_cast<int64_t>(requested);
    return std::llabs(difference) <= static_cast<int64_t>(tolerance);
}

}  // namespace

StatePredicate powerIs(bool on) {
    return [on](const DeviceState& state) { return state.on == on; };
}

StatePredicate brightnessIs(int brightness) {
    return [brightness](const DeviceState& state) { return state.brightness == brightness; };
}

StatePredicate colorNear(const Rgb& color, int tolerance) {
    return [color, tolerance](const DeviceState& state) {
        return withinTolerance(state.color.r, color.r, tolerance) &&
               withinTolerance(state.color.g, color.g, tolerance) &&
               withinTolerance(state.color.b, color.b, tolerance);
    };
}

StatePredicate temperatureNear(int kelvin, int tolerance) {
    return [kelvin, tolerance](const DeviceState& state) {
        return withinTolerance(state.colorTemperature, kelvin, tolerance);
    };
}

}  // namespace predicates

// =============================================================================
// CommandSequence
// =============================================================================

CommandSequence::CommandSequence(CommandExecutor& executor, uint64_t id,
                                 std::string fingerprint, CommandKind kind,
                                 protocol::Message message, StatePredicate verify)
    : executor_(executor)
    , id_(id)
    , fingerprint_(std::move(fingerprint))
    , kind_(kind)
    , message_(std::move(message))
    , verify_(std::move(verify)) {}

CommandSequence::~CommandSequence() {
    stopWaiting();
    if (!isFinished() && verify_) {
        executor_.unregisterVerification(fingerprint_, id_);
    }
}

bool CommandSequence::isFinished() const {
    return state_ == SequenceState::VERIFIED || state_ == SequenceState::EXHAUSTED ||
           state_ == SequenceState::SUPERSEDED;
}

void CommandSequence::start() {
    if (state_ != SequenceState::IDLE) {
        return;
    }
    // Registered before the first send so an early confirmation is latched.
    if (verify_) {
        executor_.registerVerification(fingerprint_, id_, &signal_, verify_);
    }

    if (!executor_.sendToDevice(fingerprint_, message_.toJson())) {
        finish(SequenceState::EXHAUSTED);
        return;
    }
    ++commandsSent_;
    state_ = SequenceState::SENT;

    timer_ = executor_.scheduler_.callLater(executor_.policy_.status_delay, [this]() {
        timer_ = Scheduler::INVALID_TIMER;
        onStatusDelayElapsed();
    });
}

void CommandSequence::cancel() {
    if (isFinished()) {
        return;
    }
    LOG_DEBUG("Command", "Cancelling {} command for {} after {} send(s)",
              commandKindToString(kind_), fingerprint_, commandsSent_);
    finish(SequenceState::SUPERSEDED);
}

void CommandSequence::onStatusDelayElapsed() {
    if (!executor_.sendToDevice(fingerprint_, protocol::Message::statusRequest().toJson())) {
        finish(SequenceState::EXHAUSTED);
        return;
    }
    state_ = SequenceState::AWAITING;
    attempt_ = 0;
    waitForNextAttempt();
}

void CommandSequence::waitForNextAttempt() {
    if (attempt_ >= executor_.policy_.attempts()) {
        LOG_DEBUG("Command", "{} command for {} unconfirmed after {} send(s)",
                  commandKindToString(kind_), fingerprint_, commandsSent_);
        finish(SequenceState::EXHAUSTED);
        return;
    }

    const auto delay = executor_.policy_.backoff[attempt_];
    if (verify_) {
        race_ = std::make_unique<Race>(executor_.scheduler_, signal_, delay,
                                       [this](Race::Outcome outcome) {
                                           onWaitFinished(outcome);
                                       });
    } else {
        timer_ = executor_.scheduler_.callLater(delay, [this]() {
            timer_ = Scheduler::INVALID_TIMER;
            onWaitFinished(Race::Outcome::TIMED_OUT);
        });
    }
}

void CommandSequence::onWaitFinished(Race::Outcome outcome) {
    if (outcome == Race::Outcome::WOKEN) {
        auto latest = executor_.latestStatus(fingerprint_);
        if (latest && verify_(*latest)) {
            LOG_DEBUG("Command", "{} command for {} confirmed after {} send(s)",
                      commandKindToString(kind_), fingerprint_, commandsSent_);
            finish(SequenceState::VERIFIED);
            return;
        }
        signal_.clear();
    }

    if (!resend()) {
        return;
    }
    ++attempt_;
    waitForNextAttempt();
}

bool CommandSequence::resend() {
    if (!executor_.sendToDevice(fingerprint_, message_.toJson())) {
        finish(SequenceState::EXHAUSTED);
        return false;
    }
    ++commandsSent_;
    if (!executor_.sendToDevice(fingerprint_, protocol::Message::statusRequest().toJson())) {
        finish(SequenceState::EXHAUSTED);
        return false;
    }
    return true;
}

void CommandSequence::stopWaiting() {
    race_.reset();
    if (timer_ != Scheduler::INVALID_TIMER) {
        executor_.scheduler_.cancel(timer_);
        timer_ = Scheduler::INVALID_TIMER;
    }
}

void CommandSequence::finish(SequenceState state) {
    stopWaiting();
    if (verify_) {
        executor_.unregisterVerification(fingerprint_, id_);
    }
    state_ = state;
    // Last statement: the executor may destroy this sequence.
    executor_.onSequenceFinished(*this);
}

// =============================================================================
// CommandExecutor
// =============================================================================

CommandExecutor::CommandExecutor(Scheduler& scheduler, DatagramLink& link,
                                 const DeviceRegistry& registry, uint16_t commandPort,
                                 const RetryPolicy& policy)
    : scheduler_(scheduler)
    , link_(link)
    , registry_(registry)
    , commandPort_(commandPort)
    , policy_(policy) {}

CommandExecutor::~CommandExecutor() {
    finishedCallback_ = nullptr;
    cancelAll();
}

void CommandExecutor::execute(const std::string& fingerprint, CommandKind kind,
                              protocol::Message message, StatePredicate verify) {
    pruneFinished();

    const Key key(fingerprint, kind);
    auto it = sequences_.find(key);
    if (it != sequences_.end()) {
        // Torn down before the new sequence sends anything.
        std::unique_ptr<CommandSequence> previous = std::move(it->second);
        sequences_.erase(it);
        previous->cancel();
    }

    auto sequence = std::make_unique<CommandSequence>(*this, nextSequenceId_++, fingerprint,
                                                      kind, std::move(message),
                                                      std::move(verify));
    CommandSequence* started = sequence.get();
    sequences_[key] = std::move(sequence);

    LOG_DEBUG("Command", "Sending {} command #{} to {}", commandKindToString(kind),
              started->id(), fingerprint);
    started->start();
}

void CommandExecutor::notifyStatus(const std::string& fingerprint, const DeviceState& state) {
    latestStatus_[fingerprint] = state;

    auto it = verifications_.find(fingerprint);
    if (it == verifications_.end()) {
        return;
    }
    if (it->second.predicate(state)) {
        it->second.signal->set();
    }
}

void CommandExecutor::cancelDevice(const std::string& fingerprint) {
    std::vector<std::unique_ptr<CommandSequence>> cancelled;
    for (auto it = sequences_.begin(); it != sequences_.end();) {
        if (it->first.first == fingerprint) {
            cancelled.push_back(std::move(it->second));
            it = sequences_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& sequence : cancelled) {
        sequence->cancel();
    }
    verifications_.erase(fingerprint);
    latestStatus_.erase(fingerprint);
}

void CommandExecutor::cancelAll() {
    std::map<Key, std::unique_ptr<CommandSequence>> cancelled;
    cancelled.swap(sequences_);
    for (auto& entry : cancelled) {
        entry.second->cancel();
    }
    verifications_.clear();
    latestStatus_.clear();
}

std::optional<SequenceState> CommandExecutor::sequenceState(const std::string& fingerprint,
                                                            CommandKind kind) const {
    auto it = sequences_.find(Key(fingerprint, kind));
    if (it == sequences_.end()) {
        return std::nullopt;
    }
    return it->second->state();
}

size_t CommandExecutor::activeCount() const {
    size_t count = 0;
    for (const auto& entry : sequences_) {
        if (!entry.second->isFinished()) {
            ++count;
        }
    }
    return count;
}

CommandExecutor::FinishedCallback CommandExecutor::setFinishedCallback(FinishedCallback callback) {
    FinishedCallback previous = std::move(finishedCallback_);
    finishedCallback_ = std::move(callback);
    return previous;
}

bool CommandExecutor::sendToDevice(const std::string& fingerprint, const std::string& payload) {
    auto device = registry_.findByFingerprint(fingerprint);
    if (!device) {
        LOG_DEBUG("Command", "Device {} is gone, stopping its command", fingerprint);
        return false;
    }
    // A failed datagram is just another lost one; the retry loop covers it.
    link_.sendTo(payload, device->ip(), commandPort_);
    return true;
}

void CommandExecutor::registerVerification(const std::string& fingerprint, uint64_t owner,
                                           WakeSignal* signal, StatePredicate predicate) {
    auto it = verifications_.find(fingerprint);
    if (it != verifications_.end() && it->second.owner != owner) {
        LOG_TRACE("Command", "Verification for {} now owned by #{} (was #{})", fingerprint,
                  owner, it->second.owner);
    }
    verifications_[fingerprint] = Verification{owner, signal, std::move(predicate)};
}

void CommandExecutor::unregisterVerification(const std::string& fingerprint, uint64_t owner) {
    auto it = verifications_.find(fingerprint);
    if (it != verifications_.end() && it->second.owner == owner) {
        verifications_.erase(it);
    }
}

std::optional<DeviceState> CommandExecutor::latestStatus(const std::string& fingerprint) const {
    auto it = latestStatus_.find(fingerprint);
    if (it == latestStatus_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CommandExecutor::onSequenceFinished(const CommandSequence& sequence) {
    if (!finishedCallback_) {
        return;
    }
    // Copies: the callback may start a command that replaces this sequence.
    FinishedCallback callback = finishedCallback_;
    const std::string fingerprint = sequence.fingerprint();
    const CommandKind kind = sequence.kind();
    const SequenceState state = sequence.state();
    callback(fingerprint, kind, state);
}

void CommandExecutor::pruneFinished() {
    for (auto it = sequences_.begin(); it != sequences_.end();) {
        if (it->second->isFinished()) {
            it = sequences_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace core
}  // namespace lanlight
