/**
 * @file wait.hpp
 * @brief Latching wake signal and a "first of signal or deadline" race.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/event_loop.hpp"
#include "lanlight/core/export.hpp"

#include <functional>

namespace lanlight {
namespace core {

/**
 * @class WakeSignal
 * @brief A latch with at most one waiter.
 *
 * set() stays set until clear(). A waiter installed while the signal is
 * set is not called; check isSet() first.
 */
class LANLIGHT_CORE_API WakeSignal {
public:
    using Waiter = std::function<void()>;

    WakeSignal() = default;
    WakeSignal(const WakeSignal&) = delete;
    WakeSignal& operator=(const WakeSignal&) = delete;

    /**
     * @brief Latch the signal and notify the waiter, if any, exactly once.
     */
    void set();

    void clear() { set_ = false; }

    bool isSet() const { return set_; }

    void setWaiter(Waiter waiter) { waiter_ = std::move(waiter); }

    void clearWaiter() { waiter_ = nullptr; }

private:
    bool set_ = false;
    Waiter waiter_;
};

/**
 * @class Race
 * @brief Wait for the first of a WakeSignal or a timeout; cancel the other.
 *
 * The completion always runs from a scheduler timer, never from inside
 * WakeSignal::set(), so the signal's owner can safely tear itself down in
 * response. Destroying the Race cancels it without invoking the completion.
 *
 * Usage:
 * @code
 * race_ = std::make_unique<Race>(scheduler, signal, std::chrono::seconds(1),
 *     [this](Race::Outcome outcome) { onWaitFinished(outcome); });
 * @endcode
 */
class LANLIGHT_CORE_API Race {
public:
    enum class Outcome {
        WOKEN,
        TIMED_OUT
    };

    using Completion = std::function<void(Outcome)>;

    Race(Scheduler& scheduler, WakeSignal& signal, Scheduler::Duration timeout,
         Completion completion);
    ~Race();

    Race(const Race&) = delete;
    Race& operator=(const Race&) = delete;

    /**
     * @brief Cancel whichever wait is still pending. The completion is dropped.
     */
    void cancel();

    bool isPending() const { return pending_; }

private:
    void onSignal();
    void finish(Outcome outcome);

    Scheduler& scheduler_;
    WakeSignal& signal_;
    Completion completion_;
    Scheduler::TimerId timer_ = Scheduler::INVALID_TIMER;
    bool pending_ = true;
};

}  // namespace core
}  // namespace lanlight
