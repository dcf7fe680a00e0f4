/**
 * @file wait.cpp
 * @brief WakeSignal and Race implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/wait.hpp"

namespace lanlight {
namespace core {

void WakeSignal::set() {
    if (set_) {
        return;
    }
    set_ = true;
    Waiter waiter = std::move(waiter_);
    waiter_ = nullptr;
    if (waiter) {
        waiter();
    }
}

Race::Race(Scheduler& scheduler, WakeSignal& signal, Scheduler::Duration timeout,
           Completion completion)
    : scheduler_(scheduler)
    , signal_(signal)
    , completion_(std::move(completion))
{
    if (signal_.isSet()) {
        timer_ = scheduler_.callLater(Scheduler::Duration::zero(),
                                      [this]() { finish(Outcome::WOKEN); });
        return;
    }
    timer_ = scheduler_.callLater(timeout, [this]() { finish(Outcome::TIMED_OUT); });
    signal_.setWaiter([this]() { onSignal(); });
}

Race::~Race() {
    cancel();
}

void Race::cancel() {
    if (!pending_) {
        return;
    }
    pending_ = false;
    scheduler_.cancel(timer_);
    timer_ = Scheduler::INVALID_TIMER;
    signal_.clearWaiter();
    completion_ = nullptr;
}

void Race::onSignal() {
    if (!pending_) {
        return;
    }
    // The deadline loses; report the win on the next scheduler turn.
    scheduler_.cancel(timer_);
    timer_ = scheduler_.callLater(Scheduler::Duration::zero(),
                                  [this]() { finish(Outcome::WOKEN); });
}

void Race::finish(Outcome outcome) {
    if (!pending_) {
        return;
    }
    pending_ = false;
    timer_ = Scheduler::INVALID_TIMER;
    signal_.clearWaiter();

    // Last statement: the completion may destroy this Race.
    Completion completion = std::move(completion_);
    completion_ = nullptr;
    completion(outcome);
}

}  // namespace core
}  // namespace lanlight
