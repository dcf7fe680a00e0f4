/**
 * @file event_loop.cpp
 * @brief EventLoop implementation.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#include "lanlight/core/event_loop.hpp"
#include "lanlight/utils/logger.hpp"

#ifndef _WIN32
#include <sys/select.h>
#endif

#include <algorithm>
#include <exception>

namespace lanlight {
namespace core {

namespace {

const auto kIdleWait = std::chrono::hours(1);

// Without a working waker, posted tasks are picked up on this period instead.
const auto kFallbackPollWait = std::chrono::milliseconds(50);

template <typename Fn>
void runGuarded(const char* what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR("EventLoop", "Unhandled exception in {}: {}", what, e.what());
    }
}

}  // namespace

EventLoop::EventLoop() {
    if (!waker_.isValid() || !waker_.bind(0, "127.0.0.1")) {
        LOG_ERROR("EventLoop", "Failed to create wake-up socket: {}", waker_.getLastError());
        return;
    }
    waker_.setNonBlocking(true);
    wakerAddress_ = net::SocketAddress("127.0.0.1", waker_.getLocalPort());
    LOG_TRACE("EventLoop", "Wake-up socket on {}", wakerAddress_.toString());
}

EventLoop::~EventLoop() {
    waker_.close();
}

Scheduler::TimerId EventLoop::callLater(Duration delay, Task task) {
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }
    TimerId id = nextTimerId_++;
    TimePoint deadline = now() + delay;
    timers_.emplace(TimerKey(deadline, id), std::move(task));
    deadlines_.emplace(id, deadline);
    return id;
}

bool EventLoop::cancel(TimerId id) {
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return false;
    }
    timers_.erase(TimerKey(it->second, id));
    deadlines_.erase(it);
    return true;
}

void EventLoop::watchReadable(net::SocketHandle handle, ReadableCallback callback) {
    watchers_[handle] = std::move(callback);
}

void EventLoop::unwatch(net::SocketHandle handle) {
    watchers_.erase(handle);
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

void EventLoop::run() {
    loopThread_.store(std::this_thread::get_id());
    running_.store(true);
    LOG_DEBUG("EventLoop", "Loop started");

    while (!stopRequested_.load()) {
        runOnce(kIdleWait);
    }

    stopRequested_.store(false);
    running_.store(false);
    loopThread_.store(std::thread::id());
    LOG_DEBUG("EventLoop", "Loop stopped");
}

void EventLoop::runFor(Duration duration) {
    loopThread_.store(std::this_thread::get_id());
    running_.store(true);

    const TimePoint deadline = now() + duration;
    while (!stopRequested_.load()) {
        TimePoint current = now();
        if (current >= deadline) {
            break;
        }
        runOnce(deadline - current);
    }

    stopRequested_.store(false);
    running_.store(false);
    loopThread_.store(std::thread::id());
}

void EventLoop::stop() {
    stopRequested_.store(true);
    wake();
}

bool EventLoop::isLoopThread() const {
    return loopThread_.load() == std::this_thread::get_id();
}

void EventLoop::runOnce(Duration maxWait) {
    if (!waker_.isValid()) {
        maxWait = std::min<Duration>(maxWait, kFallbackPollWait);
    }
    Duration wait = timeUntilNextTimer(maxWait);

    fd_set readSet;
    FD_ZERO(&readSet);
    net::SocketHandle maxHandle = 0;

    auto addHandle = [&](net::SocketHandle handle) {
        FD_SET(handle, &readSet);
        maxHandle = std::max(maxHandle, handle);
    };

    if (waker_.isValid()) {
        addHandle(waker_.handle());
    }
    for (const auto& watcher : watchers_) {
        addHandle(watcher.first);
    }

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(wait).count();
    struct timeval tv;
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(micros / 1000000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>(micros % 1000000);

    int ready = ::select(static_cast<int>(maxHandle + 1), &readSet, nullptr, nullptr, &tv);
    if (ready < 0) {
        int error = net::getLastSocketError();
#ifndef _WIN32
        if (error != EINTR) {
            LOG_ERROR("EventLoop", "select() failed: {}", error);
        }
#else
        LOG_ERROR("EventLoop", "select() failed: {}", error);
#endif
    } else if (ready > 0) {
        if (waker_.isValid() && FD_ISSET(waker_.handle(), &readSet)) {
            drainWaker();
        }

        std::vector<net::SocketHandle> readable;
        for (const auto& watcher : watchers_) {
            if (FD_ISSET(watcher.first, &readSet)) {
                readable.push_back(watcher.first);
            }
        }
        for (net::SocketHandle handle : readable) {
            // A previous callback may have unwatched this handle.
            auto it = watchers_.find(handle);
            if (it == watchers_.end()) {
                continue;
            }
            ReadableCallback callback = it->second;
            runGuarded("socket callback", callback);
        }
    }

    runPosted();
    runDueTimers();
}

void EventLoop::wake() {
    if (!waker_.isValid()) {
        return;
    }
    if (wakePending_.exchange(true)) {
        return;
    }
    const uint8_t byte = 1;
    if (waker_.sendTo(wakerAddress_, &byte, sizeof(byte)) < 0) {
        wakePending_.store(false);
        LOG_WARN("EventLoop", "Failed to wake loop: {}", waker_.getLastError());
    }
}

void EventLoop::drainWaker() {
    uint8_t buffer[64];
    net::SocketAddress sender;
    while (waker_.receiveFrom(buffer, sizeof(buffer), 0, sender) > 0) {
    }
    wakePending_.store(false);
}

void EventLoop::runPosted() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        runGuarded("posted task", task);
    }
}

void EventLoop::runDueTimers() {
    const TimePoint cutoff = now();
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > cutoff) {
            break;
        }
        // Pop before running so the task may schedule or cancel freely.
        Task task = std::move(it->second);
        deadlines_.erase(it->first.second);
        timers_.erase(it);
        runGuarded("timer", task);
    }
}

Scheduler::Duration EventLoop::timeUntilNextTimer(Duration cap) const {
    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        if (!posted_.empty()) {
            return Duration::zero();
        }
    }
    if (timers_.empty()) {
        return cap;
    }
    Duration untilNext = timers_.begin()->first.first - now();
    if (untilNext < Duration::zero()) {
        return Duration::zero();
    }
    return std::min(untilNext, cap);
}

}  // namespace core
}  // namespace lanlight
