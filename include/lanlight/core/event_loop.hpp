/**
 * @file event_loop.hpp
 * @brief Single-threaded cooperative scheduler and select() reactor.
 *
 * Every piece of controller state is owned by the loop thread. Timers,
 * socket readiness callbacks and posted tasks all run there, one at a
 * time. Other threads reach the loop only through post() and stop().
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/core/export.hpp"
#include "lanlight/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lanlight {
namespace core {

/**
 * @class Scheduler
 * @brief One-shot timer interface the protocol components are written against.
 *
 * Not thread-safe: call only from the thread that runs the scheduler.
 */
class LANLIGHT_CORE_API Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using TimePoint = Clock::time_point;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    static constexpr TimerId INVALID_TIMER = 0;

    virtual ~Scheduler() = default;

    /**
     * @brief Run @p task once, no earlier than @p delay from now.
     *
     * Timers with equal deadlines fire in the order they were scheduled.
     * @return Id usable with cancel(); never INVALID_TIMER.
     */
    virtual TimerId callLater(Duration delay, Task task) = 0;

    /**
     * @brief Cancel a pending timer.
     * @return false if the timer already fired, was cancelled, or never existed.
     */
    virtual bool cancel(TimerId id) = 0;

    virtual TimePoint now() const = 0;
};

/**
 * @class EventLoop
 * @brief select()-based reactor with a timer queue.
 *
 * A loopback UDP socket wakes the loop when work is posted from another
 * thread, so the same code runs on Linux, macOS and Windows.
 */
class LANLIGHT_CORE_API EventLoop : public Scheduler {
public:
    using ReadableCallback = std::function<void()>;

    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TimerId callLater(Duration delay, Task task) override;
    bool cancel(TimerId id) override;
    TimePoint now() const override { return Clock::now(); }

    /**
     * @brief Invoke @p callback on the loop thread whenever @p handle is readable.
     *
     * Replaces any previous callback for the same handle.
     */
    void watchReadable(net::SocketHandle handle, ReadableCallback callback);

    void unwatch(net::SocketHandle handle);

    /**
     * @brief Queue @p task to run on the loop thread. Thread-safe.
     */
    void post(Task task);

    /**
     * @brief Run until stop() is called.
     */
    void run();

    /**
     * @brief Run until @p duration elapses or stop() is called.
     */
    void runFor(Duration duration);

    /**
     * @brief One reactor iteration, blocking at most @p maxWait.
     */
    void runOnce(Duration maxWait);

    /**
     * @brief Ask run() to return after the current iteration. Thread-safe.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @return True when called from the thread currently inside run().
     */
    bool isLoopThread() const;

    size_t pendingTimers() const { return timers_.size(); }

private:
    void wake();
    void drainWaker();
    void runPosted();
    void runDueTimers();
    Duration timeUntilNextTimer(Duration cap) const;

    using TimerKey = std::pair<TimePoint, TimerId>;

    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimePoint> deadlines_;
    TimerId nextTimerId_ = 1;

    std::map<net::SocketHandle, ReadableCallback> watchers_;

    net::UdpSocket waker_;
    net::SocketAddress wakerAddress_;
    std::atomic<bool> wakePending_{false};

    mutable std::mutex postedMutex_;
    std::vector<Task> posted_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<std::thread::id> loopThread_{std::thread::id()};
};

}  // namespace core
}  // namespace lanlight
