#pragma once

#include <cstdint>
#include <functional>

/**
 * @class IScheduler
 * @brief Execution context of the chat client: deferred tasks, timers and a clock.
 *
 * Every component above the transport runs on exactly one scheduler and is never
 * touched concurrently. EventLoop is the threaded production implementation;
 * tests drive a manual clock instead.
 */
class IScheduler
{
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    /// Never returned by Schedule()
    static const TimerId kInvalidTimer = 0;

    virtual ~IScheduler() = default;

    /**
     * @brief Queue a task to run on the scheduler's context as soon as possible.
     *
     * Safe to call from any thread. Tasks run in posting order.
     */
    virtual void Post(Task task) = 0;

    /**
     * @brief Run a task once after a delay.
     *
     * @param delayMs Delay in milliseconds (<= 0 runs on the next iteration)
     * @param task Task to run
     * @return Id usable with Cancel()
     */
    virtual TimerId Schedule(int64_t delayMs, Task task) = 0;

    /**
     * @brief Cancel a pending timer. Unknown or already fired ids are ignored.
     */
    virtual void Cancel(TimerId id) = 0;

    /**
     * @brief Monotonic time in milliseconds.
     */
    virtual int64_t NowMs() const = 0;
};
