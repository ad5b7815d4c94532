#pragma once

#include "Scheduler.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

/**
 * @class EventLoop
 * @brief Single worker thread that owns all chat client state.
 *
 * Transport callbacks arriving on IXWebSocket's thread are posted here, and
 * application threads reach the client through Invoke(), so the client itself needs
 * no locks: everything it does runs on this one thread, in order.
 *
 * Usage Pattern:
 * @code
 *   EventLoop loop;
 *   loop.Start();
 *   ChatClient client(config, loop, std::make_unique<IxWebSocketConnection>(loop, config));
 *   loop.Invoke([&] { return client.Connect(); });
 *   ...
 *   loop.Invoke([&] { client.Disconnect(); });
 *   loop.Stop();
 * @endcode
 */
class EventLoop : public IScheduler
{
public:
    EventLoop();

    /// @brief Stops the worker thread; pending tasks and timers are discarded
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Start the worker thread.
     * @return false if already running
     */
    bool Start();

    /**
     * @brief Stop and join the worker thread.
     *
     * Tasks already queued run first; timers that are not due are dropped.
     * Must not be called from the loop thread.
     */
    void Stop();

    bool IsRunning() const;

    /// @brief True when called from the worker thread
    bool IsLoopThread() const;

    void Post(Task task) override;
    TimerId Schedule(int64_t delayMs, Task task) override;
    void Cancel(TimerId id) override;
    int64_t NowMs() const override;

    /**
     * @brief Run a callable on the loop thread and wait for its result.
     *
     * Runs inline when already on the loop thread, or when the loop is not running
     * (nothing else can touch the client then). Exceptions thrown by the callable are
     * rethrown in the caller.
     */
    template <typename Fn>
    auto Invoke(Fn fn) -> decltype(fn())
    {
        using Result = decltype(fn());

        if (IsLoopThread() || !IsRunning())
            return fn();

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> result = task->get_future();
        Post([task]() { (*task)(); });
        return result.get();
    }

private:
    void Run();

    mutable std::mutex mMutex;
    std::condition_variable mWakeup;
    std::deque<Task> mTasks;

    /// Pending timers ordered by due time, then by id (scheduling order)
    std::map<std::pair<int64_t, TimerId>, Task> mTimers;

    /// Due time of each pending timer, for Cancel()
    std::map<TimerId, int64_t> mTimerDue;

    TimerId mNextTimerId = 1;
    bool mRunning = false;
    bool mStopping = false;
    std::thread mThread;
    std::thread::id mThreadId;
};
