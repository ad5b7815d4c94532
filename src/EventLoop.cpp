#include "EventLoop.hpp"
#include "Logger.hpp"

#include <chrono>
#include <exception>

/**
 * @file EventLoop.cpp
 * @brief Task queue and timer wheel driven by a single worker thread.
 */

EventLoop::EventLoop() = default;

EventLoop::~EventLoop()
{
    Stop();
}

bool EventLoop::Start()
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (mRunning)
    {
        Logger::Instance().Warning("EventLoop", "Start ignored: already running");
        return false;
    }

    mRunning = true;
    mStopping = false;
    mThread = std::thread([this]() { Run(); });
    mThreadId = mThread.get_id();

    Logger::Instance().Debug("EventLoop", "Worker thread started");
    return true;
}

void EventLoop::Stop()
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!mRunning)
            return;
        mStopping = true;
    }
    mWakeup.notify_all();

    if (mThread.joinable())
        mThread.join();

    std::lock_guard<std::mutex> lock(mMutex);
    mTimers.clear();
    mTimerDue.clear();
    mRunning = false;
    mStopping = false;
    mThreadId = std::thread::id();

    Logger::Instance().Debug("EventLoop", "Worker thread stopped");
}

bool EventLoop::IsRunning() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mRunning && !mStopping;
}

bool EventLoop::IsLoopThread() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mRunning && std::this_thread::get_id() == mThreadId;
}

void EventLoop::Post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mTasks.push_back(std::move(task));
    }
    mWakeup.notify_one();
}

IScheduler::TimerId EventLoop::Schedule(int64_t delayMs, Task task)
{
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        id = mNextTimerId++;

        int64_t due = NowMs() + (delayMs > 0 ? delayMs : 0);
        mTimers.emplace(std::make_pair(due, id), std::move(task));
        mTimerDue.emplace(id, due);
    }
    mWakeup.notify_one();
    return id;
}

void EventLoop::Cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mMutex);

    auto it = mTimerDue.find(id);
    if (it == mTimerDue.end())
        return;

    mTimers.erase(std::make_pair(it->second, id));
    mTimerDue.erase(it);
}

int64_t EventLoop::NowMs() const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void EventLoop::Run()
{
    std::unique_lock<std::mutex> lock(mMutex);

    while (true)
    {
        Task next;

        if (!mTasks.empty())
        {
            next = std::move(mTasks.front());
            mTasks.pop_front();
        }
        else if (mStopping)
        {
            break;
        }
        else if (!mTimers.empty() && mTimers.begin()->first.first <= NowMs())
        {
            auto timer = mTimers.begin();
            next = std::move(timer->second);
            mTimerDue.erase(timer->first.second);
            mTimers.erase(timer);
        }
        else if (!mTimers.empty())
        {
            auto wait = std::chrono::milliseconds(mTimers.begin()->first.first - NowMs());
            mWakeup.wait_for(lock, wait);
            continue;
        }
        else
        {
            mWakeup.wait(lock);
            continue;
        }

        // Run outside the lock so the task can post, schedule and cancel
        lock.unlock();
        try
        {
            next();
        }
        catch (const std::exception& e)
        {
            Logger::Instance().Error("EventLoop", std::string("Task threw: ") + e.what());
        }
        lock.lock();
    }
}
