#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <utility>

namespace livecall {

using Task = std::function<void()>;
using TimerId = uint64_t;

class Loop {
public:
    void EnqueueTask(Task&& task);

    // Runs the task on the loop after the delay unless cancelled first.
    TimerId EnqueueDelayed(std::chrono::milliseconds delay, Task&& task);
    void CancelDelayed(TimerId id);

    void Run();
    void Stop();

    bool IsLoopThread() const {
        return ThreadId_.load() == std::this_thread::get_id();
    }

private:
    using Clock = std::chrono::steady_clock;
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    std::map<TimerKey, Task> Timers_;
    std::unordered_map<TimerId, Clock::time_point> TimerDeadlines_;
    TimerId NextTimerId_ = 1;
    bool Stopped_ = false;
    std::atomic<std::thread::id> ThreadId_{};
};

} // namespace livecall
