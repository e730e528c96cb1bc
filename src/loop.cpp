#include "loop.hpp"

namespace livecall {

void Loop::Run() {
    ThreadId_ = std::this_thread::get_id();

    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            while (true) {
                if (Stopped_) {
                    return;
                }
                if (!TaskQueue_.empty()) {
                    task = std::move(TaskQueue_.front());
                    TaskQueue_.pop();
                    break;
                }
                if (Timers_.empty()) {
                    Cv_.wait(lock);
                    continue;
                }

                auto first = Timers_.begin();
                auto deadline = first->first.first;
                if (deadline <= Clock::now()) {
                    task = std::move(first->second);
                    TimerDeadlines_.erase(first->first.second);
                    Timers_.erase(first);
                    break;
                }
                Cv_.wait_until(lock, deadline);
            }
        }
        task();
    }
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

TimerId Loop::EnqueueDelayed(std::chrono::milliseconds delay, Task&& task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        id = NextTimerId_++;
        auto deadline = Clock::now() + delay;
        Timers_.emplace(TimerKey{deadline, id}, std::move(task));
        TimerDeadlines_.emplace(id, deadline);
    }

    Cv_.notify_one();
    return id;
}

void Loop::CancelDelayed(TimerId id) {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto it = TimerDeadlines_.find(id);
    if (it == TimerDeadlines_.end()) {
        return;
    }
    Timers_.erase(TimerKey{it->second, id});
    TimerDeadlines_.erase(it);
}

} //namespace livecall
