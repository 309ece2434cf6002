// =============================================================================
// TaskQueue - Implementation
// =============================================================================

#include "parley/core/task_queue.h"

#include <exception>

#include "parley/core/logger.h"

namespace parley {

TaskQueue::TaskQueue(std::string name) : name_(std::move(name)) {
    worker_ = std::thread(&TaskQueue::run, this);
}

TaskQueue::~TaskQueue() {
    shutdown();
    if (worker_.joinable()) {
        // Destroyed from one of our own tasks: the loop exits on its own
        if (is_worker_thread()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

TaskQueue::TaskId TaskQueue::post(Task task) {
    return enqueue(Clock::now(), std::move(task));
}

TaskQueue::TaskId TaskQueue::post_delayed(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    return enqueue(Clock::now() + delay, std::move(task));
}

TaskQueue::TaskId TaskQueue::enqueue(Clock::time_point due, Task task) {
    if (!task) {
        return kInvalidTask;
    }

    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return kInvalidTask;
        }
        id = next_id_++;
        tasks_.emplace(Key(due, id), std::move(task));
        due_by_id_.emplace(id, due);
    }
    cv_.notify_one();
    return id;
}

bool TaskQueue::cancel(TaskId id) {
    if (id == kInvalidTask) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = due_by_id_.find(id);
        if (it == due_by_id_.end()) {
            return false;
        }
        tasks_.erase(Key(it->second, id));
        due_by_id_.erase(it);
    }
    cv_.notify_one();
    return true;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_.store(true);
        tasks_.clear();
        due_by_id_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable() && !is_worker_thread()) {
        worker_.join();
    }
}

bool TaskQueue::is_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

bool TaskQueue::is_running() const {
    return !stopping_.load();
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

// Worker: sleep until the earliest task is due, run it outside the lock
void TaskQueue::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopping_.load()) {
                    return;
                }
                if (tasks_.empty()) {
                    cv_.wait(lock);
                    continue;
                }
                auto first = tasks_.begin();
                // Copied: cancel() may erase the node while we wait
                const Clock::time_point due = first->first.first;
                if (due <= Clock::now()) {
                    task = std::move(first->second);
                    due_by_id_.erase(first->first.second);
                    tasks_.erase(first);
                    break;
                }
                cv_.wait_until(lock, due);
            }
        }

        try {
            task();
        } catch (const std::exception& e) {
            PARLEY_LOG_ERROR("TaskQueue", "[%s] task threw: %s", name_.c_str(), e.what());
        }
    }
}

}  // namespace parley
