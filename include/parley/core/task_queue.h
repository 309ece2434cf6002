#ifndef PARLEY_CORE_TASK_QUEUE_H
#define PARLEY_CORE_TASK_QUEUE_H

// =============================================================================
// TaskQueue - single worker thread running immediate and delayed tasks
// =============================================================================
// Tasks run one at a time, in due-time order; tasks due at the same instant
// run in the order they were posted. Delayed tasks double as cancellable
// timers (post_delayed + cancel).
// =============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace parley {

class TaskQueue {
   public:
    using Task = std::function<void()>;
    using TaskId = uint64_t;
    using Clock = std::chrono::steady_clock;

    // Returned by post/post_delayed after shutdown
    static constexpr TaskId kInvalidTask = 0;

    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    TaskId post(Task task);
    TaskId post_delayed(std::chrono::milliseconds delay, Task task);

    // Removes a task that has not started yet. Returns false if it already
    // ran, is running, or never existed.
    bool cancel(TaskId id);

    // Drops pending tasks and stops the worker. Blocks until the worker exits
    // unless called from the worker itself.
    void shutdown();

    bool is_worker_thread() const;
    bool is_running() const;
    size_t pending() const;
    const std::string& name() const { return name_; }

   private:
    using Key = std::pair<Clock::time_point, TaskId>;

    TaskId enqueue(Clock::time_point due, Task task);
    void run();

    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Task> tasks_;
    std::unordered_map<TaskId, Clock::time_point> due_by_id_;
    TaskId next_id_ = 1;

    std::atomic<bool> stopping_{false};
    std::thread worker_;
};

}  // namespace parley

#endif  // PARLEY_CORE_TASK_QUEUE_H
