#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ferry {

// Fixed-size worker pool for graph loading. Tasks may submit further
// tasks; wait_idle() returns once the queue is empty and no task runs.
// An exception escaping a task is kept and rethrown by wait_idle().
class TaskPool {
public:
    explicit TaskPool(size_t threads);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    // Returns false once the pool is shutting down
    bool submit(std::function<void()> task);

    void wait_idle();
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stop_ = false;
    std::exception_ptr error_;  // first task failure
};

} // namespace ferry
