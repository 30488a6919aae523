#include <ferry/task_pool.hpp>

#include <exception>

namespace ferry {

TaskPool::TaskPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&TaskPool::worker_loop, this);
    }
}

TaskPool::~TaskPool() {
    shutdown();
}

bool TaskPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return false;
        tasks_.push(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void TaskPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
    if (error_) {
        std::exception_ptr err = error_;
        error_ = nullptr;
        std::rethrow_exception(err);
    }
}

void TaskPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TaskPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure && !error_) error_ = failure;
            --active_;
            if (tasks_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

} // namespace ferry
