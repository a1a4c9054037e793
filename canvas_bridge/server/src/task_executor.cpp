#include "task_executor.hpp"

#include <utility>

namespace canvas::server {

TaskExecutor::TaskExecutor(std::string name) : name_(std::move(name)) {}

TaskExecutor::TaskExecutor(std::string name, std::size_t worker_count) : name_(std::move(name)) {
    start(worker_count);
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::start(std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("TaskExecutor " + name_ + " needs at least one worker");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (accepting_) {
        return;
    }
    accepting_ = true;
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

void TaskExecutor::shutdown() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        joining.swap(workers_);
    }
    wakeup_.notify_all();
    for (auto& worker : joining) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t TaskExecutor::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::size_t TaskExecutor::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t TaskExecutor::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

void TaskExecutor::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            throw std::runtime_error("TaskExecutor " + name_ + " is not running");
        }
        queue_.push_back(std::move(job));
    }
    wakeup_.notify_one();
}

void TaskExecutor::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wakeup_.wait(lock, [this] { return !accepting_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        auto job = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;
        lock.unlock();
        // packaged_task stores any exception in its shared state.
        job();
        lock.lock();
        --busy_;
    }
}

}  // namespace canvas::server
