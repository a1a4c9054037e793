#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace canvas::server {

// Fixed-size worker pool. Every task hands its result (or exception) back
// through the returned future; the pool itself never inspects it.
//
// The bridge runs two of these: "session" drains per-connection inboxes and
// "transfer" bounds the number of concurrent Canvas/vector store calls.
class TaskExecutor {
public:
    // Constructs a stopped pool; start() spawns the workers.
    explicit TaskExecutor(std::string name = "executor");
    TaskExecutor(std::string name, std::size_t worker_count);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void start(std::size_t worker_count);
    // Runs everything already queued, then joins the workers. Idempotent.
    void shutdown();

    const std::string& name() const { return name_; }
    std::size_t worker_count() const;
    std::size_t queued() const;
    std::size_t busy() const;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

private:
    void enqueue(std::function<void()> job);
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::size_t busy_ = 0;
    bool accepting_ = false;
};

}  // namespace canvas::server
