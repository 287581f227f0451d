#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace cellpipe::pipeline {

// Fixed-size worker pool. Finished task ids are queued so the owner can
// block on completions in the order they happen.
class ThreadPool {
public:
    explicit ThreadPool(int n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    std::pair<size_t, std::future<std::invoke_result_t<F>>> submit(F&& fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        size_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            queue_.push_back({id, [task]() { (*task)(); }});
        }
        cv_.notify_one();
        return {id, std::move(future)};
    }

    // Blocks until a task finishes and returns its id.
    size_t wait_completion();

    // Drops queued tasks that have not started; returns how many. Their
    // futures report broken_promise.
    size_t cancel_pending();

    size_t size() const { return workers_.size(); }

private:
    struct Job {
        size_t id;
        std::function<void()> run;
    };

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Job> queue_;
    std::deque<size_t> completed_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    size_t next_id_ = 0;
    bool stopping_ = false;
};

} // namespace cellpipe::pipeline
