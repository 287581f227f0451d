#include "cellpipe/pipeline/thread_pool.hpp"
#include "cellpipe/core/errors.hpp"

#include <string>

namespace cellpipe::pipeline {

ThreadPool::ThreadPool(int n_threads) {
    if (n_threads < 1) {
        throw ValidationError("Thread pool size must be >= 1 (got " + std::to_string(n_threads) +
                              ")");
    }
    workers_.reserve(static_cast<size_t>(n_threads));
    for (int i = 0; i < n_threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

void ThreadPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task stores any exception in the future
        job.run();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back(job.id);
        }
        done_cv_.notify_all();
    }
}

size_t ThreadPool::wait_completion() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]() { return !completed_.empty(); });
    const size_t id = completed_.front();
    completed_.pop_front();
    return id;
}

size_t ThreadPool::cancel_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t dropped = queue_.size();
    queue_.clear();
    return dropped;
}

} // namespace cellpipe::pipeline
