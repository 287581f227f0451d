#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace cellpipe::core {

// Shared stop flag for one run. Set once from outside, never cleared.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// (current, total, message)
using ProgressCallback = std::function<void(int, int, const std::string&)>;

inline void report(const ProgressCallback& progress, int current, int total,
                   const std::string& message) {
    if (progress) {
        progress(current, total, message);
    }
}

} // namespace cellpipe::core
