#include "cellpipe/pipeline/partition.hpp"
#include "cellpipe/core/errors.hpp"

#include <algorithm>
#include <string>

namespace cellpipe::pipeline {

std::vector<std::vector<int>> compute_batches(const std::vector<int>& fovs, int batch_size) {
    if (batch_size < 1) {
        throw ValidationError("batch_size must be >= 1 (got " + std::to_string(batch_size) + ")");
    }
    std::vector<std::vector<int>> batches;
    for (size_t start = 0; start < fovs.size(); start += static_cast<size_t>(batch_size)) {
        const size_t end = std::min(fovs.size(), start + static_cast<size_t>(batch_size));
        batches.emplace_back(fovs.begin() + static_cast<std::ptrdiff_t>(start),
                             fovs.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}

std::vector<std::vector<int>> split_worker_ranges(const std::vector<int>& batch, int n_workers) {
    if (n_workers < 1) {
        throw ValidationError("n_workers must be >= 1 (got " + std::to_string(n_workers) + ")");
    }
    const size_t n = batch.size();
    const size_t w = static_cast<size_t>(n_workers);
    const size_t base = n / w;
    const size_t extra = n % w;

    std::vector<std::vector<int>> ranges;
    size_t start = 0;
    for (size_t i = 0; i < w; ++i) {
        const size_t len = base + (i < extra ? 1 : 0);
        if (len == 0) continue;
        ranges.emplace_back(batch.begin() + static_cast<std::ptrdiff_t>(start),
                            batch.begin() + static_cast<std::ptrdiff_t>(start + len));
        start += len;
    }
    return ranges;
}

} // namespace cellpipe::pipeline
