#pragma once

#include <vector>

namespace cellpipe::pipeline {

// Contiguous slices of `fovs` of at most `batch_size`, in list order.
// Throws ValidationError for batch_size < 1.
std::vector<std::vector<int>> compute_batches(const std::vector<int>& fovs, int batch_size);

// Up to `n_workers` contiguous, non-overlapping ranges covering `batch` in
// order; range i holds n/w + (i < n%w) items and empty ranges are left out.
std::vector<std::vector<int>> split_worker_ranges(const std::vector<int>& batch, int n_workers);

} // namespace cellpipe::pipeline
