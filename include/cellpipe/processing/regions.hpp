#pragma once

#include "cellpipe/core/types.hpp"

#include <map>

namespace cellpipe::processing {

// Per-label summary of one label frame.
struct RegionStats {
    int label = 0;
    int area = 0;
    double centroid_y = 0.0;
    double centroid_x = 0.0;
    BoundingBox box;  // tight, exclusive ends
};

// Regions keyed by label, background (0) excluded.
std::map<int, RegionStats> region_stats(const LabelFrame& labels);

// Grows `box` by `padding` on every side and clips it to rows x cols.
BoundingBox pad_and_clip(const BoundingBox& box, int padding, int rows, int cols);

} // namespace cellpipe::processing
