#include "cellpipe/processing/regions.hpp"

#include <algorithm>

namespace cellpipe::processing {

std::map<int, RegionStats> region_stats(const LabelFrame& labels) {
    std::map<int, RegionStats> regions;
    std::map<int, std::pair<double, double>> sums;

    for (Eigen::Index y = 0; y < labels.rows(); ++y) {
        for (Eigen::Index x = 0; x < labels.cols(); ++x) {
            const int id = labels(y, x);
            if (id == 0) continue;

            auto it = regions.find(id);
            if (it == regions.end()) {
                RegionStats r;
                r.label = id;
                r.box = BoundingBox{static_cast<int>(y), static_cast<int>(x),
                                    static_cast<int>(y) + 1, static_cast<int>(x) + 1};
                it = regions.emplace(id, r).first;
            }
            RegionStats& r = it->second;
            r.area += 1;
            r.box.y0 = std::min(r.box.y0, static_cast<int>(y));
            r.box.x0 = std::min(r.box.x0, static_cast<int>(x));
            r.box.y1 = std::max(r.box.y1, static_cast<int>(y) + 1);
            r.box.x1 = std::max(r.box.x1, static_cast<int>(x) + 1);

            auto& s = sums[id];
            s.first += static_cast<double>(y);
            s.second += static_cast<double>(x);
        }
    }

    for (auto& [id, r] : regions) {
        const auto& s = sums[id];
        r.centroid_y = s.first / r.area;
        r.centroid_x = s.second / r.area;
    }
    return regions;
}

BoundingBox pad_and_clip(const BoundingBox& box, int padding, int rows, int cols) {
    BoundingBox out;
    out.y0 = std::max(0, box.y0 - padding);
    out.x0 = std::max(0, box.x0 - padding);
    out.y1 = std::min(rows, box.y1 + padding);
    out.x1 = std::min(cols, box.x1 + padding);
    return out;
}

} // namespace cellpipe::processing
