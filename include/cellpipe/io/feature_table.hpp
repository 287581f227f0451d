#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cellpipe::io {

namespace fs = std::filesystem;

// One (cell, frame) row of a per-FOV trace table.
struct TraceRow {
    int fov = 0;
    int cell = 0;
    int frame = 0;
    double time = 0.0;
    bool good = true;
    double position_x = 0.0;
    double position_y = 0.0;
    double bbox_x0 = 0.0;
    double bbox_y0 = 0.0;
    double bbox_x1 = 0.0;
    double bbox_y1 = 0.0;
    std::vector<double> features;  // parallel to FeatureTable::feature_columns
};

struct FeatureTable {
    std::vector<std::string> feature_columns;  // "<feature>_ch_<c>"
    std::vector<TraceRow> rows;

    static const std::vector<std::string>& base_columns();
    std::vector<std::string> header() const;

    // Orders rows by (cell, frame).
    void sort_rows();
};

// Writes CSV with a header line; NaN features become empty fields.
void write_feature_table(const fs::path& path, const FeatureTable& table);

} // namespace cellpipe::io
