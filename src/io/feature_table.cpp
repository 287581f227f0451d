#include "cellpipe/io/feature_table.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cellpipe::io {

namespace {

std::string format_value(double v) {
    if (std::isnan(v)) return "";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << v;
    return oss.str();
}

} // namespace

const std::vector<std::string>& FeatureTable::base_columns() {
    static const std::vector<std::string> cols = {
        "fov", "cell", "frame", "time", "good",
        "position_x", "position_y",
        "bbox_x0", "bbox_y0", "bbox_x1", "bbox_y1"
    };
    return cols;
}

std::vector<std::string> FeatureTable::header() const {
    std::vector<std::string> cols = base_columns();
    cols.insert(cols.end(), feature_columns.begin(), feature_columns.end());
    return cols;
}

void FeatureTable::sort_rows() {
    std::stable_sort(rows.begin(), rows.end(), [](const TraceRow& a, const TraceRow& b) {
        if (a.cell != b.cell) return a.cell < b.cell;
        return a.frame < b.frame;
    });
}

void write_feature_table(const fs::path& path, const FeatureTable& table) {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create trace table: " + path.string());
    }

    out << core::join(table.header(), ",") << "\n";
    for (const auto& r : table.rows) {
        if (r.features.size() != table.feature_columns.size()) {
            throw IOError("Row width does not match header in " + path.string());
        }
        out << r.fov << ',' << r.cell << ',' << r.frame << ','
            << format_value(r.time) << ',' << (r.good ? "True" : "False") << ','
            << format_value(r.position_x) << ',' << format_value(r.position_y) << ','
            << format_value(r.bbox_x0) << ',' << format_value(r.bbox_y0) << ','
            << format_value(r.bbox_x1) << ',' << format_value(r.bbox_y1);
        for (double v : r.features) {
            out << ',' << format_value(v);
        }
        out << "\n";
    }

    out.flush();
    if (!out) {
        throw IOError("Cannot write trace table: " + path.string());
    }
}

} // namespace cellpipe::io
