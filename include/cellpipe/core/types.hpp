#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cellpipe {

namespace fs = std::filesystem;

// Matrix types (row-major, matching the on-disk plane layout)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du16 = Eigen::Matrix<uint16_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du8 = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Per-frame label image: 0 = background, >0 = cell id
using LabelFrame = Matrix2Du16;
// Binary mask, 0 or 1
using MaskFrame = Matrix2Du8;

// Pipeline stages in dependency order
enum class Stage {
    COPY,
    SEGMENTATION,
    TRACKING,
    BACKGROUND,
    CROPPING,
    EXTRACTION
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::COPY: return "COPY";
        case Stage::SEGMENTATION: return "SEGMENTATION";
        case Stage::TRACKING: return "TRACKING";
        case Stage::BACKGROUND: return "BACKGROUND";
        case Stage::CROPPING: return "CROPPING";
        case Stage::EXTRACTION: return "EXTRACTION";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

enum class ChannelKind {
    PC,  // Phase contrast, drives segmentation and tracking
    FL   // Fluorescence
};

inline std::string channel_kind_prefix(ChannelKind kind) {
    return kind == ChannelKind::PC ? "pc" : "fl";
}

// Axis-aligned box in pixel coordinates, y1/x1 exclusive
struct BoundingBox {
    int y0 = 0;
    int x0 = 0;
    int y1 = 0;
    int x1 = 0;

    int height() const { return y1 - y0; }
    int width() const { return x1 - x0; }
    bool empty() const { return y1 <= y0 || x1 <= x0; }
};

// Bounding box of one cell in one frame
struct FrameBox {
    int frame = 0;
    BoundingBox box;
};

} // namespace cellpipe
