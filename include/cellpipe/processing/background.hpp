#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/io/fits_stack.hpp"

#include <vector>

namespace cellpipe::processing {

// Median background level per tile, sampled at the tile centres.
struct TileSupport {
    std::vector<float> centers_y;
    std::vector<float> centers_x;
    Matrix2Df values;  // (tiles_y, tiles_x)
};

// Tile medians over pixels where `labels` is 0. Tiles with fewer than
// `min_samples` background pixels are filled from valid neighbours.
TileSupport compute_tile_support(const Matrix2Df& image, const LabelFrame& labels,
                                 int tile_size, int min_samples);

// Bilinear interpolation of the tile medians over the full frame; constant
// beyond the outermost centres.
Matrix2Df interpolate_support(const TileSupport& support, int rows, int cols);

Matrix2Df estimate_background(const Matrix2Df& image, const LabelFrame& labels,
                              const config::BackgroundConfig& cfg);

// Frame-by-frame over the stacks. Returns false if cancelled.
bool estimate_background_stack(const io::FitsCube& fl, const io::FitsCube& labels,
                               io::FitsCube& out, const config::BackgroundConfig& cfg,
                               const core::CancellationToken& cancel,
                               const core::ProgressCallback& progress);

} // namespace cellpipe::processing
