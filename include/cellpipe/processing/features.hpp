#pragma once

#include "cellpipe/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cellpipe::processing {

// Inputs of one feature evaluation on a single cell crop.
struct FeatureContext {
    Matrix2Df image;
    MaskFrame mask;                        // same shape as image
    const Matrix2Df* background = nullptr; // null: no background subtraction
    float background_weight = 0.0f;
};

using FeatureFunction = std::function<double(const FeatureContext&)>;

// Sum of (image - weight * background) over the mask.
double feature_intensity_total(const FeatureContext& ctx);

// Number of bright spots inside the mask. The background-corrected crop is
// blurred (Gaussian, sigma 2), thresholded by sliding-window Li voting,
// split into particles by seeded flooding from local maxima, and particles
// with a radius below 3 px or a peak below 50 are discarded.
double feature_particle_num(const FeatureContext& ctx);

// Number of mask pixels.
double feature_area(const FeatureContext& ctx);

// Major/minor axis ratio from the second central moments of the mask.
// NaN when the mask is empty or degenerate.
double feature_aspect_ratio(const FeatureContext& ctx);

// Li's minimum cross-entropy threshold.
float threshold_li(const std::vector<float>& values);

// Per-pixel majority vote of Li thresholds over overlapping windows.
MaskFrame li_voting_mask(const Matrix2Df& image, int window_size, int stride);

void register_feature(const std::string& name, FeatureFunction fn);
// Throws ConfigError for unknown names.
FeatureFunction get_feature(const std::string& name);
std::vector<std::string> list_features();

} // namespace cellpipe::processing
