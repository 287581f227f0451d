#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/io/fits_stack.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cellpipe::processing {

// Labels cells in a single phase-contrast frame.
class Segmenter {
public:
    virtual ~Segmenter() = default;
    virtual std::string name() const = 0;
    virtual LabelFrame segment(const Matrix2Du16& frame) const = 0;
};

// Local log-standard-deviation thresholding followed by morphological
// cleanup and 4-connected labelling.
class LogStdSegmenter : public Segmenter {
public:
    explicit LogStdSegmenter(const config::SegmentationConfig& cfg);

    std::string name() const override { return "logstd"; }
    LabelFrame segment(const Matrix2Du16& frame) const override;

private:
    config::SegmentationConfig cfg_;
};

// 0.5 * log(local variance) over a (2*radius+1)^2 window, 0 where the
// variance is not positive.
Matrix2Df compute_logstd(const Matrix2Df& image, int radius = 1);

// Histogram mode (bin centre) plus n_sigma standard deviations of the
// values at or below the mode.
float mode_threshold(const Matrix2Df& values, int n_bins = 200, float n_sigma = 3.0f);

// Hole filling, then opening and closing with a 7x7 square, 3 rounds each.
MaskFrame clean_mask(const MaskFrame& mask);

// 4-connected components. Components outside [min_size, max_size] become
// background without renumbering; a bound of 0 disables it.
LabelFrame label_components(const MaskFrame& mask, int min_size = 0, int max_size = 0);

// Segments every frame of `pc` into `out`, checking `cancel` before each
// frame. Returns false if cancelled.
bool segment_stack(const Segmenter& segmenter, const io::FitsCube& pc, io::FitsCube& out,
                   const core::CancellationToken& cancel,
                   const core::ProgressCallback& progress);

using SegmenterFactory =
    std::function<std::unique_ptr<Segmenter>(const config::ProcessingConfig&)>;

void register_segmenter(const std::string& name, SegmenterFactory factory);
std::unique_ptr<Segmenter> make_segmenter(const std::string& name,
                                          const config::ProcessingConfig& cfg);
std::vector<std::string> list_segmenters();

} // namespace cellpipe::processing
