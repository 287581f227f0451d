#pragma once

#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/io/crop_store.hpp"
#include "cellpipe/io/fits_stack.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace cellpipe::processing {

namespace fs = std::filesystem;

struct CropParams {
    int padding = 5;
    int mask_margin = 0;  // >0 dilates, <0 erodes
    int min_frames = 1;
};

// One channel to crop. `background` may be null.
struct CropSource {
    std::string name;  // "pc_ch_0", "fl_ch_1", ...
    const io::FitsCube* frames = nullptr;
    const io::FitsCube* background = nullptr;
};

// Padded, clipped per-frame boxes of every tracked cell, ascending frames.
std::map<int, std::vector<FrameBox>> compute_bounding_boxes(const io::FitsCube& tracked,
                                                            int padding);

// Drops cells present in fewer than `min_frames` frames.
void filter_short_tracks(std::map<int, std::vector<FrameBox>>& boxes, int min_frames);

// Dilates (margin > 0) or erodes (margin < 0) with a (2|m|+1)^2 square.
// An erosion that leaves nothing returns the input mask.
MaskFrame adjust_mask(const MaskFrame& mask, int margin);

// Builds the crop container for one FOV at `out_path`. Cancellation is
// checked before the bbox pass, before the crop pass and before each cell
// is saved; a cancelled save deletes `out_path`. Returns false if cancelled.
bool crop_cells(const io::FitsCube& tracked, const std::vector<CropSource>& sources,
                const CropParams& params, const fs::path& out_path,
                const core::CancellationToken& cancel, const core::ProgressCallback& progress);

} // namespace cellpipe::processing
