#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/io/feature_table.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cellpipe::processing {

namespace fs = std::filesystem;

// Features measured on one cropped channel.
struct ChannelFeatureConfig {
    std::string channel_name;     // crop group, e.g. "fl_ch_1"
    int channel_id = 0;           // used in "<feature>_ch_<id>" columns
    std::string background_name;  // empty: no background subtraction
    std::vector<std::string> features;
    float background_weight = 0.0f;
    bool use_bbox_as_mask = true;
};

// PC first (weight 0, no background), then one entry per FL selection with
// background "fl_ch_<c>" and the clamped global weight. Feature lists are
// de-duplicated and sorted; unknown names throw ConfigError.
std::vector<ChannelFeatureConfig> build_channel_configs(const config::ProcessingConfig& cfg);

// "<feature>_ch_<id>" for every configured pair, in table order.
std::vector<std::string> feature_columns(const std::vector<ChannelFeatureConfig>& channels);

// Measures every (cell, frame) of the crop container into `table`.
// `timepoints_ms` may be empty, in which case the time column is the
// frame index. Checks `cancel` before each cell; returns false if
// cancelled, leaving `table` unspecified.
bool extract_traces(const fs::path& crops_path, const std::vector<ChannelFeatureConfig>& channels,
                    int fov, const std::vector<double>& timepoints_ms,
                    const core::CancellationToken& cancel, const core::ProgressCallback& progress,
                    io::FeatureTable& table);

} // namespace cellpipe::processing
