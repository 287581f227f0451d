#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace cellpipe::config {

namespace fs = std::filesystem;

struct ChannelSelection {
  int channel = 0;
  std::vector<std::string> features;
  bool use_bbox_as_mask = true; // false: measure inside the cell mask only
};

struct ChannelsConfig {
  std::optional<ChannelSelection> pc;
  std::vector<ChannelSelection> fl;

  // FL channel indices in config order
  std::vector<int> fl_channels() const;
};

struct ParamsConfig {
  std::string fovs = "all"; // "all", "" or e.g. "0-5, 7"
  int batch_size = 2;
  int n_workers = 2;
  float background_weight = 1.0f;
  std::string segmentation_method = "logstd";
  std::string tracking_method = "iou";
  int crop_padding = 5;
  int mask_margin = 0; // >0 dilates, <0 erodes
  int min_frames = 1;
};

struct SegmentationConfig {
  int min_size = 0; // 0 = unbounded
  int max_size = 0; // 0 = unbounded
};

struct IouTrackingConfig {
  float min_iou = 0.1f;
};

struct KalmanTrackingConfig {
  float max_search_radius = 25.0f;
  float process_noise = 1.0f;
  float measurement_noise = 2.0f;
  int max_lost_frames = 3;
};

struct TrackingConfig {
  IouTrackingConfig iou;
  KalmanTrackingConfig kalman;
};

struct BackgroundConfig {
  int tile_size = 64;
  int min_samples = 16; // per tile, below this the tile is filled from neighbours
};

struct ProcessingConfig {
  ChannelsConfig channels;
  ParamsConfig params;
  SegmentationConfig segmentation;
  TrackingConfig tracking;
  BackgroundConfig background;

  static ProcessingConfig load(const fs::path &path);
  static ProcessingConfig from_yaml(const YAML::Node &node);
  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;
  void validate() const;
};

// Inclusive FOV interval from a selection string.
struct FovSpan {
  int first = 0;
  int last = 0;
};

// Syntax check of "0-5, 7" style selections; nothing is expanded.
std::vector<FovSpan> parse_fov_spans(const std::string &text);

// Expands a selection into a sorted, de-duplicated list. Every index must be
// below n_fovs (ConfigError otherwise, raised before expansion).
std::vector<int> parse_fov_range(const std::string &text, int n_fovs);

// Expands params.fovs against the acquisition; throws ConfigError for
// indices outside [0, n_fovs).
std::vector<int> resolve_fovs(const ProcessingConfig &cfg, int n_fovs);

} // namespace cellpipe::config
