#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <set>

namespace cellpipe::config {

static ChannelSelection read_selection(const YAML::Node& n, bool default_bbox_mask) {
    ChannelSelection sel;
    sel.use_bbox_as_mask = default_bbox_mask;
    if (n["channel"]) sel.channel = n["channel"].as<int>();
    if (n["features"]) {
        if (!n["features"].IsSequence()) {
            throw ConfigError("channel features must be a list");
        }
        for (const auto& f : n["features"]) {
            sel.features.push_back(f.as<std::string>());
        }
    }
    if (n["use_bbox_as_mask"]) sel.use_bbox_as_mask = n["use_bbox_as_mask"].as<bool>();
    return sel;
}

static YAML::Node selection_to_yaml(const ChannelSelection& sel) {
    YAML::Node n;
    n["channel"] = sel.channel;
    n["features"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& f : sel.features) {
        n["features"].push_back(f);
    }
    n["use_bbox_as_mask"] = sel.use_bbox_as_mask;
    return n;
}

static bool selects_all(const std::string& fovs) {
    const std::string s = core::to_lower(core::trim(fovs));
    return s.empty() || s == "all";
}

static bool parse_non_negative(const std::string& s, int& out) {
    const auto v = core::parse_index(s);
    if (!v) return false;
    out = *v;
    return true;
}

std::vector<int> ChannelsConfig::fl_channels() const {
    std::vector<int> out;
    out.reserve(fl.size());
    for (const auto& sel : fl) out.push_back(sel.channel);
    return out;
}

std::vector<FovSpan> parse_fov_spans(const std::string& text) {
    std::string compact;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) compact += c;
    }
    if (compact.empty()) {
        return {};
    }
    if (compact.find(';') != std::string::npos) {
        throw ConfigError("Use commas, not semicolons, to separate FOV ranges: '" + text + "'");
    }

    std::vector<FovSpan> spans;
    for (const auto& part : core::split(compact, ',')) {
        if (part.empty()) {
            throw ConfigError("Empty entry in FOV selection: '" + text + "'");
        }
        const auto dash = part.find('-');
        if (dash == std::string::npos) {
            int v = 0;
            if (!parse_non_negative(part, v)) {
                throw ConfigError("FOV index must be a non-negative integer: '" + part + "'");
            }
            spans.push_back({v, v});
            continue;
        }
        FovSpan span;
        if (!parse_non_negative(part.substr(0, dash), span.first) ||
            !parse_non_negative(part.substr(dash + 1), span.last)) {
            throw ConfigError("Invalid FOV range (expected start-end with non-negative bounds): '" +
                              part + "'");
        }
        if (span.first > span.last) {
            throw ConfigError("FOV range start must not exceed end: '" + part + "'");
        }
        spans.push_back(span);
    }
    return spans;
}

std::vector<int> parse_fov_range(const std::string& text, int n_fovs) {
    if (n_fovs < 0) {
        throw ConfigError("n_fovs must be >= 0");
    }
    const std::vector<FovSpan> spans = parse_fov_spans(text);

    // Bounds first, so a huge range is rejected before anything is expanded.
    constexpr size_t kMaxListed = 8;
    std::set<int> invalid;
    bool truncated = false;
    for (const auto& span : spans) {
        if (span.last < n_fovs) continue;
        for (int64_t v = std::max(span.first, n_fovs); v <= span.last; ++v) {
            if (invalid.size() == kMaxListed) {
                truncated = true;
                break;
            }
            invalid.insert(static_cast<int>(v));
        }
    }
    if (!invalid.empty()) {
        std::vector<std::string> listed;
        for (int v : invalid) listed.push_back(std::to_string(v));
        if (truncated) listed.push_back("...");
        throw ConfigError("Invalid FOV indices: " + core::join(listed, ", ") +
                          " (acquisition has " + std::to_string(n_fovs) + " FOVs)");
    }

    std::set<int> fovs;
    for (const auto& span : spans) {
        for (int v = span.first; v <= span.last; ++v) fovs.insert(v);
    }
    return std::vector<int>(fovs.begin(), fovs.end());
}

std::vector<int> resolve_fovs(const ProcessingConfig& cfg, int n_fovs) {
    if (n_fovs < 0) {
        throw ConfigError("n_fovs must be >= 0");
    }
    if (selects_all(cfg.params.fovs)) {
        std::vector<int> all(static_cast<size_t>(n_fovs));
        for (int i = 0; i < n_fovs; ++i) all[static_cast<size_t>(i)] = i;
        return all;
    }
    return parse_fov_range(cfg.params.fovs, n_fovs);
}

ProcessingConfig ProcessingConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

ProcessingConfig ProcessingConfig::from_yaml(const YAML::Node& node) {
    ProcessingConfig cfg;

    try {
        if (node["channels"]) {
            auto c = node["channels"];
            if (c["pc"] && !c["pc"].IsNull()) {
                cfg.channels.pc = read_selection(c["pc"], false);
            }
            if (c["fl"]) {
                if (!c["fl"].IsSequence()) {
                    throw ConfigError("channels.fl must be a list");
                }
                for (const auto& fl : c["fl"]) {
                    cfg.channels.fl.push_back(read_selection(fl, true));
                }
            }
        }

        if (node["params"]) {
            auto p = node["params"];
            if (p["fovs"]) cfg.params.fovs = p["fovs"].as<std::string>();
            if (p["batch_size"]) cfg.params.batch_size = p["batch_size"].as<int>();
            if (p["n_workers"]) cfg.params.n_workers = p["n_workers"].as<int>();
            if (p["background_weight"]) cfg.params.background_weight = p["background_weight"].as<float>();
            if (p["segmentation_method"]) cfg.params.segmentation_method = p["segmentation_method"].as<std::string>();
            if (p["tracking_method"]) cfg.params.tracking_method = p["tracking_method"].as<std::string>();
            if (p["crop_padding"]) cfg.params.crop_padding = p["crop_padding"].as<int>();
            if (p["mask_margin"]) cfg.params.mask_margin = p["mask_margin"].as<int>();
            if (p["min_frames"]) cfg.params.min_frames = p["min_frames"].as<int>();
        }

        if (node["segmentation"]) {
            auto s = node["segmentation"];
            if (s["min_size"]) cfg.segmentation.min_size = s["min_size"].as<int>();
            if (s["max_size"]) cfg.segmentation.max_size = s["max_size"].as<int>();
        }

        if (node["tracking"]) {
            auto t = node["tracking"];
            if (t["iou"]) {
                auto i = t["iou"];
                if (i["min_iou"]) cfg.tracking.iou.min_iou = i["min_iou"].as<float>();
            }
            if (t["kalman"]) {
                auto k = t["kalman"];
                if (k["max_search_radius"]) cfg.tracking.kalman.max_search_radius = k["max_search_radius"].as<float>();
                if (k["process_noise"]) cfg.tracking.kalman.process_noise = k["process_noise"].as<float>();
                if (k["measurement_noise"]) cfg.tracking.kalman.measurement_noise = k["measurement_noise"].as<float>();
                if (k["max_lost_frames"]) cfg.tracking.kalman.max_lost_frames = k["max_lost_frames"].as<int>();
            }
        }

        if (node["background"]) {
            auto b = node["background"];
            if (b["tile_size"]) cfg.background.tile_size = b["tile_size"].as<int>();
            if (b["min_samples"]) cfg.background.min_samples = b["min_samples"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed processing config: ") + e.what());
    }

    return cfg;
}

void ProcessingConfig::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node << "\n";
}

YAML::Node ProcessingConfig::to_yaml() const {
    YAML::Node node;

    if (channels.pc) {
        node["channels"]["pc"] = selection_to_yaml(*channels.pc);
    }
    node["channels"]["fl"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& fl : channels.fl) {
        node["channels"]["fl"].push_back(selection_to_yaml(fl));
    }

    node["params"]["fovs"] = params.fovs;
    node["params"]["batch_size"] = params.batch_size;
    node["params"]["n_workers"] = params.n_workers;
    node["params"]["background_weight"] = params.background_weight;
    node["params"]["segmentation_method"] = params.segmentation_method;
    node["params"]["tracking_method"] = params.tracking_method;
    node["params"]["crop_padding"] = params.crop_padding;
    node["params"]["mask_margin"] = params.mask_margin;
    node["params"]["min_frames"] = params.min_frames;

    node["segmentation"]["min_size"] = segmentation.min_size;
    node["segmentation"]["max_size"] = segmentation.max_size;

    node["tracking"]["iou"]["min_iou"] = tracking.iou.min_iou;
    node["tracking"]["kalman"]["max_search_radius"] = tracking.kalman.max_search_radius;
    node["tracking"]["kalman"]["process_noise"] = tracking.kalman.process_noise;
    node["tracking"]["kalman"]["measurement_noise"] = tracking.kalman.measurement_noise;
    node["tracking"]["kalman"]["max_lost_frames"] = tracking.kalman.max_lost_frames;

    node["background"]["tile_size"] = background.tile_size;
    node["background"]["min_samples"] = background.min_samples;

    return node;
}

void ProcessingConfig::validate() const {
    if (!channels.pc && channels.fl.empty()) {
        throw ValidationError("channels must select a pc channel or at least one fl channel");
    }
    if (channels.pc && channels.pc->channel < 0) {
        throw ValidationError("channels.pc.channel must be >= 0");
    }
    std::set<int> seen;
    for (const auto& fl : channels.fl) {
        if (fl.channel < 0) {
            throw ValidationError("channels.fl[].channel must be >= 0");
        }
        if (!seen.insert(fl.channel).second) {
            throw ValidationError("channels.fl lists channel " + std::to_string(fl.channel) + " twice");
        }
    }

    if (!selects_all(params.fovs)) {
        parse_fov_spans(params.fovs);
    }
    if (params.batch_size < 1) {
        throw ValidationError("params.batch_size must be >= 1");
    }
    if (params.n_workers < 1) {
        throw ValidationError("params.n_workers must be >= 1");
    }
    if (!(params.background_weight >= 0.0f && params.background_weight <= 1.0f)) {
        throw ValidationError("params.background_weight must be in [0,1]");
    }
    if (params.segmentation_method.empty()) {
        throw ValidationError("params.segmentation_method must not be empty");
    }
    if (params.tracking_method.empty()) {
        throw ValidationError("params.tracking_method must not be empty");
    }
    if (params.crop_padding < 0) {
        throw ValidationError("params.crop_padding must be >= 0");
    }
    if (params.min_frames < 1) {
        throw ValidationError("params.min_frames must be >= 1");
    }

    if (segmentation.min_size < 0 || segmentation.max_size < 0) {
        throw ValidationError("segmentation.min_size/max_size must be >= 0");
    }
    if (segmentation.max_size > 0 && segmentation.max_size < segmentation.min_size) {
        throw ValidationError("segmentation.max_size must be >= segmentation.min_size");
    }

    if (!(tracking.iou.min_iou > 0.0f && tracking.iou.min_iou <= 1.0f)) {
        throw ValidationError("tracking.iou.min_iou must be in (0,1]");
    }

    if (background.tile_size < 8) {
        throw ValidationError("background.tile_size must be >= 8");
    }
    if (background.min_samples < 1) {
        throw ValidationError("background.min_samples must be >= 1");
    }
}

} // namespace cellpipe::config
