#include "cellpipe/io/naming.hpp"
#include "cellpipe/core/utils.hpp"

#include <algorithm>
#include <regex>

namespace cellpipe::io {

namespace {

const char* kind_token(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::PC_FRAMES: return "pc_ch";
        case ArtifactKind::FL_FRAMES: return "fl_ch";
        case ArtifactKind::SEG_LABELED: return "seg_labeled_ch";
        case ArtifactKind::SEG_TRACKED: return "seg_tracked_ch";
        case ArtifactKind::FL_BACKGROUND: return "fl_background_ch";
        case ArtifactKind::CROPS: return "crops";
        case ArtifactKind::TRACES: return "traces";
    }
    return "unknown";
}

std::string fov_prefix(const std::string& base_name, int fov) {
    return base_name + "_fov_" + core::zero_pad(fov, 3);
}

// <base>_fov_<NNN>_<kind>_<C>.fits
const std::regex& channel_artifact_re() {
    static const std::regex re(
        R"(^.+_fov_(\d+)_(pc_ch|fl_ch|seg_labeled_ch|seg_tracked_ch|fl_background_ch)_(\d+)\.fits$)");
    return re;
}

std::vector<fs::path> collect(const fs::path& output_dir, const std::string& pattern) {
    std::vector<fs::path> out;
    for (int fov : discover_fovs(output_dir)) {
        auto files = core::discover_files(fov_dir(output_dir, fov), pattern);
        out.insert(out.end(), files.begin(), files.end());
    }
    return out;
}

} // namespace

std::string artifact_kind_to_string(ArtifactKind kind) {
    return kind_token(kind);
}

fs::path fov_dir(const fs::path& output_dir, int fov) {
    return output_dir / ("fov_" + core::zero_pad(fov, 3));
}

fs::path artifact_path(const fs::path& output_dir, const std::string& base_name,
                       int fov, ArtifactKind kind, int channel) {
    const std::string prefix = fov_prefix(base_name, fov);
    std::string name;
    switch (kind) {
        case ArtifactKind::CROPS:
            name = prefix + "_crops.h5";
            break;
        case ArtifactKind::TRACES:
            name = prefix + "_traces.csv";
            break;
        default:
            name = prefix + "_" + kind_token(kind) + "_" + std::to_string(channel) + ".fits";
            break;
    }
    return fov_dir(output_dir, fov) / name;
}

fs::path config_path(const fs::path& output_dir) {
    return output_dir / "processing_config.yaml";
}

fs::path merged_traces_path(const fs::path& output_dir, const std::string& base_name) {
    return output_dir / (base_name + "_traces_merged.csv");
}

fs::path partial_path(const fs::path& final_path) {
    fs::path p = final_path;
    p += ".partial";
    return p;
}

bool FovArtifacts::empty() const {
    return pc_frames.empty() && fl_frames.empty() && seg_labeled.empty() &&
           seg_tracked.empty() && fl_background.empty() && !crops && !traces;
}

std::vector<int> discover_fovs(const fs::path& output_dir) {
    std::vector<int> fovs;
    if (!fs::is_directory(output_dir)) {
        return fovs;
    }
    for (const auto& entry : fs::directory_iterator(output_dir)) {
        if (!entry.is_directory()) continue;
        const std::string name = entry.path().filename().string();
        if (!core::starts_with(name, "fov_")) continue;
        if (auto index = core::parse_index(name.substr(4))) {
            fovs.push_back(*index);
        }
    }
    std::sort(fovs.begin(), fovs.end());
    return fovs;
}

FovArtifacts discover_artifacts(const fs::path& output_dir, int fov) {
    FovArtifacts found;
    found.fov = fov;
    found.dir = fov_dir(output_dir, fov);
    if (!fs::is_directory(found.dir)) {
        return found;
    }

    for (const auto& entry : fs::directory_iterator(found.dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();

        std::smatch m;
        if (std::regex_match(name, m, channel_artifact_re())) {
            const auto file_fov = core::parse_index(m[1].str());
            const auto parsed_channel = core::parse_index(m[3].str());
            if (!file_fov || *file_fov != fov || !parsed_channel) continue;
            const std::string kind = m[2].str();
            const int channel = *parsed_channel;
            if (kind == "pc_ch") found.pc_frames[channel] = entry.path();
            else if (kind == "fl_ch") found.fl_frames[channel] = entry.path();
            else if (kind == "seg_labeled_ch") found.seg_labeled[channel] = entry.path();
            else if (kind == "seg_tracked_ch") found.seg_tracked[channel] = entry.path();
            else if (kind == "fl_background_ch") found.fl_background[channel] = entry.path();
        } else if (core::ends_with(name, "_fov_" + core::zero_pad(fov, 3) + "_crops.h5")) {
            found.crops = entry.path();
        } else if (core::ends_with(name, "_fov_" + core::zero_pad(fov, 3) + "_traces.csv")) {
            found.traces = entry.path();
        }
    }
    return found;
}

std::vector<fs::path> discover_traces(const fs::path& output_dir) {
    return collect(output_dir, "*_traces.csv");
}

std::vector<fs::path> discover_crops(const fs::path& output_dir) {
    return collect(output_dir, "*_crops.h5");
}

std::vector<fs::path> discover_seg_tracked(const fs::path& output_dir) {
    return collect(output_dir, "*_seg_tracked_ch_*.fits");
}

} // namespace cellpipe::io
