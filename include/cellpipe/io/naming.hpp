#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cellpipe::io {

namespace fs = std::filesystem;

enum class ArtifactKind {
    PC_FRAMES,
    FL_FRAMES,
    SEG_LABELED,
    SEG_TRACKED,
    FL_BACKGROUND,
    CROPS,   // per FOV, no channel
    TRACES   // per FOV, no channel
};

std::string artifact_kind_to_string(ArtifactKind kind);

fs::path fov_dir(const fs::path& output_dir, int fov);

// Canonical artifact path. `channel` is ignored for CROPS and TRACES.
fs::path artifact_path(const fs::path& output_dir, const std::string& base_name,
                       int fov, ArtifactKind kind, int channel = 0);

fs::path config_path(const fs::path& output_dir);
fs::path merged_traces_path(const fs::path& output_dir, const std::string& base_name);

// Temporary sibling a stage writes before committing to `final_path`.
fs::path partial_path(const fs::path& final_path);

// Artifacts found in one FOV directory, keyed by channel.
struct FovArtifacts {
    int fov = 0;
    fs::path dir;
    std::map<int, fs::path> pc_frames;
    std::map<int, fs::path> fl_frames;
    std::map<int, fs::path> seg_labeled;
    std::map<int, fs::path> seg_tracked;
    std::map<int, fs::path> fl_background;
    std::optional<fs::path> crops;
    std::optional<fs::path> traces;

    bool empty() const;
};

std::vector<int> discover_fovs(const fs::path& output_dir);
FovArtifacts discover_artifacts(const fs::path& output_dir, int fov);

std::vector<fs::path> discover_traces(const fs::path& output_dir);
std::vector<fs::path> discover_crops(const fs::path& output_dir);
std::vector<fs::path> discover_seg_tracked(const fs::path& output_dir);

} // namespace cellpipe::io
