#include "cellpipe/io/naming.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

namespace io = cellpipe::io;
using cellpipe::testing::TempDir;

namespace {

void touch(const std::filesystem::path& p) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p) << "x";
}

} // namespace

TEST_CASE("artifact_path_follows_the_naming_table") {
    const std::filesystem::path out = "/data/out";
    REQUIRE(io::fov_dir(out, 3) == out / "fov_003");
    REQUIRE(io::artifact_path(out, "exp", 3, io::ArtifactKind::PC_FRAMES, 0).filename() ==
            "exp_fov_003_pc_ch_0.fits");
    REQUIRE(io::artifact_path(out, "exp", 3, io::ArtifactKind::FL_FRAMES, 2).filename() ==
            "exp_fov_003_fl_ch_2.fits");
    REQUIRE(io::artifact_path(out, "exp", 12, io::ArtifactKind::SEG_LABELED, 0).filename() ==
            "exp_fov_012_seg_labeled_ch_0.fits");
    REQUIRE(io::artifact_path(out, "exp", 12, io::ArtifactKind::SEG_TRACKED, 0).filename() ==
            "exp_fov_012_seg_tracked_ch_0.fits");
    REQUIRE(io::artifact_path(out, "exp", 1, io::ArtifactKind::FL_BACKGROUND, 1).filename() ==
            "exp_fov_001_fl_background_ch_1.fits");
    REQUIRE(io::artifact_path(out, "exp", 1, io::ArtifactKind::CROPS, 5).filename() ==
            "exp_fov_001_crops.h5");
    REQUIRE(io::artifact_path(out, "exp", 1, io::ArtifactKind::TRACES).parent_path() ==
            out / "fov_001");
    REQUIRE(io::config_path(out) == out / "processing_config.yaml");
    REQUIRE(io::merged_traces_path(out, "exp") == out / "exp_traces_merged.csv");
    REQUIRE(io::partial_path(out / "a.fits") == out / "a.fits.partial");
}

TEST_CASE("discover_fovs_ignores_unparseable_directories") {
    TempDir tmp("naming");
    std::filesystem::create_directories(tmp.path() / "fov_002");
    std::filesystem::create_directories(tmp.path() / "fov_000");
    std::filesystem::create_directories(tmp.path() / "fov_abc");
    std::filesystem::create_directories(tmp.path() / "fov_-1");
    std::filesystem::create_directories(tmp.path() / "fov_99999999999");
    std::filesystem::create_directories(tmp.path() / "logs");

    REQUIRE(io::discover_fovs(tmp.path()) == std::vector<int>({0, 2}));
    REQUIRE(io::discover_fovs(tmp.path() / "missing").empty());
}

TEST_CASE("discover_artifacts_maps_channels_and_skips_partials") {
    TempDir tmp("naming");
    const auto out = tmp.path();
    touch(io::artifact_path(out, "exp", 1, io::ArtifactKind::PC_FRAMES, 0));
    touch(io::artifact_path(out, "exp", 1, io::ArtifactKind::FL_FRAMES, 1));
    touch(io::artifact_path(out, "exp", 1, io::ArtifactKind::FL_FRAMES, 2));
    touch(io::artifact_path(out, "exp", 1, io::ArtifactKind::SEG_TRACKED, 0));
    touch(io::artifact_path(out, "exp", 1, io::ArtifactKind::TRACES));
    touch(io::partial_path(io::artifact_path(out, "exp", 1, io::ArtifactKind::CROPS)));
    touch(io::fov_dir(out, 1) / "exp_fov_001_fl_ch_99999999999.fits");
    touch(io::fov_dir(out, 1) / "exp_fov_99999999999_pc_ch_0.fits");

    auto a = io::discover_artifacts(out, 1);
    REQUIRE(a.fov == 1);
    REQUIRE(a.pc_frames.size() == 1);
    REQUIRE(a.fl_frames.size() == 2);
    REQUIRE(a.fl_frames.count(2) == 1);
    REQUIRE(a.seg_tracked.count(0) == 1);
    REQUIRE(a.seg_labeled.empty());
    REQUIRE_FALSE(a.crops.has_value());
    REQUIRE(a.traces.has_value());
    REQUIRE_FALSE(a.empty());

    REQUIRE(io::discover_traces(out).size() == 1);
    REQUIRE(io::discover_crops(out).empty());
    REQUIRE(io::discover_seg_tracked(out).size() == 1);
}
