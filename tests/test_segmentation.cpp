#include "cellpipe/core/errors.hpp"
#include "cellpipe/processing/regions.hpp"
#include "cellpipe/processing/segmentation.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>

using namespace cellpipe;
using namespace cellpipe::processing;

TEST_CASE("compute_logstd_is_zero_on_a_constant_image") {
    Matrix2Df image = Matrix2Df::Constant(16, 16, 42.0f);
    Matrix2Df out = compute_logstd(image, 1);
    REQUIRE(out.rows() == 16);
    REQUIRE(out.cols() == 16);
    REQUIRE(out.cwiseAbs().maxCoeff() == Catch::Approx(0.0f));
}

TEST_CASE("compute_logstd_matches_log_of_local_deviation") {
    // Alternating columns 0/2: every 3x3 window holds a 2:1 mix, variance 8/9.
    Matrix2Df image(9, 9);
    for (int y = 0; y < 9; ++y) {
        for (int x = 0; x < 9; ++x) image(y, x) = (x % 2) ? 2.0f : 0.0f;
    }
    Matrix2Df out = compute_logstd(image, 1);
    const double centre_var = 8.0 / 9.0;
    REQUIRE(out(4, 4) == Catch::Approx(0.5 * std::log(centre_var)).margin(1e-4));
}

TEST_CASE("label_components_uses_four_connectivity_and_size_bounds") {
    MaskFrame mask = MaskFrame::Zero(10, 10);
    mask.block(1, 1, 3, 3).setOnes();  // 9 px
    mask(4, 4) = 1;                    // diagonal neighbour only, separate
    mask.block(6, 6, 4, 4).setOnes();  // 16 px

    LabelFrame all = label_components(mask);
    auto regions = region_stats(all);
    REQUIRE(regions.size() == 3);

    LabelFrame filtered = label_components(mask, 2, 10);
    regions = region_stats(filtered);
    REQUIRE(regions.size() == 1);
    REQUIRE(regions.begin()->second.area == 9);
    REQUIRE(filtered(7, 7) == 0);
    REQUIRE(filtered(4, 4) == 0);
}

TEST_CASE("clean_mask_fills_holes_and_drops_specks") {
    MaskFrame mask = MaskFrame::Zero(64, 64);
    mask.block(10, 10, 30, 30).setOnes();
    mask(25, 25) = 0;  // hole
    mask(55, 55) = 1;  // speck

    MaskFrame cleaned = clean_mask(mask);
    REQUIRE(cleaned(25, 25) == 1);
    REQUIRE(cleaned(55, 55) == 0);
    REQUIRE(cleaned(20, 20) == 1);
}

TEST_CASE("mode_threshold_of_constant_values_is_that_value") {
    Matrix2Df values = Matrix2Df::Constant(4, 4, 3.5f);
    REQUIRE(mode_threshold(values) == Catch::Approx(3.5f));
}

TEST_CASE("logstd_segmenter_finds_textured_cells") {
    testing::SyntheticReader reader(1, 1, 1);
    config::SegmentationConfig cfg;
    LogStdSegmenter segmenter(cfg);

    LabelFrame labels = segmenter.segment(reader.read_frame(0, 0, 0));
    auto regions = region_stats(labels);
    REQUIRE(regions.size() == reader.discs().size());

    for (const auto& disc : reader.discs()) {
        const int id = labels(static_cast<int>(disc.cy), static_cast<int>(disc.cx));
        REQUIRE(id > 0);
        const auto& r = regions.at(id);
        REQUIRE(r.centroid_y == Catch::Approx(disc.cy).margin(2.0));
        REQUIRE(r.centroid_x == Catch::Approx(disc.cx).margin(2.0));
        const double disc_area = 3.14159265 * disc.radius * disc.radius;
        REQUIRE(r.area > 0.6 * disc_area);
        REQUIRE(r.area < 1.6 * disc_area);
    }
}

TEST_CASE("segment_stack_stops_when_cancelled") {
    testing::TempDir tmp("seg_cancel");
    auto pc = io::FitsCube::create(tmp.path() / "pc.fits", 3, 8, 8, io::PixelType::UINT16);
    for (int t = 0; t < 3; ++t) pc.write(t, Matrix2Du16(Matrix2Du16::Constant(8, 8, 100)));
    auto out = io::FitsCube::create(tmp.path() / "seg.fits", 3, 8, 8, io::PixelType::UINT16);

    LogStdSegmenter segmenter(config::SegmentationConfig{});
    core::CancellationToken cancel;
    int calls = 0;
    const bool finished = segment_stack(segmenter, pc, out, cancel,
                                        [&](int, int, const std::string&) {
                                            if (++calls == 2) cancel.cancel();
                                        });
    REQUIRE_FALSE(finished);
    REQUIRE(calls == 2);
}

TEST_CASE("segmenter_registry_resolves_names") {
    config::ProcessingConfig cfg;
    REQUIRE(make_segmenter("logstd", cfg)->name() == "logstd");
    REQUIRE_THROWS_AS(make_segmenter("cellpose", cfg), ConfigError);

    register_segmenter("threshold_test", [](const config::ProcessingConfig& c) {
        return std::make_unique<LogStdSegmenter>(c.segmentation);
    });
    const auto names = list_segmenters();
    REQUIRE(std::find(names.begin(), names.end(), "threshold_test") != names.end());
}
