#include "cellpipe/core/errors.hpp"
#include "cellpipe/processing/features.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>

using namespace cellpipe;
using namespace cellpipe::processing;

namespace {

void add_spot(Matrix2Df& image, double cy, double cx, double amplitude, double sigma) {
    for (int y = 0; y < image.rows(); ++y) {
        for (int x = 0; x < image.cols(); ++x) {
            const double r2 = (y - cy) * (y - cy) + (x - cx) * (x - cx);
            image(y, x) += static_cast<float>(amplitude * std::exp(-r2 / (2.0 * sigma * sigma)));
        }
    }
}

} // namespace

TEST_CASE("intensity_total_sums_inside_the_mask") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Constant(4, 5, 10.0f);
    ctx.mask = MaskFrame::Zero(4, 5);
    ctx.mask.block(1, 1, 2, 3).setOnes();
    REQUIRE(feature_intensity_total(ctx) == Catch::Approx(60.0));

    Matrix2Df bg = Matrix2Df::Constant(4, 5, 4.0f);
    ctx.background = &bg;
    ctx.background_weight = 0.5f;
    REQUIRE(feature_intensity_total(ctx) == Catch::Approx(48.0));

    ctx.background_weight = 0.0f;
    REQUIRE(feature_intensity_total(ctx) == Catch::Approx(60.0));
}

TEST_CASE("features_reject_mismatched_masks") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(4, 4);
    ctx.mask = MaskFrame::Ones(3, 4);
    REQUIRE_THROWS_AS(feature_intensity_total(ctx), ValidationError);
    REQUIRE_THROWS_AS(feature_area(ctx), ValidationError);
}

TEST_CASE("area_counts_mask_pixels") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(6, 6);
    ctx.mask = MaskFrame::Zero(6, 6);
    ctx.mask.block(0, 0, 3, 4).setOnes();
    REQUIRE(feature_area(ctx) == Catch::Approx(12.0));
}

TEST_CASE("aspect_ratio_of_a_rectangle") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(20, 20);
    ctx.mask = MaskFrame::Zero(20, 20);
    ctx.mask.block(8, 2, 4, 16).setOnes();
    // Uniform variances (n^2 - 1) / 12 along each axis.
    REQUIRE(feature_aspect_ratio(ctx) == Catch::Approx(std::sqrt(21.25 / 1.25)));

    ctx.mask.setZero();
    ctx.mask.block(5, 5, 6, 6).setOnes();
    REQUIRE(feature_aspect_ratio(ctx) == Catch::Approx(1.0));
}

TEST_CASE("aspect_ratio_is_nan_when_degenerate") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(10, 10);
    ctx.mask = MaskFrame::Zero(10, 10);
    REQUIRE(std::isnan(feature_aspect_ratio(ctx)));

    ctx.mask.row(4).setOnes();
    REQUIRE(std::isnan(feature_aspect_ratio(ctx)));
}

TEST_CASE("threshold_li_splits_two_levels") {
    std::vector<float> values(50, 10.0f);
    values.insert(values.end(), 50, 200.0f);
    const float t = threshold_li(values);
    REQUIRE(t > 10.0f);
    REQUIRE(t < 200.0f);

    REQUIRE(threshold_li({7.0f, 7.0f, 7.0f}) == Catch::Approx(7.0f));
    REQUIRE(std::isnan(threshold_li({})));
}

TEST_CASE("li_voting_mask_marks_bright_regions") {
    Matrix2Df image = Matrix2Df::Constant(40, 40, 5.0f);
    image.block(10, 10, 8, 8).setConstant(300.0f);
    MaskFrame mask = li_voting_mask(image, 20, 5);
    REQUIRE(mask(13, 13) == 1);
    REQUIRE(mask(30, 30) == 0);
    REQUIRE_THROWS_AS(li_voting_mask(image, 20, 0), ValidationError);
}

TEST_CASE("particle_num_counts_separated_spots") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(100, 100);
    add_spot(ctx.image, 25.0, 25.0, 500.0, 3.0);
    add_spot(ctx.image, 75.0, 75.0, 500.0, 3.0);
    ctx.mask = MaskFrame::Ones(100, 100);
    REQUIRE(feature_particle_num(ctx) == Catch::Approx(2.0));

    // Restricting the mask to one spot leaves one particle.
    ctx.mask.setZero();
    ctx.mask.block(0, 0, 50, 50).setOnes();
    REQUIRE(feature_particle_num(ctx) == Catch::Approx(1.0));
}

TEST_CASE("particle_num_ignores_dim_spots") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Zero(100, 100);
    add_spot(ctx.image, 25.0, 25.0, 500.0, 3.0);
    add_spot(ctx.image, 75.0, 75.0, 20.0, 3.0);
    ctx.mask = MaskFrame::Ones(100, 100);
    REQUIRE(feature_particle_num(ctx) == Catch::Approx(1.0));
}

TEST_CASE("particle_num_on_flat_or_empty_crops_is_zero") {
    FeatureContext ctx;
    ctx.image = Matrix2Df::Constant(3, 3, 100.0f);
    ctx.mask = MaskFrame::Ones(3, 3);
    REQUIRE(feature_particle_num(ctx) == Catch::Approx(0.0));

    ctx.mask.setZero();
    REQUIRE(feature_particle_num(ctx) == Catch::Approx(0.0));
}

TEST_CASE("feature_registry_resolves_names") {
    const auto names = list_features();
    for (const char* n : {"intensity_total", "particle_num", "area", "aspect_ratio"}) {
        REQUIRE(std::find(names.begin(), names.end(), n) != names.end());
    }
    REQUIRE_THROWS_AS(get_feature("texture"), ConfigError);

    register_feature("max_value", [](const FeatureContext& ctx) {
        return static_cast<double>(ctx.image.maxCoeff());
    });
    FeatureContext ctx;
    ctx.image = Matrix2Df::Constant(2, 2, 3.0f);
    ctx.mask = MaskFrame::Ones(2, 2);
    REQUIRE(get_feature("max_value")(ctx) == Catch::Approx(3.0));
}
