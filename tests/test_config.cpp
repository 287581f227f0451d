#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <yaml-cpp/yaml.h>

namespace config = cellpipe::config;

TEST_CASE("parse_fov_range_sorts_and_deduplicates") {
    REQUIRE(config::parse_fov_range("0-2, 5", 10) == std::vector<int>({0, 1, 2, 5}));
    REQUIRE(config::parse_fov_range(" 7 ,3-4,3", 10) == std::vector<int>({3, 4, 7}));
    REQUIRE(config::parse_fov_range("", 10).empty());
}

TEST_CASE("parse_fov_range_rejects_malformed_selections") {
    REQUIRE_THROWS_AS(config::parse_fov_spans("1;2"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("1,,2"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("-1"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("5-3"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("a-b"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("+3"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_range("1;2", 10), cellpipe::ConfigError);
}

TEST_CASE("fov_indices_beyond_int_range_are_config_errors") {
    REQUIRE_THROWS_AS(config::parse_fov_spans("99999999999"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_spans("0-99999999999"), cellpipe::ConfigError);
    REQUIRE_THROWS_AS(config::parse_fov_range("99999999999", 4), cellpipe::ConfigError);

    config::ProcessingConfig cfg;
    cfg.params.fovs = "99999999999";
    REQUIRE_THROWS_AS(cfg.validate(), cellpipe::ConfigError);
}

TEST_CASE("huge_fov_ranges_are_rejected_before_expansion") {
    const auto spans = config::parse_fov_spans("2147483646-2147483647");
    REQUIRE(spans.size() == 1);
    REQUIRE(spans[0].first == 2147483646);
    REQUIRE(spans[0].last == 2147483647);

    config::ProcessingConfig cfg;
    cfg.params.fovs = "2147483646-2147483647";
    REQUIRE_NOTHROW(cfg.validate());
    try {
        config::resolve_fovs(cfg, 4);
        FAIL("expected ConfigError");
    } catch (const cellpipe::ConfigError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("Invalid FOV indices: 2147483646, 2147483647") != std::string::npos);
    }

    cfg.params.fovs = "0-2000000000";
    try {
        config::resolve_fovs(cfg, 4);
        FAIL("expected ConfigError");
    } catch (const cellpipe::ConfigError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("Invalid FOV indices: 4, 5, 6, 7, 8, 9, 10, 11, ...") !=
                std::string::npos);
    }
}

TEST_CASE("resolve_fovs_expands_all_and_checks_bounds") {
    config::ProcessingConfig cfg;
    cfg.params.fovs = "all";
    REQUIRE(config::resolve_fovs(cfg, 3) == std::vector<int>({0, 1, 2}));
    cfg.params.fovs = "";
    REQUIRE(config::resolve_fovs(cfg, 2) == std::vector<int>({0, 1}));

    cfg.params.fovs = "1, 4-5";
    try {
        config::resolve_fovs(cfg, 5);
        FAIL("expected ConfigError");
    } catch (const cellpipe::ConfigError& e) {
        const std::string msg = e.what();
        REQUIRE(msg.find("Invalid FOV indices") != std::string::npos);
        REQUIRE(msg.find("5") != std::string::npos);
    }
}

TEST_CASE("from_yaml_reads_channels_and_keeps_defaults") {
    YAML::Node node = YAML::Load(R"(
channels:
  pc: {channel: 0, features: [area]}
  fl:
    - {channel: 2, features: [intensity_total, particle_num]}
    - {channel: 1, features: [intensity_total], use_bbox_as_mask: false}
params:
  fovs: "0-3"
  n_workers: 4
tracking:
  kalman: {max_lost_frames: 5}
)");
    auto cfg = config::ProcessingConfig::from_yaml(node);

    REQUIRE(cfg.channels.pc.has_value());
    REQUIRE(cfg.channels.pc->channel == 0);
    REQUIRE_FALSE(cfg.channels.pc->use_bbox_as_mask);
    REQUIRE(cfg.channels.fl.size() == 2);
    REQUIRE(cfg.channels.fl[0].use_bbox_as_mask);
    REQUIRE_FALSE(cfg.channels.fl[1].use_bbox_as_mask);
    REQUIRE(cfg.channels.fl_channels() == std::vector<int>({2, 1}));

    REQUIRE(cfg.params.fovs == "0-3");
    REQUIRE(cfg.params.n_workers == 4);
    REQUIRE(cfg.params.batch_size == 2);
    REQUIRE(cfg.params.segmentation_method == "logstd");
    REQUIRE(cfg.params.tracking_method == "iou");
    REQUIRE(cfg.tracking.kalman.max_lost_frames == 5);
    REQUIRE(cfg.tracking.kalman.max_search_radius == Catch::Approx(25.0f));
    REQUIRE(cfg.background.tile_size == 64);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("from_yaml_turns_type_errors_into_config_errors") {
    YAML::Node node = YAML::Load("params: {batch_size: [1, 2]}");
    REQUIRE_THROWS_AS(config::ProcessingConfig::from_yaml(node), cellpipe::ConfigError);
}

TEST_CASE("validate_reports_offending_keys") {
    auto cfg = cellpipe::testing::small_config(2, 2);
    REQUIRE_NOTHROW(cfg.validate());

    auto bad = cfg;
    bad.params.batch_size = 0;
    REQUIRE_THROWS_AS(bad.validate(), cellpipe::ValidationError);

    bad = cfg;
    bad.params.background_weight = 1.5f;
    REQUIRE_THROWS_AS(bad.validate(), cellpipe::ValidationError);

    bad = cfg;
    bad.channels.pc.reset();
    bad.channels.fl.clear();
    REQUIRE_THROWS_AS(bad.validate(), cellpipe::ValidationError);

    bad = cfg;
    bad.channels.fl.push_back(bad.channels.fl.front());
    REQUIRE_THROWS_AS(bad.validate(), cellpipe::ValidationError);
}

TEST_CASE("save_then_load_preserves_the_document") {
    cellpipe::testing::TempDir tmp("config");
    auto cfg = cellpipe::testing::small_config(3, 1);
    cfg.params.fovs = "0-1";
    cfg.params.mask_margin = -2;
    cfg.tracking.iou.min_iou = 0.25f;

    const auto path = tmp.path() / "processing_config.yaml";
    cfg.save(path);
    auto loaded = config::ProcessingConfig::load(path);

    REQUIRE(loaded.params.fovs == "0-1");
    REQUIRE(loaded.params.batch_size == 3);
    REQUIRE(loaded.params.mask_margin == -2);
    REQUIRE(loaded.tracking.iou.min_iou == Catch::Approx(0.25f));
    REQUIRE(loaded.channels.pc->features == std::vector<std::string>({"area"}));
    REQUIRE_FALSE(loaded.channels.pc->use_bbox_as_mask);
    REQUIRE(loaded.channels.fl.size() == 1);
    REQUIRE(loaded.channels.fl[0].features == std::vector<std::string>({"intensity_total"}));
}

TEST_CASE("load_missing_file_is_a_config_error") {
    REQUIRE_THROWS_AS(config::ProcessingConfig::load("/nonexistent/cellpipe.yaml"),
                      cellpipe::ConfigError);
}
