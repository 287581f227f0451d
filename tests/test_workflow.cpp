#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/events.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/io/naming.hpp"
#include "cellpipe/pipeline/stages.hpp"
#include "cellpipe/pipeline/worker.hpp"
#include "cellpipe/pipeline/workflow.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

using namespace cellpipe;
using namespace cellpipe::pipeline;

namespace {

constexpr int kFovs = 6;
constexpr int kFrames = 3;

std::vector<fs::path> all_files(const fs::path& root) {
    std::vector<fs::path> files;
    if (!fs::exists(root)) return files;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (e.is_regular_file()) files.push_back(e.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

struct Snapshot {
    fs::file_time_type mtime;
    std::string sha;
};

std::map<fs::path, Snapshot> snapshot(const fs::path& root) {
    std::map<fs::path, Snapshot> out;
    for (const auto& p : all_files(root)) {
        if (p.extension() == ".jsonl") continue;
        out[p] = {fs::last_write_time(p), core::sha256_file(p)};
    }
    return out;
}

std::vector<core::json> parse_events(const std::string& text) {
    std::vector<core::json> events;
    for (const auto& line : core::split(text, '\n')) {
        if (!line.empty()) events.push_back(core::json::parse(line));
    }
    return events;
}

size_t count_type(const std::vector<core::json>& events, const std::string& type) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(), [&](const core::json& e) {
        return e["type"] == type;
    }));
}

// Progress calls per (fov, stage); the sink runs on worker threads.
struct ProgressLog {
    std::mutex mutex;
    std::map<std::pair<int, Stage>, int> calls;

    StageProgressSink sink() {
        return [this](int fov, Stage stage, int, int, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            ++calls[{fov, stage}];
        };
    }
    int count(int fov, Stage stage) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = calls.find({fov, stage});
        return it == calls.end() ? 0 : it->second;
    }
};

fs::path traces_of(const fs::path& out, int fov) {
    return io::artifact_path(out, "synth", fov, io::ArtifactKind::TRACES);
}

} // namespace

TEST_CASE("six_fovs_in_batches_of_four_on_two_workers") {
    testing::TempDir tmp("wf_e2e");
    testing::SyntheticReader reader(kFovs, 2, kFrames);
    const auto cfg = testing::small_config(4, 2);

    std::ostringstream log;
    core::EventEmitter emitter("run_e2e", log);
    std::atomic<int> progress_calls{0};
    WorkflowOptions options;
    options.emitter = &emitter;
    options.progress = [&](int, Stage, int, int, const std::string&) { ++progress_calls; };

    core::CancellationToken cancel;
    const WorkflowResult result =
        run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel, options);

    REQUIRE(result.state == WorkflowState::COMPLETED);
    REQUIRE(result.success());
    REQUIRE(result.total == kFovs);
    REQUIRE(result.completed == kFovs);
    REQUIRE(result.failed == 0);
    REQUIRE(result.message == "Results saved to " + tmp.path().string());
    REQUIRE(progress_calls.load() > 0);

    REQUIRE(io::discover_fovs(tmp.path()) == std::vector<int>({0, 1, 2, 3, 4, 5}));
    REQUIRE(fs::exists(io::config_path(tmp.path())));
    for (int fov = 0; fov < kFovs; ++fov) {
        const auto art = io::discover_artifacts(tmp.path(), fov);
        REQUIRE(art.pc_frames.count(0) == 1);
        REQUIRE(art.fl_frames.count(1) == 1);
        REQUIRE(art.seg_labeled.count(0) == 1);
        REQUIRE(art.seg_tracked.count(0) == 1);
        REQUIRE(art.fl_background.count(1) == 1);
        REQUIRE(art.crops.has_value());
        REQUIRE(art.traces.has_value());
    }
    for (const auto& p : all_files(tmp.path())) {
        REQUIRE(p.extension() != ".partial");
    }

    // Both discs are tracked through every frame.
    const auto lines = core::split(core::read_text(traces_of(tmp.path(), 0)), '\n');
    REQUIRE(core::ends_with(lines[0], ",area_ch_0,intensity_total_ch_1"));
    std::set<std::string> cells;
    int rows = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) continue;
        const auto fields = core::split(lines[i], ',');
        REQUIRE(fields[0] == "0");
        cells.insert(fields[1]);
        ++rows;
    }
    REQUIRE(cells.size() == 2);
    REQUIRE(rows == 2 * kFrames);

    const auto events = parse_events(log.str());
    REQUIRE(count_type(events, "run_start") == 1);
    REQUIRE(count_type(events, "run_end") == 1);
    REQUIRE(count_type(events, "batch_start") == 2);
    REQUIRE(count_type(events, "batch_end") == 2);
    REQUIRE(count_type(events, "fov_end") == kFovs);
    for (const auto& e : events) {
        if (e["type"] == "fov_end") {
            REQUIRE(e["status"] == "completed");
            REQUIRE(e["stages_completed"] == 6);
        }
    }
    REQUIRE(events.back()["type"] == "run_end");
    REQUIRE(events.back()["success"] == true);
}

TEST_CASE("second_run_skips_everything_and_changes_nothing") {
    testing::TempDir tmp("wf_idem");
    testing::SyntheticReader reader(3, 2, kFrames);
    const auto cfg = testing::small_config(2, 2);
    core::CancellationToken cancel;

    REQUIRE(run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel));
    const auto before = snapshot(tmp.path());
    REQUIRE_FALSE(before.empty());
    const int reads_after_first = reader.reads.load();

    std::ostringstream log;
    core::EventEmitter emitter("run_again", log);
    std::atomic<int> progress_calls{0};
    WorkflowOptions options;
    options.emitter = &emitter;
    options.progress = [&](int, Stage, int, int, const std::string&) { ++progress_calls; };
    const auto result = run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel, options);

    REQUIRE(result.success());
    REQUIRE(progress_calls.load() == 0);
    REQUIRE(reader.reads.load() == reads_after_first);

    const auto after = snapshot(tmp.path());
    REQUIRE(after.size() == before.size());
    for (const auto& [path, snap] : before) {
        REQUIRE(after.count(path) == 1);
        REQUIRE(after.at(path).mtime == snap.mtime);
        REQUIRE(after.at(path).sha == snap.sha);
    }

    const auto events = parse_events(log.str());
    REQUIRE(count_type(events, "stage_start") == 0);
    REQUIRE(count_type(events, "stage_skipped") == 3 * 6);
}

TEST_CASE("existing_segmentation_is_reused_while_later_stages_rerun") {
    testing::TempDir tmp("wf_resume_seg");
    const fs::path out = tmp.path();
    testing::SyntheticReader reader(2, 2, kFrames);
    const auto cfg = testing::small_config(2, 2);
    core::CancellationToken cancel;
    REQUIRE(run_workflow(reader.metadata(), cfg, out, reader, cancel));

    // fov 1 keeps only its copied stacks and its labelled segmentation
    const fs::path seg = io::artifact_path(out, "synth", 1, io::ArtifactKind::SEG_LABELED, 0);
    const auto seg_mtime = fs::last_write_time(seg);
    const std::string seg_sha = core::sha256_file(seg);
    fs::remove(io::artifact_path(out, "synth", 1, io::ArtifactKind::SEG_TRACKED, 0));
    fs::remove(io::artifact_path(out, "synth", 1, io::ArtifactKind::FL_BACKGROUND, 1));
    fs::remove(io::artifact_path(out, "synth", 1, io::ArtifactKind::CROPS));
    fs::remove(traces_of(out, 1));

    std::ostringstream log;
    core::EventEmitter emitter("run_resume", log);
    ProgressLog progress;
    WorkflowOptions options;
    options.emitter = &emitter;
    options.progress = progress.sink();
    const auto result = run_workflow(reader.metadata(), cfg, out, reader, cancel, options);
    REQUIRE(result.success());

    REQUIRE(progress.count(1, Stage::COPY) == 0);
    REQUIRE(progress.count(1, Stage::SEGMENTATION) == 0);
    REQUIRE(progress.count(1, Stage::TRACKING) == kFrames);
    REQUIRE(progress.count(1, Stage::BACKGROUND) == kFrames);
    REQUIRE(progress.count(1, Stage::CROPPING) == 3);
    REQUIRE(progress.count(1, Stage::EXTRACTION) > 0);
    for (const auto& [key, n] : progress.calls) {
        REQUIRE(key.first == 1);
    }

    REQUIRE(fs::last_write_time(seg) == seg_mtime);
    REQUIRE(core::sha256_file(seg) == seg_sha);
    const auto art = io::discover_artifacts(out, 1);
    REQUIRE(art.seg_tracked.count(0) == 1);
    REQUIRE(art.fl_background.count(1) == 1);
    REQUIRE(art.crops.has_value());
    REQUIRE(art.traces.has_value());

    bool seg_skipped = false;
    for (const auto& e : parse_events(log.str())) {
        if (e["type"] == "stage_skipped" && e["fov"] == 1 &&
            e["stage_name"] == stage_to_string(Stage::SEGMENTATION)) {
            seg_skipped = true;
        }
        if (e["type"] == "stage_start") {
            REQUIRE(e["fov"] == 1);
            REQUIRE(e["stage_name"] != stage_to_string(Stage::SEGMENTATION));
        }
    }
    REQUIRE(seg_skipped);
}

TEST_CASE("background_is_resumed_per_fluorescence_channel") {
    testing::TempDir tmp("wf_resume_bg");
    const fs::path out = tmp.path();
    testing::SyntheticReader reader(1, 3, kFrames);
    auto cfg = testing::small_config(1, 1);
    config::ChannelSelection fl2;
    fl2.channel = 2;
    fl2.features = {"intensity_total"};
    cfg.channels.fl.push_back(fl2);
    core::CancellationToken cancel;
    REQUIRE(run_workflow(reader.metadata(), cfg, out, reader, cancel));

    const fs::path bg1 = io::artifact_path(out, "synth", 0, io::ArtifactKind::FL_BACKGROUND, 1);
    const fs::path bg2 = io::artifact_path(out, "synth", 0, io::ArtifactKind::FL_BACKGROUND, 2);
    REQUIRE(fs::exists(bg2));
    const auto bg1_mtime = fs::last_write_time(bg1);
    const std::string bg1_sha = core::sha256_file(bg1);
    fs::remove(bg2);
    fs::remove(io::artifact_path(out, "synth", 0, io::ArtifactKind::CROPS));
    fs::remove(traces_of(out, 0));

    std::ostringstream sink;
    core::EventEmitter emitter("run_bg", sink);
    StageContext ctx(reader.metadata(), cfg, out, reader, emitter);
    const SegmentationStage segmentation(ctx);
    const BackgroundStage background(ctx);
    REQUIRE(segmentation.is_done(0));
    REQUIRE_FALSE(background.is_done(0));

    ProgressLog progress;
    WorkflowOptions options;
    options.progress = progress.sink();
    REQUIRE(run_workflow(reader.metadata(), cfg, out, reader, cancel, options).success());

    // one channel's worth of frames, not two
    REQUIRE(progress.count(0, Stage::BACKGROUND) == kFrames);
    REQUIRE(progress.count(0, Stage::SEGMENTATION) == 0);
    REQUIRE(progress.count(0, Stage::TRACKING) == 0);
    REQUIRE(fs::exists(bg2));
    REQUIRE(fs::last_write_time(bg1) == bg1_mtime);
    REQUIRE(core::sha256_file(bg1) == bg1_sha);
    REQUIRE(background.is_done(0));

    const auto header = core::split(core::read_text(traces_of(out, 0)), '\n').front();
    REQUIRE(core::ends_with(header, ",intensity_total_ch_1,intensity_total_ch_2"));
}

TEST_CASE("stages_without_a_pc_channel_are_never_done") {
    testing::TempDir tmp("wf_is_done");
    testing::SyntheticReader reader(1, 2, kFrames);
    auto cfg = testing::small_config(1, 1);
    cfg.channels.pc.reset();

    std::ostringstream sink;
    core::EventEmitter emitter("run_is_done", sink);
    StageContext ctx(reader.metadata(), cfg, tmp.path(), reader, emitter);
    REQUIRE_FALSE(SegmentationStage(ctx).is_done(0));
    REQUIRE_FALSE(TrackingStage(ctx).is_done(0));
    REQUIRE_FALSE(BackgroundStage(ctx).is_done(0));
    REQUIRE_FALSE(CroppingStage(ctx).is_done(0));
    REQUIRE_FALSE(ExtractionStage(ctx).is_done(0));
    REQUIRE_FALSE(CopyStage(ctx).is_done(0));
}

TEST_CASE("cancel_before_run_writes_nothing") {
    testing::TempDir tmp("wf_cancel_early");
    const fs::path out = tmp.path() / "out";
    testing::SyntheticReader reader(2, 2, kFrames);

    WorkflowWorker worker(reader.metadata(), testing::small_config(2, 2), out, reader);
    worker.cancel();
    worker.cancel();
    const WorkerResult result = worker.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "Workflow cancelled");
    REQUIRE(all_files(out).empty());
    REQUIRE(reader.reads.load() == 0);
}

TEST_CASE("cancel_during_cropping_leaves_no_partial_files") {
    testing::TempDir tmp("wf_cancel_mid");
    testing::SyntheticReader reader(4, 2, kFrames);
    const auto cfg = testing::small_config(4, 1);

    core::CancellationToken cancel;
    std::atomic<int> cancelled_fov{-1};
    WorkflowOptions options;
    options.progress = [&](int fov, Stage stage, int current, int, const std::string&) {
        if (stage == Stage::CROPPING && current == 1 && cancelled_fov.load() < 0) {
            cancelled_fov = fov;
            cancel.cancel();
        }
    };

    const auto result = run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel, options);
    REQUIRE(result.state == WorkflowState::CANCELLED);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.message == "Workflow cancelled");
    REQUIRE(result.completed < result.total);

    REQUIRE(cancelled_fov.load() >= 0);
    REQUIRE_FALSE(fs::exists(
        io::artifact_path(tmp.path(), "synth", cancelled_fov.load(), io::ArtifactKind::CROPS)));
    for (const auto& p : all_files(tmp.path())) {
        REQUIRE(p.extension() != ".partial");
    }
    // Work had started, so the configuration is kept for the resumed run.
    REQUIRE(fs::exists(io::config_path(tmp.path())));

    // Resuming finishes the remaining work.
    core::CancellationToken fresh;
    REQUIRE(run_workflow(reader.metadata(), cfg, tmp.path(), reader, fresh));
    for (int fov = 0; fov < 4; ++fov) REQUIRE(fs::exists(traces_of(tmp.path(), fov)));
}

TEST_CASE("a_corrupt_pc_stack_fails_only_its_fov") {
    testing::TempDir tmp("wf_corrupt");
    testing::SyntheticReader reader(kFovs, 2, kFrames);
    const auto cfg = testing::small_config(4, 2);

    const fs::path bad = io::artifact_path(tmp.path(), "synth", 2, io::ArtifactKind::PC_FRAMES, 0);
    fs::create_directories(bad.parent_path());
    core::write_text(bad, "not a fits file");

    std::ostringstream log;
    core::EventEmitter emitter("run_corrupt", log);
    WorkflowOptions options;
    options.emitter = &emitter;
    core::CancellationToken cancel;
    const auto result = run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel, options);

    REQUIRE(result.state == WorkflowState::FAILED);
    REQUIRE(result.failed == 1);
    REQUIRE(result.completed == kFovs - 1);
    REQUIRE(result.message == "Workflow reported failure: 1 of 6 FOVs failed");
    REQUIRE_FALSE(fs::exists(traces_of(tmp.path(), 2)));
    for (int fov : {0, 1, 3, 4, 5}) REQUIRE(fs::exists(traces_of(tmp.path(), fov)));

    bool saw_failure = false;
    for (const auto& e : parse_events(log.str())) {
        if (e["type"] == "fov_end" && e["fov"] == 2) {
            REQUIRE(e["status"] == "failed");
            REQUIRE(e["error"].get<std::string>().find("FITS error") != std::string::npos);
            saw_failure = true;
        }
    }
    REQUIRE(saw_failure);
    REQUIRE(fs::exists(io::config_path(tmp.path())));
}

TEST_CASE("a_failing_copy_fails_only_its_fov") {
    testing::TempDir tmp("wf_copy_fail");
    testing::SyntheticReader reader(3, 2, kFrames);
    reader.failing_fovs.insert(1);

    WorkflowWorker worker(reader.metadata(), testing::small_config(3, 2), tmp.path(), reader);
    const WorkerResult result = worker.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "Workflow reported failure: 1 of 3 FOVs failed");
    REQUIRE(fs::exists(traces_of(tmp.path(), 0)));
    REQUIRE(fs::exists(traces_of(tmp.path(), 2)));
    REQUIRE_FALSE(fs::exists(traces_of(tmp.path(), 1)));
    REQUIRE_FALSE(fs::exists(io::partial_path(
        io::artifact_path(tmp.path(), "synth", 1, io::ArtifactKind::PC_FRAMES, 0))));
}

TEST_CASE("configuration_errors_are_raised_before_any_work") {
    testing::TempDir tmp("wf_config");
    const fs::path out = tmp.path() / "out";
    testing::SyntheticReader reader(3, 2, kFrames);
    core::CancellationToken cancel;

    auto cfg = testing::small_config(2, 2);
    cfg.params.fovs = "1, 5-6";
    try {
        run_workflow(reader.metadata(), cfg, out, reader, cancel);
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE(std::string(e.what()).find("Invalid FOV indices: 5, 6") != std::string::npos);
    }

    cfg = testing::small_config(2, 2);
    cfg.channels.fl[0].channel = 4;
    REQUIRE_THROWS_AS(run_workflow(reader.metadata(), cfg, out, reader, cancel), ConfigError);

    cfg = testing::small_config(2, 2);
    cfg.params.segmentation_method = "unet";
    REQUIRE_THROWS_AS(run_workflow(reader.metadata(), cfg, out, reader, cancel), ConfigError);

    cfg = testing::small_config(2, 2);
    cfg.params.tracking_method = "kalman";
    cfg.tracking.kalman.process_noise = -1.0f;
    REQUIRE_THROWS_AS(run_workflow(reader.metadata(), cfg, out, reader, cancel), TrackingError);

    cfg = testing::small_config(0, 2);
    REQUIRE_THROWS_AS(run_workflow(reader.metadata(), cfg, out, reader, cancel), ValidationError);

    REQUIRE(all_files(out).empty());
    REQUIRE(reader.reads.load() == 0);
}

TEST_CASE("worker_reports_configuration_errors_as_messages") {
    testing::TempDir tmp("wf_worker_err");
    testing::SyntheticReader reader(2, 2, kFrames);
    auto cfg = testing::small_config(2, 2);
    cfg.params.fovs = "0;1";

    WorkflowWorker worker(reader.metadata(), cfg, tmp.path(), reader);
    const WorkerResult result = worker.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(core::starts_with(result.message, "Workflow error: Config error: "));
    REQUIRE_FALSE(fs::exists(io::config_path(tmp.path())));
}

TEST_CASE("existing_config_file_is_never_overwritten") {
    testing::TempDir tmp("wf_keep_config");
    testing::SyntheticReader reader(1, 2, kFrames);
    core::write_text(io::config_path(tmp.path()), "# kept\n");

    core::CancellationToken cancel;
    REQUIRE(run_workflow(reader.metadata(), testing::small_config(1, 1), tmp.path(), reader,
                         cancel));
    REQUIRE(core::read_text(io::config_path(tmp.path())) == "# kept\n");
}

TEST_CASE("without_a_pc_channel_only_frames_are_copied") {
    testing::TempDir tmp("wf_fl_only");
    testing::SyntheticReader reader(2, 2, kFrames);
    auto cfg = testing::small_config(2, 2);
    cfg.channels.pc.reset();

    core::CancellationToken cancel;
    const auto result = run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel,
                                     WorkflowOptions{});
    REQUIRE(result.success());
    for (int fov = 0; fov < 2; ++fov) {
        const auto art = io::discover_artifacts(tmp.path(), fov);
        REQUIRE(art.fl_frames.count(1) == 1);
        REQUIRE(art.pc_frames.empty());
        REQUIRE(art.seg_labeled.empty());
        REQUIRE_FALSE(art.crops.has_value());
        REQUIRE_FALSE(art.traces.has_value());
    }
}

TEST_CASE("kalman_tracking_runs_end_to_end") {
    testing::TempDir tmp("wf_kalman");
    testing::SyntheticReader reader(1, 2, kFrames);
    auto cfg = testing::small_config(1, 1);
    cfg.params.tracking_method = "kalman";
    cfg.channels.fl[0].features = {"intensity_total", "particle_num"};

    core::CancellationToken cancel;
    REQUIRE(run_workflow(reader.metadata(), cfg, tmp.path(), reader, cancel));
    const auto header = core::split(core::read_text(traces_of(tmp.path(), 0)), '\n')[0];
    REQUIRE(core::ends_with(header, ",area_ch_0,intensity_total_ch_1,particle_num_ch_1"));
}
