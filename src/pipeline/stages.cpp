#include "cellpipe/pipeline/stages.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/io/feature_table.hpp"
#include "cellpipe/io/fits_stack.hpp"
#include "cellpipe/processing/background.hpp"
#include "cellpipe/processing/copying.hpp"
#include "cellpipe/processing/cropping.hpp"

#include <utility>

namespace cellpipe::pipeline {

using io::ArtifactKind;

namespace {

void require(const fs::path& path, const std::string& what) {
    if (!fs::exists(path)) {
        throw MissingArtifactError(what + " not found: " + path.string());
    }
}

std::string channel_label(ChannelKind kind, int channel) {
    return channel_kind_prefix(kind) + "_ch_" + std::to_string(channel);
}

// Selected raw stacks, PC first then FL in config order.
std::vector<std::pair<ChannelKind, int>> selected_stacks(const config::ProcessingConfig& cfg) {
    std::vector<std::pair<ChannelKind, int>> out;
    if (cfg.channels.pc) {
        out.emplace_back(ChannelKind::PC, cfg.channels.pc->channel);
    }
    for (int c : cfg.channels.fl_channels()) {
        out.emplace_back(ChannelKind::FL, c);
    }
    return out;
}

} // namespace

// --- StageContext ---

StageContext::StageContext(io::MicroscopyMetadata metadata, config::ProcessingConfig config,
                           fs::path output_dir, io::FrameReader& reader,
                           core::EventEmitter& emitter)
    : metadata_(std::move(metadata)), config_(std::move(config)),
      output_dir_(std::move(output_dir)), reader_(&reader), emitter_(&emitter) {
    segmenter_ = processing::make_segmenter(config_.params.segmentation_method, config_);
    // Builds one tracker up front so bad tracker settings surface before any work.
    make_tracker();
    feature_configs_ = processing::build_channel_configs(config_);
}

std::unique_ptr<processing::Tracker> StageContext::make_tracker() const {
    return processing::make_tracker(config_.params.tracking_method, config_);
}

fs::path StageContext::artifact(int fov, ArtifactKind kind, int channel) const {
    return io::artifact_path(output_dir_, metadata_.base_name, fov, kind, channel);
}

// --- CopyStage ---

bool CopyStage::is_done(int fov) const {
    for (const auto& [kind, c] : selected_stacks(ctx_.config())) {
        const auto art = kind == ChannelKind::PC ? ArtifactKind::PC_FRAMES : ArtifactKind::FL_FRAMES;
        if (!fs::exists(ctx_.artifact(fov, art, c))) return false;
    }
    return true;
}

bool CopyStage::process(int fov, const core::CancellationToken& cancel,
                        const core::ProgressCallback& progress) const {
    fs::create_directories(io::fov_dir(ctx_.output_dir(), fov));
    for (const auto& [kind, c] : selected_stacks(ctx_.config())) {
        const auto art = kind == ChannelKind::PC ? ArtifactKind::PC_FRAMES : ArtifactKind::FL_FRAMES;
        const fs::path dst = ctx_.artifact(fov, art, c);
        if (fs::exists(dst)) {
            continue;
        }
        const std::string label = "Copying " + channel_label(kind, c);
        if (!processing::copy_channel(ctx_.reader(), fov, c, dst, cancel, progress, label)) {
            return false;
        }
    }
    return true;
}

// --- SegmentationStage ---

bool SegmentationStage::is_done(int fov) const {
    const auto& pc = ctx_.config().channels.pc;
    return pc && fs::exists(ctx_.artifact(fov, ArtifactKind::SEG_LABELED, pc->channel));
}

bool SegmentationStage::process(int fov, const core::CancellationToken& cancel,
                                const core::ProgressCallback& progress) const {
    const auto& pc = ctx_.config().channels.pc;
    if (!pc) {
        ctx_.emitter().info("No PC channel selected, segmentation skipped", {{"fov", fov}});
        return true;
    }

    const fs::path in_path = ctx_.artifact(fov, ArtifactKind::PC_FRAMES, pc->channel);
    require(in_path, "PC stack");
    const io::FitsCube in = io::FitsCube::open(in_path);

    const fs::path dst = ctx_.artifact(fov, ArtifactKind::SEG_LABELED, pc->channel);
    core::PartialFile part(dst, io::partial_path(dst));
    bool ok = false;
    {
        io::FitsCube out = io::FitsCube::create(part.path(), in.frames(), in.rows(), in.cols(),
                                                io::PixelType::UINT16);
        ok = processing::segment_stack(ctx_.segmenter(), in, out, cancel, progress);
        out.close();
    }
    if (!ok) {
        return false;
    }
    part.commit();
    return true;
}

// --- TrackingStage ---

bool TrackingStage::is_done(int fov) const {
    const auto& pc = ctx_.config().channels.pc;
    return pc && fs::exists(ctx_.artifact(fov, ArtifactKind::SEG_TRACKED, pc->channel));
}

bool TrackingStage::process(int fov, const core::CancellationToken& cancel,
                            const core::ProgressCallback& progress) const {
    const auto& pc = ctx_.config().channels.pc;
    if (!pc) {
        ctx_.emitter().info("No PC channel selected, tracking skipped", {{"fov", fov}});
        return true;
    }

    const fs::path in_path = ctx_.artifact(fov, ArtifactKind::SEG_LABELED, pc->channel);
    require(in_path, "Segmentation");
    const io::FitsCube in = io::FitsCube::open(in_path);

    const fs::path dst = ctx_.artifact(fov, ArtifactKind::SEG_TRACKED, pc->channel);
    core::PartialFile part(dst, io::partial_path(dst));
    auto tracker = ctx_.make_tracker();
    bool ok = false;
    {
        io::FitsCube out = io::FitsCube::create(part.path(), in.frames(), in.rows(), in.cols(),
                                                io::PixelType::UINT16);
        ok = tracker->track(in, out, cancel, progress);
        out.close();
    }
    if (!ok) {
        return false;
    }
    part.commit();
    return true;
}

// --- BackgroundStage ---

bool BackgroundStage::is_done(int fov) const {
    const auto& cfg = ctx_.config();
    if (!cfg.channels.pc || cfg.channels.fl.empty()) {
        return false;
    }
    for (int c : cfg.channels.fl_channels()) {
        if (!fs::exists(ctx_.artifact(fov, ArtifactKind::FL_BACKGROUND, c))) return false;
    }
    return true;
}

bool BackgroundStage::process(int fov, const core::CancellationToken& cancel,
                              const core::ProgressCallback& progress) const {
    const auto& cfg = ctx_.config();
    if (!cfg.channels.pc || cfg.channels.fl.empty()) {
        ctx_.emitter().info("Background estimation needs a PC and an FL channel, skipped",
                            {{"fov", fov}});
        return true;
    }

    const fs::path seg_path = ctx_.artifact(fov, ArtifactKind::SEG_LABELED, cfg.channels.pc->channel);
    require(seg_path, "Segmentation");
    const io::FitsCube seg = io::FitsCube::open(seg_path);

    for (int c : cfg.channels.fl_channels()) {
        const fs::path dst = ctx_.artifact(fov, ArtifactKind::FL_BACKGROUND, c);
        if (fs::exists(dst)) {
            continue;
        }
        const fs::path fl_path = ctx_.artifact(fov, ArtifactKind::FL_FRAMES, c);
        if (!fs::exists(fl_path)) {
            ctx_.emitter().warning("FL stack missing, background skipped",
                                   {{"fov", fov}, {"channel", c}, {"path", fl_path.string()}});
            continue;
        }
        const io::FitsCube fl = io::FitsCube::open(fl_path);

        core::PartialFile part(dst, io::partial_path(dst));
        bool ok = false;
        {
            io::FitsCube out = io::FitsCube::create(part.path(), fl.frames(), fl.rows(), fl.cols(),
                                                    io::PixelType::FLOAT32);
            ok = processing::estimate_background_stack(fl, seg, out, cfg.background, cancel,
                                                       progress);
            out.close();
        }
        if (!ok) {
            return false;
        }
        part.commit();
    }
    return true;
}

// --- CroppingStage ---

bool CroppingStage::is_done(int fov) const {
    return ctx_.config().channels.pc && fs::exists(ctx_.artifact(fov, ArtifactKind::CROPS));
}

bool CroppingStage::process(int fov, const core::CancellationToken& cancel,
                            const core::ProgressCallback& progress) const {
    const auto& cfg = ctx_.config();
    if (!cfg.channels.pc) {
        ctx_.emitter().info("No PC channel selected, cropping skipped", {{"fov", fov}});
        return true;
    }
    const int pc = cfg.channels.pc->channel;

    const fs::path tracked_path = ctx_.artifact(fov, ArtifactKind::SEG_TRACKED, pc);
    require(tracked_path, "Tracked segmentation");
    const io::FitsCube tracked = io::FitsCube::open(tracked_path);

    // Owns the cubes referenced by `sources`.
    std::vector<std::unique_ptr<io::FitsCube>> cubes;
    auto open_cube = [&cubes](const fs::path& p) {
        cubes.push_back(std::make_unique<io::FitsCube>(io::FitsCube::open(p)));
        return cubes.back().get();
    };

    std::vector<processing::CropSource> sources;
    const fs::path pc_path = ctx_.artifact(fov, ArtifactKind::PC_FRAMES, pc);
    require(pc_path, "PC stack");
    sources.push_back({channel_label(ChannelKind::PC, pc), open_cube(pc_path), nullptr});

    for (int c : cfg.channels.fl_channels()) {
        const fs::path fl_path = ctx_.artifact(fov, ArtifactKind::FL_FRAMES, c);
        if (!fs::exists(fl_path)) {
            ctx_.emitter().warning("FL stack missing, channel not cropped",
                                   {{"fov", fov}, {"channel", c}, {"path", fl_path.string()}});
            continue;
        }
        processing::CropSource src;
        src.name = channel_label(ChannelKind::FL, c);
        src.frames = open_cube(fl_path);
        const fs::path bg_path = ctx_.artifact(fov, ArtifactKind::FL_BACKGROUND, c);
        if (fs::exists(bg_path)) {
            src.background = open_cube(bg_path);
        }
        sources.push_back(src);
    }

    processing::CropParams params;
    params.padding = cfg.params.crop_padding;
    params.mask_margin = cfg.params.mask_margin;
    params.min_frames = cfg.params.min_frames;

    const fs::path dst = ctx_.artifact(fov, ArtifactKind::CROPS);
    core::PartialFile part(dst, io::partial_path(dst));
    if (!processing::crop_cells(tracked, sources, params, part.path(), cancel, progress)) {
        return false;
    }
    part.commit();
    return true;
}

// --- ExtractionStage ---

bool ExtractionStage::is_done(int fov) const {
    return ctx_.config().channels.pc && fs::exists(ctx_.artifact(fov, ArtifactKind::TRACES));
}

bool ExtractionStage::process(int fov, const core::CancellationToken& cancel,
                              const core::ProgressCallback& progress) const {
    if (!ctx_.config().channels.pc) {
        ctx_.emitter().info("No PC channel selected, extraction skipped", {{"fov", fov}});
        return true;
    }

    const fs::path crops_path = ctx_.artifact(fov, ArtifactKind::CROPS);
    require(crops_path, "Crop container");

    io::FeatureTable table;
    if (!processing::extract_traces(crops_path, ctx_.feature_configs(), fov,
                                    ctx_.metadata().timepoints, cancel, progress, table)) {
        return false;
    }

    const fs::path dst = ctx_.artifact(fov, ArtifactKind::TRACES);
    core::PartialFile part(dst, io::partial_path(dst));
    io::write_feature_table(part.path(), table);
    part.commit();
    return true;
}

std::vector<std::unique_ptr<PipelineStage>> make_fov_stages(const StageContext& ctx) {
    std::vector<std::unique_ptr<PipelineStage>> stages;
    stages.push_back(std::make_unique<SegmentationStage>(ctx));
    stages.push_back(std::make_unique<TrackingStage>(ctx));
    stages.push_back(std::make_unique<BackgroundStage>(ctx));
    stages.push_back(std::make_unique<CroppingStage>(ctx));
    stages.push_back(std::make_unique<ExtractionStage>(ctx));
    return stages;
}

} // namespace cellpipe::pipeline
