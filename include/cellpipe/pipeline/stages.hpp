#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/events.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/io/naming.hpp"
#include "cellpipe/processing/extraction.hpp"
#include "cellpipe/processing/segmentation.hpp"
#include "cellpipe/processing/tracking.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cellpipe::pipeline {

namespace fs = std::filesystem;

// Everything a stage needs for one run. Plugin names are resolved on
// construction: unknown segmentation, tracking or feature names throw
// ConfigError, malformed tracker settings throw TrackingError.
class StageContext {
public:
    StageContext(io::MicroscopyMetadata metadata, config::ProcessingConfig config,
                 fs::path output_dir, io::FrameReader& reader, core::EventEmitter& emitter);

    const io::MicroscopyMetadata& metadata() const { return metadata_; }
    const config::ProcessingConfig& config() const { return config_; }
    const fs::path& output_dir() const { return output_dir_; }
    io::FrameReader& reader() const { return *reader_; }
    core::EventEmitter& emitter() const { return *emitter_; }

    const processing::Segmenter& segmenter() const { return *segmenter_; }
    // Trackers keep per-stack state, so each FOV gets a fresh one.
    std::unique_ptr<processing::Tracker> make_tracker() const;
    const std::vector<processing::ChannelFeatureConfig>& feature_configs() const {
        return feature_configs_;
    }

    fs::path artifact(int fov, io::ArtifactKind kind, int channel = 0) const;

private:
    io::MicroscopyMetadata metadata_;
    config::ProcessingConfig config_;
    fs::path output_dir_;
    io::FrameReader* reader_;
    core::EventEmitter* emitter_;
    std::unique_ptr<processing::Segmenter> segmenter_;
    std::vector<processing::ChannelFeatureConfig> feature_configs_;
};

// One step of the per-FOV chain. `is_done` is the skip predicate: when it
// holds the runner never calls `process`. `process` returns false if it
// stopped on cancellation and throws on failure.
class PipelineStage {
public:
    explicit PipelineStage(const StageContext& ctx) : ctx_(ctx) {}
    virtual ~PipelineStage() = default;

    PipelineStage(const PipelineStage&) = delete;
    PipelineStage& operator=(const PipelineStage&) = delete;

    virtual Stage stage() const = 0;
    std::string name() const { return stage_to_string(stage()); }

    virtual bool is_done(int fov) const = 0;
    virtual bool process(int fov, const core::CancellationToken& cancel,
                         const core::ProgressCallback& progress) const = 0;

protected:
    const StageContext& ctx_;
};

// Raw PC and FL stacks from the frame reader.
class CopyStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::COPY; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

class SegmentationStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::SEGMENTATION; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

class TrackingStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::TRACKING; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

class BackgroundStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::BACKGROUND; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

class CroppingStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::CROPPING; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

class ExtractionStage : public PipelineStage {
public:
    using PipelineStage::PipelineStage;
    Stage stage() const override { return Stage::EXTRACTION; }
    bool is_done(int fov) const override;
    bool process(int fov, const core::CancellationToken& cancel,
                 const core::ProgressCallback& progress) const override;
};

// Segmentation, tracking, background, cropping, extraction.
std::vector<std::unique_ptr<PipelineStage>> make_fov_stages(const StageContext& ctx);

} // namespace cellpipe::pipeline
