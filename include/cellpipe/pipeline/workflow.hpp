#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/events.hpp"
#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/pipeline/fov_runner.hpp"

#include <filesystem>
#include <string>

namespace cellpipe::pipeline {

namespace fs = std::filesystem;

enum class WorkflowState { COMPLETED, CANCELLED, FAILED };

std::string workflow_state_to_string(WorkflowState state);

struct WorkflowResult {
    WorkflowState state = WorkflowState::COMPLETED;
    int total = 0;
    int completed = 0;
    int failed = 0;
    std::string message;

    bool success() const { return state == WorkflowState::COMPLETED; }
};

struct WorkflowOptions {
    core::EventEmitter* emitter = nullptr;  // null: events are discarded
    StageProgressSink progress;             // optional, called from workers
};

// Copies, then processes every selected FOV batch by batch. Configuration
// problems throw (ConfigError, ValidationError, TrackingError) before any
// file is written; everything later is reported through the result.
WorkflowResult run_workflow(const io::MicroscopyMetadata& metadata,
                            const config::ProcessingConfig& config, const fs::path& output_dir,
                            io::FrameReader& reader, const core::CancellationToken& cancel,
                            const WorkflowOptions& options);

// True when every selected FOV completed.
bool run_workflow(const io::MicroscopyMetadata& metadata, const config::ProcessingConfig& config,
                  const fs::path& output_dir, io::FrameReader& reader,
                  const core::CancellationToken& cancel);

} // namespace cellpipe::pipeline
