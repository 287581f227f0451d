#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/pipeline/workflow.hpp"

#include <filesystem>
#include <string>

namespace cellpipe::pipeline {

struct WorkerResult {
    bool success = false;
    std::string message;
};

// Owns the cancellation token of one workflow run. cancel() may be called
// from any thread, before, during or after run().
class WorkflowWorker {
public:
    WorkflowWorker(io::MicroscopyMetadata metadata, config::ProcessingConfig config,
                   fs::path output_dir, io::FrameReader& reader, WorkflowOptions options = {});

    WorkflowWorker(const WorkflowWorker&) = delete;
    WorkflowWorker& operator=(const WorkflowWorker&) = delete;

    // Never throws; errors become a failed result.
    WorkerResult run();
    void cancel() { cancel_.cancel(); }
    core::CancellationToken& cancellation_token() { return cancel_; }

private:
    io::MicroscopyMetadata metadata_;
    config::ProcessingConfig config_;
    fs::path output_dir_;
    io::FrameReader& reader_;
    WorkflowOptions options_;
    core::CancellationToken cancel_;
};

} // namespace cellpipe::pipeline
