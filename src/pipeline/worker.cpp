#include "cellpipe/pipeline/worker.hpp"

#include <exception>
#include <utility>

namespace cellpipe::pipeline {

WorkflowWorker::WorkflowWorker(io::MicroscopyMetadata metadata, config::ProcessingConfig config,
                               fs::path output_dir, io::FrameReader& reader,
                               WorkflowOptions options)
    : metadata_(std::move(metadata)), config_(std::move(config)),
      output_dir_(std::move(output_dir)), reader_(reader), options_(std::move(options)) {}

WorkerResult WorkflowWorker::run() {
    try {
        const WorkflowResult r =
            run_workflow(metadata_, config_, output_dir_, reader_, cancel_, options_);
        return {r.success(), r.message};
    } catch (const std::exception& e) {
        if (options_.emitter) {
            options_.emitter->error(std::string("Workflow error: ") + e.what());
        }
        return {false, std::string("Workflow error: ") + e.what()};
    }
}

} // namespace cellpipe::pipeline
