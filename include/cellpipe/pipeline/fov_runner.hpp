#pragma once

#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/events.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/pipeline/stages.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cellpipe::pipeline {

enum class FovStatus { COMPLETED, CANCELLED, FAILED };

std::string fov_status_to_string(FovStatus status);

struct FovOutcome {
    int fov = 0;
    FovStatus status = FovStatus::COMPLETED;
    int stages_completed = 0;  // skipped stages included
    std::string error;         // set when FAILED
};

// (fov, stage, current, total, message). May be called from worker threads.
using StageProgressSink =
    std::function<void(int, Stage, int, int, const std::string&)>;

// Runs `stages` in order for one FOV. Cancellation is checked before each
// stage; a stage exception stops this FOV only and is returned as FAILED.
FovOutcome run_fov(const std::vector<std::unique_ptr<PipelineStage>>& stages, int fov,
                   const core::CancellationToken& cancel, core::EventEmitter& emitter,
                   const StageProgressSink& sink);

} // namespace cellpipe::pipeline
