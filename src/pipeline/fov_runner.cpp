#include "cellpipe/pipeline/fov_runner.hpp"

#include <exception>

namespace cellpipe::pipeline {

std::string fov_status_to_string(FovStatus status) {
    switch (status) {
        case FovStatus::COMPLETED: return "completed";
        case FovStatus::CANCELLED: return "cancelled";
        case FovStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

FovOutcome run_fov(const std::vector<std::unique_ptr<PipelineStage>>& stages, int fov,
                   const core::CancellationToken& cancel, core::EventEmitter& emitter,
                   const StageProgressSink& sink) {
    FovOutcome outcome;
    outcome.fov = fov;

    for (const auto& stage : stages) {
        if (cancel.is_cancelled()) {
            outcome.status = FovStatus::CANCELLED;
            return outcome;
        }

        const Stage id = stage->stage();
        try {
            if (stage->is_done(fov)) {
                emitter.stage_skipped(fov, id, "output exists");
                ++outcome.stages_completed;
                continue;
            }

            emitter.stage_start(fov, id);
            core::ProgressCallback progress = [&](int current, int total, const std::string& msg) {
                emitter.stage_progress(fov, id, current, total, msg);
                if (sink) {
                    sink(fov, id, current, total, msg);
                }
            };

            if (!stage->process(fov, cancel, progress)) {
                emitter.stage_end(fov, id, "cancelled");
                outcome.status = FovStatus::CANCELLED;
                return outcome;
            }
            emitter.stage_end(fov, id, "ok");
            ++outcome.stages_completed;
        } catch (const std::exception& e) {
            emitter.error(e.what(), {{"fov", fov}, {"stage", stage_to_string(id)}});
            emitter.stage_end(fov, id, "error");
            outcome.status = FovStatus::FAILED;
            outcome.error = e.what();
            return outcome;
        }
    }

    outcome.status = FovStatus::COMPLETED;
    return outcome;
}

} // namespace cellpipe::pipeline
