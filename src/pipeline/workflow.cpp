#include "cellpipe/pipeline/workflow.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/io/naming.hpp"
#include "cellpipe/pipeline/partition.hpp"
#include "cellpipe/pipeline/stages.hpp"
#include "cellpipe/pipeline/thread_pool.hpp"

#include <map>
#include <ostream>
#include <vector>

namespace cellpipe::pipeline {

namespace {

void check_channels(const config::ProcessingConfig& cfg, const io::MicroscopyMetadata& meta) {
    std::vector<std::string> bad;
    if (cfg.channels.pc && cfg.channels.pc->channel >= meta.n_channels) {
        bad.push_back(std::to_string(cfg.channels.pc->channel));
    }
    for (int c : cfg.channels.fl_channels()) {
        if (c >= meta.n_channels) bad.push_back(std::to_string(c));
    }
    if (!bad.empty()) {
        throw ConfigError("Invalid channel indices: " + core::join(bad, ", ") +
                          " (acquisition has " + std::to_string(meta.n_channels) + " channels)");
    }
}

// Never overwrites an existing file.
void persist_config(const config::ProcessingConfig& cfg, const fs::path& output_dir,
                    core::EventEmitter& emitter) {
    const fs::path path = io::config_path(output_dir);
    if (fs::exists(path)) {
        return;
    }
    cfg.save(path);
    emitter.info("Saved processing config", {{"path", path.string()}});
}

std::string result_message(const WorkflowResult& r, const fs::path& output_dir) {
    switch (r.state) {
        case WorkflowState::CANCELLED: return "Workflow cancelled";
        case WorkflowState::COMPLETED: return "Results saved to " + output_dir.string();
        case WorkflowState::FAILED:
            return "Workflow reported failure: " + std::to_string(r.failed) + " of " +
                   std::to_string(r.total) + " FOVs failed";
    }
    return "";
}

} // namespace

std::string workflow_state_to_string(WorkflowState state) {
    switch (state) {
        case WorkflowState::COMPLETED: return "completed";
        case WorkflowState::CANCELLED: return "cancelled";
        case WorkflowState::FAILED: return "failed";
        default: return "unknown";
    }
}

WorkflowResult run_workflow(const io::MicroscopyMetadata& metadata,
                            const config::ProcessingConfig& config, const fs::path& output_dir,
                            io::FrameReader& reader, const core::CancellationToken& cancel,
                            const WorkflowOptions& options) {
    std::ostream null_stream(nullptr);
    core::EventEmitter discard(core::get_run_id(), null_stream);
    core::EventEmitter& emitter = options.emitter ? *options.emitter : discard;

    config.validate();
    check_channels(config, metadata);
    const std::vector<int> fovs = config::resolve_fovs(config, metadata.n_fovs);
    StageContext ctx(metadata, config, output_dir, reader, emitter);

    WorkflowResult result;
    result.total = static_cast<int>(fovs.size());
    if (cancel.is_cancelled()) {
        result.state = WorkflowState::CANCELLED;
        result.message = result_message(result, output_dir);
        return result;
    }

    fs::create_directories(output_dir);
    emitter.run_start({{"output_dir", output_dir.string()},
                       {"base_name", metadata.base_name},
                       {"fovs", fovs},
                       {"batch_size", config.params.batch_size},
                       {"n_workers", config.params.n_workers},
                       {"segmentation_method", config.params.segmentation_method},
                       {"tracking_method", config.params.tracking_method}});

    const auto batches = compute_batches(fovs, config.params.batch_size);
    const std::vector<std::unique_ptr<PipelineStage>> copy_only = [&ctx]() {
        std::vector<std::unique_ptr<PipelineStage>> v;
        v.push_back(std::make_unique<CopyStage>(ctx));
        return v;
    }();
    const auto stages = make_fov_stages(ctx);
    ThreadPool pool(config.params.n_workers);

    bool cancelled = false;
    for (size_t b = 0; b < batches.size() && !cancelled; ++b) {
        const auto& batch = batches[b];
        const int batch_idx = static_cast<int>(b);
        emitter.batch_start(batch_idx, static_cast<int>(batches.size()), batch);
        int batch_completed = 0;
        int batch_failed = 0;

        // Copy runs serially on this thread.
        std::vector<int> ready;
        for (int fov : batch) {
            const FovOutcome copied = run_fov(copy_only, fov, cancel, emitter, options.progress);
            if (copied.status == FovStatus::CANCELLED) {
                cancelled = true;
                break;
            }
            if (copied.status == FovStatus::FAILED) {
                ++result.failed;
                ++batch_failed;
                emitter.fov_end(fov, fov_status_to_string(copied.status), 0, copied.error);
                continue;
            }
            ready.push_back(fov);
        }
        if (cancelled || cancel.is_cancelled()) {
            cancelled = true;
            emitter.batch_end(batch_idx, batch_completed, batch_failed);
            break;
        }

        std::map<size_t, std::future<std::vector<FovOutcome>>> futures;
        for (const auto& range : split_worker_ranges(ready, config.params.n_workers)) {
            auto submitted = pool.submit([range, &stages, &cancel, &emitter, &options]() {
                std::vector<FovOutcome> outcomes;
                for (int fov : range) {
                    outcomes.push_back(run_fov(stages, fov, cancel, emitter, options.progress));
                    if (outcomes.back().status == FovStatus::CANCELLED) break;
                }
                return outcomes;
            });
            futures.emplace(submitted.first, std::move(submitted.second));
        }

        size_t pending = futures.size();
        while (pending > 0) {
            const size_t id = pool.wait_completion();
            --pending;
            for (const auto& o : futures.at(id).get()) {
                // Copy already ran, so it counts as one completed stage.
                emitter.fov_end(o.fov, fov_status_to_string(o.status), o.stages_completed + 1,
                                o.error);
                if (o.status == FovStatus::COMPLETED) {
                    ++result.completed;
                    ++batch_completed;
                } else if (o.status == FovStatus::FAILED) {
                    ++result.failed;
                    ++batch_failed;
                }
            }
            if (cancel.is_cancelled() && !cancelled) {
                cancelled = true;
                pending -= pool.cancel_pending();
            }
        }
        emitter.batch_end(batch_idx, batch_completed, batch_failed);
    }

    if (cancelled || cancel.is_cancelled()) {
        result.state = WorkflowState::CANCELLED;
    } else if (result.completed == result.total) {
        result.state = WorkflowState::COMPLETED;
    } else {
        result.state = WorkflowState::FAILED;
    }
    result.message = result_message(result, output_dir);

    persist_config(config, output_dir, emitter);
    emitter.run_end(result.success(), workflow_state_to_string(result.state),
                    {{"total", result.total},
                     {"completed", result.completed},
                     {"failed", result.failed},
                     {"message", result.message}});
    return result;
}

bool run_workflow(const io::MicroscopyMetadata& metadata, const config::ProcessingConfig& config,
                  const fs::path& output_dir, io::FrameReader& reader,
                  const core::CancellationToken& cancel) {
    return run_workflow(metadata, config, output_dir, reader, cancel, WorkflowOptions{}).success();
}

} // namespace cellpipe::pipeline
