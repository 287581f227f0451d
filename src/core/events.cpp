#include "cellpipe/core/events.hpp"
#include "cellpipe/core/utils.hpp"

namespace cellpipe::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(&out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = base_event(type);
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::batch_start(int batch_idx, int n_batches, const std::vector<int>& fovs) {
    json event = base_event("batch_start");
    event["batch"] = batch_idx;
    event["n_batches"] = n_batches;
    event["fovs"] = fovs;
    write(event);
}

void EventEmitter::batch_end(int batch_idx, int completed, int failed) {
    json event = base_event("batch_end");
    event["batch"] = batch_idx;
    event["completed"] = completed;
    event["failed"] = failed;
    write(event);
}

void EventEmitter::stage_start(int fov, Stage stage) {
    json event = base_event("stage_start");
    event["fov"] = fov;
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    write(event);
}

void EventEmitter::stage_skipped(int fov, Stage stage, const std::string& reason) {
    json event = base_event("stage_skipped");
    event["fov"] = fov;
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["reason"] = reason;
    write(event);
}

void EventEmitter::stage_progress(int fov, Stage stage, int current, int total,
                                  const std::string& message) {
    json event = base_event("stage_progress");
    event["fov"] = fov;
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["current"] = current;
    event["total"] = total;
    event["substep"] = message;
    write(event);
}

void EventEmitter::stage_end(int fov, Stage stage, const std::string& status) {
    json event = base_event("stage_end");
    event["fov"] = fov;
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    write(event);
}

void EventEmitter::fov_end(int fov, const std::string& status, int stages_completed,
                           const std::string& error) {
    json event = base_event("fov_end");
    event["fov"] = fov;
    event["status"] = status;
    event["stages_completed"] = stages_completed;
    if (!error.empty()) {
        event["error"] = error;
    }
    write(event);
}

void EventEmitter::info(const std::string& message, const json& extra) {
    json data = extra;
    data["message"] = message;
    emit("info", data);
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json data = extra;
    data["message"] = message;
    emit("warning", data);
}

void EventEmitter::error(const std::string& message, const json& extra) {
    json data = extra;
    data["message"] = message;
    emit("error", data);
}

} // namespace cellpipe::core
