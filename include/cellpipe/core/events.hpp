#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace cellpipe::core {

using json = nlohmann::json;

// JSON-lines event log for one run. Safe to call from worker threads.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra);

    void batch_start(int batch_idx, int n_batches, const std::vector<int>& fovs);
    void batch_end(int batch_idx, int completed, int failed);

    void stage_start(int fov, Stage stage);
    void stage_skipped(int fov, Stage stage, const std::string& reason);
    void stage_progress(int fov, Stage stage, int current, int total,
                        const std::string& message);
    void stage_end(int fov, Stage stage, const std::string& status);

    void fov_end(int fov, const std::string& status, int stages_completed,
                 const std::string& error);

    void info(const std::string& message, const json& extra = json::object());
    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message, const json& extra = json::object());

    void emit(const std::string& type, const json& data);

private:
    json base_event(const std::string& type) const;
    void write(const json& event);

    std::string run_id_;
    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace cellpipe::core
