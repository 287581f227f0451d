#include "cli_shared.hpp"

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/events.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/io/naming.hpp"
#include "cellpipe/pipeline/worker.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace cellpipe;

static std::atomic<core::CancellationToken*> g_cancel{nullptr};

static void handle_signal(int) {
    core::CancellationToken* token = g_cancel.load();
    if (token) token->cancel();
}

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

// PC on channel 0, every other channel as FL with total intensity.
static config::ProcessingConfig default_config(const io::MicroscopyMetadata& meta) {
    config::ProcessingConfig cfg;
    config::ChannelSelection pc;
    pc.channel = 0;
    pc.use_bbox_as_mask = false;
    cfg.channels.pc = pc;
    for (int c = 1; c < meta.n_channels; ++c) {
        config::ChannelSelection fl;
        fl.channel = c;
        fl.features = {"intensity_total"};
        cfg.channels.fl.push_back(fl);
    }
    return cfg;
}

static int count_arg(const char* name, const std::string& value) {
    const auto v = core::parse_index(value);
    if (!v) {
        throw ConfigError(std::string(name) + " expects a non-negative integer, got '" + value + "'");
    }
    return *v;
}

static int cmd_run(const std::string& input_dir, const std::string& output_dir,
                   const std::string& config_path, const std::string& fovs,
                   const std::string& workers, const std::string& batch_size) {
    if (!fs::is_directory(input_dir)) {
        std::cerr << "Error: Input directory not found: " << input_dir << std::endl;
        return 1;
    }

    io::FitsAcquisitionReader reader(input_dir);
    const io::MicroscopyMetadata& meta = reader.metadata();

    config::ProcessingConfig cfg =
        config_path.empty() ? default_config(meta) : config::ProcessingConfig::load(config_path);
    if (!fovs.empty()) cfg.params.fovs = fovs;
    if (!workers.empty()) cfg.params.n_workers = count_arg("--workers", workers);
    if (!batch_size.empty()) cfg.params.batch_size = count_arg("--batch-size", batch_size);

    const fs::path out_dir(output_dir);
    fs::create_directories(out_dir / "logs");
    std::ofstream event_log_file(out_dir / "logs" / "run_events.jsonl");
    cli::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
    std::ostream tee_out(&tee_buf);
    core::EventEmitter emitter(core::get_run_id(), tee_out);

    pipeline::WorkflowOptions options;
    options.emitter = &emitter;
    options.progress = [](int fov, Stage stage, int current, int total, const std::string& msg) {
        if (current + 1 == total) {
            std::cerr << "[" << stage_to_string(stage) << "] fov " << fov << ": " << msg << " ("
                      << total << "/" << total << ")" << std::endl;
        }
    };

    pipeline::WorkflowWorker worker(meta, cfg, out_dir, reader, options);
    g_cancel.store(&worker.cancellation_token());
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cerr << "[RUN] " << meta.n_fovs << " FOVs in " << input_dir << " -> " << output_dir
              << std::endl;
    const pipeline::WorkerResult result = worker.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel.store(nullptr);

    std::cerr << "[RUN] " << result.message << std::endl;
    if (result.success) return 0;
    return worker.cancellation_token().is_cancelled() ? 130 : 1;
}

static int cmd_discover(const std::string& output_dir) {
    json result;
    result["output_dir"] = output_dir;
    const fs::path cfg_path = io::config_path(output_dir);
    if (fs::exists(cfg_path)) {
        result["config"] = cfg_path.string();
        result["config_sha256"] = core::sha256_file(cfg_path);
    } else {
        result["config"] = nullptr;
    }
    json fovs = json::array();
    for (int fov : io::discover_fovs(output_dir)) {
        fovs.push_back(cli::artifacts_to_json(io::discover_artifacts(output_dir, fov)));
    }
    result["fovs"] = fovs;
    print_json(result);
    return 0;
}

static int cmd_validate_config(const std::string& path) {
    json result;
    result["path"] = path;
    try {
        const auto cfg = config::ProcessingConfig::load(path);
        cfg.validate();
    } catch (const CellpipeError& e) {
        result["valid"] = false;
        result["error"] = e.what();
        print_json(result);
        return 1;
    }
    result["valid"] = true;
    print_json(result);
    return 0;
}

static int cmd_inspect(const std::string& input_dir) {
    io::FitsAcquisitionReader reader(input_dir);
    print_json(cli::metadata_to_json(reader.metadata()));
    return 0;
}

void print_usage() {
    std::cout << "Usage: cellpipe_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  run --input DIR --output DIR [--config YAML] [--fovs RANGE]\n"
              << "      [--workers N] [--batch-size N]   Process an acquisition\n"
              << "  discover --output DIR               List FOVs and artifacts as JSON\n"
              << "  validate-config --config YAML       Validate a processing config\n"
              << "  inspect --input DIR                 Print acquisition metadata as JSON\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    try {
        if (command == "run") {
            std::string input = get_arg("--input");
            std::string output = get_arg("--output");
            if (input.empty() || output.empty()) {
                std::cerr << "run requires --input and --output\n";
                return 1;
            }
            return cmd_run(input, output, get_arg("--config"), get_arg("--fovs"),
                           get_arg("--workers"), get_arg("--batch-size"));
        }

        if (command == "discover") {
            std::string output = get_arg("--output");
            if (output.empty()) {
                std::cerr << "discover requires --output\n";
                return 1;
            }
            return cmd_discover(output);
        }

        if (command == "validate-config") {
            std::string path = get_arg("--config");
            if (path.empty()) {
                std::cerr << "validate-config requires --config\n";
                return 1;
            }
            return cmd_validate_config(path);
        }

        if (command == "inspect") {
            std::string input = get_arg("--input");
            if (input.empty()) {
                std::cerr << "inspect requires --input\n";
                return 1;
            }
            return cmd_inspect(input);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
