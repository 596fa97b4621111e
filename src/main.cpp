/// @file main.cpp
/// @brief keyfix entry point - repairs corrupted animation timestamps in a glTF file
///
/// Usage: keyfix <input.gltf> [output.gltf] [--key=value ...]
///
/// Exit codes:
/// - 0: every sampler is valid or was repaired
/// - 1: fatal error (configuration, format or I/O)
/// - 2: output written, but some samplers could not be repaired

#include <keyfix/config/config.hpp>
#include <keyfix/core/log.hpp>
#include <keyfix/repair/engine.hpp>
#include <keyfix/repair/report.hpp>
#include <keyfix/scene/loader.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitSamplerFailures = 2;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <input.gltf> [output.gltf] [options]\n\n"
              << "Options:\n"
              << "  --frame-rate=<fps>      Frame rate of synthesized timestamps (default 30)\n"
              << "  --threshold=<value>     Magnitude treated as a sentinel bound (default 1e100)\n"
              << "  --binary=<path>         Output .bin path (default: beside the output .gltf)\n"
              << "  --suffix=<text>         Suffix for derived output names (default _fixed)\n"
              << "  --report=<path>         Write a JSON report\n"
              << "  --config=<path>         Load options from a JSON file\n"
              << "  --log-level=<level>     trace, debug, info, warn, error, critical, off\n"
              << "  --log-dir=<path>        Also write a rotating keyfix.log to this directory\n"
              << "  -h, --help              Show this help\n\n"
              << "Environment: KEYFIX_FRAME_RATE, KEYFIX_CORRUPTION_THRESHOLD, KEYFIX_OUTPUT_SUFFIX,\n"
              << "             KEYFIX_LOG_LEVEL, KEYFIX_LOG_DIR\n";
}

int fail(const keyfix_core::Error& error) {
    KEYFIX_LOG_ERROR("{}", keyfix_core::build_error_chain(error));
    keyfix_core::shutdown_logging();
    return kExitFatal;
}

keyfix_scene::OutputPaths resolve_outputs(const keyfix_config::RunOptions& options) {
    keyfix_scene::OutputPaths paths = options.output_metadata
        ? keyfix_scene::output_paths_for(*options.output_metadata)
        : keyfix_scene::default_output_paths(options.input, options.output_suffix);
    if (options.output_binary) {
        paths.binary = *options.output_binary;
    }
    return paths;
}

keyfix_core::Result<void> write_report(const keyfix_repair::RepairReport& report, const fs::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return keyfix_core::Error(keyfix_core::IoError::write_failed(path.string()));
        }
    }

    std::ofstream file(path);
    if (!file) {
        return keyfix_core::Error(keyfix_core::IoError::open_failed(path.string()));
    }
    file << keyfix_repair::to_json(report).dump(2) << "\n";
    if (!file) {
        return keyfix_core::Error(keyfix_core::IoError::write_failed(path.string()));
    }
    return keyfix_core::Ok();
}

} // anonymous namespace

int main(int argc, char** argv) {
    keyfix_core::init_logging();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        }
    }

    // Configuration: defaults < file < environment < command line
    keyfix_config::ConfigManager config;
    config.setup_defaults();
    config.load_environment();
    if (auto parsed = config.parse_args(argc, argv); !parsed) {
        print_usage(argv[0]);
        return fail(parsed.error());
    }

    std::string config_file = config.get_string(keyfix_config::config_keys::CONFIG_FILE);
    if (!config_file.empty()) {
        if (auto loaded = config.load_json(config_file); !loaded) {
            return fail(loaded.error());
        }
        KEYFIX_LOG_DEBUG("Merged config file {}", config_file);
    }

    auto options = config.build_run_options();
    if (!options) {
        if (config.positional().empty()) {
            print_usage(argv[0]);
        }
        return fail(options.error());
    }

    keyfix_core::LogConfig log_config;
    log_config.level = options->log_level;
    if (options->log_directory) {
        log_config.file_enabled = true;
        log_config.log_directory = options->log_directory->string();
    }
    keyfix_core::configure_logging(log_config);

    // Load
    KEYFIX_LOG_INFO("Loading scene: {}", options->input.string());
    auto scene = keyfix_scene::load_scene(options->input);
    if (!scene) {
        return fail(scene.error());
    }

    // Repair
    auto engine = keyfix_repair::TimingRepairEngine::create(options->repair);
    if (!engine) {
        return fail(engine.error());
    }
    keyfix_repair::RepairReport report = engine->run(*scene);

    // Write
    keyfix_scene::OutputPaths outputs = resolve_outputs(*options);
    if (auto written = keyfix_scene::write_scene(*scene, outputs.metadata, outputs.binary); !written) {
        return fail(written.error());
    }
    KEYFIX_LOG_INFO("Wrote {} and {}", outputs.metadata.string(), outputs.binary.string());

    keyfix_repair::log_report(report);

    if (options->report_path) {
        if (auto saved = write_report(report, *options->report_path); !saved) {
            return fail(saved.error());
        }
        KEYFIX_LOG_INFO("Report written to {}", options->report_path->string());
    }

    int exit_code = kExitOk;
    if (report.has_failures()) {
        KEYFIX_LOG_WARN("{} sampler(s) could not be repaired", report.failed_count());
        exit_code = kExitSamplerFailures;
    }

    keyfix_core::shutdown_logging();
    return exit_code;
}
