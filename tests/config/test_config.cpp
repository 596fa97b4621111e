/// @file test_config.cpp
/// @brief Tests for layered configuration

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <keyfix/config/config.hpp>

#include "support/scene_builder.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace keyfix_config;
using keyfix_test::TempDir;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

/// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : m_name(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(m_name.c_str()); }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string m_name;
};

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

TEST_CASE("ConfigLayer: basic operations", "[config][layer]") {
    ConfigLayer layer("test", ConfigLayerPriority::File);
    REQUIRE(layer.name() == "test");
    REQUIRE(layer.empty());

    layer.set("a.b", ConfigValue{std::int64_t{3}});
    REQUIRE(layer.contains("a.b"));
    REQUIRE(layer.size() == 1);
    REQUIRE(std::get<std::int64_t>(*layer.get("a.b")) == 3);
    REQUIRE_FALSE(layer.get("missing").has_value());

    REQUIRE(layer.remove("a.b"));
    REQUIRE_FALSE(layer.remove("a.b"));
    REQUIRE(layer.empty());
}

// =============================================================================
// parse_value
// =============================================================================

TEST_CASE("parse_value: narrowest type", "[config][parse]") {
    REQUIRE(std::get<bool>(parse_value("true")));
    REQUIRE_FALSE(std::get<bool>(parse_value("false")));
    REQUIRE(std::get<std::int64_t>(parse_value("24")) == 24);
    REQUIRE(std::get<std::int64_t>(parse_value("-3")) == -3);
    REQUIRE(std::get<double>(parse_value("29.97")) == Catch::Approx(29.97));
    REQUIRE(std::get<double>(parse_value("1e100")) == 1e100);
    REQUIRE(std::get<std::string>(parse_value("fast")) == "fast");
    REQUIRE(std::get<std::string>(parse_value("12abc")) == "12abc");
    REQUIRE(std::get<std::string>(parse_value("")).empty());
}

// =============================================================================
// Defaults and layering
// =============================================================================

TEST_CASE("ConfigManager: defaults", "[config][manager]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.layer_count() == 4);
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 30.0);
    REQUIRE(config.get_float(config_keys::REPAIR_CORRUPTION_THRESHOLD) == 1e100);
    REQUIRE(config.get_string(config_keys::OUTPUT_SUFFIX) == "_fixed");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
    REQUIRE_FALSE(config.contains(config_keys::REPORT_PATH));

    auto repair = config.build_repair_config();
    REQUIRE(repair.is_ok());
    REQUIRE(repair->frame_rate == 30.0);
}

TEST_CASE("ConfigManager: layer priority", "[config][manager]") {
    ConfigManager config;
    config.setup_defaults();

    config.set(config_keys::REPAIR_FRAME_RATE, ConfigValue{25.0}, "file");
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 25.0);

    config.get_layer("environment")->set(config_keys::REPAIR_FRAME_RATE, ConfigValue{std::string("50")});
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 50.0);

    REQUIRE(config.parse_args(std::vector<std::string>{"--frame-rate=60"}).is_ok());
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 60.0);
}

TEST_CASE("ConfigManager: typed getters convert", "[config][manager]") {
    ConfigManager config;
    config.set("x.int", ConfigValue{std::int64_t{7}});
    config.set("x.text", ConfigValue{std::string("2.5")});
    config.set("x.flag", ConfigValue{std::string("yes")});

    REQUIRE(config.get_float("x.int") == 7.0);
    REQUIRE(config.get_string("x.int") == "7");
    REQUIRE(config.get_float("x.text") == 2.5);
    REQUIRE(config.get_int("x.text", -1) == -1);
    REQUIRE(config.get_bool("x.flag"));
    REQUIRE(config.get_float("x.missing", 4.0) == 4.0);
}

// =============================================================================
// Command line
// =============================================================================

TEST_CASE("ConfigManager: parse_args", "[config][args]") {
    ConfigManager config;
    config.setup_defaults();

    auto parsed = config.parse_args(std::vector<std::string>{
        "walk.gltf", "--threshold=1e30", "out/walk.gltf", "--report", "report.json",
        "--repair-frame-rate=24", "--binary=out/data.bin", "--log-level=debug"});
    REQUIRE(parsed.is_ok());

    REQUIRE(config.positional() == std::vector<std::string>{"walk.gltf", "out/walk.gltf"});
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 24.0);
    REQUIRE(config.get_float(config_keys::REPAIR_CORRUPTION_THRESHOLD) == 1e30);
    REQUIRE(config.get_string(config_keys::REPORT_PATH) == "report.json");
    REQUIRE(config.get_string(config_keys::OUTPUT_BINARY_PATH) == "out/data.bin");
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "debug");
}

TEST_CASE("ConfigManager: path options stay strings", "[config][args]") {
    ConfigManager config;
    REQUIRE(config.parse_args(std::vector<std::string>{"--suffix=2", "--report=123"}).is_ok());

    auto suffix = config.get(config_keys::OUTPUT_SUFFIX);
    REQUIRE(suffix.has_value());
    REQUIRE(std::holds_alternative<std::string>(*suffix));
    REQUIRE(config.get_string(config_keys::REPORT_PATH) == "123");
}

TEST_CASE("ConfigManager: unknown short option", "[config][args]") {
    ConfigManager config;
    auto parsed = config.parse_args(std::vector<std::string>{"-x"});
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.error().code() == keyfix_core::ErrorCode::InvalidArgument);
}

TEST_CASE("ConfigManager: parse_args from argv", "[config][args]") {
    ConfigManager config;
    std::string program = "keyfix";
    std::string input = "scene.gltf";
    std::string rate = "--fps=12";
    char* argv[] = {program.data(), input.data(), rate.data()};

    REQUIRE(config.parse_args(3, argv).is_ok());
    REQUIRE(config.positional() == std::vector<std::string>{"scene.gltf"});
    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 12.0);
}

// =============================================================================
// Environment and files
// =============================================================================

TEST_CASE("ConfigManager: environment", "[config][env]") {
    EnvGuard rate("KEYFIX_FRAME_RATE", "48");
    EnvGuard level("KEYFIX_LOG_LEVEL", "warn");

    ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 48.0);
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "warn");
}

TEST_CASE("ConfigManager: load_json", "[config][file]") {
    TempDir dir;
    ConfigManager config;
    config.setup_defaults();

    SECTION("nested objects flatten") {
        write_text(dir / "keyfix.json", R"({
            "repair": {"frame_rate": 24, "corruption_threshold": 1e50},
            "output": {"suffix": "_clean"},
            "log": {"level": "error"}
        })");
        REQUIRE(config.load_json(dir / "keyfix.json").is_ok());
        REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 24.0);
        REQUIRE(config.get_float(config_keys::REPAIR_CORRUPTION_THRESHOLD) == 1e50);
        REQUIRE(config.get_string(config_keys::OUTPUT_SUFFIX) == "_clean");
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "error");
    }

    SECTION("command line still wins") {
        write_text(dir / "keyfix.json", R"({"repair": {"frame_rate": 24}})");
        REQUIRE(config.parse_args(std::vector<std::string>{"--frame-rate=60"}).is_ok());
        REQUIRE(config.load_json(dir / "keyfix.json").is_ok());
        REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 60.0);
    }

    SECTION("missing file") {
        auto loaded = config.load_json(dir / "absent.json");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code() == keyfix_core::ErrorCode::IOError);
    }

    SECTION("invalid JSON") {
        write_text(dir / "bad.json", "{ not json");
        auto loaded = config.load_json(dir / "bad.json");
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.error().code() == keyfix_core::ErrorCode::ParseError);
    }

    SECTION("arrays are rejected") {
        write_text(dir / "array.json", R"({"repair": {"frame_rate": [24]}})");
        auto loaded = config.load_json(dir / "array.json");
        REQUIRE(loaded.is_err());
        REQUIRE(config.get_float(config_keys::REPAIR_FRAME_RATE) == 30.0);
    }
}

// =============================================================================
// Run options
// =============================================================================

TEST_CASE("ConfigManager: build_run_options", "[config][options]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("input only") {
        REQUIRE(config.parse_args(std::vector<std::string>{"anim.gltf"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_ok());
        REQUIRE(options->input == std::filesystem::path("anim.gltf"));
        REQUIRE_FALSE(options->output_metadata.has_value());
        REQUIRE_FALSE(options->output_binary.has_value());
        REQUIRE_FALSE(options->report_path.has_value());
        REQUIRE(options->output_suffix == "_fixed");
        REQUIRE(options->log_level == spdlog::level::info);
        REQUIRE_FALSE(options->log_directory.has_value());
        REQUIRE(options->repair.frame_rate == 30.0);
    }

    SECTION("explicit outputs") {
        REQUIRE(config.parse_args(std::vector<std::string>{
            "anim.gltf", "out.gltf", "--binary=payload.bin", "--report=r.json", "--log-level=trace"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_ok());
        REQUIRE(*options->output_metadata == std::filesystem::path("out.gltf"));
        REQUIRE(*options->output_binary == std::filesystem::path("payload.bin"));
        REQUIRE(*options->report_path == std::filesystem::path("r.json"));
        REQUIRE(options->log_level == spdlog::level::trace);
    }

    SECTION("log directory") {
        REQUIRE(config.parse_args(std::vector<std::string>{"anim.gltf", "--log-dir", "logs"}).is_ok());
        auto with = config.build_run_options();
        REQUIRE(with.is_ok());
        REQUIRE(*with->log_directory == std::filesystem::path("logs"));
    }

    SECTION("missing input") {
        auto options = config.build_run_options();
        REQUIRE(options.is_err());
        REQUIRE(options.error().code() == keyfix_core::ErrorCode::InvalidArgument);
    }

    SECTION("too many positionals") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "b.gltf", "c.gltf"}).is_ok());
        REQUIRE(config.build_run_options().is_err());
    }

    SECTION("invalid frame rate") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "--frame-rate=0"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_err());
        REQUIRE(options.error().code() == keyfix_core::ErrorCode::ValidationError);
    }

    SECTION("non-numeric frame rate") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "--frame-rate=abc"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_err());
        REQUIRE(options.error().code() == keyfix_core::ErrorCode::ValidationError);
        REQUIRE(options.error().message().find("abc") != std::string::npos);
    }

    SECTION("non-numeric frame rate from the environment") {
        EnvGuard env("KEYFIX_FRAME_RATE", "fast");
        config.load_environment();
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_err());
        REQUIRE(options.error().code() == keyfix_core::ErrorCode::ValidationError);
    }

    SECTION("non-numeric threshold") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "--threshold=huge"}).is_ok());
        REQUIRE(config.build_run_options().is_err());
    }

    SECTION("bare frame rate flag") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "--frame-rate"}).is_ok());
        REQUIRE(config.build_run_options().is_err());
    }

    SECTION("invalid log level") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a.gltf", "--log-level=chatty"}).is_ok());
        auto options = config.build_run_options();
        REQUIRE(options.is_err());
        REQUIRE(options.error().code() == keyfix_core::ErrorCode::ValidationError);
    }
}
