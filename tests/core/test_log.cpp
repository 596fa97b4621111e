/// @file test_log.cpp
/// @brief Tests for keyfix_core logging helpers

#include <catch2/catch_test_macros.hpp>
#include <keyfix/core/log.hpp>

#include "support/scene_builder.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace keyfix_core;

TEST_CASE("parse_log_level: known names", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
}

TEST_CASE("parse_log_level: unknown name", "[core][log]") {
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("log_level_name round trip", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
        auto parsed = parse_log_level(log_level_name(level));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == level);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("keyfix_test_logger");
        auto b = get_logger("keyfix_test_logger");
        REQUIRE(a == b);
        REQUIRE(a->name() == "keyfix_test_logger");
    }

    SECTION("subsystem loggers") {
        REQUIRE(scene_logger()->name() == "scene");
        REQUIRE(repair_logger()->name() == "repair");
        REQUIRE(config_logger()->name() == "config");
    }
}

TEST_CASE("Global log level applies to existing loggers", "[core][log]") {
    auto logger = get_logger("keyfix_level_test");
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(logger->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(logger->level() == previous);
}

TEST_CASE("LogScope does not throw", "[core][log]") {
    REQUIRE_NOTHROW([] {
        KEYFIX_LOG_SCOPE("test scope");
    }());
}

TEST_CASE("LogScope: several scopes in one block", "[core][log]") {
    REQUIRE_NOTHROW([] {
        KEYFIX_LOG_SCOPE("outer");
        KEYFIX_LOG_SCOPE("inner");
    }());
}

TEST_CASE("configure_logging: rotating file sink", "[core][log]") {
    keyfix_test::TempDir dir;
    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.log_directory = (dir / "logs").string();
    config.level = spdlog::level::info;

    // Created before configuration; must pick up the file sink too
    auto repair = repair_logger();
    configure_logging(config);

    KEYFIX_LOG_INFO("default logger line {}", 42);
    repair->warn("repair logger line");
    KEYFIX_LOG_DEBUG("below the configured level");
    flush_all_loggers();

    auto path = dir / "logs" / "keyfix.log";
    REQUIRE(std::filesystem::exists(path));
    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(text.find("default logger line 42") != std::string::npos);
    REQUIRE(text.find("[repair] repair logger line") != std::string::npos);
    REQUIRE(text.find("below the configured level") == std::string::npos);

    in.close();
    configure_logging(LogConfig{});
}
