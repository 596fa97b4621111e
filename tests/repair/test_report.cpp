/// @file test_report.cpp
/// @brief Tests for repair report queries and JSON form

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <keyfix/repair/report.hpp>

#include <limits>
#include <string>

using namespace keyfix_repair;
using keyfix_core::BufferBoundsError;
using keyfix_core::Error;

namespace {

RepairReport sample_report() {
    RepairReport report;
    report.frame_rate = 30.0;
    report.samplers_scanned = 3;

    SamplerRepair repair;
    repair.animation_index = 0;
    repair.animation_name = "Walk";
    repair.sampler_index = 1;
    repair.accessor_index = 4;
    repair.count = 20;
    repair.old_min = std::numeric_limits<double>::max();
    repair.old_max = -std::numeric_limits<double>::infinity();
    repair.new_min = 0.0;
    repair.new_max = 19.0 / 30.0;
    repair.bytes_written = 80;
    report.repaired.push_back(repair);
    report.bytes_written = 80;

    Error error = BufferBoundsError::range_exceeded(7, 4000, 512);
    error.with_context("animation", "Jump");
    report.failures.push_back(SamplerFailure{1, "Jump", 0, 7, error});

    Anomaly anomaly;
    anomaly.kind = AnomalyKind::ExtremeBounds;
    anomaly.accessor_index = 9;
    anomaly.message = "Accessor 9 has extreme bounds";
    anomaly.data_extreme = true;
    report.anomalies.push_back(anomaly);

    Anomaly missing;
    missing.kind = AnomalyKind::MissingSection;
    missing.message = "Missing section 'nodes'";
    report.anomalies.push_back(missing);

    return report;
}

} // anonymous namespace

TEST_CASE("RepairReport: queries", "[repair][report]") {
    RepairReport empty;
    REQUIRE(empty.is_clean());
    REQUIRE_FALSE(empty.has_failures());
    REQUIRE(empty.repaired_count() == 0);

    RepairReport report = sample_report();
    REQUIRE_FALSE(report.is_clean());
    REQUIRE(report.has_failures());
    REQUIRE(report.repaired_count() == 1);
    REQUIRE(report.failed_count() == 1);
}

TEST_CASE("SamplerFailure: kind and description", "[repair][report]") {
    RepairReport report = sample_report();
    const auto& failure = report.failures[0];

    REQUIRE(failure.kind() == "BufferBoundsError");
    REQUIRE(failure.reason().find("4000") != std::string::npos);

    std::string text = failure.describe();
    REQUIRE(text.find("Jump") != std::string::npos);
    REQUIRE(text.find("sampler 0") != std::string::npos);
    REQUIRE(text.find("BufferBoundsError") != std::string::npos);
}

TEST_CASE("anomaly_kind_name", "[repair][report]") {
    REQUIRE(std::string(anomaly_kind_name(AnomalyKind::ExtremeBounds)) == "extreme_bounds");
    REQUIRE(std::string(anomaly_kind_name(AnomalyKind::DanglingReference)) == "dangling_reference");
    REQUIRE(std::string(anomaly_kind_name(AnomalyKind::MissingSection)) == "missing_section");
}

TEST_CASE("to_json: summary fields", "[repair][report]") {
    auto j = to_json(sample_report());

    REQUIRE(j["frame_rate"].get<double>() == 30.0);
    REQUIRE(j["samplers_scanned"].get<std::size_t>() == 3);
    REQUIRE(j["samplers_repaired"].get<std::size_t>() == 1);
    REQUIRE(j["samplers_failed"].get<std::size_t>() == 1);
    REQUIRE(j["bytes_written"].get<std::uint64_t>() == 80);
}

TEST_CASE("to_json: repaired entries", "[repair][report]") {
    auto j = to_json(sample_report());
    REQUIRE(j["repaired"].size() == 1);

    const auto& entry = j["repaired"][0];
    REQUIRE(entry["animation"] == "Walk");
    REQUIRE(entry["sampler_index"].get<std::size_t>() == 1);
    REQUIRE(entry["accessor"].get<std::int64_t>() == 4);
    REQUIRE(entry["count"].get<std::uint64_t>() == 20);
    REQUIRE(entry["new_min"].get<double>() == 0.0);
    REQUIRE(entry["new_max"].get<double>() == Catch::Approx(0.6333).epsilon(1e-3));
    REQUIRE(entry["old_min"].is_number());
    // Non-finite values have no JSON number form
    REQUIRE(entry["old_max"] == "-inf");

    // Serializes without error handler surprises
    REQUIRE_FALSE(j.dump().empty());
}

TEST_CASE("to_json: failures and anomalies", "[repair][report]") {
    auto j = to_json(sample_report());

    REQUIRE(j["failures"].size() == 1);
    const auto& failure = j["failures"][0];
    REQUIRE(failure["animation"] == "Jump");
    REQUIRE(failure["kind"] == "BufferBoundsError");
    REQUIRE(failure["code"] == "OutOfRange");
    REQUIRE(failure["accessor"].get<std::int64_t>() == 7);

    REQUIRE(j["anomalies"].size() == 2);
    REQUIRE(j["anomalies"][0]["kind"] == "extreme_bounds");
    REQUIRE(j["anomalies"][0]["accessor"].get<std::int64_t>() == 9);
    REQUIRE(j["anomalies"][0]["data_extreme"] == true);
    REQUIRE(j["anomalies"][1]["kind"] == "missing_section");
    REQUIRE_FALSE(j["anomalies"][1].contains("accessor"));
    REQUIRE_FALSE(j["anomalies"][1].contains("data_extreme"));
}

TEST_CASE("log_report does not throw", "[repair][report]") {
    REQUIRE_NOTHROW(log_report(sample_report()));
}
