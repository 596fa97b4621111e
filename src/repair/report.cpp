/// @file report.cpp
/// @brief Report serialization and logging

#include <keyfix/repair/report.hpp>
#include <keyfix/core/log.hpp>

#include <cmath>

namespace keyfix_repair {

namespace {

/// JSON has no NaN/Infinity; such bounds are emitted as their text form
nlohmann::json number_or_text(double value) {
    if (std::isfinite(value)) {
        return value;
    }
    if (std::isnan(value)) {
        return "nan";
    }
    return value > 0 ? "inf" : "-inf";
}

} // anonymous namespace

std::string SamplerFailure::describe() const {
    return "animation '" + animation_name + "' (" + std::to_string(animation_index) + ") sampler " +
        std::to_string(sampler_index) + ": " + kind() + ": " + reason();
}

const char* anomaly_kind_name(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::ExtremeBounds: return "extreme_bounds";
        case AnomalyKind::DanglingReference: return "dangling_reference";
        case AnomalyKind::MissingSection: return "missing_section";
    }
    return "unknown";
}

nlohmann::json to_json(const RepairReport& report) {
    nlohmann::json j;
    j["frame_rate"] = report.frame_rate;
    j["samplers_scanned"] = report.samplers_scanned;
    j["samplers_repaired"] = report.repaired_count();
    j["samplers_failed"] = report.failed_count();
    j["bytes_written"] = report.bytes_written;

    auto repaired = nlohmann::json::array();
    for (const auto& r : report.repaired) {
        nlohmann::json entry = {
            {"animation_index", r.animation_index},
            {"animation", r.animation_name},
            {"sampler_index", r.sampler_index},
            {"accessor", r.accessor_index},
            {"count", r.count},
            {"old_min", number_or_text(r.old_min)},
            {"old_max", number_or_text(r.old_max)},
            {"new_min", r.new_min},
            {"new_max", r.new_max},
        };
        repaired.push_back(std::move(entry));
    }
    j["repaired"] = std::move(repaired);

    auto failures = nlohmann::json::array();
    for (const auto& f : report.failures) {
        nlohmann::json entry = {
            {"animation_index", f.animation_index},
            {"animation", f.animation_name},
            {"sampler_index", f.sampler_index},
            {"accessor", f.accessor_index},
            {"kind", f.kind()},
            {"code", keyfix_core::error_code_name(f.error.code())},
            {"reason", f.reason()},
        };
        failures.push_back(std::move(entry));
    }
    j["failures"] = std::move(failures);

    auto anomalies = nlohmann::json::array();
    for (const auto& a : report.anomalies) {
        nlohmann::json entry = {
            {"kind", anomaly_kind_name(a.kind)},
            {"message", a.message},
        };
        if (a.accessor_index >= 0) {
            entry["accessor"] = a.accessor_index;
        }
        if (a.kind == AnomalyKind::ExtremeBounds) {
            entry["data_extreme"] = a.data_extreme;
        }
        anomalies.push_back(std::move(entry));
    }
    j["anomalies"] = std::move(anomalies);

    return j;
}

void log_report(const RepairReport& report) {
    auto log = keyfix_core::repair_logger();

    log->info("Samplers scanned: {}, repaired: {}, failed: {}, anomalies: {}, bytes written: {}",
        report.samplers_scanned, report.repaired_count(), report.failed_count(),
        report.anomalies.size(), report.bytes_written);

    for (const auto& f : report.failures) {
        log->warn("Failed {}", f.describe());
    }
    for (const auto& a : report.anomalies) {
        log->warn("Advisory [{}] {}", anomaly_kind_name(a.kind), a.message);
    }
}

} // namespace keyfix_repair
