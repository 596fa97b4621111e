#pragma once

/// @file report.hpp
/// @brief Structured outcome of a repair run

#include "fwd.hpp"
#include <keyfix/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace keyfix_repair {

// =============================================================================
// Entries
// =============================================================================

/// A timestamp accessor that was regenerated
struct SamplerRepair {
    std::size_t animation_index = 0;
    std::string animation_name;
    std::size_t sampler_index = 0;
    std::int64_t accessor_index = -1;
    std::uint64_t count = 0;
    double old_min = 0.0;
    double old_max = 0.0;
    double new_min = 0.0;
    double new_max = 0.0;
    std::uint64_t bytes_written = 0;
};

/// A sampler that could not be checked or repaired
struct SamplerFailure {
    std::size_t animation_index = 0;
    std::string animation_name;
    std::size_t sampler_index = 0;
    std::int64_t accessor_index = -1;
    keyfix_core::Error error;

    /// "BufferBoundsError", "UnsupportedComponentTypeError", ...
    [[nodiscard]] std::string kind() const { return keyfix_core::error_kind_name(error); }

    [[nodiscard]] std::string reason() const { return error.message(); }

    [[nodiscard]] std::string describe() const;
};

/// Advisory finding; never repaired
enum class AnomalyKind : std::uint8_t {
    ExtremeBounds,      ///< Non-timestamp accessor with sentinel bounds
    DanglingReference,  ///< Index pointing outside its target array
    MissingSection,     ///< Structural section (scenes, nodes) absent
};

[[nodiscard]] const char* anomaly_kind_name(AnomalyKind kind);

struct Anomaly {
    AnomalyKind kind = AnomalyKind::ExtremeBounds;
    std::int64_t accessor_index = -1;
    std::string message;
    /// For ExtremeBounds: the decoded data is extreme as well, not only the bounds
    bool data_extreme = false;
};

// =============================================================================
// RepairReport
// =============================================================================

struct RepairReport {
    double frame_rate = 0.0;
    std::size_t samplers_scanned = 0;
    std::vector<SamplerRepair> repaired;
    std::vector<SamplerFailure> failures;
    std::vector<Anomaly> anomalies;
    std::uint64_t bytes_written = 0;

    [[nodiscard]] std::size_t repaired_count() const { return repaired.size(); }
    [[nodiscard]] std::size_t failed_count() const { return failures.size(); }
    [[nodiscard]] bool has_failures() const { return !failures.empty(); }

    /// Nothing repaired, nothing failed
    [[nodiscard]] bool is_clean() const { return repaired.empty() && failures.empty(); }
};

/// Machine-readable form of the report
[[nodiscard]] nlohmann::json to_json(const RepairReport& report);

/// Summary at info, every failure and anomaly at warn
void log_report(const RepairReport& report);

} // namespace keyfix_repair
