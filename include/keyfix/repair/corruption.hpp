#pragma once

/// @file corruption.hpp
/// @brief Sentinel-bounds detection and timestamp synthesis

#include "fwd.hpp"
#include <keyfix/core/error.hpp>
#include <keyfix/scene/types.hpp>

#include <cstdint>
#include <vector>

namespace keyfix_repair {

/// Magnitude above which a bound is treated as a converter sentinel
inline constexpr double kDefaultCorruptionThreshold = 1e100;

/// Default frame rate assumed when regenerating timestamps
inline constexpr double kDefaultFrameRate = 30.0;

// =============================================================================
// RepairConfig
// =============================================================================

/// Engine parameters
struct RepairConfig {
    /// Frames per second of the synthesized timeline. Uniform spacing is an
    /// assumption: the original per-frame timing cannot be recovered.
    double frame_rate = kDefaultFrameRate;
    double corruption_threshold = kDefaultCorruptionThreshold;

    [[nodiscard]] double frame_period() const { return 1.0 / frame_rate; }

    /// frame_rate and corruption_threshold must be finite and positive
    [[nodiscard]] keyfix_core::Result<void> validate() const;
};

// =============================================================================
// Detection
// =============================================================================

/// Declared bounds of a SCALAR accessor
struct ScalarBounds {
    double min = 0.0;
    double max = 0.0;
};

/// True for a value that cannot be a real bound
[[nodiscard]] bool is_sentinel(double value, double threshold = kDefaultCorruptionThreshold);

/// True for a decoded binary32 value that cannot be real data: non-finite, or
/// at or beyond the smaller of threshold and FLT_MAX in magnitude
[[nodiscard]] bool is_extreme_float(float value, double threshold = kDefaultCorruptionThreshold);

/// True when the declared [min, max] pair is unusable: either value is
/// non-finite or beyond threshold in magnitude, or min > max
[[nodiscard]] bool is_corrupted(double min, double max, double threshold = kDefaultCorruptionThreshold);

/// First component of the declared bounds; a missing array reads as 0
[[nodiscard]] ScalarBounds scalar_bounds(const keyfix_scene::Accessor& accessor);

/// True when any declared component of min/max is a sentinel, or some min[c] > max[c]
[[nodiscard]] bool has_extreme_bounds(const keyfix_scene::Accessor& accessor, double threshold);

// =============================================================================
// Synthesis
// =============================================================================

/// t[i] = i * frame_period for i in [0, count), encoded as binary32
[[nodiscard]] std::vector<float> synthesize_timestamps(std::uint64_t count, double frame_period);

} // namespace keyfix_repair
