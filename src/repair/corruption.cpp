/// @file corruption.cpp
/// @brief Sentinel-bounds detection and timestamp synthesis

#include <keyfix/repair/corruption.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace keyfix_repair {

keyfix_core::Result<void> RepairConfig::validate() const {
    if (!std::isfinite(frame_rate) || frame_rate <= 0.0) {
        return keyfix_core::Error(keyfix_core::ErrorCode::ValidationError,
            "frame_rate must be a positive finite number, got " + std::to_string(frame_rate));
    }
    if (!std::isfinite(corruption_threshold) || corruption_threshold <= 0.0) {
        return keyfix_core::Error(keyfix_core::ErrorCode::ValidationError,
            "corruption_threshold must be a positive finite number, got " + std::to_string(corruption_threshold));
    }
    return keyfix_core::Ok();
}

bool is_sentinel(double value, double threshold) {
    return std::isnan(value) || std::isinf(value) || std::fabs(value) > threshold;
}

bool is_extreme_float(float value, double threshold) {
    if (!std::isfinite(value)) {
        return true;
    }
    const double limit = std::min(threshold, static_cast<double>(std::numeric_limits<float>::max()));
    return std::fabs(static_cast<double>(value)) >= limit;
}

bool is_corrupted(double min, double max, double threshold) {
    if (is_sentinel(min, threshold) || is_sentinel(max, threshold)) {
        return true;
    }
    return min > max;
}

ScalarBounds scalar_bounds(const keyfix_scene::Accessor& accessor) {
    ScalarBounds bounds;
    if (!accessor.min.empty()) {
        bounds.min = accessor.min.front();
    }
    if (!accessor.max.empty()) {
        bounds.max = accessor.max.front();
    }
    return bounds;
}

bool has_extreme_bounds(const keyfix_scene::Accessor& accessor, double threshold) {
    auto sentinel = [threshold](double v) { return is_sentinel(v, threshold); };
    if (std::any_of(accessor.min.begin(), accessor.min.end(), sentinel) ||
        std::any_of(accessor.max.begin(), accessor.max.end(), sentinel)) {
        return true;
    }
    std::size_t n = std::min(accessor.min.size(), accessor.max.size());
    for (std::size_t c = 0; c < n; ++c) {
        if (accessor.min[c] > accessor.max[c]) {
            return true;
        }
    }
    return false;
}

std::vector<float> synthesize_timestamps(std::uint64_t count, double frame_period) {
    std::vector<float> times;
    times.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        times.push_back(static_cast<float>(static_cast<double>(i) * frame_period));
    }
    return times;
}

} // namespace keyfix_repair
