#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keyfix_repair module

#include <cstdint>

namespace keyfix_repair {

struct RepairConfig;
struct ScalarBounds;

struct SamplerRepair;
struct SamplerFailure;
enum class AnomalyKind : std::uint8_t;
struct Anomaly;
struct RepairReport;

class TimingRepairEngine;

} // namespace keyfix_repair
