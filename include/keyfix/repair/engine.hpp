#pragma once

/// @file engine.hpp
/// @brief Detection and repair of corrupted animation timestamp accessors

#include "fwd.hpp"
#include "corruption.hpp"
#include "report.hpp"
#include <keyfix/core/error.hpp>
#include <keyfix/scene/types.hpp>

#include <cstdint>
#include <optional>
#include <set>

namespace keyfix_repair {

/// Walks every animation sampler of a scene and regenerates timestamp
/// accessors whose declared bounds are sentinels.
///
/// For each corrupted input accessor the engine writes t[i] = i / frame_rate as
/// little-endian binary32 at the accessor's element offsets and sets min/max to
/// the first and last written value. Output accessors and all other bytes of the
/// buffer are left alone. A sampler that cannot be repaired is recorded in the
/// report and the remaining samplers are still processed.
///
/// Running the engine on its own output finds nothing to repair.
class TimingRepairEngine {
public:
    /// Create an engine; fails with ValidationError on an unusable config
    [[nodiscard]] static keyfix_core::Result<TimingRepairEngine> create(RepairConfig config);

    [[nodiscard]] const RepairConfig& config() const noexcept { return m_config; }

    /// Repair all samplers in document order and collect advisory anomalies
    [[nodiscard]] RepairReport run(keyfix_scene::Scene& scene) const;

private:
    explicit TimingRepairEngine(RepairConfig config) : m_config(config) {}

    /// nullopt when the sampler's timestamps are valid
    [[nodiscard]] keyfix_core::Result<std::optional<SamplerRepair>> process_sampler(
        keyfix_scene::Scene& scene, std::size_t animation_index, std::size_t sampler_index) const;

    /// Regenerate one accessor's timestamps and bounds
    [[nodiscard]] keyfix_core::Result<SamplerRepair> regenerate(
        keyfix_scene::Scene& scene, std::int64_t accessor_index) const;

    void scan_anomalies(const keyfix_scene::Scene& scene, RepairReport& report) const;

    /// Accessors holding spatial data: translation channel outputs and POSITION attributes
    [[nodiscard]] static std::set<std::int64_t> spatial_accessors(const keyfix_scene::Scene& scene);

    RepairConfig m_config;
};

} // namespace keyfix_repair
