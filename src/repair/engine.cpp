/// @file engine.cpp
/// @brief Timing repair engine implementation

#include <keyfix/repair/engine.hpp>
#include <keyfix/scene/buffer_io.hpp>
#include <keyfix/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace keyfix_repair {

using keyfix_core::BufferBoundsError;
using keyfix_core::Error;
using keyfix_scene::Scene;

namespace {

std::string format_values(const std::vector<double>& values) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

keyfix_core::Result<TimingRepairEngine> TimingRepairEngine::create(RepairConfig config) {
    if (auto valid = config.validate(); !valid) {
        return keyfix_core::Err<TimingRepairEngine>(valid.error());
    }
    return keyfix_core::Ok(TimingRepairEngine(config));
}

// =============================================================================
// Run
// =============================================================================

RepairReport TimingRepairEngine::run(Scene& scene) const {
    KEYFIX_LOG_SCOPE("timing repair");
    auto log = keyfix_core::repair_logger();

    RepairReport report;
    report.frame_rate = m_config.frame_rate;

    for (std::size_t a = 0; a < scene.animations.size(); ++a) {
        const std::string name = scene.animations[a].display_name(a);
        const std::size_t samplers = scene.animations[a].samplers.size();

        for (std::size_t s = 0; s < samplers; ++s) {
            ++report.samplers_scanned;
            std::int64_t input = scene.animations[a].samplers[s].input;

            auto outcome = process_sampler(scene, a, s);
            if (!outcome) {
                Error error = outcome.error();
                error.with_context("animation", name).with_context("sampler", std::to_string(s));
                log->warn("Animation '{}' sampler {}: {}", name, s, error.message());
                report.failures.push_back(SamplerFailure{a, name, s, input, std::move(error)});
                continue;
            }

            if (auto& repair = *outcome) {
                repair->animation_name = name;
                repair->sampler_index = s;
                repair->animation_index = a;
                report.bytes_written += repair->bytes_written;
                log->debug("Animation '{}' sampler {}: regenerated {} timestamps on accessor {} "
                    "({:.3g}..{:.3g} -> {:.4f}..{:.4f})",
                    name, s, repair->count, repair->accessor_index,
                    repair->old_min, repair->old_max, repair->new_min, repair->new_max);
                report.repaired.push_back(std::move(*repair));
            }
        }
    }

    scan_anomalies(scene, report);

    log->info("Repaired {} of {} samplers at {} fps ({} failed)",
        report.repaired_count(), report.samplers_scanned, m_config.frame_rate, report.failed_count());

    return report;
}

keyfix_core::Result<std::optional<SamplerRepair>> TimingRepairEngine::process_sampler(
    Scene& scene, std::size_t animation_index, std::size_t sampler_index) const
{
    using Outcome = std::optional<SamplerRepair>;

    const auto& sampler = scene.animations[animation_index].samplers[sampler_index];
    if (!scene.accessor_in_range(sampler.input)) {
        return keyfix_core::Err<Outcome>(BufferBoundsError::accessor_index(sampler.input, scene.accessors.size()));
    }

    const auto& accessor = scene.accessors[static_cast<std::size_t>(sampler.input)];
    ScalarBounds bounds = scalar_bounds(accessor);
    if (!is_corrupted(bounds.min, bounds.max, m_config.corruption_threshold)) {
        return keyfix_core::Ok(Outcome{});
    }

    auto repair = regenerate(scene, sampler.input);
    if (!repair) {
        return keyfix_core::Err<Outcome>(repair.error());
    }
    repair->old_min = bounds.min;
    repair->old_max = bounds.max;
    return keyfix_core::Ok(Outcome{std::move(*repair)});
}

keyfix_core::Result<SamplerRepair> TimingRepairEngine::regenerate(Scene& scene, std::int64_t accessor_index) const {
    auto& accessor = scene.accessors[static_cast<std::size_t>(accessor_index)];

    auto element = accessor.element_type();
    if (!accessor.is_float() || !element || *element != keyfix_scene::ElementType::Scalar) {
        return keyfix_core::Err<SamplerRepair>(keyfix_core::UnsupportedComponentTypeError::make(
            accessor_index, accessor.component_type,
            std::string(keyfix_scene::component_type_name(accessor.component_type)) + " " + accessor.type));
    }
    if (accessor.count == 0) {
        return keyfix_core::Err<SamplerRepair>(BufferBoundsError::empty_accessor(accessor_index));
    }

    // The whole element range is validated before the first byte is touched
    auto layout = keyfix_scene::resolve_accessor_layout(scene, accessor_index);
    if (!layout) {
        return keyfix_core::Err<SamplerRepair>(layout.error());
    }

    std::vector<float> times = synthesize_timestamps(accessor.count, m_config.frame_period());
    auto& bytes = scene.buffers[layout->buffer].data;
    for (std::uint64_t i = 0; i < times.size(); ++i) {
        if (!keyfix_scene::write_f32_le(bytes, layout->element_offset(i), times[i])) {
            return keyfix_core::Err<SamplerRepair>(
                BufferBoundsError::range_exceeded(accessor_index, layout->end_byte(), bytes.size()));
        }
    }

    SamplerRepair repair;
    repair.accessor_index = accessor_index;
    repair.count = accessor.count;
    repair.new_min = static_cast<double>(times.front());
    repair.new_max = static_cast<double>(times.back());
    repair.bytes_written = accessor.count * sizeof(float);

    accessor.set_bounds({repair.new_min}, {repair.new_max});
    return keyfix_core::Ok(std::move(repair));
}

// =============================================================================
// Advisory Checks
// =============================================================================

std::set<std::int64_t> TimingRepairEngine::spatial_accessors(const Scene& scene) {
    std::set<std::int64_t> result;
    for (const auto& anim : scene.animations) {
        for (const auto& channel : anim.channels) {
            if (channel.path != "translation") {
                continue;
            }
            if (channel.sampler < 0 || static_cast<std::size_t>(channel.sampler) >= anim.samplers.size()) {
                continue;
            }
            result.insert(anim.samplers[static_cast<std::size_t>(channel.sampler)].output);
        }
    }
    for (const auto& mesh : scene.meshes) {
        for (const auto& prim : mesh.primitives) {
            auto it = prim.attributes.find("POSITION");
            if (it != prim.attributes.end()) {
                result.insert(it->second);
            }
        }
    }
    return result;
}

void TimingRepairEngine::scan_anomalies(const Scene& scene, RepairReport& report) const {
    for (const auto& issue : scene.reference_issues) {
        Anomaly anomaly;
        anomaly.kind = AnomalyKind::DanglingReference;
        anomaly.accessor_index = issue.owner == "accessor" ? issue.owner_index : -1;
        anomaly.message = issue.message();
        report.anomalies.push_back(std::move(anomaly));
    }

    for (const char* section : {"scenes", "nodes"}) {
        bool present = std::string(section) == "scenes" ? scene.has_scenes : scene.has_nodes;
        if (!present) {
            report.anomalies.push_back(Anomaly{
                AnomalyKind::MissingSection, -1, std::string("Missing section '") + section + "'", false});
        }
    }

    const double threshold = m_config.corruption_threshold;
    for (std::int64_t index : spatial_accessors(scene)) {
        if (!scene.accessor_in_range(index)) {
            continue;  // already reported as a dangling reference
        }
        const auto& accessor = scene.accessors[static_cast<std::size_t>(index)];
        if (!has_extreme_bounds(accessor, threshold)) {
            continue;
        }

        Anomaly anomaly;
        anomaly.kind = AnomalyKind::ExtremeBounds;
        anomaly.accessor_index = index;

        std::string data_note = "data not inspected";
        auto element = accessor.element_type();
        if (accessor.is_float() && element) {
            auto layout = keyfix_scene::resolve_accessor_layout(scene, index);
            if (layout) {
                auto values = keyfix_scene::read_float_accessor(scene, *layout, keyfix_scene::component_count(*element));
                anomaly.data_extreme = std::any_of(values.begin(), values.end(),
                    [threshold](float v) { return is_extreme_float(v, threshold); });
                data_note = anomaly.data_extreme ? "decoded data is extreme too" : "decoded data is within range";
            } else {
                data_note = "data unreadable: " + layout.error().message();
            }
        }

        anomaly.message = "Accessor " + std::to_string(index) + " (" + accessor.type + ") has extreme bounds min=" +
            format_values(accessor.min) + " max=" + format_values(accessor.max) + "; " + data_note;
        report.anomalies.push_back(std::move(anomaly));
    }
}

} // namespace keyfix_repair
