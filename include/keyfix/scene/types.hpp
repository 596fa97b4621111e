#pragma once

/// @file types.hpp
/// @brief Typed view of a glTF 2.0 scene document and its binary buffer
///
/// Only the parts needed to locate and patch animation timestamps are modeled.
/// Everything else stays in Scene::document and is written back untouched.

#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace keyfix_scene {

// =============================================================================
// Component / Element Types
// =============================================================================

/// glTF accessor componentType values
enum class ComponentType : std::uint32_t {
    Byte = 5120,
    UnsignedByte = 5121,
    Short = 5122,
    UnsignedShort = 5123,
    UnsignedInt = 5125,
    Float = 5126,
};

/// Size in bytes of one component, 0 for values outside the glTF set
[[nodiscard]] std::uint32_t component_size(std::uint32_t component_type);

/// Readable name of a componentType value ("FLOAT", "UNSIGNED_SHORT", ...)
[[nodiscard]] const char* component_type_name(std::uint32_t component_type);

/// glTF accessor type
enum class ElementType : std::uint8_t {
    Scalar,
    Vec2,
    Vec3,
    Vec4,
    Mat2,
    Mat3,
    Mat4,
};

/// Parse an accessor "type" string
[[nodiscard]] std::optional<ElementType> parse_element_type(const std::string& str);

/// Number of components per element
[[nodiscard]] std::uint32_t component_count(ElementType type);

// =============================================================================
// Buffers
// =============================================================================

/// Raw payload referenced by the document
struct Buffer {
    std::string name;
    std::string uri;
    std::uint64_t declared_length = 0;
    std::vector<std::uint8_t> data;
};

/// Largest byteStride glTF allows
inline constexpr std::uint32_t kMaxByteStride = 252;

/// Sub-region of a buffer
struct BufferView {
    std::string name;
    std::int64_t buffer = -1;
    std::uint64_t byte_offset = 0;
    std::uint64_t byte_length = 0;
    std::optional<std::uint32_t> byte_stride;
};

/// Typed, strided view into a buffer view
struct Accessor {
    std::string name;
    std::optional<std::int64_t> buffer_view;
    std::uint64_t byte_offset = 0;
    std::uint32_t component_type = 0;
    std::uint64_t count = 0;
    std::string type;
    bool normalized = false;
    std::vector<double> min;
    std::vector<double> max;

    /// Set when min/max were rewritten and must be merged into the document
    bool bounds_modified = false;

    [[nodiscard]] bool is_float() const {
        return component_type == static_cast<std::uint32_t>(ComponentType::Float);
    }

    [[nodiscard]] std::optional<ElementType> element_type() const {
        return parse_element_type(type);
    }

    /// Bytes occupied by one element, 0 if type or componentType is unknown
    [[nodiscard]] std::uint32_t element_size() const;

    /// Replace both bounds and mark them for write-back
    void set_bounds(std::vector<double> new_min, std::vector<double> new_max) {
        min = std::move(new_min);
        max = std::move(new_max);
        bounds_modified = true;
    }
};

// =============================================================================
// Animations
// =============================================================================

struct AnimationSampler {
    std::int64_t input = -1;
    std::int64_t output = -1;
    std::string interpolation = "LINEAR";
};

struct AnimationChannel {
    std::int64_t sampler = -1;
    std::optional<std::int64_t> node;
    std::string path;
};

struct Animation {
    std::string name;
    std::vector<AnimationChannel> channels;
    std::vector<AnimationSampler> samplers;

    /// Name for reports, falls back to "#<index>" for unnamed animations
    [[nodiscard]] std::string display_name(std::size_t index) const {
        return name.empty() ? "#" + std::to_string(index) : name;
    }
};

// =============================================================================
// Meshes
// =============================================================================

struct MeshPrimitive {
    std::map<std::string, std::int64_t> attributes;
};

struct Mesh {
    std::string name;
    std::vector<MeshPrimitive> primitives;
};

// =============================================================================
// Reference Issues
// =============================================================================

/// Dangling index found while linking the document
struct ReferenceIssue {
    std::string owner;        // "accessor", "bufferView", "animation", ...
    std::int64_t owner_index = -1;
    std::string field;        // "bufferView", "buffer", "input", ...
    std::int64_t target = -1;
    std::size_t limit = 0;    // size of the referenced array

    [[nodiscard]] std::string message() const {
        return owner + " " + std::to_string(owner_index) + " references invalid " + field + " " +
            std::to_string(target) + " (" + std::to_string(limit) + " available)";
    }
};

// =============================================================================
// Scene
// =============================================================================

/// Parsed glTF document plus its single external buffer
struct Scene {
    /// Original document; unmodeled sections are passed through from here
    nlohmann::json document;

    std::filesystem::path source_path;
    std::filesystem::path binary_path;

    std::vector<Buffer> buffers;
    std::vector<BufferView> buffer_views;
    std::vector<Accessor> accessors;
    std::vector<Animation> animations;
    std::vector<Mesh> meshes;

    /// Dangling cross references, collected once at load time
    std::vector<ReferenceIssue> reference_issues;

    bool has_scenes = false;
    bool has_nodes = false;

    [[nodiscard]] std::size_t sampler_count() const {
        std::size_t total = 0;
        for (const auto& anim : animations) {
            total += anim.samplers.size();
        }
        return total;
    }

    [[nodiscard]] bool accessor_in_range(std::int64_t index) const {
        return index >= 0 && static_cast<std::size_t>(index) < accessors.size();
    }
};

} // namespace keyfix_scene
