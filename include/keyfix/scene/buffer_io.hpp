#pragma once

/// @file buffer_io.hpp
/// @brief Byte-level access to accessor data inside a scene buffer
///
/// glTF buffers are little-endian. All reads and writes here go through explicit
/// byte assembly, so results do not depend on host byte order.

#include "types.hpp"
#include <keyfix/core/error.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace keyfix_scene {

// =============================================================================
// AccessorLayout
// =============================================================================

/// Resolved location of an accessor's elements in its buffer
struct AccessorLayout {
    std::int64_t accessor = -1;
    std::size_t buffer = 0;
    std::uint64_t first_byte = 0;    ///< bufferView.byteOffset + accessor.byteOffset
    std::uint64_t stride = 0;        ///< bufferView.byteStride or the element size
    std::uint32_t element_size = 0;
    std::uint64_t count = 0;

    /// Absolute offset of element i
    [[nodiscard]] std::uint64_t element_offset(std::uint64_t i) const {
        return first_byte + i * stride;
    }

    /// One past the last byte touched by the accessor
    [[nodiscard]] std::uint64_t end_byte() const {
        return count == 0 ? first_byte : element_offset(count - 1) + element_size;
    }

    /// True if byte offset falls inside one of the accessor's elements
    [[nodiscard]] bool covers(std::uint64_t offset) const;
};

/// Resolve where an accessor's elements live.
///
/// Fails with BufferBoundsError when the accessor, its bufferView or the view's
/// buffer index is out of range, when the accessor has no bufferView, when its
/// element size is unknown, when the view runs past the buffer end, or when the
/// last element runs past the end of its bufferView. Range checks saturate, so a
/// huge declared count fails instead of wrapping.
[[nodiscard]] keyfix_core::Result<AccessorLayout> resolve_accessor_layout(
    const Scene& scene, std::int64_t accessor_index);

// =============================================================================
// Little-endian float access
// =============================================================================

/// Read a binary32 value at offset; nullopt if the 4 bytes are not in range
[[nodiscard]] std::optional<float> read_f32_le(const std::vector<std::uint8_t>& bytes, std::uint64_t offset);

/// Write a binary32 value at offset; false if the 4 bytes are not in range
[[nodiscard]] bool write_f32_le(std::vector<std::uint8_t>& bytes, std::uint64_t offset, float value);

/// Decode component c of element i of a FLOAT accessor
[[nodiscard]] std::optional<float> read_float_component(
    const std::vector<std::uint8_t>& bytes,
    const AccessorLayout& layout,
    std::uint64_t element,
    std::uint32_t component);

/// Decode all components of a FLOAT accessor, element-major
[[nodiscard]] std::vector<float> read_float_accessor(
    const Scene& scene, const AccessorLayout& layout, std::uint32_t components);

} // namespace keyfix_scene
