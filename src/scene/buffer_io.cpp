/// @file buffer_io.cpp
/// @brief Accessor layout resolution and little-endian float access

#include <keyfix/scene/buffer_io.hpp>

#include <cstring>
#include <limits>

namespace keyfix_scene {

namespace {

/// One past the last byte of count elements starting at offset, saturating at UINT64_MAX
std::uint64_t saturating_end(std::uint64_t offset, std::uint64_t count, std::uint64_t stride, std::uint64_t element_size) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    if (count == 0) {
        return offset;
    }
    if (offset > kMax - element_size) {
        return kMax;
    }
    std::uint64_t room = kMax - offset - element_size;
    if (count - 1 > room / stride) {
        return kMax;
    }
    return offset + (count - 1) * stride + element_size;
}

} // anonymous namespace

bool AccessorLayout::covers(std::uint64_t offset) const {
    if (count == 0 || offset < first_byte || offset >= end_byte()) {
        return false;
    }
    return (offset - first_byte) % stride < element_size;
}

keyfix_core::Result<AccessorLayout> resolve_accessor_layout(const Scene& scene, std::int64_t accessor_index) {
    using keyfix_core::BufferBoundsError;

    if (!scene.accessor_in_range(accessor_index)) {
        return keyfix_core::Err<AccessorLayout>(
            BufferBoundsError::accessor_index(accessor_index, scene.accessors.size()));
    }
    const Accessor& accessor = scene.accessors[static_cast<std::size_t>(accessor_index)];

    if (!accessor.buffer_view) {
        return keyfix_core::Err<AccessorLayout>(BufferBoundsError::missing_buffer_view(accessor_index));
    }
    std::int64_t view_index = *accessor.buffer_view;
    if (view_index < 0 || static_cast<std::size_t>(view_index) >= scene.buffer_views.size()) {
        return keyfix_core::Err<AccessorLayout>(
            BufferBoundsError::buffer_view_index(view_index, scene.buffer_views.size()));
    }
    const BufferView& view = scene.buffer_views[static_cast<std::size_t>(view_index)];

    if (view.buffer < 0 || static_cast<std::size_t>(view.buffer) >= scene.buffers.size()) {
        return keyfix_core::Err<AccessorLayout>(
            BufferBoundsError::buffer_index(view.buffer, scene.buffers.size()));
    }
    const Buffer& buffer = scene.buffers[static_cast<std::size_t>(view.buffer)];

    AccessorLayout layout;
    layout.accessor = accessor_index;
    layout.buffer = static_cast<std::size_t>(view.buffer);
    layout.first_byte = view.byte_offset + accessor.byte_offset;
    layout.element_size = accessor.element_size();
    layout.stride = view.byte_stride.value_or(0) != 0 ? *view.byte_stride : layout.element_size;
    layout.count = accessor.count;

    if (layout.element_size == 0) {
        return keyfix_core::Err<AccessorLayout>(
            keyfix_core::Error(keyfix_core::ErrorCode::InvalidArgument,
                "Accessor " + std::to_string(accessor_index) + " has unknown type '" + accessor.type +
                "' or componentType " + std::to_string(accessor.component_type)));
    }

    // View must sit inside the buffer, and the accessor inside the view
    const std::uint64_t buffer_size = buffer.data.size();
    const std::uint64_t view_end = saturating_end(view.byte_offset, 1, 1, view.byte_length);
    if (view_end > buffer_size) {
        return keyfix_core::Err<AccessorLayout>(
            BufferBoundsError::range_exceeded(accessor_index, view_end, buffer_size));
    }
    const std::uint64_t span = saturating_end(accessor.byte_offset, layout.count, layout.stride, layout.element_size);
    if (span > view.byte_length) {
        return keyfix_core::Err<AccessorLayout>(
            BufferBoundsError::view_exceeded(accessor_index, view_index, span, view.byte_length));
    }

    return keyfix_core::Ok(layout);
}

std::optional<float> read_f32_le(const std::vector<std::uint8_t>& bytes, std::uint64_t offset) {
    if (offset > bytes.size() || bytes.size() - offset < 4) {
        return std::nullopt;
    }
    std::uint32_t bits = static_cast<std::uint32_t>(bytes[offset])
        | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
        | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
        | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool write_f32_le(std::vector<std::uint8_t>& bytes, std::uint64_t offset, float value) {
    if (offset > bytes.size() || bytes.size() - offset < 4) {
        return false;
    }
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    bytes[offset] = static_cast<std::uint8_t>(bits & 0xFF);
    bytes[offset + 1] = static_cast<std::uint8_t>((bits >> 8) & 0xFF);
    bytes[offset + 2] = static_cast<std::uint8_t>((bits >> 16) & 0xFF);
    bytes[offset + 3] = static_cast<std::uint8_t>((bits >> 24) & 0xFF);
    return true;
}

std::optional<float> read_float_component(
    const std::vector<std::uint8_t>& bytes,
    const AccessorLayout& layout,
    std::uint64_t element,
    std::uint32_t component)
{
    if (element >= layout.count) {
        return std::nullopt;
    }
    return read_f32_le(bytes, layout.element_offset(element) + component * 4u);
}

std::vector<float> read_float_accessor(const Scene& scene, const AccessorLayout& layout, std::uint32_t components) {
    std::vector<float> out;
    const auto& bytes = scene.buffers[layout.buffer].data;
    out.reserve(layout.count * components);
    for (std::uint64_t i = 0; i < layout.count; ++i) {
        for (std::uint32_t c = 0; c < components; ++c) {
            auto value = read_float_component(bytes, layout, i, c);
            if (!value) {
                return out;
            }
            out.push_back(*value);
        }
    }
    return out;
}

} // namespace keyfix_scene
