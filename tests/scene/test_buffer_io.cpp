/// @file test_buffer_io.cpp
/// @brief Tests for accessor layout resolution and little-endian float access

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <keyfix/scene/buffer_io.hpp>

#include "support/scene_builder.hpp"

#include <limits>
#include <vector>

using namespace keyfix_scene;
using keyfix_core::BufferBoundsError;
using keyfix_test::SceneBuilder;

namespace {

/// Scene with one buffer of size bytes and one view/accessor pair
Scene single_accessor_scene(std::size_t bytes, std::uint64_t view_offset, std::optional<std::uint32_t> stride,
                            std::uint64_t accessor_offset, std::uint64_t count) {
    Scene scene;
    scene.buffers.push_back(Buffer{"", "scene.bin", bytes, std::vector<std::uint8_t>(bytes, 0)});
    scene.buffer_views.push_back(BufferView{"", 0, view_offset, bytes - view_offset, stride});
    Accessor accessor;
    accessor.buffer_view = 0;
    accessor.byte_offset = accessor_offset;
    accessor.component_type = 5126;
    accessor.count = count;
    accessor.type = "SCALAR";
    scene.accessors.push_back(accessor);
    return scene;
}

} // anonymous namespace

// =============================================================================
// Little-endian access
// =============================================================================

TEST_CASE("write_f32_le: byte order", "[scene][buffer_io]") {
    std::vector<std::uint8_t> bytes(8, 0xAA);

    REQUIRE(write_f32_le(bytes, 2, 1.0f));
    // 1.0f == 0x3F800000
    REQUIRE(bytes[2] == 0x00);
    REQUIRE(bytes[3] == 0x00);
    REQUIRE(bytes[4] == 0x80);
    REQUIRE(bytes[5] == 0x3F);

    REQUIRE(bytes[0] == 0xAA);
    REQUIRE(bytes[1] == 0xAA);
    REQUIRE(bytes[6] == 0xAA);
    REQUIRE(bytes[7] == 0xAA);
}

TEST_CASE("read_f32_le: decodes written values", "[scene][buffer_io]") {
    std::vector<std::uint8_t> bytes = {0x00, 0x00, 0x20, 0x41};  // 10.0f
    auto value = read_f32_le(bytes, 0);
    REQUIRE(value.has_value());
    REQUIRE(*value == 10.0f);
}

TEST_CASE("read/write_f32_le: out of range", "[scene][buffer_io]") {
    std::vector<std::uint8_t> bytes(6, 0);

    REQUIRE_FALSE(read_f32_le(bytes, 3).has_value());
    REQUIRE_FALSE(read_f32_le(bytes, 100).has_value());
    REQUIRE(read_f32_le(bytes, 2).has_value());

    REQUIRE_FALSE(write_f32_le(bytes, 3, 1.0f));
    REQUIRE(bytes == std::vector<std::uint8_t>(6, 0));
}

// =============================================================================
// Layout resolution
// =============================================================================

TEST_CASE("resolve_accessor_layout: packed", "[scene][buffer_io]") {
    Scene scene = single_accessor_scene(64, 8, std::nullopt, 4, 10);

    auto layout = resolve_accessor_layout(scene, 0);
    REQUIRE(layout.is_ok());
    REQUIRE(layout->first_byte == 12);
    REQUIRE(layout->stride == 4);
    REQUIRE(layout->element_size == 4);
    REQUIRE(layout->element_offset(3) == 24);
    REQUIRE(layout->end_byte() == 52);
}

TEST_CASE("resolve_accessor_layout: byteStride", "[scene][buffer_io]") {
    Scene scene = single_accessor_scene(64, 0, 12u, 0, 5);

    auto layout = resolve_accessor_layout(scene, 0);
    REQUIRE(layout.is_ok());
    REQUIRE(layout->stride == 12);
    REQUIRE(layout->element_offset(4) == 48);
    REQUIRE(layout->end_byte() == 52);

    SECTION("covers only element bytes") {
        REQUIRE(layout->covers(0));
        REQUIRE(layout->covers(3));
        REQUIRE_FALSE(layout->covers(4));
        REQUIRE_FALSE(layout->covers(11));
        REQUIRE(layout->covers(12));
        REQUIRE(layout->covers(51));
        REQUIRE_FALSE(layout->covers(52));
    }
}

TEST_CASE("resolve_accessor_layout: zero stride means packed", "[scene][buffer_io]") {
    Scene scene = single_accessor_scene(16, 0, 0u, 0, 4);
    auto layout = resolve_accessor_layout(scene, 0);
    REQUIRE(layout.is_ok());
    REQUIRE(layout->stride == 4);
}

TEST_CASE("resolve_accessor_layout: failures", "[scene][buffer_io]") {
    SECTION("accessor index") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 0, 4);
        auto layout = resolve_accessor_layout(scene, 5);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().as<BufferBoundsError>()->kind == BufferBoundsError::Kind::AccessorIndex);
    }

    SECTION("missing buffer view") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 0, 4);
        scene.accessors[0].buffer_view.reset();
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().as<BufferBoundsError>()->kind == BufferBoundsError::Kind::MissingBufferView);
    }

    SECTION("buffer view index") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 0, 4);
        scene.accessors[0].buffer_view = 7;
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().as<BufferBoundsError>()->kind == BufferBoundsError::Kind::BufferViewIndex);
    }

    SECTION("buffer index") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 0, 4);
        scene.buffer_views[0].buffer = 1;
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().as<BufferBoundsError>()->kind == BufferBoundsError::Kind::BufferIndex);
    }

    SECTION("range exceeded by one byte") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 1, 4);
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        const auto* err = layout.error().as<BufferBoundsError>();
        REQUIRE(err->kind == BufferBoundsError::Kind::RangeExceeded);
        REQUIRE(err->required == 17);
        REQUIRE(err->available == 16);
    }

    SECTION("runs past its bufferView") {
        Scene scene = single_accessor_scene(32, 0, std::nullopt, 0, 4);
        scene.buffer_views[0].byte_length = 12;
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        const auto* err = layout.error().as<BufferBoundsError>();
        REQUIRE(err->kind == BufferBoundsError::Kind::RangeExceeded);
        REQUIRE(err->required == 16);
        REQUIRE(err->available == 12);
    }

    SECTION("bufferView runs past the buffer") {
        Scene scene = single_accessor_scene(16, 4, std::nullopt, 0, 1);
        scene.buffer_views[0].byte_length = 16;
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        const auto* err = layout.error().as<BufferBoundsError>();
        REQUIRE(err->kind == BufferBoundsError::Kind::RangeExceeded);
        REQUIRE(err->required == 20);
        REQUIRE(err->available == 16);
    }

    SECTION("huge count does not wrap") {
        Scene scene = single_accessor_scene(64, 0, std::nullopt, 0, (std::uint64_t{1} << 62) + 1);
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        const auto* err = layout.error().as<BufferBoundsError>();
        REQUIRE(err->kind == BufferBoundsError::Kind::RangeExceeded);
        REQUIRE(err->required == std::numeric_limits<std::uint64_t>::max());
    }

    SECTION("huge accessor offset does not wrap") {
        Scene scene = single_accessor_scene(64, 0, std::nullopt, std::numeric_limits<std::uint64_t>::max() - 1, 1);
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().as<BufferBoundsError>()->kind == BufferBoundsError::Kind::RangeExceeded);
    }

    SECTION("unknown element type") {
        Scene scene = single_accessor_scene(16, 0, std::nullopt, 0, 4);
        scene.accessors[0].type = "VEC7";
        auto layout = resolve_accessor_layout(scene, 0);
        REQUIRE(layout.is_err());
        REQUIRE(layout.error().code() == keyfix_core::ErrorCode::InvalidArgument);
    }
}

// =============================================================================
// Accessor decoding
// =============================================================================

TEST_CASE("read_float_accessor: VEC3 data", "[scene][buffer_io]") {
    SceneBuilder builder;
    builder.add_floats({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, {1, 2, 3}, {4, 5, 6}, "VEC3");
    Scene scene = builder.build();

    auto layout = resolve_accessor_layout(scene, 0);
    REQUIRE(layout.is_ok());
    REQUIRE(layout->count == 2);

    auto values = read_float_accessor(scene, *layout, 3);
    REQUIRE(values.size() == 6);
    REQUIRE(values[0] == Catch::Approx(1.0));
    REQUIRE(values[5] == Catch::Approx(6.0));

    auto component = read_float_component(scene.buffers[0].data, *layout, 1, 1);
    REQUIRE(component.has_value());
    REQUIRE(*component == Catch::Approx(5.0));
    REQUIRE_FALSE(read_float_component(scene.buffers[0].data, *layout, 2, 0).has_value());
}
