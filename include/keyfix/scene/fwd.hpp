#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keyfix_scene module

#include <cstdint>

namespace keyfix_scene {

enum class ComponentType : std::uint32_t;
enum class ElementType : std::uint8_t;

struct Buffer;
struct BufferView;
struct Accessor;
struct AnimationSampler;
struct AnimationChannel;
struct Animation;
struct MeshPrimitive;
struct Mesh;
struct ReferenceIssue;
struct Scene;

struct AccessorLayout;
struct OutputPaths;

} // namespace keyfix_scene
