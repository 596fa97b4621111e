/// @file types.cpp
/// @brief glTF component and element type helpers

#include <keyfix/scene/types.hpp>

namespace keyfix_scene {

std::uint32_t component_size(std::uint32_t component_type) {
    switch (static_cast<ComponentType>(component_type)) {
        case ComponentType::Byte:
        case ComponentType::UnsignedByte:
            return 1;
        case ComponentType::Short:
        case ComponentType::UnsignedShort:
            return 2;
        case ComponentType::UnsignedInt:
        case ComponentType::Float:
            return 4;
        default:
            return 0;
    }
}

const char* component_type_name(std::uint32_t component_type) {
    switch (static_cast<ComponentType>(component_type)) {
        case ComponentType::Byte: return "BYTE";
        case ComponentType::UnsignedByte: return "UNSIGNED_BYTE";
        case ComponentType::Short: return "SHORT";
        case ComponentType::UnsignedShort: return "UNSIGNED_SHORT";
        case ComponentType::UnsignedInt: return "UNSIGNED_INT";
        case ComponentType::Float: return "FLOAT";
        default: return "UNKNOWN";
    }
}

std::optional<ElementType> parse_element_type(const std::string& str) {
    if (str == "SCALAR") return ElementType::Scalar;
    if (str == "VEC2") return ElementType::Vec2;
    if (str == "VEC3") return ElementType::Vec3;
    if (str == "VEC4") return ElementType::Vec4;
    if (str == "MAT2") return ElementType::Mat2;
    if (str == "MAT3") return ElementType::Mat3;
    if (str == "MAT4") return ElementType::Mat4;
    return std::nullopt;
}

std::uint32_t component_count(ElementType type) {
    switch (type) {
        case ElementType::Scalar: return 1;
        case ElementType::Vec2: return 2;
        case ElementType::Vec3: return 3;
        case ElementType::Vec4: return 4;
        case ElementType::Mat2: return 4;
        case ElementType::Mat3: return 9;
        case ElementType::Mat4: return 16;
    }
    return 0;
}

std::uint32_t Accessor::element_size() const {
    auto element = element_type();
    if (!element) {
        return 0;
    }
    return component_size(component_type) * component_count(*element);
}

} // namespace keyfix_scene
