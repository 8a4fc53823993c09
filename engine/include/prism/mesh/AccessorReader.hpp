#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

namespace prism::mesh {

    // glTF accessor component types. Only the unsigned integer ones are valid for indices.
    enum class ComponentType : uint32_t {
        Byte = 5120,
        UnsignedByte = 5121,
        Short = 5122,
        UnsignedShort = 5123,
        UnsignedInt = 5125,
        Float = 5126
    };

    constexpr std::string_view componentTypeToString(ComponentType type) {
        switch (type) {
        case ComponentType::Byte:          return "BYTE";
        case ComponentType::UnsignedByte:  return "UNSIGNED_BYTE";
        case ComponentType::Short:         return "SHORT";
        case ComponentType::UnsignedShort: return "UNSIGNED_SHORT";
        case ComponentType::UnsignedInt:   return "UNSIGNED_INT";
        case ComponentType::Float:         return "FLOAT";
        default:                           return "UNKNOWN";
        }
    }

    // Tightly packed index data, still in its source width.
    struct IndexBuffer {
        ComponentType componentType = ComponentType::UnsignedInt;
        size_t count = 0;
        std::vector<std::byte> bytes;
    };

    class IAccessorReader {
    public:
        virtual ~IAccessorReader() = default;

        virtual size_t count(int32_t accessorIndex) const = 0;

        virtual std::vector<glm::vec2> readVec2(int32_t accessorIndex) const = 0;
        virtual std::vector<glm::vec3> readVec3(int32_t accessorIndex) const = 0;
        // VEC3 colors are widened with alpha = 1.
        virtual std::vector<glm::vec4> readColor(int32_t accessorIndex) const = 0;
        virtual std::vector<glm::uvec4> readJoints(int32_t accessorIndex) const = 0;
        virtual std::vector<glm::vec4> readWeights(int32_t accessorIndex) const = 0;
        virtual IndexBuffer readIndices(int32_t accessorIndex) const = 0;
    };

}
