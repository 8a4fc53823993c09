#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prism::mesh {

    // Accessor / material index sentinel meaning "not present".
    inline constexpr int32_t kNoAccessor = -1;
    inline constexpr int32_t kNoMaterial = -1;

    struct PrimitiveAttributes {
        int32_t position = kNoAccessor;
        int32_t normal = kNoAccessor;
        int32_t tangent = kNoAccessor;
        int32_t texCoord0 = kNoAccessor;
        int32_t texCoord1 = kNoAccessor;
        int32_t color0 = kNoAccessor;
        int32_t joints0 = kNoAccessor;
        int32_t weights0 = kNoAccessor;

        bool operator==(const PrimitiveAttributes&) const = default;

        [[nodiscard]] bool hasNormal() const { return normal != kNoAccessor; }
        [[nodiscard]] bool hasSkin() const { return joints0 != kNoAccessor || weights0 != kNoAccessor; }
    };

    struct MorphTargetAttributes {
        int32_t position = kNoAccessor;
        int32_t normal = kNoAccessor;
        int32_t tangent = kNoAccessor;
    };

    struct PrimitiveDescription {
        PrimitiveAttributes attributes;
        int32_t indices = kNoAccessor;
        int32_t material = kNoMaterial;
        std::vector<MorphTargetAttributes> targets;
    };

    // One glTF mesh as seen by the decoder. targetNames comes from mesh.extras.targetNames.
    struct MeshDescription {
        std::string name;
        uint32_t meshIndex = 0;
        std::vector<PrimitiveDescription> primitives;
        std::optional<std::vector<std::string>> targetNames;
    };

}
