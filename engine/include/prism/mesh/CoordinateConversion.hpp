#pragma once
#include <functional>
#include <optional>
#include <string_view>
#include <glm/glm.hpp>

namespace prism::mesh {

    // Maps a glTF (right-handed) vector into the target convention. Applied to positions,
    // normals and morph deltas. Must be a pure function.
    using AxisInverter = std::function<glm::vec3(const glm::vec3&)>;

    namespace axis {
        inline glm::vec3 reverseZ(const glm::vec3& v) { return {v.x, v.y, -v.z}; }
        inline glm::vec3 reverseX(const glm::vec3& v) { return {-v.x, v.y, v.z}; }
        inline glm::vec3 identity(const glm::vec3& v) { return v; }

        // "reverseZ", "reverseX" or "identity".
        std::optional<AxisInverter> fromName(std::string_view name);
    }

    enum class UvConvention {
        Current,    // (u, 1 - v) on both channels
        LegacyFlipY // (u, -v) on UV0, written by UniGLTF 1.16 and older
    };

    // Decides the convention from asset.generator. Unparseable UniGLTF versions are
    // reported and treated as current.
    UvConvention resolveUvConvention(std::string_view generator);

    // "current" or "legacy".
    std::optional<UvConvention> uvConventionFromName(std::string_view name);

    inline glm::vec2 convertUv0(const glm::vec2& uv, UvConvention convention) {
        if (convention == UvConvention::LegacyFlipY) {
            return {uv.x, -uv.y};
        }
        return {uv.x, 1.0F - uv.y};
    }

    inline glm::vec2 convertUv1(const glm::vec2& uv) {
        return {uv.x, 1.0F - uv.y};
    }

}
