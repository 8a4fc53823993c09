#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "prism/mesh/MeshError.hpp"

namespace prism::mesh {

    struct MeshVertex {
        glm::vec3 position{0.0F};
        glm::vec3 normal{0.0F};
        glm::vec2 uv0{0.0F};
        glm::vec2 uv1{0.0F};
        glm::vec4 color{1.0F};

        bool operator==(const MeshVertex&) const = default;
    };

    struct SkinVertex {
        glm::uvec4 joints{0U};
        glm::vec4 weights{0.0F};

        bool operator==(const SkinVertex&) const = default;
    };

    struct Submesh {
        uint32_t indexOffset = 0;
        uint32_t indexCount = 0;
        int32_t materialIndex = 0;

        bool operator==(const Submesh&) const = default;
    };

    struct BlendShape {
        std::string name;
        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<glm::vec3> tangents;

        bool operator==(const BlendShape&) const = default;
    };

    enum class BufferMode : uint8_t {
        Shared,
        Independent
    };

    constexpr const char* bufferModeToString(BufferMode mode) {
        return mode == BufferMode::Shared ? "shared" : "independent";
    }

    // Decoded geometry of one mesh id, before packaging.
    struct MeshBuildResult {
        std::string name;
        BufferMode mode = BufferMode::Shared;
        std::vector<MeshVertex> vertices;
        std::vector<SkinVertex> skinVertices; // empty when the mesh has no skin
        std::vector<uint32_t> indices;
        std::vector<Submesh> submeshes;
        std::vector<int32_t> materialIndices;
        std::vector<BlendShape> blendShapes;
        bool hasNormals = true;
        std::vector<MeshWarning> warnings;

        [[nodiscard]] bool hasSkin() const { return !skinVertices.empty(); }
    };

}
