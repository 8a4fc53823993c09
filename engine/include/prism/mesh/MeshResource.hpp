#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>

#include "prism/core/Handle.h"
#include "prism/mesh/MeshTypes.hpp"

namespace prism::mesh {

    inline constexpr float kBlendShapeFrameWeight = 100.0F;

    struct BoundingBox {
        glm::vec3 m_min{0.0F};
        glm::vec3 m_max{0.0F};
    };

    struct BlendShapeFrame {
        std::string name;
        float weight = kBlendShapeFrameWeight;
        std::vector<glm::vec3> positionDeltas;
        std::vector<glm::vec3> normalDeltas; // empty unless it matches the vertex count
    };

    // Renderer-ready geometry of one mesh id. Every per-vertex array has vertices.size()
    // elements; skinVertices is empty for unskinned meshes.
    struct MeshResource {
        std::string name;
        BufferMode mode = BufferMode::Shared;
        std::vector<MeshVertex> vertices;
        std::vector<glm::vec4> tangents;
        std::vector<SkinVertex> skinVertices;
        std::vector<uint32_t> indices;
        std::vector<Submesh> submeshes;
        BoundingBox bounds;
        std::vector<BlendShapeFrame> blendShapes;
    };

    struct MeshWithMaterials {
        std::unique_ptr<MeshResource> mesh;
        std::vector<MaterialHandle> materials; // one per material index
        std::vector<MeshWarning> warnings;     // decode and packaging
    };

    // Supplied by the caller; turns a glTF material index (or kNoMaterial) into a handle.
    using MaterialResolver = std::function<MaterialHandle(int32_t materialIndex)>;

}
