#pragma once
#include "prism/mesh/MeshResource.hpp"

namespace prism::mesh {

    class GeometryProcessor {
    public:
        static BoundingBox computeBounds(const std::vector<MeshVertex>& vertices);

        // Area-weighted face normals accumulated per vertex.
        static void recalculateNormals(std::vector<MeshVertex>& vertices, const std::vector<uint32_t>& indices);

        // MikkTSpace tangents from positions, normals and uv0. Fills mesh.tangents.
        static void generateTangents(MeshResource& mesh);
    };

}
