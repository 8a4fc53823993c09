#include "prism/mesh/VertexTrimmer.hpp"
#include "prism/core/common.hpp"

#include <algorithm>
#include <format>

namespace prism::mesh {

    size_t VertexTrimmer::trim(MeshBuildResult& mesh)
    {
        PRISM_PROFILE_FUNCTION();

        size_t used = 0;
        if (mesh.indices.empty())
        {
            if (!mesh.vertices.empty()) {
                reportWarning(mesh.warnings, MeshWarningCode::EmptyIndexBuffer,
                    std::format("Mesh '{}' has no triangles; all {} vertices are unreferenced.",
                                mesh.name, mesh.vertices.size()));
            }
        }
        else
        {
            used = core::sz(*std::ranges::max_element(mesh.indices)) + 1;
        }

        const size_t before = mesh.vertices.size();
        truncate(mesh.vertices, used);
        truncate(mesh.skinVertices, used);
        for (auto& shape : mesh.blendShapes)
        {
            truncate(shape.positions, used);
            truncate(shape.normals, used);
            truncate(shape.tangents, used);
        }

        const size_t removed = before - mesh.vertices.size();
        if (removed > 0) {
            core::Logger::Mesh.debug("Mesh '{}': dropped {} unused trailing vertices.", mesh.name, removed);
        }
        return removed;
    }

}
