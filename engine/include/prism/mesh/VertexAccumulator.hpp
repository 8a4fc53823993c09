#pragma once
#include "prism/mesh/AccessorReader.hpp"
#include "prism/mesh/CoordinateConversion.hpp"
#include "prism/mesh/MeshDescription.hpp"
#include "prism/mesh/MeshTypes.hpp"

namespace prism::mesh {

    struct VertexRange {
        uint32_t offset = 0;
        uint32_t count = 0;
    };

    // Appends converted per-vertex attributes of primitives to MeshBuildResult::vertices
    // (and skinVertices when the mesh is skinned).
    class VertexAccumulator {
    public:
        VertexAccumulator(MeshBuildResult& out, const IAccessorReader& reader,
                          const AxisInverter& inverter, UvConvention uvConvention);

        void reserve(size_t vertexCount);

        // Must be set before the first append when any primitive of the mesh carries
        // JOINTS_0 or WEIGHTS_0, so the skin array stays parallel to the vertex array.
        void setSkinned(bool skinned) { m_skinned = skinned; }

        VertexRange append(const PrimitiveDescription& primitive);

        static glm::vec4 normalizeWeights(const glm::vec4& weights);

    private:
        template<typename T>
        std::vector<T> readOptional(int32_t accessor, size_t vertexCount, const char* semantic,
                                    std::vector<T> (IAccessorReader::*read)(int32_t) const) const;

        MeshBuildResult& m_out;
        const IAccessorReader& m_reader;
        const AxisInverter& m_inverter;
        UvConvention m_uvConvention;
        bool m_skinned = false;
    };

}
