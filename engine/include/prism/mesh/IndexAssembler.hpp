#pragma once
#include "prism/mesh/AccessorReader.hpp"
#include "prism/mesh/MeshDescription.hpp"
#include "prism/mesh/MeshTypes.hpp"

#include <span>

namespace prism::mesh {

    // Copies triangle lists into MeshBuildResult::indices with reversed winding,
    // one Submesh per appended primitive.
    class IndexAssembler {
    public:
        IndexAssembler(MeshBuildResult& out, const IAccessorReader& reader);

        void reserve(size_t indexCount);

        // baseVertex is added to every index. vertexCount is the number of vertices the
        // primitive addresses; source indices must stay below it.
        void append(const PrimitiveDescription& primitive, uint32_t baseVertex, uint32_t vertexCount);

        // (a, b, c) -> (c, b, a) for every complete triangle, offset by baseVertex.
        static void pushFlipped(std::span<const uint32_t> triangles, uint32_t baseVertex,
                                std::vector<uint32_t>& dst);

        // Decodes an 8/16/32-bit index buffer into 32-bit values; any other component
        // type throws MeshImportError(UnsupportedIndexFormat).
        static std::vector<uint32_t> decode(const IndexBuffer& src);

    private:
        std::vector<uint32_t> sequentialIndices(uint32_t vertexCount) const;

        MeshBuildResult& m_out;
        const IAccessorReader& m_reader;
    };

}
