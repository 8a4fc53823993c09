#include "prism/mesh/IndexAssembler.hpp"
#include "prism/core/common.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <numeric>

namespace prism::mesh {

    namespace {
        template<typename T>
        std::vector<uint32_t> widen(const IndexBuffer& src)
        {
            const size_t required = src.count * sizeof(T);
            if (src.bytes.size() < required) {
                throw MeshImportError(MeshErrorCode::TruncatedIndexBuffer,
                    std::format("{} index buffer holds {} bytes, {} indices need {}",
                                componentTypeToString(src.componentType), src.bytes.size(),
                                src.count, required));
            }

            std::vector<uint32_t> out(src.count);
            const std::byte* data = src.bytes.data();
            for (size_t i = 0; i < src.count; ++i)
            {
                T v;
                std::memcpy(&v, data + (i * sizeof(T)), sizeof(T));
                out[i] = static_cast<uint32_t>(v);
            }
            return out;
        }
    }

    IndexAssembler::IndexAssembler(MeshBuildResult& out, const IAccessorReader& reader)
        : m_out(out)
        , m_reader(reader)
    {
    }

    void IndexAssembler::reserve(size_t indexCount)
    {
        m_out.indices.reserve(indexCount);
    }

    std::vector<uint32_t> IndexAssembler::decode(const IndexBuffer& src)
    {
        switch (src.componentType)
        {
        case ComponentType::UnsignedByte:
            return widen<std::uint8_t>(src);
        case ComponentType::UnsignedShort:
            return widen<std::uint16_t>(src);
        case ComponentType::UnsignedInt:
            return widen<std::uint32_t>(src);
        default:
            throw MeshImportError(MeshErrorCode::UnsupportedIndexFormat,
                std::format("index component type {} ({}) is not supported",
                            componentTypeToString(src.componentType),
                            static_cast<uint32_t>(src.componentType)));
        }
    }

    void IndexAssembler::pushFlipped(std::span<const uint32_t> triangles, uint32_t baseVertex,
                                     std::vector<uint32_t>& dst)
    {
        const size_t complete = triangles.size() - (triangles.size() % 3);
        for (size_t i = 0; i < complete; i += 3)
        {
            dst.push_back(baseVertex + triangles[i + 2]);
            dst.push_back(baseVertex + triangles[i + 1]);
            dst.push_back(baseVertex + triangles[i]);
        }
    }

    std::vector<uint32_t> IndexAssembler::sequentialIndices(uint32_t vertexCount) const
    {
        std::vector<uint32_t> indices(vertexCount);
        std::iota(indices.begin(), indices.end(), 0U);
        return indices;
    }

    void IndexAssembler::append(const PrimitiveDescription& primitive, uint32_t baseVertex, uint32_t vertexCount)
    {
        PRISM_PROFILE_FUNCTION();

        std::vector<uint32_t> source;
        if (primitive.indices != kNoAccessor)
        {
            source = decode(m_reader.readIndices(primitive.indices));
            const auto maxIt = std::ranges::max_element(source);
            if (maxIt != source.end() && *maxIt >= vertexCount) {
                throw MeshImportError(MeshErrorCode::IndexOutOfRange,
                    std::format("index accessor {} references vertex {} but the primitive has {} vertices",
                                primitive.indices, *maxIt, vertexCount));
            }
        }
        else
        {
            source = sequentialIndices(vertexCount);
        }

        if (source.size() % 3 != 0) {
            reportWarning(m_out.warnings, MeshWarningCode::IncompleteTriangle,
                std::format("Mesh '{}': dropping {} trailing indices that do not form a triangle.",
                            m_out.name, source.size() % 3));
        }

        Submesh submesh;
        submesh.indexOffset = core::u32(m_out.indices.size());
        pushFlipped(source, baseVertex, m_out.indices);
        submesh.indexCount = core::u32(m_out.indices.size()) - submesh.indexOffset;
        submesh.materialIndex = primitive.material;

        m_out.submeshes.push_back(submesh);
        m_out.materialIndices.push_back(primitive.material);
    }

}
