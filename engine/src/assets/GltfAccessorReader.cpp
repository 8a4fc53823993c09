#include "prism/assets/GltfAccessorReader.hpp"
#include "prism/core/common.hpp"

#include <fastgltf/glm_element_traits.hpp>
#include <fastgltf/tools.hpp>
#include <cpptrace/cpptrace.hpp>
#include <cstring>
#include <format>

namespace prism::assets {

    namespace {
        template<typename T>
        void copyIndices(const fastgltf::Asset& gltf, const fastgltf::Accessor& acc, mesh::IndexBuffer& out)
        {
            out.bytes.resize(acc.count * sizeof(T));
            fastgltf::iterateAccessorWithIndex<T>(gltf, acc, [&](T v, size_t i) {
                std::memcpy(out.bytes.data() + (i * sizeof(T)), &v, sizeof(T));
            });
        }
    }

    const fastgltf::Accessor& GltfAccessorReader::accessor(int32_t accessorIndex) const
    {
        if (accessorIndex < 0 || static_cast<size_t>(accessorIndex) >= m_gltf.accessors.size()) {
            throw cpptrace::out_of_range(std::format("accessor {} out of range (asset has {})",
                                                     accessorIndex, m_gltf.accessors.size()));
        }
        return m_gltf.accessors[static_cast<size_t>(accessorIndex)];
    }

    template<typename T>
    std::vector<T> GltfAccessorReader::read(int32_t accessorIndex) const
    {
        const auto& acc = accessor(accessorIndex);
        std::vector<T> out(acc.count);
        fastgltf::iterateAccessorWithIndex<T>(m_gltf, acc, [&](T v, size_t idx) {
            out[idx] = v;
        });
        return out;
    }

    size_t GltfAccessorReader::count(int32_t accessorIndex) const
    {
        return accessor(accessorIndex).count;
    }

    std::vector<glm::vec2> GltfAccessorReader::readVec2(int32_t accessorIndex) const
    {
        return read<glm::vec2>(accessorIndex);
    }

    std::vector<glm::vec3> GltfAccessorReader::readVec3(int32_t accessorIndex) const
    {
        return read<glm::vec3>(accessorIndex);
    }

    std::vector<glm::vec4> GltfAccessorReader::readColor(int32_t accessorIndex) const
    {
        const auto& acc = accessor(accessorIndex);
        if (acc.type == fastgltf::AccessorType::Vec4) {
            return read<glm::vec4>(accessorIndex);
        }

        std::vector<glm::vec4> out(acc.count);
        fastgltf::iterateAccessorWithIndex<glm::vec3>(m_gltf, acc, [&](glm::vec3 col, size_t idx) {
            out[idx] = glm::vec4(col, 1.0F);
        });
        return out;
    }

    std::vector<glm::uvec4> GltfAccessorReader::readJoints(int32_t accessorIndex) const
    {
        return read<glm::uvec4>(accessorIndex);
    }

    std::vector<glm::vec4> GltfAccessorReader::readWeights(int32_t accessorIndex) const
    {
        return read<glm::vec4>(accessorIndex);
    }

    mesh::IndexBuffer GltfAccessorReader::readIndices(int32_t accessorIndex) const
    {
        PRISM_PROFILE_FUNCTION();

        const auto& acc = accessor(accessorIndex);

        mesh::IndexBuffer out;
        out.componentType = static_cast<mesh::ComponentType>(fastgltf::getGLComponentType(acc.componentType));
        out.count = acc.count;

        switch (acc.componentType)
        {
        case fastgltf::ComponentType::UnsignedByte:
            copyIndices<std::uint8_t>(m_gltf, acc, out);
            break;
        case fastgltf::ComponentType::UnsignedShort:
            copyIndices<std::uint16_t>(m_gltf, acc, out);
            break;
        case fastgltf::ComponentType::UnsignedInt:
            copyIndices<std::uint32_t>(m_gltf, acc, out);
            break;
        default:
            // Rejected by the index assembler with the component type attached.
            break;
        }
        return out;
    }

}
