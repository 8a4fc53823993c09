#pragma once
#include "prism/mesh/AccessorReader.hpp"

#include <fastgltf/types.hpp>

namespace prism::assets {

    // IAccessorReader over a parsed fastgltf asset. Sparse and normalized accessors are
    // resolved by fastgltf; the asset must outlive the reader.
    class GltfAccessorReader final : public mesh::IAccessorReader {
    public:
        explicit GltfAccessorReader(const fastgltf::Asset& gltf) : m_gltf(gltf) {}

        size_t count(int32_t accessorIndex) const override;

        std::vector<glm::vec2> readVec2(int32_t accessorIndex) const override;
        std::vector<glm::vec3> readVec3(int32_t accessorIndex) const override;
        std::vector<glm::vec4> readColor(int32_t accessorIndex) const override;
        std::vector<glm::uvec4> readJoints(int32_t accessorIndex) const override;
        std::vector<glm::vec4> readWeights(int32_t accessorIndex) const override;
        mesh::IndexBuffer readIndices(int32_t accessorIndex) const override;

    private:
        const fastgltf::Accessor& accessor(int32_t accessorIndex) const;

        template<typename T>
        std::vector<T> read(int32_t accessorIndex) const;

        const fastgltf::Asset& m_gltf;
    };

}
