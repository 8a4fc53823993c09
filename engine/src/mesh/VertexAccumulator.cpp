#include "prism/mesh/VertexAccumulator.hpp"
#include "prism/core/common.hpp"
#include "prism/core/logger.hpp"

#include <format>

namespace prism::mesh {

    VertexAccumulator::VertexAccumulator(MeshBuildResult& out, const IAccessorReader& reader,
                                         const AxisInverter& inverter, UvConvention uvConvention)
        : m_out(out)
        , m_reader(reader)
        , m_inverter(inverter)
        , m_uvConvention(uvConvention)
    {
    }

    void VertexAccumulator::reserve(size_t vertexCount)
    {
        m_out.vertices.reserve(vertexCount);
        if (m_skinned) {
            m_out.skinVertices.reserve(vertexCount);
        }
    }

    glm::vec4 VertexAccumulator::normalizeWeights(const glm::vec4& weights)
    {
        const float sum = weights.x + weights.y + weights.z + weights.w;
        if (sum == 0.0F) {
            return weights;
        }
        const float f = 1.0F / sum;
        return weights * f;
    }

    template<typename T>
    std::vector<T> VertexAccumulator::readOptional(int32_t accessor, size_t vertexCount, const char* semantic,
                                                   std::vector<T> (IAccessorReader::*read)(int32_t) const) const
    {
        if (accessor == kNoAccessor) {
            return {};
        }
        std::vector<T> values = (m_reader.*read)(accessor);
        if (values.size() != vertexCount) {
            throw MeshImportError(MeshErrorCode::AttributeLengthMismatch,
                std::format("{} accessor {} has {} elements, POSITION has {}",
                            semantic, accessor, values.size(), vertexCount));
        }
        return values;
    }

    VertexRange VertexAccumulator::append(const PrimitiveDescription& primitive)
    {
        PRISM_PROFILE_FUNCTION();

        const PrimitiveAttributes& attributes = primitive.attributes;
        if (attributes.position == kNoAccessor) {
            throw MeshImportError(MeshErrorCode::MissingPosition,
                std::format("primitive of mesh '{}' has no POSITION attribute", m_out.name));
        }

        const std::vector<glm::vec3> positions = m_reader.readVec3(attributes.position);
        const size_t vCount = positions.size();

        const auto normals = readOptional(attributes.normal, vCount, "NORMAL", &IAccessorReader::readVec3);
        const auto texCoords0 = readOptional(attributes.texCoord0, vCount, "TEXCOORD_0", &IAccessorReader::readVec2);
        const auto texCoords1 = readOptional(attributes.texCoord1, vCount, "TEXCOORD_1", &IAccessorReader::readVec2);
        const auto colors = readOptional(attributes.color0, vCount, "COLOR_0", &IAccessorReader::readColor);
        const auto joints = readOptional(attributes.joints0, vCount, "JOINTS_0", &IAccessorReader::readJoints);
        const auto weights = readOptional(attributes.weights0, vCount, "WEIGHTS_0", &IAccessorReader::readWeights);

        if (!attributes.hasNormal() && m_out.hasNormals) {
            m_out.hasNormals = false;
            reportWarning(m_out.warnings, MeshWarningCode::MissingNormals,
                std::format("Mesh '{}' has a primitive without NORMAL; normals will be recalculated.", m_out.name));
        }

        VertexRange range{core::u32(m_out.vertices.size()), core::u32(vCount)};

        for (size_t i = 0; i < vCount; ++i)
        {
            MeshVertex v;
            v.position = m_inverter(positions[i]);
            if (!normals.empty()) {
                v.normal = m_inverter(normals[i]);
            }
            if (!texCoords0.empty()) {
                v.uv0 = convertUv0(texCoords0[i], m_uvConvention);
            }
            if (!texCoords1.empty()) {
                v.uv1 = convertUv1(texCoords1[i]);
            }
            if (!colors.empty()) {
                v.color = colors[i];
            }
            m_out.vertices.push_back(v);

            if (m_skinned)
            {
                SkinVertex skin;
                if (!joints.empty()) {
                    skin.joints = joints[i];
                }
                if (!weights.empty()) {
                    skin.weights = normalizeWeights(weights[i]);
                }
                m_out.skinVertices.push_back(skin);
            }
        }

        return range;
    }

}
