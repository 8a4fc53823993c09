#include "prism/mesh/BlendShapeBuilder.hpp"
#include "prism/core/common.hpp"

#include <array>
#include <format>

namespace prism::mesh {

    namespace {
        struct DeltaChannel {
            const char* semantic;
            int32_t accessor;
            std::vector<glm::vec3> BlendShape::*deltas;
        };

        std::array<DeltaChannel, 3> deltaChannels(const MorphTargetAttributes& target)
        {
            return {{
                {"POSITION", target.position, &BlendShape::positions},
                {"NORMAL", target.normal, &BlendShape::normals},
                {"TANGENT", target.tangent, &BlendShape::tangents},
            }};
        }
    }

    BlendShapeBuilder::BlendShapeBuilder(MeshBuildResult& out, const IAccessorReader& reader,
                                         const AxisInverter& inverter)
        : m_out(out)
        , m_reader(reader)
        , m_inverter(inverter)
    {
    }

    BlendShape& BlendShapeBuilder::getOrCreate(size_t channel)
    {
        while (m_out.blendShapes.size() <= channel)
        {
            BlendShape shape;
            shape.name = std::to_string(m_out.blendShapes.size());
            m_out.blendShapes.push_back(std::move(shape));
        }
        return m_out.blendShapes[channel];
    }

    std::vector<glm::vec3> BlendShapeBuilder::readDeltas(int32_t accessor) const
    {
        std::vector<glm::vec3> deltas = m_reader.readVec3(accessor);
        for (auto& d : deltas) {
            d = m_inverter(d);
        }
        return deltas;
    }

    void BlendShapeBuilder::addSharedTargets(const PrimitiveDescription& primitive, size_t vertexCount)
    {
        PRISM_PROFILE_FUNCTION();

        for (size_t i = 0; i < primitive.targets.size(); ++i)
        {
            BlendShape& shape = getOrCreate(i);

            for (const DeltaChannel& channel : deltaChannels(primitive.targets[i]))
            {
                if (channel.accessor == kNoAccessor) {
                    continue;
                }
                const size_t count = m_reader.count(channel.accessor);
                if (count != vertexCount)
                {
                    reportWarning(m_out.warnings, MeshWarningCode::MorphTargetLengthMismatch,
                        std::format("Mesh '{}' target {} {}: {} deltas for {} vertices, channel left empty.",
                                    m_out.name, i, channel.semantic, count, vertexCount));
                    continue;
                }
                auto& dst = shape.*channel.deltas;
                dst.reserve(vertexCount);
                auto deltas = readDeltas(channel.accessor);
                dst.insert(dst.end(), deltas.begin(), deltas.end());
            }
        }
    }

    void BlendShapeBuilder::appendIndependentTargets(const PrimitiveDescription& primitive, size_t vertexCount)
    {
        PRISM_PROFILE_FUNCTION();

        for (size_t i = 0; i < primitive.targets.size(); ++i)
        {
            BlendShape& shape = getOrCreate(i);

            for (const DeltaChannel& channel : deltaChannels(primitive.targets[i]))
            {
                if (channel.accessor == kNoAccessor) {
                    continue;
                }
                auto deltas = readDeltas(channel.accessor);
                if (deltas.size() != vertexCount) {
                    throw MeshImportError(MeshErrorCode::MorphTargetLengthMismatch,
                        std::format("mesh '{}' target {} {}: {} deltas for a primitive of {} vertices",
                                    m_out.name, i, channel.semantic, deltas.size(), vertexCount));
                }
                auto& dst = shape.*channel.deltas;
                dst.insert(dst.end(), deltas.begin(), deltas.end());
            }
        }
    }

    void BlendShapeBuilder::applyTargetNames(const std::optional<std::vector<std::string>>& targetNames)
    {
        if (!targetNames.has_value()) {
            return;
        }

        for (size_t i = 0; i < m_out.blendShapes.size(); ++i)
        {
            if (i >= targetNames->size())
            {
                reportWarning(m_out.warnings, MeshWarningCode::TargetNamesTooShort,
                    std::format("Mesh '{}': extras.targetNames has {} entries for {} blend shapes.",
                                m_out.name, targetNames->size(), m_out.blendShapes.size()));
                break;
            }
            m_out.blendShapes[i].name = (*targetNames)[i];
        }
    }

}
