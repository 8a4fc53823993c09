#include "prism/mesh/MeshBuildTask.hpp"
#include "prism/core/common.hpp"
#include "prism/core/logger.hpp"
#include "prism/mesh/GeometryProcessor.hpp"

#include <format>

namespace prism::mesh {

    MeshBuildTask::MeshBuildTask(MeshBuildResult source, MaterialResolver resolver)
        : m_source(std::move(source))
        , m_resolver(std::move(resolver))
        , m_mesh(std::make_unique<MeshResource>())
    {
        m_mesh->name = m_source.name;
        m_mesh->mode = m_source.mode;
    }

    void MeshBuildTask::ensureDefaultMaterial(MeshBuildResult& result)
    {
        if (result.materialIndices.empty()) {
            result.materialIndices.push_back(0);
        }
    }

    size_t MeshBuildTask::checkpointCount() const
    {
        size_t count = 5 + m_source.blendShapes.size();
        if (!m_source.hasNormals) {
            ++count;
        }
        return count;
    }

    BuildStage MeshBuildTask::nextStage(BuildStage stage) const
    {
        switch (stage)
        {
        case BuildStage::Vertices:
            return BuildStage::Indices;
        case BuildStage::Indices:
            return BuildStage::Bounds;
        case BuildStage::Bounds:
            return m_source.hasNormals ? BuildStage::Tangents : BuildStage::Normals;
        case BuildStage::Normals:
            return BuildStage::Tangents;
        case BuildStage::Tangents:
            return BuildStage::Materials;
        case BuildStage::Materials:
            return m_source.blendShapes.empty() ? BuildStage::Complete : BuildStage::BlendShapes;
        case BuildStage::BlendShapes:
            return m_blendShapeCursor < m_source.blendShapes.size() ? BuildStage::BlendShapes : BuildStage::Complete;
        default:
            return stage;
        }
    }

    void MeshBuildTask::step()
    {
        PRISM_PROFILE_FUNCTION();

        if (m_stage == BuildStage::Complete || m_stage == BuildStage::Cancelled) {
            return;
        }

        core::Logger::Mesh.trace("Mesh '{}': stage {}", m_source.name, stageToString(m_stage));

        switch (m_stage)
        {
        case BuildStage::Vertices:
            ensureDefaultMaterial(m_source);
            packageVertices();
            break;
        case BuildStage::Indices:
            packageIndices();
            break;
        case BuildStage::Bounds:
            computeBounds();
            break;
        case BuildStage::Normals:
            recalculateNormals();
            break;
        case BuildStage::Tangents:
            generateTangents();
            break;
        case BuildStage::Materials:
            resolveMaterials();
            break;
        case BuildStage::BlendShapes:
            addBlendShape(m_blendShapeCursor++);
            break;
        default:
            break;
        }

        m_stage = nextStage(m_stage);
    }

    void MeshBuildTask::cancel()
    {
        if (m_stage == BuildStage::Cancelled) {
            return;
        }
        core::Logger::Mesh.debug("Mesh '{}': build cancelled at stage {}.", m_source.name, stageToString(m_stage));
        m_mesh.reset();
        m_materials.clear();
        m_stage = BuildStage::Cancelled;
    }

    std::optional<MeshWithMaterials> MeshBuildTask::takeResult()
    {
        if (m_stage != BuildStage::Complete || m_taken) {
            return std::nullopt;
        }
        m_taken = true;

        MeshWithMaterials result;
        result.mesh = std::move(m_mesh);
        result.materials = std::move(m_materials);
        result.warnings = std::move(m_source.warnings);
        return result;
    }

    void MeshBuildTask::packageVertices()
    {
        m_mesh->vertices = std::move(m_source.vertices);
        m_mesh->skinVertices = std::move(m_source.skinVertices);
    }

    void MeshBuildTask::packageIndices()
    {
        m_mesh->indices = std::move(m_source.indices);
        m_mesh->submeshes = std::move(m_source.submeshes);
    }

    void MeshBuildTask::computeBounds()
    {
        m_mesh->bounds = GeometryProcessor::computeBounds(m_mesh->vertices);
    }

    void MeshBuildTask::recalculateNormals()
    {
        GeometryProcessor::recalculateNormals(m_mesh->vertices, m_mesh->indices);
    }

    void MeshBuildTask::generateTangents()
    {
        GeometryProcessor::generateTangents(*m_mesh);
    }

    void MeshBuildTask::resolveMaterials()
    {
        m_materials.reserve(m_source.materialIndices.size());
        for (const int32_t materialIndex : m_source.materialIndices) {
            m_materials.push_back(m_resolver ? m_resolver(materialIndex) : INVALID_MATERIAL_HANDLE);
        }
    }

    void MeshBuildTask::addBlendShape(size_t channel)
    {
        BlendShape& shape = m_source.blendShapes[channel];
        const size_t vertexCount = m_mesh->vertices.size();

        BlendShapeFrame frame;
        frame.name = shape.name;

        if (shape.positions.size() == vertexCount)
        {
            frame.positionDeltas = std::move(shape.positions);
            if (shape.normals.size() == vertexCount) {
                frame.normalDeltas = std::move(shape.normals);
            }
        }
        else if (shape.positions.empty())
        {
            frame.positionDeltas.assign(vertexCount, glm::vec3(0.0F));
        }
        else
        {
            reportWarning(m_source.warnings, MeshWarningCode::PartialBlendShape,
                std::format("Mesh '{}': blend shape '{}' has {} position deltas for {} vertices, skipped.",
                            m_source.name, shape.name, shape.positions.size(), vertexCount));
            return;
        }

        m_mesh->blendShapes.push_back(std::move(frame));
    }

}
