#pragma once
#include "prism/mesh/MeshResource.hpp"
#include "prism/mesh/MeshTypes.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace prism::mesh {

    enum class BuildStage : uint8_t {
        Vertices,
        Indices,
        Bounds,
        Normals,
        Tangents,
        Materials,
        BlendShapes,
        Complete,
        Cancelled
    };

    constexpr std::string_view stageToString(BuildStage stage) {
        switch (stage) {
        case BuildStage::Vertices:    return "Vertices";
        case BuildStage::Indices:     return "Indices";
        case BuildStage::Bounds:      return "Bounds";
        case BuildStage::Normals:     return "Normals";
        case BuildStage::Tangents:    return "Tangents";
        case BuildStage::Materials:   return "Materials";
        case BuildStage::BlendShapes: return "BlendShapes";
        case BuildStage::Complete:    return "Complete";
        case BuildStage::Cancelled:   return "Cancelled";
        default:                      return "Unknown";
        }
    }

    // Turns a MeshBuildResult into a MeshResource one checkpoint at a time.
    // Each step() runs exactly one stage, or one blend shape channel during
    // BlendShapes. The task owns the partial mesh until takeResult().
    class MeshBuildTask {
    public:
        MeshBuildTask(MeshBuildResult source, MaterialResolver resolver);

        MeshBuildTask(const MeshBuildTask&) = delete;
        MeshBuildTask& operator=(const MeshBuildTask&) = delete;

        void step();

        // Drops the partial mesh. Nothing is published afterwards.
        void cancel();

        [[nodiscard]] BuildStage stage() const { return m_stage; }
        [[nodiscard]] bool isComplete() const { return m_stage == BuildStage::Complete; }
        [[nodiscard]] bool isCancelled() const { return m_stage == BuildStage::Cancelled; }

        // Number of step() calls a full build takes.
        [[nodiscard]] size_t checkpointCount() const;

        // Hands the finished mesh over. Only succeeds once, and only after Complete.
        std::optional<MeshWithMaterials> takeResult();

        const std::vector<MeshWarning>& warnings() const { return m_source.warnings; }

        // Appends material index 0 when the list is empty.
        static void ensureDefaultMaterial(MeshBuildResult& result);

    private:
        void packageVertices();
        void packageIndices();
        void computeBounds();
        void recalculateNormals();
        void generateTangents();
        void resolveMaterials();
        void addBlendShape(size_t channel);

        BuildStage nextStage(BuildStage stage) const;

        MeshBuildResult m_source;
        MaterialResolver m_resolver;
        std::unique_ptr<MeshResource> m_mesh;
        std::vector<MaterialHandle> m_materials;
        BuildStage m_stage = BuildStage::Vertices;
        size_t m_blendShapeCursor = 0;
        bool m_taken = false;
    };

}
