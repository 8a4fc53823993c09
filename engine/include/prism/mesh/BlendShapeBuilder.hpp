#pragma once
#include "prism/mesh/AccessorReader.hpp"
#include "prism/mesh/CoordinateConversion.hpp"
#include "prism/mesh/MeshDescription.hpp"
#include "prism/mesh/MeshTypes.hpp"

#include <optional>
#include <string>

namespace prism::mesh {

    // Builds MeshBuildResult::blendShapes. Target i of every primitive feeds channel i.
    class BlendShapeBuilder {
    public:
        BlendShapeBuilder(MeshBuildResult& out, const IAccessorReader& reader, const AxisInverter& inverter);

        // Shared-buffer mode: one channel per target of the primitive owning the shared
        // vertex buffer. A delta accessor whose count differs from vertexCount is reported
        // and its array is left empty.
        void addSharedTargets(const PrimitiveDescription& primitive, size_t vertexCount);

        // Independent-buffer mode: appends the primitive's deltas to the matching channels.
        // A count mismatch throws MeshImportError(MorphTargetLengthMismatch).
        void appendIndependentTargets(const PrimitiveDescription& primitive, size_t vertexCount);

        // Replaces the numeric default names with mesh.extras.targetNames.
        void applyTargetNames(const std::optional<std::vector<std::string>>& targetNames);

    private:
        BlendShape& getOrCreate(size_t channel);

        std::vector<glm::vec3> readDeltas(int32_t accessor) const;

        MeshBuildResult& m_out;
        const IAccessorReader& m_reader;
        const AxisInverter& m_inverter;
    };

}
