#pragma once
#include "prism/mesh/AccessorReader.hpp"
#include "prism/mesh/AwaitCaller.hpp"
#include "prism/mesh/CoordinateConversion.hpp"
#include "prism/mesh/MeshDescription.hpp"
#include "prism/mesh/MeshResource.hpp"
#include "prism/mesh/MeshTypes.hpp"

#include <optional>

namespace prism::mesh {

    struct DecodeOptions {
        AxisInverter inverter = axis::reverseZ;
        UvConvention uvConvention = UvConvention::Current;
    };

    class MeshBuilder {
    public:
        // Shared when every primitive declares the same attribute accessors.
        static BufferMode selectBufferMode(const MeshDescription& desc);

        // Decodes every primitive of desc into one trimmed MeshBuildResult.
        // Throws MeshImportError when the mesh cannot be decoded.
        static MeshBuildResult decode(const MeshDescription& desc, const IAccessorReader& reader,
                                      const DecodeOptions& options = {});

        // Packages a decoded mesh, yielding to awaitCaller at every checkpoint.
        // Returns std::nullopt when the caller cancels.
        static std::optional<MeshWithMaterials> build(MeshBuildResult result, const MaterialResolver& resolver,
                                                      IAwaitCaller& awaitCaller);

    private:
        static void decodeShared(const MeshDescription& desc, const IAccessorReader& reader,
                                 const DecodeOptions& options, MeshBuildResult& out);
        static void decodeIndependent(const MeshDescription& desc, const IAccessorReader& reader,
                                      const DecodeOptions& options, MeshBuildResult& out);
    };

}
