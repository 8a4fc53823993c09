#pragma once
#include "prism/assets/GltfAsset.hpp"
#include "prism/assets/LoadProgress.hpp"
#include "prism/core/result.hpp"
#include "prism/mesh/AwaitCaller.hpp"
#include "prism/mesh/CoordinateConversion.hpp"
#include "prism/mesh/MeshResource.hpp"

#include <optional>
#include <vector>

namespace prism::assets {

    struct MeshImportOptions {
        mesh::AxisInverter inverter = mesh::axis::reverseZ;
        // Resolved from the asset generator when unset.
        std::optional<mesh::UvConvention> uvConvention;
        // Materials resolve to INVALID_MATERIAL_HANDLE when unset.
        mesh::MaterialResolver materialResolver;
        // Builds run to completion when null.
        mesh::IAwaitCaller* awaitCaller = nullptr;

        // Reads the import.* cvars.
        static MeshImportOptions fromCVars();
    };

    struct ImportedMesh {
        uint32_t meshIndex = 0;
        core::Result<mesh::MeshWithMaterials> result;
    };

    class MeshImporter {
    public:
        // Decodes every mesh of the asset in parallel on the task system, then builds them
        // one by one on the calling thread. A failed or cancelled mesh does not stop the others.
        static std::vector<ImportedMesh> importMeshes(const GltfAsset& asset, const MeshImportOptions& options = {},
                                                      LoadProgress* progress = nullptr);
    };

}
