#pragma once
#include "prism/core/result.hpp"
#include "prism/mesh/MeshDescription.hpp"
#include "prism/assets/LoadProgress.hpp"

#include <fastgltf/types.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace prism::assets {

    struct GltfAsset {
        fastgltf::Asset gltf;
        std::string generator;
        // mesh.extras.targetNames, one slot per mesh.
        std::vector<std::optional<std::vector<std::string>>> targetNames;
    };

    core::Result<GltfAsset> loadGltfAsset(const std::filesystem::path& path, LoadProgress* progress = nullptr);

    // Parses a .gltf/.glb held in memory. External buffers are resolved against directory.
    core::Result<GltfAsset> loadGltfAsset(std::span<const std::byte> bytes, const std::filesystem::path& directory);

    // Primitives that are not triangle lists are left out with a warning.
    mesh::MeshDescription describeMesh(const fastgltf::Asset& gltf, size_t meshIndex,
                                       std::optional<std::vector<std::string>> targetNames = std::nullopt);

}
