#include "prism/assets/GltfAsset.hpp"
#include "prism/core/common.hpp"
#include "prism/core/logger.hpp"

#include <fastgltf/core.hpp>
#include <simdjson.h>
#include <algorithm>
#include <format>
#include <unordered_map>

namespace prism::assets {

    namespace {
        using TargetNameTable = std::unordered_map<size_t, std::vector<std::string>>;

        void collectTargetNames(simdjson::dom::object* extras, std::size_t objectIndex,
                                fastgltf::Category category, void* userPointer)
        {
            if (category != fastgltf::Category::Meshes || extras == nullptr) {
                return;
            }

            simdjson::dom::array names;
            if ((*extras)["targetNames"].get_array().get(names) != simdjson::SUCCESS) {
                return;
            }

            std::vector<std::string> out;
            for (auto element : names)
            {
                std::string_view name;
                if (element.get_string().get(name) != simdjson::SUCCESS)
                {
                    core::Logger::Asset.warn("Mesh {}: extras.targetNames holds a non-string entry, list truncated.",
                                             objectIndex);
                    break;
                }
                out.emplace_back(name);
            }
            (*static_cast<TargetNameTable*>(userPointer))[objectIndex] = std::move(out);
        }

        constexpr auto kExtensions = fastgltf::Extensions::KHR_mesh_quantization |
                                     fastgltf::Extensions::KHR_texture_transform |
                                     fastgltf::Extensions::KHR_materials_variants;

        core::Result<GltfAsset> parse(fastgltf::GltfDataBuffer& data, const std::filesystem::path& directory,
                                      const std::string& label)
        {
            PRISM_PROFILE_SCOPE("Parse GLTF");

            TargetNameTable names;
            fastgltf::Parser parser(kExtensions);
            parser.setExtrasParseCallback(collectTargetNames);
            parser.setUserPointer(&names);

            auto expected = parser.loadGltf(data, directory, fastgltf::Options::LoadExternalBuffers);
            if (expected.error() != fastgltf::Error::None) {
                const auto message = std::format("Failed to parse glTF '{}': {}", label,
                                                 fastgltf::getErrorMessage(expected.error()));
                core::Logger::Asset.error("{}", message);
                return core::Unexpected(message);
            }

            GltfAsset asset;
            asset.gltf = std::move(expected.get());
            if (asset.gltf.assetInfo.has_value()) {
                asset.generator = std::string(asset.gltf.assetInfo->generator);
            }
            asset.targetNames.resize(asset.gltf.meshes.size());
            for (auto& [meshIndex, list] : names)
            {
                if (meshIndex < asset.targetNames.size()) {
                    asset.targetNames[meshIndex] = std::move(list);
                }
            }

            core::Logger::Asset.info("Parsed '{}': {} meshes, {} accessors, generator '{}'.",
                                     label, asset.gltf.meshes.size(), asset.gltf.accessors.size(), asset.generator);
            return asset;
        }

        int32_t attributeAccessor(const fastgltf::Primitive& primitive, std::string_view name)
        {
            const auto* it = primitive.findAttribute(name);
            return it != primitive.attributes.end() ? static_cast<int32_t>(it->accessorIndex) : mesh::kNoAccessor;
        }

        template<typename Attributes>
        int32_t targetAccessor(const Attributes& target, std::string_view name)
        {
            const auto it = std::ranges::find_if(target, [&](const fastgltf::Attribute& a) {
                return a.name == name;
            });
            return it != target.end() ? static_cast<int32_t>(it->accessorIndex) : mesh::kNoAccessor;
        }
    }

    core::Result<GltfAsset> loadGltfAsset(const std::filesystem::path& path, LoadProgress* progress)
    {
        PRISM_LOG_SCOPE(std::format("GltfLoad[{}]", path.filename().string()));
        PRISM_PROFILE_FUNCTION();

        if (progress != nullptr) {
            progress->currentStage.store(LoadStage::ReadingFile, std::memory_order_relaxed);
        }

        auto dataResult = fastgltf::GltfDataBuffer::FromPath(path);
        if (dataResult.error() != fastgltf::Error::None) {
            const auto message = std::format("Failed to read file '{}': {}", path.string(),
                                             fastgltf::getErrorMessage(dataResult.error()));
            core::Logger::Asset.error("{}", message);
            return core::Unexpected(message);
        }

        if (progress != nullptr) {
            progress->currentStage.store(LoadStage::ParsingGLTF, std::memory_order_relaxed);
        }
        return parse(dataResult.get(), path.parent_path(), path.filename().string());
    }

    core::Result<GltfAsset> loadGltfAsset(std::span<const std::byte> bytes, const std::filesystem::path& directory)
    {
        auto dataResult = fastgltf::GltfDataBuffer::FromBytes(bytes.data(), bytes.size());
        if (dataResult.error() != fastgltf::Error::None) {
            const auto message = std::format("Failed to wrap {} bytes of glTF: {}", bytes.size(),
                                             fastgltf::getErrorMessage(dataResult.error()));
            core::Logger::Asset.error("{}", message);
            return core::Unexpected(message);
        }
        return parse(dataResult.get(), directory, "<memory>");
    }

    mesh::MeshDescription describeMesh(const fastgltf::Asset& gltf, size_t meshIndex,
                                       std::optional<std::vector<std::string>> targetNames)
    {
        const fastgltf::Mesh& gMesh = gltf.meshes[meshIndex];

        mesh::MeshDescription desc;
        desc.name = std::string(gMesh.name);
        desc.meshIndex = core::u32(meshIndex);
        desc.targetNames = std::move(targetNames);
        desc.primitives.reserve(gMesh.primitives.size());

        for (size_t p = 0; p < gMesh.primitives.size(); ++p)
        {
            const fastgltf::Primitive& gPrim = gMesh.primitives[p];
            if (gPrim.type != fastgltf::PrimitiveType::Triangles) {
                core::Logger::Asset.warn("Mesh {} primitive {}: topology {} is not a triangle list, skipped.",
                                         meshIndex, p, static_cast<uint32_t>(gPrim.type));
                continue;
            }

            mesh::PrimitiveDescription prim;
            prim.attributes.position = attributeAccessor(gPrim, "POSITION");
            prim.attributes.normal = attributeAccessor(gPrim, "NORMAL");
            prim.attributes.tangent = attributeAccessor(gPrim, "TANGENT");
            prim.attributes.texCoord0 = attributeAccessor(gPrim, "TEXCOORD_0");
            prim.attributes.texCoord1 = attributeAccessor(gPrim, "TEXCOORD_1");
            prim.attributes.color0 = attributeAccessor(gPrim, "COLOR_0");
            prim.attributes.joints0 = attributeAccessor(gPrim, "JOINTS_0");
            prim.attributes.weights0 = attributeAccessor(gPrim, "WEIGHTS_0");

            prim.indices = gPrim.indicesAccessor.has_value()
                ? static_cast<int32_t>(gPrim.indicesAccessor.value())
                : mesh::kNoAccessor;
            prim.material = gPrim.materialIndex.has_value()
                ? static_cast<int32_t>(gPrim.materialIndex.value())
                : mesh::kNoMaterial;

            prim.targets.reserve(gPrim.targets.size());
            for (const auto& gTarget : gPrim.targets)
            {
                mesh::MorphTargetAttributes target;
                target.position = targetAccessor(gTarget, "POSITION");
                target.normal = targetAccessor(gTarget, "NORMAL");
                target.tangent = targetAccessor(gTarget, "TANGENT");
                prim.targets.push_back(target);
            }

            desc.primitives.push_back(std::move(prim));
        }
        return desc;
    }

}
