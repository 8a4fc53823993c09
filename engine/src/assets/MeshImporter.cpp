#include "prism/assets/MeshImporter.hpp"
#include "prism/assets/GltfAccessorReader.hpp"
#include "prism/core/TaskSystem.hpp"
#include "prism/core/common.hpp"
#include "prism/core/cvar.hpp"
#include "prism/core/logger.hpp"
#include "prism/mesh/MeshBuilder.hpp"

#include <chrono>
#include <format>

namespace prism::assets {

    AUTO_CVAR_STRING(import_axis, "Axis inversion applied to positions, normals and morph deltas (reverseZ, reverseX, identity)",
                     "reverseZ");
    AUTO_CVAR_STRING(import_uv_convention, "UV0 convention (auto, current, legacy); auto reads asset.generator",
                     "auto");

    MeshImportOptions MeshImportOptions::fromCVars()
    {
        MeshImportOptions options;

        const std::string axisName = import_axis.get();
        if (auto inverter = mesh::axis::fromName(axisName)) {
            options.inverter = std::move(*inverter);
        } else {
            core::Logger::Asset.warn("import_axis '{}' is not a known axis preset, using reverseZ.", axisName);
        }

        const std::string uvName = import_uv_convention.get();
        if (uvName != "auto")
        {
            options.uvConvention = mesh::uvConventionFromName(uvName);
            if (!options.uvConvention.has_value()) {
                core::Logger::Asset.warn("import_uv_convention '{}' is not recognized, resolving from the asset.", uvName);
            }
        }
        return options;
    }

    std::vector<ImportedMesh> MeshImporter::importMeshes(const GltfAsset& asset, const MeshImportOptions& options,
                                                         LoadProgress* progress)
    {
        PRISM_PROFILE_FUNCTION();
        auto startTime = std::chrono::high_resolution_clock::now();

        const fastgltf::Asset& gltf = asset.gltf;
        const auto meshCount = core::u32(gltf.meshes.size());

        mesh::DecodeOptions decodeOptions;
        decodeOptions.inverter = options.inverter;
        decodeOptions.uvConvention = options.uvConvention.value_or(mesh::resolveUvConvention(asset.generator));

        core::Logger::Asset.info("Importing {} meshes (UV convention: {}).", meshCount,
                                 decodeOptions.uvConvention == mesh::UvConvention::LegacyFlipY ? "legacy" : "current");

        if (progress != nullptr) {
            progress->meshesTotal.store(meshCount, std::memory_order_relaxed);
            progress->currentStage.store(LoadStage::DecodingMeshes, std::memory_order_relaxed);
        }

        GltfAccessorReader reader(gltf);
        std::vector<core::Result<mesh::MeshBuildResult>> decoded(meshCount);

        core::TaskSystem::parallelFor(meshCount, [&](enki::TaskSetPartition range, uint32_t /*threadnum*/) {
            for (uint32_t i = range.start; i < range.end; ++i)
            {
                PRISM_PROFILE_SCOPE("Decode Mesh");
                const auto names = i < asset.targetNames.size() ? asset.targetNames[i] : std::nullopt;
                try {
                    decoded[i] = mesh::MeshBuilder::decode(describeMesh(gltf, i, names), reader, decodeOptions);
                } catch (const mesh::MeshImportError& e) {
                    core::Logger::Asset.error("Mesh {} failed to decode: {}", i, e.what());
                    decoded[i] = core::Unexpected(std::string(e.what()));
                } catch (const cpptrace::out_of_range& e) {
                    core::Logger::Asset.error("Mesh {} references a missing accessor: {}", i, e.what());
                    decoded[i] = core::Unexpected(std::string(e.what()));
                } catch (const std::exception& e) {
                    core::Logger::Asset.error("Mesh {} aborted: {}", i, e.what());
                    decoded[i] = core::Unexpected(std::format("mesh {} aborted: {}", i, e.what()));
                }
                if (progress != nullptr) {
                    progress->meshesDecoded.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });

        if (progress != nullptr) {
            progress->currentStage.store(LoadStage::BuildingMeshes, std::memory_order_relaxed);
        }

        mesh::ImmediateAwaitCaller immediate;
        mesh::IAwaitCaller& awaitCaller = options.awaitCaller != nullptr ? *options.awaitCaller : immediate;

        std::vector<ImportedMesh> results;
        results.reserve(meshCount);
        for (uint32_t i = 0; i < meshCount; ++i)
        {
            ImportedMesh imported;
            imported.meshIndex = i;

            if (!decoded[i].has_value()) {
                imported.result = core::Unexpected(std::move(decoded[i].error()));
            } else if (auto built = mesh::MeshBuilder::build(std::move(*decoded[i]), options.materialResolver, awaitCaller)) {
                imported.result = std::move(*built);
            } else {
                imported.result = core::Unexpected(std::format("mesh {} build was cancelled", i));
            }

            if (!imported.result.has_value() && progress != nullptr) {
                progress->meshesFailed.fetch_add(1, std::memory_order_relaxed);
            }
            if (progress != nullptr) {
                progress->meshesBuilt.fetch_add(1, std::memory_order_relaxed);
            }
            results.push_back(std::move(imported));
        }

        if (progress != nullptr) {
            progress->currentStage.store(LoadStage::Complete, std::memory_order_relaxed);
        }

        auto endTime = std::chrono::high_resolution_clock::now();
        double duration = std::chrono::duration<double, std::milli>(endTime - startTime).count();
        core::Logger::Asset.info("Imported {} meshes in {:.2f}ms.", meshCount, duration);
        return results;
    }

}
