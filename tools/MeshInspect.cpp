#include "prism/assets/GltfAsset.hpp"
#include "prism/assets/MeshImporter.hpp"
#include "prism/core/TaskSystem.hpp"
#include "prism/core/cvar.hpp"
#include "prism/core/logger.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>
#include <vector>

namespace {

void printUsage()
{
    std::cerr << "Usage: prism-mesh-inspect [--config <file.ini>] [--set name=value]... <file.gltf|glb>\n";
}

}

int main(int argc, char** argv)
{
    using namespace prism;

    std::filesystem::path input;
    std::filesystem::path config;
    std::vector<std::string_view> assignments;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if ((arg == "--config" || arg == "--set") && i + 1 < argc) {
            if (arg == "--config") {
                config = argv[++i];
            } else {
                assignments.emplace_back(argv[++i]);
            }
        } else if (arg.starts_with("--")) {
            printUsage();
            return 1;
        } else {
            input = arg;
        }
    }

    if (input.empty())
    {
        printUsage();
        return 1;
    }

    core::Logger::init();

    if (!config.empty()) {
        core::CVarSystem::loadFromIni(config);
    }
    for (const auto assignment : assignments) {
        if (!core::CVarSystem::applyAssignment(assignment)) {
            core::Logger::shutdown();
            return 1;
        }
    }

    core::TaskSystem::init();

    int exitCode = 0;
    try
    {
        assets::LoadProgress progress;
        auto asset = assets::loadGltfAsset(input, &progress);
        if (!asset)
        {
            std::cerr << "Error: " << asset.error() << "\n";
            exitCode = 1;
        }
        else
        {
            const auto options = assets::MeshImportOptions::fromCVars();
            const auto meshes = assets::MeshImporter::importMeshes(*asset, options, &progress);

            for (const auto& imported : meshes)
            {
                std::cout << "mesh " << imported.meshIndex;
                if (!imported.result)
                {
                    std::cout << ": FAILED " << imported.result.error() << "\n";
                    exitCode = 1;
                    continue;
                }

                const auto& resource = *imported.result->mesh;
                std::cout << " '" << resource.name << "'"
                          << " mode=" << mesh::bufferModeToString(resource.mode)
                          << " vertices=" << resource.vertices.size()
                          << " indices=" << resource.indices.size()
                          << " submeshes=" << resource.submeshes.size()
                          << " blendshapes=" << resource.blendShapes.size()
                          << " skinned=" << (resource.skinVertices.empty() ? "no" : "yes") << "\n";
                for (const auto& warning : imported.result->warnings) {
                    std::cout << "  warning: " << warning.message << "\n";
                }
            }
            std::cout << progress.getCurrentStageString()
                      << std::format(" {:.0f}%", progress.getProgress() * 100.0f)
                      << ", " << progress.meshesFailed.load() << " of " << progress.meshesTotal.load()
                      << " meshes failed\n";
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        exitCode = 1;
    }

    core::TaskSystem::shutdown();
    core::Logger::shutdown();
    return exitCode;
}
