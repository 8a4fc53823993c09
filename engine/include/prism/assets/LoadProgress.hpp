#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace prism::assets {

enum class LoadStage {
    ReadingFile,
    ParsingGLTF,
    DecodingMeshes,
    BuildingMeshes,
    Complete
};

struct LoadProgress {
    std::atomic<LoadStage> currentStage{LoadStage::ReadingFile};
    std::atomic<uint32_t> meshesTotal{0};
    std::atomic<uint32_t> meshesDecoded{0};
    std::atomic<uint32_t> meshesBuilt{0};
    std::atomic<uint32_t> meshesFailed{0};

    float getProgress() const {
        const uint32_t total = meshesTotal.load(std::memory_order_relaxed);
        switch (currentStage.load(std::memory_order_relaxed)) {
            case LoadStage::ReadingFile:
                return 0.0f;
            case LoadStage::ParsingGLTF:
                return 0.1f;
            case LoadStage::DecodingMeshes:
                return 0.2f + (total > 0 ?
                    (float)meshesDecoded.load(std::memory_order_relaxed) / total * 0.5f : 0.0f);
            case LoadStage::BuildingMeshes:
                return 0.7f + (total > 0 ?
                    (float)meshesBuilt.load(std::memory_order_relaxed) / total * 0.3f : 0.0f);
            case LoadStage::Complete:
                return 1.0f;
        }
        return 0.0f;
    }

    std::string getCurrentStageString() const {
        const uint32_t total = meshesTotal.load(std::memory_order_relaxed);
        switch (currentStage.load(std::memory_order_relaxed)) {
            case LoadStage::ReadingFile: return "Reading file...";
            case LoadStage::ParsingGLTF: return "Parsing glTF...";
            case LoadStage::DecodingMeshes:
                return "Decoding meshes (" + std::to_string(meshesDecoded.load(std::memory_order_relaxed)) +
                       "/" + std::to_string(total) + ")";
            case LoadStage::BuildingMeshes:
                return "Building meshes (" + std::to_string(meshesBuilt.load(std::memory_order_relaxed)) +
                       "/" + std::to_string(total) + ")";
            case LoadStage::Complete: return "Complete";
        }
        return "Unknown";
    }
};

}
