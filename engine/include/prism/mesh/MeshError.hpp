#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <cpptrace/cpptrace.hpp>

namespace prism::mesh {

    enum class MeshErrorCode : uint32_t {
        EmptyMesh,
        MissingPosition,
        AttributeLengthMismatch,
        UnsupportedIndexFormat,
        TruncatedIndexBuffer,
        IndexOutOfRange,
        MorphTargetLengthMismatch
    };

    constexpr std::string_view errorCodeToString(MeshErrorCode code) {
        switch (code) {
        case MeshErrorCode::EmptyMesh:                 return "EmptyMesh";
        case MeshErrorCode::MissingPosition:           return "MissingPosition";
        case MeshErrorCode::AttributeLengthMismatch:   return "AttributeLengthMismatch";
        case MeshErrorCode::UnsupportedIndexFormat:    return "UnsupportedIndexFormat";
        case MeshErrorCode::TruncatedIndexBuffer:      return "TruncatedIndexBuffer";
        case MeshErrorCode::IndexOutOfRange:           return "IndexOutOfRange";
        case MeshErrorCode::MorphTargetLengthMismatch: return "MorphTargetLengthMismatch";
        default:                                       return "Unknown";
        }
    }

    // Aborts the decode of a whole mesh.
    class MeshImportError : public cpptrace::runtime_error {
    public:
        MeshImportError(MeshErrorCode code, const std::string& message)
            : cpptrace::runtime_error(std::string(errorCodeToString(code)) + ": " + message)
            , m_code(code) {}

        MeshErrorCode code() const noexcept { return m_code; }

    private:
        MeshErrorCode m_code;
    };

    enum class MeshWarningCode : uint32_t {
        MissingNormals,
        MorphTargetLengthMismatch,
        TargetNamesTooShort,
        IncompleteTriangle,
        EmptyIndexBuffer,
        PartialBlendShape
    };

    // Degraded-but-successful condition, also written to the Mesh log channel.
    struct MeshWarning {
        MeshWarningCode code;
        std::string message;

        bool operator==(const MeshWarning&) const = default;
    };

    // Logs the warning on the Mesh channel and appends it to warnings.
    void reportWarning(std::vector<MeshWarning>& warnings, MeshWarningCode code, std::string message);

}
