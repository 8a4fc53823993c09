#include "prism/mesh/MeshError.hpp"
#include "prism/core/logger.hpp"

#include <utility>

namespace prism::mesh {

    void reportWarning(std::vector<MeshWarning>& warnings, MeshWarningCode code, std::string message)
    {
        core::Logger::Mesh.warn("{}", message);
        warnings.push_back(MeshWarning{code, std::move(message)});
    }

}
