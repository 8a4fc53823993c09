#pragma once
#include "prism/mesh/MeshTypes.hpp"

namespace prism::mesh {

    class VertexTrimmer {
    public:
        // Drops vertex records (skin vertices and blend shape deltas included) past the
        // highest referenced index. Returns the number of vertices removed.
        static size_t trim(MeshBuildResult& mesh);

        template<typename T>
        static void truncate(std::vector<T>& values, size_t count)
        {
            if (values.size() > count) {
                values.resize(count);
            }
        }
    };

}
