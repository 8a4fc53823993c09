#include "prism/mesh/MeshBuilder.hpp"
#include "prism/core/common.hpp"
#include "prism/core/logger.hpp"
#include "prism/mesh/BlendShapeBuilder.hpp"
#include "prism/mesh/IndexAssembler.hpp"
#include "prism/mesh/MeshBuildTask.hpp"
#include "prism/mesh/VertexAccumulator.hpp"
#include "prism/mesh/VertexTrimmer.hpp"

#include <algorithm>
#include <format>

namespace prism::mesh {

    namespace {
        struct Capacity {
            size_t vertices = 0;
            size_t indices = 0;
        };

        size_t primitiveIndexCount(const PrimitiveDescription& primitive, const IAccessorReader& reader)
        {
            if (primitive.indices != kNoAccessor) {
                return reader.count(primitive.indices);
            }
            return reader.count(primitive.attributes.position);
        }

        Capacity measure(const MeshDescription& desc, const IAccessorReader& reader, BufferMode mode)
        {
            Capacity capacity;
            for (const auto& primitive : desc.primitives)
            {
                if (primitive.attributes.position == kNoAccessor) {
                    continue;
                }
                if (mode == BufferMode::Independent || capacity.vertices == 0) {
                    capacity.vertices += reader.count(primitive.attributes.position);
                }
                capacity.indices += primitiveIndexCount(primitive, reader);
            }
            return capacity;
        }
    }

    BufferMode MeshBuilder::selectBufferMode(const MeshDescription& desc)
    {
        if (desc.primitives.empty()) {
            return BufferMode::Shared;
        }
        const PrimitiveAttributes& first = desc.primitives.front().attributes;
        const bool shared = std::ranges::all_of(desc.primitives, [&](const PrimitiveDescription& p) {
            return p.attributes == first;
        });
        return shared ? BufferMode::Shared : BufferMode::Independent;
    }

    void MeshBuilder::decodeShared(const MeshDescription& desc, const IAccessorReader& reader,
                                   const DecodeOptions& options, MeshBuildResult& out)
    {
        const PrimitiveDescription& first = desc.primitives.front();
        const Capacity capacity = measure(desc, reader, BufferMode::Shared);

        VertexAccumulator vertices(out, reader, options.inverter, options.uvConvention);
        vertices.setSkinned(first.attributes.hasSkin());
        vertices.reserve(capacity.vertices);
        const VertexRange range = vertices.append(first);

        IndexAssembler indices(out, reader);
        indices.reserve(capacity.indices);
        for (const auto& primitive : desc.primitives) {
            indices.append(primitive, 0, range.count);
        }

        BlendShapeBuilder blendShapes(out, reader, options.inverter);
        blendShapes.addSharedTargets(first, range.count);
        blendShapes.applyTargetNames(desc.targetNames);
    }

    void MeshBuilder::decodeIndependent(const MeshDescription& desc, const IAccessorReader& reader,
                                        const DecodeOptions& options, MeshBuildResult& out)
    {
        const Capacity capacity = measure(desc, reader, BufferMode::Independent);

        VertexAccumulator vertices(out, reader, options.inverter, options.uvConvention);
        vertices.setSkinned(std::ranges::any_of(desc.primitives, [](const PrimitiveDescription& p) {
            return p.attributes.hasSkin();
        }));
        vertices.reserve(capacity.vertices);

        IndexAssembler indices(out, reader);
        indices.reserve(capacity.indices);

        BlendShapeBuilder blendShapes(out, reader, options.inverter);

        for (const auto& primitive : desc.primitives)
        {
            const VertexRange range = vertices.append(primitive);
            indices.append(primitive, range.offset, range.count);
            blendShapes.appendIndependentTargets(primitive, range.count);
        }

        blendShapes.applyTargetNames(desc.targetNames);
    }

    MeshBuildResult MeshBuilder::decode(const MeshDescription& desc, const IAccessorReader& reader,
                                        const DecodeOptions& options)
    {
        PRISM_PROFILE_FUNCTION();

        MeshBuildResult out;
        out.name = desc.name.empty() ? std::format("import#{}", desc.meshIndex) : desc.name;

        PRISM_LOG_SCOPE(out.name);

        if (desc.primitives.empty()) {
            throw MeshImportError(MeshErrorCode::EmptyMesh,
                std::format("mesh '{}' has no primitives", out.name));
        }

        out.mode = selectBufferMode(desc);
        core::Logger::Mesh.debug("Decoding {} primitive(s) in {} buffer mode.",
                                 desc.primitives.size(), bufferModeToString(out.mode));

        if (out.mode == BufferMode::Shared) {
            decodeShared(desc, reader, options, out);
        } else {
            decodeIndependent(desc, reader, options, out);
        }

        VertexTrimmer::trim(out);

        PRISM_ASSERT(out.materialIndices.size() == out.submeshes.size(),
                     "material index list must be parallel to the submesh list");

        core::Logger::Mesh.debug("Decoded {} vertices, {} indices, {} submeshes, {} blend shapes.",
                                 out.vertices.size(), out.indices.size(), out.submeshes.size(),
                                 out.blendShapes.size());
        return out;
    }

    std::optional<MeshWithMaterials> MeshBuilder::build(MeshBuildResult result, const MaterialResolver& resolver,
                                                        IAwaitCaller& awaitCaller)
    {
        MeshBuildTask task(std::move(result), resolver);
        while (!task.isComplete())
        {
            task.step();
            if (!awaitCaller.nextFrame())
            {
                task.cancel();
                return std::nullopt;
            }
        }
        return task.takeResult();
    }

}
