#include <doctest/doctest.h>
#include "prism/mesh/MeshBuilder.hpp"
#include "MemoryAccessorReader.hpp"

using namespace prism;
using namespace prism::mesh;

namespace {
    PrimitiveDescription fullPrimitive(test::MemoryAccessorReader& reader, size_t vertexCount)
    {
        PrimitiveDescription primitive = test::positionOnly(reader.addVec3(test::linePositions(vertexCount)));
        primitive.attributes.normal = reader.addVec3(std::vector<glm::vec3>(vertexCount, {0.0F, 1.0F, 0.0F}));
        primitive.attributes.texCoord0 = reader.addVec2(std::vector<glm::vec2>(vertexCount, {0.5F, 0.5F}));
        return primitive;
    }

    void checkPartition(const MeshBuildResult& result)
    {
        uint32_t next = 0;
        for (const auto& submesh : result.submeshes) {
            CHECK(submesh.indexOffset == next);
            next += submesh.indexCount;
        }
        CHECK(next == result.indices.size());
        CHECK(result.materialIndices.size() == result.submeshes.size());
        for (const uint32_t index : result.indices) {
            CHECK(index < result.vertices.size());
        }
    }
}

TEST_CASE("MeshBuilder selects the buffer mode") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    const PrimitiveDescription base = fullPrimitive(reader, 4);

    SUBCASE("Identical accessor sets share one buffer") {
        desc.primitives = {base, base, base};
        desc.primitives[1].indices = reader.addIndices({0, 1, 2});
        desc.primitives[2].material = 3;
        CHECK(MeshBuilder::selectBufferMode(desc) == BufferMode::Shared);
    }

    SUBCASE("A single differing accessor splits the buffers") {
        desc.primitives = {base, base};
        desc.primitives[1].attributes.texCoord1 = reader.addVec2(std::vector<glm::vec2>(4));
        CHECK(MeshBuilder::selectBufferMode(desc) == BufferMode::Independent);

        desc.primitives[1] = base;
        desc.primitives[1].attributes.weights0 = reader.addVec4(std::vector<glm::vec4>(4));
        CHECK(MeshBuilder::selectBufferMode(desc) == BufferMode::Independent);
    }

    SUBCASE("A single primitive is shared") {
        desc.primitives = {base};
        CHECK(MeshBuilder::selectBufferMode(desc) == BufferMode::Shared);
    }
}

TEST_CASE("MeshBuilder shared buffer decode") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    desc.name = "shared";

    const PrimitiveDescription base = fullPrimitive(reader, 5000);
    for (uint32_t p = 0; p < 3; ++p)
    {
        PrimitiveDescription primitive = base;
        primitive.indices = p == 2 ? reader.addIndices(test::sequence(2999, 2001))
                                   : reader.addIndices(test::sequence(p * 1500, 1500));
        primitive.material = static_cast<int32_t>(p);
        desc.primitives.push_back(primitive);
    }

    const MeshBuildResult result = MeshBuilder::decode(desc, reader);

    CHECK(result.mode == BufferMode::Shared);
    CHECK(result.name == "shared");
    CHECK(result.vertices.size() == 5000);
    REQUIRE(result.submeshes.size() == 3);
    CHECK(result.submeshes[0].indexCount == 1500);
    CHECK(result.submeshes[2].indexCount == 2001);
    CHECK(result.materialIndices == std::vector<int32_t>{0, 1, 2});
    // Shared mode never offsets indices.
    CHECK(result.indices[result.submeshes[1].indexOffset] == 1502);
    CHECK(result.hasNormals);
    CHECK(result.warnings.empty());
    checkPartition(result);
}

TEST_CASE("MeshBuilder independent buffer decode") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    desc.name = "independent";

    PrimitiveDescription a = fullPrimitive(reader, 3);
    a.indices = reader.addIndices(std::vector<uint8_t>{0, 1, 2}, ComponentType::UnsignedByte);
    a.material = 0;

    PrimitiveDescription b = test::positionOnly(reader.addVec3(test::linePositions(6)));
    b.attributes.joints0 = reader.addJoints(std::vector<glm::uvec4>(6, glm::uvec4(1, 0, 0, 0)));
    b.attributes.weights0 = reader.addVec4(std::vector<glm::vec4>(6, glm::vec4(1.0F, 0.0F, 0.0F, 0.0F)));
    b.material = 1;

    desc.primitives = {a, b};

    const MeshBuildResult result = MeshBuilder::decode(desc, reader);

    CHECK(result.mode == BufferMode::Independent);
    CHECK(result.vertices.size() == 9);
    CHECK(result.indices == std::vector<uint32_t>{2, 1, 0, 5, 4, 3, 8, 7, 6});
    REQUIRE(result.submeshes.size() == 2);
    CHECK(result.submeshes[1] == Submesh{3, 6, 1});

    SUBCASE("Skin stays parallel to the vertices") {
        REQUIRE(result.skinVertices.size() == result.vertices.size());
        CHECK(result.skinVertices[0] == SkinVertex{});
        CHECK(result.skinVertices[3].joints == glm::uvec4(1, 0, 0, 0));
        CHECK(result.skinVertices[3].weights == glm::vec4(1.0F, 0.0F, 0.0F, 0.0F));
    }

    SUBCASE("A primitive without normals flags the mesh") {
        CHECK_FALSE(result.hasNormals);
        CHECK(test::countWarnings(result.warnings, MeshWarningCode::MissingNormals) == 1);
    }

    checkPartition(result);
}

TEST_CASE("MeshBuilder generated indices") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    desc.primitives.push_back(test::positionOnly(reader.addVec3(test::linePositions(12))));

    const MeshBuildResult result = MeshBuilder::decode(desc, reader);

    CHECK(result.indices.size() == 12);
    CHECK(result.indices.size() / 3 == 4);
    CHECK(result.vertices.size() == 12);
    checkPartition(result);
}

TEST_CASE("MeshBuilder trims unused vertices") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    PrimitiveDescription primitive = fullPrimitive(reader, 10);
    primitive.indices = reader.addIndices({0, 1, 2, 2, 1, 3});
    primitive.targets.push_back({reader.addVec3(std::vector<glm::vec3>(10, glm::vec3(1.0F))), kNoAccessor, kNoAccessor});
    desc.primitives.push_back(primitive);

    const MeshBuildResult result = MeshBuilder::decode(desc, reader);

    CHECK(result.vertices.size() == 4);
    REQUIRE(result.blendShapes.size() == 1);
    CHECK(result.blendShapes[0].positions.size() == 4);
    CHECK(*std::ranges::max_element(result.indices) == result.vertices.size() - 1);
}

TEST_CASE("MeshBuilder naming and errors") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    desc.meshIndex = 7;

    SUBCASE("Unnamed meshes get an import name") {
        desc.primitives.push_back(test::positionOnly(reader.addVec3(test::linePositions(3))));
        CHECK(MeshBuilder::decode(desc, reader).name == "import#7");
    }

    SUBCASE("A mesh without primitives is rejected") {
        try {
            (void)MeshBuilder::decode(desc, reader);
            FAIL("expected MeshImportError");
        } catch (const MeshImportError& e) {
            CHECK(e.code() == MeshErrorCode::EmptyMesh);
        }
    }
}

TEST_CASE("MeshBuilder decode is deterministic") {
    test::MemoryAccessorReader reader;
    MeshDescription desc;
    desc.name = "twice";
    desc.targetNames = std::vector<std::string>{"a"};

    PrimitiveDescription a = fullPrimitive(reader, 6);
    a.targets.push_back({reader.addVec3(std::vector<glm::vec3>(6, glm::vec3(0.0F, 0.0F, 1.0F))), kNoAccessor, kNoAccessor});
    PrimitiveDescription b = test::positionOnly(reader.addVec3(test::linePositions(3)));
    b.targets.push_back({reader.addVec3(std::vector<glm::vec3>(3, glm::vec3(1.0F))), kNoAccessor, kNoAccessor});
    desc.primitives = {a, b};

    const MeshBuildResult first = MeshBuilder::decode(desc, reader);
    const MeshBuildResult second = MeshBuilder::decode(desc, reader);

    CHECK(first.vertices == second.vertices);
    CHECK(first.skinVertices == second.skinVertices);
    CHECK(first.indices == second.indices);
    CHECK(first.submeshes == second.submeshes);
    CHECK(first.materialIndices == second.materialIndices);
    CHECK(first.blendShapes == second.blendShapes);
    CHECK(first.warnings == second.warnings);
    REQUIRE(first.blendShapes.size() == 1);
    CHECK(first.blendShapes[0].name == "a");
    CHECK(first.blendShapes[0].positions.size() == 9);
}
