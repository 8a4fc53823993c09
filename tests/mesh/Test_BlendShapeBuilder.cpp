#include <doctest/doctest.h>
#include "prism/mesh/BlendShapeBuilder.hpp"
#include "prism/mesh/MeshBuilder.hpp"
#include "MemoryAccessorReader.hpp"

using namespace prism;
using namespace prism::mesh;

namespace {
    std::vector<glm::vec3> deltas(size_t count, glm::vec3 value)
    {
        return std::vector<glm::vec3>(count, value);
    }
}

TEST_CASE("BlendShapeBuilder shared buffer targets") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    out.name = "face";
    const AxisInverter inverter = axis::reverseZ;
    BlendShapeBuilder builder(out, reader, inverter);

    PrimitiveDescription primitive = test::positionOnly(reader.addVec3(test::linePositions(12)));

    SUBCASE("Deltas go through the inverter") {
        MorphTargetAttributes target;
        target.position = reader.addVec3(deltas(12, {0.0F, 1.0F, 1.0F}));
        target.normal = reader.addVec3(deltas(12, {1.0F, 0.0F, 1.0F}));
        primitive.targets.push_back(target);

        builder.addSharedTargets(primitive, 12);

        REQUIRE(out.blendShapes.size() == 1);
        CHECK(out.blendShapes[0].name == "0");
        REQUIRE(out.blendShapes[0].positions.size() == 12);
        CHECK(out.blendShapes[0].positions[5] == glm::vec3(0.0F, 1.0F, -1.0F));
        CHECK(out.blendShapes[0].normals[5] == glm::vec3(1.0F, 0.0F, -1.0F));
        CHECK(out.blendShapes[0].tangents.empty());
    }

    SUBCASE("A short delta array leaves the channel empty with a warning") {
        MorphTargetAttributes target;
        target.position = reader.addVec3(deltas(10, {0.0F, 1.0F, 0.0F}));
        primitive.targets.push_back(target);

        builder.addSharedTargets(primitive, 12);

        REQUIRE(out.blendShapes.size() == 1);
        CHECK(out.blendShapes[0].positions.empty());
        CHECK(test::countWarnings(out.warnings, MeshWarningCode::MorphTargetLengthMismatch) == 1);
    }
}

TEST_CASE("BlendShapeBuilder independent buffer targets") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    out.name = "body";
    const AxisInverter inverter = axis::identity;
    BlendShapeBuilder builder(out, reader, inverter);

    SUBCASE("Deltas of each primitive are concatenated per channel") {
        PrimitiveDescription a = test::positionOnly(reader.addVec3(test::linePositions(3)));
        PrimitiveDescription b = test::positionOnly(reader.addVec3(test::linePositions(2)));
        a.targets.push_back({reader.addVec3(deltas(3, glm::vec3(1.0F))), kNoAccessor, kNoAccessor});
        b.targets.push_back({reader.addVec3(deltas(2, glm::vec3(2.0F))), kNoAccessor, kNoAccessor});
        b.targets.push_back({reader.addVec3(deltas(2, glm::vec3(3.0F))), kNoAccessor, kNoAccessor});

        builder.appendIndependentTargets(a, 3);
        builder.appendIndependentTargets(b, 2);

        REQUIRE(out.blendShapes.size() == 2);
        CHECK(out.blendShapes[0].positions.size() == 5);
        CHECK(out.blendShapes[0].positions[4] == glm::vec3(2.0F));
        // Channel 1 only exists on the second primitive.
        CHECK(out.blendShapes[1].positions.size() == 2);
        CHECK(out.blendShapes[1].name == "1");
    }

    SUBCASE("A delta count mismatch is fatal") {
        PrimitiveDescription primitive = test::positionOnly(reader.addVec3(test::linePositions(12)));
        primitive.targets.push_back({reader.addVec3(deltas(10, glm::vec3(1.0F))), kNoAccessor, kNoAccessor});

        try {
            builder.appendIndependentTargets(primitive, 12);
            FAIL("expected MeshImportError");
        } catch (const MeshImportError& e) {
            CHECK(e.code() == MeshErrorCode::MorphTargetLengthMismatch);
        }
    }
}

TEST_CASE("BlendShapeBuilder target names") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    out.name = "named";
    const AxisInverter inverter = axis::identity;
    BlendShapeBuilder builder(out, reader, inverter);

    PrimitiveDescription primitive = test::positionOnly(reader.addVec3(test::linePositions(2)));
    for (int i = 0; i < 3; ++i) {
        primitive.targets.push_back({reader.addVec3(deltas(2, glm::vec3(0.0F))), kNoAccessor, kNoAccessor});
    }
    builder.addSharedTargets(primitive, 2);

    SUBCASE("No names keep the numeric defaults") {
        builder.applyTargetNames(std::nullopt);
        CHECK(out.blendShapes[0].name == "0");
        CHECK(out.blendShapes[2].name == "2");
    }

    SUBCASE("A full list renames every channel") {
        builder.applyTargetNames(std::vector<std::string>{"smile", "blink", "frown"});
        CHECK(out.blendShapes[0].name == "smile");
        CHECK(out.blendShapes[1].name == "blink");
        CHECK(out.blendShapes[2].name == "frown");
        CHECK(out.warnings.empty());
    }

    SUBCASE("A short list renames a prefix and warns") {
        builder.applyTargetNames(std::vector<std::string>{"smile"});
        CHECK(out.blendShapes[0].name == "smile");
        CHECK(out.blendShapes[1].name == "1");
        CHECK(out.blendShapes[2].name == "2");
        CHECK(test::countWarnings(out.warnings, MeshWarningCode::TargetNamesTooShort) == 1);
    }
}

TEST_CASE("Morph mismatch policy depends on the buffer mode") {
    test::MemoryAccessorReader reader;
    const int32_t positions = reader.addVec3(test::linePositions(12));
    const int32_t shortDeltas = reader.addVec3(deltas(10, glm::vec3(0.0F, 1.0F, 0.0F)));

    MeshDescription desc;
    desc.name = "policy";

    PrimitiveDescription primitive = test::positionOnly(positions);
    primitive.targets.push_back({shortDeltas, kNoAccessor, kNoAccessor});

    SUBCASE("Shared mode degrades to an empty channel") {
        desc.primitives.push_back(primitive);

        const MeshBuildResult result = MeshBuilder::decode(desc, reader);
        CHECK(result.mode == BufferMode::Shared);
        REQUIRE(result.blendShapes.size() == 1);
        CHECK(result.blendShapes[0].positions.empty());
        CHECK(test::countWarnings(result.warnings, MeshWarningCode::MorphTargetLengthMismatch) == 1);
    }

    SUBCASE("Independent mode aborts the mesh") {
        desc.primitives.push_back(primitive);
        PrimitiveDescription other = test::positionOnly(reader.addVec3(test::linePositions(3)));
        desc.primitives.push_back(other);

        CHECK(MeshBuilder::selectBufferMode(desc) == BufferMode::Independent);
        CHECK_THROWS_AS(MeshBuilder::decode(desc, reader), MeshImportError);
    }
}
