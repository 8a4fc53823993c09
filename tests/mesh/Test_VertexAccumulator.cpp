#include <doctest/doctest.h>
#include "prism/mesh/VertexAccumulator.hpp"
#include "MemoryAccessorReader.hpp"

using namespace prism;
using namespace prism::mesh;

TEST_CASE("VertexAccumulator converts attributes") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    out.name = "accum";
    const AxisInverter inverter = axis::reverseZ;

    PrimitiveDescription primitive;
    primitive.attributes.position = reader.addVec3({{1.0F, 2.0F, 3.0F}, {4.0F, 5.0F, 6.0F}});
    primitive.attributes.normal = reader.addVec3({{0.0F, 0.0F, 1.0F}, {1.0F, 0.0F, 0.0F}});
    primitive.attributes.texCoord0 = reader.addVec2({{0.25F, 0.75F}, {1.0F, 0.0F}});
    primitive.attributes.texCoord1 = reader.addVec2({{0.5F, 0.25F}, {0.0F, 1.0F}});

    SUBCASE("Positions and normals go through the inverter") {
        VertexAccumulator accumulator(out, reader, inverter, UvConvention::Current);
        const VertexRange range = accumulator.append(primitive);

        CHECK(range.offset == 0);
        CHECK(range.count == 2);
        REQUIRE(out.vertices.size() == 2);
        CHECK(out.vertices[0].position == glm::vec3(1.0F, 2.0F, -3.0F));
        CHECK(out.vertices[1].position == glm::vec3(4.0F, 5.0F, -6.0F));
        CHECK(out.vertices[0].normal == glm::vec3(0.0F, 0.0F, -1.0F));
        CHECK(out.vertices[1].normal == glm::vec3(1.0F, 0.0F, 0.0F));
        CHECK(out.hasNormals);
        CHECK(out.warnings.empty());
    }

    SUBCASE("Current UV convention flips V on both channels") {
        VertexAccumulator accumulator(out, reader, inverter, UvConvention::Current);
        accumulator.append(primitive);

        CHECK(out.vertices[0].uv0 == glm::vec2(0.25F, 0.25F));
        CHECK(out.vertices[1].uv0 == glm::vec2(1.0F, 1.0F));
        CHECK(out.vertices[0].uv1 == glm::vec2(0.5F, 0.75F));
        CHECK(out.vertices[1].uv1 == glm::vec2(0.0F, 0.0F));
    }

    SUBCASE("Legacy UV convention negates V on UV0 only") {
        VertexAccumulator accumulator(out, reader, inverter, UvConvention::LegacyFlipY);
        accumulator.append(primitive);

        CHECK(out.vertices[0].uv0 == glm::vec2(0.25F, -0.75F));
        CHECK(out.vertices[1].uv0 == glm::vec2(1.0F, -0.0F));
        CHECK(out.vertices[0].uv1 == glm::vec2(0.5F, 0.75F));
    }

    SUBCASE("Identity inverter keeps glTF coordinates") {
        const AxisInverter identity = axis::identity;
        VertexAccumulator accumulator(out, reader, identity, UvConvention::Current);
        accumulator.append(primitive);
        CHECK(out.vertices[0].position == glm::vec3(1.0F, 2.0F, 3.0F));
    }
}

TEST_CASE("VertexAccumulator defaults for missing attributes") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    const AxisInverter inverter = axis::reverseZ;
    VertexAccumulator accumulator(out, reader, inverter, UvConvention::Current);

    const auto first = test::positionOnly(reader.addVec3(test::linePositions(3)));
    const auto second = test::positionOnly(reader.addVec3(test::linePositions(2)));

    const VertexRange a = accumulator.append(first);
    const VertexRange b = accumulator.append(second);

    CHECK(a.offset == 0);
    CHECK(b.offset == 3);
    CHECK(b.count == 2);
    REQUIRE(out.vertices.size() == 5);
    for (const auto& v : out.vertices) {
        CHECK(v.normal == glm::vec3(0.0F));
        CHECK(v.uv0 == glm::vec2(0.0F));
        CHECK(v.uv1 == glm::vec2(0.0F));
        CHECK(v.color == glm::vec4(1.0F));
    }

    CHECK_FALSE(out.hasNormals);
    CHECK(test::countWarnings(out.warnings, MeshWarningCode::MissingNormals) == 1);
    CHECK(out.skinVertices.empty());
}

TEST_CASE("VertexAccumulator skin weights") {
    SUBCASE("Weights are divided by their sum") {
        const glm::vec4 w = VertexAccumulator::normalizeWeights({0.5F, 0.2F, 0.1F, 0.1F});
        CHECK(w.x == doctest::Approx(0.5F / 0.9F));
        CHECK(w.y == doctest::Approx(0.2F / 0.9F));
        CHECK(w.z == doctest::Approx(0.1F / 0.9F));
        CHECK(w.w == doctest::Approx(0.1F / 0.9F));
        CHECK(w.x + w.y + w.z + w.w == doctest::Approx(1.0F));
    }

    SUBCASE("Zero weights stay zero") {
        CHECK(VertexAccumulator::normalizeWeights(glm::vec4(0.0F)) == glm::vec4(0.0F));
    }

    SUBCASE("Skin array stays parallel when a primitive has no joints") {
        test::MemoryAccessorReader reader;
        MeshBuildResult out;
        const AxisInverter inverter = axis::reverseZ;

        PrimitiveDescription skinned = test::positionOnly(reader.addVec3(test::linePositions(2)));
        skinned.attributes.joints0 = reader.addJoints({{1, 2, 3, 4}, {5, 6, 7, 8}});
        skinned.attributes.weights0 = reader.addVec4({{1.0F, 1.0F, 0.0F, 0.0F}, {0.0F, 0.0F, 0.0F, 0.0F}});
        const PrimitiveDescription plain = test::positionOnly(reader.addVec3(test::linePositions(3)));

        VertexAccumulator accumulator(out, reader, inverter, UvConvention::Current);
        accumulator.setSkinned(true);
        accumulator.append(skinned);
        accumulator.append(plain);

        REQUIRE(out.skinVertices.size() == out.vertices.size());
        CHECK(out.skinVertices[0].joints == glm::uvec4(1, 2, 3, 4));
        CHECK(out.skinVertices[0].weights == glm::vec4(0.5F, 0.5F, 0.0F, 0.0F));
        CHECK(out.skinVertices[1].weights == glm::vec4(0.0F));
        CHECK(out.skinVertices[4] == SkinVertex{});
    }
}

TEST_CASE("VertexAccumulator rejects malformed primitives") {
    test::MemoryAccessorReader reader;
    MeshBuildResult out;
    const AxisInverter inverter = axis::reverseZ;
    VertexAccumulator accumulator(out, reader, inverter, UvConvention::Current);

    SUBCASE("Missing POSITION") {
        PrimitiveDescription primitive;
        primitive.attributes.normal = reader.addVec3(test::linePositions(3));
        try {
            accumulator.append(primitive);
            FAIL("expected MeshImportError");
        } catch (const MeshImportError& e) {
            CHECK(e.code() == MeshErrorCode::MissingPosition);
        }
    }

    SUBCASE("Attribute shorter than POSITION") {
        PrimitiveDescription primitive = test::positionOnly(reader.addVec3(test::linePositions(4)));
        primitive.attributes.texCoord0 = reader.addVec2({{0.0F, 0.0F}, {1.0F, 1.0F}});
        try {
            accumulator.append(primitive);
            FAIL("expected MeshImportError");
        } catch (const MeshImportError& e) {
            CHECK(e.code() == MeshErrorCode::AttributeLengthMismatch);
        }
        CHECK(out.vertices.empty());
    }
}
