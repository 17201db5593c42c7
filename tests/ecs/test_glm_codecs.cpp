/**
 * @file test_glm_codecs.cpp
 * @brief Unit tests for GLM <-> YAML snapshot helpers
 *
 * @date 2025-11-02
 */

#include <strata/ecs/glm_codecs.hpp>
#include <strata/ecs/world.hpp>

#include <gtest/gtest.h>

using namespace strata;
using namespace strata::ecs;

/**
 * @brief Test fixture for glm codec tests
 */
class GlmCodecTest : public ::testing::Test {
protected:
    // helper for float comparison with tolerance
    void expect_vec3_near(const vec3& a, const vec3& b, float tolerance = 1e-5f) {
        EXPECT_NEAR(a.x, b.x, tolerance);
        EXPECT_NEAR(a.y, b.y, tolerance);
        EXPECT_NEAR(a.z, b.z, tolerance);
    }
};

// ==============================================================================
// Writers
// ==============================================================================

TEST_F(GlmCodecTest, VectorsAreFlowSequences) {
    const YAML::Node node = vec3_to_yaml(vec3(1.0f, 2.0f, 3.0f));

    ASSERT_TRUE(node.IsSequence());
    ASSERT_EQ(node.size(), 3u);
    EXPECT_EQ(node[2].as<f32>(), 3.0f);

    YAML::Emitter out;
    out << node;
    EXPECT_STREQ(out.c_str(), "[1, 2, 3]");
}

TEST_F(GlmCodecTest, QuaternionIsWrittenWFirst) {
    const YAML::Node node = quat_to_yaml(quat(0.5f, 0.1f, 0.2f, 0.3f));

    ASSERT_EQ(node.size(), 4u);
    EXPECT_EQ(node[0].as<f32>(), 0.5f);
    EXPECT_EQ(node[3].as<f32>(), 0.3f);
}

// ==============================================================================
// Readers
// ==============================================================================

TEST_F(GlmCodecTest, ReadsWhatWasWritten) {
    const auto v2 = yaml_to_vec2(vec2_to_yaml(vec2(-1.0f, 4.5f)));
    ASSERT_TRUE(v2);
    EXPECT_EQ(*v2, vec2(-1.0f, 4.5f));

    const auto v4 = yaml_to_vec4(YAML::Load("[1, 2, 3, 4]"));
    ASSERT_TRUE(v4);
    EXPECT_EQ(v4->w, 4.0f);

    const auto q = yaml_to_quat(YAML::Load("[1, 0, 0, 0]"));
    ASSERT_TRUE(q);
    EXPECT_EQ(q->w, 1.0f);
    EXPECT_EQ(q->x, 0.0f);
}

TEST_F(GlmCodecTest, RejectsWrongShape) {
    const auto short_vec = yaml_to_vec3(YAML::Load("[1, 2]"));
    ASSERT_FALSE(short_vec);
    EXPECT_EQ(short_vec.error().code, ErrorCode::SNAPSHOT_VALIDATION_ERROR);
    EXPECT_EQ(short_vec.error().message, "Invalid vec3: expected a sequence of 3 numbers");

    const auto map = yaml_to_vec2(YAML::Load("{x: 1, y: 2}"));
    ASSERT_FALSE(map);
    EXPECT_EQ(map.error().message, "Invalid vec2: expected a sequence of 2 numbers");
}

TEST_F(GlmCodecTest, RejectsNonNumericElements) {
    const auto result = yaml_to_vec3(YAML::Load("[1, two, 3]"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::SNAPSHOT_VALIDATION_ERROR);
    EXPECT_EQ(result.error().message.rfind("Invalid vec3: ", 0), 0u);
}

// ==============================================================================
// World Integration
// ==============================================================================

namespace {

struct Transform {
    vec3 position{0.0f};
    quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

} // anonymous namespace

TEST_F(GlmCodecTest, TransformSurvivesSnapshotRoundTrip) {
    const SnapshotCodec<Transform> codec{
        .key = "transform",
        .serialize = [](const Transform& t) {
            YAML::Node node;
            node["position"] = vec3_to_yaml(t.position);
            node["rotation"] = quat_to_yaml(t.rotation);
            return node;
        },
        .deserialize = [](const YAML::Node& node) -> Result<Transform> {
            auto position = yaml_to_vec3(node["position"]);
            if (!position) return std::unexpected(position.error());
            auto rotation = yaml_to_quat(node["rotation"]);
            if (!rotation) return std::unexpected(rotation.error());
            return Transform{*position, *rotation};
        },
    };

    TypeRegistry source_types;
    World source{WorldConfig{.profiling_enabled = false, .history_capacity = 0, .registry = &source_types}};
    ASSERT_TRUE(source.register_component_snapshot(codec));
    const Entity e = source.spawn_with(Transform{vec3(1.0f, 2.0f, 3.0f), quat(1.0f, 0.0f, 0.0f, 0.0f)}).value();

    TypeRegistry target_types;
    World target{WorldConfig{.profiling_enabled = false, .history_capacity = 0, .registry = &target_types}};
    ASSERT_TRUE(target.register_component_snapshot(codec));

    const auto snap = source.snapshot();
    ASSERT_TRUE(snap);
    ASSERT_TRUE(target.restore(*snap));

    const Transform* restored = target.get<Transform>(e);
    ASSERT_NE(restored, nullptr);
    expect_vec3_near(restored->position, vec3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(restored->rotation.w, 1.0f);
}
