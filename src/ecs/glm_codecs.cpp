/**
 * @file glm_codecs.cpp
 * @brief Implementation of GLM <-> YAML conversion
 *
 * @date 2025-11-02
 */

#include <strata/ecs/glm_codecs.hpp>

#include <array>
#include <format>

namespace strata::ecs {

namespace {

/**
 * @brief Reads an N-element float sequence
 *
 * ✨ FUNCTIONAL ✨
 */
template<std::size_t N>
auto read_floats(const YAML::Node& node, std::string_view what) -> Result<std::array<f32, N>> {
    if (!node.IsSequence() || node.size() != N) {
        return make_error(ErrorCode::SNAPSHOT_VALIDATION_ERROR,
                          std::format("Invalid {}: expected a sequence of {} numbers", what, N));
    }

    std::array<f32, N> values{};
    try {
        for (std::size_t i = 0; i < N; ++i) {
            values[i] = node[i].template as<f32>();
        }
    } catch (const YAML::Exception& e) {
        return make_error(ErrorCode::SNAPSHOT_VALIDATION_ERROR,
                          std::format("Invalid {}: {}", what, e.what()));
    }
    return values;
}

template<typename... Fs>
auto flow_sequence(Fs... values) -> YAML::Node {
    YAML::Node node;
    (node.push_back(values), ...);
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

} // anonymous namespace

auto vec2_to_yaml(const vec2& v) -> YAML::Node {
    return flow_sequence(v.x, v.y);
}

auto vec3_to_yaml(const vec3& v) -> YAML::Node {
    return flow_sequence(v.x, v.y, v.z);
}

auto vec4_to_yaml(const vec4& v) -> YAML::Node {
    return flow_sequence(v.x, v.y, v.z, v.w);
}

auto quat_to_yaml(const quat& q) -> YAML::Node {
    return flow_sequence(q.w, q.x, q.y, q.z);  // w first (GLM constructor order)
}

auto yaml_to_vec2(const YAML::Node& node) -> Result<vec2> {
    auto values = read_floats<2>(node, "vec2");
    if (!values) return std::unexpected(values.error());
    return vec2((*values)[0], (*values)[1]);
}

auto yaml_to_vec3(const YAML::Node& node) -> Result<vec3> {
    auto values = read_floats<3>(node, "vec3");
    if (!values) return std::unexpected(values.error());
    return vec3((*values)[0], (*values)[1], (*values)[2]);
}

auto yaml_to_vec4(const YAML::Node& node) -> Result<vec4> {
    auto values = read_floats<4>(node, "vec4");
    if (!values) return std::unexpected(values.error());
    return vec4((*values)[0], (*values)[1], (*values)[2], (*values)[3]);
}

auto yaml_to_quat(const YAML::Node& node) -> Result<quat> {
    auto values = read_floats<4>(node, "quat");
    if (!values) return std::unexpected(values.error());
    return quat((*values)[0], (*values)[1], (*values)[2], (*values)[3]);
}

} // namespace strata::ecs
