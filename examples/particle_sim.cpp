/**
 * @file particle_sim.cpp
 * @brief Headless particle fountain driven by a phased schedule
 *
 * This example demonstrates:
 * 1. Loading runtime settings from a YAML config (optional argv[1])
 * 2. Emitting particles through deferred commands
 * 3. Integrating motion with table queries over GLM components
 * 4. Expiring particles and reporting them through events
 * 5. Saving a world snapshot and restoring it into a fresh world
 *
 * Usage: strata_particles [config.yaml]
 *
 * @date 2025-11-02
 */

#include <strata/core/config.hpp>
#include <strata/core/logging.hpp>
#include <strata/core/math.hpp>
#include <strata/ecs/glm_codecs.hpp>
#include <strata/ecs/schedule.hpp>
#include <strata/ecs/world.hpp>

#include <glm/gtc/constants.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::ecs;

//============================================================================
// Components, Resources, Events
//============================================================================

struct Position {
    vec3 value{0.0f};
};

struct Velocity {
    vec3 value{0.0f};
};

struct Lifetime {
    f32 remaining = 0.0f;
};

struct Emitter {
    vec3 origin{0.0f, 0.0f, 0.0f};
    u32 per_frame = 8;
    u64 emitted = 0;
};

struct Gravity {
    vec3 value{0.0f, -9.81f, 0.0f};
};

struct ParticleExpired {
    Entity entity;
    f32 height = 0.0f;
};

//============================================================================
// Snapshot Codecs
//============================================================================

namespace {

auto vec3_codec_node(const vec3& v) -> YAML::Node {
    YAML::Node node;
    node["value"] = vec3_to_yaml(v);
    return node;
}

auto register_codecs(World& world) -> Result<void> {
    auto position = world.register_component_snapshot(SnapshotCodec<Position>{
        .key = "position",
        .serialize = [](const Position& p) { return vec3_codec_node(p.value); },
        .deserialize = [](const YAML::Node& node) -> Result<Position> {
            auto value = yaml_to_vec3(node["value"]);
            if (!value) return std::unexpected(value.error());
            return Position{*value};
        },
    });
    if (!position) return position;

    auto velocity = world.register_component_snapshot(SnapshotCodec<Velocity>{
        .key = "velocity",
        .serialize = [](const Velocity& v) { return vec3_codec_node(v.value); },
        .deserialize = [](const YAML::Node& node) -> Result<Velocity> {
            auto value = yaml_to_vec3(node["value"]);
            if (!value) return std::unexpected(value.error());
            return Velocity{*value};
        },
    });
    if (!velocity) return velocity;

    auto lifetime = world.register_component_snapshot(SnapshotCodec<Lifetime>{
        .key = "lifetime",
        .serialize = [](const Lifetime& l) { return YAML::Node(l.remaining); },
        .deserialize = [](const YAML::Node& node) -> Result<Lifetime> {
            return Lifetime{node.as<f32>()};
        },
    });
    if (!lifetime) return lifetime;

    return world.register_resource_snapshot(SnapshotCodec<Emitter>{
        .key = "emitter",
        .serialize = [](const Emitter& e) {
            YAML::Node node;
            node["origin"] = vec3_to_yaml(e.origin);
            node["per_frame"] = e.per_frame;
            node["emitted"] = e.emitted;
            return node;
        },
        .deserialize = [](const YAML::Node& node) -> Result<Emitter> {
            auto origin = yaml_to_vec3(node["origin"]);
            if (!origin) return std::unexpected(origin.error());
            return Emitter{*origin, node["per_frame"].as<u32>(), node["emitted"].as<u64>()};
        },
    });
}

//============================================================================
// Systems
//============================================================================

auto emit_particles(World& world, f64) -> void {
    Emitter& emitter = world.init_resource<Emitter>([] { return Emitter{}; });

    for (u32 i = 0; i < emitter.per_frame; ++i) {
        // deterministic fan of launch directions
        const f32 angle = static_cast<f32>(emitter.emitted % 16) * (glm::two_pi<f32>() / 16.0f);
        const vec3 launch(glm::cos(angle) * 2.0f, 12.0f, glm::sin(angle) * 2.0f);

        world.cmd().spawn_bundle(Position{emitter.origin}, Velocity{launch}, Lifetime{2.0f});
        ++emitter.emitted;
    }
}

auto integrate(World& world, f64 dt) -> void {
    const f32 step = static_cast<f32>(dt);
    const vec3 gravity = world.init_resource<Gravity>([] { return Gravity{}; }).value;

    for (auto table : world.query_tables<Position, Velocity>()) {
        auto positions = table.column<0>();
        auto velocities = table.column<1>();
        for (std::size_t i = 0; i < table.size(); ++i) {
            velocities[i].value += gravity * step;
            positions[i].value += velocities[i].value * step;
        }
    }
}

auto age(World& world, f64 dt) -> void {
    world.each<Lifetime, const Position>([&](Entity entity, Lifetime& lifetime, const Position& position) {
        lifetime.remaining -= static_cast<f32>(dt);
        if (lifetime.remaining <= 0.0f || position.value.y < 0.0f) {
            world.emit(ParticleExpired{entity, position.value.y});
        }
    });
}

auto reap(World& world, f64) -> void {
    world.drain_events<ParticleExpired>([&](const ParticleExpired& expired) {
        world.cmd().despawn(expired.entity);
    });
}

} // anonymous namespace

//============================================================================
// Main
//============================================================================

auto main(int argc, char** argv) -> int {
    RuntimeConfig config;
    if (argc > 1) {
        auto loaded = load_config(argv[1]);
        if (!loaded) {
            LOG_FATAL("Failed to load config: {}", loaded.error().message);
            return EXIT_FAILURE;
        }
        config = *loaded;
    }

    if (auto logging = apply_logging(config); !logging) {
        LOG_ERROR("Failed to configure logging: {}", logging.error().message);
        return EXIT_FAILURE;
    }

    LOG_INFO("=== strata particle fountain ===");

    World world(to_world_config(config));
    if (auto codecs = register_codecs(world); !codecs) {
        LOG_FATAL("Codec registration failed: {}", codecs.error().message);
        return EXIT_FAILURE;
    }

    Schedule schedule(to_schedule_config(config));
    const std::vector<std::string> phases{"emit", "simulate", "cleanup"};

    for (const auto& result : {
             schedule.add(world, "emit", "emit_particles", emit_particles),
             schedule.add(world, "simulate", "integrate", integrate),
             schedule.add(world, "simulate", "age", age),
             schedule.add(world, "cleanup", "reap", reap),
         }) {
        if (!result) {
            LOG_FATAL("Failed to build schedule: {}", result.error().message);
            return EXIT_FAILURE;
        }
    }

    constexpr f64 dt = 1.0 / 60.0;
    constexpr int frames = 240;

    for (int frame = 0; frame < frames; ++frame) {
        if (auto ran = schedule.run(world, dt, phases); !ran) {
            LOG_ERROR("Frame {} failed: {}", frame, ran.error().message);
            return EXIT_FAILURE;
        }

        if (frame % 60 == 59) {
            const auto stats = world.stats();
            LOG_INFO("frame {:>4}: {} particles, {} archetypes, {:.3f} ms",
                     stats.frame, stats.alive_entities, stats.archetypes, stats.frame_ms);
        }
    }

    // ========== Snapshot ==========

    auto snapshot = world.snapshot();
    if (!snapshot) {
        LOG_ERROR("Snapshot failed: {}", snapshot.error().message);
        return EXIT_FAILURE;
    }

    const std::string path = "snapshots/particles.yaml";
    if (auto saved = save_snapshot(*snapshot, path); !saved) {
        LOG_ERROR("{}", saved.error().message);
        return EXIT_FAILURE;
    }

    auto loaded = load_snapshot(path);
    if (!loaded) {
        LOG_ERROR("{}", loaded.error().message);
        return EXIT_FAILURE;
    }

    World replay(to_world_config(config));
    if (auto codecs = register_codecs(replay); !codecs) {
        LOG_FATAL("Codec registration failed: {}", codecs.error().message);
        return EXIT_FAILURE;
    }
    if (auto restored = replay.restore(*loaded); !restored) {
        LOG_ERROR("Restore failed: {}", restored.error().message);
        return EXIT_FAILURE;
    }

    LOG_INFO("Replayed world holds {} particles (original: {})",
             replay.entity_count(), world.entity_count());

    Logger::instance().shutdown();
    return EXIT_SUCCESS;
}
