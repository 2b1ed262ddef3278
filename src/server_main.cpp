/**
 * @file server_main.cpp
 * @brief Dedicated server entry point
 *
 * Runs one artillery match headless: the tick loop advances the ECS world
 * (helicopter flight) and the match timer queue, and a demo roster of CPU
 * tanks fires every weapon of the catalog in turn.
 */

#include "core/core.hpp"
#include "core/logging/logger.hpp"
#include "core/math/math.hpp"
#include "ecs/ecs.hpp"
#include "world/height_field.hpp"
#include "world/agent_roster.hpp"
#include "world/target_registry.hpp"
#include "sim/timer_queue.hpp"
#include "gameplay/event_bus.hpp"
#include "gameplay/combat_session.hpp"
#include "gameplay/weapons/weapon.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <random>
#include <string>
#include <thread>

using namespace salvo;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        LOG_INFO("Shutdown signal received");
        g_shutdown = true;
    }
}

/**
 * @brief Server configuration
 */
struct ServerConfig {
    i32 tickRate = 60;
    u32 seed = 0;                       // 0 = random match
    world::Theme theme = world::Theme::Grassland;
    f32 terrainSize = 1500.0f;
    u32 terrainSegments = 128;
    i32 agentCount = 4;
    i32 helicopterCount = 3;
    i32 demoFires = 0;                  // 0 = until the round ends
    std::string logFile = "salvo_server.log";
    bool verbose = false;
    gameplay::SessionConfig session;
};

/**
 * @brief Dedicated server application
 */
class ServerApplication final : public gameplay::TurnListener {
public:
    bool initialize(const ServerConfig& config) {
        m_config = config;

        // Initialize logging
        Logger::initialize(config.logFile, config.verbose ? LogLevel::Debug : LogLevel::Info, LogLevel::Debug);
        LOG_INFO("Salvo Dedicated Server");
        LOG_INFO("Version: {}", VERSION_STRING);

        const u32 matchSeed = config.seed != 0 ? config.seed : std::random_device{}();
        m_rng.seed(matchSeed);

        // Initialize ECS world
        m_world = std::make_unique<ecs::World>();

        // Terrain
        m_terrain = std::make_unique<world::GridHeightField>(
            config.terrainSize, config.terrainSize, config.terrainSegments, config.theme);
        const f32 phase = std::uniform_real_distribution<f32>(0.0f, math::TWO_PI)(m_rng);
        m_terrain->generate([phase](f32 x, f32 z) {
            return 40.0f * std::sin(x * 0.004f + phase) * std::cos(z * 0.005f)
                 + 15.0f * std::sin(x * 0.013f + z * 0.011f);
        });

        // Tanks on a ring around the center
        m_agents = std::make_unique<world::AgentRoster>(*m_world);
        for (i32 i = 0; i < config.agentCount; ++i) {
            const f32 angle = math::TWO_PI * static_cast<f32>(i) / static_cast<f32>(config.agentCount);
            const f32 x = std::cos(angle) * config.terrainSize * 0.3f;
            const f32 z = std::sin(angle) * config.terrainSize * 0.3f;
            const Vec3 position{x, m_terrain->heightAt(x, z), z};

            auto spawned = m_agents->spawnAgent(static_cast<PlayerId>(i), "CPU_" + std::to_string(i + 1), position,
                                                100.0f, i % 2 == 0 ? 25.0f : 0.0f, 0.0f);
            if (!spawned) {
                LOG_ERROR("Failed to spawn agent {}: {}", i, spawned.error().message);
                return false;
            }
        }

        // Helicopters
        m_targets = std::make_unique<world::TargetFleet>(*m_world);
        for (i32 i = 0; i < config.helicopterCount; ++i) {
            const Vec3 start = world::TargetFleet::randomWaypoint(m_rng);
            m_targets->spawnTarget(start, world::TargetFleet::randomWaypoint(m_rng));
        }
        m_world->registerSystem<world::FlightSystem>(ecs::SystemPhase::Simulation, m_terrain.get(), matchSeed);

        // Combat core
        m_bus = std::make_unique<gameplay::LogEventBus>();
        m_session = std::make_unique<gameplay::CombatSession>(
            config.session, m_timers, m_terrain.get(), m_agents.get(), m_targets.get(), *m_bus);
        m_session->setTurnListener(this);

        // Calculate tick interval
        m_tickInterval = 1.0f / static_cast<f32>(config.tickRate);
        m_awaitingFire = true;

        LOG_INFO("Server initialized");
        LOG_INFO("  Seed: {}", matchSeed);
        LOG_INFO("  Theme: {}", world::themeName(config.theme));
        LOG_INFO("  Agents: {}, helicopters: {}", config.agentCount, config.helicopterCount);
        LOG_INFO("  Tick rate: {} Hz ({:.4f}s interval)", config.tickRate, m_tickInterval);
        LOG_INFO("  Step: {} ms, max flight: {} ms, turn delay: {} ms",
                 config.session.simulation.stepMs, config.session.simulation.maxDurationMs,
                 config.session.turnChangeDelayMs);

        return true;
    }

    void shutdown() {
        LOG_INFO("Server shutting down after {} match ticks", m_world ? m_world->currentTick() : 0);

        m_session.reset();
        m_timers.clear();
        m_targets.reset();
        m_agents.reset();
        m_world.reset();

        Logger::shutdown();
    }

    void run() {
        LOG_INFO("Starting server tick loop");

        auto lastTime = Clock::now();
        f32 accumulator = 0.0f;

        Tick tick = 0;

        while (!g_shutdown) {
            auto currentTime = Clock::now();
            f32 deltaTime = std::chrono::duration<f32>(currentTime - lastTime).count();
            lastTime = currentTime;

            // Cap delta to prevent spiral of death
            if (deltaTime > 0.25f) {
                deltaTime = 0.25f;
            }

            accumulator += deltaTime;

            // Process ticks
            while (accumulator >= m_tickInterval) {
                processTick();
                ++tick;
                accumulator -= m_tickInterval;
            }

            // Sleep to avoid busy waiting
            f32 sleepTime = m_tickInterval - accumulator;
            if (sleepTime > 0.001f) {
                std::this_thread::sleep_for(
                    std::chrono::microseconds(static_cast<i64>(sleepTime * 1000000.0f))
                );
            }
        }

        LOG_INFO("Server stopped after {} ticks", tick);
    }

    void onFireSequenceComplete(TimeMs finalEventTimeMs) override {
        LOG_INFO("Fire sequence complete ({:.0f} ms of events)", finalEventTimeMs);

        if (m_agents->livingCount() <= 1) {
            const auto survivors = m_agents->livingAgents();
            if (survivors.empty()) {
                LOG_INFO("Round over: no survivors");
            } else {
                LOG_INFO("Round over: agent {} wins", survivors.front().id);
            }
            g_shutdown = true;
            return;
        }
        if (m_config.demoFires > 0 && m_firesDone >= m_config.demoFires) {
            LOG_INFO("Demo finished after {} fires", m_firesDone);
            g_shutdown = true;
            return;
        }

        m_awaitingFire = true;
    }

private:
    void processTick() {
        // 1. Move helicopters and other ECS systems
        m_world->fixedUpdate(m_tickInterval);

        // 2. Play back scheduled impacts and turn callbacks
        m_timers.advance(static_cast<TimeMs>(m_tickInterval) * 1000.0);

        // 3. Let the current player shoot
        if (m_awaitingFire) {
            fireNextTurn();
        }
    }

    void fireNextTurn() {
        const auto living = m_agents->livingAgents();
        if (living.size() < 2) {
            return;
        }
        m_awaitingFire = false;

        const auto& shooter = living[m_turnIndex % living.size()];
        const auto& victim = living[(m_turnIndex + 1) % living.size()];
        ++m_turnIndex;

        // 45 degree lob toward the next tank
        Vec3 toVictim = victim.position - shooter.position;
        toVictim.y = 0.0f;
        const f32 distance = glm::length(toVictim);
        const Vec3 flat = math::safeNormalize(toVictim, Vec3(1.0f, 0.0f, 0.0f));

        gameplay::FireRequest request;
        request.origin = shooter.position + Vec3(0.0f, 10.0f, 0.0f);
        request.direction = glm::normalize(flat + math::UP);
        request.power = math::clamp(std::sqrt(distance * 300.0f), 100.0f, 600.0f);
        request.owner = shooter.id;

        const auto codes = gameplay::allWeaponCodes();
        const auto code = codes[static_cast<size_t>(m_firesDone) % codes.size()];
        ++m_firesDone;

        auto receipt = m_session->fire(gameplay::getWeaponData(code).code, request);
        if (!receipt) {
            LOG_WARN("Agent {} could not fire: {}", shooter.id, receipt.error().message);
            m_awaitingFire = true;
        }
    }

    ServerConfig m_config;
    std::unique_ptr<ecs::World> m_world;
    std::unique_ptr<world::GridHeightField> m_terrain;
    std::unique_ptr<world::AgentRoster> m_agents;
    std::unique_ptr<world::TargetFleet> m_targets;
    std::unique_ptr<gameplay::LogEventBus> m_bus;
    sim::TimerQueue m_timers;
    std::unique_ptr<gameplay::CombatSession> m_session;
    std::mt19937 m_rng;

    f32 m_tickInterval = 1.0f / 60.0f;
    bool m_awaitingFire = false;
    size_t m_turnIndex = 0;
    i32 m_firesDone = 0;
};

int main(int argc, char* argv[]) {
    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Parse command line arguments
    ServerConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-tickrate" && i + 1 < argc) {
            config.tickRate = std::stoi(argv[++i]);
        } else if (arg == "-seed" && i + 1 < argc) {
            config.seed = static_cast<u32>(std::stoul(argv[++i]));
            config.session.rngSeed = config.seed;
        } else if (arg == "-theme" && i + 1 < argc) {
            const std::string name = argv[++i];
            if (auto theme = world::parseTheme(name)) {
                config.theme = *theme;
            } else {
                LOG_WARN("Unknown theme '{}', using {}", name, world::themeName(config.theme));
            }
        } else if (arg == "-turndelay" && i + 1 < argc) {
            config.session.turnChangeDelayMs = std::stod(argv[++i]);
        } else if (arg == "-step" && i + 1 < argc) {
            config.session.simulation.stepMs = std::stof(argv[++i]);
        } else if (arg == "-maxtime" && i + 1 < argc) {
            config.session.simulation.maxDurationMs = std::stof(argv[++i]);
        } else if (arg == "-fires" && i + 1 < argc) {
            config.demoFires = std::stoi(argv[++i]);
        } else if (arg == "-log" && i + 1 < argc) {
            config.logFile = argv[++i];
        } else if (arg == "-verbose") {
            config.verbose = true;
        }
    }

    if (config.tickRate <= 0) {
        LOG_ERROR("Tick rate must be positive");
        return 1;
    }
    if (auto valid = sim::validateConfig(config.session.simulation); !valid) {
        LOG_ERROR("Invalid simulation settings: {}", valid.error().message);
        return 1;
    }

    ServerApplication server;

    if (!server.initialize(config)) {
        return 1;
    }

    server.run();
    server.shutdown();

    return 0;
}
