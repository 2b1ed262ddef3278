#include "test_harness.hpp"

#include "gameplay/combat_session.hpp"
#include "gameplay/event_bus.hpp"
#include "gameplay/impact_resolver.hpp"
#include "gameplay/weapons/direct_fire.hpp"
#include "sim/timer_queue.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace salvo;
using namespace salvo::gameplay;
using salvo::test::eventsOf;

namespace {

class RecordingEventBus final : public EventBus {
public:
    void broadcast(const std::string& eventName, const nlohmann::json& payload) override {
        m_messages.emplace_back(eventName, payload);
    }

    const std::vector<std::pair<std::string, nlohmann::json>>& messages() const { return m_messages; }

    size_t count(const std::string& eventName) const {
        return static_cast<size_t>(std::count_if(m_messages.begin(), m_messages.end(),
            [&](const auto& message) { return message.first == eventName; }));
    }

    void clear() { m_messages.clear(); }

private:
    std::vector<std::pair<std::string, nlohmann::json>> m_messages;
};

class RecordingTurnListener final : public TurnListener {
public:
    void onFireSequenceComplete(TimeMs finalEventTimeMs) override {
        completions.push_back(finalEventTimeMs);
    }

    std::vector<TimeMs> completions;
};

/**
 * @brief One match on a flat map with a recording bus
 */
struct SessionFixture {
    sim::TimerQueue host;
    // 10 unit grid spacing so small craters move vertices
    world::GridHeightField terrain{2000.0f, 2000.0f, 200};
    ecs::World world;
    world::AgentRoster agents{world};
    world::TargetFleet fleet{world};
    RecordingEventBus bus;
    RecordingTurnListener listener;
    SessionConfig config = makeConfig();
    CombatSession session{config, host, &terrain, &agents, &fleet, bus};

    SessionFixture() {
        session.setTurnListener(&listener);
    }

    static SessionConfig makeConfig() {
        SessionConfig c;
        c.rngSeed = 7;
        return c;
    }

    static FireRequest lob() {
        FireRequest request;
        request.origin = Vec3(0.0f, 10.0f, 0.0f);
        request.direction = glm::normalize(Vec3(1.0f, 1.0f, 0.0f));
        request.power = 300.0f;
        request.owner = 1;
        return request;
    }

    static FireRequest dropFrom(Vec3 origin, f32 power = 100.0f) {
        FireRequest request;
        request.origin = origin;
        request.direction = Vec3(0.0f, -1.0f, 0.0f);
        request.power = power;
        request.owner = 1;
        return request;
    }
};

} // namespace

TEST_CASE_FIXTURE(SessionFixture, "unknown weapon codes are rejected without side effects") {
    auto receipt = session.fire("ZZ01", lob());
    CHECK_FALSE(receipt.has_value());
    CHECK(bus.messages().empty());
    CHECK(host.pending() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "a fire broadcasts its full timeline once") {
    auto receipt = session.fire("BW01", lob());
    REQUIRE(receipt.has_value());

    CHECK(receipt->projectileCount == 1);
    CHECK(receipt->timeline->isFrozen());
    CHECK(receipt->finalEventTime == doctest::Approx(receipt->timeline->maxTime()));

    REQUIRE(bus.messages().size() == 1);
    CHECK(bus.messages()[0].first == events::FULL_PROJECTILE_TIMELINE);
    const auto& payload = bus.messages()[0].second;
    REQUIRE(payload.is_array());
    CHECK(payload.size() == receipt->timeline->size());
    CHECK(payload[0]["type"] == "projectileSpawn");
    CHECK(session.activePlaybacks() == 1);
}

TEST_CASE_FIXTURE(SessionFixture, "impacts dig craters and damage agents at their scheduled time") {
    auto receipt = session.fire(WeaponCode::BasicShot, lob());
    REQUIRE(receipt.has_value());

    const auto impact = eventsOf<sim::ImpactEvent>(*receipt->timeline).front();
    const Vec3 ground{impact.position.x, 0.0f, impact.position.z};
    REQUIRE(agents.spawnAgent(2, "victim", ground).has_value());

    host.advance(impact.time - 1.0);
    CHECK(bus.count(events::TERRAIN_MODIFIED) == 0);
    CHECK(terrain.heightAt(ground.x, ground.z) == doctest::Approx(0.0f));

    host.advance(1.0);
    CHECK(bus.count(events::TERRAIN_MODIFIED) == 1);
    CHECK(terrain.heightAt(ground.x, ground.z) < 0.0f);
    CHECK(bus.count(events::PLAYER_DAMAGED) == 1);
    CHECK(*agents.healthOf(2) == doctest::Approx(100.0f - BasicShotWeapon::DAMAGE));
    CHECK(agents.positionOf(2)->y < 0.0f);
    CHECK(session.activePlaybacks() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "lethal impacts defeat agents") {
    REQUIRE(agents.spawnAgent(2, "victim", Vec3(0.0f), 10.0f).has_value());
    REQUIRE(session.fire("BW01", dropFrom(Vec3(0.0f, 100.0f, 0.0f))).has_value());

    host.advance(10000.0);
    CHECK(bus.count(events::PLAYER_DEFEATED) == 1);
    CHECK(agents.livingCount() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "the turn callback fires turnChangeDelay after the last event") {
    auto receipt = session.fire("BW01", lob());
    REQUIRE(receipt.has_value());
    const TimeMs due = receipt->finalEventTime + config.turnChangeDelayMs;

    host.advance(due - 1.0);
    CHECK(listener.completions.empty());
    CHECK(bus.count(events::FIRE_SEQUENCE_COMPLETE) == 0);

    host.advance(1.0);
    REQUIRE(listener.completions.size() == 1);
    CHECK(listener.completions[0] == doctest::Approx(receipt->finalEventTime));
    CHECK(bus.count(events::FIRE_SEQUENCE_COMPLETE) == 1);
}

TEST_CASE_FIXTURE(SessionFixture, "target hits are applied and destroyed targets removed on playback") {
    fleet.spawnTarget(Vec3(0.0f, 150.0f, 0.0f), Vec3(0.0f, 150.0f, 0.0f), 20.0f, 20.0f);

    auto receipt = session.fire("BW01", dropFrom(Vec3(0.0f, 300.0f, 0.0f)));
    REQUIRE(receipt.has_value());
    CHECK(receipt->timeline->count<sim::TargetDestroyedEvent>() == 1);
    CHECK(fleet.count() == 1);

    host.advance(receipt->finalEventTime);
    CHECK(bus.count(events::TARGET_DAMAGED) == 1);
    CHECK(bus.count(events::TARGET_DESTROYED) == 1);
    CHECK(bus.count(events::TERRAIN_MODIFIED) == 0);
    CHECK(fleet.count() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "teardown cancels every pending effect and turn") {
    auto receipt = session.fire("BB01", lob());
    REQUIRE(receipt.has_value());
    bus.clear();

    session.teardown();
    CHECK(session.isTornDown());
    CHECK(host.pending() == 0);

    host.advance(60000.0);
    CHECK(bus.messages().empty());
    CHECK(listener.completions.empty());

    CHECK_NOTHROW(session.teardown());
    CHECK_FALSE(session.fire("BW01", lob()).has_value());
    CHECK_FALSE(session.fire(WeaponCode::BasicShot, lob()).has_value());
    CHECK(host.pending() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "fires are numbered and overlap safely") {
    auto first = session.fire("MS01", lob());
    auto second = session.fire("VW01", lob());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(second->fireId == first->fireId + 1);
    CHECK(session.activePlaybacks() == 2);

    host.advance(60000.0);
    CHECK(listener.completions.size() == 2);
    CHECK(session.activePlaybacks() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "delivered turn callbacks are released") {
    REQUIRE(session.fire("BW01", lob()).has_value());
    REQUIRE(session.fire("BW01", lob()).has_value());
    CHECK(session.pendingTurnCallbacks() == 2);

    host.advance(60000.0);
    CHECK(listener.completions.size() == 2);
    CHECK(session.pendingTurnCallbacks() == 0);
}

TEST_CASE_FIXTURE(SessionFixture, "out of range weapon ids are rejected") {
    CHECK_FALSE(session.fire(WeaponCode::Count, lob()).has_value());
    session.teardown();
    CHECK_FALSE(session.fire(WeaponCode::Count, lob()).has_value());
    CHECK(bus.messages().empty());
}

TEST_CASE("a session with a zero physics step refuses to fire") {
    sim::TimerQueue host;
    world::GridHeightField terrain(1000.0f, 1000.0f, 50);
    RecordingEventBus bus;

    SessionConfig config;
    config.rngSeed = 3;
    config.simulation.stepMs = 0.0f;
    CombatSession session(config, host, &terrain, nullptr, nullptr, bus);

    auto receipt = session.fire("BW01", SessionFixture::lob());
    CHECK_FALSE(receipt.has_value());
    CHECK(bus.messages().empty());
    CHECK(host.pending() == 0);
}

// ============================================================================
// ImpactResolver
// ============================================================================

TEST_CASE("ImpactResolver skips craters of size zero") {
    world::GridHeightField terrain(100.0f, 100.0f, 10);
    RecordingEventBus bus;
    ImpactResolver resolver(&terrain, nullptr, nullptr, bus);

    sim::ImpactEvent burst;
    burst.craterSize = 0.0f;
    resolver.onImpact(burst);

    CHECK(bus.messages().empty());
    CHECK(resolver.impactsApplied() == 1);
}

TEST_CASE("a detached ImpactResolver ignores effects") {
    world::GridHeightField terrain(100.0f, 100.0f, 10);
    RecordingEventBus bus;
    ImpactResolver resolver(&terrain, nullptr, nullptr, bus);
    resolver.detach();

    sim::ImpactEvent impact;
    impact.craterSize = 20.0f;
    resolver.onImpact(impact);
    resolver.onTargetDestroyed(sim::TargetDestroyedEvent{});

    CHECK(resolver.isDetached());
    CHECK(bus.messages().empty());
    CHECK(terrain.heightAt(0.0f, 0.0f) == doctest::Approx(0.0f));
}

TEST_CASE("LogEventBus counts broadcasts") {
    LogEventBus bus;
    bus.broadcast(events::TARGET_DESTROYED, {{"targetId", 1}});
    bus.broadcast(events::FULL_PROJECTILE_TIMELINE, nlohmann::json::array());
    CHECK(bus.broadcastCount() == 2);
}
