#include "test_harness.hpp"

#include "sim/timeline_json.hpp"

using namespace salvo;
using namespace salvo::sim;

namespace {

MoveEvent move(TimeMs time, ProjectileId id) {
    MoveEvent e;
    e.time = time;
    e.projectileId = id;
    return e;
}

} // namespace

TEST_CASE("freeze sorts by time and keeps insertion order for ties") {
    Timeline timeline;
    timeline.append(move(100.0, 1));
    timeline.append(move(50.0, 2));
    timeline.append(move(100.0, 3));
    timeline.append(move(0.0, 4));

    timeline.freeze();
    REQUIRE(timeline.isFrozen());

    const auto& events = timeline.events();
    REQUIRE(events.size() == 4);
    CHECK(eventProjectile(events[0]) == 4);
    CHECK(eventProjectile(events[1]) == 2);
    CHECK(eventProjectile(events[2]) == 1);
    CHECK(eventProjectile(events[3]) == 3);
}

TEST_CASE("a frozen timeline ignores appends") {
    Timeline timeline;
    timeline.append(move(10.0, 1));
    timeline.freeze();

    timeline.append(move(20.0, 1));
    timeline.truncateAfter(1, 0.0);
    CHECK(timeline.size() == 1);
}

TEST_CASE("truncateAfter only drops later events of one projectile") {
    Timeline timeline;
    timeline.append(SpawnEvent{0.0, 1});
    timeline.append(move(50.0, 1));
    timeline.append(move(100.0, 1));
    timeline.append(move(150.0, 2));
    timeline.append(ExpiredEvent{150.0, 1, Vec3(0.0f)});

    timeline.truncateAfter(1, 50.0);

    CHECK(timeline.eventsFor(1).size() == 2);
    CHECK(timeline.eventsFor(2).size() == 1);
    CHECK(timeline.count<ExpiredEvent>() == 0);
}

TEST_CASE("timeline summaries") {
    Timeline timeline;
    CHECK(timeline.empty());
    CHECK(timeline.maxTime() == doctest::Approx(0.0));

    timeline.append(SpawnEvent{0.0, 1});
    timeline.append(SpawnEvent{500.0, 2});
    timeline.append(move(750.0, 2));

    Timeline other;
    other.append(SpawnEvent{10.0, 3});
    timeline.merge(other);

    CHECK(timeline.projectileCount() == 3);
    CHECK(timeline.count<MoveEvent>() == 1);
    CHECK(timeline.maxTime() == doctest::Approx(750.0));
}

TEST_CASE("events serialize with their wire type names") {
    SpawnEvent spawn;
    spawn.time = 0.0;
    spawn.projectileId = 7;
    spawn.weaponCode = "BW01";
    spawn.position = Vec3(1.0f, 2.0f, 3.0f);

    const auto json = eventToJson(spawn);
    CHECK(json["type"] == "projectileSpawn");
    CHECK(json["projectileId"] == 7);
    CHECK(json["weaponCode"] == "BW01");
    CHECK(json["playerId"].is_null());
    CHECK(json["startPos"]["z"].get<f32>() == doctest::Approx(3.0f));
    CHECK(json["projectileStyle"] == "missile");

    ImpactEvent impact;
    impact.kind = ImpactKind::DynamicTarget;
    impact.targetId = 4;
    impact.owner = 2;
    const auto impactJson = eventToJson(impact);
    CHECK(impactJson["type"] == "projectileImpact");
    CHECK(impactJson["isTargetHit"] == true);
    CHECK(impactJson["hitTargetId"] == 4);
    CHECK(impactJson["playerId"] == 2);

    CHECK(eventToJson(TargetDestroyedEvent{})["type"] == "targetDestroyed");
    CHECK(eventToJson(ExpiredEvent{})["type"] == "projectileExpired");
    CHECK(eventToJson(MoveEvent{})["type"] == "projectileMove");
}

TEST_CASE("timelineToJson keeps stored order") {
    Timeline timeline;
    timeline.append(SpawnEvent{0.0, 1});
    timeline.append(move(50.0, 1));
    timeline.append(ExpiredEvent{100.0, 1, Vec3(0.0f)});

    const auto json = timelineToJson(timeline);
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 3);
    CHECK(json[0]["type"] == "projectileSpawn");
    CHECK(json[2]["type"] == "projectileExpired");
}
