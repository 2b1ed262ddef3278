#include "test_harness.hpp"

#include "gameplay/weapons/weapon.hpp"
#include "gameplay/weapons/direct_fire.hpp"
#include "gameplay/weapons/bounce_weapons.hpp"
#include "gameplay/weapons/burst_weapons.hpp"
#include "gameplay/weapons/carrier_weapons.hpp"
#include "gameplay/weapons/guided_weapons.hpp"

#include <array>
#include <string>

using namespace salvo;
using namespace salvo::gameplay;
using salvo::test::FireFixture;
using salvo::test::eventsOf;
using salvo::test::terminalCount;

namespace {

/// 45 degree lob from just above the ground
FireRequest lob(f32 power = 300.0f) {
    FireRequest request;
    request.origin = Vec3(0.0f, 10.0f, 0.0f);
    request.direction = glm::normalize(Vec3(1.0f, 1.0f, 0.0f));
    request.power = power;
    request.owner = 1;
    return request;
}

} // namespace

// ============================================================================
// Catalog
// ============================================================================

TEST_CASE("weapon catalog codes") {
    CHECK(parseWeaponCode("BW01") == WeaponCode::BasicShot);
    CHECK(parseWeaponCode("MGW01") == WeaponCode::MultiGuided);
    CHECK_FALSE(parseWeaponCode("XX99").has_value());
    CHECK_FALSE(parseWeaponCode("").has_value());

    const auto codes = allWeaponCodes();
    REQUIRE(codes.size() == static_cast<size_t>(WeaponCode::Count));
    for (WeaponCode code : codes) {
        auto weapon = createWeapon(code);
        REQUIRE(weapon != nullptr);
        CHECK(weapon->id() == code);
        CHECK(parseWeaponCode(weapon->data().code) == code);
    }
    CHECK(createWeapon(WeaponCode::Count) == nullptr);
}

TEST_CASE_FIXTURE(FireFixture, "every weapon resolves to terminated projectiles") {
    for (WeaponCode code : allWeaponCodes()) {
        CAPTURE(getWeaponData(code).code);

        sim::Timeline fired;
        auto context = makeContext(11);
        auto weapon = createWeapon(code);
        REQUIRE(weapon->fire(lob(), fired, context).has_value());

        CHECK(fired.projectileCount() >= 1);
        CHECK(fired.projectileCount() == context.producedCount());
        for (const auto& spawn : eventsOf<sim::SpawnEvent>(fired)) {
            CHECK(terminalCount(fired, spawn.projectileId) == 1);
        }
    }
}

TEST_CASE_FIXTURE(FireFixture, "weapons reject invalid fire requests") {
    auto context = makeContext();
    auto request = lob();
    request.power = 0.0f;

    BasicShotWeapon weapon;
    CHECK_FALSE(weapon.fire(request, timeline, context).has_value());
    CHECK(timeline.empty());
}

// ============================================================================
// Direct fire
// ============================================================================

TEST_CASE_FIXTURE(FireFixture, "BW01 fires one final shell") {
    auto context = makeContext();
    BasicShotWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1);
    CHECK(spawns[0].isFinalProjectile);
    CHECK(spawns[0].weaponCode == "BW01");
    CHECK(spawns[0].owner == 1);

    const auto impacts = eventsOf<sim::ImpactEvent>(timeline);
    REQUIRE(impacts.size() == 1);
    CHECK(impacts[0].baseDamage == doctest::Approx(BasicShotWeapon::DAMAGE));
    CHECK(impacts[0].craterSize == doctest::Approx(BasicShotWeapon::CRATER_SIZE));
    CHECK(impacts[0].position.x > 0.0f);
}

TEST_CASE_FIXTURE(FireFixture, "VW01 launches every shell together") {
    auto context = makeContext();
    SalvoWeapon weapon(SalvoWeapon::volley());
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 10);
    for (size_t i = 0; i < spawns.size(); ++i) {
        CHECK(spawns[i].time == doctest::Approx(0.0));
        CHECK(spawns[i].isFinalProjectile == (i + 1 == spawns.size()));
    }
}

TEST_CASE_FIXTURE(FireFixture, "MS01 staggers its shots") {
    auto context = makeContext();
    SalvoWeapon weapon(SalvoWeapon::multiShot());
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 8);
    for (size_t i = 0; i < spawns.size(); ++i) {
        CHECK(spawns[i].time == doctest::Approx(500.0 * static_cast<f64>(i)));
    }
}

// ============================================================================
// Bounces
// ============================================================================

TEST_CASE_FIXTURE(FireFixture, "BB01 bounces at most four times") {
    auto context = makeContext();
    BouncingBettyWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    CHECK(timeline.projectileCount() >= 2);
    CHECK(timeline.projectileCount() <= BouncingBettyWeapon::MAX_BOUNCES + 1);

    const auto impacts = eventsOf<sim::ImpactEvent>(timeline);
    for (const auto& impact : impacts) {
        CHECK(impact.bounceCount <= BouncingBettyWeapon::MAX_BOUNCES);
        CHECK(impact.isFinalProjectile == (impact.bounceCount == BouncingBettyWeapon::MAX_BOUNCES));
    }
    for (size_t i = 1; i < impacts.size(); ++i) {
        CHECK(impacts[i].time >= impacts[i - 1].time);
    }
}

TEST_CASE("BB01 bounce children reflect upward and lose power") {
    salvo::test::FireFixture fixture;
    auto context = fixture.makeContext();

    sim::ImpactEvent impact;
    impact.position = Vec3(100.0f, 0.0f, 0.0f);
    impact.velocity = Vec3(200.0f, -200.0f, 0.0f);
    impact.power = 300.0f;
    impact.bounceCount = 0;
    impact.weaponInstance = 5;

    const auto child = BouncingBettyWeapon::bounceChild(impact, context);
    CHECK(child.direction.y > 0.0f);
    CHECK(child.power == doctest::Approx(240.0f));
    CHECK(child.bounceCount == 1);
    CHECK_FALSE(child.isFinalProjectile);
    CHECK(child.weaponInstance == WeaponInstanceId{5});
    CHECK(child.startPosition.y > impact.position.y);

    impact.bounceCount = BouncingBettyWeapon::MAX_BOUNCES - 1;
    const auto last = BouncingBettyWeapon::bounceChild(impact, context);
    CHECK(last.isFinalProjectile);
    CHECK_FALSE(last.weaponInstance.has_value());
}

TEST_CASE_FIXTURE(FireFixture, "BR01 never exceeds its projectile cap") {
    auto context = makeContext();
    BouncingRabbitWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    CHECK(timeline.projectileCount() > 1);
    CHECK(timeline.projectileCount() <= BouncingRabbitWeapon::MAX_TOTAL_PROJECTILES);
    for (const auto& impact : eventsOf<sim::ImpactEvent>(timeline)) {
        CHECK(impact.bounceCount <= BouncingRabbitWeapon::MAX_BOUNCES);
    }
}

TEST_CASE_FIXTURE(FireFixture, "BR01 honours a lowered ceiling") {
    auto context = makeContext();
    BouncingRabbitWeapon weapon;
    weapon.setCeiling(7);
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    CHECK(timeline.projectileCount() <= 7);
}

TEST_CASE_FIXTURE(FireFixture, "BR01 with no room to split fires one shell") {
    auto context = makeContext();
    BouncingRabbitWeapon weapon;
    weapon.setCeiling(3);
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    CHECK(timeline.projectileCount() == 1);
}

// ============================================================================
// Bursts
// ============================================================================

TEST_CASE_FIXTURE(FireFixture, "JB01 hops until its bounce limit") {
    auto context = makeContext();
    PepperBurstWeapon weapon(PepperBurstWeapon::jumpingBean());
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    CHECK(timeline.projectileCount() >= 2);
    CHECK(timeline.projectileCount() <= 16);

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    for (size_t i = 1; i < spawns.size(); ++i) {
        CHECK(spawns[i].visual.projectileStyle == "spike_bomb");
    }
}

TEST_CASE_FIXTURE(FireFixture, "PC01 pops two children per impact") {
    auto context = makeContext();
    PepperBurstWeapon weapon(PepperBurstWeapon::popcorn());
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    // 1 + 2 + 4 + 8 + 16 + 32
    CHECK(timeline.projectileCount() >= 3);
    CHECK(timeline.projectileCount() <= 63);
}

TEST_CASE("pepper hop damage decays to its floor") {
    salvo::test::FireFixture fixture;
    auto context = fixture.makeContext();
    const auto params = PepperBurstWeapon::jumpingBean();

    sim::ImpactEvent impact;
    impact.position = Vec3(0.0f);
    impact.bounceCount = 0;
    auto first = PepperBurstWeapon::hopChild(params, impact, context);
    CHECK(first.baseDamage == doctest::Approx(params.baseDamage));
    CHECK(first.bounceCount == 1);

    impact.bounceCount = 14;
    auto last = PepperBurstWeapon::hopChild(params, impact, context);
    CHECK(last.baseDamage == doctest::Approx(params.minDamage));
    CHECK(last.isFinalProjectile);
    CHECK(last.timeFactor >= params.minTimeFactor);
}

TEST_CASE_FIXTURE(FireFixture, "MM01 throws seven shells from the impact") {
    auto context = makeContext();
    MountainMercWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1 + MountainMercWeapon::CHILD_COUNT);

    const auto mainImpact = eventsOf<sim::ImpactEvent>(timeline).front();
    for (size_t i = 1; i < spawns.size(); ++i) {
        CHECK(spawns[i].time == doctest::Approx(mainImpact.time));
        CHECK(spawns[i].direction.y > 0.9f);
    }
    CHECK(spawns.back().isFinalProjectile);
}

TEST_CASE_FIXTURE(FireFixture, "SW01 does not spray after a mid-air target hit") {
    fleet.spawnTarget(Vec3(0.0f, 50.0f, 0.0f), Vec3(0.0f, 50.0f, 0.0f), 100.0f, 10.0f);
    auto context = makeContext();

    FireRequest request;
    request.origin = Vec3(0.0f, 100.0f, 0.0f);
    request.direction = Vec3(0.0f, -1.0f, 0.0f);
    request.power = 50.0f;
    request.owner = 1;

    SprinklerWeapon weapon;
    REQUIRE(weapon.fire(request, timeline, context).has_value());

    CHECK(eventsOf<sim::SpawnEvent>(timeline).size() == 1);
    const auto impacts = eventsOf<sim::ImpactEvent>(timeline);
    REQUIRE(impacts.size() == 1);
    CHECK(impacts[0].kind == sim::ImpactKind::DynamicTarget);
    CHECK(context.producedCount() == 1);
}

TEST_CASE("SW01 ring order fills evens first") {
    const std::array<u32, SprinklerWeapon::RING_STEPS> expected = {0, 2, 4, 6, 8, 10, 11, 1, 3, 5, 7, 9};
    CHECK(SprinklerWeapon::firingOrder() == expected);
}

TEST_CASE_FIXTURE(FireFixture, "SW01 sprays four shells per ring step") {
    auto context = makeContext();
    SprinklerWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1 + SprinklerWeapon::RING_STEPS * SprinklerWeapon::POWERS.size());

    const auto mainImpact = eventsOf<sim::ImpactEvent>(timeline).front();
    CHECK(spawns[1].time == doctest::Approx(mainImpact.time));
    CHECK(spawns.back().time ==
          doctest::Approx(mainImpact.time + SprinklerWeapon::STEP_DELAY * (SprinklerWeapon::RING_STEPS - 1)));
    for (size_t i = 1; i < spawns.size(); ++i) {
        CHECK(spawns[i].isFinalProjectile);
    }
}

// ============================================================================
// Carriers
// ============================================================================

TEST_CASE_FIXTURE(FireFixture, "CW01 bursts at the apex") {
    auto context = makeContext();
    ClusterWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1 + ClusterWeapon::CLUSTER_COUNT);
    CHECK_FALSE(spawns[0].doesCollide);

    const auto carrier = timeline.eventsFor(spawns[0].projectileId);
    REQUIRE(std::holds_alternative<sim::ImpactEvent>(carrier.back()));
    const auto& burst = std::get<sim::ImpactEvent>(carrier.back());
    CHECK(burst.craterSize == doctest::Approx(0.0f));
    CHECK(burst.baseDamage == doctest::Approx(0.0f));

    // Nothing the carrier did before the burst was higher
    for (const auto& event : carrier) {
        if (const auto* move = std::get_if<sim::MoveEvent>(&event)) {
            CHECK(move->position.y <= burst.position.y);
        }
    }

    for (size_t i = 1; i < spawns.size(); ++i) {
        CHECK(spawns[i].time == doctest::Approx(burst.time));
        CHECK(spawns[i].isFinalProjectile == (i + 1 == spawns.size()));
    }
}

TEST_CASE_FIXTURE(FireFixture, "RF01 drops bomblets from its carrier") {
    auto context = makeContext();
    AirstrikeWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() >= 2);
    CHECK(spawns.size() <= 1 + AirstrikeWeapon::BOMB_COUNT);
    CHECK(spawns[0].weaponCode == "RF01");

    const auto carrier = timeline.eventsFor(spawns[0].projectileId);
    CHECK(std::holds_alternative<sim::ImpactEvent>(carrier.back()));

    for (size_t i = 1; i < spawns.size(); ++i) {
        CHECK(spawns[i].weaponCode == AIRSTRIKE_BOMBLET_CODE);
        CHECK(spawns[i].time >= AirstrikeWeapon::INITIAL_DELAY);
        CHECK(spawns[i].time >= spawns[i - 1].time);
    }
    CHECK(spawns[1].time == doctest::Approx(AirstrikeWeapon::INITIAL_DELAY));
}

// ============================================================================
// Guided
// ============================================================================

TEST_CASE_FIXTURE(FireFixture, "GW01 without targets fires one unguided shell") {
    auto context = makeContext();
    GuidedWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1);
    CHECK(spawns[0].isFinalProjectile);
    CHECK(spawns[0].power == doctest::Approx(300.0f));
}

TEST_CASE_FIXTURE(FireFixture, "GW01 locks a target in range") {
    fleet.spawnTarget(Vec3(600.0f, 250.0f, 0.0f), Vec3(600.0f, 250.0f, 0.0f));
    auto context = makeContext();
    GuidedWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1);
    CHECK(spawns[0].power == doctest::Approx(300.0f * GuidedWeapon::POWER_FACTOR));
}

TEST_CASE_FIXTURE(FireFixture, "guided weapons look ahead over different horizons") {
    // Leaves the engagement box between six and eight seconds
    fleet.spawnTarget(Vec3(500.0f, 250.0f, 0.0f), Vec3(1500.0f, 250.0f, 0.0f));
    for (auto [entity, velocity] : world.getRegistry().view<ecs::VelocityComponent>().each()) {
        velocity.linear = Vec3(100.0f, 0.0f, 0.0f);
    }

    {
        auto context = makeContext();
        CHECK(eligibleTargets(context, MultiGuidedWeapon::ENGAGEMENT_LOOKAHEAD).size() == 1);
        CHECK(eligibleTargets(context, GuidedWeapon::ENGAGEMENT_LOOKAHEAD).empty());
    }

    sim::Timeline single;
    auto singleContext = makeContext();
    GuidedWeapon guided;
    REQUIRE(guided.fire(lob(), single, singleContext).has_value());
    const auto unguided = eventsOf<sim::SpawnEvent>(single);
    REQUIRE(unguided.size() == 1);
    CHECK(unguided[0].power == doctest::Approx(300.0f));

    sim::Timeline multi;
    auto multiContext = makeContext();
    MultiGuidedWeapon multiGuided;
    REQUIRE(multiGuided.fire(lob(), multi, multiContext).has_value());
    const auto locked = eventsOf<sim::SpawnEvent>(multi);
    REQUIRE(locked.size() == 1);
    CHECK(locked[0].power == doctest::Approx(300.0f * MultiGuidedWeapon::POWER_FACTOR));
    CHECK(locked[0].isFinalProjectile);
}

TEST_CASE_FIXTURE(FireFixture, "MGW01 fires one missile per eligible target") {
    fleet.spawnTarget(Vec3(300.0f, 250.0f, 300.0f), Vec3(300.0f, 250.0f, 300.0f));
    fleet.spawnTarget(Vec3(-300.0f, 250.0f, 300.0f), Vec3(-300.0f, 250.0f, 300.0f));
    fleet.spawnTarget(Vec3(300.0f, 250.0f, -300.0f), Vec3(300.0f, 250.0f, -300.0f));
    fleet.spawnTarget(Vec3(5000.0f, 250.0f, 0.0f), Vec3(5000.0f, 250.0f, 0.0f));

    auto context = makeContext();
    CHECK(eligibleTargets(context, MultiGuidedWeapon::ENGAGEMENT_LOOKAHEAD).size() == 3);

    MultiGuidedWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 3);
    CHECK_FALSE(spawns[0].isFinalProjectile);
    CHECK_FALSE(spawns[1].isFinalProjectile);
    CHECK(spawns[2].isFinalProjectile);
}

TEST_CASE_FIXTURE(FireFixture, "MGW01 ignores targets outside the engagement box") {
    fleet.spawnTarget(Vec3(5000.0f, 250.0f, 0.0f), Vec3(5000.0f, 250.0f, 0.0f));
    auto context = makeContext();
    MultiGuidedWeapon weapon;
    REQUIRE(weapon.fire(lob(), timeline, context).has_value());

    const auto spawns = eventsOf<sim::SpawnEvent>(timeline);
    REQUIRE(spawns.size() == 1);
    CHECK(spawns[0].isFinalProjectile);
}
