#include <doctest/doctest.h>

#include "world/damage.hpp"
#include "ecs/components/combatant.hpp"

using namespace salvo;
using namespace salvo::world;

TEST_CASE("falloffDamage halves linearly toward the blast edge") {
    CHECK(falloffDamage(50.0f, 0.0f, 50.0f) == doctest::Approx(50.0f));
    CHECK(falloffDamage(50.0f, 25.0f, 50.0f) == doctest::Approx(38.0f));
    CHECK(falloffDamage(50.0f, 50.0f, 50.0f) == doctest::Approx(25.0f));
    CHECK(falloffDamage(50.0f, 50.5f, 50.0f) == doctest::Approx(0.0f));
}

TEST_CASE("falloffDamage is zero without an area of effect") {
    CHECK(falloffDamage(50.0f, 0.0f, 0.0f) == doctest::Approx(0.0f));
    CHECK(falloffDamage(50.0f, 0.0f, -5.0f) == doctest::Approx(0.0f));
}

TEST_CASE("shields absorb damage first") {
    ecs::HealthComponent pool{100.0f, 100.0f, 0.0f, 10.0f};
    const auto result = distributeDamage(pool, 30.0f);

    CHECK(result.shieldDamage == doctest::Approx(10.0f));
    CHECK(result.healthDamage == doctest::Approx(20.0f));
    CHECK(result.remainingHealth == doctest::Approx(80.0f));
    CHECK(pool.shield == doctest::Approx(0.0f));
    CHECK_FALSE(result.destroyed);
}

TEST_CASE("armor covering half the hit splits it evenly") {
    ecs::HealthComponent pool{100.0f, 100.0f, 20.0f, 0.0f};
    const auto result = distributeDamage(pool, 30.0f);

    CHECK(result.armorDamage == doctest::Approx(15.0f));
    CHECK(result.healthDamage == doctest::Approx(15.0f));
    CHECK(pool.armor == doctest::Approx(5.0f));
    CHECK(pool.health == doctest::Approx(85.0f));
}

TEST_CASE("thin armor is used up and health takes the rest") {
    ecs::HealthComponent pool{100.0f, 100.0f, 5.0f, 0.0f};
    const auto result = distributeDamage(pool, 30.0f);

    CHECK(result.armorDamage == doctest::Approx(5.0f));
    CHECK(result.healthDamage == doctest::Approx(25.0f));
    CHECK(pool.armor == doctest::Approx(0.0f));
    CHECK(pool.health == doctest::Approx(75.0f));
}

TEST_CASE("lethal damage marks the pool destroyed") {
    ecs::HealthComponent pool{10.0f, 100.0f, 0.0f, 0.0f};
    const auto result = distributeDamage(pool, 25.0f);

    CHECK(result.destroyed);
    CHECK(result.remainingHealth <= 0.0f);
}
