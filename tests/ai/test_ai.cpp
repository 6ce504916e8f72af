/*
 * Armada AI Heuristics Tests
 *
 * Tests for decision constructors, assessment helpers, affordability and
 * decision validation.
 */

#include <catch2/catch_test_macros.hpp>
#include "armada/ai.h"
#include "armada/error.h"
#include <cstring>

static Armada_FleetComposition make_comp(int32_t f, int32_t c, int32_t b) {
    Armada_FleetComposition comp = { f, c, b };
    return comp;
}

static Armada_Resources make_resources(int32_t metal, int32_t energy) {
    Armada_Resources res = {};
    res.metal = metal;
    res.energy = energy;
    res.metal_income = ARMADA_BASE_METAL_INCOME;
    res.energy_income = ARMADA_BASE_ENERGY_INCOME;
    return res;
}

/* ============================================================================
 * Decisions
 * ============================================================================ */

TEST_CASE("Decision constructors", "[ai][decision]") {
    SECTION("Wait") {
        Armada_Decision d = armada_decision_wait("Nothing to do");
        REQUIRE(d.type == ARMADA_DECISION_WAIT);
        REQUIRE(strcmp(d.reasoning, "Nothing to do") == 0);
        REQUIRE_FALSE(d.deceptive);
    }

    SECTION("Build") {
        Armada_Decision d = armada_decision_build(ARMADA_BUILD_CRUISER, 3, nullptr);
        REQUIRE(d.type == ARMADA_DECISION_BUILD);
        REQUIRE(d.build.item == ARMADA_BUILD_CRUISER);
        REQUIRE(d.build.quantity == 3);
        REQUIRE(d.reasoning == nullptr);
    }

    SECTION("Attack") {
        Armada_FleetComposition fleet = make_comp(4, 2, 0);
        Armada_Decision d = armada_decision_attack(ARMADA_AI_ENEMY_TARGET, &fleet, "Go");
        REQUIRE(d.type == ARMADA_DECISION_ATTACK);
        REQUIRE(strcmp(d.attack.target, "player_home") == 0);
        REQUIRE(d.attack.fleet.frigates == 4);
        REQUIRE(d.attack.fleet.cruisers == 2);
    }

    SECTION("Scan") {
        Armada_Decision d = armada_decision_scan(ARMADA_SCAN_DEEP, nullptr);
        REQUIRE(d.type == ARMADA_DECISION_SCAN);
        REQUIRE(d.scan.scan_type == ARMADA_SCAN_DEEP);
    }

    SECTION("Equality ignores reasoning") {
        Armada_Decision a = armada_decision_build(ARMADA_BUILD_MINE, 1, "a");
        Armada_Decision b = armada_decision_build(ARMADA_BUILD_MINE, 1, "b");
        Armada_Decision c = armada_decision_build(ARMADA_BUILD_MINE, 2, "a");
        REQUIRE(armada_decision_equals(&a, &b));
        REQUIRE_FALSE(armada_decision_equals(&a, &c));
    }

    SECTION("Type names") {
        REQUIRE(strcmp(armada_decision_type_name(ARMADA_DECISION_ATTACK), "attack") == 0);
    }
}

/* ============================================================================
 * Assessment
 * ============================================================================ */

TEST_CASE("Fleet value and threat", "[ai][assessment]") {
    Armada_FleetComposition own = make_comp(10, 0, 0);

    SECTION("Fleet value weights") {
        Armada_FleetComposition fleet = make_comp(2, 2, 2);
        REQUIRE(armada_ai_fleet_value(&fleet) == 2.0f + 5.0f + 10.0f);
    }

    SECTION("No own fleet is maximum threat") {
        Armada_FleetComposition none = {};
        Armada_FleetComposition enemy = make_comp(1, 0, 0);
        REQUIRE(armada_ai_threat_level(&none, &enemy) == 1.0f);
        REQUIRE(armada_ai_threat_level(&none, &none) == 1.0f);
    }

    SECTION("Threat is clamped") {
        Armada_FleetComposition weak = make_comp(2, 0, 0);
        Armada_FleetComposition huge = make_comp(0, 0, 100);
        REQUIRE(armada_ai_threat_level(&own, &weak) == 0.0f);
        REQUIRE(armada_ai_threat_level(&own, &huge) == 1.0f);
    }

    SECTION("Threat between the clamps") {
        Armada_FleetComposition enemy = make_comp(10, 0, 0);
        REQUIRE(armada_ai_threat_level(&own, &enemy) == 0.5f);
    }
}

TEST_CASE("Economic advantage", "[ai][assessment]") {
    Armada_Resources a = make_resources(0, 0);
    Armada_Resources b = make_resources(0, 0);

    SECTION("Equal incomes") {
        REQUIRE(armada_ai_economic_advantage(&a, &b) == 0.0f);
    }

    SECTION("Richer side is positive") {
        a.metal_income = 30000;
        a.energy_income = 30000;
        /* (60000 - 20000) / 80000 */
        REQUIRE(armada_ai_economic_advantage(&a, &b) == 0.5f);
        REQUIRE(armada_ai_economic_advantage(&b, &a) == -0.5f);
    }

    SECTION("Both zero") {
        Armada_Resources zero = {};
        REQUIRE(armada_ai_economic_advantage(&zero, &zero) == 0.0f);
    }
}

TEST_CASE("Affordability", "[ai][economy]") {
    Armada_Resources res = make_resources(1000, 1000);

    SECTION("Ships") {
        REQUIRE(armada_ai_can_afford(&res, ARMADA_BUILD_FRIGATE, 250));
        REQUIRE_FALSE(armada_ai_can_afford(&res, ARMADA_BUILD_FRIGATE, 251));
        REQUIRE(armada_ai_affordable_quantity(&res, ARMADA_BUILD_FRIGATE) == 250);
        REQUIRE(armada_ai_affordable_quantity(&res, ARMADA_BUILD_BATTLESHIP) == 50);
    }

    SECTION("Structures") {
        REQUIRE(armada_ai_can_afford(&res, ARMADA_BUILD_REACTOR, 0) == false);
        REQUIRE_FALSE(armada_ai_can_afford(&res, ARMADA_BUILD_REACTOR, 1));
        res.energy = 1200;
        REQUIRE(armada_ai_can_afford(&res, ARMADA_BUILD_REACTOR, 1));
        REQUIRE_FALSE(armada_ai_can_afford(&res, ARMADA_BUILD_MINE, 1));
    }

    SECTION("Scans") {
        REQUIRE(armada_ai_can_afford_scan(&res, ARMADA_SCAN_BASIC));
        REQUIRE_FALSE(armada_ai_can_afford_scan(&res, ARMADA_SCAN_DEEP));
    }

    SECTION("Broke") {
        Armada_Resources broke = make_resources(0, 0);
        REQUIRE(armada_ai_affordable_quantity(&broke, ARMADA_BUILD_FRIGATE) == 0);
    }
}

TEST_CASE("Unit matchups", "[ai][units]") {
    SECTION("Dominant unit") {
        Armada_FleetComposition f = make_comp(5, 3, 1);
        Armada_FleetComposition c = make_comp(1, 5, 3);
        Armada_FleetComposition b = make_comp(1, 3, 5);
        Armada_FleetComposition tie = make_comp(0, 4, 4);
        REQUIRE(armada_ai_dominant_unit(&f) == ARMADA_UNIT_FRIGATE);
        REQUIRE(armada_ai_dominant_unit(&c) == ARMADA_UNIT_CRUISER);
        REQUIRE(armada_ai_dominant_unit(&b) == ARMADA_UNIT_BATTLESHIP);
        REQUIRE(armada_ai_dominant_unit(&tie) == ARMADA_UNIT_CRUISER);
    }

    SECTION("Counter unit") {
        REQUIRE(armada_ai_counter_unit(ARMADA_UNIT_FRIGATE) == ARMADA_UNIT_BATTLESHIP);
        REQUIRE(armada_ai_counter_unit(ARMADA_UNIT_CRUISER) == ARMADA_UNIT_FRIGATE);
        REQUIRE(armada_ai_counter_unit(ARMADA_UNIT_BATTLESHIP) == ARMADA_UNIT_CRUISER);
    }
}

/* ============================================================================
 * Decision Validation
 * ============================================================================ */

TEST_CASE("Decision validation", "[ai][validate]") {
    Armada_PlayerState self;
    armada_player_state_init(&self);
    self.resources.metal = 100;
    self.resources.energy = 1500;
    self.fleet.home = make_comp(5, 2, 0);

    SECTION("Wait is always valid") {
        Armada_Decision d = armada_decision_wait(nullptr);
        REQUIRE(armada_ai_validate_decision(&d, &self));
    }

    SECTION("Affordable build") {
        Armada_Decision d = armada_decision_build(ARMADA_BUILD_FRIGATE, 25, nullptr);
        REQUIRE(armada_ai_validate_decision(&d, &self));
    }

    SECTION("Unaffordable build") {
        Armada_Decision d = armada_decision_build(ARMADA_BUILD_MINE, 1, nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
        REQUIRE(strstr(armada_get_last_error(), "Cannot afford") != nullptr);
    }

    SECTION("Non-positive quantity") {
        Armada_Decision d = armada_decision_build(ARMADA_BUILD_FRIGATE, 0, nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
        REQUIRE(strstr(armada_get_last_error(), "must be positive: 0") != nullptr);

        d.build.quantity = -4;
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
        REQUIRE(strstr(armada_get_last_error(), "armada_ai_validate_decision") != nullptr);
    }

    SECTION("Attack within home fleet") {
        Armada_FleetComposition strike = make_comp(3, 2, 0);
        Armada_Decision d = armada_decision_attack(ARMADA_AI_ENEMY_TARGET, &strike, nullptr);
        REQUIRE(armada_ai_validate_decision(&d, &self));
    }

    SECTION("Attack beyond home fleet") {
        Armada_FleetComposition strike = make_comp(6, 0, 0);
        Armada_Decision d = armada_decision_attack(ARMADA_AI_ENEMY_TARGET, &strike, nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
    }

    SECTION("Empty attack") {
        Armada_FleetComposition none = {};
        Armada_Decision d = armada_decision_attack(ARMADA_AI_ENEMY_TARGET, &none, nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
    }

    SECTION("Attack without target") {
        Armada_FleetComposition strike = make_comp(1, 0, 0);
        Armada_Decision d = armada_decision_attack("", &strike, nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(&d, &self));
        REQUIRE(strstr(armada_get_last_error(), "no target") != nullptr);
    }

    SECTION("Scans need energy") {
        Armada_Decision basic = armada_decision_scan(ARMADA_SCAN_BASIC, nullptr);
        Armada_Decision deep = armada_decision_scan(ARMADA_SCAN_DEEP, nullptr);
        REQUIRE(armada_ai_validate_decision(&basic, &self));
        REQUIRE_FALSE(armada_ai_validate_decision(&deep, &self));
    }

    SECTION("NULL arguments") {
        Armada_Decision d = armada_decision_wait(nullptr);
        REQUIRE_FALSE(armada_ai_validate_decision(nullptr, &self));
        REQUIRE_FALSE(armada_ai_validate_decision(&d, nullptr));
    }
}

/* ============================================================================
 * Names
 * ============================================================================ */

TEST_CASE("Archetype names", "[ai][names]") {
    Armada_Archetype a;

    SECTION("Known names round-trip") {
        for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
            const char *name = armada_archetype_name((Armada_Archetype)i);
            REQUIRE(armada_archetype_from_name(name, &a));
            REQUIRE(a == (Armada_Archetype)i);
        }
    }

    SECTION("Unknown name fails") {
        REQUIRE_FALSE(armada_archetype_from_name("berserker", &a));
        REQUIRE(strstr(armada_get_last_error(), "berserker") != nullptr);
        REQUIRE_FALSE(armada_archetype_from_name("", &a));
        REQUIRE_FALSE(armada_archetype_from_name(nullptr, &a));
    }

    SECTION("Strategy names") {
        REQUIRE(strcmp(armada_hybrid_strategy_name(ARMADA_HYBRID_OPPORTUNISTIC), "opportunistic") == 0);
    }
}
