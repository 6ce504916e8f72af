/*
 * Armada AI Engine Tests
 */

#include <catch2/catch_test_macros.hpp>
#include "armada/ai.h"
#include "armada/error.h"
#include "armada/rng.h"
#include <cstring>

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("AI engine lifecycle", "[ai][engine]") {
    Armada_Rng rng;
    armada_rng_seed(&rng, 10);

    SECTION("Create by archetype") {
        Armada_AIEngine *engine = armada_ai_engine_create(ARMADA_ARCHETYPE_ECONOMIST, nullptr, &rng);
        REQUIRE(engine != nullptr);
        REQUIRE(armada_ai_engine_archetype(engine) == ARMADA_ARCHETYPE_ECONOMIST);

        const Armada_AIState *state = armada_ai_engine_state(engine);
        REQUIRE(state != nullptr);
        REQUIRE_FALSE(state->has_last_decision);
        REQUIRE(state->probabilities.economic_focus == 0.75f);
        armada_ai_engine_destroy(engine);
    }

    SECTION("Create by name") {
        Armada_AIEngine *engine = armada_ai_engine_create_by_name("trickster", nullptr, &rng);
        REQUIRE(engine != nullptr);
        REQUIRE(armada_ai_engine_archetype(engine) == ARMADA_ARCHETYPE_TRICKSTER);
        armada_ai_engine_destroy(engine);
    }

    SECTION("Custom config is copied") {
        Armada_AIConfig config;
        armada_ai_config_default(&config);
        config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].military_focus = 0.33f;

        Armada_AIEngine *engine = armada_ai_engine_create(ARMADA_ARCHETYPE_AGGRESSOR, &config, &rng);
        REQUIRE(engine != nullptr);
        config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].military_focus = 0.9f;
        REQUIRE(armada_ai_engine_state(engine)->probabilities.military_focus == 0.33f);
        armada_ai_engine_destroy(engine);
    }

    SECTION("Unknown name fails") {
        REQUIRE(armada_ai_engine_create_by_name("pacifist", nullptr, &rng) == nullptr);
        REQUIRE(strstr(armada_get_last_error(), "pacifist") != nullptr);
    }

    SECTION("Invalid input fails") {
        REQUIRE(armada_ai_engine_create(ARMADA_ARCHETYPE_HYBRID, nullptr, nullptr) == nullptr);
        REQUIRE(armada_ai_engine_create(ARMADA_ARCHETYPE_COUNT, nullptr, &rng) == nullptr);

        Armada_AIConfig config;
        armada_ai_config_default(&config);
        config.probabilities[ARMADA_ARCHETYPE_HYBRID].deception_chance = 3.0f;
        REQUIRE(armada_ai_engine_create(ARMADA_ARCHETYPE_HYBRID, &config, &rng) == nullptr);
    }

    SECTION("NULL engine is safe") {
        armada_ai_engine_destroy(nullptr);
        armada_ai_engine_set_error_log(nullptr, nullptr);
        REQUIRE(armada_ai_engine_state(nullptr) == nullptr);
        REQUIRE(armada_ai_engine_archetype(nullptr) == ARMADA_ARCHETYPE_COUNT);
    }
}

/* ============================================================================
 * Turn Processing
 * ============================================================================ */

TEST_CASE("AI engine processes turns", "[ai][engine]") {
    Armada_Rng rng;
    armada_rng_seed(&rng, 2718);

    Armada_ErrorLog *log = armada_error_log_create(16);
    REQUIRE(log != nullptr);

    Armada_GameState game;
    armada_game_state_init(&game);
    game.ai.resources.metal = 20000;
    game.ai.resources.energy = 20000;
    game.ai.fleet.home.frigates = 8;
    game.ai.fleet.home.cruisers = 3;
    game.player.fleet.home.frigates = 6;
    game.player.fleet.home.battleships = 1;

    for (int arch = 0; arch < ARMADA_ARCHETYPE_COUNT; arch++) {
        Armada_AIEngine *engine = armada_ai_engine_create((Armada_Archetype)arch, nullptr, &rng);
        REQUIRE(engine != nullptr);
        armada_ai_engine_set_error_log(engine, log);

        for (int turn = 1; turn <= 25; turn++) {
            game.turn = turn;
            Armada_Decision d;
            REQUIRE(armada_ai_engine_process_turn(engine, &game, &d));

            const Armada_AIState *state = armada_ai_engine_state(engine);
            REQUIRE(state->has_last_decision);
            REQUIRE(armada_decision_equals(&state->last_decision, &d));
            REQUIRE(armada_ai_validate_decision(&d, &game.ai));
        }

        armada_ai_engine_destroy(engine);
    }

    REQUIRE(armada_error_log_count(log) == 0);
    armada_error_log_destroy(log);
}

TEST_CASE("AI engine refreshes its view", "[ai][engine]") {
    Armada_Rng rng;
    armada_rng_seed(&rng, 5);

    Armada_AIEngine *engine = armada_ai_engine_create(ARMADA_ARCHETYPE_AGGRESSOR, nullptr, &rng);
    REQUIRE(engine != nullptr);

    Armada_GameState game;
    armada_game_state_init(&game);
    game.ai.fleet.home.frigates = 10;
    game.player.fleet.home.frigates = 10;
    game.player.resources.metal_income = 30000;
    game.player.resources.energy_income = 30000;

    Armada_Decision d;
    REQUIRE(armada_ai_engine_process_turn(engine, &game, &d));

    const Armada_AIState *state = armada_ai_engine_state(engine);
    REQUIRE(state->self.fleet.home.frigates == 10);
    REQUIRE(state->threat_level == 0.5f);
    /* (20000 - 60000) / 80000 */
    REQUIRE(state->economic_advantage == -0.5f);

    SECTION("NULL arguments fail") {
        REQUIRE_FALSE(armada_ai_engine_process_turn(nullptr, &game, &d));
        REQUIRE_FALSE(armada_ai_engine_process_turn(engine, nullptr, &d));
        REQUIRE_FALSE(armada_ai_engine_process_turn(engine, &game, nullptr));
    }

    armada_ai_engine_destroy(engine);
}
