/*
 * Armada AI Configuration Tests
 *
 * Tests for the built-in defaults and the TOML overlay loader.
 */

#include <catch2/catch_test_macros.hpp>
#include "armada/ai_config.h"
#include "armada/error.h"
#include <cstring>

#ifndef ARMADA_TEST_DATA_DIR
#define ARMADA_TEST_DATA_DIR "data"
#endif

/* ============================================================================
 * Defaults
 * ============================================================================ */

TEST_CASE("AI config defaults", "[ai][config]") {
    Armada_AIConfig config;
    armada_ai_config_default(&config);

    SECTION("Archetype probabilities") {
        const Armada_BehaviorProbabilities *aggressor = &config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR];
        REQUIRE(aggressor->military_focus == 0.8f);
        REQUIRE(aggressor->adaptive_variation == 0.2f);

        const Armada_BehaviorProbabilities *economist = &config.probabilities[ARMADA_ARCHETYPE_ECONOMIST];
        REQUIRE(economist->economic_focus == 0.75f);

        const Armada_BehaviorProbabilities *trickster = &config.probabilities[ARMADA_ARCHETYPE_TRICKSTER];
        REQUIRE(trickster->deception_chance == 0.7f);

        const Armada_BehaviorProbabilities *hybrid = &config.probabilities[ARMADA_ARCHETYPE_HYBRID];
        REQUIRE(hybrid->adaptive_variation == 0.4f);
    }

    SECTION("Tuning") {
        REQUIRE(config.trickster.watch_turns == 3);
        REQUIRE(config.trickster.deception_cooldown == 3);
        REQUIRE(config.trickster.balanced_income_target == 15000);
        REQUIRE(config.hybrid.min_duration == 2);
        REQUIRE(config.hybrid.max_duration == 4);
    }

    SECTION("Defaults validate") {
        REQUIRE(armada_ai_config_validate(&config));
    }

    SECTION("Default probabilities lookup") {
        Armada_BehaviorProbabilities p = armada_default_probabilities(ARMADA_ARCHETYPE_ECONOMIST);
        REQUIRE(p.military_focus == 0.25f);

        Armada_BehaviorProbabilities none = armada_default_probabilities(ARMADA_ARCHETYPE_COUNT);
        REQUIRE(none.military_focus == 0.0f);
    }
}

/* ============================================================================
 * Validation
 * ============================================================================ */

TEST_CASE("AI config validation", "[ai][config]") {
    Armada_AIConfig config;
    armada_ai_config_default(&config);

    SECTION("Probability above one") {
        config.probabilities[ARMADA_ARCHETYPE_HYBRID].military_focus = 1.5f;
        REQUIRE_FALSE(armada_ai_config_validate(&config));
        REQUIRE(strstr(armada_get_last_error(), "military_focus") != nullptr);
    }

    SECTION("Negative probability") {
        config.trickster.deceptive_scan_chance = -0.1f;
        REQUIRE_FALSE(armada_ai_config_validate(&config));
    }

    SECTION("Zero cooldown") {
        config.trickster.deception_cooldown = 0;
        REQUIRE_FALSE(armada_ai_config_validate(&config));
    }

    SECTION("Inverted durations") {
        config.hybrid.min_duration = 5;
        config.hybrid.max_duration = 3;
        REQUIRE_FALSE(armada_ai_config_validate(&config));
    }

    SECTION("Inverted attack fractions") {
        config.trickster.attack_fraction_min = 0.9f;
        config.trickster.attack_fraction_max = 0.5f;
        REQUIRE_FALSE(armada_ai_config_validate(&config));
    }

    SECTION("NULL is rejected") {
        REQUIRE_FALSE(armada_ai_config_validate(nullptr));
    }
}

/* ============================================================================
 * TOML Loading
 * ============================================================================ */

TEST_CASE("AI config from string", "[ai][config][toml]") {
    Armada_AIConfig config;
    armada_ai_config_default(&config);

    SECTION("Overlay keeps missing keys") {
        const char *doc =
            "[aggressor]\n"
            "military_focus = 0.5\n"
            "\n"
            "[trickster]\n"
            "deception_cooldown = 5\n"
            "deceptive_scan_chance = 1\n"
            "\n"
            "[hybrid]\n"
            "max_duration = 6\n";

        REQUIRE(armada_ai_config_load_string(&config, doc));
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].military_focus == 0.5f);
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].economic_focus == 0.2f);
        REQUIRE(config.trickster.deception_cooldown == 5);
        REQUIRE(config.trickster.deceptive_scan_chance == 1.0f);
        REQUIRE(config.trickster.watch_turns == 3);
        REQUIRE(config.hybrid.min_duration == 2);
        REQUIRE(config.hybrid.max_duration == 6);
    }

    SECTION("Empty document changes nothing") {
        REQUIRE(armada_ai_config_load_string(&config, ""));
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_TRICKSTER].deception_chance == 0.7f);
    }

    SECTION("Parse error leaves config untouched") {
        REQUIRE_FALSE(armada_ai_config_load_string(&config, "[aggressor\nmilitary_focus = "));
        REQUIRE(armada_has_error());
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].military_focus == 0.8f);
    }

    SECTION("Out of range value leaves config untouched") {
        const char *doc =
            "[economist]\n"
            "economic_focus = 0.1\n"
            "military_focus = 2.0\n";
        REQUIRE_FALSE(armada_ai_config_load_string(&config, doc));
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_ECONOMIST].economic_focus == 0.75f);
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_ECONOMIST].military_focus == 0.25f);
    }

    SECTION("Integer too wide for 32 bits is rejected") {
        const char *doc =
            "[hybrid]\n"
            "max_duration = 6\n"
            "min_duration = 4294967297\n";
        REQUIRE_FALSE(armada_ai_config_load_string(&config, doc));
        REQUIRE(strstr(armada_get_last_error(), "min_duration") != nullptr);
        REQUIRE(strstr(armada_get_last_error(), "32 bits") != nullptr);
        REQUIRE(config.hybrid.min_duration == 2);
        REQUIRE(config.hybrid.max_duration == 4);
    }

    SECTION("String where an integer belongs is rejected") {
        const char *doc =
            "[trickster]\n"
            "deception_cooldown = \"three\"\n";
        REQUIRE_FALSE(armada_ai_config_load_string(&config, doc));
        REQUIRE(strstr(armada_get_last_error(), "[trickster] deception_cooldown must be an integer") != nullptr);
        REQUIRE(config.trickster.deception_cooldown == 3);
    }

    SECTION("Float where an integer belongs is rejected") {
        const char *doc =
            "[trickster]\n"
            "watch_turns = 2.5\n";
        REQUIRE_FALSE(armada_ai_config_load_string(&config, doc));
        REQUIRE(config.trickster.watch_turns == 3);
    }

    SECTION("String where a probability belongs is rejected") {
        const char *doc =
            "[aggressor]\n"
            "military_focus = \"high\"\n";
        REQUIRE_FALSE(armada_ai_config_load_string(&config, doc));
        REQUIRE(strstr(armada_get_last_error(), "[aggressor] military_focus must be a number") != nullptr);
        REQUIRE(config.probabilities[ARMADA_ARCHETYPE_AGGRESSOR].military_focus == 0.8f);
    }

    SECTION("NULL arguments") {
        REQUIRE_FALSE(armada_ai_config_load_string(nullptr, "[hybrid]"));
        REQUIRE_FALSE(armada_ai_config_load_string(&config, nullptr));
    }
}

TEST_CASE("AI config from file", "[ai][config][toml]") {
    Armada_AIConfig defaults;
    armada_ai_config_default(&defaults);

    SECTION("Shipped file matches the built-in defaults") {
        Armada_AIConfig config;
        armada_ai_config_default(&config);
        config.probabilities[ARMADA_ARCHETYPE_HYBRID].military_focus = 0.0f;
        config.hybrid.max_duration = 9;

        REQUIRE(armada_ai_config_load_file(&config, ARMADA_TEST_DATA_DIR "/ai.toml"));
        for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
            REQUIRE(memcmp(&config.probabilities[i], &defaults.probabilities[i],
                           sizeof(Armada_BehaviorProbabilities)) == 0);
        }
        REQUIRE(memcmp(&config.trickster, &defaults.trickster, sizeof(Armada_TricksterTuning)) == 0);
        REQUIRE(config.hybrid.min_duration == defaults.hybrid.min_duration);
        REQUIRE(config.hybrid.max_duration == defaults.hybrid.max_duration);
    }

    SECTION("Missing file fails") {
        Armada_AIConfig config = defaults;
        REQUIRE_FALSE(armada_ai_config_load_file(&config, ARMADA_TEST_DATA_DIR "/does_not_exist.toml"));
        REQUIRE(strstr(armada_get_last_error(), "does_not_exist.toml") != nullptr);
    }
}
