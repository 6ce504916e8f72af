#ifndef ARMADA_AI_CONFIG_H
#define ARMADA_AI_CONFIG_H

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada AI Configuration
 *
 * Behavior probabilities for every archetype plus the tunable thresholds
 * of the Trickster and Hybrid archetypes. Defaults are compiled in and can
 * be overlaid from a TOML document:
 *
 *   [aggressor]
 *   military_focus = 0.8
 *   adaptive_variation = 0.2
 *
 *   [trickster]
 *   deception_chance = 0.7
 *   deception_cooldown = 3
 *
 *   [hybrid]
 *   min_duration = 2
 *   max_duration = 4
 *
 * Missing tables and keys keep their current values.
 *
 * Usage:
 *   Armada_AIConfig config;
 *   armada_ai_config_default(&config);
 *   if (!armada_ai_config_load_file(&config, "data/ai.toml")) {
 *       armada_log_warning(ARMADA_LOG_CONFIG, "%s", armada_get_last_error());
 *   }
 */

typedef enum Armada_Archetype {
    ARMADA_ARCHETYPE_AGGRESSOR = 0,
    ARMADA_ARCHETYPE_ECONOMIST,
    ARMADA_ARCHETYPE_TRICKSTER,
    ARMADA_ARCHETYPE_HYBRID,
    ARMADA_ARCHETYPE_COUNT
} Armada_Archetype;

/**
 * Fixed per-archetype probabilities, each in [0, 1]
 */
typedef struct Armada_BehaviorProbabilities {
    float military_focus;
    float economic_focus;
    float aggression_level;
    float deception_chance;
    float adaptive_variation;
} Armada_BehaviorProbabilities;

/**
 * Trickster thresholds
 */
typedef struct Armada_TricksterTuning {
    int32_t watch_turns;              /* Turns without an enemy scan before playing straight */
    float straightforward_chance;
    int32_t deception_cooldown;       /* Turns between deceptive moves */
    float deceptive_scan_chance;      /* Scan instead of a misleading build */
    int32_t attack_min_fleet;
    float attack_max_threat;
    float attack_value_margin;        /* Own value must be this multiple of the enemy's */
    float attack_fraction_min;
    float attack_fraction_max;
    float balanced_economy_chance;
    int32_t balanced_income_target;   /* Per resource */
} Armada_TricksterTuning;

/**
 * Hybrid strategy duration bounds (turns, inclusive)
 */
typedef struct Armada_HybridTuning {
    int32_t min_duration;
    int32_t max_duration;
} Armada_HybridTuning;

typedef struct Armada_AIConfig {
    Armada_BehaviorProbabilities probabilities[ARMADA_ARCHETYPE_COUNT];
    Armada_TricksterTuning trickster;
    Armada_HybridTuning hybrid;
} Armada_AIConfig;

/**
 * Fill `config` with the built-in defaults.
 */
void armada_ai_config_default(Armada_AIConfig *config);

/**
 * Overlay values from a TOML file.
 * On failure `config` is left untouched and the error is set.
 */
bool armada_ai_config_load_file(Armada_AIConfig *config, const char *path);

/**
 * Overlay values from a TOML string.
 * On failure `config` is left untouched and the error is set.
 */
bool armada_ai_config_load_string(Armada_AIConfig *config, const char *toml);

/**
 * Range-check every value. Sets error naming the first bad value.
 */
bool armada_ai_config_validate(const Armada_AIConfig *config);

/**
 * Default probabilities of one archetype (zeroed for an invalid archetype)
 */
Armada_BehaviorProbabilities armada_default_probabilities(Armada_Archetype archetype);

#endif /* ARMADA_AI_CONFIG_H */
