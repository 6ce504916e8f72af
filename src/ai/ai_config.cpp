/**
 * Armada AI - Configuration
 *
 * Built-in archetype defaults and the TOML overlay loader. Loading works
 * on a scratch copy so a bad document never leaves a half-applied config.
 */

#include "armada/ai_config.h"
#include "armada/ai.h"
#include "armada/error.h"
#include "armada/log.h"
#include "armada/validate.h"
#include "toml.h"

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

/*============================================================================
 * Defaults
 *============================================================================*/

static const Armada_BehaviorProbabilities DEFAULT_PROBABILITIES[ARMADA_ARCHETYPE_COUNT] = {
    /* military, economic, aggression, deception, adaptive */
    { 0.80f, 0.20f, 0.90f, 0.10f, 0.20f },  /* Aggressor */
    { 0.25f, 0.75f, 0.30f, 0.10f, 0.25f },  /* Economist */
    { 0.40f, 0.30f, 0.60f, 0.70f, 0.30f },  /* Trickster */
    { 0.60f, 0.60f, 0.50f, 0.20f, 0.40f },  /* Hybrid */
};

static const Armada_TricksterTuning DEFAULT_TRICKSTER = {
    .watch_turns = 3,
    .straightforward_chance = 0.3f,
    .deception_cooldown = 3,
    .deceptive_scan_chance = 0.4f,
    .attack_min_fleet = 6,
    .attack_max_threat = 0.6f,
    .attack_value_margin = 1.2f,
    .attack_fraction_min = 0.5f,
    .attack_fraction_max = 0.7f,
    .balanced_economy_chance = 0.5f,
    .balanced_income_target = 15000,
};

static const Armada_HybridTuning DEFAULT_HYBRID = {
    .min_duration = 2,
    .max_duration = 4,
};

void armada_ai_config_default(Armada_AIConfig *config) {
    ARMADA_VALIDATE_PTR(config);
    for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
        config->probabilities[i] = DEFAULT_PROBABILITIES[i];
    }
    config->trickster = DEFAULT_TRICKSTER;
    config->hybrid = DEFAULT_HYBRID;
}

Armada_BehaviorProbabilities armada_default_probabilities(Armada_Archetype archetype) {
    if ((int)archetype < 0 || archetype >= ARMADA_ARCHETYPE_COUNT) {
        Armada_BehaviorProbabilities zero = {};
        return zero;
    }
    return DEFAULT_PROBABILITIES[archetype];
}

/*============================================================================
 * Validation
 *============================================================================*/

static bool check_probability(const char *table, const char *key, float value) {
    if (!(value >= 0.0f && value <= 1.0f)) {
        armada_set_error("[%s] %s must be in [0, 1]: %g", table, key, (double)value);
        return false;
    }
    return true;
}

static bool check_at_least(const char *table, const char *key, int32_t value, int32_t min) {
    if (value < min) {
        armada_set_error("[%s] %s must be >= %d: %d", table, key, (int)min, (int)value);
        return false;
    }
    return true;
}

bool armada_ai_config_validate(const Armada_AIConfig *config) {
    ARMADA_VALIDATE_PTR_RET(config, false);

    for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
        const char *name = armada_archetype_name((Armada_Archetype)i);
        const Armada_BehaviorProbabilities *p = &config->probabilities[i];
        if (!check_probability(name, "military_focus", p->military_focus) ||
            !check_probability(name, "economic_focus", p->economic_focus) ||
            !check_probability(name, "aggression_level", p->aggression_level) ||
            !check_probability(name, "deception_chance", p->deception_chance) ||
            !check_probability(name, "adaptive_variation", p->adaptive_variation)) {
            return false;
        }
    }

    const Armada_TricksterTuning *t = &config->trickster;
    if (!check_at_least("trickster", "watch_turns", t->watch_turns, 0) ||
        !check_probability("trickster", "straightforward_chance", t->straightforward_chance) ||
        !check_at_least("trickster", "deception_cooldown", t->deception_cooldown, 1) ||
        !check_probability("trickster", "deceptive_scan_chance", t->deceptive_scan_chance) ||
        !check_at_least("trickster", "attack_min_fleet", t->attack_min_fleet, 1) ||
        !check_probability("trickster", "attack_max_threat", t->attack_max_threat) ||
        !check_probability("trickster", "attack_fraction_min", t->attack_fraction_min) ||
        !check_probability("trickster", "attack_fraction_max", t->attack_fraction_max) ||
        !check_probability("trickster", "balanced_economy_chance", t->balanced_economy_chance) ||
        !check_at_least("trickster", "balanced_income_target", t->balanced_income_target, 1)) {
        return false;
    }
    if (!(t->attack_value_margin >= 0.0f)) {
        armada_set_error("[trickster] attack_value_margin must be >= 0: %g",
                         (double)t->attack_value_margin);
        return false;
    }
    if (t->attack_fraction_min > t->attack_fraction_max) {
        armada_set_error("[trickster] attack_fraction_min %g exceeds attack_fraction_max %g",
                         (double)t->attack_fraction_min, (double)t->attack_fraction_max);
        return false;
    }

    const Armada_HybridTuning *h = &config->hybrid;
    if (!check_at_least("hybrid", "min_duration", h->min_duration, 1) ||
        !check_at_least("hybrid", "max_duration", h->max_duration, 1)) {
        return false;
    }
    if (h->min_duration > h->max_duration) {
        armada_set_error("[hybrid] min_duration %d exceeds max_duration %d",
                         (int)h->min_duration, (int)h->max_duration);
        return false;
    }
    return true;
}

/*============================================================================
 * TOML Overlay
 *============================================================================*/

static bool key_present(toml_table_t *table, const char *key) {
    return toml_raw_in(table, key) || toml_array_in(table, key) || toml_table_in(table, key);
}

/* Accepts both 0.5 and integer literals such as 1. Absent keys keep *out. */
static bool read_float(toml_table_t *table, const char *section, const char *key, float *out) {
    toml_datum_t d = toml_double_in(table, key);
    if (d.ok) {
        *out = (float)d.u.d;
        return true;
    }
    d = toml_int_in(table, key);
    if (d.ok) {
        *out = (float)d.u.i;
        return true;
    }
    if (key_present(table, key)) {
        armada_set_error("ai_config: [%s] %s must be a number", section, key);
        return false;
    }
    return true;
}

static bool read_int(toml_table_t *table, const char *section, const char *key, int32_t *out) {
    toml_datum_t d = toml_int_in(table, key);
    if (!d.ok) {
        if (key_present(table, key)) {
            armada_set_error("ai_config: [%s] %s must be an integer", section, key);
            return false;
        }
        return true;
    }
    if (d.u.i < INT32_MIN || d.u.i > INT32_MAX) {
        armada_set_error("ai_config: [%s] %s = %lld does not fit in 32 bits",
                         section, key, (long long)d.u.i);
        return false;
    }
    *out = (int32_t)d.u.i;
    return true;
}

static bool apply_probabilities(toml_table_t *table, const char *section,
                                Armada_BehaviorProbabilities *p) {
    return read_float(table, section, "military_focus", &p->military_focus) &&
           read_float(table, section, "economic_focus", &p->economic_focus) &&
           read_float(table, section, "aggression_level", &p->aggression_level) &&
           read_float(table, section, "deception_chance", &p->deception_chance) &&
           read_float(table, section, "adaptive_variation", &p->adaptive_variation);
}

static bool apply_trickster(toml_table_t *table, const char *section, Armada_TricksterTuning *t) {
    return read_int(table, section, "watch_turns", &t->watch_turns) &&
           read_float(table, section, "straightforward_chance", &t->straightforward_chance) &&
           read_int(table, section, "deception_cooldown", &t->deception_cooldown) &&
           read_float(table, section, "deceptive_scan_chance", &t->deceptive_scan_chance) &&
           read_int(table, section, "attack_min_fleet", &t->attack_min_fleet) &&
           read_float(table, section, "attack_max_threat", &t->attack_max_threat) &&
           read_float(table, section, "attack_value_margin", &t->attack_value_margin) &&
           read_float(table, section, "attack_fraction_min", &t->attack_fraction_min) &&
           read_float(table, section, "attack_fraction_max", &t->attack_fraction_max) &&
           read_float(table, section, "balanced_economy_chance", &t->balanced_economy_chance) &&
           read_int(table, section, "balanced_income_target", &t->balanced_income_target);
}

static bool apply_hybrid(toml_table_t *table, const char *section, Armada_HybridTuning *h) {
    return read_int(table, section, "min_duration", &h->min_duration) &&
           read_int(table, section, "max_duration", &h->max_duration);
}

/**
 * Overlay `root` onto a copy of `config` and commit only if the result
 * validates. Takes ownership of `root`.
 */
static bool apply_document(Armada_AIConfig *config, toml_table_t *root, const char *source) {
    Armada_AIConfig scratch = *config;

    for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
        const char *name = armada_archetype_name((Armada_Archetype)i);
        toml_table_t *table = toml_table_in(root, name);
        if (!table) continue;

        bool ok = apply_probabilities(table, name, &scratch.probabilities[i]);
        if (ok && i == ARMADA_ARCHETYPE_TRICKSTER) {
            ok = apply_trickster(table, name, &scratch.trickster);
        } else if (ok && i == ARMADA_ARCHETYPE_HYBRID) {
            ok = apply_hybrid(table, name, &scratch.hybrid);
        }
        if (!ok) {
            toml_free(root);
            armada_log_warning(ARMADA_LOG_CONFIG, "Rejected AI config from %s: %s",
                               source, armada_get_last_error());
            return false;
        }
    }
    toml_free(root);

    if (!armada_ai_config_validate(&scratch)) {
        armada_log_warning(ARMADA_LOG_CONFIG, "Rejected AI config from %s: %s",
                           source, armada_get_last_error());
        return false;
    }

    *config = scratch;
    armada_log_info(ARMADA_LOG_CONFIG, "Loaded AI config from %s", source);
    return true;
}

bool armada_ai_config_load_file(Armada_AIConfig *config, const char *path) {
    ARMADA_VALIDATE_PTR_RET(config, false);
    ARMADA_VALIDATE_STRING_RET(path, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        armada_set_error("ai_config: failed to open %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        armada_set_error("ai_config: failed to parse %s: %s", path, errbuf);
        return false;
    }
    return apply_document(config, root, path);
}

bool armada_ai_config_load_string(Armada_AIConfig *config, const char *toml) {
    ARMADA_VALIDATE_PTR_RET(config, false);
    ARMADA_VALIDATE_PTR_RET(toml, false);

    /* toml_parse needs a mutable string */
    char *copy = strdup(toml);
    if (!copy) {
        armada_set_error("Out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        armada_set_error("ai_config: TOML parse error: %s", errbuf);
        return false;
    }
    return apply_document(config, root, "string");
}
