/**
 * Armada AI - Hybrid Archetype
 *
 * Runs a four-state strategy machine (aggressive, economic, defensive,
 * opportunistic). Each turn, in order:
 *
 *   1. With probability adaptive_variation, react to the opponent's posture
 *      and possibly override the current strategy.
 *   2. Count the strategy timer down. At zero, re-select a strategy from
 *      threat and economic advantage and restart the timer with a random
 *      duration.
 *   3. Decide with the sub-strategy of the current label.
 */

#include "armada/ai.h"
#include "armada/log.h"
#include "ai_internal.h"

#define HYBRID_REACT_FLEET           5
#define HYBRID_REACT_THREAT          0.5f
#define HYBRID_REACT_INCOME          20000
#define HYBRID_HIGH_THREAT           0.7f
#define HYBRID_ADVANTAGE_SWING       0.3f

#define HYBRID_ATTACK_MIN_FLEET      4
#define HYBRID_ATTACK_MIN_STRIKE     2
#define HYBRID_ATTACK_FRAC_MIN       0.7f
#define HYBRID_ATTACK_FRAC_MAX       0.9f
#define HYBRID_INCOME_TARGET         20000
#define HYBRID_MIN_DEFENSE           3
#define HYBRID_DEFENSE_FLOOR         8
#define HYBRID_SCAN_CHANCE           0.4f
#define HYBRID_OPPORTUNITY_ENEMY_MAX 2
#define HYBRID_OPPORTUNITY_OWN_MIN   3
#define HYBRID_OPPORTUNITY_FRACTION  0.8f

void ai_hybrid_init(Armada_HybridState *hybrid, const Armada_HybridTuning *tuning, Armada_Rng *rng) {
    hybrid->tuning = *tuning;
    hybrid->strategy = (Armada_HybridStrategy)armada_rng_int(rng, 0, ARMADA_HYBRID_STRATEGY_COUNT - 1);
    hybrid->turns_remaining = armada_rng_int(rng, tuning->min_duration, tuning->max_duration);
    hybrid->selections = 0;
}

/*============================================================================
 * Strategy Selection
 *============================================================================*/

static Armada_HybridStrategy pick(Armada_Rng *rng, float p_first,
                                  Armada_HybridStrategy first, Armada_HybridStrategy second) {
    return armada_rng_chance(rng, p_first) ? first : second;
}

static Armada_HybridStrategy select_strategy(const Armada_AIState *state, Armada_Rng *rng) {
    if (state->threat_level > HYBRID_HIGH_THREAT) {
        return pick(rng, 0.7f, ARMADA_HYBRID_DEFENSIVE, ARMADA_HYBRID_AGGRESSIVE);
    }
    if (state->economic_advantage < -HYBRID_ADVANTAGE_SWING) {
        return pick(rng, 0.6f, ARMADA_HYBRID_ECONOMIC, ARMADA_HYBRID_OPPORTUNISTIC);
    }
    if (state->economic_advantage > HYBRID_ADVANTAGE_SWING) {
        return pick(rng, 0.6f, ARMADA_HYBRID_AGGRESSIVE, ARMADA_HYBRID_OPPORTUNISTIC);
    }
    return (Armada_HybridStrategy)armada_rng_int(rng, 0, ARMADA_HYBRID_STRATEGY_COUNT - 1);
}

/* Mirror the opponent's posture */
static void react(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    Armada_HybridState *h = &state->internal.hybrid;
    const Armada_PlayerState *enemy = &game->player;

    if (armada_composition_total(&enemy->fleet.home) > HYBRID_REACT_FLEET &&
        state->threat_level > HYBRID_REACT_THREAT) {
        h->strategy = pick(rng, 0.6f, ARMADA_HYBRID_DEFENSIVE, ARMADA_HYBRID_AGGRESSIVE);
    }
    if (armada_resources_income(&enemy->resources) > HYBRID_REACT_INCOME &&
        state->economic_advantage < 0.0f) {
        h->strategy = pick(rng, 0.5f, ARMADA_HYBRID_ECONOMIC, ARMADA_HYBRID_AGGRESSIVE);
    }
}

/*============================================================================
 * Sub-strategies
 *============================================================================*/

static Armada_Decision aggressive(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (ai_home_total(state) >= HYBRID_ATTACK_MIN_FLEET) {
        float fraction = armada_rng_range(rng, HYBRID_ATTACK_FRAC_MIN, HYBRID_ATTACK_FRAC_MAX);
        Armada_Decision strike;
        if (ai_plan_attack(state, fraction, "Aggressive phase, committing the fleet", &strike) &&
            armada_composition_total(&strike.attack.fleet) >= HYBRID_ATTACK_MIN_STRIKE) {
            return strike;
        }
    }

    if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 2)) {
        return ai_build_up_to(state, ARMADA_BUILD_FRIGATE, armada_rng_int(rng, 1, 3),
                              "Aggressive phase, fast hulls");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
        return armada_decision_build(ARMADA_BUILD_CRUISER, 1, "Aggressive phase, cruiser");
    }
    return armada_decision_wait("Aggressive phase, nothing affordable");
}

static Armada_Decision economic(const Armada_AIState *state) {
    const Armada_Resources *res = &state->self.resources;

    if (armada_resources_income(res) < HYBRID_INCOME_TARGET) {
        if (res->metal_income <= res->energy_income) {
            if (armada_ai_can_afford(res, ARMADA_BUILD_MINE, 1)) {
                return armada_decision_build(ARMADA_BUILD_MINE, 1, "Economic phase, mine");
            }
        } else if (armada_ai_can_afford(res, ARMADA_BUILD_REACTOR, 1)) {
            return armada_decision_build(ARMADA_BUILD_REACTOR, 1, "Economic phase, reactor");
        }
    }

    if (ai_home_total(state) < HYBRID_MIN_DEFENSE &&
        armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
        return armada_decision_build(ARMADA_BUILD_CRUISER, 1, "Economic phase, minimal defense");
    }
    return armada_decision_wait("Economic phase, saving");
}

static Armada_Decision defensive(const Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (ai_home_total(state) < HYBRID_DEFENSE_FLOOR) {
        Armada_UnitType counter = armada_ai_counter_unit(armada_ai_dominant_unit(&game->player.fleet.home));
        Armada_Buildable item = armada_buildable_from_unit(counter);
        if (armada_ai_can_afford(res, item, 1)) {
            return armada_decision_build(item, 1, "Defensive phase, countering the enemy line");
        }
    }

    if (armada_ai_can_afford_scan(res, ARMADA_SCAN_DEEP) &&
        armada_rng_chance(rng, HYBRID_SCAN_CHANCE)) {
        return armada_decision_scan(ARMADA_SCAN_DEEP, "Defensive phase, deep scan");
    }
    return armada_decision_wait("Defensive phase, holding");
}

static Armada_Decision opportunistic(const Armada_AIState *state, const Armada_GameState *game) {
    const Armada_Resources *res = &state->self.resources;
    const Armada_PlayerState *enemy = &game->player;

    if (armada_composition_total(&enemy->fleet.home) <= HYBRID_OPPORTUNITY_ENEMY_MAX &&
        ai_home_total(state) >= HYBRID_OPPORTUNITY_OWN_MIN) {
        Armada_Decision strike;
        if (ai_plan_attack(state, HYBRID_OPPORTUNITY_FRACTION, "Enemy home is exposed", &strike)) {
            return strike;
        }
    }

    if (armada_resources_income(&enemy->resources) > armada_resources_income(res)) {
        return economic(state);
    }

    if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
        return armada_decision_build(ARMADA_BUILD_CRUISER, 1, "Opportunistic phase, cruiser");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 1)) {
        return ai_build_up_to(state, ARMADA_BUILD_FRIGATE, 2, "Opportunistic phase, frigates");
    }
    return armada_decision_wait("Opportunistic phase, nothing affordable");
}

/*============================================================================
 * Entry Point
 *============================================================================*/

Armada_Decision ai_hybrid_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    Armada_HybridState *h = &state->internal.hybrid;

    if (armada_rng_chance(rng, state->probabilities.adaptive_variation)) {
        react(state, game, rng);
    }

    h->turns_remaining--;
    if (h->turns_remaining <= 0) {
        Armada_HybridStrategy previous = h->strategy;
        h->strategy = select_strategy(state, rng);
        h->turns_remaining = armada_rng_int(rng, h->tuning.min_duration, h->tuning.max_duration);
        h->selections++;
        armada_log_debug(ARMADA_LOG_AI, "Hybrid strategy %s -> %s for %d turns",
                         armada_hybrid_strategy_name(previous),
                         armada_hybrid_strategy_name(h->strategy),
                         (int)h->turns_remaining);
    }

    switch (h->strategy) {
        case ARMADA_HYBRID_AGGRESSIVE:    return aggressive(state, rng);
        case ARMADA_HYBRID_ECONOMIC:      return economic(state);
        case ARMADA_HYBRID_DEFENSIVE:     return defensive(state, game, rng);
        case ARMADA_HYBRID_OPPORTUNISTIC: return opportunistic(state, game);
        default:
            return armada_decision_wait("Unknown strategy");
    }
}
