/**
 * Armada AI - Aggressor Archetype
 *
 * Military first. Attacks with most of the home fleet once it has five
 * ships, keeps the build queue full of cheap hulls and only tops up the
 * economy when income runs low. Under heavy threat it occasionally turtles
 * for a turn.
 */

#include "armada/ai.h"
#include "ai_internal.h"

#define AGGRESSOR_DEFENSIVE_THREAT   0.7f
#define AGGRESSOR_ATTACK_MIN_FLEET   5
#define AGGRESSOR_ATTACK_MAX_THREAT  0.8f
#define AGGRESSOR_ATTACK_FRAC_MIN    0.6f
#define AGGRESSOR_ATTACK_FRAC_MAX    0.8f
#define AGGRESSOR_INCOME_FLOOR       15000

static Armada_Decision build_military(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 3)) {
        return ai_build_up_to(state, ARMADA_BUILD_FRIGATE, armada_rng_int(rng, 1, 3),
                              "Massing frigates for the next strike");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 2)) {
        return ai_build_up_to(state, ARMADA_BUILD_CRUISER, armada_rng_int(rng, 1, 2),
                              "Adding cruisers to the battle line");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_BATTLESHIP, 1)) {
        return armada_decision_build(ARMADA_BUILD_BATTLESHIP, 1, "Laying down a battleship");
    }
    return armada_decision_wait("Cannot afford military units");
}

static Armada_Decision defensive(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (armada_ai_can_afford(res, ARMADA_BUILD_BATTLESHIP, 1)) {
        return armada_decision_build(ARMADA_BUILD_BATTLESHIP, 1, "Heavy threat, fortifying with a battleship");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
        return ai_build_up_to(state, ARMADA_BUILD_CRUISER, armada_rng_int(rng, 1, 3),
                              "Heavy threat, reinforcing with cruisers");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 1)) {
        return ai_build_up_to(state, ARMADA_BUILD_FRIGATE, armada_rng_int(rng, 1, 5),
                              "Heavy threat, screening with frigates");
    }
    return armada_decision_wait("Heavy threat but nothing affordable");
}

static Armada_Decision military(const Armada_AIState *state, Armada_Rng *rng) {
    if (ai_home_total(state) >= AGGRESSOR_ATTACK_MIN_FLEET &&
        state->threat_level < AGGRESSOR_ATTACK_MAX_THREAT) {
        float fraction = armada_rng_range(rng, AGGRESSOR_ATTACK_FRAC_MIN, AGGRESSOR_ATTACK_FRAC_MAX);
        Armada_Decision strike;
        if (ai_plan_attack(state, fraction, "Pressing the attack", &strike)) {
            return strike;
        }
    }
    return build_military(state, rng);
}

static Armada_Decision economic(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (armada_resources_income(res) < AGGRESSOR_INCOME_FLOOR) {
        if (res->metal_income < res->energy_income &&
            armada_ai_can_afford(res, ARMADA_BUILD_MINE, 1)) {
            return armada_decision_build(ARMADA_BUILD_MINE, 1, "Income low, adding a mine");
        }
        if (armada_ai_can_afford(res, ARMADA_BUILD_REACTOR, 1)) {
            return armada_decision_build(ARMADA_BUILD_REACTOR, 1, "Income low, adding a reactor");
        }
    }
    return build_military(state, rng);
}

Armada_Decision ai_aggressor_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    (void)game;
    const Armada_BehaviorProbabilities *p = &state->probabilities;

    /* The adaptation roll is consumed every turn */
    bool adapt = armada_rng_chance(rng, p->adaptive_variation);
    if (adapt && state->threat_level > AGGRESSOR_DEFENSIVE_THREAT) {
        return defensive(state, rng);
    }

    if (armada_rng_chance(rng, p->military_focus)) {
        return military(state, rng);
    }
    return economic(state, rng);
}
