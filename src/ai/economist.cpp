/**
 * Armada AI - Economist Archetype
 *
 * Grows income toward a high target, keeps a small defensive fleet and
 * only strikes with part of its fleet when it is both richer and twice as
 * strong as the opponent.
 */

#include "armada/ai.h"
#include "ai_internal.h"

#define ECONOMIST_THREAT_TRIGGER      0.5f
#define ECONOMIST_INCOME_TARGET       25000
#define ECONOMIST_ATTACK_MIN_FLEET    10
#define ECONOMIST_ATTACK_MIN_ADVANTAGE 0.3f
#define ECONOMIST_ATTACK_VALUE_MARGIN 2.0f
#define ECONOMIST_ATTACK_FRAC_MIN     0.4f
#define ECONOMIST_ATTACK_FRAC_MAX     0.5f
#define ECONOMIST_DEFENSE_FLOOR       8
#define ECONOMIST_SCAN_CHANCE         0.3f

static Armada_Decision defensive_military(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (ai_home_total(state) < ECONOMIST_DEFENSE_FLOOR) {
        if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
            return armada_decision_build(ARMADA_BUILD_CRUISER, 1, "Maintaining defensive cruisers");
        }
        if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 2)) {
            return armada_decision_build(ARMADA_BUILD_FRIGATE, 2, "Maintaining defensive frigates");
        }
        if (armada_ai_can_afford(res, ARMADA_BUILD_BATTLESHIP, 1)) {
            return armada_decision_build(ARMADA_BUILD_BATTLESHIP, 1, "Maintaining a defensive battleship");
        }
    }

    if (armada_ai_can_afford_scan(res, ARMADA_SCAN_DEEP) &&
        armada_rng_chance(rng, ECONOMIST_SCAN_CHANCE)) {
        return armada_decision_scan(ARMADA_SCAN_DEEP, "Defense adequate, gathering intelligence");
    }
    return armada_decision_wait("Holding position");
}

static Armada_Decision economic(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    if (armada_resources_income(res) < ECONOMIST_INCOME_TARGET) {
        /* Grow whichever income is lower */
        if (res->metal_income <= res->energy_income) {
            if (armada_ai_can_afford(res, ARMADA_BUILD_MINE, 1)) {
                return armada_decision_build(ARMADA_BUILD_MINE, 1, "Expanding metal income");
            }
        } else if (armada_ai_can_afford(res, ARMADA_BUILD_REACTOR, 1)) {
            return armada_decision_build(ARMADA_BUILD_REACTOR, 1, "Expanding energy income");
        }
    }
    return defensive_military(state, rng);
}

static Armada_Decision military(const Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    if (ai_home_total(state) >= ECONOMIST_ATTACK_MIN_FLEET &&
        state->economic_advantage > ECONOMIST_ATTACK_MIN_ADVANTAGE) {
        float own_value = armada_ai_fleet_value(&state->self.fleet.home);
        float enemy_value = armada_ai_fleet_value(&game->player.fleet.home);

        if (own_value >= enemy_value * ECONOMIST_ATTACK_VALUE_MARGIN) {
            float fraction = armada_rng_range(rng, ECONOMIST_ATTACK_FRAC_MIN, ECONOMIST_ATTACK_FRAC_MAX);
            Armada_Decision strike;
            if (ai_plan_attack(state, fraction, "Overwhelming advantage, limited strike", &strike)) {
                return strike;
            }
        }
    }
    return defensive_military(state, rng);
}

Armada_Decision ai_economist_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    const Armada_BehaviorProbabilities *p = &state->probabilities;

    if (state->threat_level > ECONOMIST_THREAT_TRIGGER &&
        armada_rng_chance(rng, p->military_focus)) {
        return military(state, game, rng);
    }
    if (armada_rng_chance(rng, p->economic_focus)) {
        return economic(state, rng);
    }
    return defensive_military(state, rng);
}
