/**
 * Armada AI - Trickster Archetype
 *
 * Plays to what the opponent can see. While the opponent keeps scanning it
 * makes deceptive moves (decoy scans, builds that are deliberately not the
 * expected counter), spaced out by a cooldown. Once the opponent stops
 * watching it may switch to straightforward, optimal play. Everything else
 * is balanced economy and random hulls.
 */

#include "armada/ai.h"
#include "armada/log.h"
#include "ai_internal.h"

void ai_trickster_init(Armada_TricksterState *trickster, const Armada_TricksterTuning *tuning) {
    trickster->tuning = *tuning;
    trickster->last_deception_turn = 0;
    trickster->deceptions = 0;
}

/*============================================================================
 * Straightforward Play
 *============================================================================*/

static Armada_Decision build_optimal(const Armada_AIState *state, const Armada_GameState *game) {
    const Armada_Resources *res = &state->self.resources;
    Armada_UnitType enemy = armada_ai_dominant_unit(&game->player.fleet.home);

    Armada_Buildable counter;
    int32_t quantity;
    switch (enemy) {
        case ARMADA_UNIT_CRUISER:
            counter = ARMADA_BUILD_FRIGATE;
            quantity = 3;
            break;
        case ARMADA_UNIT_BATTLESHIP:
            counter = ARMADA_BUILD_CRUISER;
            quantity = 2;
            break;
        case ARMADA_UNIT_FRIGATE:
        default:
            counter = ARMADA_BUILD_BATTLESHIP;
            quantity = 1;
            break;
    }

    if (armada_ai_can_afford(res, counter, quantity)) {
        return armada_decision_build(counter, quantity, "Building the hard counter");
    }
    if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 1)) {
        return armada_decision_build(ARMADA_BUILD_FRIGATE, 1, "Counter unaffordable, adding a frigate");
    }
    return armada_decision_wait("Cannot afford any counter");
}

static Armada_Decision straightforward(const Armada_AIState *state,
                                       const Armada_GameState *game,
                                       Armada_Rng *rng) {
    const Armada_TricksterTuning *t = &state->internal.trickster.tuning;

    if (ai_home_total(state) >= t->attack_min_fleet && state->threat_level < t->attack_max_threat) {
        float own_value = armada_ai_fleet_value(&state->self.fleet.home);
        float enemy_value = armada_ai_fleet_value(&game->player.fleet.home);

        if (own_value >= enemy_value * t->attack_value_margin) {
            float fraction = armada_rng_range(rng, t->attack_fraction_min, t->attack_fraction_max);
            Armada_Decision strike;
            if (ai_plan_attack(state, fraction, "Opponent is not watching, striking", &strike)) {
                return strike;
            }
        }
    }
    return build_optimal(state, game);
}

/*============================================================================
 * Balanced Play
 *============================================================================*/

static Armada_Decision random_hull(const Armada_AIState *state, Armada_Rng *rng) {
    Armada_Buildable hull = armada_buildable_from_unit(ai_random_unit(rng));
    if (armada_ai_can_afford(&state->self.resources, hull, 1)) {
        return armada_decision_build(hull, 1, "Adding a hull");
    }
    return armada_decision_wait("Cannot afford the chosen hull");
}

static Armada_Decision balanced(const Armada_AIState *state, Armada_Rng *rng) {
    const Armada_TricksterTuning *t = &state->internal.trickster.tuning;
    const Armada_Resources *res = &state->self.resources;

    if (armada_rng_chance(rng, t->balanced_economy_chance)) {
        if (res->metal_income < t->balanced_income_target &&
            armada_ai_can_afford(res, ARMADA_BUILD_MINE, 1)) {
            return armada_decision_build(ARMADA_BUILD_MINE, 1, "Quietly growing metal income");
        }
        if (res->energy_income < t->balanced_income_target &&
            armada_ai_can_afford(res, ARMADA_BUILD_REACTOR, 1)) {
            return armada_decision_build(ARMADA_BUILD_REACTOR, 1, "Quietly growing energy income");
        }
    }
    return random_hull(state, rng);
}

/*============================================================================
 * Deception
 *============================================================================*/

/* Builds that are not what the opponent's composition invites */
static Armada_Decision misleading_build(const Armada_AIState *state,
                                        const Armada_GameState *game,
                                        Armada_Rng *rng) {
    const Armada_Resources *res = &state->self.resources;

    switch (armada_ai_dominant_unit(&game->player.fleet.home)) {
        case ARMADA_UNIT_FRIGATE:
            /* Battleships are expected */
            if (armada_ai_can_afford(res, ARMADA_BUILD_CRUISER, 1)) {
                return ai_build_up_to(state, ARMADA_BUILD_CRUISER, armada_rng_int(rng, 1, 2),
                                      "Unexpected cruisers");
            }
            break;
        case ARMADA_UNIT_CRUISER:
            /* Frigates are expected */
            if (armada_ai_can_afford(res, ARMADA_BUILD_BATTLESHIP, 1)) {
                return armada_decision_build(ARMADA_BUILD_BATTLESHIP, 1, "Unexpected battleship");
            }
            break;
        case ARMADA_UNIT_BATTLESHIP:
            /* Cruisers are expected */
            if (armada_ai_can_afford(res, ARMADA_BUILD_FRIGATE, 3)) {
                return ai_build_up_to(state, ARMADA_BUILD_FRIGATE, armada_rng_int(rng, 2, 5),
                                      "Unexpected frigate swarm");
            }
            break;
        default:
            break;
    }
    return random_hull(state, rng);
}

static Armada_Decision deceptive(Armada_AIState *state,
                                 const Armada_GameState *game,
                                 Armada_Rng *rng) {
    Armada_TricksterState *trick = &state->internal.trickster;

    if (game->turn - trick->last_deception_turn < trick->tuning.deception_cooldown) {
        return balanced(state, rng);
    }

    Armada_Decision d;
    if (armada_ai_can_afford_scan(&state->self.resources, ARMADA_SCAN_BASIC) &&
        armada_rng_chance(rng, trick->tuning.deceptive_scan_chance)) {
        d = armada_decision_scan(ARMADA_SCAN_BASIC, "Decoy scan");
    } else {
        d = misleading_build(state, game, rng);
    }

    if (d.type != ARMADA_DECISION_WAIT) {
        d.deceptive = true;
        trick->last_deception_turn = game->turn;
        trick->deceptions++;
        armada_log_debug(ARMADA_LOG_AI, "Trickster deception #%d: %s",
                         (int)trick->deceptions, d.reasoning ? d.reasoning : "");
    }
    return d;
}

Armada_Decision ai_trickster_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng) {
    const Armada_TricksterTuning *t = &state->internal.trickster.tuning;
    int32_t since_scan = game->turn - game->player.intelligence.last_scan_turn;

    if (since_scan > t->watch_turns && armada_rng_chance(rng, t->straightforward_chance)) {
        return straightforward(state, game, rng);
    }
    if (armada_rng_chance(rng, state->probabilities.deception_chance)) {
        return deceptive(state, game, rng);
    }
    return balanced(state, rng);
}
