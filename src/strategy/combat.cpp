/*
 * Armada Combat Resolution
 *
 * Effectiveness-weighted strength comparison with per-class random
 * multipliers, ratio-based outcome bands and banded casualty rates.
 */

#include "armada/armada.h"
#include "armada/combat.h"
#include "armada/error.h"
#include "armada/log.h"
#include "armada/validate.h"

#include <string.h>
#include <math.h>

/*============================================================================
 * Effectiveness Matrix
 *============================================================================*/

/* Row: attacking class, column: defending class */
static const float g_effectiveness[ARMADA_UNIT_TYPE_COUNT][ARMADA_UNIT_TYPE_COUNT] = {
    /*               frigate  cruiser  battleship */
    /* frigate    */ { 1.0f,   1.5f,    0.7f },
    /* cruiser    */ { 0.7f,   1.0f,    1.5f },
    /* battleship */ { 1.5f,   0.7f,    1.0f },
};

float armada_effectiveness(Armada_UnitType attacker, Armada_UnitType defender) {
    if ((int)attacker < 0 || attacker >= ARMADA_UNIT_TYPE_COUNT ||
        (int)defender < 0 || defender >= ARMADA_UNIT_TYPE_COUNT) {
        return 0.0f;
    }
    return g_effectiveness[attacker][defender];
}

/*============================================================================
 * Random Factors
 *============================================================================*/

static float factor_for(const Armada_UnitFactors *f, int type) {
    switch (type) {
        case ARMADA_UNIT_FRIGATE:    return f->frigate;
        case ARMADA_UNIT_CRUISER:    return f->cruiser;
        case ARMADA_UNIT_BATTLESHIP: return f->battleship;
        default:                     return 0.0f;
    }
}

Armada_CombatFactors armada_combat_factors_uniform(float value) {
    Armada_CombatFactors f;
    f.attacker.frigate = f.attacker.cruiser = f.attacker.battleship = value;
    f.defender.frigate = f.defender.cruiser = f.defender.battleship = value;
    return f;
}

Armada_CombatFactors armada_combat_factors_roll(Armada_Rng *rng) {
    Armada_CombatFactors f;
    f.attacker.frigate = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    f.attacker.cruiser = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    f.attacker.battleship = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    f.defender.frigate = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    f.defender.cruiser = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    f.defender.battleship = armada_rng_range(rng, ARMADA_FACTOR_MIN, ARMADA_FACTOR_MAX);
    return f;
}

/*============================================================================
 * Strength and Outcome
 *============================================================================*/

double armada_combat_strength(const Armada_FleetComposition *own,
                              const Armada_UnitFactors *factors,
                              const Armada_FleetComposition *enemy) {
    if (!own || !factors || !enemy) return 0.0;

    double total = 0.0;
    for (int o = 0; o < ARMADA_UNIT_TYPE_COUNT; o++) {
        int32_t count = armada_composition_get(own, (Armada_UnitType)o);
        if (count == 0) continue;

        double versus = 0.0;
        for (int e = 0; e < ARMADA_UNIT_TYPE_COUNT; e++) {
            versus += (double)g_effectiveness[o][e] *
                      (double)armada_composition_get(enemy, (Armada_UnitType)e);
        }
        total += (double)count * (double)factor_for(factors, o) * versus;
    }
    return total;
}

Armada_CombatOutcome armada_combat_classify(double attacker_strength, double defender_strength) {
    if (attacker_strength <= 0.0) return ARMADA_COMBAT_DECISIVE_DEFENDER;
    if (defender_strength <= 0.0) return ARMADA_COMBAT_DECISIVE_ATTACKER;

    double ratio = attacker_strength / defender_strength;
    if (ratio >= ARMADA_DECISIVE_RATIO) return ARMADA_COMBAT_DECISIVE_ATTACKER;
    if (ratio <= ARMADA_ROUTED_RATIO) return ARMADA_COMBAT_DECISIVE_DEFENDER;
    return ARMADA_COMBAT_CLOSE_BATTLE;
}

Armada_FleetComposition armada_combat_casualties(const Armada_FleetComposition *comp, float rate) {
    /* Scaling floors per class, which is exactly the casualty rule */
    return armada_composition_scaled(comp, rate);
}

static void roll_loss_rates(Armada_CombatOutcome outcome, Armada_Rng *rng,
                            float *attacker_rate, float *defender_rate) {
    switch (outcome) {
        case ARMADA_COMBAT_DECISIVE_ATTACKER:
            *attacker_rate = armada_rng_range(rng, ARMADA_WINNER_LOSS_MIN, ARMADA_WINNER_LOSS_MAX);
            *defender_rate = armada_rng_range(rng, ARMADA_LOSER_LOSS_MIN, ARMADA_LOSER_LOSS_MAX);
            break;
        case ARMADA_COMBAT_DECISIVE_DEFENDER:
            *attacker_rate = armada_rng_range(rng, ARMADA_LOSER_LOSS_MIN, ARMADA_LOSER_LOSS_MAX);
            *defender_rate = armada_rng_range(rng, ARMADA_WINNER_LOSS_MIN, ARMADA_WINNER_LOSS_MAX);
            break;
        case ARMADA_COMBAT_CLOSE_BATTLE:
        default:
            *attacker_rate = armada_rng_range(rng, ARMADA_CLOSE_LOSS_MIN, ARMADA_CLOSE_LOSS_MAX);
            *defender_rate = armada_rng_range(rng, ARMADA_CLOSE_LOSS_MIN, ARMADA_CLOSE_LOSS_MAX);
            break;
    }
}

/*============================================================================
 * Resolution
 *============================================================================*/

bool armada_combat_resolve(const Armada_FleetComposition *attacker,
                           const Armada_FleetComposition *defender,
                           const Armada_CombatFactors *factors,
                           Armada_Rng *rng,
                           Armada_CombatResult *out) {
    ARMADA_VALIDATE_PTRS3_RET(attacker, defender, out, false);
    ARMADA_VALIDATE_PTR_RET(rng, false);

    if (!armada_composition_validate(attacker) || !armada_composition_validate(defender)) {
        return false;
    }

    Armada_CombatFactors rolled;
    if (!factors) {
        rolled = armada_combat_factors_roll(rng);
        factors = &rolled;
    }

    Armada_CombatResult r;
    memset(&r, 0, sizeof(r));

    r.attacker_strength = armada_combat_strength(attacker, &factors->attacker, defender);
    r.defender_strength = armada_combat_strength(defender, &factors->defender, attacker);
    r.strength_ratio = r.defender_strength > 0.0
        ? r.attacker_strength / r.defender_strength
        : INFINITY;
    r.outcome = armada_combat_classify(r.attacker_strength, r.defender_strength);

    float attacker_rate = 0.0f;
    float defender_rate = 0.0f;
    roll_loss_rates(r.outcome, rng, &attacker_rate, &defender_rate);

    r.attacker_casualties = armada_combat_casualties(attacker, attacker_rate);
    r.defender_casualties = armada_combat_casualties(defender, defender_rate);
    r.attacker_survivors = armada_composition_subtract(attacker, &r.attacker_casualties);
    r.defender_survivors = armada_composition_subtract(defender, &r.defender_casualties);

    *out = r;
    return true;
}

bool armada_combat_process_movement(const Armada_FleetMovement *move,
                                    const Armada_FleetComposition *defender_home,
                                    int32_t current_turn,
                                    const Armada_CombatFactors *factors,
                                    Armada_Rng *rng,
                                    Armada_MovementCombat *out) {
    ARMADA_VALIDATE_PTRS3_RET(move, defender_home, out, false);

    if (!armada_movement_validate(move)) {
        return false;
    }
    if (armada_movement_phase(move, current_turn) != ARMADA_PHASE_COMBAT) {
        armada_set_error("Movement to %s is %s on turn %d, not in combat",
                         move->target,
                         armada_mission_phase_name(armada_movement_phase(move, current_turn)),
                         (int)current_turn);
        return false;
    }

    Armada_MovementCombat mc;
    memset(&mc, 0, sizeof(mc));

    if (!armada_combat_resolve(&move->composition, defender_home, factors, rng, &mc.result)) {
        return false;
    }

    mc.has_returning = armada_movement_create_returning(&mc.result.attacker_survivors,
                                                        move, current_turn, &mc.returning);
    mc.defender_home = mc.result.defender_survivors;

    armada_log_debug(ARMADA_LOG_COMBAT, "%s at %s: ratio %.2f, attacker lost %d, defender lost %d",
                     armada_combat_outcome_name(mc.result.outcome), move->target,
                     mc.result.strength_ratio,
                     (int)armada_composition_total(&mc.result.attacker_casualties),
                     (int)armada_composition_total(&mc.result.defender_casualties));

    *out = mc;
    return true;
}

const char *armada_combat_outcome_name(Armada_CombatOutcome outcome) {
    switch (outcome) {
        case ARMADA_COMBAT_DECISIVE_ATTACKER: return "decisive_attacker";
        case ARMADA_COMBAT_DECISIVE_DEFENDER: return "decisive_defender";
        case ARMADA_COMBAT_CLOSE_BATTLE:      return "close_battle";
        default:                              return "unknown";
    }
}
