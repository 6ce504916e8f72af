#ifndef ARMADA_COMBAT_H
#define ARMADA_COMBAT_H

#include "armada/fleet.h"
#include "armada/rng.h"

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada Combat Resolution
 *
 * Turns two fleet compositions into an outcome, survivors and casualties.
 *
 * Each side's strength is the sum, over its own ship classes, of
 *   own_count * own_factor * sum(effectiveness[own][enemy] * enemy_count)
 * where the per-class factors are drawn from [0.8, 1.2] unless the caller
 * injects them. The attacker/defender strength ratio picks the outcome
 * and a casualty rate is drawn per side from the outcome's band.
 *
 * Usage:
 *   Armada_CombatResult result;
 *   armada_combat_resolve(&attacker, &defender, NULL, &rng, &result);
 *
 *   // Deterministic strengths for tests
 *   Armada_CombatFactors f = armada_combat_factors_uniform(1.0f);
 *   armada_combat_resolve(&attacker, &defender, &f, &rng, &result);
 */

#define ARMADA_DECISIVE_RATIO       2.0
#define ARMADA_ROUTED_RATIO         0.5

#define ARMADA_FACTOR_MIN           0.8f
#define ARMADA_FACTOR_MAX           1.2f

#define ARMADA_CLOSE_LOSS_MIN       0.40f
#define ARMADA_CLOSE_LOSS_MAX       0.60f
#define ARMADA_WINNER_LOSS_MIN      0.10f
#define ARMADA_WINNER_LOSS_MAX      0.30f
#define ARMADA_LOSER_LOSS_MIN       0.70f
#define ARMADA_LOSER_LOSS_MAX       0.90f

typedef enum Armada_CombatOutcome {
    ARMADA_COMBAT_DECISIVE_ATTACKER = 0,
    ARMADA_COMBAT_DECISIVE_DEFENDER,
    ARMADA_COMBAT_CLOSE_BATTLE
} Armada_CombatOutcome;

/**
 * Per-class strength multipliers for one side
 */
typedef struct Armada_UnitFactors {
    float frigate;
    float cruiser;
    float battleship;
} Armada_UnitFactors;

typedef struct Armada_CombatFactors {
    Armada_UnitFactors attacker;
    Armada_UnitFactors defender;
} Armada_CombatFactors;

typedef struct Armada_CombatResult {
    Armada_CombatOutcome outcome;
    Armada_FleetComposition attacker_survivors;
    Armada_FleetComposition attacker_casualties;
    Armada_FleetComposition defender_survivors;
    Armada_FleetComposition defender_casualties;
    double attacker_strength;
    double defender_strength;
    double strength_ratio;      /* +inf when the defender has no strength */
} Armada_CombatResult;

/**
 * Output of fighting one COMBAT-phase movement
 */
typedef struct Armada_MovementCombat {
    Armada_CombatResult result;
    bool has_returning;                     /* False when the raid was wiped out */
    Armada_FleetMovement returning;         /* Valid only if has_returning */
    Armada_FleetComposition defender_home;  /* Defender's home fleet after the fight */
} Armada_MovementCombat;

/**
 * Effectiveness of one attacking class against one defending class.
 * Returns 0 for invalid types.
 */
float armada_effectiveness(Armada_UnitType attacker, Armada_UnitType defender);

/**
 * Factors with every multiplier set to `value`
 */
Armada_CombatFactors armada_combat_factors_uniform(float value);

/**
 * Draw all six multipliers from [0.8, 1.2).
 */
Armada_CombatFactors armada_combat_factors_roll(Armada_Rng *rng);

/**
 * Strength of `own` fighting `enemy` with the given multipliers.
 */
double armada_combat_strength(const Armada_FleetComposition *own,
                              const Armada_UnitFactors *factors,
                              const Armada_FleetComposition *enemy);

/**
 * Classify an engagement from raw strengths (zero strength on either side
 * is decided for the other side).
 */
Armada_CombatOutcome armada_combat_classify(double attacker_strength, double defender_strength);

/**
 * floor(count * rate) per class, rate clamped to [0, 1].
 */
Armada_FleetComposition armada_combat_casualties(const Armada_FleetComposition *comp, float rate);

/**
 * Resolve one engagement. Inputs are not modified.
 *
 * @param attacker Attacking composition
 * @param defender Defending composition
 * @param factors  Injected multipliers (NULL = draw from rng)
 * @param rng      Random source for multipliers and casualty rates
 * @param out      Receives the result
 * @return false with error set on NULL or invalid compositions
 */
bool armada_combat_resolve(const Armada_FleetComposition *attacker,
                           const Armada_FleetComposition *defender,
                           const Armada_CombatFactors *factors,
                           Armada_Rng *rng,
                           Armada_CombatResult *out);

/**
 * Fight a movement against the defender's home fleet and build the
 * survivors' return leg.
 */
bool armada_combat_process_movement(const Armada_FleetMovement *move,
                                    const Armada_FleetComposition *defender_home,
                                    int32_t current_turn,
                                    const Armada_CombatFactors *factors,
                                    Armada_Rng *rng,
                                    Armada_MovementCombat *out);

const char *armada_combat_outcome_name(Armada_CombatOutcome outcome);

#endif /* ARMADA_COMBAT_H */
