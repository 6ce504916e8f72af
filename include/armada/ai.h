#ifndef ARMADA_AI_H
#define ARMADA_AI_H

#include "armada/ai_config.h"
#include "armada/economy.h"
#include "armada/error.h"
#include "armada/fleet.h"
#include "armada/game_state.h"
#include "armada/rng.h"

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada AI Decision Engine
 *
 * One decision per turn (build, attack, scan or wait) from one of four
 * archetypes. The archetype is fixed when the engine is created; its
 * private state lives in a tagged union inside Armada_AIState and a single
 * switch dispatches to the archetype's decision function.
 *
 * Usage:
 *   Armada_Rng rng;
 *   armada_rng_seed(&rng, seed);
 *
 *   Armada_AIEngine *engine = armada_ai_engine_create(ARMADA_ARCHETYPE_HYBRID, NULL, &rng);
 *   armada_ai_engine_set_error_log(engine, error_log);
 *
 *   // Each turn
 *   Armada_Decision decision;
 *   if (armada_ai_engine_process_turn(engine, &game, &decision)) {
 *       apply_decision(&game.ai, &decision);
 *   }
 *
 *   armada_ai_engine_destroy(engine);
 */

/*============================================================================
 * Heuristic Constants
 *============================================================================*/

#define ARMADA_AI_FRIGATE_VALUE       1.0f
#define ARMADA_AI_CRUISER_VALUE       2.5f
#define ARMADA_AI_BATTLESHIP_VALUE    5.0f

#define ARMADA_AI_ENEMY_TARGET        "player_home"

/*============================================================================
 * Decisions
 *============================================================================*/

typedef enum Armada_DecisionType {
    ARMADA_DECISION_WAIT = 0,
    ARMADA_DECISION_BUILD,
    ARMADA_DECISION_ATTACK,
    ARMADA_DECISION_SCAN
} Armada_DecisionType;

typedef struct Armada_BuildOrder {
    Armada_Buildable item;
    int32_t quantity;
} Armada_BuildOrder;

typedef struct Armada_AttackOrder {
    char target[ARMADA_TARGET_MAX];
    Armada_FleetComposition fleet;
} Armada_AttackOrder;

typedef struct Armada_ScanOrder {
    Armada_ScanType scan_type;
} Armada_ScanOrder;

/**
 * Tagged decision. Only the member matching `type` is meaningful.
 */
typedef struct Armada_Decision {
    Armada_DecisionType type;
    union {
        Armada_BuildOrder build;
        Armada_AttackOrder attack;
        Armada_ScanOrder scan;
    };
    const char *reasoning;      /* Static string, may be NULL */
    bool deceptive;             /* Trickster feint; sets misinformation_active when applied */
} Armada_Decision;

Armada_Decision armada_decision_wait(const char *reasoning);
Armada_Decision armada_decision_build(Armada_Buildable item, int32_t quantity, const char *reasoning);
Armada_Decision armada_decision_attack(const char *target,
                                       const Armada_FleetComposition *fleet,
                                       const char *reasoning);
Armada_Decision armada_decision_scan(Armada_ScanType scan_type, const char *reasoning);

/**
 * Structural equality (type and the active member; reasoning ignored)
 */
bool armada_decision_equals(const Armada_Decision *a, const Armada_Decision *b);

const char *armada_decision_type_name(Armada_DecisionType type);

/*============================================================================
 * Archetype State
 *============================================================================*/

typedef enum Armada_HybridStrategy {
    ARMADA_HYBRID_AGGRESSIVE = 0,
    ARMADA_HYBRID_ECONOMIC,
    ARMADA_HYBRID_DEFENSIVE,
    ARMADA_HYBRID_OPPORTUNISTIC,
    ARMADA_HYBRID_STRATEGY_COUNT
} Armada_HybridStrategy;

typedef struct Armada_TricksterState {
    Armada_TricksterTuning tuning;
    int32_t last_deception_turn;    /* 0 = never */
    int32_t deceptions;
} Armada_TricksterState;

typedef struct Armada_HybridState {
    Armada_HybridTuning tuning;
    Armada_HybridStrategy strategy;
    int32_t turns_remaining;        /* Re-selects when this reaches 0 */
    int32_t selections;             /* Timer-driven re-selections so far */
} Armada_HybridState;

/**
 * Per-side AI state. `archetype` tags the `internal` union: Trickster and
 * Hybrid carry state, Aggressor and Economist carry none.
 */
typedef struct Armada_AIState {
    Armada_Archetype archetype;
    Armada_BehaviorProbabilities probabilities;
    Armada_PlayerState self;        /* Copy of own side, refreshed every turn */
    float threat_level;             /* 0..1 */
    float economic_advantage;       /* -1..1 */
    Armada_Decision last_decision;
    bool has_last_decision;
    union {
        Armada_TricksterState trickster;
        Armada_HybridState hybrid;
    } internal;
} Armada_AIState;

/**
 * Initialize AI state for an archetype.
 *
 * @param state     State to fill
 * @param archetype Archetype
 * @param config    Probabilities and tuning (NULL = defaults)
 * @param rng       Random source (Hybrid draws its opening strategy)
 * @return false with error set for an invalid archetype or config
 */
bool armada_ai_state_init(Armada_AIState *state,
                          Armada_Archetype archetype,
                          const Armada_AIConfig *config,
                          Armada_Rng *rng);

/**
 * Copy the AI side out of the game state and recompute threat level and
 * economic advantage against the player side.
 */
void armada_ai_refresh(Armada_AIState *state, const Armada_GameState *game);

/**
 * Run the archetype's decision logic for this turn. Does not refresh.
 */
Armada_Decision armada_ai_make_decision(Armada_AIState *state,
                                        const Armada_GameState *game,
                                        Armada_Rng *rng);

/*============================================================================
 * Shared Heuristics
 *============================================================================*/

/**
 * Coarse fleet value: frigates x1 + cruisers x2.5 + battleships x5
 */
float armada_ai_fleet_value(const Armada_FleetComposition *fleet);

/**
 * clamp(enemy_value / own_value - 0.5, 0, 1), or 1.0 when own value is 0
 */
float armada_ai_threat_level(const Armada_FleetComposition *own,
                             const Armada_FleetComposition *enemy);

/**
 * (own - enemy) / (own + enemy) over total income, 0 when both are 0
 */
float armada_ai_economic_advantage(const Armada_Resources *own,
                                   const Armada_Resources *enemy);

bool armada_ai_can_afford(const Armada_Resources *res, Armada_Buildable item, int32_t quantity);

/**
 * Largest quantity of `item` the resources cover (0 if none)
 */
int32_t armada_ai_affordable_quantity(const Armada_Resources *res, Armada_Buildable item);

bool armada_ai_can_afford_scan(const Armada_Resources *res, Armada_ScanType scan_type);

/**
 * Whether `wanted` fits inside the home fleet, class by class
 */
bool armada_ai_has_available_fleet(const Armada_FleetComposition *home,
                                   const Armada_FleetComposition *wanted);

/**
 * Most numerous class. Ties favor frigates, then cruisers.
 */
Armada_UnitType armada_ai_dominant_unit(const Armada_FleetComposition *fleet);

/**
 * Class that beats `type` (frigate -> battleship, cruiser -> frigate,
 * battleship -> cruiser)
 */
Armada_UnitType armada_ai_counter_unit(Armada_UnitType type);

/**
 * Check a decision against the deciding side's own state: builds must be
 * positive and affordable, attacks need a target and ships actually at
 * home, scans need the energy. Sets error describing the violation.
 */
bool armada_ai_validate_decision(const Armada_Decision *decision, const Armada_PlayerState *self);

/*============================================================================
 * Engine
 *============================================================================*/

typedef struct Armada_AIEngine Armada_AIEngine;

/**
 * Create an engine for one side.
 *
 * @param archetype Archetype (invalid values fail)
 * @param config    Config to copy from (NULL = defaults)
 * @param rng       Shared random source (borrowed, must outlive the engine)
 * @return New engine, or NULL with error set
 */
Armada_AIEngine *armada_ai_engine_create(Armada_Archetype archetype,
                                         const Armada_AIConfig *config,
                                         Armada_Rng *rng);

/**
 * Create an engine from an archetype name ("aggressor", "economist",
 * "trickster", "hybrid"). Unknown names fail.
 */
Armada_AIEngine *armada_ai_engine_create_by_name(const char *name,
                                                 const Armada_AIConfig *config,
                                                 Armada_Rng *rng);

void armada_ai_engine_destroy(Armada_AIEngine *engine);

/**
 * Attach an error log for engine defects (borrowed, NULL detaches).
 */
void armada_ai_engine_set_error_log(Armada_AIEngine *engine, Armada_ErrorLog *log);

/**
 * Refresh state from `game.ai`, decide, validate and remember the decision.
 * A decision that fails validation is an engine defect: it is logged,
 * reported to the attached error log and the call returns false.
 */
bool armada_ai_engine_process_turn(Armada_AIEngine *engine,
                                   const Armada_GameState *game,
                                   Armada_Decision *out);

const Armada_AIState *armada_ai_engine_state(const Armada_AIEngine *engine);
Armada_Archetype armada_ai_engine_archetype(const Armada_AIEngine *engine);

/*============================================================================
 * Names
 *============================================================================*/

/**
 * Parse an archetype name (case-sensitive, lower case).
 *
 * @return false with error set for unknown names
 */
bool armada_archetype_from_name(const char *name, Armada_Archetype *out);

const char *armada_archetype_name(Armada_Archetype archetype);
const char *armada_hybrid_strategy_name(Armada_HybridStrategy strategy);

#endif /* ARMADA_AI_H */
