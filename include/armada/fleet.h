#ifndef ARMADA_FLEET_H
#define ARMADA_FLEET_H

#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

/**
 * Armada Fleet Composition & Movement Model
 *
 * Fleet compositions (counts of three ship classes), in-flight fleet
 * movements and the mission phase state machine that decides when a
 * movement fights, when it comes home and when its owner is exposed.
 *
 * The mission phase is never stored. It is derived from the movement's
 * arrival turn and the current turn:
 *
 *   turn <  arrival  -> OUTBOUND
 *   turn == arrival  -> COMBAT
 *   turn >  arrival  -> RETURNING
 *
 * Usage:
 *   Armada_Fleet fleet;
 *   armada_fleet_init(&fleet);
 *   fleet.home.frigates = 20;
 *
 *   Armada_FleetComposition strike = { .frigates = 12 };
 *   if (!armada_fleet_launch(&fleet, &strike, "enemy_home", turn)) {
 *       // armada_get_last_error() says why
 *   }
 *
 *   // Next turn, classify movements
 *   Armada_MovementBuckets buckets;
 *   armada_movement_process(fleet.movements, fleet.movement_count, turn + 1, &buckets);
 *   for (int i = 0; i < buckets.combat_count; i++) {
 *       // resolve with armada_combat_process_movement()
 *   }
 */

/*============================================================================
 * Constants
 *============================================================================*/

#define ARMADA_MAX_UNITS_PER_TYPE   1000000  /* Overflow guard per ship class */
#define ARMADA_MAX_MOVEMENTS        32       /* Movements tracked per fleet */
#define ARMADA_TARGET_MAX           32       /* Target identifier buffer size */

#define ARMADA_TRANSIT_TURNS        1        /* Launch to arrival */
#define ARMADA_MISSION_TURNS        3        /* Launch to scheduled return */
#define ARMADA_RETURN_LEG_TURNS     1        /* Combat to return for survivors */

/*============================================================================
 * Unit Types
 *============================================================================*/

typedef enum Armada_UnitType {
    ARMADA_UNIT_FRIGATE = 0,
    ARMADA_UNIT_CRUISER,
    ARMADA_UNIT_BATTLESHIP,
    ARMADA_UNIT_TYPE_COUNT
} Armada_UnitType;

/**
 * Metal/energy amount (build cost, upkeep, scan cost)
 */
typedef struct Armada_Cost {
    int32_t metal;
    int32_t energy;
} Armada_Cost;

/**
 * Static per-class data
 */
typedef struct Armada_UnitStats {
    Armada_UnitType type;
    const char *name;
    Armada_Cost build_cost;
    Armada_Cost upkeep;
    int32_t build_time;         /* Turns in the build queue */
} Armada_UnitStats;

/*============================================================================
 * Fleet Composition
 *============================================================================*/

typedef struct Armada_FleetComposition {
    int32_t frigates;
    int32_t cruisers;
    int32_t battleships;
} Armada_FleetComposition;

/**
 * Check that no count is negative or above ARMADA_MAX_UNITS_PER_TYPE.
 * Sets error on failure.
 */
bool armada_composition_validate(const Armada_FleetComposition *comp);

int32_t armada_composition_total(const Armada_FleetComposition *comp);
bool armada_composition_is_empty(const Armada_FleetComposition *comp);

/**
 * Count of one ship class (0 for invalid type or NULL)
 */
int32_t armada_composition_get(const Armada_FleetComposition *comp, Armada_UnitType type);

/**
 * Set the count of one ship class. Negative counts are clamped to 0.
 */
void armada_composition_set(Armada_FleetComposition *comp, Armada_UnitType type, int32_t count);

/**
 * a + b, per class, capped at ARMADA_MAX_UNITS_PER_TYPE
 */
Armada_FleetComposition armada_composition_add(const Armada_FleetComposition *a,
                                               const Armada_FleetComposition *b);

/**
 * a - b, per class, clamped at zero
 */
Armada_FleetComposition armada_composition_subtract(const Armada_FleetComposition *a,
                                                    const Armada_FleetComposition *b);

/**
 * Whether every class count in `part` is covered by `whole`
 */
bool armada_composition_contains(const Armada_FleetComposition *whole,
                                 const Armada_FleetComposition *part);

/**
 * floor(count * fraction) per class. Fraction is clamped to [0, 1] and
 * rounded to 6 decimals first, so float band edges such as 0.7f floor as 0.7.
 */
Armada_FleetComposition armada_composition_scaled(const Armada_FleetComposition *comp,
                                                  float fraction);

/**
 * Total build cost of a composition
 */
Armada_Cost armada_composition_build_cost(const Armada_FleetComposition *comp);

/**
 * Total per-turn upkeep of a composition
 */
Armada_Cost armada_composition_upkeep(const Armada_FleetComposition *comp);

/*============================================================================
 * Unit Stats
 *============================================================================*/

/**
 * Get stats for a ship class.
 *
 * @return Stats pointer (static), or NULL for an invalid type
 */
const Armada_UnitStats *armada_unit_get_stats(Armada_UnitType type);

Armada_Cost armada_unit_build_cost(Armada_UnitType type);
Armada_Cost armada_unit_upkeep_cost(Armada_UnitType type);
const char *armada_unit_type_name(Armada_UnitType type);

/*============================================================================
 * Fleet Movement
 *============================================================================*/

typedef enum Armada_MissionPhase {
    ARMADA_PHASE_OUTBOUND = 0,
    ARMADA_PHASE_COMBAT,
    ARMADA_PHASE_RETURNING
} Armada_MissionPhase;

typedef struct Armada_FleetMovement {
    Armada_FleetComposition composition;
    char target[ARMADA_TARGET_MAX];
    int32_t launch_turn;
    int32_t arrival_turn;
    int32_t return_turn;
} Armada_FleetMovement;

/**
 * Result of classifying a movement list for one turn
 */
typedef struct Armada_MovementBuckets {
    Armada_FleetMovement advancing[ARMADA_MAX_MOVEMENTS];
    int advancing_count;
    Armada_FleetMovement combat[ARMADA_MAX_MOVEMENTS];
    int combat_count;
    Armada_FleetMovement returning[ARMADA_MAX_MOVEMENTS];
    int returning_count;
} Armada_MovementBuckets;

/**
 * Turns during which a movement leaves its owner exposed
 */
typedef struct Armada_CounterAttackWindow {
    int32_t start_turn;
    int32_t end_turn;
    int32_t duration;
} Armada_CounterAttackWindow;

/**
 * Create a movement launched on `current_turn`.
 * Arrival is current_turn + 1, scheduled return current_turn + 3.
 *
 * @param comp         Ships in the movement (must be valid and non-empty)
 * @param target       Target identifier (non-empty, truncated to ARMADA_TARGET_MAX - 1)
 * @param current_turn Launch turn
 * @param out          Receives the movement
 * @return true on success, false with error set otherwise
 */
bool armada_movement_create(const Armada_FleetComposition *comp,
                            const char *target,
                            int32_t current_turn,
                            Armada_FleetMovement *out);

/**
 * Validate a movement built elsewhere: composition valid and non-empty,
 * target non-empty, return > arrival > launch.
 * Sets error describing the first violation.
 */
bool armada_movement_validate(const Armada_FleetMovement *move);

Armada_MissionPhase armada_movement_phase(const Armada_FleetMovement *move, int32_t current_turn);
const char *armada_mission_phase_name(Armada_MissionPhase phase);

/**
 * True while the movement is away from home and not yet on its way back:
 * from the launch turn (arrival - 1) through the combat turn.
 */
bool armada_movement_in_transit(const Armada_FleetMovement *move, int32_t current_turn);

/**
 * True only before departure takes effect, i.e. on the launch turn.
 */
bool armada_movement_can_recall(const Armada_FleetMovement *move, int32_t current_turn);

/**
 * Inclusive turn range over which armada_movement_in_transit() holds
 */
Armada_CounterAttackWindow armada_movement_counter_attack_window(const Armada_FleetMovement *move);

/**
 * Build the return leg for the survivors of a raid.
 *
 * @param survivors    Surviving attackers
 * @param original     Movement that fought
 * @param current_turn Combat turn
 * @param out          Receives the return leg (launch/arrival kept, return = current_turn + 1)
 * @return false (without error) if there are no survivors, true otherwise
 */
bool armada_movement_create_returning(const Armada_FleetComposition *survivors,
                                      const Armada_FleetMovement *original,
                                      int32_t current_turn,
                                      Armada_FleetMovement *out);

/**
 * Partition movements by mission phase for `current_turn`.
 * Never resolves combat. Fails (error set, buckets empty) if any movement
 * is invalid or count exceeds ARMADA_MAX_MOVEMENTS.
 */
bool armada_movement_process(const Armada_FleetMovement *movements,
                             int count,
                             int32_t current_turn,
                             Armada_MovementBuckets *out);

/*============================================================================
 * Fleet (home system + movements owned by one side)
 *============================================================================*/

typedef struct Armada_Fleet {
    Armada_FleetComposition home;
    Armada_FleetMovement movements[ARMADA_MAX_MOVEMENTS];
    int movement_count;
} Armada_Fleet;

void armada_fleet_init(Armada_Fleet *fleet);

/**
 * Debit `comp` from the home fleet and create a movement for it.
 * Fails without changes if the home fleet cannot cover `comp`, the
 * movement list is full or the movement would be invalid.
 */
bool armada_fleet_launch(Armada_Fleet *fleet,
                         const Armada_FleetComposition *comp,
                         const char *target,
                         int32_t current_turn);

/**
 * Recall a movement that has not departed yet. Its ships return to the
 * home fleet and the movement is removed.
 */
bool armada_fleet_recall(Armada_Fleet *fleet, int index, int32_t current_turn);

/**
 * Append an externally built movement (validated first).
 */
bool armada_fleet_add_movement(Armada_Fleet *fleet, const Armada_FleetMovement *move);

/**
 * Remove a movement by index, preserving the order of the rest.
 */
bool armada_fleet_remove_movement(Armada_Fleet *fleet, int index);

/**
 * Fold every RETURNING movement's ships into the home fleet and remove
 * those movements.
 *
 * @return Number of movements merged
 */
int armada_fleet_merge_returning(Armada_Fleet *fleet, int32_t current_turn);

/**
 * Whether any movement is in transit (home defense reduced).
 */
bool armada_fleet_is_vulnerable(const Armada_Fleet *fleet, int32_t current_turn);

/**
 * What an enemy scan sees: only the home fleet. In-transit ships are hidden.
 */
Armada_FleetComposition armada_fleet_visible(const Armada_Fleet *fleet);

/**
 * Ships at home plus ships in every movement.
 */
int32_t armada_fleet_total_ships(const Armada_Fleet *fleet);

/**
 * True when the side has no ships at home or in flight.
 */
bool armada_fleet_is_eliminated(const Armada_Fleet *fleet);

#endif /* ARMADA_FLEET_H */
