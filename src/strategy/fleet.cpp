/*
 * Armada Fleet Composition & Movement Model
 *
 * Ship class tables, composition arithmetic, the derived mission phase
 * state machine and the per-side fleet owner.
 */

#include "armada/armada.h"
#include "armada/fleet.h"
#include "armada/error.h"
#include "armada/log.h"
#include "armada/validate.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

/*============================================================================
 * Unit Stats Database
 *============================================================================*/

static const Armada_UnitStats g_unit_stats[ARMADA_UNIT_TYPE_COUNT] = {
    {
        .type = ARMADA_UNIT_FRIGATE,
        .name = "Frigate",
        .build_cost = { .metal = 4, .energy = 2 },
        .upkeep = { .metal = 2, .energy = 1 },
        .build_time = 1
    },
    {
        .type = ARMADA_UNIT_CRUISER,
        .name = "Cruiser",
        .build_cost = { .metal = 10, .energy = 6 },
        .upkeep = { .metal = 5, .energy = 3 },
        .build_time = 2
    },
    {
        .type = ARMADA_UNIT_BATTLESHIP,
        .name = "Battleship",
        .build_cost = { .metal = 20, .energy = 12 },
        .upkeep = { .metal = 10, .energy = 6 },
        .build_time = 4
    },
};

static bool valid_unit_type(Armada_UnitType type) {
    return (int)type >= 0 && type < ARMADA_UNIT_TYPE_COUNT;
}

const Armada_UnitStats *armada_unit_get_stats(Armada_UnitType type) {
    if (!valid_unit_type(type)) return NULL;
    return &g_unit_stats[type];
}

Armada_Cost armada_unit_build_cost(Armada_UnitType type) {
    Armada_Cost none = { 0, 0 };
    return valid_unit_type(type) ? g_unit_stats[type].build_cost : none;
}

Armada_Cost armada_unit_upkeep_cost(Armada_UnitType type) {
    Armada_Cost none = { 0, 0 };
    return valid_unit_type(type) ? g_unit_stats[type].upkeep : none;
}

const char *armada_unit_type_name(Armada_UnitType type) {
    return valid_unit_type(type) ? g_unit_stats[type].name : "Unknown";
}

/*============================================================================
 * Fleet Composition
 *============================================================================*/

static int32_t clamp_count(int64_t n) {
    if (n < 0) return 0;
    if (n > ARMADA_MAX_UNITS_PER_TYPE) return ARMADA_MAX_UNITS_PER_TYPE;
    return (int32_t)n;
}

bool armada_composition_validate(const Armada_FleetComposition *comp) {
    ARMADA_VALIDATE_PTR_RET(comp, false);

    const int32_t counts[ARMADA_UNIT_TYPE_COUNT] = {
        comp->frigates, comp->cruisers, comp->battleships
    };
    for (int i = 0; i < ARMADA_UNIT_TYPE_COUNT; i++) {
        if (counts[i] < 0) {
            armada_set_error("Fleet composition has negative %s count: %d",
                             g_unit_stats[i].name, (int)counts[i]);
            return false;
        }
        if (counts[i] > ARMADA_MAX_UNITS_PER_TYPE) {
            armada_set_error("Fleet composition %s count exceeds %d: %d",
                             g_unit_stats[i].name, ARMADA_MAX_UNITS_PER_TYPE, (int)counts[i]);
            return false;
        }
    }
    return true;
}

int32_t armada_composition_total(const Armada_FleetComposition *comp) {
    if (!comp) return 0;
    return comp->frigates + comp->cruisers + comp->battleships;
}

bool armada_composition_is_empty(const Armada_FleetComposition *comp) {
    return armada_composition_total(comp) <= 0;
}

int32_t armada_composition_get(const Armada_FleetComposition *comp, Armada_UnitType type) {
    if (!comp) return 0;
    switch (type) {
        case ARMADA_UNIT_FRIGATE:    return comp->frigates;
        case ARMADA_UNIT_CRUISER:    return comp->cruisers;
        case ARMADA_UNIT_BATTLESHIP: return comp->battleships;
        default:                     return 0;
    }
}

void armada_composition_set(Armada_FleetComposition *comp, Armada_UnitType type, int32_t count) {
    if (!comp) return;
    count = clamp_count(count);
    switch (type) {
        case ARMADA_UNIT_FRIGATE:    comp->frigates = count; break;
        case ARMADA_UNIT_CRUISER:    comp->cruisers = count; break;
        case ARMADA_UNIT_BATTLESHIP: comp->battleships = count; break;
        default: break;
    }
}

Armada_FleetComposition armada_composition_add(const Armada_FleetComposition *a,
                                               const Armada_FleetComposition *b) {
    Armada_FleetComposition r = {};
    if (!a || !b) return r;
    r.frigates = clamp_count((int64_t)a->frigates + b->frigates);
    r.cruisers = clamp_count((int64_t)a->cruisers + b->cruisers);
    r.battleships = clamp_count((int64_t)a->battleships + b->battleships);
    return r;
}

Armada_FleetComposition armada_composition_subtract(const Armada_FleetComposition *a,
                                                    const Armada_FleetComposition *b) {
    Armada_FleetComposition r = {};
    if (!a || !b) return r;
    r.frigates = clamp_count((int64_t)a->frigates - b->frigates);
    r.cruisers = clamp_count((int64_t)a->cruisers - b->cruisers);
    r.battleships = clamp_count((int64_t)a->battleships - b->battleships);
    return r;
}

bool armada_composition_contains(const Armada_FleetComposition *whole,
                                 const Armada_FleetComposition *part) {
    if (!whole || !part) return false;
    return part->frigates <= whole->frigates &&
           part->cruisers <= whole->cruisers &&
           part->battleships <= whole->battleships;
}

Armada_FleetComposition armada_composition_scaled(const Armada_FleetComposition *comp,
                                                  float fraction) {
    Armada_FleetComposition r = {};
    if (!comp) return r;
    if (fraction < 0.0f) fraction = 0.0f;
    if (fraction > 1.0f) fraction = 1.0f;

    /* 0.7f is 0.69999998: snap to 6 decimals so 10 * 0.7f floors to 7 */
    double rate = round((double)fraction * 1e6) / 1e6;
    r.frigates = clamp_count((int64_t)floor((double)comp->frigates * rate + 1e-9));
    r.cruisers = clamp_count((int64_t)floor((double)comp->cruisers * rate + 1e-9));
    r.battleships = clamp_count((int64_t)floor((double)comp->battleships * rate + 1e-9));
    return r;
}

Armada_Cost armada_composition_build_cost(const Armada_FleetComposition *comp) {
    Armada_Cost total = { 0, 0 };
    if (!comp) return total;
    for (int i = 0; i < ARMADA_UNIT_TYPE_COUNT; i++) {
        int32_t n = armada_composition_get(comp, (Armada_UnitType)i);
        total.metal += n * g_unit_stats[i].build_cost.metal;
        total.energy += n * g_unit_stats[i].build_cost.energy;
    }
    return total;
}

Armada_Cost armada_composition_upkeep(const Armada_FleetComposition *comp) {
    Armada_Cost total = { 0, 0 };
    if (!comp) return total;
    for (int i = 0; i < ARMADA_UNIT_TYPE_COUNT; i++) {
        int32_t n = armada_composition_get(comp, (Armada_UnitType)i);
        total.metal += n * g_unit_stats[i].upkeep.metal;
        total.energy += n * g_unit_stats[i].upkeep.energy;
    }
    return total;
}

/*============================================================================
 * Fleet Movement
 *============================================================================*/

bool armada_movement_validate(const Armada_FleetMovement *move) {
    ARMADA_VALIDATE_PTR_RET(move, false);

    if (!armada_composition_validate(&move->composition)) {
        return false;
    }
    if (armada_composition_is_empty(&move->composition)) {
        armada_set_error("Fleet movement has no ships");
        return false;
    }
    if (move->target[0] == '\0') {
        armada_set_error("Fleet movement has no target");
        return false;
    }
    if (move->arrival_turn <= move->launch_turn) {
        armada_set_error("Fleet movement arrives on turn %d, not after launch turn %d",
                         (int)move->arrival_turn, (int)move->launch_turn);
        return false;
    }
    if (move->return_turn <= move->arrival_turn) {
        armada_set_error("Fleet movement returns on turn %d, not after arrival turn %d",
                         (int)move->return_turn, (int)move->arrival_turn);
        return false;
    }
    return true;
}

bool armada_movement_create(const Armada_FleetComposition *comp,
                            const char *target,
                            int32_t current_turn,
                            Armada_FleetMovement *out) {
    ARMADA_VALIDATE_PTRS2_RET(comp, out, false);
    ARMADA_VALIDATE_STRING_RET(target, false);

    Armada_FleetMovement move;
    memset(&move, 0, sizeof(move));
    move.composition = *comp;
    snprintf(move.target, sizeof(move.target), "%s", target);
    move.launch_turn = current_turn;
    move.arrival_turn = current_turn + ARMADA_TRANSIT_TURNS;
    move.return_turn = current_turn + ARMADA_MISSION_TURNS;

    if (!armada_movement_validate(&move)) {
        return false;
    }

    *out = move;
    return true;
}

Armada_MissionPhase armada_movement_phase(const Armada_FleetMovement *move, int32_t current_turn) {
    if (!move || current_turn < move->arrival_turn) return ARMADA_PHASE_OUTBOUND;
    if (current_turn == move->arrival_turn) return ARMADA_PHASE_COMBAT;
    return ARMADA_PHASE_RETURNING;
}

const char *armada_mission_phase_name(Armada_MissionPhase phase) {
    switch (phase) {
        case ARMADA_PHASE_OUTBOUND:  return "outbound";
        case ARMADA_PHASE_COMBAT:    return "combat";
        case ARMADA_PHASE_RETURNING: return "returning";
        default:                     return "unknown";
    }
}

bool armada_movement_in_transit(const Armada_FleetMovement *move, int32_t current_turn) {
    if (!move) return false;
    if (current_turn < move->arrival_turn - ARMADA_TRANSIT_TURNS) return false;
    return armada_movement_phase(move, current_turn) != ARMADA_PHASE_RETURNING;
}

bool armada_movement_can_recall(const Armada_FleetMovement *move, int32_t current_turn) {
    if (!move) return false;
    /* Departure takes effect once the launch turn has passed */
    return current_turn < move->arrival_turn;
}

Armada_CounterAttackWindow armada_movement_counter_attack_window(const Armada_FleetMovement *move) {
    Armada_CounterAttackWindow w = { 0, 0, 0 };
    if (!move) return w;
    /* Same turns as armada_movement_in_transit */
    w.start_turn = move->arrival_turn - ARMADA_TRANSIT_TURNS;
    w.end_turn = move->arrival_turn;
    w.duration = w.end_turn - w.start_turn + 1;
    return w;
}

bool armada_movement_create_returning(const Armada_FleetComposition *survivors,
                                      const Armada_FleetMovement *original,
                                      int32_t current_turn,
                                      Armada_FleetMovement *out) {
    ARMADA_VALIDATE_PTRS3_RET(survivors, original, out, false);
    if (armada_composition_is_empty(survivors)) {
        return false;
    }

    Armada_FleetMovement leg = *original;
    leg.composition = *survivors;
    leg.return_turn = current_turn + ARMADA_RETURN_LEG_TURNS;
    if (leg.return_turn <= leg.arrival_turn) {
        leg.return_turn = leg.arrival_turn + ARMADA_RETURN_LEG_TURNS;
    }

    *out = leg;
    return true;
}

bool armada_movement_process(const Armada_FleetMovement *movements,
                             int count,
                             int32_t current_turn,
                             Armada_MovementBuckets *out) {
    ARMADA_VALIDATE_PTR_RET(out, false);
    memset(out, 0, sizeof(*out));

    if (count == 0) return true;
    ARMADA_VALIDATE_PTR_RET(movements, false);
    ARMADA_VALIDATE_RANGE_RET(count, 0, ARMADA_MAX_MOVEMENTS, false);

    for (int i = 0; i < count; i++) {
        if (!armada_movement_validate(&movements[i])) {
            char reason[256];
            snprintf(reason, sizeof(reason), "%s", armada_get_last_error());
            armada_set_error("Movement %d rejected: %s", i, reason);
            memset(out, 0, sizeof(*out));
            return false;
        }
    }

    for (int i = 0; i < count; i++) {
        const Armada_FleetMovement *m = &movements[i];
        switch (armada_movement_phase(m, current_turn)) {
            case ARMADA_PHASE_OUTBOUND:
                out->advancing[out->advancing_count++] = *m;
                break;
            case ARMADA_PHASE_COMBAT:
                out->combat[out->combat_count++] = *m;
                break;
            case ARMADA_PHASE_RETURNING:
                out->returning[out->returning_count++] = *m;
                break;
        }
    }
    return true;
}

/*============================================================================
 * Fleet
 *============================================================================*/

void armada_fleet_init(Armada_Fleet *fleet) {
    if (!fleet) return;
    memset(fleet, 0, sizeof(*fleet));
}

bool armada_fleet_add_movement(Armada_Fleet *fleet, const Armada_FleetMovement *move) {
    ARMADA_VALIDATE_PTRS2_RET(fleet, move, false);

    ARMADA_VALIDATE_COND_RET(fleet->movement_count < ARMADA_MAX_MOVEMENTS,
                             "fleet has no free movement slot", false);
    if (!armada_movement_validate(move)) {
        return false;
    }

    fleet->movements[fleet->movement_count++] = *move;
    return true;
}

bool armada_fleet_remove_movement(Armada_Fleet *fleet, int index) {
    ARMADA_VALIDATE_PTR_RET(fleet, false);
    ARMADA_VALIDATE_INDEX_RET(index, fleet->movement_count, false);

    for (int i = index; i < fleet->movement_count - 1; i++) {
        fleet->movements[i] = fleet->movements[i + 1];
    }
    fleet->movement_count--;
    memset(&fleet->movements[fleet->movement_count], 0, sizeof(Armada_FleetMovement));
    return true;
}

bool armada_fleet_launch(Armada_Fleet *fleet,
                         const Armada_FleetComposition *comp,
                         const char *target,
                         int32_t current_turn) {
    ARMADA_VALIDATE_PTRS2_RET(fleet, comp, false);

    if (!armada_composition_contains(&fleet->home, comp)) {
        armada_set_error("Home fleet cannot cover launch: %d/%d/%d requested, %d/%d/%d at home",
                         (int)comp->frigates, (int)comp->cruisers, (int)comp->battleships,
                         (int)fleet->home.frigates, (int)fleet->home.cruisers,
                         (int)fleet->home.battleships);
        return false;
    }
    ARMADA_VALIDATE_COND_RET(fleet->movement_count < ARMADA_MAX_MOVEMENTS,
                             "fleet has no free movement slot", false);

    Armada_FleetMovement move;
    if (!armada_movement_create(comp, target, current_turn, &move)) {
        return false;
    }

    fleet->home = armada_composition_subtract(&fleet->home, comp);
    fleet->movements[fleet->movement_count++] = move;
    ARMADA_WARN_IF(armada_composition_is_empty(&fleet->home), ARMADA_LOG_FLEET,
                   "home system left without defenders");

    armada_log_debug(ARMADA_LOG_FLEET, "Launched %d ships at %s, arriving turn %d",
                     (int)armada_composition_total(comp), move.target, (int)move.arrival_turn);
    return true;
}

bool armada_fleet_recall(Armada_Fleet *fleet, int index, int32_t current_turn) {
    ARMADA_VALIDATE_PTR_RET(fleet, false);
    ARMADA_VALIDATE_INDEX_RET(index, fleet->movement_count, false);

    const Armada_FleetMovement *move = &fleet->movements[index];
    if (!armada_movement_can_recall(move, current_turn)) {
        armada_set_error("Movement to %s has already departed (turn %d, arrival %d)",
                         move->target, (int)current_turn, (int)move->arrival_turn);
        return false;
    }

    fleet->home = armada_composition_add(&fleet->home, &move->composition);
    return armada_fleet_remove_movement(fleet, index);
}

int armada_fleet_merge_returning(Armada_Fleet *fleet, int32_t current_turn) {
    if (!fleet) return 0;

    int merged = 0;
    int i = 0;
    while (i < fleet->movement_count) {
        const Armada_FleetMovement *move = &fleet->movements[i];
        if (armada_movement_phase(move, current_turn) == ARMADA_PHASE_RETURNING) {
            fleet->home = armada_composition_add(&fleet->home, &move->composition);
            armada_fleet_remove_movement(fleet, i);
            merged++;
        } else {
            i++;
        }
    }
    return merged;
}

bool armada_fleet_is_vulnerable(const Armada_Fleet *fleet, int32_t current_turn) {
    if (!fleet) return false;
    for (int i = 0; i < fleet->movement_count; i++) {
        if (armada_movement_in_transit(&fleet->movements[i], current_turn)) {
            return true;
        }
    }
    return false;
}

Armada_FleetComposition armada_fleet_visible(const Armada_Fleet *fleet) {
    Armada_FleetComposition none = {};
    return fleet ? fleet->home : none;
}

int32_t armada_fleet_total_ships(const Armada_Fleet *fleet) {
    if (!fleet) return 0;
    int32_t total = armada_composition_total(&fleet->home);
    for (int i = 0; i < fleet->movement_count; i++) {
        total += armada_composition_total(&fleet->movements[i].composition);
    }
    return total;
}

bool armada_fleet_is_eliminated(const Armada_Fleet *fleet) {
    return armada_fleet_total_ships(fleet) == 0;
}
