/*
 * Armada Economy Lookups
 */

#include "armada/economy.h"
#include "armada/game_state.h"
#include "armada/log.h"
#include "armada/validate.h"

#include <string.h>

/*============================================================================
 * Cost Tables
 *============================================================================*/

typedef struct {
    const char *name;
    Armada_Cost cost;
} BuildableInfo;

static const BuildableInfo g_buildables[ARMADA_BUILDABLE_COUNT] = {
    { "frigate",    { 4, 2 } },
    { "cruiser",    { 10, 6 } },
    { "battleship", { 20, 12 } },
    { "reactor",    { 900, 1200 } },
    { "mine",       { 1500, 600 } },
};

static const struct {
    const char *name;
    int32_t energy;
} g_scans[ARMADA_SCAN_TYPE_COUNT] = {
    { "basic",    1000 },
    { "deep",     2500 },
    { "advanced", 4000 },
};

static bool valid_buildable(Armada_Buildable type) {
    return (int)type >= 0 && type < ARMADA_BUILDABLE_COUNT;
}

Armada_Cost armada_buildable_cost(Armada_Buildable type) {
    Armada_UnitType unit;
    if (armada_buildable_to_unit(type, &unit)) {
        /* Ships are priced by the unit table */
        return armada_unit_build_cost(unit);
    }
    Armada_Cost none = { 0, 0 };
    return valid_buildable(type) ? g_buildables[type].cost : none;
}

bool armada_buildable_is_unit(Armada_Buildable type) {
    return type == ARMADA_BUILD_FRIGATE ||
           type == ARMADA_BUILD_CRUISER ||
           type == ARMADA_BUILD_BATTLESHIP;
}

bool armada_buildable_is_structure(Armada_Buildable type) {
    return type == ARMADA_BUILD_REACTOR || type == ARMADA_BUILD_MINE;
}

bool armada_buildable_to_unit(Armada_Buildable type, Armada_UnitType *out_unit) {
    Armada_UnitType unit;
    switch (type) {
        case ARMADA_BUILD_FRIGATE:    unit = ARMADA_UNIT_FRIGATE; break;
        case ARMADA_BUILD_CRUISER:    unit = ARMADA_UNIT_CRUISER; break;
        case ARMADA_BUILD_BATTLESHIP: unit = ARMADA_UNIT_BATTLESHIP; break;
        default: return false;
    }
    if (out_unit) *out_unit = unit;
    return true;
}

Armada_Buildable armada_buildable_from_unit(Armada_UnitType unit) {
    switch (unit) {
        case ARMADA_UNIT_CRUISER:    return ARMADA_BUILD_CRUISER;
        case ARMADA_UNIT_BATTLESHIP: return ARMADA_BUILD_BATTLESHIP;
        case ARMADA_UNIT_FRIGATE:
        default:                     return ARMADA_BUILD_FRIGATE;
    }
}

const char *armada_buildable_name(Armada_Buildable type) {
    return valid_buildable(type) ? g_buildables[type].name : "unknown";
}

int32_t armada_scan_cost(Armada_ScanType type) {
    if ((int)type < 0 || type >= ARMADA_SCAN_TYPE_COUNT) return 0;
    return g_scans[type].energy;
}

const char *armada_scan_type_name(Armada_ScanType type) {
    if ((int)type < 0 || type >= ARMADA_SCAN_TYPE_COUNT) return "unknown";
    return g_scans[type].name;
}

/*============================================================================
 * Game State
 *============================================================================*/

void armada_player_state_init(Armada_PlayerState *side) {
    if (!side) return;
    memset(side, 0, sizeof(*side));
    side->resources.metal_income = ARMADA_BASE_METAL_INCOME;
    side->resources.energy_income = ARMADA_BASE_ENERGY_INCOME;
    side->intelligence.scan_accuracy = ARMADA_DEFAULT_SCAN_ACCURACY;
}

void armada_game_state_init(Armada_GameState *game) {
    if (!game) return;
    memset(game, 0, sizeof(*game));
    game->turn = 1;
    armada_player_state_init(&game->player);
    armada_player_state_init(&game->ai);
}

/*============================================================================
 * Intelligence
 *============================================================================*/

Armada_FleetComposition armada_intelligence_report(const Armada_PlayerState *scanner,
                                                   const Armada_PlayerState *target) {
    Armada_FleetComposition none = {};
    ARMADA_VALIDATE_PTRS2_RET(scanner, target, none);

    Armada_FleetComposition seen = armada_fleet_visible(&target->fleet);
    if (target->intelligence.misinformation_active) {
        seen = armada_composition_scaled(&seen, scanner->intelligence.scan_accuracy);
    }
    return seen;
}

bool armada_intelligence_record_scan(Armada_PlayerState *scanner,
                                     const Armada_PlayerState *target,
                                     int32_t turn) {
    ARMADA_VALIDATE_PTRS2_RET(scanner, target, false);

    scanner->intelligence.last_scan_turn = turn;
    scanner->intelligence.known_enemy_fleet = armada_intelligence_report(scanner, target);
    if (target->intelligence.misinformation_active) {
        armada_log_debug(ARMADA_LOG_GAME, "Scan on turn %d fed misinformation", (int)turn);
    }
    return true;
}

int32_t armada_resources_income(const Armada_Resources *res) {
    if (!res) return 0;
    return res->metal_income + res->energy_income;
}
