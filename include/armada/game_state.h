#ifndef ARMADA_GAME_STATE_H
#define ARMADA_GAME_STATE_H

#include "armada/fleet.h"

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada Game State
 *
 * The canonical two-sided state the orchestrator owns and hands to the
 * simulation core every turn. Plain data plus init and scan reporting.
 */

#define ARMADA_DEFAULT_SCAN_ACCURACY 0.7f

typedef struct Armada_Resources {
    int32_t metal;
    int32_t energy;
    int32_t metal_income;
    int32_t energy_income;
} Armada_Resources;

typedef struct Armada_Economy {
    int32_t reactors;
    int32_t mines;
} Armada_Economy;

typedef struct Armada_Intelligence {
    int32_t last_scan_turn;                     /* 0 = never scanned */
    Armada_FleetComposition known_enemy_fleet;
    float scan_accuracy;                        /* Fraction seen through misinformation */
    bool misinformation_active;                 /* Last applied decision was a feint */
} Armada_Intelligence;

typedef struct Armada_PlayerState {
    Armada_Resources resources;
    Armada_Fleet fleet;
    Armada_Economy economy;
    Armada_Intelligence intelligence;
} Armada_PlayerState;

typedef struct Armada_GameState {
    int32_t turn;               /* Starts at 1 */
    Armada_PlayerState player;
    Armada_PlayerState ai;
} Armada_GameState;

/**
 * Zero a side and give it base income and default scan accuracy.
 */
void armada_player_state_init(Armada_PlayerState *side);

/**
 * Turn 1 with both sides initialized.
 */
void armada_game_state_init(Armada_GameState *game);

/**
 * What `scanner` learns from scanning `target`: the target's visible home
 * fleet, scaled down by the scanner's scan_accuracy while the target has
 * misinformation active.
 */
Armada_FleetComposition armada_intelligence_report(const Armada_PlayerState *scanner,
                                                   const Armada_PlayerState *target);

/**
 * Store a scan result on `scanner`. Returns false on NULL arguments.
 */
bool armada_intelligence_record_scan(Armada_PlayerState *scanner,
                                     const Armada_PlayerState *target,
                                     int32_t turn);

/**
 * Total income (metal + energy)
 */
int32_t armada_resources_income(const Armada_Resources *res);

#endif /* ARMADA_GAME_STATE_H */
