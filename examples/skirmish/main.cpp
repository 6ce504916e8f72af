/**
 * Skirmish Example
 *
 * Headless AI-vs-AI match driving the Armada simulation core:
 * - Income and upkeep tick at the start of every turn
 * - Each side's engine picks one decision (build, attack, scan or wait)
 * - Raids that reach their target fight the defender's home fleet
 * - Survivors fly home and merge back the turn after combat
 * - The match ends when a side has lost every ship or the turn limit hits
 *
 * Usage:
 *   skirmish [player_archetype] [ai_archetype] [seed] [turns] [config.toml]
 *
 * Example:
 *   skirmish trickster hybrid 1234 60 data/ai.toml
 */

#include "armada/armada.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define DEFAULT_TURNS 50

typedef struct Side {
    const char *label;
    Armada_AIEngine *engine;
    int32_t wins;           /* Raids that routed the defender */
    int32_t losses;         /* Raids routed by the defender */
    bool had_ships;
} Side;

/* The engine always plays the `ai` half of the game state */
static void mirror_state(const Armada_GameState *game, Armada_GameState *out) {
    out->turn = game->turn;
    out->player = game->ai;
    out->ai = game->player;
}

/*============================================================================
 * Turn Phases
 *============================================================================*/

static void tick_income(Armada_PlayerState *side) {
    Armada_Resources *res = &side->resources;

    Armada_FleetComposition all = side->fleet.home;
    for (int i = 0; i < side->fleet.movement_count; i++) {
        all = armada_composition_add(&all, &side->fleet.movements[i].composition);
    }
    Armada_Cost upkeep = armada_composition_upkeep(&all);

    int64_t metal = (int64_t)res->metal + res->metal_income - upkeep.metal;
    int64_t energy = (int64_t)res->energy + res->energy_income - upkeep.energy;
    res->metal = metal > 0 ? (int32_t)metal : 0;
    res->energy = energy > 0 ? (int32_t)energy : 0;
}

static bool apply_build(Armada_PlayerState *side, const Armada_BuildOrder *order) {
    if (!armada_ai_can_afford(&side->resources, order->item, order->quantity)) {
        armada_set_error("Cannot afford %d %s", (int)order->quantity,
                         armada_buildable_name(order->item));
        return false;
    }

    Armada_Cost cost = armada_buildable_cost(order->item);
    side->resources.metal -= cost.metal * order->quantity;
    side->resources.energy -= cost.energy * order->quantity;

    Armada_UnitType unit;
    if (armada_buildable_to_unit(order->item, &unit)) {
        int32_t count = armada_composition_get(&side->fleet.home, unit);
        armada_composition_set(&side->fleet.home, unit, count + order->quantity);
    } else if (order->item == ARMADA_BUILD_REACTOR) {
        side->economy.reactors += order->quantity;
        side->resources.energy_income += ARMADA_STRUCTURE_INCOME * order->quantity;
    } else if (order->item == ARMADA_BUILD_MINE) {
        side->economy.mines += order->quantity;
        side->resources.metal_income += ARMADA_STRUCTURE_INCOME * order->quantity;
    }
    return true;
}

static bool apply_scan(Armada_PlayerState *side, const Armada_PlayerState *enemy,
                       const Armada_ScanOrder *order, int32_t turn) {
    int32_t cost = armada_scan_cost(order->scan_type);
    if (cost <= 0 || side->resources.energy < cost) {
        armada_set_error("Cannot afford %s scan", armada_scan_type_name(order->scan_type));
        return false;
    }

    side->resources.energy -= cost;
    return armada_intelligence_record_scan(side, enemy, turn);
}

static bool apply_decision(Armada_PlayerState *side, const Armada_PlayerState *enemy,
                           const Armada_Decision *d, int32_t turn) {
    bool ok = true;
    switch (d->type) {
        case ARMADA_DECISION_BUILD:
            ok = apply_build(side, &d->build);
            break;
        case ARMADA_DECISION_ATTACK:
            ok = armada_fleet_launch(&side->fleet, &d->attack.fleet, d->attack.target, turn);
            break;
        case ARMADA_DECISION_SCAN:
            ok = apply_scan(side, enemy, &d->scan, turn);
            break;
        case ARMADA_DECISION_WAIT:
        default:
            break;
    }
    /* A feint clouds enemy scans until this side's next plain decision */
    if (ok) {
        side->intelligence.misinformation_active = d->deceptive;
    }
    return ok;
}

/**
 * Fight every raid of `attacker` that arrives this turn and replace it
 * with its return leg.
 */
static bool resolve_raids(Side *side, Armada_PlayerState *attacker, Armada_PlayerState *defender,
                          int32_t turn, Armada_Rng *rng) {
    Armada_MovementBuckets buckets;
    if (!armada_movement_process(attacker->fleet.movements, attacker->fleet.movement_count,
                                 turn, &buckets)) {
        return false;
    }
    if (buckets.combat_count == 0) return true;

    int i = 0;
    while (i < attacker->fleet.movement_count) {
        Armada_FleetMovement move = attacker->fleet.movements[i];
        if (armada_movement_phase(&move, turn) != ARMADA_PHASE_COMBAT) {
            i++;
            continue;
        }

        Armada_MovementCombat mc;
        if (!armada_combat_process_movement(&move, &defender->fleet.home, turn, NULL, rng, &mc)) {
            return false;
        }
        defender->fleet.home = mc.defender_home;

        if (mc.result.outcome == ARMADA_COMBAT_DECISIVE_ATTACKER) side->wins++;
        if (mc.result.outcome == ARMADA_COMBAT_DECISIVE_DEFENDER) side->losses++;

        printf("  %s raid: %s, ratio %.2f, lost %d, destroyed %d\n",
               side->label, armada_combat_outcome_name(mc.result.outcome),
               mc.result.strength_ratio,
               (int)armada_composition_total(&mc.result.attacker_casualties),
               (int)armada_composition_total(&mc.result.defender_casualties));

        armada_fleet_remove_movement(&attacker->fleet, i);
        if (mc.has_returning) {
            if (!armada_fleet_add_movement(&attacker->fleet, &mc.returning)) {
                return false;
            }
        }
        /* Removal shifted the list; the appended return leg is not in combat */
    }
    return true;
}

static void print_side(const char *label, const Armada_PlayerState *side) {
    const Armada_FleetComposition *home = &side->fleet.home;
    printf("  %-6s metal %7d energy %7d income %6d  home F%-4d C%-4d B%-4d  raids %d\n",
           label, (int)side->resources.metal, (int)side->resources.energy,
           (int)armada_resources_income(&side->resources),
           (int)home->frigates, (int)home->cruisers, (int)home->battleships,
           side->fleet.movement_count);
}

/*============================================================================
 * Main
 *============================================================================*/

int main(int argc, char *argv[]) {
    const char *player_name = argc > 1 ? argv[1] : "aggressor";
    const char *ai_name = argc > 2 ? argv[2] : "hybrid";
    uint32_t seed = argc > 3 ? (uint32_t)strtoul(argv[3], NULL, 10) : 0;
    int turns = argc > 4 ? atoi(argv[4]) : DEFAULT_TURNS;
    const char *config_path = argc > 5 ? argv[5] : NULL;

    if (turns <= 0) {
        fprintf(stderr, "Turn limit must be positive: %s\n", argv[4]);
        return 1;
    }

    if (!armada_log_init()) {
        fprintf(stderr, "Warning: file logging unavailable: %s\n", armada_get_last_error());
    }
    armada_log_set_console_output(false);

    Armada_AIConfig config;
    armada_ai_config_default(&config);
    if (config_path && !armada_ai_config_load_file(&config, config_path)) {
        fprintf(stderr, "Failed to load %s: %s\n", config_path, armada_get_last_error());
        armada_log_shutdown();
        return 1;
    }

    Armada_Rng rng;
    armada_rng_seed(&rng, seed);

    Armada_ErrorLog *errors = armada_error_log_create(0);
    if (!errors) {
        fprintf(stderr, "Failed to create error log\n");
        armada_log_shutdown();
        return 1;
    }

    Side player = { "player", NULL, 0, 0, false };
    Side ai = { "ai", NULL, 0, 0, false };
    player.engine = armada_ai_engine_create_by_name(player_name, &config, &rng);
    ai.engine = armada_ai_engine_create_by_name(ai_name, &config, &rng);
    if (!player.engine || !ai.engine) {
        fprintf(stderr, "Failed to create engines: %s\n", armada_get_last_error());
        armada_ai_engine_destroy(player.engine);
        armada_ai_engine_destroy(ai.engine);
        armada_error_log_destroy(errors);
        armada_log_shutdown();
        return 1;
    }
    armada_ai_engine_set_error_log(player.engine, errors);
    armada_ai_engine_set_error_log(ai.engine, errors);

    Armada_GameState game;
    armada_game_state_init(&game);

    printf("Skirmish: %s (player) vs %s (ai), %d turns\n", player_name, ai_name, turns);
    armada_log_info(ARMADA_LOG_GAME, "Skirmish %s vs %s, %d turns", player_name, ai_name, turns);

    const char *winner = NULL;
    int exit_code = 0;

    for (; game.turn <= turns; game.turn++) {
        armada_log_set_turn(game.turn);

        tick_income(&game.player);
        tick_income(&game.ai);

        /* Returns from last turn's raids land before anything else happens */
        armada_fleet_merge_returning(&game.player.fleet, game.turn);
        armada_fleet_merge_returning(&game.ai.fleet, game.turn);

        /* Both sides decide on the same snapshot */
        Armada_GameState mirrored;
        mirror_state(&game, &mirrored);

        Armada_Decision player_decision;
        Armada_Decision ai_decision;
        bool player_ok = armada_ai_engine_process_turn(player.engine, &mirrored, &player_decision);
        bool ai_ok = armada_ai_engine_process_turn(ai.engine, &game, &ai_decision);

        Armada_PlayerState player_before = game.player;
        if (player_ok && !apply_decision(&game.player, &game.ai, &player_decision, game.turn)) {
            armada_error_log_report(errors, ARMADA_ERROR_USER_INPUT, ARMADA_SEVERITY_MEDIUM,
                                    game.turn, "Player decision rejected: %s",
                                    armada_get_last_error());
        }
        if (ai_ok && !apply_decision(&game.ai, &player_before, &ai_decision, game.turn)) {
            armada_error_log_report(errors, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_MEDIUM,
                                    game.turn, "AI decision rejected: %s",
                                    armada_get_last_error());
        }
        if (!player_ok || !ai_ok) {
            /* Engine defects are already in the error log */
            armada_log_and_clear_error();
        }

        printf("Turn %3d: player %-6s | ai %-6s\n", game.turn,
               player_ok ? armada_decision_type_name(player_decision.type) : "error",
               ai_ok ? armada_decision_type_name(ai_decision.type) : "error");

        if (!resolve_raids(&player, &game.player, &game.ai, game.turn, &rng) ||
            !resolve_raids(&ai, &game.ai, &game.player, game.turn, &rng)) {
            Armada_ErrorResponse response = armada_error_log_report(
                errors, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_CRITICAL, game.turn,
                "Combat resolution failed: %s", armada_get_last_error());
            fprintf(stderr, "%s\n", response.user_message);
            exit_code = 1;
            break;
        }

        if (armada_fleet_total_ships(&game.player.fleet) > 0) player.had_ships = true;
        if (armada_fleet_total_ships(&game.ai.fleet) > 0) ai.had_ships = true;

        bool player_out = player.had_ships && armada_fleet_is_eliminated(&game.player.fleet);
        bool ai_out = ai.had_ships && armada_fleet_is_eliminated(&game.ai.fleet);
        if (player_out || ai_out) {
            if (player_out && !ai_out) winner = ai_name;
            else if (ai_out && !player_out) winner = player_name;
            break;
        }
    }

    printf("\nFinal state after turn %d:\n", game.turn > turns ? turns : game.turn);
    print_side("player", &game.player);
    print_side("ai", &game.ai);
    printf("  Raids won: player %d, ai %d. Raids repelled: player %d, ai %d\n",
           player.wins, ai.wins, ai.losses, player.losses);
    printf("  Winner: %s\n", winner ? winner : "none");

    size_t error_count = armada_error_log_count(errors);
    if (error_count > 0) {
        printf("  %zu errors recorded, latest: %s\n", error_count,
               armada_error_log_latest(errors)->message);
    }

    armada_ai_engine_destroy(player.engine);
    armada_ai_engine_destroy(ai.engine);
    armada_error_log_destroy(errors);
    armada_log_shutdown();
    return exit_code;
}
