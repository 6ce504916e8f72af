/**
 * Armada AI - Shared Heuristics
 *
 * Decision constructors, fleet value, threat and economic assessment,
 * affordability checks, decision validation and the single dispatch
 * point over the archetype union.
 */

#include "armada/armada.h"
#include "armada/ai.h"
#include "armada/error.h"
#include "armada/validate.h"
#include "ai_internal.h"

#include <stdio.h>
#include <string.h>

/*============================================================================
 * Decisions
 *============================================================================*/

Armada_Decision armada_decision_wait(const char *reasoning) {
    Armada_Decision d;
    memset(&d, 0, sizeof(d));
    d.type = ARMADA_DECISION_WAIT;
    d.reasoning = reasoning;
    return d;
}

Armada_Decision armada_decision_build(Armada_Buildable item, int32_t quantity, const char *reasoning) {
    Armada_Decision d = armada_decision_wait(reasoning);
    d.type = ARMADA_DECISION_BUILD;
    d.build.item = item;
    d.build.quantity = quantity;
    return d;
}

Armada_Decision armada_decision_attack(const char *target,
                                       const Armada_FleetComposition *fleet,
                                       const char *reasoning) {
    Armada_Decision d = armada_decision_wait(reasoning);
    d.type = ARMADA_DECISION_ATTACK;
    snprintf(d.attack.target, sizeof(d.attack.target), "%s", target ? target : "");
    if (fleet) {
        d.attack.fleet = *fleet;
    }
    return d;
}

Armada_Decision armada_decision_scan(Armada_ScanType scan_type, const char *reasoning) {
    Armada_Decision d = armada_decision_wait(reasoning);
    d.type = ARMADA_DECISION_SCAN;
    d.scan.scan_type = scan_type;
    return d;
}

bool armada_decision_equals(const Armada_Decision *a, const Armada_Decision *b) {
    if (!a || !b) return false;
    if (a->type != b->type) return false;

    switch (a->type) {
        case ARMADA_DECISION_BUILD:
            return a->build.item == b->build.item && a->build.quantity == b->build.quantity;
        case ARMADA_DECISION_ATTACK:
            return strcmp(a->attack.target, b->attack.target) == 0 &&
                   a->attack.fleet.frigates == b->attack.fleet.frigates &&
                   a->attack.fleet.cruisers == b->attack.fleet.cruisers &&
                   a->attack.fleet.battleships == b->attack.fleet.battleships;
        case ARMADA_DECISION_SCAN:
            return a->scan.scan_type == b->scan.scan_type;
        case ARMADA_DECISION_WAIT:
        default:
            return true;
    }
}

const char *armada_decision_type_name(Armada_DecisionType type) {
    switch (type) {
        case ARMADA_DECISION_WAIT:   return "wait";
        case ARMADA_DECISION_BUILD:  return "build";
        case ARMADA_DECISION_ATTACK: return "attack";
        case ARMADA_DECISION_SCAN:   return "scan";
        default:                     return "unknown";
    }
}

/*============================================================================
 * Assessment
 *============================================================================*/

float armada_ai_fleet_value(const Armada_FleetComposition *fleet) {
    if (!fleet) return 0.0f;
    return (float)fleet->frigates * ARMADA_AI_FRIGATE_VALUE +
           (float)fleet->cruisers * ARMADA_AI_CRUISER_VALUE +
           (float)fleet->battleships * ARMADA_AI_BATTLESHIP_VALUE;
}

float armada_ai_threat_level(const Armada_FleetComposition *own,
                             const Armada_FleetComposition *enemy) {
    float own_value = armada_ai_fleet_value(own);
    if (own_value <= 0.0f) return 1.0f;

    float threat = armada_ai_fleet_value(enemy) / own_value - 0.5f;
    if (threat < 0.0f) return 0.0f;
    if (threat > 1.0f) return 1.0f;
    return threat;
}

float armada_ai_economic_advantage(const Armada_Resources *own,
                                   const Armada_Resources *enemy) {
    int64_t own_income = armada_resources_income(own);
    int64_t enemy_income = armada_resources_income(enemy);
    int64_t sum = own_income + enemy_income;
    if (sum == 0) return 0.0f;
    return (float)((double)(own_income - enemy_income) / (double)sum);
}

/*============================================================================
 * Affordability
 *============================================================================*/

bool armada_ai_can_afford(const Armada_Resources *res, Armada_Buildable item, int32_t quantity) {
    if (!res || quantity <= 0) return false;
    if ((int)item < 0 || item >= ARMADA_BUILDABLE_COUNT) return false;

    Armada_Cost cost = armada_buildable_cost(item);
    return (int64_t)res->metal >= (int64_t)cost.metal * quantity &&
           (int64_t)res->energy >= (int64_t)cost.energy * quantity;
}

int32_t armada_ai_affordable_quantity(const Armada_Resources *res, Armada_Buildable item) {
    if (!res) return 0;
    if ((int)item < 0 || item >= ARMADA_BUILDABLE_COUNT) return 0;

    Armada_Cost cost = armada_buildable_cost(item);
    int64_t n = ARMADA_MAX_UNITS_PER_TYPE;
    if (cost.metal > 0) {
        int64_t by_metal = res->metal > 0 ? res->metal / cost.metal : 0;
        if (by_metal < n) n = by_metal;
    }
    if (cost.energy > 0) {
        int64_t by_energy = res->energy > 0 ? res->energy / cost.energy : 0;
        if (by_energy < n) n = by_energy;
    }
    return (int32_t)n;
}

bool armada_ai_can_afford_scan(const Armada_Resources *res, Armada_ScanType scan_type) {
    if (!res) return false;
    int32_t cost = armada_scan_cost(scan_type);
    return cost > 0 && res->energy >= cost;
}

bool armada_ai_has_available_fleet(const Armada_FleetComposition *home,
                                   const Armada_FleetComposition *wanted) {
    return armada_composition_contains(home, wanted);
}

/*============================================================================
 * Unit Matchups
 *============================================================================*/

Armada_UnitType armada_ai_dominant_unit(const Armada_FleetComposition *fleet) {
    if (!fleet) return ARMADA_UNIT_FRIGATE;
    if (fleet->frigates >= fleet->cruisers && fleet->frigates >= fleet->battleships) {
        return ARMADA_UNIT_FRIGATE;
    }
    if (fleet->cruisers >= fleet->battleships) {
        return ARMADA_UNIT_CRUISER;
    }
    return ARMADA_UNIT_BATTLESHIP;
}

Armada_UnitType armada_ai_counter_unit(Armada_UnitType type) {
    switch (type) {
        case ARMADA_UNIT_FRIGATE:    return ARMADA_UNIT_BATTLESHIP;
        case ARMADA_UNIT_CRUISER:    return ARMADA_UNIT_FRIGATE;
        case ARMADA_UNIT_BATTLESHIP: return ARMADA_UNIT_CRUISER;
        default:                     return ARMADA_UNIT_FRIGATE;
    }
}

/*============================================================================
 * Validation
 *============================================================================*/

bool armada_ai_validate_decision(const Armada_Decision *decision, const Armada_PlayerState *self) {
    ARMADA_VALIDATE_PTRS2_RET(decision, self, false);

    switch (decision->type) {
        case ARMADA_DECISION_WAIT:
            return true;

        case ARMADA_DECISION_BUILD: {
            const Armada_BuildOrder *b = &decision->build;
            if ((int)b->item < 0 || b->item >= ARMADA_BUILDABLE_COUNT) {
                armada_set_error("Build decision names unknown item %d", (int)b->item);
                return false;
            }
            ARMADA_VALIDATE_POSITIVE_RET(b->quantity, false);
            if (!armada_ai_can_afford(&self->resources, b->item, b->quantity)) {
                Armada_Cost cost = armada_buildable_cost(b->item);
                armada_set_error("Cannot afford %d %s: need %lld metal, %lld energy, have %d, %d",
                                 (int)b->quantity, armada_buildable_name(b->item),
                                 (long long)cost.metal * b->quantity,
                                 (long long)cost.energy * b->quantity,
                                 (int)self->resources.metal, (int)self->resources.energy);
                return false;
            }
            return true;
        }

        case ARMADA_DECISION_ATTACK: {
            const Armada_AttackOrder *a = &decision->attack;
            ARMADA_VALIDATE_COND_RET(a->target[0] != '\0', "attack decision has no target", false);
            if (!armada_composition_validate(&a->fleet)) {
                return false;
            }
            if (armada_composition_is_empty(&a->fleet)) {
                armada_set_error("Attack decision commits no ships");
                return false;
            }
            if (!armada_ai_has_available_fleet(&self->fleet.home, &a->fleet)) {
                armada_set_error("Attack fleet %d/%d/%d exceeds home fleet %d/%d/%d",
                                 (int)a->fleet.frigates, (int)a->fleet.cruisers,
                                 (int)a->fleet.battleships,
                                 (int)self->fleet.home.frigates, (int)self->fleet.home.cruisers,
                                 (int)self->fleet.home.battleships);
                return false;
            }
            return true;
        }

        case ARMADA_DECISION_SCAN:
            if ((int)decision->scan.scan_type < 0 ||
                decision->scan.scan_type >= ARMADA_SCAN_TYPE_COUNT) {
                armada_set_error("Scan decision names unknown scan type %d",
                                 (int)decision->scan.scan_type);
                return false;
            }
            if (!armada_ai_can_afford_scan(&self->resources, decision->scan.scan_type)) {
                armada_set_error("Cannot afford %s scan: need %d energy, have %d",
                                 armada_scan_type_name(decision->scan.scan_type),
                                 (int)armada_scan_cost(decision->scan.scan_type),
                                 (int)self->resources.energy);
                return false;
            }
            return true;

        default:
            armada_set_error("Unknown decision type %d", (int)decision->type);
            return false;
    }
}

/*============================================================================
 * Shared Decision Helpers
 *============================================================================*/

int32_t ai_home_total(const Armada_AIState *state) {
    return armada_composition_total(&state->self.fleet.home);
}

Armada_Decision ai_build_up_to(const Armada_AIState *state,
                               Armada_Buildable item,
                               int32_t wanted,
                               const char *reasoning) {
    int32_t affordable = armada_ai_affordable_quantity(&state->self.resources, item);
    int32_t quantity = wanted < affordable ? wanted : affordable;
    if (quantity <= 0) {
        return armada_decision_wait("Nothing affordable");
    }
    return armada_decision_build(item, quantity, reasoning);
}

bool ai_plan_attack(const Armada_AIState *state,
                    float fraction,
                    const char *reasoning,
                    Armada_Decision *out) {
    const Armada_FleetComposition *home = &state->self.fleet.home;
    Armada_FleetComposition strike = armada_composition_scaled(home, fraction);

    /* Flooring small stacks can leave nothing to send */
    if (armada_composition_is_empty(&strike)) return false;
    if (!armada_ai_has_available_fleet(home, &strike)) return false;

    *out = armada_decision_attack(ARMADA_AI_ENEMY_TARGET, &strike, reasoning);
    return true;
}

Armada_UnitType ai_random_unit(Armada_Rng *rng) {
    return (Armada_UnitType)armada_rng_int(rng, 0, ARMADA_UNIT_TYPE_COUNT - 1);
}

/*============================================================================
 * State and Dispatch
 *============================================================================*/

bool armada_ai_state_init(Armada_AIState *state,
                          Armada_Archetype archetype,
                          const Armada_AIConfig *config,
                          Armada_Rng *rng) {
    ARMADA_VALIDATE_PTRS2_RET(state, rng, false);
    ARMADA_VALIDATE_RANGE_RET((int)archetype, 0, ARMADA_ARCHETYPE_COUNT - 1, false);

    Armada_AIConfig defaults;
    if (!config) {
        armada_ai_config_default(&defaults);
        config = &defaults;
    } else if (!armada_ai_config_validate(config)) {
        return false;
    }

    memset(state, 0, sizeof(*state));
    state->archetype = archetype;
    state->probabilities = config->probabilities[archetype];
    armada_player_state_init(&state->self);
    state->last_decision = armada_decision_wait(NULL);

    switch (archetype) {
        case ARMADA_ARCHETYPE_TRICKSTER:
            ai_trickster_init(&state->internal.trickster, &config->trickster);
            break;
        case ARMADA_ARCHETYPE_HYBRID:
            ai_hybrid_init(&state->internal.hybrid, &config->hybrid, rng);
            break;
        case ARMADA_ARCHETYPE_AGGRESSOR:
        case ARMADA_ARCHETYPE_ECONOMIST:
        default:
            break;
    }
    return true;
}

void armada_ai_refresh(Armada_AIState *state, const Armada_GameState *game) {
    if (!state || !game) return;

    state->self = game->ai;
    state->threat_level = armada_ai_threat_level(&game->ai.fleet.home, &game->player.fleet.home);
    state->economic_advantage = armada_ai_economic_advantage(&game->ai.resources,
                                                             &game->player.resources);
}

Armada_Decision armada_ai_make_decision(Armada_AIState *state,
                                        const Armada_GameState *game,
                                        Armada_Rng *rng) {
    if (!state || !game || !rng) {
        armada_set_error("armada_ai_make_decision: null argument");
        return armada_decision_wait("Invalid arguments");
    }

    switch (state->archetype) {
        case ARMADA_ARCHETYPE_AGGRESSOR: return ai_aggressor_decide(state, game, rng);
        case ARMADA_ARCHETYPE_ECONOMIST: return ai_economist_decide(state, game, rng);
        case ARMADA_ARCHETYPE_TRICKSTER: return ai_trickster_decide(state, game, rng);
        case ARMADA_ARCHETYPE_HYBRID:    return ai_hybrid_decide(state, game, rng);
        default:
            armada_set_error("Unknown AI archetype %d", (int)state->archetype);
            return armada_decision_wait("Unknown archetype");
    }
}

/*============================================================================
 * Names
 *============================================================================*/

static const char *const ARCHETYPE_NAMES[ARMADA_ARCHETYPE_COUNT] = {
    "aggressor",
    "economist",
    "trickster",
    "hybrid"
};

bool armada_archetype_from_name(const char *name, Armada_Archetype *out) {
    ARMADA_VALIDATE_STRING_RET(name, false);
    ARMADA_VALIDATE_PTR_RET(out, false);

    for (int i = 0; i < ARMADA_ARCHETYPE_COUNT; i++) {
        if (strcmp(name, ARCHETYPE_NAMES[i]) == 0) {
            *out = (Armada_Archetype)i;
            return true;
        }
    }
    armada_set_error("Unknown AI archetype: %s", name);
    return false;
}

const char *armada_archetype_name(Armada_Archetype archetype) {
    if ((int)archetype < 0 || archetype >= ARMADA_ARCHETYPE_COUNT) return "unknown";
    return ARCHETYPE_NAMES[archetype];
}

const char *armada_hybrid_strategy_name(Armada_HybridStrategy strategy) {
    switch (strategy) {
        case ARMADA_HYBRID_AGGRESSIVE:    return "aggressive";
        case ARMADA_HYBRID_ECONOMIC:      return "economic";
        case ARMADA_HYBRID_DEFENSIVE:     return "defensive";
        case ARMADA_HYBRID_OPPORTUNISTIC: return "opportunistic";
        default:                          return "unknown";
    }
}
