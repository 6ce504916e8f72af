/**
 * Armada AI - Decision Engine
 *
 * Owns one side's AI state and turns a game state into a validated
 * decision. The random source and the error log are borrowed.
 */

#include "armada/armada.h"
#include "armada/ai.h"
#include "armada/error.h"
#include "armada/log.h"
#include "armada/validate.h"

#include <stdio.h>
#include <stdlib.h>

struct Armada_AIEngine {
    Armada_AIState state;
    Armada_Rng *rng;
    Armada_ErrorLog *errors;
};

/*============================================================================
 * Lifecycle
 *============================================================================*/

Armada_AIEngine *armada_ai_engine_create(Armada_Archetype archetype,
                                         const Armada_AIConfig *config,
                                         Armada_Rng *rng) {
    ARMADA_VALIDATE_PTR_RET(rng, NULL);

    Armada_AIEngine *engine = ARMADA_ALLOC(Armada_AIEngine);
    if (!engine) {
        armada_set_error("Failed to allocate AI engine");
        return NULL;
    }

    if (!armada_ai_state_init(&engine->state, archetype, config, rng)) {
        ARMADA_FREE(engine);
        return NULL;
    }
    engine->rng = rng;

    armada_log_info(ARMADA_LOG_AI, "Created %s engine", armada_archetype_name(archetype));
    return engine;
}

Armada_AIEngine *armada_ai_engine_create_by_name(const char *name,
                                                 const Armada_AIConfig *config,
                                                 Armada_Rng *rng) {
    Armada_Archetype archetype;
    if (!armada_archetype_from_name(name, &archetype)) {
        return NULL;
    }
    return armada_ai_engine_create(archetype, config, rng);
}

void armada_ai_engine_destroy(Armada_AIEngine *engine) {
    if (!engine) return;
    ARMADA_FREE(engine);
}

void armada_ai_engine_set_error_log(Armada_AIEngine *engine, Armada_ErrorLog *log) {
    ARMADA_VALIDATE_PTR(engine);
    engine->errors = log;
}

/*============================================================================
 * Turn Processing
 *============================================================================*/

bool armada_ai_engine_process_turn(Armada_AIEngine *engine,
                                   const Armada_GameState *game,
                                   Armada_Decision *out) {
    ARMADA_VALIDATE_PTRS3_RET(engine, game, out, false);

    Armada_AIState *state = &engine->state;
    armada_ai_refresh(state, game);

    Armada_Decision decision = armada_ai_make_decision(state, game, engine->rng);

    if (!armada_ai_validate_decision(&decision, &state->self)) {
        /* Copy before the log and report calls can overwrite the buffer */
        char reason[ARMADA_ERROR_MESSAGE_MAX];
        snprintf(reason, sizeof(reason), "%s", armada_get_last_error());

        armada_log_error(ARMADA_LOG_AI, "%s engine produced an invalid %s decision: %s",
                         armada_archetype_name(state->archetype),
                         armada_decision_type_name(decision.type), reason);
        armada_error_log_report(engine->errors, ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_HIGH,
                                game->turn, "AI produced invalid decision: %s", reason);
        armada_set_error("AI produced invalid decision: %s", reason);
        return false;
    }

    state->last_decision = decision;
    state->has_last_decision = true;

    armada_log_debug(ARMADA_LOG_AI, "%s: %s (%s), threat %.2f, advantage %.2f",
                     armada_archetype_name(state->archetype),
                     armada_decision_type_name(decision.type),
                     decision.reasoning ? decision.reasoning : "",
                     state->threat_level, state->economic_advantage);

    *out = decision;
    return true;
}

/*============================================================================
 * Accessors
 *============================================================================*/

const Armada_AIState *armada_ai_engine_state(const Armada_AIEngine *engine) {
    ARMADA_VALIDATE_PTR_RET(engine, NULL);
    return &engine->state;
}

Armada_Archetype armada_ai_engine_archetype(const Armada_AIEngine *engine) {
    ARMADA_VALIDATE_PTR_RET(engine, ARMADA_ARCHETYPE_COUNT);
    return engine->state.archetype;
}
