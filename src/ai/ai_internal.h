/**
 * Armada AI - Internal Helpers
 *
 * Shared between ai_base.cpp, the archetype sources and ai_engine.cpp.
 */

#ifndef ARMADA_AI_INTERNAL_H
#define ARMADA_AI_INTERNAL_H

#include "armada/ai.h"

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Archetype Entry Points
 * ============================================================================ */

Armada_Decision ai_aggressor_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng);
Armada_Decision ai_economist_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng);
Armada_Decision ai_trickster_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng);
Armada_Decision ai_hybrid_decide(Armada_AIState *state, const Armada_GameState *game, Armada_Rng *rng);

void ai_trickster_init(Armada_TricksterState *trickster, const Armada_TricksterTuning *tuning);
void ai_hybrid_init(Armada_HybridState *hybrid, const Armada_HybridTuning *tuning, Armada_Rng *rng);

/* ============================================================================
 * Shared Decision Helpers
 * ============================================================================ */

/**
 * Ships currently at the AI's home system
 */
int32_t ai_home_total(const Armada_AIState *state);

/**
 * Build up to `wanted` of `item`, clamped to what the AI can pay for.
 * Falls back to wait when nothing is affordable.
 */
Armada_Decision ai_build_up_to(const Armada_AIState *state,
                               Armada_Buildable item,
                               int32_t wanted,
                               const char *reasoning);

/**
 * Commit floor(home * fraction) of each class against the enemy home.
 * Returns false when the resulting strike would be empty or unavailable.
 */
bool ai_plan_attack(const Armada_AIState *state,
                    float fraction,
                    const char *reasoning,
                    Armada_Decision *out);

/**
 * Uniformly random ship class
 */
Armada_UnitType ai_random_unit(Armada_Rng *rng);

#ifdef __cplusplus
}
#endif

#endif /* ARMADA_AI_INTERNAL_H */
