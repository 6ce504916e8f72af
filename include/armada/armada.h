#ifndef ARMADA_H
#define ARMADA_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

/**
 * Armada Fleet Conflict Simulation Core
 *
 * Umbrella header. Pulls in every public module of the simulation core:
 * fleet compositions and movements, combat resolution, the AI decision
 * engine, and the ambient error/log/config layers they report through.
 */

// Memory allocation helpers (zero-initialized, C++ friendly casts)
#define ARMADA_ALLOC(type) (type*)calloc(1, sizeof(type))
#define ARMADA_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define ARMADA_FREE(ptr) free(ptr)

// Version info
#define ARMADA_VERSION_MAJOR 0
#define ARMADA_VERSION_MINOR 3
#define ARMADA_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    Functions named `armada_*_create()` allocate. The caller OWNS the
 *    returned pointer and MUST call the matching `armada_*_destroy()`.
 *
 * 2. INIT FUNCTIONS:
 *    `armada_*_init()` fill caller-provided storage and never allocate.
 *
 * 3. BORROWED POINTERS:
 *    Pointers passed into create functions (random sources, error logs,
 *    configs) are borrowed. They must outlive the object that holds them.
 *
 * 4. OUT PARAMETERS:
 *    Functions that produce values write them through an `out` pointer and
 *    return false on failure, leaving the reason in armada_get_last_error().
 */

#include "armada/error.h"
#include "armada/log.h"
#include "armada/rng.h"
#include "armada/fleet.h"
#include "armada/combat.h"
#include "armada/economy.h"
#include "armada/game_state.h"
#include "armada/ai_config.h"
#include "armada/ai.h"

#endif /* ARMADA_H */
