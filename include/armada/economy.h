#ifndef ARMADA_ECONOMY_H
#define ARMADA_ECONOMY_H

#include "armada/fleet.h"

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada Economy Lookups
 *
 * Fixed cost tables read by the AI heuristics and the orchestrator. Build
 * queues and income formulas live outside the simulation core; only the
 * lookups live here.
 */

#define ARMADA_BASE_METAL_INCOME     10000
#define ARMADA_BASE_ENERGY_INCOME    10000
#define ARMADA_STRUCTURE_INCOME      500    /* Income per reactor or mine */

/**
 * Anything a build decision can name
 */
typedef enum Armada_Buildable {
    ARMADA_BUILD_FRIGATE = 0,
    ARMADA_BUILD_CRUISER,
    ARMADA_BUILD_BATTLESHIP,
    ARMADA_BUILD_REACTOR,       /* +energy income */
    ARMADA_BUILD_MINE,          /* +metal income */
    ARMADA_BUILDABLE_COUNT
} Armada_Buildable;

typedef enum Armada_ScanType {
    ARMADA_SCAN_BASIC = 0,      /* Total fleet size */
    ARMADA_SCAN_DEEP,           /* Composition by class */
    ARMADA_SCAN_ADVANCED,       /* Composition plus movements */
    ARMADA_SCAN_TYPE_COUNT
} Armada_ScanType;

/**
 * Cost of a single build of `type`. {0, 0} for invalid types.
 */
Armada_Cost armada_buildable_cost(Armada_Buildable type);

bool armada_buildable_is_unit(Armada_Buildable type);
bool armada_buildable_is_structure(Armada_Buildable type);

/**
 * Ship class of a unit buildable. Returns false for structures.
 */
bool armada_buildable_to_unit(Armada_Buildable type, Armada_UnitType *out_unit);
Armada_Buildable armada_buildable_from_unit(Armada_UnitType unit);

const char *armada_buildable_name(Armada_Buildable type);

/**
 * Energy cost of a scan. 0 for invalid types.
 */
int32_t armada_scan_cost(Armada_ScanType type);
const char *armada_scan_type_name(Armada_ScanType type);

#endif /* ARMADA_ECONOMY_H */
