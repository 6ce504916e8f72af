#ifndef ARMADA_VALIDATE_H
#define ARMADA_VALIDATE_H

#include "armada/error.h"
#include "armada/log.h"
#include <stddef.h>

/**
 * Armada Validation Macros
 *
 * Guard clauses for the public API. A failed guard records the failing
 * function and expression through armada_set_error() and returns early,
 * so callers only ever see false/NULL plus armada_get_last_error().
 *
 *   bool armada_fleet_launch(Armada_Fleet *fleet, const char *target, ...) {
 *       ARMADA_VALIDATE_PTR_RET(fleet, false);
 *       ARMADA_VALIDATE_STRING_RET(target, false);
 *       ...
 *   }
 */

#define ARMADA_GUARD_FAIL_(ret, fmt, ...) \
    do { \
        armada_set_error("%s: " fmt, __func__, __VA_ARGS__); \
        return ret; \
    } while (0)

/*============================================================================
 * Pointers
 *============================================================================*/

/* For void functions */
#define ARMADA_VALIDATE_PTR(ptr) \
    do { \
        if (!(ptr)) ARMADA_GUARD_FAIL_(, "null pointer: %s", #ptr); \
    } while (0)

#define ARMADA_VALIDATE_PTR_RET(ptr, ret) \
    do { \
        if (!(ptr)) ARMADA_GUARD_FAIL_((ret), "null pointer: %s", #ptr); \
    } while (0)

#define ARMADA_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        ARMADA_VALIDATE_PTR_RET(p1, ret); \
        ARMADA_VALIDATE_PTR_RET(p2, ret); \
    } while (0)

#define ARMADA_VALIDATE_PTRS3_RET(p1, p2, p3, ret) \
    do { \
        ARMADA_VALIDATE_PTRS2_RET(p1, p2, ret); \
        ARMADA_VALIDATE_PTR_RET(p3, ret); \
    } while (0)

/*============================================================================
 * Indices and Ranges
 *============================================================================*/

/* Negative indices wrap to huge values and fail the same check */
#define ARMADA_VALIDATE_INDEX_RET(index, count, ret) \
    do { \
        if ((size_t)(index) >= (size_t)(count)) \
            ARMADA_GUARD_FAIL_((ret), "%s out of bounds: %lld of %zu", \
                               #index, (long long)(index), (size_t)(count)); \
    } while (0)

/* Inclusive integer range */
#define ARMADA_VALIDATE_RANGE_RET(val, lo, hi, ret) \
    do { \
        if ((val) < (lo) || (val) > (hi)) \
            ARMADA_GUARD_FAIL_((ret), "%s = %d not in [%d, %d]", \
                               #val, (int)(val), (int)(lo), (int)(hi)); \
    } while (0)

#define ARMADA_VALIDATE_POSITIVE_RET(val, ret) \
    do { \
        if ((val) <= 0) \
            ARMADA_GUARD_FAIL_((ret), "%s must be positive: %d", #val, (int)(val)); \
    } while (0)

/*============================================================================
 * Strings
 *============================================================================*/

#define ARMADA_VALIDATE_STRING_RET(str, ret) \
    do { \
        if (!(str) || (str)[0] == '\0') \
            ARMADA_GUARD_FAIL_((ret), "null or empty string: %s", #str); \
    } while (0)

/*============================================================================
 * Conditions
 *============================================================================*/

#define ARMADA_VALIDATE_COND_RET(cond, msg, ret) \
    do { \
        if (!(cond)) ARMADA_GUARD_FAIL_((ret), "%s", (msg)); \
    } while (0)

/* Soft check: logs a warning and carries on */
#define ARMADA_WARN_IF(cond, subsystem, msg) \
    do { \
        if (cond) armada_log_warning((subsystem), "%s: %s", __func__, (msg)); \
    } while (0)

#endif /* ARMADA_VALIDATE_H */
