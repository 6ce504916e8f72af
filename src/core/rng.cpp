#include "armada/rng.h"

#include <time.h>

/*============================================================================
 * xorshift32
 *============================================================================*/

void armada_rng_seed(Armada_Rng *rng, uint32_t seed) {
    if (!rng) return;

    if (seed == 0) {
        seed = (uint32_t)time(NULL);
    }
    /* xorshift32 never leaves the all-zero state */
    rng->state = seed != 0 ? seed : 0x9E3779B9u;
}

uint32_t armada_rng_next(Armada_Rng *rng) {
    if (!rng) return 0;

    if (rng->state == 0) {
        rng->state = 0x9E3779B9u;
    }

    uint32_t x = rng->state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    rng->state = x;
    return x;
}

float armada_rng_float(Armada_Rng *rng) {
    /* Top 24 bits so the result is exactly representable and < 1 */
    return (float)(armada_rng_next(rng) >> 8) * (1.0f / 16777216.0f);
}

float armada_rng_range(Armada_Rng *rng, float min, float max) {
    return min + armada_rng_float(rng) * (max - min);
}

int armada_rng_int(Armada_Rng *rng, int min, int max) {
    if (min > max) return min;

    int span = max - min + 1;
    int value = min + (int)(armada_rng_float(rng) * (float)span);
    return value > max ? max : value;
}

bool armada_rng_chance(Armada_Rng *rng, float probability) {
    return armada_rng_float(rng) < probability;
}
