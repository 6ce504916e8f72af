#ifndef ARMADA_RNG_H
#define ARMADA_RNG_H

#include <stdbool.h>
#include <stdint.h>

/**
 * Armada Random Source
 *
 * xorshift32 generator shared by the AI engines and combat resolution.
 * The orchestrator owns one and lends it out, so a fixed seed reproduces
 * a whole match.
 *
 * Usage:
 *   Armada_Rng rng;
 *   armada_rng_seed(&rng, 12345);
 *   float f = armada_rng_float(&rng);          // [0, 1)
 *   int n = armada_rng_int(&rng, 1, 3);        // 1, 2 or 3
 */

typedef struct Armada_Rng {
    uint32_t state;
} Armada_Rng;

/**
 * Seed the generator.
 *
 * @param rng  Generator
 * @param seed Seed value (0 = seed from current time)
 */
void armada_rng_seed(Armada_Rng *rng, uint32_t seed);

/**
 * Next raw 32-bit value.
 */
uint32_t armada_rng_next(Armada_Rng *rng);

/**
 * Uniform float in [0, 1).
 */
float armada_rng_float(Armada_Rng *rng);

/**
 * Uniform float in [min, max).
 */
float armada_rng_range(Armada_Rng *rng, float min, float max);

/**
 * Uniform integer in [min, max] inclusive. Returns min if min > max.
 */
int armada_rng_int(Armada_Rng *rng, int min, int max);

/**
 * True with the given probability. Always consumes one draw.
 */
bool armada_rng_chance(Armada_Rng *rng, float probability);

#endif /* ARMADA_RNG_H */
