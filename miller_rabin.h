#ifndef MILLER_RABIN_H
#define MILLER_RABIN_H

#include <gmpxx.h>
#include <utility>

#include "modular_context.h"


/**
 * @enum WitnessResult
 * @brief Result of one strong Fermat test. Only Composite is a proof.
 */
enum class WitnessResult : int {
    Composite = 0,
    ProbablyPrime = 1
};


/**
 * @brief Writes m = 2^s * d with d odd and returns {d, s}.
 */
std::pair<mpz_class, unsigned long> split_power_of_two(const mpz_class& m);


/**
 * @brief Strong Fermat (Miller-Rabin) test of the context's modulus to the given base.
 */
WitnessResult strong_fermat_test(const ModulusContext& ctx, const mpz_class& base);

#endif //MILLER_RABIN_H
