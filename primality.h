#ifndef PRIMALITY_H
#define PRIMALITY_H

#include <gmpxx.h>
#include <vector>

#include "certificate.h"
#include "config.h"
#include "small_primes.h"


/**
 * @brief Largest n for which the strong Fermat test with the given bases is proven exhaustive (0 if none).
 */
mpz_class deterministic_bound(const std::vector<unsigned long>& bases);


/**
 * @brief The bases the oracle tests n with: the configured list plus deterministic pseudo-random extras.
 */
std::vector<mpz_class> select_witness_bases(const mpz_class& n, const FactorizationConfig& config);


/**
 * @brief Classifies n as Composite, ProbablyPrime or DefinitelyPrime and records the evidence.
 */
PrimalityCertificate test_primality(const mpz_class& n, const SmallPrimeTable& table, const FactorizationConfig& config);

#endif //PRIMALITY_H
