#ifndef LUCAS_PROOF_H
#define LUCAS_PROOF_H

#include <gmpxx.h>
#include <vector>

#include "certificate.h"
#include "small_primes.h"


/**
 * @enum LucasProofResult
 * @brief Result of the Lucas primality test for one base. Prime and Composite are proofs.
 */
enum class LucasProofResult : int {
    Prime = 0,
    Composite,
    Unknown    ///< the base is not a primitive root; another base may still close the proof
};


/**
 * @struct LucasBaseSearch
 * @brief Outcome of trying the bases 2, 3, ... in turn.
 */
struct LucasBaseSearch {
    LucasProofResult result = LucasProofResult::Unknown;
    mpz_class base;  ///< The deciding base (Prime or Composite), or the last base tried
};


/**
 * @brief Lucas test of n with one base, given the distinct primes dividing n - 1.
 */
LucasProofResult lucas_primality_test(const mpz_class& n, const std::vector<mpz_class>& unique_prime_divisors,
                                      const mpz_class& base);


/**
 * @brief Tries the bases 2..max_base (below n) until one proves n prime or composite.
 */
LucasBaseSearch search_lucas_base(const mpz_class& n, const std::vector<mpz_class>& unique_prime_divisors,
                                  unsigned long max_base);


/**
 * @brief Independently re-checks that `chain` proves n prime.
 */
bool verify_lucas_certificate(const LucasCertificate& chain, const mpz_class& n, const SmallPrimeTable& table);

#endif //LUCAS_PROOF_H
