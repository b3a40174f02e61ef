#include <gmpxx.h>
#include <vector>

#include "certificate.h"
#include "lucas_proof.h"
#include "miller_rabin.h"
#include "modular_context.h"
#include "small_primes.h"


// Every composite below psi_13 fails the strong Fermat test for one of the first 13 primes.
static const unsigned long VERIFY_BASES[] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41};
static const mpz_class VERIFY_BOUND("3317044064679887385961981");


/**
 * @brief Lucas test of n with one base, given the distinct primes dividing n - 1.
 *
 * If a^(n-1) = 1 mod n and a^((n-1)/q) != 1 mod n for every prime q | n - 1, then a has order
 * n - 1 and n is prime. a^(n-1) != 1 mod n proves n composite (Fermat). Otherwise the base says nothing.
 *
 * @param n The odd candidate, n > 3.
 * @param unique_prime_divisors Exactly the distinct primes dividing n - 1.
 * @param base The base a, 1 < a < n.
 * @return LucasProofResult Prime, Composite or Unknown.
 */
LucasProofResult lucas_primality_test(const mpz_class& n, const std::vector<mpz_class>& unique_prime_divisors,
                                      const mpz_class& base) {
    const ModulusContext ctx(n);
    const mpz_class n_minus_one = n - 1;
    if (!ctx.is_one(ctx.pow(base, n_minus_one))) {
        return LucasProofResult::Composite;
    }
    for (const mpz_class& q : unique_prime_divisors) {
        if (ctx.is_one(ctx.pow(base, n_minus_one / q))) {
            return LucasProofResult::Unknown;
        }
    }
    return LucasProofResult::Prime;
}


/**
 * @brief Tries the bases 2..max_base (below n) until one proves n prime or composite.
 *
 * For a prime n, the fraction of primitive roots among the bases is phi(n-1)/(n-1), so a
 * short search usually succeeds.
 *
 * @param n The odd candidate, n > 3.
 * @param unique_prime_divisors Exactly the distinct primes dividing n - 1.
 * @param max_base Largest base to try.
 * @return LucasBaseSearch The deciding base, or Unknown if none decided.
 */
LucasBaseSearch search_lucas_base(const mpz_class& n, const std::vector<mpz_class>& unique_prime_divisors,
                                  const unsigned long max_base) {
    LucasBaseSearch search;
    for (mpz_class base = 2; base <= max_base && base < n; ++base) {
        search.base = base;
        search.result = lucas_primality_test(n, unique_prime_divisors, base);
        if (search.result != LucasProofResult::Unknown) {
            return search;
        }
    }
    search.result = LucasProofResult::Unknown;
    return search;
}


/**
 * @brief Whether q is prime without looking at a chain element.
 *
 * q = 2, a table entry, q without table divisor below (limit + 1)^2, or odd q < psi_13 passing
 * the strong Fermat test for the first 13 primes.
 */
static bool is_prime_without_chain(const mpz_class& q, const SmallPrimeTable& table) {
    if (q < 2) {
        return false;
    }
    if (q == 2 || table.contains(q)) {
        return true;
    }
    if (mpz_even_p(q.get_mpz_t())) {
        return false;
    }
    if (table.proves_by_trial_division(q)) {
        for (const unsigned long p : table.primes()) {
            if (q < mpz_class(p) * p) {
                break;
            }
            if (mpz_divisible_ui_p(q.get_mpz_t(), p)) {
                return false;
            }
        }
        return true;
    }
    if (q < VERIFY_BOUND) {
        const ModulusContext ctx(q);
        for (const unsigned long base : VERIFY_BASES) {
            if (strong_fermat_test(ctx, mpz_class(base)) == WitnessResult::Composite) {
                return false;
            }
        }
        return true;
    }
    return false;
}


/**
 * @brief Independently re-checks that `chain` proves n prime.
 *
 * n is accepted if it is prime without a chain element (see is_prime_without_chain), or if the
 * chain has an element for n whose divisors are primes that multiply out n - 1 completely, each
 * of them accepted recursively, and whose base passes the Lucas test. Divisors are smaller
 * than n, so the recursion ends.
 *
 * @param chain The flattened proof chain.
 * @param n The number claimed prime.
 * @param table Small primes accepted without proof.
 * @return true if the chain proves n prime.
 */
bool verify_lucas_certificate(const LucasCertificate& chain, const mpz_class& n, const SmallPrimeTable& table) {
    if (is_prime_without_chain(n, table)) {
        return true;
    }
    if (n < 5 || mpz_even_p(n.get_mpz_t())) {
        return false;
    }
    const LucasCertificateElement* element = chain.get(n);
    if (element == nullptr || element->unique_prime_divisors.empty()) {
        return false;
    }

    mpz_class rest = n - 1;
    for (const mpz_class& q : element->unique_prime_divisors) {
        if (q < 2 || !mpz_divisible_p(rest.get_mpz_t(), q.get_mpz_t())) {
            return false;
        }
        while (mpz_divisible_p(rest.get_mpz_t(), q.get_mpz_t())) {
            mpz_divexact(rest.get_mpz_t(), rest.get_mpz_t(), q.get_mpz_t());
        }
        if (!verify_lucas_certificate(chain, q, table)) {
            return false;
        }
    }
    if (rest != 1) {
        return false;
    }
    if (element->base < 2 || element->base >= n) {
        return false;
    }
    return lucas_primality_test(n, element->unique_prime_divisors, element->base) == LucasProofResult::Prime;
}
