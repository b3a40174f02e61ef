#include <gmpxx.h>
#include <list>

#include "certificate.h"
#include "helper.h"
#include "small_primes.h"
#include "stage.h"
#include "trial_division.h"


/**
 * @brief Strips all primes of the table from N (and modifies it), returning them as factors.
 *
 * Divides N by each table prime in ascending order until N is smaller than the square of the
 * next candidate or the table is exhausted. Every prime found is certified DefinitelyPrime
 * (it is an entry of the table). What is left in N afterwards is 1, a prime, or a number without
 * prime factors up to the table bound.
 *
 * @param N The number to factorize (will be modified).
 * @param table The small primes to divide by.
 * @return std::list<Factor> The small prime factors found, with their exponents, ascending.
 */
std::list<Factor> trial_division_bounded(mpz_class& N, const SmallPrimeTable& table) {
    std::list<Factor> factors;

    for (const unsigned long P : table.primes()) {
        if (N < mpz_class(P) * P) {
            break;
        }
        const unsigned int exponent = divide_out_maximal_power(N, P);
        if (exponent > 0) {
            factors.emplace_back(mpz_class(P), exponent,
                                 PrimalityCertificate(mpz_class(P), Verdict::DefinitelyPrime, Evidence::SmallPrime));
        }
    }

    // N < P^2 stopped the loop: a remaining table prime still has to be taken out
    if (N > 1 && table.contains(N)) {
        factors.emplace_back(N, 1, PrimalityCertificate(N, Verdict::DefinitelyPrime, Evidence::SmallPrime));
        N = 1;
    }

    return factors;
}


/**
 * @brief Stage form of trial division: splits off the smallest table prime dividing n.
 *
 * @param n The composite residue.
 * @param table The small primes to divide by.
 * @return StageOutcome The split (p, n / p) for the smallest table prime p | n with p < n, or no factor.
 */
StageOutcome run_trial_division_stage(const mpz_class& n, const SmallPrimeTable& table) {
    for (const unsigned long P : table.primes()) {
        if (n <= P) {
            break;
        }
        if (mpz_divisible_ui_p(n.get_mpz_t(), P)) {
            return StageOutcome::split(mpz_class(P), n);
        }
    }
    return StageOutcome::no_factor();
}
