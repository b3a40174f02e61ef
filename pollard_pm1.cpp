#include <gmpxx.h>
#include <vector>

#include "config.h"
#include "modular_context.h"
#include "pollard_pm1.h"
#include "stage.h"


/**
 * @brief Pollard p-1 with base a: a^(B!) mod n, the bound B escalating through `bounds`.
 *
 * The exponent grows one factor at a time: a <- a^k mod n for k = 2, 3, 4, ... When some prime
 * p | n has p - 1 | k!, then a = 1 mod p and gcd(a - 1, n) reveals p. The gcd is taken every
 * `checkpoint_interval` steps and at the end of every bound of the schedule, so each escalation
 * resumes where the previous bound stopped. A gcd equal to n means two prime factors were caught
 * in the same interval; the interval is then replayed from the last checkpoint with one gcd per step.
 *
 * @param ctx Modulus context for the odd composite n.
 * @param base The base a, 1 < a < n - 1.
 * @param bounds Increasing smoothness bounds; the last one is the ceiling.
 * @param checkpoint_interval Steps between two gcds.
 * @param budget Charged with the bit length of k per step.
 * @return Pm1Attempt Found with the divisor, or the reason the run stopped.
 */
Pm1Attempt pollard_pm1(const ModulusContext& ctx, const mpz_class& base, const std::vector<unsigned long>& bounds,
                       const unsigned long checkpoint_interval, BudgetTracker& budget) {
    const mpz_class& n = ctx.get_modulus();
    Pm1Attempt attempt;

    mpz_class g = gcd(base, n);
    if (g > 1 && g < n) {
        attempt.status = Pm1Status::Found;
        attempt.divisor = g;
        return attempt;
    }

    mpz_class a = ctx.reduce(base);
    mpz_class saved = a;
    unsigned long saved_k = 2;
    unsigned long k = 2;
    unsigned long steps = 0;

    for (const unsigned long bound : bounds) {
        for (; k <= bound; ++k) {
            a = ctx.pow(a, mpz_class(k));
            budget.charge(mpz_sizeinbase(mpz_class(k).get_mpz_t(), 2));
            attempt.last_exponent = k;
            ++steps;
            if (steps % checkpoint_interval != 0 && k != bound) {
                continue;
            }

            g = gcd(a - 1, n);
            if (g == 1) {
                saved = a;
                saved_k = k + 1;
                if (budget.exhausted()) {
                    attempt.status = Pm1Status::BudgetExhausted;
                    return attempt;
                }
                continue;
            }
            if (g == n) {
                // Replay the interval step by step
                mpz_class b = saved;
                for (unsigned long j = saved_k; j <= k; ++j) {
                    b = ctx.pow(b, mpz_class(j));
                    g = gcd(b - 1, n);
                    if (g != 1) {
                        break;
                    }
                }
                if (g == n || g == 1) {
                    attempt.status = Pm1Status::Degenerate;
                    return attempt;
                }
            }
            attempt.status = Pm1Status::Found;
            attempt.divisor = g;
            return attempt;
        }
    }
    attempt.status = Pm1Status::BoundReached;
    return attempt;
}


/**
 * @brief Pollard p-1 stage: tries the first `pm1_bases` primes as bases until one gives a factor.
 *
 * Only a degenerate run moves on to the next base. A run that reaches the bound ceiling would
 * reach it with any other base too, and a run that exhausts the budget ends the stage.
 *
 * @param n The composite residue.
 * @param config Source of the bound schedule, checkpoint interval and base count.
 * @param budget The call's budget.
 * @return StageOutcome The split, or no factor.
 */
StageOutcome run_pollard_pm1(const mpz_class& n, const FactorizationConfig& config, BudgetTracker& budget) {
    if (n < 4) {
        return StageOutcome::no_factor();
    }
    if (mpz_even_p(n.get_mpz_t())) {
        return StageOutcome::split(mpz_class(2), n);
    }

    const ModulusContext ctx(n);
    mpz_class base = 2;
    for (unsigned int i = 0; i < config.pm1_bases; ++i) {
        const Pm1Attempt result = pollard_pm1(ctx, base, config.pm1_bounds, config.pm1_checkpoint_interval, budget);
        if (result.status == Pm1Status::Found) {
            return StageOutcome::split(result.divisor, n);
        }
        if (result.status != Pm1Status::Degenerate) {
            break;
        }
        mpz_nextprime(base.get_mpz_t(), base.get_mpz_t());
    }
    return StageOutcome::no_factor();
}
