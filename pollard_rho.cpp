#include <gmpxx.h>
#include <algorithm>

#include "config.h"
#include "modular_context.h"
#include "pollard_rho.h"
#include "stage.h"


/**
 * @brief One Pollard rho attempt with f(x) = x^2 + c, starting at x0, using Brent's cycle detection.
 *
 * The tortoise x stays fixed while the hare y runs r steps, then r doubles. The differences
 * x - y are not checked one at a time: they are multiplied into a running product q modulo n and
 * gcd(q, n) is taken once per batch of `batch_size` steps. If that gcd turns out to be n, the last
 * batch is replayed from its saved start ys with one gcd per step to recover the first non-trivial
 * gcd. If the replay also ends at n, the cycle closed modulo every prime factor at once and the
 * attempt is degenerate.
 *
 * @param ctx Modulus context for the odd composite n.
 * @param c Constant of the polynomial, reduced modulo n.
 * @param x0 Starting point, reduced modulo n.
 * @param max_iterations Iterations of f after which the attempt gives up.
 * @param batch_size Differences multiplied together between two gcds.
 * @param budget Charged per iteration; checked after every batch, also while y is advanced.
 * @return RhoAttempt Found with the divisor, or the reason the attempt stopped.
 */
RhoAttempt pollard_rho_brent(const ModulusContext& ctx, const mpz_class& c, const mpz_class& x0,
                             const unsigned long max_iterations, const unsigned long batch_size, BudgetTracker& budget) {
    const mpz_class& n = ctx.get_modulus();
    const mpz_class constant = ctx.reduce(c);
    auto f = [&ctx, &constant](const mpz_class& v) { return ctx.add(ctx.sqr(v), constant); };

    RhoAttempt attempt;
    mpz_class y = ctx.reduce(x0);
    mpz_class x, ys;
    mpz_class q = 1;
    mpz_class g = 1;
    unsigned long r = 1;

    while (g == 1) {
        x = y;
        for (unsigned long advanced = 0; advanced < r;) {
            const unsigned long m = std::min(batch_size, r - advanced);
            for (unsigned long i = 0; i < m; ++i) {
                y = f(y);
            }
            advanced += m;
            attempt.iterations += m;
            budget.charge(m);
            if (budget.exhausted()) {
                attempt.status = RhoStatus::BudgetExhausted;
                return attempt;
            }
        }

        unsigned long k = 0;
        while (k < r && g == 1) {
            ys = y;
            const unsigned long m = std::min(batch_size, r - k);
            for (unsigned long i = 0; i < m; ++i) {
                y = f(y);
                q = ctx.mul(q, ctx.sub(x, y));
            }
            attempt.iterations += m;
            budget.charge(2 * m);
            g = gcd(q, n);
            k += m;

            if (g == 1 && (attempt.iterations >= max_iterations || budget.exhausted())) {
                attempt.status = budget.exhausted() ? RhoStatus::BudgetExhausted : RhoStatus::IterationLimit;
                return attempt;
            }
        }
        r *= 2;
    }

    if (g == n) {
        // Replay the last batch one step at a time
        g = 1;
        for (unsigned long i = 0; i < batch_size && g == 1; ++i) {
            ys = f(ys);
            g = gcd(ctx.sub(x, ys), n);
        }
        budget.charge(batch_size);
    }

    if (g == 1 || g == n) {
        attempt.status = RhoStatus::Degenerate;
        return attempt;
    }
    attempt.status = RhoStatus::Found;
    attempt.divisor = g;
    return attempt;
}


/**
 * @brief Pollard rho stage: up to `rho_max_restarts` attempts with different c and starting points.
 *
 * Attempt i uses c = rho_seed + i and x0 = 2 + i, skipping c = 0 and c = -2, whose sequences do
 * not behave like random maps. A degenerate attempt or one that hits its iteration limit moves on to
 * the next c. Failure is only reported, it says nothing about the primality of n.
 *
 * @param n The composite residue.
 * @param config Source of the restart ceiling, iteration limit, batch size and seed.
 * @param budget The call's budget; the stage stops as soon as it runs out.
 * @return StageOutcome The split, or no factor.
 */
StageOutcome run_pollard_rho(const mpz_class& n, const FactorizationConfig& config, BudgetTracker& budget) {
    if (n < 4) {
        return StageOutcome::no_factor();
    }
    if (mpz_even_p(n.get_mpz_t())) {
        return StageOutcome::split(mpz_class(2), n);
    }

    const ModulusContext ctx(n);
    mpz_class c = config.rho_seed;
    for (unsigned int attempt = 0; attempt < config.rho_max_restarts; ++attempt, ++c) {
        while (ctx.reduce(c) == 0 || ctx.reduce(c + 2) == 0) {
            ++c;
        }
        const RhoAttempt result = pollard_rho_brent(ctx, c, mpz_class(2 + attempt), config.rho_max_iterations,
                                                    config.rho_batch_size, budget);
        if (result.status == RhoStatus::Found) {
            return StageOutcome::split(result.divisor, n);
        }
        if (result.status == RhoStatus::BudgetExhausted) {
            break;
        }
    }
    return StageOutcome::no_factor();
}
