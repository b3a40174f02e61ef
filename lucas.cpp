#include <gmpxx.h>
#include <cstdlib>
#include <stdexcept>

#include "lucas.h"
#include "miller_rabin.h"
#include "modular_context.h"


/**
 * @brief Selfridge's method A: the first D of 5, -7, 9, -11, ... with Jacobi symbol (D|n) = -1.
 *
 * A symbol of 0 with |D| < n means gcd(|D|, n) is a non-trivial factor, and the search stops
 * right there. n must be odd and must not be a perfect square, otherwise no such D exists.
 *
 * @param n Odd integer > 1 that is not a perfect square.
 * @return DiscriminantSearch Either the parameters (D, P = 1, Q = (1 - D) / 4) or a factor of n.
 * @throw std::invalid_argument if n is even, smaller than 3 or a perfect square.
 */
DiscriminantSearch select_discriminant(const mpz_class& n) {
    if (n < 3 || mpz_even_p(n.get_mpz_t())) {
        throw std::invalid_argument("Lucas discriminant search needs an odd n >= 3, got: " + n.get_str());
    }
    if (mpz_perfect_square_p(n.get_mpz_t())) {
        throw std::invalid_argument("No Lucas discriminant exists for the perfect square " + n.get_str());
    }

    DiscriminantSearch search;
    long D = 5;
    while (true) {
        const int jacobi = mpz_si_kronecker(D, n.get_mpz_t());
        if (jacobi == -1) {
            break;
        }
        if (jacobi == 0) {
            mpz_class g;
            mpz_gcd_ui(g.get_mpz_t(), n.get_mpz_t(), std::labs(D));
            if (g > 1 && g < n) {
                search.found_factor = true;
                search.factor = g;
                return search;
            }
        }
        D = (D > 0) ? -(D + 2) : -D + 2;  // 5, -7, 9, -11, 13, ...
    }
    search.parameters.D = D;
    search.parameters.P = 1;
    search.parameters.Q = (1 - D) / 4;
    return search;
}


/**
 * @brief Strong Lucas probable prime test of n = ctx.get_modulus().
 *
 * With n + 1 = 2^s * d (d odd) and the Lucas sequences U_k, V_k for (P, Q) = (1, (1 - D) / 4),
 * n is a strong Lucas probable prime if U_d = 0 mod n or V_(d*2^r) = 0 mod n for some 0 <= r < s.
 * The sequences are evaluated with the doubling formulas U_2k = U_k V_k and
 * V_2k = (V_k^2 + D U_k^2) / 2, and the step formulas U_(k+1) = (P U_k + V_k) / 2 and
 * V_(k+1) = (D U_k + P V_k) / 2, so Q^k never has to be tracked.
 *
 * @param ctx Modulus context for the odd candidate n >= 3.
 * @return LucasOutcome Composite (with the witness that failed) or ProbablyPrime with the parameters used.
 */
LucasOutcome strong_lucas_test(const ModulusContext& ctx) {
    const mpz_class& n = ctx.get_modulus();
    LucasOutcome outcome;

    if (mpz_perfect_square_p(n.get_mpz_t())) {
        mpz_sqrt(outcome.witness.get_mpz_t(), n.get_mpz_t());
        return outcome;
    }

    const DiscriminantSearch search = select_discriminant(n);
    if (search.found_factor) {
        outcome.witness = search.factor;
        return outcome;
    }
    outcome.parameters = search.parameters;
    const mpz_class D = ctx.reduce(mpz_class(search.parameters.D));

    auto [d, s] = split_power_of_two(n + 1);

    // U_1 = 1, V_1 = P = 1
    mpz_class U = 1;
    mpz_class V = 1;
    const size_t bits = mpz_sizeinbase(d.get_mpz_t(), 2);
    for (size_t i = bits - 1; i-- > 0;) {
        const mpz_class U2 = ctx.mul(U, V);
        const mpz_class V2 = ctx.half(ctx.add(ctx.sqr(V), ctx.mul(D, ctx.sqr(U))));
        if (mpz_tstbit(d.get_mpz_t(), i)) {
            U = ctx.half(ctx.add(U2, V2));
            V = ctx.half(ctx.add(ctx.mul(D, U2), V2));
        } else {
            U = U2;
            V = V2;
        }
    }

    if (U == 0 || V == 0) {
        outcome.result = LucasResult::ProbablyPrime;
        return outcome;
    }
    for (unsigned long r = 1; r < s; ++r) {
        const mpz_class U2 = ctx.mul(U, V);
        V = ctx.half(ctx.add(ctx.sqr(V), ctx.mul(D, ctx.sqr(U))));
        U = U2;
        if (V == 0) {
            outcome.result = LucasResult::ProbablyPrime;
            return outcome;
        }
    }

    outcome.witness = std::labs(search.parameters.D);
    return outcome;
}
