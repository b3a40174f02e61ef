#include <gmpxx.h>
#include <utility>
#include <stdexcept>

#include "miller_rabin.h"
#include "modular_context.h"


/**
 * @brief Writes m = 2^s * d with d odd.
 *
 * @param m A positive integer.
 * @return std::pair<mpz_class, unsigned long> The odd part d and the exponent s.
 * @throw std::invalid_argument if m < 1.
 */
std::pair<mpz_class, unsigned long> split_power_of_two(const mpz_class& m) {
    if (m < 1) {
        throw std::invalid_argument("Cannot split a power of two off " + m.get_str());
    }
    const unsigned long s = mpz_scan1(m.get_mpz_t(), 0);
    mpz_class d;
    mpz_fdiv_q_2exp(d.get_mpz_t(), m.get_mpz_t(), s);
    return {d, s};
}


/**
 * @brief Strong Fermat (Miller-Rabin) test of n = ctx.get_modulus() to base a.
 *
 * Writes n - 1 = 2^s * d with d odd, computes x = a^d mod n and squares it up to s - 1 times.
 * n is a strong probable prime to base a if x = 1 initially, or if x reaches n - 1 somewhere in
 * the chain. Otherwise a is a witness for the compositeness of n. Bases congruent to 0, 1 or -1
 * carry no information and are reported as ProbablyPrime.
 *
 * @param ctx Modulus context for the odd candidate n >= 3.
 * @param base The base a.
 * @return WitnessResult Composite if a proves n composite, ProbablyPrime otherwise.
 */
WitnessResult strong_fermat_test(const ModulusContext& ctx, const mpz_class& base) {
    const mpz_class a = ctx.reduce(base);
    if (a == 0 || ctx.is_one(a) || ctx.is_minus_one(a)) {
        return WitnessResult::ProbablyPrime;
    }

    auto [d, s] = split_power_of_two(ctx.get_modulus() - 1);
    mpz_class x = ctx.pow(a, d);
    if (ctx.is_one(x) || ctx.is_minus_one(x)) {
        return WitnessResult::ProbablyPrime;
    }
    for (unsigned long i = 1; i < s; ++i) {
        x = ctx.sqr(x);
        if (ctx.is_minus_one(x)) {
            return WitnessResult::ProbablyPrime;
        }
        if (ctx.is_one(x)) {  // non-trivial square root of 1
            return WitnessResult::Composite;
        }
    }
    return WitnessResult::Composite;
}
