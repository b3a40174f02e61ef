#include <catch2/catch.hpp>
#include <gmpxx.h>
#include <stdexcept>

#include "miller_rabin.h"
#include "modular_context.h"


// Recomputes the squaring chain of the strong Fermat test independently.
static bool witness_proves_composite(const mpz_class& n, const mpz_class& a) {
    mpz_class d = n - 1;
    unsigned long s = 0;
    while (mpz_even_p(d.get_mpz_t())) {
        d /= 2;
        ++s;
    }
    mpz_class x;
    mpz_powm(x.get_mpz_t(), a.get_mpz_t(), d.get_mpz_t(), n.get_mpz_t());
    if (x == 1 || x == n - 1) {
        return false;
    }
    for (unsigned long i = 1; i < s; ++i) {
        x = (x * x) % n;
        if (x == n - 1) {
            return false;
        }
    }
    return true;
}


TEST_CASE("Split off the power of two") {
    const auto [d, s] = split_power_of_two(mpz_class(48));
    REQUIRE(d == 3);
    REQUIRE(s == 4);
    const auto [d1, s1] = split_power_of_two(mpz_class(7));
    REQUIRE(d1 == 7);
    REQUIRE(s1 == 0);
    REQUIRE_THROWS_AS(split_power_of_two(mpz_class(0)), std::invalid_argument);
}

TEST_CASE("Carmichael number 561 is caught despite passing the Fermat test") {
    const mpz_class n(561);
    mpz_class fermat;
    mpz_powm(fermat.get_mpz_t(), mpz_class(2).get_mpz_t(), mpz_class(560).get_mpz_t(), n.get_mpz_t());
    REQUIRE(fermat == 1);

    const ModulusContext ctx(n);
    REQUIRE(strong_fermat_test(ctx, mpz_class(2)) == WitnessResult::Composite);
    REQUIRE(witness_proves_composite(n, mpz_class(2)));
}

TEST_CASE("Strong pseudoprime 2047 passes base 2 but not base 3") {
    const ModulusContext ctx(mpz_class(2047));
    REQUIRE(strong_fermat_test(ctx, mpz_class(2)) == WitnessResult::ProbablyPrime);
    REQUIRE(strong_fermat_test(ctx, mpz_class(3)) == WitnessResult::Composite);
    REQUIRE(witness_proves_composite(mpz_class(2047), mpz_class(3)));
}

TEST_CASE("Primes pass every base") {
    for (const unsigned long p : {97UL, 65537UL, 2147483647UL}) {
        const ModulusContext ctx{mpz_class(p)};
        for (const unsigned long a : {2UL, 3UL, 5UL, 7UL, 11UL, 13UL}) {
            REQUIRE(strong_fermat_test(ctx, mpz_class(a)) == WitnessResult::ProbablyPrime);
        }
    }
}

TEST_CASE("Trivial bases carry no information") {
    const ModulusContext ctx(mpz_class(561));
    REQUIRE(strong_fermat_test(ctx, mpz_class(1)) == WitnessResult::ProbablyPrime);
    REQUIRE(strong_fermat_test(ctx, mpz_class(560)) == WitnessResult::ProbablyPrime);
    REQUIRE(strong_fermat_test(ctx, mpz_class(561)) == WitnessResult::ProbablyPrime);
}

TEST_CASE("Every reported witness re-verifies") {
    for (const unsigned long n : {561UL, 1105UL, 1729UL, 2465UL, 2821UL, 6601UL, 8911UL, 25326001UL}) {
        const ModulusContext ctx{mpz_class(n)};
        bool caught = false;
        for (const unsigned long a : {2UL, 3UL, 5UL, 7UL, 11UL}) {
            if (strong_fermat_test(ctx, mpz_class(a)) == WitnessResult::Composite) {
                REQUIRE(witness_proves_composite(mpz_class(n), mpz_class(a)));
                caught = true;
            }
        }
        REQUIRE(caught);
    }
}
