#include <catch2/catch.hpp>
#include <gmpxx.h>
#include <limits>
#include <list>
#include <stdexcept>

#include "small_primes.h"
#include "trial_division.h"


TEST_CASE("Sieve produces all primes up to the bound") {
    const SmallPrimeTable table(100);
    REQUIRE(table.primes().size() == 25);
    REQUIRE(table.primes().front() == 2);
    REQUIRE(table.primes().back() == 97);
    REQUIRE(table.limit() == 100);
    REQUIRE(table.contains(mpz_class(97)));
    REQUIRE_FALSE(table.contains(mpz_class(91)));
    REQUIRE_FALSE(table.contains(mpz_class(101)));
    REQUIRE_FALSE(table.contains(mpz_class(1)));

    const SmallPrimeTable default_table(65536);
    REQUIRE(default_table.primes().size() == 6542);
    REQUIRE(default_table.primes().back() == 65521);
}

TEST_CASE("Sieve rejects a bound out of range") {
    REQUIRE_THROWS_AS(SmallPrimeTable(1), std::invalid_argument);
    REQUIRE_THROWS_AS(SmallPrimeTable(MAX_TRIAL_DIVISION_BOUND + 1), std::invalid_argument);
    REQUIRE_THROWS_AS(SmallPrimeTable(std::numeric_limits<unsigned long>::max()), std::invalid_argument);
    REQUIRE(SmallPrimeTable(2).primes().size() == 1);
}

TEST_CASE("Trial division proves primality below (bound + 1)^2") {
    const SmallPrimeTable table(100);
    REQUIRE(table.proves_by_trial_division(mpz_class(10200)));
    REQUIRE_FALSE(table.proves_by_trial_division(mpz_class(10201)));
}

TEST_CASE("Bounded trial division strips table primes") {
    const SmallPrimeTable table(65536);
    mpz_class N = mpz_class(8 * 3) * 65537;
    const std::list<Factor> factors = trial_division_bounded(N, table);
    REQUIRE(factors.size() == 2);
    REQUIRE(factors.front().factor == 2);
    REQUIRE(factors.front().exponent == 3);
    REQUIRE(factors.back().factor == 3);
    REQUIRE(factors.back().exponent == 1);
    REQUIRE(factors.back().certificate.verdict == Verdict::DefinitelyPrime);
    REQUIRE(N == 65537);
}

TEST_CASE("Bounded trial division takes out a remaining table prime") {
    const SmallPrimeTable table(100);
    mpz_class N = 2 * 97;
    const std::list<Factor> factors = trial_division_bounded(N, table);
    REQUIRE(factors.size() == 2);
    REQUIRE(factors.back().factor == 97);
    REQUIRE(N == 1);
}

TEST_CASE("Trial division stage splits off the smallest table prime") {
    const SmallPrimeTable table(100);
    const StageOutcome outcome = run_trial_division_stage(mpz_class(15), table);
    REQUIRE(outcome.found);
    REQUIRE(outcome.divisor == 3);
    REQUIRE(outcome.cofactor == 5);

    REQUIRE_FALSE(run_trial_division_stage(mpz_class(101 * 103), table).found);
    REQUIRE_FALSE(run_trial_division_stage(mpz_class(97), table).found);
}
