#include <catch2/catch.hpp>
#include <gmpxx.h>
#include <stdexcept>

#include "lucas.h"
#include "miller_rabin.h"
#include "modular_context.h"


TEST_CASE("Selfridge discriminant search") {
    DiscriminantSearch search = select_discriminant(mpz_class(5777));
    REQUIRE_FALSE(search.found_factor);
    REQUIRE(search.parameters.D == 5);
    REQUIRE(search.parameters.P == 1);
    REQUIRE(search.parameters.Q == -1);

    search = select_discriminant(mpz_class(5459));
    REQUIRE(search.parameters.D == -7);
    REQUIRE(search.parameters.Q == 2);

    search = select_discriminant(mpz_class(16109));
    REQUIRE(search.parameters.D == 13);
    REQUIRE(search.parameters.Q == -3);

    search = select_discriminant(mpz_class(18971));
    REQUIRE(search.parameters.D == -11);
    REQUIRE(search.parameters.Q == 3);
}

TEST_CASE("Discriminant search stops at a common factor") {
    const DiscriminantSearch search = select_discriminant(mpz_class(15));
    REQUIRE(search.found_factor);
    REQUIRE(search.factor == 5);
}

TEST_CASE("Discriminant search rejects squares and even numbers") {
    REQUIRE_THROWS_AS(select_discriminant(mpz_class(9801)), std::invalid_argument);
    REQUIRE_THROWS_AS(select_discriminant(mpz_class(100)), std::invalid_argument);
    REQUIRE_THROWS_AS(select_discriminant(mpz_class(1)), std::invalid_argument);
}

TEST_CASE("Strong Lucas pseudoprimes pass Lucas but fail base 2") {
    for (const unsigned long n : {5459UL, 5777UL, 10877UL, 16109UL, 18971UL}) {
        const ModulusContext ctx{mpz_class(n)};
        REQUIRE(strong_lucas_test(ctx).result == LucasResult::ProbablyPrime);
        REQUIRE(strong_fermat_test(ctx, mpz_class(2)) == WitnessResult::Composite);
    }
}

TEST_CASE("Strong pseudoprimes to base 2 fail the Lucas test") {
    LucasOutcome outcome = strong_lucas_test(ModulusContext(mpz_class(2047)));
    REQUIRE(outcome.result == LucasResult::Composite);
    REQUIRE(outcome.witness == 5);

    outcome = strong_lucas_test(ModulusContext(mpz_class(3215031751UL)));
    REQUIRE(outcome.result == LucasResult::Composite);
    REQUIRE(outcome.witness == 11);
}

TEST_CASE("Strong Lucas test on primes, squares and numbers with small factors") {
    LucasOutcome outcome = strong_lucas_test(ModulusContext(mpz_class(97)));
    REQUIRE(outcome.result == LucasResult::ProbablyPrime);
    REQUIRE(outcome.parameters.D == 5);

    outcome = strong_lucas_test(ModulusContext(mpz_class("2305843009213693951")));
    REQUIRE(outcome.result == LucasResult::ProbablyPrime);
    REQUIRE(outcome.parameters.D == 17);

    outcome = strong_lucas_test(ModulusContext(mpz_class(9801)));
    REQUIRE(outcome.result == LucasResult::Composite);
    REQUIRE(outcome.witness == 99);

    outcome = strong_lucas_test(ModulusContext(mpz_class(561)));
    REQUIRE(outcome.result == LucasResult::Composite);
    REQUIRE(outcome.witness == 3);
}
