#include <catch2/catch.hpp>
#include <gmpxx.h>
#include <stdexcept>

#include "config.h"
#include "modular_context.h"
#include "pollard_rho.h"
#include "stage.h"


TEST_CASE("Brent rho splits small semiprimes") {
    BudgetTracker budget(ResourceBudget{});
    RhoAttempt attempt = pollard_rho_brent(ModulusContext(mpz_class(8051)), mpz_class(1), mpz_class(2), 1UL << 22, 128,
                                           budget);
    REQUIRE(attempt.status == RhoStatus::Found);
    REQUIRE(attempt.divisor == 97);

    attempt = pollard_rho_brent(ModulusContext(mpz_class(10403)), mpz_class(1), mpz_class(2), 1UL << 22, 128, budget);
    REQUIRE(attempt.status == RhoStatus::Found);
    REQUIRE(attempt.divisor == 101);
    REQUIRE(budget.operations_used() > 0);
}

TEST_CASE("Brent rho respects the iteration limit") {
    BudgetTracker budget(ResourceBudget{});
    const mpz_class n = mpz_class("2305843009213693951") * mpz_class("618970019642690137449562111");
    const RhoAttempt attempt = pollard_rho_brent(ModulusContext(n), mpz_class(1), mpz_class(2), 1000, 128, budget);
    REQUIRE(attempt.status == RhoStatus::IterationLimit);
    REQUIRE(attempt.iterations >= 1000);
}

TEST_CASE("Brent rho stops when the budget runs out") {
    ResourceBudget limits;
    limits.max_operations = 5000;
    BudgetTracker budget(limits);
    const mpz_class n("24519929332510499615417475877619925411135832133344650661");
    const RhoAttempt attempt = pollard_rho_brent(ModulusContext(n), mpz_class(1), mpz_class(2), 1UL << 22, 128, budget);
    REQUIRE(attempt.status == RhoStatus::BudgetExhausted);
    REQUIRE(budget.exhausted());
    REQUIRE(budget.out_of_operations());
    REQUIRE_FALSE(budget.out_of_time());
}

TEST_CASE("Brent rho checks the budget while advancing the hare") {
    ResourceBudget limits;
    limits.max_operations = 1000;
    BudgetTracker budget(limits);
    const mpz_class n("24519929332510499615417475877619925411135832133344650661");
    const RhoAttempt attempt = pollard_rho_brent(ModulusContext(n), mpz_class(1), mpz_class(2), 1UL << 22, 16, budget);
    REQUIRE(attempt.status == RhoStatus::BudgetExhausted);
    // 765 operations before r = 256; the advance stops after the chunk that crosses 1000
    REQUIRE(budget.operations_used() == 1005);
}

TEST_CASE("Rho stage recovers a 36-bit factor of a 186-bit number") {
    const FactorizationConfig config;
    BudgetTracker budget(config.budget);
    const mpz_class p("34359739319");
    const mpz_class q("713623846352979940529142984724747568191404419");
    const mpz_class n = p * q;
    const StageOutcome outcome = run_pollard_rho(n, config, budget);
    REQUIRE(outcome.found);
    REQUIRE(mpz_class(outcome.divisor * outcome.cofactor) == n);
    REQUIRE((outcome.divisor == p || outcome.divisor == q));
}

TEST_CASE("Rho stage handles even and tiny residues") {
    const FactorizationConfig config;
    BudgetTracker budget(config.budget);
    StageOutcome outcome = run_pollard_rho(mpz_class(1000006), config, budget);
    REQUIRE(outcome.found);
    REQUIRE(outcome.divisor == 2);
    REQUIRE(outcome.cofactor == 500003);

    REQUIRE_FALSE(run_pollard_rho(mpz_class(3), config, budget).found);
}

TEST_CASE("Rho stage reports failure on a prime") {
    FactorizationConfig config;
    config.rho_max_restarts = 2;
    config.rho_max_iterations = 2000;
    BudgetTracker budget(config.budget);
    REQUIRE_FALSE(run_pollard_rho(mpz_class("2305843009213693951"), config, budget).found);
}

TEST_CASE("Stage outcome only accepts non-trivial divisors") {
    REQUIRE_THROWS_AS(StageOutcome::split(mpz_class(1), mpz_class(15)), std::logic_error);
    REQUIRE_THROWS_AS(StageOutcome::split(mpz_class(15), mpz_class(15)), std::logic_error);
    REQUIRE_THROWS_AS(StageOutcome::split(mpz_class(4), mpz_class(15)), std::logic_error);
    const StageOutcome outcome = StageOutcome::split(mpz_class(5), mpz_class(15));
    REQUIRE(outcome.found);
    REQUIRE(outcome.cofactor == 3);
    REQUIRE_FALSE(StageOutcome::no_factor().found);
}
