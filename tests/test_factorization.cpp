#include <catch2/catch.hpp>
#include <gmpxx.h>
#include <chrono>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "certificate.h"
#include "config.h"
#include "events.h"
#include "factorization.h"
#include "primality.h"
#include "small_primes.h"


static const mpz_class P36("34359739319");
static const mpz_class Q150("713623846352979940529142984724747568191404419");
static const mpz_class SMOOTH_P("62757929606400000000000001");
static const mpz_class SAFE_Q("618970019642690137449565079");
static const mpz_class M61("2305843009213693951");
static const mpz_class M89("618970019642690137449562111");


static std::vector<std::pair<mpz_class, unsigned int>> prime_powers(const FactorizationResult& result) {
    std::vector<std::pair<mpz_class, unsigned int>> powers;
    for (const Factor& f : result.factors) {
        powers.emplace_back(f.factor, f.exponent);
    }
    return powers;
}


/**
 * Records the stage names and verdicts reported during a call.
 */
class RecordingEvents : public FactoringEvents {
public:
    std::vector<std::string> splitting_stages;
    std::vector<std::string> failed_stages;
    unsigned int primes = 0;
    unsigned int composites = 0;

    void factorized(const mpz_class&, const mpz_class&, const mpz_class&, const std::string& stage) override {
        splitting_stages.push_back(stage);
    }
    void found_prime(const PrimalityCertificate&) override {
        ++primes;
    }
    void found_composite(const PrimalityCertificate&) override {
        ++composites;
    }
    void stage_failed(const std::string& stage, const mpz_class&) override {
        failed_stages.push_back(stage);
    }
};


TEST_CASE("Factoring 12") {
    const FactorizationResult result = factorize(mpz_class(12));
    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{2, 2}, {3, 1}});
    for (const Factor& f : result.factors) {
        REQUIRE(f.certificate.verdict == Verdict::DefinitelyPrime);
    }
}

TEST_CASE("Factoring the prime 97") {
    const FactorizationResult result = factorize(mpz_class(97));
    REQUIRE(result.factors.size() == 1);
    REQUIRE(result.factors.front().factor == 97);
    REQUIRE(result.factors.front().exponent == 1);
    REQUIRE(result.factors.front().certificate.verdict == Verdict::DefinitelyPrime);
}

TEST_CASE("Factoring 1 gives an empty result") {
    const FactorizationResult result = factorize(mpz_class(1));
    REQUIRE(result.factors.empty());
    REQUIRE(result.product() == 1);
}

TEST_CASE("Factoring the Carmichael number 561") {
    const FactorizationResult result = factorize(mpz_class(561));
    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{3, 1}, {11, 1}, {17, 1}});

    const PrimalityCertificate certificate = test_primality(mpz_class(561), SmallPrimeTable(65536), FactorizationConfig());
    REQUIRE(certificate.is_composite());
}

TEST_CASE("Pollard rho separates a 36-bit prime from a 150-bit prime") {
    RecordingEvents events;
    const FactorizationResult result = factorize(P36 * Q150, FactorizationConfig(), &events);
    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{P36, 1}, {Q150, 1}});
    REQUIRE(result.factors[0].certificate.verdict == Verdict::DefinitelyPrime);
    REQUIRE(result.factors[1].certificate.verdict == Verdict::ProbablyPrime);
    REQUIRE(events.splitting_stages == std::vector<std::string>{"pollard-rho"});
    REQUIRE(events.primes == 2);
    REQUIRE(events.composites == 1);
}

TEST_CASE("Pollard p-1 takes over when rho is limited to one attempt") {
    FactorizationConfig config;
    config.rho_max_restarts = 1;
    config.rho_max_iterations = 1UL << 14;
    RecordingEvents events;
    const FactorizationResult result = factorize(SMOOTH_P * SAFE_Q, config, &events);
    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{SMOOTH_P, 1}, {SAFE_Q, 1}});
    REQUIRE(events.splitting_stages == std::vector<std::string>{"pollard-pm1"});
    REQUIRE(events.failed_stages == std::vector<std::string>{"trial-division", "perfect-power", "pollard-rho"});
}

TEST_CASE("Perfect powers of large primes are merged into one factor") {
    RecordingEvents events;
    const FactorizationResult result = factorize(Q150 * Q150 * Q150, FactorizationConfig(), &events);
    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{Q150, 3}});
    REQUIRE(events.splitting_stages.front() == "perfect-power");
}

TEST_CASE("A small operation budget ends in an incomplete factorization") {
    FactorizationConfig config;
    config.budget.max_operations = 5000;
    const mpz_class n = 12 * P36 * Q150;
    try {
        factorize(n, config);
        FAIL("factorization should not complete");
    } catch (const FactorizationIncompleteException& e) {
        REQUIRE(e.input == n);
        REQUIRE(e.residue == P36 * Q150);
        REQUIRE(e.reason == IncompleteReason::OperationBudget);
        REQUIRE(e.pending.empty());
        REQUIRE(e.partial_factors.size() == 2);
        REQUIRE(e.partial_factors[0].factor == 2);
        REQUIRE(e.partial_factors[0].exponent == 2);
        REQUIRE(e.partial_factors[1].factor == 3);

        const FactorizationResult resumed = resume_factorization(e, FactorizationConfig());
        REQUIRE(prime_powers(resumed)
                == std::vector<std::pair<mpz_class, unsigned int>>{{2, 2}, {3, 1}, {P36, 1}, {Q150, 1}});
        REQUIRE(resumed.product() == n);
    }
}

TEST_CASE("A time limit ends in an incomplete factorization") {
    FactorizationConfig config;
    config.budget.time_limit = std::chrono::milliseconds(1);
    const mpz_class n = M61 * M89;
    try {
        factorize(n, config);
        FAIL("factorization should not complete");
    } catch (const FactorizationIncompleteException& e) {
        REQUIRE(e.residue == n);
        REQUIRE(e.reason == IncompleteReason::TimeLimit);
        REQUIRE(e.partial_factors.empty());
    }
}

TEST_CASE("Residues no stage can split are reported, not guessed") {
    FactorizationConfig config;
    config.rho_max_restarts = 1;
    config.rho_max_iterations = 1000;
    config.pm1_bounds = {100};
    config.pm1_bases = 1;
    const mpz_class n = 6 * P36 * Q150;
    try {
        factorize(n, config);
        FAIL("factorization should not complete");
    } catch (const FactorizationIncompleteException& e) {
        REQUIRE(e.residue == P36 * Q150);
        REQUIRE(e.reason == IncompleteReason::StagesExhausted);
        REQUIRE(e.partial_factors.size() == 2);
        REQUIRE(std::string(e.what()).find("no stage found a factor") != std::string::npos);
    }
}

TEST_CASE("Factoring is idempotent") {
    const mpz_class n = mpz_class(1024) * 243 * P36 * P36 * M61;
    const FactorizationResult first = factorize(n);
    REQUIRE(first.product() == n);
    const FactorizationResult second = factorize(first.product());
    REQUIRE(prime_powers(first) == prime_powers(second));
    REQUIRE(prime_powers(first)
            == std::vector<std::pair<mpz_class, unsigned int>>{{2, 10}, {3, 5}, {P36, 2}, {M61, 1}});
}

TEST_CASE("Returned primes are never classified composite again") {
    FactorizationConfig other_bases;
    other_bases.witness_bases = {43, 47, 53, 59};
    other_bases.extra_random_bases = 5;
    const SmallPrimeTable table(other_bases.trial_division_bound);
    for (const mpz_class& n : {mpz_class(30 * P36 * Q150), M89, mpz_class(3 * M61)}) {
        const FactorizationResult result = factorize(n);
        for (const Factor& f : result.factors) {
            REQUIRE(f.certificate.is_prime());
            REQUIRE(test_primality(f.factor, table, other_bases).is_prime());
        }
    }
}

TEST_CASE("Parallel rounds give the same factorization") {
    const std::vector<mpz_class> primes{mpz_class("2658625969"), mpz_class("2708517689"),
                                        mpz_class("2767054501"), mpz_class("3538334777")};
    mpz_class n = 1;
    for (const mpz_class& p : primes) {
        n *= p;
    }

    FactorizationConfig config;
    config.num_threads = 4;
    RecordingEvents events;
    const FactorizationResult parallel = factorize(n, config, &events);
    const FactorizationResult serial = factorize(n);
    REQUIRE(prime_powers(parallel) == prime_powers(serial));
    REQUIRE(parallel.factors.size() == 4);
    for (size_t i = 0; i < primes.size(); ++i) {
        REQUIRE(parallel.factors[i].factor == primes[i]);
        REQUIRE(parallel.factors[i].certificate.evidence == Evidence::TrialDivision);
    }
    REQUIRE(events.primes == 4);
    REQUIRE(events.splitting_stages.size() == 3);
}

TEST_CASE("Proving primes reports only the factors of the input") {
    FactorizationConfig config;
    config.prove_primality = true;
    RecordingEvents events;
    const FactorizationResult result = factorize(mpz_class(3 * M89), config, &events);

    REQUIRE(prime_powers(result) == std::vector<std::pair<mpz_class, unsigned int>>{{3, 1}, {M89, 1}});
    REQUIRE(result.factors[1].certificate.evidence == Evidence::LucasProof);
    REQUIRE(result.factors[1].certificate.proof.get(M89)->base == 3);
    REQUIRE(events.primes == result.factors.size());
    REQUIRE(events.composites == 0);
    REQUIRE(events.splitting_stages.empty());
    REQUIRE(events.failed_stages.empty());
}

TEST_CASE("Invalid input is rejected") {
    REQUIRE_THROWS_AS(factorize(mpz_class(0)), InvalidInputException);
    REQUIRE_THROWS_AS(factorize(mpz_class(-12)), InvalidInputException);
}

TEST_CASE("Invalid configurations are rejected") {
    FactorizationConfig config;
    config.trial_division_bound = 1;
    REQUIRE_THROWS_AS(factorize(mpz_class(12), config), InvalidConfigurationException);

    config = FactorizationConfig();
    config.num_threads = 0;
    REQUIRE_THROWS_AS(factorize(mpz_class(12), config), InvalidConfigurationException);

    config = FactorizationConfig();
    config.pm1_bounds = {100, 50};
    REQUIRE_THROWS_AS(factorize(mpz_class(12), config), InvalidConfigurationException);

    config = FactorizationConfig();
    config.witness_bases = {1};
    REQUIRE_THROWS_AS(factorize(mpz_class(12), config), InvalidConfigurationException);

    config = FactorizationConfig();
    config.rho_batch_size = 0;
    REQUIRE_THROWS_AS(validate_config(config), InvalidConfigurationException);

    config = FactorizationConfig();
    config.trial_division_bound = std::numeric_limits<unsigned long>::max();
    REQUIRE_THROWS_AS(validate_config(config), InvalidConfigurationException);
    REQUIRE_THROWS_AS(factorize(mpz_class(12), config), InvalidConfigurationException);

    config.trial_division_bound = MAX_TRIAL_DIVISION_BOUND + 1;
    REQUIRE_THROWS_AS(validate_config(config), InvalidConfigurationException);
}

TEST_CASE("Logging observer writes one line per event") {
    std::ostringstream log;
    LoggingFactoringEvents logger(log, true);
    const FactorizationResult result = factorize(P36 * Q150, FactorizationConfig(), &logger);
    REQUIRE(result.factors.size() == 2);
    const std::string text = log.str();
    REQUIRE(text.find("[pollard-rho]") != std::string::npos);
    REQUIRE(text.find("[prime] 34359739319: DefinitelyPrime (deterministic-bases") != std::string::npos);
    REQUIRE(text.find("[composite]") != std::string::npos);

    std::ostringstream quiet_log;
    LoggingFactoringEvents quiet(quiet_log, false);
    factorize(mpz_class(97), FactorizationConfig(), &quiet);
    REQUIRE(quiet_log.str().empty());
}
