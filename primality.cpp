#include <gmpxx.h>
#include <vector>
#include <algorithm>
#include <string>

#include "primality.h"
#include "certificate.h"
#include "config.h"
#include "lucas.h"
#include "miller_rabin.h"
#include "modular_context.h"
#include "small_primes.h"


// psi_k: smallest strong pseudoprime to all of the first k prime bases
// (Jaeschke 1993, Zhang 2001, Jiang & Deng 2014, Sorenson & Webster 2015).
static const unsigned long FIRST_PRIMES[] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41};
static const char* const PSI[] = {
        "2047",
        "1373653",
        "25326001",
        "3215031751",
        "2152302898747",
        "3474749660383",
        "341550071728321",
        "341550071728321",
        "3825123056546413051",
        "3825123056546413051",
        "3825123056546413051",
        "318665857834031151167461",
        "3317044064679887385961981"
};

// No base-2 strong pseudoprime below 2^64 is also a strong Lucas pseudoprime (Feitsma & Galway, Gilchrist).
static const mpz_class BPSW_VERIFIED_BOUND = mpz_class(1) << 64;


/**
 * @brief Largest n for which the strong Fermat test with the given bases is proven exhaustive.
 *
 * Looks for the longest prefix 2, 3, 5, ... of the primes contained in `bases`. With the first k
 * primes as bases, every composite n < psi_k is detected.
 *
 * @param bases The strong Fermat bases (any order, duplicates allowed).
 * @return mpz_class psi_k for the longest prefix k, or 0 if base 2 is missing.
 */
mpz_class deterministic_bound(const std::vector<unsigned long>& bases) {
    size_t k = 0;
    for (const unsigned long prime : FIRST_PRIMES) {
        if (std::find(bases.begin(), bases.end(), prime) == bases.end()) {
            break;
        }
        ++k;
    }
    if (k == 0) {
        return 0;
    }
    return mpz_class(PSI[k - 1]);
}


/**
 * @brief The bases the oracle tests n with.
 *
 * The configured bases come first, followed by `extra_random_bases` bases drawn uniformly from
 * [2, n - 2] with a GMP random state seeded by n itself, so repeated queries give the same answer.
 *
 * @param n The odd candidate, n > 3.
 * @param config Source of the base list and the number of extra bases.
 * @return std::vector<mpz_class> The bases, in the order they will be tried.
 */
std::vector<mpz_class> select_witness_bases(const mpz_class& n, const FactorizationConfig& config) {
    std::vector<mpz_class> bases;
    for (const unsigned long base : config.witness_bases) {
        bases.emplace_back(base);
    }
    if (config.extra_random_bases > 0 && n > 4) {
        gmp_randclass state(gmp_randinit_default);
        state.seed(n);
        const mpz_class range = n - 3;
        for (unsigned int i = 0; i < config.extra_random_bases; ++i) {
            bases.emplace_back(state.get_z_range(range) + 2);
        }
    }
    return bases;
}


/**
 * @brief Classifies n as Composite, ProbablyPrime or DefinitelyPrime and records the evidence.
 *
 * The checks run in order and the first one that decides is terminal:
 * n < 2; n = 2 or 3; n even; trial division by the small prime table (a divisor proves
 * compositeness, a table entry or n < (bound + 1)^2 proves primality); perfect square;
 * strong Fermat test for every base; strong Lucas test. A number passing both tests is
 * ProbablyPrime, upgraded to DefinitelyPrime only below the proven bound of the base set, or
 * below 2^64 when base 2 was among the bases (and only if `config.deterministic_upgrade`).
 *
 * @param n The integer to classify.
 * @param table Small primes used for trial division.
 * @param config Bases and the upgrade switch.
 * @return PrimalityCertificate The verdict together with the evidence behind it.
 */
PrimalityCertificate test_primality(const mpz_class& n, const SmallPrimeTable& table, const FactorizationConfig& config) {
    if (n < 2) {
        return {n, Verdict::Composite, Evidence::BelowTwo};
    }
    if (n == 2 || n == 3) {
        return {n, Verdict::DefinitelyPrime, Evidence::SmallPrime};
    }
    if (mpz_even_p(n.get_mpz_t())) {
        PrimalityCertificate certificate(n, Verdict::Composite, Evidence::EvenNumber);
        certificate.witness = 2;
        return certificate;
    }
    if (table.contains(n)) {
        return {n, Verdict::DefinitelyPrime, Evidence::SmallPrime};
    }

    // Trial division; stop at sqrt(n), past which no divisor is left to find
    const mpz_class root = sqrt(n);
    for (const unsigned long p : table.primes()) {
        if (root < p) {
            return {n, Verdict::DefinitelyPrime, Evidence::TrialDivision};
        }
        if (mpz_divisible_ui_p(n.get_mpz_t(), p)) {
            PrimalityCertificate certificate(n, Verdict::Composite, Evidence::TrialDivisor);
            certificate.witness = p;
            return certificate;
        }
    }
    if (table.proves_by_trial_division(n)) {
        return {n, Verdict::DefinitelyPrime, Evidence::TrialDivision};
    }

    if (root * root == n) {
        PrimalityCertificate certificate(n, Verdict::Composite, Evidence::PerfectSquare);
        certificate.witness = root;
        return certificate;
    }

    const ModulusContext ctx(n);
    PrimalityCertificate certificate(n, Verdict::ProbablyPrime, Evidence::BailliePsw);
    for (const mpz_class& base : select_witness_bases(n, config)) {
        if (strong_fermat_test(ctx, base) == WitnessResult::Composite) {
            certificate.verdict = Verdict::Composite;
            certificate.evidence = Evidence::StrongFermat;
            certificate.witness = base;
            return certificate;
        }
        certificate.fermat_bases.push_back(base);
    }

    const LucasOutcome lucas = strong_lucas_test(ctx);
    if (lucas.result == LucasResult::Composite) {
        certificate.verdict = Verdict::Composite;
        certificate.evidence = Evidence::StrongLucas;
        certificate.witness = lucas.witness;
        certificate.lucas = lucas.parameters;
        return certificate;
    }
    certificate.lucas_tested = true;
    certificate.lucas = lucas.parameters;

    if (!config.deterministic_upgrade) {
        return certificate;
    }
    if (n < deterministic_bound(config.witness_bases)) {
        certificate.verdict = Verdict::DefinitelyPrime;
        certificate.evidence = Evidence::DeterministicBases;
    } else if (n < BPSW_VERIFIED_BOUND
               && std::find(config.witness_bases.begin(), config.witness_bases.end(), 2UL) != config.witness_bases.end()) {
        certificate.verdict = Verdict::DefinitelyPrime;
        certificate.evidence = Evidence::BailliePswBound;
    }
    return certificate;
}
