#include <gmpxx.h>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <iostream>
#include <list>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "certificate.h"
#include "config.h"
#include "events.h"
#include "factorization.h"
#include "helper.h"
#include "lucas_proof.h"
#include "pollard_pm1.h"
#include "pollard_rho.h"
#include "primality.h"
#include "small_primes.h"
#include "stage.h"
#include "trial_division.h"


std::string incomplete_reason_name(const IncompleteReason reason) {
    switch (reason) {
        case IncompleteReason::OperationBudget: return "operation budget exhausted";
        case IncompleteReason::TimeLimit: return "time limit reached";
        case IncompleteReason::StagesExhausted: return "no stage found a factor";
    }
    return "unknown";
}


InvalidInputException::InvalidInputException(const mpz_class& n)
        : std::invalid_argument("Input must be a positive integer, got: " + n.get_str()), n(n) {}


FactorizationIncompleteException::FactorizationIncompleteException(
        const mpz_class& input, const mpz_class& residue, const std::vector<Factor>& partial_factors,
        const std::vector<mpz_class>& pending, const IncompleteReason reason, const std::string& detail)
        : std::runtime_error(create_message(input, residue, reason, detail)), input(input), residue(residue),
          partial_factors(partial_factors), pending(pending), reason(reason) {}

std::string FactorizationIncompleteException::create_message(const mpz_class& input, const mpz_class& residue,
                                                             const IncompleteReason reason, const std::string& detail) {
    std::string message(
        "Factorization of " + input.get_str()
        + " incomplete (" + incomplete_reason_name(reason)
        + "), unresolved residue: " + residue.get_str());
    if (!detail.empty()) {
        message += "; " + detail;
    }
    return message;
}


mpz_class FactorizationResult::product() const {
    mpz_class product = 1;
    mpz_class power;
    for (const Factor& f : factors) {
        mpz_pow_ui(power.get_mpz_t(), f.factor.get_mpz_t(), f.exponent);
        product *= power;
    }
    return product;
}

void FactorizationResult::printpp(std::ostream& out) const {
    for (const Factor& f : factors) {
        f.printpp(out);
    }
    out << std::endl;
}


/**
 * @brief Stage detecting n = k^m, m >= 2; returns the split (k, n / k).
 *
 * k is the smallest base, so k itself is not a perfect power.
 *
 * @param n The composite residue.
 * @return StageOutcome The split (k, k^(m-1)), or no factor if n is not a perfect power.
 */
StageOutcome run_perfect_power_stage(const mpz_class& n) {
    if (n < 4 || mpz_perfect_power_p(n.get_mpz_t()) == 0) {
        return StageOutcome::no_factor();
    }
    const mpz_class base = get_smallest_base_biggest_exponent_for_perfect_power(n).first;
    return StageOutcome::split(base, n);
}


/**
 * @brief The stage list in cost order: trial division, perfect power, Pollard rho, Pollard p-1.
 *
 * The stages refer to `config` and `table`, which must outlive the returned list.
 *
 * @param config Limits of the rho and p-1 stages.
 * @param table Primes for trial division.
 * @return std::vector<FactoringStage> The stages, cheapest first.
 */
std::vector<FactoringStage> make_default_stages(const FactorizationConfig& config, const SmallPrimeTable& table) {
    std::vector<FactoringStage> stages;
    stages.push_back({"trial-division", [&table](const mpz_class& n, BudgetTracker&) {
        return run_trial_division_stage(n, table);
    }});
    stages.push_back({"perfect-power", [](const mpz_class& n, BudgetTracker&) {
        return run_perfect_power_stage(n);
    }});
    stages.push_back({"pollard-rho", [&config](const mpz_class& n, BudgetTracker& budget) {
        return run_pollard_rho(n, config, budget);
    }});
    stages.push_back({"pollard-pm1", [&config](const mpz_class& n, BudgetTracker& budget) {
        return run_pollard_pm1(n, config, budget);
    }});
    return stages;
}


/**
 * @struct Resolution
 * @brief What happened to one residue taken off the work-list.
 */
struct Resolution {
    enum class Kind : int { Prime, Split, Stuck } kind = Kind::Stuck;
    mpz_class residue;
    StageOutcome split;
    IncompleteReason reason = IncompleteReason::StagesExhausted;
};


/**
 * @class Factorizer
 * @brief Mutable state of one factorization call: the work-list and the primes merged so far.
 *
 * Residues are resolved one at a time, or num_threads at a time in rounds. Merging primes and
 * invoking the observer both happen under `lock`, which nested proof runs share.
 */
class Factorizer {
private:
    const FactorizationConfig& config;
    const SmallPrimeTable& table;
    FactoringEvents* events;
    BudgetTracker& budget;
    std::mutex& lock;
    std::vector<FactoringStage> stages;
    std::vector<mpz_class> work;
    std::map<mpz_class, Factor> found;

public:
    Factorizer(const FactorizationConfig& config, const SmallPrimeTable& table, FactoringEvents* events,
               BudgetTracker& budget, std::mutex& lock);

    void add_factor(const Factor& factor);
    std::vector<mpz_class> seed(const mpz_class& input);
    FactorizationResult run(const mpz_class& input, const std::vector<mpz_class>& residues);

private:
    Resolution resolve(const mpz_class& n);
    void resolve_in_thread(const mpz_class& n, Resolution& resolution, std::exception_ptr& failure);
    std::vector<Resolution> resolve_round(const std::vector<mpz_class>& round);
    PrimalityCertificate prove(const PrimalityCertificate& certificate);
    bool count_known_prime(const mpz_class& n);
    void merge_prime(const PrimalityCertificate& certificate);
    void abandon_proof(const mpz_class& n, const std::string& reason);
    [[nodiscard]] IncompleteReason budget_reason() const;
    [[nodiscard]] std::vector<Factor> collect() const;
};


Factorizer::Factorizer(const FactorizationConfig& config, const SmallPrimeTable& table, FactoringEvents* events,
                       BudgetTracker& budget, std::mutex& lock)
        : config(config), table(table), events(events), budget(budget), lock(lock),
          stages(make_default_stages(config, table)) {
}


/**
 * @brief Adds a prime power found earlier (e.g. by an incomplete call being resumed).
 */
void Factorizer::add_factor(const Factor& factor) {
    std::lock_guard<std::mutex> guard(lock);
    auto it = found.find(factor.factor);
    if (it == found.end()) {
        found.emplace(factor.factor, factor);
    } else {
        it->second.exponent += factor.exponent;
    }
}


/**
 * @brief Strips the table primes from the input and returns the residue left for the work-list.
 *
 * @param input The number to factor, >= 1.
 * @return std::vector<mpz_class> The remaining cofactor, or nothing if it is 1.
 */
std::vector<mpz_class> Factorizer::seed(const mpz_class& input) {
    mpz_class rest = input;
    const std::list<Factor> small = trial_division_bounded(rest, table);
    for (const Factor& f : small) {
        add_factor(f);
        if (events != nullptr) {
            std::lock_guard<std::mutex> guard(lock);
            events->found_prime(f.certificate);
        }
    }
    if (rest > 1) {
        return {rest};
    }
    return {};
}


/**
 * @brief Resolves every residue, then checks that the primes multiply back to the input.
 *
 * Each pass takes up to num_threads residues off the work-list. A split pushes both halves
 * back; a prime is merged into the result. The budget is checked before every pass.
 *
 * @param input The number being factored.
 * @param residues Initial work-list.
 * @return FactorizationResult The primes found, ascending.
 * @throw FactorizationIncompleteException if the budget runs out or a residue cannot be split.
 * @throw std::logic_error if the primes do not multiply back to the input.
 */
FactorizationResult Factorizer::run(const mpz_class& input, const std::vector<mpz_class>& residues) {
    for (const mpz_class& r : residues) {
        if (r > 1) {
            work.push_back(r);
        }
    }

    const size_t threads = std::max(1U, config.num_threads);
    while (!work.empty()) {
        if (budget.exhausted()) {
            const mpz_class residue = work.back();
            work.pop_back();
            throw FactorizationIncompleteException(input, residue, collect(), work, budget_reason(),
                                                   budget.describe());
        }

        const size_t batch = std::min(threads, work.size());
        const std::vector<mpz_class> round(work.end() - static_cast<std::ptrdiff_t>(batch), work.end());
        work.resize(work.size() - batch);

        std::vector<Resolution> resolutions;
        if (batch == 1) {
            resolutions.push_back(resolve(round.front()));
        } else {
            resolutions = resolve_round(round);
        }

        const Resolution* stuck = nullptr;
        std::vector<mpz_class> unresolved;
        for (const Resolution& resolution : resolutions) {
            if (resolution.kind == Resolution::Kind::Split) {
                work.push_back(resolution.split.cofactor);
                work.push_back(resolution.split.divisor);
            } else if (resolution.kind == Resolution::Kind::Stuck) {
                if (stuck == nullptr) {
                    stuck = &resolution;
                } else {
                    unresolved.push_back(resolution.residue);
                }
            }
        }
        if (stuck != nullptr) {
            unresolved.insert(unresolved.begin(), work.begin(), work.end());
            throw FactorizationIncompleteException(input, stuck->residue, collect(), unresolved, stuck->reason,
                                                   budget.describe());
        }
    }

    FactorizationResult result;
    result.factors = collect();
    if (result.product() != input) {
        throw std::logic_error("Product of the factors " + result.product().get_str()
                               + " does not match the input " + input.get_str());
    }
    return result;
}


/**
 * @brief Classifies one residue and, if it is composite, runs the stages until one splits it.
 *
 * @param n Residue > 1.
 * @return Resolution Prime (already merged), Split, or Stuck with the reason.
 */
Resolution Factorizer::resolve(const mpz_class& n) {
    Resolution resolution;
    resolution.residue = n;

    if (count_known_prime(n)) {
        resolution.kind = Resolution::Kind::Prime;
        return resolution;
    }

    PrimalityCertificate certificate = test_primality(n, table, config);
    if (certificate.verdict == Verdict::ProbablyPrime && config.prove_primality) {
        certificate = prove(certificate);
    }
    if (certificate.is_prime()) {
        merge_prime(certificate);
        resolution.kind = Resolution::Kind::Prime;
        return resolution;
    }
    if (events != nullptr) {
        std::lock_guard<std::mutex> guard(lock);
        events->found_composite(certificate);
    }

    for (const FactoringStage& stage : stages) {
        if (budget.exhausted()) {
            resolution.kind = Resolution::Kind::Stuck;
            resolution.reason = budget_reason();
            return resolution;
        }
        const StageOutcome outcome = stage.run(n, budget);
        if (outcome.found) {
            if (events != nullptr) {
                std::lock_guard<std::mutex> guard(lock);
                events->factorized(n, outcome.divisor, outcome.cofactor, stage.name);
            }
            resolution.kind = Resolution::Kind::Split;
            resolution.split = outcome;
            return resolution;
        }
        if (events != nullptr) {
            std::lock_guard<std::mutex> guard(lock);
            events->stage_failed(stage.name, n);
        }
    }

    resolution.kind = Resolution::Kind::Stuck;
    resolution.reason = budget.exhausted() ? budget_reason() : IncompleteReason::StagesExhausted;
    return resolution;
}


/**
 * @brief Runs `resolve` in a worker thread, handing any exception back to the joining thread.
 */
void Factorizer::resolve_in_thread(const mpz_class& n, Resolution& resolution, std::exception_ptr& failure) {
    try {
        resolution = resolve(n);
    } catch (...) {
        failure = std::current_exception();
    }
}


/**
 * @brief Resolves the residues of one round concurrently, one thread each.
 *
 * @param round Residues taken off the work-list.
 * @return std::vector<Resolution> One resolution per residue, in the same order.
 * @throw The first exception raised by a worker, after all of them have been joined.
 */
std::vector<Resolution> Factorizer::resolve_round(const std::vector<mpz_class>& round) {
    std::vector<Resolution> resolutions(round.size());
    std::vector<std::exception_ptr> failures(round.size());
    std::vector<std::thread> threads;

    for (size_t i = 0; i < round.size(); ++i) {
        threads.emplace_back(&Factorizer::resolve_in_thread, this, std::cref(round[i]), std::ref(resolutions[i]),
                             std::ref(failures[i]));
    }

    // Wait for all threads to complete
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }

    for (const std::exception_ptr& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return resolutions;
}


/**
 * @brief Tries to turn a probable prime into a proven one with a Lucas (n-1) proof.
 *
 * n - 1 is factored by a nested single-threaded run sharing this call's budget and table. The
 * nested run has no observer: the primes of n - 1 are not factors of the input. Its
 * prime factors must all be DefinitelyPrime; their chains are merged into the new one. Then the
 * bases 2..max_proof_bases are searched for a primitive root.
 *
 * @param certificate The ProbablyPrime certificate of n.
 * @return PrimalityCertificate LucasProof if the proof closed, Composite with a Fermat witness
 *         if a base showed n composite, otherwise the unchanged certificate.
 */
PrimalityCertificate Factorizer::prove(const PrimalityCertificate& certificate) {
    const mpz_class& n = certificate.n;

    FactorizationConfig nested_config = config;
    nested_config.num_threads = 1;
    Factorizer nested(nested_config, table, nullptr, budget, lock);

    const mpz_class n_minus_one = n - 1;
    FactorizationResult n_minus_one_factors;
    try {
        n_minus_one_factors = nested.run(n_minus_one, nested.seed(n_minus_one));
    } catch (const FactorizationIncompleteException& e) {
        abandon_proof(n, std::string("n - 1 not factored: ") + e.what());
        return certificate;
    }

    std::vector<mpz_class> divisors;
    LucasCertificate chain;
    for (const Factor& f : n_minus_one_factors.factors) {
        if (f.certificate.verdict != Verdict::DefinitelyPrime) {
            abandon_proof(n, "divisor " + f.factor.get_str() + " of n - 1 is only probably prime");
            return certificate;
        }
        divisors.push_back(f.factor);
        chain.merge(f.certificate.proof);
    }

    const LucasBaseSearch search = search_lucas_base(n, divisors, config.max_proof_bases);
    if (search.result == LucasProofResult::Composite) {
        PrimalityCertificate composite(n, Verdict::Composite, Evidence::FermatWitness);
        composite.witness = search.base;
        return composite;
    }
    if (search.result == LucasProofResult::Unknown) {
        abandon_proof(n, "no base up to " + std::to_string(config.max_proof_bases) + " is a primitive root");
        return certificate;
    }

    PrimalityCertificate proven = certificate;
    proven.verdict = Verdict::DefinitelyPrime;
    proven.evidence = Evidence::LucasProof;
    chain.push({n, search.base, divisors});
    proven.proof = chain;
    return proven;
}


/**
 * @brief If n was already found prime, raises its exponent and returns true.
 */
bool Factorizer::count_known_prime(const mpz_class& n) {
    std::lock_guard<std::mutex> guard(lock);
    auto it = found.find(n);
    if (it == found.end()) {
        return false;
    }
    ++it->second.exponent;
    return true;
}


void Factorizer::merge_prime(const PrimalityCertificate& certificate) {
    std::lock_guard<std::mutex> guard(lock);
    auto it = found.find(certificate.n);
    if (it == found.end()) {
        found.emplace(certificate.n, Factor(certificate.n, 1, certificate));
    } else {
        ++it->second.exponent;
    }
    if (events != nullptr) {
        events->found_prime(certificate);
    }
}


void Factorizer::abandon_proof(const mpz_class& n, const std::string& reason) {
    if (events != nullptr) {
        std::lock_guard<std::mutex> guard(lock);
        events->proof_abandoned(n, reason);
    }
}


IncompleteReason Factorizer::budget_reason() const {
    return budget.out_of_operations() ? IncompleteReason::OperationBudget : IncompleteReason::TimeLimit;
}


std::vector<Factor> Factorizer::collect() const {
    std::vector<Factor> factors;
    factors.reserve(found.size());
    for (const auto& [prime, f] : found) {
        factors.push_back(f);
    }
    return factors;
}


/**
 * @brief Factors n >= 1 into certified prime powers.
 *
 * Small primes are stripped by trial division first. Every remaining residue goes through the
 * primality oracle; composites are handed to the stages of make_default_stages in order until
 * one splits them, and both halves return to the work-list. The call either returns the complete
 * factorization or throws; it never returns a partial result.
 *
 * @param n The number to factor. 1 gives an empty result.
 * @param config Tuning and budget; checked with validate_config.
 * @param events Optional observer, may be nullptr.
 * @return FactorizationResult The prime powers of n, ascending.
 * @throw InvalidInputException if n < 1.
 * @throw InvalidConfigurationException if config is out of range.
 * @throw FactorizationIncompleteException if the budget runs out or every stage fails on a residue.
 */
FactorizationResult factorize(const mpz_class& n, const FactorizationConfig& config, FactoringEvents* events) {
    if (n < 1) {
        throw InvalidInputException(n);
    }
    validate_config(config);

    const SmallPrimeTable table(config.trial_division_bound);
    BudgetTracker budget(config.budget);
    std::mutex lock;
    Factorizer factorizer(config, table, events, budget, lock);
    return factorizer.run(n, factorizer.seed(n));
}


/**
 * @brief Continues an incomplete factorization with a new configuration.
 *
 * The partial factors are taken over as they are; the unresolved residue and the pending ones
 * are factored with a fresh budget.
 *
 * @param incomplete The exception thrown by the earlier call.
 * @param config Tuning and budget for the continuation, typically with a larger budget.
 * @param events Optional observer, may be nullptr.
 * @return FactorizationResult The complete factorization of the original input.
 * @throw InvalidConfigurationException if config is out of range.
 * @throw FactorizationIncompleteException if the continuation is incomplete too.
 */
FactorizationResult resume_factorization(const FactorizationIncompleteException& incomplete,
                                         const FactorizationConfig& config, FactoringEvents* events) {
    validate_config(config);

    const SmallPrimeTable table(config.trial_division_bound);
    BudgetTracker budget(config.budget);
    std::mutex lock;
    Factorizer factorizer(config, table, events, budget, lock);
    for (const Factor& f : incomplete.partial_factors) {
        factorizer.add_factor(f);
    }
    std::vector<mpz_class> residues{incomplete.residue};
    residues.insert(residues.end(), incomplete.pending.begin(), incomplete.pending.end());
    return factorizer.run(incomplete.input, residues);
}
