#ifndef FACTORIZATION_H
#define FACTORIZATION_H

#include <gmpxx.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "events.h"
#include "helper.h"
#include "small_primes.h"
#include "stage.h"


/**
 * @enum IncompleteReason
 * @brief Why a factorization call stopped before every residue was resolved.
 */
enum class IncompleteReason : int {
    OperationBudget = 0,  ///< max_operations was reached
    TimeLimit,            ///< the wall-clock limit was reached
    StagesExhausted       ///< every stage gave up on a residue within its own limits
};


/**
 * @brief Readable name of an IncompleteReason.
 */
std::string incomplete_reason_name(IncompleteReason reason);


/**
 * @class InvalidInputException
 * @brief Custom exception thrown when the number to factor is not a positive integer.
 */
class InvalidInputException : public std::invalid_argument {
public:
    mpz_class n;  ///< The rejected input

    explicit InvalidInputException(const mpz_class& n);
};


/**
 * @class FactorizationIncompleteException
 * @brief Thrown when a call ends without resolving every residue. Carries enough state to resume.
 *
 * The product of the partial factors, the residue and the pending residues equals the input.
 */
class FactorizationIncompleteException : public std::runtime_error {
public:
    mpz_class input;                     ///< The number the call was asked to factor
    mpz_class residue;                   ///< The residue that could not be resolved
    std::vector<Factor> partial_factors; ///< Primes found so far, ascending
    std::vector<mpz_class> pending;      ///< Residues not yet looked at
    IncompleteReason reason;             ///< What stopped the call

    FactorizationIncompleteException(const mpz_class& input, const mpz_class& residue,
                                     const std::vector<Factor>& partial_factors, const std::vector<mpz_class>& pending,
                                     IncompleteReason reason, const std::string& detail);

    ~FactorizationIncompleteException() noexcept override = default;

private:
    static std::string create_message(const mpz_class& input, const mpz_class& residue, IncompleteReason reason,
                                      const std::string& detail);
};


/**
 * @struct FactorizationResult
 * @brief Certified factorization: prime powers ascending by prime, each prime exactly once.
 */
struct FactorizationResult {
    std::vector<Factor> factors;

    [[nodiscard]] mpz_class product() const;
    void printpp(std::ostream& out = std::cout) const;
};


/**
 * @brief Stage detecting n = k^m, m >= 2; returns the split (k, n / k).
 */
StageOutcome run_perfect_power_stage(const mpz_class& n);


/**
 * @brief The stage list in cost order: trial division, perfect power, Pollard rho, Pollard p-1.
 */
std::vector<FactoringStage> make_default_stages(const FactorizationConfig& config, const SmallPrimeTable& table);


/**
 * @brief Factors n >= 1 into certified prime powers.
 */
FactorizationResult factorize(const mpz_class& n, const FactorizationConfig& config = FactorizationConfig(),
                              FactoringEvents* events = nullptr);


/**
 * @brief Continues an incomplete factorization with a new configuration.
 */
FactorizationResult resume_factorization(const FactorizationIncompleteException& incomplete,
                                         const FactorizationConfig& config = FactorizationConfig(),
                                         FactoringEvents* events = nullptr);

#endif //FACTORIZATION_H
