#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>


extern const unsigned long DEFAULT_TRIAL_DIVISION_BOUND;  // Small prime table covers all primes up to this bound
extern const std::vector<unsigned long> DEFAULT_WITNESS_BASES;  // Strong Fermat bases (first 13 primes)
extern const unsigned int DEFAULT_EXTRA_RANDOM_BASES;  // Additional pseudo-random bases per candidate
extern const bool DEFAULT_DETERMINISTIC_UPGRADE;  // Whether ProbablyPrime may become DefinitelyPrime below proven bounds
extern const unsigned int DEFAULT_RHO_MAX_RESTARTS;  // Pollard rho attempts (different c) per residue
extern const unsigned long DEFAULT_RHO_MAX_ITERATIONS;  // Pollard rho iterations per attempt
extern const unsigned long DEFAULT_RHO_BATCH_SIZE;  // Differences multiplied together between two gcds
extern const unsigned long DEFAULT_RHO_SEED;  // First polynomial constant c of Pollard rho
extern const std::vector<unsigned long> DEFAULT_PM1_BOUNDS;  // Escalating smoothness bounds of Pollard p-1
extern const unsigned long DEFAULT_PM1_CHECKPOINT_INTERVAL;  // Exponent steps between two gcds in Pollard p-1
extern const unsigned int DEFAULT_PM1_BASES;  // Number of bases (2, 3, 5, ...) Pollard p-1 may try
extern const unsigned long long DEFAULT_MAX_OPERATIONS;  // Modular multiplications allowed in rho and p-1 (0 = unlimited)
extern const long DEFAULT_TIME_LIMIT_MS;  // Wall-clock limit of a call in milliseconds (0 = unlimited)
extern const unsigned int DEFAULT_NUM_THREADS;  // Residues resolved concurrently
extern const bool DEFAULT_PROVE_PRIMALITY;  // Whether probable primes get a Lucas (n-1) proof
extern const unsigned long DEFAULT_MAX_PROOF_BASES;  // Largest base tried while building a Lucas proof


/**
 * @struct ResourceBudget
 * @brief Cooperative limits of one factorization call. Zero means unlimited.
 */
struct ResourceBudget {
    unsigned long long max_operations = DEFAULT_MAX_OPERATIONS;
    std::chrono::milliseconds time_limit{DEFAULT_TIME_LIMIT_MS};
};


/**
 * @struct FactorizationConfig
 * @brief Tuning knobs of the factorization engine.
 */
struct FactorizationConfig {
    unsigned long trial_division_bound = DEFAULT_TRIAL_DIVISION_BOUND;
    std::vector<unsigned long> witness_bases = DEFAULT_WITNESS_BASES;
    unsigned int extra_random_bases = DEFAULT_EXTRA_RANDOM_BASES;
    bool deterministic_upgrade = DEFAULT_DETERMINISTIC_UPGRADE;
    unsigned int rho_max_restarts = DEFAULT_RHO_MAX_RESTARTS;
    unsigned long rho_max_iterations = DEFAULT_RHO_MAX_ITERATIONS;
    unsigned long rho_batch_size = DEFAULT_RHO_BATCH_SIZE;
    unsigned long rho_seed = DEFAULT_RHO_SEED;
    std::vector<unsigned long> pm1_bounds = DEFAULT_PM1_BOUNDS;
    unsigned long pm1_checkpoint_interval = DEFAULT_PM1_CHECKPOINT_INTERVAL;
    unsigned int pm1_bases = DEFAULT_PM1_BASES;
    ResourceBudget budget;
    unsigned int num_threads = DEFAULT_NUM_THREADS;
    bool prove_primality = DEFAULT_PROVE_PRIMALITY;
    unsigned long max_proof_bases = DEFAULT_MAX_PROOF_BASES;
};


/**
 * @class InvalidConfigurationException
 * @brief Custom exception thrown when a configuration value is out of range.
 */
class InvalidConfigurationException : public std::invalid_argument {
public:
    explicit InvalidConfigurationException(const std::string& message);
};


/**
 * @brief Checks every configuration value against its valid range.
 */
void validate_config(const FactorizationConfig& config);

#endif //CONFIG_H
