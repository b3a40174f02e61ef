#include <string>
#include <vector>
#include <stdexcept>

#include "config.h"
#include "small_primes.h"


const unsigned long DEFAULT_TRIAL_DIVISION_BOUND = 65536;
const std::vector<unsigned long> DEFAULT_WITNESS_BASES = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41};
const unsigned int DEFAULT_EXTRA_RANDOM_BASES = 2;
const bool DEFAULT_DETERMINISTIC_UPGRADE = true;
const unsigned int DEFAULT_RHO_MAX_RESTARTS = 8;
const unsigned long DEFAULT_RHO_MAX_ITERATIONS = 1UL << 22;
const unsigned long DEFAULT_RHO_BATCH_SIZE = 128;
const unsigned long DEFAULT_RHO_SEED = 1;
const std::vector<unsigned long> DEFAULT_PM1_BOUNDS = {1000, 10000, 100000, 1000000};
const unsigned long DEFAULT_PM1_CHECKPOINT_INTERVAL = 64;
const unsigned int DEFAULT_PM1_BASES = 3;
const unsigned long long DEFAULT_MAX_OPERATIONS = 0;
const long DEFAULT_TIME_LIMIT_MS = 0;
const unsigned int DEFAULT_NUM_THREADS = 1;
const bool DEFAULT_PROVE_PRIMALITY = false;
const unsigned long DEFAULT_MAX_PROOF_BASES = 1000;


InvalidConfigurationException::InvalidConfigurationException(const std::string& message)
        : std::invalid_argument(message) {}


/**
 * @brief Checks every configuration value against its valid range.
 *
 * @param config The configuration to check.
 * @throw InvalidConfigurationException naming the first offending value.
 */
void validate_config(const FactorizationConfig& config) {
    if (config.trial_division_bound < 2) {
        throw InvalidConfigurationException("Trial division bound must be at least 2.");
    }
    if (config.trial_division_bound > MAX_TRIAL_DIVISION_BOUND) {
        throw InvalidConfigurationException("Trial division bound must not exceed " +
                                            std::to_string(MAX_TRIAL_DIVISION_BOUND) + ".");
    }
    if (config.witness_bases.empty() && config.extra_random_bases == 0) {
        throw InvalidConfigurationException("At least one strong Fermat base is required.");
    }
    for (const unsigned long base : config.witness_bases) {
        if (base < 2) {
            throw InvalidConfigurationException("Strong Fermat bases must be at least 2, got: " + std::to_string(base));
        }
    }
    if (config.rho_max_restarts == 0) {
        throw InvalidConfigurationException("Pollard rho needs at least one attempt.");
    }
    if (config.rho_max_iterations == 0 || config.rho_batch_size == 0) {
        throw InvalidConfigurationException("Pollard rho iteration limit and batch size must be positive.");
    }
    if (config.pm1_bounds.empty()) {
        throw InvalidConfigurationException("Pollard p-1 needs at least one smoothness bound.");
    }
    unsigned long previous = 1;
    for (const unsigned long bound : config.pm1_bounds) {
        if (bound <= previous) {
            throw InvalidConfigurationException("Pollard p-1 bounds must be increasing and greater than 1.");
        }
        previous = bound;
    }
    if (config.pm1_checkpoint_interval == 0 || config.pm1_bases == 0) {
        throw InvalidConfigurationException("Pollard p-1 checkpoint interval and base count must be positive.");
    }
    if (config.budget.time_limit.count() < 0) {
        throw InvalidConfigurationException("Time limit must not be negative.");
    }
    if (config.num_threads == 0) {
        throw InvalidConfigurationException("At least one worker thread is required.");
    }
    if (config.prove_primality && config.max_proof_bases < 2) {
        throw InvalidConfigurationException("Lucas proofs need at least base 2.");
    }
}
