#include <iostream>
#include <string>
#include <cstdlib>
#include <gmpxx.h>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "config.h"
#include "events.h"
#include "factorization.h"
#include "helper.h"


const int EXIT_INCOMPLETE = 2;  // Exit status when the budget ran out before the factorization was complete


/**
 * @brief Builds the p-1 bound schedule with the given ceiling.
 *
 * Keeps the default bounds below the ceiling and ends the schedule with the ceiling itself.
 *
 * @param ceiling Largest smoothness bound, > 1.
 * @return std::vector<unsigned long> Increasing bounds ending with `ceiling`.
 */
std::vector<unsigned long> pm1_schedule_up_to(const unsigned long ceiling) {
    std::vector<unsigned long> bounds;
    for (const unsigned long bound : DEFAULT_PM1_BOUNDS) {
        if (bound < ceiling) {
            bounds.push_back(bound);
        }
    }
    bounds.push_back(ceiling);
    return bounds;
}


/**
 * @brief Prints each prime power with the verdict of its certificate, one per line.
 */
void print_factors(const FactorizationResult& result) {
    for (const Factor& f : result.factors) {
        std::cout << f.factor;
        if (f.exponent > 1) {
            std::cout << "^" << f.exponent;
        }
        std::cout << " [" << verdict_name(f.certificate.verdict) << ", "
                  << evidence_name(f.certificate.evidence) << "]" << std::endl;
    }
}


/**
 * @brief Main function for the factorization program.
 *
 * Reads a natural number from standard input, factors it and prints its prime powers together
 * with the verdict of each primality certificate.
 *
 * ## Command-line Parameters
 *
 * All parameters are optional:
 *
 * 1. `--trial_bound` or `-t` (positive integer): bound of the small prime table.
 *    Defaults to `DEFAULT_TRIAL_DIVISION_BOUND`.
 * 2. `--rho_restarts` or `-r` (positive integer): Pollard rho attempts per residue.
 *    Defaults to `DEFAULT_RHO_MAX_RESTARTS`.
 * 3. `--rho_iterations` or `-i` (positive integer): Pollard rho iterations per attempt.
 *    Defaults to `DEFAULT_RHO_MAX_ITERATIONS`.
 * 4. `--pm1_bound` or `-b` (positive integer): ceiling of the Pollard p-1 bound schedule.
 *    Defaults to the last entry of `DEFAULT_PM1_BOUNDS`.
 * 5. `--max_ops` or `-o` (positive integer): modular multiplications allowed (0 = unlimited).
 * 6. `--time_limit_ms` or `-l` (positive integer): wall-clock limit in milliseconds (0 = unlimited).
 * 7. `--threads` or `-p` (positive integer): residues resolved concurrently. At most 100.
 * 8. `--prove` or `-c` (boolean flag): prove probable primes with a Lucas (n-1) proof.
 * 9. `--verbose` or `-v` (boolean flag): log every stage and verdict to standard error.
 *
 * ## Exit status
 *
 * 0 on success, 1 on invalid input or parameters, 2 if the factorization is incomplete.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line arguments.
 * @return int Program exit status.
 */
int main(int argc, char *argv[]) {
    FactorizationConfig config;
    bool verbose = false;

    // Parse command-line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc && is_positive_integer(argv[i + 1]);
        try {
            if (arg == "--trial_bound" || arg == "-t") {
                if (has_value) config.trial_division_bound = std::stoul(argv[++i]);
                else {
                    std::cerr << "Error: --trial_bound/-t requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--rho_restarts" || arg == "-r") {
                if (has_value) config.rho_max_restarts = static_cast<unsigned int>(std::stoul(argv[++i]));
                else {
                    std::cerr << "Error: --rho_restarts/-r requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--rho_iterations" || arg == "-i") {
                if (has_value) config.rho_max_iterations = std::stoul(argv[++i]);
                else {
                    std::cerr << "Error: --rho_iterations/-i requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--pm1_bound" || arg == "-b") {
                if (has_value) config.pm1_bounds = pm1_schedule_up_to(std::stoul(argv[++i]));
                else {
                    std::cerr << "Error: --pm1_bound/-b requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--max_ops" || arg == "-o") {
                if (has_value) config.budget.max_operations = std::stoull(argv[++i]);
                else {
                    std::cerr << "Error: --max_ops/-o requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--time_limit_ms" || arg == "-l") {
                if (has_value) config.budget.time_limit = std::chrono::milliseconds(std::stol(argv[++i]));
                else {
                    std::cerr << "Error: --time_limit_ms/-l requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--threads" || arg == "-p") {
                if (has_value) {
                    config.num_threads = static_cast<unsigned int>(std::stoul(argv[++i]));
                    if (config.num_threads > 100) {
                        std::cerr << "Error: Number of threads should not exceed 100." << std::endl;
                        return EXIT_FAILURE;
                    }
                } else {
                    std::cerr << "Error: --threads/-p requires a positive integer value." << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (arg == "--prove" || arg == "-c") {
                config.prove_primality = true;  // Boolean flag, no value expected
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else {
                std::cerr << "Error: Unknown parameter " << arg << std::endl;
                return EXIT_FAILURE;
            }
        } catch (const std::out_of_range&) {
            std::cerr << "Error: Value of " << arg << " is too large." << std::endl;
            return EXIT_FAILURE;
        }
    }

    try {
        validate_config(config);
    } catch (const InvalidConfigurationException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Get user input
    std::cout << "Which natural number should be factored?" << std::endl;
    std::cout << "Input N:  ";
    std::string number_as_string;
    std::cin >> number_as_string;
    if (!is_positive_integer(number_as_string)) {
        std::cerr << "Error: Input must be a positive integer." << std::endl;
        return EXIT_FAILURE;
    }
    const mpz_class N(number_as_string);
    std::cout << "Valid input received. The program will attempt to factor: " << N.get_str()
              << " (" << get_number_of_decimal_digits(N) << " digits)" << std::endl;

    LoggingFactoringEvents logger(std::clog, true);
    FactoringEvents* events = verbose ? &logger : nullptr;

    // Start timing ---------
    std::chrono::time_point<std::chrono::high_resolution_clock> start = std::chrono::high_resolution_clock::now();

    FactorizationResult result;
    try {
        result = factorize(N, config, events);
    } catch (const InvalidInputException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const FactorizationIncompleteException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Factors found so far: ";
        for (const Factor& f : e.partial_factors) {
            f.printpp(std::cerr);
        }
        std::cerr << std::endl;
        return EXIT_INCOMPLETE;
    }

    // Stop timing ----------
    std::chrono::time_point<std::chrono::high_resolution_clock> end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> float_ms = end - start;
    std::cout << "Factorization in " << float_ms.count() << " milliseconds completed" << std::endl;

    std::cout << "Found Factorization:\n";
    print_factors(result);

    return EXIT_SUCCESS; // Program completed successfully
}
