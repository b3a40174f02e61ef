#ifndef POLLARD_PM1_H
#define POLLARD_PM1_H

#include <gmpxx.h>
#include <vector>

#include "config.h"
#include "modular_context.h"
#include "stage.h"


/**
 * @enum Pm1Status
 * @brief How a Pollard p-1 run with one base ended.
 */
enum class Pm1Status : int {
    Found = 0,         ///< 1 < gcd(a - 1, n) < n
    Degenerate,        ///< every prime factor was caught at the same exponent (gcd = n)
    BoundReached,      ///< the largest bound of the schedule was reached without a factor
    BudgetExhausted    ///< the call's resource budget ran out
};


/**
 * @struct Pm1Attempt
 * @brief Result of a Pollard p-1 run with one base.
 */
struct Pm1Attempt {
    Pm1Status status = Pm1Status::BoundReached;
    mpz_class divisor;
    unsigned long last_exponent = 0;  ///< Last k multiplied into the exponent
};


/**
 * @brief Pollard p-1 with base a: a^(B!) mod n, the bound B escalating through `bounds`.
 */
Pm1Attempt pollard_pm1(const ModulusContext& ctx, const mpz_class& base, const std::vector<unsigned long>& bounds,
                       unsigned long checkpoint_interval, BudgetTracker& budget);


/**
 * @brief Pollard p-1 stage: tries the first `pm1_bases` primes as bases until one gives a factor.
 */
StageOutcome run_pollard_pm1(const mpz_class& n, const FactorizationConfig& config, BudgetTracker& budget);

#endif //POLLARD_PM1_H
