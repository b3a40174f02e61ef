#ifndef POLLARD_RHO_H
#define POLLARD_RHO_H

#include <gmpxx.h>

#include "config.h"
#include "modular_context.h"
#include "stage.h"


/**
 * @enum RhoStatus
 * @brief How a single Pollard rho attempt ended.
 */
enum class RhoStatus : int {
    Found = 0,         ///< 1 < gcd < n
    Degenerate,        ///< the cycle closed modulo n itself (gcd = n), no information
    IterationLimit,    ///< the attempt used up its iterations
    BudgetExhausted    ///< the call's resource budget ran out
};


/**
 * @struct RhoAttempt
 * @brief Result of one Pollard rho attempt.
 */
struct RhoAttempt {
    RhoStatus status = RhoStatus::IterationLimit;
    mpz_class divisor;
    unsigned long iterations = 0;
};


/**
 * @brief One Pollard rho attempt with f(x) = x^2 + c, starting at x0, using Brent's cycle detection.
 */
RhoAttempt pollard_rho_brent(const ModulusContext& ctx, const mpz_class& c, const mpz_class& x0,
                             unsigned long max_iterations, unsigned long batch_size, BudgetTracker& budget);


/**
 * @brief Pollard rho stage: up to `rho_max_restarts` attempts with different c and starting points.
 */
StageOutcome run_pollard_rho(const mpz_class& n, const FactorizationConfig& config, BudgetTracker& budget);

#endif //POLLARD_RHO_H
