#include <gmpxx.h>
#include <chrono>
#include <stdexcept>
#include <string>

#include "stage.h"


BudgetTracker::BudgetTracker(const ResourceBudget& budget)
        : budget(budget), start(std::chrono::steady_clock::now()), used(0) {
}

void BudgetTracker::charge(const unsigned long long operations) {
    used.fetch_add(operations, std::memory_order_relaxed);
}

/**
 * @brief Whether the operation count or the wall-clock limit has been reached.
 */
bool BudgetTracker::exhausted() const {
    return out_of_operations() || out_of_time();
}

bool BudgetTracker::out_of_operations() const {
    return budget.max_operations > 0 && operations_used() >= budget.max_operations;
}

bool BudgetTracker::out_of_time() const {
    return budget.time_limit.count() > 0 && elapsed() >= budget.time_limit;
}

unsigned long long BudgetTracker::operations_used() const {
    return used.load(std::memory_order_relaxed);
}

std::chrono::milliseconds BudgetTracker::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

/**
 * @brief Summarizes usage, e.g. `5012 of 5000 operations, 3 ms`.
 */
std::string BudgetTracker::describe() const {
    std::string text = std::to_string(operations_used());
    if (budget.max_operations > 0) {
        text += " of " + std::to_string(budget.max_operations);
    }
    text += " operations, " + std::to_string(elapsed().count()) + " ms";
    if (budget.time_limit.count() > 0) {
        text += " of " + std::to_string(budget.time_limit.count()) + " ms";
    }
    return text;
}


/**
 * @brief Builds the outcome for a non-trivial divisor of n.
 *
 * @param divisor The divisor d, 1 < d < n.
 * @param n The residue it divides.
 * @return StageOutcome holding d and n / d.
 * @throw std::logic_error if d is not a non-trivial divisor of n.
 */
StageOutcome StageOutcome::split(const mpz_class& divisor, const mpz_class& n) {
    if (divisor <= 1 || divisor >= n || !mpz_divisible_p(n.get_mpz_t(), divisor.get_mpz_t())) {
        throw std::logic_error(divisor.get_str() + " is not a non-trivial divisor of " + n.get_str());
    }
    StageOutcome outcome;
    outcome.found = true;
    outcome.divisor = divisor;
    outcome.cofactor = n / divisor;
    return outcome;
}

StageOutcome StageOutcome::no_factor() {
    return {};
}
