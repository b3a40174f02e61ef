#ifndef STAGE_H
#define STAGE_H

#include <gmpxx.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "config.h"


/**
 * @class BudgetTracker
 * @brief Counts the work of one factorization call against its ResourceBudget.
 *
 * The operation counter is atomic so that workers resolving different residues can share one tracker.
 */
class BudgetTracker {
private:
    ResourceBudget budget;
    std::chrono::steady_clock::time_point start;
    std::atomic<unsigned long long> used;

public:
    explicit BudgetTracker(const ResourceBudget& budget);

    void charge(unsigned long long operations);
    [[nodiscard]] bool exhausted() const;
    [[nodiscard]] bool out_of_operations() const;
    [[nodiscard]] bool out_of_time() const;
    [[nodiscard]] unsigned long long operations_used() const;
    [[nodiscard]] std::chrono::milliseconds elapsed() const;
    [[nodiscard]] std::string describe() const;
};


/**
 * @struct StageOutcome
 * @brief Result of one factoring attempt: a split n = divisor * cofactor with 1 < divisor < n, or nothing.
 */
struct StageOutcome {
    bool found = false;
    mpz_class divisor;
    mpz_class cofactor;

    static StageOutcome split(const mpz_class& divisor, const mpz_class& n);
    static StageOutcome no_factor();
};


/**
 * @brief Uniform contract of every factoring stage: (residue, budget) -> outcome.
 */
using StageFunction = std::function<StageOutcome(const mpz_class&, BudgetTracker&)>;


/**
 * @struct FactoringStage
 * @brief A named entry of the driver's ordered stage list.
 */
struct FactoringStage {
    std::string name;
    StageFunction run;
};

#endif //STAGE_H
