#ifndef TRIAL_DIVISION_H
#define TRIAL_DIVISION_H

#include <gmpxx.h>
#include <list>

#include "helper.h"
#include "small_primes.h"
#include "stage.h"


/**
 * @brief Strips all primes of the table from N (and modifies it), returning them as factors.
 */
std::list<Factor> trial_division_bounded(mpz_class& N, const SmallPrimeTable& table);


/**
 * @brief Stage form of trial division: splits off the smallest table prime dividing n.
 */
StageOutcome run_trial_division_stage(const mpz_class& n, const SmallPrimeTable& table);

#endif //TRIAL_DIVISION_H
