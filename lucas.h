#ifndef LUCAS_H
#define LUCAS_H

#include <gmpxx.h>

#include "certificate.h"
#include "modular_context.h"


/**
 * @enum LucasResult
 * @brief Result of the strong Lucas test. Only Composite is a proof.
 */
enum class LucasResult : int {
    Composite = 0,
    ProbablyPrime = 1
};


/**
 * @struct DiscriminantSearch
 * @brief Outcome of the search for D with Jacobi symbol (D|n) = -1.
 */
struct DiscriminantSearch {
    bool found_factor = false;  ///< A non-trivial common factor of D and n turned up
    mpz_class factor;           ///< That factor (if found_factor)
    LucasParameters parameters; ///< D, P = 1, Q = (1 - D) / 4 (if !found_factor)
};


/**
 * @struct LucasOutcome
 * @brief Verdict of the strong Lucas test with the data that supports it.
 */
struct LucasOutcome {
    LucasResult result = LucasResult::Composite;
    LucasParameters parameters;
    mpz_class witness;  ///< Common factor, square root or |D|, depending on what failed
};


/**
 * @brief Selfridge's method A: the first D of 5, -7, 9, -11, ... with (D|n) = -1.
 */
DiscriminantSearch select_discriminant(const mpz_class& n);


/**
 * @brief Strong Lucas probable prime test of the context's modulus.
 */
LucasOutcome strong_lucas_test(const ModulusContext& ctx);

#endif //LUCAS_H
