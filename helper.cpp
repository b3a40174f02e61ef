#include <iostream>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <gmpxx.h>

#include "helper.h"


/**
 * @brief Whether s is a non-empty run of decimal digits, as accepted on the command line.
 *
 * Signs and whitespace are rejected; "0" is accepted and left to the caller to refuse.
 *
 * @param s Input string.
 * @return true if s consists of digits only.
 */
bool is_positive_integer(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](const unsigned char c) { return std::isdigit(c) != 0; });
}


/**
 * @brief Number of decimal digits of N, used when reporting residue sizes.
 *
 * mpz_sizeinbase may overestimate by one for base 10. 0 has one digit.
 *
 * @param N The integer.
 * @return size_t Digits of |N|, possibly one too many.
 */
size_t get_number_of_decimal_digits(const mpz_class& N) {
    if (N == 0) {
        return 1; // Special case: 0 has 1 decimal digit
    }
    return mpz_sizeinbase(N.get_mpz_t(), 10);
}


/**
 * @brief Strips the largest power P^e dividing T and returns e. T is replaced by T / P^e.
 *
 * @param T The residue (modified in place).
 * @param P A table prime.
 * @return unsigned int The exponent e, 0 if P does not divide T.
 */
unsigned int divide_out_maximal_power(mpz_class& T, const unsigned long P)
{
    unsigned int exponent = 0;
    while (T != 0 && mpz_divisible_ui_p(T.get_mpz_t(), P))
    {
        mpz_divexact_ui(T.get_mpz_t(), T.get_mpz_t(), P);
        exponent++;
    }
    return exponent;
}


Factor::Factor(const mpz_class& prime, const unsigned int exponent, const PrimalityCertificate& certificate)
        : exponent(exponent), factor(prime), certificate(certificate) {
}

/**
 * @brief Prints the factor in a specific format based on its verdict.
 *
 * Proven primes are printed as `(p^e)`, probable primes are suffixed with '_?'.
 *
 * @param out Stream to print to.
 */
void Factor::printpp(std::ostream& out) const
{
    out << '(' << factor;

    if (exponent > 1)
        out << "^" << exponent;
    if (certificate.verdict == Verdict::ProbablyPrime)
        out << "_?";

    out << ')' << " ";
}


/**
 * @brief Decomposes a number into a base and exponent if it is a perfect power.
 *
 * Determines the smallest base `k` and largest exponent `m` such that `N = k^m`.
 * That is, for all other bases (a > 1) and exponents (b > 1), such that `N = a^b`, it holds `m >= b`.
 *
 * @param N The number to decompose.
 * @return std::pair<mpz_class, unsigned int> A pair containing the base `k` and exponent `m`.
 * @throw std::invalid_argument if `N` is not a perfect power.
 */
std::pair<mpz_class, unsigned int> get_smallest_base_biggest_exponent_for_perfect_power(const mpz_class& N) {
    // Ensure N is greater than 1 (no meaningful decomposition for N <= 1)
    if (N <= 1) {
        throw std::invalid_argument("N must be greater than 1.");
    }

    // If N = k^m (for natural numbers k,m > 1), then m <= log2(N)
    mpz_class k;
    const auto upper_bound_exponent = static_cast<unsigned int>(mpz_sizeinbase(N.get_mpz_t(), 2));
    for (unsigned int i = upper_bound_exponent; i >= 2; --i) {  // test potential exponents, starting with upper bound
        // mpz_root returns non-zero if the computation was exact, i.e., if N is k to the i-th power.
        if (mpz_root(k.get_mpz_t(), N.get_mpz_t(), i) != 0) {
            return {k, i}; // Return the pair (k, m)
        }
    }
    throw std::invalid_argument("N: " + N.get_str() + " is not a perfect power.");
}
