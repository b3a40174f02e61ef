#ifndef HELPER_H
#define HELPER_H

#include <iostream>
#include <string>
#include <utility>
#include <gmpxx.h>

#include "certificate.h"


/**
 * @brief Whether s is a non-empty run of decimal digits.
 */
bool is_positive_integer(const std::string& s);


/**
 * @brief Number of decimal digits of N.
 */
size_t get_number_of_decimal_digits(const mpz_class& N);


/**
 * @brief Strips the largest power of the small prime P from T and returns its exponent.
 */
unsigned int divide_out_maximal_power(mpz_class& T, unsigned long P);


/**
 * @class Factor
 * @brief Represents a prime factor with an associated exponent and the certificate for its primality.
 */
class Factor {
public:
    unsigned int exponent;  ///< Exponent to represent powers in factorization (e.g., 2^6)
    mpz_class factor; ///< The prime
    PrimalityCertificate certificate; ///< Evidence that 'factor' is prime, never Composite

    Factor(const mpz_class& prime, unsigned int exponent, const PrimalityCertificate& certificate);

    /**
     * @brief Prints the factor in a specific format based on its verdict.
     */
    void printpp(std::ostream& out = std::cout) const;
};


/**
 * @brief Decomposes a number into a base and exponent if it is a perfect power.
 */
std::pair<mpz_class, unsigned int> get_smallest_base_biggest_exponent_for_perfect_power(const mpz_class& N);

#endif
