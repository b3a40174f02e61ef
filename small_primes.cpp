#include <gmpxx.h>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <string>

#include "small_primes.h"


const unsigned long MAX_TRIAL_DIVISION_BOUND = 1UL << 32;


/**
 * @brief Sieves all primes p <= limit.
 *
 * @param limit Inclusive upper bound of the table, in [2, MAX_TRIAL_DIVISION_BOUND].
 * @throw std::invalid_argument if limit is out of range.
 */
SmallPrimeTable::SmallPrimeTable(const unsigned long limit) : bound(limit) {
    if (limit < 2) {
        throw std::invalid_argument("Small prime table bound must be at least 2, got: " + std::to_string(limit));
    }
    if (limit > MAX_TRIAL_DIVISION_BOUND) {
        throw std::invalid_argument("Small prime table bound must not exceed " +
                                    std::to_string(MAX_TRIAL_DIVISION_BOUND) + ", got: " + std::to_string(limit));
    }
    std::vector<bool> composite(limit + 1, false);
    for (unsigned long i = 2; i <= limit; ++i) {
        if (composite[i]) {
            continue;
        }
        table.push_back(i);
        if (i <= limit / i) {
            for (unsigned long j = i * i; j <= limit; j += i) {
                composite[j] = true;
            }
        }
    }
}

const std::vector<unsigned long>& SmallPrimeTable::primes() const {
    return table;
}

unsigned long SmallPrimeTable::limit() const {
    return bound;
}

bool SmallPrimeTable::contains(const mpz_class& n) const {
    if (n < 2 || n > bound) {
        return false;
    }
    return std::binary_search(table.begin(), table.end(), n.get_ui());
}

/**
 * @brief Whether "no table prime divides n" already proves n prime.
 *
 * Every composite n has a prime factor <= sqrt(n). All primes <= limit are in the table,
 * so the statement holds whenever n < (limit + 1)^2.
 *
 * @param n The candidate.
 * @return true if trial division by the whole table is a primality proof for n.
 */
bool SmallPrimeTable::proves_by_trial_division(const mpz_class& n) const {
    const mpz_class next = mpz_class(bound) + 1;
    return n < next * next;
}
