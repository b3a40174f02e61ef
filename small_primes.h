#ifndef SMALL_PRIMES_H
#define SMALL_PRIMES_H

#include <gmpxx.h>
#include <vector>


extern const unsigned long MAX_TRIAL_DIVISION_BOUND;  // Largest bound a small prime table may be built for (2^32)


/**
 * @class SmallPrimeTable
 * @brief Ascending table of all primes up to a bound, built once with a sieve of Eratosthenes.
 */
class SmallPrimeTable {
private:
    unsigned long bound;
    std::vector<unsigned long> table;

public:
    explicit SmallPrimeTable(unsigned long limit);

    [[nodiscard]] const std::vector<unsigned long>& primes() const;
    [[nodiscard]] unsigned long limit() const;
    [[nodiscard]] bool contains(const mpz_class& n) const;
    [[nodiscard]] bool proves_by_trial_division(const mpz_class& n) const;
};

#endif //SMALL_PRIMES_H
