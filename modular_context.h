#ifndef MODULAR_CONTEXT_H
#define MODULAR_CONTEXT_H

#include <gmpxx.h>


/**
 * @brief Computes the representation of d as an element in the ring Z/nZ.
 */
mpz_class mod_ring(const mpz_class& d, const mpz_class& n);


/**
 * @class ModulusContext
 * @brief Modular arithmetic in Z/mZ for one fixed odd modulus m >= 3.
 *
 * All results are canonical residues in [0, m). Exponentiation is delegated to GMP (mpz_powm),
 * which switches to Montgomery (REDC) reduction for odd moduli. A context is valid only for the
 * modulus it was built with; build a new one instead of reusing it for a different modulus.
 */
class ModulusContext {
private:
    mpz_class m;
    mpz_class m_minus_one;

public:
    explicit ModulusContext(const mpz_class& modulus);

    [[nodiscard]] const mpz_class& get_modulus() const;
    [[nodiscard]] mpz_class reduce(const mpz_class& a) const;
    [[nodiscard]] mpz_class mul(const mpz_class& a, const mpz_class& b) const;
    [[nodiscard]] mpz_class sqr(const mpz_class& a) const;
    [[nodiscard]] mpz_class add(const mpz_class& a, const mpz_class& b) const;
    [[nodiscard]] mpz_class sub(const mpz_class& a, const mpz_class& b) const;
    [[nodiscard]] mpz_class pow(const mpz_class& base, const mpz_class& exponent) const;
    [[nodiscard]] mpz_class half(const mpz_class& a) const;
    [[nodiscard]] bool is_one(const mpz_class& a) const;
    [[nodiscard]] bool is_minus_one(const mpz_class& a) const;
};

#endif //MODULAR_CONTEXT_H
