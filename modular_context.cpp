#include <gmpxx.h>
#include <stdexcept>

#include "modular_context.h"


/**
 * @brief Computes the representation of d as an element in the ring Z/nZ.
 *
 * @param d The integer to be reduced modulo n.
 * @param n The modulus of the ring Z/nZ. Must be greater than 0.
 * @return The canonical representative of d in Z/nZ, satisfying 0 <= result < n.
 * @throws std::invalid_argument if n < 1.
 */
mpz_class mod_ring(const mpz_class& d, const mpz_class& n) {
    if (n < 1) {
        throw std::invalid_argument("Modulus n must be greater than 0.");
    }
    mpz_class result = d % n;
    if (result < 0) {
        result += n;
    }
    return result;
}


/**
 * @brief Builds the context for the odd modulus `modulus`.
 *
 * @param modulus The modulus m, odd and at least 3.
 * @throws std::invalid_argument if m is even or smaller than 3.
 */
ModulusContext::ModulusContext(const mpz_class& modulus) : m(modulus), m_minus_one(modulus - 1) {
    if (m < 3 || mpz_even_p(m.get_mpz_t())) {
        throw std::invalid_argument("Modulus must be odd and at least 3, got: " + m.get_str());
    }
}

const mpz_class& ModulusContext::get_modulus() const {
    return m;
}

mpz_class ModulusContext::reduce(const mpz_class& a) const {
    return mod_ring(a, m);
}

mpz_class ModulusContext::mul(const mpz_class& a, const mpz_class& b) const {
    mpz_class result = a * b;
    mpz_mod(result.get_mpz_t(), result.get_mpz_t(), m.get_mpz_t());
    return result;
}

mpz_class ModulusContext::sqr(const mpz_class& a) const {
    return mul(a, a);
}

/**
 * @brief Adds two residues. Both operands must already lie in [0, m).
 */
mpz_class ModulusContext::add(const mpz_class& a, const mpz_class& b) const {
    mpz_class result = a + b;
    if (result >= m) {
        result -= m;
    }
    return result;
}

/**
 * @brief Subtracts two residues. Both operands must already lie in [0, m).
 */
mpz_class ModulusContext::sub(const mpz_class& a, const mpz_class& b) const {
    mpz_class result = a - b;
    if (result < 0) {
        result += m;
    }
    return result;
}

/**
 * @brief Computes base^exponent mod m.
 *
 * @param base Any integer; negative values are reduced first.
 * @param exponent A non-negative exponent.
 * @return The canonical residue of base^exponent.
 * @throws std::invalid_argument if the exponent is negative.
 */
mpz_class ModulusContext::pow(const mpz_class& base, const mpz_class& exponent) const {
    if (exponent < 0) {
        throw std::invalid_argument("Negative exponent in modular exponentiation: " + exponent.get_str());
    }
    mpz_class result;
    const mpz_class b = reduce(base);
    mpz_powm(result.get_mpz_t(), b.get_mpz_t(), exponent.get_mpz_t(), m.get_mpz_t());
    return result;
}

/**
 * @brief Divides a residue by 2 in Z/mZ (m is odd, so 2 is invertible).
 */
mpz_class ModulusContext::half(const mpz_class& a) const {
    mpz_class result = a;
    if (mpz_odd_p(result.get_mpz_t())) {
        result += m;
    }
    result >>= 1;
    return result;
}

bool ModulusContext::is_one(const mpz_class& a) const {
    return a == 1;
}

bool ModulusContext::is_minus_one(const mpz_class& a) const {
    return a == m_minus_one;
}
