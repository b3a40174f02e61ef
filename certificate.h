#ifndef CERTIFICATE_H
#define CERTIFICATE_H

#include <gmpxx.h>
#include <string>
#include <vector>


/**
 * @enum Verdict
 * @brief Outcome of a primality test. ProbablyPrime and DefinitelyPrime are never merged.
 */
enum class Verdict : int {
    Composite = 0,
    ProbablyPrime = 1,
    DefinitelyPrime = 2
};


/**
 * @enum Evidence
 * @brief The piece of evidence that decided a verdict.
 */
enum class Evidence : int {
    BelowTwo = 0,          ///< n < 2: neither prime nor composite, reported as Composite
    SmallPrime,            ///< n is 2, 3 or an entry of the small prime table
    EvenNumber,            ///< n > 2 is even; witness 2
    TrialDivisor,          ///< a table prime divides n; witness is that prime
    TrialDivision,         ///< no table prime divides n and n < (table bound + 1)^2
    PerfectSquare,         ///< n is a square; witness is the square root
    StrongFermat,          ///< composite: witness is the Miller-Rabin base
    StrongLucas,           ///< composite by the strong Lucas test (witness: |D| or a common factor)
    BailliePsw,            ///< every Fermat base and the strong Lucas test passed
    DeterministicBases,    ///< all bases passed and n lies below the proven bound for that base set
    BailliePswBound,       ///< base 2 and strong Lucas passed and n < 2^64
    FermatWitness,         ///< composite: a^(n-1) != 1 found while building a Lucas proof
    LucasProof             ///< Lucas (n-1) proof chain closes
};


/**
 * @struct LucasParameters
 * @brief Parameters of the strong Lucas test (Selfridge method A: P = 1, Q = (1 - D) / 4).
 */
struct LucasParameters {
    long D = 0;
    long P = 0;
    long Q = 0;
};


/**
 * @struct LucasCertificateElement
 * @brief One link of a Lucas (n-1) proof chain.
 *
 * base^(n-1) = 1 mod n and base^((n-1)/q) != 1 mod n for every entry q of unique_prime_divisors,
 * which must be exactly the distinct primes dividing n-1.
 */
struct LucasCertificateElement {
    mpz_class n;
    mpz_class base;
    std::vector<mpz_class> unique_prime_divisors;
};


/**
 * @class LucasCertificate
 * @brief Flattened proof chain, ascending by n, without duplicates.
 */
class LucasCertificate {
public:
    std::vector<LucasCertificateElement> elements;

    void push(const LucasCertificateElement& element);
    void merge(const LucasCertificate& other);
    [[nodiscard]] bool contains(const mpz_class& n) const;
    [[nodiscard]] const LucasCertificateElement* get(const mpz_class& n) const;
    [[nodiscard]] bool empty() const;
};


/**
 * @class PrimalityCertificate
 * @brief Record of the evidence gathered about one integer and the verdict it supports.
 */
class PrimalityCertificate {
public:
    mpz_class n;                          ///< The tested integer
    Verdict verdict;                      ///< Composite, ProbablyPrime or DefinitelyPrime
    Evidence evidence;                    ///< What decided the verdict
    mpz_class witness;                    ///< Composite: base, divisor or discriminant proving it (0 if none)
    std::vector<mpz_class> fermat_bases;  ///< Strong Fermat bases that were passed
    bool lucas_tested;                    ///< Whether the strong Lucas test ran and passed
    LucasParameters lucas;                ///< Discriminant parameters if lucas_tested
    LucasCertificate proof;               ///< Proof chain if evidence == LucasProof

    PrimalityCertificate();
    PrimalityCertificate(const mpz_class& n, Verdict verdict, Evidence evidence);

    /**
     * @brief Whether the verdict is Composite. Also true for n < 2 (evidence BelowTwo, witness 0),
     *        which is not prime but has no witness either.
     */
    [[nodiscard]] bool is_composite() const;
    [[nodiscard]] bool is_prime() const;
    [[nodiscard]] std::string to_string() const;
};


/**
 * @brief Readable name of a verdict.
 */
std::string verdict_name(Verdict verdict);


/**
 * @brief Readable name of an evidence kind.
 */
std::string evidence_name(Evidence evidence);

#endif //CERTIFICATE_H
