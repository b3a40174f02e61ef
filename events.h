#ifndef EVENTS_H
#define EVENTS_H

#include <gmpxx.h>
#include <iostream>
#include <string>

#include "certificate.h"


/**
 * @class FactoringEvents
 * @brief Observer notified while a factorization runs. All callbacks default to doing nothing.
 *
 * The driver invokes the callbacks one at a time, also when residues are resolved on several threads.
 */
class FactoringEvents {
public:
    virtual ~FactoringEvents() = default;

    /// A stage split n into divisor * cofactor
    virtual void factorized(const mpz_class& n, const mpz_class& divisor, const mpz_class& cofactor,
                            const std::string& stage);
    /// A residue was classified prime
    virtual void found_prime(const PrimalityCertificate& certificate);
    /// A residue was classified composite
    virtual void found_composite(const PrimalityCertificate& certificate);
    /// A stage gave up on a residue
    virtual void stage_failed(const std::string& stage, const mpz_class& residue);
    /// A Lucas proof for n could not be completed; n stays ProbablyPrime
    virtual void proof_abandoned(const mpz_class& n, const std::string& reason);
};


/**
 * @class LoggingFactoringEvents
 * @brief Writes one line per event to a stream (std::clog by default).
 */
class LoggingFactoringEvents : public FactoringEvents {
private:
    std::ostream& out;
    bool verbose;

public:
    explicit LoggingFactoringEvents(std::ostream& out = std::clog, bool verbose = false);

    void factorized(const mpz_class& n, const mpz_class& divisor, const mpz_class& cofactor,
                    const std::string& stage) override;
    void found_prime(const PrimalityCertificate& certificate) override;
    void found_composite(const PrimalityCertificate& certificate) override;
    void stage_failed(const std::string& stage, const mpz_class& residue) override;
    void proof_abandoned(const mpz_class& n, const std::string& reason) override;
};

#endif //EVENTS_H
