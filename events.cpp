#include <gmpxx.h>
#include <iostream>
#include <string>

#include "events.h"
#include "helper.h"


void FactoringEvents::factorized(const mpz_class&, const mpz_class&, const mpz_class&, const std::string&) {}

void FactoringEvents::found_prime(const PrimalityCertificate&) {}

void FactoringEvents::found_composite(const PrimalityCertificate&) {}

void FactoringEvents::stage_failed(const std::string&, const mpz_class&) {}

void FactoringEvents::proof_abandoned(const mpz_class&, const std::string&) {}


/**
 * @brief Creates a logger writing to `out`.
 *
 * @param out Destination stream; must outlive the logger.
 * @param verbose If false, only splits and failures are logged, not every primality verdict.
 */
LoggingFactoringEvents::LoggingFactoringEvents(std::ostream& out, const bool verbose) : out(out), verbose(verbose) {
}

void LoggingFactoringEvents::factorized(const mpz_class& n, const mpz_class& divisor, const mpz_class& cofactor,
                                        const std::string& stage) {
    out << "[" << stage << "] " << n << " (" << get_number_of_decimal_digits(n) << " digits) = "
        << divisor << " * " << cofactor << std::endl;
}

void LoggingFactoringEvents::found_prime(const PrimalityCertificate& certificate) {
    if (verbose) {
        out << "[prime] " << certificate.to_string() << std::endl;
    }
}

void LoggingFactoringEvents::found_composite(const PrimalityCertificate& certificate) {
    if (verbose) {
        out << "[composite] " << certificate.to_string() << std::endl;
    }
}

void LoggingFactoringEvents::stage_failed(const std::string& stage, const mpz_class& residue) {
    out << "[" << stage << "] no factor of " << residue << std::endl;
}

void LoggingFactoringEvents::proof_abandoned(const mpz_class& n, const std::string& reason) {
    out << "[proof] " << n << " stays probably prime: " << reason << std::endl;
}
