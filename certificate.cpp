#include <gmpxx.h>
#include <string>
#include <vector>
#include <algorithm>
#include <sstream>

#include "certificate.h"


/**
 * @brief Inserts an element, keeping the chain ascending by n. An element for an already certified n is ignored.
 */
void LucasCertificate::push(const LucasCertificateElement& element) {
    auto it = std::lower_bound(elements.begin(), elements.end(), element.n,
                               [](const LucasCertificateElement& e, const mpz_class& n) { return e.n < n; });
    if (it != elements.end() && it->n == element.n) {
        return;
    }
    elements.insert(it, element);
}

void LucasCertificate::merge(const LucasCertificate& other) {
    for (const auto& element : other.elements) {
        push(element);
    }
}

bool LucasCertificate::contains(const mpz_class& n) const {
    return get(n) != nullptr;
}

const LucasCertificateElement* LucasCertificate::get(const mpz_class& n) const {
    auto it = std::lower_bound(elements.begin(), elements.end(), n,
                               [](const LucasCertificateElement& e, const mpz_class& v) { return e.n < v; });
    if (it != elements.end() && it->n == n) {
        return &(*it);
    }
    return nullptr;
}

bool LucasCertificate::empty() const {
    return elements.empty();
}


PrimalityCertificate::PrimalityCertificate()
        : n(0), verdict(Verdict::Composite), evidence(Evidence::BelowTwo), witness(0), lucas_tested(false) {
}

PrimalityCertificate::PrimalityCertificate(const mpz_class& n, const Verdict verdict, const Evidence evidence)
        : n(n), verdict(verdict), evidence(evidence), witness(0), lucas_tested(false) {
}

/**
 * @brief Whether the verdict is Composite.
 *
 * n < 2 is reported as Composite with evidence BelowTwo and no witness, since it is not prime.
 * Callers that need a witnessed composite check `evidence != Evidence::BelowTwo`.
 */
bool PrimalityCertificate::is_composite() const {
    return verdict == Verdict::Composite;
}

bool PrimalityCertificate::is_prime() const {
    return verdict != Verdict::Composite;
}

/**
 * @brief Describes the certificate on one line, e.g. `97: DefinitelyPrime (small-prime)`.
 *
 * Composite certificates name their witness, probable primes list the number of Fermat bases and
 * the Lucas discriminant, Lucas proofs give the length of their chain.
 */
std::string PrimalityCertificate::to_string() const {
    std::ostringstream out;
    out << n.get_str() << ": " << verdict_name(verdict) << " (" << evidence_name(evidence);
    if (verdict == Verdict::Composite && witness != 0) {
        out << ", witness " << witness.get_str();
    }
    if (!fermat_bases.empty()) {
        out << ", " << fermat_bases.size() << " fermat bases";
    }
    if (lucas_tested) {
        out << ", lucas D=" << lucas.D << " P=" << lucas.P << " Q=" << lucas.Q;
    }
    if (evidence == Evidence::LucasProof) {
        out << ", chain of " << proof.elements.size();
    }
    out << ")";
    return out.str();
}


std::string verdict_name(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Composite: return "Composite";
        case Verdict::ProbablyPrime: return "ProbablyPrime";
        case Verdict::DefinitelyPrime: return "DefinitelyPrime";
    }
    return "Unknown";
}


std::string evidence_name(const Evidence evidence) {
    switch (evidence) {
        case Evidence::BelowTwo: return "below-two";
        case Evidence::SmallPrime: return "small-prime";
        case Evidence::EvenNumber: return "even";
        case Evidence::TrialDivisor: return "trial-divisor";
        case Evidence::TrialDivision: return "trial-division";
        case Evidence::PerfectSquare: return "perfect-square";
        case Evidence::StrongFermat: return "strong-fermat";
        case Evidence::StrongLucas: return "strong-lucas";
        case Evidence::BailliePsw: return "bpsw";
        case Evidence::DeterministicBases: return "deterministic-bases";
        case Evidence::BailliePswBound: return "bpsw-below-2^64";
        case Evidence::FermatWitness: return "fermat-witness";
        case Evidence::LucasProof: return "lucas-proof";
    }
    return "unknown";
}
