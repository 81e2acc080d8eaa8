/**
 * @file oracle_classifier.h
 * @brief Decides whether null-byte and non-null-byte responses are
 *        distinguishable
 */

#ifndef RACCOON_PROBE_ORACLE_CLASSIFIER_H
#define RACCOON_PROBE_ORACLE_CLASSIFIER_H

#include <raccoon/config.h>
#include <raccoon/probe/fingerprint.h>
#include <raccoon/probe/vector.h>
#include <memory>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

enum class OracleClassification : uint8_t {
    INCONCLUSIVE = 0,
    NOT_VULNERABLE = 1,
    POTENTIALLY_VULNERABLE = 2,
    VULNERABLE = 3
};

// Which sampling round produced a classification
enum class SamplingPhase : uint8_t {
    INITIAL = 0,
    ESCALATED = 1
};

struct RACCOON_API OracleAssessment {
    OracleClassification classification{OracleClassification::NOT_VULNERABLE};
    SamplingPhase phase{SamplingPhase::INITIAL};
    size_t comparisons{0};
    size_t unequal{0};
    size_t inconclusive{0};

    bool requires_escalation() const noexcept {
        return classification == OracleClassification::POTENTIALLY_VULNERABLE;
    }
};

/**
 * Compares every null-byte response against every non-null-byte response.
 *
 * Any UNEQUAL comparison is evidence of an oracle: POTENTIALLY_VULNERABLE in
 * the initial phase, VULNERABLE in the escalated one. INCONCLUSIVE
 * comparisons count as no evidence; an initial set where every comparison
 * was INCONCLUSIVE is classified INCONCLUSIVE. An escalated set is always
 * VULNERABLE or NOT_VULNERABLE. Sets with an empty group make no
 * comparisons and are NOT_VULNERABLE.
 */
class RACCOON_API OracleClassifier {
public:
    explicit OracleClassifier(std::shared_ptr<const FingerprintEqualityOracle> oracle);

    OracleAssessment classify(const std::vector<VectorResponse>& responses,
                              SamplingPhase phase) const;

private:
    std::shared_ptr<const FingerprintEqualityOracle> oracle_;
};

RACCOON_API std::string to_string(OracleClassification classification);
RACCOON_API std::string to_string(SamplingPhase phase);

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_ORACLE_CLASSIFIER_H
