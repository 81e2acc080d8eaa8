#include <raccoon/probe/oracle_classifier.h>
#include <raccoon/error.h>

namespace raccoon {
namespace probe {

OracleClassifier::OracleClassifier(std::shared_ptr<const FingerprintEqualityOracle> oracle)
    : oracle_(std::move(oracle)) {
    if (!oracle_) {
        throw RaccoonException(RaccoonError::MISSING_COLLABORATOR,
                               "OracleClassifier requires an equality oracle");
    }
}

OracleAssessment OracleClassifier::classify(const std::vector<VectorResponse>& responses,
                                            SamplingPhase phase) const {
    std::vector<const Fingerprint*> with_null_byte;
    std::vector<const Fingerprint*> without_null_byte;
    for (const auto& response : responses) {
        if (response.vector.pms_with_null_byte) {
            with_null_byte.push_back(&response.fingerprint);
        } else {
            without_null_byte.push_back(&response.fingerprint);
        }
    }

    OracleAssessment assessment;
    assessment.phase = phase;

    for (const Fingerprint* a : with_null_byte) {
        for (const Fingerprint* b : without_null_byte) {
            ++assessment.comparisons;
            switch (oracle_->compare(*a, *b)) {
                case EqualityResult::UNEQUAL:
                    ++assessment.unequal;
                    break;
                case EqualityResult::INCONCLUSIVE:
                    ++assessment.inconclusive;
                    break;
                case EqualityResult::EQUAL:
                    break;
            }
        }
    }

    if (assessment.unequal > 0) {
        assessment.classification = phase == SamplingPhase::INITIAL
            ? OracleClassification::POTENTIALLY_VULNERABLE
            : OracleClassification::VULNERABLE;
    } else if (phase == SamplingPhase::INITIAL && assessment.comparisons > 0 &&
               assessment.inconclusive == assessment.comparisons) {
        assessment.classification = OracleClassification::INCONCLUSIVE;
    } else {
        assessment.classification = OracleClassification::NOT_VULNERABLE;
    }
    return assessment;
}

std::string to_string(OracleClassification classification) {
    switch (classification) {
        case OracleClassification::INCONCLUSIVE: return "INCONCLUSIVE";
        case OracleClassification::NOT_VULNERABLE: return "NOT_VULNERABLE";
        case OracleClassification::POTENTIALLY_VULNERABLE: return "POTENTIALLY_VULNERABLE";
        case OracleClassification::VULNERABLE: return "VULNERABLE";
    }
    return "UNKNOWN";
}

std::string to_string(SamplingPhase phase) {
    switch (phase) {
        case SamplingPhase::INITIAL: return "INITIAL";
        case SamplingPhase::ESCALATED: return "ESCALATED";
    }
    return "UNKNOWN";
}

} // namespace probe
} // namespace raccoon
