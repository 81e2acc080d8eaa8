#include <raccoon/probe/cipher_suite_fingerprint.h>
#include <iterator>
#include <sstream>

namespace raccoon {
namespace probe {

CipherSuiteFingerprint::CipherSuiteFingerprint(ProtocolVersion version,
                                               CipherSuite suite,
                                               WorkflowVariant variant,
                                               DhSecret secret,
                                               std::vector<VectorResponse> responses)
    : version_(version)
    , suite_(suite)
    , variant_(variant)
    , secret_(std::move(secret))
    , responses_(std::move(responses)) {}

Result<void> CipherSuiteFingerprint::set_handshake_working(bool working) {
    if (handshake_working_.has_value()) {
        return Result<void>(RaccoonError::HANDSHAKE_STATE_ALREADY_SET);
    }
    handshake_working_ = working;
    return Result<void>();
}

Result<void> CipherSuiteFingerprint::append_responses(std::vector<VectorResponse> responses) {
    if (escalated_) {
        return Result<void>(RaccoonError::ALREADY_ESCALATED);
    }
    responses_.insert(responses_.end(),
                      std::make_move_iterator(responses.begin()),
                      std::make_move_iterator(responses.end()));
    escalated_ = true;
    return Result<void>();
}

const OracleAssessment& CipherSuiteFingerprint::evaluate(const OracleClassifier& classifier) {
    assessment_ = classifier.classify(responses_,
                                      escalated_ ? SamplingPhase::ESCALATED : SamplingPhase::INITIAL);
    return *assessment_;
}

bool CipherSuiteFingerprint::is_potentially_vulnerable() const noexcept {
    return assessment_.has_value()
        && assessment_->classification == OracleClassification::POTENTIALLY_VULNERABLE;
}

bool CipherSuiteFingerprint::is_considered_vulnerable() const noexcept {
    return assessment_.has_value()
        && assessment_->classification == OracleClassification::VULNERABLE;
}

std::string CipherSuiteFingerprint::to_string() const {
    std::ostringstream oss;
    oss << raccoon::to_string(version_) << " " << raccoon::to_string(suite_)
        << " " << raccoon::to_string(variant_)
        << ": responses=" << responses_.size()
        << ", handshakeWorking=" << (handshake_working() ? "true" : "false")
        << ", escalated=" << (escalated_ ? "true" : "false");
    if (assessment_) {
        oss << ", classification=" << probe::to_string(assessment_->classification)
            << " (" << assessment_->unequal << "/" << assessment_->comparisons << " unequal)";
    }
    return oss.str();
}

} // namespace probe
} // namespace raccoon
