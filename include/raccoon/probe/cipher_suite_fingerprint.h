#ifndef RACCOON_PROBE_CIPHER_SUITE_FINGERPRINT_H
#define RACCOON_PROBE_CIPHER_SUITE_FINGERPRINT_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <raccoon/result.h>
#include <raccoon/probe/oracle_classifier.h>
#include <raccoon/probe/vector.h>
#include <optional>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

/**
 * Accumulated responses of one (version, suite, workflow variant)
 * combination.
 *
 * The response list only grows: one append is allowed for escalation, a
 * second is rejected. The baseline handshake state can be set once.
 * Classification is stored by evaluate() and reflects the responses at the
 * time of the call.
 */
class RACCOON_API CipherSuiteFingerprint {
public:
    CipherSuiteFingerprint(ProtocolVersion version,
                           CipherSuite suite,
                           WorkflowVariant variant,
                           DhSecret secret,
                           std::vector<VectorResponse> responses);

    ProtocolVersion protocol_version() const noexcept { return version_; }
    CipherSuite cipher_suite() const noexcept { return suite_; }
    WorkflowVariant workflow_variant() const noexcept { return variant_; }
    const DhSecret& secret() const noexcept { return secret_; }
    const std::vector<VectorResponse>& responses() const noexcept { return responses_; }

    /// Records the outcome of the baseline handshake. Fails if already set.
    Result<void> set_handshake_working(bool working);
    bool handshake_working() const noexcept { return handshake_working_.value_or(false); }
    bool has_handshake_state() const noexcept { return handshake_working_.has_value(); }

    /// Appends the escalation batch. Fails if an escalation already happened.
    Result<void> append_responses(std::vector<VectorResponse> responses);
    bool is_escalated() const noexcept { return escalated_; }

    /**
     * Classifies the current responses, in the escalated phase once
     * append_responses() succeeded, and stores the assessment.
     */
    const OracleAssessment& evaluate(const OracleClassifier& classifier);
    const std::optional<OracleAssessment>& assessment() const noexcept { return assessment_; }

    bool is_potentially_vulnerable() const noexcept;
    bool is_considered_vulnerable() const noexcept;

    std::string to_string() const;

private:
    ProtocolVersion version_;
    CipherSuite suite_;
    WorkflowVariant variant_;
    DhSecret secret_;
    std::vector<VectorResponse> responses_;
    std::optional<bool> handshake_working_;
    bool escalated_{false};
    std::optional<OracleAssessment> assessment_;
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_CIPHER_SUITE_FINGERPRINT_H
