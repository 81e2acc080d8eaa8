/**
 * @file direct_raccoon_probe.h
 * @brief Scan loop of the Direct Raccoon oracle probe
 *
 * For every eligible (version, suite) pair the target supports, and for
 * every configured workflow variant, the probe sends matched batches of
 * crafted handshakes whose premaster secret does or does not start with a
 * zero byte, and asks the classifier whether the server's responses to the
 * two groups can be told apart.
 */

#ifndef RACCOON_PROBE_DIRECT_RACCOON_PROBE_H
#define RACCOON_PROBE_DIRECT_RACCOON_PROBE_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <raccoon/result.h>
#include <raccoon/error_reporter.h>
#include <raccoon/site_report.h>
#include <raccoon/probe/cipher_suite_fingerprint.h>
#include <raccoon/probe/execution.h>
#include <raccoon/probe/oracle_classifier.h>
#include <raccoon/probe/random_source.h>
#include <raccoon/probe/response_collector.h>
#include <raccoon/probe/vector_set_builder.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace raccoon {
namespace probe {

struct RACCOON_API ProbeConfig {
    // Pairs executed in the first pass
    size_t iterations_per_handshake = 10;
    // Pairs added when the first pass shows differing responses, non-zero
    size_t escalation_iterations = 40;
    // Length of the initial client DH secret in bytes
    size_t secret_length = 4;
    std::vector<WorkflowVariant> workflow_variants = testable_workflow_variants();
    bool test_baseline_handshake = true;

    Result<void> validate() const;
};

struct RACCOON_API DirectRaccoonResult {
    // Absent when the probe could not run or failed as a whole
    std::optional<std::vector<CipherSuiteFingerprint>> fingerprints;
    TestResult verdict{TestResult::NOT_TESTED_YET};

    DirectRaccoonResult(std::optional<std::vector<CipherSuiteFingerprint>> f, TestResult v)
        : fingerprints(std::move(f))
        , verdict(v) {}
};

class RACCOON_API DirectRaccoonProbe {
public:
    static constexpr const char* PROBE_NAME = "Direct Raccoon";

    /**
     * @throws RaccoonException MISSING_COLLABORATOR if the scheduler, the
     *         baseline runner or the oracle is null, INVALID_CONFIGURATION
     *         if @p config does not validate.
     */
    DirectRaccoonProbe(std::shared_ptr<ParallelScheduler> scheduler,
                       std::shared_ptr<BaselineHandshakeRunner> baseline,
                       std::shared_ptr<const FingerprintEqualityOracle> oracle,
                       const ProbeConfig& config = ProbeConfig{},
                       std::shared_ptr<RandomSource> random = nullptr,
                       std::shared_ptr<ErrorReporter> reporter = nullptr);

    std::string probe_name() const { return PROBE_NAME; }
    const ProbeConfig& get_config() const { return config_; }

    /// Preconditions: one of SSL3/TLS1.0/1.1/1.2 supported, suites known, DH supported
    bool can_be_executed(const SiteReport& report) const;

    /// Takes the version/suite pairs to scan from the report
    void adjust_config(const SiteReport& report);

    /// Runs the scan. Never throws.
    DirectRaccoonResult execute_test();

    DirectRaccoonResult get_could_not_execute_result() const;

    /// can_be_executed, adjust_config and execute_test in sequence
    DirectRaccoonResult run(const SiteReport& report);

    static bool is_eligible(ProtocolVersion version, CipherSuite suite);

private:
    Result<std::vector<CipherSuiteFingerprint>> scan();
    Result<CipherSuiteFingerprint> test_combination(ProtocolVersion version,
                                                    CipherSuite suite,
                                                    WorkflowVariant variant);
    Result<std::vector<VectorResponse>> sample(ProtocolVersion version,
                                               CipherSuite suite,
                                               WorkflowVariant variant,
                                               const DhSecret& secret,
                                               size_t pairs);
    bool is_normal_handshake_working(ProtocolVersion version, CipherSuite suite);

    std::shared_ptr<BaselineHandshakeRunner> baseline_;
    ProbeConfig config_;
    std::shared_ptr<RandomSource> random_;
    std::shared_ptr<ErrorReporter> reporter_;
    VectorSetBuilder builder_;
    ResponseCollector collector_;
    OracleClassifier classifier_;
    std::vector<VersionSuiteListPair> server_supported_suites_;
};

} // namespace probe
} // namespace raccoon

#endif // RACCOON_PROBE_DIRECT_RACCOON_PROBE_H
