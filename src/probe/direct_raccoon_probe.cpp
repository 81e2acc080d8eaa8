#include <raccoon/probe/direct_raccoon_probe.h>
#include <raccoon/cipher_suites.h>
#include <algorithm>

namespace raccoon {
namespace probe {

Result<void> ProbeConfig::validate() const {
    if (iterations_per_handshake == 0 || escalation_iterations == 0 || secret_length == 0) {
        return Result<void>(RaccoonError::INVALID_CONFIGURATION);
    }
    if (workflow_variants.empty()) {
        return Result<void>(RaccoonError::INVALID_CONFIGURATION);
    }
    for (auto variant : workflow_variants) {
        if (!is_testable(variant)) {
            return Result<void>(RaccoonError::INVALID_CONFIGURATION);
        }
    }
    return Result<void>();
}

DirectRaccoonProbe::DirectRaccoonProbe(std::shared_ptr<ParallelScheduler> scheduler,
                                       std::shared_ptr<BaselineHandshakeRunner> baseline,
                                       std::shared_ptr<const FingerprintEqualityOracle> oracle,
                                       const ProbeConfig& config,
                                       std::shared_ptr<RandomSource> random,
                                       std::shared_ptr<ErrorReporter> reporter)
    : baseline_(std::move(baseline))
    , config_(config)
    , random_(random ? std::move(random) : default_random_source())
    , reporter_(std::move(reporter))
    , builder_(random_)
    , collector_(scheduler, reporter_)
    , classifier_(std::move(oracle)) {
    if (!scheduler || !baseline_) {
        throw RaccoonException(RaccoonError::MISSING_COLLABORATOR,
                               "DirectRaccoonProbe requires a scheduler and a baseline runner");
    }
    auto valid = config_.validate();
    if (!valid) {
        throw RaccoonException(valid.error(), "Invalid Direct Raccoon probe configuration");
    }
}

bool DirectRaccoonProbe::can_be_executed(const SiteReport& report) const {
    const bool any_version =
        report.get_result(AnalyzedProperty::SUPPORTS_SSL_3) == TestResult::TRUE ||
        report.get_result(AnalyzedProperty::SUPPORTS_TLS_1_0) == TestResult::TRUE ||
        report.get_result(AnalyzedProperty::SUPPORTS_TLS_1_1) == TestResult::TRUE ||
        report.get_result(AnalyzedProperty::SUPPORTS_TLS_1_2) == TestResult::TRUE;
    if (!any_version) {
        return false;
    }
    if (!report.version_suite_pairs().has_value()) {
        return false;
    }
    return report.get_result(AnalyzedProperty::SUPPORTS_DH) == TestResult::TRUE;
}

void DirectRaccoonProbe::adjust_config(const SiteReport& report) {
    server_supported_suites_ = report.version_suite_pairs().value_or(std::vector<VersionSuiteListPair>{});
}

DirectRaccoonResult DirectRaccoonProbe::get_could_not_execute_result() const {
    return DirectRaccoonResult(std::nullopt, TestResult::COULD_NOT_TEST);
}

DirectRaccoonResult DirectRaccoonProbe::run(const SiteReport& report) {
    if (!can_be_executed(report)) {
        RACCOON_REPORT_INFO(reporter_, std::string(PROBE_NAME) + " probe skipped: preconditions not met");
        return get_could_not_execute_result();
    }
    adjust_config(report);
    return execute_test();
}

bool DirectRaccoonProbe::is_eligible(ProtocolVersion version, CipherSuite suite) {
    return is_raccoon_affected_version(version) && uses_dh(suite) && is_implemented(suite);
}

DirectRaccoonResult DirectRaccoonProbe::execute_test() {
    try {
        auto scanned = scan();
        if (!scanned) {
            RACCOON_REPORT_ERROR(reporter_, scanned.error(),
                                 std::string("Could not scan for ") + PROBE_NAME + ": " +
                                 error_message(scanned.error()));
            return DirectRaccoonResult(std::nullopt, TestResult::ERROR_DURING_TEST);
        }

        std::vector<CipherSuiteFingerprint> fingerprints = std::move(scanned).value();
        const bool vulnerable = std::any_of(fingerprints.begin(), fingerprints.end(),
            [](const CipherSuiteFingerprint& f) { return f.is_considered_vulnerable(); });
        return DirectRaccoonResult(std::move(fingerprints),
                                   vulnerable ? TestResult::TRUE : TestResult::FALSE);
    } catch (const std::exception& e) {
        RACCOON_REPORT_ERROR(reporter_, RaccoonError::INTERNAL_ERROR,
                             std::string("Could not scan for ") + PROBE_NAME + ": " + e.what());
        return DirectRaccoonResult(std::nullopt, TestResult::ERROR_DURING_TEST);
    } catch (...) {
        RACCOON_REPORT_ERROR(reporter_, RaccoonError::INTERNAL_ERROR,
                             std::string("Could not scan for ") + PROBE_NAME + ": unknown exception");
        return DirectRaccoonResult(std::nullopt, TestResult::ERROR_DURING_TEST);
    }
}

Result<std::vector<CipherSuiteFingerprint>> DirectRaccoonProbe::scan() {
    std::vector<CipherSuiteFingerprint> fingerprints;

    for (const auto& pair : server_supported_suites_) {
        for (CipherSuite suite : pair.cipher_suites) {
            if (!is_eligible(pair.version, suite)) {
                continue;
            }

            std::optional<bool> handshake_working;
            if (config_.test_baseline_handshake) {
                handshake_working = is_normal_handshake_working(pair.version, suite);
            }

            for (WorkflowVariant variant : config_.workflow_variants) {
                auto fingerprint = test_combination(pair.version, suite, variant);
                if (!fingerprint) {
                    return make_error<std::vector<CipherSuiteFingerprint>>(fingerprint.error());
                }
                if (handshake_working) {
                    RACCOON_TRY_VOID(fingerprint->set_handshake_working(*handshake_working));
                }
                RACCOON_REPORT_DEBUG(reporter_, fingerprint->to_string());
                fingerprints.push_back(std::move(fingerprint).value());
            }
        }
    }
    return make_result(std::move(fingerprints));
}

Result<CipherSuiteFingerprint> DirectRaccoonProbe::test_combination(ProtocolVersion version,
                                                                    CipherSuite suite,
                                                                    WorkflowVariant variant) {
    // One secret for the whole combination, escalation included
    auto secret = random_->next_secret(config_.secret_length);
    if (!secret) {
        return make_error<CipherSuiteFingerprint>(secret.error());
    }

    auto responses = sample(version, suite, variant, *secret, config_.iterations_per_handshake);
    if (!responses) {
        return make_error<CipherSuiteFingerprint>(responses.error());
    }

    CipherSuiteFingerprint fingerprint(version, suite, variant, *secret, std::move(responses).value());
    const auto& first_pass = fingerprint.evaluate(classifier_);

    if (first_pass.requires_escalation()) {
        RACCOON_REPORT_DEBUG(reporter_,
            "Found non identical answers for " + fingerprint.to_string() + ", performing " +
            std::to_string(config_.escalation_iterations * 2) + " additional tests");

        auto escalation = sample(version, suite, variant, *secret, config_.escalation_iterations);
        if (!escalation) {
            return make_error<CipherSuiteFingerprint>(escalation.error());
        }
        auto appended = fingerprint.append_responses(std::move(escalation).value());
        if (!appended) {
            return make_error<CipherSuiteFingerprint>(appended.error());
        }
        fingerprint.evaluate(classifier_);
    }
    return make_result(std::move(fingerprint));
}

Result<std::vector<VectorResponse>> DirectRaccoonProbe::sample(ProtocolVersion version,
                                                               CipherSuite suite,
                                                               WorkflowVariant variant,
                                                               const DhSecret& secret,
                                                               size_t pairs) {
    auto set = builder_.build(version, suite, variant, secret, pairs);
    if (!set) {
        return make_error<std::vector<VectorResponse>>(set.error());
    }
    return collector_.collect(set->vectors, set->secret);
}

bool DirectRaccoonProbe::is_normal_handshake_working(ProtocolVersion version, CipherSuite suite) {
    try {
        return baseline_->run_normal_handshake(version, suite);
    } catch (const std::exception& e) {
        RACCOON_REPORT_WARNING(reporter_, RaccoonError::HANDSHAKE_FAILURE,
                               "Could not perform initial handshake for " + raccoon::to_string(version) +
                               " " + raccoon::to_string(suite) + ": " + e.what());
        return false;
    } catch (...) {
        RACCOON_REPORT_WARNING(reporter_, RaccoonError::HANDSHAKE_FAILURE,
                               "Could not perform initial handshake for " + raccoon::to_string(version) +
                               " " + raccoon::to_string(suite) + ": unknown exception");
        return false;
    }
}

} // namespace probe
} // namespace raccoon
