/**
 * Direct Raccoon Probe Simulation
 *
 * Runs the probe against simulated servers: one whose alert depends on
 * whether the premaster secret starts with a zero byte, and one that
 * answers identically but drops connections now and then.
 */

#include <raccoon/probe.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>

using namespace raccoon;
using namespace raccoon::probe;

namespace examples {

/**
 * Server model. With leak enabled, the leading zero byte is stripped
 * before the MAC check, so null-byte handshakes fail differently.
 */
class SimulatedServer : public HandshakeExecutionEngine, public BaselineHandshakeRunner {
public:
    SimulatedServer(bool leak, double drop_rate, uint64_t seed)
        : leak_(leak)
        , drop_rate_(drop_rate)
        , rng_(seed) {}

    Result<Fingerprint> execute(const ExecutionRequest& request) override {
        if (should_drop()) {
            return Result<Fingerprint>(RaccoonError::CONNECTION_RESET);
        }

        // Without Finished the server closes with handshake_failure (40). With
        // it, bad_record_mac (20) normally, decrypt_error (51) when the leak shows.
        uint8_t alert = 40;
        if (request.workflow_variant == WorkflowVariant::CKE_CCS_FIN) {
            alert = (leak_ && request.with_null_byte) ? 51 : 20;
        }
        std::vector<ObservedMessage> messages;
        messages.push_back({RecordContentType::ALERT, alert, 2});
        return make_result(Fingerprint(std::move(messages), 1, SocketState::CLOSED,
                                        std::chrono::microseconds{1500 + alert}));
    }

    bool run_normal_handshake(ProtocolVersion, CipherSuite) override {
        return !should_drop();
    }

private:
    bool should_drop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < drop_rate_;
    }

    bool leak_;
    double drop_rate_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

SiteReport make_site_report(const std::string& host) {
    SiteReport report(host, 443);
    report.put_result(AnalyzedProperty::SUPPORTS_SSL_3, false);
    report.put_result(AnalyzedProperty::SUPPORTS_TLS_1_0, true);
    report.put_result(AnalyzedProperty::SUPPORTS_TLS_1_1, false);
    report.put_result(AnalyzedProperty::SUPPORTS_TLS_1_2, true);
    report.put_result(AnalyzedProperty::SUPPORTS_DH, true);
    report.set_version_suite_pairs({
        VersionSuiteListPair(ProtocolVersion::TLS12, {CipherSuite::TLS_DHE_RSA_WITH_AES_128_GCM_SHA256,
                                                      CipherSuite::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256}),
        VersionSuiteListPair(ProtocolVersion::TLS10, {CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA})
    });
    return report;
}

void print_result(const DirectRaccoonResult& result) {
    std::cout << "Verdict: " << to_string(result.verdict) << "\n";
    if (!result.fingerprints) {
        return;
    }
    for (const auto& fingerprint : *result.fingerprints) {
        std::cout << "  " << fingerprint.to_string() << "\n";
    }
}

void scan(const std::string& title, bool leak, double drop_rate,
          const std::shared_ptr<ErrorReporter>& reporter) {
    std::cout << "\n=== " << title << " ===\n";

    auto server = std::make_shared<SimulatedServer>(leak, drop_rate, 7);

    ParallelExecutor::Config executor_config;
    executor_config.max_parallel_tasks = 8;
    auto scheduler = std::make_shared<ParallelExecutor>(server, executor_config, reporter);

    DirectRaccoonProbe probe(scheduler, server, std::make_shared<StructuralEqualityOracle>(),
                             ProbeConfig{}, default_random_source(), reporter);

    auto result = probe.run(make_site_report("simulated.example"));
    print_result(result);

    const auto& stats = scheduler->get_statistics();
    std::cout << "Handshakes executed: " << stats.tasks_executed.load()
              << ", failed: " << stats.tasks_failed.load() << "\n";
}

} // namespace examples

int main() {
    std::cout << "Direct Raccoon Probe Simulation\n";

    ErrorReporter::ReportingConfig reporting;
    reporting.minimum_level = ErrorReporter::LogLevel::WARNING;
    reporting.format = ErrorReporter::OutputFormat::HUMAN_READABLE;
    auto reporter = std::make_shared<ErrorReporter>(reporting);

    try {
        examples::scan("Server leaking the leading zero byte", true, 0.0, reporter);
        examples::scan("Patched server on a lossy network", false, 0.05, reporter);
    } catch (const RaccoonException& e) {
        std::cerr << "Setup failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nWarnings logged: " << reporter->reports_at(ErrorReporter::LogLevel::WARNING) << "\n";
    return 0;
}
