#ifndef RACCOON_SITE_REPORT_H
#define RACCOON_SITE_REPORT_H

#include <raccoon/config.h>
#include <raccoon/types.h>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace raccoon {

// Properties earlier probes established about the target
enum class AnalyzedProperty : uint8_t {
    SUPPORTS_SSL_3 = 0,
    SUPPORTS_TLS_1_0 = 1,
    SUPPORTS_TLS_1_1 = 2,
    SUPPORTS_TLS_1_2 = 3,
    SUPPORTS_DH = 4
};

struct RACCOON_API VersionSuiteListPair {
    ProtocolVersion version{ProtocolVersion::TLS12};
    std::vector<CipherSuite> cipher_suites;

    VersionSuiteListPair() = default;
    VersionSuiteListPair(ProtocolVersion v, std::vector<CipherSuite> suites)
        : version(v)
        , cipher_suites(std::move(suites)) {}
};

/**
 * What is known about one target. Properties that were never set read as
 * NOT_TESTED_YET. The version/suite list is absent until a suite probe has
 * filled it in.
 */
class RACCOON_API SiteReport {
public:
    SiteReport() = default;
    SiteReport(std::string host, uint16_t port)
        : host_(std::move(host))
        , port_(port) {}

    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

    TestResult get_result(AnalyzedProperty property) const;
    void put_result(AnalyzedProperty property, TestResult result);
    void put_result(AnalyzedProperty property, bool value);

    const std::optional<std::vector<VersionSuiteListPair>>& version_suite_pairs() const noexcept {
        return version_suite_pairs_;
    }
    void set_version_suite_pairs(std::vector<VersionSuiteListPair> pairs);
    void clear_version_suite_pairs() { version_suite_pairs_.reset(); }

    /// Union of all suites over all versions, absent when no list was set
    std::optional<std::set<CipherSuite>> cipher_suites() const;

private:
    std::string host_;
    uint16_t port_{443};
    std::map<AnalyzedProperty, TestResult> results_;
    std::optional<std::vector<VersionSuiteListPair>> version_suite_pairs_;
};

RACCOON_API std::string to_string(AnalyzedProperty property);

} // namespace raccoon

#endif // RACCOON_SITE_REPORT_H
