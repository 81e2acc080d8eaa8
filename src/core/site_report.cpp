#include <raccoon/site_report.h>

namespace raccoon {

TestResult SiteReport::get_result(AnalyzedProperty property) const {
    auto it = results_.find(property);
    if (it == results_.end()) {
        return TestResult::NOT_TESTED_YET;
    }
    return it->second;
}

void SiteReport::put_result(AnalyzedProperty property, TestResult result) {
    results_[property] = result;
}

void SiteReport::put_result(AnalyzedProperty property, bool value) {
    results_[property] = value ? TestResult::TRUE : TestResult::FALSE;
}

void SiteReport::set_version_suite_pairs(std::vector<VersionSuiteListPair> pairs) {
    version_suite_pairs_ = std::move(pairs);
}

std::optional<std::set<CipherSuite>> SiteReport::cipher_suites() const {
    if (!version_suite_pairs_) {
        return std::nullopt;
    }
    std::set<CipherSuite> suites;
    for (const auto& pair : *version_suite_pairs_) {
        suites.insert(pair.cipher_suites.begin(), pair.cipher_suites.end());
    }
    return suites;
}

std::string to_string(AnalyzedProperty property) {
    switch (property) {
        case AnalyzedProperty::SUPPORTS_SSL_3: return "SUPPORTS_SSL_3";
        case AnalyzedProperty::SUPPORTS_TLS_1_0: return "SUPPORTS_TLS_1_0";
        case AnalyzedProperty::SUPPORTS_TLS_1_1: return "SUPPORTS_TLS_1_1";
        case AnalyzedProperty::SUPPORTS_TLS_1_2: return "SUPPORTS_TLS_1_2";
        case AnalyzedProperty::SUPPORTS_DH: return "SUPPORTS_DH";
    }
    return "UNKNOWN";
}

} // namespace raccoon
