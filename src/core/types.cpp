#include <raccoon/types.h>
#include <raccoon/cipher_suites.h>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <unordered_map>

namespace raccoon {

std::vector<WorkflowVariant> testable_workflow_variants() {
    return std::vector<WorkflowVariant>(TESTABLE_WORKFLOW_VARIANTS.begin(),
                                        TESTABLE_WORKFLOW_VARIANTS.end());
}

bool is_testable(WorkflowVariant variant) noexcept {
    return std::find(TESTABLE_WORKFLOW_VARIANTS.begin(), TESTABLE_WORKFLOW_VARIANTS.end(),
                     variant) != TESTABLE_WORKFLOW_VARIANTS.end();
}

bool is_raccoon_affected_version(ProtocolVersion version) noexcept {
    return std::find(RACCOON_AFFECTED_VERSIONS.begin(), RACCOON_AFFECTED_VERSIONS.end(),
                     version) != RACCOON_AFFECTED_VERSIONS.end();
}

// String conversion functions for enums
std::string to_string(ProtocolVersion version) {
    static const std::unordered_map<ProtocolVersion, std::string> version_names = {
        {ProtocolVersion::SSL2, "SSL2"},
        {ProtocolVersion::SSL3, "SSL3"},
        {ProtocolVersion::TLS10, "TLS10"},
        {ProtocolVersion::TLS11, "TLS11"},
        {ProtocolVersion::TLS12, "TLS12"},
        {ProtocolVersion::TLS13, "TLS13"},
        {ProtocolVersion::DTLS10, "DTLS10"},
        {ProtocolVersion::DTLS12, "DTLS12"}
    };

    auto it = version_names.find(version);
    if (it != version_names.end()) {
        return it->second;
    }

    std::ostringstream oss;
    oss << "UNKNOWN_VERSION(0x" << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint16_t>(version) << ")";
    return oss.str();
}

std::string to_string(CipherSuite suite) {
    auto info = get_cipher_suite_info(suite);
    if (info) {
        return info->name;
    }

    std::ostringstream oss;
    oss << "UNKNOWN_CIPHER_SUITE(0x" << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint16_t>(suite) << ")";
    return oss.str();
}

std::string to_string(KeyExchangeAlgorithm kex) {
    switch (kex) {
        case KeyExchangeAlgorithm::NULL_KEX: return "NULL";
        case KeyExchangeAlgorithm::RSA: return "RSA";
        case KeyExchangeAlgorithm::DH_DSS: return "DH_DSS";
        case KeyExchangeAlgorithm::DH_RSA: return "DH_RSA";
        case KeyExchangeAlgorithm::DHE_DSS: return "DHE_DSS";
        case KeyExchangeAlgorithm::DHE_RSA: return "DHE_RSA";
        case KeyExchangeAlgorithm::DH_ANON: return "DH_ANON";
        case KeyExchangeAlgorithm::DHE_PSK: return "DHE_PSK";
        case KeyExchangeAlgorithm::ECDH_RSA: return "ECDH_RSA";
        case KeyExchangeAlgorithm::ECDHE_ECDSA: return "ECDHE_ECDSA";
        case KeyExchangeAlgorithm::ECDHE_RSA: return "ECDHE_RSA";
        case KeyExchangeAlgorithm::PSK: return "PSK";
        case KeyExchangeAlgorithm::TLS13: return "TLS13";
        default:
            std::ostringstream oss;
            oss << "UNKNOWN_KEY_EXCHANGE(" << static_cast<int>(kex) << ")";
            return oss.str();
    }
}

std::string to_string(WorkflowVariant variant) {
    switch (variant) {
        case WorkflowVariant::INITIAL: return "INITIAL";
        case WorkflowVariant::CKE: return "CKE";
        case WorkflowVariant::CKE_CCS: return "CKE_CCS";
        case WorkflowVariant::CKE_CCS_FIN: return "CKE_CCS_FIN";
        default:
            std::ostringstream oss;
            oss << "UNKNOWN_WORKFLOW_VARIANT(" << static_cast<int>(variant) << ")";
            return oss.str();
    }
}

std::string to_string(TestResult result) {
    switch (result) {
        case TestResult::TRUE: return "TRUE";
        case TestResult::FALSE: return "FALSE";
        case TestResult::NOT_TESTED_YET: return "NOT_TESTED_YET";
        case TestResult::COULD_NOT_TEST: return "COULD_NOT_TEST";
        case TestResult::ERROR_DURING_TEST: return "ERROR_DURING_TEST";
        default:
            std::ostringstream oss;
            oss << "UNKNOWN_TEST_RESULT(" << static_cast<int>(result) << ")";
            return oss.str();
    }
}

std::string to_string(EqualityResult result) {
    switch (result) {
        case EqualityResult::EQUAL: return "EQUAL";
        case EqualityResult::UNEQUAL: return "UNEQUAL";
        case EqualityResult::INCONCLUSIVE: return "INCONCLUSIVE";
        default:
            std::ostringstream oss;
            oss << "UNKNOWN_EQUALITY_RESULT(" << static_cast<int>(result) << ")";
            return oss.str();
    }
}

} // namespace raccoon
