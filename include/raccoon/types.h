#ifndef RACCOON_TYPES_H
#define RACCOON_TYPES_H

#include <raccoon/config.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <chrono>

namespace raccoon {

// Protocol versions with their wire values
enum class ProtocolVersion : uint16_t {
    SSL2 = 0x0200,
    SSL3 = 0x0300,
    TLS10 = 0x0301,
    TLS11 = 0x0302,
    TLS12 = 0x0303,
    TLS13 = 0x0304,
    DTLS10 = 0xFEFF,
    DTLS12 = 0xFEFD
};

// Cipher suites known to the scanner (IANA values)
enum class CipherSuite : uint16_t {
    TLS_NULL_WITH_NULL_NULL = 0x0000,
    TLS_RSA_WITH_AES_128_CBC_SHA = 0x002F,
    TLS_RSA_WITH_AES_256_CBC_SHA = 0x0035,
    TLS_RSA_WITH_AES_128_GCM_SHA256 = 0x009C,

    // Static DH
    TLS_DH_DSS_WITH_AES_128_CBC_SHA = 0x0030,
    TLS_DH_RSA_WITH_AES_128_CBC_SHA = 0x0031,
    TLS_DH_DSS_WITH_AES_256_CBC_SHA = 0x0036,
    TLS_DH_RSA_WITH_AES_256_CBC_SHA = 0x0037,
    TLS_DH_RSA_WITH_AES_128_GCM_SHA256 = 0x00A0,

    // Ephemeral DH
    TLS_DHE_RSA_WITH_3DES_EDE_CBC_SHA = 0x0016,
    TLS_DHE_DSS_WITH_AES_128_CBC_SHA = 0x0032,
    TLS_DHE_RSA_WITH_AES_128_CBC_SHA = 0x0033,
    TLS_DHE_DSS_WITH_AES_256_CBC_SHA = 0x0038,
    TLS_DHE_RSA_WITH_AES_256_CBC_SHA = 0x0039,
    TLS_DHE_RSA_WITH_AES_128_CBC_SHA256 = 0x0067,
    TLS_DHE_RSA_WITH_AES_256_CBC_SHA256 = 0x006B,
    TLS_DHE_RSA_WITH_AES_128_GCM_SHA256 = 0x009E,
    TLS_DHE_RSA_WITH_AES_256_GCM_SHA384 = 0x009F,
    TLS_DHE_DSS_WITH_AES_128_GCM_SHA256 = 0x00A2,
    TLS_DHE_PSK_WITH_AES_128_CBC_SHA = 0x0090,
    TLS_DHE_RSA_WITH_CHACHA20_POLY1305_SHA256 = 0xCCAA,

    // Anonymous DH
    TLS_DH_anon_WITH_AES_128_CBC_SHA = 0x0034,
    TLS_DH_anon_WITH_AES_256_CBC_SHA = 0x003A,

    // Elliptic curve
    TLS_ECDH_RSA_WITH_AES_128_CBC_SHA = 0xC00E,
    TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256 = 0xC02B,
    TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256 = 0xC02F,
    TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384 = 0xC030,

    // Pre-shared key
    TLS_PSK_WITH_AES_128_CBC_SHA = 0x008C,

    // TLS 1.3
    TLS_AES_128_GCM_SHA256 = 0x1301,
    TLS_AES_256_GCM_SHA384 = 0x1302,
    TLS_CHACHA20_POLY1305_SHA256 = 0x1303
};

// Key exchange algorithm of a cipher suite
enum class KeyExchangeAlgorithm : uint8_t {
    NULL_KEX = 0,
    RSA = 1,
    DH_DSS = 2,
    DH_RSA = 3,
    DHE_DSS = 4,
    DHE_RSA = 5,
    DH_ANON = 6,
    DHE_PSK = 7,
    ECDH_RSA = 8,
    ECDHE_ECDSA = 9,
    ECDHE_RSA = 10,
    PSK = 11,
    TLS13 = 12
};

// Messages sent after the crafted ClientKeyExchange. INITIAL is a
// placeholder and never tested.
enum class WorkflowVariant : uint8_t {
    INITIAL = 0,
    CKE = 1,
    CKE_CCS = 2,
    CKE_CCS_FIN = 3
};

// Outcome of a probe or of a single analyzed property
enum class TestResult : uint8_t {
    TRUE = 0,
    FALSE = 1,
    NOT_TESTED_YET = 2,
    COULD_NOT_TEST = 3,
    ERROR_DURING_TEST = 4
};

// Outcome of comparing two response fingerprints
enum class EqualityResult : uint8_t {
    EQUAL = 0,
    UNEQUAL = 1,
    INCONCLUSIVE = 2
};

// Variant sets
constexpr std::array<WorkflowVariant, 4> ALL_WORKFLOW_VARIANTS = {
    WorkflowVariant::INITIAL,
    WorkflowVariant::CKE,
    WorkflowVariant::CKE_CCS,
    WorkflowVariant::CKE_CCS_FIN
};

constexpr std::array<WorkflowVariant, 3> TESTABLE_WORKFLOW_VARIANTS = {
    WorkflowVariant::CKE,
    WorkflowVariant::CKE_CCS,
    WorkflowVariant::CKE_CCS_FIN
};

RACCOON_API std::vector<WorkflowVariant> testable_workflow_variants();
RACCOON_API bool is_testable(WorkflowVariant variant) noexcept;

// Versions on which the premaster secret is derived with leading zeros stripped
constexpr std::array<ProtocolVersion, 4> RACCOON_AFFECTED_VERSIONS = {
    ProtocolVersion::SSL3,
    ProtocolVersion::TLS10,
    ProtocolVersion::TLS11,
    ProtocolVersion::TLS12
};

RACCOON_API bool is_raccoon_affected_version(ProtocolVersion version) noexcept;

// Timing types
using Timestamp = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Utility functions
RACCOON_API std::string to_string(ProtocolVersion version);
RACCOON_API std::string to_string(CipherSuite suite);
RACCOON_API std::string to_string(KeyExchangeAlgorithm kex);
RACCOON_API std::string to_string(WorkflowVariant variant);
RACCOON_API std::string to_string(TestResult result);
RACCOON_API std::string to_string(EqualityResult result);

} // namespace raccoon

#endif // RACCOON_TYPES_H
