#include <raccoon/cipher_suites.h>

namespace raccoon {

namespace {

using K = KeyExchangeAlgorithm;

// Suites the execution engine cannot craft a workflow for are kept so
// that site reports naming them still resolve to a name.
constexpr CipherSuiteInfo CIPHER_SUITE_REGISTRY[] = {
    {CipherSuite::TLS_NULL_WITH_NULL_NULL, "TLS_NULL_WITH_NULL_NULL", K::NULL_KEX, false},
    {CipherSuite::TLS_RSA_WITH_AES_128_CBC_SHA, "TLS_RSA_WITH_AES_128_CBC_SHA", K::RSA, true},
    {CipherSuite::TLS_RSA_WITH_AES_256_CBC_SHA, "TLS_RSA_WITH_AES_256_CBC_SHA", K::RSA, true},
    {CipherSuite::TLS_RSA_WITH_AES_128_GCM_SHA256, "TLS_RSA_WITH_AES_128_GCM_SHA256", K::RSA, true},

    {CipherSuite::TLS_DH_DSS_WITH_AES_128_CBC_SHA, "TLS_DH_DSS_WITH_AES_128_CBC_SHA", K::DH_DSS, true},
    {CipherSuite::TLS_DH_RSA_WITH_AES_128_CBC_SHA, "TLS_DH_RSA_WITH_AES_128_CBC_SHA", K::DH_RSA, true},
    {CipherSuite::TLS_DH_DSS_WITH_AES_256_CBC_SHA, "TLS_DH_DSS_WITH_AES_256_CBC_SHA", K::DH_DSS, true},
    {CipherSuite::TLS_DH_RSA_WITH_AES_256_CBC_SHA, "TLS_DH_RSA_WITH_AES_256_CBC_SHA", K::DH_RSA, true},
    {CipherSuite::TLS_DH_RSA_WITH_AES_128_GCM_SHA256, "TLS_DH_RSA_WITH_AES_128_GCM_SHA256", K::DH_RSA, true},

    {CipherSuite::TLS_DHE_RSA_WITH_3DES_EDE_CBC_SHA, "TLS_DHE_RSA_WITH_3DES_EDE_CBC_SHA", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_DSS_WITH_AES_128_CBC_SHA, "TLS_DHE_DSS_WITH_AES_128_CBC_SHA", K::DHE_DSS, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA, "TLS_DHE_RSA_WITH_AES_128_CBC_SHA", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_DSS_WITH_AES_256_CBC_SHA, "TLS_DHE_DSS_WITH_AES_256_CBC_SHA", K::DHE_DSS, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_256_CBC_SHA, "TLS_DHE_RSA_WITH_AES_256_CBC_SHA", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA256, "TLS_DHE_RSA_WITH_AES_128_CBC_SHA256", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_256_CBC_SHA256, "TLS_DHE_RSA_WITH_AES_256_CBC_SHA256", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_128_GCM_SHA256, "TLS_DHE_RSA_WITH_AES_128_GCM_SHA256", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_RSA_WITH_AES_256_GCM_SHA384, "TLS_DHE_RSA_WITH_AES_256_GCM_SHA384", K::DHE_RSA, true},
    {CipherSuite::TLS_DHE_DSS_WITH_AES_128_GCM_SHA256, "TLS_DHE_DSS_WITH_AES_128_GCM_SHA256", K::DHE_DSS, true},
    {CipherSuite::TLS_DHE_PSK_WITH_AES_128_CBC_SHA, "TLS_DHE_PSK_WITH_AES_128_CBC_SHA", K::DHE_PSK, true},
    {CipherSuite::TLS_DHE_RSA_WITH_CHACHA20_POLY1305_SHA256, "TLS_DHE_RSA_WITH_CHACHA20_POLY1305_SHA256", K::DHE_RSA, false},

    {CipherSuite::TLS_DH_anon_WITH_AES_128_CBC_SHA, "TLS_DH_anon_WITH_AES_128_CBC_SHA", K::DH_ANON, true},
    {CipherSuite::TLS_DH_anon_WITH_AES_256_CBC_SHA, "TLS_DH_anon_WITH_AES_256_CBC_SHA", K::DH_ANON, true},

    {CipherSuite::TLS_ECDH_RSA_WITH_AES_128_CBC_SHA, "TLS_ECDH_RSA_WITH_AES_128_CBC_SHA", K::ECDH_RSA, true},
    {CipherSuite::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256, "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256", K::ECDHE_ECDSA, true},
    {CipherSuite::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256, "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256", K::ECDHE_RSA, true},
    {CipherSuite::TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384, "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384", K::ECDHE_RSA, true},

    {CipherSuite::TLS_PSK_WITH_AES_128_CBC_SHA, "TLS_PSK_WITH_AES_128_CBC_SHA", K::PSK, true},

    {CipherSuite::TLS_AES_128_GCM_SHA256, "TLS_AES_128_GCM_SHA256", K::TLS13, true},
    {CipherSuite::TLS_AES_256_GCM_SHA384, "TLS_AES_256_GCM_SHA384", K::TLS13, true},
    {CipherSuite::TLS_CHACHA20_POLY1305_SHA256, "TLS_CHACHA20_POLY1305_SHA256", K::TLS13, true}
};

} // namespace

std::optional<CipherSuiteInfo> get_cipher_suite_info(CipherSuite suite) {
    for (const auto& info : CIPHER_SUITE_REGISTRY) {
        if (info.suite == suite) {
            return info;
        }
    }
    return std::nullopt;
}

KeyExchangeAlgorithm key_exchange_of(CipherSuite suite) {
    auto info = get_cipher_suite_info(suite);
    return info ? info->key_exchange : KeyExchangeAlgorithm::NULL_KEX;
}

bool uses_dh(KeyExchangeAlgorithm kex) noexcept {
    switch (kex) {
        case KeyExchangeAlgorithm::DH_DSS:
        case KeyExchangeAlgorithm::DH_RSA:
        case KeyExchangeAlgorithm::DHE_DSS:
        case KeyExchangeAlgorithm::DHE_RSA:
        case KeyExchangeAlgorithm::DH_ANON:
        case KeyExchangeAlgorithm::DHE_PSK:
            return true;
        default:
            return false;
    }
}

bool uses_dh(CipherSuite suite) {
    return uses_dh(key_exchange_of(suite));
}

bool is_implemented(CipherSuite suite) {
    auto info = get_cipher_suite_info(suite);
    return info && info->implemented;
}

std::vector<CipherSuite> implemented_cipher_suites() {
    std::vector<CipherSuite> suites;
    for (const auto& info : CIPHER_SUITE_REGISTRY) {
        if (info.implemented) {
            suites.push_back(info.suite);
        }
    }
    return suites;
}

} // namespace raccoon
