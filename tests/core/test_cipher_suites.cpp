#include <gtest/gtest.h>
#include <raccoon/cipher_suites.h>
#include <algorithm>

using namespace raccoon;

class CipherSuiteRegistryTest : public ::testing::Test {};

TEST_F(CipherSuiteRegistryTest, LookupKnownSuite) {
    auto info = get_cipher_suite_info(CipherSuite::TLS_DHE_DSS_WITH_AES_256_CBC_SHA);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->suite, CipherSuite::TLS_DHE_DSS_WITH_AES_256_CBC_SHA);
    EXPECT_STREQ(info->name, "TLS_DHE_DSS_WITH_AES_256_CBC_SHA");
    EXPECT_EQ(info->key_exchange, KeyExchangeAlgorithm::DHE_DSS);
    EXPECT_TRUE(info->implemented);
}

TEST_F(CipherSuiteRegistryTest, UnknownSuite) {
    auto unknown = static_cast<CipherSuite>(0xFAFA);
    EXPECT_FALSE(get_cipher_suite_info(unknown).has_value());
    EXPECT_EQ(key_exchange_of(unknown), KeyExchangeAlgorithm::NULL_KEX);
    EXPECT_FALSE(uses_dh(unknown));
    EXPECT_FALSE(is_implemented(unknown));
}

TEST_F(CipherSuiteRegistryTest, FiniteFieldDhSuites) {
    EXPECT_TRUE(uses_dh(CipherSuite::TLS_DH_DSS_WITH_AES_128_CBC_SHA));
    EXPECT_TRUE(uses_dh(CipherSuite::TLS_DH_RSA_WITH_AES_128_GCM_SHA256));
    EXPECT_TRUE(uses_dh(CipherSuite::TLS_DHE_RSA_WITH_AES_256_GCM_SHA384));
    EXPECT_TRUE(uses_dh(CipherSuite::TLS_DH_anon_WITH_AES_128_CBC_SHA));
    EXPECT_TRUE(uses_dh(CipherSuite::TLS_DHE_PSK_WITH_AES_128_CBC_SHA));
}

TEST_F(CipherSuiteRegistryTest, NonDhSuites) {
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_RSA_WITH_AES_128_CBC_SHA));
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256));
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_ECDH_RSA_WITH_AES_128_CBC_SHA));
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_PSK_WITH_AES_128_CBC_SHA));
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_AES_128_GCM_SHA256));
    EXPECT_FALSE(uses_dh(CipherSuite::TLS_NULL_WITH_NULL_NULL));
}

TEST_F(CipherSuiteRegistryTest, KeyExchangeClassification) {
    EXPECT_TRUE(uses_dh(KeyExchangeAlgorithm::DHE_RSA));
    EXPECT_TRUE(uses_dh(KeyExchangeAlgorithm::DH_ANON));
    EXPECT_FALSE(uses_dh(KeyExchangeAlgorithm::ECDHE_ECDSA));
    EXPECT_FALSE(uses_dh(KeyExchangeAlgorithm::RSA));
}

TEST_F(CipherSuiteRegistryTest, ImplementedSuites) {
    EXPECT_TRUE(is_implemented(CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA));
    EXPECT_FALSE(is_implemented(CipherSuite::TLS_DHE_RSA_WITH_CHACHA20_POLY1305_SHA256));
    EXPECT_FALSE(is_implemented(CipherSuite::TLS_NULL_WITH_NULL_NULL));

    auto implemented = implemented_cipher_suites();
    EXPECT_FALSE(implemented.empty());
    for (auto suite : implemented) {
        EXPECT_TRUE(is_implemented(suite)) << to_string(suite);
    }
    EXPECT_EQ(std::count(implemented.begin(), implemented.end(),
                         CipherSuite::TLS_DHE_RSA_WITH_CHACHA20_POLY1305_SHA256), 0);
}
