#include <gtest/gtest.h>
#include <raccoon/types.h>
#include <algorithm>
#include <string>

using namespace raccoon;

class RaccoonTypesTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RaccoonTypesTest, ProtocolVersionWireValues) {
    EXPECT_EQ(static_cast<uint16_t>(ProtocolVersion::SSL3), 0x0300);
    EXPECT_EQ(static_cast<uint16_t>(ProtocolVersion::TLS10), 0x0301);
    EXPECT_EQ(static_cast<uint16_t>(ProtocolVersion::TLS12), 0x0303);
    EXPECT_EQ(static_cast<uint16_t>(ProtocolVersion::DTLS12), 0xFEFD);
}

TEST_F(RaccoonTypesTest, AffectedVersions) {
    EXPECT_TRUE(is_raccoon_affected_version(ProtocolVersion::SSL3));
    EXPECT_TRUE(is_raccoon_affected_version(ProtocolVersion::TLS10));
    EXPECT_TRUE(is_raccoon_affected_version(ProtocolVersion::TLS11));
    EXPECT_TRUE(is_raccoon_affected_version(ProtocolVersion::TLS12));

    EXPECT_FALSE(is_raccoon_affected_version(ProtocolVersion::SSL2));
    EXPECT_FALSE(is_raccoon_affected_version(ProtocolVersion::TLS13));
    EXPECT_FALSE(is_raccoon_affected_version(ProtocolVersion::DTLS10));
    EXPECT_FALSE(is_raccoon_affected_version(ProtocolVersion::DTLS12));
}

TEST_F(RaccoonTypesTest, TestableWorkflowVariantsExcludeInitial) {
    auto variants = testable_workflow_variants();
    ASSERT_EQ(variants.size(), 3u);
    EXPECT_EQ(variants[0], WorkflowVariant::CKE);
    EXPECT_EQ(variants[1], WorkflowVariant::CKE_CCS);
    EXPECT_EQ(variants[2], WorkflowVariant::CKE_CCS_FIN);
    EXPECT_EQ(std::count(variants.begin(), variants.end(), WorkflowVariant::INITIAL), 0);

    EXPECT_FALSE(is_testable(WorkflowVariant::INITIAL));
    for (auto variant : TESTABLE_WORKFLOW_VARIANTS) {
        EXPECT_TRUE(is_testable(variant));
    }
    EXPECT_EQ(ALL_WORKFLOW_VARIANTS.size(), TESTABLE_WORKFLOW_VARIANTS.size() + 1);
}

TEST_F(RaccoonTypesTest, ToString) {
    EXPECT_EQ(to_string(ProtocolVersion::TLS12), "TLS12");
    EXPECT_EQ(to_string(ProtocolVersion::SSL3), "SSL3");
    EXPECT_EQ(to_string(static_cast<ProtocolVersion>(0x1234)), "UNKNOWN_VERSION(0x1234)");

    EXPECT_EQ(to_string(WorkflowVariant::CKE_CCS_FIN), "CKE_CCS_FIN");
    EXPECT_EQ(to_string(WorkflowVariant::INITIAL), "INITIAL");

    EXPECT_EQ(to_string(TestResult::TRUE), "TRUE");
    EXPECT_EQ(to_string(TestResult::ERROR_DURING_TEST), "ERROR_DURING_TEST");
    EXPECT_EQ(to_string(TestResult::COULD_NOT_TEST), "COULD_NOT_TEST");

    EXPECT_EQ(to_string(EqualityResult::UNEQUAL), "UNEQUAL");
    EXPECT_EQ(to_string(KeyExchangeAlgorithm::DHE_RSA), "DHE_RSA");
}

TEST_F(RaccoonTypesTest, CipherSuiteNames) {
    EXPECT_EQ(to_string(CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA), "TLS_DHE_RSA_WITH_AES_128_CBC_SHA");
    EXPECT_EQ(to_string(static_cast<CipherSuite>(0xABCD)), "UNKNOWN_CIPHER_SUITE(0xabcd)");
}
