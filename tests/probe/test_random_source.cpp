#include <gtest/gtest.h>
#include <raccoon/probe/random_source.h>
#include <set>

using namespace raccoon;
using namespace raccoon::probe;

class RandomSourceTest : public ::testing::Test {
protected:
    OpenSSLRandomSource openssl_;
};

TEST_F(RandomSourceTest, OpenSSLGeneratesRequestedLength) {
    auto bytes = openssl_.generate_bytes(32);
    ASSERT_TRUE(bytes.is_success());
    EXPECT_EQ(bytes->size(), 32u);

    auto other = openssl_.generate_bytes(32);
    ASSERT_TRUE(other.is_success());
    EXPECT_NE(*bytes, *other);

    auto empty = openssl_.generate_bytes(0);
    ASSERT_TRUE(empty.is_success());
    EXPECT_TRUE(empty->empty());
}

TEST_F(RandomSourceTest, SecretIsPositiveAndNonZero) {
    for (int i = 0; i < 50; ++i) {
        auto secret = openssl_.next_secret(4);
        ASSERT_TRUE(secret.is_success());
        ASSERT_EQ(secret->size(), 4u);
        EXPECT_EQ(secret->bytes()[0] & 0x80, 0);
        EXPECT_NE(*secret, DhSecret(std::vector<uint8_t>(4, 0)));
    }
    EXPECT_EQ(openssl_.next_secret(0).error(), RaccoonError::INVALID_PARAMETER);
}

TEST_F(RandomSourceTest, UniformStaysInRange) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 200; ++i) {
        auto value = openssl_.uniform(5);
        ASSERT_TRUE(value.is_success());
        EXPECT_LT(*value, 5u);
        seen.insert(*value);
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_EQ(openssl_.uniform(0).error(), RaccoonError::INVALID_PARAMETER);
    EXPECT_EQ(*openssl_.uniform(1), 0u);
}

TEST_F(RandomSourceTest, SeededSourceIsReproducible) {
    SeededRandomSource a(1234);
    SeededRandomSource b(1234);
    SeededRandomSource c(4321);

    auto first = a.generate_bytes(19);
    auto second = b.generate_bytes(19);
    auto third = c.generate_bytes(19);
    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(*first, *second);
    EXPECT_NE(*first, *third);

    EXPECT_EQ(*a.next_secret(8), *b.next_secret(8));
}

TEST_F(RandomSourceTest, FactoryByName) {
    auto openssl = create_random_source("openssl");
    ASSERT_TRUE(openssl.is_success());
    EXPECT_EQ((*openssl)->name(), "openssl");

    EXPECT_EQ(create_random_source("dev-random").error(), RaccoonError::INVALID_PARAMETER);
    EXPECT_EQ(default_random_source()->name(), "openssl");

    auto botan = create_random_source("botan");
#ifdef RACCOON_HAVE_BOTAN
    ASSERT_TRUE(botan.is_success());
    EXPECT_EQ((*botan)->name(), "botan");
    auto bytes = (*botan)->generate_bytes(16);
    ASSERT_TRUE(bytes.is_success());
    EXPECT_EQ(bytes->size(), 16u);
#else
    EXPECT_EQ(botan.error(), RaccoonError::FEATURE_NOT_ENABLED);
#endif
}
