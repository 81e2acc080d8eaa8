#include <gtest/gtest.h>
#include <raccoon/result.h>
#include <raccoon/error.h>
#include <string>
#include <utility>
#include <vector>

using namespace raccoon;

class RaccoonResultTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RaccoonResultTest, BasicConstruction) {
    Result<int> success_result(42);
    EXPECT_TRUE(success_result.is_success());
    EXPECT_FALSE(success_result.is_error());
    EXPECT_TRUE(success_result);

    Result<int> error_result(RaccoonError::INVALID_PARAMETER);
    EXPECT_FALSE(error_result.is_success());
    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result);
}

TEST_F(RaccoonResultTest, ValueAccess) {
    Result<int> success_result(42);
    EXPECT_EQ(success_result.value(), 42);
    EXPECT_EQ(*std::as_const(success_result), 42);

    Result<std::string> string_result(std::string("fingerprint"));
    EXPECT_EQ(string_result->length(), 11u);
}

TEST_F(RaccoonResultTest, ValueAccessFromErrorThrows) {
    Result<int> error_result(RaccoonError::EXECUTION_FAILED);

    EXPECT_THROW(error_result.value(), RaccoonException);
    EXPECT_EQ(error_result.operator->(), nullptr);

    try {
        (void)error_result.value();
        FAIL() << "value() on an error result must throw";
    } catch (const RaccoonException& e) {
        EXPECT_EQ(e.raccoon_error(), RaccoonError::EXECUTION_FAILED);
    }
}

TEST_F(RaccoonResultTest, MoveValueAccess) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> moved = std::move(result).value();
    EXPECT_EQ(moved.size(), 3u);
}

TEST_F(RaccoonResultTest, ErrorAccess) {
    EXPECT_EQ(Result<int>(42).error(), RaccoonError::SUCCESS);
    EXPECT_EQ(Result<int>(RaccoonError::HANDSHAKE_FAILURE).error(), RaccoonError::HANDSHAKE_FAILURE);
}

TEST_F(RaccoonResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.is_success());
    EXPECT_EQ(ok.error(), RaccoonError::SUCCESS);

    Result<void> failed(RaccoonError::ALREADY_ESCALATED);
    EXPECT_TRUE(failed.is_error());
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error(), RaccoonError::ALREADY_ESCALATED);
}

TEST_F(RaccoonResultTest, Helpers) {
    auto value = make_result(std::string("secret"));
    EXPECT_TRUE(value);
    EXPECT_EQ(*value, "secret");

    auto none = make_result();
    EXPECT_TRUE(none);

    auto error = make_error<size_t>(RaccoonError::BATCH_RESULT_MISMATCH);
    EXPECT_EQ(error.error(), RaccoonError::BATCH_RESULT_MISMATCH);
}

namespace {

Result<int> propagate_void_failure(Result<void> step) {
    RACCOON_TRY_VOID(step);
    return Result<int>(1);
}

Result<void> counted_step(int& calls, RaccoonError outcome) {
    ++calls;
    return Result<void>(outcome);
}

Result<int> propagate_counted(int& calls, RaccoonError outcome) {
    RACCOON_TRY_VOID(counted_step(calls, outcome));
    return Result<int>(calls);
}

} // namespace

TEST_F(RaccoonResultTest, TryVoidPropagatesError) {
    EXPECT_EQ(propagate_void_failure(Result<void>()).value(), 1);
    EXPECT_EQ(propagate_void_failure(Result<void>(RaccoonError::TIMEOUT)).error(), RaccoonError::TIMEOUT);
}

TEST_F(RaccoonResultTest, TryVoidEvaluatesOnce) {
    int calls = 0;
    EXPECT_EQ(propagate_counted(calls, RaccoonError::NETWORK_ERROR).error(), RaccoonError::NETWORK_ERROR);
    EXPECT_EQ(calls, 1);

    calls = 0;
    EXPECT_EQ(propagate_counted(calls, RaccoonError::SUCCESS).value(), 1);
}
