#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <raccoon/probe/parallel_executor.h>
#include "../test_infrastructure/mock_collaborators.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace raccoon;
using namespace raccoon::probe;
using ::testing::_;
using ::testing::Invoke;

namespace {

std::vector<ExecutionRequest> make_requests(size_t count) {
    std::vector<ExecutionRequest> requests(count);
    for (size_t i = 0; i < count; ++i) {
        requests[i].index = i;
        requests[i].with_null_byte = (i % 2 == 0);
        requests[i].secret = DhSecret::from_uint64(1000);
    }
    return requests;
}

// Records the highest number of concurrently running executions
class ConcurrencyTrackingEngine : public HandshakeExecutionEngine {
public:
    Result<Fingerprint> execute(const ExecutionRequest&) override {
        size_t now = ++running_;
        size_t seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running_;
        return make_result(test::rejecting_fingerprint());
    }

    size_t peak() const { return peak_.load(); }

private:
    std::atomic<size_t> running_{0};
    std::atomic<size_t> peak_{0};
};

} // namespace

class ParallelExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<test::SimulatedServerEngine>();
    }

    std::shared_ptr<test::SimulatedServerEngine> engine_;
};

TEST_F(ParallelExecutorTest, OneResultPerRequestWithEchoedIndex) {
    ParallelExecutor executor(engine_);
    auto requests = make_requests(20);

    auto results = executor.execute_batch(requests);
    ASSERT_TRUE(results.is_success());
    ASSERT_EQ(results->size(), requests.size());

    std::vector<size_t> indices;
    for (const auto& result : *results) {
        EXPECT_TRUE(result.outcome.is_success());
        indices.push_back(result.index);
    }
    std::sort(indices.begin(), indices.end());
    for (size_t i = 0; i < indices.size(); ++i) {
        EXPECT_EQ(indices[i], i);
    }
    EXPECT_EQ(engine_->call_count(), 20u);
    EXPECT_EQ(executor.get_statistics().tasks_executed.load(), 20u);
    EXPECT_EQ(executor.get_statistics().batches_executed.load(), 1u);
}

TEST_F(ParallelExecutorTest, EngineExceptionsBecomeTaskErrors) {
    engine_->failing_suites.insert(CipherSuite::TLS_DHE_DSS_WITH_AES_128_CBC_SHA);
    auto requests = make_requests(6);
    requests[2].cipher_suite = CipherSuite::TLS_DHE_DSS_WITH_AES_128_CBC_SHA;
    requests[5].cipher_suite = CipherSuite::TLS_DHE_DSS_WITH_AES_128_CBC_SHA;

    ParallelExecutor executor(engine_);
    auto results = executor.execute_batch(requests);
    ASSERT_TRUE(results.is_success());
    ASSERT_EQ(results->size(), 6u);

    for (const auto& result : *results) {
        if (result.index == 2 || result.index == 5) {
            EXPECT_EQ(result.outcome.error(), RaccoonError::EXECUTION_FAILED);
        } else {
            EXPECT_TRUE(result.outcome.is_success());
        }
    }
    EXPECT_EQ(executor.get_statistics().tasks_threw.load(), 2u);
    EXPECT_EQ(executor.get_statistics().tasks_failed.load(), 2u);
}

TEST_F(ParallelExecutorTest, NonStandardThrowsBecomeTaskErrors) {
    auto engine = std::make_shared<test::MockHandshakeExecutionEngine>();
    EXPECT_CALL(*engine, execute(_))
        .WillRepeatedly(Invoke([](const ExecutionRequest& request) -> Result<Fingerprint> {
            if (request.index == 1) {
                throw 7;
            }
            return make_result(test::accepting_fingerprint());
        }));

    ParallelExecutor executor(engine);
    Result<std::vector<ExecutionResult>> results(RaccoonError::NOT_INITIALIZED);
    EXPECT_NO_THROW(results = executor.execute_batch(make_requests(4)));
    ASSERT_TRUE(results.is_success());
    ASSERT_EQ(results->size(), 4u);

    for (const auto& result : *results) {
        if (result.index == 1) {
            EXPECT_EQ(result.outcome.error(), RaccoonError::EXECUTION_FAILED);
        } else {
            EXPECT_TRUE(result.outcome.is_success());
        }
    }
    EXPECT_EQ(executor.get_statistics().tasks_threw.load(), 1u);
    EXPECT_EQ(executor.get_statistics().tasks_failed.load(), 1u);
}

TEST_F(ParallelExecutorTest, RaccoonExceptionKeepsItsCode) {
    auto engine = std::make_shared<test::MockHandshakeExecutionEngine>();
    EXPECT_CALL(*engine, execute(_))
        .WillRepeatedly(Invoke([](const ExecutionRequest&) -> Result<Fingerprint> {
            throw RaccoonException(RaccoonError::CONNECTION_REFUSED);
        }));

    ParallelExecutor executor(engine);
    auto results = executor.execute_batch(make_requests(2));
    ASSERT_TRUE(results.is_success());
    for (const auto& result : *results) {
        EXPECT_EQ(result.outcome.error(), RaccoonError::CONNECTION_REFUSED);
    }
}

TEST_F(ParallelExecutorTest, EngineErrorsArePassedThrough) {
    auto engine = std::make_shared<test::MockHandshakeExecutionEngine>();
    EXPECT_CALL(*engine, execute(_))
        .WillRepeatedly(Invoke([](const ExecutionRequest& request) {
            return request.with_null_byte ? Result<Fingerprint>(RaccoonError::CONNECTION_TIMEOUT)
                                          : Result<Fingerprint>(test::accepting_fingerprint());
        }));

    ParallelExecutor executor(engine);
    auto results = executor.execute_batch(make_requests(4));
    ASSERT_TRUE(results.is_success());
    for (const auto& result : *results) {
        if (result.index % 2 == 0) {
            EXPECT_EQ(result.outcome.error(), RaccoonError::CONNECTION_TIMEOUT);
        } else {
            EXPECT_EQ(*result.outcome, test::accepting_fingerprint());
        }
    }
}

TEST_F(ParallelExecutorTest, ParallelismIsBounded) {
    auto engine = std::make_shared<ConcurrencyTrackingEngine>();
    ParallelExecutor::Config config;
    config.max_parallel_tasks = 4;
    ParallelExecutor executor(engine, config);

    auto results = executor.execute_batch(make_requests(20));
    ASSERT_TRUE(results.is_success());
    EXPECT_EQ(results->size(), 20u);
    EXPECT_LE(engine->peak(), 4u);
    EXPECT_GE(engine->peak(), 1u);
}

TEST_F(ParallelExecutorTest, EmptyBatch) {
    ParallelExecutor executor(engine_);
    auto results = executor.execute_batch({});
    ASSERT_TRUE(results.is_success());
    EXPECT_TRUE(results->empty());
    EXPECT_EQ(engine_->call_count(), 0u);
}

TEST_F(ParallelExecutorTest, ConfigValidation) {
    ParallelExecutor::Config config;
    EXPECT_TRUE(config.validate().is_success());
    config.max_parallel_tasks = 0;
    EXPECT_EQ(config.validate().error(), RaccoonError::INVALID_CONFIGURATION);

}

TEST_F(ParallelExecutorTest, ZeroParallelismIsRejected) {
    ParallelExecutor::Config config;
    config.max_parallel_tasks = 0;

    try {
        ParallelExecutor executor(engine_, config);
        FAIL() << "a zero task limit must be rejected";
    } catch (const RaccoonException& e) {
        EXPECT_EQ(e.raccoon_error(), RaccoonError::INVALID_CONFIGURATION);
    }
    EXPECT_EQ(engine_->call_count(), 0u);
}

TEST_F(ParallelExecutorTest, MissingEngine) {
    ParallelExecutor executor(nullptr);
    EXPECT_EQ(executor.execute_batch(make_requests(1)).error(), RaccoonError::MISSING_COLLABORATOR);
}
