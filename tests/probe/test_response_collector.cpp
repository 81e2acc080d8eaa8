#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <raccoon/probe/response_collector.h>
#include <raccoon/probe/parallel_executor.h>
#include "../test_infrastructure/mock_collaborators.h"

using namespace raccoon;
using namespace raccoon::probe;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class ResponseCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorReporter::ReportingConfig config;
        config.console_output = false;
        reporter_ = std::make_shared<ErrorReporter>(config);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report) {
            warnings_.push_back(report.message);
        });

        scheduler_ = std::make_shared<test::MockParallelScheduler>();
        for (int i = 0; i < 4; ++i) {
            vectors_.emplace_back(WorkflowVariant::CKE, ProtocolVersion::TLS12,
                                  CipherSuite::TLS_DHE_RSA_WITH_AES_128_CBC_SHA, i % 2 == 0);
        }
    }

    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<test::MockParallelScheduler> scheduler_;
    std::vector<DirectRaccoonVector> vectors_;
    std::vector<std::string> warnings_;
    DhSecret secret_ = DhSecret::from_uint64(0xCAFE);
};

// Answers every request, failing the ones whose index is in @p failing
static std::vector<ExecutionResult> answer(const std::vector<ExecutionRequest>& requests,
                                           std::set<size_t> failing = {}) {
    std::vector<ExecutionResult> results;
    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        ExecutionResult result;
        result.index = it->index;
        if (failing.count(it->index) > 0) {
            result.outcome = Result<Fingerprint>(RaccoonError::CONNECTION_TIMEOUT);
        } else {
            result.outcome = Result<Fingerprint>(test::rejecting_fingerprint(it->with_null_byte ? 51 : 20));
        }
        results.push_back(std::move(result));
    }
    return results;
}

TEST_F(ResponseCollectorTest, RequestsCarryVectorAndSharedSecret) {
    std::vector<ExecutionRequest> submitted;
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([&submitted](const std::vector<ExecutionRequest>& requests) {
            submitted = requests;
            return Result<std::vector<ExecutionResult>>(answer(requests));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    auto responses = collector.collect(vectors_, secret_);
    ASSERT_TRUE(responses.is_success());

    ASSERT_EQ(submitted.size(), vectors_.size());
    for (size_t i = 0; i < submitted.size(); ++i) {
        EXPECT_EQ(submitted[i].index, i);
        EXPECT_EQ(submitted[i].secret, secret_);
        EXPECT_EQ(submitted[i].to_vector(), vectors_[i]);
    }
}

TEST_F(ResponseCollectorTest, ResultsArePairedByIndex) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            return Result<std::vector<ExecutionResult>>(answer(requests));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    auto responses = collector.collect(vectors_, secret_);
    ASSERT_TRUE(responses.is_success());
    ASSERT_EQ(responses->size(), vectors_.size());

    // Results came back reversed; responses follow vector order
    for (size_t i = 0; i < vectors_.size(); ++i) {
        EXPECT_EQ((*responses)[i].vector, vectors_[i]);
        uint8_t expected_alert = vectors_[i].pms_with_null_byte ? 51 : 20;
        EXPECT_EQ((*responses)[i].fingerprint.messages()[0].subtype, expected_alert);
    }
    EXPECT_TRUE(warnings_.empty());
}

TEST_F(ResponseCollectorTest, FailedTasksAreDroppedAndLogged) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            return Result<std::vector<ExecutionResult>>(answer(requests, {1, 2}));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    auto responses = collector.collect(vectors_, secret_);
    ASSERT_TRUE(responses.is_success());

    ASSERT_EQ(responses->size(), 2u);
    EXPECT_EQ((*responses)[0].vector, vectors_[0]);
    EXPECT_EQ((*responses)[1].vector, vectors_[3]);
    EXPECT_EQ(collector.dropped_count(), 2u);

    ASSERT_EQ(warnings_.size(), 2u);
    EXPECT_NE(warnings_[0].find(vectors_[1].to_string()), std::string::npos);
    EXPECT_EQ(reporter_->reports_at(ErrorReporter::LogLevel::WARNING), 2u);
}

TEST_F(ResponseCollectorTest, AllTasksFailing) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            return Result<std::vector<ExecutionResult>>(answer(requests, {0, 1, 2, 3}));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    auto responses = collector.collect(vectors_, secret_);
    ASSERT_TRUE(responses.is_success());
    EXPECT_TRUE(responses->empty());
}

TEST_F(ResponseCollectorTest, SchedulerFailureIsScanWide) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Return(Result<std::vector<ExecutionResult>>(RaccoonError::SCHEDULER_ERROR)));

    ResponseCollector collector(scheduler_, reporter_);
    EXPECT_EQ(collector.collect(vectors_, secret_).error(), RaccoonError::SCHEDULER_ERROR);
}

TEST_F(ResponseCollectorTest, MissingResultIsMismatch) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            auto results = answer(requests);
            results.pop_back();
            return Result<std::vector<ExecutionResult>>(std::move(results));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    EXPECT_EQ(collector.collect(vectors_, secret_).error(), RaccoonError::BATCH_RESULT_MISMATCH);
}

TEST_F(ResponseCollectorTest, DuplicateIndexIsMismatch) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            auto results = answer(requests);
            results[1].index = results[0].index;
            return Result<std::vector<ExecutionResult>>(std::move(results));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    EXPECT_EQ(collector.collect(vectors_, secret_).error(), RaccoonError::BATCH_RESULT_MISMATCH);
}

TEST_F(ResponseCollectorTest, EmptyVectorSet) {
    EXPECT_CALL(*scheduler_, execute_batch(_))
        .WillOnce(Invoke([](const std::vector<ExecutionRequest>& requests) {
            return Result<std::vector<ExecutionResult>>(answer(requests));
        }));

    ResponseCollector collector(scheduler_, reporter_);
    auto responses = collector.collect({}, secret_);
    ASSERT_TRUE(responses.is_success());
    EXPECT_TRUE(responses->empty());
}

TEST_F(ResponseCollectorTest, WorksWithParallelExecutor) {
    auto engine = std::make_shared<test::SimulatedServerEngine>();
    engine->leak_null_byte = true;
    ParallelExecutor::Config config;
    config.max_parallel_tasks = 3;
    auto executor = std::make_shared<ParallelExecutor>(engine, config, reporter_);

    ResponseCollector collector(executor, reporter_);
    auto responses = collector.collect(vectors_, secret_);
    ASSERT_TRUE(responses.is_success());
    EXPECT_EQ(responses->size(), vectors_.size());
    EXPECT_EQ(engine->call_count(), vectors_.size());
}

TEST_F(ResponseCollectorTest, NullSchedulerIsRejected) {
    ResponseCollector collector(nullptr, reporter_);
    EXPECT_EQ(collector.collect(vectors_, secret_).error(), RaccoonError::MISSING_COLLABORATOR);
}
